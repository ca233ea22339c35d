#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "index_snapshot.h"
#include "recommendation_engine.h"
#include "request_handler.h"
#include "server.h"
#include "test_support.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

int connectTo(const std::string& socket_path) {
  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }
  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);
  if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    close(fd);
    return -1;
  }
  return fd;
}

// Reads until the server closes or `timeout` passes; empty on timeout
std::string readResponse(int fd, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string response;
  char buffer[4096];
  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      return "";
    }
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (poll(&pfd, 1, static_cast<int>(left.count())) <= 0) {
      return "";
    }
    ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
    if (n <= 0) {
      return response;
    }
    response.append(buffer, static_cast<size_t>(n));
  }
}

// True when the server closes the connection within `timeout`
bool closedByServer(int fd, std::chrono::milliseconds timeout) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  if (poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
    return false;
  }
  char byte;
  return recv(fd, &byte, 1, 0) == 0;
}

} // namespace

class UnixSocketServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = "/tmp/rec_server_test_" + std::to_string(
      std::chrono::steady_clock::now().time_since_epoch().count()
    );
    fs::create_directories(dir_);
    socket_path_ = dir_ + "/rec.sock";

    auto embedder = std::make_shared<rec::testing_support::VocabularyEmbedder>(
      rec::testing_support::threeRecordVocabulary());
    auto engine = std::make_shared<rec::RecommendationEngine>(embedder, nullptr);
    rec::SnapshotBuilder builder(embedder);
    engine->publish(builder.build(rec::testing_support::threeRecordCatalog()));
    handler_ = std::make_shared<rec::RequestHandler>(engine);
  }

  void TearDown() override {
    if (fs::exists(dir_)) {
      fs::remove_all(dir_);
    }
  }

  std::string dir_;
  std::string socket_path_;
  std::shared_ptr<rec::RequestHandler> handler_;
};

// Test 1: Request over the socket
TEST_F(UnixSocketServerTest, AnswersOneRequestPerConnection) {
  rec::UnixSocketServer server(socket_path_, handler_, 2, std::chrono::milliseconds(2000));
  server.start();

  int fd = connectTo(socket_path_);
  ASSERT_GE(fd, 0);
  std::string request = R"({"endpoint": "/recommend", "params": {"query": "java", "k": 1}})" "\n";
  ASSERT_GT(send(fd, request.data(), request.size(), 0), 0);

  auto response = json::parse(readResponse(fd, std::chrono::milliseconds(3000)), nullptr, false);
  close(fd);
  ASSERT_FALSE(response.is_discarded());
  EXPECT_TRUE(response.value("success", false));
  EXPECT_EQ(response["recommended_assessments"][0]["id"], "A");

  server.stop();
  EXPECT_FALSE(server.isRunning());
  EXPECT_FALSE(fs::exists(socket_path_));
}

// Test 2: Silent clients are dropped after the request timeout
TEST_F(UnixSocketServerTest, SilentClientsDoNotStarveWorkers) {
  rec::UnixSocketServer server(socket_path_, handler_, 2, std::chrono::milliseconds(300));
  server.start();

  // One idle connection per worker
  int idle1 = connectTo(socket_path_);
  int idle2 = connectTo(socket_path_);
  ASSERT_GE(idle1, 0);
  ASSERT_GE(idle2, 0);

  int fd = connectTo(socket_path_);
  ASSERT_GE(fd, 0);
  std::string request = "{\"endpoint\": \"/health\"}\n";
  ASSERT_GT(send(fd, request.data(), request.size(), 0), 0);

  auto raw = readResponse(fd, std::chrono::milliseconds(3000));
  close(fd);
  auto response = json::parse(raw, nullptr, false);
  ASSERT_FALSE(response.is_discarded()) << "no answer while idle clients were connected";
  EXPECT_EQ(response.value("status", ""), "healthy");

  // The idle connections were closed by the server, not left hanging
  EXPECT_TRUE(closedByServer(idle1, std::chrono::milliseconds(3000)));
  EXPECT_TRUE(closedByServer(idle2, std::chrono::milliseconds(3000)));
  close(idle1);
  close(idle2);

  server.stop();
}

// Test 3: Shutdown always completes
TEST_F(UnixSocketServerTest, RepeatedStartStopDoesNotHang) {
  for (int i = 0; i < 50; ++i) {
    rec::UnixSocketServer server(socket_path_, handler_, 8, std::chrono::milliseconds(500));
    server.start();
    if (i % 5 == 0) {
      int fd = connectTo(socket_path_);
      if (fd >= 0) {
        std::string request = "{\"endpoint\": \"/info\"}\n";
        send(fd, request.data(), request.size(), 0);
        readResponse(fd, std::chrono::milliseconds(2000));
        close(fd);
      }
    }
    server.stop();
  }
  SUCCEED();
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
