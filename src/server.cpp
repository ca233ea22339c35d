#include "server.h"
#include "log.h"
#include "request_context.h"
#include "request_handler.h"
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace rec {

namespace {

constexpr size_t kMaxRequestBytes = 1 << 20;

// True once the peer has fully closed or reset the connection. A client
// that only shut down its write side is still waiting for the answer.
bool peerGone(int fd) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = 0;
  pfd.revents = 0;
  if (poll(&pfd, 1, 0) <= 0) {
    return false;
  }
  return (pfd.revents & (POLLHUP | POLLERR)) != 0;
}

// Waits until fd has data or EOF to read; false once `timeout` passes
bool waitReadable(int fd, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      return false;
    }
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, static_cast<int>(left.count()));
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    return ready > 0;
  }
}

bool sendAll(int fd, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

} // namespace

UnixSocketServer::UnixSocketServer(const std::string& socket_path,
                                   std::shared_ptr<RequestHandler> handler,
                                   int workers,
                                   std::chrono::milliseconds request_timeout)
  : socket_path_(socket_path), handler_(std::move(handler)), worker_count_(workers),
    request_timeout_(request_timeout), server_fd_(-1), running_(false) {
  if (worker_count_ <= 0) {
    throw std::invalid_argument("Server needs at least one worker");
  }
}

UnixSocketServer::~UnixSocketServer() {
  stop();
}

void UnixSocketServer::start() {
  // Create socket
  server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    throw std::runtime_error("Failed to create socket");
  }

  // Remove existing socket file
  unlink(socket_path_.c_str());

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    close(server_fd_);
    throw std::runtime_error("Socket path too long: " + socket_path_);
  }
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
    close(server_fd_);
    throw std::runtime_error("Failed to bind socket " + socket_path_ + ": " + std::strerror(errno));
  }

  if (listen(server_fd_, 64) < 0) {
    close(server_fd_);
    throw std::runtime_error("Failed to listen on socket");
  }

  running_ = true;
  for (int i = 0; i < worker_count_; ++i) {
    workers_.emplace_back(&UnixSocketServer::workerLoop, this);
  }
  accept_thread_ = std::thread(&UnixSocketServer::acceptLoop, this);

  log::info("Listening on " + socket_path_ + " with " + std::to_string(worker_count_) + " workers");
}

void UnixSocketServer::stop() {
  bool was_running;
  {
    // Under the queue lock so a worker between its predicate check and
    // its wait cannot miss the wakeup below
    std::lock_guard<std::mutex> lock(queue_mutex_);
    was_running = running_.exchange(false);
  }
  if (was_running) {
    // Close server socket to unblock accept()
    if (server_fd_ >= 0) {
      shutdown(server_fd_, SHUT_RDWR);
      close(server_fd_);
      server_fd_ = -1;
    }

    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }

    // Workers drain what is already queued, then exit
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    workers_.clear();

    unlink(socket_path_.c_str());
  }
}

void UnixSocketServer::acceptLoop() {
  while (running_.load()) {
    int client_fd = accept(server_fd_, nullptr, nullptr);
    if (client_fd < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (running_.load()) {
        log::error(std::string("Accept failed: ") + std::strerror(errno));
      }
      break;
    }

    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      pending_.push_back(client_fd);
    }
    queue_cv_.notify_one();
  }
}

void UnixSocketServer::workerLoop() {
  while (true) {
    int client_fd = -1;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !pending_.empty() || !running_.load(); });
      if (pending_.empty()) {
        return;
      }
      client_fd = pending_.front();
      pending_.pop_front();
    }
    handleClient(client_fd);
  }
}

void UnixSocketServer::handleClient(int client_fd) {
  // The deadline covers reading the request too, so a silent client
  // cannot hold a worker longer than one request timeout
  RequestContext context(request_timeout_);

  std::string request;
  char buffer[65536];

  while (request.size() < kMaxRequestBytes) {
    if (!waitReadable(client_fd, context.remaining(request_timeout_))) {
      log::warn("Dropping client that sent no complete request within " +
                std::to_string(request_timeout_.count()) + "ms");
      close(client_fd);
      return;
    }
    ssize_t bytes_read = recv(client_fd, buffer, sizeof(buffer), 0);
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read <= 0) {
      break;
    }
    request.append(buffer, static_cast<size_t>(bytes_read));
    if (request.find('\n') != std::string::npos) {
      break;
    }
  }

  if (request.empty()) {
    close(client_fd);
    return;
  }

  context.setDisconnectProbe([client_fd]() { return peerGone(client_fd); });

  std::string response = handler_->handle(request, context);
  response.push_back('\n');

  if (!sendAll(client_fd, response)) {
    log::warn("Client went away before the response was sent");
  }

  close(client_fd);
}

} // namespace rec
