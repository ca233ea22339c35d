#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rec {

class RequestHandler;

// One JSON request per connection: read until newline or EOF, answer,
// close. An accept thread queues connections for a fixed worker pool.
class UnixSocketServer {
public:
  UnixSocketServer(const std::string& socket_path,
                   std::shared_ptr<RequestHandler> handler,
                   int workers,
                   std::chrono::milliseconds request_timeout);
  ~UnixSocketServer();

  void start();
  void stop();
  bool isRunning() const { return running_; }

private:
  void acceptLoop();
  void workerLoop();
  void handleClient(int client_fd);

  std::string socket_path_;
  std::shared_ptr<RequestHandler> handler_;
  int worker_count_;
  std::chrono::milliseconds request_timeout_;
  int server_fd_;
  std::atomic<bool> running_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<int> pending_;
};

} // namespace rec
