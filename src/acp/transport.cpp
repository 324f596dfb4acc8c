#include "acp/transport.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <csignal>
#endif

namespace conductor::acp {

std::string to_string(TransportState state) {
  switch (state) {
    case TransportState::Disconnected:
      return "Disconnected";
    case TransportState::Connecting:
      return "Connecting";
    case TransportState::Connected:
      return "Connected";
    case TransportState::Failed:
      return "Failed";
  }
  return "Unknown";
}

// ============================================================
// StdioTransport::Impl: POSIX child process over pipes
// ============================================================

#ifndef _WIN32

class StdioTransport::Impl {
 public:
  Impl(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env)
      : command_(std::move(command)), args_(std::move(args)), env_(std::move(env)) {}

  ~Impl() {
    disconnect();
  }

  std::future<bool> connect() {
    std::promise<bool> promise;
    auto future = promise.get_future();
    promise.set_value(spawn());
    return future;
  }

  void disconnect() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    stopped_ = true;

    {
      std::lock_guard<std::mutex> write_lock(write_mutex_);
      if (write_fd_ >= 0) {
        close(write_fd_);
        write_fd_ = -1;
      }
    }

    // Ask the agent to exit, escalate to SIGKILL after the grace period
    if (pid_ > 0) {
      kill(pid_, SIGTERM);
      int status = 0;
      bool exited = false;
      for (int i = 0; i < 10 && !exited; ++i) {
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
          exited = true;
        } else {
          std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
      }
      if (!exited) {
        kill(pid_, SIGKILL);
        waitpid(pid_, &status, 0);
      }
      spdlog::debug("[Transport] Agent process {} reaped", pid_);
      pid_ = -1;
    }

    // Child is gone, so the reader sees EOF and returns
    if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id()) {
      reader_thread_.join();
    } else if (reader_thread_.joinable()) {
      reader_thread_.detach();
    }

    if (read_fd_ >= 0) {
      close(read_fd_);
      read_fd_ = -1;
    }

    state_ = TransportState::Disconnected;
  }

  bool send(const json& message) {
    if (state_ != TransportState::Connected) return false;

    std::string line = message.dump();
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0) return false;

    size_t offset = 0;
    while (offset < line.size()) {
      ssize_t written = write(write_fd_, line.data() + offset, line.size() - offset);
      if (written < 0) {
        if (errno == EINTR) continue;
        spdlog::error("[Transport] Write failed: {}", strerror(errno));
        return false;
      }
      offset += static_cast<size_t>(written);
    }
    return true;
  }

  void set_message_handler(Transport::MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    message_handler_ = std::move(handler);
  }

  void set_close_handler(Transport::CloseHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    close_handler_ = std::move(handler);
  }

  TransportState state() const {
    return state_;
  }

 private:
  bool spawn() {
    std::lock_guard<std::mutex> lock(process_mutex_);

    if (state_ == TransportState::Connected) return true;
    state_ = TransportState::Connecting;

    // A dead agent must surface as a write error, not kill the conductor
    std::signal(SIGPIPE, SIG_IGN);

    int stdin_pipe[2];   // [read-end, write-end]
    int stdout_pipe[2];  // [read-end, write-end]

    if (pipe(stdin_pipe) != 0) {
      spdlog::error("[Transport] Failed to create pipes: {}", strerror(errno));
      state_ = TransportState::Failed;
      return false;
    }
    if (pipe(stdout_pipe) != 0) {
      spdlog::error("[Transport] Failed to create pipes: {}", strerror(errno));
      close(stdin_pipe[0]);
      close(stdin_pipe[1]);
      state_ = TransportState::Failed;
      return false;
    }

    pid_ = fork();
    if (pid_ < 0) {
      spdlog::error("[Transport] Fork failed: {}", strerror(errno));
      close(stdin_pipe[0]);
      close(stdin_pipe[1]);
      close(stdout_pipe[0]);
      close(stdout_pipe[1]);
      state_ = TransportState::Failed;
      return false;
    }

    if (pid_ == 0) {
      // Child process
      close(stdin_pipe[1]);
      close(stdout_pipe[0]);

      dup2(stdin_pipe[0], STDIN_FILENO);
      dup2(stdout_pipe[1], STDOUT_FILENO);

      close(stdin_pipe[0]);
      close(stdout_pipe[1]);

      for (const auto& [key, val] : env_) {
        setenv(key.c_str(), val.c_str(), 1);
      }

      std::vector<const char*> argv;
      argv.push_back(command_.c_str());
      for (const auto& arg : args_) {
        argv.push_back(arg.c_str());
      }
      argv.push_back(nullptr);

      execvp(command_.c_str(), const_cast<char* const*>(argv.data()));
      _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    write_fd_ = stdin_pipe[1];
    read_fd_ = stdout_pipe[0];
    fcntl(write_fd_, F_SETFD, FD_CLOEXEC);
    fcntl(read_fd_, F_SETFD, FD_CLOEXEC);

    stopped_ = false;
    state_ = TransportState::Connected;

    reader_thread_ = std::thread([this]() {
      reader_loop();
    });

    spdlog::info("[Transport] Started {} (pid: {})", command_, pid_);
    return true;
  }

  void reader_loop() {
    std::string buffer;
    std::array<char, 4096> read_buf;

    while (true) {
      ssize_t n = read(read_fd_, read_buf.data(), read_buf.size());
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) break;

      buffer.append(read_buf.data(), static_cast<size_t>(n));

      // One JSON-RPC message per line
      size_t newline;
      while ((newline = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);

        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        try {
          auto msg = json::parse(line);
          std::lock_guard<std::mutex> lock(handler_mutex_);
          if (message_handler_) {
            message_handler_(msg);
          }
        } catch (const json::exception& e) {
          spdlog::warn("[Transport] Failed to parse JSON message: {}", e.what());
        }
      }
    }

    if (!stopped_) {
      spdlog::warn("[Transport] Agent {} closed its output", command_);
      state_ = TransportState::Failed;
      std::lock_guard<std::mutex> lock(handler_mutex_);
      if (close_handler_) {
        close_handler_();
      }
    }
  }

  std::string command_;
  std::vector<std::string> args_;
  std::map<std::string, std::string> env_;

  pid_t pid_ = -1;
  int write_fd_ = -1;
  int read_fd_ = -1;

  std::atomic<TransportState> state_{TransportState::Disconnected};
  std::atomic<bool> stopped_{false};

  std::thread reader_thread_;

  std::mutex write_mutex_;
  std::mutex process_mutex_;

  std::mutex handler_mutex_;
  Transport::MessageHandler message_handler_;
  Transport::CloseHandler close_handler_;
};

#else  // _WIN32

class StdioTransport::Impl {
 public:
  Impl(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env)
      : command_(std::move(command)), args_(std::move(args)), env_(std::move(env)) {}

  std::future<bool> connect() {
    spdlog::error("[Transport] Stdio transport not implemented on Windows");
    std::promise<bool> p;
    p.set_value(false);
    return p.get_future();
  }

  void disconnect() {}
  bool send(const json&) {
    return false;
  }
  void set_message_handler(Transport::MessageHandler) {}
  void set_close_handler(Transport::CloseHandler) {}
  TransportState state() const {
    return TransportState::Failed;
  }
 private:
  std::string command_;
  std::vector<std::string> args_;
  std::map<std::string, std::string> env_;
};

#endif

// ============================================================
// StdioTransport: delegates to Impl
// ============================================================

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env)
    : impl_(std::make_unique<Impl>(std::move(command), std::move(args), std::move(env))) {}

StdioTransport::~StdioTransport() = default;

bool StdioTransport::send(const json& message) {
  return impl_->send(message);
}

void StdioTransport::set_message_handler(MessageHandler handler) {
  impl_->set_message_handler(std::move(handler));
}

void StdioTransport::set_close_handler(CloseHandler handler) {
  impl_->set_close_handler(std::move(handler));
}

std::future<bool> StdioTransport::connect() {
  return impl_->connect();
}

void StdioTransport::disconnect() {
  impl_->disconnect();
}

TransportState StdioTransport::state() const {
  return impl_->state();
}

}  // namespace conductor::acp
