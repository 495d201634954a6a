#include "opsrelay/util/log.hpp"

#include <optional>
#include <unistd.h>
#include <vector>

namespace opsrelay::log {

namespace {

constexpr std::string_view kControlStdout = "\x01STDOUT:";
constexpr std::string_view kControlFile = "\x01FILE:";

[[nodiscard]] auto is_tty(FILE *out) noexcept -> bool {
  if (out == nullptr) {
    return false;
  }
  const int fd = ::fileno(out);
  return fd >= 0 && ::isatty(fd) != 0;
}

} // namespace

Logger::~Logger() {
  stop();
  if (file_) {
    std::fclose(file_);
  }
}

auto Logger::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel))
    return;
  queue_ctx_.restart();
  auto channel =
      std::make_shared<LogChannel>(queue_ctx_.get_executor(), kQueueCapacity);
  queue_.store(channel, std::memory_order_release);
  writer_ = std::jthread(
      [this, channel = std::move(channel)] { writer_loop(channel); });
}

auto Logger::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel))
    return;

  auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel);
  if (queue) {
    queue->close();
  }
  queue_ctx_.stop();
  if (writer_.joinable()) {
    writer_.join();
  }
}

auto Logger::set_output_stderr() noexcept -> void {
  output_.store(stderr, std::memory_order_release);
}

auto Logger::set_output_file(std::string_view path) -> bool {
  if (auto q = queue_.load(std::memory_order_acquire); q) {
    std::string cmd = path.empty()
                          ? std::string(kControlStdout)
                          : std::string(kControlFile) + std::string(path);
    return q->try_send(boost::system::error_code{}, std::move(cmd));
  }

  if (path.empty()) {
    apply_control(kControlStdout);
    return true;
  }
  FILE *f = std::fopen(std::string(path).c_str(), "a");
  if (!f)
    return false;
  std::setvbuf(f, nullptr, _IOLBF, 0);
  output_.store(f, std::memory_order_release);
  if (file_)
    std::fclose(file_);
  file_ = f;
  return true;
}

auto Logger::apply_control(std::string_view msg) -> void {
  if (msg.starts_with(kControlStdout)) {
    output_.store(stdout, std::memory_order_release);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    return;
  }
  if (msg.starts_with(kControlFile)) {
    std::string path(msg.substr(kControlFile.size()));
    FILE *f = std::fopen(path.c_str(), "a");
    if (!f) {
      return;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    if (file_)
      std::fclose(file_);
    file_ = f;
  }
}

auto Logger::write_direct(std::string_view line) -> void {
  auto *out = output_.load(std::memory_order_acquire);
  if (!out) {
    out = stdout;
  }
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

auto Logger::submit(std::string line) -> void {
  auto queue = queue_.load(std::memory_order_acquire);
  if (!queue) {
    write_direct(line);
    return;
  }
  if (queue->try_send(boost::system::error_code{}, std::move(line))) {
    return;
  }
  // Queue saturated. Off a TTY (ctest pipes, log files) drop rather than
  // block the io threads.
  if (!is_tty(output_.load(std::memory_order_acquire))) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  write_direct(line);
}

auto Logger::writer_loop(std::shared_ptr<LogChannel> queue) -> void {
  std::vector<std::string> batch;
  batch.reserve(kBatchSize);

  auto flush_batch = [&] {
    auto *out = output_.load(std::memory_order_acquire);
    if (!out) {
      out = stdout;
    }
    for (const auto &msg : batch) {
      if (msg.starts_with("\x01")) {
        apply_control(msg);
        out = output_.load(std::memory_order_acquire);
        continue;
      }
      std::fwrite(msg.data(), 1, msg.size(), out);
    }
    std::fflush(out);
    batch.clear();
  };

  while (running_.load(std::memory_order_acquire)) {
    std::optional<std::string> first;
    boost::system::error_code recv_ec;
    queue->async_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          recv_ec = ec;
          if (!ec) {
            first = std::move(item);
          }
        });

    queue_ctx_.restart();
    (void)queue_ctx_.run_one();
    if (!running_.load(std::memory_order_acquire) || recv_ec) {
      break;
    }
    if (!first) {
      continue;
    }
    batch.push_back(std::move(*first));

    while (batch.size() < kBatchSize) {
      std::optional<std::string> msg;
      const bool received = queue->try_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            if (!ec) {
              msg = std::move(item);
            }
          });
      if (!received) {
        break;
      }
      if (msg) {
        batch.push_back(std::move(*msg));
      }
    }
    flush_batch();
  }

  // Drain whatever was accepted before stop().
  for (;;) {
    std::optional<std::string> msg;
    if (!queue->try_receive(
            [&](const boost::system::error_code &ec, std::string item) {
              if (!ec) {
                msg = std::move(item);
              }
            })) {
      break;
    }
    if (msg) {
      batch.push_back(std::move(*msg));
    }
  }
  flush_batch();
}

} // namespace opsrelay::log
