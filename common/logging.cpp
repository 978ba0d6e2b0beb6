// Async logger backed by a Vyukov MPMC bounded queue and a single writer thread

#include "common/logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <new>
#include <thread>

#include <sched.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <unistd.h>

#include "common/time_utils.h"

namespace Common {

// ========== Bounded MPMC queue ==========

class MPMCQueue {
public:
  static constexpr std::size_t MAX_CAPACITY = 65536;

  struct LogRecord {
    uint64_t wall_nanos{0};
    uint32_t thread_id{0};
    uint16_t level{0};
    uint16_t len{0};
    char msg[Logger::MAX_MSG_SIZE]{};
  };

  MPMCQueue(const MPMCQueue&) = delete;
  MPMCQueue& operator=(const MPMCQueue&) = delete;
  MPMCQueue(MPMCQueue&&) = delete;
  MPMCQueue& operator=(MPMCQueue&&) = delete;

  explicit MPMCQueue(std::size_t capacity)
    : size_(std::min(roundUpPow2(capacity), MAX_CAPACITY)),
      mask_(size_ - 1),
      cells_(new Cell[size_]) {
    for (std::size_t i = 0; i < size_; ++i) {
      cells_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  ~MPMCQueue() = default;

  auto enqueue(const LogRecord& rec) noexcept -> bool {
    std::size_t pos = tail_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = cells_[pos & mask_];
      const std::size_t seq = c.seq.load(std::memory_order_acquire);
      const intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
      if (diff == 0) {
        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          c.data = rec;
          c.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false;  // full
      } else {
        pos = tail_.load(std::memory_order_relaxed);
      }
    }
  }

  auto dequeue(LogRecord& out) noexcept -> bool {
    std::size_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = cells_[pos & mask_];
      const std::size_t seq = c.seq.load(std::memory_order_acquire);
      const intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          out = c.data;
          c.seq.store(pos + size_, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false;  // empty
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
  }

private:
  struct Cell {
    CACHE_ALIGNED std::atomic<std::size_t> seq{0};
    LogRecord data{};
  };

  static auto roundUpPow2(std::size_t n) noexcept -> std::size_t {
    if (n < 2) return 2;
    --n;
    n |= n >> 1;  n |= n >> 2;  n |= n >> 4;
    n |= n >> 8;  n |= n >> 16; n |= n >> 32;
    return n + 1;
  }

  CACHE_ALIGNED std::atomic<std::size_t> head_{0};
  CACHE_ALIGNED std::atomic<std::size_t> tail_{0};
  std::size_t size_;
  std::size_t mask_;
  std::unique_ptr<Cell[]> cells_;
};

// ========== Environment knobs ==========

namespace {

auto envLong(const char* name, long fallback, long min_value, long max_value) noexcept -> long {
  const char* env = std::getenv(name);
  if (env == nullptr || *env == '\0') return fallback;
  char* end = nullptr;
  const long value = std::strtol(env, &end, 10);
  if (end == env || *end != '\0') return fallback;
  if (value < min_value || value > max_value) return fallback;
  return value;
}

auto queueCapacity() noexcept -> std::size_t {
  return static_cast<std::size_t>(envLong("LOGGER_QUEUE_CAPACITY", 16384, 2,
                                          static_cast<long>(MPMCQueue::MAX_CAPACITY)));
}

auto batchSize() noexcept -> std::size_t {
  return static_cast<std::size_t>(envLong("LOGGER_BATCH", 128, 1, 256));
}

auto flushMs() noexcept -> int {
  return static_cast<int>(envLong("LOGGER_FLUSH_MS", 100, 1, 10000));
}

auto spinBeforeWait() noexcept -> int {
  return static_cast<int>(envLong("LOGGER_SPIN_BEFORE_WAIT", 500, 0, 1'000'000));
}

auto writerCpu() noexcept -> int {
  return static_cast<int>(envLong("LOGGER_WRITER_CPU", -1, 0, sysconf(_SC_NPROCESSORS_ONLN) - 1));
}

auto currentThreadTag() noexcept -> uint32_t {
  thread_local const uint32_t tag =
    static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
  return tag;
}

} // namespace

// ========== Writer ==========

class AsyncLoggerImpl {
public:
  AsyncLoggerImpl(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl& operator=(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl(AsyncLoggerImpl&&) = delete;
  AsyncLoggerImpl& operator=(AsyncLoggerImpl&&) = delete;

  explicit AsyncLoggerImpl(const char* path)
    : queue_(queueCapacity()) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
      // a failure here surfaces as fopen() returning nullptr
    }

    file_ = std::fopen(path, "w");
    if (file_ != nullptr) {
      std::setvbuf(file_, nullptr, _IOFBF, 1 << 16);
      std::fprintf(file_, "[LOGGER_CONFIG] queue_capacity=%zu batch_size=%zu spin_count=%d flush_ms=%d writer_cpu=%d\n",
                   queueCapacity(), batchSize(), spinBeforeWait(), flushMs(), writerCpu());
      std::fflush(file_);
    }

    writer_thread_ = std::thread([this] {
      const int cpu = writerCpu();
      if (cpu >= 0) {
        cpu_set_t cpuset;
        CPU_ZERO(&cpuset);
        CPU_SET(static_cast<size_t>(cpu), &cpuset);
        // unpinned writer is still correct
        (void)pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
      }
      writerLoop();
    });
  }

  ~AsyncLoggerImpl() {
    running_.store(false, std::memory_order_release);
    cv_.notify_all();
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
    if (file_ != nullptr) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  [[nodiscard]] auto isOpen() const noexcept -> bool { return file_ != nullptr; }

  void log(uint16_t level, const char* msg, std::size_t len) noexcept {
    MPMCQueue::LogRecord rec;
    rec.wall_nanos = getWallClockNanos();
    rec.thread_id = currentThreadTag();
    rec.level = level;
    rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
    std::memcpy(rec.msg, msg, rec.len);
    rec.msg[rec.len] = '\0';

    if (UNLIKELY(!queue_.enqueue(rec))) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    enqueued_.fetch_add(1, std::memory_order_release);
    if (queue_was_empty_.exchange(false, std::memory_order_acq_rel)) {
      cv_.notify_one();
    }
  }

  void flush() noexcept {
    const uint64_t target = enqueued_.load(std::memory_order_acquire);
    const uint64_t deadline = getNanosSinceEpoch() + 2'000'000'000ULL;
    cv_.notify_one();
    while (processed_.load(std::memory_order_acquire) < target) {
      if (getNanosSinceEpoch() > deadline) break;
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
  }

  [[nodiscard]] auto stats() const noexcept -> Logger::Stats {
    Logger::Stats s;
    s.messages_written = written_.load(std::memory_order_relaxed);
    s.messages_dropped = drops_.load(std::memory_order_relaxed);
    s.bytes_written = bytes_.load(std::memory_order_relaxed);
    return s;
  }

private:
  static constexpr std::size_t MAX_BATCH = 256;

  void writerLoop() noexcept {
    const int spin_count = spinBeforeWait();
    const std::size_t batch_size = batchSize();
    const auto flush_interval = std::chrono::milliseconds(flushMs());

    MPMCQueue::LogRecord batch[MAX_BATCH];
    struct iovec iov[MAX_BATCH * 3];
    char headers[MAX_BATCH][80];
    static const char newline = '\n';

    auto last_flush = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_.load(std::memory_order_acquire) || !queue_.empty()) {
      bool found = false;
      for (int i = 0; i < spin_count; ++i) {
        if (!queue_.empty()) {
          found = true;
          break;
        }
        CPU_PAUSE();
      }
      if (!found) {
        cv_.wait_for(lock, std::chrono::milliseconds(1), [this] {
          return !running_.load(std::memory_order_acquire) || !queue_.empty();
        });
      }
      lock.unlock();

      std::size_t n = 0;
      while (n < batch_size && queue_.dequeue(batch[n])) {
        ++n;
      }

      if (n > 0) {
        if (file_ != nullptr) {
          writeBatch(batch, n, iov, headers, &newline);
        }
        if (queue_.empty()) {
          queue_was_empty_.store(true, std::memory_order_release);
        }

        const auto now = std::chrono::steady_clock::now();
        if (file_ != nullptr && (queue_.empty() || now - last_flush >= flush_interval)) {
          std::fflush(file_);
          last_flush = now;
        }
        processed_.fetch_add(n, std::memory_order_release);
      }

      lock.lock();
    }

    if (file_ != nullptr) {
      std::fflush(file_);
    }
  }

  void writeBatch(const MPMCQueue::LogRecord* batch, std::size_t n, struct iovec* iov,
                  char (*headers)[80], const char* newline) noexcept {
    std::size_t iov_count = 0;
    std::size_t bytes = 0;
    for (std::size_t i = 0; i < n; ++i) {
      const auto& rec = batch[i];
      const auto secs = static_cast<long long>(rec.wall_nanos / 1'000'000'000ULL);
      const auto nanos = static_cast<long long>(rec.wall_nanos % 1'000'000'000ULL);
      const int header_len = std::snprintf(headers[i], sizeof(headers[i]), "[%lld.%09lld][%s][T%u] ",
                                           secs, nanos,
                                           Logger::levelToString(static_cast<Logger::Level>(rec.level)),
                                           rec.thread_id);
      if (header_len <= 0) continue;
      const auto hlen = std::min(static_cast<std::size_t>(header_len), sizeof(headers[i]) - 1);
      iov[iov_count++] = {headers[i], hlen};
      iov[iov_count++] = {const_cast<char*>(rec.msg), rec.len};
      iov[iov_count++] = {const_cast<char*>(newline), 1};
      bytes += hlen + rec.len + 1;
    }
    if (iov_count == 0) return;

    // stdio buffer may hold the startup banner; keep ordering before writev
    std::fflush(file_);
    const int fd = fileno(file_);
    bool done = false;
    if (isRegularFile(fd)) {
      done = ::writev(fd, iov, static_cast<int>(iov_count)) >= 0;
    }
    if (!done) {
      for (std::size_t i = 0; i < iov_count; ++i) {
        std::fwrite(iov[i].iov_base, 1, iov[i].iov_len, file_);
      }
    }
    written_.fetch_add(iov_count / 3, std::memory_order_relaxed);
    bytes_.fetch_add(bytes, std::memory_order_relaxed);
  }

  static auto isRegularFile(int fd) noexcept -> bool {
    struct stat st;
    return fstat(fd, &st) == 0 && S_ISREG(st.st_mode);
  }

  FILE* file_{nullptr};
  MPMCQueue queue_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{true};
  CACHE_ALIGNED std::atomic<uint64_t> enqueued_{0};
  CACHE_ALIGNED std::atomic<uint64_t> processed_{0};
  CACHE_ALIGNED std::atomic<uint64_t> drops_{0};
  CACHE_ALIGNED std::atomic<uint64_t> written_{0};
  CACHE_ALIGNED std::atomic<uint64_t> bytes_{0};
  CACHE_ALIGNED std::atomic<bool> queue_was_empty_{true};
};

// ========== Global instance ==========

namespace {
std::unique_ptr<AsyncLoggerImpl> g_logger_impl;
std::unique_ptr<Logger> g_logger_owner;
std::mutex g_logger_mutex;
} // namespace

Logger* g_logger = nullptr;

auto Logger::levelToString(Level level) noexcept -> const char* {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    case FATAL: return "FATAL";
  }
  return "UNKN ";
}

auto Logger::parseLevel(const char* name, Level& out) noexcept -> bool {
  if (name == nullptr) return false;
  char lowered[8] = {};
  const size_t len = std::strlen(name);
  if (len == 0 || len >= sizeof(lowered)) return false;
  for (size_t i = 0; i < len; ++i) {
    lowered[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
  }
  if (std::strcmp(lowered, "debug") == 0) { out = DEBUG; return true; }
  if (std::strcmp(lowered, "info") == 0)  { out = INFO;  return true; }
  if (std::strcmp(lowered, "warn") == 0 || std::strcmp(lowered, "warning") == 0) { out = WARN; return true; }
  if (std::strcmp(lowered, "error") == 0) { out = ERROR; return true; }
  if (std::strcmp(lowered, "fatal") == 0) { out = FATAL; return true; }
  return false;
}

void Logger::write(Level level, const char* msg, size_t len) noexcept {
  logMessageToGlobal(level, msg, len);
}

auto Logger::getStats() const noexcept -> Stats {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (g_logger_impl) {
    return g_logger_impl->stats();
  }
  return Stats{};
}

void Logger::flush() noexcept {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (g_logger_impl) {
    g_logger_impl->flush();
  }
}

auto initLogging(const char* log_file, Logger::Level min_level) noexcept -> bool {
  if (log_file == nullptr || *log_file == '\0') return false;

  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger = nullptr;
  g_logger_owner.reset();
  g_logger_impl.reset();

  try {
    g_logger_impl = std::make_unique<AsyncLoggerImpl>(log_file);
    g_logger_owner = std::make_unique<Logger>(min_level);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "logger: failed to start for %s: %s\n", log_file, e.what());
    g_logger_impl.reset();
    return false;
  }
  g_logger = g_logger_owner.get();
  return g_logger_impl->isOpen();
}

void shutdownLogging() noexcept {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger = nullptr;
  g_logger_owner.reset();
  g_logger_impl.reset();
}

void logMessageToGlobal(Logger::Level level, const char* msg, size_t len) noexcept {
  // hot path takes no lock
  AsyncLoggerImpl* impl = g_logger_impl.get();
  if (impl != nullptr) {
    impl->log(static_cast<uint16_t>(level), msg, len);
  }
}

} // namespace Common
