// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/logging.h"

#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <mutex>
#include <vector>

#include "base/concat.h"
#include "base/result.h"

namespace base {

static pid_t my_gettid() { return syscall(SYS_gettid); }

static int my_gettimeofday(struct timeval* tv) {
  return ::gettimeofday(tv, nullptr);
}

inline namespace implementation {

using Vec = std::vector<LogTarget*>;
using Lock = std::unique_lock<std::mutex>;

static std::once_flag g_once;
static std::mutex g_mu;
static level_t g_stderr = LOG_LEVEL_INFO;  // protected by g_mu
static GetTidFunc g_gtid = nullptr;        // protected by g_mu
static GetTimeOfDayFunc g_gtod = nullptr;  // protected by g_mu
static Vec* g_vec = nullptr;               // protected by g_mu

class LogSTDERR : public LogTarget {
 public:
  LogSTDERR() noexcept = default;
  bool want(const char* file, unsigned int line, level_t level) const override {
    // g_mu held by base::want()
    return level >= g_stderr;
  }
  void log(const LogEntry& entry) override {
    // g_mu held by base::log()
    auto str = entry.as_string();
    ::fwrite(str.data(), 1, str.size(), stderr);
  }
  void flush() override { ::fflush(stderr); }
};

static LogTarget* make_stderr() {
  static LogTarget* const ptr = new LogSTDERR;
  return ptr;
}

// A misbehaving LogTarget must not take down the caller.
template <typename F, typename... Args>
static void ignore_exceptions(F func, Args&&... args) {
  try {
    func(std::forward<Args>(args)...);
  } catch (const std::exception& e) {
    ::fprintf(stderr, "LogTarget threw: %s\n", e.what());
  }
}

static void init() {
  Lock lock(g_mu);
  if (!g_gtid) g_gtid = my_gettid;
  if (!g_gtod) g_gtod = my_gettimeofday;
  if (!g_vec) g_vec = new Vec{make_stderr()};
}

static void maybe_terminate(const LogEntry& entry) {
  if (entry.level >= LOG_LEVEL_FATAL) std::terminate();
#ifndef NDEBUG
  if (entry.level >= LOG_LEVEL_DFATAL) std::terminate();
#endif
}

}  // inline namespace implementation

LogEntry::LogEntry(const char* file, unsigned int line, level_t level,
                   std::string message) noexcept : file(file),
                                                   line(line),
                                                   level(level),
                                                   message(std::move(message)) {
  std::call_once(g_once, [] { init(); });
  Lock lock(g_mu);
  ::bzero(&time, sizeof(time));
  (*g_gtod)(&time);
  tid = (*g_gtid)();
}

void LogEntry::append_to(std::string* out) const {
  char ch;
  if (level >= LOG_LEVEL_DFATAL) {
    ch = 'F';
  } else if (level >= LOG_LEVEL_ERROR) {
    ch = 'E';
  } else if (level >= LOG_LEVEL_WARN) {
    ch = 'W';
  } else if (level >= LOG_LEVEL_INFO) {
    ch = 'I';
  } else {
    ch = 'D';
  }

  struct tm tm;
  ::gmtime_r(&time.tv_sec, &tm);

  // "[IWEFD]<mm><dd> <hh>:<mm>:<ss>.<uuuuuu>  <tid> <file>:<line>] <message>"

  std::array<char, 32> buf;
  ::snprintf(buf.data(), buf.size(), "%c%02d%02d %02d:%02d:%02d.%06ld  ", ch,
             tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
             static_cast<long>(time.tv_usec));

  concat_to(out, buf.data(), tid, ' ', file, ':', line, "] ", message, '\n');
}

std::string LogEntry::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

static std::unique_ptr<std::ostringstream> make_ss(const char* file,
                                                   unsigned int line,
                                                   level_t level) {
  if (file == nullptr) std::terminate();
  if (line == 0) std::terminate();

  std::unique_ptr<std::ostringstream> ptr;
  if (want(file, line, level)) ptr.reset(new std::ostringstream);
  return ptr;
}

Logger::Logger(const char* file, unsigned int line, level_t level)
    : file_(file), line_(line), level_(level), ss_(make_ss(file, line, level)) {}

bool want(const char* file, unsigned int line, level_t level) {
  std::call_once(g_once, [] { init(); });
  if (level >= LOG_LEVEL_DFATAL) return true;
  Lock lock(g_mu);
  bool result = false;
  for (const LogTarget* target : *g_vec) {
    ignore_exceptions([file, line, level, target, &result] {
      result = target->want(file, line, level);
    });
    if (result) break;
  }
  return result;
}

void log(const LogEntry& entry) {
  std::call_once(g_once, [] { init(); });
  {
    Lock lock(g_mu);
    if (entry) {
      for (LogTarget* target : *g_vec) {
        ignore_exceptions([&entry, target] {
          if (target->want(entry.file, entry.line, entry.level)) {
            target->log(entry);
          }
        });
      }
    }
    if (entry.level >= LOG_LEVEL_ERROR) {
      for (LogTarget* target : *g_vec) {
        ignore_exceptions([target] { target->flush(); });
      }
    }
  }
  maybe_terminate(entry);
}

void log_flush() {
  std::call_once(g_once, [] { init(); });
  Lock lock(g_mu);
  for (LogTarget* target : *g_vec) {
    ignore_exceptions([target] { target->flush(); });
  }
}

void log_stderr_set_level(level_t level) {
  std::call_once(g_once, [] { init(); });
  Lock lock(g_mu);
  g_stderr = level;
}

void log_target_add(LogTarget* target) {
  std::call_once(g_once, [] { init(); });
  Lock lock(g_mu);
  g_vec->push_back(target);
}

void log_target_remove(LogTarget* target) {
  std::call_once(g_once, [] { init(); });
  Lock lock(g_mu);
  auto& v = *g_vec;
  for (auto it = v.begin(), end = v.end(); it != end; ++it) {
    if (*it == target) {
      v.erase(it);
      break;
    }
  }
}

void log_set_gettid(GetTidFunc func) {
  std::call_once(g_once, [] { init(); });
  Lock lock(g_mu);
  if (func)
    g_gtid = func;
  else
    g_gtid = my_gettid;
}

void log_set_gettimeofday(GetTimeOfDayFunc func) {
  std::call_once(g_once, [] { init(); });
  Lock lock(g_mu);
  if (func)
    g_gtod = func;
  else
    g_gtod = my_gettimeofday;
}

namespace internal {

Logger log_check(const char* file, unsigned int line, const char* expr,
                 bool cond) {
  if (cond) return Logger();
  Logger logger(file, line, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << expr;
  return logger;
}

Logger log_check_ok(const char* file, unsigned int line, const char* expr,
                    const Result& rslt) {
  if (rslt) return Logger();
  Logger logger(file, line, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << expr << ": " << rslt.as_string();
  return logger;
}

}  // namespace internal

}  // namespace base
