/*
 * Copyright (c) 2023, NVIDIA CORPORATION.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

/*
 * This is the header file for the set of QEmbed debugging features.
 *
 * 1. Multi-level, easy-to-redirect logging:
 * Instead of using std::cout or printf, use QEMB_LOG or QEMB_PRINT.
 * The message level is specified as the first argument of the log function.
     ERROR (-1): error messages. (stderr)
     SILENCE (0): messages which are never printed.
     INFO (1): non-error & non-warning informative messages. (stdout)
     WARNING (2): warning messages (stdout)
     DEBUG (3): debug, verbose messages (stdout)
     TRACE (9): per-batch diagnostics (stdout)

 * 1.1. Examples:
     QEMB_LOG(INFO, WORLD, "the current value: %d\n", val);
     QEMB_LOG_S(DEBUG, WORLD) << "table " << table_id << " resolved" << std::endl;
     QEMB_LOG_C(TRACE, WORLD, "cache set ", set, " evicted way ", way, '\n');

 * The maximum log level can be changed without rebuilding by setting 'QEMB_LOG_LEVEL'.
 * Setting 'QEMB_LOG_TO_FILE' to 1 additionally writes every level to its own file in the
 * working directory; 2 writes to the files only.
     $ QEMB_LOG_LEVEL=3 QEMB_LOG_TO_FILE=1 ./embedding_test
     $ ls
     qemb_3374842_error.log
     qemb_3374842_info.log
     qemb_3374842_warning.log
     qemb_3374842_debug.log

 * 2. Exception handling:
 * For QEmbed's own errors, QEMB_OWN_THROW or QEMB_THROW_IF is used.
 * The thrown exception records where the error has occured and what the error is about.
 * 2.1. Examples:
     QEMB_OWN_THROW(Error_t::WrongInput, "offsets must start at 0");
     QEMB_THROW_IF(num_bytes != expected, Error_t::FormatMismatch, "row has the wrong size");

 * If you want to print the nested exception message at a catch statement, call
 * 'Logger::print_exception(e, 0)'. They will be printed at the ERROR level.
 *
 * 3. Error check:
 * To terminate immediately on a broken internal invariant, use QEMB_CHECK (always executed) or
 * QEMB_ASSERT (debug build only).
     QEMB_CHECK(way < associativity_);
     QEMB_ASSERT(line != nullptr);
 */

#include <core/macro.hpp>
#include <cstdio>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace QEmbed {

enum class Error_t {
  Success,
  FileCannotOpen,
  BrokenFile,
  OutOfMemory,
  OutOfBound,
  WrongInput,
  IllegalCall,
  UnSupportedFormat,
  DataCheckError,
  FormatMismatch,
  UnsupportedIndexWidth,
  PoolingShape,
  InvalidPoolingConfig,
  IndexOutOfRange
};

// We have five reserved verbosity levels for users' convenience.
#define LOG_ERROR_LEVEL -1
#define LOG_SILENCE_LEVEL 0  // print nothing
#define LOG_INFO_LEVEL 1
#define LOG_WARNING_LEVEL 2
#define LOG_DEBUG_LEVEL 3  // If you build in debug mode, it is the default mode
#define LOG_TRACE_LEVEL 9

#define LOG_LEVEL(NAME) LOG_##NAME##_LEVEL

#define LOG_RANK_ROOT false
#define LOG_RANK_WORLD true

#define LOG_RANK(TYPE) LOG_RANK_##TYPE

#ifdef NDEBUG
#define DEFAULT_LOG_LEVEL LOG_LEVEL(WARNING)
#else
#define DEFAULT_LOG_LEVEL LOG_LEVEL(DEBUG)
#endif

#define QEMB_LOG(NAME, TYPE, ...) \
  QEmbed::Logger::get().log(LOG_LEVEL(NAME), LOG_RANK(TYPE), true, __VA_ARGS__)

#define QEMB_LOG_S(NAME, TYPE) QEmbed::Logger::get().log(LOG_LEVEL(NAME), LOG_RANK(TYPE), true)

#define QEMB_LOG_C(NAME, TYPE, ...)                                          \
  do {                                                                       \
    const QEmbed::Logger& logger = QEmbed::Logger::get();                    \
    if (logger.can_log_at(LOG_LEVEL(NAME), LOG_RANK(TYPE))) {                \
      logger.log(LOG_LEVEL(NAME), LOG_RANK(TYPE), true).append(__VA_ARGS__); \
    }                                                                        \
  } while (0)

#define QEMB_PRINT(NAME, ...) \
  QEmbed::Logger::get().log(LOG_LEVEL(NAME), LOG_RANK(ROOT), false, __VA_ARGS__)

struct SrcLoc {
  const char* file;
  unsigned line;
  const char* func;
  const char* expr;
};

#define CUR_SRC_LOC(EXPR) \
  QEmbed::SrcLoc { __FILE__, __LINE__, __func__, #EXPR }

// For QEmbed own error types, it is up to users to define the msesage.
#define QEMB_OWN_THROW(EXPR, MSG)                                                   \
  do {                                                                              \
    QEmbed::Error_t err_thr = (EXPR);                                               \
    if (err_thr != QEmbed::Error_t::Success) {                                      \
      QEmbed::Logger::get().do_throw(err_thr, CUR_SRC_LOC(EXPR), std::string(MSG)); \
    }                                                                               \
  } while (0)

#define QEMB_THROW_IF(EXPR, ERROR, MSG)                                             \
  do {                                                                              \
    const auto& expr = (EXPR);                                                      \
    if (expr) {                                                                     \
      QEmbed::Logger::get().do_throw((ERROR), CUR_SRC_LOC(EXPR), std::string(MSG)); \
    }                                                                               \
  } while (0)

#define QEMB_CHECK(EXPR)                              \
  do {                                                \
    const auto& expr = (EXPR);                        \
    if (!expr) {                                      \
      QEmbed::Logger::get().abort(CUR_SRC_LOC(EXPR)); \
    }                                                 \
  } while (0)

#define QEMB_CHECK_HINT(EXPR, HINT, ...)                                     \
  do {                                                                       \
    const auto& expr = (EXPR);                                               \
    if (!expr) {                                                             \
      QEmbed::Logger::get().abort(CUR_SRC_LOC(EXPR), (HINT), ##__VA_ARGS__); \
    }                                                                        \
  } while (0)

#define QEMB_DIE(HINT, ...) QEMB_CHECK_HINT(false, HINT, ##__VA_ARGS__)

#ifndef NDEBUG
#define QEMB_ASSERT(EXPR)                                                      \
  do {                                                                         \
    QEmbed::Logger::get().check_lazy([&] { return EXPR; }, CUR_SRC_LOC(EXPR)); \
  } while (0)
#else
#define QEMB_ASSERT(EXPR)
#endif

class Logger final {
 public:
  class DeferredEntry final {
   public:
    QEMB_DISALLOW_COPY_AND_MOVE(DeferredEntry);

    inline DeferredEntry(const Logger* logger, const int level, const bool with_prefix)
        : logger_{logger}, level_{level}, with_prefix_{with_prefix} {}

    ~DeferredEntry();

    template <typename... Args>
    inline DeferredEntry& append(Args&&... args) {
      if (logger_) {
        (os_ << ... << args);
      }
      return *this;
    }

    template <typename T>
    inline DeferredEntry& operator<<(const T& value) {
      if (logger_) {
        os_ << value;
      }
      return *this;
    }

    inline DeferredEntry& operator<<(std::ostream& (*fn)(std::ostream&)) {
      if (logger_) {
        fn(os_);
      }
      return *this;
    }

   private:
    const Logger* logger_;
    const int level_;
    const bool with_prefix_;
    std::ostringstream os_;
  };

  static constexpr size_t MAX_PREFIX_LENGTH = 96;

  static void print_exception(const std::exception& e, int depth);

  static Logger& get();

  QEMB_DISALLOW_COPY_AND_MOVE(Logger);

  ~Logger();

  // Single-process engine: every caller is the root, so `per_rank` does not filter anything.
  inline bool can_log_at(const int level, const bool /*per_rank*/) const {
    return level != LOG_LEVEL(SILENCE) && level <= max_level_;
  }

  void log(int level, bool per_rank, bool with_prefix, const char* format, ...) const;

  DeferredEntry log(int level, bool per_rank, bool with_prefix) const;

  [[noreturn]] void abort(const SrcLoc& loc, const char* format = nullptr, ...) const;

  template <typename Condition>
  void check_lazy(const Condition& condition, const SrcLoc& loc) {
    if (condition() == false) {
      abort(loc);
    }
  }

  [[noreturn]] void do_throw(QEmbed::Error_t error_type, const SrcLoc& loc,
                             const std::string& message) const;

 private:
  Logger();

  size_t write_log_prefix(bool with_prefix, char (&buffer)[Logger::MAX_PREFIX_LENGTH],
                          int level) const;

  void write(int level, const char* prefix, size_t prefix_length, const char* message) const;

 private:
  int max_level_{DEFAULT_LOG_LEVEL};
  bool log_to_std_{true};
  bool log_to_file_{false};

  std::map<int, FILE*> log_std_;
  std::map<int, FILE*> log_file_;
  std::map<int, std::string> level_name_;

  mutable std::mutex write_guard_;
};

bool qemb_has_thread_name();
const char* qemb_get_thread_name();
void qemb_set_thread_name(const char* name);
inline void qemb_set_thread_name(const std::string& name) {
  return qemb_set_thread_name(name.c_str());
}

}  // namespace QEmbed
