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

#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <base/debug/logger.hpp>
#include <chrono>
#include <common.hpp>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <thread>

namespace QEmbed {

#define LEVEL_MAP(MAP, NAME) MAP[LOG_LEVEL(NAME)] = #NAME

thread_local char THREAD_NAME[32]{};

bool qemb_has_thread_name() { return THREAD_NAME[0] != '\0'; }

const char* qemb_get_thread_name() { return THREAD_NAME; }

void qemb_set_thread_name(const char* name) {
  std::strncpy(THREAD_NAME, name, sizeof(THREAD_NAME) - 1);
  THREAD_NAME[sizeof(THREAD_NAME) - 1] = '\0';
}

Logger::DeferredEntry::~DeferredEntry() {
  if (logger_) {
    char prefix[Logger::MAX_PREFIX_LENGTH];
    const size_t prefix_length{logger_->write_log_prefix(with_prefix_, prefix, level_)};
    logger_->write(level_, prefix, prefix_length, os_.str().c_str());
  }
}

void Logger::print_exception(const std::exception& e, int depth) {
  Logger::get().log(LOG_ERROR_LEVEL, true, false, "%d. %s\n", depth, e.what());
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& e) {
    print_exception(e, depth + 1);
  }
}

Logger& Logger::get() {
  static std::unique_ptr<Logger> instance;
  static std::once_flag once_flag;

  std::call_once(once_flag, []() { instance.reset(new Logger()); });
  return *instance;
}

Logger::~Logger() {
  // If stdout and stderr are in use, we don't do fclose to prevent the situations where
  //   (1) the fds are taken in opening other files or
  //   (2) writing to the closed fds occurs, which is UB.
  if (log_to_file_) {
    for (const auto& level_file : log_file_) {
      if (level_file.second) {
        fclose(level_file.second);
      }
    }
  }
}

void Logger::log(const int level, bool per_rank, bool with_prefix, const char* format, ...) const {
  if (!can_log_at(level, per_rank)) {
    return;
  }

  std::string message;
  {
    va_list args;
    va_start(args, format);
    message.resize(vsnprintf(nullptr, 0, format, args) + 1);
    va_end(args);
  }
  {
    va_list args;
    va_start(args, format);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);
  }

  char prefix[Logger::MAX_PREFIX_LENGTH];
  const size_t prefix_length{write_log_prefix(with_prefix, prefix, level)};
  write(level, prefix, prefix_length, message.c_str());
}

Logger::DeferredEntry Logger::log(const int level, bool per_rank, bool with_prefix) const {
  if (can_log_at(level, per_rank)) {
    return {this, level, with_prefix};
  } else {
    return {nullptr, level, with_prefix};
  }
}

void Logger::abort(const SrcLoc& loc, const char* format, ...) const {
  if (format) {
    std::string hint;
    {
      va_list args;
      va_start(args, format);
      hint.resize(vsnprintf(nullptr, 0, format, args) + 1);
      va_end(args);
    }
    {
      va_list args;
      va_start(args, format);
      vsnprintf(hint.data(), hint.size(), format, args);
      va_end(args);
    }
    log(LOG_ERROR_LEVEL, true, true,
        "Check Failed!\n"
        "\tFile: %s:%u\n"
        "\tFunction: %s\n"
        "\tExpression: %s\n"
        "\tHint: %s\n",
        loc.file, loc.line, loc.func, loc.expr, hint.c_str());
  } else {
    log(LOG_ERROR_LEVEL, true, true,
        "Check Failed!\n"
        "\tFile: %s:%u\n"
        "\tFunction: %s\n"
        "\tExpression: %s\n",
        loc.file, loc.line, loc.func, loc.expr);
  }
  std::abort();
}

void Logger::do_throw(QEmbed::Error_t error_type, const SrcLoc& loc,
                      const std::string& message) const {
  std::string error_message = "Runtime error: " + message + "\n" + "\t" + loc.expr + " at " +
                              loc.func + "(" + loc.file + ":" + std::to_string(loc.line) + ")";
  std::throw_with_nested(internal_runtime_error(error_type, error_message));
}

Logger::Logger() {
  const char* max_level_str = std::getenv("QEMB_LOG_LEVEL");
  if (max_level_str != nullptr && max_level_str[0] != '\0') {
    int max_level;
    if (sscanf(max_level_str, "%d", &max_level) == 1) {
      max_level_ = max_level;
    }
  }

  const char* log_to_file_str = std::getenv("QEMB_LOG_TO_FILE");
  if (log_to_file_str != nullptr && log_to_file_str[0] != '\0') {
    int log_to_file_val = 0;
    if (sscanf(log_to_file_str, "%d", &log_to_file_val) == 1) {
      log_to_std_ = log_to_file_val < 2;
      log_to_file_ = log_to_file_val > 0;
    }
  }

  LEVEL_MAP(level_name_, ERROR);
  LEVEL_MAP(level_name_, SILENCE);
  LEVEL_MAP(level_name_, INFO);
  LEVEL_MAP(level_name_, WARNING);
  LEVEL_MAP(level_name_, DEBUG);
  LEVEL_MAP(level_name_, TRACE);

  if (log_to_file_) {
    for (int level = LOG_ERROR_LEVEL; level <= max_level_; level++) {
      if (level == LOG_SILENCE_LEVEL) {
        continue;
      }
      const auto level_it = level_name_.find(level);
      if (level_it == level_name_.end()) {
        continue;
      }
      std::string level_name = level_it->second;
      std::transform(level_name.begin(), level_name.end(), level_name.begin(),
                     [](unsigned char ch) { return std::tolower(ch); });
      const std::string log_fname = "qemb_" + std::to_string(getpid()) + "_" + level_name + ".log";
      log_file_[level] = fopen(log_fname.c_str(), "w");
    }
  }

  if (log_to_std_) {
    log_std_[LOG_ERROR_LEVEL] = stderr;
    for (int level = LOG_INFO_LEVEL; level <= max_level_; level++) {
      log_std_[level] = stdout;
    }
  }
}

size_t Logger::write_log_prefix(const bool with_prefix, char (&buffer)[Logger::MAX_PREFIX_LENGTH],
                                const int level) const {
  if (!with_prefix) {
    buffer[0] = '\0';
    return 0;
  }

  // "[QEMB][" + %H:%M:%S.
  size_t offset = 0;
  {
    const time_t now = std::time(nullptr);
    std::tm now_local;
    localtime_r(&now, &now_local);
    offset += std::strftime(buffer, sizeof(buffer), "[QEMB][%T", &now_local);
  }

  // Level.
  {
    const auto level_it = level_name_.find(level);
    int n;
    if (level_it != level_name_.end()) {
      n = snprintf(&buffer[offset], sizeof(buffer) - offset, "][%s", level_it->second.c_str());
    } else {
      n = snprintf(&buffer[offset], sizeof(buffer) - offset, "][LEVEL%d", level);
    }
    offset = std::min(offset + static_cast<size_t>(std::max(n, 0)), sizeof(buffer) - 1);
  }

  // Thread.
  {
    int n;
    if (qemb_has_thread_name()) {
      n = snprintf(&buffer[offset], sizeof(buffer) - offset, "][%s]: ", qemb_get_thread_name());
    } else {
      const size_t tid{std::hash<std::thread::id>{}(std::this_thread::get_id())};
      n = snprintf(&buffer[offset], sizeof(buffer) - offset, "][tid #%zu]: ", tid);
    }
    offset = std::min(offset + static_cast<size_t>(std::max(n, 0)), sizeof(buffer) - 1);
  }

  return offset;
}

void Logger::write(const int level, const char* const prefix, const size_t prefix_length,
                   const char* const message) const {
  const std::lock_guard<std::mutex> lock(write_guard_);

  if (log_to_std_) {
    const auto& file_it = log_std_.find(level);
    if (file_it != log_std_.end() && file_it->second) {
      fwrite(prefix, 1, prefix_length, file_it->second);
      fputs(message, file_it->second);
      fflush(file_it->second);
    }
  }

  if (log_to_file_) {
    const auto& file_it = log_file_.find(level);
    if (file_it != log_file_.end() && file_it->second) {
      fwrite(prefix, 1, prefix_length, file_it->second);
      fputs(message, file_it->second);
      fflush(file_it->second);
    }
  }
}

}  // namespace QEmbed
