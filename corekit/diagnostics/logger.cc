/*
 * Copyright 2025 Jinwoo Sung
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

#include "corekit/diagnostics/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

namespace corekit {
namespace diagnostics {

struct Logger::Impl {
  mutable std::mutex mutex_;
  std::atomic<LogLevel> current_level_{LogLevel::INFO};
  std::atomic<bool> enabled_{true};
  std::atomic<int> outputs_{static_cast<int>(LogOutput::CONSOLE)};

  struct FormatPart {
    enum Type { LITERAL, TIMESTAMP, LEVEL, COMPONENT, OPERATION, MESSAGE };
    Type type;
    std::string value;  // LITERAL only
  };

  struct LogFormat {
    std::string format_string;
    std::vector<FormatPart> parsed_format;
  };

  std::shared_ptr<LogFormat> log_format_;
  std::unique_ptr<std::ofstream> file_output_;
  LogCallback callback_;

  struct TimestampBuffer {
    char data[64];
    size_t length;
    std::string_view view() const { return {data, length}; }
  };

  Impl() { parse_format("{timestamp} [{level}] [{component}] [{operation}] {message}"); }

  ~Impl() { flush(); }

  void parse_format(const std::string& format) {
    auto new_format = std::make_shared<LogFormat>();
    new_format->format_string = format;

    size_t start = 0;
    size_t pos = 0;

    while ((pos = format.find('{', start)) != std::string::npos) {
      if (pos > start) {
        new_format->parsed_format.push_back({FormatPart::LITERAL, format.substr(start, pos - start)});
      }

      size_t end = format.find('}', pos);
      if (end == std::string::npos) {
        new_format->parsed_format.push_back({FormatPart::LITERAL, format.substr(pos)});
        start = format.length();
        break;
      }

      std::string placeholder = format.substr(pos + 1, end - pos - 1);
      if (placeholder == "timestamp") {
        new_format->parsed_format.push_back({FormatPart::TIMESTAMP, ""});
      } else if (placeholder == "level") {
        new_format->parsed_format.push_back({FormatPart::LEVEL, ""});
      } else if (placeholder == "component") {
        new_format->parsed_format.push_back({FormatPart::COMPONENT, ""});
      } else if (placeholder == "operation") {
        new_format->parsed_format.push_back({FormatPart::OPERATION, ""});
      } else if (placeholder == "message") {
        new_format->parsed_format.push_back({FormatPart::MESSAGE, ""});
      } else {
        new_format->parsed_format.push_back({FormatPart::LITERAL, format.substr(pos, end - pos + 1)});
      }

      start = end + 1;
    }

    if (start < format.length()) {
      new_format->parsed_format.push_back({FormatPart::LITERAL, format.substr(start)});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    log_format_ = std::move(new_format);
  }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_output_ && file_output_->is_open()) {
      file_output_->flush();
    }
    std::cout.flush();
    std::cerr.flush();
  }

  std::string format_message(std::chrono::system_clock::time_point timestamp_val, LogLevel level,
                             std::string_view component, std::string_view operation, std::string_view message) {
    TimestampBuffer timestamp = get_timestamp(timestamp_val);
    std::string_view level_str = level_to_string(level);

    std::shared_ptr<LogFormat> current_format;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      current_format = log_format_;
    }

    std::string result;
    if (current_format) {
      result.reserve(current_format->format_string.length() + message.length() + 32);

      for (const auto& part : current_format->parsed_format) {
        switch (part.type) {
          case FormatPart::LITERAL:
            result.append(part.value);
            break;
          case FormatPart::TIMESTAMP:
            result.append(timestamp.view());
            break;
          case FormatPart::LEVEL:
            result.append(level_str);
            break;
          case FormatPart::COMPONENT:
            result.append(component);
            break;
          case FormatPart::OPERATION:
            result.append(operation);
            break;
          case FormatPart::MESSAGE:
            result.append(message);
            break;
        }
      }
    }

    return result;
  }

  std::string_view level_to_string(LogLevel level) const {
    switch (level) {
      case LogLevel::DEBUG:
        return "DEBUG";
      case LogLevel::INFO:
        return "INFO";
      case LogLevel::WARNING:
        return "WARNING";
      case LogLevel::ERROR:
        return "ERROR";
      case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  TimestampBuffer get_timestamp(std::chrono::system_clock::time_point timestamp) const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()) % 1000;

    static thread_local std::time_t last_t = -1;
    static thread_local char date_buf[32] = {0};

    if (time_t != last_t) {
      std::tm time_info{};
#if defined(_WIN32)
      ::localtime_s(&time_info, &time_t);
#else
      ::localtime_r(&time_t, &time_info);
#endif
      std::strftime(date_buf, sizeof(date_buf), "%Y-%m-%d %H:%M:%S", &time_info);
      last_t = time_t;
    }

    TimestampBuffer result;
    int len = std::snprintf(result.data, sizeof(result.data), "%s.%03d", date_buf, static_cast<int>(ms.count()));
    if (len > 0) {
      result.length = static_cast<size_t>(len) >= sizeof(result.data) ? sizeof(result.data) - 1 : static_cast<size_t>(len);
    } else {
      result.length = 0;
    }
    return result;
  }

  void write_to_console(LogLevel level, const std::string& message) const {
    if (level >= LogLevel::ERROR) {
      std::cerr << message << std::endl;
    } else {
      std::cout << message << '\n';
    }
  }

  void write_to_file(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_output_ && file_output_->is_open()) {
      *file_output_ << message << '\n';
    }
  }

  void call_callback(LogLevel level, const std::string& message) {
    LogCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callback = callback_;
    }
    if (!callback) {
      return;
    }
    try {
      callback(level, message);
    } catch (const std::exception& e) {
      std::cerr << "Error in log callback: " << e.what() << std::endl;
    } catch (...) {
      std::cerr << "Unknown error in log callback" << std::endl;
    }
  }

  // Caller holds mutex_
  void open_log_file(const std::string& filename) {
    file_output_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (file_output_->is_open()) {
      outputs_.fetch_or(static_cast<int>(LogOutput::FILE));
    } else {
      file_output_.reset();
      std::cerr << "Failed to open log file: " << filename << std::endl;
    }
  }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger& Logger::instance() {
  // Leaked on purpose: destructors of static objects may still log
  static Logger* instance = new Logger();
  return *instance;
}

void Logger::set_level(LogLevel level) { impl_->current_level_.store(level); }

LogLevel Logger::get_level() const { return impl_->current_level_.load(); }

void Logger::set_console_output(bool enable) {
  if (enable) {
    impl_->outputs_.fetch_or(static_cast<int>(LogOutput::CONSOLE));
  } else {
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::CONSOLE));
  }
}

void Logger::set_file_output(const std::string& filename) {
  std::lock_guard<std::mutex> lock(impl_->mutex_);

  if (filename.empty()) {
    impl_->file_output_.reset();
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::FILE));
  } else {
    impl_->open_log_file(filename);
  }
}

void Logger::set_callback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex_);
  impl_->callback_ = std::move(callback);
  if (impl_->callback_) {
    impl_->outputs_.fetch_or(static_cast<int>(LogOutput::CALLBACK));
  } else {
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::CALLBACK));
  }
}

int Logger::get_outputs() const { return impl_->outputs_.load(); }

void Logger::set_enabled(bool enabled) { impl_->enabled_.store(enabled); }

bool Logger::is_enabled() const { return impl_->enabled_.load(); }

void Logger::set_format(const std::string& format) { impl_->parse_format(format); }

void Logger::flush() { impl_->flush(); }

void Logger::log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message) {
  if (!impl_->enabled_.load() || level < impl_->current_level_.load()) {
    return;
  }

  std::string formatted_message =
      impl_->format_message(std::chrono::system_clock::now(), level, component, operation, message);
  int current_outputs = impl_->outputs_.load();

  if (current_outputs & static_cast<int>(LogOutput::CONSOLE)) {
    impl_->write_to_console(level, formatted_message);
  }

  if (current_outputs & static_cast<int>(LogOutput::FILE)) {
    impl_->write_to_file(formatted_message);
  }

  if (current_outputs & static_cast<int>(LogOutput::CALLBACK)) {
    impl_->call_callback(level, formatted_message);
  }
}

void Logger::debug(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::DEBUG, component, operation, message);
}

void Logger::info(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::INFO, component, operation, message);
}

void Logger::warning(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::WARNING, component, operation, message);
}

void Logger::error(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::ERROR, component, operation, message);
}

void Logger::critical(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::CRITICAL, component, operation, message);
}

}  // namespace diagnostics
}  // namespace corekit
