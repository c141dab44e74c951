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

#pragma once

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "corekit/diagnostics/error_handler.hpp"
#include "corekit/diagnostics/logger.hpp"

namespace corekit {
namespace test {

/**
 * @brief Common test utilities for corekit tests
 */
class TestUtils {
 public:
  /**
   * @brief Wait for a condition with timeout
   * @param condition Function that returns true when condition is met
   * @param timeout_ms Timeout in milliseconds
   * @return true if condition was met, false if timeout
   */
  template <typename Condition>
  static bool waitForCondition(Condition&& condition, int timeout_ms = 5000) {
    auto start = std::chrono::steady_clock::now();
    auto timeout = std::chrono::milliseconds(timeout_ms);

    while (std::chrono::steady_clock::now() - start < timeout) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return condition();
  }

  /**
   * @brief Drive an io_context until condition holds or the timeout elapses
   */
  template <typename Condition>
  static bool runUntil(boost::asio::io_context& ioc, Condition&& condition, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!condition() && std::chrono::steady_clock::now() < deadline) {
      if (ioc.stopped()) {
        ioc.restart();
      }
      ioc.run_for(std::chrono::milliseconds(5));
    }
    return condition();
  }

  static void waitFor(int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

  /**
   * @brief Returns a writable temporary directory for tests
   */
  static std::filesystem::path getTempDirectory() {
    auto base = std::filesystem::temp_directory_path() / "corekit_tests";
    std::error_code ec;
    std::filesystem::create_directories(base, ec);
    return base;
  }

  static std::filesystem::path makeTempFilePath(const std::string& filename) { return getTempDirectory() / filename; }

  /**
   * @brief Removes a file if it exists, ignoring errors
   */
  static void removeFileIfExists(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
};

/**
 * @brief Base test class with common setup/teardown
 */
class BaseTest : public ::testing::Test {
 protected:
  void SetUp() override { test_start_time_ = std::chrono::steady_clock::now(); }

  void TearDown() override {
    auto test_duration = std::chrono::steady_clock::now() - test_start_time_;
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(test_duration).count();

    if (duration_ms > 5000) {
      std::cout << "Warning: Test took " << duration_ms << "ms to complete" << std::endl;
    }
  }

  std::chrono::steady_clock::time_point test_start_time_;
};

/**
 * @brief Captures Logger output and ErrorHandler reports for the duration of a test
 */
class DiagnosticsTest : public BaseTest {
 protected:
  void SetUp() override {
    BaseTest::SetUp();

    auto& logger = diagnostics::Logger::instance();
    logger.set_enabled(true);
    logger.set_level(diagnostics::LogLevel::DEBUG);
    logger.set_console_output(false);
    logger.set_callback([this](diagnostics::LogLevel level, const std::string& message) {
      std::lock_guard<std::mutex> lock(log_mutex_);
      log_lines_.emplace_back(level, message);
    });

    auto& handler = diagnostics::ErrorHandler::instance();
    handler.set_enabled(true);
    handler.set_min_error_level(diagnostics::ErrorLevel::INFO);
    handler.clear_callbacks();
    handler.reset_stats();
  }

  void TearDown() override {
    auto& logger = diagnostics::Logger::instance();
    logger.set_callback(nullptr);
    logger.set_level(diagnostics::LogLevel::INFO);
    logger.set_console_output(true);

    auto& handler = diagnostics::ErrorHandler::instance();
    handler.clear_callbacks();
    handler.reset_stats();

    BaseTest::TearDown();
  }

  bool logged(diagnostics::LogLevel level, const std::string& fragment) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    for (const auto& entry : log_lines_) {
      if (entry.first == level && entry.second.find(fragment) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  std::mutex log_mutex_;
  std::vector<std::pair<diagnostics::LogLevel, std::string>> log_lines_;
};

}  // namespace test
}  // namespace corekit
