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

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "corekit/corekit.hpp"

// Example namespace usage - using namespace for simplicity in examples
using namespace corekit;
using namespace std::chrono_literals;

namespace {

// Journal file that flushes asynchronously before its descriptor is closed
class Journal {
 public:
  Journal(boost::asio::any_io_executor ex, const std::string& path)
      : ex_(std::move(ex)),
        path_(util::ensure::not_null_or_white_space(path, "path")),
        out_(std::make_shared<std::ofstream>(path_)) {}

  void write(const std::string& line) { *out_ << line << '\n'; }

  template <typename Handler>
  void async_release_managed(Handler&& handler) {
    auto timer = std::make_shared<boost::asio::steady_timer>(ex_, 10ms);
    auto out = out_;
    timer->async_wait([timer, out, handler = std::forward<Handler>(handler)](boost::system::error_code) mutable {
      out->flush();
      std::cout << "Journal flushed" << std::endl;
      handler(boost::system::error_code{});
    });
  }

  void release_unmanaged() {
    out_->close();
    std::cout << "Journal closed: " << path_ << std::endl;
  }

 private:
  boost::asio::any_io_executor ex_;
  std::string path_;
  std::shared_ptr<std::ofstream> out_;
};

}  // namespace

int main() {
  std::cout << "=== corekit Async Disposal Example ===" << std::endl;

  diagnostics::Logger::instance().set_level(diagnostics::LogLevel::DEBUG);
  diagnostics::ErrorHandler::instance().register_callback(
      [](const diagnostics::ErrorInfo& error) { std::cout << "Reported: " << error.get_summary() << std::endl; });

  boost::asio::io_context ioc;

  try {
    auto journal = lifecycle::make_async_disposable<Journal>(ioc.get_executor(), ioc.get_executor(),
                                                             "corekit_example_journal.log");
    journal->write("first entry");
    journal->write("second entry");

    journal.async_dispose([&journal](boost::system::error_code ec) {
      std::cout << "Async dispose finished: " << (ec ? ec.message() : std::string("ok"))
                << ", disposed: " << std::boolalpha << journal.is_disposed() << std::endl;
    });

    // Ignored while the first disposal is in flight
    journal.async_dispose([](boost::system::error_code) { std::cout << "Second dispose is a no-op" << std::endl; });

    ioc.run();
  } catch (const diagnostics::ArgumentException& e) {
    std::cerr << "Invalid argument: " << e.get_full_message() << std::endl;
    return 1;
  }

  try {
    Journal bad(ioc.get_executor(), "   ");
  } catch (const diagnostics::EmptyArgumentException& e) {
    std::cout << "Rejected journal path: " << e.get_full_message() << std::endl;
  }

  diagnostics::Logger::instance().flush();
  return 0;
}
