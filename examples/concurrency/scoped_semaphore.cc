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

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "corekit/corekit.hpp"

// Example namespace usage - using namespace for simplicity in examples
using namespace corekit;
using namespace std::chrono_literals;

int main(int argc, char** argv) {
  std::cout << "=== corekit Scoped Semaphore Example ===" << std::endl;

  // 1. Diagnostics setup
  try {
    if (argc > 1) {
      config::load_diagnostics_config_from_yaml(argv[1]).apply();
    } else {
      config::DiagnosticsConfig defaults;
      defaults.log_level = diagnostics::LogLevel::DEBUG;
      defaults.apply();
    }
  } catch (const diagnostics::ConfigurationException& e) {
    std::cerr << "Configuration failed: " << e.get_full_message() << std::endl;
    return 1;
  }

  boost::asio::io_context ioc;
  CountingSemaphore semaphore(ioc, 2);

  // 2. Blocking acquisition: at most two workers inside the critical section
  std::cout << "\n1. Blocking acquisition with four workers and two slots" << std::endl;

  std::atomic<int> inside{0};
  std::atomic<int> peak{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < 4; ++i) {
    workers.emplace_back([&, i] {
      auto releaser = concurrency::acquire_and_release(semaphore);
      int now = ++inside;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      COREKIT_LOG_INFO("example", "worker", "Worker " + std::to_string(i) + " holds a slot");
      std::this_thread::sleep_for(50ms);
      --inside;
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  std::cout << "Peak concurrency: " << peak.load() << ", available: " << semaphore.available() << std::endl;

  // 3. Timed acquisition
  std::cout << "\n2. Timed acquisition" << std::endl;
  {
    auto first = concurrency::acquire_and_release(semaphore);
    auto second = concurrency::acquire_and_release(semaphore);
    auto third = concurrency::try_acquire_and_release_for(semaphore, 20ms);
    std::cout << "Third slot acquired: " << std::boolalpha << third.has_value() << std::endl;
  }

  // 4. Asynchronous acquisition with a deadline
  std::cout << "\n3. Asynchronous acquisition" << std::endl;
  auto held = concurrency::acquire_and_release(semaphore);
  auto held_too = concurrency::acquire_and_release(semaphore);

  concurrency::async_acquire_and_release_for(
      semaphore, 30ms, [](boost::system::error_code ec, AsyncSemaphoreReleaser releaser) {
        std::cout << "Deadline wait: " << ec.message() << " (disposed: " << releaser.is_disposed() << ")"
                  << std::endl;
      });

  CancellationSource source;
  concurrency::async_acquire_and_release(semaphore, source.token(),
                                         [](boost::system::error_code ec, AsyncSemaphoreReleaser releaser) {
                                           if (ec) {
                                             std::cout << "Cancelled wait: " << ec.message() << std::endl;
                                             return;
                                           }
                                           std::cout << "Unexpected grant" << std::endl;
                                           releaser.dispose();
                                         });
  source.cancel();

  ioc.run();
  ioc.restart();

  concurrency::async_acquire_and_release(semaphore, [](boost::system::error_code ec, AsyncSemaphoreReleaser releaser) {
    std::cout << "Granted after release: " << (ec ? ec.message() : std::string("ok")) << std::endl;
    releaser.async_dispose([](boost::system::error_code dispose_ec) {
      std::cout << "Slot returned asynchronously: " << (dispose_ec ? dispose_ec.message() : std::string("ok"))
                << std::endl;
    });
  });
  held.dispose();

  ioc.run();
  held_too.dispose();

  std::cout << "\nAvailable at exit: " << semaphore.available() << std::endl;
  diagnostics::Logger::instance().flush();
  return 0;
}
