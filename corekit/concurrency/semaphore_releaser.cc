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

#include "corekit/concurrency/semaphore_releaser.hpp"

#include "corekit/diagnostics/logger.hpp"

namespace corekit {
namespace concurrency {

void SemaphoreSlot::release_managed() {
  if (semaphore_ == nullptr) {
    return;
  }
  semaphore_->release();
  COREKIT_LOG_DEBUG("semaphore_releaser", "release",
                    "Slot returned, available=" + std::to_string(semaphore_->available()));
}

SemaphoreReleaser acquire_and_release(CountingSemaphore& semaphore) {
  semaphore.acquire();
  return SemaphoreReleaser(SemaphoreSlot(semaphore));
}

}  // namespace concurrency
}  // namespace corekit
