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

// Base
#include "corekit/base/error_codes.hpp"
#include "corekit/base/visibility.hpp"

// Error handling and logging
#include "corekit/diagnostics/error_handler.hpp"
#include "corekit/diagnostics/error_mapping.hpp"
#include "corekit/diagnostics/exceptions.hpp"
#include "corekit/diagnostics/logger.hpp"

// Configuration
#include "corekit/config/diagnostics_config.hpp"

// Disposal lifecycle
#include "corekit/lifecycle/async_disposable.hpp"
#include "corekit/lifecycle/disposable.hpp"

// Synchronization
#include "corekit/concurrency/cancellation.hpp"
#include "corekit/concurrency/counting_semaphore.hpp"
#include "corekit/concurrency/semaphore_releaser.hpp"

// Utilities
#include "corekit/util/ensure.hpp"
#include "corekit/util/exception_format.hpp"
#include "corekit/util/nullable.hpp"
#include "corekit/util/type_traits.hpp"

namespace corekit {

// === Convenience aliases ===

using concurrency::AsyncSemaphoreReleaser;
using concurrency::CancellationSource;
using concurrency::CancellationToken;
using concurrency::CountingSemaphore;
using concurrency::SemaphoreReleaser;
using lifecycle::AsyncDisposable;
using lifecycle::Disposable;

}  // namespace corekit
