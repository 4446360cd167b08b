// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __SCHED_CONSTANTS_HPP__
#define __SCHED_CONSTANTS_HPP__

#include <stout/bytes.hpp>
#include <stout/duration.hpp>

namespace corral {
namespace internal {
namespace scheduler {

// Default name of an application in its description.
constexpr char DEFAULT_APP_NAME[] = "corral";

// Default amount of memory requested for every executor.
constexpr Bytes DEFAULT_EXECUTOR_MEMORY = Megabytes(512);

// By default the scheduler does not wait for any executor to register
// before it starts scheduling.
constexpr double DEFAULT_MIN_REGISTERED_RESOURCES_RATIO = 0.0;

// Maximum amount of time the scheduler waits for the minimum ratio of
// resources to register before it starts scheduling anyway.
constexpr Duration DEFAULT_MAX_REGISTERED_RESOURCES_WAITING_TIME = Seconds(30);

// The binary workers run for every executor of an application.
constexpr char EXECUTOR_BINARY[] = "corral-executor";

// Name of the driver endpoint executors register with.
constexpr char DRIVER_ENDPOINT_NAME[] = "CoarseGrainedScheduler";

constexpr char DRIVER_URL_SCHEME[] = "corral";

// Prefix of the application ID used until the master assigns one.
constexpr char DEFAULT_APPLICATION_ID_PREFIX[] = "corral-application-";

// Exit codes executors use to report why they terminated.
constexpr int EXECUTOR_EXIT_UNCAUGHT_EXCEPTION = 50;
constexpr int EXECUTOR_EXIT_UNCAUGHT_EXCEPTION_TWICE = 51;
constexpr int EXECUTOR_EXIT_OOM = 52;
constexpr int EXECUTOR_EXIT_DISK_STORE_FAILED_TO_CREATE_DIR = 53;

} // namespace scheduler {
} // namespace internal {
} // namespace corral {

#endif // __SCHED_CONSTANTS_HPP__
