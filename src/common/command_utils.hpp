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

#ifndef __COMMON_COMMAND_UTILS_HPP__
#define __COMMON_COMMAND_UTILS_HPP__

#include <stdint.h>

#include <string>
#include <vector>

#include <corral/corral.hpp>

#include <stout/try.hpp>

#include "sched/flags.hpp"

namespace corral {
namespace internal {
namespace command {

/**
 * Splits a command line into words on whitespace, honoring single and
 * double quotes. Inside double quotes a backslash escapes the next
 * character. Returns an error for an unterminated quote.
 *
 * @param command the command line to split.
 */
Try<std::vector<std::string>> splitCommandString(const std::string& command);


/**
 * Returns the URL executors use to register with the driver.
 */
std::string driverUrl(const std::string& host, uint16_t port);


/**
 * Builds the command launching every executor of the application.
 * Requires `--driver_host` and `--driver_port`.
 *
 * @param flags the scheduler flags describing the executors.
 */
Try<CommandInfo> executorCommand(const scheduler::Flags& flags);


/**
 * Builds the description the application registers with at the
 * cluster master.
 *
 * @param flags the scheduler flags describing the application.
 */
Try<ApplicationDescription> applicationDescription(
    const scheduler::Flags& flags);

} // namespace command {
} // namespace internal {
} // namespace corral {

#endif // __COMMON_COMMAND_UTILS_HPP__
