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

#ifndef __SCHED_FLAGS_HPP__
#define __SCHED_FLAGS_HPP__

#include <stdint.h>

#include <string>

#include <stout/bytes.hpp>
#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/json.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

#include "sched/constants.hpp"

namespace corral {
namespace internal {
namespace scheduler {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  std::string app_name;
  Option<int> cores_max;
  Bytes executor_memory;
  double min_registered_resources_ratio;
  Duration max_registered_resources_waiting_time;
  Option<std::string> driver_host;
  Option<uint16_t> driver_port;
  Option<std::string> executor_extra_options;
  Option<std::string> executor_extra_path;
  Option<std::string> executor_extra_library_path;
  Option<JSON::Object> executor_environment_variables;
  Option<std::string> app_ui_address;
  Option<std::string> event_log_dir;
  Option<std::string> event_log_codec;
};

} // namespace scheduler {
} // namespace internal {
} // namespace corral {

#endif // __SCHED_FLAGS_HPP__
