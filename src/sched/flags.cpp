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

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/stringify.hpp>

#include "sched/flags.hpp"

using std::string;


corral::internal::scheduler::Flags::Flags()
{
  add(&Flags::app_name,
      "app_name",
      "Name of the application, as shown by the cluster master.",
      DEFAULT_APP_NAME);

  add(&Flags::cores_max,
      "cores_max",
      "Maximum number of cores to request for the application across\n"
      "the whole cluster. By default there is no cap and the scheduler\n"
      "never waits for executors to register (see\n"
      "`--min_registered_resources_ratio`).",
      [](const Option<int>& value) -> Option<Error> {
        if (value.isSome() && value.get() <= 0) {
          return Error("Expected `--cores_max` to be positive");
        }
        return None();
      });

  add(&Flags::executor_memory,
      "executor_memory",
      "Amount of memory to request for every executor (e.g., 512MB).",
      DEFAULT_EXECUTOR_MEMORY,
      [](const Bytes& value) -> Option<Error> {
        if (value < Megabytes(1)) {
          return Error("Expected `--executor_memory` to be at least 1MB");
        }
        return None();
      });

  add(&Flags::min_registered_resources_ratio,
      "min_registered_resources_ratio",
      "Minimum ratio of the requested cores (see `--cores_max`) that\n"
      "must be registered before the scheduler starts scheduling.\n"
      "The scheduler starts anyway once\n"
      "`--max_registered_resources_waiting_time` has elapsed.",
      DEFAULT_MIN_REGISTERED_RESOURCES_RATIO,
      [](double value) -> Option<Error> {
        if (value < 0.0 || value > 1.0) {
          return Error(
              "Expected `--min_registered_resources_ratio` to be between"
              " 0 and 1, got " + stringify(value));
        }
        return None();
      });

  add(&Flags::max_registered_resources_waiting_time,
      "max_registered_resources_waiting_time",
      "Maximum amount of time to wait for the minimum ratio of\n"
      "resources to register before scheduling begins.",
      DEFAULT_MAX_REGISTERED_RESOURCES_WAITING_TIME);

  add(&Flags::driver_host,
      "driver_host",
      "Hostname or IP address executors use to reach the driver.");

  add(&Flags::driver_port,
      "driver_port",
      "Port executors use to reach the driver.");

  add(&Flags::executor_extra_options,
      "executor_extra_options",
      "Extra command line options passed to every executor. Options\n"
      "are split on whitespace; use single or double quotes to pass\n"
      "an option containing whitespace.");

  add(&Flags::executor_extra_path,
      "executor_extra_path",
      "Colon separated list of directories prepended to the `PATH`\n"
      "of every executor.");

  add(&Flags::executor_extra_library_path,
      "executor_extra_library_path",
      "Colon separated list of directories prepended to the\n"
      "`LD_LIBRARY_PATH` of every executor.");

  add(&Flags::executor_environment_variables,
      "executor_environment_variables",
      "JSON object representing the environment variables that should be\n"
      "passed to every executor.\n"
      "Example:\n"
      "{\n"
      "  \"PATH\": \"/bin:/usr/bin\",\n"
      "  \"LD_LIBRARY_PATH\": \"/usr/local/lib\"\n"
      "}",
      [](const Option<JSON::Object>& object) -> Option<Error> {
        if (object.isSome()) {
          foreachvalue (const JSON::Value& value, object->values) {
            if (!value.is<JSON::String>()) {
              return Error("`executor_environment_variables` must "
                           "only contain string values");
            }
          }
        }
        return None();
      });

  add(&Flags::app_ui_address,
      "app_ui_address",
      "Address of the application's web UI, advertised to the master.");

  add(&Flags::event_log_dir,
      "event_log_dir",
      "Directory the application writes its event log to.");

  add(&Flags::event_log_codec,
      "event_log_codec",
      "Compression codec of the event log.");
}
