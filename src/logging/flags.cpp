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

#include "logging/flags.hpp"


corral::internal::logging::Flags::Flags()
{
  add(&Flags::quiet,
      "quiet",
      "Do not write log messages to stderr.",
      false);

  add(&Flags::logging_level,
      "logging_level",
      "Minimum severity of the messages that are logged, one of\n"
      "`INFO`, `WARNING` or `ERROR`. Together with `--quiet` it only\n"
      "applies to the files under `--log_dir`.",
      "INFO",
      [](const std::string& value) -> Option<Error> {
        if (value != "INFO" && value != "WARNING" && value != "ERROR") {
          return Error(
              "'" + value + "' is not a valid logging level. Possible"
              " values for `--logging_level` are `INFO`, `WARNING`"
              " and `ERROR`");
        }
        return None();
      });

  add(&Flags::log_dir,
      "log_dir",
      "Directory for the log files. Without it the driver only logs\n"
      "to stderr.");

  add(&Flags::logbufsecs,
      "logbufsecs",
      "How many seconds log messages may stay buffered before they\n"
      "are flushed (0 flushes every message).",
      0);

  add(&Flags::initialize_driver_logging,
      "initialize_driver_logging",
      "Whether the scheduler backend should initialize Google logging\n"
      "itself. Disable this when the driver program initializes\n"
      "logging on its own.",
      true);
}
