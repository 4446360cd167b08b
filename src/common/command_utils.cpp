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

#include <ctype.h>

#include <string>
#include <vector>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "common/command_utils.hpp"

#include "sched/constants.hpp"

using std::string;
using std::vector;

namespace corral {
namespace internal {
namespace command {

Try<vector<string>> splitCommandString(const string& command)
{
  vector<string> words;
  string word;

  bool inWord = false;
  bool inSingleQuote = false;
  bool inDoubleQuote = false;

  for (size_t i = 0; i < command.size(); i++) {
    const char c = command[i];

    if (inDoubleQuote) {
      if (c == '"') {
        inDoubleQuote = false;
      } else if (c == '\\') {
        // A trailing backslash is dropped.
        if (i + 1 < command.size()) {
          word += command[++i];
        }
      } else {
        word += c;
      }
    } else if (inSingleQuote) {
      if (c == '\'') {
        inSingleQuote = false;
      } else {
        word += c;
      }
    } else if (c == '"') {
      inWord = true;
      inDoubleQuote = true;
    } else if (c == '\'') {
      inWord = true;
      inSingleQuote = true;
    } else if (!isspace(static_cast<unsigned char>(c))) {
      inWord = true;
      word += c;
    } else if (inWord) {
      words.push_back(word);
      word.clear();
      inWord = false;
    }
  }

  if (inSingleQuote || inDoubleQuote) {
    return Error("Unterminated quote in '" + command + "'");
  }

  if (inWord) {
    words.push_back(word);
  }

  return words;
}


string driverUrl(const string& host, uint16_t port)
{
  return string(scheduler::DRIVER_URL_SCHEME) + "://" +
         scheduler::DRIVER_ENDPOINT_NAME + "@" + host + ":" + stringify(port);
}


Try<CommandInfo> executorCommand(const scheduler::Flags& flags)
{
  if (flags.driver_host.isNone()) {
    return Error("Missing required flag `--driver_host`");
  }

  if (flags.driver_port.isNone()) {
    return Error("Missing required flag `--driver_port`");
  }

  CommandInfo command;
  command.set_value(scheduler::EXECUTOR_BINARY);

  // The worker fills in the placeholders when it launches an executor.
  const vector<string> arguments = {
    "--driver-url", driverUrl(flags.driver_host.get(), flags.driver_port.get()),
    "--executor-id", "{{EXECUTOR_ID}}",
    "--hostname", "{{HOSTNAME}}",
    "--cores", "{{CORES}}",
    "--app-id", "{{APP_ID}}",
    "--worker-url", "{{WORKER_URL}}"
  };

  foreach (const string& argument, arguments) {
    command.add_arguments(argument);
  }

  if (flags.executor_environment_variables.isSome()) {
    Environment* environment = command.mutable_environment();

    foreachpair (const string& name,
                 const JSON::Value& value,
                 flags.executor_environment_variables->values) {
      Environment::Variable* variable = environment->add_variables();
      variable->set_name(name);
      variable->set_value(value.as<JSON::String>().value);
    }
  }

  if (flags.executor_extra_path.isSome()) {
    foreach (const string& entry,
             strings::tokenize(flags.executor_extra_path.get(), ":")) {
      command.add_path_entries(entry);
    }
  }

  if (flags.executor_extra_library_path.isSome()) {
    foreach (const string& entry,
             strings::tokenize(flags.executor_extra_library_path.get(), ":")) {
      command.add_library_path_entries(entry);
    }
  }

  // Options with an unterminated quote are rejected, not split at the
  // end of the string.
  if (flags.executor_extra_options.isSome()) {
    Try<vector<string>> options =
      splitCommandString(flags.executor_extra_options.get());

    if (options.isError()) {
      return Error(
          "Failed to parse `--executor_extra_options`: " + options.error());
    }

    foreach (const string& option, options.get()) {
      command.add_options(option);
    }
  }

  return command;
}


Try<ApplicationDescription> applicationDescription(
    const scheduler::Flags& flags)
{
  Try<CommandInfo> command = executorCommand(flags);
  if (command.isError()) {
    return Error(command.error());
  }

  ApplicationDescription description;
  description.set_name(flags.app_name);

  if (flags.cores_max.isSome()) {
    description.set_max_cores(flags.cores_max.get());
  }

  description.set_memory_per_executor_mb(
      static_cast<int32_t>(flags.executor_memory.megabytes()));

  description.mutable_command()->CopyFrom(command.get());

  if (flags.app_ui_address.isSome()) {
    description.set_app_ui_url(flags.app_ui_address.get());
  }

  if (flags.event_log_dir.isSome()) {
    description.set_event_log_dir(flags.event_log_dir.get());
  }

  if (flags.event_log_codec.isSome()) {
    description.set_event_log_codec(flags.event_log_codec.get());
  }

  return description;
}

} // namespace command {
} // namespace internal {
} // namespace corral {
