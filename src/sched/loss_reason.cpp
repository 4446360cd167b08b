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

#include <string>

#include <stout/stringify.hpp>

#include "sched/constants.hpp"
#include "sched/loss_reason.hpp"

using std::ostream;
using std::string;

namespace corral {
namespace internal {

ExecutorLossReason ExecutorLossReason::classify(
    const Option<int>& status,
    const string& message)
{
  if (status.isSome()) {
    return ExecutorExited{status.get()};
  }

  return ExecutorLost{message};
}


string ExecutorLossReason::message() const
{
  return visit(
      [](const ExecutorExited& exited) {
        return explainExitCode(exited.status);
      },
      [](const ExecutorLost& lost) {
        return lost.message.empty() ? string("Worker lost") : lost.message;
      });
}


string explainExitCode(int status)
{
  switch (status) {
    case scheduler::EXECUTOR_EXIT_UNCAUGHT_EXCEPTION:
      return "Uncaught exception";
    case scheduler::EXECUTOR_EXIT_UNCAUGHT_EXCEPTION_TWICE:
      return "Uncaught exception, and logging the exception failed";
    case scheduler::EXECUTOR_EXIT_OOM:
      return "Out of memory";
    case scheduler::EXECUTOR_EXIT_DISK_STORE_FAILED_TO_CREATE_DIR:
      return "Failed to create local directory";
    default:
      break;
  }

  string message = "Unknown executor exit code (" + stringify(status) + ")";

  // Shells report a process killed by signal N with status 128 + N.
  if (status > 128) {
    message += " (died from signal " + stringify(status - 128) + "?)";
  }

  return message;
}


ostream& operator<<(ostream& stream, const ExecutorExited& exited)
{
  return stream << "ExecutorExited(" << exited.status << ")";
}


ostream& operator<<(ostream& stream, const ExecutorLost& lost)
{
  return stream << "ExecutorLost(" << lost.message << ")";
}


ostream& operator<<(ostream& stream, const ExecutorLossReason& reason)
{
  reason.visit(
      [&stream](const ExecutorExited& exited) { stream << exited; },
      [&stream](const ExecutorLost& lost) { stream << lost; });

  return stream;
}

} // namespace internal {
} // namespace corral {
