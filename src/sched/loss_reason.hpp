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

#ifndef __SCHED_LOSS_REASON_HPP__
#define __SCHED_LOSS_REASON_HPP__

#include <ostream>
#include <string>
#include <utility>

#include <stout/option.hpp>
#include <stout/variant.hpp>

namespace corral {
namespace internal {

// The executor process terminated with a known exit status.
struct ExecutorExited
{
  int status;
};


// The executor is unreachable, e.g., its worker was lost, and its exit
// status is unknown.
struct ExecutorLost
{
  std::string message;
};


inline bool operator==(const ExecutorExited& left, const ExecutorExited& right)
{
  return left.status == right.status;
}


inline bool operator==(const ExecutorLost& left, const ExecutorLost& right)
{
  return left.message == right.message;
}


// Why an executor is no longer available to the application. A loss
// reason is exactly one of `ExecutorExited` and `ExecutorLost`.
class ExecutorLossReason
{
public:
  // Classifies a removal reported by the cluster master: a known exit
  // status always means the executor exited, its absence always means
  // the executor was lost.
  static ExecutorLossReason classify(
      const Option<int>& status,
      const std::string& message);

  ExecutorLossReason(const ExecutorExited& exited) : reason(exited) {}
  ExecutorLossReason(const ExecutorLost& lost) : reason(lost) {}

  template <typename... Fs>
  decltype(auto) visit(Fs&&... fs) const
  {
    return reason.visit(std::forward<Fs>(fs)...);
  }

  // Human readable description forwarded along with the removal.
  std::string message() const;

  bool operator==(const ExecutorLossReason& that) const
  {
    return reason == that.reason;
  }

  bool operator!=(const ExecutorLossReason& that) const
  {
    return !(*this == that);
  }

private:
  Variant<ExecutorExited, ExecutorLost> reason;
};


// Explains an exit status of an executor process.
std::string explainExitCode(int status);


std::ostream& operator<<(std::ostream& stream, const ExecutorExited& exited);
std::ostream& operator<<(std::ostream& stream, const ExecutorLost& lost);
std::ostream& operator<<(
    std::ostream& stream,
    const ExecutorLossReason& reason);

} // namespace internal {
} // namespace corral {

#endif // __SCHED_LOSS_REASON_HPP__
