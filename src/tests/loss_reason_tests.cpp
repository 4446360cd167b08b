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
#include <vector>

#include <gtest/gtest.h>

#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/stringify.hpp>

#include "sched/loss_reason.hpp"

using std::string;
using std::vector;

namespace corral {
namespace internal {
namespace tests {

TEST(ExecutorLossReasonTest, KnownStatusMeansExited)
{
  const vector<int> statuses = {0, 1, 50, 52, 137, 255, -1};

  foreach (int status, statuses) {
    const ExecutorLossReason reason =
      ExecutorLossReason::classify(status, "ignored message");

    EXPECT_EQ(ExecutorLossReason(ExecutorExited{status}), reason);

    // The exact status is preserved.
    EXPECT_EQ(
        Option<int>(status),
        reason.visit(
            [](const ExecutorExited& exited) -> Option<int> {
              return exited.status;
            },
            [](const ExecutorLost&) -> Option<int> { return None(); }));
  }
}


TEST(ExecutorLossReasonTest, MissingStatusMeansLost)
{
  const vector<string> messages = {"oom", "", "Worker lost: heartbeat timeout"};

  foreach (const string& message, messages) {
    const ExecutorLossReason reason =
      ExecutorLossReason::classify(None(), message);

    EXPECT_EQ(ExecutorLossReason(ExecutorLost{message}), reason);

    EXPECT_EQ(
        Option<string>(message),
        reason.visit(
            [](const ExecutorExited&) -> Option<string> { return None(); },
            [](const ExecutorLost& lost) -> Option<string> {
              return lost.message;
            }));
  }
}


TEST(ExecutorLossReasonTest, Equality)
{
  EXPECT_EQ(ExecutorLossReason(ExecutorExited{1}),
            ExecutorLossReason(ExecutorExited{1}));
  EXPECT_NE(ExecutorLossReason(ExecutorExited{1}),
            ExecutorLossReason(ExecutorExited{2}));
  EXPECT_NE(ExecutorLossReason(ExecutorLost{"1"}),
            ExecutorLossReason(ExecutorExited{1}));
}


TEST(ExecutorLossReasonTest, Message)
{
  EXPECT_EQ("Out of memory", ExecutorLossReason(ExecutorExited{52}).message());
  EXPECT_EQ("Uncaught exception",
            ExecutorLossReason(ExecutorExited{50}).message());
  EXPECT_EQ("Unknown executor exit code (1)",
            ExecutorLossReason(ExecutorExited{1}).message());
  EXPECT_EQ("Unknown executor exit code (137) (died from signal 9?)",
            ExecutorLossReason(ExecutorExited{137}).message());

  EXPECT_EQ("oom", ExecutorLossReason(ExecutorLost{"oom"}).message());
  EXPECT_EQ("Worker lost", ExecutorLossReason(ExecutorLost{""}).message());
}


TEST(ExecutorLossReasonTest, Stringify)
{
  EXPECT_EQ("ExecutorExited(137)",
            stringify(ExecutorLossReason(ExecutorExited{137})));
  EXPECT_EQ("ExecutorLost(oom)",
            stringify(ExecutorLossReason(ExecutorLost{"oom"})));
}

} // namespace tests {
} // namespace internal {
} // namespace corral {
