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

#ifndef __SCHED_COARSE_GRAINED_BACKEND_HPP__
#define __SCHED_COARSE_GRAINED_BACKEND_HPP__

#include <atomic>
#include <mutex>
#include <string>

#include <corral/scheduler.hpp>

#include <process/future.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "sched/flags.hpp"

namespace corral {
namespace internal {

// Forward declaration.
class DriverProcess;


// What the driver knows about a registered executor.
struct ExecutorData
{
  std::string hostPort;
  int cores;
};


// Keeps track of the executors registered with the driver and of the
// cores they offer, and decides when enough of them registered for the
// scheduler to start scheduling. Subclasses acquire the executors from
// a particular kind of cluster.
//
// The registry is kept by a libprocess actor; calls are thread safe.
class CoarseGrainedSchedulerBackend
{
public:
  CoarseGrainedSchedulerBackend(
      TaskScheduler* scheduler,
      const scheduler::Flags& flags);

  virtual ~CoarseGrainedSchedulerBackend();

  // Starts the executor registry. Fails if the backend was already
  // started.
  virtual Try<Nothing> start();

  // Stops the executor registry. Pending and later registry calls
  // fail. Safe to call more than once, or without 'start'.
  virtual void stop();

  // Registers an executor offering 'cores' cores. Fails for a
  // duplicate executor ID.
  process::Future<Nothing> registerExecutor(
      const std::string& executorId,
      const std::string& hostPort,
      int cores);

  // Removes an executor. Removing an unknown executor is a no-op.
  virtual process::Future<Nothing> removeExecutor(
      const std::string& executorId,
      const std::string& reason);

  // Snapshot of the registered executors.
  process::Future<hashmap<std::string, ExecutorData>> executors();

  // Number of cores offered by the registered executors.
  int totalCoreCount() const;

  // Whether the scheduler may start scheduling: either enough
  // resources registered, or the backend waited long enough.
  bool isReady();

  // Whether enough resources registered to start scheduling.
  virtual bool sufficientResourcesRegistered();

  virtual std::string applicationId();

protected:
  TaskScheduler* const scheduler;
  const scheduler::Flags flags;
  const double minRegisteredRatio;
  const Duration maxRegisteredWaitingTime;

  // Updated by the registry actor, read by anyone.
  std::atomic<int> totalCores;

private:
  process::Time createTime;
  std::string defaultApplicationId;

  std::mutex mutex;
  DriverProcess* process;
};

} // namespace internal {
} // namespace corral {

#endif // __SCHED_COARSE_GRAINED_BACKEND_HPP__
