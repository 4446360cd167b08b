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

#include <stdint.h>

#include <string>
#include <utility>

#include <glog/logging.h>

#include <process/clock.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/error.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>

#include "sched/coarse_grained_backend.hpp"
#include "sched/constants.hpp"

using process::Clock;
using process::Failure;
using process::Future;
using process::Process;

using std::string;

namespace corral {
namespace internal {

class DriverProcess : public Process<DriverProcess>
{
public:
  explicit DriverProcess(std::atomic<int>* _totalCores)
    : ProcessBase(process::ID::generate("coarse-grained-scheduler")),
      totalCores(_totalCores) {}

  ~DriverProcess() override {}

  Future<Nothing> registerExecutor(
      const string& executorId,
      const string& hostPort,
      int cores)
  {
    if (registry.contains(executorId)) {
      return Failure("Duplicate executor ID: " + executorId);
    }

    if (cores <= 0) {
      return Failure(
          "Executor " + executorId + " offers " + stringify(cores) +
          " cores");
    }

    LOG(INFO) << "Registered executor " << executorId << " on " << hostPort
              << " with " << cores << " cores";

    registry.put(executorId, ExecutorData{hostPort, cores});
    totalCores->fetch_add(cores);

    return Nothing();
  }

  Nothing removeExecutor(const string& executorId, const string& reason)
  {
    Option<ExecutorData> executor = registry.get(executorId);

    if (executor.isNone()) {
      VLOG(1) << "Ignoring removal of unknown executor " << executorId
              << ": " << reason;
      return Nothing();
    }

    LOG(INFO) << "Removing executor " << executorId << " on "
              << executor->hostPort << ": " << reason;

    totalCores->fetch_sub(executor->cores);
    registry.erase(executorId);

    return Nothing();
  }

  hashmap<string, ExecutorData> executors()
  {
    return registry;
  }

private:
  std::atomic<int>* totalCores;
  hashmap<string, ExecutorData> registry;
};


CoarseGrainedSchedulerBackend::CoarseGrainedSchedulerBackend(
    TaskScheduler* _scheduler,
    const scheduler::Flags& _flags)
  : scheduler(_scheduler),
    flags(_flags),
    minRegisteredRatio(_flags.min_registered_resources_ratio),
    maxRegisteredWaitingTime(_flags.max_registered_resources_waiting_time),
    totalCores(0),
    process(nullptr)
{
  // Make sure libprocess is initialized before reading its clock.
  process::initialize();

  createTime = Clock::now();
  defaultApplicationId =
    string(scheduler::DEFAULT_APPLICATION_ID_PREFIX) +
    stringify(static_cast<int64_t>(createTime.duration().ms()));
}


CoarseGrainedSchedulerBackend::~CoarseGrainedSchedulerBackend()
{
  stop();
}


Try<Nothing> CoarseGrainedSchedulerBackend::start()
{
  synchronized (mutex) {
    if (process != nullptr) {
      return Error("The scheduler backend is already started");
    }

    process = new DriverProcess(&totalCores);
    spawn(process);
  }

  return Nothing();
}


void CoarseGrainedSchedulerBackend::stop()
{
  DriverProcess* _process = nullptr;

  synchronized (mutex) {
    std::swap(_process, process);
  }

  if (_process != nullptr) {
    terminate(_process);
    process::wait(_process);
    delete _process;
  }
}


Future<Nothing> CoarseGrainedSchedulerBackend::registerExecutor(
    const string& executorId,
    const string& hostPort,
    int cores)
{
  Future<Nothing> future = Failure("The scheduler backend is not running");

  synchronized (mutex) {
    if (process != nullptr) {
      future = dispatch(
          process,
          &DriverProcess::registerExecutor,
          executorId,
          hostPort,
          cores);
    }
  }

  return future;
}


Future<Nothing> CoarseGrainedSchedulerBackend::removeExecutor(
    const string& executorId,
    const string& reason)
{
  Future<Nothing> future = Failure("The scheduler backend is not running");

  synchronized (mutex) {
    if (process != nullptr) {
      future = dispatch(
          process,
          &DriverProcess::removeExecutor,
          executorId,
          reason);
    }
  }

  return future;
}


Future<hashmap<string, ExecutorData>>
CoarseGrainedSchedulerBackend::executors()
{
  Future<hashmap<string, ExecutorData>> future =
    Failure("The scheduler backend is not running");

  synchronized (mutex) {
    if (process != nullptr) {
      future = dispatch(process, &DriverProcess::executors);
    }
  }

  return future;
}


int CoarseGrainedSchedulerBackend::totalCoreCount() const
{
  return totalCores.load();
}


bool CoarseGrainedSchedulerBackend::isReady()
{
  if (sufficientResourcesRegistered()) {
    LOG(INFO) << "Scheduler backend is ready for scheduling after reaching"
              << " the minimum registered resources ratio of "
              << minRegisteredRatio;
    return true;
  }

  if (Clock::now() - createTime >= maxRegisteredWaitingTime) {
    LOG(INFO) << "Scheduler backend is ready for scheduling after waiting"
              << " the maximum registered resources waiting time of "
              << maxRegisteredWaitingTime;
    return true;
  }

  return false;
}


bool CoarseGrainedSchedulerBackend::sufficientResourcesRegistered()
{
  return true;
}


string CoarseGrainedSchedulerBackend::applicationId()
{
  return defaultApplicationId;
}

} // namespace internal {
} // namespace corral {
