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

#include <algorithm>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/future.hpp>

#include <stout/bytes.hpp>
#include <stout/error.hpp>
#include <stout/strings.hpp>
#include <stout/synchronized.hpp>

#include "common/command_utils.hpp"

#include "logging/logging.hpp"

#include "sched/loss_reason.hpp"
#include "sched/standalone_backend.hpp"

using std::string;
using std::vector;

namespace corral {
namespace internal {

StandaloneSchedulerBackend::StandaloneSchedulerBackend(
    TaskScheduler* _scheduler,
    Application* _application,
    AppClient* _client,
    const scheduler::Flags& _flags)
  : CoarseGrainedSchedulerBackend(_scheduler, _flags),
    totalExpectedCores(_flags.cores_max.getOrElse(0)),
    application(_application),
    client(_client),
    stopping(false),
    clientStarting(false),
    clientStarted(false),
    clientStopDeferred(false)
{
  if (flags.initialize_driver_logging) {
    logging::initialize(flags.app_name, false, flags);
  } else {
    VLOG(1) << "Disabling initialization of GLOG logging";
  }
}


StandaloneSchedulerBackend::~StandaloneSchedulerBackend()
{
  // The client must not call back into a destroyed listener.
  stop();
}


Try<Nothing> StandaloneSchedulerBackend::start()
{
  if (stopping.load()) {
    return Error("The scheduler backend is stopped");
  }

  Try<ApplicationDescription> description =
    command::applicationDescription(flags);

  if (description.isError()) {
    return Error(
        "Failed to describe the application: " + description.error());
  }

  Try<Nothing> started = CoarseGrainedSchedulerBackend::start();
  if (started.isError()) {
    return started;
  }

  // 'stop' may run concurrently. Whoever takes the mutex first decides
  // whether the client gets started at all.
  bool stopped = false;
  synchronized (mutex) {
    if (stopping.load()) {
      stopped = true;
    } else {
      clientStarting = true;
    }
  }

  if (stopped) {
    CoarseGrainedSchedulerBackend::stop();
    return Error("The scheduler backend was stopped while starting");
  }

  LOG(INFO) << "Registering application " << description.get()
            << " with the cluster master";

  client->start(description.get(), this);

  bool deferred = false;
  synchronized (mutex) {
    clientStarting = false;
    clientStarted = true;
    deferred = clientStopDeferred;
  }

  // A 'stop' that arrived while the client was starting left the rest
  // of the shutdown to us.
  if (deferred) {
    shutdown(true);
    return Error("The scheduler backend was stopped while registering");
  }

  registration.await();

  Option<string> killed;
  bool registered = false;
  synchronized (mutex) {
    registered = appId.isSome();
    if (!registered) {
      killed = failure;
    }
  }

  if (killed.isSome()) {
    return Error("Application has been killed: " + killed.get());
  }

  if (!registered && stopping.load()) {
    return Error("The scheduler backend was stopped while registering");
  }

  return Nothing();
}


void StandaloneSchedulerBackend::stop()
{
  // NOTE: 'stopping' must be set before the client is stopped, the
  // teardown itself triggers 'disconnected' and 'dead' callbacks.
  if (stopping.exchange(true)) {
    VLOG(1) << "Ignoring stop because the scheduler backend is already"
            << " stopping";
    return;
  }

  LOG(INFO) << "Stopping the scheduler backend";

  CoarseGrainedSchedulerBackend::stop();

  bool started = false;
  bool deferred = false;
  synchronized (mutex) {
    if (clientStarting) {
      clientStopDeferred = true;
      deferred = true;
    } else {
      started = clientStarted;
    }
  }

  // Releases a 'start' still waiting for the outcome of the registration.
  registration.open();

  if (deferred) {
    VLOG(1) << "Deferring the shutdown until the client has started";
    return;
  }

  shutdown(started);
}


void StandaloneSchedulerBackend::shutdown(bool stopClient)
{
  if (stopClient) {
    client->stop();
  }

  Option<ShutdownCallback> callback;
  synchronized (mutex) {
    callback = shutdownCallback;
  }

  if (callback.isSome()) {
    callback.get()(this);
  }
}


void StandaloneSchedulerBackend::connected(const string& _appId)
{
  LOG(INFO) << "Connected to the cluster with application ID " << _appId;

  Option<string> previous;
  synchronized (mutex) {
    if (appId.isNone()) {
      appId = _appId;
    } else {
      previous = appId;
    }
  }

  if (previous.isSome() && previous.get() != _appId) {
    LOG(WARNING) << "Keeping application ID " << previous.get()
                 << " instead of " << _appId << " after reconnecting";
  }

  registration.open();
}


void StandaloneSchedulerBackend::disconnected()
{
  registration.open();

  if (stopping.load()) {
    VLOG(1) << "Disconnected from the cluster while stopping";
    return;
  }

  LOG(WARNING) << "Disconnected from the cluster! Waiting for reconnection...";
}


void StandaloneSchedulerBackend::dead(const string& reason)
{
  if (stopping.load()) {
    registration.open();

    VLOG(1) << "Ignoring termination of the application while stopping: "
            << reason;
    return;
  }

  // Recorded before opening the gate so a blocked 'start' sees it.
  synchronized (mutex) {
    failure = reason;
  }

  registration.open();

  LOG(ERROR) << "Application has been killed. Reason: " << reason;

  scheduler->error(reason);

  // Ensure the application terminates, no more jobs can run.
  application->stop();
}


void StandaloneSchedulerBackend::executorAdded(
    const string& fullId,
    const string& workerId,
    const string& hostPort,
    int cores,
    int memory)
{
  LOG(INFO) << "Granted executor ID " << fullId << " on worker " << workerId
            << " at " << hostPort << " with " << cores << " cores, "
            << Megabytes(static_cast<uint64_t>(std::max(memory, 0)))
            << " RAM";
}


void StandaloneSchedulerBackend::executorRemoved(
    const string& fullId,
    const string& message,
    const Option<int>& status)
{
  const ExecutorLossReason reason =
    ExecutorLossReason::classify(status, message);

  LOG(INFO) << "Executor " << fullId << " removed: " << message;

  const vector<string> tokens = strings::split(fullId, "/");

  CHECK_GE(tokens.size(), 2u)
    << "Malformed executor ID '" << fullId << "' reported by the client";

  const string executorId = tokens[1];

  removeExecutor(executorId, reason.message())
    .onFailed([executorId](const string& error) {
      LOG(WARNING) << "Failed to remove executor " << executorId << ": "
                   << error;
    });
}


bool StandaloneSchedulerBackend::sufficientResourcesRegistered()
{
  return totalCores.load() >= totalExpectedCores * minRegisteredRatio;
}


string StandaloneSchedulerBackend::applicationId()
{
  Option<string> id = registeredApplicationId();

  if (id.isNone()) {
    LOG(WARNING) << "Application ID is not initialized yet";
    return CoarseGrainedSchedulerBackend::applicationId();
  }

  return id.get();
}


Option<string> StandaloneSchedulerBackend::registeredApplicationId()
{
  Option<string> id;
  synchronized (mutex) {
    id = appId;
  }

  return id;
}


void StandaloneSchedulerBackend::setShutdownCallback(
    const ShutdownCallback& callback)
{
  synchronized (mutex) {
    shutdownCallback = callback;
  }
}

} // namespace internal {
} // namespace corral {
