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

#ifndef __SCHED_STANDALONE_BACKEND_HPP__
#define __SCHED_STANDALONE_BACKEND_HPP__

#include <atomic>
#include <mutex>
#include <string>

#include <corral/app_client.hpp>
#include <corral/scheduler.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "sched/coarse_grained_backend.hpp"
#include "sched/flags.hpp"
#include "sched/registration_gate.hpp"

namespace corral {
namespace internal {

// A scheduler backend acquiring executors from a standalone cluster
// master through an AppClient.
//
// 'start' registers the application with the master and blocks until
// the client reports the outcome. Afterwards the backend keeps
// tracking the connection to the master and the executors it grants
// until 'stop'. A termination of the application reported by the
// master while the backend is running is fatal: it is reported to the
// scheduler and the whole application is stopped.
class StandaloneSchedulerBackend
  : public CoarseGrainedSchedulerBackend,
    public AppClientListener
{
public:
  typedef lambda::function<void(StandaloneSchedulerBackend*)>
    ShutdownCallback;

  // None of the pointers are owned; they must outlive the backend.
  StandaloneSchedulerBackend(
      TaskScheduler* scheduler,
      Application* application,
      AppClient* client,
      const scheduler::Flags& flags);

  ~StandaloneSchedulerBackend() override;

  // Returns an error if the application could not be described, if
  // the backend was already started or stopped, or if the master
  // reported the application dead before it was connected.
  Try<Nothing> start() override;

  void stop() override;

  // AppClientListener implementation.
  void connected(const std::string& appId) override;
  void disconnected() override;
  void dead(const std::string& reason) override;

  void executorAdded(
      const std::string& fullId,
      const std::string& workerId,
      const std::string& hostPort,
      int cores,
      int memory) override;

  void executorRemoved(
      const std::string& fullId,
      const std::string& message,
      const Option<int>& status) override;

  // True once the registered executors offer at least the minimum
  // ratio of the requested cores. Always true without `--cores_max`.
  bool sufficientResourcesRegistered() override;

  // The ID the master assigned to the application or, before the
  // application is registered, a generated one.
  std::string applicationId() override;

  Option<std::string> registeredApplicationId();

  // Invoked with this backend at the end of 'stop'.
  void setShutdownCallback(const ShutdownCallback& callback);

  // Number of cores requested from the cluster, 0 when uncapped.
  const int totalExpectedCores;

private:
  Application* const application;
  AppClient* const client;

  // Stops the client if asked to and runs the shutdown callback.
  void shutdown(bool stopClient);

  std::atomic<bool> stopping;

  RegistrationGate registration;

  std::mutex mutex;
  Option<std::string> appId;
  Option<std::string> failure;
  Option<ShutdownCallback> shutdownCallback;

  // Progress of 'AppClient::start', guarded by 'mutex'.
  bool clientStarting;
  bool clientStarted;
  bool clientStopDeferred;
};

} // namespace internal {
} // namespace corral {

#endif // __SCHED_STANDALONE_BACKEND_HPP__
