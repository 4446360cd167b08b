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

#ifndef __CORRAL_APP_CLIENT_HPP__
#define __CORRAL_APP_CLIENT_HPP__

#include <string>

#include <corral/corral.hpp>

#include <stout/option.hpp>

// Interfaces between a driver and the client that connects it to a
// standalone cluster master. The client owns the wire protocol to the
// master (registration, retries, master failover); the driver only
// sees the callbacks below.

namespace corral {

// Callback interface invoked by an AppClient. Callbacks may be
// invoked from any thread, including concurrently with each other,
// so implementations must synchronize any state they share.
class AppClientListener
{
public:
  virtual ~AppClientListener() {}

  // Invoked once the master accepted the application and assigned it
  // 'appId'. May be invoked again after a disconnection when the
  // client reconnects to a (possibly new) master.
  virtual void connected(const std::string& appId) = 0;

  // Invoked when the client lost its connection to the master. The
  // client keeps trying to reconnect.
  virtual void disconnected() = 0;

  // Invoked when the application can no longer run, e.g., the master
  // removed it or all masters were unreachable for too long. No
  // further callbacks are expected.
  virtual void dead(const std::string& reason) = 0;

  // Invoked when the master granted an executor. 'fullId' has the
  // form '<workerId>/<executorId>'.
  virtual void executorAdded(
      const std::string& fullId,
      const std::string& workerId,
      const std::string& hostPort,
      int cores,
      int memory) = 0;

  // Invoked when a granted executor is gone. 'status' is the exit
  // status of the executor process when it is known.
  virtual void executorRemoved(
      const std::string& fullId,
      const std::string& message,
      const Option<int>& status) = 0;
};


// A client of a standalone cluster master.
class AppClient
{
public:
  virtual ~AppClient() {}

  // Asynchronously registers the application with the master. All
  // events are delivered to 'listener', which must outlive the
  // client or a subsequent call to 'stop'.
  virtual void start(
      const ApplicationDescription& description,
      AppClientListener* listener) = 0;

  // Unregisters the application and stops delivering events. Events
  // triggered by the teardown itself may still be delivered.
  virtual void stop() = 0;
};

} // namespace corral {

#endif // __CORRAL_APP_CLIENT_HPP__
