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

#ifndef __SCHED_REGISTRATION_GATE_HPP__
#define __SCHED_REGISTRATION_GATE_HPP__

#include <condition_variable>
#include <mutex>

#include <stout/synchronized.hpp>

namespace corral {
namespace internal {

// Lets the thread starting a scheduler backend block until the cluster
// master client reported the outcome of the registration, i.e., until
// the first of a connection, a disconnection or a termination.
//
// The gate can only ever open: opening it more than once is a no-op
// and waiting on an opened gate returns immediately. There is no
// timeout; an unresponsive master is expected to be reported by the
// client itself (via a termination), which opens the gate.
class RegistrationGate
{
public:
  RegistrationGate() : opened_(false) {}

  RegistrationGate(const RegistrationGate&) = delete;
  RegistrationGate& operator=(const RegistrationGate&) = delete;

  // Opens the gate and notifies all the waiters. Returns true only
  // for the call that actually opened the gate.
  bool open()
  {
    bool opening = false;

    synchronized (mutex) {
      opening = !opened_;
      opened_ = true;
      cond.notify_all();
    }

    return opening;
  }

  // Blocks the current thread until the gate has been opened.
  void await()
  {
    synchronized (mutex) {
      while (!opened_) {
        synchronized_wait(&cond, &mutex);
      }
    }
  }

  bool opened()
  {
    bool result = false;

    synchronized (mutex) {
      result = opened_;
    }

    return result;
  }

private:
  bool opened_;
  std::mutex mutex;
  std::condition_variable cond;
};

} // namespace internal {
} // namespace corral {

#endif // __SCHED_REGISTRATION_GATE_HPP__
