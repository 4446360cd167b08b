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

#ifndef __CORRAL_SCHEDULER_HPP__
#define __CORRAL_SCHEDULER_HPP__

#include <string>

namespace corral {

// The scheduler owning a scheduler backend. The backend reports
// fatal cluster errors to it.
class TaskScheduler
{
public:
  virtual ~TaskScheduler() {}

  // Invoked when the application can no longer be scheduled. The
  // scheduler fails all outstanding jobs with 'message'.
  virtual void error(const std::string& message) = 0;
};


// The container of a running application, used to shut the whole
// application down after a fatal error.
class Application
{
public:
  virtual ~Application() {}

  virtual void stop() = 0;
};

} // namespace corral {

#endif // __CORRAL_SCHEDULER_HPP__
