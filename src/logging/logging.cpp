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

#include <iostream>
#include <map>
#include <string>

#include <glog/logging.h>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::cerr;
using std::endl;
using std::map;
using std::string;

namespace corral {
namespace internal {
namespace logging {

// glog keeps a pointer to the program name, so it must outlive
// the call to `google::InitGoogleLogging`.
static string argv0;


google::LogSeverity getLogSeverity(const string& logging_level)
{
  static const map<string, google::LogSeverity> severities = {
    {"INFO", google::INFO},
    {"WARNING", google::WARNING},
    {"ERROR", google::ERROR}
  };

  // Unknown levels are rejected when the flags are loaded.
  auto severity = severities.find(logging_level);
  return severity != severities.end() ? severity->second : google::INFO;
}


// Decides where messages go: files under `--log_dir` (with a copy on
// stderr unless quiet) or stderr alone.
static Try<Nothing> configureDestination(const Flags& flags)
{
  if (flags.log_dir.isNone()) {
    FLAGS_logtostderr = true;

    // glog ignores the stderr threshold when it only writes to stderr,
    // so quiet mode raises the minimum level instead.
    if (flags.quiet) {
      FLAGS_minloglevel = google::FATAL;
    }

    FLAGS_stderrthreshold = FLAGS_minloglevel;
    return Nothing();
  }

  Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
  if (mkdir.isError()) {
    return Error(
        "Failed to create log directory '" + flags.log_dir.get() + "': " +
        mkdir.error());
  }

  FLAGS_log_dir = flags.log_dir.get();
  FLAGS_logtostderr = false;
  FLAGS_stderrthreshold =
    flags.quiet ? static_cast<int>(google::FATAL) : FLAGS_minloglevel;

  return Nothing();
}


void initialize(
    const string& _argv0,
    bool installFailureSignalHandler,
    const Option<Flags>& flags)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  const Flags configuration = flags.getOrElse(Flags());

  FLAGS_minloglevel = getLogSeverity(configuration.logging_level);
  FLAGS_logbufsecs = configuration.logbufsecs;

  Try<Nothing> destination = configureDestination(configuration);
  if (destination.isError()) {
    cerr << "Could not initialize logging: " << destination.error() << endl;
    exit(EXIT_FAILURE);
  }

  argv0 = _argv0;
  google::InitGoogleLogging(argv0.c_str());

  VLOG(1) << "Logging to "
          << configuration.log_dir.getOrElse("stderr");

  // glog's handler dumps a stack trace on fatal signals.
  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();
  }

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace corral {
