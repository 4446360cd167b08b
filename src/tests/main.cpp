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
#include <string>

#include <gmock/gmock.h>

#include <gtest/gtest.h>

#include <google/protobuf/stubs/common.h>

#include <process/gtest.hpp>
#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#include "tests/flags.hpp"

using namespace corral::internal;
using namespace corral::internal::tests;

using std::cerr;
using std::cout;
using std::endl;


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  using corral::internal::tests::flags; // Needed to disambiguate.

  // Unknown flags are let through, they belong to gtest and gmock.
  Try<flags::Warnings> load = flags.load("CORRAL_", argc, argv, true);

  if (flags.help) {
    cout << flags.usage() << endl;
    testing::InitGoogleMock(&argc, argv);
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  if (!flags.verbose) {
    flags.quiet = true;
  }

  process::TEST_AWAIT_TIMEOUT = flags.test_await_timeout;

  // Initialize logging. Backends created by the tests find it already
  // initialized and leave it alone.
  logging::initialize(argv[0], true, flags);

  // Flag warnings can only be logged once logging is set up.
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  if (!process::initialize()) {
    EXIT(EXIT_FAILURE) << "libprocess was initialized before the tests' "
                       << "`main()`";
  }

  testing::InitGoogleMock(&argc, argv);
  testing::FLAGS_gtest_death_test_style = "threadsafe";

  const int test_results = RUN_ALL_TESTS();

  process::finalize();

  return test_results;
}
