/*
 * SeedCheck Randomized Regression Testing Harness
 *
 * Copyright (c) 2011, Dependable Systems Laboratory, EPFL
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *     * Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *     * Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *     * Neither the name of the Dependable Systems Laboratory, EPFL nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE DEPENDABLE SYSTEMS LABORATORY, EPFL BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * All contributors are listed in SEEDCHECK-AUTHORS file.
 *
*/

#include "HarnessTestables.h"

#include "seedcheck/TestCase.h"
#include "seedcheck/Testable.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <glog/logging.h>

#include <boost/thread/thread.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <stdexcept>

#include <signal.h>
#include <unistd.h>

using namespace seedcheck;

namespace harness {

boost::atomic<bool> FixableBroken(true);

namespace {

class Counter: public Testable {
public:
  virtual void run(TestCase &testCase) {
    testCase.nextLong();
    testCase.placemark();
    testCase.nextLong();
  }
};

class FailsAt42: public Testable {
public:
  virtual void run(TestCase &testCase) {
    for (int i = 0; i < 5; i++)
      testCase.nextLong();
    testCase.placemark();
    testCase.nextBoolean();

    if (testCase.getSeed() == BrokenSeed)
      throw std::runtime_error("Broken at 42");
  }
};

class Sleeper: public Testable {
public:
  virtual void run(TestCase &testCase) {
    for (int i = 0; i < 300; i++) {
      boost::this_thread::sleep(boost::posix_time::milliseconds(10));
      testCase.nextBoolean();
    }
  }
};

class Napper: public Testable {
public:
  virtual void run(TestCase &testCase) {
    boost::this_thread::sleep(boost::posix_time::milliseconds(300));
    testCase.nextBoolean();
  }
};

class Fixable: public Testable {
public:
  virtual void run(TestCase &testCase) {
    testCase.nextLong();
    testCase.placemark();

    if (FixableBroken)
      throw std::logic_error("Not fixed yet");
  }
};

class EvenSeedFails: public Testable {
public:
  virtual void run(TestCase &testCase) {
    testCase.nextInt();
    testCase.nextInt();
    testCase.nextInt();
    testCase.placemark("Step");

    if (testCase.getSeed() % 2 == 0)
      throw std::runtime_error("Even seed\nsecond line");
  }
};

// Only ever run inside worker processes
class Crasher: public Testable {
public:
  virtual void run(TestCase &testCase) {
    testCase.nextLong();
    ::kill(getpid(), SIGKILL);
  }
};

}

SEEDCHECK_REGISTER_TESTABLE(Counter, "harness::Counter");
SEEDCHECK_REGISTER_TESTABLE(FailsAt42, "harness::FailsAt42");
SEEDCHECK_REGISTER_TESTABLE(Sleeper, "harness::Sleeper");
SEEDCHECK_REGISTER_TESTABLE(Napper, "harness::Napper");
SEEDCHECK_REGISTER_TESTABLE(Fixable, "harness::Fixable");
SEEDCHECK_REGISTER_TESTABLE(EvenSeedFails, "harness::EvenSeedFails");
SEEDCHECK_REGISTER_TESTABLE(Crasher, "harness::Crasher");

TempDir::TempDir() {
  llvm::SmallString<128> result;

  std::error_code ec = llvm::sys::fs::createUniqueDirectory("seedcheck", result);
  if (ec)
    throw std::runtime_error("Could not create a temporary directory: " + ec.message());

  path = result.str().str();
}

TempDir::~TempDir() {
  std::error_code ec = llvm::sys::fs::remove_directories(path);
  if (ec)
    LOG(WARNING) << "Could not remove " << path << ": " << ec.message();
}

std::string TempDir::file(const std::string &name) const {
  llvm::SmallString<128> result(path);
  llvm::sys::path::append(result, name);

  return result.str().str();
}

}
