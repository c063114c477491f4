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
#include "seedcheck/worker/CaseExecutor.h"

#include <gtest/gtest.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <sstream>

using namespace seedcheck;
using namespace seedcheck::worker;
using namespace boost::posix_time;

namespace {

class CaseExecutorTest: public ::testing::Test {
protected:
  std::ostringstream out;
  std::ostringstream err;

  boost::shared_ptr<TestCase> makeCase(seed_t seed, bool checkIn = false) {
    return boost::shared_ptr<TestCase>(new TestCase(seed, placemark_names_t(),
        false, checkIn));
  }
};

TEST_F(CaseExecutorTest, Success) {
  CaseExecutor executor("harness::FailsAt42", true, true,
      microsec_clock::universal_time(), ExecutionLimits(), NULL, out, err);

  CaseResult result = executor.executeTestCase(1, makeCase(0x123), false);

  EXPECT_EQ(CaseSucceeded, result.status);
  EXPECT_FALSE(result.failed());
  EXPECT_EQ(42u, result.position);
  EXPECT_EQ(0u, out.str().find("[1] 123: SUCCESS in "));
  EXPECT_TRUE(err.str().empty());
}

TEST_F(CaseExecutorTest, Failure) {
  CaseExecutor executor("harness::FailsAt42", false, true,
      microsec_clock::universal_time(), ExecutionLimits(), NULL, out, err);

  CaseResult result = executor.executeTestCase(2, makeCase(harness::BrokenSeed),
      false);

  EXPECT_EQ(CaseFailed, result.status);
  EXPECT_NE(std::string::npos, result.message.find("Broken at 42"));
  EXPECT_EQ(harness::BrokenPosition, result.position);
  ASSERT_EQ(1u, result.placemarks.count(SEEDCHECK_DEFAULT_PLACEMARK));
  EXPECT_EQ(harness::BrokenPlacemark,
      result.placemarks.find(SEEDCHECK_DEFAULT_PLACEMARK)->second);

  EXPECT_TRUE(out.str().empty());
  EXPECT_EQ(0u, err.str().find("[2] ABC: FAILURE@42 in "));
  EXPECT_NE(std::string::npos, err.str().find("\tPlacemark@41"));
}

TEST_F(CaseExecutorTest, RunnerSurvivesFailures) {
  CaseExecutor executor("harness::FailsAt42", false, false,
      microsec_clock::universal_time(), ExecutionLimits(), NULL, out, err);

  EXPECT_TRUE(executor.executeTestCase(1, makeCase(harness::BrokenSeed), false).failed());
  EXPECT_FALSE(executor.executeTestCase(2, makeCase(1), false).failed());
  EXPECT_TRUE(executor.executeTestCase(3, makeCase(harness::BrokenSeed), false).failed());

  EXPECT_TRUE(err.str().empty());
}

TEST_F(CaseExecutorTest, UnknownTestable) {
  CaseExecutor executor("harness::Missing", false, false,
      microsec_clock::universal_time(), ExecutionLimits(), NULL, out, err);

  CaseResult result = executor.executeTestCase(1, makeCase(1), false);

  EXPECT_EQ(CaseFailed, result.status);
  EXPECT_NE(std::string::npos, result.message.find("Could not create test instance"));
}

TEST_F(CaseExecutorTest, CaseTimeout) {
  ExecutionLimits limits;
  limits.maxCaseDuration = milliseconds(100);

  harness::FakeDebugSession debugSession(false);
  CaseExecutor executor("harness::Sleeper", false, true,
      microsec_clock::universal_time(), limits, &debugSession, out, err);

  CaseResult result = executor.executeTestCase(1, makeCase(5), false);

  EXPECT_EQ(CaseTimedOut, result.status);
  EXPECT_EQ("Timeout: Test case took longer than 100ms", result.message);
  EXPECT_LT(result.elapsed, seconds(2));

  // The executor replaces the abandoned runner
  CaseExecutor follower("harness::Counter", false, false,
      microsec_clock::universal_time(), limits, &debugSession, out, err);
  EXPECT_FALSE(follower.executeTestCase(2, makeCase(6), false).failed());
}

TEST_F(CaseExecutorTest, ProgressTimeout) {
  ExecutionLimits limits;
  limits.maxProgressInterval = milliseconds(100);

  harness::FakeDebugSession debugSession(false);
  CaseExecutor executor("harness::Sleeper", false, false,
      microsec_clock::universal_time(), limits, &debugSession, out, err);

  CaseResult result = executor.executeTestCase(1, makeCase(5, true), false);

  EXPECT_EQ(CaseTimedOut, result.status);
  EXPECT_EQ(0u, result.message.find("Timeout: No progress in longer than"));
}

TEST_F(CaseExecutorTest, TotalTimeout) {
  ExecutionLimits limits;
  limits.maxTotalDuration = milliseconds(200);

  harness::FakeDebugSession debugSession(false);
  CaseExecutor executor("harness::Sleeper", false, false,
      microsec_clock::universal_time() - milliseconds(150), limits,
      &debugSession, out, err);

  CaseResult result = executor.executeTestCase(1, makeCase(5), false);

  EXPECT_EQ(CaseTimedOut, result.status);
  EXPECT_EQ("Timeout: Test set took longer than 200ms", result.message);
}

TEST_F(CaseExecutorTest, DebuggerSuspendsTimeouts) {
  ExecutionLimits limits;
  limits.maxCaseDuration = milliseconds(50);

  harness::FakeDebugSession debugSession(true);
  CaseExecutor executor("harness::Napper", true, true,
      microsec_clock::universal_time(), limits, &debugSession, out, err);

  CaseResult result = executor.executeTestCase(0, makeCase(9), true);

  EXPECT_EQ(CaseSucceeded, result.status);
  EXPECT_GE(result.elapsed, milliseconds(300));
  EXPECT_EQ(0u, out.str().find("Reproducing 9: SUCCESS"));
}

TEST_F(CaseExecutorTest, TimeoutsStillApplyWithoutReproduction) {
  ExecutionLimits limits;
  limits.maxCaseDuration = milliseconds(50);

  harness::FakeDebugSession debugSession(true);
  CaseExecutor executor("harness::Napper", false, false,
      microsec_clock::universal_time(), limits, &debugSession, out, err);

  EXPECT_EQ(CaseTimedOut, executor.executeTestCase(1, makeCase(9), false).status);
}

}
