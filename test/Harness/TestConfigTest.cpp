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

#include "seedcheck/FailureStore.h"
#include "seedcheck/TestConfig.h"

#include <gtest/gtest.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <sstream>

using namespace seedcheck;
using namespace boost::posix_time;

namespace {

class TestConfigTest: public ::testing::Test {
protected:
  harness::TempDir dir;
  harness::FakeDebugSession debugSession;
  std::ostringstream out;
  std::ostringstream err;

  placemark_names_t names;

  TestConfigTest() : debugSession(false) { }

  virtual void SetUp() {
    names.insert(SEEDCHECK_DEFAULT_PLACEMARK);
  }

  virtual void TearDown() {
    harness::FixableBroken = true;
  }

  TestConfig config(const std::string &testable) {
    TestConfig result(testable);
    result.withPersistenceDir(dir.getPath())
        .withPrinting(false, false)
        .withDebugSession(&debugSession)
        .withOutput(out, err);
    return result;
  }

  failure_list_t stored(const std::string &testable) {
    return FailureStore::load(dir.file(testable + ".test"), names);
  }
};

TEST_F(TestConfigTest, NewFailureRecorded) {
  TestSummary summary = config("harness::FailsAt42")
      .withCase(harness::BrokenSeed)
      .execute();

  EXPECT_EQ(0u, summary.getSuccesses());
  EXPECT_EQ(1u, summary.getFailures());
  ASSERT_TRUE(!!summary.getFirstError());
  EXPECT_NE(std::string::npos,
      summary.getFirstError()->message.find("Broken at 42"));
  EXPECT_THROW(summary.throwErrorIfFailed(), TestFailedError);

  failure_list_t failures = stored("harness.FailsAt42");
  ASSERT_EQ(1u, failures.size());
  EXPECT_EQ(harness::BrokenSeed, failures[0].getSeed());
  EXPECT_EQ(harness::BrokenPosition, failures[0].getPosition());
  EXPECT_FALSE(failures[0].isFixed());
  ASSERT_EQ(1u, failures[0].getPlacemarks().count(SEEDCHECK_DEFAULT_PLACEMARK));
  EXPECT_EQ(harness::BrokenPlacemark,
      failures[0].getPlacemarks().find(SEEDCHECK_DEFAULT_PLACEMARK)->second);
}

TEST_F(TestConfigTest, KnownFailureReproduced) {
  config("harness::FailsAt42").withCase(harness::BrokenSeed).execute();

  TestSummary summary = config("harness::FailsAt42").execute();

  EXPECT_EQ(1u, summary.getFailures());
  EXPECT_NE(std::string::npos, err.str().find("Test failure reproduced"));
  EXPECT_EQ(1u, stored("harness.FailsAt42").size());
}

TEST_F(TestConfigTest, FixDetectedAndRegressed) {
  config("harness::Fixable").withCase(7).execute();
  ASSERT_EQ(1u, stored("harness.Fixable").size());

  harness::FixableBroken = false;

  TestSummary summary = config("harness::Fixable").execute();
  EXPECT_EQ(1u, summary.getSuccesses());
  EXPECT_EQ(0u, summary.getFailures());
  EXPECT_NE(std::string::npos, out.str().find("Test failure fixed"));

  failure_list_t failures = stored("harness.Fixable");
  ASSERT_EQ(1u, failures.size());
  EXPECT_TRUE(failures[0].isFixed());

  config("harness::Fixable").execute();
  EXPECT_NE(std::string::npos, out.str().find("Test failure still fixed"));

  harness::FixableBroken = true;

  summary = config("harness::Fixable").execute();
  EXPECT_EQ(1u, summary.getFailures());
  EXPECT_NE(std::string::npos, err.str().find("Test fix regressed: 7@9"));

  failures = stored("harness.Fixable");
  ASSERT_EQ(1u, failures.size());
  EXPECT_FALSE(failures[0].isFixed());
}

TEST_F(TestConfigTest, OldestFixesAreForgotten) {
  ptime longAgo(boost::gregorian::date(2025, 1, 1));

  failure_list_t failures;
  failures.push_back(TestFailure(longAgo, longAgo + hours(1), 1, 9, placemarks_t()));
  failures.push_back(TestFailure(longAgo, longAgo + hours(2), 2, 9, placemarks_t()));
  failures.push_back(TestFailure(longAgo, longAgo + hours(3), 3, 9, placemarks_t()));
  failures.push_back(TestFailure(longAgo, ptime(not_a_date_time), 4, 9,
      placemarks_t()));
  FailureStore::write(dir.file("harness.Counter.test"), names, failures);

  TestSummary summary = config("harness::Counter")
      .withMaxRememberedFixes(2)
      .execute();

  EXPECT_EQ(2u, summary.getSuccesses());
  EXPECT_EQ(0u, summary.getFailures());

  failures = stored("harness.Counter");
  ASSERT_EQ(2u, failures.size());
  EXPECT_EQ(3u, failures[0].getSeed());
  EXPECT_EQ(4u, failures[1].getSeed());
  EXPECT_TRUE(failures[0].isFixed());
  EXPECT_TRUE(failures[1].isFixed());
}

TEST_F(TestConfigTest, DebugReproductionStopsAtBreakpoints) {
  config("harness::FailsAt42").withCase(harness::BrokenSeed).execute();
  EXPECT_EQ(0u, debugSession.getBreakpointCatchCount());

  config("harness::FailsAt42").withDebug(true).execute();

  // One stop at the placemark, one at the failure
  EXPECT_EQ(2u, debugSession.getBreakpointCatchCount());
}

TEST_F(TestConfigTest, RandomCases) {
  TestSummary summary = config("harness::Counter")
      .withRandomCases(5)
      .execute();

  EXPECT_EQ(5u, summary.getSuccesses());
  EXPECT_EQ(0u, summary.getFailures());
  EXPECT_FALSE(!!summary.getFirstError());
  EXPECT_NO_THROW(summary.throwErrorIfFailed());
}

TEST_F(TestConfigTest, MaxFailuresEndsTestSet) {
  TestSummary summary = config("harness::EvenSeedFails")
      .withRandomCases(-1)
      .withMaxFailures(2)
      .withFailurePersistence(false)
      .execute();

  EXPECT_EQ(2u, summary.getFailures());
  EXPECT_TRUE(stored("harness.EvenSeedFails").empty());
}

TEST_F(TestConfigTest, MaxTotalDurationEndsTestSet) {
  TestSummary summary = config("harness::Counter")
      .withMaxTotalDuration(milliseconds(200))
      .withFailurePersistence(false)
      .execute();

  EXPECT_GT(summary.getSuccesses(), 0u);
  EXPECT_LT(summary.getDuration(), seconds(5));
}

TEST_F(TestConfigTest, PersistenceDirEnablesPersistence) {
  TestConfig persisted("harness::FailsAt42");
  persisted.withFailurePersistence(false)
      .withPersistenceDir(dir.getPath())
      .withPrinting(false, false)
      .withDebugSession(&debugSession)
      .withOutput(out, err)
      .withCase(harness::BrokenSeed);

  EXPECT_EQ(1u, persisted.execute().getFailures());
  EXPECT_EQ(1u, stored("harness.FailsAt42").size());
}

TEST_F(TestConfigTest, ExplicitCasesKeepTimeoutsUnderDebugger) {
  harness::FakeDebugSession attached(true);

  TestSummary summary = config("harness::Napper")
      .withDebugSession(&attached)
      .withFailurePersistence(false)
      .withMaxCaseDuration(milliseconds(50))
      .withCase(1)
      .execute();

  EXPECT_EQ(1u, summary.getFailures());
  ASSERT_TRUE(!!summary.getFirstError());
  EXPECT_EQ(worker::CaseTimedOut, summary.getFirstError()->status);
}

TEST_F(TestConfigTest, ConfigurationErrors) {
  EXPECT_THROW(config("harness::Counter").execute(), ConfigurationError);
  EXPECT_THROW(config("harness::NoSuchTest").withRandomCases(1).execute(),
      ConfigurationError);
}

TEST_F(TestConfigTest, FailureFileNaming) {
  EXPECT_EQ(dir.file("harness.Counter.test"),
      config("harness::Counter").getFailureFile());

  TestConfig simple("harness::Counter");
  simple.withPersistenceDir(dir.getPath(), false);
  EXPECT_EQ(dir.file("Counter.test"), simple.getFailureFile());
}

TEST(TestSummaryTest, Descriptions) {
  EXPECT_EQ("No cases in 0ms",
      TestSummary(0, 0, milliseconds(0), boost::none).toString());
  EXPECT_EQ("1 successful case in 250ms",
      TestSummary(1, 0, milliseconds(250), boost::none).toString());
  EXPECT_EQ("3 successful cases, 2 failed cases in 2.000s",
      TestSummary(3, 2, seconds(2), boost::none).toString());

  std::ostringstream os;
  TestSummary(0, 1, seconds(1), boost::none).printResults(os);
  EXPECT_EQ("Summary: 1 failed case in 1.000s\n", os.str());
}

TEST(TestSummaryTest, FirstErrorIsThrown) {
  worker::CaseResult error;
  error.status = worker::CaseFailed;
  error.message = "Broken";
  error.detail = "at frame";

  TestSummary summary(0, 1, seconds(1), error);

  try {
    summary.throwErrorIfFailed();
    FAIL() << "Expected a TestFailedError";
  } catch (TestFailedError &e) {
    EXPECT_EQ(std::string("Broken\nat frame"), e.what());
  }
}

}
