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

#include "seedcheck/TestCase.h"

#include "HarnessTestables.h"

#include <gtest/gtest.h>

#include <boost/thread/thread.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

using namespace seedcheck;

namespace {

placemark_names_t names(const std::string &name) {
  placemark_names_t result;
  result.insert(name);
  return result;
}

TEST(TestCaseTest, DefaultPlacemarkIsAlwaysRecognized) {
  TestCase testCase(1, placemark_names_t());

  EXPECT_EQ(1u, testCase.getPlacemarkNames().count(SEEDCHECK_DEFAULT_PLACEMARK));
  EXPECT_NO_THROW(testCase.placemark());
  EXPECT_THROW(testCase.placemark("Elsewhere"), std::invalid_argument);
}

TEST(TestCaseTest, PlacemarkRecordsPositionAfterItsDraw) {
  TestCase testCase(1, names("Insert"));

  EXPECT_EQ(-1, testCase.getLastPlacemark("Insert"));

  testCase.nextLong();
  testCase.placemark("Insert");

  EXPECT_EQ(9u, testCase.getPosition());
  EXPECT_EQ(9, testCase.getLastPlacemark("Insert"));

  testCase.nextInt();
  testCase.placemark("Insert");
  EXPECT_EQ(14, testCase.getLastPlacemark("Insert"));

  placemarks_t placemarks = testCase.getPlacemarks();
  ASSERT_EQ(1u, placemarks.size());
  EXPECT_EQ(14u, placemarks["Insert"]);
}

TEST(TestCaseTest, ForkIsDeterministic) {
  TestCase first(0xFEED, names("Step"));
  TestCase second(0xFEED, names("Step"));

  first.nextInt();
  second.nextInt();

  boost::shared_ptr<TestCase> firstChild = first.fork();
  boost::shared_ptr<TestCase> secondChild = second.fork();

  EXPECT_EQ(firstChild->getSeed(), secondChild->getSeed());
  EXPECT_EQ(0u, firstChild->getPosition());
  EXPECT_EQ(12u, first.getPosition());
  EXPECT_EQ(1u, firstChild->getPlacemarkNames().count("Step"));

  EXPECT_EQ(firstChild->nextLong(), secondChild->nextLong());

  // Forking at another position yields another child
  TestCase third(0xFEED, names("Step"));
  boost::shared_ptr<TestCase> thirdChild = third.fork();
  EXPECT_NE(firstChild->getSeed(), thirdChild->getSeed());
}

TEST(TestCaseTest, BreakpointsFireOnceEach) {
  harness::FakeDebugSession session(true);

  breakpoints_t breakpoints;
  breakpoints.insert(8);
  breakpoints.insert(20);

  TestCase testCase(3, placemark_names_t(), true, false, breakpoints, &session);
  EXPECT_FALSE(testCase.hasHitBreak());

  testCase.nextInt();
  EXPECT_EQ(0u, session.getBreakpointCatchCount());

  testCase.nextInt();
  EXPECT_EQ(1u, session.getBreakpointCatchCount());
  EXPECT_TRUE(testCase.hasHitBreak());

  testCase.nextLong();
  EXPECT_EQ(1u, session.getBreakpointCatchCount());

  testCase.nextLong();
  EXPECT_EQ(2u, session.getBreakpointCatchCount());

  testCase.nextLong();
  EXPECT_EQ(2u, session.getBreakpointCatchCount());
}

TEST(TestCaseTest, CheckInOnlyWhenTracking) {
  TestCase quiet(5, placemark_names_t());
  quiet.placemark();
  EXPECT_TRUE(quiet.getLastCheckIn().is_not_a_date_time());

  TestCase tracked(5, placemark_names_t(), false, true);
  EXPECT_TRUE(tracked.getLastCheckIn().is_not_a_date_time());

  boost::posix_time::ptime before = boost::posix_time::microsec_clock::universal_time();
  tracked.placemark();
  boost::posix_time::ptime checkIn = tracked.getLastCheckIn();

  ASSERT_FALSE(checkIn.is_not_a_date_time());
  EXPECT_GE(checkIn, before - boost::posix_time::milliseconds(1));
}

TEST(TestCaseTest, CancelledCaseStopsAtNextDraw) {
  TestCase testCase(9, placemark_names_t());

  testCase.nextInt();
  testCase.requestCancel();

  EXPECT_THROW(testCase.nextInt(), CaseCancelled);
  EXPECT_THROW(testCase.placemark(), CaseCancelled);
}

}
