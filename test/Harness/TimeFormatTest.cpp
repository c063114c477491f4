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

#include "seedcheck/TimeFormat.h"

#include <gtest/gtest.h>

#include <boost/date_time/posix_time/posix_time.hpp>

using namespace seedcheck;
using namespace boost::posix_time;

namespace {

TEST(TimeFormatTest, FileTime) {
  ptime time(boost::gregorian::date(2026, 10, 19),
      hours(14) + minutes(3) + seconds(22) + milliseconds(500));

  EXPECT_EQ("19Oct2026 14:03:22", formatFileTime(time));

  ptime parsed;
  ASSERT_TRUE(parseFileTime("19Oct2026 14:03:22", parsed));
  EXPECT_EQ(ptime(boost::gregorian::date(2026, 10, 19),
      hours(14) + minutes(3) + seconds(22)), parsed);

  ASSERT_TRUE(parseFileTime("01Jan2000 00:00:00", parsed));
  EXPECT_EQ(ptime(boost::gregorian::date(2000, 1, 1)), parsed);
}

TEST(TimeFormatTest, InvalidFileTimes) {
  ptime parsed;

  EXPECT_FALSE(parseFileTime("", parsed));
  EXPECT_FALSE(parseFileTime("30Feb2026 14:03:22", parsed));
  EXPECT_FALSE(parseFileTime("19Foo2026 14:03:22", parsed));
  EXPECT_FALSE(parseFileTime("19Oct2026 24:03:22", parsed));
  EXPECT_FALSE(parseFileTime("19Oct2026 14:03:22x", parsed));
  EXPECT_FALSE(parseFileTime("19Oct2026", parsed));
}

TEST(TimeFormatTest, HandshakeTime) {
  ptime time(boost::gregorian::date(2026, 10, 19),
      hours(14) + minutes(3) + seconds(22) + milliseconds(117));

  EXPECT_EQ("19Oct2026 140322.117", formatHandshakeTime(time));

  ptime parsed;
  ASSERT_TRUE(parseHandshakeTime("19Oct2026 140322.117", parsed));
  EXPECT_EQ(time, parsed);

  EXPECT_FALSE(parseHandshakeTime("19Oct2026 14:03:22", parsed));
  EXPECT_FALSE(parseHandshakeTime("19Oct2026 140360.000", parsed));
}

TEST(TimeFormatTest, ClockTime) {
  ptime time(boost::gregorian::date(2026, 10, 19),
      hours(9) + minutes(5) + seconds(7) + milliseconds(42));

  EXPECT_EQ("09:05:07.042", formatClockTime(time));
}

TEST(TimeFormatTest, Durations) {
  EXPECT_EQ("0ms", formatDuration(milliseconds(0)));
  EXPECT_EQ("250ms", formatDuration(milliseconds(250)));
  EXPECT_EQ("3.042s", formatDuration(milliseconds(3042)));
  EXPECT_EQ("2m 5.100s", formatDuration(minutes(2) + milliseconds(5100)));
  EXPECT_EQ("1h 0m 12.000s", formatDuration(hours(1) + seconds(12)));

  time_duration parsed;
  ASSERT_TRUE(parseDuration("00:00:01.500", parsed));
  EXPECT_EQ(milliseconds(1500), parsed);

  EXPECT_FALSE(parseDuration("", parsed));
  EXPECT_FALSE(parseDuration("-00:00:01", parsed));
}

TEST(TimeFormatTest, Hex) {
  EXPECT_EQ("0", toHex(0));
  EXPECT_EQ("abc", toHex(0xabc));
  EXPECT_EQ("ABC", toHex(0xabc, true));
  EXPECT_EQ("ffffffffffffffff", toHex(0xffffffffffffffffULL));

  uint64_t value;
  ASSERT_TRUE(parseHex("DeadBeef", value));
  EXPECT_EQ(0xdeadbeefULL, value);

  EXPECT_FALSE(parseHex("", value));
  EXPECT_FALSE(parseHex("12g", value));
  EXPECT_FALSE(parseHex("-1", value));
  EXPECT_FALSE(parseHex("11111111111111111", value));
}

}
