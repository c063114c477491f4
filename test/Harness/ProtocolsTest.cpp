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

#include "seedcheck/Protocols.h"
#include "seedcheck/TimeFormat.h"

#include <gtest/gtest.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <unistd.h>

using namespace seedcheck;
using namespace boost::posix_time;

namespace {

const std::string TesterId = "1a2b3c";

ptime sampleTime() {
  return ptime(boost::gregorian::date(2026, 10, 19),
      hours(14) + minutes(3) + seconds(22) + milliseconds(117));
}

// Strips the "<tester>:" prefix the way the pool does
std::string withoutId(const std::string &line) {
  EXPECT_EQ(0u, line.find(TesterId + ":"));
  return line.substr(TesterId.size() + 1);
}

TEST(ProtocolsTest, Assignment) {
  EXPECT_EQ("1f:abc", formatAssignment(31, 0xabc));

  unsigned int caseNumber;
  seed_t seed;

  ASSERT_TRUE(parseAssignment("1f:ABC", caseNumber, seed));
  EXPECT_EQ(31u, caseNumber);
  EXPECT_EQ(0xabcu, seed);

  ASSERT_TRUE(parseAssignment("0:ffffffffffffffff", caseNumber, seed));
  EXPECT_EQ(0u, caseNumber);
  EXPECT_EQ(0xffffffffffffffffULL, seed);

  EXPECT_FALSE(parseAssignment("", caseNumber, seed));
  EXPECT_FALSE(parseAssignment("x", caseNumber, seed));
  EXPECT_FALSE(parseAssignment("1f", caseNumber, seed));
  EXPECT_FALSE(parseAssignment("1f:", caseNumber, seed));
  EXPECT_FALSE(parseAssignment("1g:abc", caseNumber, seed));
  EXPECT_FALSE(parseAssignment("100000000:abc", caseNumber, seed));
}

TEST(ProtocolsTest, StartedAndDone) {
  std::string line = formatCaseStarted(TesterId, 10, sampleTime());
  EXPECT_EQ(TesterId + ":I:a:19Oct2026 140322.117", line);

  WorkerReport report;
  std::string error;

  ASSERT_TRUE(parseWorkerReport(withoutId(line), placemark_names_t(), report, error));
  EXPECT_EQ(WorkerReport::CaseStarted, report.kind);
  EXPECT_EQ(10u, report.caseNumber);
  EXPECT_EQ(sampleTime(), report.timestamp);

  line = formatCaseDone(TesterId, 11, sampleTime());
  ASSERT_TRUE(parseWorkerReport(withoutId(line), placemark_names_t(), report, error));
  EXPECT_EQ(WorkerReport::CaseDone, report.kind);
  EXPECT_EQ(11u, report.caseNumber);
}

TEST(ProtocolsTest, FailureWithPlacemarks) {
  placemark_names_t names;
  names.insert("Insert");
  names.insert("Remove");

  placemarks_t placemarks;
  placemarks["Remove"] = 0x41;

  std::string line = formatCaseFailed(TesterId, 3, sampleTime(), 42, names,
      placemarks, "Boom: it broke\r\nat C:\\path");
  EXPECT_EQ(TesterId + ":X:3:19Oct2026 140322.117:2a:ffffffffffffffff:41:"
      "Boom: it broke\\nat C:\\\\path", line);

  WorkerReport report;
  std::string error;

  ASSERT_TRUE(parseWorkerReport(withoutId(line), names, report, error)) << error;
  EXPECT_EQ(WorkerReport::CaseFailed, report.kind);
  EXPECT_EQ(3u, report.caseNumber);
  EXPECT_EQ(42u, report.position);
  EXPECT_EQ(1u, report.placemarks.size());
  EXPECT_EQ(0x41u, report.placemarks["Remove"]);
  EXPECT_EQ("Boom: it broke\nat C:\\path", report.detail);
}

TEST(ProtocolsTest, BadReports) {
  WorkerReport report;
  std::string error;

  EXPECT_FALSE(parseWorkerReport("Q:1:19Oct2026 140322.117", placemark_names_t(),
      report, error));
  EXPECT_NE(std::string::npos, error.find("Unrecognized report type"));

  EXPECT_FALSE(parseWorkerReport("D:zz:19Oct2026 140322.117", placemark_names_t(),
      report, error));
  EXPECT_FALSE(parseWorkerReport("D:1", placemark_names_t(), report, error));

  placemark_names_t names;
  names.insert("Insert");
  EXPECT_FALSE(parseWorkerReport("X:1:19Oct2026 140322.117:2a", names, report, error));
}

TEST(ProtocolsTest, UnreadableTimestampIsTolerated) {
  WorkerReport report;
  std::string error;

  ASSERT_TRUE(parseWorkerReport("D:5:sometime", placemark_names_t(), report, error));
  EXPECT_EQ(5u, report.caseNumber);
  EXPECT_TRUE(report.timestamp.is_not_a_date_time());
}

TEST(ProtocolsTest, EscapeDetail) {
  EXPECT_EQ("a\\nb", escapeDetail("a\r\nb"));
  EXPECT_EQ("\\\\n", escapeDetail("\\n"));
  EXPECT_EQ("\\n", unescapeDetail(escapeDetail("\\n")));
  EXPECT_EQ("trailing\\", unescapeDetail("trailing\\"));
}

TEST(ProtocolsTest, WriteLine) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));

  ASSERT_TRUE(writeLine(fds[1], "0:1"));
  ::close(fds[1]);

  char buffer[16];
  ssize_t size = ::read(fds[0], buffer, sizeof(buffer));
  ::close(fds[0]);

  ASSERT_EQ(4, size);
  EXPECT_EQ("0:1\n", std::string(buffer, size));
}

}
