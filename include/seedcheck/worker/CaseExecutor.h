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

#ifndef CASEEXECUTOR_H_
#define CASEEXECUTOR_H_

#include "seedcheck/Common.h"

#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <iostream>
#include <string>

namespace seedcheck {

class DebugSession;
class TestCase;

namespace worker {

enum CaseStatus {
  CaseSucceeded,
  CaseFailed,
  CaseTimedOut
};

struct CaseResult {
  CaseStatus status;

  std::string message;
  std::string detail;

  boost::posix_time::time_duration elapsed;
  position_t position;
  placemarks_t placemarks;

  CaseResult() : status(CaseSucceeded), position(0) { }

  bool failed() const { return status != CaseSucceeded; }

  std::string describe() const;
};

struct ExecutionLimits {
  boost::optional<boost::posix_time::time_duration> maxTotalDuration;
  boost::optional<boost::posix_time::time_duration> maxCaseDuration;
  boost::optional<boost::posix_time::time_duration> maxProgressInterval;
};

class CaseRunner;

/*
 * Runs test cases one at a time on a long-lived runner thread and watches
 * them from the calling thread. A case that exceeds one of its budgets is
 * reported as timed out, and its runner is abandoned in favor of a new one.
 */
class CaseExecutor {
private:
  std::string testableName;

  bool printProgress;
  bool printFailures;

  boost::posix_time::ptime originalStart;
  ExecutionLimits limits;

  DebugSession *debugSession;
  unsigned long initialCatchCount;

  boost::shared_ptr<CaseRunner> runner;

  std::ostream &out;
  std::ostream &err;

  void startRunner();
  void abandonRunner(TestCase &testCase);

  void printResult(int caseNumber, const TestCase &testCase,
      const CaseResult &result);

  CaseExecutor(const CaseExecutor&);
  CaseExecutor &operator=(const CaseExecutor&);
public:
  CaseExecutor(const std::string &testableName, bool printProgress,
      bool printFailures, const boost::posix_time::ptime &originalStart,
      const ExecutionLimits &limits, DebugSession *debugSession = NULL,
      std::ostream &out = std::cout, std::ostream &err = std::cerr);
  virtual ~CaseExecutor();

  const ExecutionLimits &getLimits() const { return limits; }

  CaseResult executeTestCase(int caseNumber,
      boost::shared_ptr<TestCase> testCase, bool reproduction);

  void close();
};

}

}

#endif /* CASEEXECUTOR_H_ */
