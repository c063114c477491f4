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

#ifndef TESTCONFIG_H_
#define TESTCONFIG_H_

#include "seedcheck/Common.h"
#include "seedcheck/TestFailure.h"
#include "seedcheck/worker/CaseExecutor.h"

#include <boost/function.hpp>
#include <boost/optional.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace seedcheck {

class DebugSession;

class ConfigurationError: public std::logic_error {
public:
  explicit ConfigurationError(const std::string &message) :
    std::logic_error(message) { }
};

class TestFailedError: public std::runtime_error {
public:
  explicit TestFailedError(const std::string &message) :
    std::runtime_error(message) { }
};

class TestSummary {
private:
  unsigned int successes;
  unsigned int failures;
  boost::posix_time::time_duration duration;
  boost::optional<worker::CaseResult> firstError;
public:
  TestSummary(unsigned int successes, unsigned int failures,
      const boost::posix_time::time_duration &duration,
      const boost::optional<worker::CaseResult> &firstError);

  unsigned int getSuccesses() const { return successes; }
  unsigned int getFailures() const { return failures; }
  const boost::posix_time::time_duration &getDuration() const { return duration; }
  const boost::optional<worker::CaseResult> &getFirstError() const { return firstError; }

  void throwErrorIfFailed() const;
  void printResults(std::ostream &os = std::cout) const;

  std::string toString() const;
};

/*
 * A test set for one registered testable: which cases to run, how long they
 * may take, and where failures are remembered.
 */
class TestConfig {
public:
  typedef boost::function<unsigned int (unsigned int)> concurrency_fn_t;
private:
  struct RunState;

  std::string testableName;

  bool revisitKnownFailures;
  bool debugging;
  failure_list_t specifiedCases;
  int maxRandomCases;
  int maxFailures;
  int maxRememberedFixes;
  worker::ExecutionLimits limits;
  concurrency_fn_t concurrency;
  placemark_names_t placemarkNames;
  bool printProgress;
  bool printFailures;
  bool persistingFailures;
  std::string failureDir;
  bool qualifiedName;
  DebugSession *debugSession;
  std::string workerExecutable;

  std::ostream *out;
  std::ostream *err;

  void persist(RunState &state);
  void recordFailure(RunState &state, const worker::CaseResult &result);
  void evictOldestFix(RunState &state, int &index);

  void revisitFailures(RunState &state, worker::CaseExecutor &executor);
  void executeSpecifiedCases(RunState &state, worker::CaseExecutor &executor);
  void executeLinear(RunState &state, worker::CaseExecutor &executor);
  void executeParallel(RunState &state, unsigned int workers);

  void handleParallelFailure(RunState *state, const TestFailure &failure,
      const std::string &error);
public:
  explicit TestConfig(const std::string &testableName);

  TestConfig &withRevisitKnownFailures(bool value);
  TestConfig &withDebug(bool value);
  TestConfig &withCase(seed_t seed, const placemarks_t &placemarks = placemarks_t(),
      position_t position = 0);
  TestConfig &withRandomCases(int cases);
  TestConfig &withMaxFailures(int failures);
  TestConfig &withMaxRememberedFixes(int fixes);
  TestConfig &withMaxTotalDuration(const boost::posix_time::time_duration &duration);
  TestConfig &withMaxCaseDuration(const boost::posix_time::time_duration &duration);
  TestConfig &withMaxProgressInterval(const boost::posix_time::time_duration &duration);
  TestConfig &withConcurrency(unsigned int workers);
  TestConfig &withConcurrency(const concurrency_fn_t &fromCpuCount);
  TestConfig &withPlacemarks(const placemark_names_t &names);
  TestConfig &withPlacemark(const std::string &name);
  TestConfig &withPrinting(bool progress, bool failures);
  TestConfig &withFailurePersistence(bool value);
  TestConfig &withPersistenceDir(const std::string &dir, bool qualifiedName = true);
  TestConfig &withDebugSession(DebugSession *session);
  TestConfig &withWorkerExecutable(const std::string &path);
  TestConfig &withOutput(std::ostream &out, std::ostream &err);

  const std::string &getTestableName() const { return testableName; }

  // The file known failures are read from and written to
  std::string getFailureFile() const;

  TestSummary execute();
};

}

#endif /* TESTCONFIG_H_ */
