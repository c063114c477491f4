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

#include "seedcheck/TestConfig.h"

#include "seedcheck/DebugSession.h"
#include "seedcheck/FailureStore.h"
#include "seedcheck/RandomStream.h"
#include "seedcheck/TestCase.h"
#include "seedcheck/Testable.h"
#include "seedcheck/TimeFormat.h"
#include "seedcheck/pool/WorkerPool.h"

#include <glog/logging.h>

#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/locks.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>

using namespace boost::posix_time;
using namespace seedcheck::worker;

namespace seedcheck {

namespace {

unsigned int fixedConcurrency(unsigned int workers, unsigned int cpus) {
  return workers;
}

}

struct TestConfig::RunState {
  placemark_names_t placemarkNames;

  ptime start;
  ptime termination;
  int maxCases;       // negative when unlimited
  int maxFailures;    // negative when unlimited

  bool persisting;
  std::string failureFile;
  failure_list_t knownFailures;

  unsigned int cases;
  unsigned int successes;
  unsigned int failures;
  boost::optional<CaseResult> firstError;

  boost::mutex lock;

  RunState() : termination(not_a_date_time), maxCases(0), maxFailures(-1),
    persisting(false), cases(0), successes(0), failures(0) { }

  bool timeLeft() const {
    return termination.is_not_a_date_time()
        || microsec_clock::universal_time() < termination;
  }

  bool failuresLeft(unsigned int failed) const {
    return maxFailures < 0 || (int)failed < maxFailures;
  }

  bool casesLeft(unsigned int executed) const {
    return maxCases < 0 || (int)executed < maxCases;
  }
};

TestConfig::TestConfig(const std::string &testableName) :
  testableName(testableName), revisitKnownFailures(true), debugging(false),
  maxRandomCases(0), maxFailures(1), maxRememberedFixes(5),
  concurrency(boost::bind(&fixedConcurrency, 1, _1)), printProgress(true),
  printFailures(true), persistingFailures(true), qualifiedName(true),
  debugSession(NULL), out(&std::cout), err(&std::cerr) {

}

TestConfig &TestConfig::withRevisitKnownFailures(bool value) {
  revisitKnownFailures = value;
  return *this;
}

TestConfig &TestConfig::withDebug(bool value) {
  debugging = value;
  return *this;
}

TestConfig &TestConfig::withCase(seed_t seed, const placemarks_t &placemarks,
    position_t position) {
  specifiedCases.push_back(TestFailure(microsec_clock::universal_time(),
      ptime(not_a_date_time), seed, position, placemarks));
  return *this;
}

TestConfig &TestConfig::withRandomCases(int cases) {
  maxRandomCases = cases;
  return *this;
}

TestConfig &TestConfig::withMaxFailures(int failures) {
  maxFailures = failures;
  return *this;
}

TestConfig &TestConfig::withMaxRememberedFixes(int fixes) {
  maxRememberedFixes = fixes;
  return *this;
}

TestConfig &TestConfig::withMaxTotalDuration(const time_duration &duration) {
  limits.maxTotalDuration = duration;
  return *this;
}

TestConfig &TestConfig::withMaxCaseDuration(const time_duration &duration) {
  limits.maxCaseDuration = duration;
  return *this;
}

TestConfig &TestConfig::withMaxProgressInterval(const time_duration &duration) {
  limits.maxProgressInterval = duration;
  return *this;
}

TestConfig &TestConfig::withConcurrency(unsigned int workers) {
  concurrency = boost::bind(&fixedConcurrency, workers, _1);
  return *this;
}

TestConfig &TestConfig::withConcurrency(const concurrency_fn_t &fromCpuCount) {
  concurrency = fromCpuCount;
  return *this;
}

TestConfig &TestConfig::withPlacemarks(const placemark_names_t &names) {
  placemarkNames.insert(names.begin(), names.end());
  return *this;
}

TestConfig &TestConfig::withPlacemark(const std::string &name) {
  placemarkNames.insert(name);
  return *this;
}

TestConfig &TestConfig::withPrinting(bool progress, bool failures) {
  printProgress = progress;
  printFailures = failures;
  return *this;
}

TestConfig &TestConfig::withFailurePersistence(bool value) {
  persistingFailures = value;
  return *this;
}

TestConfig &TestConfig::withPersistenceDir(const std::string &dir,
    bool qualifiedName) {
  failureDir = dir;
  this->qualifiedName = qualifiedName;
  if (!dir.empty())
    persistingFailures = true;
  return *this;
}

TestConfig &TestConfig::withDebugSession(DebugSession *session) {
  debugSession = session;
  return *this;
}

TestConfig &TestConfig::withWorkerExecutable(const std::string &path) {
  workerExecutable = path;
  return *this;
}

TestConfig &TestConfig::withOutput(std::ostream &out, std::ostream &err) {
  this->out = &out;
  this->err = &err;
  return *this;
}

std::string TestConfig::getFailureFile() const {
  return FailureStore::locate(testableName, failureDir, qualifiedName);
}

void TestConfig::persist(RunState &state) {
  if (!state.persisting)
    return;

  // Writing sorts, and the revisit loop is still walking the known list
  failure_list_t records(state.knownFailures);
  FailureStore::write(state.failureFile, state.placemarkNames, records);
}

void TestConfig::recordFailure(RunState &state, const CaseResult &result) {
  state.failures++;

  if (!state.firstError)
    state.firstError = result;
}

void TestConfig::evictOldestFix(RunState &state, int &index) {
  failure_list_t &known = state.knownFailures;

  for (;;) {
    int fixes = 0;
    int oldest = -1;
    for (int i = 0; i < (int)known.size(); i++) {
      if (!known[i].isFixed())
        continue;

      fixes++;
      if (oldest < 0 || known[i].getFixed() < known[oldest].getFixed())
        oldest = i;
    }

    if (fixes <= maxRememberedFixes || oldest < 0)
      return;

    LOG(INFO) << "Forgetting fixed failure " << known[oldest].toString();

    known.erase(known.begin() + oldest);
    if (oldest <= index)
      index--;
  }
}

void TestConfig::revisitFailures(RunState &state, CaseExecutor &executor) {
  failure_list_t &known = state.knownFailures;
  bool checkIn = !!limits.maxProgressInterval;

  for (int i = 0; i < (int)known.size() && state.failuresLeft(state.failures)
      && state.timeLeft(); i++) {
    TestFailure failure = known[i];
    bool reproducing = !failure.isFixed();

    breakpoints_t breakpoints;
    if (reproducing && debugging)
      breakpoints = failure.getBreakpoints();

    boost::shared_ptr<TestCase> testCase(new TestCase(failure.getSeed(),
        state.placemarkNames, reproducing, checkIn, breakpoints, debugSession));

    CaseResult result = executor.executeTestCase(i + 1, testCase, reproducing);

    if (result.failed()) {
      if (failure.isFixed())
        *err << "Test fix regressed: " << failure.toString() << std::endl;

      TestFailure newFailure(failure.getFailed(), ptime(not_a_date_time),
          failure.getSeed(), result.position, result.placemarks);

      if (newFailure.getPosition() != failure.getPosition()) {
        *err << "Test failed "
            << (newFailure.getPosition() > failure.getPosition() ? "later" : "earlier")
            << " than before: " << newFailure.getPosition() << " instead of "
            << failure.getPosition() << std::endl;
      } else {
        *err << "Test failure reproduced" << std::endl;
      }

      if (newFailure != failure || failure.isFixed()) {
        known[i] = newFailure;
        persist(state);
      }

      recordFailure(state, result);
    } else {
      state.successes++;

      if (!failure.isFixed()) {
        *out << "Test failure fixed" << std::endl;

        known[i].setFixed(microsec_clock::universal_time());
        evictOldestFix(state, i);
        persist(state);
      } else {
        *out << "Test failure still fixed" << std::endl;
      }
    }
  }
}

void TestConfig::executeSpecifiedCases(RunState &state, CaseExecutor &executor) {
  bool checkIn = !!limits.maxProgressInterval;

  for (failure_list_t::iterator it = specifiedCases.begin();
      it != specifiedCases.end() && state.failuresLeft(state.failures)
      && state.timeLeft(); it++) {
    state.cases++;

    breakpoints_t breakpoints;
    if (debugging)
      breakpoints = it->getBreakpoints();

    boost::shared_ptr<TestCase> testCase(new TestCase(it->getSeed(),
        state.placemarkNames, true, checkIn, breakpoints, debugSession));

    CaseResult result = executor.executeTestCase(state.cases, testCase, false);

    if (result.failed()) {
      recordFailure(state, result);

      TestFailure failure(microsec_clock::universal_time(),
          ptime(not_a_date_time), it->getSeed(), result.position,
          result.placemarks);
      if (state.persisting && std::find(state.knownFailures.begin(),
          state.knownFailures.end(), failure) == state.knownFailures.end()) {
        state.knownFailures.push_back(failure);
        persist(state);
      }
    } else {
      state.successes++;
      it->setFixed(microsec_clock::universal_time());
    }
  }
}

void TestConfig::executeLinear(RunState &state, CaseExecutor &executor) {
  bool checkIn = !!limits.maxProgressInterval;

  while (state.casesLeft(state.cases) && state.failuresLeft(state.failures)
      && state.timeLeft()) {
    state.cases++;

    boost::shared_ptr<TestCase> testCase(new TestCase(generateSeed(),
        state.placemarkNames, false, checkIn, breakpoints_t(), debugSession));

    CaseResult result = executor.executeTestCase(state.cases, testCase, false);

    if (result.failed()) {
      recordFailure(state, result);

      if (state.persisting) {
        state.knownFailures.push_back(TestFailure(microsec_clock::universal_time(),
            ptime(not_a_date_time), testCase->getSeed(), result.position,
            result.placemarks));
        persist(state);
      }
    } else {
      state.successes++;
    }
  }
}

void TestConfig::handleParallelFailure(RunState *state, const TestFailure &failure,
    const std::string &error) {
  boost::lock_guard<boost::mutex> lock(state->lock);

  if (!state->firstError) {
    CaseResult result;
    result.status = CaseFailed;
    result.message = error;
    result.position = failure.getPosition();
    result.placemarks = failure.getPlacemarks();
    state->firstError = result;
  }

  if (!state->persisting)
    return;

  state->knownFailures.push_back(failure);
  try {
    persist(*state);
  } catch (std::runtime_error &e) {
    LOG(ERROR) << "Could not record failure " << failure.toString() << ": "
        << e.what();
  }
}

void TestConfig::executeParallel(RunState &state, unsigned int workers) {
  pool::WorkerPool pool(testableName, state.placemarkNames, workers, state.start,
      limits, printProgress, printFailures, state.cases, state.successes,
      state.failures, workerExecutable, *out, *err);

  LOG(INFO) << "Running " << testableName << " on " << workers << " workers";
  pool.start();

  pool::failure_handler_t handler = boost::bind(
      &TestConfig::handleParallelFailure, this, &state, _1, _2);

  std::string reason;
  for (;;) {
    if (!state.failuresLeft(pool.getFailures())) {
      reason = boost::lexical_cast<std::string>(pool.getFailures())
          + " failures--ending test set";
      break;
    }
    if (!state.casesLeft(pool.getCases())) {
      reason = "Test set complete after "
          + boost::lexical_cast<std::string>(pool.getCases()) + " cases";
      break;
    }
    if (!state.timeLeft()) {
      reason = "Test set took longer than "
          + formatDuration(*limits.maxTotalDuration) + "--ending test set";
      break;
    }
    if (!pool.execute(handler)) {
      reason = "All workers died";
      break;
    }
  }

  pool.stop();
  *out << reason << std::endl;

  while (pool.isAlive())
    boost::this_thread::sleep(milliseconds(SEEDCHECK_POLL_INTERVAL));

  pool.shutdown();

  boost::lock_guard<boost::mutex> lock(state.lock);
  state.cases = pool.getCases();
  state.successes = pool.getSuccesses();
  state.failures = pool.getFailures();
}

TestSummary TestConfig::execute() {
  if (!TestableRegistry::getRegistry().isRegistered(testableName))
    throw ConfigurationError("Test class " + testableName + " is not registered");

  RunState state;
  state.placemarkNames = TestCase::normalizePlacemarkNames(placemarkNames);
  state.start = microsec_clock::universal_time();
  if (limits.maxTotalDuration)
    state.termination = state.start + *limits.maxTotalDuration;

  state.maxCases = maxRandomCases;
  if (maxRandomCases < 0 || (maxRandomCases == 0 && limits.maxTotalDuration))
    state.maxCases = -1;
  state.maxFailures = maxFailures <= 0 ? -1 : maxFailures;

  state.persisting = persistingFailures;
  if (revisitKnownFailures || persistingFailures) {
    state.failureFile = getFailureFile();
    state.knownFailures = FailureStore::load(state.failureFile,
        state.placemarkNames);
  }

  if (state.maxCases == 0 && specifiedCases.empty()
      && (!revisitKnownFailures || state.knownFailures.empty()))
    throw ConfigurationError(
        "No cases configured.  Use withRandomCases() or withMaxTotalDuration()");

  CaseExecutor executor(testableName, printProgress, printFailures, state.start,
      limits, debugSession, *out, *err);

  if (revisitKnownFailures)
    revisitFailures(state, executor);

  executeSpecifiedCases(state, executor);

  unsigned int workers = concurrency(boost::thread::hardware_concurrency());
  if (workers == 0)
    workers = 1;

  if (state.maxCases != 0 && state.casesLeft(state.cases)
      && state.failuresLeft(state.failures) && state.timeLeft()) {
    if (workers <= 1) {
      executeLinear(state, executor);
    } else {
      executor.close();
      executeParallel(state, workers);
    }
  }

  return TestSummary(state.successes, state.failures,
      microsec_clock::universal_time() - state.start, state.firstError);
}

}
