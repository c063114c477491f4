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

#include "seedcheck/worker/CaseExecutor.h"

#include "seedcheck/DebugSession.h"
#include "seedcheck/StackTrace.h"
#include "seedcheck/TestCase.h"
#include "seedcheck/Testable.h"
#include "seedcheck/TimeFormat.h"

#include <glog/logging.h>

#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/locks.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <typeinfo>

using namespace boost::posix_time;

namespace seedcheck {

namespace worker {

/*
 * The state shared between an executor and its runner thread. The thread
 * keeps a reference of its own, so an abandoned runner stays valid until its
 * case body returns.
 */
class CaseRunner {
public:
  boost::mutex mutex;
  boost::condition_variable cond;
  boost::thread thread;

  boost::shared_ptr<Testable> testable;
  boost::shared_ptr<TestCase> testCase;

  bool jobPending;
  bool jobRunning;
  bool shutdown;

  ptime caseStart;
  bool failed;
  std::string message;

  CaseRunner() : jobPending(false), jobRunning(false), shutdown(false),
    failed(false) { }

  static void runLoop(boost::shared_ptr<CaseRunner> self);
};

void CaseRunner::runLoop(boost::shared_ptr<CaseRunner> self) {
  boost::unique_lock<boost::mutex> lock(self->mutex);

  for (;;) {
    while (!self->jobPending && !self->shutdown)
      self->cond.wait(lock);

    if (self->shutdown)
      break;

    boost::shared_ptr<Testable> testable = self->testable;
    boost::shared_ptr<TestCase> testCase = self->testCase;

    self->jobPending = false;
    self->jobRunning = true;
    self->caseStart = microsec_clock::universal_time();
    self->cond.notify_all();

    lock.unlock();

    bool failed = false;
    std::string message;

    try {
      testable->run(*testCase);
    } catch (CaseCancelled &e) {
      failed = true;
      message = e.what();
    } catch (std::exception &e) {
      failed = true;
      message = demangle(typeid(e).name()) + ": " + e.what();
    } catch (...) {
      failed = true;
      message = "Test case threw a non-standard exception";
    }

    lock.lock();

    self->failed = failed;
    self->message = message;
    self->jobRunning = false;
    self->testable.reset();
    self->testCase.reset();
    self->cond.notify_all();
  }
}

std::string CaseResult::describe() const {
  if (detail.empty())
    return message;

  return message + "\n" + detail;
}

CaseExecutor::CaseExecutor(const std::string &testableName, bool printProgress,
    bool printFailures, const ptime &originalStart, const ExecutionLimits &limits,
    DebugSession *debugSession, std::ostream &out, std::ostream &err) :
  testableName(testableName), printProgress(printProgress),
  printFailures(printFailures), originalStart(originalStart), limits(limits),
  debugSession(debugSession), out(out), err(err) {

  if (!this->debugSession)
    this->debugSession = &ProcessDebugSession::getDefault();
}

CaseExecutor::~CaseExecutor() {
  close();
}

void CaseExecutor::startRunner() {
  runner = boost::shared_ptr<CaseRunner>(new CaseRunner());
  runner->thread = boost::thread(&CaseRunner::runLoop, runner);
}

void CaseExecutor::abandonRunner(TestCase &testCase) {
  if (debugSession->getBreakpointCatchCount() == 0) {
    testCase.requestCancel();
  } else {
    out << "Declining to cancel test on account of breakpoint" << std::endl;
  }

  {
    boost::lock_guard<boost::mutex> lock(runner->mutex);
    runner->shutdown = true;
    runner->cond.notify_all();
  }

  LOG(WARNING) << "Abandoning the runner thread of a timed out " << testableName
      << " case";

  runner->thread.detach();
  runner.reset();
}

void CaseExecutor::close() {
  if (!runner)
    return;

  {
    boost::lock_guard<boost::mutex> lock(runner->mutex);
    runner->shutdown = true;
    runner->cond.notify_all();
  }

  runner->thread.join();
  runner.reset();
}

CaseResult CaseExecutor::executeTestCase(int caseNumber,
    boost::shared_ptr<TestCase> testCase, bool reproduction) {
  CaseResult result;

  if (printProgress) {
    if (reproduction)
      out << "Reproducing ";
    if (caseNumber > 0)
      out << "[" << caseNumber << "] ";
    out << toHex(testCase->getSeed(), true) << ": " << std::flush;
  }

  boost::shared_ptr<Testable> testable;
  try {
    testable.reset(TestableRegistry::getRegistry().create(testableName));
  } catch (std::exception &e) {
    result.status = CaseFailed;
    result.message = std::string("Could not create test instance: ") + e.what();
    printResult(caseNumber, *testCase, result);
    return result;
  }

  if (!runner)
    startRunner();

  boost::unique_lock<boost::mutex> lock(runner->mutex);

  runner->testable = testable;
  runner->testCase = testCase;
  runner->jobPending = true;
  runner->cond.notify_all();

  while (runner->jobPending)
    runner->cond.wait(lock);

  ptime caseStart = runner->caseStart;

  bool suspended = reproduction && debugSession->isDebuggerAttached();
  if (suspended)
    LOG(INFO) << "Debugger attached--timeouts suspended for this reproduction";

  unsigned long caseCatchCount = debugSession->getBreakpointCatchCount();
  bool breakpointSeen = false;

  ptime caseDeadline(not_a_date_time);
  ptime totalDeadline(not_a_date_time);
  ptime progressDeadline(not_a_date_time);
  ptime progressFloor = caseStart;

  if (!suspended) {
    if (limits.maxCaseDuration)
      caseDeadline = caseStart + *limits.maxCaseDuration;
    if (limits.maxTotalDuration)
      totalDeadline = originalStart + *limits.maxTotalDuration;
    if (limits.maxProgressInterval)
      progressDeadline = caseStart + *limits.maxProgressInterval;
  }

  std::string timeoutMessage;

  while (runner->jobRunning) {
    if (!breakpointSeen
        && debugSession->getBreakpointCatchCount() != caseCatchCount) {
      breakpointSeen = true;
      out << "Breakpoint detected--no more timeout checking for this case"
          << std::endl;
    }

    ptime wake(not_a_date_time);

    if (!suspended && !breakpointSeen) {
      ptime now = microsec_clock::universal_time();

      if (!caseDeadline.is_not_a_date_time() && now >= caseDeadline) {
        timeoutMessage = "Timeout: Test case took longer than "
            + formatDuration(*limits.maxCaseDuration);
        break;
      }

      if (!totalDeadline.is_not_a_date_time() && now >= totalDeadline) {
        timeoutMessage = "Timeout: Test set took longer than "
            + formatDuration(*limits.maxTotalDuration);
        break;
      }

      if (!progressDeadline.is_not_a_date_time() && now >= progressDeadline) {
        ptime checkIn = testCase->getLastCheckIn();

        if (checkIn.is_not_a_date_time() || checkIn <= progressFloor) {
          timeoutMessage = "Timeout: No progress in longer than "
              + formatDuration(*limits.maxProgressInterval);
          break;
        }

        progressFloor = checkIn;
        progressDeadline = checkIn + *limits.maxProgressInterval;
      }

      wake = caseDeadline;
      if (!totalDeadline.is_not_a_date_time()
          && (wake.is_not_a_date_time() || totalDeadline < wake))
        wake = totalDeadline;
      if (!progressDeadline.is_not_a_date_time()
          && (wake.is_not_a_date_time() || progressDeadline < wake))
        wake = progressDeadline;
    }

    if (wake.is_not_a_date_time())
      runner->cond.wait(lock);
    else
      runner->cond.timed_wait(lock, wake);
  }

  result.elapsed = microsec_clock::universal_time() - caseStart;
  result.position = testCase->getPosition();
  result.placemarks = testCase->getPlacemarks();

  if (!timeoutMessage.empty()) {
    result.status = CaseTimedOut;
    result.message = timeoutMessage;
    result.detail = getThreadStackTrace(runner->thread.native_handle());

    lock.unlock();
    abandonRunner(*testCase);
  } else {
    result.status = runner->failed ? CaseFailed : CaseSucceeded;
    result.message = runner->message;

    lock.unlock();
  }

  printResult(caseNumber, *testCase, result);

  return result;
}

void CaseExecutor::printResult(int caseNumber, const TestCase &testCase,
    const CaseResult &result) {
  time_duration total = microsec_clock::universal_time() - originalStart;

  if (!result.failed()) {
    if (printProgress) {
      out << "SUCCESS in " << formatDuration(result.elapsed);
      if (caseNumber > 1)
        out << " (" << formatDuration(total) << " total)";
      out << std::endl;
    }
    return;
  }

  if (printProgress)
    out << std::flush;

  if (!printFailures) {
    if (printProgress)
      out << std::endl;
    return;
  }

  if (!printProgress) {
    if (testCase.isReproducing())
      err << "Reproducing ";
    if (caseNumber > 0)
      err << "[" << caseNumber << "] ";
    err << toHex(testCase.getSeed(), true) << ": ";
  }

  err << "FAILURE@" << result.position << " in " << formatDuration(result.elapsed);
  for (placemarks_t::const_iterator it = result.placemarks.begin();
      it != result.placemarks.end(); it++) {
    err << "\n\t" << it->first << "@" << it->second;
  }
  err << "\n" << result.describe() << std::endl;
}

}

}
