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

#include "seedcheck/worker/WorkerProcess.h"

#include "seedcheck/Protocols.h"
#include "seedcheck/TestCase.h"
#include "seedcheck/Testable.h"
#include "seedcheck/TimeFormat.h"

#include "llvm/Support/CommandLine.h"

#include <glog/logging.h>

#include <boost/thread/locks.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <cerrno>
#include <cstring>
#include <iostream>

#include <unistd.h>

using namespace llvm;
using namespace boost::posix_time;

namespace {

cl::opt<bool>
        WorkerMode("seedcheck-worker",
                cl::desc("Run as a worker of a parallel test set"),
                cl::init(false));

cl::opt<std::string> TesterID("tester-id",
    cl::desc("The ID prefixed to every report of this worker"));

cl::opt<std::string> TestableName("testable",
    cl::desc("The registered name of the testable to run"));

cl::opt<std::string> StartTime("start",
    cl::desc("The start time of the test set (ddMMMyyyy HHmmss.SSS)"));

cl::opt<std::string> MaxTotalDuration("max-total-duration",
    cl::desc("The time budget of the whole test set (HH:MM:SS.ffffff)"));

cl::opt<std::string> MaxCaseDuration("max-case-duration",
    cl::desc("The time budget of a single case (HH:MM:SS.ffffff)"));

cl::opt<std::string> MaxProgressInterval("max-progress-interval",
    cl::desc("The longest a case may run without a placemark (HH:MM:SS.ffffff)"));

cl::list<std::string> Placemarks("placemarks",
    cl::desc("The placemark names the testable uses"), cl::CommaSeparated);

bool parseLimit(const std::string &name, const std::string &text,
    boost::optional<time_duration> &limit) {
  if (text.empty())
    return true;

  time_duration duration;
  if (!seedcheck::parseDuration(text, duration)) {
    std::cerr << TesterID << ":Illegal " << name << ": " << text << std::endl;
    return false;
  }

  limit = duration;
  return true;
}

}

namespace seedcheck {

namespace worker {

HeartbeatMonitor::HeartbeatMonitor(const time_duration &tolerance) :
  lastBeat(0), tolerance(tolerance) {

}

void HeartbeatMonitor::beat(const ptime &now) {
  lastBeat = (now - ptime(boost::gregorian::date(1970, 1, 1))).total_microseconds();
}

bool HeartbeatMonitor::expired(const ptime &now) const {
  int64_t last = lastBeat.load();
  if (last == 0)
    return false;

  ptime beat = ptime(boost::gregorian::date(1970, 1, 1)) + microseconds(last);
  return now - beat > tolerance;
}

WorkerProcess::WorkerProcess(const std::string &testerId,
    const std::string &testableName, const ptime &originalStart,
    const ExecutionLimits &limits, const placemark_names_t &placemarkNames,
    DebugSession *debugSession, int reportFd) :
  testerId(testerId),
  placemarkNames(TestCase::normalizePlacemarkNames(placemarkNames)),
  checkIn(!!limits.maxProgressInterval), debugSession(debugSession),
  executor(testableName, false, true, originalStart, limits, debugSession),
  monitor(milliseconds(SEEDCHECK_HEARTBEAT_INTERVAL * SEEDCHECK_HEARTBEAT_TOLERANCE)),
  casePending(false), caseRunning(false), terminated(false), pendingCase(0),
  pendingSeed(0), reportFd(reportFd) {

}

WorkerProcess::~WorkerProcess() {
  {
    boost::lock_guard<boost::mutex> lock(casesMutex);
    terminated = true;
    casesCond.notify_all();
  }

  if (watchdogThread.joinable()) {
    watchdogThread.interrupt();
    watchdogThread.join();
  }

  if (caseThread.joinable())
    caseThread.join();
}

void WorkerProcess::report(const std::string &line) {
  boost::lock_guard<boost::mutex> lock(reportMutex);

  if (!writeLine(reportFd, line))
    LOG(ERROR) << "Could not write report: " << strerror(errno);
}

bool WorkerProcess::isBusy() {
  boost::lock_guard<boost::mutex> lock(casesMutex);

  return casePending || caseRunning;
}

bool WorkerProcess::queueTestCase(unsigned int caseNumber, seed_t seed) {
  boost::lock_guard<boost::mutex> lock(casesMutex);

  if (casePending || terminated)
    return false;

  pendingCase = caseNumber;
  pendingSeed = seed;
  casePending = true;
  casesCond.notify_all();

  return true;
}

void WorkerProcess::caseControl() {
  boost::unique_lock<boost::mutex> lock(casesMutex);

  for (;;) {
    while (!casePending && !terminated)
      casesCond.wait(lock);

    if (terminated)
      break;

    unsigned int caseNumber = pendingCase;
    seed_t seed = pendingSeed;
    casePending = false;
    caseRunning = true;

    lock.unlock();

    report(formatCaseStarted(testerId, caseNumber,
        microsec_clock::universal_time()));

    boost::shared_ptr<TestCase> testCase(new TestCase(seed, placemarkNames,
        false, checkIn, breakpoints_t(), debugSession));

    CaseResult result = executor.executeTestCase(caseNumber, testCase, false);

    std::string line;
    if (result.failed()) {
      line = formatCaseFailed(testerId, caseNumber,
          microsec_clock::universal_time(), result.position, placemarkNames,
          result.placemarks, result.describe());
    } else {
      line = formatCaseDone(testerId, caseNumber,
          microsec_clock::universal_time());
    }

    // Idle before the report goes out, so a stop that answers it is honored
    lock.lock();
    caseRunning = false;
    lock.unlock();

    report(line);

    lock.lock();
  }
}

void WorkerProcess::watchdogControl() {
  try {
    for (;;) {
      boost::this_thread::sleep(milliseconds(SEEDCHECK_HEARTBEAT_INTERVAL));

      if (monitor.expired(microsec_clock::universal_time())) {
        report(testerId + ":No heartbeat detected--parent process must have terminated--exiting");
        LOG(ERROR) << "Heartbeat lost. Exiting.";
        _exit(SEEDCHECK_EXIT_NO_HEARTBEAT);
      }
    }
  } catch (boost::thread_interrupted &e) {
    LOG(INFO) << "Heartbeat watchdog stopped";
  }
}

int WorkerProcess::run(std::istream &is) {
  monitor.beat(microsec_clock::universal_time());

  caseThread = boost::thread(&WorkerProcess::caseControl, this);
  watchdogThread = boost::thread(&WorkerProcess::watchdogControl, this);

  bool stopped = false;
  std::string line;

  while (std::getline(is, line)) {
    monitor.beat(microsec_clock::universal_time());

    if (!line.empty() && line[line.size() - 1] == '\r')
      line.erase(line.size() - 1);

    if (stopped || line.size() == 1) {
      stopped = true;
      if (!isBusy())
        break;
      continue;
    }

    if (line.empty())
      continue;

    unsigned int caseNumber;
    seed_t seed;
    if (!parseAssignment(line, caseNumber, seed)) {
      report(testerId + ":Illegal test case input: " + line);
      return SEEDCHECK_EXIT_BAD_INPUT;
    }

    if (!queueTestCase(caseNumber, seed))
      LOG(ERROR) << "Case " << caseNumber << " assigned while another is pending";
  }

  if (!stopped)
    LOG(INFO) << "Input closed. Exiting.";

  return 0;
}

bool WorkerProcess::isWorkerInvocation(int argc, char **argv) {
  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], SEEDCHECK_WORKER_FLAG) == 0
        || strcmp(argv[i], "-" SEEDCHECK_WORKER_FLAG) == 0)
      return true;
  }

  return false;
}

int WorkerProcess::main(int argc, char **argv) {
  cl::ParseCommandLineOptions(argc, argv, "SeedCheck worker");

  if (TesterID.empty() || TestableName.empty()) {
    std::cerr << "A worker needs both -tester-id and -testable" << std::endl;
    return SEEDCHECK_EXIT_BAD_INPUT;
  }

  ptime start = microsec_clock::universal_time();
  if (!StartTime.empty() && !parseHandshakeTime(StartTime, start)) {
    std::cerr << TesterID << ":Illegal start time: " << StartTime << std::endl;
    return SEEDCHECK_EXIT_BAD_INPUT;
  }

  ExecutionLimits limits;
  if (!parseLimit("max total duration", MaxTotalDuration, limits.maxTotalDuration)
      || !parseLimit("max case duration", MaxCaseDuration, limits.maxCaseDuration)
      || !parseLimit("max progress interval", MaxProgressInterval,
          limits.maxProgressInterval))
    return SEEDCHECK_EXIT_BAD_INPUT;

  if (!TestableRegistry::getRegistry().isRegistered(TestableName)) {
    std::cerr << TesterID << ":Test class " << TestableName << " not found"
        << std::endl;
    return SEEDCHECK_EXIT_BAD_INPUT;
  }

  placemark_names_t placemarkNames(Placemarks.begin(), Placemarks.end());

  LOG(INFO) << "Worker " << TesterID << " running " << TestableName;

  WorkerProcess process(TesterID, TestableName, start, limits, placemarkNames);

  return process.run(std::cin);
}

}

}
