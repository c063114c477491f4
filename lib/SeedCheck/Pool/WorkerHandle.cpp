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

#include "seedcheck/pool/WorkerHandle.h"
#include "seedcheck/pool/WorkerPool.h"

#include "seedcheck/TimeFormat.h"

#include <glog/logging.h>

#include <boost/bind.hpp>
#include <boost/thread/locks.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <sstream>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace boost::posix_time;

namespace seedcheck {

namespace pool {

void AccumulatedOutput::append(bool error, const std::string &line) {
  if (!buffer.empty() && error != this->error)
    flush();

  this->error = error;
  buffer.append(line);
  buffer.push_back('\n');

  if (buffer.size() >= SEEDCHECK_OUTPUT_FLUSH_LIMIT)
    flush();
}

void AccumulatedOutput::flush() {
  if (buffer.empty())
    return;

  std::ostream &os = error ? err : out;
  os << buffer << std::flush;
  buffer.clear();
}

WorkerHandle::WorkerHandle(boost::asio::io_service &service, WorkerPool *pool,
    const std::string &testerId, pid_t pid, int inputFd, int outputFd,
    int errorFd) :
  pool(pool), testerId(testerId), reportPrefix(testerId + ":"), pid(pid),
  inputFd(inputFd), outStream(service, outputFd), errStream(service, errorFd),
  outReader(outStream), errReader(errStream), testCase(-1), seed(0),
  stopped(false), unusable(false), exited(false), outClosed(false),
  errClosed(false), dead(false) {

}

WorkerHandle::~WorkerHandle() {
  close();
}

void WorkerHandle::start() {
  outReader.recvLine(boost::bind(&WorkerHandle::handleLineReceived,
      shared_from_this(), false, _1, _2));
  errReader.recvLine(boost::bind(&WorkerHandle::handleLineReceived,
      shared_from_this(), true, _1, _2));
}

void WorkerHandle::close() {
  boost::system::error_code ec;

  {
    boost::lock_guard<boost::mutex> lock(writeMutex);
    if (inputFd >= 0) {
      ::close(inputFd);
      inputFd = -1;
    }
  }

  outStream.close(ec);
  errStream.close(ec);
}

void WorkerHandle::handleLineReceived(bool error, const std::string &line,
    const boost::system::error_code &ec) {
  if (ec) {
    if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted)
      LOG(WARNING) << "Error reading from worker " << testerId << ": " << ec.message();

    {
      boost::lock_guard<boost::mutex> lock(stateMutex);
      if (error)
        errClosed = true;
      else
        outClosed = true;
    }

    checkDeath();
    return;
  }

  std::string text(line);
  if (!text.empty() && text[text.size() - 1] == '\r')
    text.erase(text.size() - 1);

  if (error && text.compare(0, reportPrefix.size(), reportPrefix) == 0)
    processWorkerReport(text.substr(reportPrefix.size()), text);
  else
    addMessage(error, text);

  AsyncLineReader &reader = error ? errReader : outReader;
  reader.recvLine(boost::bind(&WorkerHandle::handleLineReceived,
      shared_from_this(), error, _1, _2));
}

void WorkerHandle::processWorkerReport(const std::string &report,
    const std::string &line) {
  WorkerReport result;
  std::string error;

  if (!parseWorkerReport(report, pool->getPlacemarkNames(), result, error)) {
    VLOG(1) << "Worker " << testerId << ": " << error;
    addMessage(true, line);
    return;
  }

  if (result.timestamp.is_not_a_date_time()) {
    LOG(WARNING) << "Bad timestamp in report from worker " << testerId << ": " << line;
    result.timestamp = microsec_clock::universal_time();
  }

  {
    boost::lock_guard<boost::mutex> lock(stateMutex);

    if ((int)result.caseNumber != testCase) {
      std::ostringstream ss;
      ss << "Worker " << testerId << " reported on case " << result.caseNumber
          << ", but is running ";
      if (testCase < 0)
        ss << "no case";
      else
        ss << "case " << testCase;

      LOG(WARNING) << ss.str();
      addMessage(true, line);
      return;
    }
  }

  if (result.kind != WorkerReport::CaseStarted)
    endTestCase(result);
}

void WorkerHandle::endTestCase(const WorkerReport &report) {
  unsigned int caseNumber;
  seed_t caseSeed;
  ptime start;
  failure_handler_t handler;

  {
    boost::lock_guard<boost::mutex> lock(stateMutex);

    caseNumber = (unsigned int)testCase;
    caseSeed = seed;
    start = caseStart;
    handler = failureHandler;

    testCase = -1;
    failureHandler.clear();
  }

  bool failed = report.kind == WorkerReport::CaseFailed;
  pool->countCase(failed);

  time_duration total = microsec_clock::universal_time() - pool->getOriginalStart();
  std::ostringstream ss;
  ss << caseNumber << ": " << (failed ? "Failed" : "Succeeded") << " at "
      << formatClockTime(report.timestamp) << " ("
      << formatDuration(report.timestamp - start) << ", "
      << formatDuration(total) << " total)";

  if (failed) {
    ss << ", position=" << report.position;
    if (pool->isPrintingFailures() || pool->isPrintingProgress())
      addMessage(true, ss.str());

    TestFailure failure(report.timestamp, ptime(not_a_date_time), caseSeed,
        report.position, report.placemarks);
    if (handler)
      handler(failure, report.detail);
  } else if (pool->isPrintingProgress()) {
    addMessage(false, ss.str());
  }

  pool->makeAvailable(shared_from_this());
}

bool WorkerHandle::sendLine(const std::string &line) {
  boost::lock_guard<boost::mutex> lock(writeMutex);

  if (inputFd < 0)
    return false;

  return writeLine(inputFd, line);
}

void WorkerHandle::markUnusable() {
  {
    boost::lock_guard<boost::mutex> lock(stateMutex);
    if (unusable)
      return;
    unusable = true;
  }

  LOG(WARNING) << "Could not write to worker " << testerId << "--killing it";

  if (::kill(pid, SIGKILL) != 0)
    PLOG(WARNING) << "Could not kill worker " << testerId;
}

void WorkerHandle::checkDeath() {
  int lostCase = -1;
  seed_t lostSeed = 0;
  failure_handler_t handler;

  {
    boost::lock_guard<boost::mutex> lock(stateMutex);

    if (dead || !exited || !outClosed || !errClosed)
      return;

    dead = true;

    if (testCase >= 0) {
      lostCase = testCase;
      lostSeed = seed;
      handler = failureHandler;

      testCase = -1;
      failureHandler.clear();
    }
  }

  LOG(INFO) << "Worker " << testerId << " is gone";

  if (lostCase >= 0) {
    std::ostringstream ss;
    ss << "Worker process died while executing case " << lostCase;

    pool->countCase(true);
    addMessage(true, ss.str());

    TestFailure failure(microsec_clock::universal_time(), ptime(not_a_date_time),
        lostSeed, 0, placemarks_t());
    if (handler)
      handler(failure, ss.str());
  }

  pool->workerDied(shared_from_this());
}

bool WorkerHandle::execute(unsigned int caseNumber, seed_t seed,
    failure_handler_t failureHandler) {
  {
    boost::lock_guard<boost::mutex> lock(stateMutex);

    if (dead || unusable || stopped || testCase >= 0)
      return false;

    testCase = (int)caseNumber;
    this->seed = seed;
    this->failureHandler = failureHandler;
    caseStart = microsec_clock::universal_time();
  }

  if (pool->isPrintingProgress()) {
    std::ostringstream ss;
    ss << caseNumber << ": " << toHex(seed, true) << ": Executing at "
        << formatClockTime(microsec_clock::universal_time());
    addMessage(false, ss.str());
  }

  // A worker that cannot take the case dies with it assigned, which reports
  // the case as failed
  if (!sendLine(formatAssignment(caseNumber, seed)))
    markUnusable();

  return true;
}

void WorkerHandle::stop() {
  boost::lock_guard<boost::mutex> lock(stateMutex);

  stopped = true;
}

bool WorkerHandle::sendHeartBeat() {
  bool stop;
  {
    boost::lock_guard<boost::mutex> lock(stateMutex);
    if (unusable || exited)
      return false;
    stop = stopped;
  }

  if (!sendLine(stop ? "X" : "")) {
    markUnusable();
    return false;
  }

  return true;
}

void WorkerHandle::processExited(int status) {
  {
    boost::lock_guard<boost::mutex> lock(stateMutex);
    if (exited)
      return;
    exited = true;
  }

  if (WIFEXITED(status)) {
    LOG(INFO) << "Worker " << testerId << " exited with status " << WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    LOG(WARNING) << "Worker " << testerId << " was killed by signal " << WTERMSIG(status);
  }

  checkDeath();
}

bool WorkerHandle::hasExited() {
  boost::lock_guard<boost::mutex> lock(stateMutex);

  return exited;
}

bool WorkerHandle::isDead() {
  boost::lock_guard<boost::mutex> lock(stateMutex);

  return dead;
}

void WorkerHandle::addMessage(bool error, const std::string &text) {
  boost::lock_guard<boost::mutex> lock(messagesMutex);

  messages.push_back(MessageLine(error, text));
}

void WorkerHandle::printOutput(AccumulatedOutput &output) {
  std::deque<MessageLine> pending;

  {
    boost::lock_guard<boost::mutex> lock(messagesMutex);
    pending.swap(messages);
  }

  for (std::deque<MessageLine>::iterator it = pending.begin();
      it != pending.end(); it++) {
    output.append(it->error, it->text);
  }
}

}

}
