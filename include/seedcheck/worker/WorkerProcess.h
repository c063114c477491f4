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

#ifndef WORKERPROCESS_H_
#define WORKERPROCESS_H_

#include "seedcheck/Common.h"
#include "seedcheck/worker/CaseExecutor.h"

#include <boost/atomic.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <istream>
#include <string>

namespace seedcheck {

class DebugSession;

namespace worker {

class HeartbeatMonitor {
private:
  boost::atomic<int64_t> lastBeat;    // microseconds since the epoch
  boost::posix_time::time_duration tolerance;
public:
  explicit HeartbeatMonitor(const boost::posix_time::time_duration &tolerance);

  void beat(const boost::posix_time::ptime &now);
  bool expired(const boost::posix_time::ptime &now) const;
};

/*
 * The worker side of the pool protocol. Reads assignments and heartbeats on
 * stdin, runs the assigned cases one at a time and reports on stderr.
 */
class WorkerProcess {
private:
  std::string testerId;
  placemark_names_t placemarkNames;
  bool checkIn;
  DebugSession *debugSession;

  CaseExecutor executor;
  HeartbeatMonitor monitor;

  boost::mutex casesMutex;
  boost::condition_variable casesCond;
  bool casePending;
  bool caseRunning;
  bool terminated;
  unsigned int pendingCase;
  seed_t pendingSeed;

  boost::thread caseThread;
  boost::thread watchdogThread;

  int reportFd;
  boost::mutex reportMutex;

  void caseControl();
  void watchdogControl();

  bool isBusy();
  void report(const std::string &line);
public:
  WorkerProcess(const std::string &testerId, const std::string &testableName,
      const boost::posix_time::ptime &originalStart,
      const ExecutionLimits &limits, const placemark_names_t &placemarkNames,
      DebugSession *debugSession = NULL, int reportFd = 2);
  virtual ~WorkerProcess();

  // Serves the protocol until stopped or until stdin closes. Returns the
  // process exit status.
  int run(std::istream &is);

  bool queueTestCase(unsigned int caseNumber, seed_t seed);

  static bool isWorkerInvocation(int argc, char **argv);

  // Entry point of worker executables, called after logging is initialized
  static int main(int argc, char **argv);
};

}

}

#endif /* WORKERPROCESS_H_ */
