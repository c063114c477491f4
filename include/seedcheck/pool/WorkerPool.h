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

#ifndef WORKERPOOL_H_
#define WORKERPOOL_H_

#include "seedcheck/Common.h"
#include "seedcheck/pool/WorkerHandle.h"
#include "seedcheck/worker/CaseExecutor.h"

#include <boost/asio.hpp>
#include <boost/atomic.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <deque>
#include <iostream>
#include <string>
#include <vector>

namespace seedcheck {

namespace pool {

/*
 * Runs fresh cases of one testable on a set of worker processes. Each worker
 * is the worker executable launched in worker mode; the pool feeds it cases
 * and heartbeats over its stdin and reads its reports from stderr.
 */
class WorkerPool {
private:
  typedef std::vector<WorkerHandle::pointer> workers_t;

  std::string testableName;
  placemark_names_t placemarkNames;
  unsigned int concurrency;
  std::string workerExecutable;

  boost::posix_time::ptime originalStart;
  worker::ExecutionLimits limits;

  bool printProgress;
  bool printFailures;

  boost::asio::io_service service;
  boost::scoped_ptr<boost::asio::io_service::work> work;
  boost::asio::deadline_timer drainTimer;

  boost::thread ioThread;
  boost::thread heartbeatThread;

  workers_t workers;

  boost::mutex availableMutex;
  boost::condition_variable availableCond;
  std::deque<WorkerHandle::pointer> available;
  unsigned int livingWorkers;

  boost::atomic<unsigned int> totalCases;
  boost::atomic<unsigned int> totalSuccesses;
  boost::atomic<unsigned int> totalFailures;

  bool started;
  boost::atomic<bool> terminated;

  boost::mutex outputMutex;
  AccumulatedOutput output;

  WorkerHandle::pointer launchWorker(const std::string &testerId);
  std::vector<std::string> getWorkerArguments(const std::string &testerId);

  void heartbeatControl();
  void drainOutput(const boost::system::error_code &error);
  void flushOutput();
public:
  WorkerPool(const std::string &testableName,
      const placemark_names_t &placemarkNames, unsigned int concurrency,
      const boost::posix_time::ptime &originalStart,
      const worker::ExecutionLimits &limits, bool printProgress,
      bool printFailures, unsigned int cases = 0, unsigned int successes = 0,
      unsigned int failures = 0,
      const std::string &workerExecutable = std::string(),
      std::ostream &out = std::cout, std::ostream &err = std::cerr);
  virtual ~WorkerPool();

  // Launches the workers. Throws std::runtime_error if none could be started.
  void start();

  // Assigns a fresh case to the next idle worker. Returns false once every
  // worker has died.
  bool execute(failure_handler_t failureHandler);

  void stop();
  bool isAlive();
  void shutdown();

  unsigned int getCases() const { return totalCases.load(); }
  unsigned int getSuccesses() const { return totalSuccesses.load(); }
  unsigned int getFailures() const { return totalFailures.load(); }
  unsigned int getLivingWorkers();

  const placemark_names_t &getPlacemarkNames() const { return placemarkNames; }
  const boost::posix_time::ptime &getOriginalStart() const { return originalStart; }
  bool isPrintingProgress() const { return printProgress; }
  bool isPrintingFailures() const { return printFailures; }

  void countCase(bool failed);
  void makeAvailable(WorkerHandle::pointer worker);
  void workerDied(WorkerHandle::pointer worker);
};

}

}

#endif /* WORKERPOOL_H_ */
