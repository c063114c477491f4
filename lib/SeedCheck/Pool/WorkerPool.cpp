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

#include "seedcheck/pool/WorkerPool.h"

#include "seedcheck/RandomStream.h"
#include "seedcheck/TestCase.h"
#include "seedcheck/TimeFormat.h"

#include "llvm/Support/FileSystem.h"

#include <glog/logging.h>

#include <boost/bind.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/thread/locks.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <pthread.h>
#include <sched.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace boost::posix_time;

namespace seedcheck {

namespace pool {

namespace {

void closePipe(int fds[2]) {
  if (fds[0] >= 0)
    ::close(fds[0]);
  if (fds[1] >= 0)
    ::close(fds[1]);
}

}

WorkerPool::WorkerPool(const std::string &testableName,
    const placemark_names_t &placemarkNames, unsigned int concurrency,
    const ptime &originalStart, const worker::ExecutionLimits &limits,
    bool printProgress, bool printFailures, unsigned int cases,
    unsigned int successes, unsigned int failures,
    const std::string &workerExecutable, std::ostream &out, std::ostream &err) :
  testableName(testableName),
  placemarkNames(TestCase::normalizePlacemarkNames(placemarkNames)),
  concurrency(concurrency), workerExecutable(workerExecutable),
  originalStart(originalStart), limits(limits), printProgress(printProgress),
  printFailures(printFailures), drainTimer(service), livingWorkers(0),
  totalCases(cases), totalSuccesses(successes), totalFailures(failures),
  started(false), terminated(false), output(out, err) {

  if (this->workerExecutable.empty())
    this->workerExecutable = llvm::sys::fs::getMainExecutable("seedcheck",
        reinterpret_cast<void*>(&closePipe));
}

WorkerPool::~WorkerPool() {
  shutdown();
}

std::vector<std::string> WorkerPool::getWorkerArguments(const std::string &testerId) {
  std::vector<std::string> args;

  args.push_back(workerExecutable);
  args.push_back("-" SEEDCHECK_WORKER_FLAG);
  args.push_back("--tester-id=" + testerId);
  args.push_back("--testable=" + testableName);
  args.push_back("--start=" + formatHandshakeTime(originalStart));

  if (limits.maxTotalDuration)
    args.push_back("--max-total-duration=" + to_simple_string(*limits.maxTotalDuration));
  if (limits.maxCaseDuration)
    args.push_back("--max-case-duration=" + to_simple_string(*limits.maxCaseDuration));
  if (limits.maxProgressInterval)
    args.push_back("--max-progress-interval=" + to_simple_string(*limits.maxProgressInterval));

  args.push_back("--placemarks=" + boost::algorithm::join(placemarkNames, ","));

  return args;
}

WorkerHandle::pointer WorkerPool::launchWorker(const std::string &testerId) {
  int inPipe[2] = { -1, -1 };
  int outPipe[2] = { -1, -1 };
  int errPipe[2] = { -1, -1 };

  if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0
      || pipe2(errPipe, O_CLOEXEC) != 0) {
    PLOG(ERROR) << "Could not create pipes for worker " << testerId;
    closePipe(inPipe);
    closePipe(outPipe);
    closePipe(errPipe);
    return WorkerHandle::pointer();
  }

  // Everything the child needs is prepared before forking
  std::vector<std::string> args = getWorkerArguments(testerId);
  std::vector<char*> argv;
  for (std::vector<std::string>::iterator it = args.begin(); it != args.end(); it++)
    argv.push_back(const_cast<char*>(it->c_str()));
  argv.push_back(NULL);

  pid_t pid = fork();

  if (pid < 0) {
    PLOG(ERROR) << "Could not fork worker " << testerId;
    closePipe(inPipe);
    closePipe(outPipe);
    closePipe(errPipe);
    return WorkerHandle::pointer();
  }

  if (pid == 0) {
    // Child
    if (dup2(inPipe[0], STDIN_FILENO) < 0 || dup2(outPipe[1], STDOUT_FILENO) < 0
        || dup2(errPipe[1], STDERR_FILENO) < 0)
      _exit(127);

    execv(argv[0], &argv[0]);
    _exit(127);
  }

  ::close(inPipe[0]);
  ::close(outPipe[1]);
  ::close(errPipe[1]);

  LOG(INFO) << "Launched worker " << testerId << " (pid " << pid << ")";

  return WorkerHandle::create(service, this, testerId, pid, inPipe[1],
      outPipe[0], errPipe[0]);
}

void WorkerPool::start() {
  if (started)
    return;
  started = true;

  // Writes to a dead worker must fail instead of killing us
  signal(SIGPIPE, SIG_IGN);

  std::string poolId = toHex(generateSeed() & 0xFFFFFFFFULL);

  for (unsigned int i = 0; i < concurrency; i++) {
    std::string testerId = poolId + toHex(i);

    WorkerHandle::pointer worker = launchWorker(testerId);
    if (!worker)
      continue;

    workers.push_back(worker);
  }

  if (workers.empty())
    throw std::runtime_error("Could not launch any worker process from "
        + workerExecutable);

  {
    boost::lock_guard<boost::mutex> lock(availableMutex);
    livingWorkers = workers.size();
    available.assign(workers.begin(), workers.end());
  }

  for (workers_t::iterator it = workers.begin(); it != workers.end(); it++)
    (*it)->start();

  work.reset(new boost::asio::io_service::work(service));

  drainTimer.expires_from_now(boost::posix_time::milliseconds(SEEDCHECK_DRAIN_INTERVAL));
  drainTimer.async_wait(boost::bind(&WorkerPool::drainOutput, this,
      boost::asio::placeholders::error));

  ioThread = boost::thread(boost::bind(&boost::asio::io_service::run, &service));
  heartbeatThread = boost::thread(&WorkerPool::heartbeatControl, this);
}

void WorkerPool::heartbeatControl() {
  struct sched_param param;
  param.sched_priority = sched_get_priority_min(SCHED_RR);
  int err = pthread_setschedparam(pthread_self(), SCHED_RR, &param);
  if (err != 0)
    VLOG(1) << "Heartbeat thread runs at normal priority: " << strerror(err);

  try {
    for (;;) {
      for (workers_t::iterator it = workers.begin(); it != workers.end(); it++) {
        WorkerHandle::pointer worker = *it;

        if (worker->hasExited())
          continue;

        worker->sendHeartBeat();

        int status;
        pid_t result = waitpid(worker->getPid(), &status, WNOHANG);
        if (result == worker->getPid()) {
          worker->processExited(status);
        } else if (result < 0 && errno == ECHILD) {
          LOG(WARNING) << "Lost track of worker " << worker->getTesterId();
          worker->processExited(0);
        }
      }

      boost::this_thread::sleep(milliseconds(SEEDCHECK_HEARTBEAT_INTERVAL));
    }
  } catch (boost::thread_interrupted &e) {
    VLOG(1) << "Heartbeat thread stopped";
  }
}

void WorkerPool::drainOutput(const boost::system::error_code &error) {
  if (error)
    return;

  flushOutput();

  if (terminated)
    return;

  drainTimer.expires_from_now(boost::posix_time::milliseconds(SEEDCHECK_DRAIN_INTERVAL));
  drainTimer.async_wait(boost::bind(&WorkerPool::drainOutput, this,
      boost::asio::placeholders::error));
}

void WorkerPool::flushOutput() {
  boost::lock_guard<boost::mutex> lock(outputMutex);

  for (workers_t::iterator it = workers.begin(); it != workers.end(); it++)
    (*it)->printOutput(output);

  output.flush();
}

bool WorkerPool::execute(failure_handler_t failureHandler) {
  unsigned int caseNumber = ++totalCases;
  seed_t seed = generateSeed();

  boost::unique_lock<boost::mutex> lock(availableMutex);

  for (;;) {
    if (livingWorkers == 0)
      return false;

    if (available.empty()) {
      availableCond.timed_wait(lock, microsec_clock::universal_time()
          + milliseconds(SEEDCHECK_POLL_INTERVAL));
      continue;
    }

    WorkerHandle::pointer worker = available.front();
    available.pop_front();

    lock.unlock();
    if (worker->execute(caseNumber, seed, failureHandler))
      return true;
    lock.lock();
  }
}

void WorkerPool::stop() {
  for (workers_t::iterator it = workers.begin(); it != workers.end(); it++)
    (*it)->stop();
}

bool WorkerPool::isAlive() {
  for (workers_t::iterator it = workers.begin(); it != workers.end(); it++) {
    if (!(*it)->isDead())
      return true;
  }

  return false;
}

unsigned int WorkerPool::getLivingWorkers() {
  boost::lock_guard<boost::mutex> lock(availableMutex);

  return livingWorkers;
}

void WorkerPool::countCase(bool failed) {
  if (failed)
    totalFailures++;
  else
    totalSuccesses++;
}

void WorkerPool::makeAvailable(WorkerHandle::pointer worker) {
  boost::lock_guard<boost::mutex> lock(availableMutex);

  if (worker->isDead())
    return;

  available.push_back(worker);
  availableCond.notify_all();
}

void WorkerPool::workerDied(WorkerHandle::pointer worker) {
  boost::lock_guard<boost::mutex> lock(availableMutex);

  std::deque<WorkerHandle::pointer>::iterator it =
      std::find(available.begin(), available.end(), worker);
  if (it != available.end())
    available.erase(it);

  if (livingWorkers > 0)
    livingWorkers--;

  availableCond.notify_all();
}

void WorkerPool::shutdown() {
  if (!started || terminated)
    return;
  terminated = true;

  heartbeatThread.interrupt();
  heartbeatThread.join();

  for (workers_t::iterator it = workers.begin(); it != workers.end(); it++) {
    WorkerHandle::pointer worker = *it;
    if (worker->hasExited())
      continue;

    LOG(WARNING) << "Killing worker " << worker->getTesterId();
    if (::kill(worker->getPid(), SIGKILL) != 0)
      PLOG(WARNING) << "Could not kill worker " << worker->getTesterId();

    int status;
    if (waitpid(worker->getPid(), &status, 0) == worker->getPid())
      worker->processExited(status);
  }

  work.reset();
  service.stop();
  ioThread.join();

  flushOutput();

  for (workers_t::iterator it = workers.begin(); it != workers.end(); it++)
    (*it)->close();
}

}

}
