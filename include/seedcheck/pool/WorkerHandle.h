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

#ifndef WORKERHANDLE_H_
#define WORKERHANDLE_H_

#include "seedcheck/Common.h"
#include "seedcheck/Protocols.h"
#include "seedcheck/TestFailure.h"

#include <boost/asio.hpp>
#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <deque>
#include <ostream>
#include <string>

#include <sys/types.h>

namespace seedcheck {

namespace pool {

class WorkerPool;

typedef boost::function<void (const TestFailure&, const std::string&)> failure_handler_t;

struct MessageLine {
  bool error;
  std::string text;

  MessageLine(bool error, const std::string &text) : error(error), text(text) { }
};

/*
 * Batches relayed output, so that lines from several workers are not
 * interleaved character by character. The batch is written out when asked,
 * when it grows too large, or when it switches between stdout and stderr.
 */
class AccumulatedOutput {
private:
  std::ostream &out;
  std::ostream &err;

  std::string buffer;
  bool error;
public:
  AccumulatedOutput(std::ostream &out, std::ostream &err) :
    out(out), err(err), error(false) { }

  void append(bool error, const std::string &line);
  void flush();
};

/*
 * The pool's end of one worker process.
 */
class WorkerHandle: public boost::enable_shared_from_this<WorkerHandle> {
private:
  WorkerPool *pool;

  std::string testerId;
  std::string reportPrefix;
  pid_t pid;

  int inputFd;
  boost::asio::posix::stream_descriptor outStream;
  boost::asio::posix::stream_descriptor errStream;

  AsyncLineReader outReader;
  AsyncLineReader errReader;

  boost::mutex stateMutex;
  int testCase;
  seed_t seed;
  boost::posix_time::ptime caseStart;
  failure_handler_t failureHandler;

  bool stopped;
  bool unusable;
  bool exited;
  bool outClosed;
  bool errClosed;
  bool dead;

  boost::mutex writeMutex;

  boost::mutex messagesMutex;
  std::deque<MessageLine> messages;

  WorkerHandle(boost::asio::io_service &service, WorkerPool *pool,
      const std::string &testerId, pid_t pid, int inputFd, int outputFd,
      int errorFd);

  void handleLineReceived(bool error, const std::string &line,
      const boost::system::error_code &ec);

  void processWorkerReport(const std::string &report, const std::string &line);
  void endTestCase(const WorkerReport &report);

  bool sendLine(const std::string &line);
  void markUnusable();
  void checkDeath();
public:
  typedef boost::shared_ptr<WorkerHandle> pointer;

  static pointer create(boost::asio::io_service &service, WorkerPool *pool,
      const std::string &testerId, pid_t pid, int inputFd, int outputFd,
      int errorFd) {
    return pointer(new WorkerHandle(service, pool, testerId, pid, inputFd,
        outputFd, errorFd));
  }

  virtual ~WorkerHandle();

  void start();
  void close();

  const std::string &getTesterId() const { return testerId; }
  pid_t getPid() const { return pid; }

  bool execute(unsigned int caseNumber, seed_t seed,
      failure_handler_t failureHandler);
  void stop();

  bool sendHeartBeat();
  void processExited(int status);

  bool hasExited();
  bool isDead();

  void addMessage(bool error, const std::string &text);
  void printOutput(AccumulatedOutput &output);
};

}

}

#endif /* WORKERHANDLE_H_ */
