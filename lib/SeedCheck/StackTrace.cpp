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

#include "seedcheck/StackTrace.h"

#include <glog/logging.h>

#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/thread.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <dlfcn.h>
#include <cxxabi.h>
#include <execinfo.h>
#include <signal.h>

#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <cerrno>

#define STACK_SIGNAL    SIGUSR1
#define MAX_FRAMES      256
#define CAPTURE_WAIT    1000    // milliseconds

namespace seedcheck {

namespace {

struct RemoteCapture {
  void *frames[MAX_FRAMES];
  volatile int depth;
  volatile sig_atomic_t done;
};

RemoteCapture capture;
boost::mutex captureLock;
bool handlerInstalled = false;

void captureHandler(int signal) {
  capture.depth = backtrace(capture.frames, MAX_FRAMES);
  capture.done = 1;
}

std::string symbolize(void **frames, int startingFrom, int depth) {
  char lineBuffer[512];
  std::string result;

  for (int i = startingFrom; i < depth; ++i) {
    Dl_info dlinfo;
    memset(&dlinfo, 0, sizeof(dlinfo));
    dladdr(frames[i], &dlinfo);

    snprintf(lineBuffer, sizeof(lineBuffer), "\tat #%-3d", i - startingFrom);
    result.append(lineBuffer);

    if (dlinfo.dli_sname != NULL) {
      int res;
      char* d = abi::__cxa_demangle(dlinfo.dli_sname, NULL, NULL, &res);

      snprintf(lineBuffer, sizeof(lineBuffer), " %s + %ld",
          (d == NULL) ? dlinfo.dli_sname : d,
          (long)((char*) frames[i] - (char*) dlinfo.dli_saddr));
      result.append(lineBuffer);

      free(d);
    } else {
      snprintf(lineBuffer, sizeof(lineBuffer), " %p", frames[i]);
      result.append(lineBuffer);
    }

    if (dlinfo.dli_fname != NULL) {
      const char *name = strrchr(dlinfo.dli_fname, '/');
      result.append(" (");
      result.append(name ? name + 1 : dlinfo.dli_fname);
      result.append(")");
    }

    result.push_back('\n');
  }

  return result;
}

}

std::string demangle(const char *symbol) {
  int res;
  char* d = abi::__cxa_demangle(symbol, NULL, NULL, &res);
  if (d == NULL)
    return std::string(symbol);

  std::string result(d);
  free(d);

  return result;
}

std::string getStackTrace(int startingFrom, int maxDepth) {
  void *frames[MAX_FRAMES];

  int depth = backtrace(frames, MAX_FRAMES);

  // Skip this function
  startingFrom++;
  if (depth > startingFrom + maxDepth)
    depth = startingFrom + maxDepth;

  return symbolize(frames, startingFrom, depth);
}

std::string getThreadStackTrace(pthread_t thread, int maxDepth) {
  boost::lock_guard<boost::mutex> lock(captureLock);

  // The handler stays installed, since a late answer may still arrive
  if (!handlerInstalled) {
    struct sigaction act;
    memset(&act, 0, sizeof(struct sigaction));
    act.sa_handler = captureHandler;
    act.sa_flags = SA_RESTART;
    sigemptyset(&act.sa_mask);

    if (sigaction(STACK_SIGNAL, &act, NULL) != 0) {
      LOG(ERROR) << "Could not install the stack capture handler: " << strerror(errno);
      return "\t<stack trace unavailable>\n";
    }
    handlerInstalled = true;
  }

  capture.depth = 0;
  capture.done = 0;

  std::string result;

  int err = pthread_kill(thread, STACK_SIGNAL);
  if (err != 0) {
    LOG(WARNING) << "Could not signal thread for its stack trace: " << strerror(err);
  } else {
    for (int waited = 0; !capture.done && waited < CAPTURE_WAIT; waited++)
      boost::this_thread::sleep(boost::posix_time::milliseconds(1));
  }

  if (capture.done) {
    int depth = capture.depth;
    // Skip the handler and the signal trampoline
    int startingFrom = 2;
    if (depth > startingFrom + maxDepth)
      depth = startingFrom + maxDepth;

    result = symbolize(capture.frames, startingFrom, depth);
  } else {
    result = "\t<stack trace unavailable>\n";
  }

  return result;
}

}
