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

#include "seedcheck/DebugSession.h"

#include <glog/logging.h>

#include <fstream>
#include <string>
#include <cstdlib>

#include <sys/types.h>
#include <signal.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>

#define BREAK_SIGNAL  SIGUSR2

namespace seedcheck {

void initBreakSignal() {
  struct sigaction act;
  memset(&act, 0, sizeof(struct sigaction));

  act.sa_handler = SIG_IGN;
  act.sa_flags = 0;

  if (sigaction(BREAK_SIGNAL, &act, NULL) != 0) {
    LOG(ERROR) << "Could not install the break signal handler: " << strerror(errno);
  }
}

bool breakSignal() {
  if (kill(getpid(), BREAK_SIGNAL) != 0) {
    LOG(ERROR) << "Could not raise the break signal: " << strerror(errno);
    return false;
  }

  return true;
}

ProcessDebugSession::ProcessDebugSession() :
  catchCount(0), ignoreAll(false) {
  initBreakSignal();
}

bool ProcessDebugSession::isDebuggerAttached() {
  std::ifstream status("/proc/self/status");
  std::string line;

  while (std::getline(status, line)) {
    if (line.compare(0, 10, "TracerPid:") != 0)
      continue;

    return strtol(line.c_str() + 10, NULL, 10) != 0;
  }

  return false;
}

bool ProcessDebugSession::breakpoint() {
  if (ignoreAll)
    return false;

  if (!isDebuggerAttached()) {
    LOG(WARNING) << "Breakpoint requested, but no debugger is attached--ignoring further breakpoints";
    ignoreAll = true;
    return false;
  }

  if (!breakSignal())
    return false;

  catchCount++;
  return true;
}

ProcessDebugSession &ProcessDebugSession::getDefault() {
  static ProcessDebugSession session;

  return session;
}

}
