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

#ifndef DEBUGSESSION_H_
#define DEBUGSESSION_H_

#include <boost/atomic.hpp>

namespace seedcheck {

/*
 * Bookkeeping shared between test cases and the executor for hand-off to an
 * attached debugger.
 */
class DebugSession {
public:
  virtual ~DebugSession() { }

  virtual bool isDebuggerAttached() = 0;

  // Stops in the debugger if one is attached. Returns true if the stop was
  // delivered.
  virtual bool breakpoint() = 0;

  virtual unsigned long getBreakpointCatchCount() const = 0;
};

/*
 * The process-wide session. A debugger is detected through the TracerPid
 * entry of /proc/self/status, and a stop is delivered by raising the break
 * signal, which is ignored when nobody is tracing the process.
 */
class ProcessDebugSession: public DebugSession {
private:
  boost::atomic<unsigned long> catchCount;
  boost::atomic<bool> ignoreAll;

  ProcessDebugSession();
public:
  virtual ~ProcessDebugSession() { }

  virtual bool isDebuggerAttached();
  virtual bool breakpoint();

  virtual unsigned long getBreakpointCatchCount() const {
    return catchCount.load();
  }

  void setIgnoreAll(bool value) { ignoreAll = value; }
  bool isIgnoringAll() const { return ignoreAll.load(); }

  static ProcessDebugSession &getDefault();
};

void initBreakSignal();
bool breakSignal();

}

#endif /* DEBUGSESSION_H_ */
