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

#ifndef HARNESSTESTABLES_H_
#define HARNESSTESTABLES_H_

#include "seedcheck/Common.h"
#include "seedcheck/DebugSession.h"

#include <boost/atomic.hpp>

#include <string>

namespace harness {

// Seed on which FailsAt42 fails, at position 42
const seedcheck::seed_t BrokenSeed = 0xABC;

// FailsAt42 sets its "Placemark" at this position
const seedcheck::position_t BrokenPlacemark = 41;
const seedcheck::position_t BrokenPosition = 42;

// EvenSeedFails fails here, after its "Step" placemark
const seedcheck::position_t EvenFailurePosition = 13;

// Fixable fails while this is set
extern boost::atomic<bool> FixableBroken;

class FakeDebugSession: public seedcheck::DebugSession {
private:
  bool attached;
  unsigned long hits;
public:
  explicit FakeDebugSession(bool attached) : attached(attached), hits(0) { }

  virtual bool isDebuggerAttached() { return attached; }

  virtual bool breakpoint() {
    hits++;
    return true;
  }

  virtual unsigned long getBreakpointCatchCount() const { return hits; }
};

// A scratch directory removed with its contents on destruction
class TempDir {
private:
  std::string path;
public:
  TempDir();
  ~TempDir();

  const std::string &getPath() const { return path; }
  std::string file(const std::string &name) const;
};

}

#endif /* HARNESSTESTABLES_H_ */
