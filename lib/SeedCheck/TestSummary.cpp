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

#include "seedcheck/TestConfig.h"
#include "seedcheck/TimeFormat.h"

#include <sstream>

namespace seedcheck {

TestSummary::TestSummary(unsigned int successes, unsigned int failures,
    const boost::posix_time::time_duration &duration,
    const boost::optional<worker::CaseResult> &firstError) :
  successes(successes), failures(failures), duration(duration),
  firstError(firstError) {

}

void TestSummary::throwErrorIfFailed() const {
  if (failures == 0)
    return;

  if (firstError)
    throw TestFailedError(firstError->describe());

  throw TestFailedError(toString());
}

void TestSummary::printResults(std::ostream &os) const {
  os << "Summary: " << toString() << std::endl;
}

std::string TestSummary::toString() const {
  std::ostringstream ss;

  if (successes == 0 && failures == 0) {
    ss << "No cases";
  } else {
    if (successes > 0)
      ss << successes << " successful case" << (successes == 1 ? "" : "s");
    if (successes > 0 && failures > 0)
      ss << ", ";
    if (failures > 0)
      ss << failures << " failed case" << (failures == 1 ? "" : "s");
  }

  ss << " in " << formatDuration(duration);

  return ss.str();
}

}
