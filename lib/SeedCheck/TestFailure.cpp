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

#include "seedcheck/TestFailure.h"
#include "seedcheck/TimeFormat.h"

#include <sstream>

namespace seedcheck {

TestFailure::TestFailure(const boost::posix_time::ptime &failed,
    const boost::posix_time::ptime &fixed, seed_t seed, position_t position,
    const placemarks_t &placemarks) :
  failed(failed), fixed(fixed), seed(seed), position(position),
  placemarks(placemarks) {

}

TestFailure::TestFailure(const boost::posix_time::ptime &failed,
    const boost::posix_time::ptime &fixed, seed_t seed, position_t position,
    const std::map<std::string, int64_t> &placemarks) :
  failed(failed), fixed(fixed), seed(seed), position(position) {

  for (std::map<std::string, int64_t>::const_iterator it = placemarks.begin();
      it != placemarks.end(); it++) {
    if (it->second >= 0)
      this->placemarks[it->first] = (position_t)it->second;
  }
}

std::set<position_t> TestFailure::getBreakpoints() const {
  std::set<position_t> result;

  for (placemarks_t::const_iterator it = placemarks.begin();
      it != placemarks.end(); it++) {
    result.insert(it->second);
  }

  if (position > 0)
    result.insert(position);

  return result;
}

std::string TestFailure::toString() const {
  std::ostringstream ss;

  ss << toHex(seed) << "@" << position;
  for (placemarks_t::const_iterator it = placemarks.begin();
      it != placemarks.end(); it++) {
    ss << " " << it->first << ": " << it->second;
  }

  return ss.str();
}

}
