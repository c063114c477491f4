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

#ifndef TESTFAILURE_H_
#define TESTFAILURE_H_

#include "seedcheck/Common.h"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace seedcheck {

/*
 * A failing case, identified by its seed, the position it failed at and the
 * positions of its placemarks. The timestamps are bookkeeping and do not take
 * part in comparisons.
 */
class TestFailure {
private:
  boost::posix_time::ptime failed;
  boost::posix_time::ptime fixed;

  seed_t seed;
  position_t position;
  placemarks_t placemarks;
public:
  TestFailure(const boost::posix_time::ptime &failed,
      const boost::posix_time::ptime &fixed, seed_t seed, position_t position,
      const placemarks_t &placemarks);

  // Placemark positions below zero mean "never reached" and are dropped
  TestFailure(const boost::posix_time::ptime &failed,
      const boost::posix_time::ptime &fixed, seed_t seed, position_t position,
      const std::map<std::string, int64_t> &placemarks);

  const boost::posix_time::ptime &getFailed() const { return failed; }
  const boost::posix_time::ptime &getFixed() const { return fixed; }
  bool isFixed() const { return !fixed.is_not_a_date_time(); }

  void setFixed(const boost::posix_time::ptime &time) { fixed = time; }

  seed_t getSeed() const { return seed; }
  position_t getPosition() const { return position; }
  const placemarks_t &getPlacemarks() const { return placemarks; }

  std::set<position_t> getBreakpoints() const;

  bool operator==(const TestFailure &other) const {
    return seed == other.seed && position == other.position
        && placemarks == other.placemarks;
  }

  bool operator!=(const TestFailure &other) const {
    return !(*this == other);
  }

  bool operator<(const TestFailure &other) const {
    return position < other.position;
  }

  std::string toString() const;
};

typedef std::vector<TestFailure> failure_list_t;

}

#endif /* TESTFAILURE_H_ */
