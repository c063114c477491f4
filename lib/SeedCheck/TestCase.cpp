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

#include "seedcheck/TestCase.h"
#include "seedcheck/DebugSession.h"

#include <glog/logging.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/locks.hpp>

#include <limits>
#include <sstream>

using namespace boost::posix_time;

namespace seedcheck {

namespace {

const position_t NoBreak = std::numeric_limits<position_t>::max();

const ptime Epoch(boost::gregorian::date(1970, 1, 1));

int64_t nowMicros() {
  return (microsec_clock::universal_time() - Epoch).total_microseconds();
}

}

TestCase::TestCase(seed_t seed, const placemark_names_t &names, bool reproducing,
    bool checkIn, const breakpoints_t &breakpoints, DebugSession *debugSession) :
  RandomStream(seed), reproducing(reproducing), checkingIn(checkIn),
  placemarkNames(normalizePlacemarkNames(names)), breakpoints(breakpoints),
  nextBreak(NoBreak), debugSession(debugSession), lastCheckIn(0),
  cancelRequested(false) {

  if (!this->debugSession)
    this->debugSession = &ProcessDebugSession::getDefault();

  if (!this->breakpoints.empty())
    nextBreak = *this->breakpoints.begin();
}

placemark_names_t TestCase::normalizePlacemarkNames(const placemark_names_t &names) {
  placemark_names_t result(names);
  result.insert(SEEDCHECK_DEFAULT_PLACEMARK);

  return result;
}

void TestCase::advanced(position_t oldPosition, position_t newPosition) {
  if (cancelRequested) {
    std::ostringstream ss;
    ss << "Test case " << std::hex << std::uppercase << getSeed()
        << " was cancelled at position " << std::dec << oldPosition;
    throw CaseCancelled(ss.str());
  }

  if (newPosition < nextBreak)
    return;

  LOG(INFO) << "Breakpoint at position " << nextBreak << " reached";
  debugSession->breakpoint();

  breakpoints_t::const_iterator it = breakpoints.upper_bound(nextBreak);
  nextBreak = (it == breakpoints.end()) ? NoBreak : *it;
}

placemarks_t TestCase::getPlacemarks() const {
  boost::lock_guard<boost::mutex> lock(placemarksLock);

  return placemarks;
}

int64_t TestCase::getLastPlacemark(const std::string &name) const {
  boost::lock_guard<boost::mutex> lock(placemarksLock);

  placemarks_t::const_iterator it = placemarks.find(name);
  if (it == placemarks.end())
    return -1;

  return (int64_t)it->second;
}

bool TestCase::hasHitBreak() const {
  return !breakpoints.empty() && getPosition() >= *breakpoints.begin();
}

ptime TestCase::getLastCheckIn() const {
  int64_t micros = lastCheckIn.load();
  if (micros == 0)
    return ptime(not_a_date_time);

  return Epoch + microseconds(micros);
}

void TestCase::placemark(const std::string &name) {
  if (placemarkNames.count(name) == 0)
    throw std::invalid_argument("Unrecognized placemark name: " + name);

  if (checkingIn)
    lastCheckIn = nowMicros();

  nextBoolean();

  boost::lock_guard<boost::mutex> lock(placemarksLock);
  placemarks[name] = getPosition();
}

boost::shared_ptr<TestCase> TestCase::fork() {
  seed_t childSeed = (seed_t)nextLong();

  return boost::shared_ptr<TestCase>(new TestCase(childSeed, placemarkNames,
      reproducing, checkingIn, breakpoints, debugSession));
}

RandomAction TestCase::createAction() {
  return RandomAction(*this);
}

RandomAction TestCase::doAction(double probability,
    const boost::function<void ()> &action) {
  return RandomAction(*this).or_(probability, action);
}

}
