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

#ifndef TESTCASE_H_
#define TESTCASE_H_

#include "seedcheck/Common.h"
#include "seedcheck/RandomStream.h"

#include <boost/atomic.hpp>
#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <set>
#include <stdexcept>
#include <string>

namespace seedcheck {

class DebugSession;
class RandomAction;
template<typename T> class RandomSupplier;

typedef std::set<position_t> breakpoints_t;

// Thrown into a case body that the executor has given up on
class CaseCancelled: public std::runtime_error {
public:
  explicit CaseCancelled(const std::string &message) :
    std::runtime_error(message) { }
};

/*
 * The context handed to a testable for one case. Besides the random values,
 * it tracks named placemarks, stops at breakpoints when reproducing a failure,
 * and records check-ins for the progress watchdog.
 */
class TestCase: public RandomStream {
private:
  bool reproducing;
  bool checkingIn;

  placemark_names_t placemarkNames;
  breakpoints_t breakpoints;
  position_t nextBreak;

  DebugSession *debugSession;

  mutable boost::mutex placemarksLock;
  placemarks_t placemarks;

  boost::atomic<int64_t> lastCheckIn;
  boost::atomic<bool> cancelRequested;
protected:
  virtual void advanced(position_t oldPosition, position_t newPosition);
public:
  TestCase(seed_t seed, const placemark_names_t &names, bool reproducing = false,
      bool checkIn = false, const breakpoints_t &breakpoints = breakpoints_t(),
      DebugSession *debugSession = NULL);

  virtual ~TestCase() { }

  bool isReproducing() const { return reproducing; }
  bool isCheckingIn() const { return checkingIn; }

  const placemark_names_t &getPlacemarkNames() const { return placemarkNames; }
  const breakpoints_t &getBreakpoints() const { return breakpoints; }

  placemarks_t getPlacemarks() const;

  // The most recent position of the placemark, -1 if it was never reached
  int64_t getLastPlacemark(const std::string &name = SEEDCHECK_DEFAULT_PLACEMARK) const;

  bool hasHitBreak() const;

  // Not-a-date-time until the first check-in
  boost::posix_time::ptime getLastCheckIn() const;

  void placemark(const std::string &name = SEEDCHECK_DEFAULT_PLACEMARK);

  boost::shared_ptr<TestCase> fork();

  void requestCancel() { cancelRequested = true; }
  bool isCancelRequested() const { return cancelRequested.load(); }

  RandomAction createAction();
  RandomAction doAction(double probability, const boost::function<void ()> &action);

  template<typename T>
  RandomSupplier<T> createSupplier();

  template<typename T>
  RandomSupplier<T> supply(double probability, const boost::function<T ()> &supplier);

  static placemark_names_t normalizePlacemarkNames(const placemark_names_t &names);
};

}

#include "seedcheck/RandomAction.h"

namespace seedcheck {

template<typename T>
RandomSupplier<T> TestCase::createSupplier() {
  return RandomSupplier<T>(*this);
}

template<typename T>
RandomSupplier<T> TestCase::supply(double probability,
    const boost::function<T ()> &supplier) {
  return RandomSupplier<T>(*this).or_(probability, supplier);
}

}

#endif /* TESTCASE_H_ */
