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

#ifndef RANDOMACTION_H_
#define RANDOMACTION_H_

#include "seedcheck/TestCase.h"

#include <boost/function.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include <map>
#include <vector>
#include <string>
#include <stdexcept>

namespace seedcheck {

/*
 * Entries with relative probabilities laid end to end over [0, total). Each
 * entry owns the half-open range [start, start + probability), so a draw that
 * lands exactly on a boundary selects the later entry.
 */
template<typename Entry>
class WeightedChoice {
private:
  typedef std::map<double, unsigned int> starts_t;

  starts_t starts;
  std::vector<Entry> entries;
  double total;
public:
  WeightedChoice() : total(0) { }

  void add(double probability, const Entry &entry) {
    if (boost::math::isnan(probability) || boost::math::isinf(probability)
        || probability < 0)
      throw std::invalid_argument("Illegal probability");
    if (probability == 0)
      return;

    starts[total] = (unsigned int)entries.size();
    entries.push_back(entry);
    total += probability;
  }

  bool empty() const { return entries.empty(); }
  double getTotal() const { return total; }

  // The entry selected by a uniform draw in [0, 1)
  unsigned int select(double fraction) const {
    if (entries.empty())
      throw std::logic_error("No actions or suppliers configured");

    typename starts_t::const_iterator it = starts.upper_bound(fraction * total);
    --it;

    return it->second;
  }

  const Entry &get(unsigned int index) const { return entries[index]; }
};

class RandomAction {
private:
  TestCase &testCase;
  WeightedChoice<boost::function<void ()> > choice;
public:
  explicit RandomAction(TestCase &testCase) : testCase(testCase) { }

  RandomAction &or_(double probability, const boost::function<void ()> &action) {
    choice.add(probability, action);
    return *this;
  }

  unsigned int select(double fraction) const { return choice.select(fraction); }

  void execute(const std::string &placemark = std::string()) {
    if (choice.empty())
      throw std::logic_error("No actions configured");

    unsigned int index = choice.select(testCase.nextDouble());
    if (!placemark.empty())
      testCase.placemark(placemark);

    choice.get(index)();
  }
};

template<typename T>
class RandomSupplier {
private:
  TestCase &testCase;
  WeightedChoice<boost::function<T ()> > choice;
public:
  explicit RandomSupplier(TestCase &testCase) : testCase(testCase) { }

  RandomSupplier &or_(double probability, const boost::function<T ()> &supplier) {
    choice.add(probability, supplier);
    return *this;
  }

  unsigned int select(double fraction) const { return choice.select(fraction); }

  T get(const std::string &placemark = std::string()) {
    if (choice.empty())
      throw std::logic_error("No suppliers configured");

    unsigned int index = choice.select(testCase.nextDouble());
    if (!placemark.empty())
      testCase.placemark(placemark);

    return choice.get(index)();
  }
};

}

#endif /* RANDOMACTION_H_ */
