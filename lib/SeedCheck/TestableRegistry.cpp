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

#include "seedcheck/Testable.h"

#include <glog/logging.h>

#include <boost/thread/locks.hpp>

#include <stdexcept>

namespace seedcheck {

TestableRegistry &TestableRegistry::getRegistry() {
  static TestableRegistry registry;

  return registry;
}

void TestableRegistry::registerTestable(const std::string &name,
    testable_factory_t factory) {
  boost::lock_guard<boost::mutex> guard(lock);

  if (factories.count(name) > 0)
    LOG(WARNING) << "Testable " << name << " registered more than once";

  factories[name] = factory;
}

bool TestableRegistry::isRegistered(const std::string &name) const {
  boost::lock_guard<boost::mutex> guard(lock);

  return factories.count(name) > 0;
}

Testable *TestableRegistry::create(const std::string &name) const {
  testable_factory_t factory;

  {
    boost::lock_guard<boost::mutex> guard(lock);

    factories_t::const_iterator it = factories.find(name);
    if (it == factories.end())
      throw std::invalid_argument("Test class " + name + " not found");

    factory = it->second;
  }

  return factory();
}

std::string TestableRegistry::getSimpleName(const std::string &name) {
  std::string::size_type pos = name.rfind("::");
  if (pos == std::string::npos)
    return name;

  return name.substr(pos + 2);
}

}
