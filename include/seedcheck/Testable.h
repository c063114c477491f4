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

#ifndef TESTABLE_H_
#define TESTABLE_H_

#include <boost/function.hpp>
#include <boost/thread/mutex.hpp>

#include <map>
#include <string>

namespace seedcheck {

class TestCase;

/*
 * A randomized test. One instance is created per case; run() drives the code
 * under test with values drawn from the case and throws to signal failure.
 */
class Testable {
public:
  virtual ~Testable() { }

  virtual void run(TestCase &testCase) = 0;
};

typedef boost::function<Testable* ()> testable_factory_t;

/*
 * Maps testable names to factories, so that worker processes can build the
 * testable they are told to run.
 */
class TestableRegistry {
private:
  typedef std::map<std::string, testable_factory_t> factories_t;

  mutable boost::mutex lock;
  factories_t factories;

  TestableRegistry() { }
public:
  static TestableRegistry &getRegistry();

  void registerTestable(const std::string &name, testable_factory_t factory);
  bool isRegistered(const std::string &name) const;

  // The caller owns the result. Throws std::invalid_argument for unknown names.
  Testable *create(const std::string &name) const;

  // The part of a qualified name after the last "::"
  static std::string getSimpleName(const std::string &name);
};

template<class T>
Testable *createTestable() {
  return new T();
}

template<class T>
class TestableRegistration {
public:
  explicit TestableRegistration(const char *name) {
    TestableRegistry::getRegistry().registerTestable(name, &createTestable<T>);
  }
};

}

#define SEEDCHECK_CONCAT_IMPL(a, b)  a##b
#define SEEDCHECK_CONCAT(a, b)       SEEDCHECK_CONCAT_IMPL(a, b)

#define SEEDCHECK_REGISTER_TESTABLE(Class, Name) \
  static seedcheck::TestableRegistration<Class> \
      SEEDCHECK_CONCAT(testableRegistration, __LINE__)(Name)

#endif /* TESTABLE_H_ */
