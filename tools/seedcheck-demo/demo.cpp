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
#include "seedcheck/TestCase.h"
#include "seedcheck/Testable.h"
#include "seedcheck/TimeFormat.h"
#include "seedcheck/worker/WorkerProcess.h"

#include "RingBuffer.h"

#include "llvm/Support/CommandLine.h"

#include <glog/logging.h>

#include <boost/bind.hpp>

#include <deque>
#include <sstream>
#include <string>

using namespace llvm;
using namespace seedcheck;

namespace {

cl::opt<std::string> Target("target",
    cl::desc("The testable to run (demo::RingBufferTest or demo::BrokenRingBufferTest)"),
    cl::init("demo::RingBufferTest"));

cl::opt<int> RandomCases("random-cases",
    cl::desc("Number of fresh random cases, negative for no limit"), cl::init(100));

cl::opt<int> MaxFailures("max-failures",
    cl::desc("Stop after this many failures, 0 for no limit"), cl::init(1));

cl::opt<unsigned> Concurrency("concurrency",
    cl::desc("Number of worker processes for fresh cases"), cl::init(1));

cl::opt<std::string> MaxTime("max-time",
    cl::desc("Time budget of the whole test set (HH:MM:SS)"));

cl::opt<std::string> MaxCaseTime("max-case-time",
    cl::desc("Time budget of a single case (HH:MM:SS)"));

cl::opt<std::string> MaxProgress("max-progress",
    cl::desc("Longest a case may go without a placemark (HH:MM:SS)"));

cl::opt<bool> DebugReproduce("debug-reproduce",
    cl::desc("Stop at the recorded positions when reproducing known failures"),
    cl::init(false));

cl::opt<bool> NoRevisit("no-revisit",
    cl::desc("Do not replay known failures"), cl::init(false));

cl::opt<bool> NoPersist("no-persist",
    cl::desc("Do not record failures"), cl::init(false));

cl::opt<std::string> FailureDir("failure-dir",
    cl::desc("Directory of the failure files"));

cl::opt<bool> Quiet("quiet",
    cl::desc("Only print failures and the summary"), cl::init(false));

/*
 * Drives a ring buffer with random operations and checks it against a
 * std::deque. The broken variant checks against a model that drops the wrong
 * element when a full buffer is overwritten.
 */
class RingBufferTest: public Testable {
private:
  bool brokenModel;

  typedef std::deque<int> model_t;

  void push(demo::RingBuffer<int> &buffer, model_t &model, TestCase &testCase) {
    int value = testCase.nextInt();
    bool wasFull = buffer.full();

    bool pushed = buffer.push(value);
    if (!pushed)
      return;

    if (wasFull) {
      if (brokenModel)
        model.pop_back();
      else
        model.pop_front();
    }
    model.push_back(value);
  }

  void pop(demo::RingBuffer<int> &buffer, model_t &model) {
    if (model.empty())
      return;

    int value = buffer.pop();
    if (value != model.front()) {
      std::ostringstream ss;
      ss << "Popped " << value << ", expected " << model.front();
      throw std::logic_error(ss.str());
    }
    model.pop_front();
  }

  void clear(demo::RingBuffer<int> &buffer, model_t &model) {
    buffer.clear();
    model.clear();
  }

  void check(const demo::RingBuffer<int> &buffer, const model_t &model) {
    if (buffer.size() != model.size()) {
      std::ostringstream ss;
      ss << "Size is " << buffer.size() << ", expected " << model.size();
      throw std::logic_error(ss.str());
    }

    for (unsigned int i = 0; i < model.size(); i++) {
      if (buffer.at(i) != model[i]) {
        std::ostringstream ss;
        ss << "Element " << i << " is " << buffer.at(i) << ", expected " << model[i];
        throw std::logic_error(ss.str());
      }
    }
  }
public:
  explicit RingBufferTest(bool brokenModel = false) : brokenModel(brokenModel) { }

  virtual void run(TestCase &testCase) {
    demo::RingBuffer<int> buffer(testCase.nextInt(1, 20), testCase.nextBoolean());
    model_t model;

    int steps = testCase.nextInt(10, 500);
    for (int i = 0; i < steps; i++) {
      testCase.createAction()
          .or_(0.5, boost::bind(&RingBufferTest::push, this, boost::ref(buffer),
              boost::ref(model), boost::ref(testCase)))
          .or_(0.3, boost::bind(&RingBufferTest::pop, this, boost::ref(buffer),
              boost::ref(model)))
          .or_(0.02, boost::bind(&RingBufferTest::clear, this, boost::ref(buffer),
              boost::ref(model)))
          .execute("Step");

      check(buffer, model);
    }
  }
};

class BrokenRingBufferTest: public RingBufferTest {
public:
  BrokenRingBufferTest() : RingBufferTest(true) { }
};

SEEDCHECK_REGISTER_TESTABLE(RingBufferTest, "demo::RingBufferTest");
SEEDCHECK_REGISTER_TESTABLE(BrokenRingBufferTest, "demo::BrokenRingBufferTest");

bool parseLimit(const std::string &name, const std::string &text,
    TestConfig &config,
    TestConfig &(TestConfig::*setter)(const boost::posix_time::time_duration&)) {
  if (text.empty())
    return true;

  boost::posix_time::time_duration duration;
  if (!parseDuration(text, duration)) {
    LOG(ERROR) << "Illegal " << name << ": " << text;
    return false;
  }

  (config.*setter)(duration);
  return true;
}

}

int main(int argc, char **argv, char **envp) {
  google::InitGoogleLogging(argv[0]);

  if (worker::WorkerProcess::isWorkerInvocation(argc, argv))
    return worker::WorkerProcess::main(argc, argv);

  cl::ParseCommandLineOptions(argc, argv, "SeedCheck demo");

  TestConfig config(Target);
  config.withRandomCases(RandomCases)
      .withMaxFailures(MaxFailures)
      .withConcurrency((unsigned int)Concurrency)
      .withDebug(DebugReproduce)
      .withRevisitKnownFailures(!NoRevisit)
      .withFailurePersistence(!NoPersist)
      .withPlacemark("Step")
      .withPrinting(!Quiet, true);

  if (!FailureDir.empty())
    config.withPersistenceDir(FailureDir);

  if (!parseLimit("max time", MaxTime, config, &TestConfig::withMaxTotalDuration)
      || !parseLimit("max case time", MaxCaseTime, config, &TestConfig::withMaxCaseDuration)
      || !parseLimit("max progress", MaxProgress, config, &TestConfig::withMaxProgressInterval))
    return 2;

  try {
    TestSummary summary = config.execute();
    summary.printResults();

    return summary.getFailures() > 0 ? 1 : 0;
  } catch (ConfigurationError &e) {
    LOG(ERROR) << e.what();
    return 2;
  } catch (std::runtime_error &e) {
    LOG(ERROR) << "Test set aborted: " << e.what();
    return 2;
  }
}
