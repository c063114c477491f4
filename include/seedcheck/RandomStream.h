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

#ifndef RANDOMSTREAM_H_
#define RANDOMSTREAM_H_

#include "seedcheck/Common.h"

#include <boost/atomic.hpp>
#include <boost/random/mersenne_twister.hpp>

#include <string>

namespace seedcheck {

/*
 * A seeded source of random values that counts the bytes it has handed out.
 * Two streams built from the same seed produce identical values and identical
 * positions for an identical sequence of draws.
 *
 * Byte costs: boolean 1, int 4, float 4, long 8, double 8, gaussian 8.
 */
class RandomStream {
private:
  seed_t seed;
  boost::atomic<position_t> position;

  boost::random::mt19937_64 engine;

  void advance(unsigned int bytes);

  uint32_t draw32();
  uint64_t draw64();

  RandomStream(const RandomStream&);
  RandomStream &operator=(const RandomStream&);
protected:
  // Called before each draw, once the position has been moved forward.
  virtual void advanced(position_t oldPosition, position_t newPosition) { }
public:
  explicit RandomStream(seed_t seed);
  virtual ~RandomStream() { }

  seed_t getSeed() const { return seed; }
  position_t getPosition() const { return position.load(); }

  bool nextBoolean();
  bool nextBoolean(double odds);

  int32_t nextInt();
  int32_t nextInt(int32_t min, int32_t max);

  int64_t nextLong();
  int64_t nextLong(int64_t min, int64_t max);

  float nextFloat();
  double nextDouble();
  double nextDouble(double min, double max);
  double nextGaussian();

  void fill(unsigned char *bytes, size_t length);

  std::string nextAlphaNumeric(unsigned int minLength, unsigned int maxLength);
};

// A fresh seed taken from the system entropy source
seed_t generateSeed();

}

#endif /* RANDOMSTREAM_H_ */
