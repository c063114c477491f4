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

#include "seedcheck/RandomStream.h"

#include <boost/random/random_device.hpp>

#include <cmath>
#include <stdexcept>

namespace seedcheck {

namespace {

const char AlphaNumerics[] =
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

const unsigned int AlphaNumericCount = 62;

}

RandomStream::RandomStream(seed_t seed) :
  seed(seed), position(0), engine(seed) {

}

void RandomStream::advance(unsigned int bytes) {
  position_t oldPosition = position.fetch_add(bytes);

  advanced(oldPosition, oldPosition + bytes);
}

uint32_t RandomStream::draw32() {
  return (uint32_t)(engine() >> 32);
}

uint64_t RandomStream::draw64() {
  return engine();
}

bool RandomStream::nextBoolean() {
  advance(1);
  return (draw64() >> 63) == 0;
}

bool RandomStream::nextBoolean(double odds) {
  return nextDouble() < odds;
}

int32_t RandomStream::nextInt() {
  advance(4);
  return (int32_t)draw32();
}

int32_t RandomStream::nextInt(int32_t min, int32_t max) {
  if (min == max)
    return min;
  if (min > max)
    throw std::invalid_argument("Empty integer range");

  uint64_t range = (uint64_t)((int64_t)max - (int64_t)min);

  advance(4);
  uint64_t offset = ((uint64_t)draw32() * range) >> 32;

  return (int32_t)((int64_t)min + (int64_t)offset);
}

int64_t RandomStream::nextLong() {
  advance(8);
  return (int64_t)draw64();
}

int64_t RandomStream::nextLong(int64_t min, int64_t max) {
  if (min == max)
    return min;
  if (min > max)
    throw std::invalid_argument("Empty long range");

  uint64_t range = (uint64_t)max - (uint64_t)min;

  advance(8);
  return (int64_t)((uint64_t)min + draw64() % range);
}

float RandomStream::nextFloat() {
  advance(4);
  return (float)(draw32() >> 8) / (float)(1 << 24);
}

double RandomStream::nextDouble() {
  advance(8);
  return (double)(draw64() >> 11) * (1.0 / 9007199254740992.0);
}

double RandomStream::nextDouble(double min, double max) {
  return min + nextDouble() * (max - min);
}

double RandomStream::nextGaussian() {
  advance(8);

  // Box-Muller over the two halves of a single draw
  uint64_t bits = draw64();
  double u1 = ((double)(bits >> 32) + 1.0) / 4294967296.0;
  double u2 = (double)(bits & 0xFFFFFFFFULL) / 4294967296.0;

  return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * M_PI * u2);
}

void RandomStream::fill(unsigned char *bytes, size_t length) {
  uint32_t word = 0;

  for (size_t i = 0; i < length; i++) {
    if (i % 4 == 0) {
      advance(4);
      word = draw32();
    }

    bytes[i] = (unsigned char)(word >> (24 - 8 * (i % 4)));
  }
}

std::string RandomStream::nextAlphaNumeric(unsigned int minLength,
    unsigned int maxLength) {
  unsigned int length = minLength;
  if (maxLength > minLength)
    length = (unsigned int)nextInt((int32_t)minLength, (int32_t)maxLength + 1);

  std::string result;
  result.reserve(length);

  uint32_t word = 0;
  for (unsigned int i = 0; i < length; i++) {
    unsigned int slot = i % 5;
    if (slot == 0) {
      advance(4);
      word = draw32();
    }

    unsigned int index = (word >> (26 - 6 * slot)) & 0x3F;
    if (index >= AlphaNumericCount) {
      uint32_t rotated = slot ? ((word >> slot) | (word << (32 - slot))) : word;
      index = rotated % AlphaNumericCount;
    }

    result.push_back(AlphaNumerics[index]);
  }

  return result;
}

seed_t generateSeed() {
  boost::random::random_device device;

  return ((seed_t)device() << 32) | (seed_t)device();
}

}
