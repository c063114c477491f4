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

#ifndef RINGBUFFER_H_
#define RINGBUFFER_H_

#include <stdexcept>
#include <vector>

namespace demo {

/*
 * Fixed capacity FIFO. With the overwrite flag set, pushing into a full
 * buffer drops the oldest element.
 */
template<typename T>
class RingBuffer {
private:
  std::vector<T> slots;
  unsigned int head;
  unsigned int count;
  bool overwrite;
public:
  RingBuffer(unsigned int capacity, bool overwrite) :
    slots(capacity), head(0), count(0), overwrite(overwrite) {
    if (capacity == 0)
      throw std::invalid_argument("Ring buffer needs a capacity");
  }

  unsigned int size() const { return count; }
  unsigned int capacity() const { return slots.size(); }
  bool empty() const { return count == 0; }
  bool full() const { return count == slots.size(); }

  bool push(const T &value) {
    if (full()) {
      if (!overwrite)
        return false;

      slots[head] = value;
      head = (head + 1) % slots.size();
      return true;
    }

    slots[(head + count) % slots.size()] = value;
    count++;
    return true;
  }

  T pop() {
    if (empty())
      throw std::out_of_range("Pop from an empty ring buffer");

    T value = slots[head];
    head = (head + 1) % slots.size();
    count--;
    return value;
  }

  const T &at(unsigned int index) const {
    if (index >= count)
      throw std::out_of_range("Ring buffer index out of range");

    return slots[(head + index) % slots.size()];
  }

  void clear() {
    head = 0;
    count = 0;
  }
};

}

#endif /* RINGBUFFER_H_ */
