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

#ifndef FAILURESTORE_H_
#define FAILURESTORE_H_

#include "seedcheck/Common.h"
#include "seedcheck/TestFailure.h"

#include <istream>
#include <ostream>
#include <string>

namespace seedcheck {

/*
 * Persistence of the known failures of one testable, as a comma separated
 * file:
 *
 *   Failed,Fixed,Seed,Position[,PlacemarkName]*
 *   19Oct2026 14:03:22,,abc,42,13
 */
class FailureStore {
public:
  // Missing or unrecognized files yield an empty list
  static failure_list_t load(const std::string &path,
      const placemark_names_t &placemarkNames);

  // Sorts the records, then overwrites the file. Throws std::runtime_error if
  // the file cannot be written.
  static void write(const std::string &path,
      const placemark_names_t &placemarkNames, failure_list_t &failures);

  static failure_list_t read(std::istream &is,
      const placemark_names_t &placemarkNames, const std::string &source);
  static void print(std::ostream &os, const placemark_names_t &placemarkNames,
      const failure_list_t &failures);

  // Unresolved failures by failure time, then resolved ones by fix time
  static void sort(failure_list_t &failures);

  static std::string locate(const std::string &testableName,
      const std::string &failureDir, bool qualifiedName);
};

}

#endif /* FAILURESTORE_H_ */
