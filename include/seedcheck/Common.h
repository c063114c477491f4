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

#ifndef COMMON_H_
#define COMMON_H_

#include <stdint.h>

#include <map>
#include <set>
#include <string>

#define SEEDCHECK_DEFAULT_PLACEMARK     "Placemark"

#define SEEDCHECK_HEARTBEAT_INTERVAL    500   // milliseconds
#define SEEDCHECK_HEARTBEAT_TOLERANCE   5     // missed beats before a worker quits
#define SEEDCHECK_DRAIN_INTERVAL        50    // milliseconds
#define SEEDCHECK_POLL_INTERVAL         100   // milliseconds

#define SEEDCHECK_OUTPUT_FLUSH_LIMIT    1000000

#define SEEDCHECK_WORKER_FLAG           "-seedcheck-worker"

#define SEEDCHECK_EXIT_BAD_INPUT        1
#define SEEDCHECK_EXIT_NO_HEARTBEAT     3

namespace seedcheck {

typedef uint64_t seed_t;
typedef uint64_t position_t;

typedef std::set<std::string> placemark_names_t;
typedef std::map<std::string, position_t> placemarks_t;

}

#endif /* COMMON_H_ */
