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

#ifndef TIMEFORMAT_H_
#define TIMEFORMAT_H_

#include <stdint.h>

#include <string>

#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace seedcheck {

// "19Oct2026 14:03:22", used in the failure files
std::string formatFileTime(const boost::posix_time::ptime &time);
bool parseFileTime(const std::string &text, boost::posix_time::ptime &time);

// "19Oct2026 140322.117", used on the worker protocol
std::string formatHandshakeTime(const boost::posix_time::ptime &time);
bool parseHandshakeTime(const std::string &text, boost::posix_time::ptime &time);

// "14:03:22.117"
std::string formatClockTime(const boost::posix_time::ptime &time);

// Human readable, e.g. "250ms", "3.042s", "2m 5.100s", "1h 0m 12.000s"
std::string formatDuration(const boost::posix_time::time_duration &duration);

// Boost's "HH:MM:SS[.ffffff]" form
bool parseDuration(const std::string &text, boost::posix_time::time_duration &duration);

std::string toHex(uint64_t value, bool upperCase = false);
bool parseHex(const std::string &text, uint64_t &value);

}

#endif /* TIMEFORMAT_H_ */
