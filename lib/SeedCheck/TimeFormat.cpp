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

#include "seedcheck/TimeFormat.h"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

#include <cstdio>
#include <cstring>
#include <stdexcept>

using namespace boost::posix_time;

namespace seedcheck {

namespace {

const char *MonthNames[] = { "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul",
    "Aug", "Sep", "Oct", "Nov", "Dec" };

int parseMonth(const char *name) {
  for (int i = 0; i < 12; i++) {
    if (strcmp(name, MonthNames[i]) == 0)
      return i + 1;
  }
  return -1;
}

bool buildTime(int day, int month, int year, int h, int m, int s, int ms,
    ptime &time) {
  if (month < 0 || h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 59
      || ms < 0 || ms > 999)
    return false;

  try {
    boost::gregorian::date date(year, month, day);
    time = ptime(date, hours(h) + minutes(m) + seconds(s) + milliseconds(ms));
  } catch (std::out_of_range &e) {
    return false;
  }

  return true;
}

std::string formatDate(const ptime &time) {
  boost::gregorian::date date = time.date();
  char buffer[16];

  snprintf(buffer, sizeof(buffer), "%02d%s%04d", (int)date.day(),
      MonthNames[date.month() - 1], (int)date.year());

  return std::string(buffer);
}

}

std::string formatFileTime(const ptime &time) {
  time_duration tod = time.time_of_day();
  char buffer[16];

  snprintf(buffer, sizeof(buffer), " %02d:%02d:%02d", (int)tod.hours(),
      (int)tod.minutes(), (int)tod.seconds());

  return formatDate(time) + buffer;
}

bool parseFileTime(const std::string &text, ptime &time) {
  int day, year, h, m, s;
  char month[4];
  char trailing;

  if (sscanf(text.c_str(), "%2d%3[A-Za-z]%4d %2d:%2d:%2d%c", &day, month,
      &year, &h, &m, &s, &trailing) != 6)
    return false;

  return buildTime(day, parseMonth(month), year, h, m, s, 0, time);
}

std::string formatHandshakeTime(const ptime &time) {
  time_duration tod = time.time_of_day();
  char buffer[32];

  snprintf(buffer, sizeof(buffer), " %02d%02d%02d.%03d", (int)tod.hours(),
      (int)tod.minutes(), (int)tod.seconds(),
      (int)(tod.fractional_seconds() * 1000 / time_duration::ticks_per_second()));

  return formatDate(time) + buffer;
}

bool parseHandshakeTime(const std::string &text, ptime &time) {
  int day, year, h, m, s, ms;
  char month[4];
  char trailing;

  if (sscanf(text.c_str(), "%2d%3[A-Za-z]%4d %2d%2d%2d.%3d%c", &day, month,
      &year, &h, &m, &s, &ms, &trailing) != 7)
    return false;

  return buildTime(day, parseMonth(month), year, h, m, s, ms, time);
}

std::string formatClockTime(const ptime &time) {
  time_duration tod = time.time_of_day();
  char buffer[32];

  snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d", (int)tod.hours(),
      (int)tod.minutes(), (int)tod.seconds(),
      (int)(tod.fractional_seconds() * 1000 / time_duration::ticks_per_second()));

  return std::string(buffer);
}

std::string formatDuration(const time_duration &duration) {
  char buffer[64];
  int64_t millis = duration.total_milliseconds();

  if (millis < 0)
    return "-" + formatDuration(-duration);

  if (millis < 1000) {
    snprintf(buffer, sizeof(buffer), "%ldms", (long)millis);
  } else if (millis < 60 * 1000) {
    snprintf(buffer, sizeof(buffer), "%ld.%03lds", (long)(millis / 1000),
        (long)(millis % 1000));
  } else if (millis < 60 * 60 * 1000) {
    snprintf(buffer, sizeof(buffer), "%ldm %ld.%03lds", (long)(millis / 60000),
        (long)((millis / 1000) % 60), (long)(millis % 1000));
  } else {
    snprintf(buffer, sizeof(buffer), "%ldh %ldm %ld.%03lds",
        (long)(millis / 3600000), (long)((millis / 60000) % 60),
        (long)((millis / 1000) % 60), (long)(millis % 1000));
  }

  return std::string(buffer);
}

bool parseDuration(const std::string &text, time_duration &duration) {
  if (text.empty())
    return false;

  try {
    duration = duration_from_string(text);
  } catch (std::exception &e) {
    return false;
  }

  return !duration.is_special() && !duration.is_negative();
}

std::string toHex(uint64_t value, bool upperCase) {
  char buffer[20];

  snprintf(buffer, sizeof(buffer), upperCase ? "%llX" : "%llx",
      (unsigned long long)value);

  return std::string(buffer);
}

bool parseHex(const std::string &text, uint64_t &value) {
  if (text.empty() || text.size() > 16)
    return false;

  uint64_t result = 0;
  for (std::string::const_iterator it = text.begin(); it != text.end(); it++) {
    char c = *it;
    int digit;

    if (c >= '0' && c <= '9')
      digit = c - '0';
    else if (c >= 'a' && c <= 'f')
      digit = c - 'a' + 10;
    else if (c >= 'A' && c <= 'F')
      digit = c - 'A' + 10;
    else
      return false;

    result = (result << 4) | (uint64_t)digit;
  }

  value = result;
  return true;
}

}
