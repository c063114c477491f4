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

#include "seedcheck/Protocols.h"
#include "seedcheck/TimeFormat.h"

#include <limits>

#include <unistd.h>
#include <errno.h>

namespace seedcheck {

namespace {

const uint64_t NoPlacemark = std::numeric_limits<uint64_t>::max();

// Splits off the next ':'-terminated field. The last field runs to the end.
bool nextField(const std::string &text, std::string::size_type &pos,
    std::string &field) {
  if (pos > text.size())
    return false;

  std::string::size_type end = text.find(':', pos);
  if (end == std::string::npos) {
    field = text.substr(pos);
    pos = text.size() + 1;
  } else {
    field = text.substr(pos, end - pos);
    pos = end + 1;
  }

  return true;
}

std::string formatReport(const std::string &testerId, char kind,
    unsigned int caseNumber, const boost::posix_time::ptime &time) {
  std::string result(testerId);

  result.push_back(':');
  result.push_back(kind);
  result.push_back(':');
  result.append(toHex(caseNumber));
  result.push_back(':');
  result.append(formatHandshakeTime(time));

  return result;
}

}

std::string formatAssignment(unsigned int caseNumber, seed_t seed) {
  return toHex(caseNumber) + ":" + toHex(seed);
}

bool parseAssignment(const std::string &line, unsigned int &caseNumber,
    seed_t &seed) {
  std::string::size_type colon = line.find(':');
  if (colon == std::string::npos)
    return false;

  uint64_t number;
  if (!parseHex(line.substr(0, colon), number) || number > 0xFFFFFFFFULL)
    return false;
  if (!parseHex(line.substr(colon + 1), seed))
    return false;

  caseNumber = (unsigned int)number;
  return true;
}

std::string formatCaseStarted(const std::string &testerId,
    unsigned int caseNumber, const boost::posix_time::ptime &time) {
  return formatReport(testerId, 'I', caseNumber, time);
}

std::string formatCaseDone(const std::string &testerId,
    unsigned int caseNumber, const boost::posix_time::ptime &time) {
  return formatReport(testerId, 'D', caseNumber, time);
}

std::string formatCaseFailed(const std::string &testerId,
    unsigned int caseNumber, const boost::posix_time::ptime &time,
    position_t position, const placemark_names_t &placemarkNames,
    const placemarks_t &placemarks, const std::string &detail) {
  std::string result = formatReport(testerId, 'X', caseNumber, time);

  result.push_back(':');
  result.append(toHex(position));

  for (placemark_names_t::const_iterator it = placemarkNames.begin();
      it != placemarkNames.end(); it++) {
    placemarks_t::const_iterator pit = placemarks.find(*it);

    result.push_back(':');
    result.append(toHex(pit == placemarks.end() ? NoPlacemark : pit->second));
  }

  result.push_back(':');
  result.append(escapeDetail(detail));

  return result;
}

bool parseWorkerReport(const std::string &report,
    const placemark_names_t &placemarkNames, WorkerReport &result,
    std::string &error) {
  std::string::size_type pos = 0;
  std::string field;

  nextField(report, pos, field);
  if (field == "I")
    result.kind = WorkerReport::CaseStarted;
  else if (field == "D")
    result.kind = WorkerReport::CaseDone;
  else if (field == "X")
    result.kind = WorkerReport::CaseFailed;
  else {
    error = "Unrecognized report type: " + field;
    return false;
  }

  uint64_t number;
  if (!nextField(report, pos, field) || !parseHex(field, number)
      || number > 0xFFFFFFFFULL) {
    error = "Bad case number: " + field;
    return false;
  }
  result.caseNumber = (unsigned int)number;

  if (!nextField(report, pos, field)) {
    error = "Missing timestamp";
    return false;
  }
  if (!parseHandshakeTime(field, result.timestamp))
    result.timestamp = boost::posix_time::ptime(boost::posix_time::not_a_date_time);

  if (result.kind != WorkerReport::CaseFailed)
    return true;

  if (!nextField(report, pos, field) || !parseHex(field, result.position)) {
    error = "Bad position: " + field;
    return false;
  }

  result.placemarks.clear();
  for (placemark_names_t::const_iterator it = placemarkNames.begin();
      it != placemarkNames.end(); it++) {
    uint64_t value;

    if (!nextField(report, pos, field) || !parseHex(field, value)) {
      error = "Bad position for placemark " + *it + ": " + field;
      return false;
    }

    if (value != NoPlacemark)
      result.placemarks[*it] = value;
  }

  if (pos <= report.size())
    result.detail = unescapeDetail(report.substr(pos));
  else
    result.detail.clear();

  return true;
}

std::string escapeDetail(const std::string &detail) {
  std::string result;
  result.reserve(detail.size());

  for (std::string::const_iterator it = detail.begin(); it != detail.end(); it++) {
    switch (*it) {
    case '\r':
      break;
    case '\n':
      result.append("\\n");
      break;
    case '\\':
      result.append("\\\\");
      break;
    default:
      result.push_back(*it);
    }
  }

  return result;
}

std::string unescapeDetail(const std::string &detail) {
  std::string result;
  result.reserve(detail.size());

  for (std::string::size_type i = 0; i < detail.size(); i++) {
    if (detail[i] == '\\' && i + 1 < detail.size()) {
      if (detail[i + 1] == 'n') {
        result.push_back('\n');
        i++;
        continue;
      } else if (detail[i + 1] == '\\') {
        result.push_back('\\');
        i++;
        continue;
      }
    }

    result.push_back(detail[i]);
  }

  return result;
}

bool writeLine(int fd, const std::string &line) {
  std::string data(line);
  data.push_back('\n');

  const char *ptr = data.data();
  size_t remaining = data.size();

  while (remaining > 0) {
    ssize_t written = ::write(fd, ptr, remaining);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }

    ptr += written;
    remaining -= written;
  }

  return true;
}

}
