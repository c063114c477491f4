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

#ifndef PROTOCOLS_H_
#define PROTOCOLS_H_

#include "seedcheck/Common.h"

#include <boost/asio.hpp>
#include <boost/bind.hpp>
#include <boost/function.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <istream>
#include <string>

namespace seedcheck {

/*
 * Text protocol between the pool and its workers. The pool writes to the
 * worker's stdin:
 *
 *   <hex case>:<hex seed>      run a case
 *   (empty line)               heartbeat
 *   X                          stop after the current case
 *
 * Workers report on stderr, each report prefixed with the worker's ID:
 *
 *   <id>:I:<hex case>:<start time>
 *   <id>:D:<hex case>:<end time>
 *   <id>:X:<hex case>:<end time>:<hex position>:<hex placemark>...:<detail>
 */

struct WorkerReport {
  enum Kind {
    CaseStarted,
    CaseDone,
    CaseFailed
  };

  Kind kind;
  unsigned int caseNumber;
  boost::posix_time::ptime timestamp;

  position_t position;
  placemarks_t placemarks;
  std::string detail;

  WorkerReport() : kind(CaseStarted), caseNumber(0), position(0) { }
};

std::string formatAssignment(unsigned int caseNumber, seed_t seed);
bool parseAssignment(const std::string &line, unsigned int &caseNumber,
    seed_t &seed);

std::string formatCaseStarted(const std::string &testerId,
    unsigned int caseNumber, const boost::posix_time::ptime &time);
std::string formatCaseDone(const std::string &testerId,
    unsigned int caseNumber, const boost::posix_time::ptime &time);
std::string formatCaseFailed(const std::string &testerId,
    unsigned int caseNumber, const boost::posix_time::ptime &time,
    position_t position, const placemark_names_t &placemarkNames,
    const placemarks_t &placemarks, const std::string &detail);

// Parses a report with the tester ID prefix already removed. On failure,
// error describes what was wrong.
bool parseWorkerReport(const std::string &report,
    const placemark_names_t &placemarkNames, WorkerReport &result,
    std::string &error);

std::string escapeDetail(const std::string &detail);
std::string unescapeDetail(const std::string &detail);

/*
 * Reads newline-terminated lines from a pipe on an io_service.
 */
class AsyncLineReader {
public:
  typedef boost::function<void (const std::string&,
      const boost::system::error_code&)> Handler;
private:
  boost::asio::posix::stream_descriptor &stream;
  boost::asio::streambuf buffer;

  void handleLineRead(const boost::system::error_code &error, size_t size,
      Handler handler) {
    std::string line;

    if (!error) {
      std::istream is(&buffer);
      std::getline(is, line);
    }

    handler(line, error);
  }
public:
  explicit AsyncLineReader(boost::asio::posix::stream_descriptor &s) :
    stream(s) { }

  virtual ~AsyncLineReader() { }

  void recvLine(Handler handler) {
    boost::asio::async_read_until(stream, buffer, '\n',
        boost::bind(&AsyncLineReader::handleLineRead,
            this, boost::asio::placeholders::error,
            boost::asio::placeholders::bytes_transferred,
            handler));
  }
};

// Writes the whole line, retrying on short writes. Returns false on error.
bool writeLine(int fd, const std::string &line);

}

#endif /* PROTOCOLS_H_ */
