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

#include "seedcheck/FailureStore.h"
#include "seedcheck/TimeFormat.h"
#include "seedcheck/Testable.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <glog/logging.h>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <unistd.h>

using namespace llvm;
using namespace boost::posix_time;

namespace seedcheck {

namespace {

typedef std::vector<std::string> cells_t;

bool parseCount(const std::string &text, int64_t &value) {
  try {
    value = boost::lexical_cast<int64_t>(text);
  } catch (boost::bad_lexical_cast &e) {
    return false;
  }

  return value >= 0;
}

bool earlierRecord(const TestFailure &first, const TestFailure &second) {
  if (first.isFixed() != second.isFixed())
    return !first.isFixed();

  if (first.isFixed())
    return first.getFixed() < second.getFixed();
  else
    return first.getFailed() < second.getFailed();
}

void splitRow(const std::string &line, cells_t &cells) {
  std::string row(line);
  if (!row.empty() && row[row.size() - 1] == '\r')
    row.erase(row.size() - 1);

  cells.clear();
  boost::split(cells, row, boost::is_any_of(","));
}

}

failure_list_t FailureStore::read(std::istream &is,
    const placemark_names_t &placemarkNames, const std::string &source) {
  failure_list_t result;
  std::string line;
  cells_t cells;

  if (!std::getline(is, line))
    return result;

  splitRow(line, cells);
  if (cells.size() < 4 || cells[0] != "Failed" || cells[1] != "Fixed"
      || cells[2] != "Seed" || cells[3] != "Position") {
    LOG(WARNING) << "Unrecognized test file " << source
        << ": Expected Failed,Fixed,Seed,Position for first 4 column headers";
    return result;
  }

  std::vector<std::string> columns(cells.begin() + 4, cells.end());
  for (std::vector<std::string>::iterator it = columns.begin();
      it != columns.end(); it++) {
    if (placemarkNames.count(*it) == 0)
      LOG(WARNING) << "Placemark column " << *it << " of " << source << " is not recognized";
  }

  unsigned int lineNumber = 1;
  while (std::getline(is, line)) {
    lineNumber++;

    splitRow(line, cells);
    if (cells.size() == 1 && cells[0].empty())
      continue;

    if (cells.size() < 4) {
      LOG(ERROR) << source << ", line " << lineNumber << ": Too few columns";
      continue;
    }

    ptime failed;
    if (!parseFileTime(cells[0], failed)) {
      LOG(WARNING) << source << ", line " << lineNumber
          << ": Could not parse failure time " << cells[0];
      failed = second_clock::universal_time();
    }

    ptime fixed(not_a_date_time);
    if (!cells[1].empty() && !parseFileTime(cells[1], fixed)) {
      LOG(WARNING) << source << ", line " << lineNumber
          << ": Could not parse fix time " << cells[1];
      fixed = second_clock::universal_time();
    }

    uint64_t seed;
    if (!parseHex(cells[2], seed)) {
      LOG(ERROR) << source << ", line " << lineNumber << ": Bad seed " << cells[2];
      continue;
    }

    int64_t position;
    if (!parseCount(cells[3], position)) {
      LOG(ERROR) << source << ", line " << lineNumber << ": Bad position " << cells[3];
      continue;
    }

    std::map<std::string, int64_t> placemarks;
    for (unsigned int i = 0; i < columns.size() && i + 4 < cells.size(); i++) {
      const std::string &cell = cells[i + 4];
      int64_t value;

      if (cell.empty())
        continue;
      if (!parseCount(cell, value)) {
        LOG(WARNING) << source << ", line " << lineNumber << ": Bad position "
            << cell << " for placemark " << columns[i];
        continue;
      }

      placemarks[columns[i]] = value;
    }

    result.push_back(TestFailure(failed, fixed, seed, (position_t)position,
        placemarks));
  }

  return result;
}

void FailureStore::print(std::ostream &os, const placemark_names_t &placemarkNames,
    const failure_list_t &failures) {
  os << "Failed,Fixed,Seed,Position";
  for (placemark_names_t::const_iterator it = placemarkNames.begin();
      it != placemarkNames.end(); it++) {
    os << ',' << *it;
  }
  os << '\n';

  for (failure_list_t::const_iterator it = failures.begin();
      it != failures.end(); it++) {
    os << formatFileTime(it->getFailed()) << ',';
    if (it->isFixed())
      os << formatFileTime(it->getFixed());
    os << ',' << toHex(it->getSeed()) << ',' << it->getPosition();

    for (placemark_names_t::const_iterator nit = placemarkNames.begin();
        nit != placemarkNames.end(); nit++) {
      os << ',';

      placemarks_t::const_iterator pit = it->getPlacemarks().find(*nit);
      if (pit != it->getPlacemarks().end())
        os << pit->second;
    }
    os << '\n';
  }
}

void FailureStore::sort(failure_list_t &failures) {
  std::stable_sort(failures.begin(), failures.end(), earlierRecord);
}

failure_list_t FailureStore::load(const std::string &path,
    const placemark_names_t &placemarkNames) {
  std::ifstream is(path.c_str());

  if (!is) {
    if (sys::fs::exists(path))
      LOG(WARNING) << "Could not read failure file " << path;
    return failure_list_t();
  }

  failure_list_t result = read(is, placemarkNames, path);
  LOG(INFO) << "Loaded " << result.size() << " known failure(s) from " << path;

  return result;
}

void FailureStore::write(const std::string &path,
    const placemark_names_t &placemarkNames, failure_list_t &failures) {
  sort(failures);

  StringRef parent = sys::path::parent_path(path);
  if (!parent.empty()) {
    std::error_code ec = sys::fs::create_directories(parent);
    if (ec)
      throw std::runtime_error("Could not create directory " + parent.str()
          + ": " + ec.message());
  }

  std::ofstream os(path.c_str(), std::ios::out | std::ios::trunc);
  if (!os)
    throw std::runtime_error("Could not write failure file " + path);

  print(os, placemarkNames, failures);

  os.close();
  if (os.fail())
    throw std::runtime_error("Could not write failure file " + path);
}

std::string FailureStore::locate(const std::string &testableName,
    const std::string &failureDir, bool qualifiedName) {
  std::string qualified = boost::replace_all_copy(testableName, "::", ".");

  std::string simple = TestableRegistry::getSimpleName(testableName);

  SmallString<256> result;

  if (!failureDir.empty()) {
    result = failureDir;
    sys::path::append(result, (qualifiedName ? qualified : simple) + ".test");
    return result.str().str();
  }

  std::string executable = sys::fs::getMainExecutable("seedcheck",
      (void*)&FailureStore::locate);
  if (!executable.empty()) {
    result = sys::path::parent_path(executable);
    sys::path::append(result, simple + ".broken");

    if (sys::fs::exists(result))
      return result.str().str();

    int fd;
    if (!sys::fs::openFileForWrite(result, fd, sys::fs::CD_CreateNew)) {
      ::close(fd);
      if (std::error_code ec = sys::fs::remove(result))
        LOG(WARNING) << "Could not remove probe file " << result.str().str()
            << ": " << ec.message();
      return result.str().str();
    }
  }

  if (sys::fs::current_path(result))
    result.clear();
  sys::path::append(result, qualified + ".broken");

  return result.str().str();
}

}
