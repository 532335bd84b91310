// MIT License
//
// Copyright (c) 2019 the Shuttle authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "libshuttle/classes.h"
#include "libshuttle/error.h"
#include "libshuttle/file.h"
#include "libshuttle/serialize.h"
#include "libshuttle/types.h"

namespace shuttle {

size_t read_request(const Filepath& path, SolveRequest& req) {
  std::ifstream ifs(path);
  if (!ifs.good()) throw std::runtime_error("request path not found: " + path);
  nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
  ifs.close();
  if (j.is_discarded())
    throw InvalidInputError("request file " + path + " is not valid JSON");
  req = request_from_json(j);
  return req.stops.size();
}

size_t read_matrix(const Filepath& path, TravelMatrix& matrix) {
  std::ifstream ifs(path);
  if (!ifs.good()) throw std::runtime_error("matrix path not found: " + path);
  size_t n = 0;
  if (!(ifs >> n) || n == 0)
    throw InvalidInputError("matrix file " + path + " has no size");

  vec_t<StopId> ids(n);
  for (StopId& id : ids)
    if (!(ifs >> id))
      throw InvalidInputError("matrix file " + path + " has fewer than "
                              + std::to_string(n) + " ids");

  vec_t<vec_t<Minutes>> minutes(n, vec_t<Minutes>(n, 0));
  for (size_t i = 0; i < n; ++i)
    for (size_t j = 0; j < n; ++j)
      if (!(ifs >> minutes[i][j]))
        throw InvalidInputError("matrix file " + path + " is missing minutes ("
                                + std::to_string(i) + "," + std::to_string(j) + ")");

  vec_t<vec_t<Meters>> meters(n, vec_t<Meters>(n, 0));
  Meters m;
  if (ifs >> m) {
    meters[0][0] = m;
    for (size_t k = 1; k < n * n; ++k)
      if (!(ifs >> meters[k / n][k % n]))
        throw InvalidInputError("matrix file " + path + " has a partial meters table");
  }
  ifs.close();
  matrix = TravelMatrix(ids, minutes, meters);
  return n;
}

void write_matrix(const Filepath& path, const TravelMatrix& matrix) {
  std::ofstream ofs(path);
  if (!ofs.good()) throw std::runtime_error("cannot write matrix to " + path);
  const size_t n = matrix.size();
  ofs << n << '\n';
  for (size_t i = 0; i < n; ++i)
    ofs << matrix.ids().at(i) << (i + 1 < n ? ' ' : '\n');
  for (size_t i = 0; i < n; ++i)
    for (size_t j = 0; j < n; ++j)
      ofs << matrix.minutes_at(i, j) << (j + 1 < n ? ' ' : '\n');
  for (size_t i = 0; i < n; ++i)
    for (size_t j = 0; j < n; ++j)
      ofs << matrix.meters_at(i, j) << (j + 1 < n ? ' ' : '\n');
  if (!ofs.good()) throw std::runtime_error("write to " + path + " failed");
}

}  // namespace shuttle
