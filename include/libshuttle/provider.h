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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_PROVIDER_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_PROVIDER_H_

#include <string>

#include "http.h"
#include "message.h"
#include "options.h"
#include "types.h"

namespace shuttle {

/* One origin/destination result of a batched matrix request. Indices are
 * relative to the origins/destinations of that request. */
struct MatrixElement {
  int origin_index;
  int destination_index;
  std::string condition;     // "ROUTE_EXISTS", "ROUTE_NOT_FOUND", ...
  bool has_duration;
  double duration_seconds;
  bool has_distance;
  Meters distance_meters;

  bool route_exists() const {
    return (condition.empty() || condition == "ROUTE_EXISTS")
        && has_duration && has_distance;
  }
};

/* Batched travel-time/distance source. compute() returns whatever elements
 * the provider reported; missing elements are legal. Throws UpstreamError if
 * the provider rejects the request or the payload cannot be read. */
class MatrixProvider {
 public:
  virtual ~MatrixProvider() {}
  virtual vec_t<MatrixElement> compute(
    const vec_t<Point> &,     // param1: origins
    const vec_t<Point> &,     // param2: destinations
    const std::string &,      // param3: departure time (ISO-8601, "" if none)
    RoutingPreference         // param4: routing preference
  ) = 0;
};

/* Google Routes API computeRouteMatrix. compute() runs on the matrix
 * builder's worker threads. */
class RoutesMatrixProvider : public MatrixProvider {
 public:
  RoutesMatrixProvider(const Options &, HttpClient &);

  virtual vec_t<MatrixElement> compute(const vec_t<Point> &,
                                       const vec_t<Point> &,
                                       const std::string &,
                                       RoutingPreference);

 private:
  HttpClient& http_;
  std::string url_;
  std::string key_;
  std::string travel_mode_;
  long timeout_;
};

// Request body for computeRouteMatrix.
std::string route_matrix_body(const vec_t<Point> &, const vec_t<Point> &,
                              const std::string & travel_mode,
                              const std::string & departure_time,
                              RoutingPreference);

// Parse a computeRouteMatrix response. Accepts one JSON array of elements or
// a stream of JSON objects (one per line, with stray "[", "]", "," lines,
// trailing commas and the ")]}'" guard tolerated). Error payloads and
// unreadable lines throw UpstreamError.
vec_t<MatrixElement> parse_route_matrix(const std::string &);

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_PROVIDER_H_
