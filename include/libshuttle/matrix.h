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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_MATRIX_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_MATRIX_H_

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>

#include <lrucache.hpp>

#include "classes.h"
#include "geocoder.h"
#include "message.h"
#include "options.h"
#include "provider.h"
#include "types.h"

namespace shuttle {

/* Builds the pairwise travel matrix for a list of stops.
 *
 * Coordinates come from the stops themselves or from the Geocoder. Large stop
 * lists are split into blocks of at most Options::batch_size; every (origin
 * block, destination block) pair is one provider request, and requests run
 * on up to Options::max_workers threads. Results are cached per (rounded
 * coordinates, departure time, routing preference), and a key is computed at
 * most once even when several callers ask for it at the same time.
 *
 * A MatrixBuilder may be shared across threads. */
class MatrixBuilder {
 public:
  MatrixBuilder(const Options &, Geocoder &, MatrixProvider &);

  TravelMatrix build(
    const vec_t<Stop> &,                 // param1: stops (depot first)
    const std::string & departure = "",  // param2: ISO-8601 departure time
    RoutingPreference = RoutingPreference::TrafficAware,
    bool require_coordinates = false     // param4: forbid geocoding
  );

  /* Resolve coordinates only (step 1 of build) */
  vec_t<Point> resolve(const vec_t<Stop> &, bool require_coordinates);

  size_t cache_size();
  void   clear_cache();
  int    count_requests() const { return count_requests_; }  // provider calls

  static std::string cache_key(const vec_t<Point> &, const std::string &,
                               RoutingPreference, int precision);

 private:
  size_t batch_size_;
  size_t max_workers_;
  size_t cache_capacity_;
  int precision_;
  Geocoder& geocoder_;
  MatrixProvider& provider_;

  std::mutex cachemx_;                       // protects cache_ and inflight_
  std::condition_variable inflight_cv_;
  std::set<std::string> inflight_;           // keys being computed
  cache::lru_cache<std::string, TravelMatrix> cache_;
  std::atomic<int> count_requests_;

  TravelMatrix compute(const vec_t<Point> &, const std::string &,
                       RoutingPreference);
  void fetch_block(const vec_t<Point> &, size_t, size_t, const std::string &,
                   RoutingPreference, TravelMatrix &);
};

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_MATRIX_H_
