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
#include <algorithm> /* std::min */
#include <atomic>
#include <cmath> /* std::nearbyint, std::round, std::pow */
#include <exception>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>

#include "libshuttle/classes.h"
#include "libshuttle/debug.h"
#include "libshuttle/error.h"
#include "libshuttle/geocoder.h"
#include "libshuttle/matrix.h"
#include "libshuttle/message.h"
#include "libshuttle/options.h"
#include "libshuttle/provider.h"
#include "libshuttle/types.h"

namespace shuttle {

MatrixBuilder::MatrixBuilder(const Options& opt, Geocoder& geocoder,
                             MatrixProvider& provider)
    : geocoder_(geocoder),
      provider_(provider),
      cache_(opt.cache_capacity),
      count_requests_(0) {
  opt.validate();
  this->batch_size_ = opt.batch_size;
  this->max_workers_ = opt.max_workers;
  this->cache_capacity_ = opt.cache_capacity;
  this->precision_ = opt.coordinate_precision;
}

TravelMatrix MatrixBuilder::build(const vec_t<Stop>& stops,
                                  const std::string& departure,
                                  RoutingPreference pref,
                                  bool require_coordinates) {
  if (stops.empty())
    throw InvalidInputError("no stops given; nothing to build");

  const vec_t<Point> pts = this->resolve(stops, require_coordinates);
  vec_t<StopId> ids = {};
  for (const Stop& stop : stops) ids.push_back(stop.id());

  const std::string key = cache_key(pts, departure, pref, precision_);

  /* Acquire lock:
   * Either the key is cached, or somebody is computing it (wait), or we
   * claim it. */
  std::unique_lock<std::mutex> lock(cachemx_);
  while (!cache_.exists(key) && inflight_.count(key) != 0)
    inflight_cv_.wait(lock);
  if (cache_.exists(key)) {
    TravelMatrix hit = cache_.get(key);
    lock.unlock();
    DEBUG(1, { Message trace("matrix");
               trace << "cache hit (" << ids.size() << " stops)" << std::endl; });
    hit.set_ids(ids);
    return hit;
  }
  inflight_.insert(key);
  lock.unlock();
  // Lock released; the provider calls run unlocked

  TravelMatrix res;
  try {
    res = this->compute(pts, departure, pref);
  } catch (...) {
    lock.lock();
    inflight_.erase(key);  // let a waiter take over the key
    lock.unlock();
    inflight_cv_.notify_all();
    throw;
  }

  lock.lock();
  cache_.put(key, res);
  inflight_.erase(key);
  lock.unlock();
  inflight_cv_.notify_all();

  res.set_ids(ids);
  return res;
}

vec_t<Point> MatrixBuilder::resolve(const vec_t<Stop>& stops,
                                    bool require_coordinates) {
  vec_t<Point> pts = {};
  std::unordered_set<StopId> seen = {};
  dict<std::string, Point> geocoded = {};  // same address, one lookup
  for (const Stop& stop : stops) {
    if (!seen.insert(stop.id()).second)
      throw InvalidInputError("duplicate stop id " + stop.id());

    if (stop.has_point()) {
      const Point& pt = stop.point();
      if (!(pt.lat >= -90 && pt.lat <= 90 && pt.lng >= -180 && pt.lng <= 180)) {
        std::ostringstream err;
        err << "Point " << stop.id() << " has out-of-range coordinate " << pt;
        throw InvalidInputError(err.str());
      }
      pts.push_back(pt);
    } else if (require_coordinates) {
      throw InvalidInputError("Point " + stop.id()
                              + " missing lat/lng (geocoding disabled)");
    } else if (stop.has_address()) {
      auto it = geocoded.find(stop.address());
      if (it == geocoded.end())
        it = geocoded.insert(
               std::make_pair(stop.address(), geocoder_.resolve(stop.address()))).first;
      pts.push_back(it->second);
    } else {
      throw InvalidInputError("Point " + stop.id()
                              + " missing both (lat,lng) and address");
    }
  }
  return pts;
}

std::string MatrixBuilder::cache_key(const vec_t<Point>& pts,
                                     const std::string& departure,
                                     RoutingPreference pref,
                                     int precision) {
  const double scale = std::pow(10.0, precision);
  auto rounded = [&](double v) {
    double r = std::round(v * scale) / scale;
    return (r == 0 ? 0.0 : r);  // no "-0.000000"
  };
  std::ostringstream key;
  key << std::fixed << std::setprecision(precision);
  for (const Point& pt : pts)
    key << rounded(pt.lat) << "," << rounded(pt.lng) << ";";
  key << "|dep=" << departure << "|pref=" << to_string(pref);
  return key.str();
}

size_t MatrixBuilder::cache_size() {
  std::lock_guard<std::mutex> lock(cachemx_);
  return cache_.size();
}

void MatrixBuilder::clear_cache() {
  std::lock_guard<std::mutex> lock(cachemx_);
  cache_ = cache::lru_cache<std::string, TravelMatrix>(cache_capacity_);
}

TravelMatrix MatrixBuilder::compute(const vec_t<Point>& pts,
                                    const std::string& departure,
                                    RoutingPreference pref) {
  Message print("matrix");  // one per call; builds may run concurrently
  const size_t n = pts.size();
  TravelMatrix res(vec_t<StopId>(n, ""));

  vec_t<std::pair<size_t, size_t>> blocks = {};  // (origin off., dest. off.)
  for (size_t oi = 0; oi < n; oi += batch_size_)
    for (size_t di = 0; di < n; di += batch_size_)
      blocks.push_back(std::make_pair(oi, di));

  const size_t nworkers = std::min(max_workers_, blocks.size());
  print << "Building " << n << "x" << n << " matrix: " << blocks.size()
        << " block(s), " << nworkers << " worker(s)" << std::endl;
  tick_t t0 = hiclock::now();

  if (nworkers <= 1) {
    for (const auto& b : blocks)
      this->fetch_block(pts, b.first, b.second, departure, pref, res);
  } else {
    /* Each block writes its own sub-rectangle of res, so the workers share
     * res without locking. */
    std::atomic<size_t> next(0);
    std::atomic<bool> failed(false);
    vec_t<std::exception_ptr> errors(nworkers);
    vec_t<std::thread> workers = {};
    for (size_t w = 0; w < nworkers; ++w) {
      workers.push_back(std::thread([&, w]() {
        try {
          size_t b;
          while (!failed && (b = next++) < blocks.size())
            this->fetch_block(pts, blocks.at(b).first, blocks.at(b).second,
                              departure, pref, res);
        } catch (...) {
          errors.at(w) = std::current_exception();
          failed = true;
        }
      }));
    }
    for (std::thread& t : workers) t.join();
    for (const std::exception_ptr& e : errors)
      if (e) std::rethrow_exception(e);
  }

  for (size_t i = 0; i < n; ++i) res.set(i, i, 0, 0);

  print(MessageType::Success)
    << "Matrix built in "
    << std::round(dur_milli(hiclock::now() - t0).count()) << " ms" << std::endl;
  return res;
}

void MatrixBuilder::fetch_block(const vec_t<Point>& pts, size_t oi, size_t di,
                                const std::string& departure,
                                RoutingPreference pref, TravelMatrix& res) {
  const size_t nrows = std::min(batch_size_, pts.size() - oi);
  const size_t ncols = std::min(batch_size_, pts.size() - di);
  const vec_t<Point> origins(pts.begin() + oi, pts.begin() + oi + nrows);
  const vec_t<Point> destinations(pts.begin() + di, pts.begin() + di + ncols);

  count_requests_++;
  const vec_t<MatrixElement> elements =
    provider_.compute(origins, destinations, departure, pref);

  /* Anything the provider does not report stays unreachable */
  for (size_t i = 0; i < nrows; ++i)
    for (size_t j = 0; j < ncols; ++j)
      res.set(oi + i, di + j, UnreachableMinutes, UnreachableMeters);

  for (const MatrixElement& el : elements) {
    if (el.origin_index < 0 || static_cast<size_t>(el.origin_index) >= nrows ||
        el.destination_index < 0 ||
        static_cast<size_t>(el.destination_index) >= ncols) {
      std::ostringstream err;
      err << "route matrix element (" << el.origin_index << ","
          << el.destination_index << ") outside " << nrows << "x" << ncols
          << " block at (" << oi << "," << di << ")";
      throw UpstreamError(err.str(), 502);
    }
    const size_t i = oi + el.origin_index;
    const size_t j = di + el.destination_index;
    if (el.route_exists()) {
      if (el.duration_seconds < 0 || el.distance_meters < 0)
        throw UpstreamError("negative duration or distance at ("
                            + std::to_string(i) + "," + std::to_string(j) + ")",
                            502);
      // nearbyint rounds half to even
      const double mins = std::nearbyint(el.duration_seconds / 60.0);
      res.set(i, j,
              (mins >= UnreachableMinutes ? UnreachableMinutes
                                          : static_cast<Minutes>(mins)),
              el.distance_meters);
    }
  }
  DEBUG(2, { Message trace("matrix");
             trace << "block (" << oi << "," << di << ") " << nrows << "x"
                   << ncols << ": " << elements.size() << " element(s)"
                   << std::endl; });
}

}  // namespace shuttle
