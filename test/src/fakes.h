#ifndef SHUTTLE_TEST_SRC_FAKES_H_
#define SHUTTLE_TEST_SRC_FAKES_H_

#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "libshuttle.h"

namespace shuttle {
namespace test {

/* Returns a scripted response and remembers the last request. */
class FakeHttpClient : public HttpClient {
 public:
  HttpResponse response = {200, ""};
  bool fail_transport = false;
  int calls = 0;

  std::string last_url;
  HttpParams last_params;
  HttpHeaders last_headers;
  std::string last_body;
  long last_timeout = 0;

  HttpResponse get(const std::string& url, const HttpParams& params,
                   long timeout) {
    calls++;
    last_url = url;
    last_params = params;
    last_timeout = timeout;
    if (fail_transport) throw UpstreamError("connection refused", 0, true);
    return response;
  }

  HttpResponse post(const std::string& url, const HttpHeaders& headers,
                    const std::string& body, long timeout) {
    calls++;
    last_url = url;
    last_headers = headers;
    last_body = body;
    last_timeout = timeout;
    if (fail_transport) throw UpstreamError("connection refused", 0, true);
    return response;
  }

  std::string param(const std::string& key) const {
    for (const auto& kv : last_params) if (kv.first == key) return kv.second;
    return "";
  }
  std::string header(const std::string& key) const {
    for (const auto& kv : last_headers) if (kv.first == key) return kv.second;
    return "";
  }
};

/* Resolves addresses from a table; anything else is ZERO_RESULTS. */
class FakeGeocoder : public Geocoder {
 public:
  dict<std::string, Point> known;
  std::atomic<int> calls;

  FakeGeocoder() : calls(0) {}

  Point resolve(const std::string& address) {
    calls++;
    auto it = known.find(address);
    if (it == known.end()) throw ResolutionError(address, "ZERO_RESULTS");
    return it->second;
  }
};

/* Travel time from coordinates. By default one minute per 0.01 degree of
 * latitude plus longitude, and 1000 meters per minute.
 *
 * seconds() may return a negative value for ROUTE_NOT_FOUND, or NaN to leave
 * the element out of the response. */
class FakeMatrixProvider : public MatrixProvider {
 public:
  std::function<double(const Point &, const Point &)> seconds;
  std::atomic<int> calls;
  std::atomic<int> elements;
  bool fail = false;
  int delay_ms = 0;

  FakeMatrixProvider() : calls(0), elements(0) {
    seconds = [](const Point& a, const Point& b) {
      return 60 * std::round((std::fabs(a.lat - b.lat) + std::fabs(a.lng - b.lng)) * 100);
    };
  }

  vec_t<MatrixElement> compute(const vec_t<Point>& origins,
                               const vec_t<Point>& destinations,
                               const std::string &, RoutingPreference) {
    calls++;
    if (delay_ms > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    if (fail) throw UpstreamError("Routes API HTTP 503: unavailable", 503, true);
    vec_t<MatrixElement> out = {};
    for (size_t i = 0; i < origins.size(); ++i) {
      for (size_t j = 0; j < destinations.size(); ++j) {
        const double secs = seconds(origins.at(i), destinations.at(j));
        if (std::isnan(secs)) continue;
        MatrixElement el;
        el.origin_index = i;
        el.destination_index = j;
        el.condition = (secs < 0 ? "ROUTE_NOT_FOUND" : "ROUTE_EXISTS");
        el.has_duration = (secs >= 0);
        el.duration_seconds = (secs >= 0 ? secs : 0);
        el.has_distance = (secs >= 0);
        el.distance_meters = (secs >= 0 ? static_cast<Meters>(secs / 60 * 1000) : 0);
        out.push_back(el);
        elements++;
      }
    }
    return out;
  }
};

/* Stops k = 0..n-1 at latitude 35 + 0.01k, so the default provider gives
 * |i - j| minutes between stops i and j. Stop 0 is "DEPOT". */
inline vec_t<Stop> line_of_stops(size_t n) {
  vec_t<Stop> stops = {};
  for (size_t k = 0; k < n; ++k) {
    Point pt = {35.0 + 0.01 * k, 139.0};
    stops.push_back(Stop(k == 0 ? "DEPOT" : "S" + std::to_string(k), pt));
  }
  return stops;
}

/* The seven-stop example: a depot and three pickup/drop pairs. */
inline vec_t<StopId> sample_ids() {
  return {"DEPOT", "R001_P", "R001_D", "R002_P", "R002_D", "R003_P", "R003_D"};
}

inline vec_t<vec_t<Minutes>> sample_minutes() {
  return {
    {0, 10, 15, 20, 25, 30, 35},
    {10, 0, 5, 20, 25, 30, 35},
    {15, 5, 0, 15, 20, 25, 30},
    {20, 20, 15, 0, 5, 10, 15},
    {25, 25, 20, 5, 0, 10, 15},
    {30, 30, 25, 10, 10, 0, 5},
    {35, 35, 30, 15, 15, 5, 0},
  };
}

inline vec_t<PDPair> sample_pairs() {
  return {{1, 2}, {3, 4}, {5, 6}};
}

}  // namespace test
}  // namespace shuttle

#endif  // SHUTTLE_TEST_SRC_FAKES_H_
