#include <cmath>
#include <string>
#include <thread>

#include <catch2/catch.hpp>
#include "libshuttle.h"
#include "fakes.h"
// =============================================================================
// MatrixBuilder
// =============================================================================
using namespace shuttle;
using namespace shuttle::test;

namespace {

Options quiet_options() {
  Options opt;
  opt.quiet = true;
  Message::quiet(true);
  return opt;
}

/* Reports an element outside the block it was asked for. */
class StrayIndexProvider : public MatrixProvider {
 public:
  vec_t<MatrixElement> compute(const vec_t<Point>& origins,
                               const vec_t<Point> &, const std::string &,
                               RoutingPreference) {
    MatrixElement el;
    el.origin_index = static_cast<int>(origins.size());
    el.destination_index = 0;
    el.condition = "ROUTE_EXISTS";
    el.has_duration = el.has_distance = true;
    el.duration_seconds = 60;
    el.distance_meters = 100;
    return {el};
  }
};

}  // namespace

TEST_CASE("MatrixBuilder builds a matrix", "[matrix]") {
  Options opt = quiet_options();
  FakeGeocoder geocoder;
  FakeMatrixProvider provider;

  SECTION("from coordinates") {
    MatrixBuilder builder(opt, geocoder, provider);
    TravelMatrix m = builder.build(line_of_stops(3));
    REQUIRE(m.size() == 3);
    REQUIRE(m.ids() == vec_t<StopId>({"DEPOT", "S1", "S2"}));
    for (size_t i = 0; i < 3; ++i) {
      for (size_t j = 0; j < 3; ++j) {
        const int d = std::abs(static_cast<int>(i) - static_cast<int>(j));
        REQUIRE(m.minutes_at(i, j) == d);
        REQUIRE(m.meters_at(i, j) == 1000 * d);
      }
    }
    REQUIRE(provider.calls == 1);
    REQUIRE(builder.count_requests() == 1);
  }

  SECTION("empty stop list") {
    MatrixBuilder builder(opt, geocoder, provider);
    REQUIRE_THROWS_AS(builder.build({}), InvalidInputError);
    REQUIRE(provider.calls == 0);
  }

  SECTION("in batches") {
    opt.batch_size = 2;
    MatrixBuilder small(opt, geocoder, provider);
    TravelMatrix m = small.build(line_of_stops(5));
    REQUIRE(provider.calls == 9);
    REQUIRE(provider.elements == 25);

    FakeMatrixProvider other;
    opt.batch_size = 100;
    MatrixBuilder big(opt, geocoder, other);
    REQUIRE(big.build(line_of_stops(5)) == m);
    REQUIRE(other.calls == 1);
  }

  SECTION("in batches on one worker") {
    opt.batch_size = 2;
    opt.max_workers = 1;
    MatrixBuilder builder(opt, geocoder, provider);
    TravelMatrix m = builder.build(line_of_stops(4));
    REQUIRE(provider.calls == 4);
    REQUIRE(m.minutes_at(0, 3) == 3);
    REQUIRE(m.minutes_at(3, 1) == 2);
  }
}

TEST_CASE("MatrixBuilder converts durations", "[matrix]") {
  Options opt = quiet_options();
  FakeGeocoder geocoder;
  FakeMatrixProvider provider;
  MatrixBuilder builder(opt, geocoder, provider);
  double secs = 0;
  provider.seconds = [&](const Point &, const Point &) { return secs; };

  SECTION("90 seconds round to 2 minutes") {
    secs = 90;
    REQUIRE(builder.build(line_of_stops(2)).minutes_at(0, 1) == 2);
  }
  SECTION("150 seconds round half to even") {
    secs = 150;
    REQUIRE(builder.build(line_of_stops(2)).minutes_at(0, 1) == 2);
  }
  SECTION("89 seconds round to 1 minute") {
    secs = 89;
    REQUIRE(builder.build(line_of_stops(2)).minutes_at(0, 1) == 1);
  }
  SECTION("the diagonal is always zero") {
    secs = 600;
    TravelMatrix m = builder.build(line_of_stops(2));
    REQUIRE(m.minutes_at(0, 0) == 0);
    REQUIRE(m.minutes_at(1, 1) == 0);
    REQUIRE(m.meters_at(1, 1) == 0);
    REQUIRE(m.minutes_at(1, 0) == 10);
  }
}

TEST_CASE("MatrixBuilder fills in unreachable pairs", "[matrix]") {
  Options opt = quiet_options();
  FakeGeocoder geocoder;
  FakeMatrixProvider provider;
  MatrixBuilder builder(opt, geocoder, provider);
  // 0 -> 1 has no route; 1 -> 2 is not reported at all
  provider.seconds = [](const Point& a, const Point& b) {
    const int i = static_cast<int>(std::round((a.lat - 35.0) * 100));
    const int j = static_cast<int>(std::round((b.lat - 35.0) * 100));
    if (i == 0 && j == 1) return -1.0;
    if (i == 1 && j == 2) return std::nan("");
    return 120.0;
  };
  TravelMatrix m = builder.build(line_of_stops(3));
  REQUIRE(m.minutes_at(0, 1) == UnreachableMinutes);
  REQUIRE(m.meters_at(0, 1) == UnreachableMeters);
  REQUIRE(m.minutes_at(1, 2) == UnreachableMinutes);
  REQUIRE(m.meters_at(1, 2) == UnreachableMeters);
  REQUIRE(m.minutes_at(1, 0) == 2);
  REQUIRE(m.minutes_at(2, 1) == 2);
}

TEST_CASE("MatrixBuilder caches matrices", "[matrix]") {
  Options opt = quiet_options();
  FakeGeocoder geocoder;
  FakeMatrixProvider provider;

  SECTION("the same request is served from the cache") {
    MatrixBuilder builder(opt, geocoder, provider);
    TravelMatrix a = builder.build(line_of_stops(3), "2026-01-01T09:00:00Z");
    TravelMatrix b = builder.build(line_of_stops(3), "2026-01-01T09:00:00Z");
    REQUIRE(provider.calls == 1);
    REQUIRE(a == b);
    REQUIRE(builder.cache_size() == 1);
  }

  SECTION("a hit carries the caller's ids") {
    MatrixBuilder builder(opt, geocoder, provider);
    builder.build(line_of_stops(2));
    vec_t<Stop> renamed = {Stop("HQ", line_of_stops(2).at(0).point()),
                           Stop("X", line_of_stops(2).at(1).point())};
    TravelMatrix m = builder.build(renamed);
    REQUIRE(provider.calls == 1);
    REQUIRE(m.ids() == vec_t<StopId>({"HQ", "X"}));
  }

  SECTION("departure and preference are part of the key") {
    MatrixBuilder builder(opt, geocoder, provider);
    builder.build(line_of_stops(3));
    builder.build(line_of_stops(3), "2026-01-01T09:00:00Z");
    builder.build(line_of_stops(3), "", RoutingPreference::TrafficUnaware);
    REQUIRE(provider.calls == 3);
    REQUIRE(builder.cache_size() == 3);
  }

  SECTION("coordinates are rounded for the key") {
    MatrixBuilder builder(opt, geocoder, provider);
    builder.build(line_of_stops(2));
    vec_t<Stop> nudged = line_of_stops(2);
    Point pt = nudged.at(1).point();
    pt.lat += 1e-9;
    nudged.at(1) = Stop("S1", pt);
    builder.build(nudged);
    REQUIRE(provider.calls == 1);
  }

  SECTION("least recently used matrices are evicted") {
    opt.cache_capacity = 1;
    MatrixBuilder builder(opt, geocoder, provider);
    builder.build(line_of_stops(2));
    builder.build(line_of_stops(3));
    builder.build(line_of_stops(2));
    REQUIRE(provider.calls == 3);
    REQUIRE(builder.cache_size() == 1);
  }

  SECTION("clear_cache") {
    MatrixBuilder builder(opt, geocoder, provider);
    builder.build(line_of_stops(2));
    builder.clear_cache();
    REQUIRE(builder.cache_size() == 0);
    builder.build(line_of_stops(2));
    REQUIRE(provider.calls == 2);
  }

  SECTION("failures are not cached") {
    MatrixBuilder builder(opt, geocoder, provider);
    provider.fail = true;
    REQUIRE_THROWS_AS(builder.build(line_of_stops(3)), UpstreamError);
    REQUIRE(builder.cache_size() == 0);
    provider.fail = false;
    REQUIRE(builder.build(line_of_stops(3)).minutes_at(0, 2) == 2);
    REQUIRE(provider.calls == 2);
  }
}

TEST_CASE("cache_key", "[matrix]") {
  const vec_t<Point> pts = {{35.0, 139.0}, {-0.0000001, 0.5}};
  const std::string key =
    MatrixBuilder::cache_key(pts, "T", RoutingPreference::TrafficAware, 6);
  REQUIRE(key == "35.000000,139.000000;0.000000,0.500000;|dep=T|pref=TRAFFIC_AWARE");
  REQUIRE(key != MatrixBuilder::cache_key(pts, "T", RoutingPreference::TrafficUnaware, 6));
}

TEST_CASE("MatrixBuilder resolves stops", "[matrix]") {
  Options opt = quiet_options();
  FakeGeocoder geocoder;
  FakeMatrixProvider provider;
  MatrixBuilder builder(opt, geocoder, provider);
  geocoder.known["Tokyo Station"] = {35.681236, 139.767125};
  geocoder.known["Shinagawa"] = {35.628471, 139.73876};

  SECTION("addresses are geocoded once each") {
    vec_t<Stop> stops = {Stop("DEPOT", Point{35.6, 139.7}),
                         Stop("A", std::string("Tokyo Station")),
                         Stop("B", std::string("Shinagawa")),
                         Stop("C", std::string("Tokyo Station"))};
    vec_t<Point> pts = builder.resolve(stops, false);
    REQUIRE(geocoder.calls == 2);
    REQUIRE(pts.at(1).lat == Approx(35.681236));
    REQUIRE(pts.at(3).lat == Approx(35.681236));
    REQUIRE(pts.at(2).lng == Approx(139.73876));
  }

  SECTION("coordinates win over the address") {
    vec_t<Stop> stops = {Stop("A", Point{35.0, 139.0}, "Tokyo Station")};
    REQUIRE(builder.resolve(stops, false).at(0).lat == 35.0);
    REQUIRE(geocoder.calls == 0);
  }

  SECTION("geocoding can be forbidden") {
    vec_t<Stop> stops = {Stop("DEPOT", Point{35.6, 139.7}),
                         Stop("A", std::string("Tokyo Station"))};
    REQUIRE_THROWS_AS(builder.build(stops, "", RoutingPreference::TrafficAware, true),
                      InvalidInputError);
    REQUIRE(geocoder.calls == 0);
    REQUIRE(provider.calls == 0);
  }

  SECTION("unknown addresses fail") {
    vec_t<Stop> stops = {Stop("A", std::string("Atlantis"))};
    REQUIRE_THROWS_AS(builder.build(stops), ResolutionError);
    REQUIRE(provider.calls == 0);
  }

  SECTION("bad stops") {
    REQUIRE_THROWS_AS(builder.resolve({Stop("A")}, false), InvalidInputError);
    REQUIRE_THROWS_AS(builder.resolve({Stop("A", Point{91, 0})}, false),
                      InvalidInputError);
    REQUIRE_THROWS_AS(builder.resolve({Stop("A", Point{0, -180.5})}, false),
                      InvalidInputError);
    REQUIRE_THROWS_AS(builder.resolve({Stop("A", Point{1, 1}),
                                       Stop("A", Point{2, 2})}, false),
                      InvalidInputError);
  }
}

TEST_CASE("MatrixBuilder under load", "[matrix]") {
  Options opt = quiet_options();
  FakeGeocoder geocoder;
  FakeMatrixProvider provider;

  SECTION("concurrent builds of one key share one computation") {
    provider.delay_ms = 200;
    MatrixBuilder builder(opt, geocoder, provider);
    vec_t<TravelMatrix> results(4);
    vec_t<std::thread> threads = {};
    for (size_t t = 0; t < results.size(); ++t)
      threads.push_back(std::thread([&, t]() {
        results.at(t) = builder.build(line_of_stops(4));
      }));
    for (std::thread& t : threads) t.join();
    REQUIRE(provider.calls == 1);
    for (const TravelMatrix& m : results) {
      REQUIRE(m.size() == 4);
      REQUIRE(m == results.at(0));
    }
  }

  SECTION("concurrent builds of different keys each get their own matrix") {
    provider.delay_ms = 50;
    opt.batch_size = 2;
    MatrixBuilder builder(opt, geocoder, provider);
    vec_t<TravelMatrix> results(4);
    vec_t<std::thread> threads = {};
    for (size_t t = 0; t < results.size(); ++t)
      threads.push_back(std::thread([&, t]() {
        results.at(t) = builder.build(line_of_stops(t + 2));
      }));
    for (std::thread& t : threads) t.join();
    REQUIRE(builder.cache_size() == 4);
    for (size_t t = 0; t < results.size(); ++t) {
      const TravelMatrix& m = results.at(t);
      REQUIRE(m.size() == t + 2);
      for (size_t i = 0; i < m.size(); ++i)
        for (size_t j = 0; j < m.size(); ++j)
          REQUIRE(m.minutes_at(i, j) == static_cast<Minutes>(i > j ? i - j : j - i));
    }
  }

  SECTION("a failing block fails the whole build") {
    opt.batch_size = 2;
    provider.fail = true;
    MatrixBuilder builder(opt, geocoder, provider);
    REQUIRE_THROWS_AS(builder.build(line_of_stops(5)), UpstreamError);
    REQUIRE(builder.cache_size() == 0);
  }

  SECTION("elements outside the block are rejected") {
    StrayIndexProvider stray;
    MatrixBuilder builder(opt, geocoder, stray);
    try {
      builder.build(line_of_stops(2));
      FAIL("expected UpstreamError");
    } catch (const UpstreamError& e) {
      REQUIRE(e.status() == 502);
    }
  }
}
