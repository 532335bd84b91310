#include <string>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "libshuttle.h"
#include "fakes.h"
// =============================================================================
// Routes API matrix provider
// =============================================================================
using namespace shuttle;
using namespace shuttle::test;
using json = nlohmann::json;

TEST_CASE("parse_route_matrix", "[provider]") {
  SECTION("reads a JSON array") {
    const std::string text =
      "[{\"originIndex\":1,\"destinationIndex\":2,\"duration\":\"123s\","
      "\"distanceMeters\":4500,\"condition\":\"ROUTE_EXISTS\"}]";
    vec_t<MatrixElement> els = parse_route_matrix(text);
    REQUIRE(els.size() == 1);
    REQUIRE(els.at(0).origin_index == 1);
    REQUIRE(els.at(0).destination_index == 2);
    REQUIRE(els.at(0).duration_seconds == 123);
    REQUIRE(els.at(0).distance_meters == 4500);
    REQUIRE(els.at(0).route_exists());
  }

  SECTION("reads a stream of objects") {
    const std::string text =
      ")]}'\n"
      "[\n"
      "{\"originIndex\":1,\"duration\":\"60s\",\"distanceMeters\":100},\n"
      "{\"destinationIndex\":1,\"duration\":\"90s\",\"distanceMeters\":200},\n"
      "]\n";
    vec_t<MatrixElement> els = parse_route_matrix(text);
    REQUIRE(els.size() == 2);
    REQUIRE(els.at(0).origin_index == 1);
    REQUIRE(els.at(0).destination_index == 0);
    REQUIRE(els.at(1).origin_index == 0);
    REQUIRE(els.at(1).destination_index == 1);
    REQUIRE(els.at(1).duration_seconds == 90);
  }

  SECTION("defaults missing indices to zero") {
    vec_t<MatrixElement> els =
      parse_route_matrix("[{\"duration\":\"5s\",\"distanceMeters\":1}]");
    REQUIRE(els.at(0).origin_index == 0);
    REQUIRE(els.at(0).destination_index == 0);
  }

  SECTION("keeps ROUTE_NOT_FOUND elements") {
    vec_t<MatrixElement> els = parse_route_matrix(
      "[{\"originIndex\":0,\"destinationIndex\":1,"
      "\"condition\":\"ROUTE_NOT_FOUND\"}]");
    REQUIRE(els.size() == 1);
    REQUIRE_FALSE(els.at(0).route_exists());
    REQUIRE_FALSE(els.at(0).has_duration);
  }

  SECTION("an element without a duration is not a route") {
    vec_t<MatrixElement> els =
      parse_route_matrix("[{\"originIndex\":0,\"distanceMeters\":10}]");
    REQUIRE_FALSE(els.at(0).route_exists());
  }

  SECTION("empty text gives no elements") {
    REQUIRE(parse_route_matrix("").empty());
    REQUIRE(parse_route_matrix("  \n ").empty());
  }

  SECTION("error payloads throw") {
    try {
      parse_route_matrix("{\"error\":{\"code\":400,\"message\":\"bad\"}}");
      FAIL("expected UpstreamError");
    } catch (const UpstreamError& e) {
      REQUIRE(e.status() == 502);
      REQUIRE_FALSE(e.retryable());
    }
    REQUIRE_THROWS_AS(
      parse_route_matrix(")]}'\n{\"error\":{\"code\":403}}\n"), UpstreamError);
  }

  SECTION("unreadable lines throw") {
    REQUIRE_THROWS_AS(parse_route_matrix("{\"originIndex\":0}\n{oops\n"),
                      UpstreamError);
    REQUIRE_THROWS_AS(parse_route_matrix("42"), UpstreamError);
  }
}

TEST_CASE("route_matrix_body", "[provider]") {
  const vec_t<Point> origins = {{35.0, 139.0}};
  const vec_t<Point> destinations = {{35.0, 139.0}, {35.5, 139.5}};

  json body = json::parse(route_matrix_body(origins, destinations, "DRIVE", "",
                                            RoutingPreference::TrafficAware));
  REQUIRE(body["origins"].size() == 1);
  REQUIRE(body["destinations"].size() == 2);
  REQUIRE(body["destinations"][1]["waypoint"]["location"]["latLng"]["latitude"]
          == 35.5);
  REQUIRE(body["travelMode"] == "DRIVE");
  REQUIRE(body["routingPreference"] == "TRAFFIC_AWARE");
  REQUIRE_FALSE(body.contains("departureTime"));

  body = json::parse(route_matrix_body(origins, destinations, "DRIVE",
                                       "2026-01-01T09:00:00Z",
                                       RoutingPreference::TrafficUnaware));
  REQUIRE(body["departureTime"] == "2026-01-01T09:00:00Z");
  REQUIRE(body["routingPreference"] == "TRAFFIC_UNAWARE");
}

TEST_CASE("RoutesMatrixProvider", "[provider]") {
  Options opt;
  opt.quiet = true;
  opt.api_key = "k3y";
  FakeHttpClient http;
  RoutesMatrixProvider provider(opt, http);
  const vec_t<Point> pts = {{35.0, 139.0}, {35.1, 139.1}};

  SECTION("posts to the matrix endpoint") {
    http.response = {200, "[{\"originIndex\":0,\"destinationIndex\":1,"
                          "\"duration\":\"60s\",\"distanceMeters\":900}]"};
    vec_t<MatrixElement> els =
      provider.compute(pts, pts, "", RoutingPreference::TrafficAware);
    REQUIRE(els.size() == 1);
    REQUIRE(http.last_url == opt.matrix_url);
    REQUIRE(http.header("X-Goog-Api-Key") == "k3y");
    REQUIRE(http.header("Content-Type") == "application/json");
    REQUIRE(http.header("X-Goog-FieldMask").find("duration") != std::string::npos);
    REQUIRE(http.last_timeout == opt.matrix_timeout);
    REQUIRE(json::parse(http.last_body)["origins"].size() == 2);
  }

  SECTION("server errors are retryable") {
    http.response = {500, "internal"};
    try {
      provider.compute(pts, pts, "", RoutingPreference::TrafficAware);
      FAIL("expected UpstreamError");
    } catch (const UpstreamError& e) {
      REQUIRE(e.status() == 500);
      REQUIRE(e.retryable());
    }
  }

  SECTION("client errors are not") {
    http.response = {400, "{\"error\":{\"message\":\"bad origins\"}}"};
    try {
      provider.compute(pts, pts, "", RoutingPreference::TrafficAware);
      FAIL("expected UpstreamError");
    } catch (const UpstreamError& e) {
      REQUIRE(e.status() == 400);
      REQUIRE_FALSE(e.retryable());
      REQUIRE(std::string(e.what()).find("bad origins") != std::string::npos);
    }
  }

  SECTION("transport failures pass through") {
    http.fail_transport = true;
    REQUIRE_THROWS_AS(
      provider.compute(pts, pts, "", RoutingPreference::TrafficAware),
      UpstreamError);
  }

  SECTION("an API key is required") {
    Options nokey;
    REQUIRE_THROWS_AS(RoutesMatrixProvider(nokey, http), ConfigError);
  }
}
