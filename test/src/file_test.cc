#include <cstdio>
#include <fstream>
#include <stdexcept>

#include <catch2/catch.hpp>
#include "libshuttle.h"
#include "fakes.h"
// =============================================================================
// Request and matrix files
// =============================================================================
using namespace shuttle;
using namespace shuttle::test;

namespace {

void write_text(const Filepath& path, const std::string& text) {
  std::ofstream ofs(path);
  ofs << text;
}

}  // namespace

TEST_CASE("Matrix files", "[file]") {
  const Filepath path = "matrix_test.txt";

  SECTION("written matrices read back") {
    vec_t<vec_t<Meters>> meters(7, vec_t<Meters>(7, 250));
    TravelMatrix out(sample_ids(), sample_minutes(), meters);
    write_matrix(path, out);

    TravelMatrix in;
    REQUIRE(read_matrix(path, in) == 7);
    REQUIRE(in.ids() == sample_ids());
    REQUIRE(in == out);
    std::remove(path.c_str());
  }

  SECTION("meters are optional") {
    write_text(path, "2\nA B\n0 7\n8 0\n");
    TravelMatrix in;
    REQUIRE(read_matrix(path, in) == 2);
    REQUIRE(in.minutes_at(1, 0) == 8);
    REQUIRE(in.meters_at(0, 1) == 0);
    std::remove(path.c_str());
  }

  SECTION("malformed files") {
    TravelMatrix in;
    write_text(path, "0\n");
    REQUIRE_THROWS_AS(read_matrix(path, in), InvalidInputError);
    write_text(path, "2\nA\n");
    REQUIRE_THROWS_AS(read_matrix(path, in), InvalidInputError);
    write_text(path, "2\nA B\n0 1 2\n");
    REQUIRE_THROWS_AS(read_matrix(path, in), InvalidInputError);
    write_text(path, "2\nA B\n0 1\n1 0\n5 6\n");
    REQUIRE_THROWS_AS(read_matrix(path, in), InvalidInputError);
    std::remove(path.c_str());
  }

  SECTION("missing file") {
    TravelMatrix in;
    REQUIRE_THROWS_AS(read_matrix("no_such_matrix.txt", in), std::runtime_error);
  }
}

TEST_CASE("Request files", "[file]") {
  const Filepath path = "request_test.json";

  SECTION("read a request") {
    write_text(path, R"({"stops": [{"id": "DEPOT", "lat": 35, "lng": 139},
                                   {"id": "P", "lat": 35.1, "lng": 139},
                                   {"id": "D", "lat": 35.2, "lng": 139}],
                         "pickupDropPairs": [[1, 2]], "vehicleCount": 1})");
    SolveRequest req;
    REQUIRE(read_request(path, req) == 3);
    REQUIRE(req.pairs.size() == 1);
    REQUIRE(req.vehicle_count == 1);
    std::remove(path.c_str());
  }

  SECTION("not JSON") {
    write_text(path, "stops: none");
    SolveRequest req;
    REQUIRE_THROWS_AS(read_request(path, req), InvalidInputError);
    std::remove(path.c_str());
  }

  SECTION("missing file") {
    SolveRequest req;
    REQUIRE_THROWS_AS(read_request("no_such_request.json", req),
                      std::runtime_error);
  }
}
