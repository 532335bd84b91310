#include <algorithm>
#include <map>

#include <catch2/catch.hpp>
#include "libshuttle.h"
#include "fakes.h"
// =============================================================================
// Solver
// =============================================================================
using namespace shuttle;
using namespace shuttle::test;

namespace {

Options fast(int budget = 1) {
  Options opt;
  opt.search_time_budget = budget;
  return opt;
}

// Checks every property a returned plan set must have
void require_valid(const vec_t<RoutePlan>& plans, const vec_t<StopId>& ids,
                   const vec_t<vec_t<Minutes>>& minutes,
                   const vec_t<PDPair>& pairs, Load capacity) {
  std::map<StopId, std::pair<VehlId, size_t>> where;  // id -> (vehicle, pos)
  for (const RoutePlan& plan : plans) {
    REQUIRE(plan.size() >= 2);
    REQUIRE(plan.visits().front().stop_id == ids.at(0));
    REQUIRE(plan.visits().back().stop_id == ids.at(0));
    REQUIRE(plan.visits().front().time == 0);
    REQUIRE(plan.visits().front().load == 0);
    REQUIRE(plan.visits().back().load == 0);
    REQUIRE(plan.max_load() <= capacity);
    for (size_t k = 0; k < plan.size(); ++k) {
      const Visit& visit = plan.at(k);
      REQUIRE(visit.load >= 0);
      REQUIRE(visit.load <= capacity);
      REQUIRE(ids.at(visit.node) == visit.stop_id);
      if (k > 0) {
        const Visit& prev = plan.at(k - 1);
        REQUIRE(visit.time == prev.time + minutes.at(prev.node).at(visit.node));
      }
      if (k > 0 && k + 1 < plan.size()) {
        REQUIRE(where.count(visit.stop_id) == 0);  // visited once
        where[visit.stop_id] = std::make_pair(plan.vehicle_id(), k);
      }
    }
    REQUIRE(plan.total_travel_time() == plan.visits().back().time);
  }
  REQUIRE(where.size() == ids.size() - 1);  // every stop visited
  for (const PDPair& pair : pairs) {
    const auto& p = where.at(ids.at(pair.first));
    const auto& d = where.at(ids.at(pair.second));
    REQUIRE(p.first == d.first);    // same vehicle
    REQUIRE(p.second < d.second);   // pickup first
  }
}

Cost total_of(const vec_t<RoutePlan>& plans) {
  Cost total = 0;
  for (const RoutePlan& plan : plans) total += plan.total_travel_time();
  return total;
}

}  // namespace

TEST_CASE("Single vehicle serves three pairs", "[solver]") {
  Solver solver(fast());
  vec_t<RoutePlan> plans =
    solver.solve(sample_ids(), sample_minutes(), sample_pairs(), 1, 3);

  REQUIRE(plans.size() == 1);
  REQUIRE(plans.front().size() == 8);
  require_valid(plans, sample_ids(), sample_minutes(), sample_pairs(), 3);
  REQUIRE(plans.front().total_travel_time() <= 85);
  REQUIRE(solver.best_cost() == total_of(plans));
  REQUIRE(solver.count_iterations() >= 1);
}

TEST_CASE("Two vehicles share the requests", "[solver]") {
  Solver solver(fast());
  vec_t<RoutePlan> plans =
    solver.solve(sample_ids(), sample_minutes(), sample_pairs(), 2, 2);

  REQUIRE(plans.size() == 2);
  REQUIRE(plans.at(0).vehicle_id() == 0);
  REQUIRE(plans.at(1).vehicle_id() == 1);
  require_valid(plans, sample_ids(), sample_minutes(), sample_pairs(), 2);
  REQUIRE(total_of(plans) <= 85);
}

TEST_CASE("Capacity one serves the pairs one at a time", "[solver]") {
  Solver solver(fast());
  vec_t<RoutePlan> plans =
    solver.solve(sample_ids(), sample_minutes(), sample_pairs(), 1, 1);
  require_valid(plans, sample_ids(), sample_minutes(), sample_pairs(), 1);
  REQUIRE(plans.front().max_load() == 1);
}

TEST_CASE("Capacity zero is infeasible", "[solver]") {
  Solver solver(fast());
  REQUIRE_THROWS_AS(
    solver.solve(sample_ids(), sample_minutes(), sample_pairs(), 1, 0),
    InfeasibleError);
}

TEST_CASE("Stops outside any pair are visited too", "[solver]") {
  Solver solver(fast());
  const vec_t<PDPair> pairs = {{1, 2}, {3, 4}};
  vec_t<RoutePlan> plans = solver.solve(sample_ids(), sample_minutes(), pairs, 1, 2);
  require_valid(plans, sample_ids(), sample_minutes(), pairs, 2);
  REQUIRE(plans.front().size() == 8);
}

TEST_CASE("Horizon forces the work onto more vehicles", "[solver]") {
  Options opt = fast();
  opt.horizon_minutes = 70;
  Solver solver(opt);
  vec_t<RoutePlan> plans =
    solver.solve(sample_ids(), sample_minutes(), sample_pairs(), 3, 3);
  require_valid(plans, sample_ids(), sample_minutes(), sample_pairs(), 3);
  int used = 0;
  for (const RoutePlan& plan : plans) {
    REQUIRE(plan.total_travel_time() <= 70);
    if (!plan.empty()) used++;
  }
  REQUIRE(used >= 2);

  SECTION("and is infeasible with one vehicle") {
    REQUIRE_THROWS_AS(
      solver.solve(sample_ids(), sample_minutes(), sample_pairs(), 1, 3),
      InfeasibleError);
  }
}

TEST_CASE("Unused vehicles stay at the depot", "[solver]") {
  Solver solver(fast(0));
  const vec_t<StopId> ids = {"DEPOT", "A", "B"};
  const vec_t<vec_t<Minutes>> minutes = {{0, 4, 6}, {4, 0, 3}, {6, 3, 0}};
  vec_t<RoutePlan> plans = solver.solve(ids, minutes, {{1, 2}}, 3, 1);

  REQUIRE(plans.size() == 3);
  require_valid(plans, ids, minutes, {{1, 2}}, 1);
  int idle = 0;
  for (const RoutePlan& plan : plans) {
    if (plan.empty()) {
      idle++;
      REQUIRE(plan.size() == 2);
      REQUIRE(plan.total_travel_time() == 0);
      REQUIRE(plan.max_load() == 0);
    } else {
      REQUIRE(plan.total_travel_time() == 13);
    }
  }
  REQUIRE(idle == 2);
}

TEST_CASE("Depot alone yields empty routes", "[solver]") {
  Solver solver(fast());
  vec_t<RoutePlan> plans = solver.solve({"DEPOT"}, {{0}}, {}, 2, 2);
  REQUIRE(plans.size() == 2);
  for (const RoutePlan& plan : plans) {
    REQUIRE(plan.size() == 2);
    REQUIRE(plan.empty());
  }
}

TEST_CASE("Unreachable edges", "[solver]") {
  Solver solver(fast());
  const int X = UnreachableMinutes;

  SECTION("are avoided when another order exists") {
    const vec_t<StopId> ids = {"DEPOT", "A", "B", "C"};
    const vec_t<vec_t<Minutes>> minutes = {
      {0, 10, 10, 10}, {10, 0, 10, X}, {10, 10, 0, 10}, {10, X, 10, 0}};
    vec_t<RoutePlan> plans = solver.solve(ids, minutes, {{1, 2}}, 1, 1);
    require_valid(plans, ids, minutes, {{1, 2}}, 1);
    REQUIRE(plans.front().total_travel_time() == 40);
    for (size_t k = 1; k < plans.front().size(); ++k) {
      const NodeIdx a = plans.front().at(k - 1).node;
      const NodeIdx b = plans.front().at(k).node;
      REQUIRE(minutes.at(a).at(b) != X);
    }
  }

  SECTION("make the problem infeasible when unavoidable") {
    const vec_t<StopId> ids = {"DEPOT", "P", "D"};
    const vec_t<vec_t<Minutes>> minutes = {{0, 5, 5}, {5, 0, X}, {5, 5, 0}};
    REQUIRE_THROWS_AS(solver.solve(ids, minutes, {{1, 2}}, 2, 1),
                      InfeasibleError);
  }
}

TEST_CASE("Solver rejects malformed input", "[solver]") {
  Solver solver(fast(0));
  REQUIRE_THROWS_AS(solver.solve({}, {}, {}, 1, 1), InvalidInputError);
  REQUIRE_THROWS_AS(
    solver.solve(sample_ids(), sample_minutes(), sample_pairs(), 0, 1),
    InvalidInputError);
  REQUIRE_THROWS_AS(
    solver.solve(sample_ids(), sample_minutes(), {{1, 7}}, 1, 1),
    InvalidInputError);
  REQUIRE_THROWS_AS(
    solver.solve(sample_ids(), sample_minutes(), {{1, 2}, {1, 3}}, 1, 1),
    InvalidInputError);
}

TEST_CASE("Solver reads a TravelMatrix", "[solver]") {
  Solver solver(fast());
  vec_t<vec_t<Meters>> meters(7, vec_t<Meters>(7, 0));
  TravelMatrix matrix(sample_ids(), sample_minutes(), meters);
  VehicleConfig fleet = {1, 3};
  vec_t<RoutePlan> plans = solver.solve(matrix, sample_pairs(), fleet);
  require_valid(plans, sample_ids(), sample_minutes(), sample_pairs(), 3);
}

TEST_CASE("A tight horizon is met by restarting the insertion", "[solver]") {
  // Only DEPOT S2 S6 S5 S4 S3 S1 DEPOT fits in 82 minutes, and neither
  // cheapest-arc construction nor farthest-first insertion finds it
  const vec_t<StopId> ids = {"DEPOT", "S1", "S2", "S3", "S4", "S5", "S6"};
  const vec_t<vec_t<Minutes>> minutes = {
    {0, 16, 7, 17, 19, 21, 22},
    {16, 0, 10, 21, 23, 20, 9},
    {7, 10, 0, 14, 17, 16, 14},
    {17, 21, 14, 0, 3, 5, 18},
    {19, 23, 17, 3, 0, 6, 20},
    {21, 20, 16, 5, 6, 0, 15},
    {22, 9, 14, 18, 20, 15, 0},
  };
  const vec_t<PDPair> pairs = {{6, 4}, {3, 1}};
  Options opt = fast();
  opt.horizon_minutes = 82;

  SECTION("within the time budget") {
    Solver solver(opt);
    vec_t<RoutePlan> plans = solver.solve(ids, minutes, pairs, 1, 2);
    require_valid(plans, ids, minutes, pairs, 2);
    REQUIRE(solver.count_restarts() >= 1);
    REQUIRE(plans.front().total_travel_time() == 82);
    vec_t<StopId> order = {};
    for (const Visit& visit : plans.front().visits()) order.push_back(visit.stop_id);
    REQUIRE(order == vec_t<StopId>(
      {"DEPOT", "S2", "S6", "S5", "S4", "S3", "S1", "DEPOT"}));
  }

  SECTION("but not without one") {
    opt.search_time_budget = 0;
    Solver solver(opt);
    REQUIRE_THROWS_AS(solver.solve(ids, minutes, pairs, 1, 2), InfeasibleError);
  }
}

TEST_CASE("Pairs chained through a shared stop", "[solver]") {
  // B is where the first rider gets off and the second gets on
  const vec_t<StopId> ids = {"DEPOT", "A", "B", "C"};
  const vec_t<vec_t<Minutes>> minutes = {
    {0, 3, 2, 1}, {3, 0, 1, 2}, {2, 1, 0, 1}, {1, 2, 1, 0}};
  const vec_t<PDPair> pairs = {{1, 2}, {2, 3}};
  Solver solver(fast());

  SECTION("ride one seat in order") {
    vec_t<RoutePlan> plans = solver.solve(ids, minutes, pairs, 1, 1);
    require_valid(plans, ids, minutes, pairs, 1);
    const RoutePlan& plan = plans.front();
    REQUIRE(plan.size() == 5);
    REQUIRE(plan.at(1).stop_id == "A");
    REQUIRE(plan.at(2).stop_id == "B");
    REQUIRE(plan.at(3).stop_id == "C");
    REQUIRE(plan.at(1).load == 1);
    REQUIRE(plan.at(2).load == 1);
    REQUIRE(plan.at(3).load == 0);
    REQUIRE(plan.total_travel_time() == 6);
  }

  SECTION("stay on one vehicle") {
    vec_t<RoutePlan> plans = solver.solve(ids, minutes, pairs, 3, 1);
    require_valid(plans, ids, minutes, pairs, 1);
  }

  SECTION("cannot loop back") {
    REQUIRE_THROWS_AS(solver.solve(ids, minutes, {{1, 2}, {2, 1}}, 1, 1),
                      InfeasibleError);
  }
}

TEST_CASE("Reported times are earliest arrivals whatever the slack", "[solver]") {
  Options tight = fast(0);
  tight.slack_minutes = 0;
  Options loose = fast(0);
  loose.slack_minutes = 120;
  Solver a(tight), b(loose);
  vec_t<RoutePlan> pa =
    a.solve(sample_ids(), sample_minutes(), sample_pairs(), 1, 3);
  vec_t<RoutePlan> pb =
    b.solve(sample_ids(), sample_minutes(), sample_pairs(), 1, 3);

  REQUIRE(pa.front().size() == pb.front().size());
  for (size_t k = 0; k < pa.front().size(); ++k) {
    REQUIRE(pa.front().at(k).stop_id == pb.front().at(k).stop_id);
    REQUIRE(pa.front().at(k).time == pb.front().at(k).time);
  }
  // No waiting: each arrival follows the previous one by the travel time
  require_valid(pa, sample_ids(), sample_minutes(), sample_pairs(), 3);
}
