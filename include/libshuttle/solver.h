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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_SOLVER_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_SOLVER_H_

#include <random>

#include "classes.h"
#include "functions.h"
#include "message.h"
#include "model.h"
#include "options.h"
#include "types.h"

namespace shuttle {

typedef vec_t<Route> Solution;  // one route per vehicle

/* Solver plans pickup-and-delivery routes for a uniform fleet that starts and
 * ends at one depot. Every non-depot stop is visited exactly once; pickups
 * come before their drops on the same vehicle; the load stays within the
 * capacity and every arrival time within the horizon. The objective is the
 * total travel time of all vehicles.
 *
 * The search builds a first solution by extending each route along its
 * cheapest feasible arc, inserts whatever is left at its cheapest feasible
 * position, then improves it with guided local search until the time budget
 * runs out. The best solution found is returned.
 *
 * If the greedy passes leave a request unplaced, randomized insertion restarts
 * (shuffled request order, each request at one of its few cheapest feasible
 * positions) run until one places every request or the budget runs out. Local
 * search gets whatever time is left.
 *
 * Throws InvalidInputError on malformed input, InfeasibleError if no feasible
 * solution is found within the budget. */
class Solver {
 public:
  Solver(const Options &);

  vec_t<RoutePlan> solve(
    const vec_t<StopId> &,          // param1: stop ids
    const vec_t<vec_t<Minutes>> &,  // param2: minutes (n x n)
    const vec_t<PDPair> &,          // param3: pickup/drop pairs
    int,                            // param4: vehicle count
    Load,                           // param5: vehicle capacity
    NodeIdx depot = 0               // param6: depot
  );
  vec_t<RoutePlan> solve(const TravelMatrix &, const vec_t<PDPair> &,
                         const VehicleConfig &, NodeIdx depot = 0);

  /* Stats from the last solve */
  Cost best_cost()         const { return best_cost_; }
  int  count_iterations()  const { return count_iterations_; }  // local optima
  int  count_restarts()    const { return count_restarts_; }

 private:
  Message print;
  Options opts_;
  Cost best_cost_;
  int count_iterations_;
  int count_restarts_;

  // These return -1 on success, else the first request (chain head) that
  // could not be placed
  RteIdx construct(const RoutingModel &, Solution &);
  RteIdx insert_all(const RoutingModel &, const vec_t<RteIdx> &, Solution &);
  RteIdx restart(
    const RoutingModel &,
    size_t,                         // param2: candidates kept (0: all)
    tick_t,                         // param3: deadline
    std::mt19937 &,
    Solution &
  );
  void search(const RoutingModel &, tick_t, Solution &);
  vec_t<RoutePlan> extract(const RoutingModel &, const Solution &) const;
};

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_SOLVER_H_
