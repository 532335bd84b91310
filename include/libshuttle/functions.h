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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_FUNCTIONS_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_FUNCTIONS_H_
#include <functional>

#include "model.h"
#include "types.h"

/* Routes in this file are vectors of routing indices (see IndexManager) that
 * begin at a vehicle start index and end at its end index. */

namespace shuttle {

typedef vec_t<RteIdx> Route;

// Cost of travelling arc (from, to)
typedef std::function<Cost(RteIdx, RteIdx)> ArcCost;

// Insertion callbacks: whether an added cost is worth building the route for,
// and what to do with the route once it is built
typedef std::function<bool(Cost)> CostFilter;
typedef std::function<void(Cost, const Route &)> RouteSink;

/* Print ---------------------------------------------------------------------*/
void print_rte(const Route &, const RoutingModel &);


/* Route operations ----------------------------------------------------------*/
Cost cost_through(const Route &, const ArcCost &);
Cost cost_through(const Route &, const RoutingModel &);  // transit minutes

// Earliest arrival time at each position of the route
void cumul_through(const Route &, const RoutingModel &, vec_t<Minutes> &);

bool chkpc(const Route &, const RoutingModel &);   // pairs on route, in order
bool chkcap(const Route &, const RoutingModel &);  // load in [0, capacity]
bool chkhz(const Route &, const RoutingModel &);   // cumuls <= horizon
inline bool chkrte(const Route& rte, const RoutingModel& mdl) {
  return chkpc(rte, mdl) && chkcap(rte, mdl) && chkhz(rte, mdl);
}


/* Schedule operations -------------------------------------------------------*/
// Remove a routing index (and nothing else) from the route
void opdel(Route &, RteIdx);

// Every way to insert a sequence into a route, keeping the order of both.
// Routes are built only for added costs the filter accepts, then handed to
// the sink. Feasibility is not checked.
void sop_each(
  const Route &,          // param1: route (start ... end)
  const Route &,          // param2: sequence to insert
  const ArcCost &,
  const CostFilter &,
  const RouteSink &
);

// Insert a sequence (a chain of pairs, or a single stop) at the feasible
// positions of least added cost. Returns the added cost and the new route in
// the last param, or InfCost if no position is feasible.
Cost sop_insert(const Route &, const Route &, const RoutingModel &,
                const ArcCost &, Route &);

// Same, for a pickup and its drop, or a single stop if second == -1
Cost sop_insert(
  const Route &,          // param1: route (start ... end)
        RteIdx,           // param2: first index (pickup, or single stop)
        RteIdx,           // param3: second index (drop), or -1
  const RoutingModel &,
  const ArcCost &,        // param5: cost used to rank positions
        Route &           // param6: output route
);
Cost sop_insert(const Route &, RteIdx, RteIdx, const RoutingModel &, Route &);

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_FUNCTIONS_H_
