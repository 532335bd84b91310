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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_MODEL_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_MODEL_H_

#include "classes.h"
#include "options.h"
#include "types.h"

namespace shuttle {

/* IndexManager maps routing indices to stop (node) indices. There is one
 * routing index per non-depot node, then one start index per vehicle, then
 * one end index per vehicle; all start and end indices map to the depot.
 *
 *   nodes    0(depot) 1 2 3          vehicles 2
 *   indices  0->1 1->2 2->3 | 3,4 -> 0 (starts) | 5,6 -> 0 (ends) */
class IndexManager {
 public:
  IndexManager() = default;
  IndexManager(size_t num_nodes, int num_vehicles, NodeIdx depot);

  size_t  num_nodes()   const { return node_to_index_.size(); }
  int     num_vehicles()const { return num_vehicles_; }
  size_t  num_indices() const { return index_to_node_.size(); }
  size_t  num_visits()  const { return num_nodes() - 1; }  // non-depot
  NodeIdx depot()       const { return depot_; }

  RteIdx start(VehlId v) const { return static_cast<RteIdx>(num_visits()) + v; }
  RteIdx end(VehlId v)   const { return static_cast<RteIdx>(num_visits()) + num_vehicles_ + v; }
  bool   is_start(RteIdx i) const;
  bool   is_end(RteIdx i)   const;

  NodeIdx index_to_node(RteIdx) const;
  RteIdx  node_to_index(NodeIdx) const;  // -1 for the depot

 private:
  vec_t<NodeIdx> index_to_node_;
  vec_t<RteIdx> node_to_index_;
  int num_vehicles_ = 0;
  NodeIdx depot_ = 0;
};

/* RoutingModel is one routing problem: transit minutes, the capacity and
 * time dimensions, and the pickup-and-delivery pairs, all expressed over
 * routing indices. Demands and partners are looked up from tables computed
 * once in the constructor.
 *
 * A stop may be the drop of one pair and the pickup of the next, so pairs
 * link into chains: (A, B) and (B, C) make the chain A B C, visited in that
 * order by one vehicle. B boards one seat and frees one, so its demand is 0.
 *
 * Reported times are earliest arrivals. slack_max() is the waiting allowed at
 * a stop; nothing here schedules a wait, so it never constrains a route.
 *
 * The constructor validates its input and throws InvalidInputError. */
class RoutingModel {
 public:
  RoutingModel(
    const vec_t<StopId> &,          // param1: stop ids
    const vec_t<vec_t<Minutes>> &,  // param2: minutes (n x n)
    const vec_t<PDPair> &,          // param3: pickup/drop node pairs
    int,                            // param4: number of vehicles
    Load,                           // param5: capacity per vehicle
    NodeIdx,                        // param6: depot node
    const Options &                 // param7: slack, horizon
  );

  const IndexManager  & manager()   const { return manager_; }
  const vec_t<StopId> & ids()       const { return ids_; }
  const StopId        & id_of(RteIdx i) const { return ids_.at(manager_.index_to_node(i)); }

  Minutes transit(RteIdx from, RteIdx to) const {
    return minutes_.at(manager_.index_to_node(from)).at(manager_.index_to_node(to));
  }
  Load   demand(RteIdx i)     const { return demand_.at(i); }
  RteIdx drop_of(RteIdx i)    const { return drop_of_.at(i); }    // -1 if none
  RteIdx pickup_of(RteIdx i)  const { return pickup_of_.at(i); }  // -1 if none
  bool   is_pickup(RteIdx i)  const { return drop_of_.at(i) != -1; }
  bool   is_drop(RteIdx i)    const { return pickup_of_.at(i) != -1; }
  bool   in_pair(RteIdx i)    const { return is_pickup(i) || is_drop(i); }

  // The indices linked to head by pairs, in visiting order ({head} if it is
  // in no pair). A head is a visit that is not the drop of any pair.
  vec_t<RteIdx> chain(RteIdx head) const;
  const vec_t<RteIdx> & heads() const { return heads_; }
  // A visit whose pairs loop back to it (-1 if there is none). Such pairs can
  // never be ordered.
  RteIdx cyclic() const { return cyclic_; }

  int     vehicle_count() const { return manager_.num_vehicles(); }
  Load    capacity()      const { return capacity_; }
  Minutes horizon()       const { return horizon_; }
  Minutes slack_max()     const { return slack_; }
  size_t  num_pairs()     const { return num_pairs_; }

 private:
  vec_t<StopId> ids_;
  vec_t<vec_t<Minutes>> minutes_;
  IndexManager manager_;
  vec_t<Load> demand_;      // by routing index
  vec_t<RteIdx> drop_of_;   // by routing index
  vec_t<RteIdx> pickup_of_; // by routing index
  vec_t<RteIdx> heads_;
  RteIdx cyclic_;
  Load capacity_;
  Minutes horizon_;
  Minutes slack_;
  size_t num_pairs_;
};

/* Throws InvalidInputError if the problem is malformed: no stops, matrix not
 * n x n or negative, no vehicles, negative capacity, depot or pair index out
 * of range, a pair with pickup == drop, a pair on the depot, a stop that is
 * the pickup of two pairs or the drop of two pairs. */
void validate_problem(const vec_t<StopId> &, const vec_t<vec_t<Minutes>> &,
                      const vec_t<PDPair> &, int, Load, NodeIdx);
void validate_fleet(int, Load);                             // count, capacity
void validate_pairs(size_t, const vec_t<PDPair> &, NodeIdx);  // n, pairs, depot

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_MODEL_H_
