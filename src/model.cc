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
#include <sstream>
#include <string>
#include <unordered_set>

#include "libshuttle/classes.h"
#include "libshuttle/error.h"
#include "libshuttle/model.h"
#include "libshuttle/options.h"
#include "libshuttle/types.h"

namespace shuttle {

/* IndexManager --------------------------------------------------------------*/
IndexManager::IndexManager(size_t num_nodes, int num_vehicles, NodeIdx depot)
    : node_to_index_(num_nodes, -1), num_vehicles_(num_vehicles), depot_(depot) {
  for (size_t node = 0; node < num_nodes; ++node) {
    if (static_cast<NodeIdx>(node) == depot) continue;
    node_to_index_.at(node) = index_to_node_.size();
    index_to_node_.push_back(node);
  }
  for (int v = 0; v < 2 * num_vehicles; ++v)  // starts, then ends
    index_to_node_.push_back(depot);
}

bool IndexManager::is_start(RteIdx i) const {
  return i >= start(0) && i < end(0);
}

bool IndexManager::is_end(RteIdx i) const {
  return i >= end(0) && static_cast<size_t>(i) < num_indices();
}

NodeIdx IndexManager::index_to_node(RteIdx i) const {
  return index_to_node_.at(i);
}

RteIdx IndexManager::node_to_index(NodeIdx node) const {
  return node_to_index_.at(node);
}

/* RoutingModel --------------------------------------------------------------*/
RoutingModel::RoutingModel(const vec_t<StopId>& ids,
                           const vec_t<vec_t<Minutes>>& minutes,
                           const vec_t<PDPair>& pairs, int vehicle_count,
                           Load capacity, NodeIdx depot, const Options& opt)
    : ids_(ids), minutes_(minutes) {
  validate_problem(ids, minutes, pairs, vehicle_count, capacity, depot);
  this->manager_ = IndexManager(ids.size(), vehicle_count, depot);
  this->capacity_ = capacity;
  this->horizon_ = opt.horizon_minutes;
  this->slack_ = opt.slack_minutes;
  this->num_pairs_ = pairs.size();

  // Demand table: +1 per pair picked up, -1 per pair dropped, so the middle
  // of a chain and every unpaired index (depot included) carry 0
  this->demand_ = vec_t<Load>(manager_.num_indices(), 0);
  this->drop_of_ = vec_t<RteIdx>(manager_.num_indices(), -1);
  this->pickup_of_ = vec_t<RteIdx>(manager_.num_indices(), -1);
  for (const PDPair& pair : pairs) {
    const RteIdx p = manager_.node_to_index(pair.first);
    const RteIdx d = manager_.node_to_index(pair.second);
    demand_.at(p) += 1;
    demand_.at(d) -= 1;
    drop_of_.at(p) = d;
    pickup_of_.at(d) = p;
  }

  // Every visit lies on exactly one chain unless its pairs form a cycle
  this->heads_ = {};
  this->cyclic_ = -1;
  vec_t<bool> covered(manager_.num_visits(), false);
  for (size_t i = 0; i < manager_.num_visits(); ++i) {
    if (pickup_of_.at(i) != -1) continue;
    heads_.push_back(i);
    for (const RteIdx& j : chain(i)) covered.at(j) = true;
  }
  for (size_t i = 0; i < covered.size() && cyclic_ == -1; ++i)
    if (!covered.at(i)) cyclic_ = i;
}

vec_t<RteIdx> RoutingModel::chain(RteIdx head) const {
  vec_t<RteIdx> seq = {head};
  RteIdx next = drop_of_.at(head);
  while (next != -1 && next != head && seq.size() <= manager_.num_visits()) {
    seq.push_back(next);
    next = drop_of_.at(next);
  }
  return seq;
}

void validate_problem(const vec_t<StopId>& ids,
                      const vec_t<vec_t<Minutes>>& minutes,
                      const vec_t<PDPair>& pairs, int vehicle_count,
                      Load capacity, NodeIdx depot) {
  const size_t n = ids.size();
  if (n == 0)
    throw InvalidInputError("no stops given");

  std::unordered_set<StopId> seen = {};
  for (const StopId& id : ids)
    if (!seen.insert(id).second)
      throw InvalidInputError("duplicate stop id " + id);

  if (minutes.size() != n)
    throw InvalidInputError("matrix has " + std::to_string(minutes.size())
                            + " rows, expected " + std::to_string(n));
  for (size_t i = 0; i < n; ++i) {
    if (minutes.at(i).size() != n)
      throw InvalidInputError("matrix row " + std::to_string(i) + " has "
                              + std::to_string(minutes.at(i).size())
                              + " columns, expected " + std::to_string(n));
    for (size_t j = 0; j < n; ++j)
      if (minutes.at(i).at(j) < 0)
        throw InvalidInputError("negative travel time from " + ids.at(i)
                                + " to " + ids.at(j));
  }

  validate_fleet(vehicle_count, capacity);
  validate_pairs(n, pairs, depot);
}

void validate_fleet(int vehicle_count, Load capacity) {
  if (vehicle_count < 1)
    throw InvalidInputError("vehicle_count must be >= 1 (got "
                            + std::to_string(vehicle_count) + ")");
  if (capacity < 0)
    throw InvalidInputError("vehicle_capacity must be >= 0 (got "
                            + std::to_string(capacity) + ")");
}

void validate_pairs(size_t n, const vec_t<PDPair>& pairs, NodeIdx depot) {
  if (depot < 0 || static_cast<size_t>(depot) >= n)
    throw InvalidInputError("depot index " + std::to_string(depot)
                            + " out of range");

  vec_t<bool> picked(n, false), dropped(n, false);
  for (const PDPair& pair : pairs) {
    std::ostringstream which;
    which << pair;
    if (pair.first < 0 || static_cast<size_t>(pair.first) >= n ||
        pair.second < 0 || static_cast<size_t>(pair.second) >= n)
      throw InvalidInputError("pair " + which.str() + " index out of range");
    if (pair.first == pair.second)
      throw InvalidInputError("pair " + which.str() + " has pickup == drop");
    if (pair.first == depot || pair.second == depot)
      throw InvalidInputError("pair " + which.str() + " uses the depot");
    if (picked.at(pair.first))
      throw InvalidInputError("pair " + which.str() + " picks up at a stop"
                              " already picked up by another pair");
    if (dropped.at(pair.second))
      throw InvalidInputError("pair " + which.str() + " drops at a stop"
                              " already dropped by another pair");
    picked.at(pair.first) = dropped.at(pair.second) = true;
  }
}

}  // namespace shuttle
