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
#include <algorithm> /* std::reverse, std::shuffle, std::stable_sort */
#include <chrono>
#include <cmath>
#include <iostream>
#include <random>
#include <string>

#include "libshuttle/classes.h"
#include "libshuttle/debug.h"
#include "libshuttle/error.h"
#include "libshuttle/functions.h"
#include "libshuttle/message.h"
#include "libshuttle/model.h"
#include "libshuttle/options.h"
#include "libshuttle/solver.h"
#include "libshuttle/types.h"

namespace shuttle {

namespace {

ArcCost transit_of(const RoutingModel& mdl) {
  return [&mdl](RteIdx from, RteIdx to) {
    return static_cast<Cost>(mdl.transit(from, to));
  };
}

Cost cost_of(const Solution& sol, const RoutingModel& mdl) {
  Cost cst = 0;
  for (const Route& rte : sol) cst += cost_through(rte, mdl);
  return cst;
}

VehlId owner_of(const Solution& sol, RteIdx idx) {
  for (size_t v = 0; v < sol.size(); ++v)
    if (std::find(sol.at(v).begin(), sol.at(v).end(), idx) != sol.at(v).end())
      return v;
  return -1;
}

Solution empty_solution(const RoutingModel& mdl) {
  Solution sol = {};
  for (VehlId v = 0; v < mdl.vehicle_count(); ++v)
    sol.push_back({mdl.manager().start(v), mdl.manager().end(v)});
  return sol;
}

// A request is named by its head
std::string describe(const RoutingModel& mdl, RteIdx head) {
  const Route seq = mdl.chain(head);
  if (seq.size() == 1) return "stop " + mdl.id_of(head);
  std::string out = (seq.size() == 2 ? "pair (" : "chain (");
  for (size_t k = 0; k < seq.size(); ++k)
    out += (k == 0 ? "" : ", ") + mdl.id_of(seq.at(k));
  return out + ")";
}

struct Insertion {
  Cost cost;
  VehlId vehl;
  Route rte;
};

/* Guided local search. Descends with relocate-request, relocate-node and 2-opt
 * moves on the augmented cost (transit + lambda * arc penalty) to a local
 * optimum, then penalizes the arcs of maximum utility transit/(1+penalty) and
 * descends again, until the deadline. */
class GuidedLocalSearch {
 public:
  GuidedLocalSearch(const RoutingModel& mdl, double coef, tick_t deadline)
      : mdl_(mdl),
        coef_(coef),
        deadline_(deadline),
        lambda_(0),
        penalty_(mdl.manager().num_nodes(),
                 vec_t<int>(mdl.manager().num_nodes(), 0)) {
    augmented_ = [this](RteIdx from, RteIdx to) {
      const NodeIdx a = mdl_.manager().index_to_node(from);
      const NodeIdx b = mdl_.manager().index_to_node(to);
      return static_cast<Cost>(mdl_.transit(from, to))
           + lambda_ * penalty_.at(a).at(b);
    };
  }

  void run(Solution& sol, Solution& best, Cost& best_cost, int& iterations) {
    while (!timeout()) {
      descend(sol);
      const Cost cst = cost_of(sol, mdl_);
      if (cst < best_cost) {
        best = sol;
        best_cost = cst;
        DEBUG(2, { std::cout << "gls(" << iterations << ") new best "
                             << best_cost << std::endl; });
      }
      iterations++;
      if (best_cost == 0) break;
      if (lambda_ == 0) {
        size_t arcs = 0;
        for (const Route& rte : sol) arcs += rte.size() - 1;
        lambda_ = std::max(1LL, static_cast<Cost>(std::llround(
                                  coef_ * cst / static_cast<double>(arcs))));
      }
      if (!penalize(sol)) break;
    }
  }

 private:
  const RoutingModel& mdl_;
  double coef_;
  tick_t deadline_;
  Cost lambda_;
  vec_t<vec_t<int>> penalty_;  // by (node, node)
  ArcCost augmented_;

  bool timeout() const { return hiclock::now() >= deadline_; }

  void descend(Solution& sol) {
    while (!timeout()) {
      bool improved = relocate_requests(sol);
      improved = relocate_nodes(sol) || improved;
      improved = two_opt(sol) || improved;
      if (!improved) break;
    }
  }

  // Move a whole request (a stop, or every stop of a chain of pairs) to its
  // best position on any vehicle.
  bool relocate_requests(Solution& sol) {
    bool improved = false;
    for (const RteIdx& head : mdl_.heads()) {
      if (timeout()) break;
      const VehlId v = owner_of(sol, head);
      if (v == -1) continue;
      const Route seq = mdl_.chain(head);

      Route without = sol.at(v);
      for (const RteIdx& i : seq) opdel(without, i);
      const bool without_ok = chkrte(without, mdl_);
      const Cost gain = cost_through(sol.at(v), augmented_)
                      - cost_through(without, augmented_);

      Cost bestdelta = 0;
      VehlId bestvehl = -1;
      Route bestrte;
      for (VehlId u = 0; u < mdl_.vehicle_count(); ++u) {
        if (u != v && !without_ok) continue;
        Route out;
        const Cost add = sop_insert((u == v ? without : sol.at(u)), seq, mdl_,
                                    augmented_, out);
        if (add == InfCost) continue;
        if (add - gain < bestdelta) {
          bestdelta = add - gain;
          bestvehl = u;
          bestrte = out;
        }
      }
      if (bestvehl != -1) {
        sol.at(v) = without;
        sol.at(bestvehl) = bestrte;
        improved = true;
      }
    }
    return improved;
  }

  // Move one member of a pair within its route.
  bool relocate_nodes(Solution& sol) {
    bool improved = false;
    for (Route& rte : sol) {
      const Route members = rte;
      for (const RteIdx& idx : members) {
        if (timeout()) return improved;
        if (!mdl_.in_pair(idx)) continue;
        Route without = rte;
        opdel(without, idx);
        const Cost gain = cost_through(rte, augmented_)
                        - cost_through(without, augmented_);
        Route out;
        const Cost add = sop_insert(without, idx, -1, mdl_, augmented_, out);
        if (add != InfCost && add - gain < 0) {
          rte = out;
          improved = true;
        }
      }
    }
    return improved;
  }

  // Reverse a segment of one route.
  bool two_opt(Solution& sol) {
    bool improved = false;
    for (Route& rte : sol) {
      if (rte.size() < 4) continue;
      Cost cur = cost_through(rte, augmented_);
      for (size_t i = 1; i + 2 < rte.size(); ++i) {
        if (timeout()) return improved;
        for (size_t j = i + 1; j + 1 < rte.size(); ++j) {
          Route cand = rte;
          std::reverse(cand.begin() + i, cand.begin() + j + 1);
          const Cost cst = cost_through(cand, augmented_);
          if (cst < cur && chkrte(cand, mdl_)) {
            rte = cand;
            cur = cst;
            improved = true;
          }
        }
      }
    }
    return improved;
  }

  // Returns false if no arc has positive utility
  bool penalize(const Solution& sol) {
    double maxutil = 0;
    vec_t<std::pair<NodeIdx, NodeIdx>> arcs = {};
    for (const Route& rte : sol) {
      for (size_t k = 1; k < rte.size(); ++k) {
        const NodeIdx a = mdl_.manager().index_to_node(rte.at(k-1));
        const NodeIdx b = mdl_.manager().index_to_node(rte.at(k));
        const double util = mdl_.transit(rte.at(k-1), rte.at(k))
                          / (1.0 + penalty_.at(a).at(b));
        if (util > maxutil) {
          maxutil = util;
          arcs.clear();
        }
        if (util > 0 && util == maxutil) arcs.push_back(std::make_pair(a, b));
      }
    }
    for (const auto& arc : arcs) penalty_.at(arc.first).at(arc.second)++;
    return !arcs.empty();
  }
};

}  // namespace

Solver::Solver(const Options& opt)
    : print("solver"),
      opts_(opt),
      best_cost_(0),
      count_iterations_(0),
      count_restarts_(0) {
  opt.validate();
}

vec_t<RoutePlan> Solver::solve(const TravelMatrix& matrix,
                               const vec_t<PDPair>& pairs,
                               const VehicleConfig& fleet, NodeIdx depot) {
  return solve(matrix.ids(), matrix.minutes(), pairs, fleet.vehicle_count,
               fleet.capacity, depot);
}

vec_t<RoutePlan> Solver::solve(const vec_t<StopId>& ids,
                               const vec_t<vec_t<Minutes>>& minutes,
                               const vec_t<PDPair>& pairs, int vehicle_count,
                               Load capacity, NodeIdx depot) {
  RoutingModel mdl(ids, minutes, pairs, vehicle_count, capacity, depot, opts_);
  print << "Solving " << ids.size() << " stop(s), " << pairs.size()
        << " pair(s), " << vehicle_count << " vehicle(s) of capacity "
        << capacity << std::endl;
  tick_t t0 = hiclock::now();
  tick_t deadline = t0 + std::chrono::seconds(opts_.search_time_budget);
  best_cost_ = 0;
  count_iterations_ = 0;
  count_restarts_ = 0;

  if (capacity == 0 && !pairs.empty()) {
    print(MessageType::Error) << "capacity 0 cannot carry any pair" << std::endl;
    throw InfeasibleError("no feasible solution: vehicle_capacity is 0 but "
                          + std::to_string(pairs.size())
                          + " pickup/drop pair(s) need a seat");
  }
  if (mdl.cyclic() != -1) {
    print(MessageType::Error) << "pairs form a cycle" << std::endl;
    throw InfeasibleError("no feasible solution: the pairs through "
                          + mdl.id_of(mdl.cyclic())
                          + " form a cycle, so no pickup can come first");
  }

  Solution sol;
  RteIdx failed = construct(mdl, sol);
  if (failed != -1) {
    DEBUG(1, { print << "construction could not place " << describe(mdl, failed)
                     << "; retrying by insertion" << std::endl; });
    // Farthest requests first
    vec_t<RteIdx> reqs = mdl.heads();
    const RteIdx start = mdl.manager().start(0);
    std::stable_sort(reqs.begin(), reqs.end(), [&](RteIdx a, RteIdx b) {
      return mdl.transit(start, a) > mdl.transit(start, b);
    });
    sol = empty_solution(mdl);
    failed = insert_all(mdl, reqs, sol);
  }
  if (failed != -1) {
    DEBUG(1, { print << "insertion could not place " << describe(mdl, failed)
                     << "; restarting at random" << std::endl; });
    // Fixed seed: the same request gives the same routes
    std::mt19937 gen;
    const size_t rcl[] = {2, 3, 5, 0};
    for (size_t k = 0; failed != -1 && hiclock::now() < deadline; ++k)
      failed = restart(mdl, rcl[k % 4], deadline, gen, sol);
  }
  if (failed != -1) {
    print(MessageType::Error) << "no feasible solution after "
                              << count_restarts_ << " restart(s)" << std::endl;
    throw InfeasibleError("no feasible solution: " + describe(mdl, failed)
                          + " cannot be placed on any vehicle within capacity "
                          + std::to_string(capacity) + " and horizon "
                          + std::to_string(mdl.horizon()) + " min");
  }
  best_cost_ = cost_of(sol, mdl);
  DEBUG(1, { print << "initial cost " << best_cost_ << " after "
                   << count_restarts_ << " restart(s)" << std::endl; });

  search(mdl, deadline, sol);

  vec_t<RoutePlan> plans = extract(mdl, sol);
  print(MessageType::Success)
    << "Solved: cost " << best_cost_ << " min after " << count_iterations_
    << " local optima in "
    << std::round(dur_milli(hiclock::now() - t0).count()) << " ms" << std::endl;
  return plans;
}

RteIdx Solver::construct(const RoutingModel& mdl, Solution& sol) {
  const IndexManager& mgr = mdl.manager();
  vec_t<VehlId> owner(mgr.num_indices(), -1);
  sol.clear();

  for (VehlId v = 0; v < mdl.vehicle_count(); ++v) {
    Route rte = {mgr.start(v)};
    Load q = 0;
    Cost t = 0;
    while (true) {
      const RteIdx last = rte.back();
      RteIdx next = -1;
      Cost mincst = InfCost;
      for (size_t c = 0; c < mgr.num_visits(); ++c) {
        if (owner.at(c) != -1) continue;
        if (mdl.is_drop(c) && owner.at(mdl.pickup_of(c)) != v) continue;
        const Load q2 = q + mdl.demand(c);
        if (q2 < 0 || q2 > mdl.capacity()) continue;
        const Cost arc = mdl.transit(last, c);
        if (t + arc + mdl.transit(c, mgr.end(v)) > mdl.horizon()) continue;
        if (arc < mincst) {
          mincst = arc;
          next = c;
        }
      }
      if (next == -1) break;
      rte.push_back(next);
      owner.at(next) = v;
      q += mdl.demand(next);
      t += mincst;
    }
    rte.push_back(mgr.end(v));

    // Chains cut short go back to the pool
    for (const RteIdx& head : mdl.heads()) {
      if (owner.at(head) != v) continue;
      const Route seq = mdl.chain(head);
      if (owner.at(seq.back()) == v) continue;
      for (const RteIdx& i : seq) {
        if (owner.at(i) != v) continue;
        opdel(rte, i);
        owner.at(i) = -1;
      }
    }
    if (!chkrte(rte, mdl)) {
      for (const RteIdx& i : rte) if (!mgr.is_start(i) && !mgr.is_end(i)) owner.at(i) = -1;
      rte = {mgr.start(v), mgr.end(v)};
    }
    DEBUG(2, { std::cout << "construct vehl " << v << ":"; print_rte(rte, mdl); });
    sol.push_back(rte);
  }

  vec_t<RteIdx> leftover = {};
  for (const RteIdx& head : mdl.heads())
    if (owner.at(head) == -1) leftover.push_back(head);
  return insert_all(mdl, leftover, sol);
}

RteIdx Solver::insert_all(const RoutingModel& mdl, const vec_t<RteIdx>& reqs,
                          Solution& sol) {
  const ArcCost transit = transit_of(mdl);
  for (const RteIdx& head : reqs) {
    const Route seq = mdl.chain(head);
    Cost mincst = InfCost;
    VehlId bestvehl = -1;
    Route bestrte;
    for (VehlId v = 0; v < mdl.vehicle_count(); ++v) {
      Route out;
      const Cost cst = sop_insert(sol.at(v), seq, mdl, transit, out);
      if (cst < mincst) {
        mincst = cst;
        bestvehl = v;
        bestrte = out;
      }
    }
    if (bestvehl == -1) return head;
    sol.at(bestvehl) = bestrte;
  }
  return -1;
}

RteIdx Solver::restart(const RoutingModel& mdl, size_t rcl, tick_t deadline,
                       std::mt19937& gen, Solution& sol) {
  const ArcCost transit = transit_of(mdl);
  vec_t<RteIdx> reqs = mdl.heads();
  std::shuffle(reqs.begin(), reqs.end(), gen);
  sol = empty_solution(mdl);
  count_restarts_++;

  for (const RteIdx& head : reqs) {
    if (hiclock::now() >= deadline) return head;
    const Route seq = mdl.chain(head);
    // Feasible insertions by increasing cost, only the rcl cheapest kept
    vec_t<Insertion> cands = {};
    for (VehlId v = 0; v < mdl.vehicle_count(); ++v) {
      sop_each(sol.at(v), seq, transit,
        [&](Cost cst) {
          return rcl == 0 || cands.size() < rcl || cst < cands.back().cost;
        },
        [&](Cost cst, const Route& rte) {
          if (!chkrte(rte, mdl)) return;
          Insertion ins = {cst, v, rte};
          auto at = std::upper_bound(cands.begin(), cands.end(), cst,
            [](Cost c, const Insertion& other) { return c < other.cost; });
          cands.insert(at, ins);
          if (rcl != 0 && cands.size() > rcl) cands.pop_back();
        });
    }
    if (cands.empty()) return head;
    std::uniform_int_distribution<> m(0, static_cast<int>(cands.size()) - 1);
    const Insertion& pick = cands.at(m(gen));
    sol.at(pick.vehl) = pick.rte;
  }
  DEBUG(2, { std::cout << "restart " << count_restarts_ << " placed all "
                       << reqs.size() << " request(s)" << std::endl; });
  return -1;
}

void Solver::search(const RoutingModel& mdl, tick_t deadline, Solution& sol) {
  if (opts_.search_time_budget <= 0 || mdl.manager().num_visits() == 0)
    return;
  GuidedLocalSearch gls(mdl, opts_.gls_lambda_coefficient, deadline);
  Solution best = sol;
  Cost bestcst = cost_of(sol, mdl);
  gls.run(sol, best, bestcst, count_iterations_);
  sol = best;
  best_cost_ = bestcst;
}

vec_t<RoutePlan> Solver::extract(const RoutingModel& mdl,
                                 const Solution& sol) const {
  vec_t<RoutePlan> plans = {};
  for (size_t v = 0; v < sol.size(); ++v) {
    vec_t<Visit> visits = {};
    Minutes t = 0;
    Load q = 0;
    for (size_t k = 0; k < sol.at(v).size(); ++k) {
      const RteIdx i = sol.at(v).at(k);
      if (k > 0) t += mdl.transit(sol.at(v).at(k-1), i);
      q += mdl.demand(i);
      visits.push_back({mdl.id_of(i), mdl.manager().index_to_node(i), t, q});
    }
    plans.push_back(RoutePlan(v, visits));
  }
  return plans;
}

}  // namespace shuttle
