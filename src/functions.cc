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
#include <iostream>
#include <unordered_map>

#include "libshuttle/debug.h"
#include "libshuttle/functions.h"
#include "libshuttle/model.h"
#include "libshuttle/types.h"

namespace shuttle {

/* Print ---------------------------------------------------------------------*/
void print_rte(const Route& rte, const RoutingModel& mdl) {
  vec_t<Minutes> cumul;
  cumul_through(rte, mdl, cumul);
  for (size_t i = 0; i < rte.size(); ++i)
    std::cout << " (" << cumul.at(i) << "|" << mdl.id_of(rte.at(i)) << ")";
  std::cout << std::endl;
}


/* Route operations ----------------------------------------------------------*/
Cost cost_through(const Route& rte, const ArcCost& arc) {
  Cost cst = 0;
  for (size_t i = 1; i < rte.size(); ++i)
    cst += arc(rte.at(i-1), rte.at(i));
  return cst;
}

Cost cost_through(const Route& rte, const RoutingModel& mdl) {
  Cost cst = 0;
  for (size_t i = 1; i < rte.size(); ++i)
    cst += mdl.transit(rte.at(i-1), rte.at(i));
  return cst;
}

void cumul_through(const Route& rte, const RoutingModel& mdl,
                   vec_t<Minutes>& cumul) {
  cumul.clear();
  if (rte.empty()) return;
  cumul.push_back(0);
  for (size_t i = 1; i < rte.size(); ++i)
    cumul.push_back(cumul.back() + mdl.transit(rte.at(i-1), rte.at(i)));
}

bool chkpc(const Route& rte, const RoutingModel& mdl) {
  const IndexManager& mgr = mdl.manager();
  if (rte.size() < 2 || !mgr.is_start(rte.front()) || !mgr.is_end(rte.back())) {
    DEBUG(3, { std::cout << "chkpc() route does not run start to end" << std::endl; });
    return false;
  }

  std::unordered_map<RteIdx, size_t> pos = {};
  for (size_t i = 0; i < rte.size(); ++i) {
    // Starts and ends cannot appear in the interior
    if (i > 0 && i < rte.size() - 1 &&
        (mgr.is_start(rte.at(i)) || mgr.is_end(rte.at(i)))) {
      DEBUG(3, { std::cout << "chkpc() vehicle terminal in interior" << std::endl; });
      return false;
    }
    pos[rte.at(i)] = i;
  }

  // Each pair is checked from its pickup
  for (size_t i = 1; i < rte.size() - 1; ++i) {
    if (mdl.is_drop(rte.at(i)) && !pos.count(mdl.pickup_of(rte.at(i)))) {
      DEBUG(3, { std::cout << "chkpc() " << mdl.id_of(rte.at(i))
                           << " without its pickup" << std::endl; });
      return false;
    }
    if (!mdl.is_pickup(rte.at(i))) continue;
    auto j = pos.find(mdl.drop_of(rte.at(i)));
    if (j == pos.end()) {
      DEBUG(3, { std::cout << "chkpc() " << mdl.id_of(rte.at(i))
                           << " without its drop" << std::endl; });
      return false;
    }
    if (j->second < i) {
      DEBUG(3, { std::cout << "chkpc() drop before pickup at "
                           << mdl.id_of(rte.at(i)) << std::endl; });
      return false;
    }
  }
  return true;
}

bool chkcap(const Route& rte, const RoutingModel& mdl) {
  Load q = 0;  // load on board
  for (const RteIdx& i : rte) {
    q += mdl.demand(i);
    if (q < 0 || q > mdl.capacity()) {
      DEBUG(3, { std::cout << "chkcap() failed at " << mdl.id_of(i)
                           << "; q=" << q << std::endl; });
      return false;
    }
  }
  return true;
}

bool chkhz(const Route& rte, const RoutingModel& mdl) {
  // Transit is non-negative so cumuls never decrease; the last is the largest
  return cost_through(rte, mdl) <= mdl.horizon();
}


/* Schedule operations -------------------------------------------------------*/
void opdel(Route& rte, RteIdx idx) {
  Route out = {};
  for (const RteIdx& i : rte)
    if (i != idx) out.push_back(i);
  rte = out;
}

namespace {

// seq[from, to) goes right before rte[pos]
struct Placement {
  size_t pos;
  size_t from;
  size_t to;
};

// Places seq[k...] at positions >= minpos. A group of consecutive sequence
// elements may share a position; the next group goes strictly later.
void place(const Route& rte, const Route& seq, const ArcCost& arc,
           size_t k, size_t minpos, Cost cst, vec_t<Placement>& placed,
           const CostFilter& want, const RouteSink& take) {
  if (k == seq.size()) {
    if (!want(cst)) return;
    Route out = {};
    out.reserve(rte.size() + seq.size());
    size_t g = 0;
    for (size_t i = 0; i < rte.size(); ++i) {
      if (g < placed.size() && placed.at(g).pos == i) {
        out.insert(out.end(), seq.begin() + placed.at(g).from,
                              seq.begin() + placed.at(g).to);
        g++;
      }
      out.push_back(rte.at(i));
    }
    take(cst, out);
    return;
  }
  // Position p means "before rte[p]"; the start (0) never moves
  for (size_t p = minpos; p < rte.size(); ++p) {
    const RteIdx a = rte.at(p-1);
    const RteIdx b = rte.at(p);
    Cost inner = arc(a, seq.at(k));
    for (size_t e = k; e < seq.size(); ++e) {
      if (e > k) inner += arc(seq.at(e-1), seq.at(e));
      placed.push_back({p, k, e + 1});
      place(rte, seq, arc, e + 1, p + 1,
            cst + inner + arc(seq.at(e), b) - arc(a, b), placed, want, take);
      placed.pop_back();
    }
  }
}

}  // namespace

void sop_each(const Route& rte, const Route& seq, const ArcCost& arc,
              const CostFilter& want, const RouteSink& take) {
  if (rte.size() < 2) return;
  vec_t<Placement> placed = {};
  place(rte, seq, arc, 0, 1, 0, placed, want, take);
}

Cost sop_insert(const Route& rte, const Route& seq, const RoutingModel& mdl,
                const ArcCost& arc, Route& rteout) {
  Cost mincst = InfCost;
  rteout.clear();
  sop_each(rte, seq, arc,
    [&](Cost cst) { return cst < mincst; },
    [&](Cost cst, const Route& mutrte) {
      if (chkrte(mutrte, mdl)) {
        mincst = cst;
        rteout = mutrte;
      }
    });
  return mincst;
}

Cost sop_insert(const Route& rte, RteIdx first, RteIdx second,
                const RoutingModel& mdl, const ArcCost& arc, Route& rteout) {
  Route seq = {first};
  if (second != -1) seq.push_back(second);
  return sop_insert(rte, seq, mdl, arc, rteout);
}

Cost sop_insert(const Route& rte, RteIdx first, RteIdx second,
                const RoutingModel& mdl, Route& rteout) {
  ArcCost arc = [&mdl](RteIdx from, RteIdx to) {
    return static_cast<Cost>(mdl.transit(from, to));
  };
  return sop_insert(rte, first, second, mdl, arc, rteout);
}

}  // namespace shuttle
