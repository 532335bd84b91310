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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_CLASSES_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_CLASSES_H_

#include <ostream>
#include <string>
#include <vector>

#include "types.h"

/* -------
 * SUMMARY
 * -------
 * This file contains definitions for the major classes used by Shuttle.
 * These classes are:
 *   - Stop
 *   - TravelMatrix
 *   - VehicleConfig
 *   - Visit
 *   - RoutePlan
 *   - SolveRequest / SolveResponse
 * At the bottom are << overloads
 */

namespace shuttle {

/* Stop is a place a vehicle must visit: a depot, pickup, dropoff, or any
 * other stop. It is located either by a coordinate or by an address to be
 * geocoded. ----------------------------------------------------------------*/
class Stop {
 public:
  /* Constructors */
  Stop() = default;
  Stop(const StopId &);                         // no location (invalid)
  Stop(const StopId &, const Point &);          // located by coordinate
  Stop(const StopId &, const std::string &);    // located by address
  Stop(const StopId &, const Point &, const std::string &);

  const StopId      & id()          const;  // return id
  const Point       & point()       const;  // return coordinate
  const std::string & address()     const;  // return address ("" if none)
        bool          has_point()   const;  // true if coordinate given
        bool          has_address() const;  // true if address non-empty

 private:
  StopId id_;
  Point point_ = {0, 0};
  std::string address_;
  bool has_point_ = false;
};

/* TravelMatrix holds pairwise travel minutes and meters between stops. Row i
 * and column i belong to ids()[i]. Entries with no route hold the sentinels
 * UnreachableMinutes/UnreachableMeters. -------------------------------------*/
class TravelMatrix {
 public:
  /* Constructors */
  TravelMatrix() = default;
  TravelMatrix(const vec_t<StopId> &);  // n x n, all zero
  TravelMatrix(
    const vec_t<StopId> &,          // param1: ids
    const vec_t<vec_t<Minutes>> &,  // param2: minutes (n x n)
    const vec_t<vec_t<Meters>> &    // param3: meters (n x n)
  );

  const vec_t<StopId>         & ids()     const;  // return ids
  const vec_t<vec_t<Minutes>> & minutes() const;  // return minutes
  const vec_t<vec_t<Meters>>  & meters()  const;  // return meters
        size_t                  size()    const;  // return number of stops

  Minutes minutes_at(size_t i, size_t j) const { return minutes_.at(i).at(j); }
  Meters  meters_at(size_t i, size_t j)  const { return meters_.at(i).at(j); }

  void set(size_t i, size_t j, Minutes, Meters);
  void set_ids(const vec_t<StopId> &);
  void print() const;  // print to standard out

  // Equal if both tables are equal (ids are not compared)
  bool operator==(const TravelMatrix & rhs) const {
    return minutes_ == rhs.minutes_ && meters_ == rhs.meters_;
  }

 private:
  vec_t<StopId> ids_;
  vec_t<vec_t<Minutes>> minutes_;
  vec_t<vec_t<Meters>> meters_;
};

/* Fleet settings. Capacity is uniform across vehicles. ----------------------*/
struct VehicleConfig {
  int  vehicle_count;
  Load capacity;
};

/* One position in a RoutePlan. ----------------------------------------------*/
struct Visit {
  StopId  stop_id;
  NodeIdx node;   // position in the stop list
  Minutes time;   // cumulative minutes on arrival
  Load    load;   // load on board after the stop is served
};

/* RoutePlan is the sequence of stops served by one vehicle, from the depot
 * back to the depot. --------------------------------------------------------*/
class RoutePlan {
 public:
  /* Constructors */
  RoutePlan() = default;
  RoutePlan(
    VehlId,       // param1: id of the vehicle (0-based)
    vec_t<Visit>  // param2: visits, depot first and last
  );
  const VehlId       & vehicle_id()        const;  // return owner
  const vec_t<Visit> & visits()            const;  // return visits
  const Visit        & at(size_t)          const;  // return particular Visit
        Minutes        total_travel_time() const;  // time at terminal node
        Load           max_load()          const;  // max load on route
        size_t         size()              const;  // number of visits
        bool           empty()             const;  // true if only the depot
        void           print()             const;  // print to standard out

 private:
  VehlId vehicle_id_;
  vec_t<Visit> visits_;
  Load max_load_;
};

/* SolveRequest is what the engine needs to produce plans from raw stops. ---*/
struct SolveRequest {
  vec_t<Stop>       stops;
  vec_t<PDPair>     pairs;
  int               vehicle_count = 2;
  Load              vehicle_capacity = 2;
  std::string       departure_time = "";  // ISO-8601, "" if none
  RoutingPreference routing_preference = RoutingPreference::TrafficAware;
  bool              require_coordinates = false;
};

struct SolveResponse {
  vec_t<RoutePlan> routes;
};

std::ostream& operator<<(std::ostream& os, const Point &);
std::ostream& operator<<(std::ostream& os, const Stop &);
std::ostream& operator<<(std::ostream& os, const PDPair &);
std::ostream& operator<<(std::ostream& os, const Visit &);
std::ostream& operator<<(std::ostream& os, const RoutePlan &);

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_CLASSES_H_
