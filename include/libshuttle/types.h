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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_TYPES_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_TYPES_H_

#include <chrono>
#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility> /* std::pair */
#include <vector>

namespace shuttle {

template <typename K, typename V> using dict  = std::unordered_map<K, V>;
template <typename T>             using vec_t = std::vector<T>;

// "StopId" type-class
// Stops are named by the caller; inside the engine they are addressed by
// their position in the stop list (NodeIdx).
typedef std::string StopId;
typedef int         NodeIdx;
typedef int         VehlId;

// Routing index (see model.h). Starts and ends of vehicles get their own
// indices so the depot can appear once per vehicle.
typedef int RteIdx;

// "Lon/Lat" type-class
typedef double Lat;
typedef double Lng;

struct Point {
  Lat lat;
  Lng lng;
};

// unit: minutes / meters
typedef int       Minutes;
typedef int       Meters;
typedef long long Cost;  // objective values (sums of Minutes, plus penalties)

typedef int Load;  // +1 per pickup, -1 per dropoff

// (pickup, dropoff), both NodeIdx into the stop list
typedef std::pair<NodeIdx, NodeIdx> PDPair;

enum class RoutingPreference {
  TrafficAware,    // = 0
  TrafficUnaware,  // = 1
};

// Sentinel costs for origin/destination pairs with no route. Large but finite
// so that the optimizer treats the arc as very expensive instead of invalid.
const Minutes UnreachableMinutes = 1000000;
const Meters  UnreachableMeters  = 1000000000;

// Filepath
typedef std::string Filepath;

// Chrono
typedef std::chrono::milliseconds                                   milli;
typedef std::chrono::duration<double, std::milli>                   dur_milli;
typedef std::chrono::steady_clock                                   hiclock;
typedef std::chrono::time_point<std::chrono::steady_clock>          tick_t;

// Infinity
const int  InfInt  = std::numeric_limits<int>::max();
const Cost InfCost = std::numeric_limits<Cost>::max();

// SQLite
typedef int         SqliteReturnCode;
typedef char*       SqliteErrorMessage;
typedef const char* SqliteQuery;

inline std::string to_string(const RoutingPreference& pref) {
  return (pref == RoutingPreference::TrafficAware ? "TRAFFIC_AWARE"
                                                  : "TRAFFIC_UNAWARE");
}

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_TYPES_H_
