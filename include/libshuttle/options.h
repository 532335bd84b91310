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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_OPTIONS_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_OPTIONS_H_

#include <string>

#include "types.h"

namespace shuttle {

struct Options {
    /* Routing engine -------------------------------------------------------*/

    // Waiting allowed at each stop (time dimension slack). Stops have no time
    // windows, so routes never wait: reported times are earliest arrivals
    // and this only bounds what a caller may add when scheduling.
    Minutes slack_minutes = 30;

    // No cumulative time on any route may exceed this.
    Minutes horizon_minutes = 1440;

    // Wall-clock seconds given to the local search. The search always runs
    // to this cutoff unless no improving or penalizing move remains.
    int search_time_budget = 10;

    // Guided local search: lambda = coefficient * (cost / arcs) of the first
    // solution.
    double gls_lambda_coefficient = 0.1;

    /* Matrix builder -------------------------------------------------------*/

    // Max origins (and destinations) per provider request.
    size_t batch_size = 100;

    // Max computed matrices kept in memory (least-recently-used eviction).
    size_t cache_capacity = 256;

    // Max concurrent provider requests during one build.
    size_t max_workers = 4;

    // Coordinates are rounded to this many decimals to form the cache key.
    int coordinate_precision = 6;

    std::string travel_mode = "DRIVE";

    /* Providers ------------------------------------------------------------*/
    std::string api_key = "";
    std::string language = "ja";
    std::string region = "JP";
    std::string geocode_url =
      "https://maps.googleapis.com/maps/api/geocode/json";
    std::string matrix_url =
      "https://routes.googleapis.com/distanceMatrix/v2:computeRouteMatrix";
    long geocode_timeout = 20;  // seconds
    long matrix_timeout = 90;   // seconds

    /* Output ---------------------------------------------------------------*/

    // The command-line tool saves solved plans into this SQLite file (empty:
    // do not save). Shuttle itself never writes it.
    Filepath path_to_save = "";

    // Set to TRUE to silence all Message output
    bool quiet = false;

    // Throws ConfigError if any setting is out of range.
    void validate() const;
};

} // namespace shuttle

#endif // SHUTTLE_INCLUDE_LIBSHUTTLE_OPTIONS_H_
