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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_SERIALIZE_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_SERIALIZE_H_

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "classes.h"
#include "error.h"
#include "types.h"

namespace shuttle {

/* Engine input ------------------------------------------------------------*/
// {"stops": [{"id", "lat"?, "lng"?, "address"?}, ...],
//  "pickupDropPairs": [[p, d], ...],     indices into stops
//  "vehicleCount"?: 2, "vehicleCapacity"?: 2,
//  "departureTime"?: ISO-8601, "routingPreference"?: "TRAFFIC_AWARE",
//  "requireCoordinates"?: false}
// "points" is read when "stops" is absent, and the snake_case spelling of
// every key is accepted. Throws InvalidInputError on a malformed document.
SolveRequest request_from_json(const nlohmann::json &);

RoutingPreference routing_preference_from_string(const std::string &);


/* Engine output -----------------------------------------------------------*/
// {"vehicleId", "stops": [{"stopId", "loadAtStop", "timeMinutes"}],
//  "totalTravelTimeMinutes", "maxLoad"}
nlohmann::json to_json(const RoutePlan &);

// {"status": "ok", "routes": [...]}
nlohmann::json to_json(const SolveResponse &);

// {"ids", "minutes", "meters"}
nlohmann::json to_json(const TravelMatrix &);

// {"status": "error", "kind", "detail"}; kind is "internal" for exceptions
// outside the Error taxonomy
nlohmann::json error_to_json(const std::exception &);

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_SERIALIZE_H_
