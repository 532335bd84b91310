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
#include <string>

#include <nlohmann/json.hpp>

#include "libshuttle/classes.h"
#include "libshuttle/error.h"
#include "libshuttle/serialize.h"
#include "libshuttle/types.h"

namespace shuttle {

using json = nlohmann::json;

namespace {

// The value under either spelling of a key, or nullptr if absent or null
const json* field(const json& j, const char* camel, const char* snake) {
  auto it = j.find(camel);
  if (it != j.end() && !it->is_null()) return &(*it);
  it = j.find(snake);
  if (it != j.end() && !it->is_null()) return &(*it);
  return nullptr;
}

std::string wrong_type(const std::string& name, const char* expected,
                       const json& v) {
  return "field " + name + " must be " + expected + " (got " + v.dump() + ")";
}

int get_int(const json& v, const std::string& name) {
  if (!v.is_number_integer()) throw InvalidInputError(wrong_type(name, "an integer", v));
  return v.get<int>();
}

double get_double(const json& v, const std::string& name) {
  if (!v.is_number()) throw InvalidInputError(wrong_type(name, "a number", v));
  return v.get<double>();
}

std::string get_string(const json& v, const std::string& name) {
  if (!v.is_string()) throw InvalidInputError(wrong_type(name, "a string", v));
  return v.get<std::string>();
}

bool get_bool(const json& v, const std::string& name) {
  if (!v.is_boolean()) throw InvalidInputError(wrong_type(name, "true or false", v));
  return v.get<bool>();
}

Stop stop_from_json(const json& j, size_t k) {
  const std::string where = "stops[" + std::to_string(k) + "]";
  if (!j.is_object())
    throw InvalidInputError(where + " must be an object");
  const json* id = field(j, "id", "id");
  if (id == nullptr)
    throw InvalidInputError(where + " has no id");
  const StopId sid = get_string(*id, where + ".id");

  const json* lat = field(j, "lat", "lat");
  const json* lng = field(j, "lng", "lng");
  const json* addr = field(j, "address", "address");
  if ((lat == nullptr) != (lng == nullptr))
    throw InvalidInputError("Point " + sid + " has only one of lat/lng");

  const std::string address =
    (addr == nullptr ? "" : get_string(*addr, where + ".address"));
  if (lat != nullptr) {
    Point pt = {get_double(*lat, where + ".lat"), get_double(*lng, where + ".lng")};
    return (address.empty() ? Stop(sid, pt) : Stop(sid, pt, address));
  }
  return (address.empty() ? Stop(sid) : Stop(sid, address));
}

}  // namespace

RoutingPreference routing_preference_from_string(const std::string& s) {
  if (s == "TRAFFIC_AWARE") return RoutingPreference::TrafficAware;
  if (s == "TRAFFIC_UNAWARE") return RoutingPreference::TrafficUnaware;
  throw InvalidInputError("unknown routing preference " + s
                          + " (expected TRAFFIC_AWARE or TRAFFIC_UNAWARE)");
}

SolveRequest request_from_json(const json& j) {
  if (!j.is_object())
    throw InvalidInputError("request must be a JSON object");
  SolveRequest req;

  const json* stops = field(j, "stops", "points");
  if (stops == nullptr)
    throw InvalidInputError("request has no stops");
  if (!stops->is_array())
    throw InvalidInputError(wrong_type("stops", "an array", *stops));
  for (size_t k = 0; k < stops->size(); ++k)
    req.stops.push_back(stop_from_json(stops->at(k), k));

  const json* pairs = field(j, "pickupDropPairs", "pickup_drop_pairs");
  if (pairs != nullptr) {
    if (!pairs->is_array())
      throw InvalidInputError(wrong_type("pickupDropPairs", "an array", *pairs));
    for (size_t k = 0; k < pairs->size(); ++k) {
      const json& pair = pairs->at(k);
      const std::string where = "pickupDropPairs[" + std::to_string(k) + "]";
      if (!pair.is_array() || pair.size() != 2)
        throw InvalidInputError(wrong_type(where, "a [pickup, drop] array", pair));
      req.pairs.push_back(std::make_pair(get_int(pair.at(0), where),
                                         get_int(pair.at(1), where)));
    }
  }

  const json* v = nullptr;
  if ((v = field(j, "vehicleCount", "vehicle_count")) != nullptr)
    req.vehicle_count = get_int(*v, "vehicleCount");
  if ((v = field(j, "vehicleCapacity", "vehicle_capacity")) != nullptr)
    req.vehicle_capacity = get_int(*v, "vehicleCapacity");
  if ((v = field(j, "departureTime", "departure_time")) != nullptr)
    req.departure_time = get_string(*v, "departureTime");
  if ((v = field(j, "routingPreference", "routing_preference")) != nullptr)
    req.routing_preference =
      routing_preference_from_string(get_string(*v, "routingPreference"));
  if ((v = field(j, "requireCoordinates", "require_coordinates")) != nullptr)
    req.require_coordinates = get_bool(*v, "requireCoordinates");
  return req;
}

json to_json(const RoutePlan& plan) {
  json stops = json::array();
  for (const Visit& visit : plan.visits())
    stops.push_back({{"stopId", visit.stop_id},
                     {"loadAtStop", visit.load},
                     {"timeMinutes", visit.time}});
  return {{"vehicleId", plan.vehicle_id()},
          {"stops", stops},
          {"totalTravelTimeMinutes", plan.total_travel_time()},
          {"maxLoad", plan.max_load()}};
}

json to_json(const SolveResponse& resp) {
  json routes = json::array();
  for (const RoutePlan& plan : resp.routes) routes.push_back(to_json(plan));
  return {{"status", "ok"}, {"routes", routes}};
}

json to_json(const TravelMatrix& matrix) {
  return {{"ids", matrix.ids()},
          {"minutes", matrix.minutes()},
          {"meters", matrix.meters()}};
}

json error_to_json(const std::exception& e) {
  json out = {{"status", "error"}, {"kind", "internal"}, {"detail", e.what()}};
  if (const Error* err = dynamic_cast<const Error*>(&e))
    out["kind"] = err->kind();
  if (const ResolutionError* err = dynamic_cast<const ResolutionError*>(&e)) {
    out["address"] = err->address();
    out["providerStatus"] = err->status();
    out["retryable"] = err->retryable();
  }
  if (const UpstreamError* err = dynamic_cast<const UpstreamError*>(&e)) {
    if (err->status() != 0) out["httpStatus"] = err->status();
    out["retryable"] = err->retryable();
  }
  return out;
}

}  // namespace shuttle
