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
#include <cstdlib>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "libshuttle/debug.h"
#include "libshuttle/error.h"
#include "libshuttle/message.h"
#include "libshuttle/provider.h"
#include "libshuttle/types.h"

namespace shuttle {

using json = nlohmann::json;

namespace {

const size_t ERROR_EXCERPT = 400;
const size_t LINE_EXCERPT = 160;

std::string excerpt(const std::string& s, size_t n) {
  return (s.size() > n ? s.substr(0, n) : s);
}

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

// "123s" -> 123.0; plain numbers are accepted too
bool read_duration(const json& j, double& out) {
  if (j.is_number()) {
    out = j.get<double>();
    return true;
  }
  if (!j.is_string()) return false;
  std::string s = j.get<std::string>();
  if (!s.empty() && s.back() == 's') s.pop_back();
  if (s.empty()) return false;
  char* end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return end != nullptr && *end == '\0';
}

MatrixElement to_element(const json& obj) {
  if (!obj.is_object())
    throw UpstreamError("route matrix element is not an object: "
                        + excerpt(obj.dump(), LINE_EXCERPT), 502);
  if (obj.contains("error"))
    throw UpstreamError("route matrix error: "
                        + excerpt(obj.dump(), ERROR_EXCERPT), 502);

  MatrixElement el;
  try {
    // proto3 JSON omits zero-valued fields, so a missing index means 0
    el.origin_index = obj.value("originIndex", 0);
    el.destination_index = obj.value("destinationIndex", 0);
    el.condition = obj.value("condition", std::string("ROUTE_EXISTS"));
  } catch (const json::exception& e) {
    throw UpstreamError(std::string("malformed route matrix element (")
                        + e.what() + "): " + excerpt(obj.dump(), LINE_EXCERPT),
                        502);
  }
  el.has_duration = obj.contains("duration")
                 && read_duration(obj["duration"], el.duration_seconds);
  if (!el.has_duration) el.duration_seconds = 0;
  el.has_distance = obj.contains("distanceMeters")
                 && obj["distanceMeters"].is_number();
  el.distance_meters = (el.has_distance
                          ? static_cast<Meters>(obj["distanceMeters"].get<double>())
                          : 0);
  return el;
}

json latlng(const Point& pt) {
  return {{"waypoint",
           {{"location",
             {{"latLng", {{"latitude", pt.lat}, {"longitude", pt.lng}}}}}}}};
}

}  // namespace

/* RoutesMatrixProvider ------------------------------------------------------*/
RoutesMatrixProvider::RoutesMatrixProvider(const Options& opt, HttpClient& http)
    : http_(http) {
  if (opt.api_key.empty())
    throw ConfigError("matrix provider needs an API key (GOOGLE_MAPS_API_KEY not set)");
  this->url_ = opt.matrix_url;
  this->key_ = opt.api_key;
  this->travel_mode_ = opt.travel_mode;
  this->timeout_ = opt.matrix_timeout;
}

vec_t<MatrixElement> RoutesMatrixProvider::compute(
    const vec_t<Point>& origins,
    const vec_t<Point>& destinations,
    const std::string& departure_time,
    RoutingPreference pref) {
  Message print("routes");
  HttpHeaders headers = {
    {"Content-Type", "application/json"},
    {"X-Goog-Api-Key", key_},
    {"X-Goog-FieldMask",
     "originIndex,destinationIndex,duration,distanceMeters,condition"}
  };
  const std::string body =
    route_matrix_body(origins, destinations, travel_mode_, departure_time, pref);

  DEBUG(2, { print << "POST " << origins.size() << "x" << destinations.size()
                   << " (" << to_string(pref) << ")" << std::endl; });

  HttpResponse resp = http_.post(url_, headers, body, timeout_);
  if (resp.status < 200 || resp.status >= 300) {
    print(MessageType::Error) << "Routes API HTTP " << resp.status << std::endl;
    throw UpstreamError("Routes API HTTP " + std::to_string(resp.status) + ": "
                        + excerpt(resp.body, ERROR_EXCERPT),
                        resp.status, resp.status >= 500 || resp.status == 429);
  }
  return parse_route_matrix(resp.body);
}

std::string route_matrix_body(const vec_t<Point>& origins,
                              const vec_t<Point>& destinations,
                              const std::string& travel_mode,
                              const std::string& departure_time,
                              RoutingPreference pref) {
  json body;
  body["origins"] = json::array();
  for (const Point& pt : origins) body["origins"].push_back(latlng(pt));
  body["destinations"] = json::array();
  for (const Point& pt : destinations) body["destinations"].push_back(latlng(pt));
  body["travelMode"] = travel_mode;
  body["routingPreference"] = to_string(pref);
  if (!departure_time.empty()) body["departureTime"] = departure_time;
  return body.dump();
}

vec_t<MatrixElement> parse_route_matrix(const std::string& text) {
  vec_t<MatrixElement> out;
  const std::string s = trim(text);
  if (s.empty()) return out;

  /* Whole-payload JSON: an array of elements, or a single object */
  json whole = json::parse(s, nullptr, false);
  if (!whole.is_discarded()) {
    if (whole.is_array()) {
      for (const json& obj : whole) out.push_back(to_element(obj));
      return out;
    }
    if (whole.is_object()) {
      out.push_back(to_element(whole));
      return out;
    }
    throw UpstreamError("unexpected Routes API payload: "
                        + excerpt(s, ERROR_EXCERPT), 502);
  }

  /* Stream of objects, one per line */
  std::istringstream lines(s);
  std::string line;
  while (std::getline(lines, line)) {
    std::string t = trim(line);
    if (t.empty() || t == "[" || t == "]" || t == ",") continue;
    if (t.compare(0, 4, ")]}'") == 0) continue;  // XSSI guard
    if (t.front() == '[') t = trim(t.substr(1));
    if (!t.empty() && t.back() == ']') t = trim(t.substr(0, t.size() - 1));
    if (!t.empty() && t.back() == ',') t.pop_back();
    if (t.empty()) continue;
    if (t.compare(0, 8, "{\"error\"") == 0)
      throw UpstreamError("Routes API error: " + excerpt(t, ERROR_EXCERPT), 502);
    json obj = json::parse(t, nullptr, false);
    if (obj.is_discarded())
      throw UpstreamError("Bad JSON line from Routes API: "
                          + excerpt(t, LINE_EXCERPT), 502);
    out.push_back(to_element(obj));
  }
  return out;
}

}  // namespace shuttle
