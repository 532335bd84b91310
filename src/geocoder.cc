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

#include "libshuttle/debug.h"
#include "libshuttle/error.h"
#include "libshuttle/geocoder.h"
#include "libshuttle/http.h"
#include "libshuttle/message.h"
#include "libshuttle/options.h"
#include "libshuttle/types.h"

namespace shuttle {

using json = nlohmann::json;

GoogleGeocoder::GoogleGeocoder(const Options& opt, HttpClient& http)
    : http_(http) {
  if (opt.api_key.empty())
    throw ConfigError("geocoder needs an API key (GOOGLE_MAPS_API_KEY not set)");
  this->url_ = opt.geocode_url;
  this->key_ = opt.api_key;
  this->language_ = opt.language;
  this->region_ = opt.region;
  this->timeout_ = opt.geocode_timeout;
}

Point GoogleGeocoder::resolve(const std::string& address) {
  Message print("geocoder");
  HttpParams params = {
    {"address", address},
    {"key", key_},
    {"language", language_},
    {"region", region_}
  };
  HttpResponse resp;
  try {
    resp = http_.get(url_, params, timeout_);
  } catch (const UpstreamError& e) {
    print(MessageType::Error) << "geocode " << address << ": " << e.what()
                              << std::endl;
    throw ResolutionError(address, e.what(), e.retryable());
  }
  if (resp.status < 200 || resp.status >= 300) {
    print(MessageType::Error) << "geocode " << address << ": HTTP "
                              << resp.status << std::endl;
    throw ResolutionError(address, "HTTP " + std::to_string(resp.status),
                          resp.status >= 500 || resp.status == 429);
  }
  Point pt = parse_geocode_response(address, resp.body);
  DEBUG(1, { print << "resolved " << address << " to (" << pt.lat << ","
                   << pt.lng << ")" << std::endl; });
  return pt;
}

Point parse_geocode_response(const std::string& address,
                             const std::string& body) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    throw ResolutionError(address, "malformed response");

  const std::string status =
    (j.contains("status") && j["status"].is_string()
       ? j["status"].get<std::string>() : "MISSING_STATUS");
  if (status != "OK")
    throw ResolutionError(address, status,
                          status == "OVER_QUERY_LIMIT" || status == "UNKNOWN_ERROR");

  if (!j.contains("results") || !j["results"].is_array() || j["results"].empty())
    throw ResolutionError(address, "ZERO_RESULTS");

  const json& first = j["results"].at(0);
  try {
    const json& loc = first.at("geometry").at("location");
    Point pt = {loc.at("lat").get<double>(), loc.at("lng").get<double>()};
    return pt;
  } catch (const json::exception& e) {
    throw ResolutionError(address, std::string("malformed location: ") + e.what());
  }
}

}  // namespace shuttle
