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

#include "libshuttle/classes.h"
#include "libshuttle/error.h"
#include "libshuttle/geocoder.h"
#include "libshuttle/http.h"
#include "libshuttle/matrix.h"
#include "libshuttle/message.h"
#include "libshuttle/model.h"
#include "libshuttle/options.h"
#include "libshuttle/provider.h"
#include "libshuttle/shuttle.h"
#include "libshuttle/solver.h"
#include "libshuttle/types.h"

namespace shuttle {

Shuttle::Shuttle(const Options& opt)
    : print("shuttle"), opts_(opt), solver_(opt) {
  Message::quiet(opt.quiet);
  if (opt.api_key.empty()) {
    print(MessageType::Warning)
      << "No API key; only requests with a travel matrix can be solved"
      << std::endl;
    return;
  }
  http_.reset(new CurlHttpClient());
  geocoder_.reset(new GoogleGeocoder(opt, *http_));
  provider_.reset(new RoutesMatrixProvider(opt, *http_));
  builder_.reset(new MatrixBuilder(opt, *geocoder_, *provider_));
}

Shuttle::Shuttle(const Options& opt, Geocoder& geocoder,
                 MatrixProvider& provider)
    : print("shuttle"),
      opts_(opt),
      builder_(new MatrixBuilder(opt, geocoder, provider)),
      solver_(opt) {
  Message::quiet(opt.quiet);
}

MatrixBuilder& Shuttle::matrix_builder() {
  if (!builder_)
    throw ConfigError("no matrix provider (GOOGLE_MAPS_API_KEY not set)");
  return *builder_;
}

void Shuttle::check(const SolveRequest& req) const {
  if (req.stops.empty())
    throw InvalidInputError("no stops given; nothing to build");
  validate_fleet(req.vehicle_count, req.vehicle_capacity);
  validate_pairs(req.stops.size(), req.pairs, 0);
}

TravelMatrix Shuttle::build_matrix(const SolveRequest& req) {
  check(req);
  return matrix_builder().build(req.stops, req.departure_time,
                                req.routing_preference,
                                req.require_coordinates);
}

SolveResponse Shuttle::solve(const SolveRequest& req) {
  const TravelMatrix matrix = build_matrix(req);
  return solve(req, matrix);
}

SolveResponse Shuttle::solve(const SolveRequest& req,
                             const TravelMatrix& matrix) {
  check(req);
  if (matrix.size() != req.stops.size())
    throw InvalidInputError("matrix covers " + std::to_string(matrix.size())
                            + " stops, request has "
                            + std::to_string(req.stops.size()));
  for (size_t i = 0; i < matrix.size(); ++i)
    if (matrix.ids().at(i) != req.stops.at(i).id())
      throw InvalidInputError("matrix stop " + std::to_string(i) + " is "
                              + matrix.ids().at(i) + ", request has "
                              + req.stops.at(i).id());

  const VehicleConfig fleet = {req.vehicle_count, req.vehicle_capacity};
  SolveResponse resp;
  resp.routes = solver_.solve(matrix, req.pairs, fleet);
  return resp;
}

}  // namespace shuttle
