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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_SHUTTLE_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_SHUTTLE_H_
#include <memory>

#include "classes.h"
#include "geocoder.h"
#include "http.h"
#include "matrix.h"
#include "message.h"
#include "options.h"
#include "provider.h"
#include "solver.h"
#include "types.h"

namespace shuttle {

/* Shuttle turns a SolveRequest into route plans: it builds the travel matrix
 * for the request's stops (geocoding addresses as needed), then solves the
 * pickup-and-delivery problem over it. Nothing is kept between solves except
 * the matrix builder's cache.
 *
 * The one-argument constructor talks to Google through libcurl and needs
 * Options::api_key for solve(request); solve(request, matrix) never needs
 * it. The three-argument constructor borrows the geocoder and provider. */
class Shuttle {
 public:
  Shuttle(const Options &);
  Shuttle(const Options &, Geocoder &, MatrixProvider &);

  SolveResponse solve(const SolveRequest &);
  SolveResponse solve(const SolveRequest &, const TravelMatrix &);
  TravelMatrix  build_matrix(const SolveRequest &);

  MatrixBuilder & matrix_builder();
  Solver        & solver()     { return solver_; }

 private:
  Message print;
  Options opts_;
  std::unique_ptr<HttpClient>     http_;       // owned transport, if any
  std::unique_ptr<Geocoder>       geocoder_;   // owned, if any
  std::unique_ptr<MatrixProvider> provider_;   // owned, if any
  std::unique_ptr<MatrixBuilder>  builder_;    // null without a provider
  Solver solver_;

  void check(const SolveRequest &) const;
};

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_SHUTTLE_H_
