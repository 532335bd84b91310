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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_GEOCODER_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_GEOCODER_H_

#include <string>

#include "http.h"
#include "message.h"
#include "options.h"
#include "types.h"

namespace shuttle {

/* Resolves a free-text address to a coordinate. Throws ResolutionError when
 * the address cannot be matched or the provider cannot be reached. No
 * caching happens here; see MatrixBuilder. */
class Geocoder {
 public:
  virtual ~Geocoder() {}
  virtual Point resolve(const std::string &) = 0;
};

/* Google Geocoding API. resolve() may run on several threads at once. */
class GoogleGeocoder : public Geocoder {
 public:
  GoogleGeocoder(const Options &, HttpClient &);

  virtual Point resolve(const std::string &);

 private:
  HttpClient& http_;
  std::string url_;
  std::string key_;
  std::string language_;
  std::string region_;
  long timeout_;
};

// Extract the first result's location from a Geocoding API body. Throws
// ResolutionError if the status is not "OK", there are no results, or the
// body is not the expected JSON.
Point parse_geocode_response(const std::string &,   // address (for errors)
                             const std::string &);  // response body

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_GEOCODER_H_
