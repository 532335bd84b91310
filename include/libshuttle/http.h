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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_HTTP_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_HTTP_H_

#include <string>
#include <utility>
#include <vector>

#include "types.h"

namespace shuttle {

typedef vec_t<std::pair<std::string, std::string>> HttpParams;   // query
typedef vec_t<std::pair<std::string, std::string>> HttpHeaders;

struct HttpResponse {
  long status;       // HTTP status code
  std::string body;  // raw body text
};

/* Transport used by the geocoder and the matrix provider. Implementations
 * throw UpstreamError (retryable) when no response was received at all
 * (connection failure, timeout); any response, whatever its status, is
 * returned to the caller. */
class HttpClient {
 public:
  virtual ~HttpClient() {}
  virtual HttpResponse get(
    const std::string &,  // param1: url
    const HttpParams &,   // param2: query parameters (url-encoded here)
    long                  // param3: timeout (seconds)
  ) = 0;
  virtual HttpResponse post(
    const std::string &,  // param1: url
    const HttpHeaders &,  // param2: headers
    const std::string &,  // param3: body
    long                  // param4: timeout (seconds)
  ) = 0;
};

/* libcurl implementation. One easy handle per request, so a single
 * CurlHttpClient can be shared by the matrix builder's workers. */
class CurlHttpClient : public HttpClient {
 public:
  CurlHttpClient();

  virtual HttpResponse get(const std::string &, const HttpParams &, long);
  virtual HttpResponse post(const std::string &, const HttpHeaders &,
                            const std::string &, long);

  std::string escape(const std::string &) const;  // url-encode
};

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_HTTP_H_
