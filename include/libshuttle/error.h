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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_ERROR_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_ERROR_H_

#include <stdexcept>
#include <string>

/* -------
 * SUMMARY
 * -------
 * Failures raised by Shuttle. All of them are fatal for the call that raised
 * them; none are retried inside the library. Callers that want a retry
 * policy can consult retryable() on the provider errors.
 *   - InvalidInputError  malformed stops, pairs or vehicle settings
 *   - ResolutionError    an address could not be geocoded
 *   - UpstreamError      the matrix provider rejected or failed a request
 *   - InfeasibleError    no plan satisfies the constraints within budget
 *   - ConfigError        options or credentials are unusable
 */

namespace shuttle {

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
  virtual const char* kind() const { return "error"; }
};

class InvalidInputError : public Error {
 public:
  explicit InvalidInputError(const std::string& what) : Error(what) {}
  const char* kind() const { return "invalid_input"; }
};

class ResolutionError : public Error {
 public:
  ResolutionError(const std::string& address, const std::string& status,
                  bool retryable = false)
      : Error("geocode failed: " + address + " -> " + status),
        address_(address), status_(status), retryable_(retryable) {}
  const char* kind() const { return "resolution"; }

  const std::string & address()   const { return address_; }
  const std::string & status()    const { return status_; }
        bool          retryable() const { return retryable_; }

 private:
  std::string address_;
  std::string status_;
  bool retryable_;
};

class UpstreamError : public Error {
 public:
  UpstreamError(const std::string& what, long status = 0,
                bool retryable = false)
      : Error(what), status_(status), retryable_(retryable) {}
  const char* kind() const { return "upstream"; }

  long status()    const { return status_; }  // HTTP status, 0 if none
  bool retryable() const { return retryable_; }

 private:
  long status_;
  bool retryable_;
};

class InfeasibleError : public Error {
 public:
  explicit InfeasibleError(const std::string& what) : Error(what) {}
  const char* kind() const { return "infeasible"; }
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& what) : Error(what) {}
  const char* kind() const { return "config"; }
};

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_ERROR_H_
