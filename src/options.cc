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

#include "libshuttle/error.h"
#include "libshuttle/options.h"

namespace shuttle {

void Options::validate() const {
  if (slack_minutes < 0)
    throw ConfigError("slack_minutes must be >= 0 (got "
                      + std::to_string(slack_minutes) + ")");
  if (horizon_minutes < 0)
    throw ConfigError("horizon_minutes must be >= 0 (got "
                      + std::to_string(horizon_minutes) + ")");
  if (search_time_budget < 0)
    throw ConfigError("search_time_budget must be >= 0 (got "
                      + std::to_string(search_time_budget) + ")");
  if (gls_lambda_coefficient < 0)
    throw ConfigError("gls_lambda_coefficient must be >= 0");
  if (batch_size < 1)
    throw ConfigError("batch_size must be >= 1");
  if (cache_capacity < 1)
    throw ConfigError("cache_capacity must be >= 1");
  if (max_workers < 1)
    throw ConfigError("max_workers must be >= 1");
  if (coordinate_precision < 0 || coordinate_precision > 12)
    throw ConfigError("coordinate_precision must be in [0, 12] (got "
                      + std::to_string(coordinate_precision) + ")");
}

}  // namespace shuttle
