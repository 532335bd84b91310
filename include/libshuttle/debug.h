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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_DEBUG_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_DEBUG_H_

// Compile with -DSHUTTLE_DEBUG=<level> to enable tracing blocks.
//   1: per-build / per-solve events
//   2: per-block / per-move events
//   3: per-check events (very noisy)
// Usage:
//     DEBUG(2, { print << "moved " << node << std::endl; });
#ifndef SHUTTLE_DEBUG
#define SHUTTLE_DEBUG 0
#endif

#define DEBUG(level, ...)                                                     \
  do {                                                                        \
    if ((level) <= SHUTTLE_DEBUG) { __VA_ARGS__ }                             \
  } while (0)

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_DEBUG_H_
