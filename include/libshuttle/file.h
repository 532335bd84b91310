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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_FILE_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_FILE_H_
#include <string>

#include "classes.h"
#include "types.h"

namespace shuttle {

/* These functions throw runtime_errors if the file cannot be read, and
 * InvalidInputError if its content is malformed. */
size_t read_request(const Filepath &, SolveRequest &);  // return # stops

/* Matrix text format (whitespace separated):
 *   n
 *   id_0 ... id_n-1
 *   n rows of n minutes
 *   n rows of n meters    (optional; zeros if absent) */
size_t read_matrix(const Filepath &, TravelMatrix &);   // return # stops
void write_matrix(const Filepath &, const TravelMatrix &);

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_FILE_H_
