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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_H_

namespace shuttle {}  // namespace shuttle

#include "libshuttle/classes.h"
#include "libshuttle/dbsql.h"
#include "libshuttle/debug.h"
#include "libshuttle/error.h"
#include "libshuttle/file.h"
#include "libshuttle/functions.h"
#include "libshuttle/geocoder.h"
#include "libshuttle/http.h"
#include "libshuttle/matrix.h"
#include "libshuttle/message.h"
#include "libshuttle/model.h"
#include "libshuttle/options.h"
#include "libshuttle/provider.h"
#include "libshuttle/serialize.h"
#include "libshuttle/shuttle.h"
#include "libshuttle/solver.h"
#include "libshuttle/types.h"

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_H_
