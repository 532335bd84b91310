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
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "libshuttle.h"

using namespace shuttle;

void print_usage() {
  std::cerr
    << "Usage: shuttle request.json [matrix.txt] [-b seconds] [-s out.db]\n"
    << "               [-m matrix_out.txt] [-q]\n"
    << "  matrix.txt  precomputed travel matrix; otherwise it is built\n"
    << "              through Google (GOOGLE_MAPS_API_KEY must be set)\n"
    << "  -b          search time budget in seconds (default 10)\n"
    << "  -s          save solved plans into this SQLite file\n"
    << "  -m          write the travel matrix used to this file\n"
    << "  -q          quiet\n"
    << "Exit status: 0 ok, 1 invalid input or setup, 2 geocoding or matrix\n"
    << "provider failure, 3 no feasible plan, 4 other failure."
    << std::endl;
}

int fail(const std::exception& e, int code) {
  std::cout << error_to_json(e).dump(2) << std::endl;
  return code;
}

int main(int argc, char** argv) {
  vec_t<std::string> args(argv, argv + argc);
  vec_t<std::string> positional = {};
  Options op;
  Filepath matrix_out = "";
  for (size_t i = 1; i < args.size(); ++i) {
    const std::string& arg = args.at(i);
    const bool has_value = (i + 1 < args.size());
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else if (arg == "-q") {
      op.quiet = true;
    } else if (arg == "-b" && has_value) {
      try {
        op.search_time_budget = std::stoi(args.at(++i));
      } catch (const std::logic_error &) {
        std::cerr << "-b needs a number of seconds" << std::endl;
        return 1;
      }
    } else if (arg == "-s" && has_value) {
      op.path_to_save = args.at(++i);
    } else if (arg == "-m" && has_value) {
      matrix_out = args.at(++i);
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown or incomplete option " << arg << std::endl;
      print_usage();
      return 1;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.empty() || positional.size() > 2) {
    print_usage();
    return 1;
  }

  const char* key = std::getenv("GOOGLE_MAPS_API_KEY");
  if (key != nullptr) op.api_key = key;

  try {
    op.validate();
    SolveRequest req;
    read_request(positional.at(0), req);

    Shuttle shuttle(op);
    TravelMatrix matrix;
    if (positional.size() == 2)
      read_matrix(positional.at(1), matrix);
    else
      matrix = shuttle.build_matrix(req);
    if (!matrix_out.empty()) write_matrix(matrix_out, matrix);

    SolveResponse resp = shuttle.solve(req, matrix);
    if (!op.path_to_save.empty()) {
      PlanStore store;
      store.insert(resp.routes);
      store.save(op.path_to_save);
    }
    std::cout << to_json(resp).dump(2) << std::endl;
    return 0;
  } catch (const InvalidInputError& e) {
    return fail(e, 1);
  } catch (const ConfigError& e) {
    return fail(e, 1);
  } catch (const ResolutionError& e) {
    return fail(e, 2);
  } catch (const UpstreamError& e) {
    return fail(e, 2);
  } catch (const InfeasibleError& e) {
    return fail(e, 3);
  } catch (const std::exception& e) {
    return fail(e, 4);
  }
}
