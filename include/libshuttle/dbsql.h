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
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_DBSQL_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_DBSQL_H_

#include <sqlite3.h>

#include "classes.h"
#include "message.h"
#include "types.h" /* SqliteQuery types */

/* -------
 * SUMMARY
 * -------
 * This file contains the SQL statements used by the plan store, and the
 * PlanStore class itself.
 * The statements are:
 *
 *   CREATE STATEMENTS
 *   - create_shuttle_tables  create database tables
 *
 *   INSERT STATEMENTS (i--)
 *   - irt_stmt  insert route
 *   - ivs_stmt  insert visit
 *
 *   SELECT STATEMENTS (s--)
 *   - sav_stmt  select all visits
 *   - spv_stmt  select plan visits
 *   - cpl_stmt  count plans
 */

namespace shuttle {

namespace sql {

/* Create Shuttle database tables. -------------------------------------------*/
const SqliteQuery create_shuttle_tables =
  "create table routes("
    "plan_id        int not null,"        // col 0
    "vehicle_id     int not null,"        // col 1
    "total_time     int not null,"        // col 2
    "max_load       int not null,"        // col 3
  "primary key (plan_id, vehicle_id)"
  ") without rowid;"

  "create table visits("
    "plan_id        int not null,"        // col 0
    "vehicle_id     int not null,"        // col 1
    "seq            int not null,"        // col 2
    "stop_id        text not null,"       // col 3
    "node           int not null,"        // col 4
    "time           int not null,"        // col 5
    "load           int not null,"        // col 6
  "primary key (plan_id, vehicle_id, seq),"
  "foreign key (plan_id, vehicle_id) references routes(plan_id, vehicle_id)"
  ") without rowid;";

/* Insert statements. --------------------------------------------------------*/
const SqliteQuery irt_stmt =  // insert route
  "insert into routes values (?, ?, ?, ?);";

const SqliteQuery ivs_stmt =  // insert visit
  "insert into visits values (?, ?, ?, ?, ?, ?, ?);";

/* Select statements. --------------------------------------------------------*/
const SqliteQuery sav_stmt =  // select all visits
  "select * from visits "
  "order by plan_id, vehicle_id, seq;";

const SqliteQuery spv_stmt =  // select plan visits
  "select * from visits "
  "where"
  "  plan_id = ? "  // param1: plan id
  "order by vehicle_id, seq;";

const SqliteQuery cpl_stmt =  // count plans
  "select count(distinct plan_id) from routes;";

}  // namespace sql

/* PlanStore keeps solved plans in an in-memory SQLite database. Each insert()
 * is one plan (one solve) and gets the next plan id, starting at 1. save()
 * copies the whole database into a file. Failures throw std::runtime_error
 * with the SQLite message. */
class PlanStore {
 public:
  PlanStore();
  ~PlanStore();
  PlanStore(const PlanStore &) = delete;
  PlanStore & operator=(const PlanStore &) = delete;

  int insert(const vec_t<RoutePlan> &);   // returns the plan id
  vec_t<RoutePlan> select(int);           // routes of one plan
  vec_t<RoutePlan> select_all();          // routes of every plan, in order
  int count_plans();
  void save(const Filepath &);

 private:
  Message print;
  sqlite3* db_;
  sqlite3_stmt* irt_stmt;
  sqlite3_stmt* ivs_stmt;
  sqlite3_stmt* sav_stmt;
  sqlite3_stmt* spv_stmt;
  sqlite3_stmt* cpl_stmt;
  int next_plan_id_;

  void prepare_stmt(SqliteQuery, sqlite3_stmt**);
  void step_done(sqlite3_stmt*);
  vec_t<RoutePlan> read_routes(sqlite3_stmt*);
};

}  // namespace shuttle

#endif  // SHUTTLE_INCLUDE_LIBSHUTTLE_DBSQL_H_
