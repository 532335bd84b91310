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
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <sqlite3.h>

#include "libshuttle/classes.h"
#include "libshuttle/dbsql.h"
#include "libshuttle/message.h"
#include "libshuttle/types.h"

namespace shuttle {

PlanStore::PlanStore()
    : print("planstore"), db_(nullptr), irt_stmt(nullptr), ivs_stmt(nullptr),
      sav_stmt(nullptr), spv_stmt(nullptr), cpl_stmt(nullptr),
      next_plan_id_(1) {
  if (sqlite3_open(":memory:", &db_) != SQLITE_OK) {
    print(MessageType::Error) << "Failed (create db). Reason:\n";
    std::string reason = sqlite3_errmsg(db_);
    sqlite3_close(db_);
    throw std::runtime_error(reason);
  }

  SqliteErrorMessage err = NULL;
  try {
    if (sqlite3_db_config(db_, SQLITE_DBCONFIG_ENABLE_FKEY, 1, NULL) != SQLITE_OK)
      throw std::runtime_error(sqlite3_errmsg(db_));
    if (sqlite3_exec(db_, sql::create_shuttle_tables, NULL, NULL, &err) != SQLITE_OK) {
      std::string reason = (err != NULL ? err : "unknown error");
      print(MessageType::Error) << "Failed (create shuttle tables). Reason: "
                                << reason << std::endl;
      sqlite3_free(err);
      throw std::runtime_error("create shuttle tables failed: " + reason);
    }
    prepare_stmt(sql::irt_stmt, &irt_stmt);
    prepare_stmt(sql::ivs_stmt, &ivs_stmt);
    prepare_stmt(sql::sav_stmt, &sav_stmt);
    prepare_stmt(sql::spv_stmt, &spv_stmt);
    prepare_stmt(sql::cpl_stmt, &cpl_stmt);
  } catch (const std::runtime_error &) {
    sqlite3_finalize(irt_stmt);
    sqlite3_finalize(ivs_stmt);
    sqlite3_finalize(sav_stmt);
    sqlite3_finalize(spv_stmt);
    sqlite3_finalize(cpl_stmt);
    sqlite3_close(db_);
    throw;
  }
}

PlanStore::~PlanStore() {
  sqlite3_finalize(irt_stmt);
  sqlite3_finalize(ivs_stmt);
  sqlite3_finalize(sav_stmt);
  sqlite3_finalize(spv_stmt);
  sqlite3_finalize(cpl_stmt);
  sqlite3_close(db_);
}

void PlanStore::prepare_stmt(SqliteQuery query, sqlite3_stmt** stmt) {
  if (sqlite3_prepare_v2(db_, query, -1, stmt, NULL) != SQLITE_OK) {
    print(MessageType::Error) << "Prepare query failed: \n" << query << std::endl;
    throw std::runtime_error(sqlite3_errmsg(db_));
  }
}

void PlanStore::step_done(sqlite3_stmt* stmt) {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    std::string reason = sqlite3_errmsg(db_);
    sqlite3_clear_bindings(stmt);
    sqlite3_reset(stmt);
    throw std::runtime_error(reason);
  }
  sqlite3_clear_bindings(stmt);
  sqlite3_reset(stmt);
}

int PlanStore::insert(const vec_t<RoutePlan>& plans) {
  const int plan_id = next_plan_id_;
  SqliteErrorMessage err = NULL;
  if (sqlite3_exec(db_, "BEGIN", NULL, NULL, &err) != SQLITE_OK) {
    std::string reason = (err != NULL ? err : "unknown error");
    sqlite3_free(err);
    throw std::runtime_error(reason);
  }
  try {
    for (const RoutePlan& plan : plans) {
      sqlite3_bind_int(irt_stmt, 1, plan_id);
      sqlite3_bind_int(irt_stmt, 2, plan.vehicle_id());
      sqlite3_bind_int(irt_stmt, 3, plan.total_travel_time());
      sqlite3_bind_int(irt_stmt, 4, plan.max_load());
      step_done(irt_stmt);
      for (size_t k = 0; k < plan.size(); ++k) {
        const Visit& visit = plan.at(k);
        sqlite3_bind_int(ivs_stmt, 1, plan_id);
        sqlite3_bind_int(ivs_stmt, 2, plan.vehicle_id());
        sqlite3_bind_int(ivs_stmt, 3, k);
        sqlite3_bind_text(ivs_stmt, 4, visit.stop_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(ivs_stmt, 5, visit.node);
        sqlite3_bind_int(ivs_stmt, 6, visit.time);
        sqlite3_bind_int(ivs_stmt, 7, visit.load);
        step_done(ivs_stmt);
      }
    }
  } catch (const std::runtime_error& e) {
    print(MessageType::Error) << "insert plan " << plan_id << " failed: "
                              << e.what() << std::endl;
    sqlite3_exec(db_, "ROLLBACK", NULL, NULL, NULL);
    throw;
  }
  if (sqlite3_exec(db_, "COMMIT", NULL, NULL, &err) != SQLITE_OK) {
    std::string reason = (err != NULL ? err : "unknown error");
    sqlite3_free(err);
    sqlite3_exec(db_, "ROLLBACK", NULL, NULL, NULL);
    throw std::runtime_error(reason);
  }
  next_plan_id_++;
  return plan_id;
}

vec_t<RoutePlan> PlanStore::read_routes(sqlite3_stmt* stmt) {
  vec_t<RoutePlan> plans = {};
  vec_t<Visit> visits = {};
  int cur_plan = -1;
  VehlId cur_vehl = -1;
  int rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    const int plan_id  = sqlite3_column_int(stmt, 0);
    const VehlId vid   = sqlite3_column_int(stmt, 1);
    const StopId sid   = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
    const NodeIdx node = sqlite3_column_int(stmt, 4);
    const Minutes time = sqlite3_column_int(stmt, 5);
    const Load load    = sqlite3_column_int(stmt, 6);
    if ((plan_id != cur_plan || vid != cur_vehl) && !visits.empty()) {
      plans.push_back(RoutePlan(cur_vehl, visits));
      visits.clear();
    }
    cur_plan = plan_id;
    cur_vehl = vid;
    visits.push_back({sid, node, time, load});
  }
  if (rc != SQLITE_DONE) {
    std::string reason = sqlite3_errmsg(db_);
    sqlite3_clear_bindings(stmt);
    sqlite3_reset(stmt);
    throw std::runtime_error(reason);
  }
  if (!visits.empty()) plans.push_back(RoutePlan(cur_vehl, visits));
  sqlite3_clear_bindings(stmt);
  sqlite3_reset(stmt);
  return plans;
}

vec_t<RoutePlan> PlanStore::select(int plan_id) {
  sqlite3_bind_int(spv_stmt, 1, plan_id);
  return read_routes(spv_stmt);
}

vec_t<RoutePlan> PlanStore::select_all() {
  return read_routes(sav_stmt);
}

int PlanStore::count_plans() {
  int count = 0;
  if (sqlite3_step(cpl_stmt) == SQLITE_ROW)
    count = sqlite3_column_int(cpl_stmt, 0);
  else {
    sqlite3_reset(cpl_stmt);
    throw std::runtime_error(sqlite3_errmsg(db_));
  }
  sqlite3_reset(cpl_stmt);
  return count;
}

void PlanStore::save(const Filepath& path) {
  sqlite3* p_file = nullptr;
  int rc = sqlite3_open(path.c_str(), &p_file);
  if (rc == SQLITE_OK) {
    sqlite3_backup* p_backup = sqlite3_backup_init(p_file, "main", db_, "main");
    if (p_backup) {
      sqlite3_backup_step(p_backup, -1);
      sqlite3_backup_finish(p_backup);
    }
    rc = sqlite3_errcode(p_file);
  }
  if (rc != SQLITE_OK) {
    std::string reason = sqlite3_errmsg(p_file);
    sqlite3_close(p_file);
    print(MessageType::Error) << "Failed (save " << path << "). Reason: "
                              << reason << std::endl;
    throw std::runtime_error("save " + path + " failed: " + reason);
  }
  sqlite3_close(p_file);
  print << "Saved plans to " << path << std::endl;
}

}  // namespace shuttle
