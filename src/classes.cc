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
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "libshuttle/classes.h"
#include "libshuttle/types.h"

namespace shuttle {

/* Stop ----------------------------------------------------------------------*/
Stop::Stop(const StopId& id) {
  this->id_ = id;
}

Stop::Stop(const StopId& id, const Point& pt) {
  this->id_ = id;
  this->point_ = pt;
  this->has_point_ = true;
}

Stop::Stop(const StopId& id, const std::string& address) {
  this->id_ = id;
  this->address_ = address;
}

Stop::Stop(const StopId& id, const Point& pt, const std::string& address) {
  this->id_ = id;
  this->point_ = pt;
  this->address_ = address;
  this->has_point_ = true;
}

const StopId      & Stop::id()          const { return id_; }
const Point       & Stop::point()       const { return point_; }
const std::string & Stop::address()     const { return address_; }
      bool          Stop::has_point()   const { return has_point_; }
      bool          Stop::has_address() const { return !address_.empty(); }


/* TravelMatrix --------------------------------------------------------------*/
TravelMatrix::TravelMatrix(const vec_t<StopId>& ids) {
  const size_t n = ids.size();
  this->ids_ = ids;
  this->minutes_ = vec_t<vec_t<Minutes>>(n, vec_t<Minutes>(n, 0));
  this->meters_ = vec_t<vec_t<Meters>>(n, vec_t<Meters>(n, 0));
}

TravelMatrix::TravelMatrix(
  const vec_t<StopId>& ids,
  const vec_t<vec_t<Minutes>>& minutes,
  const vec_t<vec_t<Meters>>& meters)
{
  this->ids_ = ids;
  this->minutes_ = minutes;
  this->meters_ = meters;
}

const vec_t<StopId>         & TravelMatrix::ids()     const { return ids_; }
const vec_t<vec_t<Minutes>> & TravelMatrix::minutes() const { return minutes_; }
const vec_t<vec_t<Meters>>  & TravelMatrix::meters()  const { return meters_; }
      size_t                  TravelMatrix::size()    const { return ids_.size(); }

void TravelMatrix::set(size_t i, size_t j, Minutes mins, Meters m) {
  minutes_.at(i).at(j) = mins;
  meters_.at(i).at(j) = m;
}

void TravelMatrix::set_ids(const vec_t<StopId>& ids) { ids_ = ids; }

void TravelMatrix::print() const {
  for (size_t i = 0; i < minutes_.size(); ++i) {
    std::cout << std::setw(10) << (i < ids_.size() ? ids_.at(i) : "?");
    for (const Minutes& m : minutes_.at(i))
      std::cout << " " << std::setw(7) << m;
    std::cout << std::endl;
  }
}


/* RoutePlan -----------------------------------------------------------------*/
RoutePlan::RoutePlan(VehlId vid, vec_t<Visit> visits) {
  this->vehicle_id_ = vid;
  this->visits_ = visits;
  this->max_load_ = 0;
  for (const Visit& visit : visits_)
    max_load_ = std::max(max_load_, visit.load);
}

const VehlId       & RoutePlan::vehicle_id() const { return vehicle_id_; }
const vec_t<Visit> & RoutePlan::visits()     const { return visits_; }
const Visit        & RoutePlan::at(size_t i) const { return visits_.at(i); }
      Load           RoutePlan::max_load()   const { return max_load_; }
      size_t         RoutePlan::size()       const { return visits_.size(); }
      bool           RoutePlan::empty()      const { return visits_.size() <= 2; }

Minutes RoutePlan::total_travel_time() const {
  return (visits_.empty() ? 0 : visits_.back().time);
}

void RoutePlan::print() const {
  std::cout << "Vehicle " << vehicle_id_ << ":";
  for (const Visit& visit : visits_)
    std::cout << " " << visit;
  std::cout << " | time=" << total_travel_time() << " max_load=" << max_load_
            << std::endl;
}


/* Printers ------------------------------------------------------------------*/
std::ostream& operator<<(std::ostream& os, const Point& pt) {
  return os << "(" << pt.lat << "," << pt.lng << ")";
}

std::ostream& operator<<(std::ostream& os, const Stop& stop) {
  os << stop.id();
  if (stop.has_point()) os << stop.point();
  else if (stop.has_address()) os << "{" << stop.address() << "}";
  return os;
}

std::ostream& operator<<(std::ostream& os, const PDPair& pair) {
  return os << "(" << pair.first << "->" << pair.second << ")";
}

std::ostream& operator<<(std::ostream& os, const Visit& visit) {
  return os << "(" << visit.stop_id << "|" << visit.time << "|" << visit.load
            << ")";
}

std::ostream& operator<<(std::ostream& os, const RoutePlan& plan) {
  os << plan.vehicle_id() << ":";
  for (const Visit& visit : plan.visits())
    os << " " << visit;
  return os;
}

}  // namespace shuttle
