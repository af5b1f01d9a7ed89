/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <iomanip>

#include "boost/format.hpp"

#include "errors.hh"
#include "VariableRegistry.hh"

namespace Phreatic {

/* ******************************************************************
* Allocation
****************************************************************** */
VariableHandle
VariableRegistry::Allocate(const Key& origin, const Key& name, VariableKind kind, int extent)
{
  return Allocate_(origin, name, kind, extent, false);
}


VariableHandle
VariableRegistry::AllocateScalar(const Key& origin, const Key& name, VariableKind kind)
{
  return Allocate_(origin, name, kind, 1, true);
}


VariableHandle
VariableRegistry::Allocate_(const Key& origin,
                            const Key& name,
                            VariableKind kind,
                            int extent,
                            bool scalar)
{
  if (!Keys::validKey(origin) || !Keys::validKey(name)) {
    Errors::Message msg;
    msg << "VariableRegistry: invalid variable key \"" << origin << "\", \"" << name << "\"";
    Exceptions::phreatic_throw(msg);
  }

  if (extent <= 0) {
    Errors::InvalidShapeError msg;
    msg << "VariableRegistry: variable \"" << Keys::getFullName(origin, name)
        << "\" requested with non-positive extent " << extent;
    Exceptions::phreatic_throw(msg);
  }

  if (Exists(origin, name)) {
    Errors::DuplicateNameError msg;
    msg << "VariableRegistry: variable \"" << Keys::getFullName(origin, name)
        << "\" is already allocated";
    Exceptions::phreatic_throw(msg);
  }

  data_.emplace(std::make_pair(origin, name),
                std::make_unique<Variable>(origin, name, kind, extent, scalar));
  return VariableHandle{ origin, name };
}


void
VariableRegistry::Release(const Key& origin, const Key& name)
{
  auto it = data_.find(std::make_pair(origin, name));
  if (it == data_.end()) {
    Errors::NotFoundError msg;
    msg << "VariableRegistry: cannot release \"" << Keys::getFullName(origin, name)
        << "\", it is not allocated";
    Exceptions::phreatic_throw(msg);
  }
  data_.erase(it);
}


int
VariableRegistry::ReleaseOrigin(const Key& origin)
{
  int count(0);
  auto it = data_.lower_bound(std::make_pair(origin, Key()));
  while (it != data_.end() && it->first.first == origin) {
    it = data_.erase(it);
    count++;
  }
  return count;
}


/* ******************************************************************
* Access
****************************************************************** */
bool
VariableRegistry::Exists(const Key& origin, const Key& name) const
{
  return data_.count(std::make_pair(origin, name)) > 0;
}


const Variable&
VariableRegistry::GetVariable(const Key& origin, const Key& name) const
{
  auto it = data_.find(std::make_pair(origin, name));
  if (it == data_.end()) {
    Errors::NotFoundError msg;
    msg << "VariableRegistry: variable \"" << Keys::getFullName(origin, name)
        << "\" is not allocated";
    Exceptions::phreatic_throw(msg);
  }
  return *it->second;
}


Variable&
VariableRegistry::GetVariableW_(const Key& origin, const Key& name)
{
  return const_cast<Variable&>(GetVariable(origin, name));
}


const Variable&
VariableRegistry::GetVariableChecked_(const Key& origin, const Key& name, VariableKind kind) const
{
  const auto& var = GetVariable(origin, name);
  if (var.kind() != kind) {
    Errors::KindMismatchError msg;
    msg << "VariableRegistry: variable \"" << Keys::getFullName(origin, name) << "\" is of kind "
        << to_string(var.kind()) << ", requested as " << to_string(kind);
    Exceptions::phreatic_throw(msg);
  }
  return var;
}


Teuchos::ArrayView<double>
VariableRegistry::GetReal(const Key& origin, const Key& name)
{
  GetVariableChecked_(origin, name, VariableKind::REAL);
  return GetVariableW_(origin, name).real_view();
}


Teuchos::ArrayView<const double>
VariableRegistry::GetReal(const Key& origin, const Key& name) const
{
  return GetVariableChecked_(origin, name, VariableKind::REAL).real_view();
}


Teuchos::ArrayView<int>
VariableRegistry::GetInt(const Key& origin, const Key& name)
{
  GetVariableChecked_(origin, name, VariableKind::INTEGER);
  return GetVariableW_(origin, name).int_view();
}


Teuchos::ArrayView<const int>
VariableRegistry::GetInt(const Key& origin, const Key& name) const
{
  return GetVariableChecked_(origin, name, VariableKind::INTEGER).int_view();
}


KeyVector
VariableRegistry::Origins() const
{
  KeyVector origins;
  for (const auto& entry : data_) {
    if (origins.empty() || origins.back() != entry.first.first) {
      origins.push_back(entry.first.first);
    }
  }
  return origins;
}


/* ******************************************************************
* Accounting: sums live entries only.
****************************************************************** */
RegistryReport
VariableRegistry::Report() const
{
  RegistryReport report;
  for (const auto& entry : data_) {
    const auto& var = *entry.second;
    if (var.kind() == VariableKind::INTEGER) {
      report.num_integer++;
    } else {
      report.num_real++;
    }
    report.total_bytes += var.size_bytes();
  }
  return report;
}


RegistryReport
VariableRegistry::OriginReport(const Key& origin) const
{
  RegistryReport report;
  auto it = data_.lower_bound(std::make_pair(origin, Key()));
  for (; it != data_.end() && it->first.first == origin; ++it) {
    const auto& var = *it->second;
    if (var.kind() == VariableKind::INTEGER) {
      report.num_integer++;
    } else {
      report.num_real++;
    }
    report.total_bytes += var.size_bytes();
  }
  return report;
}


void
VariableRegistry::WriteSummary(std::ostream& os) const
{
  auto total = Report();

  os << "Information on variables stored in the registry" << std::endl;
  os << boost::format("%-24s %10s %10s %14s") % "ORIGIN" % "INTEGERS" % "DOUBLES" % "BYTES"
     << std::endl;
  os << std::string(61, '-') << std::endl;
  for (const auto& origin : Origins()) {
    auto r = OriginReport(origin);
    os << boost::format("%-24s %10d %10d %14d") % origin % r.num_integer % r.num_real %
            r.total_bytes
       << std::endl;
  }
  os << std::string(61, '-') << std::endl;
  os << boost::format("%-24s %10d %10d %14d") % "TOTAL" % total.num_integer % total.num_real %
          total.total_bytes
     << std::endl;
  os << boost::format("Total memory: %.6f MB") % (total.total_bytes / (1024.0 * 1024.0))
     << std::endl;
}

} // namespace Phreatic
