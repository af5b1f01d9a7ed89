/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "dbc.hh"
#include "Variable.hh"

namespace Phreatic {

std::string
to_string(VariableKind kind)
{
  return (kind == VariableKind::INTEGER) ? "INTEGER" : "DOUBLE";
}


Variable::Variable(const Key& origin, const Key& name, VariableKind kind, int extent, bool scalar)
  : origin_(origin), name_(name), kind_(kind), extent_(extent), scalar_(scalar)
{
  PHREATIC_ASSERT(extent_ > 0);
  PHREATIC_ASSERT(!scalar_ || extent_ == 1);

  if (kind_ == VariableKind::REAL) {
    rdata_.assign(extent_, 0.0);
  } else {
    idata_.assign(extent_, 0);
  }
}


std::size_t
Variable::size_bytes() const
{
  std::size_t item = (kind_ == VariableKind::REAL) ? sizeof(double) : sizeof(int);
  return item * static_cast<std::size_t>(extent_);
}


Teuchos::ArrayView<double>
Variable::real_view()
{
  PHREATIC_ASSERT(kind_ == VariableKind::REAL);
  return Teuchos::ArrayView<double>(rdata_.data(), rdata_.size());
}


Teuchos::ArrayView<const double>
Variable::real_view() const
{
  PHREATIC_ASSERT(kind_ == VariableKind::REAL);
  return Teuchos::ArrayView<const double>(rdata_.data(), rdata_.size());
}


Teuchos::ArrayView<int>
Variable::int_view()
{
  PHREATIC_ASSERT(kind_ == VariableKind::INTEGER);
  return Teuchos::ArrayView<int>(idata_.data(), idata_.size());
}


Teuchos::ArrayView<const int>
Variable::int_view() const
{
  PHREATIC_ASSERT(kind_ == VariableKind::INTEGER);
  return Teuchos::ArrayView<const int>(idata_.data(), idata_.size());
}

} // namespace Phreatic
