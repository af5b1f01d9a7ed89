/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <sstream>

#include "UnitTest++.h"

#include "errors.hh"
#include "VariableRegistry.hh"

using namespace Phreatic;

SUITE(VARIABLE_REGISTRY)
{
  TEST(ALLOCATE_AND_GET)
  {
    VariableRegistry registry;
    auto h = registry.Allocate("SLN_1", "X", VariableKind::REAL, 10);

    CHECK(registry.Exists(h));
    CHECK_EQUAL("SLN_1", h.origin);
    CHECK_EQUAL("X", h.name);

    auto x = registry.GetReal("SLN_1", "X");
    CHECK_EQUAL(10, x.size());
    for (int i = 0; i < 10; ++i) CHECK_EQUAL(0.0, x[i]);

    // writes through one view are seen by the next lookup
    x[3] = 4.5;
    CHECK_EQUAL(4.5, registry.GetReal(h)[3]);

    const auto& var = registry.GetVariable("SLN_1", "X");
    CHECK(var.kind() == VariableKind::REAL);
    CHECK(!var.is_scalar());
    CHECK_EQUAL(10 * sizeof(double), var.size_bytes());
  }

  TEST(SCALARS_AND_INTEGERS)
  {
    VariableRegistry registry;
    registry.AllocateScalar("SLN_1", "ITER", VariableKind::INTEGER);
    registry.Allocate("GWF_1", "IBOUND", VariableKind::INTEGER, 4);

    CHECK(registry.GetVariable("SLN_1", "ITER").is_scalar());
    registry.GetInt("SLN_1", "ITER")[0] = 7;
    CHECK_EQUAL(7, registry.GetInt("SLN_1", "ITER")[0]);
    CHECK_EQUAL(4, registry.GetInt("GWF_1", "IBOUND").size());
  }

  TEST(DUPLICATE_NAME)
  {
    VariableRegistry registry;
    registry.Allocate("GWF_1", "K", VariableKind::REAL, 5);

    CHECK_THROW(registry.Allocate("GWF_1", "K", VariableKind::REAL, 5), Errors::DuplicateNameError);
    CHECK_THROW(registry.Allocate("GWF_1", "K", VariableKind::INTEGER, 2),
                Errors::DuplicateNameError);
    CHECK_THROW(registry.AllocateScalar("GWF_1", "K", VariableKind::REAL),
                Errors::DuplicateNameError);

    // same name under another origin is a different variable
    registry.Allocate("GWF_2", "K", VariableKind::REAL, 5);
    CHECK_EQUAL(2, registry.size());
  }

  TEST(INVALID_SHAPE)
  {
    VariableRegistry registry;
    CHECK_THROW(registry.Allocate("GWF_1", "K", VariableKind::REAL, 0), Errors::InvalidShapeError);
    CHECK_THROW(registry.Allocate("GWF_1", "K", VariableKind::REAL, -3),
                Errors::InvalidShapeError);
    CHECK(!registry.Exists("GWF_1", "K"));
  }

  TEST(NOT_FOUND_AND_RELEASE)
  {
    VariableRegistry registry;
    CHECK_THROW(registry.GetReal("GWF_1", "K"), Errors::NotFoundError);

    registry.Allocate("GWF_1", "K", VariableKind::REAL, 5);
    registry.Release("GWF_1", "K");
    CHECK(!registry.Exists("GWF_1", "K"));

    // re-release is an error
    CHECK_THROW(registry.Release("GWF_1", "K"), Errors::NotFoundError);

    // and the name is free again
    registry.Allocate("GWF_1", "K", VariableKind::INTEGER, 2);
    CHECK_EQUAL(2, registry.GetInt("GWF_1", "K").size());
  }

  TEST(KIND_MISMATCH)
  {
    VariableRegistry registry;
    registry.Allocate("GWF_1", "IBOUND", VariableKind::INTEGER, 3);
    CHECK_THROW(registry.GetReal("GWF_1", "IBOUND"), Errors::KindMismatchError);
  }

  TEST(RELEASE_ORIGIN)
  {
    VariableRegistry registry;
    registry.Allocate("SLN_1", "X", VariableKind::REAL, 3);
    registry.Allocate("SLN_1", "RHS", VariableKind::REAL, 3);
    registry.Allocate("SLN_1-linear", "P", VariableKind::REAL, 3);
    registry.Allocate("SLN_10", "X", VariableKind::REAL, 3);

    CHECK_EQUAL(2, registry.ReleaseOrigin("SLN_1"));
    CHECK(!registry.Exists("SLN_1", "X"));
    CHECK(registry.Exists("SLN_1-linear", "P"));
    CHECK(registry.Exists("SLN_10", "X"));
    CHECK_EQUAL(0, registry.ReleaseOrigin("SLN_1"));
  }

  TEST(REPORT_IS_EXACT)
  {
    VariableRegistry registry;
    RegistryReport r0 = registry.Report();
    CHECK_EQUAL(0, r0.num_integer);
    CHECK_EQUAL(0, r0.num_real);
    CHECK_EQUAL(0u, r0.total_bytes);

    // a sequence of allocations and releases, tracking the expected footprint
    std::size_t expected(0);
    int nreal(0), nint(0);
    for (int i = 1; i <= 20; ++i) {
      std::stringstream name;
      name << "V" << i;
      if (i % 3 == 0) {
        registry.Allocate("MODEL", name.str(), VariableKind::INTEGER, i);
        expected += i * sizeof(int);
        nint++;
      } else {
        registry.Allocate("MODEL", name.str(), VariableKind::REAL, i);
        expected += i * sizeof(double);
        nreal++;
      }

      // duplicates never change the accounting
      CHECK_THROW(registry.Allocate("MODEL", name.str(), VariableKind::REAL, 1),
                  Errors::DuplicateNameError);
    }

    registry.Release("MODEL", "V5");
    expected -= 5 * sizeof(double);
    nreal--;
    registry.Release("MODEL", "V9");
    expected -= 9 * sizeof(int);
    nint--;

    RegistryReport r = registry.Report();
    CHECK_EQUAL(nint, r.num_integer);
    CHECK_EQUAL(nreal, r.num_real);
    CHECK_EQUAL(expected, r.total_bytes);

    RegistryReport ro = registry.OriginReport("MODEL");
    CHECK_EQUAL(expected, ro.total_bytes);
  }

  TEST(ORDERED_ENUMERATION)
  {
    VariableRegistry registry;
    registry.Allocate("SLN_1", "X", VariableKind::REAL, 1);
    registry.Allocate("GWF_2", "K", VariableKind::REAL, 1);
    registry.Allocate("GWF_1", "K", VariableKind::REAL, 1);

    auto origins = registry.Origins();
    CHECK_EQUAL(3, origins.size());
    CHECK_EQUAL("GWF_1", origins[0]);
    CHECK_EQUAL("GWF_2", origins[1]);
    CHECK_EQUAL("SLN_1", origins[2]);

    std::stringstream ss;
    registry.WriteSummary(ss);
    CHECK(ss.str().find("GWF_2") != std::string::npos);
    CHECK(ss.str().find("TOTAL") != std::string::npos);
  }
}
