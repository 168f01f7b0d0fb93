#pragma once

// =============================================================================
// GVMI - Test Framework (Master Include)
// =============================================================================
//
// Single include for all test utilities.
//
// Components:
//   - core.hpp   : Test registration, runner, assertions
//   - guard.hpp  : RAII wrappers for C API handles
//   - oracle.hpp : Eigen reference binning and mutual information
//   - data.hpp   : Random and structured expression data generators
//
// Usage:
//   #include "test.hpp"
//
//   GVMI_TEST_BEGIN
//
//   GVMI_TEST_UNIT(my_test) {
//       auto x = gvmi::test::ramp(20);
//       gvmi_real_t mi = 0;
//       GVMI_ASSERT_EQ(gvmi_mi_mutual_information(x.data(), x.data(), x.size(), 10, &mi), GVMI_OK);
//       GVMI_ASSERT_NEAR(mi, gvmi::test::oracle::mutual_information(x, x, 10), 1e-12);
//   }
//
//   GVMI_TEST_END
//   GVMI_TEST_MAIN()
//
// =============================================================================

// Core testing framework
#include "core.hpp"

// RAII guards for C API handles
#include "guard.hpp"

// Eigen reference implementation
#include "oracle.hpp"

// Test data generators
#include "data.hpp"
