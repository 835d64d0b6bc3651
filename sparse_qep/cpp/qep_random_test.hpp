/*!
  \file qep_random_test.hpp
  \rst
  Tests for qep_random.hpp: PRNG container classes, the table-driven NormalRNGSimulator, and uniform value generation.

  The PRNG container tests verify seeding and rollback (ResetToMostRecentSeed()).
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_RANDOM_TEST_HPP_
#define SPARSE_QEP_CPP_QEP_RANDOM_TEST_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Checks that PRNG containers are behaving correctly:

  * Tests manual seed setting
  * Tests last_seed and reset
  * Tests that draws replay after a reset and that distinct seeds give distinct streams
  * Tests NormalRNGSimulator indexing and exhaustion
  * Tests the first two moments of NormalRNG and the range of ComputeUniformRandomValues()

  \return
    number of test failures: 0 if PRNG containers are behaving correctly
\endrst*/
int RunRandomTests() SQ_WARN_UNUSED_RESULT;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_RANDOM_TEST_HPP_
