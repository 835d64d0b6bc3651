/*!
  \file qep_run_tests.hpp
  \rst
  Single entry point for every C++ unit test suite; shared by the test driver executable and the Python module.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_RUN_TESTS_HPP_
#define SPARSE_QEP_CPP_QEP_RUN_TESTS_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Runs all C++ unit tests, printing SUCCESS/FAILURE for each suite.

  \return
    number of test failures: 0 if everything passed
\endrst*/
SQ_WARN_UNUSED_RESULT int RunCppTests();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_RUN_TESTS_HPP_
