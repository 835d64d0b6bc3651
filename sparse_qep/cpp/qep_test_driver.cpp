/*!
  \file qep_test_driver.cpp
  \rst
  Command-line driver for the C++ unit tests.  Exits with status 0 iff every suite passes; this is what ``ctest`` runs.
\endrst*/

#include <cstdio>

#include "qep_logging.hpp"
#include "qep_run_tests.hpp"

int main() {
  const int total_errors = sparse_qep::RunCppTests();
  if (total_errors != 0) {
    SQ_FAILURE_PRINTF("%d C++ unit test errors\n", total_errors);
    return 1;
  }
  SQ_SUCCESS_PRINTF("all C++ unit tests\n");
  return 0;
}
