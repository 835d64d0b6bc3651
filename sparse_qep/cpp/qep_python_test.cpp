/*!
  \file qep_python_test.cpp
  \rst
  Python wrapper around RunCppTests() (qep_run_tests.hpp).
\endrst*/
// Python.h must come first; see qep_python_common.cpp.
#include "Python.h"  // NOLINT(build/include)

#include "qep_python_test.hpp"

#include <boost/python/def.hpp>  // NOLINT(build/include_order)

#include "qep_common.hpp"
#include "qep_run_tests.hpp"

namespace sparse_qep {

void ExportCppTestFunctions() {
  boost::python::def("run_cpp_tests", RunCppTests, R"%%(
    Runs all current C++ unit tests and reports failures.

    :return: number of test failures. expected to be 0.
    :rtype: int >= 0
    )%%");
}

}  // end namespace sparse_qep
