/*!
  \file qep_model_test.hpp
  \rst
  Tests for ExactProcess (qep_exact_process.hpp), the likelihoods, the models (qep_model.hpp) and
  IndependentModelList (qep_model_list.hpp).
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_MODEL_TEST_HPP_
#define SPARSE_QEP_CPP_QEP_MODEL_TEST_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Checks exact posteriors against hand-computed values, likelihood marginals, fantasy updates (exact and through
  pseudo points) and the list semantics of IndependentModelList.

  \return
    number of test failures: 0 if all model routines are working properly
\endrst*/
SQ_WARN_UNUSED_RESULT int RunModelTests();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_MODEL_TEST_HPP_
