/*!
  \file qep_lmc_variational_strategy_test.hpp
  \rst
  Tests for LmcVariationalStrategy (qep_lmc_variational_strategy.hpp).
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_LMC_VARIATIONAL_STRATEGY_TEST_HPP_
#define SPARSE_QEP_CPP_QEP_LMC_VARIATIONAL_STRATEGY_TEST_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Checks all-task and per-point-task outputs against hand-computed mixtures of two latent processes, KL summation over
  the latent dimension, parameter layout, and constructor/argument errors.

  \return
    number of test failures: 0 if LmcVariationalStrategy is working properly
\endrst*/
SQ_WARN_UNUSED_RESULT int RunLmcVariationalStrategyTests();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_LMC_VARIATIONAL_STRATEGY_TEST_HPP_
