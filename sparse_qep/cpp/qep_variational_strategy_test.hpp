/*!
  \file qep_variational_strategy_test.hpp
  \rst
  Tests for the whitened and unwhitened variational strategies (qep_variational_strategy.hpp).

  Most checks use problems small enough to have closed forms: inputs that coincide with the inducing points, or an
  identity kernel so that ``K_zz`` and ``K_xz`` are (scaled) selection matrices.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_VARIATIONAL_STRATEGY_TEST_HPP_
#define SPARSE_QEP_CPP_QEP_VARIATIONAL_STRATEGY_TEST_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Checks:

  * degenerate calls (``x == Z``) for both strategies
  * closed-form posteriors with a linear mean and identity kernel, in training and eval mode
  * one-time seeding of ``q(u)``, KL divergences, cache invalidation
  * parameter (de)serialization, cloning, and batch shapes
  * conjugate gradient solves and the mean-only fast path against the Cholesky path
  * pseudo points and constructor errors

  \return
    number of test failures: 0 if the variational strategies are working properly
\endrst*/
SQ_WARN_UNUSED_RESULT int RunVariationalStrategyTests();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_VARIATIONAL_STRATEGY_TEST_HPP_
