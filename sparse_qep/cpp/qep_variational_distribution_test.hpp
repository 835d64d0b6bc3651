/*!
  \file qep_variational_distribution_test.hpp
  \rst
  Tests for the variational distributions ``q(u)`` (qep_variational_distribution.hpp) and for StrategyCache
  (qep_cache.hpp), the memo table strategies keep next to them.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_VARIATIONAL_DISTRIBUTION_TEST_HPP_
#define SPARSE_QEP_CPP_QEP_VARIATIONAL_DISTRIBUTION_TEST_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Checks default parameters, seeding from a prior, the parameter layout of each variational distribution, cloning, and
  constructor errors.

  \return
    number of test failures: 0 if the variational distributions are working properly
\endrst*/
SQ_WARN_UNUSED_RESULT int RunVariationalDistributionTests();

/*!\rst
  Checks generation-based invalidation in StrategyCache and that the "initialized" flag is terminal.

  \return
    number of test failures: 0 if StrategyCache is working properly
\endrst*/
SQ_WARN_UNUSED_RESULT int RunStrategyCacheTests();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_VARIATIONAL_DISTRIBUTION_TEST_HPP_
