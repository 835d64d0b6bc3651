/*!
  \file qep_distribution_test.hpp
  \rst
  Tests for LatentDistribution (qep_distribution.hpp): construction and layout, root decompositions, sampling moments
  for both families, the marginal sampler, and KL divergences against closed forms.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_DISTRIBUTION_TEST_HPP_
#define SPARSE_QEP_CPP_QEP_DISTRIBUTION_TEST_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  \return
    number of test failures: 0 if LatentDistribution and its free functions are working properly
\endrst*/
SQ_WARN_UNUSED_RESULT int RunDistributionTests();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_DISTRIBUTION_TEST_HPP_
