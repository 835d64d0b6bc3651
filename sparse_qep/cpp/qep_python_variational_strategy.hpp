/*!
  \file qep_python_variational_strategy.hpp
  \rst
  This file registers the translation layer for constructing an unwhitened variational strategy (see
  qep_variational_strategy.hpp) from Python and making predictions with it.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_PYTHON_VARIATIONAL_STRATEGY_HPP_
#define SPARSE_QEP_CPP_QEP_PYTHON_VARIATIONAL_STRATEGY_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Exports ``UnwhitenedPredictor``:

  1. Constructor accepting Python structures (square exponential kernel, constant mean, inducing points)
  2. Predictive mean and covariance, KL divergence, posterior samples
  3. Flattened variational parameters and train/eval mode switches
\endrst*/
void ExportVariationalStrategyFunctions();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_PYTHON_VARIATIONAL_STRATEGY_HPP_
