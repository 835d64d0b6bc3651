/*!
  \file qep_likelihood.cpp
  \rst
  Definitions for the observation likelihoods.
\endrst*/

#include "qep_likelihood.hpp"

#include <cmath>

#include <limits>

#include <boost/math/distributions/normal.hpp>  // NOLINT(build/include_order)

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"

namespace sparse_qep {

GaussianLikelihood::GaussianLikelihood(double noise_variance) : noise_variance_(noise_variance) {
  if (unlikely(noise_variance < 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Noise variance must be non-negative.", noise_variance, 0.0);
  }
}

LatentDistribution GaussianLikelihood::Marginal(const LatentDistribution& function_distribution) const {
  return function_distribution.AddJitter(noise_variance_);
}

LikelihoodInterface * GaussianLikelihood::Clone() const {
  return new GaussianLikelihood(*this);
}

QExponentialLikelihood::QExponentialLikelihood(double noise_variance, double power) : noise_variance_(noise_variance), power_(power) {
  if (unlikely(noise_variance < 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Noise variance must be non-negative.", noise_variance, 0.0);
  }
  if (unlikely(power <= 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Likelihood power must be positive.", power, std::numeric_limits<double>::min());
  }
}

LatentDistribution QExponentialLikelihood::Marginal(const LatentDistribution& function_distribution) const {
  return function_distribution.AddJitter(noise_variance_);
}

LikelihoodInterface * QExponentialLikelihood::Clone() const {
  return new QExponentialLikelihood(*this);
}

LatentDistribution BernoulliLikelihood::Marginal(const LatentDistribution& function_distribution) const {
  const BatchMatrix& mean = function_distribution.mean();
  const BatchMatrix variance = function_distribution.Variance();
  const int event_size = function_distribution.event_size();

  BatchMatrix probability(mean.batch_shape, mean.num_rows, mean.num_cols);
  BatchMatrix covariance(mean.batch_shape, event_size, event_size);
  for (int b = 0; b < probability.batch_size(); ++b) {
    for (int t = 0; t < mean.num_cols; ++t) {
      for (int n = 0; n < mean.num_rows; ++n) {
        const int index = t*mean.num_rows + n;
        const double p = boost::math::cdf(normal_, mean.element(b)[index]/std::sqrt(1.0 + variance.element(b)[index]));
        probability.element(b)[index] = p;
        const int diagonal = function_distribution.CovarianceIndex(n, t);
        covariance.element(b)[diagonal*event_size + diagonal] = p*(1.0 - p);
      }
    }
  }

  if (function_distribution.is_multitask()) {
    return LatentDistribution::Multitask(kNormalPower, probability, covariance, function_distribution.interleaved());
  }
  return LatentDistribution(kNormalPower, probability, covariance);
}

LikelihoodInterface * BernoulliLikelihood::Clone() const {
  return new BernoulliLikelihood(*this);
}

}  // end namespace sparse_qep
