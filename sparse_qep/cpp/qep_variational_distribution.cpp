/*!
  \file qep_variational_distribution.cpp
  \rst
  Definitions for the variational distributions: forward construction of ``q(u)``, seeding from the prior, and
  parameter (de)serialization.
\endrst*/

#include "qep_variational_distribution.hpp"

#include <cmath>

#include <algorithm>
#include <limits>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_logging.hpp"
#include "qep_random.hpp"

namespace sparse_qep {

VariationalDistributionInterface::VariationalDistributionInterface(int num_inducing_points, const BatchShape& batch_shape, double power)
    : num_inducing_points_(num_inducing_points), batch_shape_(batch_shape), power_(power) {
  if (unlikely(num_inducing_points <= 0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "Need at least one inducing point.", num_inducing_points, 1);
  }
  if (unlikely(power <= 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Variational power must be positive.", power, std::numeric_limits<double>::min());
  }
}

LatentDistribution VariationalDistributionInterface::ExpandPrior(const LatentDistribution& prior) const {
  if (unlikely(prior.event_size() != num_inducing_points_)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Prior event size must equal the number of inducing points.", prior.event_size(), num_inducing_points_);
  }
  return prior.Expand(batch_shape_);
}

CholeskyVariationalDistribution::CholeskyVariationalDistribution(int num_inducing_points, const BatchShape& batch_shape, double power,
                                                                 double mean_init_std, NormalRNG::EngineType::result_type mean_init_seed)
    : VariationalDistributionInterface(num_inducing_points, batch_shape, power),
      mean_init_std_(mean_init_std),
      mean_init_seed_(mean_init_seed),
      variational_mean_(batch_shape, num_inducing_points, 1),
      chol_variational_covar_(IdentityBatch(batch_shape, num_inducing_points)) {
}

LatentDistribution CholeskyVariationalDistribution::Forward() const {
  const int size = num_inducing_points_;
  BatchMatrix covariance(batch_shape_, size, size);
  for (int b = 0; b < covariance.batch_size(); ++b) {
    GeneralMatrixMatrixTransposeMultiply(chol_variational_covar_.element(b), chol_variational_covar_.element(b), 1.0, 0.0,
                                         size, size, size, covariance.element(b));
  }
  LatentDistribution result(power_, variational_mean_, covariance);
  result.SetRoot(chol_variational_covar_);
  return result;
}

void CholeskyVariationalDistribution::InitializeVariationalDistribution(const LatentDistribution& prior) {
  const LatentDistribution prior_expanded = ExpandPrior(prior);
  const int size = num_inducing_points_;

  variational_mean_ = prior_expanded.mean();
  if (mean_init_std_ != 0.0) {
    NormalRNG normal_rng(mean_init_seed_);
    for (auto& entry : variational_mean_.data) {
      entry += mean_init_std_*normal_rng();
    }
  }

  for (int b = 0; b < chol_variational_covar_.batch_size(); ++b) {
    const double jitter = PsdSafeCholesky(prior_expanded.covariance().element(b), size, 1.0e-8, 3, chol_variational_covar_.element(b));
    if (jitter > 0.0) {
      SQ_VERBOSE_PRINTF("CholeskyVariationalDistribution: prior factored with jitter %.1E\n", jitter);
    }
  }
}

void CholeskyVariationalDistribution::GetParameters(double * restrict parameters) const noexcept {
  const int size = num_inducing_points_;
  for (int b = 0; b < variational_mean_.batch_size(); ++b) {
    parameters = std::copy(variational_mean_.element(b), variational_mean_.element(b) + size, parameters);
    double const * chol = chol_variational_covar_.element(b);
    for (int j = 0; j < size; ++j) {
      parameters = std::copy(chol + j*size + j, chol + (j + 1)*size, parameters);
    }
  }
}

void CholeskyVariationalDistribution::SetParameters(double const * restrict parameters) noexcept {
  const int size = num_inducing_points_;
  for (int b = 0; b < variational_mean_.batch_size(); ++b) {
    std::copy(parameters, parameters + size, variational_mean_.element(b));
    parameters += size;
    double * chol = chol_variational_covar_.element(b);
    for (int j = 0; j < size; ++j) {
      std::copy(parameters, parameters + size - j, chol + j*size + j);
      parameters += size - j;
    }
  }
}

VariationalDistributionInterface * CholeskyVariationalDistribution::Clone() const {
  return new CholeskyVariationalDistribution(*this);
}

MeanFieldVariationalDistribution::MeanFieldVariationalDistribution(int num_inducing_points, const BatchShape& batch_shape, double power)
    : VariationalDistributionInterface(num_inducing_points, batch_shape, power),
      variational_mean_(batch_shape, num_inducing_points, 1),
      variational_stddev_(batch_shape, num_inducing_points, 1, std::vector<double>(BatchSize(batch_shape)*num_inducing_points, 1.0)) {
}

LatentDistribution MeanFieldVariationalDistribution::Forward() const {
  const int size = num_inducing_points_;
  BatchMatrix covariance(batch_shape_, size, size);
  BatchMatrix root(batch_shape_, size, size);
  for (int b = 0; b < covariance.batch_size(); ++b) {
    double const * const stddev = variational_stddev_.element(b);
    for (int i = 0; i < size; ++i) {
      covariance.element(b)[i*size + i] = Square(stddev[i]);
      root.element(b)[i*size + i] = stddev[i];
    }
  }
  LatentDistribution result(power_, variational_mean_, covariance);
  result.SetRoot(root);
  return result;
}

void MeanFieldVariationalDistribution::InitializeVariationalDistribution(const LatentDistribution& prior) {
  const LatentDistribution prior_expanded = ExpandPrior(prior);
  variational_mean_ = prior_expanded.mean();
  const BatchMatrix variance = prior_expanded.Variance();
  for (int i = 0; i < static_cast<int>(variance.data.size()); ++i) {
    variational_stddev_.data[i] = std::sqrt(std::max(variance.data[i], 0.0));
  }
}

void MeanFieldVariationalDistribution::GetParameters(double * restrict parameters) const noexcept {
  const int size = num_inducing_points_;
  for (int b = 0; b < variational_mean_.batch_size(); ++b) {
    parameters = std::copy(variational_mean_.element(b), variational_mean_.element(b) + size, parameters);
    parameters = std::copy(variational_stddev_.element(b), variational_stddev_.element(b) + size, parameters);
  }
}

void MeanFieldVariationalDistribution::SetParameters(double const * restrict parameters) noexcept {
  const int size = num_inducing_points_;
  for (int b = 0; b < variational_mean_.batch_size(); ++b) {
    std::copy(parameters, parameters + size, variational_mean_.element(b));
    std::copy(parameters + size, parameters + 2*size, variational_stddev_.element(b));
    parameters += 2*size;
  }
}

VariationalDistributionInterface * MeanFieldVariationalDistribution::Clone() const {
  return new MeanFieldVariationalDistribution(*this);
}

DeltaVariationalDistribution::DeltaVariationalDistribution(int num_inducing_points, const BatchShape& batch_shape, double power)
    : VariationalDistributionInterface(num_inducing_points, batch_shape, power),
      variational_mean_(batch_shape, num_inducing_points, 1) {
}

LatentDistribution DeltaVariationalDistribution::Forward() const {
  const int size = num_inducing_points_;
  const BatchMatrix zeros(batch_shape_, size, size);
  LatentDistribution result(power_, variational_mean_, zeros);
  result.SetRoot(zeros);
  return result;
}

void DeltaVariationalDistribution::InitializeVariationalDistribution(const LatentDistribution& prior) {
  variational_mean_ = ExpandPrior(prior).mean();
}

void DeltaVariationalDistribution::GetParameters(double * restrict parameters) const noexcept {
  std::copy(variational_mean_.data.begin(), variational_mean_.data.end(), parameters);
}

void DeltaVariationalDistribution::SetParameters(double const * restrict parameters) noexcept {
  std::copy(parameters, parameters + variational_mean_.data.size(), variational_mean_.data.begin());
}

VariationalDistributionInterface * DeltaVariationalDistribution::Clone() const {
  return new DeltaVariationalDistribution(*this);
}

}  // end namespace sparse_qep
