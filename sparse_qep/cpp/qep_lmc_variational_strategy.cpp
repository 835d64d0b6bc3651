/*!
  \file qep_lmc_variational_strategy.cpp
  \rst
  Implementation of LmcVariationalStrategy.

  For latent ``q`` with mean ``\mu_q``, covariance ``K_q`` and coefficients ``a_q``:

  | all tasks: ``mean[n, t] = \sum_q \mu_q[n] a_q[t]``, ``cov = \sum_q K_q \otimes a_q a_q^T`` (index ``n*T + t``)
  | one task:  ``mean[n] = \sum_q a_q[t_n] \mu_q[n]``, ``cov[n, n'] = \sum_q a_q[t_n] a_q[t_{n'}] K_q[n, n']``

  plus ``jitter_val`` on the diagonal.  Latent ``q`` is batch index ``q`` along ``latent_dim`` of the base output.
\endrst*/

#include "qep_lmc_variational_strategy.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_model.hpp"
#include "qep_random.hpp"

namespace sparse_qep {

LmcVariationalStrategy::LmcVariationalStrategy(std::unique_ptr<VariationalStrategyInterface> base_variational_strategy, int num_tasks,
                                               int num_latents, int latent_dim, double jitter_val, NormalRNGInterface * normal_rng)
    : base_variational_strategy_(std::move(base_variational_strategy)),
      num_tasks_(num_tasks),
      num_latents_(num_latents),
      latent_dim_(latent_dim),
      jitter_val_(jitter_val),
      batch_shape_(),
      lmc_coefficients_() {
  if (unlikely(base_variational_strategy_ == nullptr)) {
    SQ_THROW_EXCEPTION(PreconditionException, "LMC needs a base variational strategy.");
  }
  if (unlikely(num_tasks_ < 1)) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "LMC needs at least one task.", num_tasks_, 1);
  }
  if (unlikely(latent_dim_ >= 0)) {
    SQ_THROW_EXCEPTION(PreconditionException, "latent_dim must be a negative indexed batch dimension.");
  }

  const BatchShape variational_batch_shape = base_variational_strategy_->VariationalDistribution().batch_shape();
  const int rank = static_cast<int>(variational_batch_shape.size());
  if (unlikely(-latent_dim_ > rank)) {
    SQ_THROW_EXCEPTION(PreconditionException, "latent_dim exceeds the rank of the variational batch shape.");
  }
  const int position = rank + latent_dim_;
  if (unlikely(variational_batch_shape[position] != num_latents_ && variational_batch_shape[position] != 1)) {
    SQ_THROW_EXCEPTION(PreconditionException, "Mismatch in num_latents: the variational batch shape along latent_dim must be num_latents or 1.");
  }

  batch_shape_ = variational_batch_shape;
  batch_shape_.erase(batch_shape_.begin() + position);

  if (jitter_val_ == kDefaultJitter) {
    jitter_val_ = base_variational_strategy_->settings().jitter;
  }
  if (unlikely(jitter_val_ < 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Jitter must be non-negative.", jitter_val_, 0.0);
  }

  lmc_coefficients_ = BatchMatrix(variational_batch_shape, 1, num_tasks_);
  NormalRNG default_normal_rng(NormalRNG::kDefaultSeed);
  NormalRNGInterface * coefficient_rng = (normal_rng != nullptr) ? normal_rng : &default_normal_rng;
  for (auto& coefficient : lmc_coefficients_.data) {
    coefficient = (*coefficient_rng)();
  }
}

LmcVariationalStrategy::LmcVariationalStrategy(const LmcVariationalStrategy& source)
    : base_variational_strategy_(source.base_variational_strategy_->Clone()),
      num_tasks_(source.num_tasks_),
      num_latents_(source.num_latents_),
      latent_dim_(source.latent_dim_),
      jitter_val_(source.jitter_val_),
      batch_shape_(source.batch_shape_),
      lmc_coefficients_(source.lmc_coefficients_) {
}

LatentDistribution LmcVariationalStrategy::Call(const BatchMatrix& inputs, bool prior) {
  const LatentDistribution latent_dist = base_variational_strategy_->Call(inputs, prior);
  const BatchShape& latent_batch_shape = latent_dist.batch_shape();
  const int num_data = latent_dist.num_data();
  const int num_tasks = num_tasks_;
  const int event_size = num_data*num_tasks;

  const BatchMatrix lmc_coefficients = lmc_coefficients_.Expand(latent_batch_shape);
  const int position = NormalizeBatchDim(latent_dim_, static_cast<int>(latent_batch_shape.size()));
  const int num_latents_local = latent_batch_shape[position];

  BatchShape output_batch_shape(latent_batch_shape);
  output_batch_shape.erase(output_batch_shape.begin() + position);
  BatchMatrix mean(output_batch_shape, num_data, num_tasks);
  BatchMatrix covariance(output_batch_shape, event_size, event_size);

  for (int q = 0; q < num_latents_local; ++q) {
    const BatchMatrix latent_mean = latent_dist.mean().Select(latent_dim_, q);
    const BatchMatrix latent_covariance = latent_dist.covariance().Select(latent_dim_, q);
    const BatchMatrix coefficients = lmc_coefficients.Select(latent_dim_, q);
    for (int b = 0; b < mean.batch_size(); ++b) {
      double const * const mu = latent_mean.element(b);
      double const * const K = latent_covariance.element(b);
      double const * const a = coefficients.element(b);
      double * mean_b = mean.element(b);
      double * cov_b = covariance.element(b);

      for (int t = 0; t < num_tasks; ++t) {
        VectorAXPY(num_data, a[t], mu, mean_b + t*num_data);
      }

      // K_q \otimes a_q a_q^T, interleaved
      for (int n2 = 0; n2 < num_data; ++n2) {
        for (int t2 = 0; t2 < num_tasks; ++t2) {
          double * column = cov_b + (n2*num_tasks + t2)*event_size;
          for (int n1 = 0; n1 < num_data; ++n1) {
            const double scaled_kernel = K[n2*num_data + n1]*a[t2];
            for (int t1 = 0; t1 < num_tasks; ++t1) {
              column[n1*num_tasks + t1] += scaled_kernel*a[t1];
            }
          }
        }
      }
    }
  }

  for (int b = 0; b < covariance.batch_size(); ++b) {
    AddDiagonalJitter(jitter_val_, event_size, covariance.element(b));
  }
  return LatentDistribution::Multitask(latent_dist.power(), mean, covariance, true);
}

LatentDistribution LmcVariationalStrategy::Call(const BatchMatrix& inputs, const std::vector<int>& task_indices, bool prior) {
  if (unlikely(static_cast<int>(task_indices.size()) != inputs.num_cols)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Need exactly one task index per input.", static_cast<int>(task_indices.size()), inputs.num_cols);
  }
  for (const auto task_index : task_indices) {
    if (unlikely(task_index < 0 || task_index >= num_tasks_)) {
      SQ_THROW_EXCEPTION(BoundsException<int>, "Task index out of range.", task_index, 0, num_tasks_ - 1);
    }
  }

  const LatentDistribution latent_dist = base_variational_strategy_->Call(inputs, prior);
  const BatchShape& latent_batch_shape = latent_dist.batch_shape();
  const int num_data = latent_dist.num_data();

  const BatchMatrix lmc_coefficients = lmc_coefficients_.Expand(latent_batch_shape);
  const int position = NormalizeBatchDim(latent_dim_, static_cast<int>(latent_batch_shape.size()));
  const int num_latents_local = latent_batch_shape[position];

  BatchShape output_batch_shape(latent_batch_shape);
  output_batch_shape.erase(output_batch_shape.begin() + position);
  BatchMatrix mean(output_batch_shape, num_data, 1);
  BatchMatrix covariance(output_batch_shape, num_data, num_data);

  std::vector<double> selected_coefficients(num_data);
  for (int q = 0; q < num_latents_local; ++q) {
    const BatchMatrix latent_mean = latent_dist.mean().Select(latent_dim_, q);
    const BatchMatrix latent_covariance = latent_dist.covariance().Select(latent_dim_, q);
    const BatchMatrix coefficients = lmc_coefficients.Select(latent_dim_, q);
    for (int b = 0; b < mean.batch_size(); ++b) {
      double const * const mu = latent_mean.element(b);
      double const * const K = latent_covariance.element(b);
      for (int n = 0; n < num_data; ++n) {
        selected_coefficients[n] = coefficients.element(b)[task_indices[n]];
      }

      double * mean_b = mean.element(b);
      double * cov_b = covariance.element(b);
      for (int n2 = 0; n2 < num_data; ++n2) {
        mean_b[n2] += selected_coefficients[n2]*mu[n2];
        for (int n1 = 0; n1 < num_data; ++n1) {
          cov_b[n2*num_data + n1] += selected_coefficients[n1]*selected_coefficients[n2]*K[n2*num_data + n1];
        }
      }
    }
  }

  for (int b = 0; b < covariance.batch_size(); ++b) {
    AddDiagonalJitter(jitter_val_, num_data, covariance.element(b));
  }
  return LatentDistribution(latent_dist.power(), mean, covariance);
}

BatchMatrix LmcVariationalStrategy::KlDivergence() {
  return base_variational_strategy_->KlDivergence().SumBatchDim(latent_dim_);
}

void LmcVariationalStrategy::GetParameters(double * restrict parameters) const noexcept {
  base_variational_strategy_->GetParameters(parameters);
  parameters += base_variational_strategy_->GetNumberOfParameters();
  std::copy(lmc_coefficients_.data.begin(), lmc_coefficients_.data.end(), parameters);
}

void LmcVariationalStrategy::SetParameters(double const * restrict parameters) {
  base_variational_strategy_->SetParameters(parameters);
  parameters += base_variational_strategy_->GetNumberOfParameters();
  std::copy(parameters, parameters + lmc_coefficients_.data.size(), lmc_coefficients_.data.begin());
}

std::unique_ptr<ExactConditionalModel> LmcVariationalStrategy::GetFantasyModel(const BatchMatrix& SQ_UNUSED(inputs),
                                                                               const BatchMatrix& SQ_UNUSED(targets),
                                                                               const LikelihoodInterface& SQ_UNUSED(likelihood),
                                                                               double SQ_UNUSED(noise_variance)) {
  SQ_THROW_EXCEPTION(NotImplementedException, "Fantasy updates are not available for LMC outputs.");
}

VariationalStrategyInterface * LmcVariationalStrategy::Clone() const {
  return new LmcVariationalStrategy(*this);
}

}  // end namespace sparse_qep
