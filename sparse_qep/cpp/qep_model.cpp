/*!
  \file qep_model.cpp
  \rst
  Implementation of ApproximateModel and ExactConditionalModel.
\endrst*/

#include "qep_model.hpp"

#include <memory>
#include <utility>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_exact_process.hpp"
#include "qep_exception.hpp"
#include "qep_likelihood.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_variational_strategy.hpp"

namespace sparse_qep {

BatchMatrix FantasyNoiseCovariance(const BatchMatrix& targets, const LikelihoodInterface& likelihood, double noise_variance) {
  const double fantasy_noise = (noise_variance == kLikelihoodNoise) ? likelihood.noise_variance() : noise_variance;
  if (unlikely(fantasy_noise < 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Fantasy noise variance must be non-negative.", fantasy_noise, 0.0);
  }

  const int num_fantasies = targets.num_rows;
  BatchMatrix noise_covariance(targets.batch_shape, num_fantasies, num_fantasies);
  for (int b = 0; b < noise_covariance.batch_size(); ++b) {
    AddDiagonalJitter(fantasy_noise, num_fantasies, noise_covariance.element(b));
  }
  return noise_covariance;
}

ApproximateModel::ApproximateModel(std::unique_ptr<VariationalStrategyInterface> strategy, const LikelihoodInterface& likelihood)
    : strategy_(std::move(strategy)),
      likelihood_(likelihood.Clone()),
      train_inputs_(),
      train_targets_() {
  if (unlikely(strategy_ == nullptr)) {
    SQ_THROW_EXCEPTION(PreconditionException, "An approximate model needs a variational strategy.");
  }
}

ApproximateModel::ApproximateModel(const ApproximateModel& source)
    : strategy_(source.strategy_->Clone()),
      likelihood_(source.likelihood_->Clone()),
      train_inputs_(source.train_inputs_),
      train_targets_(source.train_targets_) {
}

std::unique_ptr<ModelInterface> ApproximateModel::GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets, double noise_variance) {
  return std::unique_ptr<ModelInterface>(strategy_->GetFantasyModel(inputs, targets, *likelihood_, noise_variance).release());
}

void ApproximateModel::SetTrainData(const BatchMatrix& inputs, const BatchMatrix& targets) {
  if (unlikely(targets.num_rows != inputs.num_cols || targets.num_cols != 1)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Need exactly one target per training input.", targets.num_rows*targets.num_cols, inputs.num_cols);
  }
  train_inputs_ = inputs;
  train_targets_ = targets;
}

ModelInterface * ApproximateModel::Clone() const {
  return new ApproximateModel(*this);
}

ExactConditionalModel::ExactConditionalModel(const ExactProcess& process, const LikelihoodInterface& likelihood)
    : process_(process.Clone()),
      likelihood_(likelihood.Clone()) {
}

ExactConditionalModel::ExactConditionalModel(const ExactConditionalModel& source)
    : process_(source.process_->Clone()),
      likelihood_(source.likelihood_->Clone()) {
}

std::unique_ptr<ModelInterface> ExactConditionalModel::GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets, double noise_variance) {
  if (unlikely(!likelihood_->is_conjugate())) {
    SQ_THROW_EXCEPTION(NotImplementedException, "Fantasy updates require a conjugate likelihood.");
  }

  std::unique_ptr<ExactProcess> fantasy_process(process_->Clone());
  fantasy_process->AddPointsToProcess(inputs, targets, FantasyNoiseCovariance(targets, *likelihood_, noise_variance));
  return std::unique_ptr<ModelInterface>(new ExactConditionalModel(*fantasy_process, *likelihood_));
}

ModelInterface * ExactConditionalModel::Clone() const {
  return new ExactConditionalModel(*this);
}

}  // end namespace sparse_qep
