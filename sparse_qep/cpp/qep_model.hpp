/*!
  \file qep_model.hpp
  \rst
  Models: a latent process paired with an observation likelihood.

  ModelInterface is the capability set that IndependentModelList (qep_model_list.hpp) relies on:

  * Forward(x): the prior ``p(f(x))``
  * Call(x): the (approximate) posterior ``q(f(x))``
  * Likelihood(dist): the marginal over observations, ``likelihood().Marginal(dist)``
  * GetFantasyModel(inputs, targets): a NEW model conditioned on extra observations; the receiver is unchanged

  Two implementations:

  1. ApproximateModel: a variational strategy plus a likelihood.  Its fantasy models are ExactConditionalModel
     (built by the strategy from its pseudo points).
  2. ExactConditionalModel: an ExactProcess plus a likelihood.  Fantasizing appends the observations to a copy of the
     process.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_MODEL_HPP_
#define SPARSE_QEP_CPP_QEP_MODEL_HPP_

#include <memory>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_exact_process.hpp"
#include "qep_likelihood.hpp"
#include "qep_variational_strategy.hpp"

namespace sparse_qep {

class ModelInterface {
 public:
  virtual ~ModelInterface() = default;

  //! prior ``p(f(x))`` at ``(batch, D, N)`` inputs
  virtual LatentDistribution Forward(const BatchMatrix& inputs) = 0;

  //! posterior ``q(f(x))`` at ``(batch, D, N)`` inputs
  virtual LatentDistribution Call(const BatchMatrix& inputs) = 0;

  /*!\rst
    \return
      the marginal over observations given ``q(f)`` (e.g., ``q(f)`` with observation noise added)
  \endrst*/
  LatentDistribution Likelihood(const LatentDistribution& function_distribution) const SQ_WARN_UNUSED_RESULT {
    return likelihood().Marginal(function_distribution);
  }

  /*!\rst
    \param
      :inputs: ``(batch, D, n)`` fantasy points
      :targets: ``(batch, n, 1)`` fantasy observations
      :noise_variance: noise of the fantasy observations; ``kLikelihoodNoise`` selects the likelihood's
    \return
      a new model conditioned on the model's data and ``(inputs, targets)``
    \raise
      NotImplementedException if the model cannot be conditioned exactly
  \endrst*/
  virtual std::unique_ptr<ModelInterface> GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets,
                                                          double noise_variance = kLikelihoodNoise) = 0;

  virtual const LikelihoodInterface& likelihood() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  //! ``(batch, D, N)``; empty if the model has no training data
  virtual const BatchMatrix& train_inputs() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  //! ``(batch, N, 1)``; empty if the model has no training data
  virtual const BatchMatrix& train_targets() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual ModelInterface * Clone() const SQ_WARN_UNUSED_RESULT = 0;
};

/*!\rst
  Variational model.  Training data is only recorded (SetTrainData()) so that model lists can report it; the
  variational objective itself is not part of this library.
\endrst*/
class ApproximateModel final : public ModelInterface {
 public:
  /*!\rst
    \param
      :strategy: variational strategy (ownership transferred)
      :likelihood: observation likelihood (cloned)
    \raise
      PreconditionException if ``strategy`` is null
  \endrst*/
  ApproximateModel(std::unique_ptr<VariationalStrategyInterface> strategy, const LikelihoodInterface& likelihood);

  virtual LatentDistribution Forward(const BatchMatrix& inputs) override {
    return strategy_->Call(inputs, true);
  }

  virtual LatentDistribution Call(const BatchMatrix& inputs) override {
    return strategy_->Call(inputs, false);
  }

  virtual std::unique_ptr<ModelInterface> GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets,
                                                          double noise_variance = kLikelihoodNoise) override;

  virtual const LikelihoodInterface& likelihood() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *likelihood_;
  }

  virtual const BatchMatrix& train_inputs() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return train_inputs_;
  }

  virtual const BatchMatrix& train_targets() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return train_targets_;
  }

  /*!\rst
    \raise
      InvalidValueException<int> unless there is exactly one target per input
  \endrst*/
  void SetTrainData(const BatchMatrix& inputs, const BatchMatrix& targets);

  const VariationalStrategyInterface& strategy() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *strategy_;
  }

  VariationalStrategyInterface& mutable_strategy() noexcept {
    return *strategy_;
  }

  virtual ModelInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(ApproximateModel);

 private:
  ApproximateModel(const ApproximateModel& source);

  std::unique_ptr<VariationalStrategyInterface> strategy_;
  std::unique_ptr<LikelihoodInterface> likelihood_;
  BatchMatrix train_inputs_;
  BatchMatrix train_targets_;
};

/*!\rst
  Exact posterior of a prior process given (pseudo and real) observations; the result of a fantasy update.
\endrst*/
class ExactConditionalModel final : public ModelInterface {
 public:
  ExactConditionalModel(const ExactProcess& process, const LikelihoodInterface& likelihood);

  virtual LatentDistribution Forward(const BatchMatrix& inputs) override {
    return process_->prior().Forward(inputs);
  }

  virtual LatentDistribution Call(const BatchMatrix& inputs) override {
    return process_->ComputePosterior(inputs);
  }

  /*!\rst
    Appends ``(inputs, targets)`` with noise ``noise_variance * I`` to a copy of the process.

    \raise
      NotImplementedException if the likelihood is not conjugate;
      LowerBoundException<double> if the resolved noise variance is negative
  \endrst*/
  virtual std::unique_ptr<ModelInterface> GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets,
                                                          double noise_variance = kLikelihoodNoise) override;

  virtual const LikelihoodInterface& likelihood() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *likelihood_;
  }

  virtual const BatchMatrix& train_inputs() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return process_->points_sampled();
  }

  virtual const BatchMatrix& train_targets() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return process_->points_sampled_value();
  }

  const ExactProcess& process() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *process_;
  }

  virtual ModelInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(ExactConditionalModel);

 private:
  ExactConditionalModel(const ExactConditionalModel& source);

  std::unique_ptr<ExactProcess> process_;
  std::unique_ptr<LikelihoodInterface> likelihood_;
};

/*!\rst
  ``noise_variance * I`` with the batch shape of ``targets``, for ``targets.num_rows`` observations.
  ``kLikelihoodNoise`` selects ``likelihood.noise_variance()``.

  \raise
    LowerBoundException<double> if the resolved noise variance is negative
\endrst*/
BatchMatrix FantasyNoiseCovariance(const BatchMatrix& targets, const LikelihoodInterface& likelihood, double noise_variance) SQ_WARN_UNUSED_RESULT;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_MODEL_HPP_
