/*!
  \file qep_lmc_variational_strategy.hpp
  \rst
  Linear Model of Coregionalization (LMC) for multitask processes.

  ``Q`` latent functions ``g^{(q)}`` are modelled by a base strategy whose q(u) carries the latent functions along one
  (negative-indexed) batch dimension, ``latent_dim``.  The ``T`` output tasks are linear combinations

  ``f_t(x) = \sum_q a_t^{(q)} g^{(q)}(x)``

  with learnable coefficients ``a``, shape ``(q(u) batch, 1, T)``.  Call() returns either all tasks at every input (a
  multitask distribution with event ``N x T``, interleaved) or one task per input (task_indices).

  The base q(u)'s batch size along ``latent_dim`` may also be 1, in which case every latent function shares q(u) (and the
  coefficients carry a single latent).
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_LMC_VARIATIONAL_STRATEGY_HPP_
#define SPARSE_QEP_CPP_QEP_LMC_VARIATIONAL_STRATEGY_HPP_

#include <memory>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_likelihood.hpp"
#include "qep_random.hpp"
#include "qep_settings.hpp"
#include "qep_variational_strategy.hpp"

namespace sparse_qep {

class LmcVariationalStrategy final : public VariationalStrategyInterface {
 public:
  /*!\rst
    \param
      :base_variational_strategy: strategy over the latent functions (ownership transferred)
      :num_tasks: number of output tasks ``T``
      :num_latents: number of latent functions ``Q``
      :latent_dim: batch dimension of the base q(u) holding the latent functions; must be negative
      :jitter_val: jitter added to the output covariance; ``kDefaultJitter`` selects the base strategy's
        ``settings().jitter``
      :normal_rng[1]: source of the ``N(0, 1)`` initial coefficients; nullptr uses ``NormalRNG(kDefaultSeed)``
    \raise
      PreconditionException if ``latent_dim >= 0``, if the base q(u) batch shape along ``latent_dim`` is neither
      ``num_latents`` nor 1, or if ``base_variational_strategy`` is null;
      LowerBoundException<int> if ``num_tasks < 1``
  \endrst*/
  LmcVariationalStrategy(std::unique_ptr<VariationalStrategyInterface> base_variational_strategy, int num_tasks, int num_latents = 1,
                         int latent_dim = -1, double jitter_val = kDefaultJitter, NormalRNGInterface * normal_rng = nullptr);

  //! all tasks at every input
  virtual LatentDistribution Call(const BatchMatrix& inputs, bool prior = false) override;

  /*!\rst
    One task per input: ``task_indices[n]`` is the task of point ``n``.

    \raise
      InvalidValueException<int> if ``task_indices.size() != N``;
      BoundsException<int> if a task index is outside ``[0, num_tasks)``
  \endrst*/
  LatentDistribution Call(const BatchMatrix& inputs, const std::vector<int>& task_indices, bool prior = false);

  //! base KL summed along ``latent_dim``
  virtual BatchMatrix KlDivergence() override;

  virtual LatentDistribution PriorDistribution() override {
    return base_variational_strategy_->PriorDistribution();
  }

  virtual LatentDistribution VariationalDistribution() const override {
    return base_variational_strategy_->VariationalDistribution();
  }

  virtual bool variational_params_initialized() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return base_variational_strategy_->variational_params_initialized();
  }

  //! base q(u) batch shape without ``latent_dim``
  virtual BatchShape batch_shape() const override SQ_WARN_UNUSED_RESULT {
    return batch_shape_;
  }

  virtual void Train(bool mode) override {
    base_variational_strategy_->Train(mode);
  }

  virtual bool training() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return base_variational_strategy_->training();
  }

  virtual const VariationalSettings& settings() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return base_variational_strategy_->settings();
  }

  virtual VariationalSettings& mutable_settings() noexcept override {
    return base_variational_strategy_->mutable_settings();
  }

  //! base parameters, then the coefficients
  virtual int GetNumberOfParameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return base_variational_strategy_->GetNumberOfParameters() + static_cast<int>(lmc_coefficients_.data.size());
  }

  virtual void GetParameters(double * restrict parameters) const noexcept override SQ_NONNULL_POINTERS;

  virtual void SetParameters(double const * restrict parameters) override SQ_NONNULL_POINTERS;

  /*!\rst
    \raise
      NotImplementedException always; LMC outputs have no exact conditional form
  \endrst*/
  virtual std::unique_ptr<ExactConditionalModel> GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets,
                                                                 const LikelihoodInterface& likelihood,
                                                                 double noise_variance = kLikelihoodNoise) override;

  virtual VariationalStrategyInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  const VariationalStrategyInterface& base_variational_strategy() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *base_variational_strategy_;
  }

  VariationalStrategyInterface& mutable_base_variational_strategy() noexcept {
    return *base_variational_strategy_;
  }

  //! ``(q(u) batch, 1, T)``
  const BatchMatrix& lmc_coefficients() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return lmc_coefficients_;
  }

  BatchMatrix& mutable_lmc_coefficients() noexcept {
    return lmc_coefficients_;
  }

  int num_tasks() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return num_tasks_;
  }

  int num_latents() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return num_latents_;
  }

  int latent_dim() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return latent_dim_;
  }

  double jitter_val() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return jitter_val_;
  }

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(LmcVariationalStrategy);

 private:
  LmcVariationalStrategy(const LmcVariationalStrategy& source);

  std::unique_ptr<VariationalStrategyInterface> base_variational_strategy_;
  int num_tasks_;
  int num_latents_;
  int latent_dim_;
  double jitter_val_;
  BatchShape batch_shape_;
  BatchMatrix lmc_coefficients_;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_LMC_VARIATIONAL_STRATEGY_HPP_
