/*!
  \file qep_variational_strategy.hpp
  \rst
  Variational strategies: turn ``q(u)``, a distribution over the process values ``u = f(Z)`` at ``M`` inducing points
  ``Z``, into the approximate posterior ``q(f(x)) = \int p(f(x) | u) q(u) du`` at arbitrary inputs ``x``.

  **Classes**

  1. VariationalStrategyInterface: pure abstract interface shared by every strategy (including the LMC wrapper in
     qep_lmc_variational_strategy.hpp); this is what deep layers and approximate models talk to.
  2. VariationalStrategyBase: state and logic shared by the strategies that own inducing points: the prior process,
     ``Z``, ``q(u)``, the cache, the settings, the training flag.  Implements the call protocol (one-time seeding of
     ``q(u)``, cache epochs), the KL divergence, parameter (de)serialization, and fantasy updates.
  3. VariationalStrategy: the *whitened* strategy.  ``q(u)`` lives in whitened coordinates ``u = L v``, ``L L^T = K_zz``,
     so its prior is ``D(0, I)``.
  4. UnwhitenedVariationalStrategy: ``q(u)`` is over ``f(Z)`` directly; its prior is ``D(\mu_z, K_zz)``.  Supports
     conjugate-gradient solves for large ``M``, a mean-only fast path, pseudo points, and fantasy updates.

  **Call protocol**

  ``Call(x, prior)``:

  * ``prior == true``: returns the prior ``p(f(x))`` (the model's Forward()); nothing else happens.
  * otherwise: in training mode, starts a new forward epoch (invalidates the cache).  If ``q(u)`` has never been seeded,
    seeds it from PriorDistribution() and sets ``variational_params_initialized`` (a one-way flag).  Then ``x`` and ``Z``
    are broadcast to a common batch shape and Forward() marginalizes ``q(u)``.

  **Shapes**

  Inputs ``x`` are ``(batch, D, N)`` point sets (see qep_batch_matrix.hpp).  ``Z`` is ``(batch_z, D, M)``.  Outputs
  have batch shape ``broadcast(model batch, batch_z, batch_x, q(u) batch)`` and event size ``N``.

  **Training vs. eval**

  The unwhitened strategy computes different (but consistent) covariances in the two modes: training returns the
  diagonal of the Schur complement clamped at 0 (what a stochastic ELBO needs), eval returns the full Schur
  complement.  Both add ``P^T P``, ``P = R^T K_zz^{-1} K_zx``, with ``R R^T = S``.

  **Caching**

  See qep_cache.hpp.  Cached quantities: the prior (``prior_distribution_memo``), the Cholesky factor of ``K_zz``
  (``cholesky_factor``; arguments ignored within a generation, but recomputed if the batch shape changes), the mean-only
  solve (``mean_cache``), and the pseudo points (``pseudo_points_memo``).

  **Ownership**

  A strategy owns a clone of its prior model, its inducing points, its variational distribution, its cache, and its
  settings.  Clone() deep-copies all of them.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_VARIATIONAL_STRATEGY_HPP_
#define SPARSE_QEP_CPP_QEP_VARIATIONAL_STRATEGY_HPP_

#include <memory>
#include <utility>

#include "qep_batch_matrix.hpp"
#include "qep_cache.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_likelihood.hpp"
#include "qep_process_model.hpp"
#include "qep_settings.hpp"
#include "qep_variational_distribution.hpp"

namespace sparse_qep {

class ExactConditionalModel;

/*!\rst
  Interface to every variational strategy.
\endrst*/
class VariationalStrategyInterface {
 public:
  virtual ~VariationalStrategyInterface() = default;

  /*!\rst
    Approximate posterior (or, with ``prior``, the prior) at ``inputs``.

    \param
      :inputs: ``(batch, D, N)`` points
      :prior: return the prior ``p(f(x))`` instead
    \return
      ``q(f(x))``
  \endrst*/
  virtual LatentDistribution Call(const BatchMatrix& inputs, bool prior = false) = 0;

  /*!\rst
    \return
      ``KL(q(u) || p(u))``, one entry per batch element: ``(batch, 1, 1)``
  \endrst*/
  virtual BatchMatrix KlDivergence() = 0;

  //! ``p(u)``
  virtual LatentDistribution PriorDistribution() = 0;

  //! ``q(u)``
  virtual LatentDistribution VariationalDistribution() const = 0;

  virtual bool variational_params_initialized() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  //! batch shape of ``q(f)`` for unbatched inputs
  virtual BatchShape batch_shape() const SQ_WARN_UNUSED_RESULT = 0;

  /*!\rst
    Enters training (``mode == true``) or eval mode.  Entering or re-entering training mode, and leaving it, invalidate
    the cache; staying in eval mode keeps it.
  \endrst*/
  virtual void Train(bool mode) = 0;

  virtual bool training() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual const VariationalSettings& settings() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual VariationalSettings& mutable_settings() noexcept = 0;

  //! number of learnable parameters: ``q(u)``'s, then ``Z`` (if learnable)
  virtual int GetNumberOfParameters() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual void GetParameters(double * restrict parameters) const noexcept SQ_NONNULL_POINTERS = 0;

  //! also invalidates the cache
  virtual void SetParameters(double const * restrict parameters) SQ_NONNULL_POINTERS = 0;

  /*!\rst
    Conditions the approximate posterior on new observations exactly.  The strategy turns ``q(u)`` into pseudo
    observations at ``Z`` (see UnwhitenedVariationalStrategy::PseudoPoints()), appends ``(inputs, targets)``, and
    returns the exact conditional model.  The strategy's parameters are not changed.

    \param
      :inputs: ``(batch, D, n)`` new points
      :targets: ``(batch, n, 1)`` new observations
      :likelihood: observation model; must be conjugate
      :noise_variance: noise of the new observations; ``kLikelihoodNoise`` selects ``likelihood.noise_variance()``
    \return
      the fantasy model
    \raise
      NotImplementedException if the likelihood is not conjugate or the strategy has no pseudo-point support
  \endrst*/
  virtual std::unique_ptr<ExactConditionalModel> GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets,
                                                                 const LikelihoodInterface& likelihood,
                                                                 double noise_variance = kLikelihoodNoise) = 0;

  virtual VariationalStrategyInterface * Clone() const SQ_WARN_UNUSED_RESULT = 0;
};

/*!\rst
  State and shared logic of the strategies that own inducing points.
\endrst*/
class VariationalStrategyBase : public VariationalStrategyInterface {
 public:
  virtual LatentDistribution Call(const BatchMatrix& inputs, bool prior = false) override;

  /*!\rst
    Marginalizes ``q(u)`` at ``inputs``.  ``inputs`` and ``inducing_points`` must already share a batch shape.

    \param
      :inputs: ``(batch, D, N)`` points ``x``
      :inducing_points: ``(batch, D, M)`` points ``Z``
      :inducing_values: ``(batch, M, 1)`` variational mean ``m``
      :variational_inducing_distribution: ``q(u)``, provides ``S`` and its root; may be nullptr (no ``S``)
    \return
      ``q(f(x))``
  \endrst*/
  virtual LatentDistribution Forward(const BatchMatrix& inputs, const BatchMatrix& inducing_points, const BatchMatrix& inducing_values,
                                     LatentDistribution const * variational_inducing_distribution) = 0;

  virtual BatchMatrix KlDivergence() override;

  virtual LatentDistribution VariationalDistribution() const override {
    return variational_distribution_->Forward();
  }

  virtual bool variational_params_initialized() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return cache_.variational_params_initialized();
  }

  virtual BatchShape batch_shape() const override SQ_WARN_UNUSED_RESULT;

  virtual void Train(bool mode) override;

  virtual bool training() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return training_;
  }

  virtual const VariationalSettings& settings() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return settings_;
  }

  virtual VariationalSettings& mutable_settings() noexcept override {
    return settings_;
  }

  virtual int GetNumberOfParameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return variational_distribution_->GetNumberOfParameters() + (learn_inducing_locations_ ? static_cast<int>(inducing_points_.data.size()) : 0);
  }

  virtual void GetParameters(double * restrict parameters) const noexcept override SQ_NONNULL_POINTERS;

  virtual void SetParameters(double const * restrict parameters) override SQ_NONNULL_POINTERS;

  virtual std::unique_ptr<ExactConditionalModel> GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets,
                                                                 const LikelihoodInterface& likelihood,
                                                                 double noise_variance = kLikelihoodNoise) override;

  //! true if PseudoPoints() is available (for some ``q(u)``)
  virtual bool has_fantasy_strategy() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return false;
  }

  /*!\rst
    Pseudo observations at ``Z`` equivalent to ``q(u)``.

    \return
      (``(batch, M, M)`` pseudo noise covariance, ``(batch, M, 1)`` pseudo targets)
    \raise
      NotImplementedException if this strategy (or its ``q(u)``) has no pseudo-point support
  \endrst*/
  virtual std::pair<BatchMatrix, BatchMatrix> PseudoPoints();

  //! starts a new forward evaluation context: everything cached so far becomes stale
  void BeginForwardEpoch() noexcept {
    cache_.BumpGeneration();
  }

  void ClearCache() noexcept {
    cache_.BumpGeneration();
  }

  /*!\rst
    Replaces ``Z``; invalidates the cache.

    \raise
      InvalidValueException<int> if the dimension or number of points changes
  \endrst*/
  void SetInducingPoints(const BatchMatrix& inducing_points);

  const ProcessModel& model() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *model_;
  }

  const BatchMatrix& inducing_points() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return inducing_points_;
  }

  const VariationalDistributionInterface& variational_distribution() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *variational_distribution_;
  }

  int num_inducing_points() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return inducing_points_.num_cols;
  }

  bool learn_inducing_locations() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return learn_inducing_locations_;
  }

  double jitter_val() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return jitter_val_;
  }

  const StrategyCache& cache() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return cache_;
  }

 protected:
  /*!\rst
    \param
      :model: the prior process (cloned)
      :inducing_points: ``(batch_z, D, M)`` initial ``Z``
      :variational_distribution: ``q(u)`` over ``M`` points (ownership transferred)
      :learn_inducing_locations: whether ``Z`` is part of the parameter vector
      :jitter_val: jitter added to ``K_zz``; ``kDefaultJitter`` selects ``settings.jitter``
      :settings: configuration
    \raise
      InvalidValueException<int> if ``Z`` does not match the model dimension or ``q(u)``'s size;
      LowerBoundException<double> for a negative ``jitter_val`` other than the sentinel
  \endrst*/
  VariationalStrategyBase(const ProcessModel& model, const BatchMatrix& inducing_points,
                          std::unique_ptr<VariationalDistributionInterface> variational_distribution,
                          bool learn_inducing_locations, double jitter_val, const VariationalSettings& settings);

  VariationalStrategyBase(const VariationalStrategyBase& source);

  /*!\rst
    Cholesky factor of ``K_zz`` (which includes ``jitter_val``), cached under ``cholesky_factor``.  Within a generation
    ``induc_induc_covar`` is only consulted if the cached factor has a different shape.

    \raise
      SingularMatrixException if ``K_zz`` cannot be factored after jitter escalation
  \endrst*/
  BatchMatrix CholeskyFactor(const BatchMatrix& induc_induc_covar);

  //! seeds ``q(u)`` from PriorDistribution() the first time it is needed
  void InitializeVariationalParameters();

  std::unique_ptr<ProcessModel> model_;
  //! ``(batch_z, D, M)``
  BatchMatrix inducing_points_;
  std::unique_ptr<VariationalDistributionInterface> variational_distribution_;
  StrategyCache cache_;
  VariationalSettings settings_;
  bool learn_inducing_locations_;
  double jitter_val_;
  bool training_;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(VariationalStrategyBase);
};

/*!\rst
  Whitened strategy.  With ``L L^T = K_zz + jitter``, ``A = L^{-1} K_zx`` and ``q(v) = D(m, S)``:

  | ``mean = \mu(x) + A^T m``
  | ``cov  = K_xx + jitter I + A^T (S - I) A``

  The prior is ``D(0, I)`` over ``M`` points with ``q(u)``'s batch shape.  If ``x == Z`` (bitwise) and ``S`` is given,
  the result is ``q(u)`` mapped back to function space: ``D(L m + \mu_z, L S L^T)``.

  Pseudo points (and hence fantasy updates) are not available for this strategy.
\endrst*/
class VariationalStrategy final : public VariationalStrategyBase {
 public:
  VariationalStrategy(const ProcessModel& model, const BatchMatrix& inducing_points,
                      std::unique_ptr<VariationalDistributionInterface> variational_distribution,
                      bool learn_inducing_locations = true, double jitter_val = kDefaultJitter,
                      const VariationalSettings& settings = VariationalSettings());

  virtual LatentDistribution PriorDistribution() override;

  virtual LatentDistribution Forward(const BatchMatrix& inputs, const BatchMatrix& inducing_points, const BatchMatrix& inducing_values,
                                     LatentDistribution const * variational_inducing_distribution) override;

  virtual VariationalStrategyInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(VariationalStrategy);

 private:
  VariationalStrategy(const VariationalStrategy& source) = default;
};

/*!\rst
  Unwhitened strategy.  Preferable to the whitened one when ``Z`` equals the training inputs (the degenerate case is
  free) or when ``M`` is large enough that conjugate gradients beat a Cholesky factorization.

  Forward() evaluates the prior on ``[Z, x]`` jointly; with ``K_zz`` (plus ``jitter_val``), ``K_zx``, ``K_xx``,
  ``\delta = m - \mu_z``, ``R R^T = S``:

  | ``mean = \mu(x) + K_xz K_zz^{-1} \delta``
  | ``cov (training) = diag(max(0, diag(K_xx) - diag(K_xz K_zz^{-1} K_zx))) + P^T P``
  | ``cov (eval)     = K_xx - K_xz K_zz^{-1} K_zx + P^T P``, ``P = R^T K_zz^{-1} K_zx``

  Solves use the cached Cholesky factor of ``K_zz`` unless ``settings.fast_computations`` is on and
  ``M > settings.max_exact_cholesky_size``, in which case they use conjugate gradients.
\endrst*/
class UnwhitenedVariationalStrategy final : public VariationalStrategyBase {
 public:
  UnwhitenedVariationalStrategy(const ProcessModel& model, const BatchMatrix& inducing_points,
                                std::unique_ptr<VariationalDistributionInterface> variational_distribution,
                                bool learn_inducing_locations = true, double jitter_val = kDefaultJitter,
                                const VariationalSettings& settings = VariationalSettings());

  /*!\rst
    ``D(\mu(Z), K(Z, Z) + kDefaultPriorJitter I)`` in the model's family; cached under ``prior_distribution_memo``.  A
    training-mode Forward() replaces the cached value with ``D(\mu_z, K_zz)`` (``K_zz`` including ``jitter_val``).
  \endrst*/
  virtual LatentDistribution PriorDistribution() override;

  /*!\rst
    See class docs.  If ``inputs`` equals ``inducing_points`` bitwise, returns ``D(m, S)`` unchanged.

    \raise
      PreconditionException if ``inputs == inducing_points`` and ``S`` is absent
  \endrst*/
  virtual LatentDistribution Forward(const BatchMatrix& inputs, const BatchMatrix& inducing_points, const BatchMatrix& inducing_values,
                                     LatentDistribution const * variational_inducing_distribution) override;

  virtual bool has_fantasy_strategy() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return true;
  }

  /*!\rst
    Pseudo observations equivalent to ``q(u) = D(m, S)``.  With ``R = K(Z, Z) - S`` and ``j = jitter_val``:

    | ``C = S + S (R R^T + j I)^{-1} R^T S``
    | ``\tilde{m} = m + S (R R^T + j I)^{-1} R^T m``

    ``C`` is then repaired to be PSD: ``chol(C + j I)`` if it exists, else the projection ``V diag(max(\lambda, 0) + j) V^T``
    from the eigen-decomposition of ``C``.  Cached under ``pseudo_points_memo``.

    \return
      (``C``, ``\tilde{m}``)
    \raise
      NotImplementedException unless ``q(u)`` is a CholeskyVariationalDistribution
  \endrst*/
  virtual std::pair<BatchMatrix, BatchMatrix> PseudoPoints() override;

  virtual VariationalStrategyInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(UnwhitenedVariationalStrategy);

 private:
  UnwhitenedVariationalStrategy(const UnwhitenedVariationalStrategy& source) = default;

  /*!\rst
    Solves ``K_zz X = B`` in place for every batch element: with the Cholesky factor ``chol`` if it is non-empty,
    otherwise with conjugate gradients on ``induc_induc_covar``.
  \endrst*/
  void SolveInducing(const BatchMatrix& induc_induc_covar, const BatchMatrix& chol, BatchMatrix * rhs) const SQ_NONNULL_POINTERS;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_VARIATIONAL_STRATEGY_HPP_
