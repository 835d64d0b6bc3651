/*!
  \file qep_distribution.hpp
  \rst
  LatentDistribution: the (batched) multivariate Normal or Q-Exponential distribution returned by every strategy and
  model in this library, plus sampling and KL divergence.

  **Families**

  A distribution carries a ``power`` ``q``.  ``q == 2`` is the multivariate Normal ``N(\mu, \Sigma)``; any other value is
  the multivariate Q-Exponential ``QED_q(\mu, \Sigma)`` with density proportional to
  ``|\Sigma|^{-1/2} r^{(q/2-1) d/2} \exp(-r^{q/2}/2)``, ``r = (x-\mu)^T \Sigma^{-1} (x-\mu)``.  The family is resolved from
  the power exactly once, by FamilyFromPower(); every other piece of code switches on the resulting
  DistributionFamily.

  A Q-Exponential vector has the stochastic representation ``x = \mu + R L u`` with ``u`` uniform on the unit sphere,
  ``L L^T = \Sigma`` and ``R^q ~ \chi^2_d``.  Writing ``u = z/\|z\|`` for ``z ~ N(0, I_d)`` (so ``\|z\|^2 ~ \chi^2_d``
  independently of ``u``) gives ``x = \mu + L z \|z\|^{2/q - 1}``.  All sampling here uses this form, so only
  ``N(0, 1)`` draws are needed.

  **Layout**

  ``mean`` is a BatchMatrix with ``N`` rows (data points) and ``T`` columns (tasks; 1 for single-task distributions).
  ``covariance`` is ``NT x NT``; its indexing is ``t*N + n`` ("non-interleaved", e.g., the block-diagonal output of a
  deep layer) or ``n*T + t`` ("interleaved", e.g., the Kronecker output of LMC).  FlatMean() returns the mean in the
  covariance's ordering.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_DISTRIBUTION_HPP_
#define SPARSE_QEP_CPP_QEP_DISTRIBUTION_HPP_

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_random.hpp"
#include "qep_settings.hpp"

namespace sparse_qep {

//! ``power`` value of the Normal family
static constexpr double kNormalPower = 2.0;

enum class DistributionFamily {
  //! multivariate Normal, ``power == 2``
  kNormal = 0,
  //! multivariate Q-Exponential, ``power != 2``
  kQExponential = 1,
};

/*!\rst
  The single point where a power tag is mapped to a distribution family.
\endrst*/
inline SQ_CONST_FUNCTION SQ_WARN_UNUSED_RESULT DistributionFamily FamilyFromPower(double power) noexcept {
  return (power == kNormalPower) ? DistributionFamily::kNormal : DistributionFamily::kQExponential;
}

char const * FamilyName(DistributionFamily family) noexcept SQ_CONST_FUNCTION SQ_WARN_UNUSED_RESULT;

/*!\rst
  A batch of multivariate Normal or Q-Exponential distributions over ``N`` points and ``T`` tasks.

  Immutable after construction except for SetRoot(); all transformations return new objects.
\endrst*/
class LatentDistribution {
 public:
  /*!\rst
    Single-task distribution.  ``mean`` and ``covariance`` batch shapes are broadcast against each other.

    \param
      :power: the power ``q``; 2 for the Normal family
      :mean: ``(batch, N, 1)`` means
      :covariance: ``(batch, N, N)`` covariances
    \raise
      InvalidValueException<int> for inconsistent sizes; ShapeMismatchException if the batch shapes do not broadcast
  \endrst*/
  LatentDistribution(double power, const BatchMatrix& mean, const BatchMatrix& covariance);

  /*!\rst
    Multitask distribution.

    \param
      :power: the power ``q``
      :mean: ``(batch, N, T)`` means
      :covariance: ``(batch, NT, NT)`` covariances, indexed per ``interleaved``
      :interleaved: true for covariance index ``n*T + t``, false for ``t*N + n``
  \endrst*/
  static LatentDistribution Multitask(double power, const BatchMatrix& mean, const BatchMatrix& covariance, bool interleaved) SQ_WARN_UNUSED_RESULT;

  DistributionFamily family() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return family_;
  }

  double power() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return power_;
  }

  const BatchShape& batch_shape() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return mean_.batch_shape;
  }

  int num_data() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return mean_.num_rows;
  }

  int num_tasks() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return mean_.num_cols;
  }

  //! ``N*T``, the dimension of each distribution in the batch
  int event_size() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return mean_.num_rows*mean_.num_cols;
  }

  bool is_multitask() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return multitask_;
  }

  bool interleaved() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return interleaved_;
  }

  const BatchMatrix& mean() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return mean_;
  }

  const BatchMatrix& covariance() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return covariance_;
  }

  bool has_root() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return has_root_;
  }

  /*!\rst
    Records a known root ``R`` with ``R R^T == covariance`` (e.g., the Cholesky factor held by a variational
    distribution) so that RootDecomposition() need not factor.

    \param
      :root: ``(batch, NT, k)`` root; batch shape must equal batch_shape()
  \endrst*/
  void SetRoot(const BatchMatrix& root);

  //! covariance index of point ``n``, task ``t``
  int CovarianceIndex(int n, int t) const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return interleaved_ ? n*num_tasks() + t : t*num_data() + n;
  }

  //! ``(batch, NT, 1)`` mean in covariance ordering
  BatchMatrix FlatMean() const SQ_WARN_UNUSED_RESULT;

  //! ``(batch, N, T)`` diagonal of the covariance, in the mean's layout
  BatchMatrix Variance() const SQ_WARN_UNUSED_RESULT;

  /*!\rst
    \return
      a copy whose covariances have ``jitter`` added to the diagonal (any known root is dropped)
  \endrst*/
  LatentDistribution AddJitter(double jitter = kDefaultPriorJitter) const SQ_WARN_UNUSED_RESULT;

  /*!\rst
    \return
      a copy broadcast onto ``new_batch_shape``
    \raise
      ShapeMismatchException if batch_shape() does not broadcast to ``new_batch_shape``
  \endrst*/
  LatentDistribution Expand(const BatchShape& new_batch_shape) const SQ_WARN_UNUSED_RESULT;

  /*!\rst
    A root ``R`` of each covariance, ``R R^T = \Sigma``: the known root if one was set, else the (jittered) Cholesky
    factor, else (if factoring fails) the eigen root ``V diag(\sqrt{\max(\lambda, 0)})``.

    \return
      ``(batch, NT, k)`` roots
  \endrst*/
  BatchMatrix RootDecomposition(double cholesky_jitter = 1.0e-8, int max_tries = 3) const SQ_WARN_UNUSED_RESULT;

  /*!\rst
    Draws ``num_samples`` joint samples from every distribution in the batch.

    \param
      :num_samples: number of samples ``S``
      :normal_rng[1]: source of ``N(0, 1)`` draws
    \output
      :normal_rng[1]: state advanced
    \return
      ``([S] + batch, N, T)`` samples
  \endrst*/
  BatchMatrix Rsample(int num_samples, NormalRNGInterface * normal_rng) const SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

 private:
  LatentDistribution(double power, const BatchMatrix& mean, const BatchMatrix& covariance, bool multitask, bool interleaved);

  //! tag resolved from ``power_``
  DistributionFamily family_;
  double power_;
  //! ``(batch, N, T)``
  BatchMatrix mean_;
  //! ``(batch, NT, NT)``
  BatchMatrix covariance_;
  //! ``(batch, NT, k)``; valid iff ``has_root_``
  BatchMatrix root_;
  bool has_root_;
  bool multitask_;
  bool interleaved_;
};

/*!\rst
  Normalizing factor for Q-Exponential draws: ``\sqrt{E[R^2]/d}`` with ``R^q ~ \chi^2_d``, i.e.,
  ``\sqrt{2^{2/q} \Gamma(d/2 + 2/q) / \Gamma(d/2) / d}``.  Dividing a draw's deviation by this makes its covariance
  equal to ``\Sigma``.  Equals 1 for ``q == 2``.
\endrst*/
double QExponentialRescaleFactor(int dim, double power) SQ_WARN_UNUSED_RESULT;

/*!\rst
  Draws one independent univariate sample per entry: ``loc + scale * z |z|^{2/q - 1}``, with ``loc`` the mean and
  ``scale`` the marginal standard deviation of each entry.  This is how deep layers turn an upstream distribution into
  concrete inputs.

  \param
    :distribution: provides ``loc``, ``scale``, and the power
    :rescale: if true, divide deviations by ``QExponentialRescaleFactor(1, q)``
    :normal_rng[1]: source of ``N(0, 1)`` draws
  \output
    :normal_rng[1]: state advanced
  \return
    ``(batch, N, T)`` samples
\endrst*/
BatchMatrix SampleMarginals(const LatentDistribution& distribution, bool rescale, NormalRNGInterface * normal_rng) SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

/*!\rst
  ``KL(q || p)`` for each element of the broadcast batch.

  With ``d`` the event size, ``\delta = \mu_q - \mu_p`` and ``T = tr(\Sigma_p^{-1} \Sigma_q) + \delta^T \Sigma_p^{-1} \delta``:

  * Normal: ``1/2 (\log|\Sigma_p| - \log|\Sigma_q| - d + T)``
  * Q-Exponential (power ``q``): ``1/2 (\log|\Sigma_p| - \log|\Sigma_q|) - d/2 + d/2 (T/d)^{q/2} - (q/2 - 1) d/2 \log(T/d)``

  The Q-Exponential form matches the Normal form at ``q == 2`` and vanishes when ``q == p``.

  \param
    :q_distribution: the approximating distribution; its family selects the formula
    :p_distribution: the reference distribution (same event size)
  \return
    ``(broadcast batch, 1, 1)`` divergences
  \raise
    InvalidValueException<int> if the event sizes differ; SingularMatrixException if ``\Sigma_p`` cannot be factored
\endrst*/
BatchMatrix KlDivergence(const LatentDistribution& q_distribution, const LatentDistribution& p_distribution) SQ_WARN_UNUSED_RESULT;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_DISTRIBUTION_HPP_
