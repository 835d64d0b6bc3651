/*!
  \file qep_variational_distribution.hpp
  \rst
  Variational distributions ``q(u)`` over the function values ``u`` at ``M`` inducing points.

  A variational distribution owns the learnable parameters of ``q(u)`` and rebuilds the distribution from them on
  demand (Forward()); it has no other state, so Forward() is reproducible.  ``q(u)`` lives in the family selected by
  ``power`` (see FamilyFromPower()).

  The one-time seeding hook InitializeVariationalDistribution() copies a prior ``p(u)`` into the parameters.  Strategies
  call it exactly once, on their first non-prior call.

  **Parameter layout**

  GetParameters() / SetParameters() serialize, batch element by batch element:

  * CholeskyVariationalDistribution: mean ``m[M]``, then the lower triangle of ``L`` column by column (``M(M+1)/2``)
  * MeanFieldVariationalDistribution: mean ``m[M]``, then standard deviations ``s[M]``
  * DeltaVariationalDistribution: mean ``m[M]``
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_VARIATIONAL_DISTRIBUTION_HPP_
#define SPARSE_QEP_CPP_QEP_VARIATIONAL_DISTRIBUTION_HPP_

#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_random.hpp"

namespace sparse_qep {

//! parameterizations of ``q(u)``
enum class VariationalDistributionType {
  //! ``q(u) = D(m, L L^T)``, full lower triangular ``L``
  kCholesky = 0,
  //! ``q(u) = D(m, diag(s^2))``
  kMeanField = 1,
  //! ``q(u) = \delta_m``, MAP
  kDelta = 2,
};

/*!\rst
  Interface (and shared size data) for the variational distribution ``q(u)``.
\endrst*/
class VariationalDistributionInterface {
 public:
  virtual ~VariationalDistributionInterface() = default;

  /*!\rst
    \return
      ``q(u)`` built from the current parameters; batch shape ``batch_shape()``, event size ``M``
  \endrst*/
  virtual LatentDistribution Forward() const SQ_WARN_UNUSED_RESULT = 0;

  /*!\rst
    Seeds the parameters from ``prior``, broadcast onto ``batch_shape()``.

    \param
      :prior: ``p(u)`` with event size ``M``
    \raise
      InvalidValueException<int> if the event size is not ``M``; ShapeMismatchException if the batch does not broadcast
  \endrst*/
  virtual void InitializeVariationalDistribution(const LatentDistribution& prior) = 0;

  virtual VariationalDistributionType type() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual int GetNumberOfParameters() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual void GetParameters(double * restrict parameters) const noexcept SQ_NONNULL_POINTERS = 0;

  virtual void SetParameters(double const * restrict parameters) noexcept SQ_NONNULL_POINTERS = 0;

  virtual VariationalDistributionInterface * Clone() const SQ_WARN_UNUSED_RESULT = 0;

  //! ``batch_shape() + [M]``
  BatchShape shape() const SQ_WARN_UNUSED_RESULT {
    BatchShape result(batch_shape_);
    result.push_back(num_inducing_points_);
    return result;
  }

  int num_inducing_points() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return num_inducing_points_;
  }

  const BatchShape& batch_shape() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return batch_shape_;
  }

  double power() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return power_;
  }

  DistributionFamily family() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return FamilyFromPower(power_);
  }

 protected:
  VariationalDistributionInterface(int num_inducing_points, const BatchShape& batch_shape, double power);

  //! checks ``prior`` and returns it broadcast onto ``batch_shape_``
  LatentDistribution ExpandPrior(const LatentDistribution& prior) const SQ_WARN_UNUSED_RESULT;

  //! ``M``
  int num_inducing_points_;
  BatchShape batch_shape_;
  double power_;
};

/*!\rst
  ``q(u) = D(m, L L^T)`` with ``L`` lower triangular.  Forward() exposes ``L`` as the covariance root.

  Default parameters: ``m = 0``, ``L = I``.  Seeding sets ``m = \mu_p + mean_init_std * N(0, 1)`` and
  ``L = chol(\Sigma_p)``; with ``mean_init_std == 0`` (default) ``q(u)`` equals the prior exactly.
\endrst*/
class CholeskyVariationalDistribution final : public VariationalDistributionInterface {
 public:
  /*!\rst
    \param
      :num_inducing_points: ``M``
      :batch_shape: batch shape of ``q(u)``
      :power: distribution power (``kNormalPower`` for a Gaussian ``q(u)``)
      :mean_init_std: standard deviation of the noise added to the seeded mean
      :mean_init_seed: seed for that noise
  \endrst*/
  CholeskyVariationalDistribution(int num_inducing_points, const BatchShape& batch_shape, double power = kNormalPower,
                                  double mean_init_std = 0.0, NormalRNG::EngineType::result_type mean_init_seed = NormalRNG::kDefaultSeed);

  virtual LatentDistribution Forward() const override SQ_WARN_UNUSED_RESULT;

  virtual void InitializeVariationalDistribution(const LatentDistribution& prior) override;

  virtual VariationalDistributionType type() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return VariationalDistributionType::kCholesky;
  }

  virtual int GetNumberOfParameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return BatchSize(batch_shape_)*(num_inducing_points_ + num_inducing_points_*(num_inducing_points_ + 1)/2);
  }

  virtual void GetParameters(double * restrict parameters) const noexcept override SQ_NONNULL_POINTERS;

  virtual void SetParameters(double const * restrict parameters) noexcept override SQ_NONNULL_POINTERS;

  virtual VariationalDistributionInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  const BatchMatrix& variational_mean() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return variational_mean_;
  }

  const BatchMatrix& chol_variational_covar() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return chol_variational_covar_;
  }

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(CholeskyVariationalDistribution);

 private:
  CholeskyVariationalDistribution(const CholeskyVariationalDistribution& source) = default;

  double mean_init_std_;
  //! seed of the NormalRNG drawing the seeding noise
  NormalRNG::EngineType::result_type mean_init_seed_;
  //! ``(batch, M, 1)``
  BatchMatrix variational_mean_;
  //! ``(batch, M, M)``, strict upper triangle zero
  BatchMatrix chol_variational_covar_;
};

/*!\rst
  ``q(u) = D(m, diag(s^2))``, ``s > 0``.  Default parameters: ``m = 0``, ``s = 1``.  Seeding sets ``m = \mu_p`` and
  ``s = \sqrt{diag(\Sigma_p)}``.
\endrst*/
class MeanFieldVariationalDistribution final : public VariationalDistributionInterface {
 public:
  MeanFieldVariationalDistribution(int num_inducing_points, const BatchShape& batch_shape, double power = kNormalPower);

  virtual LatentDistribution Forward() const override SQ_WARN_UNUSED_RESULT;

  virtual void InitializeVariationalDistribution(const LatentDistribution& prior) override;

  virtual VariationalDistributionType type() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return VariationalDistributionType::kMeanField;
  }

  virtual int GetNumberOfParameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return BatchSize(batch_shape_)*2*num_inducing_points_;
  }

  virtual void GetParameters(double * restrict parameters) const noexcept override SQ_NONNULL_POINTERS;

  virtual void SetParameters(double const * restrict parameters) noexcept override SQ_NONNULL_POINTERS;

  virtual VariationalDistributionInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(MeanFieldVariationalDistribution);

 private:
  MeanFieldVariationalDistribution(const MeanFieldVariationalDistribution& source) = default;

  //! ``(batch, M, 1)``
  BatchMatrix variational_mean_;
  //! ``(batch, M, 1)``
  BatchMatrix variational_stddev_;
};

/*!\rst
  Point mass ``q(u) = \delta_m`` (MAP inference); the covariance is identically zero.  Seeding sets ``m = \mu_p``.
\endrst*/
class DeltaVariationalDistribution final : public VariationalDistributionInterface {
 public:
  DeltaVariationalDistribution(int num_inducing_points, const BatchShape& batch_shape, double power = kNormalPower);

  virtual LatentDistribution Forward() const override SQ_WARN_UNUSED_RESULT;

  virtual void InitializeVariationalDistribution(const LatentDistribution& prior) override;

  virtual VariationalDistributionType type() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return VariationalDistributionType::kDelta;
  }

  virtual int GetNumberOfParameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return BatchSize(batch_shape_)*num_inducing_points_;
  }

  virtual void GetParameters(double * restrict parameters) const noexcept override SQ_NONNULL_POINTERS;

  virtual void SetParameters(double const * restrict parameters) noexcept override SQ_NONNULL_POINTERS;

  virtual VariationalDistributionInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(DeltaVariationalDistribution);

 private:
  DeltaVariationalDistribution(const DeltaVariationalDistribution& source) = default;

  //! ``(batch, M, 1)``
  BatchMatrix variational_mean_;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_VARIATIONAL_DISTRIBUTION_HPP_
