/*!
  \file qep_likelihood.hpp
  \rst
  Observation likelihoods ``p(y | f)``.

  A likelihood maps the latent distribution ``q(f)`` to the marginal over observations (Marginal()) and tells fantasy
  updates whether it is conjugate to the latent family.  Only conjugate likelihoods (additive noise in the latent family)
  admit exact fantasy conditioning; the ELBO and any other training objective live outside this library.

  1. GaussianLikelihood: ``y = f + \epsilon``, ``\epsilon ~ N(0, \sigma_n^2)``; conjugate
  2. QExponentialLikelihood: ``y = f + \epsilon``, ``\epsilon ~ QED_q(0, \sigma_n^2)``; conjugate
  3. BernoulliLikelihood: ``p(y = 1 | f) = \Phi(f)`` (probit); NOT conjugate
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_LIKELIHOOD_HPP_
#define SPARSE_QEP_CPP_QEP_LIKELIHOOD_HPP_

#include <boost/math/distributions/normal.hpp>  // NOLINT(build/include_order)

#include "qep_common.hpp"
#include "qep_distribution.hpp"

namespace sparse_qep {

//! sentinel for fantasy updates: "use the likelihood's own noise variance"
static constexpr double kLikelihoodNoise = -1.0;

class LikelihoodInterface {
 public:
  virtual ~LikelihoodInterface() = default;

  /*!\rst
    \param
      :function_distribution: ``q(f)``
    \return
      the marginal ``\int p(y | f) q(f) df`` (conjugate likelihoods) or its first two moments (otherwise)
  \endrst*/
  virtual LatentDistribution Marginal(const LatentDistribution& function_distribution) const SQ_WARN_UNUSED_RESULT = 0;

  //! true if conditioning on observations keeps the latent family (exact fantasy updates are possible)
  virtual bool is_conjugate() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  //! ``\sigma_n^2``; 0 for likelihoods without additive noise
  virtual double noise_variance() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual double power() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual LikelihoodInterface * Clone() const SQ_WARN_UNUSED_RESULT = 0;

  DistributionFamily family() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return FamilyFromPower(power());
  }
};

/*!\rst
  Homoscedastic additive Gaussian noise.  Marginal() adds ``\sigma_n^2`` to the diagonal of the covariance.
\endrst*/
class GaussianLikelihood final : public LikelihoodInterface {
 public:
  /*!\rst
    \raise
      LowerBoundException<double> if ``noise_variance < 0``
  \endrst*/
  explicit GaussianLikelihood(double noise_variance);

  virtual LatentDistribution Marginal(const LatentDistribution& function_distribution) const override SQ_WARN_UNUSED_RESULT;

  virtual bool is_conjugate() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return true;
  }

  virtual double noise_variance() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return noise_variance_;
  }

  virtual double power() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return kNormalPower;
  }

  virtual LikelihoodInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(GaussianLikelihood);

 private:
  GaussianLikelihood(const GaussianLikelihood& source) = default;

  double noise_variance_;
};

/*!\rst
  Homoscedastic additive Q-Exponential noise of power ``q``.  Marginal() adds ``\sigma_n^2`` to the diagonal.
\endrst*/
class QExponentialLikelihood final : public LikelihoodInterface {
 public:
  /*!\rst
    \raise
      LowerBoundException<double> if ``noise_variance < 0`` or ``power <= 0``
  \endrst*/
  QExponentialLikelihood(double noise_variance, double power);

  virtual LatentDistribution Marginal(const LatentDistribution& function_distribution) const override SQ_WARN_UNUSED_RESULT;

  virtual bool is_conjugate() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return true;
  }

  virtual double noise_variance() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return noise_variance_;
  }

  virtual double power() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return power_;
  }

  virtual LikelihoodInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(QExponentialLikelihood);

 private:
  QExponentialLikelihood(const QExponentialLikelihood& source) = default;

  double noise_variance_;
  double power_;
};

/*!\rst
  Probit classification likelihood.  With ``f ~ N(\mu, \sigma^2)`` marginally,
  ``p(y = 1) = \Phi(\mu / \sqrt{1 + \sigma^2})``; Marginal() returns these probabilities as the mean, with
  (independent) Bernoulli variances ``p (1 - p)``.
\endrst*/
class BernoulliLikelihood final : public LikelihoodInterface {
 public:
  BernoulliLikelihood() : normal_(0.0, 1.0) {
  }

  virtual LatentDistribution Marginal(const LatentDistribution& function_distribution) const override SQ_WARN_UNUSED_RESULT;

  virtual bool is_conjugate() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return false;
  }

  virtual double noise_variance() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return 0.0;
  }

  virtual double power() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return kNormalPower;
  }

  virtual LikelihoodInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_ASSIGN(BernoulliLikelihood);

 private:
  BernoulliLikelihood(const BernoulliLikelihood& source) = default;

  //! standard normal; evaluates ``\Phi``
  const boost::math::normal_distribution<double> normal_;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_LIKELIHOOD_HPP_
