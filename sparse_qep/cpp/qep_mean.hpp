/*!
  \file qep_mean.hpp
  \rst
  MeanInterface, the interface for prior mean functions ``\mu(x)``, with zero, constant, and linear means.

  Mirrors CovarianceInterface (qep_covariance.hpp): point-wise evaluation, hyperparameter access, virtual copy.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_MEAN_HPP_
#define SPARSE_QEP_CPP_QEP_MEAN_HPP_

#include <vector>

#include "qep_common.hpp"

namespace sparse_qep {

class MeanInterface {
 public:
  virtual ~MeanInterface() = default;

  /*!\rst
    \param
      :point[dim]: spatial coordinate
    \return
      the prior mean ``\mu(point)``
  \endrst*/
  virtual double Mean(double const * restrict point) const noexcept SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT = 0;

  virtual int GetNumberOfHyperparameters() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual void SetHyperparameters(double const * restrict hyperparameters) noexcept = 0;

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept = 0;

  virtual MeanInterface * Clone() const SQ_WARN_UNUSED_RESULT = 0;
};

//! ``\mu(x) = 0``
class ZeroMean final : public MeanInterface {
 public:
  ZeroMean() = default;

  virtual double Mean(double const * restrict SQ_UNUSED(point)) const noexcept override SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT {
    return 0.0;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return 0;
  }

  virtual void SetHyperparameters(double const * restrict SQ_UNUSED(hyperparameters)) noexcept override {
  }

  virtual void GetHyperparameters(double * restrict SQ_UNUSED(hyperparameters)) const noexcept override {
  }

  virtual MeanInterface * Clone() const override SQ_WARN_UNUSED_RESULT;
};

//! ``\mu(x) = c``
class ConstantMean final : public MeanInterface {
 public:
  explicit ConstantMean(double constant) : constant_(constant) {
  }

  virtual double Mean(double const * restrict SQ_UNUSED(point)) const noexcept override SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT {
    return constant_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return 1;
  }

  virtual void SetHyperparameters(double const * restrict hyperparameters) noexcept override {
    constant_ = hyperparameters[0];
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override {
    hyperparameters[0] = constant_;
  }

  virtual MeanInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

 private:
  double constant_;
};

/*!\rst
  ``\mu(x) = w^T x + b``.  Hyperparameters are ordered ``[w_0, ..., w_{dim-1}, b]``.
\endrst*/
class LinearMean final : public MeanInterface {
 public:
  /*!\rst
    \param
      :weights: ``w``, one per spatial dimension (``dim = weights.size()``)
      :bias: ``b``
  \endrst*/
  LinearMean(std::vector<double> weights, double bias);

  virtual double Mean(double const * restrict point) const noexcept override SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

  virtual int GetNumberOfHyperparameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return weights_.size() + 1;
  }

  virtual void SetHyperparameters(double const * restrict hyperparameters) noexcept override;

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override;

  virtual MeanInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

 private:
  std::vector<double> weights_;
  double bias_;
};

/*!\rst
  Evaluates a mean function at every point of a point set.

  \param
    :mean: the mean function
    :points[dim][num_points]: the point set
    :dim: spatial dimension
    :num_points: number of points
  \output
    :mean_vector[num_points]: ``\mu(x_i)``
\endrst*/
void BuildMeanVector(const MeanInterface& mean, double const * restrict points, int dim, int num_points, double * restrict mean_vector) noexcept SQ_NONNULL_POINTERS;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_MEAN_HPP_
