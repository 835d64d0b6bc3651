/*!
  \file qep_covariance.hpp
  \rst
  CovarianceInterface, the interface for the kernels ``k(x,x')`` that define prior covariances, plus three kernels:
  Square Exponential, Matern with ``\nu = 2.5``, and an "identity" kernel (``\alpha`` on exact coincidence, else 0).

  Kernels are SPSD: ``k(x,x') = k(x',x)`` and ``k(x,x) >= 0``.  The stationary kernels here take ``dim+1``
  hyperparameters ``\alpha, L_1, ..., L_d``: ``\alpha = \sigma_f^2`` is the signal variance and ``L_i`` are axis-aligned
  length scales.  IdentityCovariance takes only ``\alpha``.

  Kernels only evaluate covariances; learning their hyperparameters belongs to the (external) objective.

  The free functions BuildCovarianceMatrix() and BuildMixCovarianceMatrix() fill ``K(X,X)`` and ``K(X,Y)`` from point
  sets laid out ``points[num_points][dim]``.

  For more details, see Rasmussen & Williams Chapter 4.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_COVARIANCE_HPP_
#define SPARSE_QEP_CPP_QEP_COVARIANCE_HPP_

#include <vector>

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Abstract class for evaluating covariance functions between two points.

  Hyperparameters are stored as class member data by subclasses.
\endrst*/
class CovarianceInterface {
 public:
  virtual ~CovarianceInterface() = default;

  /*!\rst
    Computes the covariance function of two points, cov(``point_one``, ``point_two``).  Points must be arrays with length dim.

    \param
      :point_one[dim]: first spatial coordinate
      :point_two[dim]: second spatial coordinate
    \return
      value of covariance between the input points
  \endrst*/
  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT = 0;

  //! spatial dimension of the points this kernel accepts
  virtual int dim() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  virtual int GetNumberOfHyperparameters() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT = 0;

  /*!\rst
    Sets the hyperparameters.  Ordering is defined by GetHyperparameters().

    \param
      :hyperparameters[this.GetNumberOfHyperparameters()]: hyperparameters to set
  \endrst*/
  virtual void SetHyperparameters(double const * restrict hyperparameters) noexcept SQ_NONNULL_POINTERS = 0;

  /*!\rst
    Gets the hyperparameters, ordered ``[alpha=\sigma_f^2, length_0, ..., length_{n-1}]``.

    \output
      :hyperparameters[this.GetNumberOfHyperparameters()]: values of current hyperparameters
  \endrst*/
  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept SQ_NONNULL_POINTERS = 0;

  /*!\rst
    For implementing the virtual (copy) constructor idiom.

    \return
      :Pointer to a constructed object that is a subclass of CovarianceInterface
  \endrst*/
  virtual CovarianceInterface * Clone() const SQ_WARN_UNUSED_RESULT = 0;
};

/*!\rst
  Implements the square exponential covariance function:
  ``cov(x_1, x_2) = \alpha * \exp(-1/2 * ((x_1 - x_2)^T * L * (x_1 - x_2)) )``
  where L is the diagonal matrix with i-th diagonal entry ``1/lengths[i]/lengths[i]``
\endrst*/
class SquareExponential final : public CovarianceInterface {
 public:
  /*!\rst
    \param
      :dim: the number of spatial dimensions
      :alpha: the hyperparameter ``\alpha`` (e.g., signal variance, ``\sigma_f^2``)
      :length: the constant length scale to use for all hyperparameter length scales
  \endrst*/
  SquareExponential(int dim, double alpha, double length);

  SquareExponential(int dim, double alpha, std::vector<double> lengths);

  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept override SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

  virtual int dim() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return dim_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return 1 + dim_;
  }

  virtual void SetHyperparameters(double const * restrict hyperparameters) noexcept override SQ_NONNULL_POINTERS {
    alpha_ = hyperparameters[0];

    hyperparameters += 1;
    for (int i = 0; i < dim_; ++i) {
      lengths_[i] = hyperparameters[i];
      lengths_sq_[i] = Square(hyperparameters[i]);
    }
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override SQ_NONNULL_POINTERS {
    hyperparameters[0] = alpha_;
    hyperparameters += 1;
    for (int i = 0; i < dim_; ++i) {
      hyperparameters[i] = lengths_[i];
    }
  }

  virtual CovarianceInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(SquareExponential);

 private:
  explicit SquareExponential(const SquareExponential& source);

  //! dimension of the problem
  int dim_;
  //! ``\sigma_f^2``, signal variance
  double alpha_;
  //! length scales, one per dimension
  std::vector<double> lengths_;
  //! square of the length scales, one per dimension
  std::vector<double> lengths_sq_;
};

/*!\rst
  Implements a case of the Matern class of covariance functions with ``\nu = 5/2`` (smoothness parameter).

  ``cov_{\nu=5/2}(r) = \alpha * [1 + \sqrt{5}r + 5/3 r^2] \exp(-\sqrt{5}r)``, where ``r = \sqrt{(x_1 - x_2)^T * L * (x_1 - x_2)}``
\endrst*/
class MaternNu2p5 final : public CovarianceInterface {
 public:
  MaternNu2p5(int dim, double alpha, double length);

  MaternNu2p5(int dim, double alpha, std::vector<double> lengths);

  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept override SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

  virtual int dim() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return dim_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return 1 + dim_;
  }

  virtual void SetHyperparameters(double const * restrict hyperparameters) noexcept override SQ_NONNULL_POINTERS {
    alpha_ = hyperparameters[0];

    hyperparameters += 1;
    for (int i = 0; i < dim_; ++i) {
      lengths_[i] = hyperparameters[i];
      lengths_sq_[i] = Square(hyperparameters[i]);
    }
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override SQ_NONNULL_POINTERS {
    hyperparameters[0] = alpha_;
    hyperparameters += 1;
    for (int i = 0; i < dim_; ++i) {
      hyperparameters[i] = lengths_[i];
    }
  }

  virtual CovarianceInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(MaternNu2p5);

 private:
  explicit MaternNu2p5(const MaternNu2p5& source);

  //! dimension of the problem
  int dim_;
  //! ``\sigma_f^2``, signal variance
  double alpha_;
  //! length scales, one per dimension
  std::vector<double> lengths_;
  //! square of the length scales, one per dimension
  std::vector<double> lengths_sq_;
};

/*!\rst
  ``cov(x_1, x_2) = \alpha`` if ``x_1 == x_2`` coordinate-wise (exact comparison), else 0.  Covariance matrices over
  distinct points are ``\alpha I``; useful as a white-noise kernel and in tests where closed forms are needed.

  One hyperparameter: ``\alpha``.
\endrst*/
class IdentityCovariance final : public CovarianceInterface {
 public:
  IdentityCovariance(int dim, double alpha);

  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept override SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

  virtual int dim() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return dim_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return 1;
  }

  virtual void SetHyperparameters(double const * restrict hyperparameters) noexcept override SQ_NONNULL_POINTERS {
    alpha_ = hyperparameters[0];
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override SQ_NONNULL_POINTERS {
    hyperparameters[0] = alpha_;
  }

  virtual CovarianceInterface * Clone() const override SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(IdentityCovariance);

 private:
  explicit IdentityCovariance(const IdentityCovariance& source);

  int dim_;
  double alpha_;
};

/*!\rst
  Computes the covariance matrix ``K(X, X)`` of a point set.

  \param
    :covariance: the covariance function
    :points[dim][num_points]: the point set ``X``
    :dim: spatial dimension
    :num_points: number of points
  \output
    :cov_matrix[num_points][num_points]: ``K(X, X)``, both triangles filled
\endrst*/
void BuildCovarianceMatrix(const CovarianceInterface& covariance, double const * restrict points, int dim, int num_points, double * restrict cov_matrix) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Computes the (rectangular) covariance matrix ``K(X, Y)``: ``cov_matrix[j*num_one + i] = k(x_i, y_j)``.

  \param
    :covariance: the covariance function
    :points_one[dim][num_one]: the point set ``X``
    :points_two[dim][num_two]: the point set ``Y``
    :dim: spatial dimension
    :num_one: number of points in ``X``
    :num_two: number of points in ``Y``
  \output
    :cov_matrix[num_one][num_two]: ``K(X, Y)``
\endrst*/
void BuildMixCovarianceMatrix(const CovarianceInterface& covariance, double const * restrict points_one, double const * restrict points_two, int dim, int num_one, int num_two, double * restrict cov_matrix) noexcept SQ_NONNULL_POINTERS;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_COVARIANCE_HPP_
