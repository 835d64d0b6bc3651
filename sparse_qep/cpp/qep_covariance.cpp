/*!
  \file qep_covariance.cpp
  \rst
  Definitions of the Covariance member functions of the CovarianceInterface subclasses, their validating constructors,
  and the covariance matrix builders.
\endrst*/

#include "qep_covariance.hpp"

#include <cmath>

#include <limits>
#include <vector>

#include "qep_common.hpp"
#include "qep_exception.hpp"

namespace sparse_qep {

namespace {

/*!\rst
  Computes ``\sum_{i=0}^{dim} (p1_i - p2_i) / W_i * (p1_i - p2_i)``, ``p1, p2 = point 1 & 2``; ``W = weight``.

  \param
    :point_one[size]: the vector p1
    :point_two[size]: the vector p2
    :weights[size]: the vector W, i.e., the scaling to apply to each term of the norm
    :size: number of dimensions in point
  \return
    the weighted, squared ``L_2``-norm of the vector difference ``p1 - p2``.
\endrst*/
SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT double
NormSquaredWithInverseWeights(double const * restrict point_one, double const * restrict point_two,
                              double const * restrict weights, int size) noexcept {
  double norm = 0.0;

  for (int i = 0; i < size; ++i) {
    norm += Square((point_one[i] - point_two[i]))/weights[i];
  }
  return norm;
}

/*!\rst
  Validate and initialize covariance function data (sizes, hyperparameters).

  \param
    :dim: the number of spatial dimensions
    :alpha: the hyperparameter \alpha, (e.g., signal variance, \sigma_f^2)
    :lengths_in: the input length scales, one per spatial dimension
    :lengths_sq[dim]: pointer to an array of at least dim double
  \output
    :lengths_sq[dim]: first dim entries overwritten with the square of the entries of lengths_in
\endrst*/
SQ_NONNULL_POINTERS void InitializeCovariance(int dim, double alpha, const std::vector<double>& lengths_in,
                                              double * restrict lengths_sq) {
  if (dim < 0) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "Negative spatial dimension.", dim, 0);
  }

  if (static_cast<unsigned>(dim) != lengths_in.size()) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "dim (truth) and length vector size do not match.", lengths_in.size(), dim);
  }

  if (alpha <= 0.0) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Invalid hyperparameter (alpha).", alpha, std::numeric_limits<double>::min());
  }

  for (int i = 0; i < dim; ++i) {
    lengths_sq[i] = Square(lengths_in[i]);
    if (unlikely(lengths_in[i] <= 0.0)) {
      SQ_THROW_EXCEPTION(LowerBoundException<double>, "Invalid hyperparameter (length).", lengths_in[i], std::numeric_limits<double>::min());
    }
  }
}

}  // end unnamed namespace

SquareExponential::SquareExponential(int dim, double alpha, std::vector<double> lengths)
    : dim_(dim), alpha_(alpha), lengths_(lengths), lengths_sq_(lengths.size()) {
  InitializeCovariance(dim_, alpha_, lengths_, lengths_sq_.data());
}

SquareExponential::SquareExponential(int dim, double alpha, double length)
    : SquareExponential(dim, alpha, std::vector<double>(dim, length)) {
}

SquareExponential::SquareExponential(const SquareExponential& SQ_UNUSED(source)) = default;

double SquareExponential::Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept {
  const double norm_val = NormSquaredWithInverseWeights(point_one, point_two, lengths_sq_.data(), dim_);
  return alpha_*std::exp(-0.5*norm_val);
}

CovarianceInterface * SquareExponential::Clone() const {
  return new SquareExponential(*this);
}

MaternNu2p5::MaternNu2p5(int dim, double alpha, std::vector<double> lengths)
    : dim_(dim), alpha_(alpha), lengths_(lengths), lengths_sq_(lengths.size()) {
  InitializeCovariance(dim_, alpha_, lengths_, lengths_sq_.data());
}

MaternNu2p5::MaternNu2p5(int dim, double alpha, double length)
    : MaternNu2p5(dim, alpha, std::vector<double>(dim, length)) {
}

MaternNu2p5::MaternNu2p5(const MaternNu2p5& SQ_UNUSED(source)) = default;

double MaternNu2p5::Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept {
  const double norm_val = NormSquaredWithInverseWeights(point_one, point_two, lengths_sq_.data(), dim_);
  const double matern_arg = kSqrt5 * std::sqrt(norm_val);

  return alpha_*(1.0 + matern_arg + 5.0/3.0*norm_val)*std::exp(-matern_arg);
}

CovarianceInterface * MaternNu2p5::Clone() const {
  return new MaternNu2p5(*this);
}

IdentityCovariance::IdentityCovariance(int dim, double alpha) : dim_(dim), alpha_(alpha) {
  if (dim < 0) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "Negative spatial dimension.", dim, 0);
  }
  if (alpha <= 0.0) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Invalid hyperparameter (alpha).", alpha, std::numeric_limits<double>::min());
  }
}

IdentityCovariance::IdentityCovariance(const IdentityCovariance& SQ_UNUSED(source)) = default;

double IdentityCovariance::Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept {
  for (int i = 0; i < dim_; ++i) {
    if (point_one[i] != point_two[i]) {
      return 0.0;
    }
  }
  return alpha_;
}

CovarianceInterface * IdentityCovariance::Clone() const {
  return new IdentityCovariance(*this);
}

void BuildCovarianceMatrix(const CovarianceInterface& covariance, double const * restrict points, int dim, int num_points, double * restrict cov_matrix) noexcept {
  // fill the lower triangle, then mirror
  for (int j = 0; j < num_points; ++j) {
    for (int i = j; i < num_points; ++i) {
      cov_matrix[j*num_points + i] = covariance.Covariance(points + i*dim, points + j*dim);
      cov_matrix[i*num_points + j] = cov_matrix[j*num_points + i];
    }
  }
}

void BuildMixCovarianceMatrix(const CovarianceInterface& covariance, double const * restrict points_one, double const * restrict points_two, int dim, int num_one, int num_two, double * restrict cov_matrix) noexcept {
  for (int j = 0; j < num_two; ++j) {
    for (int i = 0; i < num_one; ++i) {
      cov_matrix[i] = covariance.Covariance(points_one + i*dim, points_two + j*dim);
    }
    cov_matrix += num_one;
  }
}

}  // end namespace sparse_qep
