/*!
  \file qep_mean.cpp
  \rst
  Definitions for the MeanInterface subclasses in qep_mean.hpp.
\endrst*/

#include "qep_mean.hpp"

#include <algorithm>
#include <vector>

#include "qep_common.hpp"
#include "qep_linear_algebra.hpp"

namespace sparse_qep {

MeanInterface * ZeroMean::Clone() const {
  return new ZeroMean(*this);
}

MeanInterface * ConstantMean::Clone() const {
  return new ConstantMean(*this);
}

LinearMean::LinearMean(std::vector<double> weights, double bias) : weights_(weights), bias_(bias) {
}

double LinearMean::Mean(double const * restrict point) const noexcept {
  return DotProduct(weights_.data(), point, weights_.size()) + bias_;
}

void LinearMean::SetHyperparameters(double const * restrict hyperparameters) noexcept {
  const int dim = weights_.size();
  std::copy(hyperparameters, hyperparameters + dim, weights_.begin());
  bias_ = hyperparameters[dim];
}

void LinearMean::GetHyperparameters(double * restrict hyperparameters) const noexcept {
  std::copy(weights_.begin(), weights_.end(), hyperparameters);
  hyperparameters[weights_.size()] = bias_;
}

MeanInterface * LinearMean::Clone() const {
  return new LinearMean(*this);
}

void BuildMeanVector(const MeanInterface& mean, double const * restrict points, int dim, int num_points, double * restrict mean_vector) noexcept {
  for (int i = 0; i < num_points; ++i) {
    mean_vector[i] = mean.Mean(points + i*dim);
  }
}

}  // end namespace sparse_qep
