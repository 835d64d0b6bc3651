/*!
  \file qep_exact_process.cpp
  \rst
  Implementation of ExactProcess and PointsToSampleState.

  With ``L L^T = K(X,X) + \Sigma_n`` and ``Ks = K(X, Xs)``:

  | ``mus  = \mu(Xs) + Ks^T * K^-1 * (y - \mu(X))``
  | ``V    = L^-1 * Ks``
  | ``Vars = Kss - V^T * V``

  ``Vars`` is the Schur complement of ``K`` in the joint covariance of ``(f(X) + noise, f(Xs))``, so it is SPD whenever
  the joint covariance is.
\endrst*/

#include "qep_exact_process.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_covariance.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_logging.hpp"
#include "qep_mean.hpp"
#include "qep_process_model.hpp"

namespace sparse_qep {

namespace {

void CheckObservationSizes(const BatchMatrix& points, const BatchMatrix& values, const BatchMatrix& noise_covariance) {
  const int num_points = points.num_cols;
  if (unlikely(values.num_rows != num_points || values.num_cols != 1)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Need exactly one observation per point.", values.num_rows*values.num_cols, num_points);
  }
  if (unlikely(noise_covariance.num_rows != num_points || noise_covariance.num_cols != num_points)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Noise covariance must be num_points x num_points.", noise_covariance.num_rows, num_points);
  }
}

/*!\rst
  Stacks two ``(batch, n_i, 1)`` vectors.
\endrst*/
BatchMatrix StackVectors(const BatchMatrix& top, const BatchMatrix& bottom) {
  BatchMatrix result(top.batch_shape, top.num_rows + bottom.num_rows, 1);
  for (int b = 0; b < result.batch_size(); ++b) {
    std::copy(bottom.element(b), bottom.element(b) + bottom.num_rows,
              std::copy(top.element(b), top.element(b) + top.num_rows, result.element(b)));
  }
  return result;
}

/*!\rst
  ``diag(upper, lower)`` for square batches.
\endrst*/
BatchMatrix BlockDiagonal(const BatchMatrix& upper, const BatchMatrix& lower) {
  const int size_upper = upper.num_rows;
  const int size = size_upper + lower.num_rows;
  BatchMatrix result(upper.batch_shape, size, size);
  for (int b = 0; b < result.batch_size(); ++b) {
    double * block = result.element(b);
    for (int j = 0; j < size_upper; ++j) {
      std::copy(upper.element(b) + j*size_upper, upper.element(b) + (j + 1)*size_upper, block + j*size);
    }
    for (int j = 0; j < lower.num_rows; ++j) {
      std::copy(lower.element(b) + j*lower.num_rows, lower.element(b) + (j + 1)*lower.num_rows,
                block + (size_upper + j)*size + size_upper);
    }
  }
  return result;
}

}  // end unnamed namespace

ExactProcess::ExactProcess(const ProcessModel& prior, const BatchMatrix& points_sampled, const BatchMatrix& points_sampled_value,
                           const BatchMatrix& noise_covariance)
    : prior_(prior.Clone()),
      batch_shape_(),
      points_sampled_(),
      points_sampled_value_(),
      noise_covariance_(),
      K_chol_(),
      K_inv_y_() {
  if (unlikely(points_sampled.num_rows != prior.dim())) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Point dimension does not match the prior.", points_sampled.num_rows, prior.dim());
  }
  if (unlikely(points_sampled.num_cols <= 0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "Need at least one observation.", points_sampled.num_cols, 1);
  }
  CheckObservationSizes(points_sampled, points_sampled_value, noise_covariance);

  batch_shape_ = BroadcastShapes(BroadcastShapes(prior.batch_shape(), points_sampled.batch_shape),
                                 BroadcastShapes(points_sampled_value.batch_shape, noise_covariance.batch_shape));
  points_sampled_ = points_sampled.Expand(batch_shape_);
  points_sampled_value_ = points_sampled_value.Expand(batch_shape_);
  noise_covariance_ = noise_covariance.Expand(batch_shape_);

  RecomputeDerivedVariables();
}

ExactProcess::ExactProcess(const ExactProcess& source)
    : prior_(source.prior_->Clone()),
      batch_shape_(source.batch_shape_),
      points_sampled_(source.points_sampled_),
      points_sampled_value_(source.points_sampled_value_),
      noise_covariance_(source.noise_covariance_),
      K_chol_(source.K_chol_),
      K_inv_y_(source.K_inv_y_) {
}

void ExactProcess::RecomputeDerivedVariables() {
  const int num_sampled_local = num_sampled();
  const int dim_local = dim();
  K_chol_ = BatchMatrix(batch_shape_, num_sampled_local, num_sampled_local);
  K_inv_y_ = BatchMatrix(batch_shape_, num_sampled_local, 1);

  std::vector<double> covariance_with_noise(num_sampled_local*num_sampled_local);
  for (int b = 0; b < K_chol_.batch_size(); ++b) {
    const int model_index = BroadcastIndex(batch_shape_, b, prior_->batch_shape());
    BuildCovarianceMatrix(prior_->covariance(model_index), points_sampled_.element(b), dim_local, num_sampled_local,
                          covariance_with_noise.data());
    VectorAXPY(num_sampled_local*num_sampled_local, 1.0, noise_covariance_.element(b), covariance_with_noise.data());

    const double jitter = PsdSafeCholesky(covariance_with_noise.data(), num_sampled_local, 1.0e-8, 3, K_chol_.element(b));
    if (jitter > 0.0) {
      SQ_VERBOSE_PRINTF("ExactProcess: K factored with jitter %.1E\n", jitter);
    }

    // K_inv_y = K^-1 (y - mu(X))
    double * K_inv_y = K_inv_y_.element(b);
    BuildMeanVector(prior_->mean(model_index), points_sampled_.element(b), dim_local, num_sampled_local, K_inv_y);
    VectorScale(num_sampled_local, -1.0, K_inv_y);
    VectorAXPY(num_sampled_local, 1.0, points_sampled_value_.element(b), K_inv_y);
    CholeskyFactorLMatrixVectorSolve(K_chol_.element(b), num_sampled_local, K_inv_y);
  }
}

void ExactProcess::FillPointsToSampleState(StateType * points_to_sample_state) const {
  const int num_to_sample = points_to_sample_state->num_to_sample;
  for (int b = 0; b < points_to_sample_state->K_star.batch_size(); ++b) {
    const int model_index = BroadcastIndex(batch_shape_, b, prior_->batch_shape());
    BuildMixCovarianceMatrix(prior_->covariance(model_index), points_sampled_.element(b),
                             points_to_sample_state->points_to_sample.element(b), dim(), num_sampled(), num_to_sample,
                             points_to_sample_state->K_star.element(b));
  }
}

void ExactProcess::ComputeMeanOfPoints(const StateType& points_to_sample_state, BatchMatrix * mean_of_points) const {
  const int num_to_sample = points_to_sample_state.num_to_sample;
  *mean_of_points = BatchMatrix(batch_shape_, num_to_sample, 1);
  for (int b = 0; b < mean_of_points->batch_size(); ++b) {
    const int model_index = BroadcastIndex(batch_shape_, b, prior_->batch_shape());
    BuildMeanVector(prior_->mean(model_index), points_to_sample_state.points_to_sample.element(b), dim(), num_to_sample,
                    mean_of_points->element(b));
    GeneralMatrixVectorMultiply(points_to_sample_state.K_star.element(b), 'T', K_inv_y_.element(b), 1.0, 1.0,
                                num_sampled(), num_to_sample, num_sampled(), mean_of_points->element(b));
  }
}

void ExactProcess::ComputeVarianceOfPoints(StateType * points_to_sample_state, BatchMatrix * var_star) const {
  const int num_to_sample = points_to_sample_state->num_to_sample;
  *var_star = BatchMatrix(batch_shape_, num_to_sample, num_to_sample);
  points_to_sample_state->V = points_to_sample_state->K_star;
  for (int b = 0; b < var_star->batch_size(); ++b) {
    const int model_index = BroadcastIndex(batch_shape_, b, prior_->batch_shape());
    // Vars = Kss
    BuildCovarianceMatrix(prior_->covariance(model_index), points_to_sample_state->points_to_sample.element(b), dim(),
                          num_to_sample, var_star->element(b));
    // V := L^-1 * K_star
    double * V = points_to_sample_state->V.element(b);
    TriangularMatrixMatrixSolve(K_chol_.element(b), 'N', num_sampled(), num_to_sample, num_sampled(), V);
    // Vars -= V^T V
    GeneralMatrixMatrixMultiply(V, 'T', V, -1.0, 1.0, num_to_sample, num_sampled(), num_to_sample, var_star->element(b));
  }
}

LatentDistribution ExactProcess::ComputePosterior(const BatchMatrix& points_to_sample) const {
  StateType points_to_sample_state(*this, points_to_sample);
  BatchMatrix mean;
  BatchMatrix covariance;
  ComputeMeanOfPoints(points_to_sample_state, &mean);
  ComputeVarianceOfPoints(&points_to_sample_state, &covariance);
  return LatentDistribution(power(), mean, covariance);
}

void ExactProcess::AddPointsToProcess(const BatchMatrix& new_points, const BatchMatrix& new_points_value, const BatchMatrix& new_noise_covariance) {
  if (unlikely(new_points.num_rows != dim())) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "New point dimension does not match the process.", new_points.num_rows, dim());
  }
  CheckObservationSizes(new_points, new_points_value, new_noise_covariance);

  const BatchShape new_batch_shape = BroadcastShapes(BroadcastShapes(batch_shape_, new_points.batch_shape),
                                                     BroadcastShapes(new_points_value.batch_shape, new_noise_covariance.batch_shape));
  points_sampled_ = ConcatenateColumns(points_sampled_.Expand(new_batch_shape), new_points.Expand(new_batch_shape));
  points_sampled_value_ = StackVectors(points_sampled_value_.Expand(new_batch_shape), new_points_value.Expand(new_batch_shape));
  noise_covariance_ = BlockDiagonal(noise_covariance_.Expand(new_batch_shape), new_noise_covariance.Expand(new_batch_shape));
  batch_shape_ = new_batch_shape;

  // TODO: extend K_chol_ by a block Cholesky update (O(N^2 n)) instead of refactoring (O(N^3)).
  RecomputeDerivedVariables();
}

ExactProcess * ExactProcess::Clone() const {
  return new ExactProcess(*this);
}

PointsToSampleState::PointsToSampleState(const ExactProcess& exact_process, const BatchMatrix& points_to_sample_in)
    : dim(exact_process.dim()),
      num_sampled(exact_process.num_sampled()),
      num_to_sample(points_to_sample_in.num_cols),
      points_to_sample(),
      K_star(),
      V() {
  SetupState(exact_process, points_to_sample_in);
}

void PointsToSampleState::SetupState(const ExactProcess& exact_process, const BatchMatrix& points_to_sample_in) {
  if (unlikely(points_to_sample_in.num_rows != dim)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Prediction point dimension does not match the process.", points_to_sample_in.num_rows, dim);
  }
  num_sampled = exact_process.num_sampled();
  num_to_sample = points_to_sample_in.num_cols;
  points_to_sample = points_to_sample_in.Expand(exact_process.batch_shape());
  K_star = BatchMatrix(exact_process.batch_shape(), num_sampled, num_to_sample);
  V = BatchMatrix(exact_process.batch_shape(), num_sampled, num_to_sample);

  exact_process.FillPointsToSampleState(this);
}

}  // end namespace sparse_qep
