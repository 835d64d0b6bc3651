/*!
  \file qep_process_model.cpp
  \rst
  Definitions for ProcessModel.
\endrst*/

#include "qep_process_model.hpp"

#include <limits>
#include <memory>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_covariance.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"
#include "qep_mean.hpp"

namespace sparse_qep {

ProcessModel::ProcessModel(const BatchShape& batch_shape, const MeanInterface& mean, const CovarianceInterface& covariance, double power)
    : batch_shape_(batch_shape), power_(power), means_(), covariances_() {
  if (unlikely(power <= 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Process power must be positive.", power, std::numeric_limits<double>::min());
  }
  const int batch_size = BatchSize(batch_shape_);
  if (unlikely(batch_size <= 0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "Process batch must be non-empty.", batch_size, 1);
  }
  for (int b = 0; b < batch_size; ++b) {
    means_.emplace_back(mean.Clone());
    covariances_.emplace_back(covariance.Clone());
  }
}

ProcessModel::ProcessModel(const MeanInterface& mean, const CovarianceInterface& covariance, double power)
    : ProcessModel(BatchShape(), mean, covariance, power) {
}

ProcessModel::ProcessModel(const ProcessModel& source)
    : batch_shape_(source.batch_shape_), power_(source.power_), means_(), covariances_() {
  for (const auto& mean : source.means_) {
    means_.emplace_back(mean->Clone());
  }
  for (const auto& covariance : source.covariances_) {
    covariances_.emplace_back(covariance->Clone());
  }
}

LatentDistribution ProcessModel::Forward(const BatchMatrix& points) const {
  const int dim_model = dim();
  if (unlikely(points.num_rows != dim_model)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Point dimension does not match the covariance.", points.num_rows, dim_model);
  }
  const BatchShape batch_shape = BroadcastShapes(batch_shape_, points.batch_shape);
  const int num_points = points.num_cols;

  BatchMatrix mean(batch_shape, num_points, 1);
  BatchMatrix covariance(batch_shape, num_points, num_points);
  for (int b = 0; b < mean.batch_size(); ++b) {
    const int model_index = BroadcastIndex(batch_shape, b, batch_shape_);
    double const * const point_set = points.element(BroadcastIndex(batch_shape, b, points.batch_shape));
    BuildMeanVector(*means_[model_index], point_set, dim_model, num_points, mean.element(b));
    BuildCovarianceMatrix(*covariances_[model_index], point_set, dim_model, num_points, covariance.element(b));
  }
  return LatentDistribution(power_, mean, covariance);
}

}  // end namespace sparse_qep
