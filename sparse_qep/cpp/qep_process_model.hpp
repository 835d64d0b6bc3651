/*!
  \file qep_process_model.hpp
  \rst
  ProcessModel: a (batch of) prior stochastic process(es) ``f ~ P(\mu(\cdot), k(\cdot,\cdot))``, Normal or
  Q-Exponential according to its ``power``.  This is the prior that variational strategies condition.

  A model with batch shape ``B`` holds one (mean, covariance) pair per batch element; e.g., the ``Q`` independent latent
  processes of an LMC model or the ``H`` output processes of a deep layer.  Every element starts as a copy of the
  constructor's mean and covariance; use mutable_mean() / mutable_covariance() to give elements distinct
  hyperparameters.

  Forward() evaluates the prior at a point set: with ``x`` of batch shape ``B_x``, the result has batch shape
  ``broadcast(B, B_x)``, mean ``\mu(x)`` and covariance ``K(x, x)``.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_PROCESS_MODEL_HPP_
#define SPARSE_QEP_CPP_QEP_PROCESS_MODEL_HPP_

#include <memory>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_covariance.hpp"
#include "qep_distribution.hpp"
#include "qep_mean.hpp"

namespace sparse_qep {

class ProcessModel final {
 public:
  /*!\rst
    \param
      :batch_shape: batch shape ``B`` of the model
      :mean: prior mean function (cloned into every batch element)
      :covariance: prior covariance function (cloned into every batch element)
      :power: distribution power; ``kNormalPower`` (default) for a Gaussian process
  \endrst*/
  ProcessModel(const BatchShape& batch_shape, const MeanInterface& mean, const CovarianceInterface& covariance, double power = kNormalPower);

  ProcessModel(const MeanInterface& mean, const CovarianceInterface& covariance, double power = kNormalPower);

  //! deep copy (clones every mean and covariance)
  ProcessModel(const ProcessModel& source);

  ProcessModel * Clone() const SQ_WARN_UNUSED_RESULT {
    return new ProcessModel(*this);
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

  int dim() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return covariances_[0]->dim();
  }

  MeanInterface& mutable_mean(int batch_index) {
    return *means_.at(batch_index);
  }

  CovarianceInterface& mutable_covariance(int batch_index) {
    return *covariances_.at(batch_index);
  }

  const MeanInterface& mean(int batch_index) const {
    return *means_.at(batch_index);
  }

  const CovarianceInterface& covariance(int batch_index) const {
    return *covariances_.at(batch_index);
  }

  /*!\rst
    Evaluates the prior at ``points``.

    \param
      :points: ``(B_x, dim, N)`` point sets
    \return
      the prior over ``f(points)``, batch shape ``broadcast(B, B_x)``
    \raise
      InvalidValueException<int> if ``points.num_rows != dim()``; ShapeMismatchException if the batches do not broadcast
  \endrst*/
  LatentDistribution Forward(const BatchMatrix& points) const SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(ProcessModel);

 private:
  BatchShape batch_shape_;
  double power_;
  //! one per batch element
  std::vector<std::unique_ptr<MeanInterface>> means_;
  //! one per batch element
  std::vector<std::unique_ptr<CovarianceInterface>> covariances_;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_PROCESS_MODEL_HPP_
