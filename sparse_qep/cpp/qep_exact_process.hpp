/*!
  \file qep_exact_process.hpp
  \rst
  ExactProcess: the exact conditional (posterior) of a ProcessModel given noisy observations, and PointsToSampleState,
  which holds the quantities it needs to make predictions at a fixed set of ``points_to_sample``.

  This is the object a fantasy update produces: a variational strategy turns ``q(u)`` into pseudo observations of
  ``u`` at the inducing points (with a full noise covariance), appends the fantasy observations, and conditions the prior
  exactly.  It is NOT a training path; there are no hyperparameter gradients.

  With training points ``X``, observations ``y``, noise covariance ``\Sigma_n`` and prior ``P(\mu, k)``:

  | ``K = K(X, X) + \Sigma_n``, ``L L^T = K``
  | ComputeMeanOfPoints    : ``\mu(Xs) + K(Xs, X) K^{-1} (y - \mu(X))``
  | ComputeVarianceOfPoints: ``K(Xs, Xs) - K(Xs, X) K^{-1} K(X, Xs)``

  computed through ``L`` without forming ``K^{-1}`` (see Rasmussen & Williams, Algorithm 2.1).  The posterior keeps the
  prior's power, so a Q-Exponential prior yields a Q-Exponential posterior with the same location and scale.

  Everything is batched: the batch shape of an ExactProcess is the broadcast of its prior's batch shape and the batch
  shapes of its data.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_EXACT_PROCESS_HPP_
#define SPARSE_QEP_CPP_QEP_EXACT_PROCESS_HPP_

#include <memory>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_process_model.hpp"

namespace sparse_qep {

struct PointsToSampleState;

class ExactProcess final {
 public:
  using StateType = PointsToSampleState;

  /*!\rst
    Conditions ``prior`` on the observations.

    .. Warning:: ``points_sampled`` must not contain duplicate points unless the noise covariance makes ``K`` non-singular.

    \param
      :prior: the prior process (cloned)
      :points_sampled: ``(batch, dim, N)`` training points ``X``
      :points_sampled_value: ``(batch, N, 1)`` observations ``y``
      :noise_covariance: ``(batch, N, N)`` observation noise covariance ``\Sigma_n``
    \raise
      InvalidValueException<int> for inconsistent sizes; ShapeMismatchException if the batches do not broadcast;
      SingularMatrixException if ``K`` cannot be factored
  \endrst*/
  ExactProcess(const ProcessModel& prior, const BatchMatrix& points_sampled, const BatchMatrix& points_sampled_value,
               const BatchMatrix& noise_covariance);

  int dim() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return points_sampled_.num_rows;
  }

  int num_sampled() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return points_sampled_.num_cols;
  }

  const BatchShape& batch_shape() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return batch_shape_;
  }

  double power() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return prior_->power();
  }

  const ProcessModel& prior() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *prior_;
  }

  const BatchMatrix& points_sampled() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return points_sampled_;
  }

  const BatchMatrix& points_sampled_value() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return points_sampled_value_;
  }

  const BatchMatrix& noise_covariance() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return noise_covariance_;
  }

  /*!\rst
    Sets up the PointsToSampleState object so that it can be used to compute the posterior mean and variance.
    This function should not be called directly; instead use PointsToSampleState::SetupState().
  \endrst*/
  void FillPointsToSampleState(StateType * points_to_sample_state) const SQ_NONNULL_POINTERS;

  /*!\rst
    \param
      :points_to_sample_state: a FULLY CONFIGURED PointsToSampleState
    \output
      :mean_of_points[1]: ``(batch, num_to_sample, 1)`` posterior means
  \endrst*/
  void ComputeMeanOfPoints(const StateType& points_to_sample_state, BatchMatrix * mean_of_points) const SQ_NONNULL_POINTERS;

  /*!\rst
    \param
      :points_to_sample_state[1]: a FULLY CONFIGURED PointsToSampleState
    \output
      :points_to_sample_state[1]: only temporary state is mutated
      :var_star[1]: ``(batch, num_to_sample, num_to_sample)`` posterior covariances, both triangles filled
  \endrst*/
  void ComputeVarianceOfPoints(StateType * points_to_sample_state, BatchMatrix * var_star) const SQ_NONNULL_POINTERS;

  /*!\rst
    \return
      the posterior over ``f(points_to_sample)`` in the prior's family
  \endrst*/
  LatentDistribution ComputePosterior(const BatchMatrix& points_to_sample) const SQ_WARN_UNUSED_RESULT;

  /*!\rst
    Appends observations; the new noise covariance enters block-diagonally (new observations are independent of the
    old ones).  Forces recomputation of all derived quantities.

    \param
      :new_points: ``(batch, dim, n)`` new points
      :new_points_value: ``(batch, n, 1)`` new observations
      :new_noise_covariance: ``(batch, n, n)`` noise covariance of the new observations
  \endrst*/
  void AddPointsToProcess(const BatchMatrix& new_points, const BatchMatrix& new_points_value, const BatchMatrix& new_noise_covariance);

  ExactProcess * Clone() const SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(ExactProcess);

 private:
  ExactProcess(const ExactProcess& source);

  /*!\rst
    Recomputes the derived quantities in this class.  Called any time state variables are changed.
  \endrst*/
  void RecomputeDerivedVariables();

  //! prior process
  std::unique_ptr<ProcessModel> prior_;
  //! broadcast of the prior and data batch shapes
  BatchShape batch_shape_;
  //! coordinates of already-sampled points, ``X``
  BatchMatrix points_sampled_;
  //! observations at points_sampled, ``y``
  BatchMatrix points_sampled_value_;
  //! ``\Sigma_n``, the noise covariance
  BatchMatrix noise_covariance_;

  // derived variables
  //! cholesky factorization of ``K(X,X) + \Sigma_n``
  BatchMatrix K_chol_;
  //! ``K^-1 (y - \mu(X))``; computed WITHOUT forming ``K^-1``
  BatchMatrix K_inv_y_;
};

/*!\rst
  Holds the per-``points_to_sample`` state that ExactProcess needs to compute posterior means and variances.

  .. WARNING:: This object's state is INVALIDATED if the ExactProcess used in construction is mutated!
     SetupState() should be called again in such a situation.
\endrst*/
struct PointsToSampleState final {
  /*!\rst
    \param
      :exact_process: the process to make predictions with
      :points_to_sample_in: ``(batch, dim, num_to_sample)`` points ``Xs``; batch must broadcast to the process batch
  \endrst*/
  PointsToSampleState(const ExactProcess& exact_process, const BatchMatrix& points_to_sample_in);

  void SetupState(const ExactProcess& exact_process, const BatchMatrix& points_to_sample_in);

  //! spatial dimension
  const int dim;
  //! number of training points
  int num_sampled;
  //! number of points to predict
  int num_to_sample;

  //! points to make predictions about, ``Xs``, broadcast onto the process batch
  BatchMatrix points_to_sample;

  // derived variables; these are all *temporary* quantities
  //! the "mixed" covariance matrix ``Ks = K(X, Xs)`` (``num_sampled x num_to_sample``)
  BatchMatrix K_star;
  //! ``L^-1 Ks``
  BatchMatrix V;

  SQ_DISALLOW_DEFAULT_AND_COPY_AND_ASSIGN(PointsToSampleState);
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_EXACT_PROCESS_HPP_
