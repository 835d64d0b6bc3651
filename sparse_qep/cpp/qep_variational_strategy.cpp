/*!
  \file qep_variational_strategy.cpp
  \rst
  Implementation of the variational strategies.

  Both concrete strategies start Forward() the same way: the prior is evaluated once at the union ``[Z, x]`` (so
  ``K_zz``, ``K_zx``, ``K_xx`` and both means come from a single kernel sweep) and partitioned by JointPrior.  Everything
  after that is a handful of triangular solves and GEMMs per batch element; ``K^{-1}`` is never formed.

  Batch elements are matched up with BroadcastIndex(): the joint prior carries ``broadcast(model batch, input batch)``,
  ``q(u)`` carries its own batch shape, and results carry the broadcast of both.
\endrst*/

#include "qep_variational_strategy.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_cache.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_exact_process.hpp"
#include "qep_exception.hpp"
#include "qep_likelihood.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_linear_algebra-inl.hpp"
#include "qep_logging.hpp"
#include "qep_model.hpp"
#include "qep_process_model.hpp"
#include "qep_settings.hpp"
#include "qep_variational_distribution.hpp"

namespace sparse_qep {

namespace {

/*!\rst
  The prior over ``[f(Z), f(x)]`` split into its blocks.  ``induc_induc_covar`` includes the jitter.
\endrst*/
struct JointPrior final {
  JointPrior(const LatentDistribution& full_output, int num_induc, double jitter)
      : num_induc(num_induc),
        num_data(full_output.num_data() - num_induc),
        induc_mean(full_output.batch_shape(), num_induc, 1),
        test_mean(full_output.batch_shape(), num_data, 1),
        induc_induc_covar(full_output.batch_shape(), num_induc, num_induc),
        induc_data_covar(full_output.batch_shape(), num_induc, num_data),
        data_data_covar(full_output.batch_shape(), num_data, num_data) {
    const int num_total = num_induc + num_data;
    for (int b = 0; b < induc_mean.batch_size(); ++b) {
      double const * const mean = full_output.mean().element(b);
      double const * const covariance = full_output.covariance().element(b);
      std::copy(mean, mean + num_induc, induc_mean.element(b));
      std::copy(mean + num_induc, mean + num_total, test_mean.element(b));

      for (int j = 0; j < num_induc; ++j) {
        std::copy(covariance + j*num_total, covariance + j*num_total + num_induc, induc_induc_covar.element(b) + j*num_induc);
      }
      AddDiagonalJitter(jitter, num_induc, induc_induc_covar.element(b));
      for (int j = 0; j < num_data; ++j) {
        double const * const column = covariance + (num_induc + j)*num_total;
        std::copy(column, column + num_induc, induc_data_covar.element(b) + j*num_induc);
        std::copy(column + num_induc, column + num_total, data_data_covar.element(b) + j*num_data);
      }
    }
  }

  const BatchShape& batch_shape() const noexcept {
    return induc_mean.batch_shape;
  }

  int num_induc;
  int num_data;
  //! ``(batch, M, 1)``
  BatchMatrix induc_mean;
  //! ``(batch, N, 1)``
  BatchMatrix test_mean;
  //! ``(batch, M, M)``
  BatchMatrix induc_induc_covar;
  //! ``(batch, M, N)``
  BatchMatrix induc_data_covar;
  //! ``(batch, N, N)``
  BatchMatrix data_data_covar;
};

}  // end unnamed namespace

VariationalStrategyBase::VariationalStrategyBase(const ProcessModel& model, const BatchMatrix& inducing_points,
                                                 std::unique_ptr<VariationalDistributionInterface> variational_distribution,
                                                 bool learn_inducing_locations, double jitter_val, const VariationalSettings& settings)
    : model_(model.Clone()),
      inducing_points_(inducing_points),
      variational_distribution_(std::move(variational_distribution)),
      cache_(),
      settings_(settings),
      learn_inducing_locations_(learn_inducing_locations),
      jitter_val_(jitter_val == kDefaultJitter ? settings.jitter : jitter_val),
      training_(true) {
  if (unlikely(variational_distribution_ == nullptr)) {
    SQ_THROW_EXCEPTION(PreconditionException, "A variational strategy needs a variational distribution.");
  }
  if (unlikely(inducing_points_.num_rows != model_->dim())) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Inducing point dimension does not match the model.", inducing_points_.num_rows, model_->dim());
  }
  if (unlikely(inducing_points_.num_cols != variational_distribution_->num_inducing_points())) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Number of inducing points does not match the variational distribution.",
                       inducing_points_.num_cols, variational_distribution_->num_inducing_points());
  }
  if (unlikely(jitter_val_ < 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Jitter must be non-negative.", jitter_val_, 0.0);
  }
}

VariationalStrategyBase::VariationalStrategyBase(const VariationalStrategyBase& source)
    : model_(source.model_->Clone()),
      inducing_points_(source.inducing_points_),
      variational_distribution_(source.variational_distribution_->Clone()),
      cache_(source.cache_),
      settings_(source.settings_),
      learn_inducing_locations_(source.learn_inducing_locations_),
      jitter_val_(source.jitter_val_),
      training_(source.training_) {
}

void VariationalStrategyBase::InitializeVariationalParameters() {
  if (!cache_.variational_params_initialized()) {
    const LatentDistribution prior_distribution = PriorDistribution();
    variational_distribution_->InitializeVariationalDistribution(prior_distribution);
    cache_.MarkVariationalParamsInitialized();
  }
}

LatentDistribution VariationalStrategyBase::Call(const BatchMatrix& inputs, bool prior) {
  if (prior) {
    return model_->Forward(inputs);
  }

  if (training_) {
    BeginForwardEpoch();
  }
  InitializeVariationalParameters();

  const BatchShape batch_shape_local = BroadcastShapes(inputs.batch_shape, inducing_points_.batch_shape);
  const LatentDistribution variational_inducing_distribution = VariationalDistribution();
  return Forward(inputs.Expand(batch_shape_local), inducing_points_.Expand(batch_shape_local),
                 variational_inducing_distribution.mean(), &variational_inducing_distribution);
}

BatchMatrix VariationalStrategyBase::KlDivergence() {
  return sparse_qep::KlDivergence(VariationalDistribution(), PriorDistribution());
}

BatchShape VariationalStrategyBase::batch_shape() const {
  return BroadcastShapes(BroadcastShapes(model_->batch_shape(), inducing_points_.batch_shape), variational_distribution_->batch_shape());
}

void VariationalStrategyBase::Train(bool mode) {
  if ((training_ && !mode) || mode) {
    cache_.BumpGeneration();
  }
  training_ = mode;
}

void VariationalStrategyBase::GetParameters(double * restrict parameters) const noexcept {
  variational_distribution_->GetParameters(parameters);
  if (learn_inducing_locations_) {
    std::copy(inducing_points_.data.begin(), inducing_points_.data.end(), parameters + variational_distribution_->GetNumberOfParameters());
  }
}

void VariationalStrategyBase::SetParameters(double const * restrict parameters) {
  variational_distribution_->SetParameters(parameters);
  if (learn_inducing_locations_) {
    parameters += variational_distribution_->GetNumberOfParameters();
    std::copy(parameters, parameters + inducing_points_.data.size(), inducing_points_.data.begin());
  }
  cache_.BumpGeneration();
}

void VariationalStrategyBase::SetInducingPoints(const BatchMatrix& inducing_points) {
  if (unlikely(inducing_points.num_rows != inducing_points_.num_rows)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Inducing point dimension cannot change.", inducing_points.num_rows, inducing_points_.num_rows);
  }
  if (unlikely(inducing_points.num_cols != inducing_points_.num_cols)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Number of inducing points cannot change.", inducing_points.num_cols, inducing_points_.num_cols);
  }
  inducing_points_ = inducing_points;
  cache_.BumpGeneration();
}

std::pair<BatchMatrix, BatchMatrix> VariationalStrategyBase::PseudoPoints() {
  SQ_THROW_EXCEPTION(NotImplementedException, "Pseudo points are not available for this variational strategy.");
}

std::unique_ptr<ExactConditionalModel> VariationalStrategyBase::GetFantasyModel(const BatchMatrix& inputs, const BatchMatrix& targets,
                                                                                const LikelihoodInterface& likelihood,
                                                                                double noise_variance) {
  if (unlikely(!likelihood.is_conjugate())) {
    SQ_THROW_EXCEPTION(NotImplementedException, "Fantasy updates require a conjugate likelihood.");
  }
  if (unlikely(!has_fantasy_strategy())) {
    SQ_THROW_EXCEPTION(NotImplementedException, "This variational strategy does not support fantasy updates.");
  }
  const BatchMatrix fantasy_noise_covariance = FantasyNoiseCovariance(targets, likelihood, noise_variance);

  InitializeVariationalParameters();
  const std::pair<BatchMatrix, BatchMatrix> pseudo_points = PseudoPoints();

  // exact process over Z with the pseudo observations; q(u)'s uncertainty enters as (correlated) observation noise
  ExactProcess fantasy_process(*model_, inducing_points_, pseudo_points.second, pseudo_points.first);

  fantasy_process.AddPointsToProcess(inputs, targets, fantasy_noise_covariance);

  return std::unique_ptr<ExactConditionalModel>(new ExactConditionalModel(fantasy_process, likelihood));
}

BatchMatrix VariationalStrategyBase::CholeskyFactor(const BatchMatrix& induc_induc_covar) {
  const BatchMatrix * cached = cache_.GetMatrix(kCholeskyFactorKey);
  if (cached != nullptr && cached->batch_shape == induc_induc_covar.batch_shape && cached->num_rows == induc_induc_covar.num_rows) {
    return *cached;
  }

  const int num_induc = induc_induc_covar.num_rows;
  BatchMatrix chol(induc_induc_covar.batch_shape, num_induc, num_induc);
  for (int b = 0; b < chol.batch_size(); ++b) {
    const double jitter = PsdSafeCholesky(induc_induc_covar.element(b), num_induc, settings_.cholesky_jitter,
                                          settings_.cholesky_max_tries, chol.element(b));
    if (jitter > 0.0) {
      SQ_VERBOSE_PRINTF("K_zz (batch element %d) factored with extra jitter %.1E\n", b, jitter);
    }
  }
  cache_.PutMatrix(kCholeskyFactorKey, chol);
  return chol;
}

VariationalStrategy::VariationalStrategy(const ProcessModel& model, const BatchMatrix& inducing_points,
                                         std::unique_ptr<VariationalDistributionInterface> variational_distribution,
                                         bool learn_inducing_locations, double jitter_val, const VariationalSettings& settings)
    : VariationalStrategyBase(model, inducing_points, std::move(variational_distribution), learn_inducing_locations, jitter_val, settings) {
}

LatentDistribution VariationalStrategy::PriorDistribution() {
  const LatentDistribution * cached = cache_.GetDistribution(kPriorDistributionMemoKey);
  if (cached != nullptr) {
    return *cached;
  }

  const BatchShape& batch_shape_local = variational_distribution_->batch_shape();
  const int num_induc = num_inducing_points();
  const BatchMatrix identity = IdentityBatch(batch_shape_local, num_induc);
  LatentDistribution prior(model_->power(), BatchMatrix(batch_shape_local, num_induc, 1), identity);
  prior.SetRoot(identity);
  cache_.PutDistribution(kPriorDistributionMemoKey, prior);
  return prior;
}

/*!\rst
  With ``L L^T = K_zz`` and interpolation term ``A = L^{-1} K_zx``:

  | ``mean = \mu(x) + A^T m``
  | ``cov  = K_xx + jitter I + A^T (S - I) A``

  (Section 3 of Hensman, Matthews & Ghahramani, "Scalable Variational Gaussian Process Classification", with
  ``u = L v``.)
\endrst*/
LatentDistribution VariationalStrategy::Forward(const BatchMatrix& inputs, const BatchMatrix& inducing_points, const BatchMatrix& inducing_values,
                                                LatentDistribution const * variational_inducing_distribution) {
  const int num_induc = inducing_points.num_cols;
  const double power = model_->power();

  if (variational_inducing_distribution != nullptr && inputs == inducing_points) {
    // q(u) mapped back from whitened coordinates: D(L m + mu_z, L S L^T)
    const LatentDistribution induc_output = model_->Forward(inducing_points);
    BatchMatrix induc_induc_covar = induc_output.covariance();
    for (int b = 0; b < induc_induc_covar.batch_size(); ++b) {
      AddDiagonalJitter(jitter_val_, num_induc, induc_induc_covar.element(b));
    }
    const BatchMatrix chol = CholeskyFactor(induc_induc_covar);
    const BatchMatrix& variational_covariance = variational_inducing_distribution->covariance();

    const BatchShape batch_shape_local = BroadcastShapes(BroadcastShapes(chol.batch_shape, inducing_values.batch_shape),
                                                         variational_covariance.batch_shape);
    BatchMatrix mean(batch_shape_local, num_induc, 1);
    BatchMatrix covariance(batch_shape_local, num_induc, num_induc);
    std::vector<double> chol_times_covariance(num_induc*num_induc);
    for (int b = 0; b < mean.batch_size(); ++b) {
      const int prior_index = BroadcastIndex(batch_shape_local, b, chol.batch_shape);
      double const * const L = chol.element(prior_index);
      double const * const m = inducing_values.element(BroadcastIndex(batch_shape_local, b, inducing_values.batch_shape));
      double const * const S = variational_covariance.element(BroadcastIndex(batch_shape_local, b, variational_covariance.batch_shape));

      std::copy(m, m + num_induc, mean.element(b));
      TriangularMatrixVectorMultiply(L, 'N', num_induc, mean.element(b));
      VectorAXPY(num_induc, 1.0, induc_output.mean().element(prior_index), mean.element(b));

      GeneralMatrixMatrixMultiply(L, 'N', S, 1.0, 0.0, num_induc, num_induc, num_induc, chol_times_covariance.data());
      GeneralMatrixMatrixTransposeMultiply(chol_times_covariance.data(), L, 1.0, 0.0, num_induc, num_induc, num_induc, covariance.element(b));
    }
    return LatentDistribution(power, mean, covariance);
  }

  const JointPrior joint(model_->Forward(ConcatenateColumns(inducing_points, inputs)), num_induc, jitter_val_);
  const int num_data = joint.num_data;
  const BatchMatrix chol = CholeskyFactor(joint.induc_induc_covar);

  BatchShape batch_shape_local = BroadcastShapes(joint.batch_shape(), inducing_values.batch_shape);
  if (variational_inducing_distribution != nullptr) {
    batch_shape_local = BroadcastShapes(batch_shape_local, variational_inducing_distribution->batch_shape());
  }

  BatchMatrix mean(batch_shape_local, num_data, 1);
  BatchMatrix covariance(batch_shape_local, num_data, num_data);
  std::vector<double> interp_term(num_induc*num_data);
  std::vector<double> middle_term(num_induc*num_induc);
  std::vector<double> middle_times_interp(num_induc*num_data);
  for (int b = 0; b < mean.batch_size(); ++b) {
    const int prior_index = BroadcastIndex(batch_shape_local, b, joint.batch_shape());
    double const * const m = inducing_values.element(BroadcastIndex(batch_shape_local, b, inducing_values.batch_shape));

    // A = L^-1 K_zx
    std::copy(joint.induc_data_covar.element(prior_index), joint.induc_data_covar.element(prior_index) + num_induc*num_data, interp_term.begin());
    TriangularMatrixMatrixSolve(chol.element(prior_index), 'N', num_induc, num_data, num_induc, interp_term.data());

    // mean = mu(x) + A^T m
    std::copy(joint.test_mean.element(prior_index), joint.test_mean.element(prior_index) + num_data, mean.element(b));
    GeneralMatrixVectorMultiply(interp_term.data(), 'T', m, 1.0, 1.0, num_induc, num_data, num_induc, mean.element(b));

    // middle = S - I
    if (variational_inducing_distribution != nullptr) {
      const BatchMatrix& variational_covariance = variational_inducing_distribution->covariance();
      double const * const S = variational_covariance.element(BroadcastIndex(batch_shape_local, b, variational_covariance.batch_shape));
      std::copy(S, S + num_induc*num_induc, middle_term.begin());
    } else {
      std::fill(middle_term.begin(), middle_term.end(), 0.0);
    }
    AddDiagonalJitter(-1.0, num_induc, middle_term.data());

    // cov = K_xx + jitter I + A^T (S - I) A
    double * cov = covariance.element(b);
    std::copy(joint.data_data_covar.element(prior_index), joint.data_data_covar.element(prior_index) + num_data*num_data, cov);
    AddDiagonalJitter(jitter_val_, num_data, cov);
    GeneralMatrixMatrixMultiply(middle_term.data(), 'N', interp_term.data(), 1.0, 0.0, num_induc, num_induc, num_data, middle_times_interp.data());
    GeneralMatrixMatrixMultiply(interp_term.data(), 'T', middle_times_interp.data(), 1.0, 1.0, num_data, num_induc, num_data, cov);
  }
  return LatentDistribution(power, mean, covariance);
}

VariationalStrategyInterface * VariationalStrategy::Clone() const {
  return new VariationalStrategy(*this);
}

UnwhitenedVariationalStrategy::UnwhitenedVariationalStrategy(const ProcessModel& model, const BatchMatrix& inducing_points,
                                                             std::unique_ptr<VariationalDistributionInterface> variational_distribution,
                                                             bool learn_inducing_locations, double jitter_val, const VariationalSettings& settings)
    : VariationalStrategyBase(model, inducing_points, std::move(variational_distribution), learn_inducing_locations, jitter_val, settings) {
}

LatentDistribution UnwhitenedVariationalStrategy::PriorDistribution() {
  const LatentDistribution * cached = cache_.GetDistribution(kPriorDistributionMemoKey);
  if (cached != nullptr) {
    return *cached;
  }

  const LatentDistribution prior = model_->Forward(inducing_points_).AddJitter();
  cache_.PutDistribution(kPriorDistributionMemoKey, prior);
  return prior;
}

void UnwhitenedVariationalStrategy::SolveInducing(const BatchMatrix& induc_induc_covar, const BatchMatrix& chol, BatchMatrix * rhs) const {
  const int num_induc = induc_induc_covar.num_rows;
  const int num_rhs = rhs->num_cols;
  const int max_iterations = (settings_.max_cg_iterations > 0) ? settings_.max_cg_iterations : num_induc;
  std::vector<double> solution(num_induc);
  for (int b = 0; b < rhs->batch_size(); ++b) {
    const int covariance_index = BroadcastIndex(rhs->batch_shape, b, induc_induc_covar.batch_shape);
    if (!chol.data.empty()) {
      CholeskyFactorLMatrixMatrixSolve(chol.element(covariance_index), num_induc, num_rhs, rhs->element(b));
      continue;
    }

    for (int j = 0; j < num_rhs; ++j) {
      double * column = rhs->element(b) + j*num_induc;
      const int num_iterations = ConjugateGradientSolve(induc_induc_covar.element(covariance_index), column, num_induc,
                                                        settings_.cg_tolerance, max_iterations, solution.data());
      if (num_iterations > max_iterations) {
        SQ_WARNING_PRINTF("CG solve against K_zz did not reach tolerance %.1E in %d iterations\n", settings_.cg_tolerance, max_iterations);
      }
      std::copy(solution.begin(), solution.end(), column);
    }
  }
}

LatentDistribution UnwhitenedVariationalStrategy::Forward(const BatchMatrix& inputs, const BatchMatrix& inducing_points, const BatchMatrix& inducing_values,
                                                          LatentDistribution const * variational_inducing_distribution) {
  const double power = model_->power();

  // if our points equal the inducing points, we're done
  if (inputs == inducing_points) {
    if (unlikely(variational_inducing_distribution == nullptr)) {
      SQ_THROW_EXCEPTION(PreconditionException, "Inputs equal the inducing points but no variational covariance was given.");
    }
    return LatentDistribution(power, inducing_values, variational_inducing_distribution->covariance());
  }

  // otherwise, we have to marginalize
  const int num_induc = inducing_points.num_cols;
  const JointPrior joint(model_->Forward(ConcatenateColumns(inducing_points, inputs)), num_induc, jitter_val_);
  const int num_data = joint.num_data;

  const bool use_cholesky = !settings_.fast_computations || num_induc <= settings_.max_exact_cholesky_size;
  const BatchMatrix chol = use_cholesky ? CholeskyFactor(joint.induc_induc_covar) : BatchMatrix();

  BatchShape batch_shape_local = BroadcastShapes(joint.batch_shape(), inducing_values.batch_shape);
  BatchMatrix mean_diff(batch_shape_local, num_induc, 1);
  for (int b = 0; b < mean_diff.batch_size(); ++b) {
    double const * const m = inducing_values.element(BroadcastIndex(batch_shape_local, b, inducing_values.batch_shape));
    double const * const induc_mean = joint.induc_mean.element(BroadcastIndex(batch_shape_local, b, joint.batch_shape()));
    for (int i = 0; i < num_induc; ++i) {
      mean_diff.element(b)[i] = m[i] - induc_mean[i];
    }
  }

  // predictions without variances: mean = mu(x) + K_xz K_zz^-1 (m - mu_z)
  if (!training_ && settings_.skip_posterior_variances) {
    // K_zz^-1 (m - mu_z) depends on neither x nor the solver settings, so one solve serves the whole generation
    const BatchMatrix * cached_mean_cache = cache_.GetMatrix(kMeanCacheKey);
    BatchMatrix mean_cache;
    if (cached_mean_cache != nullptr && cached_mean_cache->batch_shape == batch_shape_local && cached_mean_cache->num_rows == num_induc) {
      SQ_DEBUG_PRINTF("mean-only prediction: reusing the cached K_zz solve\n");
      mean_cache = *cached_mean_cache;
    } else {
      mean_cache = mean_diff;
      SolveInducing(joint.induc_induc_covar, chol, &mean_cache);
      cache_.PutMatrix(kMeanCacheKey, mean_cache);
    }

    BatchMatrix mean(batch_shape_local, num_data, 1);
    for (int b = 0; b < mean.batch_size(); ++b) {
      const int prior_index = BroadcastIndex(batch_shape_local, b, joint.batch_shape());
      std::copy(joint.test_mean.element(prior_index), joint.test_mean.element(prior_index) + num_data, mean.element(b));
      GeneralMatrixVectorMultiply(joint.induc_data_covar.element(prior_index), 'T', mean_cache.element(b), 1.0, 1.0,
                                  num_induc, num_data, num_induc, mean.element(b));
    }
    return LatentDistribution(power, mean, BatchMatrix(batch_shape_local, num_data, num_data));
  }

  BatchMatrix root_variational_covar;
  if (variational_inducing_distribution != nullptr) {
    root_variational_covar = variational_inducing_distribution->RootDecomposition(settings_.cholesky_jitter, settings_.cholesky_max_tries);
    batch_shape_local = BroadcastShapes(batch_shape_local, root_variational_covar.batch_shape);
  }
  const int root_size = root_variational_covar.num_cols;

  // cache the prior over u computed along the way
  if (training_) {
    const LatentDistribution prior_distribution(power, joint.induc_mean, joint.induc_induc_covar);
    cache_.PutDistribution(kPriorDistributionMemoKey, prior_distribution.Expand(batch_shape_local));
  }

  // K_zz^-1 K_zx
  BatchMatrix inv_induc_data_covar(joint.induc_data_covar);
  SolveInducing(joint.induc_induc_covar, chol, &inv_induc_data_covar);

  BatchMatrix mean(batch_shape_local, num_data, 1);
  BatchMatrix covariance(batch_shape_local, num_data, num_data);
  std::vector<double> root_times_solve(root_size*num_data);
  for (int b = 0; b < mean.batch_size(); ++b) {
    const int prior_index = BroadcastIndex(batch_shape_local, b, joint.batch_shape());
    double const * const induc_data_covar = joint.induc_data_covar.element(prior_index);
    double const * const data_data_covar = joint.data_data_covar.element(prior_index);
    double const * const solve = inv_induc_data_covar.element(prior_index);

    // mean = mu(x) + (K_zz^-1 K_zx)^T (m - mu_z)
    std::copy(joint.test_mean.element(prior_index), joint.test_mean.element(prior_index) + num_data, mean.element(b));
    GeneralMatrixVectorMultiply(solve, 'T', mean_diff.element(BroadcastIndex(batch_shape_local, b, mean_diff.batch_shape)), 1.0, 1.0,
                                num_induc, num_data, num_induc, mean.element(b));

    double * cov = covariance.element(b);
    if (training_) {
      // only the (clamped) diagonal of K_xx - K_xz K_zz^-1 K_zx
      for (int j = 0; j < num_data; ++j) {
        const double interp_data_data_var = DotProduct(induc_data_covar + j*num_induc, solve + j*num_induc, num_induc);
        cov[j*num_data + j] = std::max(data_data_covar[j*num_data + j] - interp_data_data_var, 0.0);
      }
    } else {
      std::copy(data_data_covar, data_data_covar + num_data*num_data, cov);
      GeneralMatrixMatrixMultiply(induc_data_covar, 'T', solve, -1.0, 1.0, num_data, num_induc, num_data, cov);
    }

    // + P^T P, P = R^T K_zz^-1 K_zx
    if (variational_inducing_distribution != nullptr) {
      double const * const root = root_variational_covar.element(BroadcastIndex(batch_shape_local, b, root_variational_covar.batch_shape));
      GeneralMatrixMatrixMultiply(root, 'T', solve, 1.0, 0.0, root_size, num_induc, num_data, root_times_solve.data());
      GeneralMatrixMatrixMultiply(root_times_solve.data(), 'T', root_times_solve.data(), 1.0, 1.0, num_data, root_size, num_data, cov);
    }
  }
  return LatentDistribution(power, mean, covariance);
}

/*!\rst
  ``D_a = (S^{-1} - K^{-1})^{-1} = S + S R^{-1} S`` with ``R = K - S``; ``R`` is typically not PSD, so
  ``R^{-1} S`` is computed as ``(R R^T + j I)^{-1} R^T S``.  The mean is ``D_a S^{-1} m = m + S R^{-1} m``.
\endrst*/
std::pair<BatchMatrix, BatchMatrix> UnwhitenedVariationalStrategy::PseudoPoints() {
  if (unlikely(variational_distribution_->type() != VariationalDistributionType::kCholesky)) {
    SQ_THROW_EXCEPTION(NotImplementedException, "Only CholeskyVariationalDistribution has pseudo-point support.");
  }
  const BatchMatrix * cached_covariance = cache_.GetMatrix(kPseudoPointsCovarianceKey);
  const BatchMatrix * cached_mean = cache_.GetMatrix(kPseudoPointsMeanKey);
  if (cached_covariance != nullptr && cached_mean != nullptr) {
    return std::make_pair(*cached_covariance, *cached_mean);
  }

  const int num_induc = num_inducing_points();
  const int size = num_induc*num_induc;
  const LatentDistribution variational_inducing_distribution = VariationalDistribution();
  const BatchMatrix& var_cov = variational_inducing_distribution.covariance();
  const BatchMatrix& var_mean = variational_inducing_distribution.mean();
  const LatentDistribution induc_output = model_->Forward(inducing_points_);
  const BatchMatrix& induc_induc_covar = induc_output.covariance();

  const BatchShape batch_shape_local = BroadcastShapes(var_cov.batch_shape, induc_induc_covar.batch_shape);
  BatchMatrix pseudo_target_covar(batch_shape_local, num_induc, num_induc);
  BatchMatrix pseudo_target_mean(batch_shape_local, num_induc, 1);

  std::vector<double> cov_diff(size);
  std::vector<double> inner_term(size);
  std::vector<double> inner_chol(size);
  std::vector<double> inner_solve(size);
  std::vector<double> inducing_covar(size);
  std::vector<double> inducing_covar_chol(size);
  std::vector<double> inner_rhs_mean(num_induc);
  std::vector<double> eigenvalues(num_induc);
  std::vector<double> eigenvectors(size);
  for (int b = 0; b < pseudo_target_covar.batch_size(); ++b) {
    const int variational_index = BroadcastIndex(batch_shape_local, b, var_cov.batch_shape);
    double const * const S = var_cov.element(variational_index);
    double const * const m = var_mean.element(variational_index);
    double const * const K = induc_induc_covar.element(BroadcastIndex(batch_shape_local, b, induc_induc_covar.batch_shape));

    // R = K - S
    for (int i = 0; i < size; ++i) {
      cov_diff[i] = K[i] - S[i];
    }

    // R R^T + j I
    GeneralMatrixMatrixTransposeMultiply(cov_diff.data(), cov_diff.data(), 1.0, 0.0, num_induc, num_induc, num_induc, inner_term.data());
    AddDiagonalJitter(jitter_val_, num_induc, inner_term.data());
    const double inner_jitter = PsdSafeCholesky(inner_term.data(), num_induc, settings_.cholesky_jitter, settings_.cholesky_max_tries, inner_chol.data());
    if (inner_jitter > 0.0) {
      SQ_VERBOSE_PRINTF("PseudoPoints: R R^T factored with extra jitter %.1E\n", inner_jitter);
    }

    // C = S + S (R R^T + j I)^-1 R^T S
    GeneralMatrixMatrixMultiply(cov_diff.data(), 'T', S, 1.0, 0.0, num_induc, num_induc, num_induc, inner_solve.data());
    CholeskyFactorLMatrixMatrixSolve(inner_chol.data(), num_induc, num_induc, inner_solve.data());
    std::copy(S, S + size, inducing_covar.begin());
    GeneralMatrixMatrixMultiply(S, 'N', inner_solve.data(), 1.0, 1.0, num_induc, num_induc, num_induc, inducing_covar.data());

    // m~ = m + S (R R^T + j I)^-1 R^T m
    GeneralMatrixVectorMultiply(cov_diff.data(), 'T', m, 1.0, 0.0, num_induc, num_induc, num_induc, inner_rhs_mean.data());
    CholeskyFactorLMatrixVectorSolve(inner_chol.data(), num_induc, inner_rhs_mean.data());
    std::copy(m, m + num_induc, pseudo_target_mean.element(b));
    GeneralMatrixVectorMultiply(S, 'N', inner_rhs_mean.data(), 1.0, 1.0, num_induc, num_induc, num_induc, pseudo_target_mean.element(b));

    // ensure C is PSD; both factorizations below read the lower triangle
    for (int j = 0; j < num_induc; ++j) {
      for (int i = j + 1; i < num_induc; ++i) {
        inducing_covar[i*num_induc + j] = inducing_covar[j*num_induc + i];
      }
    }
    double * pseudo_covar = pseudo_target_covar.element(b);
    try {
      std::vector<double> jittered_covar(inducing_covar);
      AddDiagonalJitter(jitter_val_, num_induc, jittered_covar.data());
      const double covar_jitter = PsdSafeCholesky(jittered_covar.data(), num_induc, settings_.cholesky_jitter, settings_.cholesky_max_tries,
                                                  inducing_covar_chol.data());
      if (covar_jitter > 0.0) {
        SQ_VERBOSE_PRINTF("PseudoPoints: C factored with extra jitter %.1E\n", covar_jitter);
      }
      GeneralMatrixMatrixTransposeMultiply(inducing_covar_chol.data(), inducing_covar_chol.data(), 1.0, 0.0, num_induc, num_induc, num_induc, pseudo_covar);
    } catch (const SingularMatrixException& exception) {
      SQ_WARNING_PRINTF("PseudoPoints: pseudo covariance is not PSD; repairing through its eigen-decomposition.\n%s\n", exception.what());
      SymmetricEigenDecomposition(inducing_covar.data(), num_induc, eigenvalues.data(), eigenvectors.data());
      // V diag(max(lambda, 0) + j) V^T
      std::fill(pseudo_covar, pseudo_covar + size, 0.0);
      for (int k = 0; k < num_induc; ++k) {
        OuterProduct(num_induc, num_induc, std::max(eigenvalues[k], 0.0) + jitter_val_, eigenvectors.data() + k*num_induc,
                     eigenvectors.data() + k*num_induc, pseudo_covar);
      }
    }
  }

  cache_.PutMatrix(kPseudoPointsCovarianceKey, pseudo_target_covar);
  cache_.PutMatrix(kPseudoPointsMeanKey, pseudo_target_mean);
  return std::make_pair(pseudo_target_covar, pseudo_target_mean);
}

VariationalStrategyInterface * UnwhitenedVariationalStrategy::Clone() const {
  return new UnwhitenedVariationalStrategy(*this);
}

}  // end namespace sparse_qep
