/*!
  \file qep_variational_strategy_test.cpp
  \rst
  Routines to test the variational strategies.  See qep_variational_strategy_test.hpp for the list of checks.
\endrst*/

#include "qep_variational_strategy_test.hpp"

#include <cmath>

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_cache.hpp"
#include "qep_common.hpp"
#include "qep_covariance.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_logging.hpp"
#include "qep_mean.hpp"
#include "qep_process_model.hpp"
#include "qep_random.hpp"
#include "qep_settings.hpp"
#include "qep_test_utils.hpp"
#include "qep_variational_distribution.hpp"
#include "qep_variational_strategy.hpp"

namespace sparse_qep {

namespace {

std::unique_ptr<VariationalDistributionInterface> MakeCholeskyDistribution(int num_inducing, const BatchShape& batch_shape) {
  return std::unique_ptr<VariationalDistributionInterface>(new CholeskyVariationalDistribution(num_inducing, batch_shape));
}

//! ``num_points`` 1-d points evenly spaced on ``[left, right]``
BatchMatrix BuildEvenlySpacedPoints(double left, double right, int num_points) {
  BatchMatrix points({}, 1, num_points);
  for (int i = 0; i < num_points; ++i) {
    points.data[i] = left + (right - left)*i/(num_points - 1);
  }
  return points;
}

/*!\rst
  With ``x == Z``, the whitened strategy maps the seeded ``q(v) = D(0, I)`` back to ``D(\mu_z, K_zz + jitter I)``, and
  the unwhitened strategy returns the seeded ``q(u) = D(\mu_z, K_zz + 10^{-3} I)`` unchanged.
\endrst*/
SQ_WARN_UNUSED_RESULT int TestDegenerateCalls() {
  int total_errors = 0;
  UniformRandomGenerator uniform_generator(3141);
  const MockSparseRegressionData data(1, 8, 4, kNormalPower, &uniform_generator);
  const LatentDistribution prior_at_inducing = data.prior->Forward(data.inducing_points);

  {
    VariationalStrategy strategy(*data.prior, data.inducing_points, MakeCholeskyDistribution(4, {}));
    if (strategy.variational_params_initialized()) {
      ++total_errors;
    }
    const LatentDistribution output = strategy.Call(data.inducing_points);
    if (!strategy.variational_params_initialized()) {
      ++total_errors;
    }
    total_errors += CheckBatchMatrixNear(output.mean(), prior_at_inducing.mean(), 1.0e-12);
    total_errors += CheckBatchMatrixNear(output.covariance(), prior_at_inducing.AddJitter(kDefaultVariationalJitter).covariance(), 1.0e-10);

    // q(v) == p(v) right after seeding
    const BatchMatrix kl = strategy.KlDivergence();
    if (!CheckDoubleWithin(kl.data[0], 0.0, 1.0e-12)) {
      ++total_errors;
    }
  }

  {
    UnwhitenedVariationalStrategy strategy(*data.prior, data.inducing_points, MakeCholeskyDistribution(4, {}));
    const LatentDistribution output = strategy.Call(data.inducing_points);
    total_errors += CheckBatchMatrixNear(output.mean(), prior_at_inducing.mean(), 1.0e-14);
    total_errors += CheckBatchMatrixNear(output.covariance(), prior_at_inducing.AddJitter().covariance(), 1.0e-10);

    const BatchMatrix induc_mean = prior_at_inducing.mean();
    total_errors += CheckThrows<PreconditionException>("degenerate Forward without S", [&strategy, &data, &induc_mean]() {
        return strategy.Forward(data.inducing_points, data.inducing_points, induc_mean, nullptr);
      });
  }

  // the prior flag bypasses q(u) entirely
  {
    VariationalStrategy strategy(*data.prior, data.inducing_points, MakeCholeskyDistribution(4, {}));
    const LatentDistribution output = strategy.Call(data.train_inputs, true);
    total_errors += CheckBatchMatrixNear(output.covariance(), data.prior->Forward(data.train_inputs).covariance(), 0.0);
    if (strategy.variational_params_initialized()) {
      SQ_ERROR_PRINTF("prior call seeded q(u)\n");
      ++total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  ``Z = [0, 1, 2]``, ``\mu(x) = 2x + 1``, ``k = I`` (identity kernel), ``q(u) = D([0.5, -1, 2], 0.25 I)``, evaluated at
  ``x = [1, 5]``.  Only ``x_0`` correlates with (exactly) one inducing point, ``z_1``.  With ``k = 1 + 10^{-6}``:

  * unwhitened: ``mean = [3 + (m_1 - 3)/k, 11]``, ``var_0 = 1 - 1/k + 0.25/k^2``, ``var_1 = 1``
  * whitened: ``mean = [3 + m_1/\sqrt{k}, 11]``, ``var_0 = 1 + 10^{-6} + (0.25 - 1)/k``, ``var_1 = 1 + 10^{-6}``
\endrst*/
SQ_WARN_UNUSED_RESULT int TestIdentityKernelClosedForm() {
  int total_errors = 0;
  const double tolerance = 1.0e-12;
  const ProcessModel model(LinearMean({2.0}, 1.0), IdentityCovariance(1, 1.0));
  const BatchMatrix inducing_points = BuildEvenlySpacedPoints(0.0, 2.0, 3);
  const BatchMatrix inputs({}, 1, 2, {1.0, 5.0});
  const std::vector<double> parameters = {0.5, -1.0, 2.0,  // m
                                          0.5, 0.0, 0.0, 0.5, 0.0, 0.5};  // L = 0.5 I
  const double k = 1.0 + kDefaultVariationalJitter;

  {
    UnwhitenedVariationalStrategy strategy(model, inducing_points, MakeCholeskyDistribution(3, {}), false);
    if (!CheckIntEquals(strategy.GetNumberOfParameters(), 9)) {
      ++total_errors;
    }
    const LatentDistribution seeded = strategy.Call(inducing_points);
    total_errors += CheckBatchMatrixNear(seeded.mean(), BatchMatrix({}, 3, 1, {1.0, 3.0, 5.0}), tolerance);
    strategy.SetParameters(parameters.data());

    // training: diagonal only
    const LatentDistribution training_output = strategy.Call(inputs);
    const double var0 = 1.0 - 1.0/k + 0.25/Square(k);
    total_errors += CheckBatchMatrixNear(training_output.mean(), BatchMatrix({}, 2, 1, {3.0 - 4.0/k, 11.0}), tolerance);
    total_errors += CheckBatchMatrixNear(training_output.covariance(), BatchMatrix({}, 2, 2, {var0, 0.0, 0.0, 1.0}), tolerance);

    // a training call memoizes D(mu_z, K_zz + jitter I) as p(u)
    const LatentDistribution memoized_prior = strategy.PriorDistribution();
    if (!CheckDoubleWithin(memoized_prior.covariance().data[0], k, tolerance)) {
      ++total_errors;
    }

    strategy.Train(false);
    const LatentDistribution eval_output = strategy.Call(inputs);
    total_errors += CheckBatchMatrixNear(eval_output.mean(), training_output.mean(), tolerance);
    total_errors += CheckBatchMatrixNear(eval_output.covariance(), training_output.covariance(), tolerance);
    total_errors += CheckCovarianceIsPsd(eval_output, 1.0e-6);
  }

  {
    VariationalStrategy strategy(model, inducing_points, MakeCholeskyDistribution(3, {}), false);
    const LatentDistribution seeded = strategy.Call(inducing_points);
    total_errors += CheckBatchMatrixNear(seeded.mean(), BatchMatrix({}, 3, 1, {1.0, 3.0, 5.0}), tolerance);
    strategy.SetParameters(parameters.data());

    const LatentDistribution output = strategy.Call(inputs);
    const double var0 = k + (0.25 - 1.0)/k;
    total_errors += CheckBatchMatrixNear(output.mean(), BatchMatrix({}, 2, 1, {3.0 - 1.0/std::sqrt(k), 11.0}), tolerance);
    total_errors += CheckBatchMatrixNear(output.covariance(), BatchMatrix({}, 2, 2, {var0, 0.0, 0.0, k}), tolerance);
    total_errors += CheckCovarianceIsPsd(output, 1.0e-6);

    // whitened KL against D(0, I): 1/2 (-log|S| - 3 + tr(S) + m^T m)
    const double kl_truth = 0.5*(-3.0*std::log(0.25) - 3.0 + 0.75 + (0.25 + 1.0 + 4.0));
    if (!CheckDoubleWithin(strategy.KlDivergence().data[0], kl_truth, tolerance)) {
      ++total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  Seeding happens once; KL reflects the prior memo of the current cache generation.
\endrst*/
SQ_WARN_UNUSED_RESULT int TestSeedingAndCache() {
  int total_errors = 0;
  UniformRandomGenerator uniform_generator(2718);
  const MockSparseRegressionData data(2, 10, 5, kNormalPower, &uniform_generator);

  UnwhitenedVariationalStrategy strategy(*data.prior, data.inducing_points, MakeCholeskyDistribution(5, {}));
  const LatentDistribution first = strategy.Call(data.train_inputs);
  const int num_parameters = strategy.GetNumberOfParameters();
  if (!CheckIntEquals(num_parameters, 5 + 15 + 2*5)) {
    ++total_errors;
  }

  // perturb q(u); a second call must not reseed it
  std::vector<double> parameters(num_parameters);
  strategy.GetParameters(parameters.data());
  parameters[0] += 1.0;
  strategy.SetParameters(parameters.data());
  const LatentDistribution second = strategy.Call(data.train_inputs);
  if (second.mean() == first.mean()) {
    SQ_ERROR_PRINTF("q(u) was seeded twice\n");
    ++total_errors;
  }
  std::vector<double> parameters_out(num_parameters);
  strategy.GetParameters(parameters_out.data());
  if (!CheckMatrixNormWithin(parameters_out.data(), parameters.data(), num_parameters, 1, 0.0)) {
    ++total_errors;
  }

  // the training call memoized D(mu_z, K_zz + 1e-6 I), which is tighter than q(u) = D(mu_z, K_zz + 1e-3 I)
  parameters[0] -= 1.0;
  strategy.SetParameters(parameters.data());
  strategy.Call(data.train_inputs);
  const double training_kl = strategy.KlDivergence().data[0];
  if (!(training_kl > 0.0)) {
    SQ_ERROR_PRINTF("KL against the memoized prior = %.18E, expected > 0\n", training_kl);
    ++total_errors;
  }

  // leaving training mode invalidates the memo; the fresh prior is exactly the seed
  const StrategyCache::GenerationType generation = strategy.cache().generation();
  strategy.Train(false);
  if (strategy.cache().generation() == generation || strategy.cache().NumFreshEntries() != 0) {
    ++total_errors;
  }
  if (!CheckDoubleWithin(strategy.KlDivergence().data[0], 0.0, 1.0e-8)) {
    ++total_errors;
  }

  // eval calls reuse the cached factor
  strategy.Call(data.train_inputs);
  const StrategyCache::GenerationType eval_generation = strategy.cache().generation();
  strategy.Call(data.train_inputs);
  if (strategy.cache().generation() != eval_generation || strategy.cache().GetMatrix(kCholeskyFactorKey) == nullptr) {
    SQ_ERROR_PRINTF("eval calls invalidated the cache\n");
    ++total_errors;
  }

  // training calls: diag(max(0, diag(K_xx - K_xz K_zz^-1 K_zx))) + K_xz K_zz^-1 S K_zz^-1 K_zx
  strategy.Train(true);
  const LatentDistribution training_output = strategy.Call(data.train_inputs);
  const int num_induc = data.num_inducing;
  const int num_data = data.num_train;
  const int num_total = num_induc + num_data;
  const BatchMatrix joint_covariance = data.prior->Forward(ConcatenateColumns(data.inducing_points, data.train_inputs)).covariance();
  std::vector<double> chol(num_induc*num_induc);
  std::vector<double> solve(num_induc*num_data);
  for (int j = 0; j < num_induc; ++j) {
    std::copy(joint_covariance.data.begin() + j*num_total, joint_covariance.data.begin() + j*num_total + num_induc, chol.begin() + j*num_induc);
  }
  AddDiagonalJitter(strategy.jitter_val(), num_induc, chol.data());
  if (ComputeCholeskyFactorL(num_induc, chol.data()) != 0) {
    SQ_ERROR_PRINTF("reference K_zz is not SPD\n");
    return total_errors + 1;
  }
  for (int j = 0; j < num_data; ++j) {
    double const * const column = joint_covariance.data.data() + (num_induc + j)*num_total;
    std::copy(column, column + num_induc, solve.begin() + j*num_induc);
  }
  CholeskyFactorLMatrixMatrixSolve(chol.data(), num_induc, num_data, solve.data());

  std::vector<double> expected(num_data*num_data, 0.0);
  for (int j = 0; j < num_data; ++j) {
    double const * const column = joint_covariance.data.data() + (num_induc + j)*num_total;
    const double schur_diagonal = column[num_induc + j] - DotProduct(column, solve.data() + j*num_induc, num_induc);
    expected[j*num_data + j] = std::max(schur_diagonal, 0.0);
  }
  std::vector<double> covariance_times_solve(num_induc*num_data);
  const BatchMatrix variational_covariance = strategy.VariationalDistribution().covariance();
  GeneralMatrixMatrixMultiply(variational_covariance.data.data(), 'N', solve.data(), 1.0, 0.0, num_induc, num_induc, num_data,
                              covariance_times_solve.data());
  GeneralMatrixMatrixMultiply(solve.data(), 'T', covariance_times_solve.data(), 1.0, 1.0, num_data, num_induc, num_data, expected.data());

  const BatchMatrix& covariance = training_output.covariance();
  if (!CheckMatrixNormWithin(covariance.data.data(), expected.data(), num_data, num_data, 1.0e-8)) {
    SQ_ERROR_PRINTF("training covariance does not match the clamped diagonal plus the q(u) term\n");
    ++total_errors;
  }
  for (int j = 0; j < num_data; ++j) {
    if (covariance.data[j*num_data + j] < 0.0) {
      SQ_ERROR_PRINTF("training variance %d = %.18E\n", j, covariance.data[j*num_data + j]);
      ++total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  ``Z = [0, 1, 2]``, ``k = 3 I`` (identity kernel), ``jitter_val = 0``, ``q(u) = \delta(0)`` (zero root), evaluated at
  ``x = [1, 5]``.  ``x_0 = z_1``, so ``K_xx - K_xz K_zz^{-1} K_zx`` is 0 at ``x_0`` in exact arithmetic.  In double
  precision ``3 - 3 ((3/\sqrt{3})/\sqrt{3}) = -8.9 \cdot 10^{-16}``: eval mode returns that value, training mode clamps it to 0.
\endrst*/
SQ_WARN_UNUSED_RESULT int TestTrainingVarianceClamp() {
  int total_errors = 0;
  const ProcessModel model(ZeroMean(), IdentityCovariance(1, 3.0));
  const BatchMatrix inducing_points = BuildEvenlySpacedPoints(0.0, 2.0, 3);
  const BatchMatrix inputs({}, 1, 2, {1.0, 5.0});

  UnwhitenedVariationalStrategy strategy(model, inducing_points,
                                         std::unique_ptr<VariationalDistributionInterface>(new DeltaVariationalDistribution(3, {})),
                                         false, 0.0);
  strategy.Call(inducing_points);

  const LatentDistribution training_output = strategy.Call(inputs);
  const BatchMatrix& training_covariance = training_output.covariance();
  if (!CheckDoubleWithin(training_covariance.data[0], 0.0, 0.0) || !CheckDoubleWithin(training_covariance.data[3], 3.0, 0.0) ||
      !CheckDoubleWithin(training_covariance.data[1], 0.0, 0.0) || !CheckDoubleWithin(training_covariance.data[2], 0.0, 0.0)) {
    SQ_ERROR_PRINTF("training covariance = [%.18E %.18E; %.18E %.18E]\n", training_covariance.data[0], training_covariance.data[2],
                    training_covariance.data[1], training_covariance.data[3]);
    ++total_errors;
  }
  total_errors += CheckBatchMatrixNear(training_output.mean(), BatchMatrix({}, 2, 1), 0.0);

  strategy.Train(false);
  const LatentDistribution eval_output = strategy.Call(inputs);
  const double eval_variance = eval_output.covariance().data[0];
  if (!(eval_variance < 0.0) || !CheckDoubleWithin(eval_variance, 0.0, 1.0e-14)) {
    SQ_ERROR_PRINTF("eval variance at x_0 = %.18E, expected a tiny negative value\n", eval_variance);
    ++total_errors;
  }
  if (!CheckDoubleWithin(training_covariance.data[0], std::max(eval_variance, 0.0), 0.0)) {
    ++total_errors;
  }

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestParametersAndBatchShapes() {
  int total_errors = 0;
  UniformRandomGenerator uniform_generator(1414);
  const MockSparseRegressionData data(1, 6, 3, kNormalPower, &uniform_generator);

  const ProcessModel batched_model({2}, ConstantMean(0.0), SquareExponential(1, 1.0, 0.7));
  VariationalStrategy strategy(batched_model, data.inducing_points, MakeCholeskyDistribution(3, {2}));
  total_errors += CheckBatchShapeEquals(strategy.batch_shape(), {2});

  const BatchMatrix batched_inputs = data.train_inputs.Unsqueeze(0, 3).Unsqueeze(1, 1);  // {3, 1}
  const LatentDistribution output = strategy.Call(batched_inputs);
  total_errors += CheckBatchShapeEquals(output.batch_shape(), {3, 2});
  if (!CheckIntEquals(output.num_data(), data.num_train)) {
    ++total_errors;
  }
  total_errors += CheckCovarianceIsPsd(output, 1.0e-8);

  // parameters: q(u) for both batch elements, then Z
  const int num_parameters = strategy.GetNumberOfParameters();
  if (!CheckIntEquals(num_parameters, 2*(3 + 6) + 3)) {
    ++total_errors;
  }
  std::vector<double> parameters(num_parameters);
  strategy.GetParameters(parameters.data());
  if (!CheckMatrixNormWithin(parameters.data() + 2*(3 + 6), data.inducing_points.data.data(), 3, 1, 0.0)) {
    ++total_errors;
  }

  // clones are deep
  std::unique_ptr<VariationalStrategyInterface> clone(strategy.Clone());
  parameters[num_parameters - 1] += 0.5;
  clone->SetParameters(parameters.data());
  if (!CheckDoubleWithin(strategy.inducing_points().data[2], data.inducing_points.data[2], 0.0)) {
    SQ_ERROR_PRINTF("setting a clone's parameters changed the original\n");
    ++total_errors;
  }
  std::vector<double> clone_parameters(num_parameters);
  clone->GetParameters(clone_parameters.data());
  if (!CheckMatrixNormWithin(clone_parameters.data(), parameters.data(), num_parameters, 1, 0.0)) {
    ++total_errors;
  }

  BatchMatrix moved_points(data.inducing_points);
  moved_points.data[0] += 0.1;
  strategy.SetInducingPoints(moved_points);
  if (strategy.inducing_points() != moved_points || strategy.cache().NumFreshEntries() != 0) {
    ++total_errors;
  }
  total_errors += CheckThrows<InvalidValueException<int> >("SetInducingPoints with a new size", [&strategy]() {
      strategy.SetInducingPoints(BatchMatrix({}, 1, 4));
    });

  return total_errors;
}

/*!\rst
  Conjugate gradients (``M > max_exact_cholesky_size``) and the mean-only path agree with the Cholesky path.
\endrst*/
SQ_WARN_UNUSED_RESULT int TestSolverPaths() {
  int total_errors = 0;
  UniformRandomGenerator uniform_generator(8675);
  const MockSparseRegressionData data(1, 7, 4, kNormalPower, &uniform_generator);
  const BatchMatrix inducing_points = BuildEvenlySpacedPoints(-1.5, 1.5, 4);

  VariationalSettings cholesky_settings;
  cholesky_settings.fast_computations = false;
  VariationalSettings cg_settings;
  cg_settings.fast_computations = true;
  cg_settings.max_exact_cholesky_size = 2;
  cg_settings.max_cg_iterations = 50;

  UnwhitenedVariationalStrategy cholesky_strategy(*data.prior, inducing_points, MakeCholeskyDistribution(4, {}), true, kDefaultJitter, cholesky_settings);
  UnwhitenedVariationalStrategy cg_strategy(*data.prior, inducing_points, MakeCholeskyDistribution(4, {}), true, kDefaultJitter, cg_settings);

  // move q(u) away from the prior so the mean solve matters
  cholesky_strategy.Call(inducing_points);
  std::vector<double> parameters(cholesky_strategy.GetNumberOfParameters());
  cholesky_strategy.GetParameters(parameters.data());
  for (int i = 0; i < 4; ++i) {
    parameters[i] += 0.3*(i - 1.5);
  }
  cholesky_strategy.SetParameters(parameters.data());
  cg_strategy.Call(inducing_points);
  cg_strategy.SetParameters(parameters.data());

  cholesky_strategy.Train(false);
  cg_strategy.Train(false);
  const LatentDistribution cholesky_output = cholesky_strategy.Call(data.train_inputs);
  const LatentDistribution cg_output = cg_strategy.Call(data.train_inputs);
  total_errors += CheckBatchMatrixNear(cg_output.mean(), cholesky_output.mean(), 1.0e-6);
  total_errors += CheckBatchMatrixNear(cg_output.covariance(), cholesky_output.covariance(), 1.0e-6);
  if (cg_strategy.cache().GetMatrix(kCholeskyFactorKey) != nullptr) {
    SQ_ERROR_PRINTF("CG path factored K_zz\n");
    ++total_errors;
  }

  cholesky_strategy.mutable_settings().skip_posterior_variances = true;
  const LatentDistribution mean_only = cholesky_strategy.Call(data.train_inputs);
  total_errors += CheckBatchMatrixNear(mean_only.mean(), cholesky_output.mean(), 1.0e-10);
  total_errors += CheckBatchMatrixNear(mean_only.covariance(), BatchMatrix({}, data.num_train, data.num_train), 0.0);
  if (cholesky_strategy.cache().GetMatrix(kMeanCacheKey) == nullptr) {
    return total_errors + 1;
  }

  // the mean solve is reused within a generation, even after switching to a one-step CG solver
  const BatchMatrix first_solve(*cholesky_strategy.cache().GetMatrix(kMeanCacheKey));
  VariationalSettings one_step_cg_settings(cholesky_settings);
  one_step_cg_settings.fast_computations = true;
  one_step_cg_settings.max_exact_cholesky_size = 2;
  one_step_cg_settings.max_cg_iterations = 1;
  one_step_cg_settings.skip_posterior_variances = true;
  cholesky_strategy.mutable_settings() = one_step_cg_settings;
  const BatchMatrix shifted_inputs({}, 1, 3, {-0.9, 0.15, 1.2});
  const LatentDistribution reused = cholesky_strategy.Call(shifted_inputs);
  total_errors += CheckBatchMatrixNear(*cholesky_strategy.cache().GetMatrix(kMeanCacheKey), first_solve, 0.0);

  cholesky_strategy.mutable_settings() = cholesky_settings;
  cholesky_strategy.mutable_settings().skip_posterior_variances = true;
  cholesky_strategy.ClearCache();
  total_errors += CheckBatchMatrixNear(reused.mean(), cholesky_strategy.Call(shifted_inputs).mean(), 1.0e-10);

  // a new generation solves again, now with the truncated CG
  cholesky_strategy.mutable_settings() = one_step_cg_settings;
  cholesky_strategy.ClearCache();
  const LatentDistribution resolved = cholesky_strategy.Call(data.train_inputs);
  double max_difference = 0.0;
  for (int i = 0; i < data.num_train; ++i) {
    max_difference = std::max(max_difference, std::fabs(resolved.mean().data[i] - cholesky_output.mean().data[i]));
  }
  if (max_difference < 1.0e-8) {
    SQ_ERROR_PRINTF("one CG iteration reproduced the exact mean (max difference %.18E)\n", max_difference);
    ++total_errors;
  }

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestPseudoPointsAndErrors() {
  int total_errors = 0;
  UniformRandomGenerator uniform_generator(5772);
  const MockSparseRegressionData data(1, 6, 3, kNormalPower, &uniform_generator);

  {
    // well separated, so that K_zz - S stays comfortably PSD
    const BatchMatrix inducing_points = BuildEvenlySpacedPoints(-1.5, 1.5, 3);
    UnwhitenedVariationalStrategy strategy(*data.prior, inducing_points, MakeCholeskyDistribution(3, {}));
    if (!strategy.has_fantasy_strategy()) {
      ++total_errors;
    }
    strategy.Call(inducing_points);
    std::vector<double> parameters(strategy.GetNumberOfParameters());
    strategy.GetParameters(parameters.data());
    // shrink L so that S is well inside K_zz
    for (int i = 3; i < 9; ++i) {
      parameters[i] *= 0.5;
    }
    strategy.SetParameters(parameters.data());

    const std::pair<BatchMatrix, BatchMatrix> pseudo_points = strategy.PseudoPoints();
    if (!CheckIntEquals(pseudo_points.first.num_rows, 3) || !CheckIntEquals(pseudo_points.second.num_rows, 3)) {
      ++total_errors;
    }
    const LatentDistribution pseudo_distribution(kNormalPower, pseudo_points.second, pseudo_points.first);
    total_errors += CheckCovarianceIsPsd(pseudo_distribution, 1.0e-10);
    std::vector<double> transpose(9);
    MatrixTranspose(pseudo_points.first.data.data(), 3, 3, transpose.data());
    if (!CheckMatrixNormWithin(transpose.data(), pseudo_points.first.data.data(), 3, 3, 1.0e-12)) {
      ++total_errors;
    }

    // memoized within a generation
    const std::pair<BatchMatrix, BatchMatrix> pseudo_points_again = strategy.PseudoPoints();
    if (pseudo_points_again.first != pseudo_points.first || strategy.cache().GetMatrix(kPseudoPointsMeanKey) == nullptr) {
      ++total_errors;
    }
  }

  {
    VariationalStrategy whitened(*data.prior, data.inducing_points, MakeCholeskyDistribution(3, {}));
    if (whitened.has_fantasy_strategy()) {
      ++total_errors;
    }
    total_errors += CheckThrows<NotImplementedException>("whitened pseudo points", [&whitened]() {
        return whitened.PseudoPoints();
      });

    UnwhitenedVariationalStrategy mean_field(*data.prior, data.inducing_points,
                                             std::unique_ptr<VariationalDistributionInterface>(new MeanFieldVariationalDistribution(3, {})));
    total_errors += CheckThrows<NotImplementedException>("mean field pseudo points", [&mean_field]() {
        return mean_field.PseudoPoints();
      });
  }

  total_errors += CheckThrows<InvalidValueException<int> >("inducing point dimension mismatch", [&data]() {
      VariationalStrategy strategy(*data.prior, BatchMatrix({}, 2, 3), MakeCholeskyDistribution(3, {}));
    });
  total_errors += CheckThrows<InvalidValueException<int> >("inducing point count mismatch", [&data]() {
      VariationalStrategy strategy(*data.prior, data.inducing_points, MakeCholeskyDistribution(4, {}));
    });
  total_errors += CheckThrows<LowerBoundException<double> >("negative jitter", [&data]() {
      UnwhitenedVariationalStrategy strategy(*data.prior, data.inducing_points, MakeCholeskyDistribution(3, {}), true, -0.5);
    });
  total_errors += CheckThrows<PreconditionException>("missing variational distribution", [&data]() {
      UnwhitenedVariationalStrategy strategy(*data.prior, data.inducing_points, std::unique_ptr<VariationalDistributionInterface>());
    });

  return total_errors;
}

/*!\rst
  ``k = I`` (identity kernel) at ``Z = [0, 1]`` and ``jitter_val = 0``, with ``S = s_1 q_1 q_1^T + s_2 q_2 q_2^T``,
  ``q_1 = (0.6, 0.8)``, ``q_2 = (-0.8, 0.6)``.  Then ``R = I - S`` shares the eigenvectors of ``S`` and

  .. math:: C = \sum_i \frac{s_i}{1 - s_i} q_i q_i^T, \quad \tilde{m} = \sum_i \frac{q_i^T m}{1 - s_i} q_i.

  ``s = (0.5, 0.25)`` gives a PD ``C`` that is returned through its Cholesky factor.  ``s = (0.5, 2)`` gives ``C``
  eigenvalues ``(1, -2)``; the eigen repair drops the negative direction, leaving ``q_1 q_1^T``.
\endrst*/
SQ_WARN_UNUSED_RESULT int TestPseudoPointsClosedForm() {
  int total_errors = 0;
  const ProcessModel model(ZeroMean(), IdentityCovariance(1, 1.0));
  const BatchMatrix inducing_points = BuildEvenlySpacedPoints(0.0, 1.0, 2);
  const double q[2][2] = {{0.6, 0.8}, {-0.8, 0.6}};
  const std::vector<double> variational_mean = {1.0, 0.0};

  const double eigenvalue_pairs[2][2] = {{0.5, 0.25}, {0.5, 2.0}};
  for (const auto& s : eigenvalue_pairs) {
    UnwhitenedVariationalStrategy strategy(model, inducing_points, MakeCholeskyDistribution(2, {}), false, 0.0);
    strategy.Call(inducing_points);

    // S, and the repaired C and m~ from the closed forms above
    double variational_covariance[4] = {0.0};
    std::vector<double> expected_covariance(4, 0.0);
    std::vector<double> expected_mean(2, 0.0);
    for (int k = 0; k < 2; ++k) {
      const double projected_mean = q[k][0]*variational_mean[0] + q[k][1]*variational_mean[1];
      const double covariance_eigenvalue = std::max(s[k]/(1.0 - s[k]), 0.0);
      for (int j = 0; j < 2; ++j) {
        expected_mean[j] += projected_mean/(1.0 - s[k])*q[k][j];
        for (int i = 0; i < 2; ++i) {
          variational_covariance[j*2 + i] += s[k]*q[k][i]*q[k][j];
          expected_covariance[j*2 + i] += covariance_eigenvalue*q[k][i]*q[k][j];
        }
      }
    }
    const double chol_00 = std::sqrt(variational_covariance[0]);
    const double chol_10 = variational_covariance[1]/chol_00;
    const double chol_11 = std::sqrt(variational_covariance[3] - chol_10*chol_10);
    const std::vector<double> parameters = {variational_mean[0], variational_mean[1], chol_00, chol_10, chol_11};
    if (!CheckIntEquals(strategy.GetNumberOfParameters(), 5)) {
      ++total_errors;
      continue;
    }
    strategy.SetParameters(parameters.data());
    total_errors += CheckBatchMatrixNear(strategy.VariationalDistribution().covariance(),
                                         BatchMatrix({}, 2, 2, std::vector<double>(variational_covariance, variational_covariance + 4)),
                                         1.0e-14);

    const std::pair<BatchMatrix, BatchMatrix> pseudo_points = strategy.PseudoPoints();
    total_errors += CheckBatchMatrixNear(pseudo_points.first, BatchMatrix({}, 2, 2, expected_covariance), 1.0e-10);
    total_errors += CheckBatchMatrixNear(pseudo_points.second, BatchMatrix({}, 2, 1, expected_mean), 1.0e-10);
    total_errors += CheckCovarianceIsPsd(LatentDistribution(kNormalPower, pseudo_points.second, pseudo_points.first), 1.0e-12);

    if (s[1] > 1.0) {
      // indefinite C: only q_1 q_1^T survives the repair
      total_errors += CheckBatchMatrixNear(pseudo_points.first, BatchMatrix({}, 2, 2, {0.36, 0.48, 0.48, 0.64}), 1.0e-10);
      total_errors += CheckBatchMatrixNear(pseudo_points.second, BatchMatrix({}, 2, 1, {0.08, 1.44}), 1.0e-10);
    }
  }

  return total_errors;
}

}  // end unnamed namespace

int RunVariationalStrategyTests() {
  int total_errors = 0;
  int current_errors = 0;

  current_errors = TestDegenerateCalls();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("degenerate strategy calls failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestIdentityKernelClosedForm();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("identity kernel closed forms failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestSeedingAndCache();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("seeding and caching failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestTrainingVarianceClamp();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("training variance clamp failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestParametersAndBatchShapes();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("parameters and batch shapes failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestSolverPaths();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("solver paths failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestPseudoPointsClosedForm();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("pseudo point closed forms failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestPseudoPointsAndErrors();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("pseudo points and errors failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  return total_errors;
}

}  // end namespace sparse_qep
