/*!
  \file qep_deep_regression_demo.cpp
  \rst
  ``sparse_qep/cpp/qep_deep_regression_demo.cpp``

  Demo of the two main consumers of the variational strategies:

  1. A two-layer deep Q-Exponential process (qep_deep.hpp): a hidden layer mapping ``dim`` inputs to ``kHiddenDims``
     processes feeds a single squashed output process.  Each forward pass propagates ``num_likelihood_samples``
     Monte-Carlo samples through the layers; we print the sample-averaged predictive mean and variance.
  2. A fantasy update (qep_model.hpp): an unwhitened single-layer model is conditioned on the training data through
     its pseudo points, giving an exact conditional model whose predictions we compare against the true function.

  The training data is random (see MockSparseRegressionData in qep_test_utils.hpp): ``y = sin(\sum_d x_d)``.
  Variational parameters keep their seeded values; optimizing the ELBO is left to the caller.
\endrst*/

#include <cmath>
#include <cstdio>

#include <memory>
#include <utility>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_covariance.hpp"
#include "qep_deep.hpp"
#include "qep_distribution.hpp"
#include "qep_likelihood.hpp"
#include "qep_logging.hpp"
#include "qep_mean.hpp"
#include "qep_model.hpp"
#include "qep_process_model.hpp"
#include "qep_random.hpp"
#include "qep_settings.hpp"
#include "qep_test_utils.hpp"
#include "qep_variational_distribution.hpp"
#include "qep_variational_strategy.hpp"

using namespace sparse_qep;  // NOLINT, no external linkage in this file

int main() {
  // feel free to change these (and recompile) as you explore
  static const int dim = 2;  // > 0
  static const int num_train = 40;  // > 0
  static const int num_inducing = 10;  // 0 < num_inducing <= num_train
  static const int num_test = 5;  // > 0
  static const int kHiddenDims = 3;  // > 0
  // 2 gives Gaussian processes; other positive values give Q-Exponential processes (1 is Laplace-like)
  static const double power = 1.0;
  static const double noise_variance = 1.0e-2;

  UniformRandomGenerator uniform_generator(314);  // repeatable results
  NormalRNG normal_rng(271);

  MockSparseRegressionData data(dim, num_train, num_inducing, power, &uniform_generator);

  BatchMatrix test_points(BatchShape(), dim, num_test);
  ComputeUniformRandomValues(-1.5, 1.5, dim*num_test, &uniform_generator, test_points.data.data());
  std::vector<double> test_truth(num_test);
  for (int i = 0; i < num_test; ++i) {
    double coordinate_sum = 0.0;
    for (int d = 0; d < dim; ++d) {
      coordinate_sum += test_points.data[i*dim + d];
    }
    test_truth[i] = std::sin(coordinate_sum);
  }

  // 1. deep model
  VariationalSettings settings;
  settings.num_likelihood_samples = 8;

  const BatchShape hidden_shape = {kHiddenDims};
  std::unique_ptr<VariationalStrategyInterface> hidden_strategy(
      new VariationalStrategy(ProcessModel(hidden_shape, ConstantMean(0.0), SquareExponential(dim, 1.0, 1.0), power),
                              data.inducing_points,
                              std::unique_ptr<VariationalDistributionInterface>(new CholeskyVariationalDistribution(num_inducing, hidden_shape, power)),
                              true, kDefaultJitter, settings));

  BatchMatrix output_inducing_points(BatchShape(), kHiddenDims, num_inducing);
  ComputeUniformRandomValues(-1.0, 1.0, kHiddenDims*num_inducing, &uniform_generator, output_inducing_points.data.data());
  std::unique_ptr<VariationalStrategyInterface> output_strategy(
      new VariationalStrategy(ProcessModel(ConstantMean(0.0), SquareExponential(kHiddenDims, 1.0, 1.0), power),
                              output_inducing_points,
                              std::unique_ptr<VariationalDistributionInterface>(new CholeskyVariationalDistribution(num_inducing, BatchShape(), power)),
                              true, kDefaultJitter, settings));

  DeepQepModel deep_model;
  deep_model.AddLayer(std::unique_ptr<DeepQepLayer>(new DeepQepLayer(std::move(hidden_strategy), dim, kHiddenDims)));
  deep_model.AddLayer(std::unique_ptr<DeepQepLayer>(new DeepQepLayer(std::move(output_strategy), kHiddenDims, kSquashedOutputDims)));

  const LatentDistribution deep_output = deep_model.Forward(test_points, &normal_rng, true);
  const QExponentialLikelihood likelihood(noise_variance, power);
  const BatchMatrix deep_variance = likelihood.Marginal(deep_output).Variance();

  std::printf("deep model: %d layers, %d variational parameters, KL = %.6E\n", deep_model.num_layers(),
              deep_model.GetNumberOfParameters(), deep_model.KlDivergence());
  std::printf("output batch shape: ");
  PrintBatchShape(deep_output.batch_shape());

  const int num_samples = deep_output.batch_shape()[0];
  for (int i = 0; i < num_test; ++i) {
    double mean = 0.0;
    double variance = 0.0;
    for (int s = 0; s < num_samples; ++s) {
      mean += deep_output.mean().element(s)[i];
      variance += deep_variance.element(s)[i];
    }
    std::printf("  x_%d: sample-averaged mean = %+.4f, variance = %.4f\n", i, mean/num_samples, variance/num_samples);
  }

  // 2. fantasy update of a single-layer model
  std::unique_ptr<VariationalStrategyInterface> strategy(
      new UnwhitenedVariationalStrategy(*data.prior, data.inducing_points,
                                        std::unique_ptr<VariationalDistributionInterface>(new CholeskyVariationalDistribution(num_inducing, BatchShape(), power))));
  // a training-mode call seeds q(u) from the prior
  const LatentDistribution train_output = strategy->Call(data.train_inputs);
  SQ_VERBOSE_PRINTF("seeded q(u); q(f) over %d training points\n", train_output.num_data());
  strategy->Train(false);

  ApproximateModel model(std::move(strategy), likelihood);
  std::unique_ptr<ModelInterface> fantasy_model = model.GetFantasyModel(data.train_inputs, data.train_targets);
  const LatentDistribution prediction = fantasy_model->Call(test_points);
  const BatchMatrix prediction_variance = prediction.Variance();

  std::printf("fantasy model conditioned on %d points (pseudo + training):\n", fantasy_model->train_inputs().num_cols);
  double max_error = 0.0;
  for (int i = 0; i < num_test; ++i) {
    const double error = std::fabs(prediction.mean().data[i] - test_truth[i]);
    max_error = std::fmax(max_error, error);
    std::printf("  x_%d: mean = %+.4f, truth = %+.4f, variance = %.3E\n", i, prediction.mean().data[i], test_truth[i],
                prediction_variance.data[i]);
  }
  std::printf("max |mean - truth| = %.4E\n", max_error);

  return 0;
}
