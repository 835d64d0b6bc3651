/*!
  \file qep_model_test.cpp
  \rst
  Routines to test exact conditioning, likelihoods, fantasy models and model lists.

  Exact posteriors use an identity kernel (``k(x, x') = 2`` iff ``x == x'``) so that every quantity has a short closed
  form.  The pseudo-point test checks the defining property of pseudo observations: conditioning the prior on them
  reproduces ``q(f)``, so a fantasy observation with (practically) infinite noise changes nothing.
\endrst*/

#include "qep_model_test.hpp"

#include <cmath>

#include <memory>
#include <utility>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_covariance.hpp"
#include "qep_distribution.hpp"
#include "qep_exact_process.hpp"
#include "qep_exception.hpp"
#include "qep_likelihood.hpp"
#include "qep_logging.hpp"
#include "qep_mean.hpp"
#include "qep_model.hpp"
#include "qep_model_list.hpp"
#include "qep_process_model.hpp"
#include "qep_test_utils.hpp"
#include "qep_variational_distribution.hpp"
#include "qep_variational_strategy.hpp"

namespace sparse_qep {

namespace {

/*!\rst
  Prior ``k(x, x') = 2 [x == x']``, zero mean, observed at ``X = [0, 1]`` with ``y = [1, 3]`` and noise ``0.5 I``.
\endrst*/
std::unique_ptr<ExactProcess> MakeIdentityProcess(double power) {
  const ProcessModel prior(ConstantMean(0.0), IdentityCovariance(1, 2.0), power);
  const BatchMatrix points({}, 1, 2, {0.0, 1.0});
  const BatchMatrix values({}, 2, 1, {1.0, 3.0});
  const BatchMatrix noise({}, 2, 2, {0.5, 0.0, 0.0, 0.5});
  return std::unique_ptr<ExactProcess>(new ExactProcess(prior, points, values, noise));
}

SQ_WARN_UNUSED_RESULT int TestExactProcess() {
  int total_errors = 0;
  std::unique_ptr<ExactProcess> process = MakeIdentityProcess(kNormalPower);

  // K = 2.5 I: mean = 2/2.5 * y at observed points, 0 elsewhere; variance 2 - 4/2.5 or 2
  const BatchMatrix points_to_sample({}, 1, 2, {0.0, 5.0});
  const LatentDistribution posterior = process->ComputePosterior(points_to_sample);
  total_errors += CheckBatchMatrixNear(posterior.mean(), BatchMatrix({}, 2, 1, {0.8, 0.0}), 1.0e-14);
  total_errors += CheckBatchMatrixNear(posterior.covariance(), BatchMatrix({}, 2, 2, {0.4, 0.0, 0.0, 2.0}), 1.0e-14);

  // new observation at 5 with unit noise: mean 2/3 * 4, variance 2 - 4/3
  process->AddPointsToProcess(BatchMatrix({}, 1, 1, {5.0}), BatchMatrix({}, 1, 1, {4.0}), BatchMatrix({}, 1, 1, {1.0}));
  if (!CheckIntEquals(process->num_sampled(), 3)) {
    ++total_errors;
  }
  const LatentDistribution updated = process->ComputePosterior(points_to_sample);
  total_errors += CheckBatchMatrixNear(updated.mean(), BatchMatrix({}, 2, 1, {0.8, 8.0/3.0}), 1.0e-14);
  total_errors += CheckBatchMatrixNear(updated.Variance(), BatchMatrix({}, 2, 1, {0.4, 2.0/3.0}), 1.0e-14);

  // the posterior stays in the prior's family
  std::unique_ptr<ExactProcess> q_exponential_process = MakeIdentityProcess(1.0);
  if (!CheckDoubleWithin(q_exponential_process->ComputePosterior(points_to_sample).power(), 1.0, 0.0)) {
    ++total_errors;
  }

  // batched data broadcasts against an unbatched prior
  const ProcessModel prior(ConstantMean(0.0), IdentityCovariance(1, 2.0));
  const BatchMatrix batched_points({2}, 1, 1, {0.0, 1.0});
  const BatchMatrix batched_values({2}, 1, 1, {1.0, -1.0});
  const ExactProcess batched_process(prior, batched_points, batched_values, BatchMatrix({}, 1, 1, {0.5}));
  total_errors += CheckBatchShapeEquals(batched_process.batch_shape(), {2});
  const LatentDistribution batched_posterior = batched_process.ComputePosterior(BatchMatrix({}, 1, 1, {1.0}));
  total_errors += CheckBatchMatrixNear(batched_posterior.mean(), BatchMatrix({2}, 1, 1, {0.0, -0.8}), 1.0e-14);

  total_errors += CheckThrows<InvalidValueException<int> >("one value per point", [&prior]() {
      ExactProcess bad(prior, BatchMatrix({}, 1, 2, {0.0, 1.0}), BatchMatrix({}, 3, 1), BatchMatrix({}, 2, 2));
    });
  total_errors += CheckThrows<InvalidValueException<int> >("prediction dimension", [&process]() {
      return process->ComputePosterior(BatchMatrix({}, 2, 1));
    });

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestLikelihoods() {
  int total_errors = 0;
  const LatentDistribution function_distribution(kNormalPower, BatchMatrix({}, 2, 1, {0.0, 1.0}),
                                                 BatchMatrix({}, 2, 2, {3.0, 0.0, 0.0, 0.0}));

  const GaussianLikelihood gaussian(0.25);
  const LatentDistribution noisy = gaussian.Marginal(function_distribution);
  total_errors += CheckBatchMatrixNear(noisy.covariance(), BatchMatrix({}, 2, 2, {3.25, 0.0, 0.0, 0.25}), 1.0e-15);
  total_errors += CheckBatchMatrixNear(noisy.mean(), function_distribution.mean(), 0.0);
  if (!gaussian.is_conjugate() || gaussian.family() != DistributionFamily::kNormal) {
    ++total_errors;
  }

  const QExponentialLikelihood q_exponential(0.1, 1.0);
  if (!q_exponential.is_conjugate() || q_exponential.family() != DistributionFamily::kQExponential) {
    ++total_errors;
  }

  // p = Phi(mu / sqrt(1 + sigma^2)): Phi(0) and Phi(1)
  const BernoulliLikelihood bernoulli;
  const LatentDistribution probabilities = bernoulli.Marginal(function_distribution);
  const double phi_one = 0.8413447460685429;
  total_errors += CheckBatchMatrixNear(probabilities.mean(), BatchMatrix({}, 2, 1, {0.5, phi_one}), 1.0e-12);
  total_errors += CheckBatchMatrixNear(probabilities.Variance(), BatchMatrix({}, 2, 1, {0.25, phi_one*(1.0 - phi_one)}), 1.0e-12);
  if (bernoulli.is_conjugate()) {
    ++total_errors;
  }

  total_errors += CheckThrows<LowerBoundException<double> >("negative noise", []() {
      GaussianLikelihood bad(-1.0);
    });
  total_errors += CheckThrows<LowerBoundException<double> >("non-positive likelihood power", []() {
      QExponentialLikelihood bad(0.1, 0.0);
    });

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestExactConditionalModel() {
  int total_errors = 0;
  ExactConditionalModel model(*MakeIdentityProcess(kNormalPower), GaussianLikelihood(0.5));
  const BatchMatrix points_to_sample({}, 1, 2, {0.0, 5.0});

  // prior ignores the data; the likelihood adds its noise
  total_errors += CheckBatchMatrixNear(model.Forward(points_to_sample).covariance(), BatchMatrix({}, 2, 2, {2.0, 0.0, 0.0, 2.0}), 0.0);
  total_errors += CheckBatchMatrixNear(model.Likelihood(model.Call(points_to_sample)).Variance(), BatchMatrix({}, 2, 1, {0.9, 2.5}), 1.0e-14);

  // fantasy at 5 with the likelihood's noise (0.5): mean 2/2.5 * 4
  std::unique_ptr<ModelInterface> fantasy_model = model.GetFantasyModel(BatchMatrix({}, 1, 1, {5.0}), BatchMatrix({}, 1, 1, {4.0}));
  total_errors += CheckBatchMatrixNear(fantasy_model->Call(points_to_sample).mean(), BatchMatrix({}, 2, 1, {0.8, 3.2}), 1.0e-14);
  if (!CheckIntEquals(fantasy_model->train_inputs().num_cols, 3) || !CheckIntEquals(model.train_inputs().num_cols, 2)) {
    ++total_errors;
  }

  // explicit noise overrides the likelihood's
  std::unique_ptr<ModelInterface> exact_fantasy = model.GetFantasyModel(BatchMatrix({}, 1, 1, {5.0}), BatchMatrix({}, 1, 1, {4.0}), 0.0);
  total_errors += CheckBatchMatrixNear(exact_fantasy->Call(points_to_sample).mean(), BatchMatrix({}, 2, 1, {0.8, 4.0}), 1.0e-14);

  total_errors += CheckThrows<LowerBoundException<double> >("negative fantasy noise", [&model]() {
      return model.GetFantasyModel(BatchMatrix({}, 1, 1, {5.0}), BatchMatrix({}, 1, 1, {4.0}), -2.0);
    });
  ExactConditionalModel classifier(*MakeIdentityProcess(kNormalPower), BernoulliLikelihood());
  total_errors += CheckThrows<NotImplementedException>("fantasy with a non-conjugate likelihood", [&classifier]() {
      return classifier.GetFantasyModel(BatchMatrix({}, 1, 1, {5.0}), BatchMatrix({}, 1, 1, {1.0}));
    });

  return total_errors;
}

/*!\rst
  Unwhitened strategy on ``Z = [-2, 0, 2]`` with ``m = [0.3, -0.2, 0.5]`` and ``S = 0.25 I``; ``K_zz - S`` is well
  conditioned so the pseudo points are accurate.
\endrst*/
std::unique_ptr<ApproximateModel> MakeApproximateModel(const LikelihoodInterface& likelihood) {
  const ProcessModel prior(ConstantMean(0.0), SquareExponential(1, 1.0, 1.0));
  const BatchMatrix inducing_points({}, 1, 3, {-2.0, 0.0, 2.0});
  std::unique_ptr<VariationalStrategyInterface> strategy(
      new UnwhitenedVariationalStrategy(prior, inducing_points,
                                        std::unique_ptr<VariationalDistributionInterface>(new CholeskyVariationalDistribution(3, BatchShape())),
                                        false, 1.0e-8));
  // seed q(u) once so that our parameters are not overwritten later
  const LatentDistribution seeded = strategy->Call(inducing_points);
  SQ_VERBOSE_PRINTF("seeded q(u) over %d inducing points\n", seeded.num_data());

  const std::vector<double> parameters = {0.3, -0.2, 0.5, 0.5, 0.0, 0.0, 0.5, 0.0, 0.5};
  strategy->SetParameters(parameters.data());
  strategy->Train(false);
  return std::unique_ptr<ApproximateModel>(new ApproximateModel(std::move(strategy), likelihood));
}

SQ_WARN_UNUSED_RESULT int TestApproximateModelFantasy() {
  int total_errors = 0;
  std::unique_ptr<ApproximateModel> model = MakeApproximateModel(GaussianLikelihood(0.1));
  const BatchMatrix test_points({}, 1, 3, {-1.0, 0.5, 3.0});
  const LatentDistribution variational_posterior = model->Call(test_points);

  // a fantasy with (practically) infinite noise carries no information
  const BatchMatrix fantasy_point({}, 1, 1, {1.0});
  const BatchMatrix fantasy_target({}, 1, 1, {7.0});
  std::unique_ptr<ModelInterface> uninformed = model->GetFantasyModel(fantasy_point, fantasy_target, 1.0e12);
  const LatentDistribution uninformed_posterior = uninformed->Call(test_points);
  total_errors += CheckBatchMatrixNear(uninformed_posterior.mean(), variational_posterior.mean(), 1.0e-4);
  total_errors += CheckBatchMatrixNear(uninformed_posterior.covariance(), variational_posterior.covariance(), 1.0e-4);

  // a noiseless fantasy pins the posterior at its point
  std::unique_ptr<ModelInterface> pinned = model->GetFantasyModel(fantasy_point, fantasy_target, 1.0e-8);
  const LatentDistribution pinned_posterior = pinned->Call(fantasy_point);
  if (!CheckDoubleWithin(pinned_posterior.mean().data[0], 7.0, 1.0e-3) ||
      !CheckDoubleWithin(pinned_posterior.covariance().data[0], 0.0, 1.0e-5)) {
    ++total_errors;
  }
  // pseudo points (3) plus the fantasy point; the source model is unchanged
  if (!CheckIntEquals(pinned->train_inputs().num_cols, 4) || !CheckIntEquals(model->train_inputs().num_cols, 0)) {
    ++total_errors;
  }

  std::unique_ptr<ApproximateModel> classifier = MakeApproximateModel(BernoulliLikelihood());
  total_errors += CheckThrows<NotImplementedException>("approximate fantasy with a non-conjugate likelihood", [&]() {
      return classifier->GetFantasyModel(fantasy_point, fantasy_target);
    });

  total_errors += CheckThrows<InvalidValueException<int> >("train data sizes", [&model]() {
      model->SetTrainData(BatchMatrix({}, 1, 3), BatchMatrix({}, 2, 1));
    });
  model->SetTrainData(BatchMatrix({}, 1, 2, {0.0, 1.0}), BatchMatrix({}, 2, 1, {0.5, 0.25}));
  std::unique_ptr<ModelInterface> model_copy(model->Clone());
  total_errors += CheckBatchMatrixNear(model_copy->train_targets(), model->train_targets(), 0.0);

  total_errors += CheckThrows<PreconditionException>("null strategy", []() {
      ApproximateModel bad(std::unique_ptr<VariationalStrategyInterface>(), GaussianLikelihood(0.1));
    });

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestIndependentModelList() {
  int total_errors = 0;
  IndependentModelList::ModelList models;
  models.emplace_back(new ExactConditionalModel(*MakeIdentityProcess(kNormalPower), GaussianLikelihood(0.5)));
  models.emplace_back(MakeApproximateModel(GaussianLikelihood(0.1)).release());
  IndependentModelList model_list(std::move(models));
  if (!CheckIntEquals(model_list.num_models(), 2)) {
    ++total_errors;
  }

  const std::vector<BatchMatrix> inputs = {BatchMatrix({}, 1, 2, {0.0, 5.0}), BatchMatrix({}, 1, 1, {0.5})};
  const std::vector<LatentDistribution> posteriors = model_list.Call(inputs);
  if (!CheckIntEquals(posteriors.size(), 2) || !CheckIntEquals(posteriors[0].num_data(), 2) || !CheckIntEquals(posteriors[1].num_data(), 1)) {
    ++total_errors;
  }
  total_errors += CheckBatchMatrixNear(posteriors[0].mean(), BatchMatrix({}, 2, 1, {0.8, 0.0}), 1.0e-14);
  total_errors += CheckBatchMatrixNear(posteriors[1].mean(), model_list.mutable_model(1).Call(inputs[1]).mean(), 0.0);

  const std::vector<LatentDistribution> priors = model_list.Forward(inputs);
  total_errors += CheckBatchMatrixNear(priors[0].covariance(), model_list.ForwardI(0, inputs[0]).covariance(), 0.0);
  total_errors += CheckBatchMatrixNear(model_list.LikelihoodI(0, posteriors[0]).Variance(), BatchMatrix({}, 2, 1, {0.9, 2.5}), 1.0e-14);

  // per-model fantasy noise; the first model uses its likelihood's
  const std::vector<BatchMatrix> fantasy_inputs = {BatchMatrix({}, 1, 1, {5.0}), BatchMatrix({}, 1, 1, {1.0})};
  const std::vector<BatchMatrix> fantasy_targets = {BatchMatrix({}, 1, 1, {4.0}), BatchMatrix({}, 1, 1, {7.0})};
  const IndependentModelList fantasy_list = model_list.GetFantasyModel(fantasy_inputs, fantasy_targets, {kLikelihoodNoise, 1.0e-8});
  const std::vector<BatchMatrix> fantasy_train_inputs = fantasy_list.train_inputs();
  const std::vector<BatchMatrix> source_train_inputs = model_list.train_inputs();
  if (!CheckIntEquals(fantasy_train_inputs[0].num_cols, 3) || !CheckIntEquals(fantasy_train_inputs[1].num_cols, 4) ||
      !CheckIntEquals(source_train_inputs[0].num_cols, 2) || !CheckIntEquals(source_train_inputs[1].num_cols, 0)) {
    ++total_errors;
  }
  IndependentModelList fantasy_copy(fantasy_list);
  total_errors += CheckBatchMatrixNear(fantasy_copy.mutable_model(0).Call(inputs[0]).mean(), BatchMatrix({}, 2, 1, {0.8, 3.2}), 1.0e-14);
  if (!CheckIntEquals(fantasy_list.train_targets()[1].num_rows, 4)) {
    ++total_errors;
  }

  total_errors += CheckThrows<InvalidValueException<int> >("input list length", [&model_list, &inputs]() {
      return model_list.Call(std::vector<BatchMatrix>(inputs.begin(), inputs.begin() + 1));
    });
  total_errors += CheckThrows<InvalidValueException<int> >("noise list length", [&]() {
      return model_list.GetFantasyModel(fantasy_inputs, fantasy_targets, {0.1});
    });
  total_errors += CheckThrows<BoundsException<int> >("model index", [&model_list]() {
      return model_list.model(2).likelihood().noise_variance();
    });
  total_errors += CheckThrows<PreconditionException>("null model", []() {
      IndependentModelList::ModelList null_models;
      null_models.emplace_back(nullptr);
      IndependentModelList bad(std::move(null_models));
    });

  return total_errors;
}

}  // end unnamed namespace

int RunModelTests() {
  int total_errors = 0;
  int current_errors = 0;

  current_errors = TestExactProcess();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("exact process failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestLikelihoods();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("likelihoods failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestExactConditionalModel();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("exact conditional model failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestApproximateModelFantasy();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("approximate model fantasy failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestIndependentModelList();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("independent model list failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  return total_errors;
}

}  // end namespace sparse_qep
