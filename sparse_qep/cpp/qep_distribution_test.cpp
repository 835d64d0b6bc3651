/*!
  \file qep_distribution_test.cpp
  \rst
  Routines to test LatentDistribution.  Sampling tests compare empirical moments against the analytic ones; their
  tolerances are several standard errors wide so that the fixed seeds are not load-bearing.
\endrst*/

#include "qep_distribution_test.hpp"

#include <cmath>

#include <algorithm>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_linear_algebra-inl.hpp"
#include "qep_logging.hpp"
#include "qep_random.hpp"
#include "qep_test_utils.hpp"

namespace sparse_qep {

namespace {

/*!\rst
  Empirical mean and (biased) covariance of the samples of batch element ``batch_index`` of a single-task
  ``([S] + batch, N, 1)`` sample batch.

  \output
    :mean[N]: sample mean
    :covariance[N][N]: sample covariance
\endrst*/
void ComputeSampleMoments(const BatchMatrix& samples, int batch_index, double * restrict mean, double * restrict covariance) {
  const int num_samples = samples.batch_shape[0];
  const int inner_batch_size = samples.batch_size()/num_samples;
  const int size = samples.num_rows;

  std::fill(mean, mean + size, 0.0);
  std::fill(covariance, covariance + size*size, 0.0);
  for (int s = 0; s < num_samples; ++s) {
    double const * const sample = samples.element(s*inner_batch_size + batch_index);
    VectorAXPY(size, 1.0, sample, mean);
    OuterProduct(size, size, 1.0, sample, sample, covariance);
  }
  VectorScale(size, 1.0/num_samples, mean);
  VectorScale(size*size, 1.0/num_samples, covariance);
  OuterProduct(size, size, -1.0, mean, mean, covariance);
}

SQ_WARN_UNUSED_RESULT int TestConstructionAndLayout() {
  int total_errors = 0;

  // mean broadcasts against a batched covariance
  const BatchMatrix mean({}, 2, 1, {1.0, -1.0});
  const BatchMatrix covariance({3}, 2, 2, {1.0, 0.0, 0.0, 1.0,
                                           2.0, 0.5, 0.5, 2.0,
                                           3.0, 1.0, 1.0, 3.0});
  const LatentDistribution distribution(kNormalPower, mean, covariance);
  total_errors += CheckBatchShapeEquals(distribution.batch_shape(), {3});
  if (distribution.family() != DistributionFamily::kNormal || distribution.is_multitask()) {
    ++total_errors;
  }
  if (!CheckIntEquals(distribution.event_size(), 2)) {
    ++total_errors;
  }
  for (int b = 0; b < 3; ++b) {
    if (!CheckMatrixNormWithin(distribution.mean().element(b), mean.element(0), 2, 1, 0.0)) {
      ++total_errors;
    }
  }
  if (FamilyFromPower(1.0) != DistributionFamily::kQExponential) {
    ++total_errors;
  }

  total_errors += CheckThrows<LowerBoundException<double> >("non-positive power", [&mean, &covariance]() {
      return LatentDistribution(0.0, mean, covariance);
    });
  total_errors += CheckThrows<InvalidValueException<int> >("covariance size mismatch", [&mean]() {
      return LatentDistribution(kNormalPower, mean, IdentityBatch({}, 3));
    });
  total_errors += CheckThrows<ShapeMismatchException>("non-broadcastable batches", []() {
      return LatentDistribution(kNormalPower, BatchMatrix({2}, 2, 1), IdentityBatch({3}, 2));
    });
  total_errors += CheckThrows<InvalidValueException<int> >("two-column single-task mean", []() {
      return LatentDistribution(kNormalPower, BatchMatrix({}, 1, 2), IdentityBatch({}, 2));
    });

  // interleaved multitask: N = 2 points, T = 2 tasks, covariance index n*T + t
  const BatchMatrix task_mean({}, 2, 2, {10.0, 11.0, 20.0, 21.0});  // column t holds task t
  BatchMatrix task_covariance({}, 4, 4);
  for (int i = 0; i < 4; ++i) {
    task_covariance.data[i*4 + i] = 1.0 + i;
  }
  const LatentDistribution interleaved = LatentDistribution::Multitask(1.5, task_mean, task_covariance, true);
  if (!interleaved.is_multitask() || !interleaved.interleaved() || interleaved.family() != DistributionFamily::kQExponential) {
    ++total_errors;
  }
  if (!CheckIntEquals(interleaved.CovarianceIndex(1, 0), 2)) {
    ++total_errors;
  }
  total_errors += CheckBatchMatrixNear(interleaved.FlatMean(), BatchMatrix({}, 4, 1, {10.0, 20.0, 11.0, 21.0}), 0.0);
  total_errors += CheckBatchMatrixNear(interleaved.Variance(), BatchMatrix({}, 2, 2, {1.0, 3.0, 2.0, 4.0}), 0.0);

  const LatentDistribution blocked = LatentDistribution::Multitask(1.5, task_mean, task_covariance, false);
  total_errors += CheckBatchMatrixNear(blocked.FlatMean(), BatchMatrix({}, 4, 1, task_mean.data), 0.0);
  total_errors += CheckBatchMatrixNear(blocked.Variance(), BatchMatrix({}, 2, 2, {1.0, 2.0, 3.0, 4.0}), 0.0);

  const LatentDistribution jittered = distribution.AddJitter();
  for (int b = 0; b < 3; ++b) {
    for (int i = 0; i < 2; ++i) {
      if (!CheckDoubleWithin(jittered.covariance().element(b)[i*3], covariance.element(b)[i*3] + kDefaultPriorJitter, 1.0e-15)) {
        ++total_errors;
      }
    }
  }

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestRootDecomposition() {
  int total_errors = 0;

  // rank one: needs jitter (or the eigen fallback) to factor
  const BatchMatrix singular({}, 2, 2, {1.0, 1.0, 1.0, 1.0});
  const LatentDistribution distribution(kNormalPower, BatchMatrix({}, 2, 1), singular);
  const BatchMatrix root = distribution.RootDecomposition();
  std::vector<double> product(4, 0.0);
  GeneralMatrixMatrixTransposeMultiply(root.data.data(), root.data.data(), 1.0, 0.0, 2, root.num_cols, 2, product.data());
  if (!CheckMatrixNormWithin(product.data(), singular.data.data(), 2, 2, 1.0e-6)) {
    ++total_errors;
  }

  // a known root is returned as-is and survives Expand
  LatentDistribution rooted(kNormalPower, BatchMatrix({}, 2, 1), singular);
  const BatchMatrix column_root({}, 2, 1, {1.0, 1.0});
  rooted.SetRoot(column_root);
  if (!rooted.has_root() || rooted.RootDecomposition() != column_root) {
    SQ_ERROR_PRINTF("known root was not used\n");
    ++total_errors;
  }
  const LatentDistribution expanded = rooted.Expand({2});
  if (!expanded.has_root()) {
    ++total_errors;
  }
  total_errors += CheckBatchMatrixNear(expanded.RootDecomposition(), column_root.Expand({2}), 0.0);
  if (rooted.AddJitter(0.1).has_root()) {
    SQ_ERROR_PRINTF("jittered distribution kept a stale root\n");
    ++total_errors;
  }
  total_errors += CheckThrows<ShapeMismatchException>("SetRoot batch mismatch", [&rooted]() {
      rooted.SetRoot(BatchMatrix({2}, 2, 1));
    });

  return total_errors;
}

/*!\rst
  Normal: sample mean and covariance match ``\mu, \Sigma``.
  Q-Exponential (``q = 1``, ``d = 2``): ``x = \mu + L z \|z\|``, so ``Cov[x] = E[z z^T \|z\|^2] \Sigma = 4 \Sigma``,
  which is also ``QExponentialRescaleFactor(2, 1)^2 \Sigma``.
\endrst*/
SQ_WARN_UNUSED_RESULT int TestRsample() {
  int total_errors = 0;
  const int num_samples = 20000;
  const BatchMatrix mean({2}, 2, 1, {1.0, -1.0, 0.0, 2.0});
  const BatchMatrix covariance({2}, 2, 2, {2.0, 0.6, 0.6, 1.0,
                                           1.0, -0.3, -0.3, 0.5});
  double sample_mean[2];
  double sample_covariance[4];

  {
    NormalRNG normal_rng(5431);
    const LatentDistribution distribution(kNormalPower, mean, covariance);
    const BatchMatrix samples = distribution.Rsample(num_samples, &normal_rng);
    total_errors += CheckBatchShapeEquals(samples.batch_shape, {num_samples, 2});
    for (int b = 0; b < 2; ++b) {
      ComputeSampleMoments(samples, b, sample_mean, sample_covariance);
      if (!CheckMatrixNormWithin(sample_mean, mean.element(b), 2, 1, 0.05)) {
        ++total_errors;
      }
      if (!CheckMatrixNormWithin(sample_covariance, covariance.element(b), 2, 2, 0.1)) {
        ++total_errors;
      }
    }
  }

  {
    // heavier tails: more samples for the same accuracy
    NormalRNG normal_rng(7919);
    const double power = 1.0;
    const LatentDistribution distribution(power, mean, covariance);
    const BatchMatrix samples = distribution.Rsample(5*num_samples, &normal_rng);
    const double rescale_sq = Square(QExponentialRescaleFactor(2, power));
    if (!CheckDoubleWithin(rescale_sq, 4.0, 1.0e-13)) {
      ++total_errors;
    }
    for (int b = 0; b < 2; ++b) {
      ComputeSampleMoments(samples, b, sample_mean, sample_covariance);
      if (!CheckMatrixNormWithin(sample_mean, mean.element(b), 2, 1, 0.1)) {
        ++total_errors;
      }
      VectorScale(4, 1.0/rescale_sq, sample_covariance);
      if (!CheckMatrixNormWithin(sample_covariance, covariance.element(b), 2, 2, 0.2)) {
        ++total_errors;
      }
    }
  }

  {
    NormalRNG normal_rng(101);
    const LatentDistribution distribution(kNormalPower, mean, covariance);
    if (!CheckIntEquals(distribution.Rsample(0, &normal_rng).batch_size(), 0)) {
      ++total_errors;
    }
    total_errors += CheckThrows<LowerBoundException<int> >("negative sample count", [&distribution, &normal_rng]() {
        return distribution.Rsample(-1, &normal_rng);
      });
  }

  return total_errors;
}

/*!\rst
  Marginal draws with a replayed table: ``loc + scale z |z|^{2/q-1} / rescale``.
\endrst*/
SQ_WARN_UNUSED_RESULT int TestSampleMarginals() {
  int total_errors = 0;
  const BatchMatrix mean({}, 2, 1, {1.0, 2.0});
  const BatchMatrix covariance({}, 2, 2, {4.0, 1.0, 1.0, 9.0});
  NormalRNGSimulator normal_rng({0.5, -1.0, 0.5, -1.0, 0.5, -1.0});

  const LatentDistribution normal(kNormalPower, mean, covariance);
  total_errors += CheckBatchMatrixNear(SampleMarginals(normal, true, &normal_rng), BatchMatrix({}, 2, 1, {2.0, -1.0}), 1.0e-14);

  const double sqrt3 = std::sqrt(3.0);
  if (!CheckDoubleWithin(QExponentialRescaleFactor(1, 1.0), sqrt3, 1.0e-14)) {
    ++total_errors;
  }
  if (!CheckDoubleWithin(QExponentialRescaleFactor(5, kNormalPower), 1.0, 0.0)) {
    ++total_errors;
  }

  const LatentDistribution q_exponential(1.0, mean, covariance);
  total_errors += CheckBatchMatrixNear(SampleMarginals(q_exponential, false, &normal_rng), BatchMatrix({}, 2, 1, {1.5, -1.0}), 1.0e-14);
  total_errors += CheckBatchMatrixNear(SampleMarginals(q_exponential, true, &normal_rng),
                                       BatchMatrix({}, 2, 1, {1.0 + 0.5/sqrt3, 2.0 - sqrt3}), 1.0e-14);

  if (!CheckIntEquals(normal_rng.index(), 6)) {
    ++total_errors;
  }

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestKlDivergence() {
  int total_errors = 0;
  const double tolerance = 1.0e-13;

  {
    const BatchMatrix mean({}, 3, 1, {0.5, -0.2, 1.0});
    const BatchMatrix covariance({}, 3, 3, {2.0, 0.3, 0.1,
                                            0.3, 1.0, -0.2,
                                            0.1, -0.2, 1.5});
    for (const double power : {kNormalPower, 1.0, 1.5}) {
      const LatentDistribution distribution(power, mean, covariance);
      const BatchMatrix kl = KlDivergence(distribution, distribution);
      if (!CheckDoubleWithin(kl.data[0], 0.0, 1.0e-12)) {
        SQ_ERROR_PRINTF("KL(q || q) != 0 for power %f\n", power);
        ++total_errors;
      }
    }
  }

  // 1-d closed forms: q = (mean 1, variance 2), p = (mean 0, variance 1), so T = 2 + 1 = 3
  const BatchMatrix q_mean({}, 1, 1, {1.0});
  const BatchMatrix q_covariance({}, 1, 1, {2.0});
  const BatchMatrix p_mean({}, 1, 1, {0.0});
  const BatchMatrix p_covariance({}, 1, 1, {1.0});
  {
    const LatentDistribution q_distribution(kNormalPower, q_mean, q_covariance);
    const LatentDistribution p_distribution(kNormalPower, p_mean, p_covariance);
    const BatchMatrix kl = KlDivergence(q_distribution, p_distribution);
    if (!CheckDoubleWithin(kl.data[0], 0.5*(2.0 - std::log(2.0)), tolerance)) {
      ++total_errors;
    }
  }
  {
    const LatentDistribution q_distribution(1.0, q_mean, q_covariance);
    const LatentDistribution p_distribution(1.0, p_mean, p_covariance);
    const BatchMatrix kl = KlDivergence(q_distribution, p_distribution);
    const double truth = -0.5*std::log(2.0) - 0.5 + 0.5*std::sqrt(3.0) + 0.25*std::log(3.0);
    if (!CheckDoubleWithin(kl.data[0], truth, tolerance)) {
      ++total_errors;
    }
  }

  // batched q against an unbatched p
  {
    const BatchMatrix batched_mean({3}, 1, 1, {1.0, 0.0, -1.0});
    const LatentDistribution q_distribution(kNormalPower, batched_mean, q_covariance);
    const LatentDistribution p_distribution(kNormalPower, p_mean, p_covariance);
    const BatchMatrix kl = KlDivergence(q_distribution, p_distribution);
    total_errors += CheckBatchShapeEquals(kl.batch_shape, {3});
    const double truth[3] = {0.5*(2.0 - std::log(2.0)), 0.5*(1.0 - std::log(2.0)), 0.5*(2.0 - std::log(2.0))};
    total_errors += CheckBatchMatrixNear(kl, BatchMatrix({3}, 1, 1, {truth[0], truth[1], truth[2]}), 1.0e-12);
  }

  total_errors += CheckThrows<InvalidValueException<int> >("KL event size mismatch", [&q_mean, &q_covariance]() {
      const LatentDistribution q_distribution(kNormalPower, q_mean, q_covariance);
      const LatentDistribution p_distribution(kNormalPower, BatchMatrix({}, 2, 1), IdentityBatch({}, 2));
      return KlDivergence(q_distribution, p_distribution);
    });

  return total_errors;
}

}  // end unnamed namespace

int RunDistributionTests() {
  int total_errors = 0;
  int current_errors = 0;

  current_errors = TestConstructionAndLayout();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("construction and layout failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestRootDecomposition();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("root decomposition failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestRsample();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("Rsample failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestSampleMarginals();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("SampleMarginals failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestKlDivergence();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("KlDivergence failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  return total_errors;
}

}  // end namespace sparse_qep
