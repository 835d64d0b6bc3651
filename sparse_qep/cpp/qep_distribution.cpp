/*!
  \file qep_distribution.cpp
  \rst
  Implementation of LatentDistribution, its samplers, and the KL divergence between two LatentDistributions.
\endrst*/

#include "qep_distribution.hpp"

#include <cmath>

#include <algorithm>
#include <limits>
#include <vector>

#include <boost/math/special_functions/gamma.hpp>  // NOLINT(build/include_order)

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_exception.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_logging.hpp"
#include "qep_random.hpp"

namespace sparse_qep {

namespace {

/*!\rst
  Radial factor turning a standard normal draw ``z`` (``\|z\|^2 = norm_sq``) into a Q-Exponential draw:
  ``\|z\|^{2/q - 1}``.  1 for the Normal family.
\endrst*/
double RadialFactor(DistributionFamily family, double power, double norm_sq) noexcept {
  switch (family) {
    case DistributionFamily::kNormal: {
      return 1.0;
    }
    case DistributionFamily::kQExponential: {
      if (norm_sq == 0.0) {
        return 0.0;
      }
      return std::pow(norm_sq, 1.0/power - 0.5);
    }
  }
  return 1.0;
}

/*!\rst
  Eigen root ``V diag(\sqrt{\max(\lambda, 0)})`` of a symmetric matrix.
\endrst*/
void EigenRoot(double const * restrict matrix, int size, double * restrict root) {
  std::vector<double> eigenvalues(size);
  SymmetricEigenDecomposition(matrix, size, eigenvalues.data(), root);
  for (int j = 0; j < size; ++j) {
    VectorScale(size, std::sqrt(std::max(eigenvalues[j], 0.0)), root + j*size);
  }
}

}  // end unnamed namespace

char const * FamilyName(DistributionFamily family) noexcept {
  switch (family) {
    case DistributionFamily::kNormal: {
      return "Normal";
    }
    case DistributionFamily::kQExponential: {
      return "QExponential";
    }
  }
  return "Unknown";
}

LatentDistribution::LatentDistribution(double power, const BatchMatrix& mean, const BatchMatrix& covariance, bool multitask, bool interleaved)
    : family_(FamilyFromPower(power)),
      power_(power),
      mean_(),
      covariance_(),
      root_(),
      has_root_(false),
      multitask_(multitask),
      interleaved_(interleaved) {
  if (unlikely(power <= 0.0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<double>, "Distribution power must be positive.", power, std::numeric_limits<double>::min());
  }
  const int event_size = mean.num_rows*mean.num_cols;
  if (unlikely(covariance.num_rows != event_size || covariance.num_cols != event_size)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Covariance size does not match the mean.", covariance.num_rows, event_size);
  }

  const BatchShape batch_shape = BroadcastShapes(mean.batch_shape, covariance.batch_shape);
  mean_ = mean.Expand(batch_shape);
  covariance_ = covariance.Expand(batch_shape);
}

LatentDistribution::LatentDistribution(double power, const BatchMatrix& mean, const BatchMatrix& covariance)
    : LatentDistribution(power, mean, covariance, false, false) {
  if (unlikely(mean.num_cols != 1)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Single-task means must have one column.", mean.num_cols, 1);
  }
}

LatentDistribution LatentDistribution::Multitask(double power, const BatchMatrix& mean, const BatchMatrix& covariance, bool interleaved) {
  return LatentDistribution(power, mean, covariance, true, interleaved);
}

void LatentDistribution::SetRoot(const BatchMatrix& root) {
  if (unlikely(root.batch_shape != batch_shape())) {
    SQ_THROW_EXCEPTION(ShapeMismatchException, "Root batch shape must match the distribution.", batch_shape(), root.batch_shape);
  }
  if (unlikely(root.num_rows != event_size())) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Root row count must equal the event size.", root.num_rows, event_size());
  }
  root_ = root;
  has_root_ = true;
}

BatchMatrix LatentDistribution::FlatMean() const {
  if (!interleaved_ || num_tasks() == 1) {
    return BatchMatrix(batch_shape(), event_size(), 1, mean_.data);
  }

  const int num_points = num_data();
  const int num_outputs = num_tasks();
  BatchMatrix flat_mean(batch_shape(), event_size(), 1);
  for (int b = 0; b < flat_mean.batch_size(); ++b) {
    double const * const mean = mean_.element(b);
    double * flat = flat_mean.element(b);
    for (int t = 0; t < num_outputs; ++t) {
      for (int n = 0; n < num_points; ++n) {
        flat[CovarianceIndex(n, t)] = mean[t*num_points + n];
      }
    }
  }
  return flat_mean;
}

BatchMatrix LatentDistribution::Variance() const {
  const int num_points = num_data();
  const int num_outputs = num_tasks();
  const int size = event_size();
  BatchMatrix variance(batch_shape(), num_points, num_outputs);
  for (int b = 0; b < variance.batch_size(); ++b) {
    double const * const covariance = covariance_.element(b);
    double * var = variance.element(b);
    for (int t = 0; t < num_outputs; ++t) {
      for (int n = 0; n < num_points; ++n) {
        const int index = CovarianceIndex(n, t);
        var[t*num_points + n] = covariance[index*size + index];
      }
    }
  }
  return variance;
}

LatentDistribution LatentDistribution::AddJitter(double jitter) const {
  BatchMatrix covariance(covariance_);
  for (int b = 0; b < covariance.batch_size(); ++b) {
    AddDiagonalJitter(jitter, covariance.num_rows, covariance.element(b));
  }
  return LatentDistribution(power_, mean_, covariance, multitask_, interleaved_);
}

LatentDistribution LatentDistribution::Expand(const BatchShape& new_batch_shape) const {
  LatentDistribution result(power_, mean_.Expand(new_batch_shape), covariance_.Expand(new_batch_shape), multitask_, interleaved_);
  if (has_root_) {
    result.SetRoot(root_.Expand(new_batch_shape));
  }
  return result;
}

BatchMatrix LatentDistribution::RootDecomposition(double cholesky_jitter, int max_tries) const {
  if (has_root_) {
    return root_;
  }

  const int size = event_size();
  BatchMatrix root(batch_shape(), size, size);
  for (int b = 0; b < root.batch_size(); ++b) {
    try {
      const double jitter_used = PsdSafeCholesky(covariance_.element(b), size, cholesky_jitter, max_tries, root.element(b));
      if (jitter_used > 0.0) {
        SQ_VERBOSE_PRINTF("RootDecomposition: batch element %d factored with jitter %.1E\n", b, jitter_used);
      }
    } catch (const SingularMatrixException& exception) {
      SQ_WARNING_PRINTF("RootDecomposition: Cholesky failed (%s); using the eigen root\n", exception.what());
      EigenRoot(covariance_.element(b), size, root.element(b));
    }
  }
  return root;
}

BatchMatrix LatentDistribution::Rsample(int num_samples, NormalRNGInterface * normal_rng) const {
  if (unlikely(num_samples < 0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "Number of samples must be non-negative.", num_samples, 0);
  }
  const BatchMatrix root = RootDecomposition();
  const BatchMatrix flat_mean = FlatMean();
  const int size = event_size();
  const int rank = root.num_cols;
  const int num_points = num_data();
  const int num_outputs = num_tasks();
  const int batch_size = mean_.batch_size();

  BatchShape sample_shape(batch_shape());
  sample_shape.insert(sample_shape.begin(), num_samples);
  BatchMatrix samples(sample_shape, num_points, num_outputs);

  std::vector<double> normals(rank);
  std::vector<double> deviation(size);
  for (int s = 0; s < num_samples; ++s) {
    for (int b = 0; b < batch_size; ++b) {
      double norm_sq = 0.0;
      for (auto& normal : normals) {
        normal = (*normal_rng)();
        norm_sq += Square(normal);
      }
      GeneralMatrixVectorMultiply(root.element(b), 'N', normals.data(), RadialFactor(family_, power_, norm_sq), 0.0,
                                  size, rank, size, deviation.data());

      double const * const mean = flat_mean.element(b);
      double * sample = samples.element(s*batch_size + b);
      for (int t = 0; t < num_outputs; ++t) {
        for (int n = 0; n < num_points; ++n) {
          const int index = CovarianceIndex(n, t);
          sample[t*num_points + n] = mean[index] + deviation[index];
        }
      }
    }
  }
  return samples;
}

double QExponentialRescaleFactor(int dim, double power) {
  if (FamilyFromPower(power) == DistributionFamily::kNormal) {
    return 1.0;
  }
  if (unlikely(dim <= 0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "Dimension must be positive.", dim, 1);
  }
  const double half_dim = 0.5*static_cast<double>(dim);
  const double log_second_moment = 2.0/power*kLog2 + boost::math::lgamma(half_dim + 2.0/power) -
      boost::math::lgamma(half_dim);
  return std::sqrt(std::exp(log_second_moment)/static_cast<double>(dim));
}

BatchMatrix SampleMarginals(const LatentDistribution& distribution, bool rescale, NormalRNGInterface * normal_rng) {
  const BatchMatrix& loc = distribution.mean();
  const BatchMatrix variance = distribution.Variance();
  const double scale_correction = rescale ? 1.0/QExponentialRescaleFactor(1, distribution.power()) : 1.0;

  BatchMatrix samples(loc.batch_shape, loc.num_rows, loc.num_cols);
  for (int i = 0; i < static_cast<int>(samples.data.size()); ++i) {
    const double normal = (*normal_rng)();
    const double scale = std::sqrt(std::max(variance.data[i], 0.0));
    samples.data[i] = loc.data[i] + scale_correction*scale*normal*
        RadialFactor(distribution.family(), distribution.power(), Square(normal));
  }
  return samples;
}

BatchMatrix KlDivergence(const LatentDistribution& q_distribution, const LatentDistribution& p_distribution) {
  const int size = q_distribution.event_size();
  if (unlikely(p_distribution.event_size() != size)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "KL divergence requires equal event sizes.", p_distribution.event_size(), size);
  }

  const BatchShape batch_shape = BroadcastShapes(q_distribution.batch_shape(), p_distribution.batch_shape());
  const LatentDistribution q_expanded = q_distribution.Expand(batch_shape);
  const LatentDistribution p_expanded = p_distribution.Expand(batch_shape);
  const BatchMatrix q_mean = q_expanded.FlatMean();
  const BatchMatrix p_mean = p_expanded.FlatMean();
  const double dim = static_cast<double>(size);
  const double power = q_distribution.power();

  BatchMatrix kl_divergence(batch_shape, 1, 1);
  std::vector<double> chol_p(size*size);
  std::vector<double> chol_q(size*size);
  std::vector<double> mean_diff(size);
  for (int b = 0; b < kl_divergence.batch_size(); ++b) {
    const double jitter_p = PsdSafeCholesky(p_expanded.covariance().element(b), size, 1.0e-8, 3, chol_p.data());
    const double jitter_q = PsdSafeCholesky(q_expanded.covariance().element(b), size, 1.0e-8, 3, chol_q.data());
    if (jitter_p > 0.0 || jitter_q > 0.0) {
      SQ_VERBOSE_PRINTF("KlDivergence: jitter %.1E (p), %.1E (q)\n", jitter_p, jitter_q);
    }
    const double log_det_p = CholeskyLogDeterminant(chol_p.data(), size);
    const double log_det_q = CholeskyLogDeterminant(chol_q.data(), size);

    // tr(\Sigma_p^{-1} \Sigma_q) = \|L_p^{-1} L_q\|_F^2
    TriangularMatrixMatrixSolve(chol_p.data(), 'N', size, size, size, chol_q.data());
    const double trace_term = Square(VectorNorm(chol_q.data(), size*size));

    for (int i = 0; i < size; ++i) {
      mean_diff[i] = q_mean.element(b)[i] - p_mean.element(b)[i];
    }
    TriangularMatrixVectorSolve(chol_p.data(), 'N', size, size, mean_diff.data());
    const double quadratic = trace_term + Square(VectorNorm(mean_diff.data(), size));

    double kl = 0.0;
    switch (q_distribution.family()) {
      case DistributionFamily::kNormal: {
        kl = 0.5*(log_det_p - log_det_q - dim + quadratic);
        break;
      }
      case DistributionFamily::kQExponential: {
        const double ratio = std::max(quadratic/dim, std::numeric_limits<double>::min());
        kl = 0.5*(log_det_p - log_det_q) - 0.5*dim + 0.5*dim*std::pow(ratio, 0.5*power) -
            (0.5*power - 1.0)*0.5*dim*std::log(ratio);
        break;
      }
    }
    kl_divergence.data[b] = kl;
  }
  return kl_divergence;
}

}  // end namespace sparse_qep
