/*!
  \file qep_test_utils.cpp
  \rst
  Implementations of the precision checks and mock data used throughout the unit tests.
\endrst*/

#include "qep_test_utils.hpp"

#include <cmath>
#include <cstdint>

#include <algorithm>
#include <limits>
#include <memory>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_covariance.hpp"
#include "qep_distribution.hpp"
#include "qep_linear_algebra.hpp"
#include "qep_logging.hpp"
#include "qep_mean.hpp"
#include "qep_process_model.hpp"
#include "qep_random.hpp"

namespace sparse_qep {

bool CheckIntEquals(int64_t value, int64_t truth) noexcept {
  bool passed = value == truth;

  if (passed == false) {
    SQ_ERROR_PRINTF("value = %lld, truth = %lld, diff = %lld\n", static_cast<long long>(value), static_cast<long long>(truth),
                    static_cast<long long>(truth - value));
  }
  return passed;
}

/*!\rst
  A small residual is NECESSARY but NOT SUFFICIENT for an accurate ``x``:
  ``\|\delta x\| / \|x\| \le cond(A) * \|r\| / (\|A\| * \|x\|)``.  A backward stable solver keeps the residual near
  machine precision even when ``cond(A)`` is large.
\endrst*/
double ResidualNorm(double const * restrict A, double const * restrict x, double const * restrict b, int size) noexcept {
  std::vector<double> y(b, b + size);  // y = b
  GeneralMatrixVectorMultiply(A, 'N', x, -1.0, 1.0, size, size, size, y.data());  // y -= A * x

  return VectorNorm(y.data(), size);
}

bool CheckDoubleWithin(double value, double truth, double tolerance) noexcept {
  double diff = std::fabs(value - truth);
  bool passed = diff <= tolerance;

  if (passed != true) {
    SQ_ERROR_PRINTF("value = %.18E, truth = %.18E, diff = %.18E, tol = %.18E\n", value, truth, diff, tolerance);
  }
  return passed;
}

bool CheckDoubleWithinRelativeWithThreshold(double value, double truth, double tolerance, double threshold) noexcept {
  double denom = std::fabs(truth);
  if (denom < threshold) {
    denom = 1.0;  // don't divide by 0
  }
  double diff = std::fabs((value - truth)/denom);
  bool passed = diff <= tolerance;
  if (passed != true) {
    SQ_ERROR_PRINTF("value = %.18E, truth = %.18E, diff = %.18E, tol = %.18E\n", value, truth, diff, tolerance);
  }
  return passed;
}

bool CheckDoubleWithinRelative(double value, double truth, double tolerance) noexcept {
  return CheckDoubleWithinRelativeWithThreshold(value, truth, tolerance, std::numeric_limits<double>::min());
}

/*!\rst
  Uses the Frobenius Norm for convenience; matrix 2-norms are expensive to compute.
\endrst*/
bool CheckMatrixNormWithin(double const * restrict matrix1, double const * restrict matrix2, int size_m, int size_n, double tolerance) noexcept {
  std::vector<double> difference_matrix(matrix1, matrix1 + size_m*size_n);

  VectorAXPY(size_m*size_n, -1.0, matrix2, difference_matrix.data());
  double norm = VectorNorm(difference_matrix.data(), size_m*size_n);
  if (norm > tolerance) {
    SQ_ERROR_PRINTF("||matrix1 - matrix2||_F = %.18E, tol = %.18E\n", norm, tolerance);
  }
  return norm <= tolerance;
}

int CheckBatchMatrixNear(const BatchMatrix& value, const BatchMatrix& truth, double tolerance) noexcept {
  if (value.batch_shape != truth.batch_shape || value.num_rows != truth.num_rows || value.num_cols != truth.num_cols) {
    SQ_ERROR_PRINTF("shape mismatch: (%d x %d, batch size %d) vs (%d x %d, batch size %d)\n", value.num_rows, value.num_cols,
                    value.batch_size(), truth.num_rows, truth.num_cols, truth.batch_size());
    return 1;
  }

  int total_errors = 0;
  for (int b = 0; b < value.batch_size(); ++b) {
    if (!CheckMatrixNormWithin(value.element(b), truth.element(b), value.num_rows, value.num_cols, tolerance)) {
      SQ_ERROR_PRINTF("batch element %d, value:\n", b);
      PrintMatrix(value.element(b), value.num_rows, value.num_cols);
      SQ_ERROR_PRINTF("truth:\n");
      PrintMatrix(truth.element(b), truth.num_rows, truth.num_cols);
      ++total_errors;
    }
  }
  return total_errors;
}

int CheckBatchShapeEquals(const BatchShape& value, const BatchShape& truth) noexcept {
  int total_errors = 0;
  if (!CheckIntEquals(value.size(), truth.size())) {
    return 1;
  }
  for (int i = 0; i < static_cast<int>(value.size()); ++i) {
    if (!CheckIntEquals(value[i], truth[i])) {
      ++total_errors;
    }
  }
  return total_errors;
}

int CheckCovarianceIsPsd(const LatentDistribution& distribution, double tolerance) {
  const BatchMatrix& covariance = distribution.covariance();
  const int size = covariance.num_rows;
  std::vector<double> eigenvalues(size);
  std::vector<double> eigenvectors(size*size);

  int total_errors = 0;
  for (int b = 0; b < covariance.batch_size(); ++b) {
    SymmetricEigenDecomposition(covariance.element(b), size, eigenvalues.data(), eigenvectors.data());
    const double min_eigenvalue = *std::min_element(eigenvalues.begin(), eigenvalues.end());
    if (min_eigenvalue < -tolerance) {
      SQ_ERROR_PRINTF("batch element %d: smallest eigenvalue %.18E < %.18E\n", b, min_eigenvalue, -tolerance);
      ++total_errors;
    }
  }
  return total_errors;
}

MockSparseRegressionData::MockSparseRegressionData(int dim_in, int num_train_in, int num_inducing_in, double power,
                                                   UniformRandomGenerator * uniform_generator)
    : dim(dim_in),
      num_train(num_train_in),
      num_inducing(num_inducing_in),
      prior(new ProcessModel(ConstantMean(0.25), SquareExponential(dim_in, 1.2, 0.8), power)),
      train_inputs(BatchShape(), dim_in, num_train_in),
      train_targets(BatchShape(), num_train_in, 1),
      inducing_points(BatchShape(), dim_in, num_inducing_in) {
  ComputeUniformRandomValues(-2.0, 2.0, dim*num_train, uniform_generator, train_inputs.data.data());

  for (int i = 0; i < num_train; ++i) {
    double coordinate_sum = 0.0;
    for (int d = 0; d < dim; ++d) {
      coordinate_sum += train_inputs.data[i*dim + d];
    }
    train_targets.data[i] = std::sin(coordinate_sum);
  }

  std::copy(train_inputs.data.begin(), train_inputs.data.begin() + dim*num_inducing, inducing_points.data.begin());
}

}  // end namespace sparse_qep
