/*!
  \file qep_test_utils.hpp
  \rst
  Functions and classes that are useful for unit testing: absolute/relative precision checks, a few matrix utilities,
  and a mock data class that builds a small regression problem (prior model, training data, inducing points).

  All checks log the offending values (SQ_ERROR_PRINTF) when they fail, so a test only needs to count failures.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_TEST_UTILS_HPP_
#define SPARSE_QEP_CPP_QEP_TEST_UTILS_HPP_

#include <cstdint>

#include <memory>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_logging.hpp"
#include "qep_process_model.hpp"
#include "qep_random.hpp"

namespace sparse_qep {

/*!\rst
  Checks if ``value == truth``.

  \return
    true if value and truth are equal
\endrst*/
bool CheckIntEquals(int64_t value, int64_t truth) noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT;

/*!\rst
  ``\|b - A*x\|_2``

  \param
    :A[size][size]: the linear system
    :x[size]: the (approximate) solution
    :b[size]: the right hand side
    :size: dimension of the system
  \return
    the residual norm
\endrst*/
double ResidualNorm(double const * restrict A, double const * restrict x, double const * restrict b, int size) noexcept SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

/*!\rst
  Checks if ``|value - truth| <= tolerance``.
\endrst*/
bool CheckDoubleWithin(double value, double truth, double tolerance) noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT;

/*!\rst
  Checks if ``|value - truth| / |truth| <= tolerance``.
\endrst*/
bool CheckDoubleWithinRelative(double value, double truth, double tolerance) noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT;

/*!\rst
  Checks if ``|value - truth| / |truth| <= tolerance``, measuring the absolute error instead when ``|truth| < threshold``.
\endrst*/
bool CheckDoubleWithinRelativeWithThreshold(double value, double truth, double tolerance, double threshold) noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT;

/*!\rst
  Checks if ``\|matrix1 - matrix2\|_F <= tolerance``.
\endrst*/
bool CheckMatrixNormWithin(double const * restrict matrix1, double const * restrict matrix2, int size_m, int size_n, double tolerance) noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT;

/*!\rst
  Entrywise comparison of two batches, including their shapes.

  \return
    number of batch elements that differ by more than ``tolerance`` (Frobenius norm), or 1 if the shapes differ
\endrst*/
int CheckBatchMatrixNear(const BatchMatrix& value, const BatchMatrix& truth, double tolerance) noexcept SQ_WARN_UNUSED_RESULT;

/*!\rst
  \return
    number of mismatches between ``value`` and ``truth`` (each dimension and the rank count once)
\endrst*/
int CheckBatchShapeEquals(const BatchShape& value, const BatchShape& truth) noexcept SQ_WARN_UNUSED_RESULT;

/*!\rst
  \return
    number of batch elements of ``distribution``'s covariance with an eigenvalue below ``-tolerance``
\endrst*/
int CheckCovarianceIsPsd(const LatentDistribution& distribution, double tolerance) SQ_WARN_UNUSED_RESULT;

/*!\rst
  Runs ``function`` and checks that it throws ``ExceptionType``.

  \param
    :description: label for the error message
    :function: callable taking no arguments
  \return
    0 if ``ExceptionType`` was thrown, 1 otherwise (other exceptions propagate)
\endrst*/
template <typename ExceptionType, typename Function>
SQ_WARN_UNUSED_RESULT int CheckThrows(char const * description, Function function) {
  try {
    function();
  } catch (const ExceptionType& exception) {
    return 0;
  }
  SQ_ERROR_PRINTF("%s: expected exception was not thrown\n", description);
  return 1;
}

/*!\rst
  Mock data for strategy tests: a 1-D (or ``dim``-D) regression problem with

  * ``prior``: constant mean 0.25 and square exponential kernel (``alpha = 1.2``, ``length = 0.8``), power ``power``
  * ``train_inputs``: ``(D, num_train)`` points drawn uniformly from ``[-2, 2]``
  * ``train_targets``: ``(num_train, 1)``, ``sin(\sum_d x_d)``
  * ``inducing_points``: the first ``num_inducing`` training points
\endrst*/
struct MockSparseRegressionData final {
  MockSparseRegressionData(int dim_in, int num_train_in, int num_inducing_in, double power, UniformRandomGenerator * uniform_generator) SQ_NONNULL_POINTERS;

  int dim;
  int num_train;
  int num_inducing;
  std::unique_ptr<ProcessModel> prior;
  BatchMatrix train_inputs;
  BatchMatrix train_targets;
  BatchMatrix inducing_points;

  SQ_DISALLOW_DEFAULT_AND_COPY_AND_ASSIGN(MockSparseRegressionData);
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_TEST_UTILS_HPP_
