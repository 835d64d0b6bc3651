/*!
  \file qep_linear_algebra_test.hpp
  \rst
  Functions for testing qep_linear_algebra and supporting utilities.

  Includes Build* functions that build matrices with various properties (random SPD, Moler, Householder reflectors,
  rank-deficient PSD).  These are in turn used as test inputs for the linear algebra routines and for the
  distribution tests.

  The linear algebra tests are all called through RunLinearAlgebraTests(); these check hand-verified examples, special
  matrix properties, and analytic bounds on residual/error.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_TEST_HPP_
#define SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_TEST_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

struct UniformRandomGenerator;

/*!\rst
  Utility function to generate a ``m x m`` identity matrix.

  \param
    :size_m: dimension of matrix
  \output
    :matrix[size_m][size_m]: identity matrix of order size_m
\endrst*/
SQ_NONNULL_POINTERS void BuildIdentityMatrix(int size_m, double * restrict matrix) noexcept;

/*!\rst
  Builds the "Moler" matrix, an ill-conditioned SPD matrix.  Matches ``gallery('moler', size, alpha)`` in MATLAB.

  \param
    :alpha: moler matrix parameter
    :size: dimension of moler matrix
  \output
    :moler_matrix[size][size]: the moler matrix with parameter ``alpha``, dimension ``size``
\endrst*/
static constexpr double kMolerDefaultParameter = -1.0;
SQ_NONNULL_POINTERS void BuildMolerMatrix(double alpha, int size, double * restrict moler_matrix) noexcept;

/*!\rst
  Builds an SPD matrix ``L * L^T`` from a random lower triangular ``L`` (entries in ``[0, 1]``).  Conditioning can be
  poor since ``cond(SPD) = cond(L)^2``.

  \param
    :size: dimension of matrix
    :uniform_generator[1]: a UniformRandomGenerator object providing the random engine for uniform random numbers
  \output
    :uniform_generator[1]: UniformRandomGenerator object will have its state changed due to random draws
    :spd_matrix[size][size]: a random, SPD matrix
\endrst*/
SQ_NONNULL_POINTERS void BuildRandomSPDMatrix(int size, UniformRandomGenerator * uniform_generator, double * restrict spd_matrix) noexcept;

/*!\rst
  Builds a PSD matrix of rank ``rank < size``: ``B * B^T`` with ``B`` a random ``size x rank`` matrix.  Singular, so a
  plain Cholesky factorization fails on it.
\endrst*/
SQ_NONNULL_POINTERS void BuildRankDeficientPSDMatrix(int size, int rank, UniformRandomGenerator * uniform_generator, double * restrict psd_matrix) noexcept;

/*!\rst
  ``F = I - 2 v v^T`` with ``v`` chosen so that ``F * x = [\|x\|_2; zeros(n-1,1)]``.  ``F`` is orthogonal and symmetric.

  \param
    :vector[size]: vector x used to construct F
    :size: dimension of matrix, vector
  \output
    :householder[size][size]: householder matrix, F
\endrst*/
SQ_NONNULL_POINTERS void BuildHouseholderReflectorMatrix(double const * restrict vector, int size, double * restrict householder) noexcept;

/*!\rst
  Builds a vector with random entries in ``[left_bound, right_bound]``.  A random ``m x n`` matrix can be built too:
  ``BuildRandomVector(m*n, ...)``.
\endrst*/
SQ_NONNULL_POINTERS void BuildRandomVector(int size, double left_bound, double right_bound, UniformRandomGenerator * uniform_generator, double * restrict vector) noexcept;

/*!\rst
  Checks if the input matrix is symmetric to within (relative) tolerance.
\endrst*/
SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT bool CheckMatrixIsSymmetric(double const * restrict matrix, int size, double tolerance) noexcept;

/*!\rst
  Runs a battery of tests on (supporting) linear algebra routines:

  * vector functions, outer product, trace
  * cholesky factorization, including jitter escalation in PsdSafeCholesky and log-determinants
  * Solving ``A * x = b`` when ``A`` is SPD (cholesky backsolves and conjugate gradients)
  * symmetric eigen-decomposition
  * matrix-vector and matrix-matrix multiply; transpose

  \return
    number of test failures: 0 if all linear algebra routines are working properly
\endrst*/
SQ_WARN_UNUSED_RESULT int RunLinearAlgebraTests();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_TEST_HPP_
