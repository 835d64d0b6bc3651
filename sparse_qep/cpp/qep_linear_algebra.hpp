/*!
  \file qep_linear_algebra.hpp
  \rst
  Low level linear algebra in support of the other qep_* components.  The functions here cover the subset of BLAS
  (levels 1 through 3) and LAPACK that sparse variational inference needs:

  * Level 1: ``O(n)`` operations; vector scale, axpy, dot product, norm
  * Level 2: ``O(n^2)`` operations; matrix-vector multiplies (+ special cases) and triangular solves
  * Level 3: ``O(n^3)`` operations; matrix-matrix multiplies and triangular solves
  * LAPACK-like: Cholesky factorization (plain and with jitter escalation), symmetric eigen-decomposition

  plus an iterative conjugate gradient solver for large SPD systems, where a dense factorization would be too
  expensive.

  Problem sizes here are the number of inducing points (tens to hundreds), so these are plain loops with no
  blocking; they are written to map onto BLAS calls directly if that is ever needed.

  Matrix storage is column-major as prescribed in qep_common.hpp.  Triangular matrices are always *lower* triangular
  and stored in the lower triangle; the contents of the strict upper triangle are ignored.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_HPP_
#define SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Computes ``\|x\|_2`` with scaling to prevent overflow and reduce precision loss.

  \param
    :vector[size]: the vector x
    :size: number of elements in x
  \return
    The vector 2-norm (aka Euclidean norm) of x.
\endrst*/
double VectorNorm(double const * restrict vector, int size) noexcept SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

/*!\rst
  Transposes a 2D matrix.

  For example, ``A[3][2] = [4 53 81 32 12 2]`` becomes ``A[2][3] = [4 32 53 12 81 2]``.

  \param
    :matrix[num_rows][num_cols]: matrix to be transposed
    :num_rows: number of rows in matrix
    :num_cols: number of columns in matrix
  \output
    :transpose[num_cols][num_rows]: transpose of matrix
\endrst*/
void MatrixTranspose(double const * restrict matrix, int num_rows, int num_cols, double * restrict transpose) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Zeroes the strict upper triangle of a (column-major) matrix.

  \param
    :size: dimension of matrix
    :matrix[size][size]: matrix whose upper tri is to be zeroed (on input)
  \output
    :matrix[size][size]: lower triangular part of input matrix
\endrst*/
void ZeroUpperTriangle(int size, double * restrict matrix) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Adds ``jitter`` to every diagonal entry of a square matrix: ``A := A + jitter * I``.

  \param
    :jitter: amount to add
    :size: dimension of matrix
    :matrix[size][size]: matrix to regularize
  \output
    :matrix[size][size]: input plus ``jitter * I``
\endrst*/
inline SQ_NONNULL_POINTERS void AddDiagonalJitter(double jitter, int size, double * restrict matrix) noexcept {
  for (int i = 0; i < size; ++i) {
    matrix[0] += jitter;
    matrix += size + 1;
  }
}

/*!\rst
  Multiplies first ``size`` elements of ``vector`` by ``alpha``, ``vector := vector*alpha``.

  Should be equivalent to BLAS call:
  ``dscal(size, alpha, vector, 1);``

  \param
    :size: number of elements in vector
    :alpha: number to scale by
    :vector[size]: vector to scale
  \output
    :vector[size]: vector with elements scaled
\endrst*/
inline SQ_NONNULL_POINTERS void VectorScale(int size, double alpha, double * restrict vector) noexcept {
  for (int i = 0; i < size; ++i) {
    vector[i] *= alpha;
  }
}

/*!\rst
  Computes ``y_i = alpha * x_i + y_i``; ``y`` is modified in-place.

  \param
    :size: number of elements in ``x, y``
    :alpha: quantity to scale by
    :vec1[size]: ``x``, vector to scale and add to ``y``
    :vec2[size]: ``y``, vector to add to
  \output
    :vec2[size]: input ``y`` plus ``alpha*x``
\endrst*/
inline SQ_NONNULL_POINTERS void VectorAXPY(int size, double alpha, double const * restrict vec1, double * restrict vec2) noexcept {
  for (int i = 0; i < size; ++i) {
    vec2[i] += alpha*vec1[i];
  }
}

/*!\rst
  Computes dot product between two vectors.

  Equivalent BLAS call:
  ``ddot(size, vector1, 1, vector2, 1);``

  \param
    :vector1[size]: first vector
    :vector2[size]: second vector
    :size: length of vectors
  \return
    dot/inner product, ``<vector1, vector2>``
\endrst*/
inline SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT double DotProduct(double const * restrict vector1, double const * restrict vector2, int size) noexcept {
  double sum = 0.0;
  for (int i = 0; i < size; ++i) {
    sum += vector1[i]*vector2[i];
  }
  return sum;
}

/*!\rst
  Computes the cholesky factorization of a symmetric, positive-definite (SPD) matrix,
  ``A = L * L^T``; ``A`` is the input matrix, ``L`` is the (lower triangular) cholesky factor.
  ``O(n^3)`` operations.

  Calling this function on a semi-definite matrix may result in a severe loss of precision.  Callers that expect
  merely PSD inputs (covariance matrices subject to rounding) should use PsdSafeCholesky() instead.

  The strict upper triangle of chol is NOT accessed.

  \param
    :size_m: dimension of matrix
    :chol[size_m][size_m]: SPD (square) matrix (``A``) (on entry)
  \output
    :chol[size_m][size_m]: cholesky factor of ``A`` (``L``) in the lower triangle (on exit)
  \return
    0 if successful. Otherwise the matrix is NOT positive definite and this returns ``i``, the
    index of the ``i``-th leading minor that is not positive definite.
\endrst*/
int ComputeCholeskyFactorL(int size_m, double * restrict chol) noexcept SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

/*!\rst
  Cholesky factorization of a matrix that is PSD in exact arithmetic but may have lost definiteness to rounding.

  First attempts a plain factorization.  On failure, adds ``jitter * 10^i`` to the diagonal for
  ``i = 0 .. max_tries-1`` and retries, logging a warning for each escalation.  The upper triangle of the output is
  zeroed, so ``chol`` can be used as a dense ``L``.

  \param
    :matrix[size_m][size_m]: symmetric matrix to factor (only the lower triangle is read)
    :size_m: dimension of matrix
    :jitter: initial jitter for the escalation (e.g., 1.0e-8 for double)
    :max_tries: number of escalation attempts after the plain factorization fails
  \output
    :chol[size_m][size_m]: cholesky factor of ``matrix + jitter_used * I``; strict upper triangle is 0
  \return
    the jitter that was added (0.0 if the plain factorization succeeded)
  \raise
    SingularMatrixException if the matrix contains NaN or every escalation fails
\endrst*/
double PsdSafeCholesky(double const * restrict matrix, int size_m, double jitter, int max_tries, double * restrict chol) SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

/*!\rst
  Computes ``\log|A| = 2 \sum_i \log L_{ii}`` from the Cholesky factor ``L`` of ``A``.

  \param
    :chol[size_m][size_m]: cholesky factor ``L`` (lower triangle)
    :size_m: dimension of ``L``
  \return
    log-determinant of ``A = L * L^T``
\endrst*/
double CholeskyLogDeterminant(double const * restrict chol, int size_m) noexcept SQ_PURE_FUNCTION SQ_NONNULL_POINTERS SQ_WARN_UNUSED_RESULT;

/*!\rst
  Eigen-decomposition of a symmetric matrix, ``A = V * diag(lambda) * V^T``, via the cyclic Jacobi method.
  Eigenvalues are returned in ascending order; column ``i`` of ``V`` is the eigenvector for ``lambda_i``.

  ``O(n^3)`` per sweep; the number of sweeps is small (quadratic convergence) for the matrix sizes seen here.

  \param
    :matrix[size_m][size_m]: symmetric matrix (both triangles must be valid)
    :size_m: dimension of matrix
  \output
    :eigenvalues[size_m]: eigenvalues, ascending
    :eigenvectors[size_m][size_m]: orthonormal eigenvectors, stored column-wise
  \return
    number of Jacobi sweeps performed
\endrst*/
int SymmetricEigenDecomposition(double const * restrict matrix, int size_m, double * restrict eigenvalues, double * restrict eigenvectors) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Solves ``A * x = b`` for SPD ``A`` with (unpreconditioned) conjugate gradients.  ``x`` starts at 0.
  Stops when ``\|r\|_2 <= tolerance * \|b\|_2`` or after ``max_iterations``.

  \param
    :A[size_m][size_m]: SPD matrix (both triangles must be valid)
    :b[size_m]: the RHS
    :size_m: dimension of ``A``
    :tolerance: relative residual tolerance
    :max_iterations: iteration cap
  \output
    :x[size_m]: the (approximate) solution
  \return
    number of iterations performed; ``max_iterations + 1`` if the tolerance was not reached
\endrst*/
int ConjugateGradientSolve(double const * restrict A, double const * restrict b, int size_m, double tolerance, int max_iterations, double * restrict x) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Solves ``A * x = b`` or ``A^T * x = b`` IN-PLACE when ``A`` is lower triangular (and nonsingular).
  Before calling, ``x`` holds the RHS, ``b``.  After return, ``x`` is OVERWRITTEN with the solution.

  DOES NOT form ``A^-1`` explicitly.

  \param
    :A[size_m][size_m]: lower triangular, non-singular matrix
    :trans: 'N' to solve ``A * x = b``, 'T' to solve ``A^T * x = b``
    :size_m: dimension of ``A``
    :lda: the first dimension of ``A`` as declared by the caller; ``lda >= size_m``
    :x[size_m]: the RHS vector, ``b``
  \output
    :x[size_m]: the solution, ``A\b``.
\endrst*/
void TriangularMatrixVectorSolve(double const * restrict A, char trans, int size_m, int lda, double * restrict x) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Solve ``A * X = B`` or ``A^T * X = B`` (``A, X, B`` matrices) IN-PLACE when ``A`` is lower triangular.

  \param
    :A[size_m][size_m]: lower triangular, non-singular matrix
    :trans: 'N' to solve ``A * X = B``, 'T' to solve ``A^T * X = B``
    :size_m: dimension of ``A``
    :size_n: number of columns of ``X, B``
    :lda: the first dimension of ``A`` as declared by the caller; ``lda >= size_m``
    :X[size_m][size_n]: the RHS matrix, ``B``
  \output
    :X[size_m][size_n]: the solution, ``A\B``.
\endrst*/
void TriangularMatrixMatrixSolve(double const * restrict A, char trans, int size_m, int size_n, int lda, double * restrict X) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Solves ``A * x = b`` IN-PLACE, where the lower triangle of ``A`` holds its Cholesky factor ``L``:
  ``x = L^T \ (L \ b)``.

  Should be equivalent to BLAS call:
  ``dpotrs('L', size_m, 1, A, size_m, x, size_m, &info);``

  \param
    :A[size_m][size_m]: matrix whose lower triangle contains ``L``
    :size_m: dimension of ``A``
    :x[size_m]: the RHS vector, ``b``
  \output
    :x[size_m]: the solution, ``A\b``.
\endrst*/
inline SQ_NONNULL_POINTERS void CholeskyFactorLMatrixVectorSolve(double const * restrict A, int size_m, double * restrict x) noexcept {
  TriangularMatrixVectorSolve(A, 'N', size_m, size_m, x);
  TriangularMatrixVectorSolve(A, 'T', size_m, size_m, x);
}

/*!\rst
  Multi-RHS version of CholeskyFactorLMatrixVectorSolve: solves ``A * X = B`` IN-PLACE.

  Should be equivalent to BLAS call:
  ``dpotrs('L', size_m, size_n, A, size_m, X, size_m, &info);``

  \param
    :A[size_m][size_m]: matrix holding ``L``, the cholesky factor of ``A``, in its lower triangle
    :size_m: number of rows of ``A, X, B``; number of columns of ``A``
    :size_n: number of columns of ``X, B``
    :X[size_m][size_n]: matrix of RHS vectors, ``B``
  \output
    :X[size_m][size_n]: matrix of solutions, ``A\B``
\endrst*/
inline SQ_NONNULL_POINTERS void CholeskyFactorLMatrixMatrixSolve(double const * restrict A, int size_m, int size_n, double * restrict X) noexcept {
  TriangularMatrixMatrixSolve(A, 'N', size_m, size_n, size_m, X);
  TriangularMatrixMatrixSolve(A, 'T', size_m, size_n, size_m, X);
}

/*!\rst
  Computes ``A * x`` or ``A^T * x`` IN-PLACE for lower-triangular ``A``.

  \param
    :A[size_m][size_m]: lower triangular matrix to be multiplied
    :trans: 'N' for ``A * x``, 'T' for ``A^T * x``
    :size_m: dimension of ``A, x``
    :x[size_m]: vector to multiply by ``A``
  \output
    :x[size_m]: ``A * x`` or ``A^T * x``
\endrst*/
void TriangularMatrixVectorMultiply(double const * restrict A, char trans, int size_m, double * restrict x) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Computes ``y = alpha * A * x + beta * y`` or ``y = alpha * A^T * x + beta * y``.

  Should be equivalent to BLAS call:
  ``dgemv(trans, size_m, size_n, alpha, A, lda, x, 1, beta, y, 1);``

  \param
    :A[size_m][size_n]: matrix to multiply
    :trans: 'N' for ``A * x``, 'T' for ``A^T * x``
    :x[size_n OR size_m]: vector to multiply (size_n if trans == 'N')
    :alpha: scale factor on ``A * x``
    :beta: scale factor on ``y``
    :size_m: number of rows of ``A``
    :size_n: number of columns of ``A``
    :lda: the first dimension of ``A`` as declared by the caller; ``lda >= size_m``
    :y[size_m OR size_n]: vector to add to (size_m if trans == 'N')
  \output
    :y[size_m OR size_n]: the result
\endrst*/
void GeneralMatrixVectorMultiply(double const * restrict A, char trans, double const * restrict x, double alpha, double beta, int size_m, int size_n, int lda, double * restrict y) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Computes ``C = alpha * op(A) * B + beta * C``, where ``op(A)`` is ``A`` or ``A^T``.

  Should be equivalent to BLAS call:
  ``dgemm(transA, 'N', size_m, size_n, size_k, alpha, A, lda, B, size_k, beta, C, size_m);``

  \param
    :A[size_m][size_k] (or A[size_k][size_m] if transA == 'T'): left matrix
    :transA: 'N' for ``A``, 'T' for ``A^T``
    :B[size_k][size_n]: right matrix
    :alpha: scale factor on ``op(A) * B``
    :beta: scale factor on ``C``
    :size_m: rows of ``op(A)`` and ``C``
    :size_k: columns of ``op(A)``; rows of ``B``
    :size_n: columns of ``B`` and ``C``
    :C[size_m][size_n]: matrix to add to
  \output
    :C[size_m][size_n]: the result
\endrst*/
void GeneralMatrixMatrixMultiply(double const * restrict Amat, char transA, double const * restrict Bmat, double alpha, double beta, int size_m, int size_k, int size_n, double * restrict Cmat) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Computes ``C = alpha * A * B^T + beta * C``; in particular ``R * R^T`` for a root ``R``.

  Should be equivalent to BLAS call:
  ``dgemm('N', 'T', size_m, size_n, size_k, alpha, A, size_m, B, size_n, beta, C, size_m);``

  \param
    :A[size_m][size_k]: left matrix
    :B[size_n][size_k]: right matrix (transposed in the product)
    :alpha: scale factor on ``A * B^T``
    :beta: scale factor on ``C``
    :size_m: rows of ``A`` and ``C``
    :size_k: columns of ``A`` and ``B``
    :size_n: rows of ``B``; columns of ``C``
    :C[size_m][size_n]: matrix to add to
  \output
    :C[size_m][size_n]: the result
\endrst*/
void GeneralMatrixMatrixTransposeMultiply(double const * restrict Amat, double const * restrict Bmat, double alpha, double beta, int size_m, int size_k, int size_n, double * restrict Cmat) noexcept SQ_NONNULL_POINTERS;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_HPP_
