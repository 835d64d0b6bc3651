/*!
  \file qep_linear_algebra.cpp
  \rst
  Implementations of the linear algebra routines in qep_linear_algebra.hpp; a small subset of BLAS and LAPACK plus a
  Jacobi eigensolver and a conjugate gradient solver.

  These do not call BLAS/LAPACK: for the matrix sizes in play (the number of inducing points), call overhead eats
  the advantage, and custom loops can assume our storage conventions.  The signatures map directly onto BLAS calls
  should that change.

  See qep_common.hpp for the storage and matrix-loop conventions; in summary we use::

    for (int i = 0; i < m; ++i) {
      y[i] = 0;
      for (int j = 0; j < n; ++j) {
        y[i] += A[j]*x[j];
      }
      A += n;
    }
\endrst*/

#include "qep_linear_algebra.hpp"

#include <cmath>

#include <algorithm>
#include <limits>
#include <numeric>
#include <vector>

#include "qep_common.hpp"
#include "qep_exception.hpp"
#include "qep_logging.hpp"

namespace sparse_qep {

/*!\rst
  Computing ``norm += Square(vector[i])`` can overflow and lose precision, so we track a running scale factor
  (as in the reference BLAS ``dnrm2``).
\endrst*/
double VectorNorm(double const * restrict vector, int size) noexcept {
  if (unlikely(size == 1)) {
    return std::fabs(vector[0]);
  }
  double scale = 0.0, scaled_norm = 1.0;
  for (int i = 0; i < size; ++i) {
    if (likely(vector[i] != 0.0)) {
      double abs_xi = std::fabs(vector[i]);
      if (scale < abs_xi) {
        double temp = scale/abs_xi;
        scaled_norm = 1.0 + scaled_norm * (temp*temp);
        scale = abs_xi;
      } else {
        double temp = abs_xi/scale;
        scaled_norm += temp*temp;
      }
    }
  }
  return scale * std::sqrt(scaled_norm);
}

void MatrixTranspose(double const * restrict matrix, int num_rows, int num_cols, double * restrict transpose) noexcept {
  for (int i = 0; i < num_rows; ++i) {
    for (int j = 0; j < num_cols; ++j) {
      transpose[j] = matrix[j*num_rows + i];
    }
    transpose += num_cols;
  }
}

void ZeroUpperTriangle(int size, double * restrict matrix) noexcept {
  for (int i = 0; i < size; ++i) {
    for (int j = 0; j < i; ++j) {
      matrix[j] = 0.0;
    }
    matrix += size;
  }
}

/*!\rst
  Outer-product formulation of ``A = L * L^T`` (see Golub, Van Loan 1983).  Not pivoted; a non-positive pivot stops
  the factorization and reports the failing leading minor.

  Should be the same as BLAS call:
  ``dpotrf('L', size_m, A, size_m, &info);``
\endrst*/
int ComputeCholeskyFactorL(int size_m, double * restrict chol) noexcept {
  double * restrict chol_temp = chol;
  // L_{ij} = chol[j*size_m + i] is the input matrix (on input) and its cholesky factor (on exit)
#define SQ_CHOL(i, j) chol[((j)*size_m + (i))]
  double A_kk;
  for (int k = 0; k < size_m; ++k) {
    if (likely(chol_temp[k] > 1.0e-16)) {
      // L_{kk} = \sqrt(A_{kk})
      A_kk = std::sqrt(chol_temp[k]);
      chol_temp[k] = A_kk;

      // L_{jk} = L_{jk}/L_{kk}, j = k+1..N
      for (int j = k+1; j < size_m; ++j) {
        chol_temp[j] /= A_kk;
      }

      // L_{ij} = L_{ij} - L_{ik}*L_{jk}, j=k+1..N and i=j..N
      for (int j = k+1; j < size_m; ++j) {
        for (int i = j; i < size_m; ++i) {
          SQ_CHOL(i, j) = SQ_CHOL(i, j) - SQ_CHOL(i, k) * SQ_CHOL(j, k);
        }
      }
    } else {
      SQ_VERBOSE_PRINTF("cholesky pivot %d not positive: %.18E\n", k, chol_temp[k]);
      return k + 1;
    }
    chol_temp += size_m;
  }
#undef SQ_CHOL

  return 0;
}

double PsdSafeCholesky(double const * restrict matrix, int size_m, double jitter, int max_tries, double * restrict chol) {
  for (int i = 0; i < size_m*size_m; ++i) {
    if (unlikely(std::isnan(matrix[i]))) {
      SQ_THROW_EXCEPTION(SingularMatrixException, "Matrix contains NaN.", matrix, size_m, i % size_m + 1, 0.0);
    }
  }

  std::copy(matrix, matrix + size_m*size_m, chol);
  int leading_minor = ComputeCholeskyFactorL(size_m, chol);
  if (likely(leading_minor == 0)) {
    ZeroUpperTriangle(size_m, chol);
    return 0.0;
  }

  double jitter_new = jitter;
  for (int i = 0; i < max_tries; ++i) {
    std::copy(matrix, matrix + size_m*size_m, chol);
    AddDiagonalJitter(jitter_new, size_m, chol);
    leading_minor = ComputeCholeskyFactorL(size_m, chol);
    if (leading_minor == 0) {
      SQ_WARNING_PRINTF("PsdSafeCholesky: %d x %d matrix not positive definite, added jitter of %.1E to the diagonal\n",
                        size_m, size_m, jitter_new);
      ZeroUpperTriangle(size_m, chol);
      return jitter_new;
    }
    jitter_new *= 10.0;
  }

  SQ_ERROR_PRINTF("PsdSafeCholesky: factorization failed after %d jitter attempts\n", max_tries);
  SQ_THROW_EXCEPTION(SingularMatrixException, "Matrix not positive definite even with jitter.", matrix, size_m,
                     leading_minor, jitter_new / 10.0);
}

double CholeskyLogDeterminant(double const * restrict chol, int size_m) noexcept {
  double log_determinant = 0.0;
  for (int i = 0; i < size_m; ++i) {
    log_determinant += std::log(chol[0]);
    chol += size_m + 1;
  }
  return 2.0*log_determinant;
}

/*!\rst
  Cyclic Jacobi (Golub, Van Loan 1996, 8.4).  Each rotation ``J(p, q, theta)`` zeroes ``A_{pq}``; ``A := J^T A J`` and
  ``V := V J``.  Sweeps repeat until the off-diagonal Frobenius norm falls below ``eps * \|A\|_F``.
\endrst*/
int SymmetricEigenDecomposition(double const * restrict matrix, int size_m, double * restrict eigenvalues, double * restrict eigenvectors) noexcept {
  static const int kMaxSweeps = 100;
  std::vector<double> A(matrix, matrix + size_m*size_m);
  std::vector<double> V(size_m*size_m, 0.0);
  AddDiagonalJitter(1.0, size_m, V.data());

#define SQ_A(i, j) A[(j)*size_m + (i)]
#define SQ_V(i, j) V[(j)*size_m + (i)]
  double frobenius_norm = VectorNorm(A.data(), size_m*size_m);
  const double tolerance = std::numeric_limits<double>::epsilon() * std::max(frobenius_norm, std::numeric_limits<double>::min());

  int sweep = 0;
  for (; sweep < kMaxSweeps; ++sweep) {
    double off_diagonal = 0.0;
    for (int q = 0; q < size_m; ++q) {
      for (int p = 0; p < q; ++p) {
        off_diagonal += 2.0*Square(SQ_A(p, q));
      }
    }
    if (std::sqrt(off_diagonal) <= tolerance) {
      break;
    }

    for (int p = 0; p < size_m - 1; ++p) {
      for (int q = p + 1; q < size_m; ++q) {
        double a_pq = SQ_A(p, q);
        if (a_pq == 0.0) {
          continue;
        }
        double theta = (SQ_A(q, q) - SQ_A(p, p)) / (2.0*a_pq);
        double t = (theta >= 0.0 ? 1.0 : -1.0) / (std::fabs(theta) + std::sqrt(theta*theta + 1.0));
        double c = 1.0 / std::sqrt(t*t + 1.0);
        double s = t*c;

        for (int k = 0; k < size_m; ++k) {
          double a_kp = SQ_A(k, p);
          double a_kq = SQ_A(k, q);
          SQ_A(k, p) = c*a_kp - s*a_kq;
          SQ_A(k, q) = s*a_kp + c*a_kq;
        }
        for (int k = 0; k < size_m; ++k) {
          double a_pk = SQ_A(p, k);
          double a_qk = SQ_A(q, k);
          SQ_A(p, k) = c*a_pk - s*a_qk;
          SQ_A(q, k) = s*a_pk + c*a_qk;
        }
        for (int k = 0; k < size_m; ++k) {
          double v_kp = SQ_V(k, p);
          double v_kq = SQ_V(k, q);
          SQ_V(k, p) = c*v_kp - s*v_kq;
          SQ_V(k, q) = s*v_kp + c*v_kq;
        }
      }
    }
  }
  if (sweep == kMaxSweeps) {
    SQ_WARNING_PRINTF("SymmetricEigenDecomposition: Jacobi did not converge in %d sweeps\n", kMaxSweeps);
  }

  // sort ascending, permuting eigenvector columns along with the eigenvalues
  std::vector<int> order(size_m);
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&A, size_m](int i, int j) {
      return A[i*size_m + i] < A[j*size_m + j];
    });
  for (int i = 0; i < size_m; ++i) {
    eigenvalues[i] = SQ_A(order[i], order[i]);
    std::copy(V.begin() + order[i]*size_m, V.begin() + (order[i] + 1)*size_m, eigenvectors);
    eigenvectors += size_m;
  }
#undef SQ_A
#undef SQ_V

  return sweep;
}

/*!\rst
  Hestenes-Stiefel conjugate gradients (Golub, Van Loan 1996, 10.2).  One matrix-vector product per iteration.
\endrst*/
int ConjugateGradientSolve(double const * restrict A, double const * restrict b, int size_m, double tolerance, int max_iterations, double * restrict x) noexcept {
  std::fill(x, x + size_m, 0.0);
  std::vector<double> residual(b, b + size_m);
  std::vector<double> direction(b, b + size_m);
  std::vector<double> A_direction(size_m);

  const double b_norm = VectorNorm(b, size_m);
  if (b_norm == 0.0) {
    return 0;
  }
  double residual_norm_sq = DotProduct(residual.data(), residual.data(), size_m);

  for (int iteration = 0; iteration < max_iterations; ++iteration) {
    if (std::sqrt(residual_norm_sq) <= tolerance*b_norm) {
      return iteration;
    }
    GeneralMatrixVectorMultiply(A, 'N', direction.data(), 1.0, 0.0, size_m, size_m, size_m, A_direction.data());
    double step = residual_norm_sq / DotProduct(direction.data(), A_direction.data(), size_m);
    VectorAXPY(size_m, step, direction.data(), x);
    VectorAXPY(size_m, -step, A_direction.data(), residual.data());

    double residual_norm_sq_new = DotProduct(residual.data(), residual.data(), size_m);
    double beta = residual_norm_sq_new / residual_norm_sq;
    for (int i = 0; i < size_m; ++i) {
      direction[i] = residual[i] + beta*direction[i];
    }
    residual_norm_sq = residual_norm_sq_new;
  }

  if (std::sqrt(residual_norm_sq) <= tolerance*b_norm) {
    return max_iterations;
  }
  SQ_VERBOSE_PRINTF("ConjugateGradientSolve: relative residual %.3E after %d iterations\n",
                    std::sqrt(residual_norm_sq) / b_norm, max_iterations);
  return max_iterations + 1;
}

/*!\rst
  Backsolve; backward-stable, unlike forming ``A^-1``.

  Should be equiv to BLAS call:
  ``dtrsv('L', trans, 'N', size_m, A, lda, x, 1);``
\endrst*/
void TriangularMatrixVectorSolve(double const * restrict A, char trans, int size_m, int lda, double * restrict x) noexcept {
  double temp;
  if (trans == 'N') {  // solve A*x = b, A lower tri
    // work forward since the first unknown has the form A_{00}*x_0 = b_0
    for (int j = 0; j < size_m; ++j) {
      // if b_j == 0, then x_j = 0
      if (x[j] != 0.0) {
        x[j] /= A[j];
        temp = x[j];

        // remove solved value from the rest of RHS
        for (int i = j+1; i < size_m; ++i) {
          x[i] = x[i] - temp*A[i];
        }
      }
      A += lda;
    }
  } else {  // solve A^T * x = b, A is lower tri
    // now the LAST unknown is the easy one, so work backwards
    A += lda*(size_m-1);
    for (int j = size_m-1; j >= 0; --j) {
      temp = x[j];
      for (int i = size_m-1; i >= j+1; --i) {
        temp -= A[i]*x[i];
      }
      temp /= A[j];
      x[j] = temp;
      A -= lda;
    }
  }
}

/*!\rst
  One TriangularMatrixVectorSolve per column of ``X``.

  Should be equiv to BLAS call:
  ``dtrsm('L', 'L', trans, 'N', size_m, size_n, 1.0, A, lda, B, size_m);``
\endrst*/
void TriangularMatrixMatrixSolve(double const * restrict A, char trans, int size_m, int size_n, int lda, double * restrict X) noexcept {
  for (int k = 0; k < size_n; ++k) {
    TriangularMatrixVectorSolve(A, trans, size_m, lda, X);
    X += size_m;
  }
}

/*!\rst
  Avoids the strict upper triangle of A; in-place, so 'N' works backwards.

  Should be equivalent to BLAS call:
  ``dtrmv('L', trans, 'N', size_m, A, size_m, x, 1);``
\endrst*/
void TriangularMatrixVectorMultiply(double const * restrict A, char trans, int size_m, double * restrict x) noexcept {
  double temp;

  if ('N' == trans) {  // x = A * x
    A += size_m * (size_m-1);
    for (int j = size_m-1; j >= 0; --j) {
      temp = x[j];
      for (int i = size_m-1; i >= j+1; --i) {
        // sub-diagonal contributions from j-th column
        x[i] += temp*A[i];
      }
      x[j] *= A[j];
      A -= size_m;
    }
  } else {  // x = A^T * x; the j-th column of A acts as its j-th row
    for (int j = 0; j < size_m; ++j) {
      temp = x[j] * A[j];
      for (int i = j+1; i < size_m; ++i) {
        temp += A[i]*x[i];
      }
      x[j] = temp;
      A += size_m;
    }
  }
}

/*!\rst
  'N': ``y`` is the weighted sum of the columns of ``A``.  'T': ``y_i`` is the dot product of column ``i`` with ``x``.

  Should be equivalent to BLAS call:
  ``dgemv(trans, size_m, size_n, alpha, A, lda, x, 1, beta, y, 1);``
\endrst*/
void GeneralMatrixVectorMultiply(double const * restrict A, char trans, double const * restrict x, double alpha, double beta, int size_m, int size_n, int lda, double * restrict y) noexcept {
  double temp;

  if (beta != 1.0) {
    int leny = (trans == 'N') ? size_m : size_n;
    if (likely(beta == 0.0)) {
      std::fill(y, y+leny, 0.0);
    } else {
      VectorScale(leny, beta, y);
    }
  }

  if (likely(trans == 'N')) {
    for (int i = 0; i < size_n; ++i) {
      temp = alpha*x[i];
      for (int j = 0; j < size_m; ++j) {
        y[j] += A[j]*temp;
      }
      A += lda;
    }
  } else {
    for (int i = 0; i < size_n; ++i) {
      temp = 0.0;
      for (int j = 0; j < size_m; ++j) {
        temp += A[j]*x[j];
      }
      y[i] += alpha*temp;
      A += lda;
    }
  }
}

/*!\rst
  One matrix-vector product per column of ``B``.
\endrst*/
void GeneralMatrixMatrixMultiply(double const * restrict Amat, char transA, double const * restrict Bmat, double alpha, double beta, int size_m, int size_k, int size_n, double * restrict Cmat) noexcept {
  if (transA == 'N') {
    for (int j = 0; j < size_n; ++j) {
      GeneralMatrixVectorMultiply(Amat, 'N', Bmat, alpha, beta, size_m, size_k, size_m, Cmat);
      Bmat += size_k;
      Cmat += size_m;
    }
  } else {
    for (int j = 0; j < size_n; ++j) {
      GeneralMatrixVectorMultiply(Amat, 'T', Bmat, alpha, beta, size_k, size_m, size_k, Cmat);
      Bmat += size_k;
      Cmat += size_m;
    }
  }
}

/*!\rst
  Sum of rank-1 updates, ``C += alpha * A_l * B_l^T`` over the columns ``l`` of ``A`` and ``B``.
\endrst*/
void GeneralMatrixMatrixTransposeMultiply(double const * restrict Amat, double const * restrict Bmat, double alpha, double beta, int size_m, int size_k, int size_n, double * restrict Cmat) noexcept {
  if (beta != 1.0) {
    if (likely(beta == 0.0)) {
      std::fill(Cmat, Cmat + size_m*size_n, 0.0);
    } else {
      VectorScale(size_m*size_n, beta, Cmat);
    }
  }

  for (int l = 0; l < size_k; ++l) {
    double * restrict C_column = Cmat;
    for (int j = 0; j < size_n; ++j) {
      double temp = alpha*Bmat[j];
      if (temp != 0.0) {
        for (int i = 0; i < size_m; ++i) {
          C_column[i] += Amat[i]*temp;
        }
      }
      C_column += size_m;
    }
    Amat += size_m;
    Bmat += size_n;
  }
}

}  // end namespace sparse_qep
