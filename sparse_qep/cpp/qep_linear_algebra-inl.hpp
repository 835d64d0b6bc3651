/*!
  \file qep_linear_algebra-inl.hpp
  \rst
  Inline rank-1 updates for qep_linear_algebra; kept out of the main header since only a few callers need them.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_INL_HPP_
#define SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_INL_HPP_

#include "qep_common.hpp"
#include "qep_linear_algebra.hpp"

namespace sparse_qep {

/*!\rst
  Computes ``A = alpha*v*u^T + A`` (aka ``A_{ij} += alpha * v_i * u_j``).  With ``v == u`` the update is symmetric and
  semi-definite; this is how rank-1 coregionalization factors ``a * a^T`` are formed.

  \param
    :size_m: length of ``v``
    :size_n: length of ``u``
    :alpha: scaling factor
    :vector_v[size_m]: the vector ``v``
    :vector_u[size_n]: the vector ``u``
    :outer_prod[size_m][size_n]: the matrix ``A`` to update
  \output
    :outer_prod[size_m][size_n]: ``A + alpha * v * u^T``
\endrst*/
inline SQ_NONNULL_POINTERS void OuterProduct(int size_m, int size_n, double alpha, double const * restrict vector_v, double const * restrict vector_u, double * restrict outer_prod) noexcept {
  for (int j = 0; j < size_n; ++j) {
    VectorAXPY(size_m, alpha*vector_u[j], vector_v, outer_prod + j*size_m);
  }
}

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_LINEAR_ALGEBRA_INL_HPP_
