/*!
  \file qep_batch_matrix.hpp
  \rst
  Batches of equally sized, column-major matrices and the numpy-style broadcasting rules for their batch shapes.

  **Batch shapes**

  A ``BatchShape`` lists the leading batch dimensions, outermost first; e.g., ``{S, Q}`` describes ``S*Q`` matrices.
  The empty shape ``{}`` describes a single matrix.  Batch elements are numbered in row-major order over the shape
  (the LAST batch dimension varies fastest).

  Two shapes broadcast if, after left-padding the shorter with 1s, every dimension pair is equal or contains a 1; the
  result takes the larger size in each slot.  Failure to broadcast throws ShapeMismatchException.

  **Storage**

  Batch element ``b`` of a BatchMatrix occupies ``data[b*num_rows*num_cols, (b+1)*num_rows*num_cols)``, stored
  column-major (see qep_common.hpp).  Vectors are ``num_cols == 1``.

  Point sets ``X`` with ``N`` points in ``D`` dimensions follow the ``points[num_points][dim]`` convention:
  ``num_rows == D``, ``num_cols == N``, so each point is one contiguous column.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_BATCH_MATRIX_HPP_
#define SPARSE_QEP_CPP_QEP_BATCH_MATRIX_HPP_

#include <vector>

#include "qep_common.hpp"

namespace sparse_qep {

using BatchShape = std::vector<int>;

/*!\rst
  \return
    number of matrices described by ``batch_shape`` (product of its entries; 1 for the empty shape)
\endrst*/
int BatchSize(const BatchShape& batch_shape) noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT;

/*!\rst
  Broadcasts two batch shapes numpy-style.

  \param
    :shape1: first batch shape
    :shape2: second batch shape
  \return
    the broadcast shape
  \raise
    ShapeMismatchException if some dimension pair is unequal and neither entry is 1
\endrst*/
BatchShape BroadcastShapes(const BatchShape& shape1, const BatchShape& shape2) SQ_WARN_UNUSED_RESULT;

/*!\rst
  Maps the flattened index of a batch element of the broadcast shape ``full_shape`` to the flattened index of the
  element of ``sub_shape`` that broadcasts onto it.  ``sub_shape`` must be broadcastable to ``full_shape`` (no checks).
\endrst*/
int BroadcastIndex(const BatchShape& full_shape, int full_index, const BatchShape& sub_shape) noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT;

/*!\rst
  Converts a (possibly negative, python-style) batch dimension index into ``[0, size)``.

  \raise
    BoundsException if ``dim`` is not in ``[-size, size)``
\endrst*/
int NormalizeBatchDim(int dim, int size) SQ_WARN_UNUSED_RESULT;

/*!\rst
  A batch of ``BatchSize(batch_shape)`` column-major ``num_rows x num_cols`` matrices.
\endrst*/
struct BatchMatrix {
  BatchMatrix() : batch_shape(), num_rows(0), num_cols(0), data() {
  }

  //! all entries are zero-initialized
  BatchMatrix(const BatchShape& batch_shape_in, int num_rows_in, int num_cols_in);

  /*!\rst
    \raise
      InvalidValueException<int> if ``data_in.size()`` is not ``BatchSize(batch_shape) * num_rows * num_cols``
  \endrst*/
  BatchMatrix(const BatchShape& batch_shape_in, int num_rows_in, int num_cols_in, std::vector<double> data_in);

  int batch_size() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return BatchSize(batch_shape);
  }

  int matrix_size() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return num_rows*num_cols;
  }

  double * element(int batch_index) noexcept SQ_WARN_UNUSED_RESULT {
    return data.data() + batch_index*matrix_size();
  }

  double const * element(int batch_index) const noexcept SQ_WARN_UNUSED_RESULT {
    return data.data() + batch_index*matrix_size();
  }

  /*!\rst
    Copies this batch onto the (broadcast-compatible) ``new_batch_shape``.

    \raise
      ShapeMismatchException if ``batch_shape`` does not broadcast to ``new_batch_shape``
  \endrst*/
  BatchMatrix Expand(const BatchShape& new_batch_shape) const SQ_WARN_UNUSED_RESULT;

  /*!\rst
    Inserts a new batch dimension of extent ``size`` at position ``dim`` (negative counts from the end, so
    ``-1`` appends) and replicates every matrix along it.
  \endrst*/
  BatchMatrix Unsqueeze(int dim, int size) const SQ_WARN_UNUSED_RESULT;

  /*!\rst
    Sums the batch elements along batch dimension ``dim`` (negative counts from the end), removing that dimension.
  \endrst*/
  BatchMatrix SumBatchDim(int dim) const SQ_WARN_UNUSED_RESULT;

  /*!\rst
    Extracts the sub-batch at position ``index`` of batch dimension ``dim``, removing that dimension.
  \endrst*/
  BatchMatrix Select(int dim, int index) const SQ_WARN_UNUSED_RESULT;

  //! transposes every matrix in the batch
  BatchMatrix Transpose() const SQ_WARN_UNUSED_RESULT;

  //! shapes equal and data bitwise equal
  bool operator==(const BatchMatrix& other) const noexcept SQ_WARN_UNUSED_RESULT;

  bool operator!=(const BatchMatrix& other) const noexcept SQ_WARN_UNUSED_RESULT {
    return !(*this == other);
  }

  BatchShape batch_shape;
  int num_rows;
  int num_cols;
  std::vector<double> data;
};

/*!\rst
  Horizontal concatenation ``[A, B]`` of two batches with equal ``num_rows``, after broadcasting their batch shapes.
  With the point-set convention this is the union of the point sets (``A``'s points first).

  \raise
    InvalidValueException<int> if the row counts differ; ShapeMismatchException if the batch shapes do not broadcast
\endrst*/
BatchMatrix ConcatenateColumns(const BatchMatrix& matrix_a, const BatchMatrix& matrix_b) SQ_WARN_UNUSED_RESULT;

/*!\rst
  Forms a batch of ``num_rows x num_rows`` identity matrices.
\endrst*/
BatchMatrix IdentityBatch(const BatchShape& batch_shape, int num_rows) SQ_WARN_UNUSED_RESULT;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_BATCH_MATRIX_HPP_
