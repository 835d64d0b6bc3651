/*!
  \file qep_batch_matrix.cpp
  \rst
  Implementation of batch shape broadcasting and the BatchMatrix reshaping operations.

  All reshaping goes through the same pattern: decompose a flattened (row-major) batch index into a multi-index,
  edit the multi-index, and recompose.  Batches are small (tens of elements), so this is never a bottleneck.
\endrst*/

#include "qep_batch_matrix.hpp"

#include <algorithm>
#include <cstring>
#include <utility>
#include <vector>

#include "qep_common.hpp"
#include "qep_exception.hpp"
#include "qep_linear_algebra.hpp"

namespace sparse_qep {

namespace {

/*!\rst
  Writes the row-major multi-index of ``flat_index`` in ``batch_shape`` into ``multi_index`` (resized to fit).
\endrst*/
void DecomposeBatchIndex(const BatchShape& batch_shape, int flat_index, std::vector<int> * multi_index) {
  multi_index->resize(batch_shape.size());
  for (int i = static_cast<int>(batch_shape.size()) - 1; i >= 0; --i) {
    (*multi_index)[i] = flat_index % batch_shape[i];
    flat_index /= batch_shape[i];
  }
}

int ComposeBatchIndex(const BatchShape& batch_shape, const std::vector<int>& multi_index) noexcept {
  int flat_index = 0;
  for (int i = 0; i < static_cast<int>(batch_shape.size()); ++i) {
    flat_index = flat_index*batch_shape[i] + multi_index[i];
  }
  return flat_index;
}

}  // end unnamed namespace

int BatchSize(const BatchShape& batch_shape) noexcept {
  int size = 1;
  for (const auto& dim : batch_shape) {
    size *= dim;
  }
  return size;
}

BatchShape BroadcastShapes(const BatchShape& shape1, const BatchShape& shape2) {
  const int rank1 = shape1.size();
  const int rank2 = shape2.size();
  const int rank = std::max(rank1, rank2);
  BatchShape result(rank);
  for (int i = 0; i < rank; ++i) {
    // walk from the trailing dimension; missing leading dims act as 1
    const int dim1 = (i < rank1) ? shape1[rank1 - 1 - i] : 1;
    const int dim2 = (i < rank2) ? shape2[rank2 - 1 - i] : 1;
    if (dim1 == dim2 || dim2 == 1) {
      result[rank - 1 - i] = dim1;
    } else if (dim1 == 1) {
      result[rank - 1 - i] = dim2;
    } else {
      SQ_THROW_EXCEPTION(ShapeMismatchException, "Batch shapes are not broadcastable.", shape1, shape2);
    }
  }
  return result;
}

int BroadcastIndex(const BatchShape& full_shape, int full_index, const BatchShape& sub_shape) noexcept {
  const int full_rank = full_shape.size();
  const int sub_rank = sub_shape.size();
  int sub_index = 0;
  int stride = 1;
  for (int i = 0; i < sub_rank; ++i) {
    const int full_dim = full_shape[full_rank - 1 - i];
    const int coordinate = full_index % full_dim;
    full_index /= full_dim;
    const int sub_dim = sub_shape[sub_rank - 1 - i];
    if (sub_dim != 1) {
      sub_index += coordinate*stride;
    }
    stride *= sub_dim;
  }
  return sub_index;
}

int NormalizeBatchDim(int dim, int size) {
  if (unlikely(dim < -size || dim >= size)) {
    SQ_THROW_EXCEPTION(BoundsException<int>, "Batch dimension out of range.", dim, -size, size - 1);
  }
  return (dim < 0) ? dim + size : dim;
}

BatchMatrix::BatchMatrix(const BatchShape& batch_shape_in, int num_rows_in, int num_cols_in)
    : batch_shape(batch_shape_in),
      num_rows(num_rows_in),
      num_cols(num_cols_in),
      data(BatchSize(batch_shape_in)*num_rows_in*num_cols_in, 0.0) {
}

BatchMatrix::BatchMatrix(const BatchShape& batch_shape_in, int num_rows_in, int num_cols_in, std::vector<double> data_in)
    : batch_shape(batch_shape_in),
      num_rows(num_rows_in),
      num_cols(num_cols_in),
      data(std::move(data_in)) {
  const int expected_size = BatchSize(batch_shape)*num_rows*num_cols;
  if (unlikely(static_cast<int>(data.size()) != expected_size)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "BatchMatrix data size does not match its shape.", static_cast<int>(data.size()), expected_size);
  }
}

BatchMatrix BatchMatrix::Expand(const BatchShape& new_batch_shape) const {
  if (unlikely(BroadcastShapes(batch_shape, new_batch_shape) != new_batch_shape)) {
    SQ_THROW_EXCEPTION(ShapeMismatchException, "Cannot expand to a smaller batch shape.", batch_shape, new_batch_shape);
  }
  if (new_batch_shape == batch_shape) {
    return *this;
  }

  BatchMatrix result(new_batch_shape, num_rows, num_cols);
  const int size = matrix_size();
  for (int b = 0; b < result.batch_size(); ++b) {
    const int source = BroadcastIndex(new_batch_shape, b, batch_shape);
    std::copy(element(source), element(source) + size, result.element(b));
  }
  return result;
}

BatchMatrix BatchMatrix::Unsqueeze(int dim, int size) const {
  const int new_rank = batch_shape.size() + 1;
  const int position = NormalizeBatchDim(dim, new_rank);
  BatchShape new_batch_shape(batch_shape);
  new_batch_shape.insert(new_batch_shape.begin() + position, size);

  BatchMatrix result(new_batch_shape, num_rows, num_cols);
  const int matrix_length = matrix_size();
  std::vector<int> multi_index;
  for (int b = 0; b < result.batch_size(); ++b) {
    DecomposeBatchIndex(new_batch_shape, b, &multi_index);
    multi_index.erase(multi_index.begin() + position);
    const int source = ComposeBatchIndex(batch_shape, multi_index);
    std::copy(element(source), element(source) + matrix_length, result.element(b));
  }
  return result;
}

BatchMatrix BatchMatrix::SumBatchDim(int dim) const {
  const int position = NormalizeBatchDim(dim, batch_shape.size());
  BatchShape new_batch_shape(batch_shape);
  new_batch_shape.erase(new_batch_shape.begin() + position);

  BatchMatrix result(new_batch_shape, num_rows, num_cols);
  const int matrix_length = matrix_size();
  std::vector<int> multi_index;
  for (int b = 0; b < batch_size(); ++b) {
    DecomposeBatchIndex(batch_shape, b, &multi_index);
    multi_index.erase(multi_index.begin() + position);
    const int target = ComposeBatchIndex(new_batch_shape, multi_index);
    VectorAXPY(matrix_length, 1.0, element(b), result.element(target));
  }
  return result;
}

BatchMatrix BatchMatrix::Select(int dim, int index) const {
  const int position = NormalizeBatchDim(dim, batch_shape.size());
  if (unlikely(index < 0 || index >= batch_shape[position])) {
    SQ_THROW_EXCEPTION(BoundsException<int>, "Select index out of range.", index, 0, batch_shape[position] - 1);
  }
  BatchShape new_batch_shape(batch_shape);
  new_batch_shape.erase(new_batch_shape.begin() + position);

  BatchMatrix result(new_batch_shape, num_rows, num_cols);
  const int matrix_length = matrix_size();
  std::vector<int> multi_index;
  for (int b = 0; b < result.batch_size(); ++b) {
    DecomposeBatchIndex(new_batch_shape, b, &multi_index);
    multi_index.insert(multi_index.begin() + position, index);
    const int source = ComposeBatchIndex(batch_shape, multi_index);
    std::copy(element(source), element(source) + matrix_length, result.element(b));
  }
  return result;
}

BatchMatrix BatchMatrix::Transpose() const {
  BatchMatrix result(batch_shape, num_cols, num_rows);
  for (int b = 0; b < batch_size(); ++b) {
    MatrixTranspose(element(b), num_rows, num_cols, result.element(b));
  }
  return result;
}

bool BatchMatrix::operator==(const BatchMatrix& other) const noexcept {
  if (batch_shape != other.batch_shape || num_rows != other.num_rows || num_cols != other.num_cols) {
    return false;
  }
  // bitwise; -0.0 != 0.0 here
  return data.empty() || std::memcmp(data.data(), other.data.data(), data.size()*sizeof(double)) == 0;
}

BatchMatrix ConcatenateColumns(const BatchMatrix& matrix_a, const BatchMatrix& matrix_b) {
  if (unlikely(matrix_a.num_rows != matrix_b.num_rows)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Row counts of concatenated matrices differ.", matrix_b.num_rows, matrix_a.num_rows);
  }
  const BatchShape batch_shape = BroadcastShapes(matrix_a.batch_shape, matrix_b.batch_shape);
  BatchMatrix result(batch_shape, matrix_a.num_rows, matrix_a.num_cols + matrix_b.num_cols);
  const int size_a = matrix_a.matrix_size();
  const int size_b = matrix_b.matrix_size();
  for (int b = 0; b < result.batch_size(); ++b) {
    double const * const source_a = matrix_a.element(BroadcastIndex(batch_shape, b, matrix_a.batch_shape));
    double const * const source_b = matrix_b.element(BroadcastIndex(batch_shape, b, matrix_b.batch_shape));
    double * target = result.element(b);
    std::copy(source_a, source_a + size_a, target);
    std::copy(source_b, source_b + size_b, target + size_a);
  }
  return result;
}

BatchMatrix IdentityBatch(const BatchShape& batch_shape, int num_rows) {
  BatchMatrix result(batch_shape, num_rows, num_rows);
  for (int b = 0; b < result.batch_size(); ++b) {
    AddDiagonalJitter(1.0, num_rows, result.element(b));
  }
  return result;
}

}  // end namespace sparse_qep
