/*!
  \file qep_batch_matrix_test.cpp
  \rst
  Routines to test BatchMatrix and batch shape broadcasting.  Inputs are small enough that expected results are
  written out by hand.
\endrst*/

#include "qep_batch_matrix_test.hpp"

#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_exception.hpp"
#include "qep_logging.hpp"
#include "qep_test_utils.hpp"

namespace sparse_qep {

namespace {

/*!\rst
  A batch whose every entry encodes its position: ``100*b + (column*num_rows + row)``.
\endrst*/
BatchMatrix BuildIndexedBatch(const BatchShape& batch_shape, int num_rows, int num_cols) {
  BatchMatrix result(batch_shape, num_rows, num_cols);
  for (int b = 0; b < result.batch_size(); ++b) {
    for (int i = 0; i < result.matrix_size(); ++i) {
      result.element(b)[i] = 100.0*b + i;
    }
  }
  return result;
}

SQ_WARN_UNUSED_RESULT int TestBroadcastShapes() {
  int total_errors = 0;

  total_errors += CheckBatchShapeEquals(BroadcastShapes({3, 1}, {4}), {3, 4});
  total_errors += CheckBatchShapeEquals(BroadcastShapes({}, {2, 5}), {2, 5});
  total_errors += CheckBatchShapeEquals(BroadcastShapes({2, 1, 5}, {3, 1}), {2, 3, 5});
  total_errors += CheckBatchShapeEquals(BroadcastShapes({}, {}), {});
  total_errors += CheckThrows<ShapeMismatchException>("BroadcastShapes({3}, {4})", []() {
      return BroadcastShapes({3}, {4});
    });

  if (!CheckIntEquals(BatchSize({}), 1)) {
    ++total_errors;
  }
  if (!CheckIntEquals(BatchSize({2, 3, 4}), 24)) {
    ++total_errors;
  }

  // element (i, j) of {3, 4} comes from element i of {3, 1} and element j of {4}
  const BatchShape full_shape = {3, 4};
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 4; ++j) {
      if (!CheckIntEquals(BroadcastIndex(full_shape, i*4 + j, {3, 1}), i)) {
        ++total_errors;
      }
      if (!CheckIntEquals(BroadcastIndex(full_shape, i*4 + j, {4}), j)) {
        ++total_errors;
      }
      if (!CheckIntEquals(BroadcastIndex(full_shape, i*4 + j, {}), 0)) {
        ++total_errors;
      }
    }
  }

  if (!CheckIntEquals(NormalizeBatchDim(-1, 3), 2)) {
    ++total_errors;
  }
  if (!CheckIntEquals(NormalizeBatchDim(1, 3), 1)) {
    ++total_errors;
  }
  total_errors += CheckThrows<BoundsException<int> >("NormalizeBatchDim(3, 3)", []() {
      return NormalizeBatchDim(3, 3);
    });
  total_errors += CheckThrows<BoundsException<int> >("NormalizeBatchDim(-4, 3)", []() {
      return NormalizeBatchDim(-4, 3);
    });

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestConstructionAndExpand() {
  int total_errors = 0;

  total_errors += CheckThrows<InvalidValueException<int> >("BatchMatrix with bad data size", []() {
      return BatchMatrix({2}, 2, 2, std::vector<double>(7, 0.0));
    });

  const BatchMatrix identity = IdentityBatch({2}, 3);
  const std::vector<double> identity_truth = {1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
  for (int b = 0; b < 2; ++b) {
    if (!CheckMatrixNormWithin(identity.element(b), identity_truth.data(), 3, 3, 0.0)) {
      ++total_errors;
    }
  }

  // {3, 1} -> {2, 3, 4}: element (a, i, j) is a copy of source element i
  const BatchMatrix source = BuildIndexedBatch({3, 1}, 2, 1);
  const BatchMatrix expanded = source.Expand({2, 3, 4});
  total_errors += CheckBatchShapeEquals(expanded.batch_shape, {2, 3, 4});
  for (int a = 0; a < 2; ++a) {
    for (int i = 0; i < 3; ++i) {
      for (int j = 0; j < 4; ++j) {
        if (!CheckMatrixNormWithin(expanded.element((a*3 + i)*4 + j), source.element(i), 2, 1, 0.0)) {
          ++total_errors;
        }
      }
    }
  }
  if (source.Expand({3, 1}) != source) {
    SQ_ERROR_PRINTF("Expand onto the same shape changed the batch\n");
    ++total_errors;
  }
  total_errors += CheckThrows<ShapeMismatchException>("Expand({3, 1}) onto {4}", [&source]() {
      return source.Expand({4});
    });
  total_errors += CheckThrows<ShapeMismatchException>("Expand({3, 1}) onto {1}", [&source]() {
      return source.Expand({1});
    });

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestReshaping() {
  int total_errors = 0;
  const BatchMatrix source = BuildIndexedBatch({3}, 2, 2);

  // trailing insertion: (i, k) <- i
  const BatchMatrix appended = source.Unsqueeze(-1, 2);
  total_errors += CheckBatchShapeEquals(appended.batch_shape, {3, 2});
  for (int i = 0; i < 3; ++i) {
    for (int k = 0; k < 2; ++k) {
      if (!CheckMatrixNormWithin(appended.element(i*2 + k), source.element(i), 2, 2, 0.0)) {
        ++total_errors;
      }
    }
  }

  // leading insertion: (k, i) <- i
  const BatchMatrix prepended = source.Unsqueeze(0, 2);
  total_errors += CheckBatchShapeEquals(prepended.batch_shape, {2, 3});
  for (int k = 0; k < 2; ++k) {
    for (int i = 0; i < 3; ++i) {
      if (!CheckMatrixNormWithin(prepended.element(k*3 + i), source.element(i), 2, 2, 0.0)) {
        ++total_errors;
      }
    }
  }

  // summing over the replicated dimension scales by its extent
  const BatchMatrix summed = appended.SumBatchDim(-1);
  BatchMatrix doubled(source);
  for (auto& entry : doubled.data) {
    entry *= 2.0;
  }
  total_errors += CheckBatchMatrixNear(summed, doubled, 0.0);

  // summing over the leading dimension of a {2, 3} batch: entry i is element(i) + element(3 + i)
  const BatchMatrix grid = BuildIndexedBatch({2, 3}, 1, 2);
  const BatchMatrix column_sums = grid.SumBatchDim(0);
  total_errors += CheckBatchShapeEquals(column_sums.batch_shape, {3});
  for (int i = 0; i < 3; ++i) {
    const double truth[2] = {100.0*i + 100.0*(3 + i), 100.0*i + 100.0*(3 + i) + 2.0};
    if (!CheckMatrixNormWithin(column_sums.element(i), truth, 1, 2, 0.0)) {
      ++total_errors;
    }
  }

  const BatchMatrix row = grid.Select(0, 1);
  total_errors += CheckBatchShapeEquals(row.batch_shape, {3});
  for (int i = 0; i < 3; ++i) {
    if (!CheckMatrixNormWithin(row.element(i), grid.element(3 + i), 1, 2, 0.0)) {
      ++total_errors;
    }
  }
  const BatchMatrix column = grid.Select(-1, 2);
  total_errors += CheckBatchShapeEquals(column.batch_shape, {2});
  for (int a = 0; a < 2; ++a) {
    if (!CheckMatrixNormWithin(column.element(a), grid.element(a*3 + 2), 1, 2, 0.0)) {
      ++total_errors;
    }
  }
  total_errors += CheckThrows<BoundsException<int> >("Select index out of range", [&grid]() {
      return grid.Select(1, 3);
    });
  total_errors += CheckThrows<BoundsException<int> >("Select dimension out of range", [&grid]() {
      return grid.Select(2, 0);
    });

  // 2 x 3 column-major [[0, 2, 4], [1, 3, 5]] transposes to [[0, 1], [2, 3], [4, 5]]
  const BatchMatrix wide = BuildIndexedBatch({}, 2, 3);
  const BatchMatrix tall = wide.Transpose();
  const std::vector<double> tall_truth = {0.0, 2.0, 4.0, 1.0, 3.0, 5.0};
  total_errors += CheckBatchMatrixNear(tall, BatchMatrix({}, 3, 2, tall_truth), 0.0);
  total_errors += CheckBatchMatrixNear(tall.Transpose(), wide, 0.0);

  return total_errors;
}

SQ_WARN_UNUSED_RESULT int TestConcatenateColumns() {
  int total_errors = 0;

  // 2-d point sets: a has 2 points (shared), b has 1 point per batch element
  const BatchMatrix points_a({}, 2, 2, {1.0, 2.0, 3.0, 4.0});
  const BatchMatrix points_b({3}, 2, 1, {5.0, 6.0, 7.0, 8.0, 9.0, 10.0});
  const BatchMatrix joined = ConcatenateColumns(points_a, points_b);
  total_errors += CheckBatchShapeEquals(joined.batch_shape, {3});
  if (!CheckIntEquals(joined.num_rows, 2) || !CheckIntEquals(joined.num_cols, 3)) {
    ++total_errors;
  }
  for (int b = 0; b < 3; ++b) {
    const double truth[6] = {1.0, 2.0, 3.0, 4.0, 5.0 + 2*b, 6.0 + 2*b};
    if (!CheckMatrixNormWithin(joined.element(b), truth, 2, 3, 0.0)) {
      ++total_errors;
    }
  }

  const BatchMatrix points_c({}, 3, 1);
  total_errors += CheckThrows<InvalidValueException<int> >("ConcatenateColumns row mismatch", [&points_a, &points_c]() {
      return ConcatenateColumns(points_a, points_c);
    });
  const BatchMatrix points_d({2}, 2, 1);
  total_errors += CheckThrows<ShapeMismatchException>("ConcatenateColumns batch mismatch", [&points_b, &points_d]() {
      return ConcatenateColumns(points_b, points_d);
    });

  return total_errors;
}

}  // end unnamed namespace

int RunBatchMatrixTests() {
  int total_errors = 0;
  int current_errors = 0;

  current_errors = TestBroadcastShapes();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("broadcasting failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestConstructionAndExpand();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("construction and Expand failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestReshaping();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("reshaping failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestConcatenateColumns();
  if (current_errors != 0) {
    SQ_PARTIAL_FAILURE_PRINTF("ConcatenateColumns failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  return total_errors;
}

}  // end namespace sparse_qep
