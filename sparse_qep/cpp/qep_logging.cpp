/*!
  \file qep_logging.cpp
  \rst
  Printers for commonly used structures.  Kept here to hide the ``std::printf()`` calls.
\endrst*/

#include "qep_logging.hpp"

#include <cstdio>

#include <vector>

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  Matrices are column-major but screens print by rows, so we walk the storage in transposed order.
\endrst*/
void PrintMatrix(double const * restrict matrix, int num_rows, int num_cols) noexcept {
  for (int i = 0; i < num_rows; ++i) {
    for (int j = 0; j < num_cols; ++j) {
      std::printf("%.18E ", matrix[j*num_rows + i]);
    }
    std::printf("\n");
  }
}

void PrintBatchShape(const std::vector<int>& batch_shape) noexcept {
  std::printf("[");
  for (int i = 0; i < static_cast<int>(batch_shape.size()); ++i) {
    std::printf(i == 0 ? "%d" : ", %d", batch_shape[i]);
  }
  std::printf("]\n");
}

}  // end namespace sparse_qep
