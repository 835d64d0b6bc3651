/*!
  \file qep_logging.hpp
  \rst
  Macros wrapping std::printf() for the sparse QEP core.  The "log" is stdout and the verbosity level is chosen at
  compile-time through the ``SQ_DEBUG_PRINT``, ``SQ_VERBOSE_PRINT``, ``SQ_WARNING_PRINT``, and ``SQ_ERROR_PRINT``
  definitions (each level implies the levels below it).

  There are also printers for column-major matrices and batch shapes.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_LOGGING_HPP_
#define SPARSE_QEP_CPP_QEP_LOGGING_HPP_

#include <cstdio>

#include <vector>

#include "qep_common.hpp"

namespace sparse_qep {

/*!\rst
  printf wrapper enabled by ``SQ_DEBUG_PRINT``.  Details about internal state (cache hits, chosen solve paths).
\endrst*/
#ifdef SQ_DEBUG_PRINT
#define SQ_DEBUG_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define SQ_DEBUG_PRINTF(...) (void)0
#endif

/*!\rst
  printf wrapper enabled by ``SQ_VERBOSE_PRINT``.  Extra information about numerical behavior, e.g., how much jitter
  a factorization needed.
\endrst*/
#ifdef SQ_VERBOSE_PRINT
#define SQ_VERBOSE_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define SQ_VERBOSE_PRINTF(...) (void)0
#endif

#if defined(SQ_VERBOSE_PRINT) || defined(SQ_DEBUG_PRINT)
#ifndef SQ_WARNING_PRINT
#define SQ_WARNING_PRINT
#endif
#endif

/*!\rst
  printf wrapper enabled by ``SQ_WARNING_PRINT``.  Something went wrong but a fallback recovered (jitter escalation,
  eigen-decomposition PSD repair).
\endrst*/
#ifdef SQ_WARNING_PRINT
#define SQ_WARNING_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define SQ_WARNING_PRINTF(...) (void)0
#endif

#ifdef SQ_WARNING_PRINT
#ifndef SQ_ERROR_PRINT
#define SQ_ERROR_PRINT
#endif
#endif

/*!\rst
  printf wrapper enabled by ``SQ_ERROR_PRINT``.  Something failed and an exception is about to be thrown.
\endrst*/
#ifdef SQ_ERROR_PRINT
#define SQ_ERROR_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define SQ_ERROR_PRINTF(...) (void)0
#endif

/*!\rst
  Color codes for printf.  Insert before a string literal component to change the color until a reset::

    printf(SQ_ANSI_COLOR_GREEN "Hi I am %d" SQ_ANSI_COLOR_RESET "And you are %d\n", 2, 3);
\endrst*/
#define SQ_ANSI_COLOR_RESET   "\x1b[0m"                  // reset to default color
#define SQ_ANSI_COLOR_RED     "\x1b[31m"                 // Red
#define SQ_ANSI_COLOR_GREEN   "\x1b[32m"                 // Green
#define SQ_ANSI_COLOR_BOLDRED     "\033[1m\033[31m"      // Bold Red
#define SQ_ANSI_COLOR_BOLDGREEN   "\033[1m\033[32m"      // Bold Green

// for top-level test suites
#define SQ_SUCCESS_PRINTF(...) std::printf(SQ_ANSI_COLOR_BOLDGREEN "SUCCESS: " SQ_ANSI_COLOR_RESET __VA_ARGS__)
#define SQ_FAILURE_PRINTF(...) std::printf(SQ_ANSI_COLOR_BOLDRED "FAILURE: " SQ_ANSI_COLOR_RESET __VA_ARGS__)

// for test sub-components
#define SQ_PARTIAL_SUCCESS_PRINTF(...) std::printf(SQ_ANSI_COLOR_GREEN "ok: " SQ_ANSI_COLOR_RESET __VA_ARGS__)
#define SQ_PARTIAL_FAILURE_PRINTF(...) std::printf(SQ_ANSI_COLOR_RED "fail: " SQ_ANSI_COLOR_RESET __VA_ARGS__)

/*!\rst
  Print a column-major matrix to stdout, one row per line, with ``%.18E`` descriptors.

  ``A[3][2] = [4 53 81 32 12 2]`` prints as the rows ``4 32``, ``53 12``, ``81 2``.

  \param
    :matrix[num_rows][num_cols]: matrix to be printed
    :num_rows: number of rows
    :num_cols: number of columns
\endrst*/
void PrintMatrix(double const * restrict matrix, int num_rows, int num_cols) noexcept SQ_NONNULL_POINTERS;

/*!\rst
  Print a batch shape as ``[d_0, d_1, ...]`` followed by a newline; ``[]`` for the empty (scalar) batch.

  \param
    :batch_shape: batch dimensions, outermost first
\endrst*/
void PrintBatchShape(const std::vector<int>& batch_shape) noexcept;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_LOGGING_HPP_
