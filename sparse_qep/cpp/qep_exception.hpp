/*!
  \file qep_exception.hpp
  \rst
  Exception objects for the sparse QEP core, along with helper functions and macros for throwing them.  This library
  never calls throw directly; instead it goes through sparse_qep::ThrowException(), usually via::

    SQ_THROW_EXCEPTION(MyException, ...);

  which adds file/line and function name information.  (Analogous to boost::throw_exception() and
  BOOST_THROW_EXCEPTION.)

  ALL exception objects MUST inherit publicly from std::exception.  The base here is SparseQepException; each subclass
  documents the output of what() in its class comments.  To use SQ_THROW_EXCEPTION, the first two arguments of the
  exception's ctor must be ``char const *``.

  Taxonomy, matching how callers are expected to react:

  * PreconditionException: a caller violated a structural precondition (malformed ``latent_dim``, mismatched LMC batch,
    missing variational covariance for degenerate inputs, wrong feature dimension).  Fatal; never retried.
  * ShapeMismatchException: two batch shapes cannot be broadcast together.
  * BoundsException (and Lower/Upper variants), InvalidValueException: a scalar input is out of range.
  * SingularMatrixException: a covariance expected to be PSD could not be factored even after jitter escalation.
  * NotImplementedException: the requested operation is not supported for this configuration (e.g., pseudo points for
    a variational distribution without a Cholesky parameterization, fantasy updates with a non-conjugate likelihood).

  Users may define ``SQ_NO_EXCEPTIONS`` to *disable* exception handling in this library; they must then implement
  sparse_qep::ThrowException() themselves.
\endrst*/

#include <exception>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

#include "qep_common.hpp"

#ifndef SPARSE_QEP_CPP_QEP_EXCEPTION_HPP_
#define SPARSE_QEP_CPP_QEP_EXCEPTION_HPP_

namespace sparse_qep {

/*!\rst
  Stringify the expansion of a macro; e.g., on line 53, ``SQ_STRINGIFY_EXPANSION(__LINE__) --> "53"``.
\endrst*/
#define SQ_STRINGIFY_EXPANSION_INNER(x) #x
#define SQ_STRINGIFY_EXPANSION(x) SQ_STRINGIFY_EXPANSION_INNER(x)

/*!\rst
  Compile-time string with the current file and line, e.g., ``(qep_foo.cpp: 893)``.
\endrst*/
#define SQ_STRINGIFY_FILE_AND_LINE "(" __FILE__ ": " SQ_STRINGIFY_EXPANSION(__LINE__) ")"

#ifdef SQ_NO_EXCEPTIONS
/*!\rst
  With exceptions disabled, the user provides ThrowException().  Callers assume it NEVER returns; if the user
  implementation does, behavior is UNDEFINED.

  \param
    :exception: an exception object publicly deriving from std::exception
  \return
    **NEVER RETURNS**
\endrst*/
SQ_NORETURN void ThrowException(const std::exception& exception);
#else
/*!\rst
  Wrapper around the "throw" keyword.  Checks that the argument inherits from std::exception and throws it.

  \param
    :exception: reference to exception object (publicly deriving from std::exception) to throw
  \return
    **NEVER RETURNS**
\endrst*/
template <typename ExceptionType>
SQ_NORETURN inline void ThrowException(const ExceptionType& except) {
  static_assert(std::is_base_of<std::exception, ExceptionType>::value, "ExceptionType must be derived from std::exception.");
  throw except;
}
#endif

/*!\rst
  Throw an exception with file/line and function name information prepended to its ctor arguments.  So instead of::

    ThrowException(BoundsException<int>(SQ_STRINGIFY_FILE_AND_LINE, SQ_CURRENT_FUNCTION_NAME, "Invalid task.", t, 0, T-1));

  write::

    SQ_THROW_EXCEPTION(BoundsException<int>, "Invalid task.", t, 0, T-1);
\endrst*/
#define SQ_THROW_EXCEPTION(ExceptionType, Args...) ThrowException(ExceptionType(SQ_STRINGIFY_FILE_AND_LINE, SQ_CURRENT_FUNCTION_NAME, Args))

/*!\rst
  **Overview**

  General runtime error and superclass of every exception in the ``sparse_qep`` library.  Essentially
  std::runtime_error with a ctor that formats the message.

  **Message Format**

  ::

    SparseQepException: CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
class SparseQepException : public std::exception {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "SparseQepException";

  /*!\rst
    \param
      :line_info[]: ptr to char array containing __FILE__ and __LINE__ info; e.g., from SQ_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional ptr to char array from SQ_CURRENT_FUNCTION_NAME or similar
      :custom_message[]: optional ptr to char array with any additional text/info to print/log
  \endrst*/
  SparseQepException(char const * line_info, char const * func_info, char const * custom_message);

  virtual const char* what() const noexcept override SQ_WARN_UNUSED_RESULT {
    return message_.c_str();
  }

  SparseQepException() = delete;

 protected:
  /*!\rst
    Used by subclasses to override the class name at the front of the message text.
  \endrst*/
  explicit SparseQepException(char const * name);

  /*!\rst
    Append the custom message, function name, and file/line info (in that order) to ``message_``.
  \endrst*/
  void AppendCustomMessageAndDebugInfo(char const * line_info, char const * func_info,
                                       char const * custom_message);

  //! the message produced by ``what()``.
  std::string message_;
};

/*!\rst
  **Overview**

  A caller-side structural precondition was violated.  These are fatal for the call.

  **Message Format**

  ::

    PreconditionException: CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
class PreconditionException : public SparseQepException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "PreconditionException";

  PreconditionException(char const * line_info, char const * func_info, char const * custom_message);

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(PreconditionException);
};

/*!\rst
  **Overview**

  The requested operation has no implementation for the current configuration.

  **Message Format**

  ::

    NotImplementedException: CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
class NotImplementedException : public SparseQepException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "NotImplementedException";

  NotImplementedException(char const * line_info, char const * func_info, char const * custom_message);

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(NotImplementedException);
};

/*!\rst
  **Overview**

  Two batch shapes cannot be broadcast against each other.  Stores both shapes.

  **Message Format**

  ::

    ShapeMismatchException: [A_0, A_1, ...] and [B_0, ...] are not broadcastable.
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
class ShapeMismatchException : public SparseQepException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "ShapeMismatchException";

  /*!\rst
    \param
      :line_info[]: ptr to char array containing __FILE__ and __LINE__ info; e.g., from SQ_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional ptr to char array from SQ_CURRENT_FUNCTION_NAME or similar
      :custom_message[]: optional ptr to char array with any additional text/info to print/log
      :shape1: the first batch shape
      :shape2: the batch shape that could not be broadcast against shape1
  \endrst*/
  ShapeMismatchException(char const * line_info, char const * func_info, char const * custom_message,
                         const std::vector<int>& shape1_in, const std::vector<int>& shape2_in);

  const std::vector<int>& shape1() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return shape1_;
  }

  const std::vector<int>& shape2() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return shape2_;
  }

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(ShapeMismatchException);

 private:
  //! the two incompatible shapes
  std::vector<int> shape1_, shape2_;
};

/*!\rst
  **Overview**

  Exception to capture value < min_value OR value > max_value.

  **Message Format**

  ::

    BoundsException: VALUE is not in range [MIN, MAX].
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
template <typename ValueType>
class BoundsException : public SparseQepException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "BoundsException";

  /*!\rst
    \param
      :line_info[]: ptr to char array containing __FILE__ and __LINE__ info; e.g., from SQ_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional ptr to char array from SQ_CURRENT_FUNCTION_NAME or similar
      :custom_message[]: optional ptr to char array with any additional text/info to print/log
      :value: the value that violates its min or max bound
      :min: the minimum bound for value
      :max: the maximum bound for value
  \endrst*/
  BoundsException(char const * line_info, char const * func_info,
                  char const * custom_message, ValueType value_in,
                  ValueType min_in, ValueType max_in);

  ValueType value() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return value_;
  }

  ValueType max() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return max_;
  }

  ValueType min() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return min_;
  }

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(BoundsException);

 protected:
  BoundsException(char const * name_in, char const * line_info,
                  char const * func_info, char const * custom_message,
                  ValueType value_in, ValueType min_in, ValueType max_in);

 private:
  //! the erroneous value_ and the ``[min_, max_]`` bounds that it should lie in
  ValueType value_, min_, max_;
};

// template explicit instantiation declarations, see qep_common.hpp header comments, item 6
extern template class BoundsException<int>;
extern template class BoundsException<double>;

/*!\rst
  Exception to capture value < min_value.  BoundsException with max set to std::numeric_limits<ValueType>::max().
\endrst*/
template <typename ValueType>
class LowerBoundException : public BoundsException<ValueType> {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "LowerBoundException";

  LowerBoundException(char const * line_info, char const * func_info,
                      char const * custom_message, ValueType value_in,
                      ValueType min_in)
      : BoundsException<ValueType>(kName, line_info, func_info, custom_message, value_in,
                                   min_in, std::numeric_limits<ValueType>::max()) {
  }

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(LowerBoundException);
};

/*!\rst
  **Overview**

  Exception to capture value != truth (+/- tolerance).  The tolerance ctor is only enabled for floating point types.

  **Message Format**

  ::

    InvalidValueException: VALUE != TRUTH (value != truth).
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
template <typename ValueType>
class InvalidValueException : public SparseQepException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "InvalidValueException";

  /*!\rst
    \param
      :line_info[]: ptr to char array containing __FILE__ and __LINE__ info; e.g., from SQ_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional ptr to char array from SQ_CURRENT_FUNCTION_NAME or similar
      :custom_message[]: optional ptr to char array with any additional text/info to print/log
      :value: the invalid value
      :truth: what "value" is supposed to be
  \endrst*/
  InvalidValueException(char const * line_info, char const * func_info,
                        char const * custom_message, ValueType value_in, ValueType truth_in);

  /*!\rst
    Same as above but with an acceptable error ``|value - truth| <= tolerance``.
  \endrst*/
  template <typename ValueTypeIn = ValueType, class = typename std::enable_if<std::is_floating_point<ValueType>::value, ValueTypeIn>::type>
  InvalidValueException(char const * line_info, char const * func_info,
                        char const * custom_message, ValueType value_in,
                        ValueType truth_in, ValueType tolerance_in);

  ValueType value() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return value_;
  }

  ValueType truth() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return truth_;
  }

  ValueType tolerance() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return tolerance_;
  }

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(InvalidValueException);

 private:
  //! the erroneous ``value_`` and the ``truth_ +/- tolerance_`` range that it should lie in
  ValueType value_, truth_, tolerance_;
};

// template explicit instantiation declarations, see qep_common.hpp header comments, item 6
extern template class InvalidValueException<int>;
extern template class InvalidValueException<double>;
extern template InvalidValueException<double>::InvalidValueException(
    char const * line_info, char const * func_info, char const * custom_message,
    double value_in, double truth_in, double tolerance_in);

/*!\rst
  **Overview**

  A *square* matrix that should be SPD could not be factored.  Stores a copy of the matrix (column-major), its size,
  the index of the leading minor that failed, and the largest jitter that was tried before giving up.

  **Message Format**

  ::

    SingularMatrixException: M x M matrix is singular; i-th leading minor is not SPD (jitter tried: J).
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO

  .. Note:: the matrix itself is not printed; catch the exception and call PrintMatrix() (qep_logging.hpp) if needed.
\endrst*/
class SingularMatrixException : public SparseQepException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "SingularMatrixException";

  /*!\rst
    \param
      :line_info[]: ptr to char array containing __FILE__ and __LINE__ info; e.g., from SQ_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional ptr to char array from SQ_CURRENT_FUNCTION_NAME or similar
      :custom_message[]: optional ptr to char array with any additional text/info to print/log
      :matrix[num_rows][num_rows]: the singular matrix
      :num_rows: number of rows (= number of columns) in the matrix
      :leading_minor_index: index of the first non-positive definite (principal) leading minor
      :jitter: largest diagonal jitter added before giving up (0 if none was tried)
  \endrst*/
  SingularMatrixException(char const * line_info, char const * func_info, char const * custom_message,
                          double const * matrix_in, int num_rows_in, int leading_minor_index_in, double jitter_in);

  int num_rows() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return num_rows_;
  }

  int leading_minor_index() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return leading_minor_index_;
  }

  double jitter() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return jitter_;
  }

  const std::vector<double>& matrix() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return matrix_;
  }

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(SingularMatrixException);

 private:
  //! the number of rows (= number of columns) in the singular matrix
  int num_rows_;
  //! index of the first non-positive definite (principal) leading minor
  int leading_minor_index_;
  //! largest jitter tried
  double jitter_;
  //! the data of the singular matrix, ordered column-major
  std::vector<double> matrix_;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_EXCEPTION_HPP_
