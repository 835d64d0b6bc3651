/*!
  \file qep_exception.cpp
  \rst
  Ctors for the exception classes in qep_exception.hpp.  They build ``message_`` with the error details and where it
  occurred.

  Numbers are converted with boost::lexical_cast<std::string>; std::to_string's floating point formatting loses far too
  much precision (it is fine for integral types, which is where we use it).
\endrst*/

// No locale-dependent number formatting is needed.
#define BOOST_LEXICAL_CAST_ASSUME_C_LOCALE

#include "qep_exception.hpp"

#include <limits>
#include <string>
#include <vector>

#include <boost/lexical_cast.hpp>  // NOLINT(build/include_order)

#include "qep_common.hpp"

namespace sparse_qep {

namespace {

std::string FormatBatchShape(const std::vector<int>& shape) {
  std::string result("[");
  for (int i = 0; i < static_cast<int>(shape.size()); ++i) {
    if (i > 0) {
      result += ", ";
    }
    result += std::to_string(shape[i]);
  }
  result += "]";
  return result;
}

}  // end unnamed namespace

void SparseQepException::AppendCustomMessageAndDebugInfo(char const * line_info, char const * func_info,
                                                         char const * custom_message) {
  if (custom_message) {
    message_ += custom_message;
    message_ += " ";
  }
  if (func_info) {
    message_ += func_info;
    message_ += " ";
  }
  message_ += line_info;
}

SparseQepException::SparseQepException(char const * line_info, char const * func_info,
                                       char const * custom_message) : message_(kName) {
  message_ += ": ";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

SparseQepException::SparseQepException(char const * name) : message_(name) {
}

PreconditionException::PreconditionException(char const * line_info, char const * func_info,
                                             char const * custom_message) : SparseQepException(kName) {
  message_ += ": ";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

NotImplementedException::NotImplementedException(char const * line_info, char const * func_info,
                                                 char const * custom_message) : SparseQepException(kName) {
  message_ += ": ";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

ShapeMismatchException::ShapeMismatchException(char const * line_info, char const * func_info,
                                               char const * custom_message, const std::vector<int>& shape1_in,
                                               const std::vector<int>& shape2_in)
    : SparseQepException(kName), shape1_(shape1_in), shape2_(shape2_in) {
  message_ += ": " + FormatBatchShape(shape1_) + " and " + FormatBatchShape(shape2_) + " are not broadcastable.\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

template <typename ValueType>
BoundsException<ValueType>::BoundsException(char const * name_in, char const * line_info,
                                            char const * func_info, char const * custom_message,
                                            ValueType value_in, ValueType min_in, ValueType max_in)
    : SparseQepException(name_in),
      value_(value_in),
      min_(min_in),
      max_(max_in) {
  message_ += ": value: " + boost::lexical_cast<std::string>(value_) + " is not in range [" +
      boost::lexical_cast<std::string>(min_) + ", " + boost::lexical_cast<std::string>(max_) + "]\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

template <typename ValueType>
BoundsException<ValueType>::BoundsException(char const * line_info, char const * func_info,
                                            char const * custom_message, ValueType value_in,
                                            ValueType min_in, ValueType max_in)
    : BoundsException(kName, line_info, func_info, custom_message, value_in, min_in, max_in) {
}

// template explicit instantiation definitions, see qep_common.hpp header comments, item 6
template class BoundsException<int>;
template class BoundsException<double>;

template <typename ValueType>
InvalidValueException<ValueType>::InvalidValueException(char const * line_info, char const * func_info,
                                                        char const * custom_message, ValueType value_in,
                                                        ValueType truth_in)
    : SparseQepException(kName), value_(value_in), truth_(truth_in), tolerance_(0) {
  message_ += ": " + boost::lexical_cast<std::string>(value_) + " != " +
      boost::lexical_cast<std::string>(truth_) + " (value != truth)\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

template <typename ValueType>
template <typename ValueTypeIn, typename>
InvalidValueException<ValueType>::InvalidValueException(char const * line_info, char const * func_info,
                                                        char const * custom_message, ValueType value_in,
                                                        ValueType truth_in, ValueType tolerance_in)
    : SparseQepException(kName), value_(value_in), truth_(truth_in), tolerance_(tolerance_in) {
  message_ += ": " + boost::lexical_cast<std::string>(value_) + " != " + boost::lexical_cast<std::string>(truth_) +
      " +/- " + boost::lexical_cast<std::string>(tolerance_) + " (value != truth +/- tolerance)\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

// template explicit instantiation definitions, see qep_common.hpp header comments, item 6
template class InvalidValueException<int>;
template class InvalidValueException<double>;
template InvalidValueException<double>::InvalidValueException(
    char const * line_info, char const * func_info, char const * custom_message, double value_in,
    double truth_in, double tolerance_in);

SingularMatrixException::SingularMatrixException(char const * line_info, char const * func_info,
                                                 char const * custom_message, double const * matrix_in,
                                                 int num_rows_in, int leading_minor_index_in, double jitter_in)
    : SparseQepException(kName), num_rows_(num_rows_in), leading_minor_index_(leading_minor_index_in),
      jitter_(jitter_in), matrix_(matrix_in, matrix_in + Square(num_rows_)) {
  message_ += ": " + std::to_string(num_rows_) + " x " + std::to_string(num_rows_) + " matrix is singular; " +
      std::to_string(leading_minor_index_) + "-th leading minor is not SPD (jitter tried: " +
      boost::lexical_cast<std::string>(jitter_) + ").\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

}  // end namespace sparse_qep
