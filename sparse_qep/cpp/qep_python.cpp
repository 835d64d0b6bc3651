/*!
  \file qep_python.cpp
  \rst
  This file contains the "call" to ``BOOST_PYTHON_MODULE``; think of that as the ``main()`` function for the interface.
  It includes the docstring for the Python module and wraps the ``Export*()`` functions from the ``qep_python_*``
  helper files.

  This file also translates C++ exceptions into Python exceptions.  Each exception class in qep_exception.hpp gets a
  Python counterpart (module attribute of the same name, subclassing ``SparseQepException``, which subclasses
  ``Exception``); data fields (e.g., ``value``, ``min``, ``max``) are copied onto the Python instance.
\endrst*/
// Python.h must come first; see qep_python_common.cpp.
#include "Python.h"  // NOLINT(build/include)

#include <exception>  // NOLINT(build/include_order)
#include <string>  // NOLINT(build/include_order)
#include <type_traits>  // NOLINT(build/include_order)

#include <boost/python/docstring_options.hpp>  // NOLINT(build/include_order)
#include <boost/python/errors.hpp>  // NOLINT(build/include_order)
#include <boost/python/exception_translator.hpp>  // NOLINT(build/include_order)
#include <boost/python/extract.hpp>  // NOLINT(build/include_order)
#include <boost/python/handle.hpp>  // NOLINT(build/include_order)
#include <boost/python/module.hpp>  // NOLINT(build/include_order)
#include <boost/python/object.hpp>  // NOLINT(build/include_order)
#include <boost/python/scope.hpp>  // NOLINT(build/include_order)

#include "qep_common.hpp"
#include "qep_exception.hpp"
#include "qep_python_common.hpp"
#include "qep_python_test.hpp"
#include "qep_python_variational_strategy.hpp"

namespace sparse_qep {

namespace {  // unnamed namespace for exception translation

/*!\rst
  Builds a Python exception type called ``scope.name`` (subclassing ``base_type``, or ``Exception`` if nullptr) and
  binds it to ``scope``.

  .. WARNING:: ONLY call this from within ``BOOST_PYTHON_MODULE``; ``scope`` has no meaning afterward.

  \return
    the new (callable) type object
\endrst*/
SQ_WARN_UNUSED_RESULT PyObject * CreatePyExceptionClass(const char * name, const char * docstring, PyObject * base_type, boost::python::scope * scope) {
  std::string scope_name = boost::python::extract<std::string>(scope->attr("__name__"));
  std::string qualified_name = scope_name + "." + name;

  // const_cast: PyErr_NewExceptionWithDoc takes char *, http://bugs.python.org/issue4949
  PyObject * type_object = PyErr_NewExceptionWithDoc(const_cast<char *>(qualified_name.c_str()), const_cast<char *>(docstring), base_type, nullptr);
  if (!type_object) {
    boost::python::throw_error_already_set();
  }
  scope->attr(name) = boost::python::object(boost::python::handle<>(boost::python::borrowed(type_object)));

  return type_object;
}

/*!\rst
  Monostate holding the Python type objects of our exceptions.  Type objects must never be deallocated, so the
  pointers are static and live as long as the process.  Until Initialize() runs, every type is ``RuntimeError``.

  .. NOTE:: this class follows the Monostate pattern, implying GLOBAL STATE.  Initialize() is not thread safe; it only
    runs during module import.
\endrst*/
class PyExceptionClassContainer {
 public:
  //! defines the Python exception types in ``scope``; later calls do nothing
  void Initialize(boost::python::scope * scope) SQ_NONNULL_POINTERS {
    if (!initialized_) {
      base_type_object_ = CreatePyExceptionClass(SparseQepException::kName, "Base exception class for errors raised from the (C++) ``sparse_qep`` library.", nullptr, scope);
      precondition_type_object_ = CreatePyExceptionClass(PreconditionException::kName, "an argument or object state violates a precondition", base_type_object_, scope);
      not_implemented_type_object_ = CreatePyExceptionClass(NotImplementedException::kName, "the requested operation is not supported by this object", base_type_object_, scope);
      shape_mismatch_type_object_ = CreatePyExceptionClass(ShapeMismatchException::kName, "batch shapes do not broadcast", base_type_object_, scope);
      bounds_type_object_ = CreatePyExceptionClass(BoundsException<double>::kName, "value not in range [min, max].", base_type_object_, scope);
      invalid_value_type_object_ = CreatePyExceptionClass(InvalidValueException<double>::kName, "value != truth (+/- tolerance)", base_type_object_, scope);
      singular_matrix_type_object_ = CreatePyExceptionClass(SingularMatrixException::kName, "num_rows X num_rows matrix is singular", base_type_object_, scope);
      initialized_ = true;
    }
  }

  SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT PyObject * TypeObject(const std::exception&) const noexcept {
    return base_type_object_;
  }

  SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT PyObject * TypeObject(const PreconditionException&) const noexcept {
    return precondition_type_object_;
  }

  SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT PyObject * TypeObject(const NotImplementedException&) const noexcept {
    return not_implemented_type_object_;
  }

  SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT PyObject * TypeObject(const ShapeMismatchException&) const noexcept {
    return shape_mismatch_type_object_;
  }

  template <typename ValueType>
  SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT PyObject * TypeObject(const BoundsException<ValueType>&) const noexcept {
    return bounds_type_object_;
  }

  template <typename ValueType>
  SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT PyObject * TypeObject(const InvalidValueException<ValueType>&) const noexcept {
    return invalid_value_type_object_;
  }

  SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT PyObject * TypeObject(const SingularMatrixException&) const noexcept {
    return singular_matrix_type_object_;
  }

 private:
  static PyObject * const default_type_object_;

  static PyObject * base_type_object_;
  static PyObject * precondition_type_object_;
  static PyObject * not_implemented_type_object_;
  static PyObject * shape_mismatch_type_object_;
  static PyObject * bounds_type_object_;
  static PyObject * invalid_value_type_object_;
  static PyObject * singular_matrix_type_object_;

  static bool initialized_;
};

PyObject * const PyExceptionClassContainer::default_type_object_ = PyExc_RuntimeError;
PyObject * PyExceptionClassContainer::base_type_object_ = PyExceptionClassContainer::default_type_object_;
PyObject * PyExceptionClassContainer::precondition_type_object_ = PyExceptionClassContainer::default_type_object_;
PyObject * PyExceptionClassContainer::not_implemented_type_object_ = PyExceptionClassContainer::default_type_object_;
PyObject * PyExceptionClassContainer::shape_mismatch_type_object_ = PyExceptionClassContainer::default_type_object_;
PyObject * PyExceptionClassContainer::bounds_type_object_ = PyExceptionClassContainer::default_type_object_;
PyObject * PyExceptionClassContainer::invalid_value_type_object_ = PyExceptionClassContainer::default_type_object_;
PyObject * PyExceptionClassContainer::singular_matrix_type_object_ = PyExceptionClassContainer::default_type_object_;
bool PyExceptionClassContainer::initialized_ = false;

// data fields copied onto the Python exception instance; most exceptions carry none
void SetExceptionPayload(const std::exception&, boost::python::object *) {
}

template <typename ValueType>
void SetExceptionPayload(const BoundsException<ValueType>& except, boost::python::object * instance) {
  instance->attr("value") = except.value();
  instance->attr("min") = except.min();
  instance->attr("max") = except.max();
}

template <typename ValueType>
void SetExceptionPayload(const InvalidValueException<ValueType>& except, boost::python::object * instance) {
  instance->attr("value") = except.value();
  instance->attr("truth") = except.truth();
  instance->attr("tolerance") = except.tolerance();
}

void SetExceptionPayload(const SingularMatrixException& except, boost::python::object * instance) {
  instance->attr("num_rows") = except.num_rows();
  instance->attr("leading_minor_index") = except.leading_minor_index();
  instance->attr("jitter") = except.jitter();
  instance->attr("matrix") = VectorToPylist(except.matrix());
}

/*!\rst
  Raises the Python counterpart of ``except``: an instance of ``TypeObject(except)`` built from ``except.what()``, with
  the payload attached.

  \return
    **NEVER RETURNS**
\endrst*/
template <typename ExceptionType>
SQ_NORETURN void TranslateException(const ExceptionType& except, const PyExceptionClassContainer& py_exception_type_objects) {
  boost::python::object except_type(boost::python::handle<>(boost::python::borrowed(py_exception_type_objects.TypeObject(except))));
  boost::python::object instance = except_type(except.what());
  SetExceptionPayload(except, &instance);

  // PyErr_SetObject INCREFs both references; they are DECREF'd when exception handling completes
  PyErr_SetObject(except_type.ptr(), instance.ptr());
  boost::python::throw_error_already_set();
  throw;  // throw_error_already_set() never returns but is not marked noreturn: https://svn.boost.org/trac/boost/ticket/1482
}

template <typename ExceptionType>
void RegisterExceptionTranslator(const PyExceptionClassContainer& py_exception_type_objects) {
  auto translate_exception = [py_exception_type_objects](const ExceptionType& except) {
    TranslateException(except, py_exception_type_objects);
  };

  // nullptr fills boost's (dummy) pointer argument
  boost::python::register_exception_translator<ExceptionType>(translate_exception, nullptr);
}

/*!\rst
  Registers translators for our exceptions.  boost::python keeps translators in a LIFO stack, so the most general
  (std::exception) MUST be registered first or it masks the rest.

  .. NOTE:: PyExceptionClassContainer must be initialized first.
\endrst*/
void RegisterSparseQepExceptions() {
  PyExceptionClassContainer py_exception_type_objects;

  RegisterExceptionTranslator<std::exception>(py_exception_type_objects);
  RegisterExceptionTranslator<PreconditionException>(py_exception_type_objects);
  RegisterExceptionTranslator<NotImplementedException>(py_exception_type_objects);
  RegisterExceptionTranslator<ShapeMismatchException>(py_exception_type_objects);
  RegisterExceptionTranslator<SingularMatrixException>(py_exception_type_objects);
  RegisterExceptionTranslator<InvalidValueException<int>>(py_exception_type_objects);
  RegisterExceptionTranslator<InvalidValueException<double>>(py_exception_type_objects);
  RegisterExceptionTranslator<BoundsException<int>>(py_exception_type_objects);
  RegisterExceptionTranslator<BoundsException<double>>(py_exception_type_objects);
}

}  // end unnamed namespace

namespace {  // unnamed namespace for BOOST_PYTHON_MODULE(SPARSE_QEP) definition

BOOST_PYTHON_MODULE(SPARSE_QEP) {
  boost::python::scope current_scope;

  PyExceptionClassContainer py_exception_type_objects;
  py_exception_type_objects.Initialize(&current_scope);
  RegisterSparseQepExceptions();

  bool show_user_defined = true;
  bool show_py_signatures = true;
  bool show_cpp_signatures = true;
  boost::python::docstring_options doc_options(show_user_defined, show_py_signatures, show_cpp_signatures);

  current_scope.attr("__doc__") = R"%%(
    Python interface to the C++ sparse variational Gaussian/Q-Exponential process library.

    * Exceptions: Python counterparts of the classes in qep_exception.hpp (base: SparseQepException).  C++ exceptions
      are caught and re-raised as these, with their data fields as attributes.

    * Objects:

      * UnwhitenedPredictor: an unwhitened sparse variational process (square exponential kernel, constant mean,
        Cholesky ``q(u)``); predictions, KL divergence and flattened variational parameters.
      * RandomnessSourceContainer: uniform and normal random sources for functions that sample.

    * Testing: run_cpp_tests runs every C++ unit test.

    All list inputs and outputs are FLATTENED C-style; see each docstring for shapes.
    )%%";

  ExportCppTestFunctions();
  ExportRandomnessContainer();
  ExportVariationalStrategyFunctions();
}  // end BOOST_PYTHON_MODULE(SPARSE_QEP) definition

}  // end unnamed namespace

}  // end namespace sparse_qep
