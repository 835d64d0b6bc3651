/*!
  \file qep_python_common.hpp
  \rst
  Classes and utilities that are useful throughout the qep_python_* interface code.

  1. Utilities for copying between std::vector and boost::python::list
  2. A RandomnessSourceContainer for moving consistent RNG state between C++ and Python
  3. ExportRandomnessContainer() for giving Python access to item 2

  Functions callable from Python generally:

  1. copy list inputs from Python to C++ (boost::python::list to std::vector, then into BatchMatrix),
  2. compute the result with C++ calls,
  3. copy the result back into a boost::python::list (or return primitive types directly).

  ALL ARRAYS/LISTS MUST BE FLATTENED, C-style (rightmost index varies fastest).  A list of ``num_points`` points in
  ``dim`` dimensions, shape ``(num_points, dim)``, flattens to exactly the column-major ``(dim, num_points)`` layout of a
  point set BatchMatrix, so point lists are copied without reordering.

  Docstrings are raw strings delimited by ``%%``: ``R"%%(docstring)%%"``.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_PYTHON_COMMON_HPP_
#define SPARSE_QEP_CPP_QEP_PYTHON_COMMON_HPP_

#include <vector>

#include <boost/python/list.hpp>  // NOLINT(build/include_order)

#include "qep_common.hpp"
#include "qep_random.hpp"

namespace sparse_qep {

/*!\rst
  Copies the first ``size`` entries of ``input`` into ``output`` (resized to ``size``).
\endrst*/
void CopyPylistToVector(const boost::python::list& input, int size, std::vector<double>& output);

boost::python::list VectorToPylist(const std::vector<double>& input) SQ_WARN_UNUSED_RESULT;

/*!\rst
  Randomness sources for the Python interface.  Python should create one of these and pass it back to every C++
  function that needs randomness, so that results stay reproducible across calls.
\endrst*/
class RandomnessSourceContainer {
  static constexpr NormalRNG::EngineType::result_type kNormalDefaultSeed = 314;
  static constexpr UniformRandomGenerator::EngineType::result_type kUniformDefaultSeed = 314;

 public:
  RandomnessSourceContainer();

  void SetExplicitUniformGeneratorSeed(UniformRandomGenerator::EngineType::result_type seed);

  void ResetUniformGeneratorState();

  void SetExplicitNormalRNGSeed(NormalRNG::EngineType::result_type seed);

  void ResetNormalRNGState();

  UniformRandomGenerator uniform_generator;
  NormalRNG normal_rng;

  SQ_DISALLOW_COPY_AND_ASSIGN(RandomnessSourceContainer);
};

/*!\rst
  Exports RandomnessSourceContainer (constructor and seeding functions).
\endrst*/
void ExportRandomnessContainer();

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_PYTHON_COMMON_HPP_
