/*!
  \file qep_python_common.cpp
  \rst
  Definitions of the list utilities and the RandomnessSourceContainer declared in qep_python_common.hpp.
  Member function descriptions live in the Python docstrings of ExportRandomnessContainer().
\endrst*/
// Python.h must come first; otherwise pyport redefines things illegally in C++ on some systems
// (reference: http://bugs.python.org/issue10910).
#include "Python.h"  // NOLINT(build/include)

#include "qep_python_common.hpp"

#include <vector>  // NOLINT(build/include_order)

#include <boost/python/class.hpp>  // NOLINT(build/include_order)
#include <boost/python/extract.hpp>  // NOLINT(build/include_order)
#include <boost/python/list.hpp>  // NOLINT(build/include_order)

#include "qep_common.hpp"
#include "qep_random.hpp"

namespace sparse_qep {

void CopyPylistToVector(const boost::python::list& input, int size, std::vector<double>& output) {
  output.resize(size);
  for (int i = 0; i < size; ++i) {
    output[i] = boost::python::extract<double>(input[i]);
  }
}

boost::python::list VectorToPylist(const std::vector<double>& input) {
  boost::python::list result;
  for (const auto& entry : input) {
    result.append(entry);
  }
  return result;
}

RandomnessSourceContainer::RandomnessSourceContainer()
    : uniform_generator(kUniformDefaultSeed),
      normal_rng(kNormalDefaultSeed) {
}

void RandomnessSourceContainer::SetExplicitUniformGeneratorSeed(UniformRandomGenerator::EngineType::result_type seed) {
  uniform_generator.SetExplicitSeed(seed);
}

void RandomnessSourceContainer::ResetUniformGeneratorState() {
  uniform_generator.ResetToMostRecentSeed();
}

void RandomnessSourceContainer::SetExplicitNormalRNGSeed(NormalRNG::EngineType::result_type seed) {
  normal_rng.SetExplicitSeed(seed);
}

void RandomnessSourceContainer::ResetNormalRNGState() {
  normal_rng.ResetToMostRecentSeed();
}

void ExportRandomnessContainer() {
  boost::python::class_<RandomnessSourceContainer, boost::noncopyable>("RandomnessSourceContainer", boost::python::init<>(R"%%(
    Constructor for a RandomnessSourceContainer holding one uniform and one normal random source, both seeded
    to a repeatable default.  Reseed with SetExplicit*Seed().
    )%%"))
      .def("SetExplicitUniformGeneratorSeed", &RandomnessSourceContainer::SetExplicitUniformGeneratorSeed, R"%%(
    Seeds the uniform generator with the specified seed value.

    :param seed: seed value to use
    :type seed: unsigned int
      )%%")
      .def("ResetUniformRNGSeed", &RandomnessSourceContainer::ResetUniformGeneratorState, R"%%(
    Resets the uniform generator to its most recently specified seed value.  Useful for testing.
      )%%")
      .def("SetExplicitNormalRNGSeed", &RandomnessSourceContainer::SetExplicitNormalRNGSeed, R"%%(
    Seeds the normal RNG with the specified seed value.

    :param seed: seed value to use
    :type seed: unsigned int
      )%%")
      .def("ResetNormalRNGSeed", &RandomnessSourceContainer::ResetNormalRNGState, R"%%(
    Resets the normal RNG to its most recently specified seed value.  Useful for testing.
      )%%")
      ;  // NOLINT, this is boost style
}

}  // end namespace sparse_qep
