/*!
  \file qep_random.cpp
  \rst
  Seeding, replay, and uniform draws for the generators declared in qep_random.hpp.
\endrst*/

#include "qep_random.hpp"

#include <vector>

#include <boost/random/uniform_real.hpp>  // NOLINT(build/include_order)

#include "qep_common.hpp"
#include "qep_exception.hpp"

namespace sparse_qep {

UniformRandomGenerator::UniformRandomGenerator(EngineType::result_type seed) noexcept : engine(seed), last_seed_(seed) {
}

UniformRandomGenerator::UniformRandomGenerator() noexcept : UniformRandomGenerator(kDefaultSeed) {
}

void UniformRandomGenerator::SetExplicitSeed(EngineType::result_type seed) noexcept {
  engine.seed(seed);
  last_seed_ = seed;
}

void UniformRandomGenerator::ResetToMostRecentSeed() noexcept {
  SetExplicitSeed(last_seed_);
}

NormalRNG::NormalRNG(EngineType::result_type seed) noexcept
    : uniform_generator(seed),
      normal_distribution_(0.0, 1.0),
      normal_random_variable_(uniform_generator.engine, normal_distribution_) {
}

NormalRNG::NormalRNG() noexcept : NormalRNG(kDefaultSeed) {
}

double NormalRNG::operator()() {
  return normal_random_variable_();
}

void NormalRNG::ResetGenerator() noexcept {
  normal_random_variable_.distribution().reset();
}

void NormalRNG::SetExplicitSeed(EngineType::result_type seed) noexcept {
  uniform_generator.SetExplicitSeed(seed);
  ResetGenerator();
}

void NormalRNG::ResetToMostRecentSeed() noexcept {
  uniform_generator.ResetToMostRecentSeed();
  ResetGenerator();
}

NormalRNGSimulator::NormalRNGSimulator(const std::vector<double>& random_number_table_in)
    : random_number_table_(random_number_table_in),
      index_(0) {
}

double NormalRNGSimulator::operator()() {
  const int table_size = random_number_table_.size();
  if (unlikely(index_ >= table_size)) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "NormalRNGSimulator table exhausted.", index_, table_size);
  }
  return random_number_table_[index_++];
}

void NormalRNGSimulator::ResetToMostRecentSeed() noexcept {
  index_ = 0;
}

void ComputeUniformRandomValues(double min_value, double max_value, int num_values, UniformRandomGenerator * uniform_generator,
                                double * restrict values) {
  boost::uniform_real<double> uniform_double(min_value, max_value);
  for (int i = 0; i < num_values; ++i) {
    values[i] = uniform_double(uniform_generator->engine);
  }
}

}  // end namespace sparse_qep
