/*!
  \file qep_random.hpp
  \rst
  Classes for handling pseudo-random number generation:

  1. UniformRandomGenerator: container for a PRNG "engine"; used with ``<boost/random>`` distributions.
  2. NormalRNG: functor producing ``N(0, 1)`` draws; drives Monte-Carlo sampling of latent distributions (deep layers)
     and the random initialization of LMC coefficients.
  3. NormalRNGSimulator: replays a fixed table of "normal" draws so that sampling code can be tested deterministically.

  Seeds are always explicit.  Each generator remembers its last seed, and ResetToMostRecentSeed() replays the draws
  made since then, so a sample path can be reproduced exactly.

  UniformRandomGenerator wraps ``boost::mt19937``; NormalRNG transforms its output with ``boost::normal_distribution``.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_RANDOM_HPP_
#define SPARSE_QEP_CPP_QEP_RANDOM_HPP_

#include <vector>

#include <boost/random/mersenne_twister.hpp>  // NOLINT(build/include_order)
#include <boost/random/normal_distribution.hpp>  // NOLINT(build/include_order)
#include <boost/random/variate_generator.hpp>  // NOLINT(build/include_order)

#include "qep_common.hpp"
#include "qep_exception.hpp"

namespace sparse_qep {

/*!\rst
  Abstract functor generating random numbers distributed ~ N(0, 1).  Sampling code takes this interface so that tests
  can substitute NormalRNGSimulator.
\endrst*/
class NormalRNGInterface {
 public:
  /*!\rst
    \return
      a number drawn from ``N(0, 1)``
  \endrst*/
  virtual double operator()() = 0;

  /*!\rst
    Reset the generator so that it replays the sequence it produced since its most recent seeding.
  \endrst*/
  virtual void ResetToMostRecentSeed() noexcept = 0;

  virtual ~NormalRNGInterface() = default;
};

/*!\rst
  Container for a uniform PRNG engine, remembering the most recent seed.

  .. Note:: seed values take type ``EngineType::result_type``. Do not pass in a wider integer type!
\endrst*/
struct UniformRandomGenerator final {
  using EngineType = boost::mt19937;

  //! Default seed value to make reproducing test results simple.
  static constexpr EngineType::result_type kDefaultSeed = 314;

  /*!\rst
    Default-constructs with seed ``kDefaultSeed``.
  \endrst*/
  UniformRandomGenerator() noexcept;

  /*!\rst
    \param
      :seed: new seed to set
  \endrst*/
  explicit UniformRandomGenerator(EngineType::result_type seed) noexcept;

  EngineType::result_type last_seed() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return last_seed_;
  }

  /*!\rst
    \param
      :seed: new seed to set
  \endrst*/
  void SetExplicitSeed(EngineType::result_type seed) noexcept;

  /*!\rst
    Reseed with the value of the most recent seed.
  \endrst*/
  void ResetToMostRecentSeed() noexcept;

  //! A (boost) PRNG engine that can be passed to a ``<boost/random>`` distribution, e.g., ``uniform_real<>``.
  EngineType engine;

 private:
  //! The last seed value that was written to ``engine``.
  EngineType::result_type last_seed_;
};

/*!\rst
  Maintains a UniformRandomGenerator and transforms its output to ``N(0, 1)``.

  .. Note:: seed values take type ``EngineType::result_type``. Do not pass in a wider integer type!
\endrst*/
class NormalRNG final : public NormalRNGInterface {
 public:
  using UniformGeneratorType = UniformRandomGenerator;
  using EngineType = UniformRandomGenerator::EngineType;

  //! Default seed value to make reproducing test results simple.
  static constexpr EngineType::result_type kDefaultSeed = 314;

  NormalRNG() noexcept;

  explicit NormalRNG(EngineType::result_type seed) noexcept;

  EngineType& GetEngine() noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return uniform_generator.engine;
  }

  virtual double operator()() override;

  EngineType::result_type last_seed() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return uniform_generator.last_seed();
  }

  /*!\rst
    Clears the state of ``normal_distribution_``; boost may generate normals two at a time, so reseeding the engine
    alone does not make future draws independent of past ones.
  \endrst*/
  void ResetGenerator() noexcept;

  void SetExplicitSeed(EngineType::result_type seed) noexcept;

  virtual void ResetToMostRecentSeed() noexcept override;

  // normal_random_variable_ holds a reference to uniform_generator.engine
  SQ_DISALLOW_COPY_AND_ASSIGN(NormalRNG);

  //! The underlying generator providing uniform PRNGs for this object to transform to N(0, 1).
  UniformGeneratorType uniform_generator;

 private:
  //! Transforms uniform to N(0, 1); may carry internal state.
  boost::normal_distribution<double> normal_distribution_;
  //! Convenience functor returning values distributed ~ N(0, 1).
  boost::variate_generator<EngineType&, boost::normal_distribution<double> > normal_random_variable_;
};

/*!\rst
  "Generates" normal random numbers by replaying ``random_number_table``.  Lets tests pin down sample paths exactly.
  Drawing more numbers than the table holds throws InvalidValueException.
\endrst*/
class NormalRNGSimulator final : public NormalRNGInterface {
 public:
  explicit NormalRNGSimulator(const std::vector<double>& random_number_table_in);

  virtual double operator()() override;

  virtual void ResetToMostRecentSeed() noexcept override;

  int index() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return index_;
  }

  SQ_DISALLOW_DEFAULT_AND_COPY_AND_ASSIGN(NormalRNGSimulator);

 private:
  //! Table that stores all random numbers.
  std::vector<double> random_number_table_;
  //! Index of the random number in the table to return when the generator is called.
  int index_;
};

/*!\rst
  Fills ``values`` with independent draws from ``U[min_value, max_value]``; e.g., random inducing point locations.

  \param
    :min_value: lower bound
    :max_value: upper bound
    :num_values: number of draws
    :uniform_generator[1]: a UniformRandomGenerator object providing the random engine for uniform random numbers
  \output
    :uniform_generator[1]: UniformRandomGenerator object will have changed state due to random draws
    :values[num_values]: the draws
\endrst*/
SQ_NONNULL_POINTERS void ComputeUniformRandomValues(double min_value, double max_value, int num_values, UniformRandomGenerator * uniform_generator, double * restrict values);

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_RANDOM_HPP_
