/*!
  \file qep_cache.hpp
  \rst
  StrategyCache: per-strategy memoization of intermediate results (the Cholesky factor of ``K_zz``, the prior
  ``p(u)``, the mean-only solve, the pseudo points).

  Every entry is stamped with the cache *generation* in which it was written.  Lookups return an entry only if its stamp
  equals the current generation, so bumping the generation invalidates everything at once; stale entries are never
  returned.  Strategies bump the generation when:

  * they (re-)enter training mode
  * their parameters or inducing points change
  * a new forward epoch begins (one per training step)
  * ClearCache() is called

  The cache also holds ``variational_params_initialized``, the terminal "q(u) has been seeded" flag; it survives
  generation bumps.

  A cache belongs to exactly one strategy and is never shared.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_CACHE_HPP_
#define SPARSE_QEP_CPP_QEP_CACHE_HPP_

#include <cstdint>

#include <map>
#include <string>
#include <utility>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"

namespace sparse_qep {

//! ``p(u)``, or ``D(\mu_z, K_zz)`` memoized by a training-mode forward pass
extern char const * const kPriorDistributionMemoKey;
//! Cholesky factor of ``K_zz + jitter``
extern char const * const kCholeskyFactorKey;
//! ``K_zz^{-1} (m - \mu_z)`` for mean-only predictions
extern char const * const kMeanCacheKey;
//! pseudo point covariance
extern char const * const kPseudoPointsCovarianceKey;
//! pseudo point mean
extern char const * const kPseudoPointsMeanKey;

class StrategyCache final {
 public:
  using GenerationType = std::uint64_t;

  StrategyCache() noexcept : generation_(0), variational_params_initialized_(false), matrices_(), distributions_() {
  }

  GenerationType generation() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return generation_;
  }

  //! invalidates every entry
  void BumpGeneration() noexcept {
    ++generation_;
  }

  bool variational_params_initialized() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return variational_params_initialized_;
  }

  //! one-way: there is no way to reset the flag
  void MarkVariationalParamsInitialized() noexcept {
    variational_params_initialized_ = true;
  }

  /*!\rst
    \return
      the entry stored under ``key`` in the current generation, or nullptr
  \endrst*/
  const BatchMatrix * GetMatrix(const std::string& key) const SQ_WARN_UNUSED_RESULT;

  void PutMatrix(const std::string& key, const BatchMatrix& value);

  const LatentDistribution * GetDistribution(const std::string& key) const SQ_WARN_UNUSED_RESULT;

  void PutDistribution(const std::string& key, const LatentDistribution& value);

  //! number of entries valid in the current generation
  int NumFreshEntries() const noexcept SQ_WARN_UNUSED_RESULT;

  //! drops all stored entries; keeps the generation counter and the initialized flag
  void Clear() noexcept;

 private:
  template <typename ValueType>
  using Table = std::map<std::string, std::pair<GenerationType, ValueType>>;

  //! current generation
  GenerationType generation_;
  bool variational_params_initialized_;
  Table<BatchMatrix> matrices_;
  Table<LatentDistribution> distributions_;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_CACHE_HPP_
