/*!
  \file qep_cache.cpp
  \rst
  Definitions for StrategyCache.
\endrst*/

#include "qep_cache.hpp"

#include <map>
#include <string>
#include <utility>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"

namespace sparse_qep {

char const * const kPriorDistributionMemoKey = "prior_distribution_memo";
char const * const kCholeskyFactorKey = "cholesky_factor";
char const * const kMeanCacheKey = "mean_cache";
char const * const kPseudoPointsCovarianceKey = "pseudo_points_memo/covariance";
char const * const kPseudoPointsMeanKey = "pseudo_points_memo/mean";

namespace {

template <typename ValueType>
ValueType const * FindFresh(const std::map<std::string, std::pair<StrategyCache::GenerationType, ValueType>>& table,
                            const std::string& key, StrategyCache::GenerationType generation) {
  const auto entry = table.find(key);
  if (entry == table.end() || entry->second.first != generation) {
    return nullptr;
  }
  return &entry->second.second;
}

template <typename ValueType>
void Store(const std::string& key, StrategyCache::GenerationType generation, const ValueType& value,
           std::map<std::string, std::pair<StrategyCache::GenerationType, ValueType>> * table) {
  table->erase(key);
  table->emplace(key, std::make_pair(generation, value));
}

}  // end unnamed namespace

const BatchMatrix * StrategyCache::GetMatrix(const std::string& key) const {
  return FindFresh(matrices_, key, generation_);
}

void StrategyCache::PutMatrix(const std::string& key, const BatchMatrix& value) {
  Store(key, generation_, value, &matrices_);
}

const LatentDistribution * StrategyCache::GetDistribution(const std::string& key) const {
  return FindFresh(distributions_, key, generation_);
}

void StrategyCache::PutDistribution(const std::string& key, const LatentDistribution& value) {
  Store(key, generation_, value, &distributions_);
}

int StrategyCache::NumFreshEntries() const noexcept {
  int num_fresh = 0;
  for (const auto& entry : matrices_) {
    num_fresh += (entry.second.first == generation_);
  }
  for (const auto& entry : distributions_) {
    num_fresh += (entry.second.first == generation_);
  }
  return num_fresh;
}

void StrategyCache::Clear() noexcept {
  matrices_.clear();
  distributions_.clear();
}

}  // end namespace sparse_qep
