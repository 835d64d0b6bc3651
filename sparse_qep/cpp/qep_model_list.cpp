/*!
  \file qep_model_list.cpp
  \rst
  Implementation of IndependentModelList.
\endrst*/

#include "qep_model_list.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"
#include "qep_likelihood.hpp"
#include "qep_model.hpp"

namespace sparse_qep {

IndependentModelList::IndependentModelList(ModelList models) : models_(std::move(models)) {
  for (const auto& model_ptr : models_) {
    if (unlikely(model_ptr == nullptr)) {
      SQ_THROW_EXCEPTION(PreconditionException, "IndependentModelList only supports non-null models with a likelihood.");
    }
  }
}

IndependentModelList::IndependentModelList(const IndependentModelList& source) : models_() {
  models_.reserve(source.models_.size());
  for (const auto& model_ptr : source.models_) {
    models_.emplace_back(model_ptr->Clone());
  }
}

void IndependentModelList::CheckIndex(int index) const {
  if (unlikely(index < 0 || index >= num_models())) {
    SQ_THROW_EXCEPTION(BoundsException<int>, "Model index out of range.", index, 0, num_models() - 1);
  }
}

void IndependentModelList::CheckListLength(int length) const {
  if (unlikely(length != num_models())) {
    SQ_THROW_EXCEPTION(InvalidValueException<int>, "Need exactly one argument per model.", length, num_models());
  }
}

const ModelInterface& IndependentModelList::model(int index) const {
  CheckIndex(index);
  return *models_[index];
}

ModelInterface& IndependentModelList::mutable_model(int index) {
  CheckIndex(index);
  return *models_[index];
}

LatentDistribution IndependentModelList::ForwardI(int index, const BatchMatrix& inputs) {
  CheckIndex(index);
  return models_[index]->Forward(inputs);
}

LatentDistribution IndependentModelList::LikelihoodI(int index, const LatentDistribution& function_distribution) const {
  CheckIndex(index);
  return models_[index]->Likelihood(function_distribution);
}

std::vector<LatentDistribution> IndependentModelList::Forward(const std::vector<BatchMatrix>& inputs) {
  CheckListLength(static_cast<int>(inputs.size()));
  std::vector<LatentDistribution> result;
  result.reserve(models_.size());
  for (int i = 0; i < num_models(); ++i) {
    result.push_back(models_[i]->Forward(inputs[i]));
  }
  return result;
}

std::vector<LatentDistribution> IndependentModelList::Call(const std::vector<BatchMatrix>& inputs) {
  CheckListLength(static_cast<int>(inputs.size()));
  std::vector<LatentDistribution> result;
  result.reserve(models_.size());
  for (int i = 0; i < num_models(); ++i) {
    result.push_back(models_[i]->Call(inputs[i]));
  }
  return result;
}

IndependentModelList IndependentModelList::GetFantasyModel(const std::vector<BatchMatrix>& inputs, const std::vector<BatchMatrix>& targets,
                                                           const std::vector<double>& noise_variance) const {
  CheckListLength(static_cast<int>(inputs.size()));
  CheckListLength(static_cast<int>(targets.size()));
  if (!noise_variance.empty()) {
    CheckListLength(static_cast<int>(noise_variance.size()));
  }

  ModelList fantasy_models;
  fantasy_models.reserve(models_.size());
  for (int i = 0; i < num_models(); ++i) {
    const double noise = noise_variance.empty() ? kLikelihoodNoise : noise_variance[i];
    fantasy_models.push_back(models_[i]->GetFantasyModel(inputs[i], targets[i], noise));
  }
  return IndependentModelList(std::move(fantasy_models));
}

std::vector<BatchMatrix> IndependentModelList::train_inputs() const {
  std::vector<BatchMatrix> result;
  result.reserve(models_.size());
  for (const auto& model_ptr : models_) {
    result.push_back(model_ptr->train_inputs());
  }
  return result;
}

std::vector<BatchMatrix> IndependentModelList::train_targets() const {
  std::vector<BatchMatrix> result;
  result.reserve(models_.size());
  for (const auto& model_ptr : models_) {
    result.push_back(model_ptr->train_targets());
  }
  return result;
}

}  // end namespace sparse_qep
