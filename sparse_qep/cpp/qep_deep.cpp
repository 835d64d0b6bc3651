/*!
  \file qep_deep.cpp
  \rst
  Implementation of DeepQepLayer and DeepQepModel.
\endrst*/

#include "qep_deep.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_exception.hpp"
#include "qep_random.hpp"
#include "qep_variational_strategy.hpp"

namespace sparse_qep {

DeepQepLayer::DeepQepLayer(std::unique_ptr<VariationalStrategyInterface> variational_strategy, int input_dims, int output_dims)
    : variational_strategy_(std::move(variational_strategy)),
      input_dims_(input_dims),
      output_dims_(output_dims) {
  if (unlikely(variational_strategy_ == nullptr)) {
    SQ_THROW_EXCEPTION(PreconditionException, "A deep layer needs a variational strategy.");
  }
  if (unlikely(input_dims_ < 1)) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "input_dims must be positive.", input_dims_, 1);
  }
  if (unlikely(output_dims_ < 0)) {
    SQ_THROW_EXCEPTION(LowerBoundException<int>, "output_dims must be non-negative.", output_dims_, 0);
  }
}

DeepQepLayer::DeepQepLayer(const DeepQepLayer& source)
    : variational_strategy_(source.variational_strategy_->Clone()),
      input_dims_(source.input_dims_),
      output_dims_(source.output_dims_) {
}

LatentDistribution DeepQepLayer::Call(const BatchMatrix& inputs, bool are_samples) {
  const VariationalSettings& settings = variational_strategy_->settings();
  if (settings.debug && unlikely(inputs.num_rows != input_dims_)) {
    SQ_THROW_EXCEPTION(PreconditionException, "Input shape did not match input_dims.");
  }

  LatentDistribution output = squashed() ? variational_strategy_->Call(inputs) : variational_strategy_->Call(inputs.Unsqueeze(-1, output_dims_));

  if (!squashed()) {
    // (batch, H) processes over N points -> (batch) distributions over N x H, tasks not interleaved
    const BatchMatrix& latent_mean = output.mean();
    const BatchMatrix& latent_covariance = output.covariance();
    const int num_data = output.num_data();
    const int event_size = num_data*output_dims_;

    BatchShape batch_shape(latent_mean.batch_shape);
    batch_shape.pop_back();
    BatchMatrix mean(batch_shape, num_data, output_dims_);
    BatchMatrix covariance(batch_shape, event_size, event_size);
    for (int b = 0; b < mean.batch_size(); ++b) {
      for (int h = 0; h < output_dims_; ++h) {
        const int source = b*output_dims_ + h;
        std::copy(latent_mean.element(source), latent_mean.element(source) + num_data, mean.element(b) + h*num_data);
        // block h of the block-diagonal covariance
        for (int j = 0; j < num_data; ++j) {
          double const * const column = latent_covariance.element(source) + j*num_data;
          std::copy(column, column + num_data, covariance.element(b) + (h*num_data + j)*event_size + h*num_data);
        }
      }
    }
    output = LatentDistribution::Multitask(output.power(), mean, covariance, false);
  }

  if (!are_samples) {
    BatchShape sample_batch_shape(output.batch_shape());
    sample_batch_shape.insert(sample_batch_shape.begin(), settings.num_likelihood_samples);
    output = output.Expand(sample_batch_shape);
  }
  return output;
}

LatentDistribution DeepQepLayer::Call(const LatentDistribution& inputs, NormalRNGInterface * normal_rng, bool rescale) {
  // (batch, N, D) samples -> (batch, D, N) points
  const BatchMatrix samples = SampleMarginals(inputs, rescale, normal_rng);
  return Call(samples.Transpose(), true);
}

DeepQepModel::DeepQepModel(const DeepQepModel& source) : layers_(), children_() {
  for (const auto& layer : source.layers_) {
    layers_.emplace_back(new DeepQepLayer(*layer));
  }
  for (const auto& child : source.children_) {
    children_.emplace_back(new DeepQepModel(*child));
  }
}

void DeepQepModel::AddLayer(std::unique_ptr<DeepQepLayer> layer) {
  if (unlikely(layer == nullptr)) {
    SQ_THROW_EXCEPTION(PreconditionException, "Cannot add a null layer.");
  }
  layers_.push_back(std::move(layer));
}

void DeepQepModel::AddChild(std::unique_ptr<DeepQepModel> child) {
  if (unlikely(child == nullptr)) {
    SQ_THROW_EXCEPTION(PreconditionException, "Cannot add a null child model.");
  }
  children_.push_back(std::move(child));
}

DeepQepLayer& DeepQepModel::mutable_layer(int index) {
  if (unlikely(index < 0 || index >= num_layers())) {
    SQ_THROW_EXCEPTION(BoundsException<int>, "Layer index out of range.", index, 0, num_layers() - 1);
  }
  return *layers_[index];
}

std::vector<VariationalStrategyInterface *> DeepQepModel::SubVariationalStrategies() {
  std::vector<VariationalStrategyInterface *> strategies;
  for (auto& layer : layers_) {
    strategies.push_back(&layer->mutable_variational_strategy());
  }
  for (auto& child : children_) {
    const std::vector<VariationalStrategyInterface *> child_strategies = child->SubVariationalStrategies();
    strategies.insert(strategies.end(), child_strategies.begin(), child_strategies.end());
  }
  return strategies;
}

double DeepQepModel::KlDivergence() {
  double kl_divergence = 0.0;
  for (auto strategy : SubVariationalStrategies()) {
    const BatchMatrix strategy_kl = strategy->KlDivergence();
    for (const auto kl : strategy_kl.data) {
      kl_divergence += kl;
    }
  }
  return kl_divergence;
}

LatentDistribution DeepQepModel::Forward(const BatchMatrix& inputs, NormalRNGInterface * normal_rng, bool rescale) {
  if (unlikely(layers_.empty())) {
    SQ_THROW_EXCEPTION(PreconditionException, "A deep model needs at least one layer to run Forward().");
  }
  LatentDistribution output = layers_.front()->Call(inputs);
  for (auto layer = layers_.begin() + 1; layer != layers_.end(); ++layer) {
    output = (*layer)->Call(output, normal_rng, rescale);
  }
  return output;
}

void DeepQepModel::Train(bool mode) {
  for (auto strategy : SubVariationalStrategies()) {
    strategy->Train(mode);
  }
}

int DeepQepModel::GetNumberOfParameters() {
  int num_parameters = 0;
  for (auto strategy : SubVariationalStrategies()) {
    num_parameters += strategy->GetNumberOfParameters();
  }
  return num_parameters;
}

void DeepQepModel::GetParameters(double * restrict parameters) {
  for (auto strategy : SubVariationalStrategies()) {
    strategy->GetParameters(parameters);
    parameters += strategy->GetNumberOfParameters();
  }
}

void DeepQepModel::SetParameters(double const * restrict parameters) {
  for (auto strategy : SubVariationalStrategies()) {
    strategy->SetParameters(parameters);
    parameters += strategy->GetNumberOfParameters();
  }
}

}  // end namespace sparse_qep
