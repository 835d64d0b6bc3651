/*!
  \file qep_deep.hpp
  \rst
  Deep (doubly stochastic) Q-Exponential/Gaussian processes, after Salimbeni & Deisenroth, "Doubly Stochastic
  Variational Inference for Deep Gaussian Processes" (2017).

  A DeepQepLayer is ``H`` independent processes sharing their input.  Instead of a marginal over the whole input
  distribution, a layer receives concrete input *samples* and returns ``q(f)`` for each sample; a downstream layer draws
  fresh marginal samples from that output, and so on.

  Shapes (``S = settings.num_likelihood_samples``, points are columns, see qep_batch_matrix.hpp):

  * deterministic ``(batch, D, N)`` inputs produce ``([S] + batch)`` outputs, each ``N x H`` (multitask, tasks
    NOT interleaved, block-diagonal across tasks)
  * sample inputs ``([S] + batch, D, N)`` (``are_samples``) keep their batch shape
  * with ``output_dims == kSquashedOutputDims`` the task dimension is dropped: the layer is a single process and its
    outputs are plain ``N``-point distributions

  DeepQepModel is the container: an ordered list of layers plus nested models.  Its KL divergence is the total over
  every strategy in the tree, and Forward() chains its own layers.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_DEEP_HPP_
#define SPARSE_QEP_CPP_QEP_DEEP_HPP_

#include <memory>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_random.hpp"
#include "qep_variational_strategy.hpp"

namespace sparse_qep {

//! ``output_dims`` value for a layer whose output dimension is squashed (a single process)
static constexpr int kSquashedOutputDims = 0;

class DeepQepLayer final {
 public:
  /*!\rst
    \param
      :variational_strategy: strategy whose q(u) batch ends in ``output_dims`` (unless squashed); ownership transferred
      :input_dims: expected feature dimension ``D`` of the inputs
      :output_dims: number of processes ``H``, or ``kSquashedOutputDims``
    \raise
      PreconditionException if ``variational_strategy`` is null;
      LowerBoundException<int> if ``input_dims < 1`` or ``output_dims < 0``
  \endrst*/
  DeepQepLayer(std::unique_ptr<VariationalStrategyInterface> variational_strategy, int input_dims, int output_dims);

  DeepQepLayer(const DeepQepLayer& source);

  /*!\rst
    \param
      :inputs: ``(batch, D, N)`` points
      :are_samples: true if the leading batch dimension already enumerates samples
    \return
      ``q(f)``, see file docs for shapes
    \raise
      PreconditionException (with ``settings().debug``) if ``D != input_dims``
  \endrst*/
  LatentDistribution Call(const BatchMatrix& inputs, bool are_samples = false);

  /*!\rst
    Draws one marginal sample per entry of ``inputs`` (``loc = mean``, ``scale = sqrt(variance)``, in the inputs'
    family) and continues with ``Call(samples, true)``.  ``inputs`` is typically the previous layer's output, with
    event ``N x D``.

    \param
      :inputs: distribution over inputs
      :normal_rng[1]: source of ``N(0, 1)`` draws
      :rescale: normalize Q-Exponential draws to unit variance, see SampleMarginals()
    \output
      :normal_rng[1]: state advanced
  \endrst*/
  LatentDistribution Call(const LatentDistribution& inputs, NormalRNGInterface * normal_rng, bool rescale = false) SQ_NONNULL_POINTERS;

  int input_dims() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return input_dims_;
  }

  int output_dims() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return output_dims_;
  }

  bool squashed() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return output_dims_ == kSquashedOutputDims;
  }

  const VariationalStrategyInterface& variational_strategy() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return *variational_strategy_;
  }

  VariationalStrategyInterface& mutable_variational_strategy() noexcept {
    return *variational_strategy_;
  }

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(DeepQepLayer);

 private:
  std::unique_ptr<VariationalStrategyInterface> variational_strategy_;
  int input_dims_;
  int output_dims_;
};

class DeepQepModel final {
 public:
  DeepQepModel() : layers_(), children_() {
  }

  DeepQepModel(const DeepQepModel& source);

  //! appends a layer to the forward chain (ownership transferred)
  void AddLayer(std::unique_ptr<DeepQepLayer> layer);

  //! adds a nested model; its strategies count toward SubVariationalStrategies() (ownership transferred)
  void AddChild(std::unique_ptr<DeepQepModel> child);

  int num_layers() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return static_cast<int>(layers_.size());
  }

  int num_children() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return static_cast<int>(children_.size());
  }

  DeepQepLayer& mutable_layer(int index);

  /*!\rst
    Every strategy in the tree: this model's layers in order, then each child's (depth first).
  \endrst*/
  std::vector<VariationalStrategyInterface *> SubVariationalStrategies();

  //! ``\sum`` over SubVariationalStrategies() of the total of their (batched) KL divergences
  double KlDivergence();

  /*!\rst
    Runs the layers in order: the first on the deterministic ``inputs``, each later one on samples drawn from its
    predecessor's output.

    \raise
      PreconditionException if the model has no layers
  \endrst*/
  LatentDistribution Forward(const BatchMatrix& inputs, NormalRNGInterface * normal_rng, bool rescale = false) SQ_NONNULL_POINTERS;

  //! sets the training mode of every strategy in the tree
  void Train(bool mode);

  int GetNumberOfParameters();

  //! strategies in SubVariationalStrategies() order
  void GetParameters(double * restrict parameters) SQ_NONNULL_POINTERS;

  void SetParameters(double const * restrict parameters) SQ_NONNULL_POINTERS;

  SQ_DISALLOW_ASSIGN(DeepQepModel);

 private:
  std::vector<std::unique_ptr<DeepQepLayer>> layers_;
  std::vector<std::unique_ptr<DeepQepModel>> children_;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_DEEP_HPP_
