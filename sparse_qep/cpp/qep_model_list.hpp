/*!
  \file qep_model_list.hpp
  \rst
  IndependentModelList: a list of independent models (e.g., one per output), each with its own inputs.

  Every list-valued operation takes one argument per model and returns one result per model, in order; a list of the
  wrong length is an error rather than a silent truncation.  Fantasy updates produce a new list of fantasy models
  and leave this one unchanged.
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_MODEL_LIST_HPP_
#define SPARSE_QEP_CPP_QEP_MODEL_LIST_HPP_

#include <memory>
#include <vector>

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_distribution.hpp"
#include "qep_model.hpp"

namespace sparse_qep {

class IndependentModelList final {
 public:
  using ModelList = std::vector<std::unique_ptr<ModelInterface>>;

  /*!\rst
    \param
      :models: the models (ownership transferred)
    \raise
      PreconditionException if any model is null
  \endrst*/
  explicit IndependentModelList(ModelList models);

  IndependentModelList(const IndependentModelList& source);

  int num_models() const noexcept SQ_PURE_FUNCTION SQ_WARN_UNUSED_RESULT {
    return static_cast<int>(models_.size());
  }

  const ModelInterface& model(int index) const;

  ModelInterface& mutable_model(int index);

  //! prior of the ``index``-th model only
  LatentDistribution ForwardI(int index, const BatchMatrix& inputs);

  //! likelihood marginal of the ``index``-th model only
  LatentDistribution LikelihoodI(int index, const LatentDistribution& function_distribution) const;

  //! priors; ``inputs[i]`` goes to model ``i``
  std::vector<LatentDistribution> Forward(const std::vector<BatchMatrix>& inputs);

  //! posteriors; ``inputs[i]`` goes to model ``i``
  std::vector<LatentDistribution> Call(const std::vector<BatchMatrix>& inputs);

  /*!\rst
    \param
      :inputs: fantasy points, one ``(batch, D, n_i)`` set per model
      :targets: fantasy observations, one ``(batch, n_i, 1)`` vector per model
      :noise_variance: per-model noise; empty, or one entry per model (``kLikelihoodNoise`` selects that model's
        likelihood noise)
    \return
      a new list of each model's fantasy model
    \raise
      InvalidValueException<int> if a list length does not match num_models();
      whatever the models' GetFantasyModel() raise
  \endrst*/
  IndependentModelList GetFantasyModel(const std::vector<BatchMatrix>& inputs, const std::vector<BatchMatrix>& targets,
                                       const std::vector<double>& noise_variance = std::vector<double>()) const SQ_WARN_UNUSED_RESULT;

  std::vector<BatchMatrix> train_inputs() const SQ_WARN_UNUSED_RESULT;

  std::vector<BatchMatrix> train_targets() const SQ_WARN_UNUSED_RESULT;

  SQ_DISALLOW_DEFAULT_AND_ASSIGN(IndependentModelList);

 private:
  void CheckIndex(int index) const;

  void CheckListLength(int length) const;

  ModelList models_;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_MODEL_LIST_HPP_
