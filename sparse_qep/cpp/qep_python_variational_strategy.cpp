/*!
  \file qep_python_variational_strategy.cpp
  \rst
  This file has the logic to construct an UnwhitenedVariationalStrategy (C++ object) from Python and invoke its member
  functions.  The data flow follows the steps in qep_python_common.hpp.

  .. Note:: descriptions of the internal functions live in the Python docstrings of ExportVariationalStrategyFunctions().
\endrst*/
// Python.h must come first; see qep_python_common.cpp.
#include "Python.h"  // NOLINT(build/include)

#include "qep_python_variational_strategy.hpp"

#include <memory>  // NOLINT(build/include_order)
#include <utility>  // NOLINT(build/include_order)
#include <vector>  // NOLINT(build/include_order)

#include <boost/python/class.hpp>  // NOLINT(build/include_order)
#include <boost/python/extract.hpp>  // NOLINT(build/include_order)
#include <boost/python/list.hpp>  // NOLINT(build/include_order)
#include <boost/python/make_constructor.hpp>  // NOLINT(build/include_order)

#include "qep_batch_matrix.hpp"
#include "qep_common.hpp"
#include "qep_covariance.hpp"
#include "qep_distribution.hpp"
#include "qep_mean.hpp"
#include "qep_process_model.hpp"
#include "qep_python_common.hpp"
#include "qep_variational_distribution.hpp"
#include "qep_variational_strategy.hpp"

namespace sparse_qep {

namespace {

BatchMatrix PylistToPoints(const boost::python::list& points, int dim, int num_points) {
  BatchMatrix result(BatchShape(), dim, num_points);
  CopyPylistToVector(points, dim*num_points, result.data);
  return result;
}

/*!\rst
  Surrogate "constructor" for UnwhitenedVariationalStrategy intended only for use by boost::python.
\endrst*/
UnwhitenedVariationalStrategy * make_unwhitened_predictor(const boost::python::list& hyperparameters,
                                                          double constant_mean, double power,
                                                          const boost::python::list& inducing_points,
                                                          int dim, int num_inducing, bool learn_inducing_locations) {
  const double alpha = boost::python::extract<double>(hyperparameters[0]);
  const boost::python::list lengths_in = boost::python::extract<boost::python::list>(hyperparameters[1]);
  std::vector<double> lengths;
  CopyPylistToVector(lengths_in, dim, lengths);

  const ProcessModel model(ConstantMean(constant_mean), SquareExponential(dim, alpha, lengths), power);
  std::unique_ptr<VariationalDistributionInterface> variational_distribution(
      new CholeskyVariationalDistribution(num_inducing, BatchShape(), power));
  return new UnwhitenedVariationalStrategy(model, PylistToPoints(inducing_points, dim, num_inducing),
                                           std::move(variational_distribution), learn_inducing_locations);
}

boost::python::list PredictMeanWrapper(UnwhitenedVariationalStrategy * strategy, const boost::python::list& points_to_sample,
                                       int num_to_sample) {
  const LatentDistribution posterior = strategy->Call(PylistToPoints(points_to_sample, strategy->inducing_points().num_rows, num_to_sample), false);
  return VectorToPylist(posterior.mean().data);
}

boost::python::list PredictVarianceWrapper(UnwhitenedVariationalStrategy * strategy, const boost::python::list& points_to_sample,
                                           int num_to_sample) {
  const LatentDistribution posterior = strategy->Call(PylistToPoints(points_to_sample, strategy->inducing_points().num_rows, num_to_sample), false);
  // symmetric, so column-major storage is also the row-major (Python) layout
  return VectorToPylist(posterior.covariance().data);
}

boost::python::list SamplePosteriorWrapper(UnwhitenedVariationalStrategy * strategy, const boost::python::list& points_to_sample,
                                           int num_to_sample, int num_samples, RandomnessSourceContainer * randomness_source) {
  const LatentDistribution posterior = strategy->Call(PylistToPoints(points_to_sample, strategy->inducing_points().num_rows, num_to_sample), false);
  return VectorToPylist(posterior.Rsample(num_samples, &randomness_source->normal_rng).data);
}

double KlDivergenceWrapper(UnwhitenedVariationalStrategy * strategy) {
  double kl_divergence = 0.0;
  for (const auto entry : strategy->KlDivergence().data) {
    kl_divergence += entry;
  }
  return kl_divergence;
}

boost::python::list GetParametersWrapper(const UnwhitenedVariationalStrategy& strategy) {
  std::vector<double> parameters(strategy.GetNumberOfParameters());
  strategy.GetParameters(parameters.data());
  return VectorToPylist(parameters);
}

void SetParametersWrapper(UnwhitenedVariationalStrategy * strategy, const boost::python::list& parameters_in) {
  std::vector<double> parameters;
  CopyPylistToVector(parameters_in, strategy->GetNumberOfParameters(), parameters);
  strategy->SetParameters(parameters.data());
}

void TrainWrapper(UnwhitenedVariationalStrategy * strategy) {
  strategy->Train(true);
}

void EvalWrapper(UnwhitenedVariationalStrategy * strategy) {
  strategy->Train(false);
}

int NumParametersWrapper(const UnwhitenedVariationalStrategy& strategy) {
  return strategy.GetNumberOfParameters();
}

bool TrainingWrapper(const UnwhitenedVariationalStrategy& strategy) {
  return strategy.training();
}

}  // end unnamed namespace

void ExportVariationalStrategyFunctions() {
  boost::python::class_<UnwhitenedVariationalStrategy, boost::noncopyable>("UnwhitenedPredictor", boost::python::no_init)
      .def("__init__", boost::python::make_constructor(&make_unwhitened_predictor), R"%%(
    Constructor for a ``SPARSE_QEP.UnwhitenedPredictor``: an unwhitened sparse variational process with a Cholesky
    ``q(u)``, a square exponential kernel and a constant mean.  Starts in training mode.

    :param hyperparameters: index 0 is the signal variance ``\alpha``, index 1 the length scales
    :type hyperparameters: list of len 2; float64 and list of float64 of length ``dim``
    :param constant_mean: value of the prior mean
    :type constant_mean: float64
    :param power: 2 for a Gaussian process, otherwise the q of a Q-Exponential process
    :type power: float64 > 0
    :param inducing_points: inducing point locations
    :type inducing_points: list of float64 with shape (num_inducing, dim)
    :param dim: the spatial dimension of a point
    :type dim: int > 0
    :param num_inducing: number of inducing points
    :type num_inducing: int > 0
    :param learn_inducing_locations: whether the inducing points are part of the parameters
    :type learn_inducing_locations: bool
          )%%")
      .add_property("num_parameters", &NumParametersWrapper, "Return the number of variational parameters.")
      .add_property("training", &TrainingWrapper, "Return True in training mode.")
      .def("predict_mean", PredictMeanWrapper, R"%%(
        Mean of ``q(f(x))``.  In training mode, the first call seeds ``q(u)`` from the prior.

        :param points_to_sample: points at which to predict
        :type points_to_sample: list of float64 with shape (num_to_sample, dim)
        :param num_to_sample: number of points
        :type num_to_sample: int > 0
        :rtype: list of float64 with shape (num_to_sample, )
        )%%")
      .def("predict_variance", PredictVarianceWrapper, R"%%(
        Covariance of ``q(f(x))``.

        :param points_to_sample: points at which to predict
        :type points_to_sample: list of float64 with shape (num_to_sample, dim)
        :param num_to_sample: number of points
        :type num_to_sample: int > 0
        :rtype: list of float64 with shape (num_to_sample, num_to_sample)
        )%%")
      .def("sample", SamplePosteriorWrapper, R"%%(
        Draws joint samples of ``f(x) ~ q(f(x))``.

        :param points_to_sample: points at which to sample
        :type points_to_sample: list of float64 with shape (num_to_sample, dim)
        :param num_to_sample: number of points
        :type num_to_sample: int > 0
        :param num_samples: number of joint samples
        :type num_samples: int >= 0
        :param randomness_source: source of the normal draws
        :type randomness_source: RandomnessSourceContainer
        :rtype: list of float64 with shape (num_samples, num_to_sample)
        )%%")
      .def("kl_divergence", KlDivergenceWrapper, R"%%(
        ``KL(q(u) || p(u))``.

        :rtype: float64 >= 0
        )%%")
      .def("get_parameters", GetParametersWrapper, R"%%(
        Variational parameters: ``q(u)``'s mean, the lower triangle of its Cholesky factor (column by column), then the
        inducing points if they are learned.

        :rtype: list of float64 of length num_parameters
        )%%")
      .def("set_parameters", SetParametersWrapper, R"%%(
        Overwrites the variational parameters (same layout as get_parameters); invalidates cached quantities.

        :param parameters: new parameters
        :type parameters: list of float64 of length num_parameters
        )%%")
      .def("train", TrainWrapper, "Switch to training mode (invalidates cached quantities).")
      .def("eval", EvalWrapper, "Switch to evaluation mode.")
      ;  // NOLINT, this is boost style
}

}  // end namespace sparse_qep
