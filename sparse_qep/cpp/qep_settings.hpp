/*!
  \file qep_settings.hpp
  \rst
  Configuration for the variational strategies and deep layers.

  Settings are passed to strategies explicitly (by value at construction; they may be modified afterward via the
  strategy's ``mutable_settings()``).  There is no process-wide state.

  The named jitter constants below are the defaults used throughout the library:

  * ``kDefaultPriorJitter``: added to the prior covariance ``K_zz`` (i.e., what AddJitter() uses when no value is given)
  * ``kDefaultVariationalJitter``: added to ``K_zz`` inside the variational marginalization (double precision)
  * ``kDefaultJitter``: negative sentinel; a strategy constructed with it uses ``settings.jitter``
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_SETTINGS_HPP_
#define SPARSE_QEP_CPP_QEP_SETTINGS_HPP_

#include "qep_common.hpp"

namespace sparse_qep {

//! jitter added to a prior covariance when no value is specified
static constexpr double kDefaultPriorJitter = 1.0e-3;
//! jitter added to ``K_zz`` during variational marginalization, double precision
static constexpr double kDefaultVariationalJitter = 1.0e-6;
//! sentinel: "use the configured jitter"
static constexpr double kDefaultJitter = -1.0;

/*!\rst
  Container to hold the switches that control the variational computations.

  **Debugging**

  ``debug`` enables (cheap) consistency checks, e.g., that deep layer inputs have ``input_dims`` features.

  **Predictions**

  ``skip_posterior_variances``: in eval mode, compute only the predictive mean (via a cached ``K_zz^{-1} (m - \mu_z)``);
  the returned covariance is identically 0.  ``fast_pred_var`` is carried for API compatibility; predictive variances
  are always computed exactly here.

  **Solves**

  If ``fast_computations`` is false OR ``M <= max_exact_cholesky_size``, solves against ``K_zz`` use its (cached)
  Cholesky factor.  Otherwise they use conjugate gradients with tolerance ``cg_tolerance`` and at most
  ``max_cg_iterations`` iterations (0 means ``M`` iterations).

  **Factorization**

  Failed Cholesky factorizations are retried after adding ``cholesky_jitter * 10^i`` to the diagonal,
  ``i = 0 .. cholesky_max_tries - 1``.

  **Sampling**

  Deep layers fed deterministic inputs expand their output by ``num_likelihood_samples`` Monte-Carlo samples.
\endrst*/
struct VariationalSettings {
  VariationalSettings() noexcept
      : debug(true),
        jitter(kDefaultVariationalJitter),
        skip_posterior_variances(false),
        fast_pred_var(false),
        fast_computations(true),
        max_exact_cholesky_size(800),
        cg_tolerance(1.0e-10),
        max_cg_iterations(0),
        num_likelihood_samples(10),
        cholesky_jitter(1.0e-8),
        cholesky_max_tries(3) {
  }

  bool debug;
  //! variational jitter added to ``K_zz`` (double)
  double jitter;
  bool skip_posterior_variances;
  bool fast_pred_var;
  bool fast_computations;
  int max_exact_cholesky_size;
  double cg_tolerance;
  int max_cg_iterations;
  int num_likelihood_samples;
  double cholesky_jitter;
  int cholesky_max_tries;
};

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_SETTINGS_HPP_
