/*!
  \file qep_common.hpp
  \rst
  This file contains the conventions shared by every component of the sparse variational QEP core, along with the
  compiler macros (disallowing constructors, function attributes, branch hints) used throughout the project.

  **IMPLEMENTATION NOTES**

  1. Memory.
     No function allocates memory that the caller must free.  Array outputs are allocated by the caller, class members
     are never plain pointers (use std::unique_ptr), and ``new`` appears only in ``Clone()`` functions or as the
     argument of a std::unique_ptr ctor.  ``malloc``/``free`` are not used at all; use std::vector.

  2. Matrices are stored as flattened arrays in COLUMN-MAJOR order.
     ``A[dim1][dim2]`` describes a matrix with dim1 rows and dim2 columns where dim1 is the most rapidly-varying index,
     so ``A[i][j]`` is accessed through ``A[j*dim1 + i]``.  For example::

       A[3][2] =
         [4  32
          53 12
          81  2]

     is flattened to ``A_flat[6] = [4 53 81 32 12 2]``.

     ``lda, ldb, ldc`` name the leading dimension (column stride) of ``A, B, C``, so that submatrices can be passed
     without copying.

  3. Batches.
     Stochastic process quantities carry arbitrary leading batch dimensions (one per latent function, per output
     dimension of a deep layer, per Monte-Carlo sample, ...).  A batch shape is a ``std::vector<int>`` listed outermost
     first; see qep_batch_matrix.hpp.  Batch elements are flattened in ROW-MAJOR order over the batch shape (the last
     batch dimension varies fastest) and each element is itself a column-major matrix as in item 2.  So a
     ``BatchMatrix`` with batch shape ``[2][3]`` and ``4 x 5`` elements is 6 contiguous ``4 x 5`` column-major matrices,
     and element ``(b0, b1)`` starts at offset ``(b0*3 + b1)*20``.

     Points follow the convention ``points[dim][num_points]``: each column is one point.  So ``[..., N, D]`` inputs
     live in a ``BatchMatrix`` with ``num_rows = D`` and ``num_cols = N``.

     Shapes broadcast like numpy: trailing dimensions are aligned and each pair must match or contain a 1.

  4. Keywords.
     a. mark all pointers ``const`` whenever appropriate (e.g., all inputs)
     b. mark class member functions ``const`` whenever appropriate
     c. mark pointers ``restrict`` whenever appropriate (see restrict below)
     d. ``likely``/``unlikely`` branch hints are used sparingly, mostly on error checks
     e. gcc attributes via the ``SQ_*`` macros below: ``unused``, ``nonnull``, ``warn_unused_result``, ``pure``,
        ``const``, ``noreturn``; plus ``final``, ``override``, ``noexcept`` from the language

  5. Evaluator/State separation.
     Objects whose expensive derived quantities are recomputed per query separate the immutable "core" object from
     its mutable state.  The core registers ``using StateType = FooState;`` and provides ``FillState(StateType *) const``;
     the State is a struct whose ctor calls ``SetupState(const Foo&, ...)``, which sizes its members and asks the core
     to fill them.

     =================================================  ===============================================
     Class                                               State
     =================================================  ===============================================
     ExactConditionalProcess                             PointsToSampleState
     =================================================  ===============================================

     Variational strategies do NOT follow this split: their derived quantities (prior distribution, Cholesky factor of
     ``K_{zz}``, pseudo points) are memoized in a ``StrategyCache`` owned by the strategy and stamped with a
     generation counter.  Any change to the learnable parameters bumps the generation, which invalidates every entry.
     The RNG classes are also exempt since they exist only to hold mutable state.

  6. Explicit [template] instantiation.
     Large templates are defined in cpp files and explicitly instantiated there (``template class Foo<int>;``), with an
     ``extern template class Foo<int>;`` declaration in the hpp.  This keeps compile times down; templates are used
     here as static polymorphism over a handful of types.

  7. Matrix-loop idiom.
     Loops over columns advance the pointer instead of recomputing offsets::

       for (int i = 0; i < n; ++i) {
         y[i] = DotProduct(A, x, m);
         A += lda;
       }

  8. RAII and exception safety.
     All resources are held by objects whose dtors release them.  All components provide basic exception safety;
     functions marked ``noexcept`` provide the nothrow guarantee.  Errors are reported by throwing the exceptions in
     qep_exception.hpp; see that file for the taxonomy.

  Function comments go above declarations and describe inputs/outputs in RST::

    BEGIN_COMMENT!\rst
      Compute all the stuff.

      \param
        :size: number of variables
        :x[size]: vector of input variables
      \output
        :y[size]: vector of computed results
      \return
        confidence score of the results, y
    \endrstEND_COMMENT
\endrst*/

#ifndef SPARSE_QEP_CPP_QEP_COMMON_HPP_
#define SPARSE_QEP_CPP_QEP_COMMON_HPP_

namespace sparse_qep {

/*!\rst
  Macros declare copy and assignment operators for C++ classes.  Place these in the private (or protected) section of
  a class to disallow these actions.
\endrst*/
#define SQ_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName) \
  TypeName() = delete

#define SQ_DISALLOW_COPY(TypeName) \
  TypeName(const TypeName&) = delete

#define SQ_DISALLOW_ASSIGN(TypeName) \
  void operator=(const TypeName&) = delete

#define SQ_DISALLOW_COPY_AND_ASSIGN(TypeName) \
  SQ_DISALLOW_COPY(TypeName);                 \
  SQ_DISALLOW_ASSIGN(TypeName)

#define SQ_DISALLOW_DEFAULT_AND_COPY_AND_ASSIGN(TypeName) \
  SQ_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName); \
  SQ_DISALLOW_COPY_AND_ASSIGN(TypeName)

#define SQ_DISALLOW_DEFAULT_AND_ASSIGN(TypeName) \
  SQ_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName); \
  SQ_DISALLOW_ASSIGN(TypeName)

/*!\rst
  Name of the function immediately containing the macro.  ``__PRETTY_FUNCTION__`` also prints template parameters
  and argument types, so it is preferred where supported.
\endrst*/
#ifdef __GNUC__
#define SQ_CURRENT_FUNCTION_NAME __PRETTY_FUNCTION__
#else
#define SQ_CURRENT_FUNCTION_NAME __func__
#endif

/*!\rst
  Branch prediction hints through ``__builtin_expect()``.  Most useful for branches that almost never happen (errors).
\endrst*/
#ifndef unlikely
#define unlikely(expr) __builtin_expect((expr), 0)
#endif

#ifndef likely
#define likely(expr) __builtin_expect((expr), 1)
#endif

/*!\rst
  Allow ``restrict`` as a keyword in ``C++``.  ``restrict``'d pointers promise that values written through one of them
  are never read or written through another.  Invalid use is undefined behavior; the compiler does not check it.
\endrst*/
#ifdef __cplusplus
#define restrict __restrict__
#endif

/*!\rst
  Silence unused variable warnings; e.g., ``void Foo(int SQ_UNUSED(index))``.
\endrst*/
#ifdef __GNUC__
#define SQ_UNUSED(x) UNUSED_ ## x __attribute__((__unused__))
#else
#define SQ_UNUSED(x) UNUSED_ ## x
#endif

/*!\rst
  Warn when ``nullptr`` is passed for pointer arguments.  For member functions, the implicit ``this`` is argument 1,
  so ``SQ_NONNULL_POINTERS_LIST`` indices are shifted by one.
\endrst*/
#ifdef __GNUC__
#define SQ_NONNULL_POINTERS __attribute__((__nonnull__))  // all pointers must be nonnull
#define SQ_NONNULL_POINTERS_LIST(...) __attribute__((__nonnull__ (__VA_ARGS__)))  // listed positions must be nonnull
#else
#define SQ_NONNULL_POINTERS
#define SQ_NONNULL_POINTERS_LIST(...)
#endif

/*!\rst
  Warn when the return value is ignored.
\endrst*/
#ifdef __GNUC__
#define SQ_WARN_UNUSED_RESULT __attribute__((__warn_unused_result__))
#else
#define SQ_WARN_UNUSED_RESULT
#endif

/*!\rst
  Function depends only on its (non-pointer) arguments and has no side effects.
\endrst*/
#ifdef __GNUC__
#define SQ_CONST_FUNCTION __attribute__((__const__))
#else
#define SQ_CONST_FUNCTION
#endif

/*!\rst
  Function has no side effects; it may read (but not write) global memory and pointer arguments.
\endrst*/
#ifdef __GNUC__
#define SQ_PURE_FUNCTION __attribute__((__pure__))
#else
#define SQ_PURE_FUNCTION
#endif

/*!\rst
  Function never returns (e.g., it always throws).
\endrst*/
#ifdef __GNUC__
#define SQ_NORETURN __attribute__((__noreturn__))
#else
#define SQ_NORETURN
#endif

/*!\rst
  ``value * value`` without a call to ``std::pow``.

  \param
    :value: value to be squared
  \return
    the product: value * value
\endrst*/
template <typename T>
constexpr SQ_WARN_UNUSED_RESULT SQ_CONST_FUNCTION T Square(T value) {
  return value*value;
}

/*!\rst
  Mathematical constants.
\endrst*/
static constexpr double kPi = 3.1415926535897932384626;
static constexpr double kSqrt3 = 1.7320508075688772935274;
static constexpr double kSqrt5 = 2.2360679774997896964092;
static constexpr double kLog2Pi = 1.8378770664093454835607;
static constexpr double kLog2 = 0.6931471805599453094172;

}  // end namespace sparse_qep

#endif  // SPARSE_QEP_CPP_QEP_COMMON_HPP_
