/* -*- Mode: C++; tab-width: 8; indent-tabs-mode: nil; c-basic-offset: 2 -*-
 * vim: set ts=8 sts=2 et sw=2 tw=80:
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/* A type suitable for returning either a value or an error from a function. */

#ifndef tempora_Result_h
#define tempora_Result_h

#include <type_traits>
#include <utility>
#include <variant>

#include "tempora/Assertions.h"

namespace tempora {

/**
 * Empty struct, indicating success for operations that have no return value.
 * For example, if you declare another empty struct `struct OutOfMemory {};`,
 * then `Result<Ok, OutOfMemory>` represents either success or OOM.
 */
struct Ok {};

template <typename V, typename E>
class Result;

/**
 * A type that auto-converts to an error Result. This is like a Result without
 * a success type. It's the best return type for functions that always return
 * an error.
 */
template <typename E>
class [[nodiscard]] GenericErrorResult {
  E mErrorValue;

  template <typename V, typename E2>
  friend class Result;

 public:
  explicit GenericErrorResult(const E& aErrorValue) : mErrorValue(aErrorValue) {}
  explicit GenericErrorResult(E&& aErrorValue)
      : mErrorValue(std::move(aErrorValue)) {}
};

template <typename E>
inline auto Err(E&& aErrorValue) {
  return GenericErrorResult<std::decay_t<E>>(std::forward<E>(aErrorValue));
}

/**
 * Result<V, E> represents the outcome of an operation that can either succeed
 * or fail. It contains either a success value of type V or an error value of
 * type E.
 *
 * All Result methods are const, so results are basically immutable, except
 * that unwrap() and unwrapErr() move the contained value out.
 */
template <typename V, typename E>
class [[nodiscard]] Result final {
  static_assert(!std::is_same_v<V, E>,
                "success and error types must be distinct");

  std::variant<V, E> mStorage;

 public:
  using ok_type = V;
  using err_type = E;

  /* Create a success result. */
  Result(V&& aValue) : mStorage(std::in_place_index<0>, std::move(aValue)) {}
  Result(const V& aValue) : mStorage(std::in_place_index<0>, aValue) {}

  /* Create an error result. */
  explicit Result(const E& aErrorValue)
      : mStorage(std::in_place_index<1>, aErrorValue) {}

  /* Create an error result from a GenericErrorResult. */
  template <typename E2>
  Result(GenericErrorResult<E2>&& aErrorResult)
      : mStorage(std::in_place_index<1>, std::move(aErrorResult.mErrorValue)) {}

  Result(const Result&) = default;
  Result(Result&&) = default;
  Result& operator=(const Result&) = default;
  Result& operator=(Result&&) = default;

  /** True if this Result is a success result. */
  bool isOk() const { return mStorage.index() == 0; }

  /** True if this Result is an error result. */
  bool isErr() const { return mStorage.index() == 1; }

  /** Take the success value from this Result, which must be a success result. */
  V unwrap() {
    TEMPORA_RELEASE_ASSERT(isOk(), "unwrap() called on an error result");
    return std::move(*std::get_if<0>(&mStorage));
  }

  /** See the success value from this Result, which must be a success result. */
  const V& inspect() const {
    TEMPORA_RELEASE_ASSERT(isOk(), "inspect() called on an error result");
    return *std::get_if<0>(&mStorage);
  }

  /**
   * Take the success value from this Result, which must be a success result.
   * If it is an error result, then return the aValue.
   */
  V unwrapOr(V aValue) {
    return isOk() ? std::move(*std::get_if<0>(&mStorage)) : std::move(aValue);
  }

  /** Take the error value from this Result, which must be an error result. */
  E unwrapErr() {
    TEMPORA_RELEASE_ASSERT(isErr(), "unwrapErr() called on a success result");
    return std::move(*std::get_if<1>(&mStorage));
  }

  /** See the error value from this Result, which must be an error result. */
  const E& inspectErr() const {
    TEMPORA_RELEASE_ASSERT(isErr(),
                           "inspectErr() called on a success result");
    return *std::get_if<1>(&mStorage);
  }

  /**
   * Propagate the error value from this Result, which must be an error result.
   *
   * This can be used to propagate an error from a function call to the
   * caller with a different value type, but the same error type.
   */
  GenericErrorResult<E> propagateErr() {
    TEMPORA_RELEASE_ASSERT(isErr(),
                           "propagateErr() called on a success result");
    return GenericErrorResult<E>(std::move(*std::get_if<1>(&mStorage)));
  }

  /**
   * Map a function V -> V2 over this result's success variant. If this result
   * is an error, do not invoke the function and propagate the error.
   */
  template <typename F, typename V2 = std::invoke_result_t<F, V>>
  Result<V2, E> map(F f) {
    if (isErr()) {
      return propagateErr();
    }
    return f(unwrap());
  }

  /**
   * Given a function V -> Result<V2, E>, apply it to this result's success
   * value and return its result. If this result is an error value, it is
   * propagated.
   */
  template <typename F, typename R = std::invoke_result_t<F, V>>
  R andThen(F f) {
    if (isErr()) {
      return propagateErr();
    }
    return f(unwrap());
  }
};

}  // namespace tempora

/**
 * TEMPORA_TRY(expr) is the C++ equivalent of Rust's `target = try!(expr);`,
 * using gcc's statement expressions. First, it evaluates expr, which must
 * produce a Result value. On success, the result's success value is
 * 'returned' as rvalue. On error, immediately returns the error result. This
 * pattern allows to directly assign the success value:
 *
 * ```
 * SuccessValue val = TEMPORA_TRY(Func());
 * ```
 *
 * Where `Func()` returns a `Result<SuccessValue, E>` and is called in a
 * function that returns `Result<T, E>`.
 */
#define TEMPORA_TRY(expr)                              \
  __extension__({                                      \
    auto temporaTryVarTempResult = (expr);             \
    if (TEMPORA_UNLIKELY(temporaTryVarTempResult.isErr())) { \
      return temporaTryVarTempResult.propagateErr();   \
    }                                                  \
    temporaTryVarTempResult.unwrap();                  \
  })

/**
 * TEMPORA_ALWAYS_OK(expr) unwraps a Result that cannot fail because its
 * inputs were validated beforehand. Debug builds assert on an error.
 */
#define TEMPORA_ALWAYS_OK(expr)                                        \
  __extension__({                                                      \
    auto temporaAlwaysOkTempResult = (expr);                           \
    TEMPORA_ASSERT(temporaAlwaysOkTempResult.isOk(),                   \
                   "operation on validated input must not fail");      \
    temporaAlwaysOkTempResult.unwrap();                                \
  })

#endif /* tempora_Result_h */
