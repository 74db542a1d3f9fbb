#pragma once

#include "RetryPolicy.hpp"

#include <functional>
#include <memory>
#include <set>
#include <tuple>
#include <type_traits>
#include <utility>

namespace resilient_http {
namespace retry {

// ============ Retry Predicates ============

using RetryConditionFn = std::function<bool(const HttpResponse*, const HttpError&, uint32_t)>;

/**
 * Adapts any callable with the shouldRetry signature.
 */
class FunctionPredicate : public RetryPredicate {
public:
    explicit FunctionPredicate(RetryConditionFn fn) : fn_(std::move(fn)) {}

    bool shouldRetry(const HttpResponse* response, const HttpError& error, uint32_t attempt) const override {
        return fn_ && fn_(response, error, attempt);
    }

private:
    RetryConditionFn fn_;
};

inline RetryPredicatePtr fromFunction(RetryConditionFn fn) {
    return std::make_shared<FunctionPredicate>(std::move(fn));
}

inline RetryPredicatePtr always() {
    return fromFunction([](const HttpResponse*, const HttpError&, uint32_t) { return true; });
}

inline RetryPredicatePtr never() {
    return fromFunction([](const HttpResponse*, const HttpError&, uint32_t) { return false; });
}

/**
 * Retry on transient CURL errors only.
 */
inline RetryPredicatePtr onCurlCodes(std::set<CURLcode> codes = {
                                         CURLE_COULDNT_RESOLVE_HOST,
                                         CURLE_COULDNT_CONNECT,
                                         CURLE_OPERATION_TIMEDOUT,
                                         CURLE_SSL_CONNECT_ERROR,
                                         CURLE_SEND_ERROR,
                                         CURLE_RECV_ERROR,
                                         CURLE_GOT_NOTHING,
                                     }) {
    return fromFunction([codes = std::move(codes)](const HttpResponse*, const HttpError& error, uint32_t) {
        return codes.count(error.curlCode()) > 0;
    });
}

/**
 * Retry while the failed attempt number is below maxAttempt.
 */
inline RetryPredicatePtr upToAttempt(uint32_t maxAttempt) {
    return fromFunction([maxAttempt](const HttpResponse*, const HttpError&, uint32_t attempt) {
        return attempt < maxAttempt;
    });
}

template <class P>
using is_predicate_ptr = std::is_convertible<P, RetryPredicatePtr>;

/**
 * Combine multiple predicates with OR logic.
 * Returns true if any predicate returns true.
 */
template <class... Ps,
          std::enable_if_t<(sizeof...(Ps) > 0) && (is_predicate_ptr<std::decay_t<Ps>>::value && ...), int> = 0>
inline RetryPredicatePtr anyOf(Ps&&... ps) {
    return fromFunction([fs = std::make_tuple(RetryPredicatePtr(std::forward<Ps>(ps))...)]
                        (const HttpResponse* response, const HttpError& error, uint32_t attempt) -> bool {
        return std::apply(
            [&](const auto&... p) { return ((p && p->shouldRetry(response, error, attempt)) || ...); },
            fs
        );
    });
}

/**
 * Combine multiple predicates with AND logic.
 * Returns true if all predicates return true.
 */
template <class... Ps,
          std::enable_if_t<(sizeof...(Ps) > 0) && (is_predicate_ptr<std::decay_t<Ps>>::value && ...), int> = 0>
inline RetryPredicatePtr allOf(Ps&&... ps) {
    return fromFunction([fs = std::make_tuple(RetryPredicatePtr(std::forward<Ps>(ps))...)]
                        (const HttpResponse* response, const HttpError& error, uint32_t attempt) -> bool {
        return std::apply(
            [&](const auto&... p) { return ((p && p->shouldRetry(response, error, attempt)) && ...); },
            fs
        );
    });
}

} // namespace retry
} // namespace resilient_http
