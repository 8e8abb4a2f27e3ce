/// @file batch_update.hpp
/// @brief Applying an ordered list of requests to one presentation.

#pragma once

#include <slides-cpp/error.hpp>
#include <slides-cpp/handlers.hpp>
#include <slides-cpp/request.hpp>
#include <slides-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace slides_cpp {

/// The request that stopped a batch.
struct BatchFailure {
    std::size_t index;    ///< Position of the failing request.
    std::string request;  ///< Its operation name, or "" if it could not be parsed.
    Error error;

    auto operator==(const BatchFailure&) const -> bool = default;
};

/// Outcome of a batch: one reply per applied request, in order, and the
/// failure that stopped the batch, if any.
struct BatchResult {
    Value replies = Value::array();  ///< `[{<operationName>: body}, ...]`
    std::optional<BatchFailure> failure;

    auto ok() const noexcept -> bool { return !failure.has_value(); }
};

/// Apply one request and wrap its reply body as `{<operationName>: body}`.
auto apply_request(Value& presentation, const Request& request, HandlerContext& ctx) -> Result<Value>;

/// Apply requests in order, stopping at the first failure. Requests
/// before the failure keep their effects.
///
/// @code
/// auto ids = IdFactory{};
/// auto opts = StoreOptions{};
/// auto ctx = HandlerContext{ids, opts};
/// auto result = apply_requests(deck, requests, ctx);
/// if (!result.ok()) report(result.failure->index, result.failure->error);
/// @endcode
auto apply_requests(Value& presentation, std::span<const Request> requests,
                    HandlerContext& ctx) -> BatchResult;

/// Apply a JSON request envelope (a sequence of single-key objects).
/// Each item is parsed just before it runs, so a malformed item fails
/// at its own index.
auto apply_requests(Value& presentation, const Value& requests, HandlerContext& ctx) -> BatchResult;

}  // namespace slides_cpp
