#include <slides-cpp/batch_update.hpp>
#include <slides-cpp/log.hpp>

#include <string>
#include <utility>

namespace slides_cpp {

namespace {

auto describe(const BatchFailure& failure) -> std::string {
    auto name = failure.request.empty() ? std::string{"<unparsed>"} : failure.request;
    return "batchUpdate request " + std::to_string(failure.index) + " (" + name + ") failed: "
         + std::string{to_string_view(failure.error.kind)} + ": " + failure.error.message;
}

// Run one request, recording its reply or the failure.
auto step(Value& presentation, const Request& request, std::size_t index,
          HandlerContext& ctx, BatchResult& result) -> bool {
    auto reply = apply_request(presentation, request, ctx);
    if (!reply) {
        result.failure = BatchFailure{index, std::string{request_name(request)}, std::move(reply).error()};
        log::warn(describe(*result.failure));
        return false;
    }
    result.replies.push_back(std::move(reply).value());
    return true;
}

}  // anonymous namespace

auto apply_request(Value& presentation, const Request& request, HandlerContext& ctx) -> Result<Value> {
    auto body = std::visit([&](const auto& typed) { return handle(presentation, typed, ctx); }, request);
    if (!body) return body;
    auto reply = Value::object();
    reply[std::string{request_name(request)}] = std::move(body).value();
    return reply;
}

auto apply_requests(Value& presentation, std::span<const Request> requests,
                    HandlerContext& ctx) -> BatchResult {
    log::debug("batchUpdate: applying " + std::to_string(requests.size()) + " requests");
    auto result = BatchResult{};
    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (!step(presentation, requests[i], i, ctx, result)) break;
    }
    return result;
}

auto apply_requests(Value& presentation, const Value& requests, HandlerContext& ctx) -> BatchResult {
    auto result = BatchResult{};
    if (!requests.is_array()) {
        result.failure = BatchFailure{0, "", invalid_input("requests must be a list")};
        log::warn(describe(*result.failure));
        return result;
    }
    log::debug("batchUpdate: applying " + std::to_string(requests.size()) + " requests");
    for (std::size_t i = 0; i < requests.size(); ++i) {
        auto request = parse_request(requests[i]);
        if (!request) {
            auto name = requests[i].is_object() && requests[i].size() == 1
                ? requests[i].begin().key() : std::string{};
            result.failure = BatchFailure{i, std::move(name), std::move(request).error()};
            log::warn(describe(*result.failure));
            break;
        }
        if (!step(presentation, *request, i, ctx, result)) break;
    }
    return result;
}

}  // namespace slides_cpp
