#pragma once

// Helpers shared by the request handlers.
//
// Internal header, not installed.

#include <slides-cpp/handlers.hpp>
#include <slides-cpp/locator.hpp>

#include <string>
#include <string_view>

namespace slides_cpp::detail {

// Give a mutated page a fresh revision.
inline void touch_page(Value* page, HandlerContext& ctx) {
    ctx.mutated = true;
    if (page && page->is_object()) (*page)["revisionId"] = ctx.ids.new_id();
}

inline auto quote_id(std::string_view id) -> std::string {
    return "'" + std::string{id} + "'";
}

// Reject an ID for a new object that is malformed or already in use.
inline auto check_unused_id(const Value& presentation, std::string_view id,
                            const HandlerContext& ctx) -> Result<void> {
    if (auto valid = check_new_object_id(id, ctx.options); !valid) return valid;
    if (contains_object_id(presentation, id)) {
        return conflict("object ID " + quote_id(id) + " already exists");
    }
    return {};
}

}  // namespace slides_cpp::detail
