/// @file error.hpp
/// @brief Error types and the Result return type for slides-cpp.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace slides_cpp {

/// Categories of errors that can occur while handling requests.
enum class ErrorKind : std::uint8_t {
    invalid_input,      ///< Malformed or missing parameters.
    not_found,          ///< A referenced presentation, page, element or layout does not exist.
    conflict,           ///< Duplicate ID on create, or a structural path conflict.
    unimplemented,      ///< The operation is not simulated (table-cell text).
    revision_mismatch,  ///< Write control named a revision that is not current.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_input:     return "invalid_input";
        case ErrorKind::not_found:         return "not_found";
        case ErrorKind::conflict:          return "conflict";
        case ErrorKind::unimplemented:     return "unimplemented";
        case ErrorKind::revision_mismatch: return "revision_mismatch";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

// -- Error constructors -------------------------------------------------------

inline auto invalid_input(std::string msg) -> Error {
    return Error{ErrorKind::invalid_input, std::move(msg)};
}

inline auto not_found(std::string msg) -> Error {
    return Error{ErrorKind::not_found, std::move(msg)};
}

inline auto conflict(std::string msg) -> Error {
    return Error{ErrorKind::conflict, std::move(msg)};
}

inline auto unimplemented(std::string msg) -> Error {
    return Error{ErrorKind::unimplemented, std::move(msg)};
}

// -- Result -------------------------------------------------------------------

/// Either a value of type T or an Error.
///
/// @code
/// auto r = get_path(doc, "slideProperties.layoutObjectId");
/// if (!r) return r.error();
/// use(*r);
/// @endcode
template <typename T>
class Result {
public:
    Result(T value) : data_{std::in_place_index<0>, std::move(value)} {}
    Result(Error error) : data_{std::in_place_index<1>, std::move(error)} {}

    auto has_value() const noexcept -> bool { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    auto value() & -> T& { return std::get<0>(data_); }
    auto value() const& -> const T& { return std::get<0>(data_); }
    auto value() && -> T&& { return std::get<0>(std::move(data_)); }

    auto error() const& -> const Error& { return std::get<1>(data_); }
    auto error() && -> Error&& { return std::get<1>(std::move(data_)); }

    auto operator*() & -> T& { return value(); }
    auto operator*() const& -> const T& { return value(); }
    auto operator*() && -> T&& { return std::move(*this).value(); }
    auto operator->() -> T* { return &value(); }
    auto operator->() const -> const T* { return &value(); }

private:
    std::variant<T, Error> data_;
};

/// A Result carrying no value: success, or an Error.
template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_{std::move(error)} {}

    auto has_value() const noexcept -> bool { return !error_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    auto error() const& -> const Error& { return *error_; }
    auto error() && -> Error&& { return std::move(*error_); }

private:
    std::optional<Error> error_;
};

}  // namespace slides_cpp
