#ifndef GD_ERROR_HPP
#define GD_ERROR_HPP

#include <exception>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace gd {

/// the exception raised for every invalid input and failed layout step; `what()` appends the raising location
struct exception : public std::exception {
    std::string          message;
    std::source_location sourceLocation;

    exception(std::string_view msg = "unknown exception", std::source_location location = std::source_location::current()) noexcept : message(msg), sourceLocation(location) {}

    [[nodiscard]] const char* what() const noexcept override {
        if (formattedMessage.empty()) {
            formattedMessage = fmt::format("{} at {}:{}", message, sourceLocation.file_name(), sourceLocation.line());
        }
        return formattedMessage.c_str();
    }

private:
    mutable std::string formattedMessage;
};

/// error half of the `std::expected` lookups in `gd::options`
struct Error {
    std::string          message;
    std::source_location sourceLocation;

    Error(std::string_view msg = "unknown error", std::source_location location = std::source_location::current()) noexcept : message(msg), sourceLocation(location) {}

    [[nodiscard]] std::string srcLoc() const noexcept { return fmt::format("{}:{}", sourceLocation.file_name(), sourceLocation.line()); }
};

/// unwraps an expected value, turning the error into a `gd::exception` raised at the caller's location
template<typename T>
T getOrThrow(std::expected<T, Error>&& expectedValue, std::source_location location = std::source_location::current()) {
    if (!expectedValue) {
        throw gd::exception(expectedValue.error().message, location);
    }
    return std::move(*expectedValue);
}

} // namespace gd

template<>
struct fmt::formatter<gd::Error> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}') {
            throw fmt::format_error("invalid format");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const gd::Error& err, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}: {}", err.srcLoc(), err.message);
    }
};

#endif // GD_ERROR_HPP
