#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bytestream {
    class error : public std::runtime_error {
        static auto format_message(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(format_message(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };

    class error_code : public error {
        int errorc;
    public:
        error_code(int code, std::string_view what) :
            error(what),
            errorc(code)
        {}

        template <typename... T>
        error_code(int code, fmt::format_string<T...> format, T&&... args) :
            error(format, std::forward<T>(args)...),
            errorc(code)
        {}

        auto code() const noexcept -> int {
            return errorc;
        }
    };

    /// The underlying resource reported a failure.
    class io_error : public error_code {
    public:
        using error_code::error_code;
    };

    /// An I/O operation was attempted after the stream was closed or
    /// detached.
    struct detached : error {
        detached() : error("stream is detached") {}
    };

    class invalid_argument : public std::invalid_argument {
    public:
        invalid_argument(std::string_view what) :
            std::invalid_argument(std::string(what))
        {}

        template <typename... T>
        invalid_argument(fmt::format_string<T...> format, T&&... args) :
            std::invalid_argument(
                fmt::format(format, std::forward<T>(args)...)
            )
        {}
    };
}
