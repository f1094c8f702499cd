#pragma once

#include <fmt/format.h>
#include <string_view>

namespace bytestream {
    class open_mode {
        bool read = false;
        bool write = false;
    public:
        constexpr open_mode() = default;

        constexpr open_mode(std::string_view mode) noexcept :
            read(mode.find_first_of("r+") != std::string_view::npos),
            write(mode.find_first_of("wacx+") != std::string_view::npos)
        {}

        constexpr auto operator==(const open_mode& other) const noexcept
            -> bool = default;

        constexpr auto readable() const noexcept -> bool { return read; }

        constexpr auto writable() const noexcept -> bool { return write; }
    };
}

namespace fmt {
    template <>
    struct formatter<bytestream::open_mode> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const bytestream::open_mode& mode, FormatContext& ctx)
            const {
            auto result = std::string_view("none");

            if (mode.readable() && mode.writable()) result = "read/write";
            else if (mode.readable()) result = "read";
            else if (mode.writable()) result = "write";

            return formatter<std::string_view>::format(result, ctx);
        }
    };
}
