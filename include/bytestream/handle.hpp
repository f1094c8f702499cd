#pragma once

#include "json.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bytestream {
    struct metadata {
        std::string_view stream_type;
        std::string mode;
        bool seekable = false;
        bool eof = false;
        std::optional<std::string> uri;
    };

    auto to_json(json& json, const metadata& metadata) -> void;

    // Primitives report failure through empty optionals or false returns
    // and leave errno describing the cause.
    class handle {
    public:
        virtual ~handle() = default;

        virtual auto close() noexcept -> bool = 0;

        virtual auto eof() const noexcept -> bool = 0;

        virtual auto is_open() const noexcept -> bool = 0;

        virtual auto metadata() const -> bytestream::metadata = 0;

        virtual auto mode() const noexcept -> std::string_view = 0;

        virtual auto read(std::span<std::byte> buffer)
            -> std::optional<std::size_t> = 0;

        virtual auto read_all() -> std::optional<std::string>;

        virtual auto seek(long offset, int whence) noexcept -> bool = 0;

        virtual auto seekable() const noexcept -> bool = 0;

        virtual auto stat() const noexcept -> std::optional<std::size_t> = 0;

        virtual auto tell() const noexcept -> std::optional<long> = 0;

        virtual auto uri() const -> std::optional<std::string> = 0;

        virtual auto write(std::span<const std::byte> data)
            -> std::optional<std::size_t> = 0;
    };
}
