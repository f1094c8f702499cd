#pragma once

#include "handle.hpp"
#include "json.hpp"

#include <cstdio>
#include <fmt/format.h>
#include <memory>

namespace bytestream {
    // Introspection (size, metadata) and string conversion never throw.
    class stream {
        friend struct fmt::formatter<stream>;

        std::unique_ptr<bytestream::handle> handle;
        std::optional<std::size_t> cached_size;
        std::optional<std::string> locator;
        json custom = json::object();
        bool can_read = false;
        bool can_seek = false;
        bool can_write = false;

        auto reset() noexcept -> void;
    public:
        struct options {
            std::optional<std::size_t> size;
            json metadata = json::object();
        };

        stream() = default;

        explicit stream(std::unique_ptr<bytestream::handle>&& handle);

        stream(std::unique_ptr<bytestream::handle>&& handle, options&& opts);

        stream(const stream&) = delete;

        stream(stream&& other) noexcept;

        ~stream();

        auto operator=(const stream&) -> stream& = delete;

        auto operator=(stream&& other) noexcept -> stream&;

        explicit operator std::string() noexcept;

        auto close() noexcept -> void;

        auto contents() -> std::string;

        auto detach() noexcept -> std::unique_ptr<bytestream::handle>;

        auto eof() const -> bool;

        auto metadata() const noexcept -> json;

        auto metadata(std::string_view key) const noexcept
            -> std::optional<json>;

        auto read(long length) -> std::string;

        auto readable() const noexcept -> bool;

        auto rewind() -> void;

        auto seek(long offset, int whence = SEEK_SET) -> void;

        auto seekable() const noexcept -> bool;

        auto size() noexcept -> std::optional<std::size_t>;

        // Failures are logged; an empty string is returned in that case.
        auto string() noexcept -> std::string;

        auto tell() const -> long;

        auto writable() const noexcept -> bool;

        auto write(std::span<const std::byte> data) -> std::size_t;

        auto write(std::string_view data) -> std::size_t;
    };
}

namespace fmt {
    template <>
    struct formatter<bytestream::stream> {
        template <typename ParseContext>
        constexpr auto parse(ParseContext& ctx) {
            return ctx.begin();
        }

        template <typename FormatContext>
        auto format(const bytestream::stream& stream, FormatContext& ctx)
            const {
            return fmt::format_to(
                ctx.out(),
                "stream ({})",
                fmt::ptr(stream.handle.get())
            );
        }
    };
}
