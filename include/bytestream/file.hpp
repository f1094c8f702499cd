#pragma once

#include "handle.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>

namespace bytestream {
    struct file_deleter {
        bool pipe = false;
#ifndef NDEBUG
        std::string name;
#endif
        auto operator()(FILE* file) const noexcept -> void;
    };

    using file_stream = std::unique_ptr<FILE, file_deleter>;

    class file_handle final : public handle {
        file_stream file;
        std::string open_mode;
        std::optional<std::string> locator;
        std::string type;
        bool can_seek = false;
    public:
        file_handle(
            file_stream&& file,
            std::string_view mode,
            std::optional<std::string> uri = std::nullopt,
            std::string_view type = "STDIO"
        );

        auto close() noexcept -> bool override;

        auto eof() const noexcept -> bool override;

        auto is_open() const noexcept -> bool override;

        auto metadata() const -> bytestream::metadata override;

        auto mode() const noexcept -> std::string_view override;

        auto native() const noexcept -> FILE*;

        auto read(std::span<std::byte> buffer)
            -> std::optional<std::size_t> override;

        auto seek(long offset, int whence) noexcept -> bool override;

        auto seekable() const noexcept -> bool override;

        auto stat() const noexcept -> std::optional<std::size_t> override;

        auto tell() const noexcept -> std::optional<long> override;

        auto uri() const -> std::optional<std::string> override;

        auto write(std::span<const std::byte> data)
            -> std::optional<std::size_t> override;
    };

    // Mode: one of r, w, a, x (exclusive create) or c (create without
    // truncating), then an optional '+' and 'b' or 't'.
    auto open(const std::filesystem::path& path, std::string_view mode)
        -> std::unique_ptr<file_handle>;

    auto pipe(std::string_view command, std::string_view mode)
        -> std::unique_ptr<file_handle>;

    auto temp() -> std::unique_ptr<file_handle>;

    auto wrap(FILE* file) -> std::unique_ptr<file_handle>;
}
