#pragma once

#include "handle.hpp"

#include <filesystem>
#include <memory>
#include <zlib.h>

namespace bytestream {
    class gzip_handle final : public handle {
        gzFile file;
        std::string open_mode;
        std::string path;
    public:
        gzip_handle(gzFile file, std::string_view mode, std::string path);

        gzip_handle(const gzip_handle&) = delete;

        ~gzip_handle();

        auto operator=(const gzip_handle&) -> gzip_handle& = delete;

        auto close() noexcept -> bool override;

        auto eof() const noexcept -> bool override;

        auto is_open() const noexcept -> bool override;

        auto metadata() const -> bytestream::metadata override;

        auto mode() const noexcept -> std::string_view override;

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

    auto gzip(const std::filesystem::path& path, std::string_view mode)
        -> std::unique_ptr<gzip_handle>;
}
