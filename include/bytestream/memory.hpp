#pragma once

#include "handle.hpp"

#include <memory>

namespace bytestream {
    class memory_handle final : public handle {
        std::string buffer;
        std::string open_mode;
        std::size_t position = 0;
        bool open = true;
        bool end = false;
        bool append;
    public:
        memory_handle(std::string data, std::string_view mode);

        auto close() noexcept -> bool override;

        auto data() const noexcept -> std::string_view;

        auto eof() const noexcept -> bool override;

        auto is_open() const noexcept -> bool override;

        auto metadata() const -> bytestream::metadata override;

        auto mode() const noexcept -> std::string_view override;

        auto read(std::span<std::byte> buffer)
            -> std::optional<std::size_t> override;

        auto read_all() -> std::optional<std::string> override;

        auto seek(long offset, int whence) noexcept -> bool override;

        auto seekable() const noexcept -> bool override;

        auto stat() const noexcept -> std::optional<std::size_t> override;

        auto tell() const noexcept -> std::optional<long> override;

        auto uri() const -> std::optional<std::string> override;

        auto write(std::span<const std::byte> data)
            -> std::optional<std::size_t> override;
    };

    auto memory(std::string_view mode = "w+b") -> std::unique_ptr<memory_handle>;

    auto memory(std::string data, std::string_view mode)
        -> std::unique_ptr<memory_handle>;
}
