#include <bytestream/memory.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>
#include <new>

namespace {
    constexpr auto memory_uri = "memory://";
}

namespace bytestream {
    memory_handle::memory_handle(std::string data, std::string_view mode) :
        buffer(std::move(data)),
        open_mode(mode),
        append(mode.find('a') != std::string_view::npos)
    {}

    auto memory_handle::close() noexcept -> bool {
        open = false;
        end = false;
        position = 0;
        buffer.clear();
        buffer.shrink_to_fit();
        return true;
    }

    auto memory_handle::data() const noexcept -> std::string_view {
        return buffer;
    }

    auto memory_handle::eof() const noexcept -> bool {
        return end;
    }

    auto memory_handle::is_open() const noexcept -> bool {
        return open;
    }

    auto memory_handle::metadata() const -> bytestream::metadata {
        return {
            .stream_type = "MEMORY",
            .mode = open_mode,
            .seekable = true,
            .eof = end,
            .uri = memory_uri
        };
    }

    auto memory_handle::mode() const noexcept -> std::string_view {
        return open_mode;
    }

    auto memory_handle::read(std::span<std::byte> buffer)
        -> std::optional<std::size_t> {
        if (!open) {
            errno = EBADF;
            return std::nullopt;
        }

        const auto available =
            position < this->buffer.size() ?
            this->buffer.size() - position : 0;
        const auto bytes = std::min(available, buffer.size());

        if (bytes > 0) {
            std::memcpy(buffer.data(), this->buffer.data() + position, bytes);
            position += bytes;
        }

        if (bytes < buffer.size()) end = true;

        return bytes;
    }

    auto memory_handle::read_all() -> std::optional<std::string> {
        if (!open) {
            errno = EBADF;
            return std::nullopt;
        }

        end = true;

        if (position >= buffer.size()) return std::string();

        auto result = buffer.substr(position);
        position = buffer.size();
        return result;
    }

    auto memory_handle::seek(long offset, int whence) noexcept -> bool {
        if (!open) return false;

        auto base = long(0);

        switch (whence) {
            case SEEK_SET: break;
            case SEEK_CUR: base = static_cast<long>(position); break;
            case SEEK_END: base = static_cast<long>(buffer.size()); break;
            default:
                errno = EINVAL;
                return false;
        }

        if (offset > 0 && base > std::numeric_limits<long>::max() - offset) {
            errno = EOVERFLOW;
            return false;
        }

        if (base + offset < 0) {
            errno = EINVAL;
            return false;
        }

        position = static_cast<std::size_t>(base + offset);
        end = false;
        return true;
    }

    auto memory_handle::seekable() const noexcept -> bool {
        return true;
    }

    auto memory_handle::stat() const noexcept -> std::optional<std::size_t> {
        if (!open) return std::nullopt;
        return buffer.size();
    }

    auto memory_handle::tell() const noexcept -> std::optional<long> {
        if (!open) return std::nullopt;
        return static_cast<long>(position);
    }

    auto memory_handle::uri() const -> std::optional<std::string> {
        return memory_uri;
    }

    auto memory_handle::write(std::span<const std::byte> data)
        -> std::optional<std::size_t> {
        if (!open) {
            errno = EBADF;
            return std::nullopt;
        }

        if (append) position = buffer.size();

        if (position > buffer.max_size() - data.size()) {
            errno = EFBIG;
            return std::nullopt;
        }

        // Writing past the end fills the gap with zeros, as a sparse file
        // would read back.
        if (position + data.size() > buffer.size()) {
            try {
                buffer.resize(position + data.size());
            }
            catch (const std::bad_alloc&) {
                errno = ENOMEM;
                return std::nullopt;
            }
        }

        if (!data.empty()) {
            std::memcpy(buffer.data() + position, data.data(), data.size());
        }

        position += data.size();

        return data.size();
    }

    auto memory(std::string_view mode) -> std::unique_ptr<memory_handle> {
        return std::make_unique<memory_handle>(std::string(), mode);
    }

    auto memory(std::string data, std::string_view mode)
        -> std::unique_ptr<memory_handle> {
        return std::make_unique<memory_handle>(std::move(data), mode);
    }
}
