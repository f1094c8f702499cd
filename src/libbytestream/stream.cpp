#include <bytestream/error.h>
#include <bytestream/mode.hpp>
#include <bytestream/stream.hpp>

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <timber/timber>
#include <utility>

namespace fs = std::filesystem;

using namespace std::literals;

namespace {
    constexpr auto file_scheme = "file://"sv;

    auto local_path(const std::optional<std::string>& uri)
        -> std::optional<fs::path> {
        if (!uri || uri->empty()) return std::nullopt;

        const auto view = std::string_view(*uri);

        if (view.starts_with(file_scheme)) {
            return fs::path(view.substr(file_scheme.size()));
        }

        if (view.find("://") != std::string_view::npos) return std::nullopt;

        return fs::path(view);
    }
}

namespace bytestream {
    stream::stream(std::unique_ptr<bytestream::handle>&& handle) :
        stream(std::move(handle), options())
    {}

    stream::stream(
        std::unique_ptr<bytestream::handle>&& handle,
        options&& opts
    ) :
        handle(std::move(handle)),
        cached_size(opts.size)
    {
        if (!this->handle || !this->handle->is_open()) {
            throw invalid_argument("stream requires an open resource handle");
        }

        if (!opts.metadata.is_object()) {
            throw invalid_argument(
                "stream metadata must be an object, not {}",
                opts.metadata.type_name()
            );
        }

        const auto mode = open_mode(this->handle->mode());

        can_read = mode.readable();
        can_write = mode.writable();
        can_seek = this->handle->seekable();
        locator = this->handle->uri();
        custom = std::move(opts.metadata);

        TIMBER_TRACE(
            R"({} opened with mode "{}" ({}{}))",
            *this,
            this->handle->mode(),
            mode,
            can_seek ? ", seekable" : ""
        );
    }

    stream::stream(stream&& other) noexcept :
        handle(std::move(other.handle)),
        cached_size(std::exchange(other.cached_size, std::nullopt)),
        locator(std::exchange(other.locator, std::nullopt)),
        custom(std::move(other.custom)),
        can_read(std::exchange(other.can_read, false)),
        can_seek(std::exchange(other.can_seek, false)),
        can_write(std::exchange(other.can_write, false))
    {}

    stream::~stream() {
        close();
    }

    auto stream::operator=(stream&& other) noexcept -> stream& {
        if (std::addressof(other) != this) {
            std::destroy_at(this);
            std::construct_at(this, std::move(other));
        }

        return *this;
    }

    stream::operator std::string() noexcept {
        return string();
    }

    auto stream::close() noexcept -> void {
        if (!handle) return;

        TIMBER_TRACE("{} closing", *this);

        if (!handle->close()) {
            TIMBER_DEBUG("{} handle reported an error while closing", *this);
        }

        reset();
    }

    auto stream::contents() -> std::string {
        if (!handle) throw detached();

        if (!can_read) {
            throw io_error(EBADF, "cannot read from non-readable stream");
        }

        auto result = handle->read_all();
        if (!result) throw io_error(errno, "unable to read stream contents");

        return std::move(*result);
    }

    auto stream::detach() noexcept -> std::unique_ptr<bytestream::handle> {
        if (!handle) return nullptr;

        TIMBER_TRACE("{} detached", *this);

        auto result = std::move(handle);
        reset();

        return result;
    }

    auto stream::eof() const -> bool {
        if (!handle) throw detached();
        return handle->eof();
    }

    auto stream::metadata() const noexcept -> json {
        if (!handle) return json::object();

        try {
            auto result = json(handle->metadata());
            result.update(custom);
            return result;
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR("{} failed to read metadata: {}", *this, ex.what());
        }

        return json::object();
    }

    auto stream::metadata(std::string_view key) const noexcept
        -> std::optional<json> {
        if (!handle) return std::nullopt;

        try {
            const auto name = std::string(key);

            const auto entry = custom.find(name);
            if (entry != custom.end()) return *entry;

            const auto all = json(handle->metadata());

            const auto it = all.find(name);
            if (it != all.end()) return *it;
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR(
                R"({} failed to read metadata entry "{}": {})",
                *this,
                key,
                ex.what()
            );
        }

        return std::nullopt;
    }

    auto stream::read(long length) -> std::string {
        if (length < 0) throw invalid_argument("length cannot be negative");
        if (!handle) throw detached();

        if (!can_read) {
            throw io_error(EBADF, "cannot read from non-readable stream");
        }

        if (length == 0) return {};

        auto buffer = std::string(static_cast<std::size_t>(length), '\0');

        const auto bytes =
            handle->read(std::as_writable_bytes(std::span(buffer)));
        if (!bytes) throw io_error(errno, "unable to read from stream");

        buffer.resize(*bytes);
        return buffer;
    }

    auto stream::readable() const noexcept -> bool {
        return can_read;
    }

    auto stream::reset() noexcept -> void {
        handle.reset();
        cached_size.reset();
        locator.reset();
        custom.clear();

        can_read = false;
        can_seek = false;
        can_write = false;
    }

    auto stream::rewind() -> void {
        seek(0);
    }

    auto stream::seek(long offset, int whence) -> void {
        if (!handle) throw detached();
        if (!can_seek) throw io_error(ESPIPE, "stream is not seekable");

        if (!handle->seek(offset, whence)) {
            throw io_error(
                errno,
                "unable to seek to stream position {} with whence {}",
                offset,
                whence
            );
        }
    }

    auto stream::seekable() const noexcept -> bool {
        return can_seek;
    }

    auto stream::size() noexcept -> std::optional<std::size_t> {
        if (!handle) return std::nullopt;

        // Files may change underneath the handle, so their size is never
        // served from the cache.
        const auto path = local_path(locator);
        if (cached_size && !path) return cached_size;

        auto fresh = std::optional<std::size_t>();

        if (path) {
            auto error = std::error_code();
            const auto bytes = fs::file_size(*path, error);

            if (!error) fresh = static_cast<std::size_t>(bytes);
        }

        if (!fresh) fresh = handle->stat();
        if (fresh) cached_size = fresh;

        return fresh;
    }

    auto stream::string() noexcept -> std::string {
        try {
            if (can_seek) rewind();
            return contents();
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR("{} string conversion failed: {}", *this, ex.what());
        }

        return {};
    }

    auto stream::tell() const -> long {
        if (!handle) throw detached();

        const auto position = handle->tell();
        if (!position) {
            throw io_error(errno, "unable to determine stream position");
        }

        return *position;
    }

    auto stream::writable() const noexcept -> bool {
        return can_write;
    }

    auto stream::write(std::span<const std::byte> data) -> std::size_t {
        if (!handle) throw detached();

        if (!can_write) {
            throw io_error(EBADF, "cannot write to a non-writable stream");
        }

        const auto bytes = handle->write(data);
        if (!bytes) throw io_error(errno, "unable to write to stream");

        if (cached_size) *cached_size += *bytes;

        return *bytes;
    }

    auto stream::write(std::string_view data) -> std::size_t {
        return write(std::as_bytes(std::span(data.data(), data.size())));
    }
}
