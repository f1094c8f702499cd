#include <bytestream/error.h>
#include <bytestream/file.hpp>

#include <cerrno>
#include <ext/except.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <timber/timber>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    using bytestream::file_deleter;
    using bytestream::file_stream;

    auto make_deleter(bool pipe, [[maybe_unused]] std::string_view name)
        -> file_deleter {
        auto deleter = file_deleter { .pipe = pipe };
#ifndef NDEBUG
        deleter.name = name;
#endif
        return deleter;
    }

    auto close_file(const file_deleter& deleter, FILE* file) noexcept -> bool {
        if (!file) return true;

        const auto result = deleter.pipe ? pclose(file) : std::fclose(file);

        if (result != -1) {
#ifndef NDEBUG
            TIMBER_DEBUG(
                R"(Closed file stream ({}) "{}")",
                fmt::ptr(file),
                deleter.name
            );
#else
            TIMBER_DEBUG("Closed file stream ({})", fmt::ptr(file));
#endif
            return true;
        }

        const auto error = std::error_code(errno, std::generic_category());

#ifndef NDEBUG
        TIMBER_ERROR(
            R"(Failed to close file stream ({}) "{}": {})",
            fmt::ptr(file),
            deleter.name,
            error.message()
        );
#else
        TIMBER_ERROR(
            "Failed to close file stream ({}): {}",
            fmt::ptr(file),
            error.message()
        );
#endif

        return false;
    }

    auto parse_mode(std::string_view mode) -> std::pair<int, const char*> {
        if (mode.empty()) {
            throw bytestream::invalid_argument("file mode cannot be empty");
        }

        const auto update = mode.find('+') != std::string_view::npos;
        const auto access = update ? O_RDWR : O_WRONLY;

        switch (mode.front()) {
            case 'r':
                return {update ? O_RDWR : O_RDONLY, update ? "r+" : "r"};
            case 'w':
                return {access | O_CREAT | O_TRUNC, update ? "w+" : "w"};
            case 'a':
                return {access | O_CREAT | O_APPEND, update ? "a+" : "a"};
            case 'x':
                return {access | O_CREAT | O_EXCL, update ? "w+" : "w"};
            case 'c':
                return {access | O_CREAT, update ? "w+" : "w"};
        }

        throw bytestream::invalid_argument(R"(invalid file mode "{}")", mode);
    }
}

namespace bytestream {
    auto file_deleter::operator()(FILE* file) const noexcept -> void {
        close_file(*this, file);
    }

    file_handle::file_handle(
        file_stream&& file,
        std::string_view mode,
        std::optional<std::string> uri,
        std::string_view type
    ) :
        file(std::move(file)),
        open_mode(mode),
        locator(std::move(uri)),
        type(type)
    {
        if (!this->file) {
            throw invalid_argument("file handle requires an open stdio stream");
        }

        can_seek = lseek(fileno(this->file.get()), 0, SEEK_CUR) != -1;
    }

    auto file_handle::close() noexcept -> bool {
        const auto deleter = file.get_deleter();
        return close_file(deleter, file.release());
    }

    auto file_handle::eof() const noexcept -> bool {
        return file && std::feof(file.get()) != 0;
    }

    auto file_handle::is_open() const noexcept -> bool {
        return file != nullptr;
    }

    auto file_handle::metadata() const -> bytestream::metadata {
        return {
            .stream_type = type,
            .mode = open_mode,
            .seekable = can_seek,
            .eof = eof(),
            .uri = locator
        };
    }

    auto file_handle::mode() const noexcept -> std::string_view {
        return open_mode;
    }

    auto file_handle::native() const noexcept -> FILE* {
        return file.get();
    }

    auto file_handle::read(std::span<std::byte> buffer)
        -> std::optional<std::size_t> {
        if (!file) {
            errno = EBADF;
            return std::nullopt;
        }

        std::clearerr(file.get());

        const auto bytes =
            std::fread(buffer.data(), 1, buffer.size(), file.get());

        if (bytes < buffer.size() && std::ferror(file.get())) {
            return std::nullopt;
        }

        return bytes;
    }

    auto file_handle::seek(long offset, int whence) noexcept -> bool {
        return file && fseeko(file.get(), offset, whence) == 0;
    }

    auto file_handle::seekable() const noexcept -> bool {
        return can_seek;
    }

    auto file_handle::stat() const noexcept -> std::optional<std::size_t> {
        if (!file) return std::nullopt;

        struct stat info;
        if (fstat(fileno(file.get()), &info) == -1) return std::nullopt;
        if (!S_ISREG(info.st_mode)) return std::nullopt;

        return static_cast<std::size_t>(info.st_size);
    }

    auto file_handle::tell() const noexcept -> std::optional<long> {
        if (!file) return std::nullopt;

        const auto position = ftello(file.get());
        if (position == -1) return std::nullopt;

        return position;
    }

    auto file_handle::uri() const -> std::optional<std::string> {
        return locator;
    }

    auto file_handle::write(std::span<const std::byte> data)
        -> std::optional<std::size_t> {
        if (!file) {
            errno = EBADF;
            return std::nullopt;
        }

        // The C library requires a positioning call between a read and a
        // following write on an update stream.
        if (can_seek && std::fseek(file.get(), 0, SEEK_CUR) != 0) {
            return std::nullopt;
        }

        const auto bytes =
            std::fwrite(data.data(), 1, data.size(), file.get());

        if (bytes < data.size() || std::fflush(file.get()) != 0) {
            return std::nullopt;
        }

        return bytes;
    }

    auto open(const fs::path& path, std::string_view mode)
        -> std::unique_ptr<file_handle> {
        const auto [flags, fdmode] = parse_mode(mode);

        const auto descriptor = ::open(path.c_str(), flags | O_CLOEXEC, 0666);
        if (descriptor == -1) {
            TIMBER_DEBUG(R"(Failed to open file "{}")", path.native());

            throw ext::system_error(fmt::format(
                R"(Failed to open file "{}")",
                path.native()
            ));
        }

        auto* const stream = fdopen(descriptor, fdmode);
        if (!stream) {
            const auto error = errno;
            ::close(descriptor);
            errno = error;

            throw ext::system_error(fmt::format(
                R"(Failed to open stream for file "{}")",
                path.native()
            ));
        }

        TIMBER_DEBUG(
            R"(Opened file stream ({}) "{}" with mode "{}")",
            fmt::ptr(stream),
            path.native(),
            mode
        );

        return std::make_unique<file_handle>(
            file_stream(stream, make_deleter(false, path.native())),
            mode,
            path.native()
        );
    }

    auto pipe(std::string_view command, std::string_view mode)
        -> std::unique_ptr<file_handle> {
        const auto cmd = std::string(command);
        const auto type = std::string(mode);

        auto* const stream = popen(cmd.c_str(), type.c_str());
        if (!stream) {
            throw ext::system_error(fmt::format(
                R"(Failed to open pipe to command "{}")",
                command
            ));
        }

        TIMBER_DEBUG(
            R"(Opened pipe ({}) to command "{}")",
            fmt::ptr(stream),
            command
        );

        return std::make_unique<file_handle>(
            file_stream(stream, make_deleter(true, command)),
            mode,
            std::nullopt,
            "PIPE"
        );
    }

    auto temp() -> std::unique_ptr<file_handle> {
        auto* const stream = std::tmpfile();
        if (!stream) throw ext::system_error("Failed to create temporary file");

        TIMBER_DEBUG("Created temporary file ({})", fmt::ptr(stream));

        return std::make_unique<file_handle>(
            file_stream(stream, make_deleter(false, "temporary file")),
            "w+b",
            std::nullopt,
            "TEMP"
        );
    }

    auto wrap(FILE* file) -> std::unique_ptr<file_handle> {
        if (!file) {
            throw invalid_argument("cannot wrap a null stdio stream");
        }

        const auto flags = fcntl(fileno(file), F_GETFL);
        if (flags == -1) {
            throw ext::system_error(fmt::format(
                "Failed to read status flags of file stream ({})",
                fmt::ptr(file)
            ));
        }

        const auto append = (flags & O_APPEND) != 0;
        auto mode = std::string_view();

        switch (flags & O_ACCMODE) {
            case O_RDONLY: mode = "r"; break;
            case O_WRONLY: mode = append ? "a" : "w"; break;
            default: mode = append ? "a+" : "r+"; break;
        }

        return std::make_unique<file_handle>(
            file_stream(file, make_deleter(false, "wrapped stream")),
            mode
        );
    }
}
