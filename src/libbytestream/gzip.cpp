#include <bytestream/error.h>
#include <bytestream/gzip.hpp>

#include <algorithm>
#include <cerrno>
#include <ext/except.h>
#include <limits>
#include <system_error>
#include <timber/timber>
#include <utility>

namespace fs = std::filesystem;

namespace {
    constexpr auto max_chunk =
        static_cast<std::size_t>(std::numeric_limits<int>::max());

    auto zlib_message(gzFile file) -> std::string {
        auto code = Z_OK;
        const auto* const message = gzerror(file, &code);

        if (code == Z_ERRNO) {
            return std::generic_category().message(errno);
        }

        return message ? message : "unknown error";
    }
}

namespace bytestream {
    gzip_handle::gzip_handle(
        gzFile file,
        std::string_view mode,
        std::string path
    ) :
        file(file),
        open_mode(mode),
        path(std::move(path))
    {
        if (!file) {
            throw invalid_argument("gzip handle requires an open gzip file");
        }
    }

    gzip_handle::~gzip_handle() {
        close();
    }

    auto gzip_handle::close() noexcept -> bool {
        if (!file) return true;

        const auto result = gzclose(std::exchange(file, nullptr));

        if (result == Z_OK) {
            TIMBER_DEBUG(R"(Closed gzip file "{}")", path);
            return true;
        }

        TIMBER_ERROR(
            R"(Failed to close gzip file "{}": zlib error ({}))",
            path,
            result
        );

        return false;
    }

    auto gzip_handle::eof() const noexcept -> bool {
        return file && gzeof(file) != 0;
    }

    auto gzip_handle::is_open() const noexcept -> bool {
        return file != nullptr;
    }

    auto gzip_handle::metadata() const -> bytestream::metadata {
        return {
            .stream_type = "ZLIB",
            .mode = open_mode,
            .seekable = false,
            .eof = eof(),
            .uri = uri()
        };
    }

    auto gzip_handle::mode() const noexcept -> std::string_view {
        return open_mode;
    }

    auto gzip_handle::read(std::span<std::byte> buffer)
        -> std::optional<std::size_t> {
        if (!file) {
            errno = EBADF;
            return std::nullopt;
        }

        const auto length =
            static_cast<unsigned int>(std::min(buffer.size(), max_chunk));
        const auto bytes = gzread(file, buffer.data(), length);

        if (bytes == -1) {
            TIMBER_DEBUG(
                R"(Failed to read gzip file "{}": {})",
                path,
                zlib_message(file)
            );
            return std::nullopt;
        }

        return static_cast<std::size_t>(bytes);
    }

    auto gzip_handle::seek(long offset, int whence) noexcept -> bool {
        return file && gzseek(file, offset, whence) != -1;
    }

    auto gzip_handle::seekable() const noexcept -> bool {
        return false;
    }

    auto gzip_handle::stat() const noexcept -> std::optional<std::size_t> {
        return std::nullopt;
    }

    auto gzip_handle::tell() const noexcept -> std::optional<long> {
        if (!file) return std::nullopt;

        const auto position = gztell(file);
        if (position == -1) return std::nullopt;

        return position;
    }

    auto gzip_handle::uri() const -> std::optional<std::string> {
        return "compress.zlib://" + path;
    }

    auto gzip_handle::write(std::span<const std::byte> data)
        -> std::optional<std::size_t> {
        if (!file) {
            errno = EBADF;
            return std::nullopt;
        }

        auto written = std::size_t(0);

        while (written < data.size()) {
            const auto length = static_cast<unsigned int>(
                std::min(data.size() - written, max_chunk)
            );
            const auto bytes = gzwrite(file, data.data() + written, length);

            if (bytes <= 0) {
                TIMBER_DEBUG(
                    R"(Failed to write gzip file "{}": {})",
                    path,
                    zlib_message(file)
                );
                return std::nullopt;
            }

            written += static_cast<std::size_t>(bytes);
        }

        return written;
    }

    auto gzip(const fs::path& path, std::string_view mode)
        -> std::unique_ptr<gzip_handle> {
        const auto zmode = std::string(mode);
        auto* const file = gzopen(path.c_str(), zmode.c_str());

        if (!file) {
            throw ext::system_error(fmt::format(
                R"(Failed to open gzip file "{}")",
                path.native()
            ));
        }

        TIMBER_DEBUG(
            R"(Opened gzip file "{}" with mode "{}")",
            path.native(),
            mode
        );

        return std::make_unique<gzip_handle>(file, mode, path.native());
    }
}
