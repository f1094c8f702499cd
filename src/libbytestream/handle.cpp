#include <bytestream/handle.hpp>

#include <array>

namespace {
    constexpr auto chunk_size = std::size_t(8192);
}

namespace bytestream {
    auto to_json(json& json, const metadata& metadata) -> void {
        json = {
            {"stream_type", metadata.stream_type},
            {"mode", metadata.mode},
            {"seekable", metadata.seekable},
            {"eof", metadata.eof}
        };

        if (metadata.uri) json["uri"] = *metadata.uri;
    }

    auto handle::read_all() -> std::optional<std::string> {
        auto buffer = std::array<std::byte, chunk_size>();
        auto result = std::string();

        while (true) {
            const auto bytes = read(buffer);
            if (!bytes) return std::nullopt;

            result.append(reinterpret_cast<const char*>(buffer.data()), *bytes);

            if (*bytes < buffer.size()) break;
        }

        return result;
    }
}
