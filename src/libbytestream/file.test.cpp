#include <bytestream/bytestream>

#include <ext/except.h>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace std::literals;

class FileTest : public testing::Test {
protected:
    fs::path directory;

    FileTest() {
        const auto* const info =
            testing::UnitTest::GetInstance()->current_test_info();

        directory = fs::temp_directory_path() / fmt::format(
            "bytestream.{}.{}.{}",
            getpid(),
            info->test_suite_name(),
            info->name()
        );

        fs::create_directories(directory);
    }

    ~FileTest() {
        auto error = std::error_code();
        fs::remove_all(directory, error);
    }

    auto create(std::string_view name, std::string_view contents) const
        -> fs::path {
        const auto path = directory / name;

        auto file = std::ofstream(path, std::ios::binary);
        file << contents;

        return path;
    }

    static auto slurp(const fs::path& path) -> std::string {
        auto file = std::ifstream(path, std::ios::binary);
        return {
            std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()
        };
    }
};

TEST_F(FileTest, OpenMissingFile) {
    EXPECT_THROW(
        bytestream::open(directory / "missing", "r"),
        ext::system_error
    );
}

TEST_F(FileTest, OpenInvalidMode) {
    const auto path = create("file", "data");

    EXPECT_THROW(bytestream::open(path, "q"), bytestream::invalid_argument);
    EXPECT_THROW(bytestream::open(path, ""), bytestream::invalid_argument);
}

TEST_F(FileTest, Size) {
    const auto path = create("file", "Hello, world!");
    auto stream = bytestream::stream(bytestream::open(path, "r"));

    EXPECT_EQ(13, stream.size());
    EXPECT_EQ(13, stream.size());
}

TEST_F(FileTest, SizeTracksExternalChanges) {
    const auto path = create("file", "abc");
    auto stream = bytestream::stream(bytestream::open(path, "r"));

    EXPECT_EQ(3, stream.size());

    {
        auto file = std::ofstream(path, std::ios::binary | std::ios::app);
        file << "defg";
    }

    EXPECT_EQ(7, stream.size());
}

TEST_F(FileTest, Metadata) {
    const auto path = create("file", "data");
    auto stream = bytestream::stream(bytestream::open(path, "rb"));

    EXPECT_EQ(
        path.native(),
        stream.metadata("uri")->get<std::string>()
    );
    EXPECT_EQ("STDIO", stream.metadata("stream_type").value());
    EXPECT_EQ("rb", stream.metadata("mode").value());
    EXPECT_EQ(true, stream.metadata("seekable").value());
}

TEST_F(FileTest, ReadWrite) {
    const auto path = directory / "file";
    auto stream = bytestream::stream(bytestream::open(path, "w+"));

    EXPECT_TRUE(stream.readable());
    EXPECT_TRUE(stream.writable());
    EXPECT_TRUE(stream.seekable());

    EXPECT_EQ(4, stream.write("data"));
    EXPECT_EQ(4, stream.size());
    EXPECT_EQ(4, stream.tell());

    stream.rewind();

    EXPECT_EQ("da", stream.read(2));
    EXPECT_EQ(2, stream.write("ta"));
    EXPECT_EQ(4, stream.size());

    EXPECT_EQ("data", stream.string());
    EXPECT_EQ("data", slurp(path));
}

TEST_F(FileTest, Truncate) {
    const auto path = create("file", "old contents");
    auto stream = bytestream::stream(bytestream::open(path, "w"));

    EXPECT_FALSE(stream.readable());
    EXPECT_EQ(0, stream.size());
}

TEST_F(FileTest, CreateWithoutTruncating) {
    const auto path = create("file", "data");
    auto stream = bytestream::stream(bytestream::open(path, "c+"));

    EXPECT_EQ(4, stream.size());
    EXPECT_EQ("data", stream.contents());
}

TEST_F(FileTest, ExclusiveCreate) {
    const auto path = create("file", "data");

    EXPECT_THROW(bytestream::open(path, "x"), ext::system_error);

    auto stream = bytestream::stream(
        bytestream::open(directory / "new", "x+b")
    );

    EXPECT_TRUE(stream.readable());
    EXPECT_TRUE(stream.writable());
}

TEST_F(FileTest, Append) {
    const auto path = create("file", "hello");

    {
        auto stream = bytestream::stream(bytestream::open(path, "a"));

        EXPECT_FALSE(stream.readable());
        EXPECT_TRUE(stream.writable());
        EXPECT_EQ(6, stream.write(" world"));
    }

    EXPECT_EQ("hello world", slurp(path));
}

TEST_F(FileTest, WriteToReadOnlyDescriptor) {
    const auto path = create("file", "data");

    // "rw" is classified as writable, but the descriptor is read-only.
    auto stream = bytestream::stream(bytestream::open(path, "rw"));

    EXPECT_TRUE(stream.writable());
    EXPECT_THROW(stream.write("more"), bytestream::io_error);
}

TEST_F(FileTest, Temporary) {
    auto stream = bytestream::stream(bytestream::temp());

    EXPECT_TRUE(stream.readable());
    EXPECT_TRUE(stream.writable());
    EXPECT_TRUE(stream.seekable());
    EXPECT_FALSE(stream.metadata("uri").has_value());
    EXPECT_EQ("TEMP", stream.metadata("stream_type").value());

    EXPECT_EQ(4, stream.write("data"));
    EXPECT_EQ(4, stream.size());
    EXPECT_EQ("", stream.read(1));
    EXPECT_TRUE(stream.eof());

    stream.seek(0);

    EXPECT_FALSE(stream.eof());
    EXPECT_EQ("data", stream.contents());
    EXPECT_EQ("", stream.contents());
}

TEST_F(FileTest, Pipe) {
    auto stream = bytestream::stream(bytestream::pipe("printf hello", "r"));

    EXPECT_TRUE(stream.readable());
    EXPECT_FALSE(stream.writable());
    EXPECT_FALSE(stream.seekable());
    EXPECT_FALSE(stream.size().has_value());
    EXPECT_EQ("PIPE", stream.metadata("stream_type").value());
    EXPECT_THROW(stream.seek(0), bytestream::io_error);

    EXPECT_EQ("hello", stream.string());
    EXPECT_EQ("", stream.string());
}

TEST_F(FileTest, WritePipe) {
    const auto path = directory / "out";

    {
        auto stream = bytestream::stream(bytestream::pipe(
            fmt::format("cat > '{}'", path.native()),
            "w"
        ));

        EXPECT_FALSE(stream.readable());
        EXPECT_TRUE(stream.writable());
        EXPECT_EQ(5, stream.write("piped"));
    }

    EXPECT_EQ("piped", slurp(path));
}

TEST_F(FileTest, WrapInfersMode) {
    const auto path = create("file", "data");

    auto read_only = bytestream::wrap(std::fopen(path.c_str(), "r"));
    EXPECT_EQ("r", read_only->mode());

    auto read_write = bytestream::wrap(std::fopen(path.c_str(), "r+"));
    EXPECT_EQ("r+", read_write->mode());

    auto append = bytestream::wrap(std::fopen(path.c_str(), "a"));
    EXPECT_EQ("a", append->mode());

    auto update = bytestream::wrap(std::fopen(path.c_str(), "a+"));
    EXPECT_EQ("a+", update->mode());

    auto truncate = bytestream::wrap(std::fopen(path.c_str(), "w"));
    EXPECT_EQ("w", truncate->mode());
}

TEST_F(FileTest, ReadAfterFailedOperation) {
    const auto path = create("file", "data");
    auto* const file = std::fopen(path.c_str(), "r");
    ASSERT_NE(nullptr, file);

    // Writing to a read-only stdio stream sets its error indicator.
    EXPECT_EQ(EOF, std::fputc('x', file));
    EXPECT_NE(0, std::ferror(file));

    auto stream = bytestream::stream(bytestream::wrap(file));

    EXPECT_EQ("data", stream.read(10));
    EXPECT_TRUE(stream.eof());
    EXPECT_EQ("", stream.read(10));
}

TEST_F(FileTest, MetadataTypeOutlivesArgument) {
    auto handle = std::unique_ptr<bytestream::file_handle>();

    {
        auto type = std::string("CUSTOM_STREAM_TYPE");
        handle = std::make_unique<bytestream::file_handle>(
            bytestream::file_stream(std::tmpfile()),
            "w+b",
            std::nullopt,
            type
        );
    }

    EXPECT_EQ("CUSTOM_STREAM_TYPE", handle->metadata().stream_type);
}

TEST_F(FileTest, WrapNull) {
    EXPECT_THROW(bytestream::wrap(nullptr), bytestream::invalid_argument);
}

TEST_F(FileTest, DetachKeepsFileOpen) {
    const auto path = create("file", "data");

    auto stream = bytestream::stream(bytestream::open(path, "r+"));
    auto handle = stream.detach();

    ASSERT_NE(nullptr, handle);

    auto* const file = dynamic_cast<bytestream::file_handle*>(handle.get());
    ASSERT_NE(nullptr, file);

    EXPECT_EQ(0, std::fseek(file->native(), 0, SEEK_END));
    EXPECT_EQ(4, std::ftell(file->native()));
    EXPECT_THROW(stream.tell(), bytestream::detached);

    EXPECT_TRUE(file->close());
    EXPECT_FALSE(file->is_open());
}
