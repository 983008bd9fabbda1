#include "streamdl/destination_file.hpp"
#include "streamdl/helpers.hpp"
#include "streamdl/input_stream.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace streamdl;
using streamdl::test::read_file;
using streamdl::test::TempDir;
using streamdl::test::write_file;

TEST(FdInputStreamTest, ReadsFileUntilEndOfStream) {
    TempDir dir;
    write_file(dir.path("src"), "HELLO WORLD");

    auto stream = FdInputStream::openFile(dir.path("src").string());
    std::string out;
    char buf[4];
    size_t n;
    while ((n = stream->read(buf, sizeof(buf))) > 0) {
        EXPECT_LE(n, sizeof(buf));
        out.append(buf, n);
    }
    EXPECT_EQ(out, "HELLO WORLD");
    EXPECT_EQ(stream->read(buf, sizeof(buf)), 0u);
}

TEST(FdInputStreamTest, MissingFileReportsErrno) {
    TempDir dir;
    try {
        FdInputStream::openFile(dir.path("nope").string());
        FAIL() << "expected IoError";
    } catch (const IoError &e) {
        EXPECT_EQ(e.code(), ENOENT);
        EXPECT_EQ(std::string(e.what()).rfind("file_open_failed:", 0), 0u) << e.what();
    }
}

TEST(FdInputStreamTest, CloseIsIdempotentAndStopsReads) {
    TempDir dir;
    write_file(dir.path("src"), "data");
    auto stream = FdInputStream::openFile(dir.path("src").string());
    EXPECT_GE(stream->getFD(), 0);

    stream->close();
    stream->close();
    EXPECT_EQ(stream->getFD(), -1);

    char buf[4];
    EXPECT_THROW(stream->read(buf, sizeof(buf)), IoError);
}

TEST(FdInputStreamTest, ReadsFromPipe) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    FdInputStream stream(fds[0]);
    ASSERT_EQ(::write(fds[1], "abc", 3), 3);
    ::close(fds[1]);

    char buf[8];
    EXPECT_EQ(stream.read(buf, sizeof(buf)), 3u);
    EXPECT_EQ(std::string(buf, 3), "abc");
    EXPECT_EQ(stream.read(buf, sizeof(buf)), 0u);
}

TEST(FdInputStreamTest, ConnectRejectsInvalidAddress) {
    try {
        FdInputStream::connectTcp("not-an-ip", 9000);
        FAIL() << "expected IoError";
    } catch (const IoError &e) {
        EXPECT_EQ(e.code(), EINVAL);
    }
}

TEST(DestinationFileTest, CreatesMissingFile) {
    TempDir dir;
    DestinationFile file(dir.path("out"));
    EXPECT_TRUE(file.isOpen());
    EXPECT_EQ(file.length(), 0u);
    EXPECT_TRUE(std::filesystem::exists(dir.path("out")));
}

TEST(DestinationFileTest, KeepsExistingContent) {
    TempDir dir;
    write_file(dir.path("out"), "HELLO");

    DestinationFile file(dir.path("out"));
    EXPECT_EQ(file.length(), 5u);
    EXPECT_EQ(file.position(), 0u);

    file.seek(5);
    file.write(" WORLD", 6);
    EXPECT_EQ(file.position(), 11u);
    file.close();

    EXPECT_EQ(read_file(dir.path("out")), "HELLO WORLD");
}

TEST(DestinationFileTest, OverwritesFromCurrentPosition) {
    TempDir dir;
    write_file(dir.path("out"), "XXXXXXXX");

    {
        DestinationFile file(dir.path("out"));
        file.write("ab", 2);
        file.seek(6);
        file.write("cd", 2);
    }
    EXPECT_EQ(read_file(dir.path("out")), "abXXXXcd");
}

TEST(DestinationFileTest, UnopenablePathThrows) {
    TempDir dir;
    try {
        DestinationFile file(dir.path("missing") / "out");
        FAIL() << "expected IoError";
    } catch (const IoError &e) {
        EXPECT_EQ(e.code(), ENOENT);
    }
}

TEST(DestinationFileTest, MoveTransfersOwnership) {
    TempDir dir;
    DestinationFile a(dir.path("out"));
    DestinationFile b(std::move(a));
    EXPECT_FALSE(a.isOpen());
    EXPECT_TRUE(b.isOpen());
    b.write("x", 1);
    b.close();
    EXPECT_FALSE(b.isOpen());
    EXPECT_EQ(read_file(dir.path("out")), "x");
}

TEST(HelpersTest, ParsesCommands) {
    EXPECT_TRUE(is_cmd("PAUSE", "PAUSE"));
    EXPECT_TRUE(is_cmd("STATUS now", "STATUS"));
    EXPECT_FALSE(is_cmd("PAUSED", "PAUSE"));
}

TEST(HelpersTest, ParsesHostPort) {
    HostPort hp;
    ASSERT_TRUE(parse_host_port("127.0.0.1:9000", hp));
    EXPECT_EQ(hp.host, "127.0.0.1");
    EXPECT_EQ(hp.port, 9000);
    EXPECT_FALSE(parse_host_port("localhost", hp));
    EXPECT_FALSE(parse_host_port("host:99999", hp));
    EXPECT_FALSE(parse_host_port(":80", hp));
}

TEST(HelpersTest, ParsesSizes) {
    EXPECT_EQ(parse_size("8192"), 8192u);
    EXPECT_THROW(parse_size("-1"), std::runtime_error);
    EXPECT_THROW(parse_size("12kb"), std::runtime_error);
    EXPECT_THROW(parse_size(""), std::runtime_error);
}
