#include <gtest/gtest.h>
#include <transfer/stream_copier.hpp>
#include <core/constants.hpp>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

// Serves data in chunks, optionally failing after fail_after bytes.
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string data, long fail_after = -1)
        : data_(std::move(data)), fail_after_(fail_after) {}

    ssize_t read(char* buf, size_t len) override {
        if (fail_after_ >= 0 && static_cast<long>(pos_) >= fail_after_) return -1;
        size_t n = std::min(len, data_.size() - pos_);
        std::copy(data_.data() + pos_, data_.data() + pos_ + n, buf);
        pos_ += n;
        reads_++;
        return static_cast<ssize_t>(n);
    }

    int reads() const { return reads_; }

private:
    std::string data_;
    size_t pos_ = 0;
    long fail_after_;
    int reads_ = 0;
};

// Accepts at most max_chunk bytes per call; fails once limit is reached.
class MemorySink : public ByteSink {
public:
    explicit MemorySink(size_t max_chunk = SIZE_MAX, long limit = -1)
        : max_chunk_(max_chunk), limit_(limit) {}

    ssize_t write(const char* buf, size_t len) override {
        if (limit_ >= 0 && static_cast<long>(data.size()) >= limit_) return -1;
        size_t n = std::min(len, max_chunk_);
        data.append(buf, n);
        return static_cast<ssize_t>(n);
    }

    std::string data;

private:
    size_t max_chunk_;
    long limit_;
};

std::string pattern(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; i++) s[i] = static_cast<char>('a' + i % 26);
    return s;
}

}  // namespace

TEST(StreamCopier, CopiesEverything) {
    std::string payload = pattern(COPY_BUF_SIZE * 3 + 17);
    MemorySource src(payload);
    MemorySink dst;

    auto r = copy_stream(src, dst);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.bytes, static_cast<int64_t>(payload.size()));
    EXPECT_EQ(dst.data, payload);
    EXPECT_FALSE(r.value.read_error);
    EXPECT_GE(r.value.elapsed.count(), 0);
}

TEST(StreamCopier, UsesFixedBuffer) {
    std::string payload = pattern(COPY_BUF_SIZE * 4);
    MemorySource src(payload);
    MemorySink dst;

    ASSERT_TRUE(copy_stream(src, dst).is_ok());
    // 4 full reads plus the zero-byte read that ends the loop
    EXPECT_EQ(src.reads(), 5);
}

TEST(StreamCopier, EmptySource) {
    MemorySource src("");
    MemorySink dst;

    auto r = copy_stream(src, dst);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.bytes, 0);
    EXPECT_TRUE(dst.data.empty());
}

TEST(StreamCopier, ShortWritesAreCompleted) {
    std::string payload = pattern(5000);
    MemorySource src(payload);
    MemorySink dst(100);

    auto r = copy_stream(src, dst);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(dst.data, payload);
}

TEST(StreamCopier, ReadErrorEndsCopyLikeEof) {
    std::string payload = pattern(COPY_BUF_SIZE * 3);
    MemorySource src(payload, COPY_BUF_SIZE * 2);
    MemorySink dst;

    auto r = copy_stream(src, dst);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.read_error);
    EXPECT_EQ(r.value.bytes, COPY_BUF_SIZE * 2);
    EXPECT_EQ(dst.data, payload.substr(0, COPY_BUF_SIZE * 2));
}

TEST(StreamCopier, WriteErrorFails) {
    MemorySource src(pattern(COPY_BUF_SIZE * 3));
    MemorySink dst(SIZE_MAX, COPY_BUF_SIZE);

    auto r = copy_stream(src, dst);
    EXPECT_TRUE(r.is_err());
}

class LocalFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "hostcp_copier_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(LocalFileTest, CopiesBetweenFiles) {
    std::string payload = pattern(10000);
    std::ofstream(test_dir / "in.bin", std::ios::binary) << payload;

    auto src = LocalFileSource::open((test_dir / "in.bin").string());
    ASSERT_TRUE(src.is_ok()) << src.error;
    auto dst = LocalFileSink::open((test_dir / "out.bin").string(), 0644);
    ASSERT_TRUE(dst.is_ok()) << dst.error;

    auto r = copy_stream(*src.value, *dst.value);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.bytes, 10000);

    dst.value.reset();
    EXPECT_EQ(fs::file_size(test_dir / "out.bin"), 10000u);
}

TEST_F(LocalFileTest, SinkTruncatesExistingFile) {
    std::ofstream(test_dir / "out.bin") << std::string(500, 'x');

    MemorySource src("short");
    auto dst = LocalFileSink::open((test_dir / "out.bin").string(), 0644);
    ASSERT_TRUE(dst.is_ok());
    ASSERT_TRUE(copy_stream(src, *dst.value).is_ok());
    dst.value.reset();

    EXPECT_EQ(fs::file_size(test_dir / "out.bin"), 5u);
}

TEST_F(LocalFileTest, OpenMissingSourceFails) {
    auto src = LocalFileSource::open((test_dir / "missing").string());
    EXPECT_TRUE(src.is_err());
    EXPECT_EQ(src.kind, ErrorKind::LocalIo);
}
