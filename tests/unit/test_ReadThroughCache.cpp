#include <gtest/gtest.h>
#include "cache/ReadThroughCache.hpp"

#include <atomic>
#include <fstream>
#include <future>
#include <unistd.h>

using namespace loft;
using namespace loft::cache;
namespace fs = std::filesystem;

class ReadThroughCacheTest : public ::testing::Test {
protected:
    fs::path dir;
    std::atomic<int> fetches{0};

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / ("loft-cache-" + std::to_string(::getpid()) + "-" + info->name());
        fs::remove_all(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    ReadThroughCache::Fetcher serving(const std::string& content) {
        return [this, content](const std::string&, const http::Sink& sink, const http::CancelToken&) {
            ++fetches;
            sink(content.data(), content.size());
        };
    }

    static std::string readAll(RandomAccessReader& r) {
        std::string out(r.size(), '\0');
        size_t off = 0;
        while (off < out.size()) {
            const auto n = r.readAt(out.data() + off, out.size() - off, off);
            if (n == 0) break;
            off += n;
        }
        out.resize(off);
        return out;
    }
};

TEST_F(ReadThroughCacheTest, ReadersShareOneBackgroundCopy) {
    std::promise<void> gate;
    auto released = gate.get_future().share();

    ReadThroughCache cache(dir, [&](const std::string&, const http::Sink& sink, const http::CancelToken&) {
        ++fetches;
        sink("hello ", 6);
        released.wait();
        sink("world", 5);
    });

    auto first = cache.openRandomAccess("f1", 11);
    auto second = cache.openRandomAccess("f1", 11);

    char buf[16] = {};
    ASSERT_EQ(first->readAt(buf, 6, 0), 6u);
    EXPECT_EQ(std::string(buf, 6), "hello ");
    EXPECT_EQ(cache.entry("f1")->state(), Entry::State::Pending);

    gate.set_value();
    ASSERT_EQ(second->readAt(buf, 5, 6), 5u);
    EXPECT_EQ(std::string(buf, 5), "world");

    EXPECT_EQ(readAll(*first), "hello world");
    EXPECT_EQ(fetches.load(), 1);
}

TEST_F(ReadThroughCacheTest, SequentialReadsAdvancePosition) {
    ReadThroughCache cache(dir, serving("0123456789"));
    auto reader = cache.openRandomAccess("f1", 10);

    char buf[4];
    EXPECT_EQ(reader->read(buf, 4), 4u);
    EXPECT_EQ(std::string(buf, 4), "0123");
    EXPECT_EQ(reader->read(buf, 4), 4u);
    EXPECT_EQ(std::string(buf, 4), "4567");
    EXPECT_EQ(reader->read(buf, 4), 2u);
    EXPECT_EQ(reader->read(buf, 4), 0u);
    EXPECT_EQ(reader->position(), 10u);
}

TEST_F(ReadThroughCacheTest, ReadsPastTheEndReturnNothing) {
    ReadThroughCache cache(dir, serving("abc"));
    auto reader = cache.openRandomAccess("f1", 3);

    char buf[8];
    EXPECT_EQ(reader->readAt(buf, 8, 3), 0u);
    EXPECT_EQ(reader->readAt(buf, 8, 100), 0u);
    EXPECT_EQ(reader->readAt(buf, 8, 1), 2u);
    EXPECT_EQ(std::string(buf, 2), "bc");
}

TEST_F(ReadThroughCacheTest, FinishedFilesSurviveRestart) {
    {
        ReadThroughCache cache(dir, serving("persisted"));
        auto reader = cache.openRandomAccess("id/with:odd chars", 9);
        EXPECT_EQ(readAll(*reader), "persisted");
        reader->close();
        cache.entry("id/with:odd chars")->joinProducer();
        EXPECT_EQ(cache.entry("id/with:odd chars")->state(), Entry::State::Complete);
    }

    ReadThroughCache reopened(dir, [](const std::string&, const http::Sink&, const http::CancelToken&) {
        FAIL() << "restored entries must not be fetched again";
    });
    ASSERT_TRUE(reopened.contains("id/with:odd chars"));

    auto reader = reopened.openRandomAccess("id/with:odd chars", 9);
    EXPECT_EQ(readAll(*reader), "persisted");
}

TEST_F(ReadThroughCacheTest, PartialFilesAreDiscardedOnStartup) {
    fs::create_directories(dir);
    std::ofstream(dir / "half.part") << "junk";

    ReadThroughCache cache(dir, serving("x"));
    EXPECT_FALSE(fs::exists(dir / "half.part"));
    EXPECT_FALSE(cache.contains("half"));
}

TEST_F(ReadThroughCacheTest, ForeignFilesAreIgnoredOnStartup) {
    fs::create_directories(dir);
    std::ofstream(dir / "stray%zz") << "junk";
    std::ofstream(dir / "ok") << "kept";

    ReadThroughCache cache(dir, serving("x"));
    EXPECT_TRUE(cache.contains("ok"));
    EXPECT_EQ(cache.entry("ok")->state(), Entry::State::Complete);
}

TEST_F(ReadThroughCacheTest, FailedCopyIsRetriedOnNextOpen) {
    ReadThroughCache cache(dir, [this](const std::string&, const http::Sink& sink, const http::CancelToken&) {
        if (++fetches == 1) throw std::runtime_error("connection reset");
        sink("second try", 10);
    });

    auto failing = cache.openRandomAccess("f1", 10);
    char buf[16];
    EXPECT_THROW((void)failing->readAt(buf, 10, 0), std::runtime_error);
    EXPECT_EQ(cache.entry("f1")->state(), Entry::State::Failed);

    auto retry = cache.openRandomAccess("f1", 10);
    EXPECT_EQ(readAll(*retry), "second try");
    EXPECT_EQ(fetches.load(), 2);
}

TEST_F(ReadThroughCacheTest, ShortDownloadShrinksTheEntry) {
    ReadThroughCache cache(dir, serving("abc"));
    auto reader = cache.openRandomAccess("f1", 10);

    char buf[16];
    EXPECT_EQ(reader->readAt(buf, 10, 0), 3u);
    cache.entry("f1")->joinProducer();
    EXPECT_EQ(reader->size(), 3u);
}

TEST_F(ReadThroughCacheTest, EvictRemovesFinishedEntries) {
    ReadThroughCache cache(dir, serving("bye"));
    auto reader = cache.openRandomAccess("f1", 3);
    EXPECT_EQ(readAll(*reader), "bye");
    cache.entry("f1")->joinProducer();

    const auto path = cache.entry("f1")->finalPath();
    ASSERT_TRUE(fs::exists(path));

    EXPECT_TRUE(cache.evict("f1"));
    EXPECT_FALSE(cache.contains("f1"));
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(cache.evict("f1"));
}

TEST_F(ReadThroughCacheTest, EscapedIdsRoundTrip) {
    for (const std::string id : {"plain-id_1.bin", "a/b", "100%", ".hidden", "sp ace"}) {
        const auto escaped = ReadThroughCache::escapeId(id);
        EXPECT_EQ(escaped.find('/'), std::string::npos) << id;
        EXPECT_NE(escaped.front(), '.') << id;
        EXPECT_EQ(ReadThroughCache::unescapeId(escaped).value_or(""), id);
    }
    EXPECT_FALSE(ReadThroughCache::unescapeId("bad%zz").has_value());
    EXPECT_FALSE(ReadThroughCache::unescapeId("trailing%4").has_value());
    EXPECT_FALSE(ReadThroughCache::unescapeId("sp ace").has_value());
}
