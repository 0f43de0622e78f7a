#include "test_helpers.hpp"

#include "cache.hpp"
#include "hash.hpp"

class CacheTest : public GoogetTest {
protected:
    const PackageId id{"foo", "noarch", "1.0"};
};

TEST_F(CacheTest, LayoutFollowsPackageId) {
    EXPECT_EQ(cache->archive_path(id), env.cache_dir / "foo.noarch.1.0.goo");
    EXPECT_EQ(cache->unpack_dir(id), env.cache_dir / "foo.noarch.1.0");
    EXPECT_TRUE(cache->contains(cache->unpack_dir(id) / "file"));
    EXPECT_FALSE(cache->contains(work_dir / "elsewhere"));
}

TEST_F(CacheTest, StoreThenLookup) {
    EXPECT_FALSE(cache->lookup(id, "").has_value());

    const std::string body = "archive bytes";
    const fs::path stored = cache->store(id, sha256_string(body), [&](const fs::path& tmp) {
        write_text(tmp, body);
    });
    EXPECT_EQ(stored, cache->archive_path(id));
    EXPECT_EQ(read_text(stored), body);

    EXPECT_EQ(cache->lookup(id, sha256_string(body)), stored);
    EXPECT_EQ(cache->lookup(id, ""), stored);
    EXPECT_FALSE(cache->lookup(id, sha256_string("other")).has_value());
}

TEST_F(CacheTest, ChecksumMismatchLeavesNothingBehind) {
    try {
        cache->store(id, sha256_string("expected"), [](const fs::path& tmp) { write_text(tmp, "tampered"); });
        FAIL() << "mismatch not detected";
    } catch (const GoogetException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ChecksumMismatch);
    }
    EXPECT_TRUE(fs::is_empty(env.cache_dir));
}

TEST_F(CacheTest, FetchFailureRemovesTemporary) {
    EXPECT_THROW(cache->store(id, "", [](const fs::path& tmp) {
                     write_text(tmp, "partial");
                     throw GoogetException("connection reset", ErrorKind::DownloadError);
                 }),
                 GoogetException);
    EXPECT_TRUE(fs::is_empty(env.cache_dir));
}

TEST_F(CacheTest, CancelledDownloadRemovesTemporary) {
    const fs::path source = work_dir / "source.goo";
    write_text(source, "archive bytes");

    const ErrorKind kind = error_kind_of([&] {
        cache->store(id, "", [&](const fs::path& tmp) {
            write_text(tmp, "arch");
            request_cancellation();
            downloader.download_file("file://" + source.string(), tmp);
        });
    });
    reset_cancellation();

    EXPECT_EQ(kind, ErrorKind::Cancelled);
    EXPECT_TRUE(fs::is_empty(env.cache_dir));
    EXPECT_FALSE(cache->lookup(id, "").has_value());
}

TEST_F(CacheTest, RemoveIgnoresMissingPaths) {
    write_text(cache->unpack_dir(id) / "a" / "b", "x");
    cache->remove(cache->unpack_dir(id));
    EXPECT_FALSE(fs::exists(cache->unpack_dir(id)));
    EXPECT_NO_THROW(cache->remove(cache->unpack_dir(id)));
}
