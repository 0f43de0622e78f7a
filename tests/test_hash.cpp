#include "test_helpers.hpp"

#include "hash.hpp"

class HashTest : public GoogetTest {};

TEST_F(HashTest, CalculateSHA256) {
    const fs::path path = work_dir / "test.txt";
    write_text(path, "hello world");
    // echo -n "hello world" | sha256sum
    EXPECT_EQ(calculate_sha256(path), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(HashTest, StringAndIncrementalDigestsAgree) {
    EXPECT_EQ(sha256_string(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    Sha256 sha;
    sha.update("hello ", 6);
    sha.update("world", 5);
    EXPECT_EQ(sha.hex_digest(), sha256_string("hello world"));
}

TEST_F(HashTest, MissingFileThrows) {
    EXPECT_THROW(calculate_sha256(work_dir / "absent"), GoogetException);
}

TEST_F(HashTest, ChecksumComparisonIgnoresCase) {
    EXPECT_TRUE(checksums_equal("ABCdef01", "abcDEF01"));
    EXPECT_FALSE(checksums_equal("abc", "abd"));
    EXPECT_FALSE(checksums_equal("abc", "abcd"));
}
