#include <gtest/gtest.h>
#include "exception.hpp"
#include "identifier.hpp"
#include "priority.hpp"

TEST(IdentifierTest, ParsesPartialForms) {
    PackageId a = parse_package_id("foo");
    EXPECT_EQ(a.name, "foo");
    EXPECT_TRUE(a.arch.empty());
    EXPECT_TRUE(a.version.empty());

    PackageId b = parse_package_id("foo.x86_64");
    EXPECT_EQ(b.name, "foo");
    EXPECT_EQ(b.arch, "x86_64");
    EXPECT_TRUE(b.version.empty());

    PackageId c = parse_package_id("foo.noarch.1.2.3@4");
    EXPECT_EQ(c.name, "foo");
    EXPECT_EQ(c.arch, "noarch");
    EXPECT_EQ(c.version, "1.2.3@4");
}

TEST(IdentifierTest, RejectsMalformed) {
    for (const char* bad : {"", ".noarch", "foo.", "foo..1", "foo.noarch.", "foo bar", "foo.noarch.1..2"}) {
        try {
            parse_package_id(bad);
            ADD_FAILURE() << "accepted \"" << bad << "\"";
        } catch (const GoogetException& e) {
            EXPECT_EQ(e.kind(), ErrorKind::MalformedIdentifier) << bad;
        }
    }
    EXPECT_THROW(parse_full_package_id("foo.noarch"), GoogetException);
    EXPECT_NO_THROW(parse_full_package_id("foo.noarch.1"));
}

TEST(IdentifierTest, StringRoundTrip) {
    for (const char* text : {"foo", "foo.arm64", "foo.noarch.1.0", "lib-x.x86_32.2.0.0-rc+1"}) {
        const PackageId id = parse_package_id(text);
        EXPECT_EQ(id.to_string(), text);
        EXPECT_EQ(parse_package_id(id.to_string()), id);
    }
}

TEST(IdentifierTest, KeyAndArchiveName) {
    const PackageId id{"foo", "x86_64", "1.0"};
    EXPECT_EQ(id.key(), "foo.x86_64");
    EXPECT_EQ(id.archive_name(), "foo.x86_64.1.0.goo");
}

TEST(PackagePatternTest, WildcardPositions) {
    const PackageId foo{"foo", "x86_64", "2.0"};

    EXPECT_TRUE(PackagePattern::parse("foo").matches(foo));
    EXPECT_TRUE(PackagePattern::parse("foo.x86_64").matches(foo));
    EXPECT_FALSE(PackagePattern::parse("foo.arm").matches(foo));
    EXPECT_TRUE(PackagePattern::parse("foo.*").matches(foo));
    EXPECT_TRUE(PackagePattern::parse("foo.*.*").matches(foo));
    EXPECT_TRUE(PackagePattern::parse("*.x86_64").matches(foo));
    EXPECT_FALSE(PackagePattern::parse("bar").matches(foo));
}

TEST(PackagePatternTest, VersionForms) {
    const PackageId foo{"foo", "noarch", "5"};

    EXPECT_TRUE(PackagePattern::parse("foo.*.5").matches(foo));
    EXPECT_FALSE(PackagePattern::parse("foo.*.3").matches(foo));
    EXPECT_TRUE(PackagePattern::parse("foo.*.3+").matches(foo));
    EXPECT_TRUE(PackagePattern::parse("foo.*.5+").matches(foo));
    EXPECT_FALSE(PackagePattern::parse("foo.*.6+").matches(foo));
    EXPECT_EQ(PackagePattern::parse("foo.*.3+").name(), "foo");
}

TEST(PackagePatternTest, RejectsMalformed) {
    EXPECT_THROW(PackagePattern::parse(""), GoogetException);
    EXPECT_THROW(PackagePattern::parse("foo."), GoogetException);
    EXPECT_THROW(PackagePattern::parse("foo.*."), GoogetException);
    EXPECT_THROW(PackagePattern::parse("foo.*.1..2+"), GoogetException);
}

TEST(PriorityTest, NamedAndNumeric) {
    EXPECT_EQ(parse_priority("default"), PRIORITY_DEFAULT);
    EXPECT_EQ(parse_priority("Canary"), PRIORITY_CANARY);
    EXPECT_EQ(parse_priority("PIN"), PRIORITY_PIN);
    EXPECT_EQ(parse_priority("rollback"), PRIORITY_ROLLBACK);
    EXPECT_EQ(parse_priority("42"), 42);
    EXPECT_EQ(parse_priority(" 700 "), 700);
    EXPECT_THROW(parse_priority("high"), GoogetException);
    EXPECT_THROW(parse_priority(""), GoogetException);
    EXPECT_THROW(parse_priority("10x"), GoogetException);

    EXPECT_EQ(priority_to_string(PRIORITY_DEFAULT), "Default");
    EXPECT_EQ(priority_to_string(PRIORITY_CANARY), "Canary");
    EXPECT_EQ(priority_to_string(PRIORITY_PIN), "Pin");
    EXPECT_EQ(priority_to_string(42), "42");
}
