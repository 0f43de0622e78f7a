#include "test_helpers.hpp"

#include "database.hpp"

class DatabaseTest : public GoogetTest {
protected:
    PackageState state_for(const std::string& name, const std::string& version) {
        PackageState s;
        s.package_spec = file_spec(name, version);
        s.source_repo = "https://repo.example/stable";
        s.checksum = "abc";
        s.installed_files = {{dest(name), "deadbeef"}, {target_dir.string(), ""}};
        s.install_date = 1700000000;
        return s;
    }
};

TEST_F(DatabaseTest, WritePersistsAcrossReopen) {
    StateDB& sdb = open_db();
    sdb.upsert(state_for("foo", "1.0"));
    sdb.upsert(state_for("bar", "2.0"));
    close_db();

    StateDB& reopened = open_db();
    ASSERT_EQ(reopened.fetch_all().size(), 2u);
    const PackageState foo = reopened.fetch_one("foo", "noarch");
    EXPECT_EQ(foo, state_for("foo", "1.0"));
}

TEST_F(DatabaseTest, UpsertReplacesByNameAndArch) {
    StateDB& sdb = open_db();
    sdb.upsert(state_for("foo", "1.0"));
    sdb.upsert(state_for("foo", "2.0"));

    const auto all = sdb.fetch_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].package_spec.version.str(), "2.0");
    EXPECT_EQ(installed_packages(all), (PackageMap{{"foo.noarch", "2.0"}}));
}

TEST_F(DatabaseTest, FetchAllFiltersByNameSubstring) {
    StateDB& sdb = open_db();
    sdb.upsert(state_for("libfoo", "1.0"));
    sdb.upsert(state_for("foo-tools", "1.0"));
    sdb.upsert(state_for("bar", "1.0"));
    EXPECT_EQ(sdb.fetch_all("foo").size(), 2u);
    EXPECT_EQ(sdb.fetch_all("").size(), 3u);
    EXPECT_TRUE(sdb.fetch_all("qux").empty());
}

TEST_F(DatabaseTest, MissingRecordsAreNotFound) {
    StateDB& sdb = open_db();
    EXPECT_FALSE(sdb.find("foo", "noarch").has_value());
    try {
        sdb.fetch_one("foo", "noarch");
        FAIL() << "fetch_one returned a missing record";
    } catch (const GoogetException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
    EXPECT_THROW(sdb.remove("foo", "noarch"), GoogetException);
}

TEST_F(DatabaseTest, RemoveDropsRecord) {
    StateDB& sdb = open_db();
    sdb.upsert(state_for("foo", "1.0"));
    sdb.remove("foo", "noarch");
    EXPECT_TRUE(sdb.fetch_all().empty());
}

TEST_F(DatabaseTest, SecondOpenIsBusy) {
    open_db();
    try {
        StateDB second(env.db_file);
        FAIL() << "second handle acquired the lock";
    } catch (const GoogetException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DBBusy);
    }
    close_db();
    EXPECT_NO_THROW(StateDB{env.db_file});
}

TEST_F(DatabaseTest, ClosedHandleRefusesAccess) {
    StateDB& sdb = open_db();
    sdb.close();
    EXPECT_FALSE(sdb.is_open());
    EXPECT_THROW(sdb.fetch_all(), GoogetException);
}

TEST_F(DatabaseTest, CorruptContentIsReported) {
    for (const char* text : {"[{\"PackageSpec\": ", "{\"a\": 1}", "[{\"PackageSpec\": {\"Version\": \"1\"}}]"}) {
        try {
            parse_state(text, "test");
            ADD_FAILURE() << "accepted " << text;
        } catch (const GoogetException& e) {
            EXPECT_EQ(e.kind(), ErrorKind::DBCorrupt) << text;
        }
    }

    GooGetState dup = {state_for("foo", "1.0"), state_for("foo", "2.0")};
    EXPECT_THROW(parse_state(serialize_state(dup), "test"), GoogetException);
    EXPECT_THROW(open_db().write(dup), GoogetException);

    close_db();
    write_text(env.db_file, "not: [valid");
    EXPECT_THROW(StateDB{env.db_file}, GoogetException);
}

TEST_F(DatabaseTest, EmptyFileIsEmptyState) {
    write_text(env.db_file, "");
    EXPECT_TRUE(open_db().fetch_all().empty());
}
