#include "test_helpers.hpp"

#include "environment.hpp"
#include "pkgspec.hpp"

class EnvironmentTest : public GoogetTest {
protected:
    void TearDown() override {
        unsetenv("GooGetRoot");
        unsetenv("GOOGETROOT");
        GoogetTest::TearDown();
    }
};

TEST_F(EnvironmentTest, LayoutUnderRoot) {
    const Environment e = make_environment(root);
    EXPECT_EQ(e.cache_dir, root / "cache");
    EXPECT_EQ(e.db_file, root / "googet.db");
    EXPECT_EQ(e.repo_dir, root / "repos");
    EXPECT_EQ(e.conf_file, root / "googet.conf");
    EXPECT_EQ(e.archs, known_archs());
    EXPECT_EQ(e.cache_life, DEFAULT_CACHE_LIFE);
    EXPECT_FALSE(e.allow_unsafe_url);
}

TEST_F(EnvironmentTest, ConfigOverridesDefaults) {
    write_text(root / "googet.conf",
               "archs: [x86_64, noarch]\n"
               "cachelife: 10m\n"
               "lockfilemaxage: 1h30m\n"
               "proxyserver: http://proxy:3128\n"
               "allowunsafeurl: true\n");
    const Environment e = make_environment(root);
    EXPECT_EQ(e.archs, (std::vector<std::string>{"x86_64", "noarch"}));
    EXPECT_EQ(e.cache_life, std::chrono::minutes(10));
    EXPECT_EQ(e.lock_max_age, std::chrono::seconds(5400));
    EXPECT_EQ(e.proxy_server, "http://proxy:3128");
    EXPECT_TRUE(e.allow_unsafe_url);
}

TEST_F(EnvironmentTest, MalformedConfigRejected) {
    write_text(root / "googet.conf", "cachelife: soon\n");
    EXPECT_THROW(make_environment(root), GoogetException);
    write_text(root / "googet.conf", "- a\n- b\n");
    EXPECT_THROW(make_environment(root), GoogetException);
}

TEST_F(EnvironmentTest, DurationForms) {
    EXPECT_EQ(parse_duration("90"), std::chrono::seconds(90));
    EXPECT_EQ(parse_duration("90s"), std::chrono::seconds(90));
    EXPECT_EQ(parse_duration("2h"), std::chrono::seconds(7200));
    EXPECT_THROW(parse_duration("h"), GoogetException);
    EXPECT_THROW(parse_duration("5d"), GoogetException);
}

TEST_F(EnvironmentTest, RootResolution) {
    unsetenv("GooGetRoot");
    unsetenv("GOOGETROOT");
    EXPECT_EQ(resolve_root(""), fs::path(GOOGET_DEFAULT_ROOT));

    setenv("GOOGETROOT", (work_dir / "envroot").c_str(), 1);
    EXPECT_EQ(resolve_root(""), work_dir / "envroot");
    EXPECT_EQ(resolve_root((work_dir / "flag").string()), work_dir / "flag");
}

TEST_F(EnvironmentTest, RootLockIsExclusive) {
    auto lock = obtain_root_lock(env);
    ASSERT_NE(lock, nullptr);
    try {
        obtain_root_lock(env);
        FAIL() << "lock acquired twice";
    } catch (const GoogetException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DBBusy);
    }
    lock.reset();
    EXPECT_NE(obtain_root_lock(env), nullptr);
}
