#include "test_helpers.hpp"

#include "clean.hpp"

class RemoveTest : public GoogetTest {
protected:
    void SetUp() override {
        GoogetTest::SetUp();
        url = publish("stable", file_spec("base", "1"));
        publish("stable", file_spec("mid", "1", {{"base", "1"}}));
        publish("stable", file_spec("top", "1", {{"mid", "1"}}));
        publish("stable", file_spec("other", "1"));
    }

    void install(std::vector<std::string> names) {
        ASSERT_EQ(run_command("install", std::move(names), {{"sources", url}}), 0);
    }

    std::string url;
};

TEST_F(RemoveTest, RemovesDependentsLeavesFirst) {
    install({"top", "other"});
    ASSERT_EQ(installed_ids().size(), 4u);

    EXPECT_EQ(run_command("remove", {"base"}), 0);

    EXPECT_EQ(installed_ids(), std::vector<std::string>{"other.noarch.1"});
    for (const char* name : {"base", "mid", "top"}) {
        EXPECT_FALSE(fs::exists(dest(name))) << name;
        EXPECT_FALSE(fs::exists(cache->archive_path({name, "noarch", "1"}))) << name;
    }
    EXPECT_TRUE(fs::exists(dest("other")));
}

TEST_F(RemoveTest, LeafRemovalKeepsDependencies) {
    install({"top"});
    EXPECT_EQ(run_command("remove", {"top.noarch"}), 0);
    EXPECT_EQ(installed_ids(), (std::vector<std::string>{"base.noarch.1", "mid.noarch.1"}));
}

TEST_F(RemoveTest, DbOnlyLeavesFiles) {
    install({"other"});
    EXPECT_EQ(run_command("remove", {"other"}, {{"db_only", "true"}}), 0);
    EXPECT_TRUE(installed_ids().empty());
    EXPECT_TRUE(fs::exists(dest("other")));
}

TEST_F(RemoveTest, UnknownPackageReturnsFailure) {
    install({"other"});
    EXPECT_EQ(run_command("remove", {"ghost", "other"}), 1);
    EXPECT_TRUE(installed_ids().empty());
}

TEST_F(RemoveTest, UninstallScriptRunsFromRedownloadedArchive) {
    PkgSpec s = file_spec("scripted", "1");
    s.uninstall = ExecFile{"remove.sh", {}, {}};
    publish("stable", s, {{"scripted.txt", "s"}, {"remove.sh", "echo \"$GOOGET_PACKAGE\" > '" + dest("marker") + "'\n"}});
    install({"scripted"});

    // Without a cached archive the uninstall script is fetched again.
    clean_all(env.cache_dir);
    EXPECT_EQ(run_command("remove", {"scripted"}), 0);

    EXPECT_EQ(read_text(dest("marker")), "scripted.noarch.1\n");
    EXPECT_FALSE(fs::exists(dest("scripted")));
    EXPECT_FALSE(fs::exists(cache->unpack_dir({"scripted", "noarch", "1"})));
    EXPECT_TRUE(installed_ids().empty());
}

TEST_F(RemoveTest, FailedUninstallScriptKeepsRecord) {
    PkgSpec s = file_spec("stubborn", "1");
    s.uninstall = ExecFile{"remove.sh", {}, {}};
    publish("stable", s, {{"stubborn.txt", "s"}, {"remove.sh", "exit 2\n"}});
    install({"stubborn"});

    RemovalTask task(context(), open_db().fetch_one("stubborn", "noarch"), false);
    EXPECT_EQ(error_kind_of([&] { task.run(); }), ErrorKind::ScriptError);
    EXPECT_EQ(task.state(), TaskState::Failed);
    EXPECT_TRUE(fs::exists(dest("stubborn")));
    EXPECT_FALSE(fs::exists(cache->unpack_dir({"stubborn", "noarch", "1"})));
    EXPECT_EQ(installed_ids(), std::vector<std::string>{"stubborn.noarch.1"});
}

TEST_F(RemoveTest, SharedDirectoriesSurvive) {
    PkgSpec a = make_spec("a", "1");
    a.files["tree"] = dest("shared");
    PkgSpec b = make_spec("b", "1");
    b.files["tree"] = dest("shared");
    publish("stable", a, {{"tree/a.txt", "a"}});
    publish("stable", b, {{"tree/b.txt", "b"}});
    install({"a", "b"});

    EXPECT_EQ(run_command("remove", {"a"}), 0);
    EXPECT_FALSE(fs::exists(dest("shared/a.txt")));
    EXPECT_TRUE(fs::exists(dest("shared/b.txt")));

    EXPECT_EQ(run_command("remove", {"b"}), 0);
    EXPECT_FALSE(fs::exists(dest("shared")));
}
