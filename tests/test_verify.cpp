#include "test_helpers.hpp"

class VerifyTest : public GoogetTest {
protected:
    void install(const PkgSpec& spec, const FileContents& contents) {
        url = publish("stable", spec, contents);
        ASSERT_EQ(run_command("install", {spec.name}, {{"sources", url}}), 0);
    }

    std::string url;
};

TEST_F(VerifyTest, IntactPackagePasses) {
    install(file_spec("A", "1"), {{"A.txt", "a"}});
    EXPECT_TRUE(verify_package(context(), open_db().fetch_one("A", "noarch"), false));
    close_db();
    EXPECT_EQ(run_command("verify", {"A"}), 0);
}

TEST_F(VerifyTest, ModifiedOrMissingFileFails) {
    install(file_spec("A", "1"), {{"A.txt", "a"}});
    write_text(dest("A"), "changed");
    EXPECT_FALSE(verify_package(context(), open_db().fetch_one("A", "noarch"), false));
    EXPECT_TRUE(verify_package(context(), open_db().fetch_one("A", "noarch"), true));

    fs::remove(dest("A"));
    EXPECT_FALSE(verify_package(context(), open_db().fetch_one("A", "noarch"), false));
    close_db();
    EXPECT_EQ(run_command("verify", {"A"}), 1);
}

TEST_F(VerifyTest, ReinstallRepairsPackage) {
    install(file_spec("A", "1"), {{"A.txt", "a"}});
    write_text(dest("A"), "changed");

    EXPECT_EQ(run_command("verify", {"A"}, {{"reinstall", "true"}}), 0);
    EXPECT_EQ(read_text(dest("A")), "a");
    EXPECT_EQ(run_command("verify", {"A"}), 0);
}

TEST_F(VerifyTest, VerifyScriptDecides) {
    PkgSpec spec = file_spec("A", "1");
    spec.verify = ExecFile{"verify.sh", {}, {}};
    install(spec, {{"A.txt", "a"}, {"verify.sh", "test -f '" + dest("healthy") + "'\n"}});

    EXPECT_FALSE(verify_package(context(), open_db().fetch_one("A", "noarch"), true));
    write_text(dest("healthy"), "");
    EXPECT_TRUE(verify_package(context(), open_db().fetch_one("A", "noarch"), true));
    EXPECT_FALSE(fs::exists(cache->unpack_dir({"A", "noarch", "1"})));
}

TEST_F(VerifyTest, UnknownPackageReported) {
    EXPECT_EQ(run_command("verify", {"ghost"}), 1);
}
