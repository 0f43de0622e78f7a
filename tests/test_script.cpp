#include "test_helpers.hpp"

#include "script.hpp"

class ScriptTest : public GoogetTest {
protected:
    fs::path script_dir() const { return work_dir / "unpack"; }

    ExecFile script(const std::string& body, std::vector<int> codes = {}) {
        write_text(script_dir() / "run.sh", body);
        return ExecFile{"run.sh", {}, std::move(codes)};
    }
};

TEST_F(ScriptTest, ZeroExitSucceeds) {
    const ExecFile ef = script("echo hello\n");
    EXPECT_EQ(run_exec_file(script_dir(), ef, "out.log", {}), 0);
    EXPECT_EQ(read_text(script_dir() / "out.log"), "hello\n");
}

TEST_F(ScriptTest, ListedExitCodeSucceeds) {
    const ExecFile ef = script("exit 194\n", {194});
    EXPECT_EQ(run_exec_file(script_dir(), ef, "out.log", {}), 194);
}

TEST_F(ScriptTest, UnlistedExitCodeIsScriptError) {
    const ExecFile ef = script("exit 7\n", {3});
    try {
        run_exec_file(script_dir(), ef, "out.log", {});
        FAIL() << "script failure not reported";
    } catch (const GoogetException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ScriptError);
    }
}

TEST_F(ScriptTest, ArgumentsEnvironmentAndWorkingDirectory) {
    ExecFile ef = script("echo \"$1 $GOOGET_PACKAGE\"\npwd\n");
    ef.args = {"first"};
    run_exec_file(script_dir(), ef, "out.log", {{"GOOGET_PACKAGE", "foo.noarch.1"}});

    const std::string out = read_text(script_dir() / "out.log");
    EXPECT_NE(out.find("first foo.noarch.1\n"), std::string::npos);
    EXPECT_NE(out.find(fs::canonical(script_dir()).string()), std::string::npos);
}

TEST_F(ScriptTest, OutputIsAppended) {
    const ExecFile ef = script("echo line\n");
    run_exec_file(script_dir(), ef, "out.log", {});
    run_exec_file(script_dir(), ef, "out.log", {});
    EXPECT_EQ(read_text(script_dir() / "out.log"), "line\nline\n");
}

TEST_F(ScriptTest, MissingOrEscapingScriptRejected) {
    fs::create_directories(script_dir());
    EXPECT_THROW(run_exec_file(script_dir(), ExecFile{"absent.sh", {}, {}}, "out.log", {}), GoogetException);
    EXPECT_THROW(run_exec_file(script_dir(), ExecFile{"../run.sh", {}, {}}, "out.log", {}), GoogetException);
}

TEST_F(ScriptTest, CancellationKillsTheScript) {
    const ExecFile ef = script("sleep 30\n");
    request_cancellation();
    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(error_kind_of([&] { run_exec_file(script_dir(), ef, "out.log", {}); }), ErrorKind::ScriptError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    reset_cancellation();
}
