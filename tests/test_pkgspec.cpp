#include "test_helpers.hpp"

#include "exception.hpp"
#include "pkgspec.hpp"
#include "yaml_util.hpp"

namespace {

ErrorKind parse_error_kind(const std::string& text) {
    try {
        parse_pkgspec(text);
    } catch (const GoogetException& e) {
        return e.kind();
    }
    return ErrorKind::Generic;
}

} // anonymous namespace

class PkgSpecTest : public GoogetTest {};

TEST_F(PkgSpecTest, ParsesJsonDocument) {
    const PkgSpec spec = parse_pkgspec(R"({
        "Name": "foo",
        "Version": "1.2.3@4",
        "Arch": "x86_64",
        "Description": "a package",
        "Tags": {"team": "infra"},
        "PkgDependencies": {"bar": "1.0", "baz.noarch": "2.0"},
        "Replaces": ["oldfoo"],
        "Conflicts": ["evilfoo.*.1+"],
        "Files": {"bin/foo": "<ProgramFiles>/foo/foo"},
        "Install": {"Path": "install.sh", "Args": ["-q"], "ExitCodes": [0, 3010]}
    })");

    EXPECT_EQ(spec.name, "foo");
    EXPECT_EQ(spec.version.str(), "1.2.3@4");
    EXPECT_EQ(spec.arch, "x86_64");
    EXPECT_EQ(spec.tags.at("team"), "infra");
    EXPECT_EQ(spec.files.at("bin/foo"), "<ProgramFiles>/foo/foo");
    EXPECT_EQ(spec.install.path, "install.sh");
    EXPECT_EQ(spec.install.args, std::vector<std::string>{"-q"});
    EXPECT_EQ(spec.install.exit_codes, (std::vector<int>{0, 3010}));
    EXPECT_TRUE(spec.uninstall.empty());
    EXPECT_EQ(spec.to_string(), "foo.x86_64.1.2.3@4");
}

TEST_F(PkgSpecTest, KeysAreCaseInsensitiveAndYamlIsAccepted) {
    const PkgSpec spec = parse_pkgspec("name: foo\nversion: \"1.0\"\narch: noarch\n");
    EXPECT_EQ(spec.name, "foo");
    EXPECT_EQ(spec.version.str(), "1.0");
}

TEST_F(PkgSpecTest, DependenciesInheritArch) {
    PkgSpec spec = make_spec("foo", "1.0", "x86_64", {{"bar", "1.0"}, {"baz.noarch", "2.0"}});
    const auto reqs = spec.dependency_requests();
    ASSERT_EQ(reqs.size(), 2u);

    EXPECT_EQ(reqs[0].name, "bar");
    EXPECT_EQ(reqs[0].arch, "x86_64");
    EXPECT_FALSE(reqs[0].arch_explicit);
    EXPECT_EQ(reqs[0].min_version, "1.0");

    EXPECT_EQ(reqs[1].name, "baz");
    EXPECT_EQ(reqs[1].arch, "noarch");
    EXPECT_TRUE(reqs[1].arch_explicit);
}

TEST_F(PkgSpecTest, RejectsInvalidFields) {
    EXPECT_EQ(parse_error_kind(R"({"Version": "1.0", "Arch": "noarch"})"), ErrorKind::ParseError);
    EXPECT_EQ(parse_error_kind(R"({"Name": "foo", "Version": "1.0", "Arch": "sparc"})"), ErrorKind::ParseError);
    EXPECT_EQ(parse_error_kind(R"({"Name": "foo", "Arch": "noarch"})"), ErrorKind::ParseError);
    EXPECT_EQ(parse_error_kind(R"({"Name": "foo", "Version": "1..0", "Arch": "noarch"})"),
              ErrorKind::MalformedIdentifier);
    EXPECT_EQ(parse_error_kind(R"({"Name": "foo", "Version": "1.0", "Arch": "noarch",
                                   "PkgDependencies": {"bar": "not a version"}})"),
              ErrorKind::ParseError);
    EXPECT_EQ(parse_error_kind(R"({"Name": "foo", "Version": "1.0", "Arch": "noarch",
                                   "Files": {"/etc/passwd": "x"}})"),
              ErrorKind::ParseError);
    EXPECT_EQ(parse_error_kind(R"({"Name": "foo", "Version": "1.0", "Arch": "noarch",
                                   "Install": {"Path": "a.sh", "ExitCodes": ["zero"]}})"),
              ErrorKind::ParseError);
    EXPECT_EQ(parse_error_kind("[1, 2"), ErrorKind::ParseError);
    EXPECT_EQ(parse_error_kind("[1, 2]"), ErrorKind::ParseError);
}

TEST_F(PkgSpecTest, RejectsTooManyTags) {
    PkgSpec spec = make_spec("foo", "1.0");
    for (size_t i = 0; i <= MAX_TAGS; ++i) spec.tags["t" + std::to_string(i)] = "v";
    EXPECT_THROW(verify_pkgspec(spec), GoogetException);
    spec.tags.erase("t0");
    EXPECT_NO_THROW(verify_pkgspec(spec));
}

TEST_F(PkgSpecTest, ScriptPathsAreCleaned) {
    const PkgSpec spec = parse_pkgspec(R"({"Name": "foo", "Version": "1.0", "Arch": "noarch",
                                           "Uninstall": {"Path": "../../scripts/remove.sh"}})");
    EXPECT_EQ(spec.uninstall.path, "scripts/remove.sh");
}

TEST_F(PkgSpecTest, SerializedSpecParsesBack) {
    PkgSpec spec = file_spec("foo", "2.0", {{"bar", "1.0"}});
    spec.replaces = {"oldfoo"};
    spec.verify = ExecFile{"check.sh", {"--all"}, {0}};
    EXPECT_EQ(parse_pkgspec(serialize_pkgspec(spec)), spec);
}

TEST_F(PkgSpecTest, ManifestParsing) {
    RepoSpec rs;
    rs.checksum = "abc";
    rs.source = "packages/foo.noarch.1.0.goo";
    rs.package_spec = make_spec("foo", "1.0");
    const auto specs = parse_repo_manifest(serialize_repo_manifest({rs}), "test");
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].checksum, "abc");
    EXPECT_EQ(specs[0].package_spec.id(), rs.package_spec.id());

    EXPECT_TRUE(parse_repo_manifest("", "empty").empty());
    EXPECT_THROW(parse_repo_manifest(R"({"Checksum": "x"})", "map"), GoogetException);
    EXPECT_TRUE(parse_repo_manifest(R"([{"Checksum": "x", "Source": "y"}])", "nospec").empty());
}

TEST_F(PkgSpecTest, InvalidManifestEntriesAreDropped) {
    RepoSpec good{"abc", "packages/foo.noarch.1.0.goo", make_spec("foo", "1.0")};
    RepoSpec bad_pattern{"def", "packages/bar.noarch.1.0.goo", make_spec("bar", "1.0")};
    bad_pattern.package_spec.replaces = {"foo..1"};
    RepoSpec bad_arch{"ghi", "packages/baz.sparc.1.0.goo", make_spec("baz", "1.0")};

    YAML::Node root(YAML::NodeType::Sequence);
    for (const RepoSpec* rs : {&good, &bad_pattern, &bad_arch}) root.push_back(repospec_to_yaml(*rs));
    root[2]["PackageSpec"]["Arch"] = "sparc";

    const auto specs = parse_repo_manifest(emit_json(root), "mixed");
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].package_spec.name, "foo");
}

TEST_F(PkgSpecTest, ReadsSpecFromArchive) {
    const PkgSpec spec = file_spec("foo", "1.5");
    const fs::path archive = build_archive(spec, file_contents(spec), work_dir / "out");
    EXPECT_EQ(read_pkgspec_from_archive(archive), spec);

    const fs::path other = work_dir / "plain.tar.gz";
    write_text(work_dir / "plain" / "readme", "x");
    const std::string cmd = "tar -czf '" + other.string() + "' -C '" + (work_dir / "plain").string() + "' .";
    ASSERT_EQ(std::system(cmd.c_str()), 0);
    EXPECT_THROW(read_pkgspec_from_archive(other), GoogetException);
}
