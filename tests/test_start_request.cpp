#include <gtest/gtest.h>
#include <managers/start_request.hpp>
#include <algorithm>
#include <optional>

namespace {

std::optional<std::string> flag_value(const std::vector<std::string>& flags,
                                      const std::string& flag) {
    auto it = std::find(flags.begin(), flags.end(), flag);
    if (it == flags.end() || it + 1 == flags.end()) return std::nullopt;
    return *(it + 1);
}

bool has_flag(const std::vector<std::string>& flags, const std::string& flag) {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

StartArguments make_args() {
    StartArguments args;
    args.project_dir = "/work/project";
    return args;
}

ServerConfig make_config() {
    ServerConfig c;
    c.workers = 8;
    c.typeshed = "/opt/typeshed";
    c.version_hash = "deadbeef";
    c.binary = "pyre.bin";
    return c;
}

} // namespace

// ── directories_to_analyze ──────────────────────────────────

TEST(StartRequest, DirectoriesEmptyByDefault) {
    EXPECT_TRUE(directories_to_analyze(make_args(), make_config()).empty());
}

TEST(StartRequest, DirectoriesResolveAgainstProjectRoot) {
    auto args = make_args();
    args.source_directories = {".", "lib/", "/elsewhere/src"};
    auto dirs = directories_to_analyze(args, make_config());
    ASSERT_EQ(dirs.size(), 3u);
    EXPECT_EQ(dirs[0], "/work/project");
    EXPECT_EQ(dirs[1], "/work/project/lib");
    EXPECT_EQ(dirs[2], "/elsewhere/src");
}

TEST(StartRequest, DirectoriesDeduplicatedInFirstSeenOrder) {
    auto args = make_args();
    args.source_directories = {"b", "/work/project", "b/", "./b", "a"};
    auto dirs = directories_to_analyze(args, make_config());
    std::vector<std::string> expected = {"/work/project/b", "/work/project", "/work/project/a"};
    EXPECT_EQ(dirs, expected);
}

TEST(StartRequest, CommandLineOverridesConfiguredDirectories) {
    auto args = make_args();
    auto config = make_config();
    config.analysis_directories = {"/work/project", "/work/project/configured"};

    EXPECT_EQ(directories_to_analyze(args, config).size(), 2u);

    args.source_directories = {"cli"};
    auto dirs = directories_to_analyze(args, config);
    ASSERT_EQ(dirs.size(), 1u);
    EXPECT_EQ(dirs[0], "/work/project/cli");
}

// ── should_filter_directories ───────────────────────────────

TEST(StartRequest, NoFilterForRootOnly) {
    EXPECT_FALSE(should_filter_directories({"/work/project"}, "/work/project"));
}

TEST(StartRequest, NoFilterWhenEmpty) {
    EXPECT_FALSE(should_filter_directories({}, "/work/project"));
}

TEST(StartRequest, NoFilterWithoutRoot) {
    EXPECT_FALSE(should_filter_directories({"/work/project/a", "/work/project/b"}, "/work/project"));
}

TEST(StartRequest, FilterForStrictSuperset) {
    EXPECT_TRUE(should_filter_directories({"/work/project", "/work/other"}, "/work/project"));
}

// ── build_start_request ─────────────────────────────────────

TEST(StartRequest, FilterFlagOmittedForRootOnly) {
    auto args = make_args();
    args.source_directories = {"/work/project"};
    auto req = build_start_request(args, make_config());
    EXPECT_FALSE(has_flag(req.flags, "-filter-directories"));
}

TEST(StartRequest, FilterFlagKeepsOrder) {
    auto args = make_args();
    args.source_directories = {"/work/project", "/work/other"};
    auto req = build_start_request(args, make_config());
    EXPECT_EQ(flag_value(req.flags, "-filter-directories"), "/work/project,/work/other");

    args.source_directories = {"/work/other", "/work/project"};
    req = build_start_request(args, make_config());
    EXPECT_EQ(flag_value(req.flags, "-filter-directories"), "/work/other,/work/project");
}

TEST(StartRequest, WatchmanOnUnlessDisabled) {
    auto args = make_args();
    EXPECT_TRUE(has_flag(build_start_request(args, make_config()).flags, "-use-watchman"));

    args.no_watchman = true;
    EXPECT_FALSE(has_flag(build_start_request(args, make_config()).flags, "-use-watchman"));
}

TEST(StartRequest, TerminalOnlyWhenRequested) {
    auto args = make_args();
    EXPECT_FALSE(has_flag(build_start_request(args, make_config()).flags, "-terminal"));

    args.terminal = true;
    EXPECT_TRUE(has_flag(build_start_request(args, make_config()).flags, "-terminal"));
}

TEST(StartRequest, AlwaysCarriesWorkersTypeshedVersion) {
    auto req = build_start_request(make_args(), make_config());
    EXPECT_EQ(flag_value(req.flags, "-workers"), "8");
    EXPECT_EQ(flag_value(req.flags, "-typeshed"), "/opt/typeshed");
    EXPECT_EQ(flag_value(req.flags, "-expected-binary-version"), "deadbeef");
}

TEST(StartRequest, SearchPathOnlyWhenConfigured) {
    auto config = make_config();
    EXPECT_FALSE(has_flag(build_start_request(make_args(), config).flags, "-search-path"));

    config.search_path = {"x", "y"};
    EXPECT_EQ(flag_value(build_start_request(make_args(), config).flags, "-search-path"), "x,y");
}

TEST(StartRequest, CommonFlags) {
    auto args = make_args();
    std::vector<std::string> expected = {"-project-root", "/work/project"};
    EXPECT_EQ(common_flags(args), expected);

    args.verbose = true;
    args.logging_sections = "server,-progress";
    args.log_identifier = "ci";
    expected = {"-project-root", "/work/project", "-verbose",
                "-logging-sections", "server,-progress", "-log-identifier", "ci"};
    EXPECT_EQ(common_flags(args), expected);
}

TEST(StartRequest, FullFlagOrder) {
    auto args = make_args();
    args.source_directories = {"/work/project", "/work/project/sub"};
    args.terminal = true;
    auto config = make_config();
    config.search_path = {"/stubs"};

    auto req = build_start_request(args, config);
    EXPECT_EQ(req.command, "start");
    EXPECT_EQ(req.project_dir, "/work/project");

    std::vector<std::string> expected = {
        "-project-root", "/work/project",
        "-filter-directories", "/work/project,/work/project/sub",
        "-use-watchman",
        "-terminal",
        "-workers", "8",
        "-typeshed", "/opt/typeshed",
        "-expected-binary-version", "deadbeef",
        "-search-path", "/stubs",
    };
    EXPECT_EQ(req.flags, expected);
}
