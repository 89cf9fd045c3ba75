#include <gtest/gtest.h>
#include "shell/Cli.hpp"
#include "shell/Parser.hpp"
#include "shell/Token.hpp"

using namespace tmr::shell;

TEST(TokenizerTest, SplitsFlagsAndWords) {
    const auto toks = tokenize({"--exclude=*.log", "-n", "src", "--", "-odd"});
    EXPECT_EQ(to_string(toks), "Flag(exclude) Word(*.log) Flag(n) Word(src) Word(--) Word(-odd)");
}

TEST(TokenizerTest, ShortBundleAndGluedValue) {
    EXPECT_EQ(to_string(tokenize({"-nv"})), "Flag(n) Flag(v)");
    EXPECT_EQ(to_string(tokenize({"-e*.tmp"})), "Flag(e) Word(*.tmp)");
    EXPECT_EQ(to_string(tokenize({"-5", "-"})), "Word(-5) Word(-)");
}

TEST(ParserTest, SwitchesDoNotSwallowPositionals) {
    const auto call = parseTokens(tokenize({"-n", "src", "dst"}), {"n"});
    EXPECT_TRUE(hasFlag(call, {"n"}));
    ASSERT_EQ(call.positionals.size(), 2u);
    EXPECT_EQ(call.positionals[0], "src");
}

TEST(ParserTest, RepeatedOptionsKeepEveryValue) {
    const auto call = parseTokens(tokenize({"-e", "a", "--exclude", "b", "-e=c"}));
    EXPECT_EQ(optVals(call, {"e", "exclude"}), (std::vector<std::string>{"a", "b", "=c"}));
    EXPECT_EQ(optVal(call, {"e", "exclude"}), "=c");
}

TEST(CliTest, FullCommandLine) {
    const auto opts = parseCli({"-e", "*.log", "--exclude=tmp/", "--dry-run", "-v", "debug",
                                "--config", "/tmp/tm.yaml", "--json", "--no-color", "from", "to"});
    EXPECT_EQ(opts.excludes, (std::vector<std::string>{"*.log", "tmp/"}));
    EXPECT_TRUE(opts.dryRun);
    EXPECT_TRUE(opts.json);
    EXPECT_TRUE(opts.noColor);
    ASSERT_TRUE(opts.verbosity);
    EXPECT_EQ(*opts.verbosity, spdlog::level::debug);
    ASSERT_TRUE(opts.configPath);
    EXPECT_EQ(*opts.configPath, "/tmp/tm.yaml");
    EXPECT_EQ(opts.source, "from");
    EXPECT_EQ(opts.target, "to");
}

TEST(CliTest, BundledShortFlags) {
    const auto opts = parseCli({"-nv", "warn", "a", "b"});
    EXPECT_TRUE(opts.dryRun);
    EXPECT_EQ(*opts.verbosity, spdlog::level::warn);
}

TEST(CliTest, SentinelAllowsDashedPaths) {
    const auto opts = parseCli({"--", "-src", "-dst"});
    EXPECT_EQ(opts.source, "-src");
    EXPECT_EQ(opts.target, "-dst");
}

TEST(CliTest, HelpNeedsNoPaths) {
    EXPECT_TRUE(parseCli({"--help"}).help);
    EXPECT_TRUE(parseCli({"-h"}).help);
}

TEST(CliTest, UsageErrors) {
    EXPECT_THROW(parseCli({}), UsageError);
    EXPECT_THROW(parseCli({"only-one"}), UsageError);
    EXPECT_THROW(parseCli({"a", "b", "c"}), UsageError);
    EXPECT_THROW(parseCli({"--frobnicate", "a", "b"}), UsageError);
    EXPECT_THROW(parseCli({"-v", "loud", "a", "b"}), UsageError);
    EXPECT_THROW(parseCli({"a", "b", "-e"}), UsageError);
}

TEST(CliTest, VerbosityNames) {
    EXPECT_EQ(parseVerbosity("info"), spdlog::level::info);
    EXPECT_EQ(parseVerbosity("error"), spdlog::level::err);
    EXPECT_THROW(parseVerbosity("trace"), UsageError);
}

TEST(CliTest, UsageMentionsEveryOption) {
    const auto text = usage();
    for (const auto* opt : {"--exclude", "--dry-run", "--verbosity", "--config", "--json", "--no-color", "--help"})
        EXPECT_NE(text.find(opt), std::string::npos) << opt;
}
