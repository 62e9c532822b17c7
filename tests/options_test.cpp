#include "options.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace brewrecents {
namespace {

ParseResult parse(std::vector<const char*> args) {
    args.insert(args.begin(), "brew-recents");
    return parse_args(static_cast<int>(args.size()), args.data());
}

TEST(ParseArgs, Defaults) {
    ParseResult result = parse({});
    ASSERT_FALSE(result.has_error());
    EXPECT_EQ(result.action, ParseResult::Action::Run);

    const Options& opts = result.options;
    EXPECT_EQ(opts.days, 7);
    EXPECT_EQ(opts.style.truncate_at, 25);
    EXPECT_TRUE(opts.show_formula);
    EXPECT_TRUE(opts.show_cask);
    EXPECT_TRUE(opts.show_new);
    EXPECT_TRUE(opts.show_updated);
    EXPECT_TRUE(opts.style.dim_inspected);
    EXPECT_FALSE(opts.style.hide_inspected);
    EXPECT_TRUE(opts.style.color);
    EXPECT_FALSE(opts.style.plain);
}

TEST(ParseArgs, Values) {
    ParseResult result = parse({"--days", "3", "-t", "12", "--width=100",
                                "--history-file", "/tmp/hist"});
    ASSERT_FALSE(result.has_error()) << result.error;
    EXPECT_EQ(result.options.days, 3);
    EXPECT_EQ(result.options.style.truncate_at, 12);
    EXPECT_EQ(result.options.width, 100);
    EXPECT_EQ(result.options.history_file, "/tmp/hist");
}

TEST(ParseArgs, MissingValueIsAnError) {
    EXPECT_TRUE(parse({"--days"}).has_error());
    EXPECT_TRUE(parse({"--days", "--plain"}).has_error());
    EXPECT_TRUE(parse({"--truncate-chars"}).has_error());
}

TEST(ParseArgs, InvalidValueIsAnError) {
    EXPECT_TRUE(parse({"--days", "abc"}).has_error());
    EXPECT_TRUE(parse({"--days", "0"}).has_error());
    EXPECT_TRUE(parse({"-t", "-4"}).has_error());
    EXPECT_TRUE(parse({"--days=7x"}).has_error());
}

TEST(ParseArgs, UnknownFlagIsAnError) {
    ParseResult result = parse({"--bogus"});
    ASSERT_TRUE(result.has_error());
    EXPECT_NE(result.error.find("--bogus"), std::string::npos);
}

TEST(ParseArgs, HelpAndVersion) {
    EXPECT_EQ(parse({"-h"}).action, ParseResult::Action::Help);
    EXPECT_EQ(parse({"--plain", "--help"}).action, ParseResult::Action::Help);
    EXPECT_EQ(parse({"--version"}).action, ParseResult::Action::Version);
}

TEST(ParseArgs, OnlyFlagsRestrict) {
    const Options opts = parse({"--only-cask", "--only-updated"}).options;
    EXPECT_FALSE(opts.show_formula);
    EXPECT_TRUE(opts.show_cask);
    EXPECT_FALSE(opts.show_new);
    EXPECT_TRUE(opts.show_updated);
}

TEST(ParseArgs, BothOnlyFlagsShowBothRegardlessOfOrder) {
    for (const auto& opts : {parse({"--only-formula", "--only-cask"}).options,
                             parse({"--only-cask", "--only-formula"}).options}) {
        EXPECT_TRUE(opts.show_formula);
        EXPECT_TRUE(opts.show_cask);
    }
}

TEST(ParseArgs, NoFlagWinsOverOnly) {
    const Options opts = parse({"--no-new", "--only-new"}).options;
    EXPECT_FALSE(opts.show_new);
    EXPECT_TRUE(opts.show_updated);
}

TEST(ParseArgs, CancelledOnlyDoesNotHideOtherSide) {
    const Options opts = parse({"--only-cask", "--no-cask"}).options;
    EXPECT_TRUE(opts.show_formula);
    EXPECT_FALSE(opts.show_cask);
}

TEST(ParseArgs, ShortToggles) {
    const Options opts = parse({"-F", "-U"}).options;
    EXPECT_FALSE(opts.show_formula);
    EXPECT_TRUE(opts.show_cask);
    EXPECT_TRUE(opts.show_new);
    EXPECT_FALSE(opts.show_updated);
}

TEST(ParseArgs, PlainEnableAfterOnlyOther) {
    const Options opts = parse({"--only-cask", "--formula"}).options;
    EXPECT_TRUE(opts.show_formula);
    EXPECT_TRUE(opts.show_cask);
}

TEST(ParseArgs, StyleFlags) {
    const Options opts = parse({"--no-dim-looked-up", "--hide-looked-up",
                                "--no-color", "--plain", "--debug"}).options;
    EXPECT_FALSE(opts.style.dim_inspected);
    EXPECT_TRUE(opts.style.hide_inspected);
    EXPECT_FALSE(opts.style.color);
    EXPECT_TRUE(opts.style.plain);
    EXPECT_TRUE(opts.debug);
}

} // namespace
} // namespace brewrecents
