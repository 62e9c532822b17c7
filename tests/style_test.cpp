#include "style.hpp"
#include "terminal.hpp"

#include <gtest/gtest.h>

namespace brewrecents {
namespace {

MembershipSets make_sets() {
    MembershipSets sets;
    sets.installed = {"wget", "both"};
    sets.inspected = {"jq", "both"};
    return sets;
}

TEST(StyleEntry, PlainNameIsUnstyled) {
    StyledEntry entry = style_entry("ripgrep", make_sets(), StyleOptions());

    EXPECT_FALSE(entry.suppressed);
    EXPECT_EQ(entry.text, "ripgrep");
    EXPECT_EQ(entry.visible_length, 7);
}

TEST(StyleEntry, InstalledIsHighlightedWithIndicator) {
    StyledEntry entry = style_entry("wget", make_sets(), StyleOptions());

    std::string expected = std::string(Terminal::BOLD) + Terminal::ITALIC + Terminal::GREEN +
                           INSTALLED_INDICATOR + "wget" + Terminal::RESET;
    EXPECT_EQ(entry.text, expected);
    EXPECT_EQ(entry.visible_length, 5);
}

TEST(StyleEntry, InspectedIsDimmed) {
    StyledEntry entry = style_entry("jq", make_sets(), StyleOptions());

    EXPECT_EQ(entry.text, std::string(Terminal::DIM) + "jq" + Terminal::RESET);
    EXPECT_EQ(entry.visible_length, 2);
}

TEST(StyleEntry, InspectedWithoutDimIsPlain) {
    StyleOptions options;
    options.dim_inspected = false;

    EXPECT_EQ(style_entry("jq", make_sets(), options).text, "jq");
}

TEST(StyleEntry, InstalledOverridesDim) {
    StyledEntry entry = style_entry("both", make_sets(), StyleOptions());

    EXPECT_NE(entry.text.find(INSTALLED_INDICATOR), std::string::npos);
    EXPECT_EQ(entry.text.find(Terminal::DIM), std::string::npos);
}

TEST(StyleEntry, HideLookedUpWinsOverInstalled) {
    StyleOptions options;
    options.hide_inspected = true;

    StyledEntry entry = style_entry("both", make_sets(), options);
    EXPECT_TRUE(entry.suppressed);
    EXPECT_TRUE(entry.text.empty());

    EXPECT_TRUE(style_entry("jq", make_sets(), options).suppressed);
    EXPECT_FALSE(style_entry("wget", make_sets(), options).suppressed);
}

TEST(StyleEntry, PlainOutputDropsStylingAndIndicator) {
    StyleOptions options;
    options.plain = true;

    EXPECT_EQ(style_entry("wget", make_sets(), options).text, "wget");
    EXPECT_EQ(style_entry("jq", make_sets(), options).text, "jq");
}

TEST(StyleEntry, PlainOutputStillHides) {
    StyleOptions options;
    options.plain = true;
    options.hide_inspected = true;

    EXPECT_TRUE(style_entry("jq", make_sets(), options).suppressed);
}

TEST(StyleEntry, NoColorKeepsIndicator) {
    StyleOptions options;
    options.color = false;

    StyledEntry entry = style_entry("wget", make_sets(), options);
    EXPECT_EQ(entry.text, std::string(INSTALLED_INDICATOR) + "wget");
    EXPECT_EQ(entry.visible_length, 5);

    EXPECT_EQ(style_entry("jq", make_sets(), options).text, "jq");
}

TEST(StyleEntry, TruncatesBeforeStyling) {
    StyleOptions options;
    options.truncate_at = 5;

    MembershipSets sets;
    sets.installed = {"imagemagick"};

    StyledEntry entry = style_entry("imagemagick", sets, options);
    EXPECT_NE(entry.text.find("imag\xe2\x80\xa6"), std::string::npos);
    EXPECT_EQ(entry.visible_length, 6);  // indicator + 5
}

} // namespace
} // namespace brewrecents
