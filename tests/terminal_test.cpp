#include "terminal.hpp"

#include <gtest/gtest.h>
#include <cstdlib>

namespace brewrecents {
namespace {

TEST(ParseWidth, AcceptsPositiveIntegers) {
    EXPECT_EQ(parse_width("50"), 50);
    EXPECT_EQ(parse_width("1"), 1);
}

TEST(ParseWidth, RejectsEverythingElse) {
    EXPECT_EQ(parse_width(nullptr), 0);
    EXPECT_EQ(parse_width(""), 0);
    EXPECT_EQ(parse_width("abc"), 0);
    EXPECT_EQ(parse_width("80x"), 0);
    EXPECT_EQ(parse_width("0"), 0);
    EXPECT_EQ(parse_width("-20"), 0);
}

TEST(ResolveWidth, ColumnsWins) {
    EXPECT_EQ(resolve_width("50", 120), 50);
    EXPECT_EQ(resolve_width("50", 0), 50);
}

TEST(ResolveWidth, FallsBackToTtyThenDefault) {
    EXPECT_EQ(resolve_width(nullptr, 120), 120);
    EXPECT_EQ(resolve_width("abc", 120), 120);
    EXPECT_EQ(resolve_width(nullptr, 0), Terminal::DEFAULT_WIDTH);
    EXPECT_EQ(resolve_width("abc", 0), 80);
}

class TerminalColumnsTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* old = std::getenv("COLUMNS");
        had_columns_ = old != nullptr;
        if (had_columns_) saved_ = old;
    }

    void TearDown() override {
        if (had_columns_) {
            setenv("COLUMNS", saved_.c_str(), 1);
        } else {
            unsetenv("COLUMNS");
        }
    }

private:
    bool had_columns_ = false;
    std::string saved_;
};

TEST_F(TerminalColumnsTest, OutputWidthReadsColumns) {
    setenv("COLUMNS", "50", 1);
    Terminal terminal;
    EXPECT_EQ(terminal.output_width(), 50);
}

TEST_F(TerminalColumnsTest, InvalidColumnsIsIgnored) {
    setenv("COLUMNS", "abc", 1);
    Terminal terminal;
    int width = terminal.output_width();
    EXPECT_GT(width, 0);
    if (!terminal.is_tty()) {
        EXPECT_EQ(width, Terminal::DEFAULT_WIDTH);
    }
}

} // namespace
} // namespace brewrecents
