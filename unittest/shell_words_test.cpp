#include <gtest/gtest.h>
#include "common/shell_words.hpp"

using namespace snapkeep;

TEST(ShellWordsTest, SplitsOnWhitespaceAndQuotes) {
    EXPECT_EQ(shell::split("  nice   -n19 "), (std::vector<std::string>{"nice", "-n19"}));
    EXPECT_EQ(shell::split("a 'b c' \"d e\""), (std::vector<std::string>{"a", "b c", "d e"}));
    EXPECT_EQ(shell::split("x\\ y"), (std::vector<std::string>{"x y"}));
    EXPECT_EQ(shell::split("''"), (std::vector<std::string>{""}));
    EXPECT_TRUE(shell::split("").empty());
}

TEST(ShellWordsTest, UnterminatedInputThrows) {
    EXPECT_THROW(shell::split("'open"), std::invalid_argument);
    EXPECT_THROW(shell::split("\"open"), std::invalid_argument);
    EXPECT_THROW(shell::split("trailing\\"), std::invalid_argument);
}

TEST(ShellWordsTest, QuoteOnlyWhenNeeded) {
    EXPECT_EQ(shell::quote("/usr/bin/snapkeep"), "/usr/bin/snapkeep");
    EXPECT_EQ(shell::quote("my config.json"), "'my config.json'");
    EXPECT_EQ(shell::quote(""), "''");
    EXPECT_EQ(shell::split(shell::quote("it's")), (std::vector<std::string>{"it's"}));
}

TEST(ShellWordsTest, JoinQuotesEachWord) {
    std::vector<std::string> words = {"snapkeep", "--config", "/tmp/a b.json", "backup-job"};
    std::string joined = shell::join(words);
    EXPECT_EQ(joined, "snapkeep --config '/tmp/a b.json' backup-job");
    EXPECT_EQ(shell::split(joined), words);
}
