#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "coop_ledger/apps/cli_support.h"
#include "coop_ledger/apps/day_control_app.h"

namespace coop_ledger::apps {

TEST(CliSupportTest, ParsesFlagsValuesAndPositionals) {
    std::vector<std::string> positional;
    const auto args = ParseArgs(
        {"settle", "--teller", "teller-1", "--physical-cash=4950", "--dry-run", "--actor", "ops"},
        &positional);
    ASSERT_EQ(positional.size(), 1U);
    EXPECT_EQ(positional[0], "settle");
    EXPECT_EQ(GetArg(args, "teller"), "teller-1");
    EXPECT_EQ(GetArg(args, "physical-cash"), "4950");
    EXPECT_EQ(GetArg(args, "dry-run"), "true");
    EXPECT_EQ(GetArg(args, "actor"), "ops");
    EXPECT_EQ(GetArg(args, "missing", "fallback"), "fallback");
    EXPECT_TRUE(HasArg(args, "dry-run"));
    EXPECT_FALSE(HasArg(args, "missing"));
}

TEST(CliSupportTest, ParsesNumbersStrictly) {
    double value = 0.0;
    EXPECT_TRUE(ParseDoubleText("4950.25", &value));
    EXPECT_DOUBLE_EQ(value, 4950.25);
    EXPECT_FALSE(ParseDoubleText("", &value));
    EXPECT_FALSE(ParseDoubleText("12abc", &value));
    EXPECT_FALSE(ParseDoubleText("abc", &value));
    EXPECT_FALSE(ParseDoubleText("nan", &value));
    EXPECT_FALSE(ParseDoubleText("inf", &value));
    EXPECT_FALSE(ParseDoubleText("-Infinity", &value));
    EXPECT_FALSE(ParseDoubleText("1e400", &value));
}

TEST(CliSupportTest, SplitsCommandLineWithQuotes) {
    std::vector<std::string> tokens;
    std::string error;
    ASSERT_TRUE(SplitCommandLine(
        R"(post --description "Opening \"capital\"" --amount 10  )", &tokens, &error));
    ASSERT_EQ(tokens.size(), 5U);
    EXPECT_EQ(tokens[0], "post");
    EXPECT_EQ(tokens[2], "Opening \"capital\"");
    EXPECT_EQ(tokens[4], "10");

    ASSERT_TRUE(SplitCommandLine(R"(create-account --name "")", &tokens, &error));
    ASSERT_EQ(tokens.size(), 3U);
    EXPECT_TRUE(tokens[2].empty());

    EXPECT_FALSE(SplitCommandLine(R"(post --description "open)", &tokens, &error));
    EXPECT_EQ(error, "unterminated quote");
}

TEST(CliSupportTest, QuotesOutputValuesOnlyWhenNeeded) {
    EXPECT_EQ(QuoteOutputValue("OPEN"), "OPEN");
    EXPECT_EQ(QuoteOutputValue(""), "\"\"");
    EXPECT_EQ(QuoteOutputValue("Vault Transfer"), "\"Vault Transfer\"");
    EXPECT_EQ(QuoteOutputValue("a=\"b\""), "\"a=\\\"b\\\"\"");
}

TEST(CliSupportTest, ParsesDenominationList) {
    std::vector<Denomination> notes;
    std::string error;
    ASSERT_TRUE(ParseDenominations("1000x4,500x1,0.5x12", &notes, &error)) << error;
    ASSERT_EQ(notes.size(), 3U);
    EXPECT_DOUBLE_EQ(notes[0].denomination, 1000.0);
    EXPECT_EQ(notes[0].count, 4);
    EXPECT_DOUBLE_EQ(notes[2].denomination, 0.5);
    EXPECT_EQ(notes[2].count, 12);

    ASSERT_TRUE(ParseDenominations("", &notes, &error));
    EXPECT_TRUE(notes.empty());
    EXPECT_FALSE(ParseDenominations("1000*4", &notes, &error));
    EXPECT_NE(error.find("1000*4"), std::string::npos);
    EXPECT_FALSE(ParseDenominations("1000x1.5", &notes, &error));
    EXPECT_FALSE(ParseDenominations("1000x-1", &notes, &error));
    EXPECT_FALSE(ParseDenominations("1000x4,", &notes, &error));
}

}  // namespace coop_ledger::apps
