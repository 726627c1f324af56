#include "utils/StringTokenizer.h"
#include <gtest/gtest.h>

using namespace utils;

TEST(StringTokenizerTest, tokenize)
{
    std::string data = "abc/defg/eh";

    StringTokenizer::Token token0 = StringTokenizer::tokenize(data.c_str(), data.length(), '/');
    EXPECT_EQ(3u, token0.length);
    EXPECT_EQ(data.c_str(), token0.start);
    EXPECT_EQ(&((data.c_str())[4]), token0.next);
    EXPECT_EQ(7u, token0.remainingLength);
    EXPECT_EQ('/', token0.delimiter);
    EXPECT_EQ("abc", token0.str());

    StringTokenizer::Token token1 = StringTokenizer::tokenize(token0, '/');
    EXPECT_EQ(token0.next, token1.start);
    EXPECT_EQ(2u, token1.remainingLength);
    EXPECT_EQ("defg", token1.str());

    StringTokenizer::Token token2 = StringTokenizer::tokenize(token1, '/');
    EXPECT_EQ("eh", token2.str());
    EXPECT_EQ(nullptr, token2.next);
    EXPECT_EQ(0u, token2.remainingLength);

    EXPECT_TRUE(StringTokenizer::tokenize(token2, '/').empty());
}

TEST(StringTokenizerTest, repeatedDelimitersYieldNoEmptyTokens)
{
    std::string data = "//a/b///////////";

    auto token0 = StringTokenizer::tokenize(data.c_str(), data.length(), '/');
    EXPECT_EQ(&((data.c_str())[2]), token0.start);
    EXPECT_EQ("a", token0.str());

    auto token1 = StringTokenizer::tokenize(token0, '/');
    EXPECT_EQ("b", token1.str());
    EXPECT_EQ(&((data.c_str())[6]), token1.next);

    auto token2 = StringTokenizer::tokenize(token1, '/');
    EXPECT_TRUE(token2.empty());
    EXPECT_EQ(0u, token2.length);
    EXPECT_EQ(nullptr, token2.next);
}

TEST(StringTokenizerTest, onlyDelimitersOrEmpty)
{
    std::string data = "\r\n\r\n";
    EXPECT_TRUE(StringTokenizer::tokenize(data.c_str(), data.length(), "\r\n").empty());

    std::string empty;
    EXPECT_TRUE(StringTokenizer::tokenize(empty.c_str(), empty.length(), '/').empty());
    EXPECT_EQ("", StringTokenizer::tokenize(empty.c_str(), empty.length(), '/').str());
}

TEST(StringTokenizerTest, sessionDescriptionLines)
{
    const std::string sdp = "v=0\r\na=mid:0\r\n\r\na=candidate:1 1 udp 5 10.0.0.1 9 typ host\n";

    std::vector<std::string> lines;
    for (auto line = StringTokenizer::tokenize(sdp.c_str(), sdp.size(), "\r\n"); !line.empty();
         line = StringTokenizer::tokenize(line, "\r\n"))
    {
        lines.push_back(line.str());
    }

    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ("v=0", lines[0]);
    EXPECT_EQ("a=mid:0", lines[1]);
    EXPECT_EQ("a=candidate:1 1 udp 5 10.0.0.1 9 typ host", lines[2]);

    auto field = StringTokenizer::tokenize(lines[2].c_str(), lines[2].size(), " \t");
    EXPECT_TRUE(StringTokenizer::startsWith(field, "a=candidate:"));
    field = StringTokenizer::tokenize(field, " \t");
    EXPECT_TRUE(StringTokenizer::isNumber(field));
}

TEST(StringTokenizerTest, comparisons)
{
    const std::string data = "UDP 2122260223 typ";
    auto protocol = StringTokenizer::tokenize(data.c_str(), data.size(), ' ');
    auto priority = StringTokenizer::tokenize(protocol, ' ');
    auto typ = StringTokenizer::tokenize(priority, ' ');

    EXPECT_FALSE(StringTokenizer::isEqual(protocol, "udp"));
    EXPECT_TRUE(StringTokenizer::isEqualIgnoreCase(protocol, "udp"));
    EXPECT_FALSE(StringTokenizer::isEqualIgnoreCase(protocol, "udp6"));
    EXPECT_TRUE(StringTokenizer::startsWithIgnoreCase(protocol, "ud"));
    EXPECT_FALSE(StringTokenizer::startsWith(protocol, "ud"));

    EXPECT_TRUE(StringTokenizer::isNumber(priority));
    EXPECT_FALSE(StringTokenizer::isNumber(protocol));
    EXPECT_TRUE(StringTokenizer::isEqual(typ, "typ"));
    EXPECT_FALSE(StringTokenizer::isNumber(StringTokenizer::tokenize(typ, ' ')));
}
