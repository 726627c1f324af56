#include "utils/Base64.h"
#include <cstring>
#include <gtest/gtest.h>

TEST(Base64, encode)
{
    std::string text = "Hello base64 world!";
    std::string strResult = utils::Base64::encode(reinterpret_cast<const uint8_t*>(text.c_str()), text.size());

    EXPECT_STREQ(strResult.c_str(), "SGVsbG8gYmFzZTY0IHdvcmxkIQ==");
    EXPECT_EQ(utils::Base64::encodeLength(text.size()), strResult.size());
}

TEST(Base64, decode)
{
    std::string encoded = "SGVsbG8gYmFzZTY0IHdvcmxkIQ==";
    ASSERT_EQ(19u, utils::Base64::decodeLength(encoded));
    uint8_t result[19];

    auto s = utils::Base64::decode(encoded, result, sizeof(result));
    EXPECT_EQ(19u, s);
    EXPECT_EQ("Hello base64 world!", std::string(reinterpret_cast<const char*>(result), s));
}

TEST(Base64, urlAlphabetHasNoPadding)
{
    const uint8_t bytes[] = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ("+/+/", utils::Base64::encode(bytes, sizeof(bytes)));
    EXPECT_EQ("-_-_", utils::Base64::encode(bytes, sizeof(bytes), utils::Base64::Alphabet::URL));

    const uint8_t ab[] = {'a', 'b'};
    EXPECT_EQ("YWI=", utils::Base64::encode(ab, sizeof(ab)));
    EXPECT_EQ("YWI", utils::Base64::encode(ab, sizeof(ab), utils::Base64::Alphabet::URL));

    EXPECT_EQ(6u, utils::Base64::encodeLength(4, utils::Base64::Alphabet::URL));
    EXPECT_EQ(24u, utils::Base64::encodeLength(18, utils::Base64::Alphabet::URL));
    EXPECT_EQ(8u, utils::Base64::encodeLength(4));
}

TEST(Base64, decodeAcceptsBothAlphabets)
{
    uint8_t result[3];
    ASSERT_EQ(3u, utils::Base64::decode("-_-_", result, sizeof(result)));
    EXPECT_EQ(0xFB, result[0]);
    EXPECT_EQ(0xFF, result[1]);
    EXPECT_EQ(0xBF, result[2]);

    ASSERT_EQ(3u, utils::Base64::decode("+/+/", result, sizeof(result)));
    EXPECT_EQ(0xBF, result[2]);

    ASSERT_EQ(2u, utils::Base64::decode("YWI", result, sizeof(result)));
    EXPECT_EQ('a', result[0]);
    EXPECT_EQ('b', result[1]);
}

TEST(Base64, transcodeTest)
{
    uint8_t data[4096];
    for (size_t i = 0; i < sizeof(data); ++i)
    {
        data[i] = i;
    }

    for (auto alphabet : {utils::Base64::Alphabet::STANDARD, utils::Base64::Alphabet::URL})
    {
        std::string encoded = utils::Base64::encode(data, 4096, alphabet);
        uint8_t decoded[4096];
        EXPECT_EQ(sizeof(decoded), utils::Base64::decode(encoded, decoded, sizeof(decoded)));
        EXPECT_EQ(0, std::memcmp(data, decoded, sizeof(decoded)));
    }
}
