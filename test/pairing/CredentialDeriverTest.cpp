#include "pairing/CredentialDeriver.h"
#include <cctype>
#include <gtest/gtest.h>
#include <set>

using namespace pairing;

namespace
{
const Fingerprint fingerprintA = {0xE7, 0x3B, 0x38, 0x46, 0x1A, 0x5D, 0x88, 0xB0, 0xC4, 0x2E, 0x9F, 0x7A, 0x1D,
    0x6C, 0x3E, 0x8B, 0x5F, 0x4A, 0x9D, 0x2C, 0x7E, 0x1B, 0x6F, 0x3A, 0x8D, 0x5C, 0x2E, 0x9B, 0x4F, 0x7A, 0x1C,
    0x3D};

Fingerprint sequentialFingerprint()
{
    Fingerprint fingerprint;
    for (size_t i = 0; i < fingerprint.size(); ++i)
    {
        fingerprint[i] = static_cast<uint8_t>(i);
    }
    return fingerprint;
}
} // namespace

TEST(CredentialDeriverTest, knownCredentials)
{
    const auto credentials = CredentialDeriver::deriveCredentials(fingerprintA);
    EXPECT_EQ("RCSMqw", credentials.ufrag);
    EXPECT_EQ("Chi4g1ImbgvbE1sssTUb8XGW", credentials.pwd);

    const auto other = CredentialDeriver::deriveCredentials(sequentialFingerprint());
    EXPECT_EQ("yBo2uQ", other.ufrag);
    EXPECT_EQ("j4iaQjXwWSfbfkbOYGPvpSEH", other.pwd);
}

TEST(CredentialDeriverTest, credentialsAreDeterministicAndUrlSafe)
{
    const auto first = CredentialDeriver::deriveCredentials(fingerprintA);
    const auto second = CredentialDeriver::deriveCredentials(fingerprintA);
    EXPECT_EQ(first, second);
    ASSERT_EQ(6u, first.ufrag.size());
    ASSERT_EQ(24u, first.pwd.size());

    std::set<std::string> ufrags;
    for (int i = 0; i < 64; ++i)
    {
        auto fingerprint = fingerprintA;
        fingerprint[31] = static_cast<uint8_t>(i);
        const auto credentials = CredentialDeriver::deriveCredentials(fingerprint);
        ufrags.insert(credentials.ufrag);
        for (char c : credentials.ufrag + credentials.pwd)
        {
            EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') << c;
        }
    }
    EXPECT_GT(ufrags.size(), 60u);
}

TEST(CredentialDeriverTest, compareIsUnsignedLexicographic)
{
    auto low = fingerprintA;
    auto high = fingerprintA;
    low[7] = 0x10;
    high[7] = 0xF0;

    EXPECT_EQ(1, CredentialDeriver::compareFingerprints(high, low));
    EXPECT_EQ(-1, CredentialDeriver::compareFingerprints(low, high));
    EXPECT_EQ(0, CredentialDeriver::compareFingerprints(low, low));

    low[0] = 0x7F;
    high[0] = 0x80;
    high[7] = 0x00;
    EXPECT_EQ(1, CredentialDeriver::compareFingerprints(high, low));
}

TEST(CredentialDeriverTest, sessionId)
{
    EXPECT_EQ("9374554709566333208", CredentialDeriver::generateSessionId(fingerprintA));
    EXPECT_EQ("7137586562153591654", CredentialDeriver::generateSessionId(sequentialFingerprint()));
}

TEST(CredentialDeriverTest, sasIsSymmetric)
{
    const auto other = sequentialFingerprint();
    const auto sas = CredentialDeriver::generateSas(fingerprintA, other);
    EXPECT_EQ("1285", sas);
    EXPECT_EQ(sas, CredentialDeriver::generateSas(other, fingerprintA));

    auto third = other;
    third[31] = 0xFF;
    const auto sasThird = CredentialDeriver::generateSas(fingerprintA, third);
    EXPECT_EQ(4u, sasThird.size());
    EXPECT_EQ(sasThird, CredentialDeriver::generateSas(third, fingerprintA));
}

TEST(CredentialDeriverTest, formatFingerprint)
{
    const auto text = CredentialDeriver::formatFingerprint(fingerprintA);
    EXPECT_EQ(95u, text.size());
    EXPECT_EQ("E7:3B:38:46:1A:5D:88:B0:C4:2E:9F:7A:1D:6C:3E:8B:5F:4A:9D:2C:7E:1B:6F:3A:8D:5C:2E:9B:4F:7A:1C:3D", text);
}
