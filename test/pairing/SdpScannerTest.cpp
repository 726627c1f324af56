#include "pairing/PacketCodec.h"
#include "pairing/PairingErrors.h"
#include "pairing/SdpScanner.h"
#include <gtest/gtest.h>

using namespace pairing;

namespace
{
const char* const chromeOffer =
    "v=0\r\n"
    "o=- 2750483185240431612 2 IN IP4 127.0.0.1\r\n"
    "s=-\r\n"
    "t=0 0\r\n"
    "a=group:BUNDLE 0\r\n"
    "a=extmap-allow-mixed\r\n"
    "a=msid-semantic: WMS\r\n"
    "m=application 56231 UDP/DTLS/SCTP webrtc-datachannel\r\n"
    "c=IN IP4 203.0.113.45\r\n"
    "a=candidate:2054585653 1 udp 2122260223 192.168.1.100 56231 typ host generation 0 network-id 1\r\n"
    "a=candidate:3405283124 1 tcp 1518280447 192.168.1.100 9 typ host tcptype active generation 0\r\n"
    "a=candidate:842163049 1 udp 1686052607 203.0.113.45 56231 typ srflx raddr 192.168.1.100 rport 56231\r\n"
    "a=candidate:1116254117 1 udp 41885439 198.51.100.1 3478 typ relay raddr 203.0.113.45 rport 56231\r\n"
    "a=ice-ufrag:ABCD\r\n"
    "a=ice-pwd:abcdefghijklmnopqrstuvwx\r\n"
    "a=ice-options:trickle\r\n"
    "a=fingerprint:sha-256 "
    "A1:B2:C3:D4:E5:F6:07:18:29:3A:4B:5C:6D:7E:8F:90:01:12:23:34:45:56:67:78:89:9A:AB:BC:CD:DE:EF:F0\r\n"
    "a=setup:actpass\r\n"
    "a=mid:0\r\n"
    "a=sctp-port:5000\r\n"
    "a=max-message-size:262144\r\n";

const char* const firefoxOffer =
    "v=0\r\n"
    "o=mozilla...THIS_IS_SDPARTA-128.0 7891234567890123456 0 IN IP4 0.0.0.0\r\n"
    "s=-\r\n"
    "t=0 0\r\n"
    "a=fingerprint:SHA-256 "
    "99:88:77:66:55:44:33:22:11:00:ff:ee:dd:cc:bb:aa:12:34:56:78:9a:bc:de:f0:fe:dc:ba:98:76:54:32:10\r\n"
    "a=group:BUNDLE 0\r\n"
    "a=ice-options:trickle\r\n"
    "m=application 54321 UDP/DTLS/SCTP webrtc-datachannel\r\n"
    "c=IN IP4 203.0.113.99\r\n"
    "a=candidate:0 1 UDP 2122252543 192.168.1.105 54321 typ host\r\n"
    "a=candidate:1 1 UDP 2122218495 2001:db8::1 54322 typ host\r\n"
    "a=candidate:2 1 UDP 1686052863 203.0.113.99 54321 typ srflx raddr 192.168.1.105 rport 54321\r\n"
    "a=candidate:3 1 UDP 2122252543 6a7c1f0e-2b4d-4e8a-9c3f-1d2e3f4a5b6c.local 54323 typ host\r\n"
    "a=end-of-candidates\r\n"
    "a=ice-pwd:abcdefghijklmnopqrstuv\r\n"
    "a=ice-ufrag:abc1\r\n"
    "a=mid:0\r\n"
    "a=sctp-port:5000\r\n"
    "a=setup:actpass\r\n";
} // namespace

TEST(SdpScannerTest, fingerprintFromChrome)
{
    const Fingerprint expected = {0xA1, 0xB2, 0xC3, 0xD4, 0xE5, 0xF6, 0x07, 0x18, 0x29, 0x3A, 0x4B, 0x5C, 0x6D,
        0x7E, 0x8F, 0x90, 0x01, 0x12, 0x23, 0x34, 0x45, 0x56, 0x67, 0x78, 0x89, 0x9A, 0xAB, 0xBC, 0xCD, 0xDE, 0xEF,
        0xF0};
    EXPECT_EQ(expected, SdpScanner::extractFingerprint(chromeOffer));
}

TEST(SdpScannerTest, fingerprintIsCaseInsensitive)
{
    const auto fingerprint = SdpScanner::extractFingerprint(firefoxOffer);
    EXPECT_EQ(0x99, fingerprint[0]);
    EXPECT_EQ(0xFF, fingerprint[10]);
    EXPECT_EQ(0x10, fingerprint[31]);
}

TEST(SdpScannerTest, missingOrShortFingerprint)
{
    try
    {
        SdpScanner::extractFingerprint("v=0\r\na=fingerprint:sha-1 AA:BB\r\n");
        FAIL();
    }
    catch (const SdpError& e)
    {
        EXPECT_EQ("No SHA-256 fingerprint found in session description", e.getMessage());
    }

    try
    {
        SdpScanner::extractFingerprint("v=0\r\na=fingerprint:sha-256 AA:BB:CC\r\n");
        FAIL();
    }
    catch (const SdpError& e)
    {
        EXPECT_EQ("Invalid fingerprint length: expected 64 hex chars, got 6", e.getMessage());
    }
}

TEST(SdpScannerTest, candidatesFromChrome)
{
    const auto candidates = SdpScanner::extractCandidates(chromeOffer);
    ASSERT_EQ(3u, candidates.size());

    EXPECT_EQ(Candidate("192.168.1.100", 56231, Candidate::Type::HOST, Candidate::Protocol::UDP), candidates[0]);
    EXPECT_EQ(Candidate("192.168.1.100", 9, Candidate::Type::HOST, Candidate::TcpType::ACTIVE), candidates[1]);
    EXPECT_EQ(Candidate("203.0.113.45", 56231, Candidate::Type::SRFLX, Candidate::Protocol::UDP), candidates[2]);
}

TEST(SdpScannerTest, candidatesFromFirefox)
{
    const auto candidates = SdpScanner::extractCandidates(firefoxOffer);
    ASSERT_EQ(4u, candidates.size());

    EXPECT_EQ(Candidate::Protocol::UDP, candidates[0].protocol);
    EXPECT_EQ(AddressFamily::IPV6, candidates[1].getAddressFamily());
    EXPECT_EQ("2001:db8::1", candidates[1].ip);
    EXPECT_EQ(Candidate::Type::SRFLX, candidates[2].type);
    EXPECT_EQ(AddressFamily::MDNS, candidates[3].getAddressFamily());
    EXPECT_EQ(54323, candidates[3].port);
}

TEST(SdpScannerTest, parseCandidateLine)
{
    Candidate candidate;
    ASSERT_TRUE(SdpScanner::parseCandidateLine("candidate:1 1 tcp 1518280447 10.0.0.5 9 typ host", candidate));
    EXPECT_EQ(Candidate::Protocol::TCP, candidate.protocol);
    ASSERT_TRUE(candidate.tcpType.isSet());
    EXPECT_EQ(Candidate::TcpType::PASSIVE, candidate.tcpType.get());

    ASSERT_TRUE(SdpScanner::parseCandidateLine("a=candidate:1 1 TCP 1 10.0.0.5 9 typ host tcptype so", candidate));
    ASSERT_TRUE(candidate.tcpType.isSet());
    EXPECT_EQ(Candidate::TcpType::SO, candidate.tcpType.get());

    EXPECT_FALSE(SdpScanner::parseCandidateLine("candidate:1 1 udp 1 10.0.0.5 70000 typ host", candidate));
    EXPECT_FALSE(SdpScanner::parseCandidateLine("candidate:1 1 udp 1 10.0.0.5 0 typ host", candidate));
    EXPECT_FALSE(SdpScanner::parseCandidateLine("candidate:1 1 sctp 1 10.0.0.5 5000 typ host", candidate));
    EXPECT_FALSE(SdpScanner::parseCandidateLine("candidate:1 1 udp 1 10.0.0.5 5000 typ prflx", candidate));
    EXPECT_FALSE(SdpScanner::parseCandidateLine("candidate:1 1 udp 1 10.0.0.5 5000 type host", candidate));
    EXPECT_FALSE(SdpScanner::parseCandidateLine("candidate:1 1 udp 1 10.0.0.5", candidate));
    EXPECT_FALSE(SdpScanner::parseCandidateLine("", candidate));
}

TEST(SdpScannerTest, iceCredentials)
{
    const auto credentials = SdpScanner::extractIceCredentials(firefoxOffer);
    ASSERT_TRUE(credentials.isSet());
    EXPECT_EQ("abc1", credentials.get().ufrag);
    EXPECT_EQ("abcdefghijklmnopqrstuv", credentials.get().pwd);

    EXPECT_FALSE(SdpScanner::extractIceCredentials("v=0\r\na=ice-ufrag:abc1\r\n").isSet());
}

TEST(SdpScannerTest, replaceIceCredentialsKeepsEverythingElse)
{
    IceCredentials replacement;
    replacement.ufrag = "RCSMqw";
    replacement.pwd = "Chi4g1ImbgvbE1sssTUb8XGW";

    const std::string original = chromeOffer;
    const auto patched = SdpScanner::replaceIceCredentials(original, replacement);

    const auto credentials = SdpScanner::extractIceCredentials(patched);
    ASSERT_TRUE(credentials.isSet());
    EXPECT_EQ(replacement, credentials.get());

    std::string expected = original;
    expected.replace(expected.find("a=ice-ufrag:ABCD"), std::string("a=ice-ufrag:ABCD").size(), "a=ice-ufrag:RCSMqw");
    expected.replace(expected.find("a=ice-pwd:abcdefghijklmnopqrstuvwx"),
        std::string("a=ice-pwd:abcdefghijklmnopqrstuvwx").size(),
        "a=ice-pwd:Chi4g1ImbgvbE1sssTUb8XGW");
    EXPECT_EQ(expected, patched);
}

TEST(SdpScannerTest, replaceIceCredentialsWithBareNewlines)
{
    IceCredentials replacement;
    replacement.ufrag = "uuuu";
    replacement.pwd = "pppppppppppppppppppppp";

    EXPECT_EQ("v=0\na=ice-ufrag:uuuu\na=ice-pwd:pppppppppppppppppppppp",
        SdpScanner::replaceIceCredentials("v=0\na=ice-ufrag:old\na=ice-pwd:oldpassword", replacement));
}

TEST(SdpScannerTest, tcpWithoutKnownSubtypeSurvivesPacketEncoding)
{
    const Fingerprint fingerprint = {0x01, 0x02, 0x03};

    for (const char* line : {"candidate:1 1 tcp 1 10.0.0.1 9 typ host",
             "candidate:1 1 tcp 1 10.0.0.1 9 typ host tcptype unknown"})
    {
        Candidate candidate;
        ASSERT_TRUE(SdpScanner::parseCandidateLine(line, candidate));
        ASSERT_TRUE(candidate.tcpType.isSet());
        EXPECT_EQ(Candidate("10.0.0.1", 9, Candidate::Type::HOST, Candidate::Protocol::TCP), candidate);

        const auto packet = PacketCodec::decode(PacketCodec::encode(fingerprint, {candidate}));
        ASSERT_EQ(1u, packet.candidates.size());
        EXPECT_EQ(candidate, packet.candidates[0]);
    }

    Candidate udp;
    ASSERT_TRUE(SdpScanner::parseCandidateLine("candidate:1 1 udp 1 10.0.0.1 9 typ host", udp));
    EXPECT_FALSE(udp.tcpType.isSet());
}
