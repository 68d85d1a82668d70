#include <cctype>
#include <cstdint>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "crypto/codec.hpp"
#include "crypto/det_rng.hpp"

using namespace codec;

static std::vector<std::uint8_t> bytes_of(const std::string &s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

TEST(Crc32, CheckValue)
{
    EXPECT_EQ(crc32(bytes_of("123456789")), 0xCBF43926u);
    EXPECT_EQ(crc32(bytes_of("")), 0u);
}

TEST(Crc32, SingleBitFlipChangesValue)
{
    auto a = bytes_of("Hello, World!");
    auto b = a;
    b[3] ^= 0x01;
    EXPECT_NE(crc32(a), crc32(b));
}

TEST(Base64, KnownVectors)
{
    EXPECT_EQ(base64_encode(bytes_of("")), "");
    EXPECT_EQ(base64_encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");
    EXPECT_EQ(base64_encode(bytes_of("Hello, World!")), "SGVsbG8sIFdvcmxkIQ==");
}

TEST(Base64, DecodeBinary)
{
    std::vector<std::uint8_t> all(256);
    for (std::size_t i = 0; i < all.size(); ++i)
        all[i] = static_cast<std::uint8_t>(i);

    std::vector<std::uint8_t> back;
    ASSERT_TRUE(base64_decode(base64_encode(all), back));
    EXPECT_EQ(back, all);
    EXPECT_EQ(base64_encoded_len(all.size()), base64_encode(all).size());
}

TEST(Base64, RejectsMalformed)
{
    std::vector<std::uint8_t> out;
    EXPECT_FALSE(base64_decode("not base64!", out));
    EXPECT_FALSE(base64_decode("Zm9v!", out));    // trailing garbage
    EXPECT_FALSE(base64_decode("Zg", out));       // padding required
    EXPECT_FALSE(base64_decode("SGVs bG8=", out));  // no whitespace
    EXPECT_TRUE(out.empty());
}

TEST(MessageId, SixteenLowerHexAndFresh)
{
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i)
    {
        const std::string id = random_message_id();
        ASSERT_EQ(id.size(), 16u);
        for (char c : id)
            EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)) &&
                        !std::isupper(static_cast<unsigned char>(c)));
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 32u);
}

TEST(DetRng, SameSeedSameStream)
{
    DetRng a(42), b(42), c(43);
    bool   differs = false;
    // cross several refill blocks
    for (int i = 0; i < 200; ++i)
    {
        const std::uint64_t va = a.next_u64();
        EXPECT_EQ(va, b.next_u64());
        if (va != c.next_u64())
            differs = true;
    }
    EXPECT_TRUE(differs);
}

TEST(DetRng, UniformStaysInRange)
{
    DetRng rng(7);
    std::vector<int> hits(10, 0);
    for (int i = 0; i < 5000; ++i)
    {
        const std::uint64_t v = rng.uniform(10);
        ASSERT_LT(v, 10u);
        hits[v]++;
    }
    for (int h : hits)
        EXPECT_GT(h, 300);  // ~500 expected per bucket
    EXPECT_EQ(rng.uniform(1), 0u);

    for (int i = 0; i < 1000; ++i)
    {
        const double u = rng.unit();
        ASSERT_GE(u, 0.0);
        ASSERT_LT(u, 1.0);
    }
}
