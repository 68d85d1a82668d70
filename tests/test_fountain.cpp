#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

#include "proto/fountain.hpp"

using namespace fountain;

static Bytes gen_bytes(std::size_t n)
{
    Bytes v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(i % 256);
    return v;
}

static Bytes bytes_of(const std::string &s)
{
    return Bytes(s.begin(), s.end());
}

// Feed next_part(0..) until the decoder completes; returns the parts used
static std::vector<Part> decode_until_complete(const Encoder &enc, Decoder &dec,
                                               std::size_t max_parts)
{
    std::vector<Part> used;
    for (std::size_t seq = 0; seq < max_parts && !dec.is_complete(); ++seq)
    {
        used.push_back(enc.next_part(seq));
        EXPECT_EQ(dec.receive_part(used.back()), qr::Errc::Ok);
    }
    return used;
}

TEST(Fountain, Split_PadsLastFragment)
{
    auto frags = split(bytes_of("abcdefghijk"), 4);
    ASSERT_EQ(frags.size(), 3u);
    EXPECT_EQ(frags[0], bytes_of("abcd"));
    EXPECT_EQ(frags[1], bytes_of("efgh"));
    EXPECT_EQ(frags[2], (Bytes{'i', 'j', 'k', 0}));
    EXPECT_TRUE(split(bytes_of("abc"), 0).empty());
}

TEST(Fountain, XorInto)
{
    Bytes a{0xFF, 0x00, 0xAA};
    xor_into(a, Bytes{0xFF, 0xFF, 0x55});
    EXPECT_EQ(a, (Bytes{0x00, 0xFF, 0xFF}));
}

TEST(Fountain, SampleDegree_ClippedAndBiasedLow)
{
    codec::DetRng rng(1234);
    EXPECT_EQ(sample_degree(rng, 0), 0u);
    for (int i = 0; i < 200; ++i)
        ASSERT_EQ(sample_degree(rng, 1), 1u);
    for (int i = 0; i < 200; ++i)
        ASSERT_LE(sample_degree(rng, 2), 2u);

    std::vector<int> hist(MAX_DEGREE + 1, 0);
    const int        n = 20000;
    for (int i = 0; i < n; ++i)
    {
        const std::size_t d = sample_degree(rng, 1000);
        ASSERT_GE(d, 1u);
        ASSERT_LE(d, MAX_DEGREE);
        hist[d]++;
    }
    EXPECT_NEAR(hist[1] / double(n), 0.50, 0.03);
    EXPECT_NEAR(hist[2] / double(n), 0.30, 0.03);
    EXPECT_NEAR(hist[3] / double(n), 0.15, 0.02);
    int high = 0;
    for (std::size_t d = 4; d <= MAX_DEGREE; ++d)
        high += hist[d];
    EXPECT_NEAR(high / double(n), 0.05, 0.015);
}

TEST(Fountain, ChooseFragments_DistinctSorted)
{
    codec::DetRng rng(99);
    for (int i = 0; i < 500; ++i)
    {
        auto idx = choose_fragments(rng, 5);
        ASSERT_FALSE(idx.empty());
        ASSERT_TRUE(std::is_sorted(idx.begin(), idx.end()));
        ASSERT_EQ(std::adjacent_find(idx.begin(), idx.end()), idx.end());
        ASSERT_LT(idx.back(), 5u);
    }
}

TEST(Fountain, Encoder_RejectsDegenerateInput)
{
    EXPECT_FALSE(Encoder::create(Bytes{}, 10).has_value());
    EXPECT_FALSE(Encoder::create(gen_bytes(10), 0).has_value());

    auto enc = Encoder::create(gen_bytes(25), 10);
    ASSERT_TRUE(enc.has_value());
    EXPECT_EQ(enc->fragment_count(), 3u);
    EXPECT_EQ(enc->fragment_size(), 10u);
    EXPECT_EQ(enc->message_len(), 25u);
}

TEST(Fountain, NextPart_DeterministicAndConsistent)
{
    const Bytes msg   = gen_bytes(95);
    auto        enc   = Encoder::create(msg, 10, /*seed=*/0xDEADBEEF);
    auto        frags = split(msg, 10);
    ASSERT_TRUE(enc.has_value());

    for (std::size_t seq = 0; seq < 100; ++seq)
    {
        const Part a = enc->next_part(seq);
        const Part b = enc->next_part(seq);
        ASSERT_EQ(a.indexes, b.indexes);
        ASSERT_EQ(a.data, b.data);
        ASSERT_FALSE(a.indexes.empty());

        Bytes expect(10, 0);
        for (std::size_t i : a.indexes)
            xor_into(expect, frags[i]);
        ASSERT_EQ(a.data, expect);
    }

    // same seed, separate instance: identical symbols
    auto twin = Encoder::create(msg, 10, 0xDEADBEEF);
    EXPECT_EQ(twin->next_part(17).indexes, enc->next_part(17).indexes);
    EXPECT_EQ(twin->next_part(17).data, enc->next_part(17).data);
}

TEST(Fountain, Roundtrip_Short)
{
    const Bytes msg = bytes_of("Hello, World! This is a test message for fountain codes.");
    auto        enc = Encoder::create(msg, 10);
    ASSERT_TRUE(enc.has_value());

    Decoder dec(enc->fragment_count(), enc->message_len());
    decode_until_complete(*enc, dec, 5000);
    ASSERT_TRUE(dec.is_complete());
    EXPECT_TRUE(dec.can_decode());
    EXPECT_FLOAT_EQ(dec.progress(), 1.0f);

    Bytes out;
    ASSERT_EQ(dec.result(out), qr::Errc::Ok);
    EXPECT_EQ(out, msg);
}

TEST(Fountain, Roundtrip_SingleFragment)
{
    const Bytes msg = bytes_of("tiny");
    auto        enc = Encoder::create(msg, 100);
    ASSERT_TRUE(enc.has_value());
    ASSERT_EQ(enc->fragment_count(), 1u);

    Decoder dec(1, msg.size());
    ASSERT_EQ(dec.receive_part(enc->next_part(0)), qr::Errc::Ok);
    ASSERT_TRUE(dec.is_complete());
    Bytes out;
    ASSERT_EQ(dec.result(out), qr::Errc::Ok);
    EXPECT_EQ(out, msg);
}

TEST(Fountain, Roundtrip_2500Bytes_ForwardAndReverse)
{
    const Bytes msg = gen_bytes(2500);
    auto        enc = Encoder::create(msg, 10);
    ASSERT_TRUE(enc.has_value());
    ASSERT_EQ(enc->fragment_count(), 250u);

    Decoder fwd(250, 2500);
    auto    parts = decode_until_complete(*enc, fwd, 50000);
    ASSERT_TRUE(fwd.is_complete()) << "not complete after " << parts.size() << " parts";
    Bytes out_fwd;
    ASSERT_EQ(fwd.result(out_fwd), qr::Errc::Ok);
    EXPECT_EQ(out_fwd, msg);

    // the same N parts, last first
    Decoder rev(250, 2500);
    for (auto it = parts.rbegin(); it != parts.rend(); ++it)
        ASSERT_EQ(rev.receive_part(*it), qr::Errc::Ok);
    ASSERT_TRUE(rev.is_complete());
    Bytes out_rev;
    ASSERT_EQ(rev.result(out_rev), qr::Errc::Ok);
    EXPECT_EQ(out_rev, msg);
}

TEST(Fountain, OrderIndependence_Shuffled)
{
    const Bytes msg = gen_bytes(777);
    auto        enc = Encoder::create(msg, 16);
    ASSERT_TRUE(enc.has_value());

    Decoder ref(enc->fragment_count(), msg.size());
    auto    parts = decode_until_complete(*enc, ref, 20000);
    ASSERT_TRUE(ref.is_complete());

    std::mt19937 g(2024);
    for (int round = 0; round < 5; ++round)
    {
        std::shuffle(parts.begin(), parts.end(), g);
        Decoder dec(enc->fragment_count(), msg.size());
        for (const auto &p : parts)
            ASSERT_EQ(dec.receive_part(p), qr::Errc::Ok);
        ASSERT_TRUE(dec.is_complete());
        Bytes out;
        ASSERT_EQ(dec.result(out), qr::Errc::Ok);
        EXPECT_EQ(out, msg);
    }
}

TEST(Fountain, LossTolerance_SkipEvenSeq)
{
    const Bytes msg = bytes_of("Testing fountain codes with simulated packet loss");
    auto        enc = Encoder::create(msg, 5);
    ASSERT_TRUE(enc.has_value());

    Decoder     dec(enc->fragment_count(), msg.size());
    std::size_t delivered = 0;
    for (std::size_t seq = 0; seq < 10000 && !dec.is_complete(); ++seq)
    {
        if (seq % 2 == 0)
            continue;  // lost frame
        ASSERT_EQ(dec.receive_part(enc->next_part(seq)), qr::Errc::Ok);
        delivered++;
    }
    ASSERT_TRUE(dec.is_complete());
    EXPECT_GE(delivered, enc->fragment_count());
    Bytes out;
    ASSERT_EQ(dec.result(out), qr::Errc::Ok);
    EXPECT_EQ(out, msg);
}

TEST(Fountain, PeelingCascade)
{
    // fragments a=[1,2] b=[3,4] c=[5,6]
    Decoder dec(3, 6);
    ASSERT_EQ(dec.receive_part(Part{{0, 1}, {1 ^ 3, 2 ^ 4}}), qr::Errc::Ok);
    ASSERT_EQ(dec.receive_part(Part{{1, 2}, {3 ^ 5, 4 ^ 6}}), qr::Errc::Ok);
    EXPECT_EQ(dec.recovered_count(), 0u);
    EXPECT_EQ(dec.pending_count(), 2u);

    // one degree-1 part unlocks the whole chain
    ASSERT_EQ(dec.receive_part(Part{{2}, {5, 6}}), qr::Errc::Ok);
    EXPECT_TRUE(dec.is_complete());
    EXPECT_EQ(dec.pending_count(), 0u);

    Bytes out;
    ASSERT_EQ(dec.result(out), qr::Errc::Ok);
    EXPECT_EQ(out, (Bytes{1, 2, 3, 4, 5, 6}));
}

TEST(Fountain, Idempotence_Redelivery)
{
    Decoder dec(4, 8);
    Part    pair{{0, 3}, {9, 9}};
    ASSERT_EQ(dec.receive_part(pair), qr::Errc::Ok);
    ASSERT_EQ(dec.receive_part(pair), qr::Errc::Ok);
    EXPECT_EQ(dec.pending_count(), 1u);  // duplicate equation not queued twice

    Part single{{1}, {7, 8}};
    ASSERT_EQ(dec.receive_part(single), qr::Errc::Ok);
    auto before = dec.stats();
    ASSERT_EQ(dec.receive_part(single), qr::Errc::Ok);
    auto after = dec.stats();
    EXPECT_EQ(before.recovered_count, after.recovered_count);
    EXPECT_EQ(before.pending_parts, after.pending_parts);
    EXPECT_TRUE(dec.has_fragment(1));
    EXPECT_FALSE(dec.has_fragment(0));
}

TEST(Fountain, ResultBeforeComplete)
{
    Decoder dec(3, 30);
    Bytes   out;
    EXPECT_EQ(dec.result(out), qr::Errc::DecodingIncomplete);
    EXPECT_FLOAT_EQ(dec.progress(), 0.0f);
    EXPECT_FALSE(dec.can_decode());
}

TEST(Fountain, Decoder_RejectsBadParts)
{
    Decoder dec(3, 25);  // only fragment sizes 9..12 give K=3 for 25 bytes
    EXPECT_EQ(dec.receive_part(Part{{}, Bytes(10, 0)}), qr::Errc::InvalidData);
    EXPECT_EQ(dec.receive_part(Part{{3}, Bytes(10, 0)}), qr::Errc::InvalidData);
    EXPECT_EQ(dec.receive_part(Part{{1, 1}, Bytes(10, 0)}), qr::Errc::InvalidData);
    // 20 bytes per fragment would make K=2, not 3
    EXPECT_EQ(dec.receive_part(Part{{0}, Bytes(20, 0)}), qr::Errc::InvalidData);
    EXPECT_EQ(dec.fragment_size(), 0u);
    EXPECT_EQ(dec.recovered_count(), 0u);

    ASSERT_EQ(dec.receive_part(Part{{0}, Bytes(10, 1)}), qr::Errc::Ok);
    EXPECT_EQ(dec.fragment_size(), 10u);
    // size is fixed by the first accepted part
    EXPECT_EQ(dec.receive_part(Part{{1}, Bytes(9, 1)}), qr::Errc::InvalidData);
    EXPECT_EQ(dec.recovered_count(), 1u);
}

TEST(Fountain, Decoder_LearnsFragmentSizeFromParts)
{
    // ceil(21 / 3) == 7, but the sender used 10-byte fragments
    const Bytes msg = gen_bytes(21);
    auto        enc = Encoder::create(msg, 10);
    ASSERT_TRUE(enc.has_value());
    ASSERT_EQ(enc->fragment_count(), 3u);

    Decoder dec(3, 21);
    decode_until_complete(*enc, dec, 2000);
    ASSERT_TRUE(dec.is_complete());
    Bytes out;
    ASSERT_EQ(dec.result(out), qr::Errc::Ok);
    EXPECT_EQ(out, msg);
}

TEST(Fountain, Stats)
{
    auto enc = Encoder::create(bytes_of("Test"), 2);
    ASSERT_TRUE(enc.has_value());
    Decoder dec(enc->fragment_count(), 4);

    auto s = dec.stats();
    EXPECT_EQ(s.fragment_count, 2u);
    EXPECT_EQ(s.recovered_count, 0u);
    EXPECT_EQ(s.pending_parts, 0u);
    EXPECT_FALSE(s.is_complete);
    EXPECT_FLOAT_EQ(s.progress, 0.0f);
}
