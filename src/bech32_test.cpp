#include <gtest/gtest.h>

#include "bech32.hpp"

TEST(Bech32Test, PublicKey)
{
    const std::string hex =
        "3bf0c63fcb93463407af97a5e5ee64fa883d107ef9e558472c4eb9aaaefa459d";
    const std::string npub =
        "npub180cvv07tjdrrgpa0j7j7tmnyl2yr6yr7l8j4s3evf6u64th6gkwsyjh6w6";
    EXPECT_EQ(bech32::encodeHex("npub", hex), npub);
    auto back = bech32::decodeHex("npub", npub);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, hex);
}

TEST(Bech32Test, SecretKey)
{
    auto hex = bech32::decodeHex(
        "nsec", "nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe5");
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(*hex,
              "67dea2ed018072d675f5415ecfaed7d2597555e202d85b3d65ea4e58d2d92ffa");
}

TEST(Bech32Test, RejectsBadInput)
{
    // Last character changed.
    EXPECT_FALSE(bech32::decode(
        "npub180cvv07tjdrrgpa0j7j7tmnyl2yr6yr7l8j4s3evf6u64th6gkwsyjh6w7"));
    // Wrong prefix.
    EXPECT_FALSE(bech32::decodeHex(
        "note", "npub180cvv07tjdrrgpa0j7j7tmnyl2yr6yr7l8j4s3evf6u64th6gkwsyjh6w6"));
    // Mixed case.
    EXPECT_FALSE(bech32::decode(
        "Npub180cvv07tjdrrgpa0j7j7tmnyl2yr6yr7l8j4s3evf6u64th6gkwsyjh6w6"));
    EXPECT_FALSE(bech32::decode("nothing"));
}

TEST(Bech32Test, UpperCaseIsAccepted)
{
    auto d = bech32::decode(
        "NPUB180CVV07TJDRRGPA0J7J7TMNYL2YR6YR7L8J4S3EVF6U64TH6GKWSYJH6W6");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->hrp, "npub");
    EXPECT_EQ(d->data.size(), 32);
}
