#include <gtest/gtest.h>

#include "schnorr.hpp"
#include "test_utils.hpp"

namespace
{

const std::string ZERO32(64, '0');
const std::string SECRET_3 =
    "0000000000000000000000000000000000000000000000000000000000000003";

} // namespace

TEST(SchnorrTest, PublicKeyFromSecret)
{
    ASSIGN_OR_FAIL(std::string pk, schnorr::publicKeyFor(SECRET_3));
    EXPECT_EQ(pk,
              "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9");
}

TEST(SchnorrTest, KnownSignature)
{
    ASSIGN_OR_FAIL(std::string sig, schnorr::sign(SECRET_3, ZERO32,
                                                  std::vector<unsigned char>(32, 0)));
    EXPECT_EQ(sig,
              "e907831f80848d1069a5371b402410364bdf1c5f8307b0084c55f1ce2dca8215"
              "25f66a4a85ea8b71e482a74f382d2ce5ebeee8fdb2172f477df4900d310536c0");
    EXPECT_TRUE(schnorr::verify(
        "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9",
        ZERO32, sig));
}

TEST(SchnorrTest, SignAndVerify)
{
    ASSIGN_OR_FAIL(std::string sk, schnorr::generateSecret());
    ASSIGN_OR_FAIL(std::string pk, schnorr::publicKeyFor(sk));
    const std::string msg =
        "243f6a8885a308d313198a2e03707344a4093822299f31d0082efa98ec4e6c89";
    ASSIGN_OR_FAIL(std::string sig, schnorr::sign(sk, msg));
    EXPECT_TRUE(schnorr::verify(pk, msg, sig));

    std::string bad = sig;
    bad[10] = bad[10] == '0' ? '1' : '0';
    EXPECT_FALSE(schnorr::verify(pk, msg, bad));
    EXPECT_FALSE(schnorr::verify(pk, ZERO32, sig));
}

TEST(SchnorrTest, RejectsOutOfRangeSecret)
{
    EXPECT_FALSE(schnorr::publicKeyFor(ZERO32).has_value());
    EXPECT_FALSE(schnorr::publicKeyFor(
                     "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")
                     .has_value());
    EXPECT_FALSE(schnorr::publicKeyFor("abcd").has_value());
}
