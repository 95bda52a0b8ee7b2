#include <map>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <mw/crypto.hpp>
#include <mw/crypto_mock.hpp>

#include "http_signature.hpp"
#include "test_utils.hpp"

using ::testing::_;
using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Not;
using ::testing::Return;
using ::testing::StartsWith;

TEST(HttpSignatureTest, ParsesSignatureHeader)
{
    ASSIGN_OR_FAIL(auto params, http_signature::parseSignatureHeader(
        R"(keyId="https://remote.example/users/a#main-key",algorithm="rsa-sha256",headers="(request-target) Host date digest",signature="c2ln")"));
    EXPECT_EQ(params.key_id, "https://remote.example/users/a#main-key");
    EXPECT_EQ(params.algorithm, "rsa-sha256");
    EXPECT_EQ(params.headers, (std::vector<std::string>{
                "(request-target)", "host", "date", "digest"}));
    EXPECT_EQ(params.signature, (std::vector<unsigned char>{'s', 'i', 'g'}));
}

TEST(HttpSignatureTest, SignatureHeaderDefaultsToDate)
{
    ASSIGN_OR_FAIL(auto params, http_signature::parseSignatureHeader(
        R"(keyId="k",signature="c2ln")"));
    EXPECT_EQ(params.headers, std::vector<std::string>{"date"});
}

TEST(HttpSignatureTest, RejectsIncompleteHeaders)
{
    auto res = http_signature::parseSignatureHeader(R"(signature="c2ln")");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::INVALID_INPUT);
    EXPECT_FALSE(http_signature::parseSignatureHeader(
        R"(keyId="k",headers="",signature="c2ln")").has_value());
}

TEST(HttpSignatureTest, SigningString)
{
    std::map<std::string, std::string> headers = {
        {"host", "bridge.example"}, {"date", "Tue, 14 Nov 2023 22:13:20 GMT"}};
    auto lookup = [&](const std::string& name) -> std::optional<std::string>
    {
        auto it = headers.find(name);
        if(it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    };
    ASSIGN_OR_FAIL(std::string s, http_signature::signingString(
        {"(request-target)", "host", "date"}, "POST", "/inbox", lookup));
    EXPECT_EQ(s, "(request-target): post /inbox\n"
              "host: bridge.example\n"
              "date: Tue, 14 Nov 2023 22:13:20 GMT");

    auto missing = http_signature::signingString(
        {"(request-target)", "digest"}, "POST", "/inbox", lookup);
    EXPECT_FALSE(missing.has_value());
}

TEST(HttpSignatureTest, KeyOwner)
{
    EXPECT_EQ(http_signature::keyOwner("https://a.example/u/b#main-key"),
              "https://a.example/u/b");
    EXPECT_EQ(http_signature::keyOwner("https://a.example/u/b"),
              "https://a.example/u/b");
}

TEST(HttpSignatureTest, Digest)
{
    ASSIGN_OR_FAIL(std::string digest, http_signature::digestHeader("hello"));
    EXPECT_EQ(digest, "SHA-256=LPJNul+wow4m6DsqxbninhsWHlwfp0JecwQzYpOLmCQ=");
}

TEST(HttpSignatureTest, SignsPostOverDigest)
{
    NiceMock<mw::CryptoMock> crypto;
    EXPECT_CALL(crypto, sign(_, "PRIVATE",
                             StartsWith("(request-target): post /users/a/inbox\n"
                                        "host: remote.example:8443\ndate: ")))
        .WillOnce(Return(std::vector<unsigned char>{'s', 'i', 'g'}));

    mw::HTTPRequest req("https://remote.example:8443/users/a/inbox");
    auto res = http_signature::signRequest(
        req, "POST", "https://remote.example:8443/users/a/inbox", "{}",
        "https://bridge.example/users/npub1x#main-key", "PRIVATE", crypto);
    ASSERT_TRUE(res.has_value()) << errorMsg(res.error());
}

TEST(HttpSignatureTest, SignsGetWithoutDigest)
{
    NiceMock<mw::CryptoMock> crypto;
    EXPECT_CALL(crypto, sign(_, "PRIVATE", AllOf(
        StartsWith("(request-target): get /notes/1?page=2\nhost: remote.example\n"),
        Not(HasSubstr("digest")))))
        .WillOnce(Return(std::vector<unsigned char>{'s'}));

    mw::HTTPRequest req("https://remote.example/notes/1?page=2");
    auto res = http_signature::signRequest(
        req, "GET", "https://remote.example/notes/1?page=2", "",
        "https://bridge.example/actor#main-key", "PRIVATE", crypto);
    ASSERT_TRUE(res.has_value()) << errorMsg(res.error());
}

TEST(HttpSignatureTest, SignatureFailureIsReported)
{
    NiceMock<mw::CryptoMock> crypto;
    EXPECT_CALL(crypto, sign(_, _, _))
        .WillOnce(Return(std::unexpected(mw::runtimeError("bad key"))));
    mw::HTTPRequest req("https://remote.example/inbox");
    auto res = http_signature::signRequest(
        req, "POST", "https://remote.example/inbox", "{}", "k", "PRIVATE",
        crypto);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::INTERNAL);
}

TEST(HttpSignatureTest, RealKeysVerify)
{
    mw::Crypto crypto;
    ASSIGN_OR_FAIL(auto keys, crypto.generateKeyPair(mw::KeyType::RSA)
                   .transform_error(fromInternalError));
    const std::string to_sign = "(request-target): post /inbox\nhost: a\ndate: b";
    ASSIGN_OR_FAIL(auto sig, crypto.sign(mw::SignatureAlgorithm::RSA_V1_5_SHA256,
                                         keys.private_key, to_sign)
                   .transform_error(fromInternalError));
    ASSIGN_OR_FAIL(auto params, http_signature::parseSignatureHeader(
        R"(keyId="k",headers="(request-target) host date",signature=")" +
        mw::base64Encode(sig) + "\""));
    ASSIGN_OR_FAIL(bool valid, crypto.verifySignature(
        mw::SignatureAlgorithm::RSA_V1_5_SHA256, keys.public_key,
        params.signature, to_sign).transform_error(fromInternalError));
    EXPECT_TRUE(valid);
}
