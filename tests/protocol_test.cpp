#include <string>

#include <gtest/gtest.h>

#include "scanport/net/protocol.hpp"
#include "test_support.hpp"

namespace net = scanport::net;
using scanport::core::StatusCode;
using scanport::test::view;

namespace {
    const std::string kFullConfig =
        R"({"apiKey":"a","productToken":"p","projectName":"n","requesterEmail":"e@x","userKey":"u","wssUrl":"https://w"})";
}

TEST(ProtocolMetadata, DecodesValid){
    net::TransferMetadata m{};
    std::string detail;
    const auto s = net::decode_metadata(view(R"({"chunkSize":4,"length":8})"), {}, &m, &detail);
    ASSERT_EQ(s.code, StatusCode::Ok) << detail;
    EXPECT_EQ(m.chunk_size, 4u);
    EXPECT_EQ(m.length, 8u);
}

TEST(ProtocolMetadata, ZeroLengthIsAllowed){
    net::TransferMetadata m{};
    std::string detail;
    ASSERT_EQ(net::decode_metadata(view(R"({"chunkSize":1,"length":0})"), {}, &m, &detail).code, StatusCode::Ok);
    EXPECT_EQ(m.length, 0u);
}

TEST(ProtocolMetadata, ChunkSizeLargerThanLengthIsAllowed){
    net::TransferMetadata m{};
    std::string detail;
    EXPECT_EQ(net::decode_metadata(view(R"({"chunkSize":4096,"length":5})"), {}, &m, &detail).code, StatusCode::Ok);
}

TEST(ProtocolMetadata, RejectsMalformed){
    const char* cases[] = {
        "not json",
        "[1,2]",
        R"({"length":8})",
        R"({"chunkSize":4})",
        R"({"chunkSize":"4","length":8})",
        R"({"chunkSize":4.5,"length":8})",
        R"({"chunkSize":0,"length":8})",
        R"({"chunkSize":-1,"length":8})",
        R"({"chunkSize":4,"length":-8})",
        R"({"chunkSize":4294967296,"length":8})",
    };
    for (const char* c : cases) {
        net::TransferMetadata m{};
        std::string detail;
        const auto s = net::decode_metadata(view(c), {}, &m, &detail);
        EXPECT_EQ(s.code, StatusCode::MalformedMetadata) << c;
        EXPECT_FALSE(detail.empty()) << c;
    }
}

TEST(ProtocolMetadata, EnforcesLimits){
    net::MetadataLimits limits{};
    limits.max_chunk_bytes = 1024;
    limits.max_archive_bytes = 4096;
    net::TransferMetadata m{};
    std::string detail;

    EXPECT_EQ(net::decode_metadata(view(R"({"chunkSize":2048,"length":10})"), limits, &m, &detail).code,
              StatusCode::MalformedMetadata);
    EXPECT_NE(detail.find("chunkSize"), std::string::npos);

    EXPECT_EQ(net::decode_metadata(view(R"({"chunkSize":16,"length":5000})"), limits, &m, &detail).code,
              StatusCode::MalformedMetadata);
    EXPECT_NE(detail.find("length"), std::string::npos);

    EXPECT_EQ(net::decode_metadata(view(R"({"chunkSize":1024,"length":4096})"), limits, &m, &detail).code,
              StatusCode::Ok);
}

TEST(ProtocolMetadata, EncodeRoundTrip){
    std::string body;
    ASSERT_EQ(net::encode_metadata({16, 1u << 20}, &body).code, StatusCode::Ok);
    net::TransferMetadata m{};
    std::string detail;
    ASSERT_EQ(net::decode_metadata(view(body), {}, &m, &detail).code, StatusCode::Ok);
    EXPECT_EQ(m.chunk_size, 16u);
    EXPECT_EQ(m.length, 1u << 20);
}

TEST(ProtocolConfig, DecodesMandatoryAndExtras){
    const std::string body =
        R"({"apiKey":"a","productToken":"p","projectName":"n","requesterEmail":"e@x","userKey":"u",)"
        R"("wssUrl":"https://w","extraWsConfig":{"foo":"bar","checkPolicies":true,"b":1}})";
    net::ScanConfig c{};
    std::string detail;
    ASSERT_EQ(net::decode_config(view(body), &c, &detail).code, StatusCode::Ok) << detail;
    EXPECT_EQ(c.api_key, "a");
    EXPECT_EQ(c.product_token, "p");
    EXPECT_EQ(c.project_name, "n");
    EXPECT_EQ(c.requester_email, "e@x");
    EXPECT_EQ(c.user_key, "u");
    EXPECT_EQ(c.wss_url, "https://w");

    ASSERT_EQ(c.extra.size(), 3u);
    EXPECT_EQ(c.extra[0].first, "b");
    EXPECT_EQ(c.extra[0].second, "1");
    EXPECT_EQ(c.extra[1].first, "checkPolicies");
    EXPECT_EQ(c.extra[1].second, "true");
    EXPECT_EQ(c.extra[2].first, "foo");
    EXPECT_EQ(c.extra[2].second, "bar");
}

TEST(ProtocolConfig, ExtrasAreOptional){
    net::ScanConfig c{};
    std::string detail;
    ASSERT_EQ(net::decode_config(view(kFullConfig), &c, &detail).code, StatusCode::Ok);
    EXPECT_TRUE(c.extra.empty());
}

TEST(ProtocolConfig, MissingUserKey){
    const std::string body =
        R"({"apiKey":"a","productToken":"p","projectName":"n","requesterEmail":"e@x","wssUrl":"https://w"})";
    net::ScanConfig c{};
    std::string detail;
    const auto s = net::decode_config(view(body), &c, &detail);
    ASSERT_EQ(s.code, StatusCode::MissingConfigField);
    EXPECT_EQ(s.aux, net::config_field_bit(net::ConfigField::UserKey));
    EXPECT_NE(detail.find("userKey"), std::string::npos);
}

TEST(ProtocolConfig, EmptyAndNonStringCountAsMissing){
    const std::string body =
        R"({"apiKey":"","productToken":7,"projectName":"n","requesterEmail":"e@x","userKey":"u","wssUrl":null})";
    net::ScanConfig c{};
    std::string detail;
    const auto s = net::decode_config(view(body), &c, &detail);
    ASSERT_EQ(s.code, StatusCode::MissingConfigField);
    EXPECT_EQ(s.aux, net::config_field_bit(net::ConfigField::ApiKey) |
                     net::config_field_bit(net::ConfigField::ProductToken) |
                     net::config_field_bit(net::ConfigField::WssUrl));
    EXPECT_EQ(net::missing_fields_list(s.aux), "apiKey, productToken, wssUrl");
}

TEST(ProtocolConfig, NonObjectIsUnexpectedSegment){
    net::ScanConfig c{};
    std::string detail;
    EXPECT_EQ(net::decode_config(view("[]"), &c, &detail).code, StatusCode::UnexpectedSegment);
    EXPECT_EQ(net::decode_config(view("{broken"), &c, &detail).code, StatusCode::UnexpectedSegment);
}

TEST(ProtocolConfig, NonObjectExtrasRejected){
    std::string body = kFullConfig;
    body.pop_back();
    body += R"(,"extraWsConfig":["x"]})";
    net::ScanConfig c{};
    std::string detail;
    EXPECT_EQ(net::decode_config(view(body), &c, &detail).code, StatusCode::UnexpectedSegment);
}

TEST(ProtocolConfig, EncodeRoundTrip){
    net::ScanConfig in = scanport::test::sample_config();
    in.extra.emplace_back("foo", "bar");
    std::string body;
    ASSERT_EQ(net::encode_config(in, &body).code, StatusCode::Ok);

    net::ScanConfig out{};
    std::string detail;
    ASSERT_EQ(net::decode_config(view(body), &out, &detail).code, StatusCode::Ok);
    EXPECT_EQ(out.user_key, in.user_key);
    ASSERT_EQ(out.extra.size(), 1u);
    EXPECT_EQ(out.extra[0].second, "bar");
}

TEST(ProtocolResult, SuccessCarriesDetailAndExitCode){
    net::ScanOutcome o{};
    o.status = net::OutcomeStatus::Success;
    o.detail = "scan ok\n";
    o.exit_code = 0;
    std::string body;
    ASSERT_EQ(net::encode_result(o, &body).code, StatusCode::Ok);
    EXPECT_EQ(body.find("\"error\""), std::string::npos);

    net::ScanOutcome back{};
    ASSERT_EQ(net::decode_result(view(body), &back).code, StatusCode::Ok);
    EXPECT_EQ(back.status, net::OutcomeStatus::Success);
    EXPECT_EQ(back.detail, "scan ok\n");
    EXPECT_EQ(back.exit_code, 0);
    EXPECT_EQ(back.error, StatusCode::Ok);
}

TEST(ProtocolResult, FailureNamesErrorKind){
    net::ScanOutcome o{};
    o.status = net::OutcomeStatus::Failure;
    o.detail = "timed out";
    o.error = StatusCode::ScanTimeout;
    std::string body;
    ASSERT_EQ(net::encode_result(o, &body).code, StatusCode::Ok);
    EXPECT_NE(body.find("ScanTimeoutError"), std::string::npos);

    net::ScanOutcome back{};
    ASSERT_EQ(net::decode_result(view(body), &back).code, StatusCode::Ok);
    EXPECT_EQ(back.status, net::OutcomeStatus::Failure);
    EXPECT_EQ(back.error, StatusCode::ScanTimeout);
}

TEST(ProtocolResult, PendingCannotBeEncoded){
    std::string body;
    EXPECT_EQ(net::encode_result(net::ScanOutcome{}, &body).code, StatusCode::Invalid);
}

TEST(ProtocolResult, NonUtf8DetailIsReplaced){
    net::ScanOutcome o{};
    o.status = net::OutcomeStatus::Failure;
    o.detail = std::string("bad \xff byte");
    std::string body;
    ASSERT_EQ(net::encode_result(o, &body).code, StatusCode::Ok);
    net::ScanOutcome back{};
    EXPECT_EQ(net::decode_result(view(body), &back).code, StatusCode::Ok);
}

TEST(ProtocolError, RoundTrip){
    std::string body;
    ASSERT_EQ(net::encode_error(StatusCode::TruncatedStream, "got 5 of 8 bytes", &body).code, StatusCode::Ok);
    net::ErrorMessage e{};
    ASSERT_EQ(net::decode_error(view(body), &e).code, StatusCode::Ok);
    EXPECT_EQ(e.kind, "TruncatedStreamError");
    EXPECT_EQ(e.message, "got 5 of 8 bytes");
}
