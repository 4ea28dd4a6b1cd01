#include <cctype>
#include <cstring>
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "scanport/security/secrets.hpp"
#include "test_support.hpp"

using scanport::core::StatusCode;

TEST(SecuritySecrets, InitIsIdempotent) {
    EXPECT_EQ(scanport::security::secrets_init().code, StatusCode::Ok);
    EXPECT_EQ(scanport::security::secrets_init().code, StatusCode::Ok);
}

TEST(SecuritySecrets, SessionIdsAreHexAndDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        scanport::core::SessionId id{};
        ASSERT_EQ(scanport::security::make_session_id(&id).code, StatusCode::Ok);
        ASSERT_TRUE(id.is_valid());
        ASSERT_EQ(std::strlen(id.c_str()), scanport::core::kSessionIdChars);
        for (const char* p = id.c_str(); *p != '\0'; ++p) {
            EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(*p)) && !std::isupper(static_cast<unsigned char>(*p)));
        }
        seen.insert(id.c_str());
    }
    EXPECT_EQ(seen.size(), 64u);
}

TEST(SecuritySecrets, NullIdIsInvalid) {
    EXPECT_EQ(scanport::security::make_session_id(nullptr).code, StatusCode::Invalid);
}

TEST(SecuritySecrets, WipeConfigClearsEverything) {
    scanport::net::ScanConfig cfg = scanport::test::sample_config();
    cfg.extra.emplace_back("foo", "bar");
    scanport::security::wipe_config(&cfg);
    EXPECT_TRUE(cfg.api_key.empty());
    EXPECT_TRUE(cfg.product_token.empty());
    EXPECT_TRUE(cfg.user_key.empty());
    EXPECT_TRUE(cfg.wss_url.empty());
    EXPECT_TRUE(cfg.extra.empty());
}

TEST(SecuritySecrets, WipeStringHandlesNullAndEmpty) {
    scanport::security::wipe_string(nullptr);
    std::string s;
    scanport::security::wipe_string(&s);
    EXPECT_TRUE(s.empty());
}
