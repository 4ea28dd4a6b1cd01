#include <array>

#include <gtest/gtest.h>

#include "scanport/cli/options.hpp"

using scanport::cli::OptionId;
using scanport::cli::OptionType;

namespace {
    const std::array<scanport::cli::OptionSpec, 4> kSpecs = {{
        {OptionId::Port, OptionType::I64, "port", 'p'},
        {OptionId::Host, OptionType::String, "host", 'H'},
        {OptionId::Config, OptionType::String, "config", 'c'},
        {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
    }};
}

TEST(CliOptions, ParsesLongAndShortAndStopsAtPositional) {
    const char* argv[] = {"--verbose", "--host", "scanner", "-p", "9000", "image.tar", "--port", "1"};
    const scanport::cli::CliArgs args{argv, 8};

    scanport::cli::ParsedOption buf[8]{};
    scanport::cli::ParsedOptions out{buf, 0, 8};
    scanport::cli::u32 consumed = 0;
    const scanport::core::Status s = scanport::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, scanport::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, OptionId::Verbose);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, OptionId::Host);
    EXPECT_STREQ(out.data[1].value.str, "scanner");

    EXPECT_EQ(out.data[2].id, OptionId::Port);
    EXPECT_EQ(out.data[2].value.i64v, 9000);
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const char* argv[] = {"--host=abc", "-p123"};
    scanport::cli::ParsedOption buf[8]{};
    scanport::cli::ParsedOptions out{buf, 0, 8};
    scanport::cli::u32 consumed = 0;
    const scanport::core::Status s = scanport::cli::parse_options({argv, 2}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, scanport::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_STREQ(out.data[0].value.str, "abc");
    EXPECT_EQ(out.data[1].value.i64v, 123);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const char* argv[] = {"--host", "1", "--", "--verbose"};
    scanport::cli::ParsedOption buf[8]{};
    scanport::cli::ParsedOptions out{buf, 0, 8};
    scanport::cli::u32 consumed = 0;
    const scanport::core::Status s = scanport::cli::parse_options({argv, 4}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, scanport::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "1");
}

TEST(CliOptions, LastOccurrenceWins) {
    const char* argv[] = {"-p", "1", "--port=2"};
    scanport::cli::ParsedOption buf[8]{};
    scanport::cli::ParsedOptions out{buf, 0, 8};
    scanport::cli::u32 consumed = 0;
    ASSERT_EQ(scanport::cli::parse_options({argv, 3}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              scanport::core::StatusCode::Ok);
    const scanport::cli::ParsedOption* p = scanport::cli::find_option(out, OptionId::Port);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->value.i64v, 2);
    EXPECT_EQ(scanport::cli::find_option(out, OptionId::Config), nullptr);
}

TEST(CliOptions, InvalidCarriesOffendingIndex) {
    struct Case {
        const char* argv[2];
        scanport::cli::u32 argc;
        scanport::cli::u32 at;
    };
    const Case cases[] = {
        {{"--nope", nullptr}, 1, 0},
        {{"-v", "--host"}, 2, 1},
        {{"--port", "12x"}, 2, 0},
        {{"--verbose=yes", nullptr}, 1, 0},
    };
    for (const Case& c : cases) {
        scanport::cli::ParsedOption buf[4]{};
        scanport::cli::ParsedOptions out{buf, 0, 4};
        scanport::cli::u32 consumed = 0;
        const scanport::core::Status s =
            scanport::cli::parse_options({c.argv, c.argc}, kSpecs.data(), kSpecs.size(), &out, &consumed);
        EXPECT_EQ(s.code, scanport::core::StatusCode::Invalid) << c.argv[0];
        EXPECT_EQ(s.aux, c.at) << c.argv[0];
    }
}

TEST(CliOptions, InvalidWhenOutputFull) {
    const char* argv[] = {"-v", "-v"};
    scanport::cli::ParsedOption buf[1]{};
    scanport::cli::ParsedOptions out{buf, 0, 1};
    scanport::cli::u32 consumed = 0;
    EXPECT_EQ(scanport::cli::parse_options({argv, 2}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              scanport::core::StatusCode::Invalid);
}
