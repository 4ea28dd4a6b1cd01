#include "scanport/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace scanport::cli {
    namespace {
        [[nodiscard]] scanport::core::Status invalid(u32 at) noexcept {
            return scanport::core::make_status(scanport::core::StatusDomain::Cli, scanport::core::StatusCode::Invalid, at);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
                                                  const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Fills opt from value per the option's type. Flags take no value.
        [[nodiscard]] bool assign_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            opt->id = spec.id;
            opt->type = spec.type;
            switch (spec.type) {
                case OptionType::Flag:
                    opt->value.boolv = 1;
                    return value == nullptr;
                case OptionType::String:
                    opt->value.str = value;
                    return value != nullptr;
                case OptionType::I64:
                    return parse_i64(value, &opt->value.i64v);
            }
            return false;
        }
    } // namespace

    scanport::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid(0);
        }
        *consumed = 0;
        out->len = 0;

        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return invalid(0);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                // --name or --name=value
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid(i);
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                // -x, -xVALUE or -x VALUE
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid(i);
            }

            const char* value = inline_value;
            u32 used = 1;
            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return invalid(i);
                }
                value = args.argv[i + 1];
                used = 2;
            }

            ParsedOption opt{};
            if (!assign_value(*spec, value, &opt)) {
                return invalid(i);
            }
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid(i);
            }
            out->data[out->len++] = opt;
            i += used;
        }

        *consumed = i;
        return scanport::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace scanport::cli
