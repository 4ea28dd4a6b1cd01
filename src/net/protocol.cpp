#include "scanport/net/protocol.hpp"

#include <cstdio>
#include <limits>

#include <nlohmann/json.hpp>

namespace scanport::net {

using scanport::core::StatusDomain;
using scanport::core::make_status;
using scanport::core::ok_status;
using json = nlohmann::json;

namespace {
    constexpr ConfigField kAllFields[kMandatoryFieldCount] = {
        ConfigField::ApiKey,
        ConfigField::ProductToken,
        ConfigField::ProjectName,
        ConfigField::RequesterEmail,
        ConfigField::UserKey,
        ConfigField::WssUrl,
    };

    json parse_payload(BufferView payload) {
        const char* begin = reinterpret_cast<const char*>(payload.data);
        if (begin == nullptr) {
            return json(json::value_t::discarded);
        }
        return json::parse(begin, begin + payload.len, nullptr, false);
    }

    std::string dump_text(const json& j) {
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::string* field_slot(ScanConfig* c, ConfigField f) noexcept {
        switch (f) {
            case ConfigField::ApiKey: return &c->api_key;
            case ConfigField::ProductToken: return &c->product_token;
            case ConfigField::ProjectName: return &c->project_name;
            case ConfigField::RequesterEmail: return &c->requester_email;
            case ConfigField::UserKey: return &c->user_key;
            case ConfigField::WssUrl: return &c->wss_url;
        }
        return nullptr;
    }

    // Reads a non-negative integer member. Floats, strings and booleans are
    // rejected so "8" or 8.5 never pass as a length.
    bool read_count(const json& obj, const char* key, i64* out, std::string* detail) {
        const auto it = obj.find(key);
        if (it == obj.end()) {
            *detail = std::string("missing field '") + key + "'";
            return false;
        }
        if (it->is_number_unsigned()) {
            const auto v = it->get<json::number_unsigned_t>();
            if (v > static_cast<json::number_unsigned_t>(std::numeric_limits<i64>::max())) {
                *detail = std::string("field '") + key + "' is out of range";
                return false;
            }
            *out = static_cast<i64>(v);
            return true;
        }
        if (it->is_number_integer()) {
            *out = it->get<json::number_integer_t>();
            return true;
        }
        *detail = std::string("field '") + key + "' must be an integer";
        return false;
    }
} // namespace

const char* config_field_name(ConfigField f) noexcept {
    switch (f) {
        case ConfigField::ApiKey: return "apiKey";
        case ConfigField::ProductToken: return "productToken";
        case ConfigField::ProjectName: return "projectName";
        case ConfigField::RequesterEmail: return "requesterEmail";
        case ConfigField::UserKey: return "userKey";
        case ConfigField::WssUrl: return "wssUrl";
    }
    return "unknown";
}

std::string missing_fields_list(u32 mask) {
    std::string out;
    for (ConfigField f : kAllFields) {
        if ((mask & config_field_bit(f)) == 0) {
            continue;
        }
        if (!out.empty()) {
            out += ", ";
        }
        out += config_field_name(f);
    }
    return out;
}

Status decode_metadata(BufferView payload,
                       const MetadataLimits& limits,
                       TransferMetadata* out,
                       std::string* detail) noexcept {
    if (out == nullptr || detail == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    detail->clear();

    const json j = parse_payload(payload);
    if (j.is_discarded()) {
        *detail = "metadata is not valid JSON";
        return make_status(StatusDomain::Net, StatusCode::MalformedMetadata);
    }
    if (!j.is_object()) {
        *detail = "metadata must be a JSON object";
        return make_status(StatusDomain::Net, StatusCode::MalformedMetadata);
    }

    i64 chunk_size = 0;
    i64 length = 0;
    if (!read_count(j, "chunkSize", &chunk_size, detail) || !read_count(j, "length", &length, detail)) {
        return make_status(StatusDomain::Net, StatusCode::MalformedMetadata);
    }

    if (chunk_size <= 0) {
        *detail = "chunkSize must be positive";
        return make_status(StatusDomain::Net, StatusCode::MalformedMetadata);
    }
    if (length < 0) {
        *detail = "length must not be negative";
        return make_status(StatusDomain::Net, StatusCode::MalformedMetadata);
    }
    if (chunk_size > static_cast<i64>(std::numeric_limits<u32>::max()) ||
        (limits.max_chunk_bytes > 0 && chunk_size > static_cast<i64>(limits.max_chunk_bytes))) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "chunkSize %lld exceeds the server limit of %u bytes",
                      static_cast<long long>(chunk_size), limits.max_chunk_bytes);
        *detail = buf;
        return make_status(StatusDomain::Net, StatusCode::MalformedMetadata);
    }
    if (limits.max_archive_bytes > 0 && static_cast<u64>(length) > limits.max_archive_bytes) {
        char buf[112];
        std::snprintf(buf, sizeof(buf), "length %lld exceeds the server limit of %llu bytes",
                      static_cast<long long>(length),
                      static_cast<unsigned long long>(limits.max_archive_bytes));
        *detail = buf;
        return make_status(StatusDomain::Net, StatusCode::MalformedMetadata);
    }

    out->chunk_size = static_cast<u32>(chunk_size);
    out->length = static_cast<u64>(length);
    return ok_status();
}

Status decode_config(BufferView payload, ScanConfig* out, std::string* detail) noexcept {
    if (out == nullptr || detail == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    detail->clear();

    const json j = parse_payload(payload);
    if (j.is_discarded() || !j.is_object()) {
        *detail = "expected a JSON object carrying the scan configuration";
        return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment);
    }

    ScanConfig cfg{};
    u32 missing = 0;
    for (ConfigField f : kAllFields) {
        const auto it = j.find(config_field_name(f));
        if (it == j.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
            missing |= config_field_bit(f);
            continue;
        }
        *field_slot(&cfg, f) = it->get<std::string>();
    }

    if (missing != 0) {
        *detail = "missing mandatory config field(s): " + missing_fields_list(missing);
        return make_status(StatusDomain::Net, StatusCode::MissingConfigField, missing);
    }

    const auto extra = j.find("extraWsConfig");
    if (extra != j.end() && !extra->is_null()) {
        if (!extra->is_object()) {
            *detail = "extraWsConfig must be a JSON object";
            return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment);
        }
        for (const auto& [key, value] : extra->items()) {
            if (value.is_string()) {
                cfg.extra.emplace_back(key, value.get<std::string>());
            } else {
                cfg.extra.emplace_back(key, dump_text(value));
            }
        }
    }

    *out = std::move(cfg);
    return ok_status();
}

Status encode_metadata(const TransferMetadata& m, std::string* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    json j = json::object();
    j["chunkSize"] = m.chunk_size;
    j["length"] = m.length;
    *out = dump_text(j);
    return ok_status();
}

Status encode_config(const ScanConfig& c, std::string* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    json j = json::object();
    j["apiKey"] = c.api_key;
    j["productToken"] = c.product_token;
    j["projectName"] = c.project_name;
    j["requesterEmail"] = c.requester_email;
    j["userKey"] = c.user_key;
    j["wssUrl"] = c.wss_url;

    json extra = json::object();
    for (const auto& [key, value] : c.extra) {
        extra[key] = value;
    }
    j["extraWsConfig"] = std::move(extra);

    *out = dump_text(j);
    return ok_status();
}

Status encode_result(const ScanOutcome& o, std::string* out) noexcept {
    if (out == nullptr || o.status == OutcomeStatus::Pending) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    json j = json::object();
    j["status"] = o.status == OutcomeStatus::Success ? "success" : "failure";
    j["detail"] = o.detail;
    j["exitCode"] = o.exit_code;
    if (o.error != StatusCode::Ok) {
        j["error"] = scanport::core::error_kind_name(o.error);
    }
    *out = dump_text(j);
    return ok_status();
}

Status decode_result(BufferView payload, ScanOutcome* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    const json j = parse_payload(payload);
    if (j.is_discarded() || !j.is_object()) {
        return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment);
    }

    const auto status = j.find("status");
    const auto detail = j.find("detail");
    if (status == j.end() || !status->is_string() || detail == j.end() || !detail->is_string()) {
        return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment);
    }

    ScanOutcome o{};
    const std::string& s = status->get_ref<const std::string&>();
    if (s == "success") {
        o.status = OutcomeStatus::Success;
    } else if (s == "failure") {
        o.status = OutcomeStatus::Failure;
    } else {
        return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment);
    }
    o.detail = detail->get<std::string>();

    const auto code = j.find("exitCode");
    if (code != j.end() && code->is_number_integer()) {
        o.exit_code = code->get<int>();
    }
    const auto error = j.find("error");
    if (error != j.end() && error->is_string()) {
        // Only the kind name travels; map the known ones back.
        const std::string& kind = error->get_ref<const std::string&>();
        for (StatusCode c : {StatusCode::ScanTimeout, StatusCode::ScanInvocation, StatusCode::CorruptArchive}) {
            if (kind == scanport::core::error_kind_name(c)) {
                o.error = c;
            }
        }
    }

    *out = std::move(o);
    return ok_status();
}

Status encode_error(StatusCode kind, const std::string& message, std::string* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    json j = json::object();
    j["kind"] = scanport::core::error_kind_name(kind);
    j["message"] = message;
    *out = dump_text(j);
    return ok_status();
}

Status decode_error(BufferView payload, ErrorMessage* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    const json j = parse_payload(payload);
    if (j.is_discarded() || !j.is_object()) {
        return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment);
    }
    const auto kind = j.find("kind");
    const auto message = j.find("message");
    if (kind == j.end() || !kind->is_string() || message == j.end() || !message->is_string()) {
        return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment);
    }
    out->kind = kind->get<std::string>();
    out->message = message->get<std::string>();
    return ok_status();
}

} // namespace scanport::net
