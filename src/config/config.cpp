#include <chregistry/config/config.h>

#include <fstream>
#include <sstream>

namespace chregistry::config {

namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

std::string KeyError(std::string_view key, std::string_view what) {
    std::string msg(key);
    msg.append(": ");
    msg.append(what);
    return msg;
}

} // namespace

chregistry::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return chregistry::Status(chregistry::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return Parse(ss.str());
}

chregistry::Result<Config> Config::Parse(std::string text) {
    auto r = chjson::parse(text);
    if (r.err) {
        std::ostringstream oss;
        oss << "invalid json: " << ErrorCodeToString(r.err.code)
            << " at line " << r.err.line << ", col " << r.err.column;
        return chregistry::Status(chregistry::StatusCode::invalid_argument, oss.str());
    }

    if (!r.doc.root().is_object()) {
        return chregistry::Status(chregistry::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

const chjson::sv_value* Config::Find(std::string_view key) const {
    const chjson::sv_value* cur = &doc_.root();
    while (cur != nullptr) {
        auto dot = key.find('.');
        auto part = key.substr(0, dot);
        if (!cur->is_object()) {
            return nullptr;
        }
        cur = cur->find(part);
        if (dot == std::string_view::npos) {
            return cur;
        }
        key.remove_prefix(dot + 1);
    }
    return nullptr;
}

bool Config::Has(std::string_view key) const {
    return Find(key) != nullptr;
}

chregistry::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return chregistry::Status(chregistry::StatusCode::not_found, KeyError(key, "missing key"));
    }
    if (!v->is_string()) {
        return chregistry::Status(chregistry::StatusCode::invalid_argument, KeyError(key, "not a string"));
    }
    return std::string(v->as_string_view());
}

chregistry::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return chregistry::Status(chregistry::StatusCode::not_found, KeyError(key, "missing key"));
    }
    if (!v->is_number() || !v->is_int()) {
        return chregistry::Status(chregistry::StatusCode::invalid_argument, KeyError(key, "not an int"));
    }
    return static_cast<int>(v->as_int());
}

chregistry::Result<bool> Config::GetBool(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return chregistry::Status(chregistry::StatusCode::not_found, KeyError(key, "missing key"));
    }
    if (!v->is_bool()) {
        return chregistry::Status(chregistry::StatusCode::invalid_argument, KeyError(key, "not a bool"));
    }
    return v->as_bool();
}

chregistry::Result<std::string> Config::GetString(std::string_view key, std::string fallback) const {
    if (!Has(key)) {
        return fallback;
    }
    return GetString(key);
}

chregistry::Result<int> Config::GetInt(std::string_view key, int fallback) const {
    if (!Has(key)) {
        return fallback;
    }
    return GetInt(key);
}

chregistry::Result<bool> Config::GetBool(std::string_view key, bool fallback) const {
    if (!Has(key)) {
        return fallback;
    }
    return GetBool(key);
}

} // namespace chregistry::config
