#pragma once

#include <string>
#include <string_view>

#include <chregistry/core/status.h>

#include <chjson/chjson.hpp>

namespace chregistry::config {

// Read-only view over a JSON config object. Keys are dotted paths into nested
// objects, e.g. "heartbeat.interval_ms".
class Config {
public:
    static chregistry::Result<Config> LoadFile(std::string path);
    static chregistry::Result<Config> Parse(std::string text);

    bool Has(std::string_view key) const;

    chregistry::Result<std::string> GetString(std::string_view key) const;
    chregistry::Result<int> GetInt(std::string_view key) const;
    chregistry::Result<bool> GetBool(std::string_view key) const;

    // Missing keys yield the fallback; a present key of the wrong type is an error.
    chregistry::Result<std::string> GetString(std::string_view key, std::string fallback) const;
    chregistry::Result<int> GetInt(std::string_view key, int fallback) const;
    chregistry::Result<bool> GetBool(std::string_view key, bool fallback) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    const chjson::sv_value* Find(std::string_view key) const;

    chjson::document doc_;
};

} // namespace chregistry::config
