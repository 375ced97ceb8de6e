#include <chregistry/registry/registration.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

#include <chjson/chjson.hpp>

namespace chregistry::registry {
namespace {

chregistry::Status Invalid(std::string message) {
    return chregistry::Status(chregistry::StatusCode::invalid_argument, std::move(message));
}

chjson::value EncodeEntries(const std::vector<PatchEntry>& entries) {
    chjson::value::array arr;
    arr.reserve(entries.size());
    for (const auto& e : entries) {
        arr.push_back(chjson::value(chjson::value::object{
            {"Name", chjson::value(e.name)},
            {"Url", chjson::value(e.url)},
        }));
    }
    return chjson::value(std::move(arr));
}

chregistry::Status DecodeEntries(const chjson::sv_value& root, std::string_view key, std::vector<PatchEntry>& out) {
    const auto* v = root.find(key);
    if (v == nullptr || v->is_null()) {
        return chregistry::Status::Ok();
    }
    if (!v->is_array()) {
        return Invalid(std::string(key) + " must be an array");
    }
    for (const auto& item : v->as_array()) {
        if (!item.is_object()) {
            return Invalid(std::string(key) + " entries must be objects");
        }
        const auto* name = item.find("Name");
        const auto* url = item.find("Url");
        if (name == nullptr || url == nullptr || !name->is_string() || !url->is_string()) {
            return Invalid(std::string(key) + " entries need string Name and Url");
        }
        out.push_back(PatchEntry{std::string(name->as_string_view()), std::string(url->as_string_view())});
    }
    return chregistry::Status::Ok();
}

// Absent or null leaves `out` empty.
chregistry::Status OptionalString(const chjson::sv_value& root, std::string_view key, std::string& out) {
    const auto* v = root.find(key);
    if (v == nullptr || v->is_null()) {
        return chregistry::Status::Ok();
    }
    if (!v->is_string()) {
        return Invalid(std::string(key) + " must be a string");
    }
    out = std::string(v->as_string_view());
    return chregistry::Status::Ok();
}

} // namespace

bool Registration::DependsOn(std::string_view name) const {
    return std::find(required_services.begin(), required_services.end(), name) != required_services.end();
}

PatchEntry EntryOf(const Registration& reg) {
    return PatchEntry{reg.service_name, reg.service_url};
}

Patch FilterPatch(const Patch& full, const std::vector<std::string>& names) {
    auto wanted = [&](const PatchEntry& e) {
        return std::find(names.begin(), names.end(), e.name) != names.end();
    };

    Patch out;
    std::copy_if(full.added.begin(), full.added.end(), std::back_inserter(out.added), wanted);
    std::copy_if(full.removed.begin(), full.removed.end(), std::back_inserter(out.removed), wanted);
    return out;
}

std::string EncodePatch(const Patch& patch) {
    chjson::value j(chjson::value::object{
        {"Added", EncodeEntries(patch.added)},
        {"Removed", EncodeEntries(patch.removed)},
    });
    return chjson::dump(j);
}

chregistry::Result<Patch> DecodePatch(const std::string& json) {
    auto r = chjson::parse(json);
    if (r.err || !r.doc.root().is_object()) {
        return Invalid("patch is not a JSON object");
    }

    Patch p;
    if (auto st = DecodeEntries(r.doc.root(), "Added", p.added); !st.ok()) {
        return st;
    }
    if (auto st = DecodeEntries(r.doc.root(), "Removed", p.removed); !st.ok()) {
        return st;
    }
    return p;
}

chregistry::Result<Registration> DecodeRegistration(const std::string& json) {
    auto r = chjson::parse(json);
    if (r.err) {
        return Invalid("registration is not valid JSON");
    }
    const auto& root = r.doc.root();
    if (!root.is_object()) {
        return Invalid("registration must be a JSON object");
    }

    Registration reg;
    const std::array<std::pair<std::string_view, std::string*>, 4> fields{{
        {"ServiceName", &reg.service_name},
        {"ServiceUrl", &reg.service_url},
        {"ServiceUpdateUrl", &reg.service_update_url},
        {"HeartbeatUrl", &reg.heartbeat_url},
    }};
    for (const auto& [key, field] : fields) {
        if (auto st = OptionalString(root, key, *field); !st.ok()) {
            return st;
        }
    }

    if (const auto* deps = root.find("RequiredServices"); deps != nullptr && !deps->is_null()) {
        if (!deps->is_array()) {
            return Invalid("RequiredServices must be an array of strings");
        }
        for (const auto& d : deps->as_array()) {
            if (!d.is_string()) {
                return Invalid("RequiredServices must be an array of strings");
            }
            std::string name(d.as_string_view());
            if (!reg.DependsOn(name)) {
                reg.required_services.push_back(std::move(name));
            }
        }
    }

    if (reg.service_name.empty()) {
        return Invalid("ServiceName is required");
    }
    if (reg.service_url.empty()) {
        return Invalid("ServiceUrl is required");
    }
    if (!reg.required_services.empty() && reg.service_update_url.empty()) {
        return Invalid("ServiceUpdateUrl is required when RequiredServices is set");
    }
    return reg;
}

std::string EncodeRegistration(const Registration& reg) {
    chjson::value::array deps;
    for (const auto& d : reg.required_services) {
        deps.push_back(chjson::value(d));
    }
    chjson::value j(chjson::value::object{
        {"ServiceName", chjson::value(reg.service_name)},
        {"ServiceUrl", chjson::value(reg.service_url)},
        {"RequiredServices", chjson::value(std::move(deps))},
        {"ServiceUpdateUrl", chjson::value(reg.service_update_url)},
        {"HeartbeatUrl", chjson::value(reg.heartbeat_url)},
    });
    return chjson::dump(j);
}

} // namespace chregistry::registry
