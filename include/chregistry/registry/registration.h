#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <chregistry/core/status.h>

namespace chregistry::registry {

// One live service instance. Never mutated once stored; a change is a replacement.
struct Registration {
    std::string service_name;
    std::string service_url;                 // canonical base address, the removal key
    std::vector<std::string> required_services;
    std::string service_update_url;          // receives patch pushes
    std::string heartbeat_url;               // probed for liveness

    bool DependsOn(std::string_view name) const;
};

struct PatchEntry {
    std::string name;
    std::string url;

    bool operator==(const PatchEntry& o) const { return name == o.name && url == o.url; }
};

// A delta of membership changes, in discovery order.
struct Patch {
    std::vector<PatchEntry> added;
    std::vector<PatchEntry> removed;

    bool empty() const { return added.empty() && removed.empty(); }
};

PatchEntry EntryOf(const Registration& reg);

// Entries of `full` whose name is one of `names`, order preserved.
Patch FilterPatch(const Patch& full, const std::vector<std::string>& names);

// {"Added":[{"Name":..,"Url":..}],"Removed":[...]}; both arrays always present.
std::string EncodePatch(const Patch& patch);
chregistry::Result<Patch> DecodePatch(const std::string& json);

// Validates as well as decodes; failures are invalid_argument.
chregistry::Result<Registration> DecodeRegistration(const std::string& json);
std::string EncodeRegistration(const Registration& reg);

} // namespace chregistry::registry
