#include "rummi/core/SavePayload.hpp"

#include <cstdio>

namespace rummi::core {

std::uint64_t Fnv1a64(const std::string& text) noexcept {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char byte : text) {
        hash ^= byte;
        hash *= 1099511628211ULL;
    }
    return hash;
}

Json SavePayload::ToJson() const {
    Json json;
    json["version"] = version;
    json["mode"] = mode;
    json["meta"] = meta;
    json["data"] = data;
    return json;
}

SavePayload SavePayload::FromJson(const Json& json) {
    SavePayload payload;
    if (json.contains("version")) {
        payload.version = json["version"].get<int>();
    }
    if (json.contains("mode") && json["mode"].is_string()) {
        payload.mode = json["mode"].get<std::string>();
    }
    if (json.contains("meta")) {
        payload.meta = json["meta"];
    }
    if (json.contains("data")) {
        payload.data = json["data"];
    }
    return payload;
}

std::vector<std::uint8_t> SavePayload::SerializeBinary() const {
    return Json::to_msgpack(ToJson());
}

SavePayload SavePayload::DeserializeBinary(const std::vector<std::uint8_t>& bytes) {
    auto json = Json::from_msgpack(bytes);
    return FromJson(json);
}

std::string SavePayload::Checksum() const {
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx",
                  static_cast<unsigned long long>(Fnv1a64(data.dump())));
    return buffer;
}

void SavePayload::Seal() {
    meta["checksum"] = Checksum();
}

bool SavePayload::Verify() const {
    if (!meta.is_object() || !meta.contains("checksum") || !meta["checksum"].is_string()) {
        return false;
    }
    return meta["checksum"].get<std::string>() == Checksum();
}

}  // namespace rummi::core
