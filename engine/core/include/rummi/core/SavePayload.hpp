#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "rummi/core/Json.hpp"

namespace rummi::core {

// Versioned record envelope. meta carries bookkeeping, data the record itself.
struct SavePayload {
    int version = 1;
    std::string mode;
    Json meta = Json::object();
    Json data = Json::object();

    Json ToJson() const;
    // Throws nlohmann::json exceptions on mistyped fields.
    static SavePayload FromJson(const Json& json);

    std::vector<std::uint8_t> SerializeBinary() const;
    static SavePayload DeserializeBinary(const std::vector<std::uint8_t>& bytes);

    std::string Checksum() const;
    void Seal();
    bool Verify() const;
};

std::uint64_t Fnv1a64(const std::string& text) noexcept;

}  // namespace rummi::core
