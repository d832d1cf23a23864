#pragma once

#include <nlohmann/json.hpp>

namespace rummi::core {

using Json = nlohmann::json;

}  // namespace rummi::core
