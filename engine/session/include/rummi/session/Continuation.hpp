#pragma once

#include <optional>
#include <string>

namespace rummi::session {

enum class ContinuationDecision { SkipTurn, AddBot, EndGame };

const char* DecisionName(ContinuationDecision decision) noexcept;
std::optional<ContinuationDecision> ParseDecision(const std::string& name) noexcept;

}  // namespace rummi::session
