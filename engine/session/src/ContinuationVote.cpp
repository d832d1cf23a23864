#include "rummi/session/ContinuationVote.hpp"

#include <algorithm>

namespace rummi::session {

ContinuationVote::ContinuationVote(std::string target_player_id, std::vector<std::string> voters,
                                   core::TimePoint deadline)
    : target_(std::move(target_player_id)), voters_(std::move(voters)), deadline_(deadline) {}

VoteStatus ContinuationVote::cast(const std::string& voter_id, ContinuationDecision decision) {
    if (std::find(voters_.begin(), voters_.end(), voter_id) == voters_.end()) {
        return VoteStatus::NotEligible;
    }
    if (!votes_.emplace(voter_id, decision).second) {
        return VoteStatus::AlreadyVoted;
    }
    return VoteStatus::Accepted;
}

std::map<ContinuationDecision, int> ContinuationVote::counts() const {
    std::map<ContinuationDecision, int> counts{{ContinuationDecision::SkipTurn, 0},
                                               {ContinuationDecision::AddBot, 0},
                                               {ContinuationDecision::EndGame, 0}};
    for (const auto& entry : votes_) {
        ++counts[entry.second];
    }
    return counts;
}

ContinuationDecision ContinuationVote::tally() const noexcept {
    int skip = 0;
    int bot = 0;
    int end = 0;
    for (const auto& entry : votes_) {
        switch (entry.second) {
        case ContinuationDecision::SkipTurn:
            ++skip;
            break;
        case ContinuationDecision::AddBot:
            ++bot;
            break;
        case ContinuationDecision::EndGame:
            ++end;
            break;
        }
    }
    ContinuationDecision best = ContinuationDecision::SkipTurn;
    int best_count = skip;
    if (bot > best_count) {
        best = ContinuationDecision::AddBot;
        best_count = bot;
    }
    if (end > best_count) {
        best = ContinuationDecision::EndGame;
    }
    return best;
}

}  // namespace rummi::session
