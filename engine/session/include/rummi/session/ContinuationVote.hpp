#pragma once

#include <map>
#include <string>
#include <vector>

#include "rummi/core/Clock.hpp"
#include "rummi/session/Continuation.hpp"

namespace rummi::session {

enum class VoteStatus { Accepted, NotEligible, AlreadyVoted };

// Ballot among the connected players on how to continue without a player
// whose grace period ran out.
class ContinuationVote {
public:
    ContinuationVote(std::string target_player_id, std::vector<std::string> voters,
                     core::TimePoint deadline);

    VoteStatus cast(const std::string& voter_id, ContinuationDecision decision);

    bool complete() const noexcept { return votes_.size() >= voters_.size(); }
    bool timedOut(core::TimePoint now) const noexcept { return now >= deadline_; }

    // Plurality in the order skip_turn, add_bot, end_game; a later option
    // needs strictly more votes to win, so ties and empty ballots skip.
    ContinuationDecision tally() const noexcept;
    std::map<ContinuationDecision, int> counts() const;

    const std::string& target() const noexcept { return target_; }
    const std::vector<std::string>& voters() const noexcept { return voters_; }
    const std::map<std::string, ContinuationDecision>& votes() const noexcept { return votes_; }
    core::TimePoint deadline() const noexcept { return deadline_; }

private:
    std::string target_;
    std::vector<std::string> voters_;
    std::map<std::string, ContinuationDecision> votes_;
    core::TimePoint deadline_;
};

}  // namespace rummi::session
