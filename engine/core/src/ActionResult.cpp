#include "rummi/core/ActionResult.hpp"

namespace rummi::core {

const char* RejectionKindName(RejectionKind kind) noexcept {
    switch (kind) {
    case RejectionKind::None:
        return "none";
    case RejectionKind::NotFound:
        return "not_found";
    case RejectionKind::InvalidState:
        return "invalid_state";
    case RejectionKind::NotYourTurn:
        return "not_your_turn";
    case RejectionKind::InvalidPlayer:
        return "invalid_player";
    case RejectionKind::SessionFull:
        return "session_full";
    case RejectionKind::BotPoolExhausted:
        return "bot_pool_exhausted";
    case RejectionKind::MalformedTile:
        return "malformed_tile";
    case RejectionKind::InvalidSet:
        return "invalid_set";
    case RejectionKind::InitialPlayTooLow:
        return "initial_play_too_low";
    case RejectionKind::UncommittedChanges:
        return "uncommitted_changes";
    case RejectionKind::DrawNotAllowed:
        return "draw_not_allowed";
    case RejectionKind::DeckEmpty:
        return "deck_empty";
    }
    return "none";
}

}  // namespace rummi::core
