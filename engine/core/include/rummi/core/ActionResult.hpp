#pragma once

#include <string>

namespace rummi::core {

enum class RejectionKind {
    None,
    NotFound,
    InvalidState,
    NotYourTurn,
    InvalidPlayer,
    SessionFull,
    BotPoolExhausted,
    MalformedTile,
    InvalidSet,
    InitialPlayTooLow,
    UncommittedChanges,
    DrawNotAllowed,
    DeckEmpty,
};

const char* RejectionKindName(RejectionKind kind) noexcept;

// Outcome of a player action. Rejections never mutate the game, except
// DeckEmpty which still passes the turn.
struct ActionResult {
    bool ok = true;
    RejectionKind kind = RejectionKind::None;
    std::string reason;
    std::string detail;

    static ActionResult Ok(std::string detail = {}) {
        ActionResult result;
        result.detail = std::move(detail);
        return result;
    }

    static ActionResult Reject(RejectionKind kind, std::string reason) {
        ActionResult result;
        result.ok = false;
        result.kind = kind;
        result.reason = std::move(reason);
        return result;
    }

    explicit operator bool() const noexcept { return ok; }
};

}  // namespace rummi::core
