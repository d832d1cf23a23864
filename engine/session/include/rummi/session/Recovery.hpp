#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rummi/core/Clock.hpp"

namespace rummi::session {

enum class FailureKind {
    GameNotFound,
    PlayerNotInGame,
    InvalidGameState,
    StateRestorationFailed,
    NetworkError,
    TimerSyncError,
    GracePeriodError,
    DatabaseError,
    ConcurrentDisconnection,
    MobileSpecific,
};

enum class RecoveryAction {
    RedirectToLobby,
    ClearGameData,
    VerifyPlayerData,
    AttemptRejoin,
    ValidateState,
    RepairState,
    ResetState,
    CreateNewGame,
    RestorePartialState,
    ResetPlayerState,
    RejoinAsSpectator,
    RetryConnection,
    SwitchTransport,
    ReduceQuality,
    ResetTimer,
    SyncWithServer,
    UseDefaultTimer,
    SkipGracePeriod,
    DefaultContinuation,
    EndGame,
    UseMemoryStorage,
    RetryDatabase,
    SyncWhenAvailable,
    ProcessSequentially,
    BatchProcess,
    AbandonGame,
    ExtendTimeouts,
    ReduceFrequency,
    SimplifyProtocol,
};

const char* FailureName(FailureKind kind) noexcept;
const char* RecoveryActionName(RecoveryAction action) noexcept;

struct FallbackStrategy {
    std::string name;
    bool retryable = false;
    int max_retries = 0;
    core::Millis retry_delay{0};
    std::string user_message;
    std::vector<RecoveryAction> actions;
    // Forced once the failure recurs more than max_retries times.
    RecoveryAction final_action = RecoveryAction::RedirectToLobby;
};

const FallbackStrategy& StrategyFor(FailureKind kind);

RecoveryAction FinalActionFor(FailureKind kind);

struct FailureContext {
    std::string game_id;
    std::string player_id;
    std::string message;
};

struct RecoveryOutcome {
    bool success = false;
    std::string strategy;
    std::vector<std::pair<RecoveryAction, bool>> attempted;
    std::optional<RecoveryAction> resolved_by;
    bool retryable = false;
    bool final_fallback = false;
    bool critical = false;
    core::Millis retry_delay{0};
    std::string user_message;
};

// Performs one remedial action, returning whether it fixed the failure.
using ActionExecutor = std::function<bool(RecoveryAction, const FailureContext&)>;

class RecoveryCoordinator {
public:
    static constexpr std::size_t kHistoryCapacity = 100;
    static constexpr core::Millis kRetryWindow{5 * 60 * 1000};

    struct FailureRecord {
        FailureKind kind;
        FailureContext context;
        core::TimePoint at;
    };

    RecoveryOutcome handle(FailureKind kind, const FailureContext& context, core::TimePoint now,
                           const ActionExecutor& execute);

    std::size_t recentFailures(FailureKind kind, const FailureContext& context,
                               core::TimePoint now) const;
    const std::deque<FailureRecord>& history() const noexcept { return history_; }
    void clearHistory() noexcept { history_.clear(); }

private:
    std::deque<FailureRecord> history_;
};

}  // namespace rummi::session
