#include "rummi/session/Recovery.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <exception>
#include <map>

namespace rummi::session {

namespace {

using A = RecoveryAction;

FallbackStrategy MakeStrategy(std::string name, bool retryable, int max_retries, int delay_ms,
                              std::string message, std::vector<RecoveryAction> actions,
                              RecoveryAction final_action) {
    FallbackStrategy strategy;
    strategy.name = std::move(name);
    strategy.retryable = retryable;
    strategy.max_retries = max_retries;
    strategy.retry_delay = core::Millis(delay_ms);
    strategy.user_message = std::move(message);
    strategy.actions = std::move(actions);
    strategy.final_action = final_action;
    return strategy;
}

const std::map<FailureKind, FallbackStrategy>& StrategyTable() {
    static const std::map<FailureKind, FallbackStrategy> table{
        {FailureKind::GameNotFound,
         MakeStrategy("redirect_to_lobby", false, 0, 0, "This game is no longer available.",
                      {A::RedirectToLobby, A::ClearGameData}, A::CreateNewGame)},
        {FailureKind::PlayerNotInGame,
         MakeStrategy("verify_and_rejoin", true, 2, 1000, "Verifying your seat in the game.",
                      {A::VerifyPlayerData, A::AttemptRejoin, A::RedirectToLobby},
                      A::CreateNewGame)},
        {FailureKind::InvalidGameState,
         MakeStrategy("state_recovery", true, 3, 2000, "Recovering the game state.",
                      {A::ValidateState, A::RepairState, A::ResetState, A::CreateNewGame},
                      A::CreateNewGame)},
        {FailureKind::StateRestorationFailed,
         MakeStrategy("partial_recovery", true, 2, 1000, "Restoring what we can of your game.",
                      {A::RestorePartialState, A::ResetPlayerState, A::RejoinAsSpectator},
                      A::RedirectToLobby)},
        {FailureKind::NetworkError,
         MakeStrategy("connection_recovery", true, 5, 2000, "Connection problem, retrying.",
                      {A::RetryConnection, A::SwitchTransport, A::ReduceQuality},
                      A::RetryConnection)},
        {FailureKind::TimerSyncError,
         MakeStrategy("timer_reset", true, 2, 500, "Resynchronising the turn timer.",
                      {A::ResetTimer, A::SyncWithServer, A::UseDefaultTimer},
                      A::UseDefaultTimer)},
        {FailureKind::GracePeriodError,
         MakeStrategy("immediate_decision", false, 0, 0, "Continuing the game without waiting.",
                      {A::SkipGracePeriod, A::DefaultContinuation, A::EndGame},
                      A::DefaultContinuation)},
        {FailureKind::DatabaseError,
         MakeStrategy("memory_fallback", true, 3, 5000, "Saving is delayed, the game continues.",
                      {A::UseMemoryStorage, A::RetryDatabase, A::SyncWhenAvailable},
                      A::UseMemoryStorage)},
        {FailureKind::ConcurrentDisconnection,
         MakeStrategy("sequential_processing", true, 2, 1000, "Several players dropped, hold on.",
                      {A::ProcessSequentially, A::BatchProcess, A::AbandonGame},
                      A::ProcessSequentially)},
        {FailureKind::MobileSpecific,
         MakeStrategy("mobile_optimization", true, 3, 1500, "Adjusting for your mobile connection.",
                      {A::ExtendTimeouts, A::ReduceFrequency, A::SimplifyProtocol},
                      A::ExtendTimeouts)},
    };
    return table;
}

bool SameSubject(const RecoveryCoordinator::FailureRecord& record, FailureKind kind,
                 const FailureContext& context) {
    return record.kind == kind && record.context.game_id == context.game_id &&
           record.context.player_id == context.player_id;
}

}  // namespace

const char* FailureName(FailureKind kind) noexcept {
    switch (kind) {
    case FailureKind::GameNotFound:
        return "game_not_found";
    case FailureKind::PlayerNotInGame:
        return "player_not_in_game";
    case FailureKind::InvalidGameState:
        return "invalid_game_state";
    case FailureKind::StateRestorationFailed:
        return "state_restoration_failed";
    case FailureKind::NetworkError:
        return "network_error";
    case FailureKind::TimerSyncError:
        return "timer_sync_error";
    case FailureKind::GracePeriodError:
        return "grace_period_error";
    case FailureKind::DatabaseError:
        return "database_error";
    case FailureKind::ConcurrentDisconnection:
        return "concurrent_disconnection_error";
    case FailureKind::MobileSpecific:
        return "mobile_specific_error";
    }
    return "unknown";
}

const char* RecoveryActionName(RecoveryAction action) noexcept {
    switch (action) {
    case A::RedirectToLobby:
        return "redirect_to_lobby";
    case A::ClearGameData:
        return "clear_game_data";
    case A::VerifyPlayerData:
        return "verify_player_data";
    case A::AttemptRejoin:
        return "attempt_rejoin";
    case A::ValidateState:
        return "validate_state";
    case A::RepairState:
        return "repair_state";
    case A::ResetState:
        return "reset_state";
    case A::CreateNewGame:
        return "create_new_game";
    case A::RestorePartialState:
        return "restore_partial_state";
    case A::ResetPlayerState:
        return "reset_player_state";
    case A::RejoinAsSpectator:
        return "rejoin_as_spectator";
    case A::RetryConnection:
        return "retry_connection";
    case A::SwitchTransport:
        return "switch_transport";
    case A::ReduceQuality:
        return "reduce_quality";
    case A::ResetTimer:
        return "reset_timer";
    case A::SyncWithServer:
        return "sync_with_server";
    case A::UseDefaultTimer:
        return "use_default_timer";
    case A::SkipGracePeriod:
        return "skip_grace_period";
    case A::DefaultContinuation:
        return "default_continuation";
    case A::EndGame:
        return "end_game";
    case A::UseMemoryStorage:
        return "use_memory_storage";
    case A::RetryDatabase:
        return "retry_database";
    case A::SyncWhenAvailable:
        return "sync_when_available";
    case A::ProcessSequentially:
        return "process_sequentially";
    case A::BatchProcess:
        return "batch_process";
    case A::AbandonGame:
        return "abandon_game";
    case A::ExtendTimeouts:
        return "extend_timeouts";
    case A::ReduceFrequency:
        return "reduce_frequency";
    case A::SimplifyProtocol:
        return "simplify_protocol";
    }
    return "unknown";
}

const FallbackStrategy& StrategyFor(FailureKind kind) {
    return StrategyTable().at(kind);
}

RecoveryAction FinalActionFor(FailureKind kind) {
    return StrategyFor(kind).final_action;
}

std::size_t RecoveryCoordinator::recentFailures(FailureKind kind, const FailureContext& context,
                                                core::TimePoint now) const {
    return static_cast<std::size_t>(
        std::count_if(history_.begin(), history_.end(), [&](const FailureRecord& record) {
            return SameSubject(record, kind, context) && now - record.at <= kRetryWindow;
        }));
}

RecoveryOutcome RecoveryCoordinator::handle(FailureKind kind, const FailureContext& context,
                                            core::TimePoint now, const ActionExecutor& execute) {
    history_.push_back(FailureRecord{kind, context, now});
    while (history_.size() > kHistoryCapacity) {
        history_.pop_front();
    }

    const FallbackStrategy& strategy = StrategyFor(kind);
    RecoveryOutcome outcome;
    outcome.strategy = strategy.name;
    outcome.user_message = strategy.user_message;

    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Recovering from %s (game %s, player %s): %s",
                FailureName(kind), context.game_id.c_str(), context.player_id.c_str(),
                context.message.c_str());

    try {
        const std::size_t attempts = recentFailures(kind, context, now);
        if (strategy.retryable && attempts > static_cast<std::size_t>(strategy.max_retries)) {
            const RecoveryAction action = FinalActionFor(kind);
            const bool done = execute(action, context);
            outcome.attempted.emplace_back(action, done);
            outcome.success = done;
            outcome.resolved_by = done ? std::optional<RecoveryAction>(action) : std::nullopt;
            outcome.final_fallback = true;
            outcome.retryable = false;
            outcome.user_message = "Unable to recover automatically.";
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s exceeded %d retries, forcing %s",
                         FailureName(kind), strategy.max_retries, RecoveryActionName(action));
            return outcome;
        }

        for (RecoveryAction action : strategy.actions) {
            const bool done = execute(action, context);
            outcome.attempted.emplace_back(action, done);
            if (done) {
                outcome.success = true;
                outcome.resolved_by = action;
                break;
            }
        }
    } catch (const std::exception& ex) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "Recovery for %s failed: %s",
                        FailureName(kind), ex.what());
        outcome.success = false;
        outcome.critical = true;
        outcome.final_fallback = true;
        outcome.retryable = false;
        outcome.retry_delay = core::Millis(0);
        outcome.user_message = "Something went wrong. Please refresh or contact support.";
        return outcome;
    }

    outcome.retryable = !outcome.success && strategy.retryable;
    outcome.retry_delay = outcome.retryable ? strategy.retry_delay : core::Millis(0);
    if (!outcome.success) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "No remedy for %s yet", FailureName(kind));
    }
    return outcome;
}

}  // namespace rummi::session
