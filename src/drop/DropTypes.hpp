#pragma once

#include "host/HostInterfaces.hpp"

#include <optional>
#include <string>

namespace deaddrop {

constexpr int NO_WEEK = -1;
constexpr int NO_DAY = -1;

enum class DropPhase {
    Idle,       // No drop placed
    Active      // One drop placed and not yet cleared by sleep
};

enum class DropKind {
    Manual,         // Player asked the contact
    Automatic,      // Weekly scheduled drop
    DailyRefresh    // Unconditional daily drop
};

enum class DropOutcome {
    Spawned,
    UnknownTier,
    NotUnlocked,
    NoLocations,
    NotInitialized
};

inline const char* dropKindToString(DropKind kind) {
    switch (kind) {
        case DropKind::Manual:       return "manual";
        case DropKind::Automatic:    return "automatic";
        case DropKind::DailyRefresh: return "daily";
    }
    return "unknown";
}

/// Failure reason as reported to callers and logs
inline const char* dropOutcomeToString(DropOutcome outcome) {
    switch (outcome) {
        case DropOutcome::Spawned:        return "spawned";
        case DropOutcome::UnknownTier:    return "unknown tier";
        case DropOutcome::NotUnlocked:    return "not unlocked yet";
        case DropOutcome::NoLocations:    return "no locations";
        case DropOutcome::NotInitialized: return "not initialized";
    }
    return "unknown";
}

/// Result of one spawn attempt
struct DropRequest {
    int tier = 0;
    DropKind kind = DropKind::Manual;
    DropOutcome outcome = DropOutcome::NotInitialized;
    int itemsPlaced = 0;

    bool spawned() const { return outcome == DropOutcome::Spawned; }
};

/// The one drop currently placed in the world
struct ActiveDrop {
    std::string locationId;
    Vec3 position;
    int tier = 0;
    DropKind kind = DropKind::Manual;
    int itemsPlaced = 0;
};

/// Mutable scheduling state, owned by DropScheduler
struct SchedulerState {
    bool activeDropPresent = false;
    int lastAutoDropWeek = NO_WEEK;
    int scheduledDayOfWeek = NO_DAY;

    bool operator==(const SchedulerState& other) const {
        return activeDropPresent == other.activeDropPresent &&
               lastAutoDropWeek == other.lastAutoDropWeek &&
               scheduledDayOfWeek == other.scheduledDayOfWeek;
    }
    bool operator!=(const SchedulerState& other) const { return !(*this == other); }
};

} // namespace deaddrop
