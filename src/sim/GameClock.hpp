#pragma once

#include "host/HostInterfaces.hpp"
#include "host/TimeSignals.hpp"

namespace deaddrop {

/// Configuration for the simulated day cycle
struct GameClockConfig {
    float dayDurationSeconds = 1440.0f;   // One in-game day (24 real minutes)
    int daysPerWeek = 7;
};

/// In-game calendar for the simulated host.
///
/// Counts elapsed days and raises time signals on the bus.  On a day
/// boundary that starts a new week, WeekPassed is emitted before DayPassed
/// so handlers see the new week's schedule on its first day.
class GameClock : public ITimeSource {
public:
    GameClock() = default;
    explicit GameClock(const GameClockConfig& config);

    /// Advance real time; emits one set of signals per completed day
    void advance(float seconds);

    /// Step whole days
    void advanceDays(int days);

    /// Emit WeekPassed for the week the clock is in.  Hosts call this once
    /// when the world starts so the first week has a schedule.
    void startWeek();

    /// The player went to bed
    void sleep();

    int elapsedDays() const override { return m_elapsedDays; }
    int currentWeek() const { return m_elapsedDays / m_config.daysPerWeek; }
    int dayOfWeek() const { return m_elapsedDays % m_config.daysPerWeek; }

    /// Seconds into the current day
    float timeOfDay() const { return m_time; }

    TimeSignalBus& signals() { return m_signals; }
    const GameClockConfig& getConfig() const { return m_config; }

private:
    void completeDay();

    GameClockConfig m_config;
    TimeSignalBus m_signals;
    int m_elapsedDays = 0;
    float m_time = 0.0f;
};

} // namespace deaddrop
