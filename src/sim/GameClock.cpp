#include "sim/GameClock.hpp"
#include "core/Log.hpp"

namespace deaddrop {

GameClock::GameClock(const GameClockConfig& config) : m_config(config) {
    if (m_config.daysPerWeek < 1) {
        HOST_LOG_WARN("Clock: days per week {} is invalid, using 7", m_config.daysPerWeek);
        m_config.daysPerWeek = 7;
    }
}

void GameClock::advance(float seconds) {
    if (m_config.dayDurationSeconds <= 0.0f || seconds <= 0.0f) return;
    m_time += seconds;
    while (m_time >= m_config.dayDurationSeconds) {
        m_time -= m_config.dayDurationSeconds;
        completeDay();
    }
}

void GameClock::advanceDays(int days) {
    for (int i = 0; i < days; ++i) {
        completeDay();
    }
}

void GameClock::startWeek() {
    HOST_LOG_DEBUG("Clock: week {} started", currentWeek());
    m_signals.emit(TimeSignal::WeekPassed);
}

void GameClock::sleep() {
    HOST_LOG_DEBUG("Clock: sleep started on day {}", m_elapsedDays);
    m_signals.emit(TimeSignal::SleepStart);
}

void GameClock::completeDay() {
    ++m_elapsedDays;
    if (m_elapsedDays % m_config.daysPerWeek == 0) {
        m_signals.emit(TimeSignal::WeekPassed);
    }
    m_signals.emit(TimeSignal::DayPassed);
}

} // namespace deaddrop
