#pragma once

#include "host/HostInterfaces.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>

namespace deaddrop::messages {

/// "(x, y, z)" with one decimal
inline std::string formatPosition(const Vec3& pos) {
    return fmt::format("({:.1f}, {:.1f}, {:.1f})", pos.x, pos.y, pos.z);
}

inline std::string dropLive(int tier, const Vec3& pos) {
    return fmt::format("Tier {} package is live. Go get it: {}", tier, formatPosition(pos));
}

inline std::string unknownTier() {
    return "I don't know what kind of drop you're asking for.";
}

inline std::string notUnlocked(int tier) {
    return fmt::format("You're not high enough in the game to get a tier {} drop yet.", tier);
}

inline std::string noLocations() {
    return "No safe spot to stash anything right now. Try again later.";
}

inline std::string requestAccepted(int tier) {
    return fmt::format("You got it. Dropping tier {} supply now.", tier);
}

inline std::string dailyTier(int tier) {
    return fmt::format("Today's drop tier: {}. Better loot awaits.", tier);
}

} // namespace deaddrop::messages
