#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Random.hpp"
#include "mod/DropMod.hpp"
#include "sim/ContactBook.hpp"
#include "sim/GameClock.hpp"
#include "sim/ItemDatabase.hpp"
#include "sim/SimWorld.hpp"

#include <filesystem>
#include <memory>
#include <string>

using namespace deaddrop;

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    Config config;
    if (!config.loadFromFile(configPath)) {
        Log::init("", "info");
        LOG_CRITICAL("Could not load config from '{}'", configPath);
        return 1;
    }
    Log::init(config.getString("logging.file", ""), config.getString("logging.level", "info"));
    LOG_INFO("Configuration loaded from '{}'", configPath);

    // Per-machine overrides: "config.json" -> "config.local.json"
    {
        namespace fs = std::filesystem;
        fs::path base(configPath);
        fs::path localFile = base.parent_path()
            / (base.stem().string() + ".local" + base.extension().string());
        if (config.mergeFromFile(localFile.string())) {
            LOG_INFO("Local config merged from '{}'", localFile.string());
        }
    }

    GameClockConfig clockConfig;
    clockConfig.daysPerWeek = config.getInt("schedule.days_per_week", DEFAULT_DAYS_PER_WEEK);
    GameClock clock(clockConfig);

    SimWorld world;
    world.loadFromConfig(config);

    ItemDatabase items;
    items.loadFromConfig(config);

    ContactBook contacts;

    const int seed = config.getInt("sim.seed", 0);
    std::unique_ptr<MersenneRandom> rng = seed != 0
        ? std::make_unique<MersenneRandom>(static_cast<uint32_t>(seed))
        : std::make_unique<MersenneRandom>();

    DropMod mod(config, HostServices{clock, clock.signals(), world, items, contacts, *rng});

    mod.onSceneLoaded("Menu");
    mod.onSceneLoaded(mod.sceneName());
    if (!mod.isStarted()) {
        LOG_CRITICAL("Mod did not start");
        return 1;
    }
    clock.startWeek();

    const int days = config.getInt("sim.days", 28);
    int manualSpawned = 0;
    int manualDenied = 0;

    for (int day = 0; day < days; ++day) {
        // Once a week the player phones in one request per tier
        if (clock.dayOfWeek() == 3) {
            for (int tier : mod.catalog()->tiers()) {
                if (mod.contact()->requestCustomDrop(tier)) {
                    ++manualSpawned;
                } else {
                    ++manualDenied;
                }
            }
        }
        clock.advanceDays(1);
        clock.sleep();
    }

    const SchedulerState& state = mod.scheduler()->state();
    LOG_INFO("Simulated {} days (week {}): {} manual drops spawned, {} denied, last automatic drop week {}",
             clock.elapsedDays(), clock.currentWeek(), manualSpawned, manualDenied,
             state.lastAutoDropWeek);

    mod.shutdown();
    Log::shutdown();
    return 0;
}
