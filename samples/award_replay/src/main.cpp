// Award Replay - Plays back a scripted run of the Sink level through the award engine
//
// Usage:
//   award_replay [settings.json]
//
// Feeds key figures the way gameplay code would (weapons fired, pickups,
// level completion), ticks the engine at 60 Hz and prints every achievement
// the ledger records along with the final summary.

#include <laurel/awards/achievement_ids.hpp>
#include <laurel/awards/achievement_ledger.hpp>
#include <laurel/awards/award_engine.hpp>
#include <laurel/awards/award_settings.hpp>
#include <laurel/core/log.hpp>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

using namespace laurel::awards;
namespace core = laurel::core;

namespace {

constexpr float FRAME_TIME = 1.0f / 60.0f;

// Something that happens at a given time into the replay
struct ReplayEvent {
    float time;
    const char* description;
    std::function<void(AwardEngine&)> apply;
};

// Stand-in for the persistent level progress store
struct ProgressStore {
    GlobalProgress progress{3, 11, 4, 18500};
};

std::vector<ReplayEvent> build_sink_replay(ProgressStore& store) {
    return {
        {0.0f, "Level start", [](AwardEngine& engine) {
            engine.wipe_instance_figures();
            engine.set_label(KeyFigureId::LevelPlayingName, level_names::Sink);
        }},
        {1.5f, "Bomb placed", [](AwardEngine& engine) {
            engine.add_count(KeyFigureId::WeaponsUsedCount, 1);
            engine.add_count(KeyFigureId::WeaponsUsedBombCount, 1);
        }},
        {2.0f, "Gerbil launched", [](AwardEngine& engine) {
            engine.keep_max_count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount, 640);
            engine.keep_max_timer(KeyFigureId::FlyingMaxTimeForSingleGerbilTimer, 1.2f);
        }},
        {3.0f, "Pickups collected", [](AwardEngine& engine) {
            for (int i = 1; i <= 7; ++i) {
                engine.add_count(KeyFigureId::PickupsCollectedCount, 1);
                engine.keep_max_count(KeyFigureId::PickupsMaxForSingleGerbilCount, i);
            }
            // Story award, no waiting for the heartbeat
            engine.check_award(achievement_ids::Einstein);
        }},
        {4.5f, "Gerbil landed", [](AwardEngine& engine) {
            engine.keep_max_count(KeyFigureId::RotationsMaxForSingleGerbilCount, 5);
            engine.keep_max_timer(KeyFigureId::FlyingMaxTimeForSingleGerbilTimer, 3.4f);
        }},
        {9.0f, "Level completed", [&store](AwardEngine& engine) {
            engine.set_timer(KeyFigureId::LevelCompletedTimer, 9.0f);
            engine.set_label(KeyFigureId::LevelCompletedName, level_names::Sink);
            store.progress.levels_completed += 1;
            store.progress.wipeouts += 1;
            store.progress.gold_chests += 1;
            store.progress.total_score += 2400;
        }},
    };
}

} // anonymous namespace

int main(int argc, char** argv) {
    AwardSettings settings;
    if (argc > 1 && !settings.load(argv[1])) {
        core::log_warning("replay", "Using default award settings");
    }
    core::set_log_level(core::parse_log_level(settings.log_level));

    AchievementLedger ledger;
    ledger.load_default_achievements();
    ledger.set_on_earned([](const AchievementInfo& info) {
        std::cout << "  * " << info.display_name << " (" << info.points << " G)\n";
    });

    ProgressStore store;
    AwardEngine engine(ledger, settings);
    engine.set_global_progress_provider([&store]() { return store.progress; });

    try {
        engine.load_content();

        auto events = build_sink_replay(store);
        size_t next_event = 0;
        const float duration = events.back().time + settings.initial_delay + 2.0f * settings.heartbeat_interval;

        for (float time = 0.0f; time <= duration; time += FRAME_TIME) {
            while (next_event < events.size() && events[next_event].time <= time) {
                std::cout << "[" << events[next_event].time << "s] " << events[next_event].description << "\n";
                events[next_event].apply(engine);
                ++next_event;
            }
            engine.update(FRAME_TIME);
        }
    } catch (const std::exception& e) {
        core::log_error("replay", "Replay failed: {}", e.what());
        return 1;
    }

    for (const auto& line : engine.describe()) {
        std::cout << line << "\n";
    }

    std::cout << "\nEarned this run:\n";
    for (const auto& notification : ledger.take_pending_notifications()) {
        std::cout << "  " << notification.title << " " << notification.display_name << "\n";
    }
    std::cout << ledger.summary() << "\n";
    return 0;
}
