#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <laurel/awards/key_figures.hpp>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace laurel::awards;
using Catch::Matchers::WithinAbs;

TEST_CASE("Key figure descriptors", "[awards][key_figures]") {
    SECTION("Every id has a descriptor matching its position") {
        for (size_t i = 0; i < KEY_FIGURE_COUNT; ++i) {
            auto id = static_cast<KeyFigureId>(i);
            REQUIRE(key_figure_info(id).id == id);
        }
    }

    SECTION("Kinds and scopes") {
        REQUIRE(key_figure_info(KeyFigureId::WipeoutsCount).kind == KeyFigureKind::Counter);
        REQUIRE(key_figure_info(KeyFigureId::WipeoutsCount).scope == KeyFigureScope::Global);
        REQUIRE(key_figure_info(KeyFigureId::LevelCompletedName).kind == KeyFigureKind::Label);
        REQUIRE(key_figure_info(KeyFigureId::LevelCompletedTimer).kind == KeyFigureKind::Timer);
        REQUIRE(key_figure_info(KeyFigureId::FlyingMaxTimeForSingleGerbilTimer).kind == KeyFigureKind::Timer);
        REQUIRE(key_figure_info(KeyFigureId::TotalScoreCount).scope == KeyFigureScope::Global);
        REQUIRE(key_figure_info(KeyFigureId::PickupsCollectedCount).scope == KeyFigureScope::Instance);
    }

    SECTION("Lookup by name") {
        REQUIRE(find_key_figure("weapons_used_count") == KeyFigureId::WeaponsUsedCount);
        REQUIRE(find_key_figure("level_playing_name") == KeyFigureId::LevelPlayingName);
        REQUIRE_FALSE(find_key_figure("weapons_used").has_value());
    }

    SECTION("Out of range id throws") {
        REQUIRE_THROWS_AS(key_figure_info(KeyFigureId::Count), std::invalid_argument);
    }
}

TEST_CASE("KeyFigures start zeroed", "[awards][key_figures]") {
    KeyFigures figures;

    for (size_t i = 0; i < KEY_FIGURE_COUNT; ++i) {
        auto id = static_cast<KeyFigureId>(i);
        REQUIRE(figures.value(id) == KeyFigureValue{});
        REQUIRE(figures.to_string(id) == "(no value)");
    }
}

TEST_CASE("KeyFigures counters", "[awards][key_figures]") {
    KeyFigures figures;

    SECTION("Set and add") {
        figures.set_count(KeyFigureId::WeaponsUsedBombCount, 4);
        figures.add_count(KeyFigureId::WeaponsUsedBombCount, 3);
        REQUIRE(figures.count(KeyFigureId::WeaponsUsedBombCount) == 7);
    }

    SECTION("Keep maximum ignores smaller and equal candidates") {
        figures.keep_max_count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount, 500);
        figures.keep_max_count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount, 300);
        REQUIRE(figures.count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount) == 500);
        figures.keep_max_count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount, 900);
        REQUIRE(figures.count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount) == 900);
        figures.keep_max_count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount, 900);
        REQUIRE(figures.count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount) == 900);
    }

    SECTION("Keep maximum is order independent") {
        KeyFigures other;
        for (int candidate : {900, 300, 500}) {
            other.keep_max_count(KeyFigureId::RotationsMaxForSingleGerbilCount, candidate);
        }
        for (int candidate : {300, 500, 900}) {
            figures.keep_max_count(KeyFigureId::RotationsMaxForSingleGerbilCount, candidate);
        }
        REQUIRE(figures.count(KeyFigureId::RotationsMaxForSingleGerbilCount) ==
                other.count(KeyFigureId::RotationsMaxForSingleGerbilCount));
    }

    SECTION("Negative results are rejected") {
        REQUIRE_THROWS_AS(figures.set_count(KeyFigureId::PickupsCollectedCount, -1), std::invalid_argument);
        figures.set_count(KeyFigureId::PickupsCollectedCount, 2);
        REQUIRE_THROWS_AS(figures.add_count(KeyFigureId::PickupsCollectedCount, -3), std::invalid_argument);
        REQUIRE(figures.count(KeyFigureId::PickupsCollectedCount) == 2);
    }

    SECTION("Overflowing results are rejected") {
        const int max = std::numeric_limits<int>::max();
        figures.set_count(KeyFigureId::TotalScoreCount, max);
        REQUIRE_THROWS_AS(figures.add_count(KeyFigureId::TotalScoreCount, 1), std::invalid_argument);
        REQUIRE(figures.count(KeyFigureId::TotalScoreCount) == max);

        figures.set_count(KeyFigureId::TotalScoreCount, max - 5);
        REQUIRE_NOTHROW(figures.add_count(KeyFigureId::TotalScoreCount, 5));
        REQUIRE(figures.count(KeyFigureId::TotalScoreCount) == max);
        REQUIRE_NOTHROW(figures.add_count(KeyFigureId::TotalScoreCount, std::numeric_limits<int>::min() + 1));
        REQUIRE(figures.count(KeyFigureId::TotalScoreCount) == 0);
    }

    SECTION("Adding in steps matches setting the total") {
        KeyFigures stepped;
        stepped.add_count(KeyFigureId::WeaponsUsedCount, 1);
        stepped.add_count(KeyFigureId::WeaponsUsedCount, 1);

        figures.set_count(KeyFigureId::WeaponsUsedCount, 2);

        REQUIRE(stepped.value(KeyFigureId::WeaponsUsedCount) == figures.value(KeyFigureId::WeaponsUsedCount));
        REQUIRE(stepped.describe() == figures.describe());
    }
}

TEST_CASE("KeyFigures timers and labels", "[awards][key_figures]") {
    KeyFigures figures;

    SECTION("Timer set and keep maximum") {
        figures.set_timer(KeyFigureId::LevelCompletedTimer, 31.5f);
        REQUIRE_THAT(figures.timer(KeyFigureId::LevelCompletedTimer), WithinAbs(31.5, 0.0001));

        figures.keep_max_timer(KeyFigureId::FlyingMaxTimeForSingleGerbilTimer, 2.5f);
        figures.keep_max_timer(KeyFigureId::FlyingMaxTimeForSingleGerbilTimer, 1.0f);
        REQUIRE_THAT(figures.timer(KeyFigureId::FlyingMaxTimeForSingleGerbilTimer), WithinAbs(2.5, 0.0001));
    }

    SECTION("Label set") {
        figures.set_label(KeyFigureId::LevelPlayingName, "Sink");
        REQUIRE(figures.label(KeyFigureId::LevelPlayingName) == "Sink");
        REQUIRE(figures.to_string(KeyFigureId::LevelPlayingName) == "Sink");
    }

    SECTION("Negative timer is rejected") {
        REQUIRE_THROWS_AS(figures.set_timer(KeyFigureId::LevelCompletedTimer, -0.5f), std::invalid_argument);
    }

    SECTION("Non-finite timers are rejected") {
        figures.set_timer(KeyFigureId::LevelCompletedTimer, 12.0f);

        const float nan = std::numeric_limits<float>::quiet_NaN();
        const float inf = std::numeric_limits<float>::infinity();
        REQUIRE_THROWS_AS(figures.set_timer(KeyFigureId::LevelCompletedTimer, nan), std::invalid_argument);
        REQUIRE_THROWS_AS(figures.set_timer(KeyFigureId::LevelCompletedTimer, inf), std::invalid_argument);
        REQUIRE_THROWS_AS(figures.keep_max_timer(KeyFigureId::LevelCompletedTimer, nan), std::invalid_argument);
        REQUIRE_THROWS_AS(figures.keep_max_timer(KeyFigureId::LevelCompletedTimer, inf), std::invalid_argument);
        REQUIRE_THAT(figures.timer(KeyFigureId::LevelCompletedTimer), WithinAbs(12.0, 0.0001));
    }
}

TEST_CASE("KeyFigures reject kind mismatches", "[awards][key_figures]") {
    KeyFigures figures;

    REQUIRE_THROWS_AS(figures.set_count(KeyFigureId::LevelCompletedName, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(figures.add_count(KeyFigureId::LevelCompletedTimer, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(figures.set_timer(KeyFigureId::WeaponsUsedCount, 1.0f), std::invalid_argument);
    REQUIRE_THROWS_AS(figures.keep_max_timer(KeyFigureId::LevelPlayingName, 1.0f), std::invalid_argument);
    REQUIRE_THROWS_AS(figures.set_label(KeyFigureId::TotalScoreCount, "Sink"), std::invalid_argument);

    // Nothing was written
    REQUIRE(figures.value(KeyFigureId::LevelCompletedName) == KeyFigureValue{});
    REQUIRE(figures.value(KeyFigureId::TotalScoreCount) == KeyFigureValue{});
}

TEST_CASE("KeyFigures mutators only touch their own slot", "[awards][key_figures]") {
    struct Mutation {
        KeyFigureId id;
        std::function<void(KeyFigures&)> apply;
    };

    std::vector<Mutation> mutations = {
        {KeyFigureId::WipeoutsCount, [](KeyFigures& f) { f.set_count(KeyFigureId::WipeoutsCount, 3); }},
        {KeyFigureId::PickupsCollectedCount, [](KeyFigures& f) { f.add_count(KeyFigureId::PickupsCollectedCount, 2); }},
        {KeyFigureId::FlyingMaxSpeedForSingleGerbilCount,
         [](KeyFigures& f) { f.keep_max_count(KeyFigureId::FlyingMaxSpeedForSingleGerbilCount, 500); }},
        {KeyFigureId::LevelCompletedTimer, [](KeyFigures& f) { f.set_timer(KeyFigureId::LevelCompletedTimer, 31.0f); }},
        {KeyFigureId::FlyingMaxTimeForSingleGerbilTimer,
         [](KeyFigures& f) { f.keep_max_timer(KeyFigureId::FlyingMaxTimeForSingleGerbilTimer, 2.5f); }},
        {KeyFigureId::LevelPlayingName, [](KeyFigures& f) { f.set_label(KeyFigureId::LevelPlayingName, "Sink"); }},
    };

    for (const auto& mutation : mutations) {
        KeyFigures figures;
        mutation.apply(figures);

        REQUIRE_FALSE(figures.value(mutation.id) == KeyFigureValue{});
        for (size_t i = 0; i < KEY_FIGURE_COUNT; ++i) {
            auto other = static_cast<KeyFigureId>(i);
            if (other != mutation.id) {
                INFO("mutated " << key_figure_info(mutation.id).name << ", checking " << key_figure_info(other).name);
                REQUIRE(figures.value(other) == KeyFigureValue{});
            }
        }
    }
}

TEST_CASE("KeyFigures wipe", "[awards][key_figures]") {
    KeyFigures figures;
    figures.set_count(KeyFigureId::WipeoutsCount, 3);
    figures.set_count(KeyFigureId::GoldChestsCount, 2);
    figures.set_count(KeyFigureId::WeaponsUsedCount, 5);
    figures.set_timer(KeyFigureId::LevelCompletedTimer, 12.0f);
    figures.set_label(KeyFigureId::LevelCompletedName, "Collateral");

    SECTION("Single figure") {
        figures.wipe(KeyFigureId::WeaponsUsedCount);
        REQUIRE(figures.count(KeyFigureId::WeaponsUsedCount) == 0);
        REQUIRE(figures.count(KeyFigureId::WipeoutsCount) == 3);
    }

    SECTION("Instance figures only") {
        figures.wipe_instance_figures();

        for (size_t i = 0; i < KEY_FIGURE_COUNT; ++i) {
            auto id = static_cast<KeyFigureId>(i);
            if (key_figure_info(id).scope == KeyFigureScope::Instance) {
                REQUIRE(figures.value(id) == KeyFigureValue{});
            }
        }
        REQUIRE(figures.count(KeyFigureId::WipeoutsCount) == 3);
        REQUIRE(figures.count(KeyFigureId::GoldChestsCount) == 2);
    }
}

TEST_CASE("KeyFigures describe", "[awards][key_figures]") {
    KeyFigures figures;
    figures.set_timer(KeyFigureId::LevelCompletedTimer, 31.999f);
    figures.set_count(KeyFigureId::TotalScoreCount, 20000);

    REQUIRE(figures.to_string(KeyFigureId::LevelCompletedTimer) == "32.00");
    REQUIRE(figures.to_string(KeyFigureId::TotalScoreCount) == "20000");

    auto lines = figures.describe();
    REQUIRE(lines.size() == KEY_FIGURE_COUNT);
    REQUIRE(lines.back().find("total_score_count = 20000") != std::string::npos);
}
