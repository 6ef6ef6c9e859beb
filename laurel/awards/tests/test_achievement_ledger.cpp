#include <catch2/catch_test_macros.hpp>
#include <laurel/awards/achievement_ledger.hpp>
#include <laurel/awards/achievement_ids.hpp>
#include <laurel/awards/award_catalog.hpp>
#include <string>
#include <vector>

using namespace laurel::awards;

class LedgerFixture {
protected:
    LedgerFixture() {
        ledger.load_default_achievements();
    }

    AchievementLedger ledger;
};

TEST_CASE_METHOD(LedgerFixture, "AchievementLedger default list", "[awards][ledger]") {
    REQUIRE(ledger.total_count() == 20);
    REQUIRE(ledger.total_points() == 200);
    REQUIRE(ledger.earned_count() == 0);
    REQUIRE(ledger.summary() == "0 of 200 (G), 0 of 20 Achievements");

    SECTION("Every default award rule has an achievement") {
        AwardCatalog catalog;
        load_default_awards(catalog);
        for (const auto& rule : catalog.rules()) {
            REQUIRE(ledger.get(rule.achievement_id) != nullptr);
        }
    }

    SECTION("Display data") {
        const auto* info = ledger.get(achievement_ids::SpeedFreak01);
        REQUIRE(info != nullptr);
        REQUIRE(info->display_name == "Speed Freak");
        REQUIRE(info->points == 5);
        REQUIRE_FALSE(info->earned);
    }
}

TEST_CASE_METHOD(LedgerFixture, "AchievementLedger award", "[awards][ledger]") {
    ledger.award(achievement_ids::ScoreProgress01);

    REQUIRE(ledger.is_earned(achievement_ids::ScoreProgress01));
    REQUIRE(ledger.get(achievement_ids::ScoreProgress01)->earned_timestamp > 0);
    REQUIRE(ledger.summary() == "20 of 200 (G), 1 of 20 Achievements");

    SECTION("Queues one notification") {
        REQUIRE(ledger.has_pending_notifications());
        auto notifications = ledger.take_pending_notifications();
        REQUIRE(notifications.size() == 1);
        REQUIRE(notifications[0].achievement_id == achievement_ids::ScoreProgress01);
        REQUIRE(notifications[0].title == "Achievement Earned!");
        REQUIRE(notifications[0].display_name == "Score 40,000");
        REQUIRE(notifications[0].points == 20);
        REQUIRE_FALSE(ledger.has_pending_notifications());
    }

    SECTION("Awarding again is ignored") {
        ledger.award(achievement_ids::ScoreProgress01);
        REQUIRE(ledger.take_pending_notifications().size() == 1);
        REQUIRE(ledger.earned_count() == 1);
    }

    SECTION("Reset un-earns everything") {
        ledger.reset();
        REQUIRE(ledger.earned_count() == 0);
        REQUIRE_FALSE(ledger.has_pending_notifications());
    }
}

TEST_CASE_METHOD(LedgerFixture, "AchievementLedger unknown id is safe", "[awards][ledger]") {
    REQUIRE_NOTHROW(ledger.award("NoSuchAchievement"));
    REQUIRE(ledger.earned_count() == 0);
    REQUIRE_FALSE(ledger.has_pending_notifications());
}

TEST_CASE_METHOD(LedgerFixture, "AchievementLedger on-earned callback", "[awards][ledger]") {
    std::vector<std::string> earned;
    ledger.set_on_earned([&earned](const AchievementInfo& info) {
        earned.push_back(info.achievement_id);
    });

    ledger.award(achievement_ids::FirstPickup);
    ledger.award(achievement_ids::FirstPickup);
    ledger.award(achievement_ids::BombParty);

    REQUIRE(earned == std::vector<std::string>{achievement_ids::FirstPickup, achievement_ids::BombParty});
}

TEST_CASE_METHOD(LedgerFixture, "AchievementLedger restores earned state silently", "[awards][ledger]") {
    ledger.mark_earned({achievement_ids::GoldProgress00, achievement_ids::Einstein, "Missing"});

    REQUIRE(ledger.earned_count() == 2);
    REQUIRE(ledger.earned_points() == 20);
    REQUIRE_FALSE(ledger.has_pending_notifications());
    REQUIRE(ledger.earned_ids() == std::vector<std::string>{achievement_ids::Einstein, achievement_ids::GoldProgress00});

    // Restored ids do not notify when awarded again
    ledger.award(achievement_ids::Einstein);
    REQUIRE_FALSE(ledger.has_pending_notifications());
}

TEST_CASE("AchievementLedger registration", "[awards][ledger]") {
    AchievementLedger ledger;

    AchievementInfo info;
    info.achievement_id = "Custom";
    info.display_name = "Custom";
    info.points = 15;
    ledger.register_achievement(info);
    ledger.award("Custom");

    SECTION("Overwriting keeps the earned state") {
        info.display_name = "Renamed";
        ledger.register_achievement(info);
        REQUIRE(ledger.total_count() == 1);
        REQUIRE(ledger.get("Custom")->display_name == "Renamed");
        REQUIRE(ledger.is_earned("Custom"));
    }

    SECTION("Empty id is rejected") {
        ledger.register_achievement(AchievementInfo{});
        REQUIRE(ledger.total_count() == 1);
    }
}
