#include <laurel/awards/achievement_ledger.hpp>
#include <laurel/awards/achievement_ids.hpp>
#include <laurel/core/log.hpp>
#include <ctime>
#include <format>

namespace laurel::awards {

// ============================================================================
// Registration
// ============================================================================

void AchievementLedger::register_achievement(AchievementInfo info) {
    if (info.achievement_id.empty()) {
        core::log_error("achievements", "Cannot register achievement with empty ID");
        return;
    }

    if (auto* existing = find(info.achievement_id)) {
        core::log_warning("achievements", "Overwriting existing achievement: {}", info.achievement_id);
        info.earned = existing->earned;
        info.earned_timestamp = existing->earned_timestamp;
        *existing = std::move(info);
        return;
    }

    m_index.emplace(info.achievement_id, m_achievements.size());
    m_achievements.push_back(std::move(info));
}

void AchievementLedger::load_default_achievements() {
    namespace ids = achievement_ids;

    auto add = [this](const char* id, const char* name, const char* description,
                      const char* how_to_earn, int points) {
        AchievementInfo info;
        info.achievement_id = id;
        info.display_name = name;
        info.description = description;
        info.how_to_earn = how_to_earn;
        info.points = points;
        register_achievement(std::move(info));
    };

    add(ids::OneHitWonderExploder, "One Hit Wonder Exploder",
        "Completed the site Spooky using only one Exploder",
        "Complete the site Spooky using only one Exploder", 5);
    add(ids::Einstein, "Einstein was a Physicist",
        "Collected all pickup items with a single gerbil and a single bomb on the site Sink.",
        "Collect all pickup items with a single gerbil and a single bomb on the site Sink.", 10);
    add(ids::WipeoutProgress01, "8 Wipeouts",
        "Collected 8 Wipeouts by being fast or frugal with weapon usage.",
        "Collect 8 Wipeouts by being fast or frugal with weapon usage.", 5);
    add(ids::SpinCycle, "Spin Cycle",
        "Made a gerbil rotate 12 times on site Newton's Gerbil.",
        "Make a gerbil rotate 12 times on site Newton's Gerbil.", 5);
    add(ids::OneHitWonderDisintegrator, "One Hit Wonder Disintegrator",
        "Completed the site Be Decisive using only one Disintegrator",
        "Complete the site Be Decisive using only one Disintegrator", 10);
    add(ids::GameProgress01, "36 Sites Demolished",
        "Demolished 36 Gerbil Sites.", "Demolish 36 Gerbil Sites.", 15);
    add(ids::DisintegrationMad, "Disintegration Mad",
        "Disintegrated a Red Alarm Gerbil.", "Disintegrate something you think you shouldn't touch!", 5);
    add(ids::WipeoutProgress02, "16 Wipeouts",
        "Collected 16 Wipeouts by being fast or frugal with weapon usage.",
        "Collect 16 Wipeouts by being fast or frugal with weapon usage.", 10);
    add(ids::PenguinLover, "Penguin Lover",
        "Avoided detonating any penguins on level Bad Neighbors",
        "Avoid detonating any penguins on level Bad Neighbors", 5);
    add(ids::GameProgress02, "72 Sites Demolished",
        "Demolished 72 Gerbil Sites.", "Demolish 72 Gerbil Sites.", 20);
    add(ids::GoldProgress01, "36 Gold Chests", "Got 36 Gold Chests.", "Get 36 Gold Chests.", 10);
    add(ids::SpeedFreak01, "Speed Freak",
        "Completed site Two Seasons in 32 seconds or less.",
        "Complete site Two Seasons in 32 seconds or less.", 5);
    add(ids::GoldProgress02, "72 Gold Chests", "Got 72 Gold Chests.", "Get 72 Gold Chests.", 15);
    add(ids::BombParty, "Bomb Party", "Used at least 10 bombs on any site.", "Use at least 10 bombs on any site.", 10);
    add(ids::FirstPickup, "First Pickup", "Got any pickup on any site.", "Get any pickup on any site.", 5);
    add(ids::GoldProgress00, "First Gold Chest",
        "Got one Gold Chest by scoring highly on any site.",
        "Get one Gold Chest by scoring highly on any site.", 10);
    add(ids::WipeoutProgress00, "First Wipeout",
        "Collected one Wipeout by being fast or frugal with weapon usage.",
        "Collect one Wipeout by being fast or frugal with weapon usage.", 10);
    add(ids::FirstAlarmGerbils, "First Alarm Gerbils",
        "Avoided the Red Alarm Gerbils on site Collateral.",
        "Avoid the Red Alarm Gerbils on site Collateral.", 10);
    add(ids::ScoreProgress00, "Score 20,000", "Scored 20,000 points.", "Score 20,000 points.", 15);
    add(ids::ScoreProgress01, "Score 40,000", "Scored 40,000 points.", "Score 40,000 points.", 20);
}

// ============================================================================
// IAchievementSink
// ============================================================================

void AchievementLedger::award(const std::string& achievement_id) {
    core::log_info("achievements", "Received request to award {}", achievement_id);

    auto* info = find(achievement_id);
    if (!info) {
        core::log_warning("achievements", "Unknown achievement: {}", achievement_id);
        return;
    }

    if (info->earned) {
        core::log_debug("achievements", "Achievement already earned: {}", achievement_id);
        return;
    }

    info->earned = true;
    info->earned_timestamp = static_cast<uint64_t>(std::time(nullptr));

    core::log_info("achievements", "Achievement earned: {} ({})", achievement_id, info->display_name);

    AchievementNotification notif;
    notif.achievement_id = achievement_id;
    notif.title = "Achievement Earned!";
    notif.display_name = info->display_name;
    notif.points = info->points;
    notif.timestamp = info->earned_timestamp;
    m_pending_notifications.push_back(std::move(notif));

    if (m_on_earned) {
        m_on_earned(*info);
    }
}

// ============================================================================
// Persistence hooks
// ============================================================================

void AchievementLedger::mark_earned(const std::vector<std::string>& achievement_ids) {
    for (const auto& id : achievement_ids) {
        auto* info = find(id);
        if (!info) {
            core::log_warning("achievements", "Cannot restore unknown achievement: {}", id);
            continue;
        }
        info->earned = true;
    }
}

void AchievementLedger::reset() {
    core::log_info("achievements", "Resetting all earned achievements");
    for (auto& info : m_achievements) {
        info.earned = false;
        info.earned_timestamp = 0;
    }
    m_pending_notifications.clear();
}

// ============================================================================
// Queries
// ============================================================================

bool AchievementLedger::is_earned(const std::string& achievement_id) const {
    const auto* info = get(achievement_id);
    return info && info->earned;
}

const AchievementInfo* AchievementLedger::get(const std::string& achievement_id) const {
    auto it = m_index.find(achievement_id);
    if (it == m_index.end()) return nullptr;
    return &m_achievements[it->second];
}

std::vector<std::string> AchievementLedger::earned_ids() const {
    std::vector<std::string> result;
    for (const auto& info : m_achievements) {
        if (info.earned) {
            result.push_back(info.achievement_id);
        }
    }
    return result;
}

int AchievementLedger::earned_count() const {
    int count = 0;
    for (const auto& info : m_achievements) {
        if (info.earned) ++count;
    }
    return count;
}

int AchievementLedger::earned_points() const {
    int total = 0;
    for (const auto& info : m_achievements) {
        if (info.earned) total += info.points;
    }
    return total;
}

int AchievementLedger::total_points() const {
    int total = 0;
    for (const auto& info : m_achievements) {
        total += info.points;
    }
    return total;
}

std::string AchievementLedger::summary() const {
    return std::format("{} of {} (G), {} of {} Achievements",
                       earned_points(), total_points(), earned_count(), total_count());
}

// ============================================================================
// Notifications
// ============================================================================

std::vector<AchievementNotification> AchievementLedger::take_pending_notifications() {
    auto result = std::move(m_pending_notifications);
    m_pending_notifications.clear();
    return result;
}

void AchievementLedger::set_on_earned(EarnedCallback callback) {
    m_on_earned = std::move(callback);
}

// ============================================================================
// Internal
// ============================================================================

AchievementInfo* AchievementLedger::find(const std::string& achievement_id) {
    auto it = m_index.find(achievement_id);
    if (it == m_index.end()) return nullptr;
    return &m_achievements[it->second];
}

} // namespace laurel::awards
