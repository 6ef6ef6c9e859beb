#pragma once

#include <laurel/awards/achievement_sink.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace laurel::awards {

// ============================================================================
// AchievementInfo - Player-facing description of one achievement
// ============================================================================

struct AchievementInfo {
    std::string achievement_id;
    std::string display_name;
    std::string description;        // Shown once earned
    std::string how_to_earn;        // Shown before earning
    int points = 0;
    bool display_before_earned = true;

    bool earned = false;
    uint64_t earned_timestamp = 0;
};

struct AchievementNotification {
    std::string achievement_id;
    std::string title;
    std::string display_name;
    int points = 0;
    uint64_t timestamp = 0;
};

// ============================================================================
// AchievementLedger - Local achievement list, usable as the engine's sink
// ============================================================================
//
// Tracks which achievements the player has earned. award() ignores ids that
// are already earned, so it is safe to call repeatedly; a genuinely new award
// queues a notification for the UI and fires the on-earned callback.

class AchievementLedger : public IAchievementSink {
public:
    using EarnedCallback = std::function<void(const AchievementInfo&)>;

    AchievementLedger() = default;

    // Registration, display order follows registration order
    void register_achievement(AchievementInfo info);
    void load_default_achievements();

    // IAchievementSink
    void award(const std::string& achievement_id) override;

    // Restore earned state from storage without notifying
    void mark_earned(const std::vector<std::string>& achievement_ids);

    // Cheat/test: un-earn everything and drop pending notifications
    void reset();

    // Queries
    bool is_earned(const std::string& achievement_id) const;
    const AchievementInfo* get(const std::string& achievement_id) const;
    const std::vector<AchievementInfo>& achievements() const { return m_achievements; }
    std::vector<std::string> earned_ids() const;

    int earned_count() const;
    int total_count() const { return static_cast<int>(m_achievements.size()); }
    int earned_points() const;
    int total_points() const;

    // "X of Y (G), A of B Achievements"
    std::string summary() const;

    // Notifications
    std::vector<AchievementNotification> take_pending_notifications();
    bool has_pending_notifications() const { return !m_pending_notifications.empty(); }

    void set_on_earned(EarnedCallback callback);

private:
    AchievementInfo* find(const std::string& achievement_id);

    std::vector<AchievementInfo> m_achievements;
    std::unordered_map<std::string, size_t> m_index;
    std::vector<AchievementNotification> m_pending_notifications;
    EarnedCallback m_on_earned;
};

} // namespace laurel::awards
