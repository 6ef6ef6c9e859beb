#pragma once

#include <functional>
#include <string>
#include <utility>

namespace laurel::awards {

// ============================================================================
// IAchievementSink - Receives "award this achievement" calls from AwardEngine
// ============================================================================
//
// Implementations own persistence and platform sync. The engine calls award()
// at most once per achievement per session, but implementations should still
// ignore ids they have already recorded. An implementation must not call back
// into the engine's check_awards() from award().

class IAchievementSink {
public:
    virtual ~IAchievementSink() = default;
    virtual void award(const std::string& achievement_id) = 0;
};

// Forwards every award to a callback (platform hooks, tests)
class CallbackAchievementSink : public IAchievementSink {
public:
    using Callback = std::function<void(const std::string& achievement_id)>;

    CallbackAchievementSink() = default;
    explicit CallbackAchievementSink(Callback callback) : m_callback(std::move(callback)) {}

    void set_callback(Callback callback) { m_callback = std::move(callback); }

    void award(const std::string& achievement_id) override {
        if (m_callback) {
            m_callback(achievement_id);
        }
    }

private:
    Callback m_callback;
};

} // namespace laurel::awards
