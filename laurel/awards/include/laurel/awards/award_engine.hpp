#pragma once

#include <laurel/awards/achievement_sink.hpp>
#include <laurel/awards/award_catalog.hpp>
#include <laurel/awards/award_settings.hpp>
#include <laurel/awards/key_figures.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace laurel::awards {

// ============================================================================
// GlobalProgress - Totals pulled from persistent level progress
// ============================================================================

struct GlobalProgress {
    int wipeouts = 0;
    int levels_completed = 0;
    int gold_chests = 0;
    int total_score = 0;
};

// ============================================================================
// KeyFigureSnapshot - Instance figures captured for process suspend/resume
// ============================================================================

struct KeyFigureSnapshot {
    bool content_loaded = false;
    std::vector<std::pair<KeyFigureId, KeyFigureValue>> figures;
};

// ============================================================================
// AwardEngine
// ============================================================================
//
// Owns the key figures and the award catalog. Gameplay code updates figures
// through the mutators; update() runs check_awards() on a coarse heartbeat and
// every rule whose conditions hold is sent to the sink once per session.
//
// Not thread safe: mutators, update() and check_awards() belong to the game
// update thread.

class AwardEngine {
public:
    using GlobalProgressProvider = std::function<GlobalProgress()>;

    explicit AwardEngine(IAchievementSink& sink, AwardSettings settings = {});

    AwardEngine(const AwardEngine&) = delete;
    AwardEngine& operator=(const AwardEngine&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Builds the catalog once (rules file from settings, or the built-in awards).
    // Later calls do nothing.
    void load_content();
    bool is_content_loaded() const { return m_content_loaded; }

    // Heartbeat driven evaluation, call every frame
    void update(float delta_time);

    // ========================================================================
    // Key figure mutators
    // ========================================================================

    void set_count(KeyFigureId id, int value) { m_figures.set_count(id, value); }
    void add_count(KeyFigureId id, int delta) { m_figures.add_count(id, delta); }
    void keep_max_count(KeyFigureId id, int candidate) { m_figures.keep_max_count(id, candidate); }
    void set_timer(KeyFigureId id, float seconds) { m_figures.set_timer(id, seconds); }
    void keep_max_timer(KeyFigureId id, float candidate) { m_figures.keep_max_timer(id, candidate); }
    void set_label(KeyFigureId id, std::string text) { m_figures.set_label(id, std::move(text)); }
    void wipe(KeyFigureId id) { m_figures.wipe(id); }

    // Call at level start
    void wipe_instance_figures();

    const KeyFigures& key_figures() const { return m_figures; }

    // ========================================================================
    // Evaluation
    // ========================================================================

    // Evaluates every rule not yet awarded this session, in catalog order, and
    // awards those whose conditions hold. Returns the number awarded.
    // A rule is marked awarded before the sink is called; an exception thrown by
    // the sink propagates and the remaining rules wait for the next call.
    int check_awards();

    // Evaluates a single rule right away. Returns true if it was awarded now.
    bool check_award(const std::string& achievement_id);

    // Clears every awarded-this-session flag and wipes the Instance figures.
    // Rules that still hold are awarded again on the next check.
    void reset_session();

    bool is_awarded_this_session(const std::string& achievement_id) const;
    std::vector<std::string> awarded_this_session() const;

    // ========================================================================
    // Global progress
    // ========================================================================

    void set_global_progress_provider(GlobalProgressProvider provider);

    // Copies the provider's totals into the Global figures. Throws
    // std::invalid_argument, leaving them unchanged, if any total is negative.
    void refresh_global_figures();

    // ========================================================================
    // Snapshot
    // ========================================================================

    KeyFigureSnapshot snapshot() const;
    void restore(const KeyFigureSnapshot& snapshot);

    // ========================================================================
    // Accessors
    // ========================================================================

    const AwardCatalog& catalog() const { return m_catalog; }
    const AwardSettings& settings() const { return m_settings; }

    // Replaces the built-in rules; only valid before load_content()
    AwardCatalog& mutable_catalog();

    std::vector<std::string> describe() const { return m_figures.describe(); }

private:
    bool try_award(size_t index);

    IAchievementSink& m_sink;
    AwardSettings m_settings;

    KeyFigures m_figures;
    AwardCatalog m_catalog;
    std::vector<bool> m_awarded;        // Parallel to m_catalog.rules()

    GlobalProgressProvider m_global_progress;

    bool m_content_loaded = false;
    bool m_evaluating = false;
    float m_initial_delay_remaining = 0.0f;
    float m_heartbeat_remaining = 0.0f;
};

} // namespace laurel::awards
