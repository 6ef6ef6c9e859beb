#include <laurel/awards/award_engine.hpp>
#include <laurel/core/log.hpp>
#include <algorithm>
#include <format>
#include <stdexcept>

namespace laurel::awards {

namespace {

// Clears the evaluating flag however the evaluation ends
class EvaluationScope {
public:
    explicit EvaluationScope(bool& flag) : m_flag(flag) { m_flag = true; }
    ~EvaluationScope() { m_flag = false; }

    EvaluationScope(const EvaluationScope&) = delete;
    EvaluationScope& operator=(const EvaluationScope&) = delete;

private:
    bool& m_flag;
};

} // anonymous namespace

AwardEngine::AwardEngine(IAchievementSink& sink, AwardSettings settings)
    : m_sink(sink)
    , m_settings(std::move(settings))
    , m_initial_delay_remaining(m_settings.initial_delay) {
}

// ============================================================================
// Lifecycle
// ============================================================================

void AwardEngine::load_content() {
    if (m_content_loaded) {
        return;
    }

    // Rules added through mutable_catalog() take precedence
    if (m_catalog.empty()) {
        if (!m_settings.rules_path.empty()) {
            if (!m_catalog.load_from_file(m_settings.rules_path)) {
                core::log_error("awards", "Award rules in {} did not load cleanly", m_settings.rules_path);
            }
        }
        if (m_catalog.empty()) {
            load_default_awards(m_catalog);
        }
    }

    m_awarded.assign(m_catalog.size(), false);
    m_content_loaded = true;

    core::log_info("awards", "Award engine ready with {} rules", m_catalog.size());
}

void AwardEngine::update(float delta_time) {
    if (!m_settings.enabled || !m_content_loaded) {
        return;
    }

    // Hold back until splash and loading screens are gone, then check on a
    // heartbeat rather than every frame. Urgent awards use check_award().
    if (m_initial_delay_remaining > 0.0f) {
        m_initial_delay_remaining -= delta_time;
        if (m_initial_delay_remaining > 0.0f) {
            return;
        }
    } else {
        m_heartbeat_remaining -= delta_time;
        if (m_heartbeat_remaining > 0.0f) {
            return;
        }
    }
    m_heartbeat_remaining = m_settings.heartbeat_interval;

    refresh_global_figures();

    if (m_settings.debug_overlay) {
        for (const auto& line : m_figures.describe()) {
            core::log_debug("awards", "{}", line);
        }
    }

    check_awards();
}

void AwardEngine::wipe_instance_figures() {
    m_figures.wipe_instance_figures();
}

// ============================================================================
// Evaluation
// ============================================================================

int AwardEngine::check_awards() {
    if (!m_content_loaded) {
        core::log_debug("awards", "check_awards called before load_content");
        return 0;
    }
    if (m_evaluating) {
        core::log_warning("awards", "Ignoring re-entrant check_awards call from an achievement sink");
        return 0;
    }

    EvaluationScope scope(m_evaluating);

    int awarded = 0;
    for (size_t i = 0; i < m_catalog.size(); ++i) {
        if (try_award(i)) {
            ++awarded;
        }
    }
    return awarded;
}

bool AwardEngine::check_award(const std::string& achievement_id) {
    if (!m_content_loaded) {
        return false;
    }
    if (m_evaluating) {
        core::log_warning("awards", "Ignoring re-entrant check_award({}) from an achievement sink", achievement_id);
        return false;
    }

    auto index = m_catalog.index_of(achievement_id);
    if (!index) {
        core::log_warning("awards", "Unknown award rule: {}", achievement_id);
        return false;
    }

    EvaluationScope scope(m_evaluating);
    return try_award(*index);
}

void AwardEngine::reset_session() {
    std::fill(m_awarded.begin(), m_awarded.end(), false);
    m_figures.wipe_instance_figures();
    core::log_info("awards", "Award session reset");
}

bool AwardEngine::is_awarded_this_session(const std::string& achievement_id) const {
    auto index = m_catalog.index_of(achievement_id);
    if (!index || *index >= m_awarded.size()) {
        return false;
    }
    return m_awarded[*index];
}

std::vector<std::string> AwardEngine::awarded_this_session() const {
    std::vector<std::string> result;
    for (size_t i = 0; i < m_awarded.size(); ++i) {
        if (m_awarded[i]) {
            result.push_back(m_catalog.at(i).achievement_id);
        }
    }
    return result;
}

// ============================================================================
// Global progress
// ============================================================================

void AwardEngine::set_global_progress_provider(GlobalProgressProvider provider) {
    m_global_progress = std::move(provider);
}

void AwardEngine::refresh_global_figures() {
    if (!m_global_progress) {
        return;
    }

    GlobalProgress progress = m_global_progress();
    if (progress.wipeouts < 0 || progress.levels_completed < 0 ||
        progress.gold_chests < 0 || progress.total_score < 0) {
        throw std::invalid_argument(std::format(
            "Global progress cannot be negative (wipeouts {}, levels {}, gold chests {}, score {})",
            progress.wipeouts, progress.levels_completed, progress.gold_chests, progress.total_score));
    }

    m_figures.set_count(KeyFigureId::WipeoutsCount, progress.wipeouts);
    m_figures.set_count(KeyFigureId::LevelsCompletedCount, progress.levels_completed);
    m_figures.set_count(KeyFigureId::GoldChestsCount, progress.gold_chests);
    m_figures.set_count(KeyFigureId::TotalScoreCount, progress.total_score);
}

// ============================================================================
// Snapshot
// ============================================================================

KeyFigureSnapshot AwardEngine::snapshot() const {
    KeyFigureSnapshot snap;
    snap.content_loaded = m_content_loaded;

    for (size_t i = 0; i < KEY_FIGURE_COUNT; ++i) {
        auto id = static_cast<KeyFigureId>(i);
        if (key_figure_info(id).scope == KeyFigureScope::Instance) {
            snap.figures.emplace_back(id, m_figures.value(id));
        }
    }
    return snap;
}

void AwardEngine::restore(const KeyFigureSnapshot& snapshot) {
    if (snapshot.content_loaded) {
        load_content();
    }

    for (const auto& [id, value] : snapshot.figures) {
        switch (key_figure_info(id).kind) {
            case KeyFigureKind::Counter:
                m_figures.set_count(id, value.count);
                break;
            case KeyFigureKind::Timer:
                m_figures.set_timer(id, value.timer);
                break;
            case KeyFigureKind::Label:
                m_figures.set_label(id, value.label);
                break;
        }
    }
}

// ============================================================================
// Accessors
// ============================================================================

AwardCatalog& AwardEngine::mutable_catalog() {
    if (m_content_loaded) {
        throw std::logic_error("The award catalog cannot change after load_content()");
    }
    return m_catalog;
}

// ============================================================================
// Internal
// ============================================================================

bool AwardEngine::try_award(size_t index) {
    if (m_awarded[index]) {
        return false;
    }

    const auto& rule = m_catalog.at(index);
    if (!rule.evaluate(m_figures)) {
        return false;
    }

    // Marked first: a failing sink does not get a second attempt this session
    m_awarded[index] = true;
    core::log_info("awards", "Awarding {}", rule.achievement_id);
    m_sink.award(rule.achievement_id);
    return true;
}

} // namespace laurel::awards
