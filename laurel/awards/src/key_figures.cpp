#include <laurel/awards/key_figures.hpp>
#include <cmath>
#include <format>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace laurel::awards {

namespace {

constexpr KeyFigureInfo s_key_figures[] = {
    {KeyFigureId::WipeoutsCount, "wipeouts_count", KeyFigureKind::Counter, KeyFigureScope::Global},
    {KeyFigureId::LevelsCompletedCount, "levels_completed_count", KeyFigureKind::Counter, KeyFigureScope::Global},
    {KeyFigureId::LevelCompletedName, "level_completed_name", KeyFigureKind::Label, KeyFigureScope::Instance},
    {KeyFigureId::LevelPlayingName, "level_playing_name", KeyFigureKind::Label, KeyFigureScope::Instance},
    {KeyFigureId::LevelCompletedTimer, "level_completed_timer", KeyFigureKind::Timer, KeyFigureScope::Instance},
    {KeyFigureId::RedGerbilsPoppedCount, "red_gerbils_popped_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::RedGerbilsDisintegratedCount, "red_gerbils_disintegrated_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::FlyingMaxSpeedForSingleGerbilCount, "flying_max_speed_for_single_gerbil_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::FlyingMaxTimeForSingleGerbilTimer, "flying_max_time_for_single_gerbil_timer", KeyFigureKind::Timer, KeyFigureScope::Instance},
    {KeyFigureId::PenguinsExplodedCount, "penguins_exploded_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::GoldChestsCount, "gold_chests_count", KeyFigureKind::Counter, KeyFigureScope::Global},
    {KeyFigureId::WeaponsUsedCount, "weapons_used_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::WeaponsUsedBombCount, "weapons_used_bomb_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::WeaponsUsedDisintegratorCount, "weapons_used_disintegrator_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::WeaponsUsedExploderCount, "weapons_used_exploder_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::PickupsCollectedCount, "pickups_collected_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::PickupsMaxForSingleGerbilCount, "pickups_max_for_single_gerbil_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::RotationsMaxForSingleGerbilCount, "rotations_max_for_single_gerbil_count", KeyFigureKind::Counter, KeyFigureScope::Instance},
    {KeyFigureId::TotalScoreCount, "total_score_count", KeyFigureKind::Counter, KeyFigureScope::Global},
};

static_assert(std::size(s_key_figures) == KEY_FIGURE_COUNT, "Every KeyFigureId needs a descriptor");

size_t checked_index(KeyFigureId id) {
    auto index = static_cast<size_t>(id);
    if (index >= KEY_FIGURE_COUNT) {
        throw std::invalid_argument(std::format("KeyFigureId {} is out of range", index));
    }
    return index;
}

} // anonymous namespace

// ============================================================================
// Descriptors
// ============================================================================

const KeyFigureInfo& key_figure_info(KeyFigureId id) {
    return s_key_figures[checked_index(id)];
}

std::optional<KeyFigureId> find_key_figure(std::string_view name) {
    for (const auto& info : s_key_figures) {
        if (name == info.name) {
            return info.id;
        }
    }
    return std::nullopt;
}

const char* key_figure_kind_name(KeyFigureKind kind) {
    switch (kind) {
        case KeyFigureKind::Counter: return "counter";
        case KeyFigureKind::Timer: return "timer";
        case KeyFigureKind::Label: return "label";
    }
    return "unknown";
}

// ============================================================================
// KeyFigureValue
// ============================================================================

void KeyFigureValue::wipe() {
    count = 0;
    timer = 0.0f;
    label.clear();
}

// ============================================================================
// KeyFigures - Mutators
// ============================================================================

void KeyFigures::set_count(KeyFigureId id, int value) {
    auto& v = slot(id, KeyFigureKind::Counter, "set_count");
    if (value < 0) {
        throw std::invalid_argument(std::format("set_count: {} cannot be negative ({})",
                                                key_figure_info(id).name, value));
    }
    v.count = value;
}

void KeyFigures::add_count(KeyFigureId id, int delta) {
    auto& v = slot(id, KeyFigureKind::Counter, "add_count");
    if (delta > 0 && v.count > std::numeric_limits<int>::max() - delta) {
        throw std::invalid_argument(std::format("add_count: {} would overflow ({} + {})",
                                                key_figure_info(id).name, v.count, delta));
    }
    if (v.count + delta < 0) {
        throw std::invalid_argument(std::format("add_count: {} would become negative ({} + {})",
                                                key_figure_info(id).name, v.count, delta));
    }
    v.count += delta;
}

void KeyFigures::keep_max_count(KeyFigureId id, int candidate) {
    auto& v = slot(id, KeyFigureKind::Counter, "keep_max_count");
    if (candidate > v.count) {
        v.count = candidate;
    }
}

void KeyFigures::set_timer(KeyFigureId id, float seconds) {
    auto& v = slot(id, KeyFigureKind::Timer, "set_timer");
    if (!std::isfinite(seconds) || seconds < 0.0f) {
        throw std::invalid_argument(std::format("set_timer: {} must be finite and non-negative ({})",
                                                key_figure_info(id).name, seconds));
    }
    v.timer = seconds;
}

void KeyFigures::keep_max_timer(KeyFigureId id, float candidate) {
    auto& v = slot(id, KeyFigureKind::Timer, "keep_max_timer");
    if (!std::isfinite(candidate)) {
        throw std::invalid_argument(std::format("keep_max_timer: {} needs a finite value",
                                                key_figure_info(id).name));
    }
    if (candidate > v.timer) {
        v.timer = candidate;
    }
}

void KeyFigures::set_label(KeyFigureId id, std::string text) {
    slot(id, KeyFigureKind::Label, "set_label").label = std::move(text);
}

void KeyFigures::wipe(KeyFigureId id) {
    m_values[checked_index(id)].wipe();
}

void KeyFigures::wipe_instance_figures() {
    for (const auto& info : s_key_figures) {
        if (info.scope == KeyFigureScope::Instance) {
            m_values[static_cast<size_t>(info.id)].wipe();
        }
    }
}

// ============================================================================
// KeyFigures - Queries
// ============================================================================

int KeyFigures::count(KeyFigureId id) const {
    return slot(id).count;
}

float KeyFigures::timer(KeyFigureId id) const {
    return slot(id).timer;
}

const std::string& KeyFigures::label(KeyFigureId id) const {
    return slot(id).label;
}

const KeyFigureValue& KeyFigures::value(KeyFigureId id) const {
    return slot(id);
}

std::string KeyFigures::to_string(KeyFigureId id) const {
    const auto& v = slot(id);
    if (!v.label.empty()) {
        return v.label;
    }
    if (v.timer > 0.0f) {
        return std::format("{:.2f}", v.timer);
    }
    if (v.count > 0) {
        return std::to_string(v.count);
    }
    return "(no value)";
}

std::vector<std::string> KeyFigures::describe() const {
    std::vector<std::string> lines;
    lines.reserve(KEY_FIGURE_COUNT);
    for (const auto& info : s_key_figures) {
        lines.push_back(std::format("{:>40} = {}", info.name, to_string(info.id)));
    }
    return lines;
}

// ============================================================================
// Internal
// ============================================================================

KeyFigureValue& KeyFigures::slot(KeyFigureId id, KeyFigureKind expected, const char* operation) {
    const auto& info = key_figure_info(id);
    if (info.kind != expected) {
        throw std::invalid_argument(std::format("{}: {} is a {} figure, not a {}",
                                                operation, info.name,
                                                key_figure_kind_name(info.kind),
                                                key_figure_kind_name(expected)));
    }
    return m_values[static_cast<size_t>(id)];
}

const KeyFigureValue& KeyFigures::slot(KeyFigureId id) const {
    return m_values[checked_index(id)];
}

} // namespace laurel::awards
