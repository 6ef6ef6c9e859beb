#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace laurel::awards {

// ============================================================================
// KeyFigureId - Every gameplay measurement the award rules can look at
// ============================================================================
//
// Global figures persist across levels and are owned by external progress
// storage. Instance figures only describe the current run of a level and are
// wiped at level start (see KeyFigures::wipe_instance_figures).

enum class KeyFigureId : uint8_t {
    WipeoutsCount = 0,                  // Global - wipeouts received across all levels
    LevelsCompletedCount,               // Global - levels completed across all levels
    LevelCompletedName,                 // Instance - level just successfully completed
    LevelPlayingName,                   // Instance - level currently playing
    LevelCompletedTimer,                // Instance - seconds taken to complete the level
    RedGerbilsPoppedCount,              // Instance
    RedGerbilsDisintegratedCount,       // Instance
    FlyingMaxSpeedForSingleGerbilCount, // Instance - best speed of any one gerbil, world units/s
    FlyingMaxTimeForSingleGerbilTimer,  // Instance - longest flight of any one gerbil
    PenguinsExplodedCount,              // Instance
    GoldChestsCount,                    // Global - gold chests across all levels
    WeaponsUsedCount,                   // Instance - all weapons
    WeaponsUsedBombCount,               // Instance
    WeaponsUsedDisintegratorCount,      // Instance
    WeaponsUsedExploderCount,           // Instance
    PickupsCollectedCount,              // Instance - across all gerbils
    PickupsMaxForSingleGerbilCount,     // Instance - best of any one gerbil
    RotationsMaxForSingleGerbilCount,   // Instance - best of any one gerbil
    TotalScoreCount,                    // Global - score earned across all levels

    Count
};

constexpr size_t KEY_FIGURE_COUNT = static_cast<size_t>(KeyFigureId::Count);

enum class KeyFigureKind : uint8_t {
    Counter,    // Non-negative integer
    Timer,      // Non-negative seconds
    Label       // Level name
};

enum class KeyFigureScope : uint8_t {
    Global,
    Instance
};

// ============================================================================
// KeyFigureInfo - Static descriptor of a key figure
// ============================================================================

struct KeyFigureInfo {
    KeyFigureId id;
    const char* name;           // snake_case, used by rule files
    KeyFigureKind kind;
    KeyFigureScope scope;
};

const KeyFigureInfo& key_figure_info(KeyFigureId id);
std::optional<KeyFigureId> find_key_figure(std::string_view name);
const char* key_figure_kind_name(KeyFigureKind kind);

// ============================================================================
// KeyFigureValue
// ============================================================================

// Only the field matching the figure's kind is ever written
struct KeyFigureValue {
    int count = 0;
    float timer = 0.0f;
    std::string label;

    void wipe();

    bool operator==(const KeyFigureValue& other) const = default;
};

// ============================================================================
// KeyFigures - Fact store with one slot per KeyFigureId
// ============================================================================
//
// Every mutator throws std::invalid_argument when the figure's kind does not
// match the operation, when the id is out of range, when a counter would
// become negative or overflow, or when a timer is negative or not finite.

class KeyFigures {
public:
    KeyFigures() = default;

    // Counters
    void set_count(KeyFigureId id, int value);
    void add_count(KeyFigureId id, int delta);
    void keep_max_count(KeyFigureId id, int candidate);

    // Timers
    void set_timer(KeyFigureId id, float seconds);
    void keep_max_timer(KeyFigureId id, float candidate);

    // Labels
    void set_label(KeyFigureId id, std::string text);

    // Reset one slot, or every Instance-scope slot
    void wipe(KeyFigureId id);
    void wipe_instance_figures();

    int count(KeyFigureId id) const;
    float timer(KeyFigureId id) const;
    const std::string& label(KeyFigureId id) const;
    const KeyFigureValue& value(KeyFigureId id) const;

    // "(no value)" for an empty slot
    std::string to_string(KeyFigureId id) const;

    // One "name = value" line per figure
    std::vector<std::string> describe() const;

private:
    KeyFigureValue& slot(KeyFigureId id, KeyFigureKind expected, const char* operation);
    const KeyFigureValue& slot(KeyFigureId id) const;

    std::array<KeyFigureValue, KEY_FIGURE_COUNT> m_values{};
};

} // namespace laurel::awards
