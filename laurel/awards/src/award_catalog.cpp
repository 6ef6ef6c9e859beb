#include <laurel/awards/award_catalog.hpp>
#include <laurel/awards/achievement_ids.hpp>
#include <laurel/core/log.hpp>
#include <laurel/data/json_loader.hpp>
#include <stdexcept>

namespace laurel::awards {

// ============================================================================
// JSON Deserialization
// ============================================================================

namespace {

std::optional<AwardCondition> deserialize_condition(const nlohmann::json& j, std::string& error) {
    using namespace data::json_helpers;

    if (!require_string(j, "figure", error) || !require_string(j, "op", error)) {
        return std::nullopt;
    }

    auto figure_name = j["figure"].get<std::string>();
    auto figure = find_key_figure(figure_name);
    if (!figure) {
        error = "Unknown key figure '" + figure_name + "'";
        return std::nullopt;
    }

    auto op_symbol = j["op"].get<std::string>();
    auto op = parse_compare_op(op_symbol);
    if (!op) {
        error = "Unknown operator '" + op_symbol + "'";
        return std::nullopt;
    }

    AwardCondition cond;
    cond.figure = *figure;
    cond.op = *op;

    if (*op == CompareOp::IsSet || *op == CompareOp::IsUnset) {
        return cond;
    }

    if (!j.contains("value")) {
        error = "Condition on '" + figure_name + "' is missing 'value'";
        return std::nullopt;
    }

    const auto& value = j["value"];
    switch (key_figure_info(*figure).kind) {
        case KeyFigureKind::Counter:
            if (!value.is_number_integer()) {
                error = "Counter figure '" + figure_name + "' needs an integer value";
                return std::nullopt;
            }
            cond.count = value.get<int>();
            break;
        case KeyFigureKind::Timer:
            if (!value.is_number()) {
                error = "Timer figure '" + figure_name + "' needs a numeric value";
                return std::nullopt;
            }
            cond.timer = value.get<float>();
            break;
        case KeyFigureKind::Label:
            if (!value.is_string()) {
                error = "Label figure '" + figure_name + "' needs a string value";
                return std::nullopt;
            }
            cond.label = value.get<std::string>();
            break;
    }

    return cond;
}

} // anonymous namespace

std::optional<AwardRule> deserialize_award_rule(const nlohmann::json& j, std::string& error) {
    using namespace data::json_helpers;

    if (!require_string(j, "achievement_id", error)) {
        return std::nullopt;
    }

    AwardRule rule;
    rule.achievement_id = j["achievement_id"].get<std::string>();

    if (!j.contains("conditions") || !j["conditions"].is_array()) {
        error = "Award " + rule.achievement_id + " needs a 'conditions' array";
        return std::nullopt;
    }

    for (const auto& cond_json : j["conditions"]) {
        if (!cond_json.is_object()) {
            error = "Award " + rule.achievement_id + " has a condition that is not an object";
            return std::nullopt;
        }
        auto cond = deserialize_condition(cond_json, error);
        if (!cond) {
            error = "Award " + rule.achievement_id + ": " + error;
            return std::nullopt;
        }
        rule.conditions.push_back(std::move(*cond));
    }

    if (!validate(rule, error)) {
        return std::nullopt;
    }
    return rule;
}

// ============================================================================
// AwardCatalog
// ============================================================================

void AwardCatalog::add(AwardRule rule) {
    std::string error;
    if (!validate(rule, error)) {
        throw std::invalid_argument(error);
    }
    if (m_index.contains(rule.achievement_id)) {
        throw std::invalid_argument("Duplicate award rule: " + rule.achievement_id);
    }

    core::log_debug("awards", "Registered award rule: {} ({} conditions)",
                    rule.achievement_id, rule.conditions.size());

    m_index.emplace(rule.achievement_id, m_rules.size());
    m_rules.push_back(std::move(rule));
}

bool AwardCatalog::load_from_file(const std::string& path) {
    core::log_info("awards", "Loading award rules from: {}", path);

    auto json_opt = data::load_json_file(path);
    if (!json_opt) {
        return false;
    }
    return load_from_json(*json_opt, path);
}

bool AwardCatalog::load_from_json(const nlohmann::json& root, const std::string& source) {
    const std::string array_key = root.is_object() ? "awards" : "";
    auto result = data::parse_json_array<AwardRule>(root, deserialize_award_rule, array_key);

    for (const auto& warn : result.warnings) {
        core::log_warning("awards", "{}: {}", source, warn);
    }
    for (const auto& err : result.errors) {
        core::log_error("awards", "{}: {}", source, err);
    }

    bool ok = result.success();
    size_t added = 0;
    for (auto& rule : result.items) {
        if (m_index.contains(rule.achievement_id)) {
            core::log_error("awards", "{}: duplicate award rule {} ignored", source, rule.achievement_id);
            ok = false;
            continue;
        }
        add(std::move(rule));
        ++added;
    }

    core::log_info("awards", "Loaded {} award rules from {} ({} errors)",
                   added, source, result.error_count());
    return ok;
}

const AwardRule* AwardCatalog::find(const std::string& achievement_id) const {
    auto it = m_index.find(achievement_id);
    if (it == m_index.end()) return nullptr;
    return &m_rules[it->second];
}

std::optional<size_t> AwardCatalog::index_of(const std::string& achievement_id) const {
    auto it = m_index.find(achievement_id);
    if (it == m_index.end()) return std::nullopt;
    return it->second;
}

bool AwardCatalog::contains(const std::string& achievement_id) const {
    return m_index.contains(achievement_id);
}

void AwardCatalog::clear() {
    m_rules.clear();
    m_index.clear();
}

// ============================================================================
// Default awards
// ============================================================================

void load_default_awards(AwardCatalog& catalog) {
    using KF = KeyFigureId;
    namespace ids = achievement_ids;
    namespace levels = level_names;

    // Wipeouts collected across all levels
    catalog.add(award_rule().id(ids::WipeoutProgress00).at_least(KF::WipeoutsCount, 1).build());
    catalog.add(award_rule().id(ids::WipeoutProgress01).at_least(KF::WipeoutsCount, 8).build());
    catalog.add(award_rule().id(ids::WipeoutProgress02).at_least(KF::WipeoutsCount, 16).build());

    // Levels completed
    catalog.add(award_rule().id(ids::GameProgress01).at_least(KF::LevelsCompletedCount, 36).build());
    catalog.add(award_rule().id(ids::GameProgress02).at_least(KF::LevelsCompletedCount, 72).build());

    // Disintegrate a red alarm gerbil
    catalog.add(award_rule().id(ids::DisintegrationMad).at_least(KF::RedGerbilsDisintegratedCount, 1).build());

    // Complete a level using a single weapon of one type
    catalog.add(award_rule()
        .id(ids::OneHitWonderExploder)
        .label_is(KF::LevelCompletedName, levels::Spooky)
        .exactly(KF::WeaponsUsedExploderCount, 1)
        .build());
    catalog.add(award_rule()
        .id(ids::OneHitWonderDisintegrator)
        .label_is(KF::LevelCompletedName, levels::BeDecisive)
        .exactly(KF::WeaponsUsedDisintegratorCount, 1)
        .build());

    // Avoid detonating any penguins on a level with lots of them
    catalog.add(award_rule()
        .id(ids::PenguinLover)
        .exactly(KF::PenguinsExplodedCount, 0)
        .label_is(KF::LevelCompletedName, levels::BadNeighbors)
        .build());

    // Gold chests
    catalog.add(award_rule().id(ids::GoldProgress00).at_least(KF::GoldChestsCount, 1).build());
    catalog.add(award_rule().id(ids::GoldProgress01).at_least(KF::GoldChestsCount, 36).build());
    catalog.add(award_rule().id(ids::GoldProgress02).at_least(KF::GoldChestsCount, 72).build());

    // Complete a level very quickly
    catalog.add(award_rule()
        .id(ids::SpeedFreak01)
        .below(KF::LevelCompletedTimer, 32.0f)
        .label_is(KF::LevelCompletedName, levels::TwoSeasons)
        .build());

    // All pickups with a single gerbil and a single bomb (mid-level award)
    catalog.add(award_rule()
        .id(ids::Einstein)
        .exactly(KF::WeaponsUsedCount, 1)
        .at_least(KF::PickupsMaxForSingleGerbilCount, 7)
        .label_is(KF::LevelPlayingName, levels::Sink)
        .build());

    // Any one gerbil rotates 12 times (mid-level award)
    catalog.add(award_rule()
        .id(ids::SpinCycle)
        .at_least(KF::RotationsMaxForSingleGerbilCount, 12)
        .label_is(KF::LevelPlayingName, levels::NewtonsGerbil)
        .build());

    catalog.add(award_rule().id(ids::BombParty).at_least(KF::WeaponsUsedBombCount, 10).build());
    catalog.add(award_rule().id(ids::FirstPickup).at_least(KF::PickupsCollectedCount, 1).build());

    // Got past the first level with alarm gerbils
    catalog.add(award_rule().id(ids::FirstAlarmGerbils).label_is(KF::LevelCompletedName, levels::Collateral).build());

    // Total score
    catalog.add(award_rule().id(ids::ScoreProgress00).at_least(KF::TotalScoreCount, 20000).build());
    catalog.add(award_rule().id(ids::ScoreProgress01).at_least(KF::TotalScoreCount, 40000).build());
}

} // namespace laurel::awards
