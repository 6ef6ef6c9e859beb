#pragma once

#include <laurel/awards/award_rule.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace laurel::awards {

// ============================================================================
// AwardCatalog - Ordered, validated list of award rules
// ============================================================================
//
// Rules are evaluated in the order they were added. The structure is fixed once
// the engine has loaded its content; session state lives in AwardEngine.

class AwardCatalog {
public:
    // Throws std::invalid_argument for an invalid rule or a duplicate id
    void add(AwardRule rule);

    // Loads rules from a JSON file ({"awards": [...]} or a bare array). Broken
    // items are logged and skipped; returns false if anything failed.
    bool load_from_file(const std::string& path);

    // Same as load_from_file for an already parsed document
    bool load_from_json(const nlohmann::json& root, const std::string& source = "<memory>");

    const AwardRule* find(const std::string& achievement_id) const;
    std::optional<size_t> index_of(const std::string& achievement_id) const;
    bool contains(const std::string& achievement_id) const;

    const std::vector<AwardRule>& rules() const { return m_rules; }
    const AwardRule& at(size_t index) const { return m_rules.at(index); }
    size_t size() const { return m_rules.size(); }
    bool empty() const { return m_rules.empty(); }

    void clear();

private:
    std::vector<AwardRule> m_rules;
    std::unordered_map<std::string, size_t> m_index;
};

// Registers the twenty awards of the game, in definition order
void load_default_awards(AwardCatalog& catalog);

// Parses one {"achievement_id": ..., "conditions": [...]} object
std::optional<AwardRule> deserialize_award_rule(const nlohmann::json& j, std::string& error);

} // namespace laurel::awards
