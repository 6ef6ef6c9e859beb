#include <laurel/awards/award_settings.hpp>
#include <laurel/core/filesystem.hpp>
#include <laurel/core/log.hpp>
#include <nlohmann/json.hpp>

namespace laurel::awards {

using json = nlohmann::json;

bool AwardSettings::load(const std::string& path) {
    std::string content = core::FileSystem::read_text(path);
    if (content.empty()) {
        core::log_warning("awards", "Award settings not found: {}", path);
        return false;
    }

    try {
        json j = json::parse(content);
        if (!j.is_object()) {
            core::log_error("awards", "Award settings {} must be a JSON object", path);
            return false;
        }

        AwardSettings loaded = *this;
        loaded.enabled = j.value("enabled", enabled);
        loaded.initial_delay = j.value("initial_delay", initial_delay);
        loaded.heartbeat_interval = j.value("heartbeat_interval", heartbeat_interval);
        loaded.debug_overlay = j.value("debug_overlay", debug_overlay);
        loaded.rules_path = j.value("rules_path", rules_path);
        loaded.log_level = j.value("log_level", log_level);

        if (loaded.initial_delay < 0.0f || loaded.heartbeat_interval < 0.0f) {
            core::log_error("awards", "Award settings {}: delays cannot be negative", path);
            return false;
        }

        *this = std::move(loaded);
        return true;
    } catch (const json::exception& e) {
        core::log_error("awards", "Failed to parse award settings {}: {}", path, e.what());
        return false;
    }
}

bool AwardSettings::save(const std::string& path) const {
    json j;

    j["enabled"] = enabled;
    j["initial_delay"] = initial_delay;
    j["heartbeat_interval"] = heartbeat_interval;
    j["debug_overlay"] = debug_overlay;
    j["rules_path"] = rules_path;
    j["log_level"] = log_level;

    return core::FileSystem::write_text(path, j.dump(4));
}

void AwardSettings::reset() {
    *this = AwardSettings{};
}

} // namespace laurel::awards
