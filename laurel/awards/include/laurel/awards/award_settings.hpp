#pragma once

#include <string>

namespace laurel::awards {

struct AwardSettings {
    bool enabled = true;
    float initial_delay = 6.0f;         // Seconds before the first check, keeps toasts off the splash screen
    float heartbeat_interval = 2.0f;    // Seconds between checks
    bool debug_overlay = false;         // Log every key figure on each heartbeat
    std::string rules_path = "";        // Empty = built-in award rules
    std::string log_level = "info";

    // Load settings from JSON file; keeps current values on failure
    bool load(const std::string& path);

    // Save settings to JSON file
    bool save(const std::string& path) const;

    // Reset to defaults
    void reset();
};

} // namespace laurel::awards
