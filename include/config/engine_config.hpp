// File: include/config/engine_config.hpp
//
// YAML Configuration Support for the geochron index engine
// Loads index, cache, coordinator, journal and logging settings

#ifndef GEOCHRON_CONFIG_ENGINE_CONFIG_HPP
#define GEOCHRON_CONFIG_ENGINE_CONFIG_HPP

#include "core/index_coordinator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geochron {

/// Configuration structure for the index engine
struct EngineConfig {
    // === Spatial Index Settings ===
    struct Spatial {
        size_t max_fanout = 10;
    } spatial;

    // === Temporal Index Settings ===
    struct Temporal {
        size_t default_limit = 1000;        // Time-series page size
    } temporal;

    // === Result Cache Settings ===
    struct Cache {
        size_t capacity = 1000;
        size_t ttl_seconds = 300;           // 5 minutes; at most one year
        size_t sweep_interval_seconds = 60; // At most one year
        size_t sweep_batch_size = 256;      // Entries per lock hold
    } cache;

    // === Coordinator Settings ===
    struct Coordinator {
        bool auto_create_indexes = true;
        size_t default_limit = 100;         // Bounding-box page size
    } coordinator;

    // === Journal Settings ===
    struct JournalSettings {
        std::string backend = "memory";     // "memory" or "sqlite"
        std::string sqlite_path = "geochron_journal.db";
    } journal;

    // === Logging Settings ===
    struct Logging {
        std::string level = "info";         // trace, debug, info, warn, error, off
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// Unknown sections and keys are ignored; missing ones keep their defaults.
    /// @param yaml_content YAML content as string
    /// @return EngineConfig if successful, std::nullopt on parse or validation error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Coordinator settings derived from this configuration
    IndexCoordinator::Config ToCoordinatorConfig() const;

    /// Create default configuration
    static EngineConfig Default();
};

} // namespace geochron

#endif // GEOCHRON_CONFIG_ENGINE_CONFIG_HPP
