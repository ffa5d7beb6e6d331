// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for the index engine

#include "config/engine_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace geochron {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Helper to convert string to a non-negative count
static size_t ParseCount(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(key + " must be a non-negative integer, got \"" + value + "\"");
    }
    return static_cast<size_t>(std::stoull(value));
}

// Apply one key/value pair; unknown keys are ignored
static void ApplySetting(EngineConfig& config,
                         const std::string& section,
                         const std::string& key,
                         const std::string& value) {
    if (section == "spatial") {
        if (key == "max_fanout") config.spatial.max_fanout = ParseCount(key, value);
    }
    else if (section == "temporal") {
        if (key == "default_limit") config.temporal.default_limit = ParseCount(key, value);
    }
    else if (section == "cache") {
        if (key == "capacity") config.cache.capacity = ParseCount(key, value);
        else if (key == "ttl_seconds") config.cache.ttl_seconds = ParseCount(key, value);
        else if (key == "sweep_interval_seconds") config.cache.sweep_interval_seconds = ParseCount(key, value);
        else if (key == "sweep_batch_size") config.cache.sweep_batch_size = ParseCount(key, value);
    }
    else if (section == "coordinator") {
        if (key == "auto_create_indexes") config.coordinator.auto_create_indexes = ParseBool(value);
        else if (key == "default_limit") config.coordinator.default_limit = ParseCount(key, value);
    }
    else if (section == "journal") {
        if (key == "backend") config.journal.backend = value;
        else if (key == "sqlite_path") config.journal.sqlite_path = value;
    }
    else if (section == "logging") {
        if (key == "level") config.logging.level = value;
    }
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open config file: {}", filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        spdlog::error("Failed to initialize YAML parser");
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    bool expecting_section = true;
    int depth = 0;
    int sequence_depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            spdlog::error("YAML parse error at line {}: {}",
                          parser.problem_mark.line + 1,
                          parser.problem ? parser.problem : "unknown");
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                if (depth == 3) {
                    current_key.clear();  // Nested mapping under a key: ignored
                }
                break;

            case YAML_SEQUENCE_START_EVENT:
                sequence_depth++;
                if (depth == 2) {
                    current_key.clear();  // Sequence under a key: ignored
                }
                break;

            case YAML_SEQUENCE_END_EVENT:
                sequence_depth--;
                if (depth == 1 && sequence_depth == 0) {
                    current_section.clear();  // Top-level sequence value consumed
                    expecting_section = true;
                }
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                    expecting_section = true;
                }
                break;

            case YAML_SCALAR_EVENT: {
                if (sequence_depth > 0) {
                    break;
                }

                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level keys alternate with their (scalar or mapping) values
                    if (expecting_section) {
                        current_section = value;
                        expecting_section = false;
                    } else {
                        current_section.clear();
                        expecting_section = true;
                    }
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            spdlog::error("Invalid value for {}.{}: {}",
                                          current_section, current_key, e.what());
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        spdlog::error("Configuration validation failed:");
        for (const auto& error : config.GetValidationErrors()) {
            spdlog::error("  - {}", error);
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open file for writing: {}", filepath);
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# geochron engine configuration\n\n";

    ss << "spatial:\n";
    ss << "  max_fanout: " << spatial.max_fanout << "\n\n";

    ss << "temporal:\n";
    ss << "  default_limit: " << temporal.default_limit << "\n\n";

    ss << "cache:\n";
    ss << "  capacity: " << cache.capacity << "\n";
    ss << "  ttl_seconds: " << cache.ttl_seconds << "\n";
    ss << "  sweep_interval_seconds: " << cache.sweep_interval_seconds << "\n";
    ss << "  sweep_batch_size: " << cache.sweep_batch_size << "\n\n";

    ss << "coordinator:\n";
    ss << "  auto_create_indexes: " << (coordinator.auto_create_indexes ? "true" : "false") << "\n";
    ss << "  default_limit: " << coordinator.default_limit << "\n\n";

    ss << "journal:\n";
    ss << "  backend: \"" << journal.backend << "\"\n";
    ss << "  sqlite_path: \"" << journal.sqlite_path << "\"\n\n";

    ss << "logging:\n";
    ss << "  level: \"" << logging.level << "\"\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate spatial settings
    if (spatial.max_fanout < 4) {
        errors.push_back("spatial max_fanout must be at least 4");
    }

    // Validate page sizes
    if (temporal.default_limit == 0) {
        errors.push_back("temporal default_limit must be greater than 0");
    }
    if (coordinator.default_limit == 0) {
        errors.push_back("coordinator default_limit must be greater than 0");
    }

    // Validate cache settings
    if (cache.capacity == 0) {
        errors.push_back("cache capacity must be greater than 0");
    }
    const size_t max_seconds = static_cast<size_t>(
        std::chrono::seconds(QueryCache::kMaxDuration).count());
    if (cache.ttl_seconds == 0 || cache.ttl_seconds > max_seconds) {
        errors.push_back("cache ttl_seconds must be between 1 and " +
                         std::to_string(max_seconds) + " (one year)");
    }
    if (cache.sweep_interval_seconds == 0 || cache.sweep_interval_seconds > max_seconds) {
        errors.push_back("cache sweep_interval_seconds must be between 1 and " +
                         std::to_string(max_seconds) + " (one year)");
    }
    if (cache.sweep_batch_size == 0) {
        errors.push_back("cache sweep_batch_size must be greater than 0");
    }

    // Validate journal settings
    if (journal.backend != "memory" && journal.backend != "sqlite") {
        errors.push_back("journal backend must be one of: memory, sqlite");
    }
    if (journal.backend == "sqlite" && journal.sqlite_path.empty()) {
        errors.push_back("journal sqlite_path is required for the sqlite backend");
    }

    // Validate logging
    if (logging.level != "trace" && logging.level != "debug" &&
        logging.level != "info" && logging.level != "warn" &&
        logging.level != "error" && logging.level != "off") {
        errors.push_back("logging level must be one of: trace, debug, info, warn, error, off");
    }

    return errors;
}

IndexCoordinator::Config EngineConfig::ToCoordinatorConfig() const {
    IndexCoordinator::Config config;
    config.spatial.max_fanout = spatial.max_fanout;
    config.cache.capacity = cache.capacity;
    config.cache.ttl = std::chrono::seconds(cache.ttl_seconds);
    config.cache.sweep_interval = std::chrono::seconds(cache.sweep_interval_seconds);
    config.cache.sweep_batch_size = cache.sweep_batch_size;
    config.auto_create_indexes = coordinator.auto_create_indexes;
    config.default_limit = coordinator.default_limit;
    config.default_series_limit = temporal.default_limit;
    return config;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

} // namespace geochron
