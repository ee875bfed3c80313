// File: src/config/optimizer_config.cpp
//
// YAML Configuration Implementation for the Adaptive Prediction Optimizer

#include "config/optimizer_config.hpp"
#include "core/logging.hpp"
#include <yaml.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace apo {

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

// std::stoull accepts "-1" and wraps it; unsigned settings reject any sign
static uint64_t ParseUnsigned(const std::string& value) {
    size_t first = value.find_first_not_of(" \t");
    if (first == std::string::npos || value[first] == '-' || value[first] == '+') {
        throw std::invalid_argument("expected an unsigned integer, got '" + value + "'");
    }
    return std::stoull(value);
}

// Apply one "section.key: value" setting; unknown keys are ignored
static void ApplySetting(OptimizerConfig& config,
                         const std::string& section,
                         const std::string& key,
                         const std::string& value) {
    if (section == "optimizer") {
        auto& o = config.optimizer;
        if (key == "default_radius_km") o.default_radius_km = std::stod(value);
        else if (key == "min_samples") o.min_samples = ParseUnsigned(value);
        else if (key == "low_confidence_samples") o.low_confidence_samples = ParseUnsigned(value);
        else if (key == "default_model_id") o.default_model_id = value;
        else if (key == "confidence_weight") o.confidence_weight = std::stod(value);
        else if (key == "sample_saturation") o.sample_saturation = ParseUnsigned(value);
        else if (key == "max_query_results") o.max_query_results = static_cast<size_t>(ParseUnsigned(value));
        else if (key == "cache_epsilon_km") o.cache_epsilon_km = std::stod(value);
        else if (key == "cache_capacity") o.cache_capacity = static_cast<size_t>(ParseUnsigned(value));
    }
    else if (section == "learning") {
        if (key == "blend") config.learning.blend = value;
        else if (key == "default_scale") config.learning.default_scale = std::stod(value);
    }
    else if (section == "prediction_cache") {
        auto& p = config.prediction_cache;
        if (key == "ttl_seconds") p.ttl_seconds = std::stod(value);
        else if (key == "time_bucket_seconds") p.time_bucket_seconds = std::stod(value);
        else if (key == "capacity") p.capacity = static_cast<size_t>(ParseUnsigned(value));
    }
    else if (section == "storage") {
        auto& s = config.storage;
        if (key == "backend") s.backend = value;
        else if (key == "cell_size_degrees") s.cell_size_degrees = std::stod(value);
        else if (key == "initial_cell_capacity") s.initial_cell_capacity = static_cast<size_t>(ParseUnsigned(value));
        else if (key == "db_path") s.db_path = value;
        else if (key == "enable_wal") s.enable_wal = ParseBool(value);
        else if (key == "synchronous") s.synchronous = value;
        else if (key == "cache_size_kb") s.cache_size_kb = static_cast<size_t>(ParseUnsigned(value));
        else if (key == "busy_timeout_ms") s.busy_timeout_ms = std::stoi(value);
    }
    else if (section == "logging") {
        if (key == "level") config.logging.level = value;
    }
}

std::optional<OptimizerConfig> OptimizerConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        APO_LOG(LogLevel::ERROR, LogComponent::CONFIG,
                "Failed to open config file: " << filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<OptimizerConfig> OptimizerConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        APO_LOG(LogLevel::ERROR, LogComponent::CONFIG, "Failed to initialize YAML parser");
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    OptimizerConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            APO_LOG(LogLevel::ERROR, LogComponent::CONFIG,
                    "YAML parse error at line " << parser.problem_mark.line + 1
                    << ": " << (parser.problem ? parser.problem : "unknown"));
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::logic_error& e) {
                            // std::stod and friends throw invalid_argument/out_of_range
                            APO_LOG(LogLevel::ERROR, LogComponent::CONFIG,
                                    "Invalid value for " << current_section << "."
                                    << current_key << ": \"" << value << "\"");
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
        APO_LOG(LogLevel::ERROR, LogComponent::CONFIG, "Configuration validation failed:");
        for (const auto& error : config.GetValidationErrors()) {
            APO_LOG(LogLevel::ERROR, LogComponent::CONFIG, "  - " << error);
        }
        return std::nullopt;
    }

    return config;
}

bool OptimizerConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        APO_LOG(LogLevel::ERROR, LogComponent::CONFIG,
                "Failed to open file for writing: " << filepath);
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string OptimizerConfig::ToYamlString() const {
    std::ostringstream ss;
    ss.precision(17);

    ss << "# Adaptive Prediction Optimizer Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "optimizer:\n";
    ss << "  default_radius_km: " << optimizer.default_radius_km << "\n";
    ss << "  min_samples: " << optimizer.min_samples << "\n";
    ss << "  low_confidence_samples: " << optimizer.low_confidence_samples << "\n";
    ss << "  default_model_id: \"" << optimizer.default_model_id << "\"\n";
    ss << "  confidence_weight: " << optimizer.confidence_weight << "\n";
    ss << "  sample_saturation: " << optimizer.sample_saturation << "\n";
    ss << "  max_query_results: " << optimizer.max_query_results << "\n";
    ss << "  cache_epsilon_km: " << optimizer.cache_epsilon_km << "\n";
    ss << "  cache_capacity: " << optimizer.cache_capacity << "\n\n";

    ss << "learning:\n";
    ss << "  blend: \"" << learning.blend << "\"\n";
    ss << "  default_scale: " << learning.default_scale << "\n\n";

    ss << "prediction_cache:\n";
    ss << "  ttl_seconds: " << prediction_cache.ttl_seconds << "\n";
    ss << "  time_bucket_seconds: " << prediction_cache.time_bucket_seconds << "\n";
    ss << "  capacity: " << prediction_cache.capacity << "\n\n";

    ss << "storage:\n";
    ss << "  backend: \"" << storage.backend << "\"\n";
    ss << "  cell_size_degrees: " << storage.cell_size_degrees << "\n";
    ss << "  initial_cell_capacity: " << storage.initial_cell_capacity << "\n";
    ss << "  db_path: \"" << storage.db_path << "\"\n";
    ss << "  enable_wal: " << (storage.enable_wal ? "true" : "false") << "\n";
    ss << "  synchronous: \"" << storage.synchronous << "\"\n";
    ss << "  cache_size_kb: " << storage.cache_size_kb << "\n";
    ss << "  busy_timeout_ms: " << storage.busy_timeout_ms << "\n\n";

    ss << "logging:\n";
    ss << "  level: \"" << logging.level << "\"\n";

    return ss.str();
}

bool OptimizerConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> OptimizerConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Recommendation settings
    if (!(optimizer.default_radius_km > 0.0) || !std::isfinite(optimizer.default_radius_km)) {
        errors.push_back("default_radius_km must be a positive number");
    }
    if (optimizer.default_model_id.empty()) {
        errors.push_back("default_model_id must not be empty");
    }
    if (!std::isfinite(optimizer.confidence_weight) ||
        optimizer.confidence_weight < 0.0 || optimizer.confidence_weight > 1.0) {
        errors.push_back("confidence_weight must be between 0.0 and 1.0");
    }
    if (optimizer.sample_saturation == 0) {
        errors.push_back("sample_saturation must be greater than 0");
    }
    if (optimizer.max_query_results == 0) {
        errors.push_back("max_query_results must be greater than 0");
    }
    if (!std::isfinite(optimizer.cache_epsilon_km) || optimizer.cache_epsilon_km < 0.0) {
        errors.push_back("cache_epsilon_km must be a non-negative number");
    }

    // Learning settings
    if (learning.blend != "simple_average" && learning.blend != "sample_weighted") {
        errors.push_back("blend must be one of: simple_average, sample_weighted");
    }
    if (!(learning.default_scale > 0.0) || !std::isfinite(learning.default_scale)) {
        errors.push_back("default_scale must be a positive number");
    }

    // Prediction cache settings
    if (!(prediction_cache.ttl_seconds > 0.0) || !(prediction_cache.ttl_seconds <= kMaxCacheSeconds)) {
        errors.push_back("prediction_cache ttl_seconds must be in (0, 1e9]");
    }
    if (!(prediction_cache.time_bucket_seconds > 0.0) ||
        !(prediction_cache.time_bucket_seconds <= kMaxCacheSeconds)) {
        errors.push_back("prediction_cache time_bucket_seconds must be in (0, 1e9]");
    }
    if (prediction_cache.capacity == 0) {
        errors.push_back("prediction_cache capacity must be greater than 0");
    }

    // Storage settings
    if (storage.backend != "memory" && storage.backend != "sqlite") {
        errors.push_back("storage backend must be one of: memory, sqlite");
    }
    if (!(storage.cell_size_degrees > 0.0) || !(storage.cell_size_degrees <= 180.0)) {
        errors.push_back("cell_size_degrees must be in (0, 180]");
    }
    if (storage.backend == "sqlite" && storage.db_path.empty()) {
        errors.push_back("db_path is required for the sqlite backend");
    }
    if (storage.synchronous != "FULL" && storage.synchronous != "NORMAL" &&
        storage.synchronous != "OFF") {
        errors.push_back("synchronous must be one of: FULL, NORMAL, OFF");
    }
    if (storage.busy_timeout_ms < 0) {
        errors.push_back("busy_timeout_ms must be non-negative");
    }

    // Logging settings
    try {
        ParseLogLevel(logging.level);
    } catch (const std::invalid_argument&) {
        errors.push_back("logging level must be one of: debug, info, warn, error, off");
    }

    return errors;
}

OptimizerConfig OptimizerConfig::Default() {
    return OptimizerConfig{};  // Uses default member initializers
}

} // namespace apo
