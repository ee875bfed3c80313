// File: include/config/optimizer_config.hpp
//
// YAML Configuration Support for the Adaptive Prediction Optimizer
// Allows loading optimizer, learning, cache and storage settings from YAML

#ifndef APO_OPTIMIZER_CONFIG_HPP
#define APO_OPTIMIZER_CONFIG_HPP

#include <cstdint>
#include <string>
#include <optional>
#include <vector>

namespace apo {

/// Pattern store backend selection and tuning
struct StorageConfig {
    /// "memory" or "sqlite"
    std::string backend = "memory";

    // --- memory backend ---
    double cell_size_degrees = 1.0;       // Spatial grid cell edge
    size_t initial_cell_capacity = 16;

    // --- sqlite backend ---
    std::string db_path = "apo_patterns.db";
    bool enable_wal = true;
    std::string synchronous = "NORMAL";   // FULL, NORMAL or OFF
    size_t cache_size_kb = 10240;         // 10 MB page cache
    int busy_timeout_ms = 5000;
};

/// Configuration structure for the optimizer
struct OptimizerConfig {
    /// Longest prediction cache TTL or time bucket, in seconds (~31 years)
    static constexpr double kMaxCacheSeconds = 1e9;

    // === Recommendation Settings ===
    struct Optimizer {
        double default_radius_km = 111.0;       // ~1 degree of latitude
        uint64_t min_samples = 1;
        uint64_t low_confidence_samples = 10;   // Below this a result is flagged
        std::string default_model_id = "ensemble";
        double confidence_weight = 0.7;         // Score = avg(conf) * w + (1 - w) * trust
        uint64_t sample_saturation = 10;        // Samples at which trust reaches 1.0
        size_t max_query_results = 10000;       // Radius query result cap
        double cache_epsilon_km = 0.1;          // Center match tolerance
        size_t cache_capacity = 4096;
    } optimizer;

    // === Learning Settings ===
    struct Learning {
        std::string blend = "simple_average";   // or "sample_weighted"
        double default_scale = 1.0;             // Error scale of the default accuracy function
    } learning;

    // === Prediction Cache Settings ===
    struct PredictionCache {
        double ttl_seconds = 300.0;             // 5 minutes
        double time_bucket_seconds = 3600.0;    // Width of issued_at buckets in keys
        size_t capacity = 100000;
    } prediction_cache;

    // === Storage Settings ===
    StorageConfig storage;

    // === Logging Settings ===
    struct Logging {
        std::string level = "warn";             // debug, info, warn, error, off
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return OptimizerConfig if successful, std::nullopt on error
    static std::optional<OptimizerConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return OptimizerConfig if successful, std::nullopt on error
    static std::optional<OptimizerConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static OptimizerConfig Default();
};

} // namespace apo

#endif // APO_OPTIMIZER_CONFIG_HPP
