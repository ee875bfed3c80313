// File: src/optimizer/optimizer.hpp
#pragma once

#include "cache/prediction_cache.hpp"
#include "learning/learning_engine.hpp"
#include "optimizer/optimization_cache.hpp"
#include "optimizer/recommendation.hpp"
#include "storage/pattern_store.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apo {

struct OptimizerConfig;

/// Snapshot of what the optimizer has learned
struct OptimizationStats {
    size_t total_patterns{0};
    std::map<ModelID, size_t> patterns_per_model;

    /// Mean confidence over all patterns (0.0 when empty)
    double average_confidence{0.0};
    std::map<ModelID, double> average_confidence_per_model;

    uint64_t total_samples{0};

    /// Store records skipped because they failed validation
    uint64_t corrupt_records{0};

    // Optimization cache
    size_t cache_size{0};
    uint64_t cache_hits{0};
    uint64_t cache_misses{0};
    uint64_t cache_invalidations{0};

    std::string ToString() const;
};

/// Optimizer: Recommends the best-performing model for a location
///
/// Recommend() ranks the models of every pattern within a radius:
///
///   score = avg(confidence) * w + (1 - w) * min(total_samples, S) / S
///
/// with w = confidence_weight (0.7) and S = sample_saturation (10). The
/// highest score wins; exact ties go to the lexicographically smallest
/// model id. Learned results are cached per query circle and invalidated
/// whenever RecordOutcome() updates a pattern inside the circle.
///
/// Storage failures always reach the caller; they are never turned into a
/// default recommendation.
///
/// Thread-safety: one instance may be shared by many threads.
class Optimizer {
public:
    struct Config {
        Config() = default;

        double default_radius_km{111.0};
        uint64_t min_samples{1};

        /// Learned results with fewer samples are flagged low_confidence
        uint64_t low_confidence_samples{10};

        ModelID default_model_id{"ensemble"};

        double confidence_weight{0.7};
        uint64_t sample_saturation{10};

        /// Cap on patterns read per radius query (nearest kept)
        size_t max_query_results{10000};

        OptimizationCache::Config cache;
        LearningEngine::Config learning;
    };

    Optimizer(std::shared_ptr<PatternStore> store, AccuracyFunction accuracy_fn);

    /// @throws std::invalid_argument if store or accuracy_fn is empty, or
    ///         the config is out of range
    Optimizer(std::shared_ptr<PatternStore> store,
              AccuracyFunction accuracy_fn,
              const Config& config);

    Optimizer(const Optimizer&) = delete;
    Optimizer& operator=(const Optimizer&) = delete;

    /// Build an optimizer with the configured store backend and the
    /// normalized-error accuracy function
    static std::unique_ptr<Optimizer> Create(const OptimizerConfig& config);

    /// Map the YAML-level configuration onto Optimizer::Config
    static Config ConfigFrom(const OptimizerConfig& config);

    // ========================================================================
    // Recommendations
    // ========================================================================

    Recommendation Recommend(const Coordinate& location);
    Recommendation Recommend(const Coordinate& location, double radius_km);
    Recommendation Recommend(const Coordinate& location, double radius_km, uint64_t min_samples);

    /// Recommend a model for location
    /// @param radius_km Query radius; must be finite and > 0
    /// @param min_samples Patterns with fewer samples are ignored (0 acts as 1)
    /// @param default_model_id Returned, with confidence 0.0, when no
    ///        pattern qualifies
    /// @throws InvalidCoordinateError on an out-of-range location
    /// @throws std::invalid_argument on a bad radius or empty default model
    /// @throws StorageError if the store fails
    Recommendation Recommend(const Coordinate& location,
                             double radius_km,
                             uint64_t min_samples,
                             const ModelID& default_model_id);

    // ========================================================================
    // Learning
    // ========================================================================

    /// Fold an outcome into the pattern store
    ///
    /// Cached recommendations covering prediction.location are invalidated
    /// before this returns.
    LearningInsight RecordOutcome(const PredictionRecord& prediction, const Payload& actual);

    LearningInsight RecordOutcome(const PredictionRecord& prediction,
                                  const Payload& actual,
                                  const AccuracyFunction& accuracy_fn);

    // ========================================================================
    // Introspection
    // ========================================================================

    /// Aggregate statistics; does not touch last_used_at
    OptimizationStats Stats() const;

    /// Drop every cached recommendation
    void InvalidateAll();

    PatternStore& Store() { return *store_; }
    LearningEngine& Learning() { return engine_; }
    const OptimizationCache& Cache() const { return cache_; }
    const Config& GetConfig() const { return config_; }

private:
    struct ModelScore {
        double confidence_sum{0.0};
        uint64_t total_samples{0};
        size_t pattern_count{0};
    };

    /// Rank grouped patterns; returns std::nullopt if none qualify
    std::optional<Recommendation> Rank(const std::vector<Pattern>& patterns,
                                       uint64_t min_samples) const;

    double Score(const ModelScore& model) const;

    std::shared_ptr<PatternStore> store_;
    Config config_;
    OptimizationCache cache_;
    LearningEngine engine_;
};

/// Map the YAML-level configuration onto PredictionCache::Config
PredictionCache::Config MakePredictionCacheConfig(const OptimizerConfig& config);

} // namespace apo
