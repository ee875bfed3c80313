// File: src/optimizer/optimizer.cpp
#include "optimizer/optimizer.hpp"
#include "config/optimizer_config.hpp"
#include "core/logging.hpp"
#include "geo/geo_distance.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace apo {

std::string OptimizationStats::ToString() const {
    std::ostringstream oss;
    oss << "OptimizationStats{patterns=" << total_patterns
        << ", avg_confidence=" << average_confidence
        << ", samples=" << total_samples
        << ", corrupt=" << corrupt_records
        << ", cache(size=" << cache_size << ", hits=" << cache_hits
        << ", misses=" << cache_misses << ", invalidations=" << cache_invalidations << ")";
    for (const auto& [model_id, count] : patterns_per_model) {
        oss << ", " << model_id << "=" << count;
    }
    oss << "}";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

Optimizer::Optimizer(std::shared_ptr<PatternStore> store, AccuracyFunction accuracy_fn)
    : Optimizer(std::move(store), std::move(accuracy_fn), Config()) {}

Optimizer::Optimizer(std::shared_ptr<PatternStore> store,
                     AccuracyFunction accuracy_fn,
                     const Config& config)
    : store_(store),
      config_(config),
      cache_(config.cache),
      engine_(std::move(store), std::move(accuracy_fn), config.learning) {

    if (!(config_.default_radius_km > 0.0) || !std::isfinite(config_.default_radius_km)) {
        throw std::invalid_argument("default_radius_km must be a positive number");
    }
    if (config_.default_model_id.empty()) {
        throw std::invalid_argument("default_model_id must not be empty");
    }
    if (!std::isfinite(config_.confidence_weight) ||
        config_.confidence_weight < 0.0 || config_.confidence_weight > 1.0) {
        throw std::invalid_argument("confidence_weight must be between 0.0 and 1.0");
    }
    if (!std::isfinite(config_.cache.epsilon_km) || config_.cache.epsilon_km < 0.0) {
        throw std::invalid_argument("cache epsilon_km must be a non-negative number");
    }
    if (config_.sample_saturation == 0) {
        throw std::invalid_argument("sample_saturation must be greater than 0");
    }

    // Outcomes invalidate overlapping recommendations before RecordOutcome returns
    engine_.AddUpdateListener([this](const Coordinate& location, const ModelID&) {
        size_t removed = cache_.InvalidateCovering(location);
        if (removed > 0) {
            APO_LOG(LogLevel::DEBUG, LogComponent::OPTIMIZER,
                    "Invalidated " << removed << " cached recommendations covering "
                    << location.ToString());
        }
    });
}

Optimizer::Config Optimizer::ConfigFrom(const OptimizerConfig& config) {
    Config result;
    result.default_radius_km = config.optimizer.default_radius_km;
    result.min_samples = config.optimizer.min_samples;
    result.low_confidence_samples = config.optimizer.low_confidence_samples;
    result.default_model_id = config.optimizer.default_model_id;
    result.confidence_weight = config.optimizer.confidence_weight;
    result.sample_saturation = config.optimizer.sample_saturation;
    result.max_query_results = config.optimizer.max_query_results;
    result.cache.capacity = config.optimizer.cache_capacity;
    result.cache.epsilon_km = config.optimizer.cache_epsilon_km;
    result.learning.blend = LearningEngine::ParseConfidenceBlend(config.learning.blend);
    return result;
}

std::unique_ptr<Optimizer> Optimizer::Create(const OptimizerConfig& config) {
    std::shared_ptr<PatternStore> store = CreatePatternStore(config.storage);

    NormalizedErrorAccuracy::Config accuracy_config;
    accuracy_config.default_scale = config.learning.default_scale;

    return std::make_unique<Optimizer>(std::move(store),
                                       MakeNormalizedErrorAccuracy(accuracy_config),
                                       ConfigFrom(config));
}

PredictionCache::Config MakePredictionCacheConfig(const OptimizerConfig& config) {
    using Millis = std::chrono::milliseconds;

    // Out-of-range values collapse to zero or the longest supported span
    auto to_millis = [](double seconds) {
        if (!(seconds > 0.0)) {
            return Millis(0);
        }
        double clamped = std::min(seconds, OptimizerConfig::kMaxCacheSeconds);
        return Millis(static_cast<int64_t>(std::llround(clamped * 1000.0)));
    };

    PredictionCache::Config result;
    result.capacity = config.prediction_cache.capacity;
    result.default_ttl = to_millis(config.prediction_cache.ttl_seconds);
    result.time_bucket = to_millis(config.prediction_cache.time_bucket_seconds);
    return result;
}

// ============================================================================
// Recommendations
// ============================================================================

Recommendation Optimizer::Recommend(const Coordinate& location) {
    return Recommend(location, config_.default_radius_km, config_.min_samples,
                     config_.default_model_id);
}

Recommendation Optimizer::Recommend(const Coordinate& location, double radius_km) {
    return Recommend(location, radius_km, config_.min_samples, config_.default_model_id);
}

Recommendation Optimizer::Recommend(const Coordinate& location,
                                    double radius_km,
                                    uint64_t min_samples) {
    return Recommend(location, radius_km, min_samples, config_.default_model_id);
}

Recommendation Optimizer::Recommend(const Coordinate& location,
                                    double radius_km,
                                    uint64_t min_samples,
                                    const ModelID& default_model_id) {
    ValidateCoordinate(location);
    if (!std::isfinite(radius_km) || radius_km <= 0.0) {
        throw std::invalid_argument("radius_km must be a positive finite number");
    }
    if (default_model_id.empty()) {
        throw std::invalid_argument("default_model_id must not be empty");
    }
    min_samples = std::max<uint64_t>(min_samples, 1);

    if (auto cached = cache_.Lookup(location, radius_km, min_samples)) {
        return *cached;
    }

    // Read before the query; an invalidation after this point drops the insert
    uint64_t generation = cache_.Generation();

    QueryOptions options;
    options.max_results = config_.max_query_results;
    std::vector<Pattern> patterns = store_->QueryRadius(location, radius_km, options);

    std::optional<Recommendation> learned = Rank(patterns, min_samples);
    if (!learned) {
        Recommendation fallback;
        fallback.model_id = default_model_id;
        fallback.confidence = 0.0;
        fallback.source = RecommendationSource::kDefault;
        fallback.low_confidence = true;
        fallback.computed_at = Timestamp::Now();
        return fallback;
    }

    cache_.Insert(location, radius_km, min_samples, *learned, generation);
    return *learned;
}

std::optional<Recommendation> Optimizer::Rank(const std::vector<Pattern>& patterns,
                                              uint64_t min_samples) const {
    // Ordered by model id so the first of equal scores is the smallest id
    std::map<ModelID, ModelScore> models;
    for (const auto& pattern : patterns) {
        if (pattern.sample_count < min_samples) {
            continue;
        }
        ModelScore& model = models[pattern.model_id];
        model.confidence_sum += pattern.confidence;
        model.total_samples += pattern.sample_count;
        model.pattern_count++;
    }

    if (models.empty()) {
        return std::nullopt;
    }

    auto best = models.begin();
    double best_score = Score(best->second);
    for (auto it = std::next(models.begin()); it != models.end(); ++it) {
        double score = Score(it->second);
        if (score > best_score) {
            best_score = score;
            best = it;
        }
    }

    Recommendation recommendation;
    recommendation.model_id = best->first;
    recommendation.confidence = best_score;
    recommendation.source = RecommendationSource::kLearned;
    recommendation.total_samples = best->second.total_samples;
    recommendation.pattern_count = best->second.pattern_count;
    recommendation.low_confidence = best->second.total_samples < config_.low_confidence_samples;
    recommendation.computed_at = Timestamp::Now();
    return recommendation;
}

double Optimizer::Score(const ModelScore& model) const {
    double average = model.confidence_sum / static_cast<double>(model.pattern_count);
    double saturation = static_cast<double>(config_.sample_saturation);
    double trust = std::min(static_cast<double>(model.total_samples), saturation) / saturation;

    double score = average * config_.confidence_weight + (1.0 - config_.confidence_weight) * trust;
    return std::clamp(score, 0.0, 1.0);
}

// ============================================================================
// Learning
// ============================================================================

LearningInsight Optimizer::RecordOutcome(const PredictionRecord& prediction,
                                         const Payload& actual) {
    return engine_.RecordOutcome(prediction, actual);
}

LearningInsight Optimizer::RecordOutcome(const PredictionRecord& prediction,
                                         const Payload& actual,
                                         const AccuracyFunction& accuracy_fn) {
    return engine_.RecordOutcome(prediction, actual, accuracy_fn);
}

// ============================================================================
// Introspection
// ============================================================================

OptimizationStats Optimizer::Stats() const {
    OptimizationStats stats;

    QueryOptions options;
    options.max_results = std::numeric_limits<size_t>::max();
    options.touch = false;
    std::vector<Pattern> patterns = store_->FindAll(options);

    double confidence_sum = 0.0;
    std::map<ModelID, double> confidence_per_model;
    for (const auto& pattern : patterns) {
        stats.patterns_per_model[pattern.model_id]++;
        confidence_per_model[pattern.model_id] += pattern.confidence;
        confidence_sum += pattern.confidence;
        stats.total_samples += pattern.sample_count;
    }

    stats.total_patterns = patterns.size();
    if (!patterns.empty()) {
        stats.average_confidence = confidence_sum / static_cast<double>(patterns.size());
    }
    for (const auto& [model_id, sum] : confidence_per_model) {
        stats.average_confidence_per_model[model_id] =
            sum / static_cast<double>(stats.patterns_per_model[model_id]);
    }

    stats.corrupt_records = store_->GetStats().corrupt_records;

    OptimizationCache::Stats cache_stats = cache_.GetStats();
    stats.cache_size = cache_stats.size;
    stats.cache_hits = cache_stats.hits;
    stats.cache_misses = cache_stats.misses;
    stats.cache_invalidations = cache_stats.invalidations;
    return stats;
}

void Optimizer::InvalidateAll() {
    cache_.Clear();
}

} // namespace apo
