// File: src/optimizer/recommendation.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace apo {

/// Where a recommendation came from
enum class RecommendationSource : uint8_t {
    /// No qualifying pattern; the configured fallback model
    kDefault = 0,

    /// Ranked from learned patterns
    kLearned = 1,
};

const char* ToString(RecommendationSource source);

/// Model recommended for a location
struct Recommendation {
    ModelID model_id;

    /// Ranking score in [0, 1]; 0.0 for a default recommendation
    double confidence{0.0};

    RecommendationSource source{RecommendationSource::kDefault};

    /// Samples behind the winning model within the query radius
    uint64_t total_samples{0};

    /// Patterns behind the winning model within the query radius
    size_t pattern_count{0};

    /// True when total_samples is below the low-confidence threshold
    bool low_confidence{true};

    Timestamp computed_at;

    bool operator==(const Recommendation& other) const {
        return model_id == other.model_id &&
               confidence == other.confidence &&
               source == other.source &&
               total_samples == other.total_samples &&
               pattern_count == other.pattern_count &&
               low_confidence == other.low_confidence &&
               computed_at == other.computed_at;
    }
    bool operator!=(const Recommendation& other) const { return !(*this == other); }

    std::string ToString() const;
};

} // namespace apo
