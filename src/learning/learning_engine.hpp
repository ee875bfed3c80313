// File: src/learning/learning_engine.hpp
#pragma once

#include "core/types.hpp"
#include "learning/accuracy.hpp"
#include "storage/pattern_store.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace apo {

/// What one recorded outcome did to its pattern
struct LearningInsight {
    Coordinate location;
    ModelID model_id;

    /// Accuracy folded into the pattern (after clamping)
    double accuracy{0.0};

    /// Accuracy as returned by the accuracy function
    double raw_accuracy{0.0};

    /// True if raw_accuracy was NaN or outside [0, 1]
    bool accuracy_clamped{false};

    /// Confidence before the update (0.0 for a new pattern)
    double previous_confidence{0.0};

    double new_confidence{0.0};
    uint64_t sample_count{0};

    /// True if the outcome created the pattern
    bool created{false};

    std::string ToString() const;
};

/// LearningEngine: Turns prediction outcomes into pattern updates
///
/// Each outcome is scored by an accuracy function and folded into the
/// (location, model_id) pattern with an atomic PatternStore::Update, so
/// concurrent outcomes for the same key never lose a sample.
///
/// Thread-safety: RecordOutcome() may be called concurrently. Listeners are
/// invoked on the calling thread after the store write.
class LearningEngine {
public:
    /// How a new accuracy is blended into an existing confidence
    enum class ConfidenceBlend : uint8_t {
        /// (old + accuracy) / 2
        kSimpleAverage = 0,

        /// (old * n + accuracy) / (n + 1), the running mean
        kSampleWeighted = 1,
    };

    struct Config {
        Config() = default;

        ConfidenceBlend blend{ConfidenceBlend::kSimpleAverage};
    };

    /// Called with the key of every updated pattern
    using UpdateListener = std::function<void(const Coordinate& location, const ModelID& model_id)>;

    /// Learning statistics
    struct Stats {
        uint64_t outcomes_recorded{0};
        uint64_t patterns_created{0};
        uint64_t accuracies_clamped{0};
    };

    LearningEngine(std::shared_ptr<PatternStore> store, AccuracyFunction accuracy_fn);

    /// @throws std::invalid_argument if store or accuracy_fn is empty
    LearningEngine(std::shared_ptr<PatternStore> store,
                   AccuracyFunction accuracy_fn,
                   const Config& config);

    // ========================================================================
    // Learning
    // ========================================================================

    /// Score an outcome with the configured accuracy function and update
    /// the pattern for (prediction.location, prediction.model_id)
    /// @throws InvalidCoordinateError if prediction.location is out of range
    /// @throws std::invalid_argument if prediction.model_id is empty
    /// @throws StorageError if the store fails
    LearningInsight RecordOutcome(const PredictionRecord& prediction, const Payload& actual);

    /// Same, with a per-call accuracy function
    LearningInsight RecordOutcome(const PredictionRecord& prediction,
                                  const Payload& actual,
                                  const AccuracyFunction& accuracy_fn);

    /// Register a listener notified after every pattern update
    void AddUpdateListener(UpdateListener listener);

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Clamp an accuracy into [0, 1]; NaN becomes 0
    static double ClampAccuracy(double accuracy);

    /// Blend an accuracy into a confidence built from sample_count samples
    static double BlendConfidence(ConfidenceBlend blend,
                                  double confidence,
                                  uint64_t sample_count,
                                  double accuracy);

    /// Parse "simple_average" or "sample_weighted"
    /// @throws std::invalid_argument for any other name
    static ConfidenceBlend ParseConfidenceBlend(const std::string& name);

    Stats GetStats() const;
    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<PatternStore> store_;
    AccuracyFunction accuracy_fn_;
    Config config_;

    std::vector<UpdateListener> listeners_;
    mutable std::shared_mutex listeners_mutex_;

    std::atomic<uint64_t> outcomes_recorded_{0};
    std::atomic<uint64_t> patterns_created_{0};
    std::atomic<uint64_t> accuracies_clamped_{0};

    void NotifyListeners(const Coordinate& location, const ModelID& model_id) const;
};

} // namespace apo
