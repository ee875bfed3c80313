// File: src/learning/learning_engine.cpp
#include "learning/learning_engine.hpp"
#include "core/logging.hpp"
#include "geo/geo_distance.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace apo {

std::string LearningInsight::ToString() const {
    std::ostringstream oss;
    oss << "LearningInsight{" << location.ToString() << ", model=" << model_id
        << ", accuracy=" << accuracy;
    if (accuracy_clamped) {
        oss << " (raw " << raw_accuracy << ")";
    }
    oss << ", confidence " << previous_confidence << " -> " << new_confidence
        << ", samples=" << sample_count
        << (created ? ", created" : "") << "}";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

LearningEngine::LearningEngine(std::shared_ptr<PatternStore> store,
                               AccuracyFunction accuracy_fn)
    : LearningEngine(std::move(store), std::move(accuracy_fn), Config()) {}

LearningEngine::LearningEngine(std::shared_ptr<PatternStore> store,
                               AccuracyFunction accuracy_fn,
                               const Config& config)
    : store_(std::move(store)),
      accuracy_fn_(std::move(accuracy_fn)),
      config_(config) {
    if (!store_) {
        throw std::invalid_argument("LearningEngine requires a pattern store");
    }
    if (!accuracy_fn_) {
        throw std::invalid_argument("LearningEngine requires an accuracy function");
    }
}

// ============================================================================
// Learning
// ============================================================================

LearningInsight LearningEngine::RecordOutcome(const PredictionRecord& prediction,
                                              const Payload& actual) {
    return RecordOutcome(prediction, actual, accuracy_fn_);
}

LearningInsight LearningEngine::RecordOutcome(const PredictionRecord& prediction,
                                              const Payload& actual,
                                              const AccuracyFunction& accuracy_fn) {
    // Reject before touching the store so nothing is partially applied
    ValidateCoordinate(prediction.location);
    if (prediction.model_id.empty()) {
        throw std::invalid_argument("Prediction model_id must not be empty");
    }
    if (!accuracy_fn) {
        throw std::invalid_argument("Accuracy function must not be empty");
    }

    LearningInsight insight;
    insight.location = prediction.location;
    insight.model_id = prediction.model_id;
    insight.raw_accuracy = accuracy_fn(prediction.payload, actual);
    insight.accuracy = ClampAccuracy(insight.raw_accuracy);

    insight.accuracy_clamped = std::isnan(insight.raw_accuracy) ||
                               insight.accuracy != insight.raw_accuracy;
    if (insight.accuracy_clamped) {
        accuracies_clamped_.fetch_add(1, std::memory_order_relaxed);
        APO_LOG(LogLevel::WARN, LogComponent::LEARNING,
                "InvalidOutcome: accuracy " << insight.raw_accuracy << " for "
                << prediction.model_id << " at " << prediction.location.ToString()
                << " clamped to " << insight.accuracy);
    }

    const double accuracy = insight.accuracy;
    const ConfidenceBlend blend = config_.blend;

    Pattern stored = store_->Update(
        prediction.location, prediction.model_id,
        [&](const std::optional<Pattern>& current) {
            Pattern next;
            next.location = prediction.location;
            next.model_id = prediction.model_id;

            if (!current) {
                insight.created = true;
                insight.previous_confidence = 0.0;
                next.confidence = accuracy;
                next.sample_count = 1;
            } else {
                insight.created = false;
                insight.previous_confidence = current->confidence;
                next.confidence = BlendConfidence(blend, current->confidence,
                                                  current->sample_count, accuracy);
                next.sample_count = current->sample_count + 1;
            }
            return next;
        });

    insight.new_confidence = stored.confidence;
    insight.sample_count = stored.sample_count;

    outcomes_recorded_.fetch_add(1, std::memory_order_relaxed);
    if (insight.created) {
        patterns_created_.fetch_add(1, std::memory_order_relaxed);
    }

    APO_LOG(LogLevel::DEBUG, LogComponent::LEARNING, insight.ToString());

    NotifyListeners(prediction.location, prediction.model_id);
    return insight;
}

void LearningEngine::AddUpdateListener(UpdateListener listener) {
    if (!listener) {
        throw std::invalid_argument("Update listener must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void LearningEngine::NotifyListeners(const Coordinate& location, const ModelID& model_id) const {
    std::shared_lock<std::shared_mutex> lock(listeners_mutex_);
    for (const auto& listener : listeners_) {
        listener(location, model_id);
    }
}

// ============================================================================
// Utilities
// ============================================================================

double LearningEngine::ClampAccuracy(double accuracy) {
    if (std::isnan(accuracy)) {
        return 0.0;
    }
    return std::clamp(accuracy, 0.0, 1.0);
}

double LearningEngine::BlendConfidence(ConfidenceBlend blend,
                                       double confidence,
                                       uint64_t sample_count,
                                       double accuracy) {
    double blended = 0.0;
    switch (blend) {
        case ConfidenceBlend::kSampleWeighted: {
            double n = static_cast<double>(std::max<uint64_t>(sample_count, 1));
            blended = (confidence * n + accuracy) / (n + 1.0);
            break;
        }
        case ConfidenceBlend::kSimpleAverage:
        default:
            blended = (confidence + accuracy) / 2.0;
            break;
    }
    // Guard against rounding drift past the bounds
    return std::clamp(blended, 0.0, 1.0);
}

LearningEngine::ConfidenceBlend LearningEngine::ParseConfidenceBlend(const std::string& name) {
    if (name == "simple_average") return ConfidenceBlend::kSimpleAverage;
    if (name == "sample_weighted") return ConfidenceBlend::kSampleWeighted;
    throw std::invalid_argument("Unknown confidence blend: " + name);
}

LearningEngine::Stats LearningEngine::GetStats() const {
    Stats stats;
    stats.outcomes_recorded = outcomes_recorded_.load(std::memory_order_relaxed);
    stats.patterns_created = patterns_created_.load(std::memory_order_relaxed);
    stats.accuracies_clamped = accuracies_clamped_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace apo
