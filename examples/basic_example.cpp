// File: examples/basic_example.cpp
//
// Basic model recommendation example using the Adaptive Prediction Optimizer.
// Demonstrates:
// - Loading configuration from YAML (optional first argument)
// - Recording prediction outcomes for two competing models
// - Asking for a recommendation and watching it change after more feedback
// - Caching prediction payloads with a TTL
// - Viewing statistics

#include "config/optimizer_config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "optimizer/optimizer.hpp"
#include <iomanip>
#include <iostream>

using namespace apo;

namespace {

void PrintRecommendation(const Recommendation& rec) {
    std::cout << "  model=" << rec.model_id
              << "  confidence=" << std::fixed << std::setprecision(3) << rec.confidence
              << "  source=" << ToString(rec.source)
              << "  samples=" << rec.total_samples
              << (rec.low_confidence ? "  (low confidence)" : "") << "\n";
}

PredictionRecord MakePrediction(const Coordinate& location, const ModelID& model, double value) {
    PredictionRecord record;
    record.location = location;
    record.model_id = model;
    record.issued_at = Timestamp::Now();
    record.payload.Set("temperature_c", value);
    record.model_version = "v1";
    return record;
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "=== Adaptive Prediction Optimizer Example ===\n\n";

    // Step 1: Configuration
    OptimizerConfig config = OptimizerConfig::Default();
    if (argc > 1) {
        auto loaded = OptimizerConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
        std::cout << "Loaded configuration from " << argv[1] << "\n";
    }
    LogManager::Instance().SetMinLevel(ParseLogLevel(config.logging.level));

    try {
        // Step 2: Build the optimizer
        std::cout << "Step 1: Creating optimizer (" << config.storage.backend << " store)...\n";
        std::unique_ptr<Optimizer> optimizer = Optimizer::Create(config);
        PredictionCache prediction_cache(MakePredictionCacheConfig(config));

        const Coordinate new_york(40.7128, -74.0060);
        const Coordinate nearby(40.7306, -73.9866);  // ~2.6 km away

        // Step 3: Nothing learned yet
        std::cout << "\nStep 2: Recommendation before any feedback:\n";
        PrintRecommendation(optimizer->Recommend(new_york, 10.0));

        // Step 4: Feed outcomes. "lstm" is close to the truth, "arima" is not.
        std::cout << "\nStep 3: Recording outcomes...\n";
        const double observed = 21.0;
        Payload actual{{"temperature_c", observed}};
        for (int i = 0; i < 6; ++i) {
            optimizer->RecordOutcome(MakePrediction(new_york, "lstm", observed + 0.1), actual);
            optimizer->RecordOutcome(MakePrediction(nearby, "arima", observed + 0.6), actual);
        }
        std::cout << "  recorded 12 outcomes\n";

        std::cout << "\nStep 4: Recommendation after feedback:\n";
        PrintRecommendation(optimizer->Recommend(new_york, 10.0));

        // Step 5: Cached prediction payloads
        std::cout << "\nStep 5: Prediction cache...\n";
        PredictionRecord prediction = MakePrediction(new_york, "lstm", 21.3);
        PredictionCacheKey key = prediction_cache.MakeKey(prediction);
        prediction_cache.Put(key, prediction.payload);
        if (auto cached = prediction_cache.Get(key)) {
            std::cout << "  cache hit: " << cached->ToString() << "\n";
        }

        // Step 6: Statistics
        std::cout << "\nStep 6: Statistics\n";
        OptimizationStats stats = optimizer->Stats();
        std::cout << "  patterns: " << stats.total_patterns << "\n";
        std::cout << "  samples: " << stats.total_samples << "\n";
        for (const auto& [model_id, average] : stats.average_confidence_per_model) {
            std::cout << "  " << model_id << " average confidence: " << average << "\n";
        }
        std::cout << "  cache hits/misses: " << stats.cache_hits << "/" << stats.cache_misses << "\n";
    } catch (const ApoError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
