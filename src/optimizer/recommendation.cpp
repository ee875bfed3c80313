// File: src/optimizer/recommendation.cpp
#include "optimizer/recommendation.hpp"
#include <sstream>

namespace apo {

const char* ToString(RecommendationSource source) {
    switch (source) {
        case RecommendationSource::kDefault: return "Default";
        case RecommendationSource::kLearned: return "Learned";
        default: return "Unknown";
    }
}

std::string Recommendation::ToString() const {
    std::ostringstream oss;
    oss << "Recommendation{model=" << model_id
        << ", confidence=" << confidence
        << ", source=" << apo::ToString(source)
        << ", samples=" << total_samples
        << ", patterns=" << pattern_count
        << (low_confidence ? ", low_confidence" : "")
        << ", computed_at=" << computed_at.ToString() << "}";
    return oss.str();
}

} // namespace apo
