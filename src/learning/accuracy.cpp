// File: src/learning/accuracy.cpp
#include "learning/accuracy.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace apo {

NormalizedErrorAccuracy::NormalizedErrorAccuracy()
    : NormalizedErrorAccuracy(Config()) {}

NormalizedErrorAccuracy::NormalizedErrorAccuracy(const Config& config)
    : config_(config) {
    if (!(config_.default_scale > 0.0) || !std::isfinite(config_.default_scale)) {
        throw std::invalid_argument("default_scale must be a positive finite number");
    }
    for (const auto& [field, scale] : config_.field_scales) {
        if (!(scale > 0.0) || !std::isfinite(scale)) {
            throw std::invalid_argument("Scale for field '" + field + "' must be positive");
        }
    }
}

double NormalizedErrorAccuracy::ScaleFor(const std::string& field) const {
    auto it = config_.field_scales.find(field);
    return it != config_.field_scales.end() ? it->second : config_.default_scale;
}

double NormalizedErrorAccuracy::operator()(const Payload& predicted, const Payload& actual) const {
    double total = 0.0;
    size_t shared = 0;

    for (const auto& [field, predicted_value] : predicted.Data()) {
        auto it = actual.Data().find(field);
        if (it == actual.Data().end()) {
            continue;
        }
        ++shared;

        double actual_value = it->second;
        if (!std::isfinite(predicted_value) || !std::isfinite(actual_value)) {
            continue;
        }

        double error = std::abs(predicted_value - actual_value) / ScaleFor(field);
        total += 1.0 - std::min(error, 1.0);
    }

    if (shared == 0) {
        return 0.0;
    }
    return total / static_cast<double>(shared);
}

AccuracyFunction MakeNormalizedErrorAccuracy(const NormalizedErrorAccuracy::Config& config) {
    NormalizedErrorAccuracy accuracy(config);
    return [accuracy](const Payload& predicted, const Payload& actual) {
        return accuracy(predicted, actual);
    };
}

} // namespace apo
