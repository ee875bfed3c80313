// File: src/learning/accuracy.hpp
#pragma once

#include "core/types.hpp"
#include <functional>
#include <map>
#include <string>

namespace apo {

/// Scores a predicted payload against the observed one
///
/// Expected to return a value in [0, 1]; the learning engine clamps anything
/// else.
using AccuracyFunction = std::function<double(const Payload& predicted, const Payload& actual)>;

/// Accuracy from normalized absolute error
///
/// For each field present in both payloads:
///   score = 1 - min(|predicted - actual| / scale, 1)
/// The result is the mean score over the shared fields, or 0.0 when the
/// payloads share no field. A non-finite value scores 0 for its field.
class NormalizedErrorAccuracy {
public:
    struct Config {
        Config() = default;

        /// Error at which a field scores 0
        double default_scale{1.0};

        /// Per-field overrides of default_scale
        std::map<std::string, double> field_scales;
    };

    NormalizedErrorAccuracy();
    explicit NormalizedErrorAccuracy(const Config& config);

    double operator()(const Payload& predicted, const Payload& actual) const;

    /// Scale used for a field
    double ScaleFor(const std::string& field) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

/// Wrap a NormalizedErrorAccuracy into an AccuracyFunction
AccuracyFunction MakeNormalizedErrorAccuracy(const NormalizedErrorAccuracy::Config& config);

} // namespace apo
