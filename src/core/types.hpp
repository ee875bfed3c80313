// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <chrono>
#include <vector>
#include <map>
#include <iosfwd>
#include <initializer_list>

namespace apo {

// ModelID: Opaque identifier of a candidate prediction strategy
using ModelID = std::string;

// Coordinate: Geographic position in decimal degrees
// Latitude in [-90, 90], longitude in [-180, 180]. Range checks live in
// geo/geo_distance.hpp so that plain construction never throws.
struct Coordinate {
    double latitude{0.0};
    double longitude{0.0};

    Coordinate() = default;
    Coordinate(double lat, double lon) : latitude(lat), longitude(lon) {}

    // Exact comparison; stored coordinates are never rounded
    bool operator==(const Coordinate& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
    bool operator!=(const Coordinate& other) const { return !(*this == other); }

    // Lexicographic (latitude, longitude) ordering for ordered containers
    bool operator<(const Coordinate& other) const {
        if (latitude != other.latitude) return latitude < other.latitude;
        return longitude < other.longitude;
    }

    // String conversion for debugging
    std::string ToString() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static Coordinate Deserialize(std::istream& in);

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const Coordinate& c) const;
    };
};

// Timestamp: Microsecond-precision wall-clock time point
//
// Wall clock rather than a monotonic clock because pattern timestamps are
// persisted and must stay meaningful across process restarts.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates zero timestamp (the epoch)
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    // Shift by a duration
    Timestamp operator+(Duration d) const { return Timestamp(time_point_ + d); }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // String conversion (ISO-8601, UTC)
    std::string ToString() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static Timestamp Deserialize(std::istream& in);

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// Payload: Sparse set of named numeric fields produced by a predictor
//
// The optimizer treats a payload as opaque; only accuracy functions look
// inside it.
class Payload {
public:
    using FieldType = std::string;
    using ValueType = double;
    using StorageType = std::map<FieldType, ValueType>;

    Payload() = default;
    explicit Payload(const StorageType& data) : data_(data) {}
    Payload(std::initializer_list<StorageType::value_type> init) : data_(init) {}

    // Set a field value
    void Set(const FieldType& field, ValueType value);

    // Get a field value (returns 0.0 if not present)
    ValueType Get(const FieldType& field) const;

    // Check if field exists
    bool Has(const FieldType& field) const;

    // Remove a field
    void Remove(const FieldType& field);

    size_t Size() const { return data_.size(); }
    bool IsEmpty() const { return data_.empty(); }

    // Get all field names in sorted order
    std::vector<FieldType> GetFields() const;

    const StorageType& Data() const { return data_; }

    bool operator==(const Payload& other) const { return data_ == other.data_; }
    bool operator!=(const Payload& other) const { return data_ != other.data_; }

    std::string ToString() const;

private:
    StorageType data_;
};

// PredictionRecord: Output of an external predictor for one location
struct PredictionRecord {
    Coordinate location;
    ModelID model_id;
    Timestamp issued_at;
    Payload payload;

    // Optional version tag of the model that produced the payload; part of
    // the prediction cache key
    std::string model_version;
};

} // namespace apo
