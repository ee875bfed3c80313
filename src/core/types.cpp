// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace apo {

// ============================================================================
// Coordinate
// ============================================================================

std::string Coordinate::ToString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6)
        << "(" << latitude << ", " << longitude << ")";
    return oss.str();
}

void Coordinate::Serialize(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(&latitude), sizeof(latitude));
    out.write(reinterpret_cast<const char*>(&longitude), sizeof(longitude));
}

Coordinate Coordinate::Deserialize(std::istream& in) {
    Coordinate c;
    in.read(reinterpret_cast<char*>(&c.latitude), sizeof(c.latitude));
    in.read(reinterpret_cast<char*>(&c.longitude), sizeof(c.longitude));
    return c;
}

size_t Coordinate::Hash::operator()(const Coordinate& c) const {
    // +0.0 and -0.0 compare equal, so hash them identically
    double lat = c.latitude == 0.0 ? 0.0 : c.latitude;
    double lon = c.longitude == 0.0 ? 0.0 : c.longitude;
    size_t h1 = std::hash<double>()(lat);
    size_t h2 = std::hash<double>()(lon);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

// ============================================================================
// Timestamp
// ============================================================================

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    return Timestamp(TimePoint(std::chrono::duration_cast<ClockType::duration>(
        Duration(micros))));
}

int64_t Timestamp::ToMicros() const {
    return std::chrono::duration_cast<Duration>(time_point_.time_since_epoch()).count();
}

std::string Timestamp::ToString() const {
    std::time_t seconds = ClockType::to_time_t(time_point_);
    int64_t micros = ToMicros() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }

    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << micros << "Z";
    return oss.str();
}

void Timestamp::Serialize(std::ostream& out) const {
    int64_t micros = ToMicros();
    out.write(reinterpret_cast<const char*>(&micros), sizeof(micros));
}

Timestamp Timestamp::Deserialize(std::istream& in) {
    int64_t micros = 0;
    in.read(reinterpret_cast<char*>(&micros), sizeof(micros));
    return FromMicros(micros);
}

// ============================================================================
// Payload
// ============================================================================

void Payload::Set(const FieldType& field, ValueType value) {
    data_[field] = value;
}

Payload::ValueType Payload::Get(const FieldType& field) const {
    auto it = data_.find(field);
    return it != data_.end() ? it->second : 0.0;
}

bool Payload::Has(const FieldType& field) const {
    return data_.find(field) != data_.end();
}

void Payload::Remove(const FieldType& field) {
    data_.erase(field);
}

std::vector<Payload::FieldType> Payload::GetFields() const {
    std::vector<FieldType> fields;
    fields.reserve(data_.size());
    for (const auto& [field, value] : data_) {
        fields.push_back(field);
    }
    return fields;
}

std::string Payload::ToString() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [field, value] : data_) {
        if (!first) {
            oss << ", ";
        }
        oss << field << ": " << value;
        first = false;
    }
    oss << "}";
    return oss.str();
}

} // namespace apo
