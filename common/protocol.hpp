// common/protocol.hpp
#pragma once
#include <array>
#include <chrono>
#include <cstddef>

// Wire contract shared by the ingestion server and the simulator.
// Binary datagrams carry the 11 fields below as little-endian doubles, in this order.
constexpr size_t kFieldCount = 11;
constexpr size_t kBinaryPayloadSize = kFieldCount * sizeof(double);  // 88 bytes

constexpr std::array<const char*, kFieldCount> kFieldNames = {
    "bus_voltage",
    "bus_frequency",
    "active_power",
    "reactive_power",
    "current_magnitude",
    "current_phase",
    "temperature",
    "load_demand",
    "generation_output",
    "grid_stability_index",
    "fault_indicator",
};

constexpr const char* kTimestampField = "timestamp";

struct MeasurementRecord {
    double bus_voltage{0.0};
    double bus_frequency{0.0};
    double active_power{0.0};
    double reactive_power{0.0};
    double current_magnitude{0.0};
    double current_phase{0.0};
    double temperature{0.0};
    double load_demand{0.0};
    double generation_output{0.0};
    double grid_stability_index{0.0};
    int fault_indicator{0};

    // Payload timestamp when one was supplied, otherwise the receive time.
    // Not part of the 11-field contract.
    std::chrono::system_clock::time_point timestamp{};
};

// The only place the field order is spelled out; encoders and decoders go through these.
inline std::array<double, kFieldCount> to_values(const MeasurementRecord& r) {
    return {r.bus_voltage,
            r.bus_frequency,
            r.active_power,
            r.reactive_power,
            r.current_magnitude,
            r.current_phase,
            r.temperature,
            r.load_demand,
            r.generation_output,
            r.grid_stability_index,
            static_cast<double>(r.fault_indicator)};
}

// fault_indicator is taken as-is; callers validate it first.
inline MeasurementRecord from_values(const std::array<double, kFieldCount>& v, int fault_indicator) {
    MeasurementRecord r;
    r.bus_voltage = v[0];
    r.bus_frequency = v[1];
    r.active_power = v[2];
    r.reactive_power = v[3];
    r.current_magnitude = v[4];
    r.current_phase = v[5];
    r.temperature = v[6];
    r.load_demand = v[7];
    r.generation_output = v[8];
    r.grid_stability_index = v[9];
    r.fault_indicator = fault_indicator;
    return r;
}
