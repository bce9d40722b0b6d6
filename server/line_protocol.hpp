// server/line_protocol.hpp
#pragma once
#include "../common/protocol.hpp"
#include <string>
#include <vector>

struct PointTags {
    std::string measurement{"grid_measurements"};
    std::string data_source{"simulink"};
    std::string grid_section{"main_bus"};
};

// One InfluxDB line-protocol point per record, millisecond timestamps.
// Non-finite values are left out of the field set; fault_indicator is always present.
std::string format_point(const MeasurementRecord& record, const PointTags& tags);
std::string format_batch(const std::vector<MeasurementRecord>& batch, const PointTags& tags);

// Shortest decimal text that parses back to the same double.
std::string format_field_value(double value);
