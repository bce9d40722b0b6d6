/**
 * Line protocol tests
 */

#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "../server/line_protocol.hpp"
#include "test_helpers.hpp"

TEST(LineProtocolTest, FormatsPointWithTagsFieldsAndMillis) {
    MeasurementRecord r = make_record(0);
    r.grid_stability_index = 0.95;
    r.fault_indicator = 1;

    std::string line = format_point(r, PointTags{});

    EXPECT_EQ(line.rfind("grid_measurements,data_source=simulink,grid_section=main_bus ", 0), 0u);
    EXPECT_NE(line.find("bus_voltage=13800,"), std::string::npos);
    EXPECT_NE(line.find("grid_stability_index=0.95,"), std::string::npos);
    EXPECT_NE(line.find("fault_indicator=1i "), std::string::npos);
    EXPECT_EQ(line.substr(line.rfind(' ') + 1), "1700000000000");
}

TEST(LineProtocolTest, EscapesMeasurementAndTags) {
    PointTags tags;
    tags.measurement = "grid data";
    tags.data_source = "lab,bench=2";
    tags.grid_section = "";

    std::string line = format_point(make_record(0), tags);

    EXPECT_EQ(line.rfind("grid\\ data,data_source=lab\\,bench\\=2 ", 0), 0u);
    EXPECT_EQ(line.find("grid_section"), std::string::npos);
}

TEST(LineProtocolTest, OmitsNonFiniteFields) {
    MeasurementRecord r = make_record(0);
    r.temperature = std::numeric_limits<double>::quiet_NaN();
    r.load_demand = std::numeric_limits<double>::infinity();

    std::string line = format_point(r, PointTags{});

    EXPECT_EQ(line.find("temperature="), std::string::npos);
    EXPECT_EQ(line.find("load_demand="), std::string::npos);
    EXPECT_NE(line.find("generation_output="), std::string::npos);
}

TEST(LineProtocolTest, FieldValuesRoundTrip) {
    EXPECT_EQ(format_field_value(0.1), "0.1");
    EXPECT_EQ(format_field_value(-3.5), "-3.5");
    double third = 1.0 / 3.0;
    EXPECT_EQ(std::stod(format_field_value(third)), third);
}

TEST(LineProtocolTest, BatchIsOneLinePerRecord) {
    std::vector<MeasurementRecord> batch = {make_record(0), make_record(1), make_record(2)};
    std::string body = format_batch(batch, PointTags{});

    size_t lines = 0;
    for (char c : body) lines += c == '\n';
    EXPECT_EQ(lines, 3u);
    EXPECT_NE(body.find("1700000000002\n"), std::string::npos);
}
