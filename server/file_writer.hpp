// server/file_writer.hpp
#pragma once
#include "batch_writer.hpp"
#include "line_protocol.hpp"
#include <fstream>
#include <string>

// Appends line-protocol points to a local file, for runs without a database.
class FileWriter : public BatchWriter {
private:
    std::string path;
    PointTags tags;
    std::ofstream out;

public:
    FileWriter(const std::string& path, const PointTags& tags);

    size_t write(const std::vector<MeasurementRecord>& batch) override;
    std::string describe() const override;
};
