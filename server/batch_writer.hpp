// server/batch_writer.hpp
#pragma once
#include "../common/protocol.hpp"
#include "errors.hpp"
#include <cstddef>
#include <string>
#include <vector>

// Storage backend boundary. Implementations either accept the whole batch and
// return the number of records accepted, or throw WriteError.
class BatchWriter {
public:
    virtual ~BatchWriter() = default;

    virtual size_t write(const std::vector<MeasurementRecord>& batch) = 0;
    virtual std::string describe() const = 0;
};
