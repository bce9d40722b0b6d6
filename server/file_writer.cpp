// server/file_writer.cpp
#include "file_writer.hpp"

FileWriter::FileWriter(const std::string& p, const PointTags& t) : path(p), tags(t) {
    out.open(path, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open storage file: " + path);
    }
}

size_t FileWriter::write(const std::vector<MeasurementRecord>& batch) {
    if (!out.is_open()) {
        out.clear();
        out.open(path, std::ios::app);
    }
    if (!out) {
        out.close();
        throw WriteError(WriteErrorKind::BackendUnreachable, "Storage file is not writable: " + path);
    }

    out << format_batch(batch, tags);
    out.flush();
    if (!out) {
        out.close();
        throw WriteError(WriteErrorKind::BackendUnreachable, "Failed to write to " + path);
    }
    return batch.size();
}

std::string FileWriter::describe() const {
    return "file " + path;
}
