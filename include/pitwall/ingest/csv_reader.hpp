#pragma once

#include "pitwall/support/error.hpp"

#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace pitwall::ingest {

// Streaming delimited-text reader. Header names are matched after trimming and
// lower-casing so `" LAP_NUMBER"` and `lap_number` are the same column.
class CsvReader {
public:
    CsvReader(std::istream& in, char delimiter);

    bool read_header(support::Error* error);
    // Skips blank lines. Returns false at end of input.
    bool next(std::vector<std::string>* fields);

    // -1 when the header has no such column.
    int column(const std::string& name) const;
    const std::vector<std::string>& header() const { return header_; }
    std::size_t line_number() const { return line_number_; }

private:
    bool read_record(std::vector<std::string>* fields);

    std::istream& in_;
    char delimiter_;
    std::vector<std::string> header_;
    std::unordered_map<std::string, int> index_;
    std::size_t line_number_ = 0;
};

// Empty string when the column is absent or the row is short.
const std::string& field_or_empty(const std::vector<std::string>& fields, int column);

} // namespace pitwall::ingest
