#include "pitwall/ingest/csv_reader.hpp"

#include "pitwall/support/text.hpp"

namespace pitwall::ingest {

using support::trim;

CsvReader::CsvReader(std::istream& in, char delimiter) : in_(in), delimiter_(delimiter) {}

bool CsvReader::read_record(std::vector<std::string>* fields) {
    fields->clear();
    std::string line;
    if (!std::getline(in_, line)) return false;
    ++line_number_;

    std::string cur;
    bool quoted = false;
    // A quote opens a quoted field only as the field's first non-blank
    // character; anywhere else it is literal.
    bool field_started = false;
    for (std::size_t i = 0;; ++i) {
        if (i == line.size()) {
            if (!quoted) break;
            // Quoted field continues on the next physical line.
            std::string more;
            if (!std::getline(in_, more)) break;
            ++line_number_;
            cur.push_back('\n');
            line = std::move(more);
            i = static_cast<std::size_t>(-1);
            continue;
        }
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"' && !field_started) {
            quoted = true;
            field_started = true;
        } else if (c == delimiter_) {
            fields->push_back(trim(cur));
            cur.clear();
            field_started = false;
        } else if (c != '\r') {
            cur.push_back(c);
            if (c != ' ' && c != '\t') field_started = true;
        }
    }
    fields->push_back(trim(cur));
    return true;
}

bool CsvReader::read_header(support::Error* error) {
    std::vector<std::string> fields;
    while (read_record(&fields)) {
        if (fields.size() == 1 && fields[0].empty()) continue;

        // UTF-8 byte order mark on the first header cell.
        if (!fields[0].empty() && fields[0].rfind("\xEF\xBB\xBF", 0) == 0) {
            fields[0] = trim(fields[0].substr(3));
        }
        header_ = fields;
        index_.clear();
        for (std::size_t i = 0; i < header_.size(); ++i) {
            const std::string key = support::to_lower(header_[i]);
            if (!key.empty() && index_.count(key) == 0) index_[key] = static_cast<int>(i);
        }
        return true;
    }
    return support::fail(error, support::ErrorKind::Parse, "file has no header row");
}

bool CsvReader::next(std::vector<std::string>* fields) {
    while (read_record(fields)) {
        bool blank = true;
        for (const auto& f : *fields) blank = blank && f.empty();
        if (!blank) return true;
    }
    return false;
}

int CsvReader::column(const std::string& name) const {
    const auto it = index_.find(support::to_lower(trim(name)));
    return it == index_.end() ? -1 : it->second;
}

const std::string& field_or_empty(const std::vector<std::string>& fields, int column) {
    static const std::string empty;
    if (column < 0 || static_cast<std::size_t>(column) >= fields.size()) return empty;
    return fields[static_cast<std::size_t>(column)];
}

} // namespace pitwall::ingest
