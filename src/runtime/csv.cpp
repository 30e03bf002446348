#include <oryx/runtime/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace oryx::runtime {

auto read_record_text(std::istream& input, std::string& out) -> bool {
    out.clear();
    std::string line;
    bool any = false;
    std::size_t quotes = 0;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (any) {
            out.push_back('\n');
        } else if (line.empty()) {
            // Blank lines between records carry no data.
            continue;
        }
        any = true;
        quotes += static_cast<std::size_t>(std::count(line.begin(), line.end(), '"'));
        out += line;
        if (quotes % 2 == 0) {
            return true;
        }
    }
    return any;
}

auto parse_csv_records(const std::string& text, char separator)
    -> std::expected<std::vector<std::vector<std::string>>, std::string> {
    std::vector<std::vector<std::string>> records;
    if (text.empty()) {
        return records;
    }
    try {
        std::istringstream stream(text);
        rapidcsv::Document doc(stream, rapidcsv::LabelParams(-1, -1),
                               rapidcsv::SeparatorParams(separator, false, false, true));
        const std::size_t n = doc.GetRowCount();
        records.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            records.push_back(doc.GetRow<std::string>(i));
        }
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("malformed delimited text: {}", e.what()));
    }
    return records;
}

auto format_csv_row(const std::vector<std::string>& fields, char separator) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out.push_back(separator);
        }
        const auto& field = fields[i];
        bool quote = field.find_first_of(std::string{separator, '"', '\n', '\r'}) !=
                     std::string::npos;
        if (!quote) {
            out += field;
            continue;
        }
        out.push_back('"');
        for (char c : field) {
            if (c == '"') {
                out.push_back('"');
            }
            out.push_back(c);
        }
        out.push_back('"');
    }
    return out;
}

CsvWriter::CsvWriter(std::ofstream out, std::filesystem::path path, char separator)
    : out_(std::move(out)), path_(std::move(path)), separator_(separator) {}

auto CsvWriter::open(const std::filesystem::path& path, char separator)
    -> std::expected<CsvWriter, std::string> {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        return std::unexpected(fmt::format("failed to open output file: {}", path.string()));
    }
    return CsvWriter(std::move(out), path, separator);
}

void CsvWriter::write(const std::vector<std::string>& fields) {
    out_ << format_csv_row(fields, separator_) << '\n';
}

void CsvWriter::write(const Row& row) {
    std::vector<std::string> fields;
    fields.reserve(row.size());
    for (const auto& value : row) {
        fields.push_back(to_text(value));
    }
    write(fields);
}

auto CsvWriter::close() -> std::expected<void, std::string> {
    out_.flush();
    if (!out_) {
        return std::unexpected(fmt::format("failed writing {}", path_.string()));
    }
    out_.close();
    return {};
}

}  // namespace oryx::runtime
