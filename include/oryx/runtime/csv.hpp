#pragma once

#include <oryx/core/value.hpp>

#include <expected>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

namespace oryx::runtime {

/// Read the text of one logical record. Quoted fields may span physical
/// lines, in which case the line breaks are kept. Returns false at end of
/// input.
auto read_record_text(std::istream& input, std::string& out) -> bool;

/// Tokenize records (RFC 4180 quoting) with rapidcsv.
[[nodiscard]] auto parse_csv_records(const std::string& text, char separator)
    -> std::expected<std::vector<std::vector<std::string>>, std::string>;

/// Render one record, quoting fields that contain the separator, a quote or
/// a line break.
[[nodiscard]] auto format_csv_row(const std::vector<std::string>& fields, char separator)
    -> std::string;

/// Buffered delimited-text writer.
class CsvWriter {
   public:
    [[nodiscard]] static auto open(const std::filesystem::path& path, char separator = ',')
        -> std::expected<CsvWriter, std::string>;

    void write(const std::vector<std::string>& fields);
    void write(const Row& row);

    /// Flush and report any stream failure.
    [[nodiscard]] auto close() -> std::expected<void, std::string>;

   private:
    CsvWriter(std::ofstream out, std::filesystem::path path, char separator);

    std::ofstream out_;
    std::filesystem::path path_;
    char separator_;
};

}  // namespace oryx::runtime
