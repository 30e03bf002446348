#include <oryx/runtime/csv.hpp>
#include <oryx/runtime/row_source.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace oryx::runtime {

namespace {

auto first_record(std::istream& input, char separator)
    -> std::expected<std::optional<std::vector<std::string>>, std::string> {
    std::string text;
    if (!read_record_text(input, text)) {
        return std::optional<std::vector<std::string>>{};
    }
    auto records = parse_csv_records(text, separator);
    if (!records) {
        return std::unexpected(records.error());
    }
    if (records->empty()) {
        return std::optional<std::vector<std::string>>{};
    }
    return std::optional<std::vector<std::string>>{std::move(records->front())};
}

}  // namespace

CsvRowSource::CsvRowSource(Token, std::filesystem::path path, TableOptions options)
    : path_(std::move(path)), options_(options) {
    if (options_.batch_size == 0) {
        options_.batch_size = 1;
    }
}

auto CsvRowSource::open(const std::filesystem::path& path, TableOptions options)
    -> std::expected<std::unique_ptr<CsvRowSource>, std::string> {
    auto source = std::make_unique<CsvRowSource>(Token{}, path, options);
    if (auto ok = source->rewind(); !ok) {
        return std::unexpected(ok.error());
    }
    return source;
}

auto CsvRowSource::rewind() -> std::expected<void, std::string> {
    input_ = std::ifstream(path_);
    if (!input_) {
        return std::unexpected(fmt::format("failed to open {}", path_.string()));
    }
    buffer_.clear();
    cursor_ = 0;
    next_id_ = 0;
    eof_ = false;
    if (options_.have_header) {
        std::string header;
        read_record_text(input_, header);
    }
    return {};
}

auto CsvRowSource::fill() -> std::expected<void, std::string> {
    buffer_.clear();
    cursor_ = 0;
    std::string text;
    std::string record;
    std::size_t count = 0;
    while (count < options_.batch_size && read_record_text(input_, record)) {
        text += record;
        text.push_back('\n');
        ++count;
    }
    if (count < options_.batch_size) {
        eof_ = true;
    }
    auto records = parse_csv_records(text, options_.separator);
    if (!records) {
        return std::unexpected(fmt::format("{} (near record {}): {}", path_.string(), next_id_,
                                           records.error()));
    }
    buffer_ = std::move(*records);
    return {};
}

auto CsvRowSource::next() -> std::expected<std::optional<SourceRow>, std::string> {
    if (cursor_ >= buffer_.size()) {
        if (eof_) {
            return std::optional<SourceRow>{};
        }
        if (auto ok = fill(); !ok) {
            return std::unexpected(ok.error());
        }
        if (buffer_.empty()) {
            return std::optional<SourceRow>{};
        }
    }
    SourceRow row{.id = next_id_++, .fields = std::move(buffer_[cursor_++])};
    return std::optional<SourceRow>{std::move(row)};
}

auto CsvRowSource::next_batch() -> std::expected<std::vector<SourceRow>, std::string> {
    std::vector<SourceRow> batch;
    batch.reserve(options_.batch_size);
    while (batch.size() < options_.batch_size) {
        auto row = next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            break;
        }
        batch.push_back(std::move(**row));
    }
    return batch;
}

auto CsvRowSource::checkpoint() const -> std::optional<std::uint64_t> {
    if (next_id_ == 0) {
        return std::nullopt;
    }
    return next_id_;
}

auto CsvRowSource::recover(std::uint64_t offset) -> std::expected<void, std::string> {
    if (auto ok = rewind(); !ok) {
        return ok;
    }
    for (std::uint64_t i = 0; i < offset; ++i) {
        auto row = next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            return std::unexpected(fmt::format("cannot recover {} past record {}: source has {}",
                                               path_.string(), offset, i));
        }
    }
    spdlog::debug("recovered {} at record {}", path_.string(), offset);
    return {};
}

auto CsvRowSource::completed() const -> bool {
    return eof_ && cursor_ >= buffer_.size();
}

auto resume(const std::filesystem::path& path, const TableOptions& options,
            std::uint64_t checkpoint) -> std::expected<std::unique_ptr<CsvRowSource>, std::string> {
    auto source = CsvRowSource::open(path, options);
    if (!source) {
        return source;
    }
    if (auto ok = (*source)->recover(checkpoint); !ok) {
        return std::unexpected(ok.error());
    }
    return source;
}

auto read_header(const std::filesystem::path& path, const TableOptions& options)
    -> std::expected<std::vector<std::string>, std::string> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(fmt::format("failed to open {}", path.string()));
    }
    auto record = first_record(input, options.separator);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (!*record) {
        return std::unexpected(fmt::format("{} is empty", path.string()));
    }
    if (options.have_header) {
        return std::move(**record);
    }
    std::vector<std::string> names;
    names.reserve((*record)->size());
    for (std::size_t i = 0; i < (*record)->size(); ++i) {
        names.push_back(fmt::format("Col_{}", i + 1));
    }
    return names;
}

}  // namespace oryx::runtime
