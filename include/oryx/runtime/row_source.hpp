#pragma once

#include <oryx/core/options.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace oryx::runtime {

/// One source record with its read-time sequence id.
struct SourceRow {
    std::uint64_t id = 0;
    std::vector<std::string> fields;
};

/// Sequential, resumable record stream.
///
/// checkpoint() reports how many records have been handed out (nullopt before
/// the first one); recover(offset) re-derives the sequence from the start and
/// skips `offset` records, so ids continue exactly where the checkpoint left
/// off.
class RowSource {
   public:
    virtual ~RowSource() = default;

    /// Next record, or nullopt once the source is exhausted.
    [[nodiscard]] virtual auto next() -> std::expected<std::optional<SourceRow>, std::string> = 0;

    [[nodiscard]] virtual auto checkpoint() const -> std::optional<std::uint64_t> = 0;

    [[nodiscard]] virtual auto recover(std::uint64_t offset) -> std::expected<void, std::string> = 0;

    [[nodiscard]] virtual auto completed() const -> bool = 0;
};

/// Record stream over a delimited text file. Records are tokenized in
/// batches of `TableOptions::batch_size`.
class CsvRowSource final : public RowSource {
    struct Token {};

   public:
    /// Use open(); the token keeps construction inside this class.
    CsvRowSource(Token, std::filesystem::path path, TableOptions options);

    [[nodiscard]] static auto open(const std::filesystem::path& path, TableOptions options)
        -> std::expected<std::unique_ptr<CsvRowSource>, std::string>;

    auto next() -> std::expected<std::optional<SourceRow>, std::string> override;
    auto checkpoint() const -> std::optional<std::uint64_t> override;
    auto recover(std::uint64_t offset) -> std::expected<void, std::string> override;
    auto completed() const -> bool override;

    /// Up to `batch_size` records; empty once exhausted.
    [[nodiscard]] auto next_batch() -> std::expected<std::vector<SourceRow>, std::string>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

   private:
    auto rewind() -> std::expected<void, std::string>;
    auto fill() -> std::expected<void, std::string>;

    std::filesystem::path path_;
    TableOptions options_;
    std::ifstream input_;
    std::vector<std::vector<std::string>> buffer_;
    std::size_t cursor_ = 0;
    std::uint64_t next_id_ = 0;
    bool eof_ = false;
};

/// A source positioned after `checkpoint` records of `path`.
[[nodiscard]] auto resume(const std::filesystem::path& path, const TableOptions& options,
                          std::uint64_t checkpoint)
    -> std::expected<std::unique_ptr<CsvRowSource>, std::string>;

/// Column names of a file: its header record, or `Col_1..Col_n` sized by the
/// first record when the file has no header.
[[nodiscard]] auto read_header(const std::filesystem::path& path, const TableOptions& options)
    -> std::expected<std::vector<std::string>, std::string>;

}  // namespace oryx::runtime
