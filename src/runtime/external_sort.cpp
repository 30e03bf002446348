#include <oryx/runtime/backend.hpp>
#include <oryx/runtime/csv.hpp>
#include <oryx/runtime/external_sort.hpp>
#include <oryx/runtime/row_source.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <queue>
#include <utility>
#include <vector>

namespace oryx::runtime {

namespace {

struct KeyedRecord {
    std::vector<Value> keys;
    std::vector<std::string> fields;
};

struct HeapEntry {
    KeyedRecord record;
    std::size_t run = 0;
};

/// Distinguishes sorts started within one clock tick.
std::atomic<std::uint64_t> scratch_counter{0};

/// Removes the scratch directory of one sort on scope exit.
class ScratchDir {
   public:
    explicit ScratchDir(std::filesystem::path dir) : dir_(std::move(dir)) {}
    ScratchDir(const ScratchDir&) = delete;
    auto operator=(const ScratchDir&) -> ScratchDir& = delete;
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return dir_; }

   private:
    std::filesystem::path dir_;
};

auto keyed(const plan::RowComparator& comparator, SourceRow row)
    -> std::expected<KeyedRecord, std::string> {
    try {
        auto keys = comparator.extract(row.fields);
        return KeyedRecord{.keys = std::move(keys), .fields = std::move(row.fields)};
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("record {}: {}", row.id, e.what()));
    }
}

}  // namespace

ExternalSorter::ExternalSorter(plan::RowComparator comparator, SortOptions options)
    : comparator_(std::move(comparator)), options_(std::move(options)) {
    if (options_.chunk_rows == 0) {
        options_.chunk_rows = 1;
    }
    if (options_.work_dir.empty()) {
        options_.work_dir = default_work_dir();
    }
}

auto ExternalSorter::sort_file(const std::filesystem::path& input,
                               const std::filesystem::path& output)
    -> std::expected<std::size_t, std::string> {
    const char sep = options_.table.separator;
    auto source = CsvRowSource::open(input, options_.table);
    if (!source) {
        return std::unexpected(source.error());
    }
    auto writer = CsvWriter::open(output, sep);
    if (!writer) {
        return std::unexpected(writer.error());
    }
    if (options_.table.have_header) {
        auto header = read_header(input, options_.table);
        if (!header) {
            return std::unexpected(header.error());
        }
        writer->write(*header);
    }

    auto less = [this](const KeyedRecord& lhs, const KeyedRecord& rhs) {
        return comparator_.compare(lhs.keys, rhs.keys) < 0;
    };

    ScratchDir scratch(options_.work_dir /
                       fmt::format("sort-{}-{}",
                                   std::chrono::steady_clock::now().time_since_epoch().count(),
                                   scratch_counter.fetch_add(1)));
    std::vector<std::filesystem::path> runs;
    std::vector<KeyedRecord> chunk;
    std::size_t total = 0;

    while (true) {
        chunk.clear();
        while (chunk.size() < options_.chunk_rows) {
            auto row = (*source)->next();
            if (!row) {
                return std::unexpected(row.error());
            }
            if (!*row) {
                break;
            }
            auto record = keyed(comparator_, std::move(**row));
            if (!record) {
                return std::unexpected(record.error());
            }
            chunk.push_back(std::move(*record));
        }
        if (chunk.empty()) {
            break;
        }
        total += chunk.size();
        std::sort(chunk.begin(), chunk.end(), less);

        if (runs.empty() && chunk.size() < options_.chunk_rows) {
            // Single in-memory run.
            for (const auto& record : chunk) {
                writer->write(record.fields);
            }
            if (auto ok = writer->close(); !ok) {
                return std::unexpected(ok.error());
            }
            return total;
        }

        if (runs.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(scratch.path(), ec);
            if (ec) {
                return std::unexpected(fmt::format("cannot create work directory {}: {}",
                                                   scratch.path().string(), ec.message()));
            }
        }
        auto run_path = scratch.path() / fmt::format("run-{}.csv", runs.size());
        auto run = CsvWriter::open(run_path, sep);
        if (!run) {
            return std::unexpected(run.error());
        }
        for (const auto& record : chunk) {
            run->write(record.fields);
        }
        if (auto ok = run->close(); !ok) {
            return std::unexpected(ok.error());
        }
        runs.push_back(std::move(run_path));
    }
    chunk.clear();
    chunk.shrink_to_fit();

    spdlog::debug("external sort of {}: {} record(s) in {} run(s)", input.string(), total,
                  runs.size());

    TableOptions run_options = options_.table;
    run_options.have_header = false;
    std::vector<std::unique_ptr<CsvRowSource>> readers;
    readers.reserve(runs.size());
    auto greater = [this](const HeapEntry& lhs, const HeapEntry& rhs) {
        int c = comparator_.compare(lhs.record.keys, rhs.record.keys);
        return c != 0 ? c > 0 : lhs.run > rhs.run;
    };
    std::priority_queue<HeapEntry, std::vector<HeapEntry>, decltype(greater)> heap(greater);

    auto pull = [&](std::size_t run) -> std::expected<void, std::string> {
        auto row = readers[run]->next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            return {};
        }
        auto record = keyed(comparator_, std::move(**row));
        if (!record) {
            return std::unexpected(record.error());
        }
        heap.push(HeapEntry{.record = std::move(*record), .run = run});
        return {};
    };

    for (const auto& path : runs) {
        auto reader = CsvRowSource::open(path, run_options);
        if (!reader) {
            return std::unexpected(reader.error());
        }
        readers.push_back(std::move(*reader));
        if (auto ok = pull(readers.size() - 1); !ok) {
            return std::unexpected(ok.error());
        }
    }

    while (!heap.empty()) {
        auto top = heap.top();
        heap.pop();
        writer->write(top.record.fields);
        if (auto ok = pull(top.run); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (auto ok = writer->close(); !ok) {
        return std::unexpected(ok.error());
    }
    return total;
}

}  // namespace oryx::runtime
