#pragma once

/// @file include/fras/data_loader.hpp
/// @brief Transaction record loader (JSON and CSV).
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Turn JSON or CSV text into `RawRecord`s. Values stay textual; validation
/// (numeric amount, ISO-8601 timestamp) is the pipeline's job so that bad
/// records can be reported rather than silently dropped.
///
/// ## Expected Formats
/// ```
/// [ {"id": "t1", "amount": 12.5, "timestamp": "2025-01-02T10:00:00Z",
///    "account": "A1", "vendor": "V1", "description": "office supplies"} ]
/// ```
/// or the same array under a `"transactions"` key. A JSON `null` or absent
/// amount becomes an empty optional.
/// ```
/// id,amount,timestamp,account,vendor,description,label
/// t1,12.50,2025-01-02T10:00:00Z,A1,V1,office supplies,legitimate
/// ```
/// CSV columns are located by header name (case-insensitive), in any
/// order; `id`, `amount` and `timestamp` are required, the rest optional.
/// Fields may be double-quoted; `""` inside quotes is a literal quote.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unreadable files or unparseable
///   documents
/// - Rows with the wrong number of fields are kept as records with missing
///   values, so the pipeline reports them as skipped
/// - Does not modify any file or external state

#include "fras/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fras::core {

class DataLoader {
public:
    /// Load records from disk. `.csv` files are parsed as CSV, everything
    /// else as JSON.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or parsed
    /// - Otherwise one record per JSON element / CSV data row
    [[nodiscard]] static std::optional<std::vector<RawRecord>>
    load_file(const std::string& filepath) noexcept;

    /// Parse a JSON document.
    ///
    /// # Returns
    /// `nullopt` if the text is not JSON, or is neither an array nor an
    /// object with a `"transactions"` array.
    [[nodiscard]] static std::optional<std::vector<RawRecord>>
    parse_json_string(std::string_view json) noexcept;

    /// Parse CSV text with a header row.
    ///
    /// # Returns
    /// `nullopt` if the header lacks `id`, `amount` or `timestamp`.
    [[nodiscard]] static std::optional<std::vector<RawRecord>>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Split one CSV line into fields, honouring double quotes.
    [[nodiscard]] static std::vector<std::string>
    split_csv_line(const std::string& line);
};

}  // namespace fras::core
