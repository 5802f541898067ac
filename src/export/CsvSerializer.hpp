/**
 * @file CsvSerializer.hpp
 * @brief Delimited text output of a dataset's (selected) rows
 *
 * Output rules:
 * - one line per row, values separated by ','
 * - a value whose text contains ',' is wrapped in double quotes; embedded
 *   quotes are not escaped
 * - a field named exactly "Distance" is truncated to an integer
 * - tokens starting with '"' are literals written verbatim on every row
 * - nulls are written as empty values
 */

#pragma once

#include "../../include/data_search.hpp"
#include "../core/FeatureStore.hpp"
#include "../core/Logger.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dsearch {

class CsvSerializer {
public:
    struct Options {
        bool append;               // add rows to an existing file, never a header
        bool exclude_header;
        std::string order_columns; // ',' separated, unknown columns ignored

        Options()
            : append(false),
              exclude_header(false) {}
    };

    explicit CsvSerializer(FeatureStore& store);

    /**
     * @brief Write the rows of a dataset to a delimited text file
     *
     * @param dataset Session name or path of the table or feature class
     * @param path Output file
     * @param columns ',' separated field names and quoted literals
     * @return Data rows written; 0 when there is nothing to export (including
     *         a column list with no known field); -1 when the input is missing
     *         or the file cannot be written. A failed write leaves no partial
     *         rows: a new file is removed and an appended one is cut back to
     *         its earlier length.
     */
    long write_csv(const std::string& dataset, const std::string& path,
                   const std::string& columns, const Options& options = Options());

    /**
     * @brief Create (or truncate) a file holding only a header line
     */
    bool write_empty_csv(const std::string& path, const std::string& header);

    /**
     * @brief Text form of one value under the quoting and Distance rules
     */
    static std::string format_value(const FieldValue& value, bool truncate_to_integer);

    static std::string quote_if_needed(const std::string& text);

private:
    void discard_partial(const std::string& path, const std::optional<std::uintmax_t>& kept_size);

    FeatureStore& store_;
    Logger logger_;
};

} // namespace dsearch
