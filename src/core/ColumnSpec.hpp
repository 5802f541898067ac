#pragma once

/**
 * @file ColumnSpec.hpp
 * @brief Parsing helpers for column, group and statistic specifications
 *
 * Output column lists are comma-separated and may contain quoted literal
 * constants ("\"SiteRef\""). Group lists are ';'-separated field names and
 * statistic lists are ';'-separated "Field STAT" entries.
 */

#include "../../include/data_search.hpp"

#include <string>
#include <vector>

namespace dsearch {

std::string trim(const std::string& text);
std::string to_lower(const std::string& text);
bool iequals(const std::string& a, const std::string& b);

/**
 * @brief Split a specification on a delimiter, trimming each token
 *
 * Empty tokens are dropped.
 */
std::vector<std::string> split_list(const std::string& spec, char delimiter);

std::string join_list(const std::vector<std::string>& tokens, const std::string& separator);

/**
 * @brief A token starting with a double quote is a pass-through constant
 */
bool is_literal_token(const std::string& token);

/**
 * @brief Parse "Field STAT;Field STAT" into statistic pairs
 *
 * @param spec Statistic specification
 * @param malformed Receives entries with no field, or an unknown keyword
 * @return Parsed statistics in specification order
 */
std::vector<StatisticSpec> parse_statistics(const std::string& spec,
                                            std::vector<std::string>* malformed = nullptr);

std::string format_statistics(const std::vector<StatisticSpec>& statistics);

} // namespace dsearch
