/**
 * @file ColumnSpec.cpp
 * @brief Implementation of column list tokenizing and name matching helpers
 */

#include "ColumnSpec.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace dsearch {

std::string trim(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    const size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

std::vector<std::string> split_list(const std::string& spec, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(spec);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string join_list(const std::vector<std::string>& tokens, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) joined += separator;
        joined += tokens[i];
    }
    return joined;
}

bool is_literal_token(const std::string& token) {
    return !token.empty() && token.front() == '"';
}

std::vector<StatisticSpec> parse_statistics(const std::string& spec,
                                            std::vector<std::string>* malformed) {
    std::vector<StatisticSpec> statistics;
    for (const auto& entry : split_list(spec, ';')) {
        std::istringstream parts(entry);
        std::string field;
        std::string keyword;
        parts >> field >> keyword;

        auto type = parse_statistic_keyword(keyword);
        if (field.empty() || !type) {
            if (malformed) malformed->push_back(entry);
            continue;
        }
        statistics.emplace_back(field, *type);
    }
    return statistics;
}

std::string format_statistics(const std::vector<StatisticSpec>& statistics) {
    std::vector<std::string> entries;
    entries.reserve(statistics.size());
    for (const auto& stat : statistics) {
        entries.push_back(stat.field + " " + statistic_keyword(stat.type));
    }
    return join_list(entries, ";");
}

} // namespace dsearch
