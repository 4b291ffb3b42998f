#include "text_format.hpp"

namespace marshal {
    namespace {
        constexpr std::string_view whitespace = " \t\n\r\f\v";
    }

    std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines;
        while (!text.empty()) {
            auto end = text.find('\n');
            auto line = text.substr(0, end);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.push_back(line);
            if (end == std::string_view::npos) {
                break;
            }
            text.remove_prefix(end + 1);
        }
        return lines;
    }

    std::vector<std::string_view> split_whitespace(std::string_view line) {
        std::vector<std::string_view> tokens;
        auto start = line.find_first_not_of(whitespace);
        while (start != std::string_view::npos) {
            auto end = line.find_first_of(whitespace, start);
            tokens.push_back(line.substr(start, end == std::string_view::npos ? end : end - start));
            if (end == std::string_view::npos) {
                break;
            }
            start = line.find_first_not_of(whitespace, end);
        }
        return tokens;
    }

    std::string_view trim(std::string_view s) {
        auto start = s.find_first_not_of(whitespace);
        if (start == std::string_view::npos) {
            return {};
        }
        auto end = s.find_last_not_of(whitespace);
        return s.substr(start, end - start + 1);
    }

    std::uint64_t parse_dimension(std::string_view line, const std::string &what) {
        auto value = parse_number<std::uint64_t>(trim(line));
        if (!value.has_value()) {
            throw ParseError("marshal::parse_matrix: couldn't parse '" + std::string(line) + "' as " + what);
        }
        return *value;
    }
}
