#pragma once

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include "math_utils/matrix.h"
#include "local_storage.hpp"

/**
 * The matrix text format:
 *   <rows>
 *   <cols>
 *   <rows lines, each holding cols whitespace separated numbers>
 * Anything after the last row is ignored.
 */
namespace marshal {
    class ParseError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // splits on '\n', dropping a trailing '\r' from every line. A final newline does not start a new line.
    std::vector<std::string_view> split_lines(std::string_view text);

    std::vector<std::string_view> split_whitespace(std::string_view line);

    std::string_view trim(std::string_view s);

    /**
     * Parses the rows or cols header line.
     * @param what used in the error message ("rows" or "cols").
     * @throws ParseError if the trimmed line is not an unsigned integer.
     */
    std::uint64_t parse_dimension(std::string_view line, const std::string &what);

    template<typename T>
    std::optional<T> parse_number(std::string_view token) {
        if (token.size() > 1 && token.front() == '+' && token[1] != '-') {
            token.remove_prefix(1);
        }
        T value{};
        auto end = token.data() + token.size();
        auto [ptr, ec] = std::from_chars(token.data(), end, value);
        if (ec != std::errc() || ptr != end) {
            return std::nullopt;
        }
        return value;
    }

    // shortest representation that parses back to the same value.
    template<typename T>
    std::string format_number(const T &value) {
        char buf[64];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        if (ec != std::errc()) {
            throw std::logic_error("marshal::format_number: buffer too small");
        }
        return {buf, ptr};
    }

    /**
     * @throws ParseError describing the first problem found.
     */
    template<typename T>
    math_utils::matrix<T> parse_lines(const std::vector<std::string_view> &lines) {
        if (lines.empty()) {
            throw ParseError("marshal::parse_matrix: matrix text is empty");
        }
        auto rows = parse_dimension(lines[0], "rows");

        if (lines.size() < 2) {
            throw ParseError("marshal::parse_matrix: missing cols line");
        }
        auto cols = parse_dimension(lines[1], "cols");

        // grows with the rows actually present, the header alone is not trusted for sizing.
        std::vector<T> numbers;
        for (std::uint64_t i = 0; i < rows; ++i) {
            if (i + 2 >= lines.size()) {
                throw ParseError("marshal::parse_matrix: not enough rows: found " + std::to_string(i) + " of " +
                                 std::to_string(rows));
            }

            auto tokens = split_whitespace(lines[i + 2]);
            if (tokens.size() != cols) {
                throw ParseError("marshal::parse_matrix: row " + std::to_string(i) + " length: " +
                                 std::to_string(tokens.size()) + " doesn't match cols: " + std::to_string(cols));
            }
            for (auto token: tokens) {
                auto number = parse_number<T>(token);
                if (!number.has_value()) {
                    throw ParseError("marshal::parse_matrix: couldn't parse '" + std::string(token) + "' in row " +
                                     std::to_string(i));
                }
                numbers.push_back(*number);
            }
        }

        return math_utils::matrix<T>(rows, cols, std::move(numbers));
    }

    template<typename T>
    math_utils::matrix<T> parse_matrix(std::string_view text) {
        return parse_lines<T>(split_lines(text));
    }

    template<typename T>
    std::string format_matrix(const math_utils::matrix<T> &m) {
        std::string out = std::to_string(m.rows()) + "\n" + std::to_string(m.cols()) + "\n";
        for (std::uint64_t i = 0; i < m.rows(); ++i) {
            for (std::uint64_t j = 0; j < m.cols(); ++j) {
                if (j > 0) {
                    out += ' ';
                }
                out += format_number(m(i, j));
            }
            out += '\n';
        }
        return out;
    }

    /**
     * @throws StorageError if the file cannot be read, ParseError (prefixed with the file name) if its
     *         content is not a valid matrix.
     */
    template<typename T>
    math_utils::matrix<T> load_matrix(const std::filesystem::path &filename) {
        auto content = load_from_file(filename);
        try {
            return parse_matrix<T>(content);
        } catch (const ParseError &e) {
            throw ParseError(filename.string() + ": " + e.what());
        } catch (const math_utils::InvalidShape &e) {
            throw ParseError(filename.string() + ": " + e.what());
        }
    }

    template<typename T>
    void store_matrix(const std::filesystem::path &filename, const math_utils::matrix<T> &m) {
        dump_to_file(filename, format_matrix(m));
    }
}
