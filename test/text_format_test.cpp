#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "marshal/text_format.hpp"
#include "test_utils.hpp"

namespace {
    template<typename T>
    bool fails_to_parse(const std::vector<std::string_view> &lines) {
        try {
            marshal::parse_lines<T>(lines);
        } catch (const marshal::ParseError &) {
            return true;
        }
        return false;
    }
}

int text_format_test(int, char *[]) {
    auto ints = marshal::parse_lines<std::int32_t>({"3", "2", " 1 2", "3 4", "5 6"});
    assert(ints == TestUtils::scenario_left());

    auto floats = marshal::parse_lines<float>({"3", "2", "1.2 2.567", "3.45 4.2", "5.0 6.0"});
    assert((floats.data() == std::vector<float>{1.2f, 2.567f, 3.45f, 4.2f, 5.0f, 6.0f}));

    auto from_text = marshal::parse_matrix<double>("2\r\n2\r\n1\t-2.5\r\n +3 4e1\r\n\r\ntrailing garbage\n");
    assert((from_text.data() == std::vector<double>{1.0, -2.5, 3.0, 40.0}));

    assert(fails_to_parse<std::int32_t>({"3", "2", "1.2 2.567", "3.45 4.2", "5.0 6.0"}));
    assert(fails_to_parse<std::int32_t>({}));
    assert(fails_to_parse<std::int32_t>({""}));
    assert(fails_to_parse<std::int32_t>({"2"}));
    assert(fails_to_parse<std::int32_t>({"3", "2"}));
    assert(fails_to_parse<std::int32_t>({"a"}));
    assert(fails_to_parse<std::int32_t>({"2", "a"}));
    assert(fails_to_parse<std::int32_t>({"-2", "2"}));
    assert(fails_to_parse<std::int32_t>({"3", "2", "1 2", "3 4"}));
    assert(fails_to_parse<std::int32_t>({"3", "2", "1 2 3", "4 5 6", "7 8 9"}));
    assert(fails_to_parse<std::int32_t>({"3", "2", "1 2 3", "a 5 6", "7 8 9"}));
    assert(fails_to_parse<std::int32_t>({"1", "2", "1 x2"}));
    assert(fails_to_parse<std::int32_t>({"1", "1", "+-1"}));
    assert(fails_to_parse<std::int32_t>({"1", "1", "4294967296"}));

    std::string message;
    try {
        marshal::parse_lines<std::int32_t>({"3", "2", "1 2 3", "4 5 6", "7 8 9"});
    } catch (const marshal::ParseError &e) {
        message = e.what();
    }
    assert(message.find("row 0 length: 3 doesn't match cols: 2") != std::string::npos);

    // a huge declared row count with a single row present is a parse error, not an allocation failure.
    message.clear();
    try {
        marshal::parse_lines<std::int32_t>({"3000000000", "2", "1 2"});
    } catch (const marshal::ParseError &e) {
        message = e.what();
    }
    assert(message.find("not enough rows: found 1 of 3000000000") != std::string::npos);
    assert(fails_to_parse<double>({"1", "18446744073709551615", "1 2"}));

    assert(marshal::format_matrix(TestUtils::scenario_product()) ==
           "3\n4\n29 32 35 38\n65 72 79 86\n101 112 123 134\n");

    math_utils::matrix<double> fractions(1, 3, {0.1, -2.5, 1e-7});
    auto text = marshal::format_matrix(fractions);
    assert(text == "1\n3\n0.1 -2.5 1e-07\n");
    assert(marshal::parse_matrix<double>(text) == fractions);

    assert(marshal::format_matrix(math_utils::matrix<std::int64_t>(2, 0, {})) == "2\n0\n\n\n");

    assert(marshal::split_whitespace("  a \t b  ").size() == 2);
    assert(marshal::trim(" \t42\r ") == "42");
    assert(marshal::split_lines("a\nb\n").size() == 2);
    return 0;
}
