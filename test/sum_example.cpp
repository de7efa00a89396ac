#include "sum.hpp"
#include <boost/test/unit_test.hpp>
#include <sstream>

using sum_example::source_token;

namespace
{
    std::string evaluate(std::vector<source_token> const &tokens)
    {
        std::ostringstream out;
        sum_example::evaluate(tokens, out);
        return out.str();
    }
}

BOOST_AUTO_TEST_CASE(sum_example_nested)
{
    BOOST_CHECK_EQUAL("sum: 10\n", evaluate({{calc::digit{1}, 1, 1},
                                             {calc::plus(), 1, 3},
                                             {calc::left_parenthesis(), 1, 5},
                                             {calc::digit{2}, 1, 6},
                                             {calc::plus(), 1, 8},
                                             {calc::digit{3}, 1, 10},
                                             {calc::right_parenthesis(), 1, 11},
                                             {calc::plus(), 1, 13},
                                             {calc::digit{4}, 1, 15}}));
}

BOOST_AUTO_TEST_CASE(sum_example_unclosed_parenthesis)
{
    BOOST_CHECK_EQUAL("parse error after 0 tokens: expected digit, found left_parenthesis; not enough tokens; in "
                      "parenthesized sum\n",
                      evaluate({{calc::left_parenthesis(), 1, 1},
                                {calc::digit{1}, 1, 2},
                                {calc::plus(), 1, 4},
                                {calc::digit{2}, 1, 6}}));
}

BOOST_AUTO_TEST_CASE(sum_example_trailing_token)
{
    BOOST_CHECK_EQUAL("sum: 5\nunexpected right_parenthesis at 1:3\n",
                      evaluate({{calc::digit{5}, 1, 1}, {calc::right_parenthesis(), 1, 3}}));
}
