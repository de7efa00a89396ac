#include "test_parsers.hpp"
#include "print_outputs.hpp"
#include <boost/test/unit_test.hpp>

using namespace tokparse;
using namespace tokparse::test;

BOOST_AUTO_TEST_CASE(many0_collects_until_failure)
{
    std::vector<calc::token> const tokens = {calc::digit{1}, calc::digit{2}, calc::plus(), calc::digit{3}};
    auto const result = many0(calc::parse_digit)(make_token_range(tokens));
    BOOST_REQUIRE(result.complete());
    BOOST_CHECK_EQUAL((std::vector<std::uint64_t>{1, 2}), result.complete()->result);
    BOOST_CHECK(result.complete()->rest.begin() == tokens.data() + 2);
}

BOOST_AUTO_TEST_CASE(many0_consumes_everything)
{
    std::vector<calc::token> const tokens = {calc::digit{1}, calc::digit{2}, calc::digit{3}};
    auto const result = many0(calc::parse_digit)(make_token_range(tokens));
    BOOST_REQUIRE(result.complete());
    BOOST_CHECK_EQUAL((std::vector<std::uint64_t>{1, 2, 3}), result.complete()->result);
    BOOST_CHECK(result.complete()->rest.empty());
}

BOOST_AUTO_TEST_CASE(many0_no_match)
{
    std::vector<calc::token> const tokens = {calc::plus()};
    calc_range const input = make_token_range(tokens);
    auto const result = many0(calc::parse_digit)(input);
    BOOST_REQUIRE(result.complete());
    BOOST_CHECK(result.complete()->result.empty());
    BOOST_CHECK(result.complete()->rest.begin() == input.begin());
}

BOOST_AUTO_TEST_CASE(many0_empty_input)
{
    std::vector<calc::token> const tokens;
    std::size_t calls = 0;
    auto const result = many0(count_calls(calc::parse_digit, calls))(make_token_range(tokens));
    BOOST_REQUIRE(result.complete());
    BOOST_CHECK(result.complete()->result.empty());
    BOOST_CHECK(result.complete()->rest.empty());
    BOOST_CHECK_EQUAL(0u, calls);
}

BOOST_AUTO_TEST_CASE(many0_stops_without_progress)
{
    std::vector<calc::token> const tokens = {calc::plus()};
    calc_range const input = make_token_range(tokens);
    auto const result = many0(succeed_with(9))(input);
    BOOST_REQUIRE(result.complete());
    BOOST_CHECK_EQUAL((std::vector<std::uint64_t>{9}), result.complete()->result);
    BOOST_CHECK(result.complete()->rest.begin() == input.begin());
}

BOOST_AUTO_TEST_CASE(many1_collects_until_failure)
{
    std::vector<calc::token> const tokens = {calc::digit{4}, calc::digit{5}, calc::comma()};
    auto const result = many1(calc::parse_digit)(make_token_range(tokens));
    BOOST_REQUIRE(result.complete());
    BOOST_CHECK_EQUAL((std::vector<std::uint64_t>{4, 5}), result.complete()->result);
    BOOST_CHECK(result.complete()->rest.begin() == tokens.data() + 2);
}

BOOST_AUTO_TEST_CASE(many1_first_failure_is_the_inner_error)
{
    std::vector<calc::token> const tokens = {calc::comma(), calc::digit{5}};
    calc_range const input = make_token_range(tokens);
    auto const expected = calc::parse_digit(input);
    BOOST_REQUIRE(expected.error());
    auto const result = many1(calc::parse_digit)(input);
    BOOST_REQUIRE(result.error());
    BOOST_CHECK_EQUAL(*expected.error(), *result.error());
}

BOOST_AUTO_TEST_CASE(many1_keeps_consumption_count_of_inner_error)
{
    std::vector<calc::token> const tokens = {calc::digit{1}};
    auto const result = many1(fail_after(3, "deep"))(make_token_range(tokens));
    BOOST_REQUIRE(result.error());
    BOOST_CHECK_EQUAL(3u, result.error()->tokens_consumed);
}

BOOST_AUTO_TEST_CASE(many1_empty_input)
{
    std::vector<calc::token> const tokens;
    auto const result = many1(calc::parse_digit)(make_token_range(tokens));
    BOOST_REQUIRE(result.error());
    BOOST_CHECK_EQUAL(make_not_enough_token<calc::token>(), *result.error());
}

BOOST_AUTO_TEST_CASE(many_of_groups)
{
    std::vector<calc::token> const tokens = {calc::left_parenthesis(), calc::digit{1}, calc::right_parenthesis(),
                                             calc::left_parenthesis(), calc::digit{2}, calc::right_parenthesis(),
                                             calc::left_parenthesis()};
    auto const result = many1(delimited(calc::parse_left_parenthesis, calc::parse_digit,
                                        calc::parse_right_parenthesis))(make_token_range(tokens));
    BOOST_REQUIRE(result.complete());
    BOOST_CHECK_EQUAL((std::vector<std::uint64_t>{1, 2}), result.complete()->result);
    BOOST_CHECK(result.complete()->rest.begin() == tokens.data() + 6);
}

BOOST_AUTO_TEST_CASE(many1_of_payload_less_tokens)
{
    std::vector<calc::token> const tokens = {calc::plus(), calc::plus(), calc::digit{1}};
    auto const result = many1(calc::parse_plus)(make_token_range(tokens));
    BOOST_REQUIRE(result.complete());
    BOOST_CHECK_EQUAL(std::vector<std::tuple<>>(2), result.complete()->result);
    BOOST_CHECK(result.complete()->rest.begin() == tokens.data() + 2);
}
