#pragma once

#include "generated.hpp"
#include <tokparse/tokparse.hpp>
#include <numeric>
#include <ostream>

namespace sum_example
{
    typedef tokparse::positioned<calc::token> source_token;

    template <class Wrapper>
    tokparse::parse_result<calc::token, std::uint64_t, Wrapper> parse_sum(tokparse::token_range<Wrapper> tokens);

    struct sum_parser
    {
        template <class Wrapper>
        tokparse::parse_result<calc::token, std::uint64_t, Wrapper>
        operator()(tokparse::token_range<Wrapper> const tokens) const
        {
            return parse_sum(tokens);
        }
    };

    // sum := term {'+' term}
    // term := digit | '(' sum ')'
    template <class Wrapper>
    tokparse::parse_result<calc::token, std::uint64_t, Wrapper> parse_sum(tokparse::token_range<Wrapper> tokens)
    {
        using namespace tokparse;
        auto term = alt(calc::parse_digit,
                        context("parenthesized sum",
                                delimited(calc::parse_left_parenthesis, sum_parser(), calc::parse_right_parenthesis)));
        return map(separated_list1(calc::parse_plus, std::move(term)),
                   [](std::vector<std::uint64_t> const &terms)
                   {
                       return std::accumulate(terms.begin(), terms.end(), std::uint64_t(0));
                   })(tokens);
    }

    // Errors carry no source position. Only an unparsed remainder can be located.
    inline void evaluate(std::vector<source_token> const &tokens, std::ostream &out)
    {
        auto const result = parse_sum(tokparse::make_token_range(tokens));
        if (auto const *const error = result.error())
        {
            out << *error << '\n';
            return;
        }
        auto const &complete = *result.complete();
        out << "sum: " << complete.result << '\n';
        if (!complete.rest.empty())
        {
            out << "unexpected " << *complete.rest.begin() << '\n';
        }
    }
}
