#pragma once

#include "generated.hpp"
#include <tokparse/tokparse.hpp>

namespace tokparse
{
    namespace test
    {
        typedef token_range<calc::token> calc_range;

        // Wraps a parser and counts how often it is invoked.
        template <class Parser>
        struct counting_parser
        {
            Parser parser;
            std::size_t *calls;

            template <class Wrapper>
            result_of_parser<Parser, Wrapper> operator()(token_range<Wrapper> const tokens)
            {
                ++*calls;
                return parser(tokens);
            }
        };

        template <class Parser>
        counting_parser<typename std::decay<Parser>::type> count_calls(Parser &&parser, std::size_t &calls)
        {
            return {std::forward<Parser>(parser), &calls};
        }

        // Fails with a fixed consumption count without looking at the input.
        inline auto fail_after(std::size_t const consumed, char const *label)
        {
            return [consumed, label](calc_range) -> parse_result<calc::token, std::uint64_t>
            {
                parse_error<calc::token> error{{}, consumed};
                error.errors.emplace_back(in_context{label});
                return error;
            };
        }

        // Succeeds without consuming anything.
        inline auto succeed_with(std::uint64_t const value)
        {
            return [value](calc_range tokens) -> parse_result<calc::token, std::uint64_t>
            {
                return make_complete(tokens, value);
            };
        }

        inline std::vector<calc::token> digits_separated_by_commas(std::vector<std::uint64_t> const &digits)
        {
            std::vector<calc::token> result;
            for (std::uint64_t const digit : digits)
            {
                if (!result.empty())
                {
                    result.emplace_back(calc::comma());
                }
                result.emplace_back(calc::digit{digit});
            }
            return result;
        }
    }
}
