#pragma once

#include <tokparse/parse_result.hpp>
#include <silicium/optional.hpp>

namespace tokparse
{
    template <class Parser>
    struct opt_parser
    {
        Parser parser;

        template <class Wrapper>
        parse_result<token_of<Parser, Wrapper>, Si::optional<output_of<Parser, Wrapper>>, Wrapper>
        operator()(token_range<Wrapper> const tokens)
        {
            typedef output_of<Parser, Wrapper> element_type;
            typedef parse_result<token_of<Parser, Wrapper>, Si::optional<element_type>, Wrapper> result_type;
            auto attempt = parser(tokens);
            return Si::visit<result_type>(
                attempt.outcome,
                [](parse_complete<Wrapper, element_type> &complete) -> result_type
                {
                    return parse_complete<Wrapper, Si::optional<element_type>>{
                        complete.rest, Si::optional<element_type>(std::move(complete.result))};
                },
                [tokens](parse_error<token_of<Parser, Wrapper>> const &) -> result_type
                {
                    return parse_complete<Wrapper, Si::optional<element_type>>{tokens, Si::none};
                });
        }
    };

    // Never fails. An inner failure gives Si::none without consuming anything.
    template <class Parser>
    opt_parser<typename std::decay<Parser>::type> opt(Parser &&parser)
    {
        return {std::forward<Parser>(parser)};
    }
}
