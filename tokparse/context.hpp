#pragma once

#include <tokparse/parse_result.hpp>

namespace tokparse
{
    template <class Parser>
    struct context_parser
    {
        char const *label;
        Parser parser;

        template <class Wrapper>
        result_of_parser<Parser, Wrapper> operator()(token_range<Wrapper> const tokens)
        {
            auto result = parser(tokens);
            Si::visit<void>(result.outcome,
                            [](parse_complete<Wrapper, output_of<Parser, Wrapper>> const &)
                            {
                            },
                            [this](parse_error<token_of<Parser, Wrapper>> &error)
                            {
                                error.errors.emplace_back(in_context{label});
                            });
            return result;
        }
    };

    // Names the grammar rule Parser stands for in the error trail of its failures.
    template <class Parser>
    context_parser<typename std::decay<Parser>::type> context(char const *label, Parser &&parser)
    {
        return {label, std::forward<Parser>(parser)};
    }
}
