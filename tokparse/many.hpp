#pragma once

#include <tokparse/parse_result.hpp>
#include <silicium/optional.hpp>
#include <vector>

namespace tokparse
{
    enum class repetition_minimum
    {
        zero,
        one
    };

    template <repetition_minimum Minimum, class Parser>
    struct many_parser
    {
        Parser parser;

        template <class Wrapper>
        parse_result<token_of<Parser, Wrapper>, std::vector<output_of<Parser, Wrapper>>, Wrapper>
        operator()(token_range<Wrapper> const tokens)
        {
            typedef output_of<Parser, Wrapper> element_type;
            typedef parse_error<token_of<Parser, Wrapper>> error_type;
            std::vector<element_type> items;
            token_range<Wrapper> rest = tokens;
            if ((Minimum == repetition_minimum::zero) && rest.empty())
            {
                return make_complete(rest, std::move(items));
            }
            Si::optional<error_type> failure;
            bool repeat = true;
            while (repeat)
            {
                auto attempt = parser(rest);
                repeat = Si::visit<bool>(attempt.outcome,
                                         [&](parse_complete<Wrapper, element_type> &complete) -> bool
                                         {
                                             bool const made_progress = (complete.rest.begin() != rest.begin());
                                             rest = complete.rest;
                                             items.emplace_back(std::move(complete.result));
                                             return made_progress && !rest.empty();
                                         },
                                         [&](error_type &error) -> bool
                                         {
                                             if ((Minimum == repetition_minimum::one) && items.empty())
                                             {
                                                 failure = std::move(error);
                                             }
                                             return false;
                                         });
            }
            if (failure)
            {
                return std::move(*failure);
            }
            return make_complete(rest, std::move(items));
        }
    };

    // Zero or more repetitions. Never fails.
    template <class Parser>
    many_parser<repetition_minimum::zero, typename std::decay<Parser>::type> many0(Parser &&parser)
    {
        return {std::forward<Parser>(parser)};
    }

    // One or more repetitions. A failure of the first attempt is returned as is.
    template <class Parser>
    many_parser<repetition_minimum::one, typename std::decay<Parser>::type> many1(Parser &&parser)
    {
        return {std::forward<Parser>(parser)};
    }
}
