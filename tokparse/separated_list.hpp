#pragma once

#include <tokparse/many.hpp>
#include <silicium/optional.hpp>
#include <vector>

namespace tokparse
{
    template <repetition_minimum Minimum, class Separator, class Item>
    struct separated_list_parser
    {
        Separator separator;
        Item item;

        template <class Wrapper>
        parse_result<token_of<Item, Wrapper>, std::vector<output_of<Item, Wrapper>>, Wrapper>
        operator()(token_range<Wrapper> const tokens)
        {
            typedef output_of<Item, Wrapper> element_type;
            typedef parse_error<token_of<Item, Wrapper>> error_type;
            std::vector<element_type> items;
            if (tokens.empty())
            {
                if (Minimum == repetition_minimum::one)
                {
                    return make_not_enough_token<token_of<Item, Wrapper>>();
                }
                return make_complete(tokens, std::move(items));
            }
            token_range<Wrapper> rest = tokens;
            Si::optional<error_type> failure;
            bool repeat = true;
            while (repeat)
            {
                token_range<Wrapper> const round_start = rest;
                auto element = item(rest);
                repeat = Si::visit<bool>(element.outcome,
                                         [&](parse_complete<Wrapper, element_type> &complete) -> bool
                                         {
                                             rest = complete.rest;
                                             items.emplace_back(std::move(complete.result));
                                             return !rest.empty();
                                         },
                                         [&](error_type &error) -> bool
                                         {
                                             if ((Minimum == repetition_minimum::one) && items.empty())
                                             {
                                                 failure = std::move(error).with_tokens_consumed(
                                                     consumed_between(tokens, rest));
                                             }
                                             return false;
                                         });
                if (!repeat)
                {
                    break;
                }
                auto separation = separator(rest);
                repeat = Si::visit<bool>(
                    separation.outcome,
                    [&](parse_complete<Wrapper, output_of<Separator, Wrapper>> const &separated) -> bool
                    {
                        rest = separated.rest;
                        return rest.begin() != round_start.begin();
                    },
                    [](parse_error<token_of<Separator, Wrapper>> const &) -> bool
                    {
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

    // Items separated by Separator, possibly none. A trailing separator is consumed. Never fails.
    template <class Separator, class Item>
    separated_list_parser<repetition_minimum::zero, typename std::decay<Separator>::type,
                          typename std::decay<Item>::type>
    separated_list0(Separator &&separator, Item &&item)
    {
        return {std::forward<Separator>(separator), std::forward<Item>(item)};
    }

    // Like separated_list0, but an empty input or a failing first item is an error.
    template <class Separator, class Item>
    separated_list_parser<repetition_minimum::one, typename std::decay<Separator>::type,
                          typename std::decay<Item>::type>
    separated_list1(Separator &&separator, Item &&item)
    {
        return {std::forward<Separator>(separator), std::forward<Item>(item)};
    }
}
