#pragma once

#include <tokparse/parse_result.hpp>

namespace tokparse
{
    template <class Parser, class Mapper>
    struct map_parser
    {
        Parser parser;
        Mapper mapper;

        template <class Wrapper>
        using mapped_type = typename std::decay<decltype(
            std::declval<Mapper &>()(std::declval<output_of<Parser, Wrapper>>()))>::type;

        template <class Wrapper>
        parse_result<token_of<Parser, Wrapper>, mapped_type<Wrapper>, Wrapper>
        operator()(token_range<Wrapper> const tokens)
        {
            typedef parse_result<token_of<Parser, Wrapper>, mapped_type<Wrapper>, Wrapper> result_type;
            auto inner = parser(tokens);
            return Si::visit<result_type>(
                inner.outcome,
                [this](parse_complete<Wrapper, output_of<Parser, Wrapper>> &complete) -> result_type
                {
                    return make_complete(complete.rest, mapper(std::move(complete.result)));
                },
                [](parse_error<token_of<Parser, Wrapper>> &error) -> result_type
                {
                    return std::move(error);
                });
        }
    };

    // Transforms the output of a successful parse. Failures pass through unchanged.
    template <class Parser, class Mapper>
    map_parser<typename std::decay<Parser>::type, typename std::decay<Mapper>::type> map(Parser &&parser,
                                                                                         Mapper &&mapper)
    {
        return {std::forward<Parser>(parser), std::forward<Mapper>(mapper)};
    }
}
