#pragma once

#include <tokparse/parse_result.hpp>

namespace tokparse
{
    template <class Left, class Main, class Right>
    struct delimited_parser
    {
        Left left;
        Main main;
        Right right;

        template <class Wrapper>
        parse_result<token_of<Main, Wrapper>, output_of<Main, Wrapper>, Wrapper>
        operator()(token_range<Wrapper> const tokens)
        {
            typedef parse_result<token_of<Main, Wrapper>, output_of<Main, Wrapper>, Wrapper> result_type;
            auto opening = left(tokens);
            return Si::visit<result_type>(
                opening.outcome,
                [this](parse_complete<Wrapper, output_of<Left, Wrapper>> const &opened) -> result_type
                {
                    auto content = main(opened.rest);
                    return Si::visit<result_type>(
                        content.outcome,
                        [this](parse_complete<Wrapper, output_of<Main, Wrapper>> &inner) -> result_type
                        {
                            auto closing = right(inner.rest);
                            return Si::visit<result_type>(
                                closing.outcome,
                                [&inner](parse_complete<Wrapper, output_of<Right, Wrapper>> const &closed)
                                    -> result_type
                                {
                                    return make_complete(closed.rest, std::move(inner.result));
                                },
                                [](parse_error<token_of<Right, Wrapper>> &error) -> result_type
                                {
                                    return std::move(error);
                                });
                        },
                        [](parse_error<token_of<Main, Wrapper>> &error) -> result_type
                        {
                            return std::move(error);
                        });
                },
                [](parse_error<token_of<Left, Wrapper>> &error) -> result_type
                {
                    return std::move(error);
                });
        }
    };

    // Parses left, main and right in sequence and keeps only the output of main.
    template <class Left, class Main, class Right>
    delimited_parser<typename std::decay<Left>::type, typename std::decay<Main>::type,
                     typename std::decay<Right>::type>
    delimited(Left &&left, Main &&main, Right &&right)
    {
        return {std::forward<Left>(left), std::forward<Main>(main), std::forward<Right>(right)};
    }
}
