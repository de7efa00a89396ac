#pragma once

#include <tokparse/parse_result.hpp>
#include <tuple>
#include <type_traits>
#include <utility>

namespace tokparse
{
    namespace detail
    {
        template <class Token, class Wrapper, class... Parsers>
        struct tuple_step;

        template <class Token, class Wrapper>
        struct tuple_step<Token, Wrapper>
        {
            typedef parse_result<Token, std::tuple<>, Wrapper> result_type;

            static result_type run(token_range<Wrapper> const rest)
            {
                return make_complete(rest, std::tuple<>());
            }
        };

        // Each output is moved into the result as soon as the parsers after it have succeeded.
        template <class Token, class Wrapper, class Head, class... Tail>
        struct tuple_step<Token, Wrapper, Head, Tail...>
        {
            typedef std::tuple<output_of<Head, Wrapper>, output_of<Tail, Wrapper>...> outputs_type;
            typedef parse_result<Token, outputs_type, Wrapper> result_type;
            typedef tuple_step<Token, Wrapper, Tail...> next_step;

            static result_type run(token_range<Wrapper> const rest, Head &head, Tail &... tail)
            {
                auto element = head(rest);
                return Si::visit<result_type>(
                    element.outcome,
                    [&tail...](parse_complete<Wrapper, output_of<Head, Wrapper>> &first) -> result_type
                    {
                        auto remaining = next_step::run(first.rest, tail...);
                        return Si::visit<result_type>(
                            remaining.outcome,
                            [&first](typename next_step::result_type::complete_type &others) -> result_type
                            {
                                return make_complete(
                                    others.rest,
                                    std::tuple_cat(std::tuple<output_of<Head, Wrapper>>(std::move(first.result)),
                                                   std::move(others.result)));
                            },
                            [](parse_error<Token> &error) -> result_type
                            {
                                return std::move(error);
                            });
                    },
                    [](parse_error<token_of<Head, Wrapper>> &error) -> result_type
                    {
                        return std::move(error);
                    });
            }
        };
    }

    template <class... Parsers>
    struct tuple_parser
    {
        std::tuple<Parsers...> parsers;

        template <class Wrapper>
        using token_type = typename std::common_type<token_of<Parsers, Wrapper>...>::type;

        template <class Wrapper>
        parse_result<token_type<Wrapper>, std::tuple<output_of<Parsers, Wrapper>...>, Wrapper>
        operator()(token_range<Wrapper> const tokens)
        {
            return run_all(tokens, std::index_sequence_for<Parsers...>());
        }

    private:
        template <class Wrapper, std::size_t... Indices>
        parse_result<token_type<Wrapper>, std::tuple<output_of<Parsers, Wrapper>...>, Wrapper>
        run_all(token_range<Wrapper> const tokens, std::index_sequence<Indices...>)
        {
            return detail::tuple_step<token_type<Wrapper>, Wrapper, Parsers...>::run(tokens,
                                                                                   std::get<Indices>(parsers)...);
        }
    };

    template <class Token>
    struct empty_tuple_parser
    {
        template <class Wrapper>
        parse_result<Token, std::tuple<>, Wrapper> operator()(token_range<Wrapper> const tokens)
        {
            return make_complete(tokens, std::tuple<>());
        }
    };

    // Runs every parser in order and collects all outputs. Stops at the first failure.
    template <class First, class... Rest>
    tuple_parser<typename std::decay<First>::type, typename std::decay<Rest>::type...> tuple(First &&first,
                                                                                             Rest &&... rest)
    {
        return {std::make_tuple(std::forward<First>(first), std::forward<Rest>(rest)...)};
    }

    // Succeeds without consuming anything. Token names the token type the empty sequence reports errors in.
    template <class Token>
    empty_tuple_parser<Token> tuple()
    {
        return {};
    }
}
