#pragma once

#include <tokparse/parse_result.hpp>
#include <silicium/optional.hpp>
#include <cassert>
#include <iterator>
#include <tuple>

namespace tokparse
{
    namespace detail
    {
        // Keeps the failure that got furthest. Failures that got equally far are merged.
        template <class Token>
        void remember_furthest(Si::optional<parse_error<Token>> &furthest, parse_error<Token> failure)
        {
            if (!furthest || (failure.tokens_consumed > furthest->tokens_consumed))
            {
                furthest = std::move(failure);
                return;
            }
            if (failure.tokens_consumed == furthest->tokens_consumed)
            {
                furthest->errors.insert(furthest->errors.end(), std::make_move_iterator(failure.errors.begin()),
                                        std::make_move_iterator(failure.errors.end()));
            }
        }

        template <class Result, std::size_t I, std::size_t Count>
        struct alt_step
        {
            template <class Parsers, class Wrapper>
            static Result run(Parsers &parsers, token_range<Wrapper> const tokens,
                              Si::optional<typename Result::error_type> &furthest)
            {
                auto attempt = std::get<I>(parsers)(tokens);
                return Si::visit<Result>(attempt.outcome,
                                         [](typename Result::complete_type &complete) -> Result
                                         {
                                             return std::move(complete);
                                         },
                                         [&](typename Result::error_type &error) -> Result
                                         {
                                             remember_furthest(furthest, std::move(error));
                                             return alt_step<Result, I + 1, Count>::run(parsers, tokens, furthest);
                                         });
            }
        };

        template <class Result, std::size_t Count>
        struct alt_step<Result, Count, Count>
        {
            template <class Parsers, class Wrapper>
            static Result run(Parsers &, token_range<Wrapper> const, Si::optional<typename Result::error_type> &furthest)
            {
                assert(furthest);
                return std::move(*furthest);
            }
        };
    }

    template <class First, class... Rest>
    struct alt_parser
    {
        std::tuple<First, Rest...> parsers;

        template <class Wrapper>
        parse_result<token_of<First, Wrapper>, output_of<First, Wrapper>, Wrapper>
        operator()(token_range<Wrapper> const tokens)
        {
            typedef parse_result<token_of<First, Wrapper>, output_of<First, Wrapper>, Wrapper> result_type;
            Si::optional<typename result_type::error_type> furthest;
            return detail::alt_step<result_type, 0, 1 + sizeof...(Rest)>::run(parsers, tokens, furthest);
        }
    };

    // Ordered choice: the first alternative that succeeds wins. If all of them fail, the failure
    // that consumed the most tokens is reported.
    template <class First, class... Rest>
    alt_parser<typename std::decay<First>::type, typename std::decay<Rest>::type...> alt(First &&first,
                                                                                         Rest &&... rest)
    {
        return {std::make_tuple(std::forward<First>(first), std::forward<Rest>(rest)...)};
    }
}
