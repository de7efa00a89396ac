#pragma once

#include <tokparse/parse_error.hpp>
#include <tokparse/token_range.hpp>
#include <type_traits>
#include <utility>

namespace tokparse
{
    template <class Wrapper, class Output>
    struct parse_complete
    {
        token_range<Wrapper> rest;
        Output result;
    };

    template <class Token, class Output, class Wrapper = Token>
    struct parse_result
    {
        typedef Token token_type;
        typedef Output output_type;
        typedef Wrapper wrapper_type;
        typedef parse_complete<Wrapper, Output> complete_type;
        typedef parse_error<Token> error_type;

        Si::variant<complete_type, error_type> outcome;

        parse_result(complete_type complete)
            : outcome(std::move(complete))
        {
        }

        parse_result(error_type error)
            : outcome(std::move(error))
        {
        }

        complete_type *complete()
        {
            return Si::try_get_ptr<complete_type>(outcome);
        }

        complete_type const *complete() const
        {
            return Si::try_get_ptr<complete_type>(outcome);
        }

        error_type *error()
        {
            return Si::try_get_ptr<error_type>(outcome);
        }

        error_type const *error() const
        {
            return Si::try_get_ptr<error_type>(outcome);
        }
    };

    template <class Wrapper, class Output>
    parse_complete<Wrapper, typename std::decay<Output>::type> make_complete(token_range<Wrapper> rest,
                                                                             Output &&result)
    {
        return parse_complete<Wrapper, typename std::decay<Output>::type>{rest, std::forward<Output>(result)};
    }

    // The result type of invoking Parser on a range of Wrapper.
    template <class Parser, class Wrapper>
    using result_of_parser =
        typename std::decay<decltype(std::declval<Parser &>()(std::declval<token_range<Wrapper>>()))>::type;

    template <class Parser, class Wrapper>
    using output_of = typename result_of_parser<Parser, Wrapper>::output_type;

    template <class Parser, class Wrapper>
    using token_of = typename result_of_parser<Parser, Wrapper>::token_type;
}
