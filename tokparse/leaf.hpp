#pragma once

#include <tokparse/parse_result.hpp>
#include <silicium/optional.hpp>
#include <ostream>

namespace tokparse
{
    // A token together with where the lexer found it.
    template <class Token>
    struct positioned
    {
        Token token;
        std::size_t line;
        std::size_t column;
    };

    template <class Token>
    std::ostream &operator<<(std::ostream &out, positioned<Token> const &printed)
    {
        return out << printed.token << " at " << printed.line << ':' << printed.column;
    }

    // Specialize to teach the engine how to get a Token out of a custom Wrapper.
    template <class Token, class Wrapper>
    struct token_conversion
    {
        static Token convert(Wrapper const &wrapped)
        {
            return static_cast<Token>(wrapped);
        }
    };

    template <class Token>
    struct token_conversion<Token, Token>
    {
        static Token convert(Token const &token)
        {
            return token;
        }
    };

    template <class Token>
    struct token_conversion<Token, positioned<Token>>
    {
        static Token convert(positioned<Token> const &wrapped)
        {
            return wrapped.token;
        }
    };

    template <class Token, class Wrapper>
    Token to_token(Wrapper const &wrapped)
    {
        return token_conversion<Token, Wrapper>::convert(wrapped);
    }

    // Consumes exactly one token if Matcher accepts it. Matcher maps Token const & to Si::optional<Output>.
    template <class Token, class Output, class Wrapper, class Matcher>
    parse_result<Token, Output, Wrapper> match_one(token_range<Wrapper> const tokens, char const *expected,
                                                   Matcher &&match)
    {
        if (tokens.empty())
        {
            return make_not_enough_token<Token>();
        }
        Token found = to_token<Token>(*tokens.begin());
        Si::optional<Output> matched = std::forward<Matcher>(match)(static_cast<Token const &>(found));
        if (!matched)
        {
            return make_expects_error<Token>(expected, std::move(found));
        }
        return parse_complete<Wrapper, Output>{skip_tokens(tokens, 1), std::move(*matched)};
    }
}
