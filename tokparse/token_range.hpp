#pragma once

#include <silicium/iterator_range.hpp>
#include <cassert>
#include <cstddef>
#include <vector>

namespace tokparse
{
    // A borrowed view of the caller's token buffer. Parsers only ever narrow it to a suffix.
    template <class Wrapper>
    using token_range = Si::iterator_range<Wrapper const *>;

    template <class Wrapper>
    token_range<Wrapper> make_token_range(std::vector<Wrapper> const &tokens)
    {
        return Si::make_iterator_range(tokens.data(), tokens.data() + tokens.size());
    }

    template <class Wrapper, std::size_t N>
    token_range<Wrapper> make_token_range(Wrapper const (&tokens)[N])
    {
        return Si::make_iterator_range(&tokens[0], &tokens[0] + N);
    }

    template <class Wrapper>
    std::size_t token_count(token_range<Wrapper> const tokens)
    {
        return static_cast<std::size_t>(tokens.end() - tokens.begin());
    }

    template <class Wrapper>
    token_range<Wrapper> skip_tokens(token_range<Wrapper> const tokens, std::size_t const count)
    {
        assert(count <= token_count(tokens));
        return Si::make_iterator_range(tokens.begin() + count, tokens.end());
    }

    // Number of tokens between the start of an input and a suffix of it.
    template <class Wrapper>
    std::size_t consumed_between(token_range<Wrapper> const input, token_range<Wrapper> const rest)
    {
        assert(rest.begin() >= input.begin());
        assert(rest.end() == input.end());
        return static_cast<std::size_t>(rest.begin() - input.begin());
    }
}
