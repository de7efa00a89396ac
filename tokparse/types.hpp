#pragma once

#include <silicium/optional.hpp>
#include <string>
#include <vector>

namespace tokparse
{
    typedef std::string identifier;

    namespace types
    {
        struct token_kind
        {
            identifier name;

            // C++ type of the value the token carries, none for pure markers like punctuation
            Si::optional<std::string> payload;

            // what a diagnostic says was expected when this kind is missing
            std::string description;
        };

        struct token_set
        {
            identifier name;
            std::vector<token_kind> kinds;

            token_set &add_kind(identifier kind_name, std::string description)
            {
                kinds.emplace_back(token_kind{std::move(kind_name), Si::none, std::move(description)});
                return *this;
            }

            token_set &add_kind(identifier kind_name, std::string payload, std::string description)
            {
                kinds.emplace_back(token_kind{std::move(kind_name), std::move(payload), std::move(description)});
                return *this;
            }
        };
    }
}
