#pragma once

#include <silicium/variant.hpp>
#include <silicium/config.hpp>
#include <algorithm>
#include <cstring>
#include <ostream>
#include <vector>

namespace tokparse
{
    template <class Token>
    struct expects
    {
        char const *expected;
        Token found;
    };

    struct not_enough_token
    {
    };

    struct in_context
    {
        char const *label;
    };

    template <class Token>
    using parse_error_kind = Si::variant<expects<Token>, not_enough_token, in_context>;

    template <class Token>
    struct parse_error
    {
        // innermost failure first, enclosing contexts after it
        std::vector<parse_error_kind<Token>> errors;
        std::size_t tokens_consumed;

        parse_error with_tokens_consumed(std::size_t const consumed) &&
        {
            return parse_error{std::move(errors), consumed};
        }
    };

    template <class Token>
    parse_error<Token> make_not_enough_token()
    {
        parse_error<Token> result{{}, 0};
        result.errors.emplace_back(not_enough_token());
        return result;
    }

    template <class Token>
    parse_error<Token> make_expects_error(char const *expected, Token found)
    {
        parse_error<Token> result{{}, 0};
        result.errors.emplace_back(expects<Token>{expected, std::move(found)});
        return result;
    }

    template <class Token>
    bool operator==(expects<Token> const &left, expects<Token> const &right)
    {
        return (std::strcmp(left.expected, right.expected) == 0) && (left.found == right.found);
    }

    inline bool operator==(not_enough_token, not_enough_token)
    {
        return true;
    }

    inline bool operator==(in_context const &left, in_context const &right)
    {
        return std::strcmp(left.label, right.label) == 0;
    }

    template <class Token>
    bool equal_kinds(parse_error_kind<Token> const &left, parse_error_kind<Token> const &right)
    {
        if (left.index() != right.index())
        {
            return false;
        }
        return Si::visit<bool>(left,
                               [&right](expects<Token> const &left_value)
                               {
                                   return left_value == *Si::try_get_ptr<expects<Token>>(right);
                               },
                               [](not_enough_token)
                               {
                                   return true;
                               },
                               [&right](in_context const &left_value)
                               {
                                   return left_value == *Si::try_get_ptr<in_context>(right);
                               });
    }

    template <class Token>
    bool operator==(parse_error<Token> const &left, parse_error<Token> const &right)
    {
        if (left.tokens_consumed != right.tokens_consumed)
        {
            return false;
        }
        return (left.errors.size() == right.errors.size()) &&
               std::equal(left.errors.begin(), left.errors.end(), right.errors.begin(),
                          [](parse_error_kind<Token> const &l, parse_error_kind<Token> const &r)
                          {
                              return equal_kinds(l, r);
                          });
    }

    template <class Token>
    bool operator!=(parse_error<Token> const &left, parse_error<Token> const &right)
    {
        return !(left == right);
    }

    template <class Token>
    std::ostream &operator<<(std::ostream &out, expects<Token> const &error)
    {
        return out << "expected " << error.expected << ", found " << error.found;
    }

    inline std::ostream &operator<<(std::ostream &out, not_enough_token)
    {
        return out << "not enough tokens";
    }

    inline std::ostream &operator<<(std::ostream &out, in_context const &error)
    {
        return out << "in " << error.label;
    }

    template <class Token>
    void render_kind(std::ostream &out, parse_error_kind<Token> const &kind)
    {
        Si::visit<void>(kind,
                        [&out](expects<Token> const &error)
                        {
                            out << error;
                        },
                        [&out](not_enough_token const error)
                        {
                            out << error;
                        },
                        [&out](in_context const &error)
                        {
                            out << error;
                        });
    }

    template <class Token>
    std::ostream &operator<<(std::ostream &out, parse_error<Token> const &error)
    {
        out << "parse error after " << error.tokens_consumed << " tokens: ";
        bool first = true;
        for (parse_error_kind<Token> const &kind : error.errors)
        {
            if (first)
            {
                first = false;
            }
            else
            {
                out << "; ";
            }
            render_kind(out, kind);
        }
        return out;
    }
}
