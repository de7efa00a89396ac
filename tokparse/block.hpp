#pragma once

#include <silicium/sink/append.hpp>
#include <cstddef>
#include <initializer_list>
#include <utility>

namespace tokparse
{
    struct indentation_level
    {
        explicit indentation_level(std::size_t amount = 0)
            : m_amount(amount)
        {
        }

        indentation_level deeper() const
        {
            return indentation_level(m_amount + 1);
        }

        template <class CharSink>
        void render(CharSink &&sink) const
        {
            for (std::size_t i = 0; i < m_amount; ++i)
            {
                Si::append(sink, "    ");
            }
        }

    private:
        std::size_t m_amount;
    };

    template <class CharSink, class... Content>
    void start_line(CharSink &&code, indentation_level indentation, Content const &... content)
    {
        indentation.render(code);
        (void)std::initializer_list<int>{(Si::append(code, content), 0)...};
    }

    template <class CharSink, class... Content>
    void line(CharSink &&code, indentation_level indentation, Content const &... content)
    {
        start_line(code, indentation, content...);
        Si::append(code, "\n");
    }

    // Renders "{", the content one level deeper, "}" and then end.
    template <class CharSink, class ContentGenerator>
    void block(CharSink &&code, indentation_level indentation, ContentGenerator &&content, char const *end)
    {
        line(code, indentation, "{");
        std::forward<ContentGenerator>(content)(indentation.deeper());
        start_line(code, indentation, "}");
        Si::append(code, end);
    }
}
