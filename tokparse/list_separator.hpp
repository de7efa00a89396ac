#pragma once

#include <silicium/sink/append.hpp>

namespace tokparse
{
    template <class CharSink>
    struct list_separator
    {
        explicit list_separator(CharSink out, char const *separator)
            : m_out(out)
            , m_separator(separator)
            , m_first(true)
        {
        }

        void add_element()
        {
            if (m_first)
            {
                m_first = false;
                return;
            }
            Si::append(m_out, m_separator);
        }

    private:
        CharSink m_out;
        char const *m_separator;
        bool m_first;
    };

    template <class CharSink>
    auto make_list_separator(CharSink out, char const *separator = ", ")
    {
        return list_separator<CharSink>(out, separator);
    }
}
