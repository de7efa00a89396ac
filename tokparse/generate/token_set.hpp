#pragma once

#include <tokparse/block.hpp>
#include <tokparse/list_separator.hpp>
#include <tokparse/types.hpp>
#include <silicium/sink/ptr_sink.hpp>
#include <set>
#include <stdexcept>

namespace tokparse
{
    namespace generate
    {
        char const headers[] = "#pragma once\n"
                               "#include <tokparse/leaf.hpp>\n"
                               "#include <silicium/optional.hpp>\n"
                               "#include <silicium/variant.hpp>\n"
                               "#include <cstdint>\n"
                               "#include <ostream>\n"
                               "#include <string>\n"
                               "#include <tuple>\n"
                               "\n";

        inline std::string get_output_type(types::token_kind const &kind)
        {
            return kind.payload ? *kind.payload : std::string("std::tuple<>");
        }

        inline std::string escape_string_literal(std::string const &content)
        {
            std::string result;
            for (char const c : content)
            {
                if ((c == '"') || (c == '\\'))
                {
                    result += '\\';
                }
                result += c;
            }
            return result;
        }

        inline void check_token_set(types::token_set const &set)
        {
            if (set.kinds.empty())
            {
                throw std::invalid_argument("token set " + set.name + " has no kinds");
            }
            std::set<identifier> seen;
            for (types::token_kind const &kind : set.kinds)
            {
                if (!seen.insert(kind.name).second)
                {
                    throw std::invalid_argument("token kind " + kind.name + " appears twice in " + set.name);
                }
            }
        }

        template <class CharSink>
        void generate_kind_structures(CharSink &&code, indentation_level indentation, types::token_set const &set)
        {
            for (types::token_kind const &kind : set.kinds)
            {
                line(code, indentation, "struct ", kind.name);
                block(code, indentation,
                      [&](indentation_level const in_struct)
                      {
                          if (kind.payload)
                          {
                              line(code, in_struct, *kind.payload, " value;");
                          }
                      },
                      ";\n\n");
            }
        }

        template <class CharSink>
        void generate_token_typedef(CharSink &&code, indentation_level indentation, types::token_set const &set)
        {
            start_line(code, indentation, "typedef Si::variant<");
            auto comma = make_list_separator(Si::ref_sink(code));
            for (types::token_kind const &kind : set.kinds)
            {
                comma.add_element();
                Si::append(code, kind.name);
            }
            Si::append(code, "> token;\n\n");
        }

        template <class CharSink>
        void generate_comparison(CharSink &&code, indentation_level indentation, types::token_set const &set)
        {
            for (types::token_kind const &kind : set.kinds)
            {
                if (kind.payload)
                {
                    line(code, indentation, "inline bool operator==(", kind.name, " const &left, ", kind.name,
                         " const &right)");
                    block(code, indentation,
                          [&](indentation_level const in_function)
                          {
                              line(code, in_function, "return left.value == right.value;");
                          },
                          "\n\n");
                }
                else
                {
                    line(code, indentation, "inline bool operator==(", kind.name, " const &, ", kind.name,
                         " const &)");
                    block(code, indentation,
                          [&](indentation_level const in_function)
                          {
                              line(code, in_function, "return true;");
                          },
                          "\n\n");
                }
            }
            line(code, indentation, "inline bool operator==(token const &left, token const &right)");
            block(code, indentation,
                  [&](indentation_level const in_function)
                  {
                      line(code, in_function, "if (left.index() != right.index())");
                      block(code, in_function,
                            [&](indentation_level const in_if)
                            {
                                line(code, in_if, "return false;");
                            },
                            "\n");
                      line(code, in_function, "return Si::visit<bool>(");
                      indentation_level const in_call = in_function.deeper();
                      auto comma = make_list_separator(Si::ref_sink(code), ",\n");
                      comma.add_element();
                      start_line(code, in_call, "left");
                      for (types::token_kind const &kind : set.kinds)
                      {
                          comma.add_element();
                          start_line(code, in_call, "[&right](", kind.name, " const &value) { return value == "
                                                                            "*Si::try_get_ptr<",
                                     kind.name, ">(right); }");
                      }
                      Si::append(code, ");\n");
                  },
                  "\n\n");
            line(code, indentation, "inline bool operator!=(token const &left, token const &right)");
            block(code, indentation,
                  [&](indentation_level const in_function)
                  {
                      line(code, in_function, "return !(left == right);");
                  },
                  "\n\n");
        }

        template <class CharSink>
        void generate_printing(CharSink &&code, indentation_level indentation, types::token_set const &set)
        {
            line(code, indentation, "inline std::ostream &operator<<(std::ostream &out, token const &printed)");
            block(code, indentation,
                  [&](indentation_level const in_function)
                  {
                      line(code, in_function, "Si::visit<void>(");
                      indentation_level const in_call = in_function.deeper();
                      auto comma = make_list_separator(Si::ref_sink(code), ",\n");
                      comma.add_element();
                      start_line(code, in_call, "printed");
                      for (types::token_kind const &kind : set.kinds)
                      {
                          comma.add_element();
                          if (kind.payload)
                          {
                              start_line(code, in_call, "[&out](", kind.name, " const &value) { out << \"",
                                         kind.name, "(\" << value.value << ')'; }");
                          }
                          else
                          {
                              start_line(code, in_call, "[&out](", kind.name, " const &) { out << \"", kind.name,
                                         "\"; }");
                          }
                      }
                      Si::append(code, ");\n");
                      line(code, in_function, "return out;");
                  },
                  "\n\n");
        }

        template <class CharSink>
        void generate_leaf_parser(CharSink &&code, indentation_level indentation, types::token_kind const &kind)
        {
            std::string const output = get_output_type(kind);
            line(code, indentation, "struct parse_", kind.name, "_type");
            block(code, indentation,
                  [&](indentation_level const in_struct)
                  {
                      line(code, in_struct, "template <class Wrapper>");
                      line(code, in_struct, "tokparse::parse_result<token, ", output,
                           ", Wrapper> operator()(tokparse::token_range<Wrapper> const tokens) const");
                      block(code, in_struct,
                            [&](indentation_level const in_function)
                            {
                                line(code, in_function, "return tokparse::match_one<token, ", output,
                                     ">(tokens, \"", escape_string_literal(kind.description),
                                     "\", [](token const &found) -> Si::optional<", output, ">");
                                block(code, in_function,
                                      [&](indentation_level const in_matcher)
                                      {
                                          if (kind.payload)
                                          {
                                              line(code, in_matcher, "if (", kind.name,
                                                   " const *const matched = Si::try_get_ptr<", kind.name,
                                                   ">(found))");
                                              block(code, in_matcher,
                                                    [&](indentation_level const in_if)
                                                    {
                                                        line(code, in_if, "return matched->value;");
                                                    },
                                                    "\n");
                                          }
                                          else
                                          {
                                              line(code, in_matcher, "if (Si::try_get_ptr<", kind.name,
                                                   ">(found))");
                                              block(code, in_matcher,
                                                    [&](indentation_level const in_if)
                                                    {
                                                        line(code, in_if, "return std::tuple<>();");
                                                    },
                                                    "\n");
                                          }
                                          line(code, in_matcher, "return Si::none;");
                                      },
                                      ");\n");
                            },
                            "\n");
                  },
                  ";\n\n");
            line(code, indentation, "constexpr parse_", kind.name, "_type parse_", kind.name, "{};");
            Si::append(code, "\n");
        }

        // Emits the token types of a set and one leaf parser per kind into namespace set.name.
        template <class CharSink>
        void generate_token_set(CharSink &&code, indentation_level indentation, types::token_set const &set)
        {
            check_token_set(set);
            line(code, indentation, "namespace ", set.name);
            block(code, indentation,
                  [&](indentation_level const in_namespace)
                  {
                      generate_kind_structures(code, in_namespace, set);
                      generate_token_typedef(code, in_namespace, set);
                      generate_comparison(code, in_namespace, set);
                      generate_printing(code, in_namespace, set);
                      for (types::token_kind const &kind : set.kinds)
                      {
                          generate_leaf_parser(code, in_namespace, kind);
                      }
                  },
                  "\n");
        }
    }
}
