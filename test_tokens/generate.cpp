#include <silicium/sink/iterator_sink.hpp>
#include <tokparse/generate/token_set.hpp>
#include <tokparse/update_generated_file.hpp>
#include <iostream>

int main(int argc, char **argv)
{
    using namespace tokparse;
    std::vector<char> file;
    auto file_writer = Si::make_container_sink(file);
    Si::append(file_writer, generate::headers);
    types::token_set calc;
    calc.name = "calc";
    calc.add_kind("digit", "std::uint64_t", "digit")
        .add_kind("identifier", "std::string", "identifier")
        .add_kind("plus", "'+'")
        .add_kind("comma", "','")
        .add_kind("left_parenthesis", "'('")
        .add_kind("right_parenthesis", "')'");
    indentation_level const top_level;
    try
    {
        generate::generate_token_set(file_writer, top_level, calc);
    }
    catch (std::invalid_argument const &ex)
    {
        std::cerr << ex.what() << '\n';
        return 1;
    }
    return run_code_generator_command_line_tool(Si::make_iterator_range(argv, argv + argc), std::cerr,
                                                Si::make_contiguous_range(file));
}
