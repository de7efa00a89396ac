#pragma once

#include <boost/range/algorithm/equal.hpp>
#include <silicium/iterator_range.hpp>
#include <silicium/memory_range.hpp>
#include <silicium/variant.hpp>
#include <silicium/config.hpp>
#include <ventura/open.hpp>
#include <ventura/read_file.hpp>
#include <ventura/write_file.hpp>
#include <ostream>
#include <vector>

namespace tokparse
{
    inline bool write_generated_file(Si::os_string const &file_name, char const *file, Si::memory_range content,
                                     std::ostream &log)
    {
        boost::system::error_code const error = ventura::write_file(ventura::safe_c_str(file_name), content);
        if (!!error)
        {
            log << "Could not open " << file << "\n" << error << '\n';
            return false;
        }
        log << "Wrote file " << file << " (" << content.size() << " bytes)\n";
        return true;
    }

    // Leaves the file alone when it already has the new content so that dependent targets are not rebuilt.
    inline bool update_generated_file(char const *file, Si::memory_range new_content, std::ostream &log)
    {
        Si::os_string const file_name = Si::to_os_string(file);
        return Si::visit<bool>(ventura::read_file(ventura::safe_c_str(file_name)),
                               [&](std::vector<char> old_content) -> bool
                               {
                                   if (boost::range::equal(old_content, new_content))
                                   {
                                       log << "Generated file does not change\n";
                                       return true;
                                   }
                                   return write_generated_file(file_name, file, new_content, log);
                               },
                               [&](boost::system::error_code const error)
                               {
                                   log << "Could not read " << file << "\nError code: " << error << '\n';
                                   return write_generated_file(file_name, file, new_content, log);
                               },
                               [&](ventura::read_file_problem const problem)
                               {
                                   switch (problem)
                                   {
                                   case ventura::read_file_problem::concurrent_write_detected:
                                       log << "Someone seems to have access " << file << " concurrently.\n";
                                       return false;

                                   case ventura::read_file_problem::file_too_large_for_memory:
                                       log << "Could not be loaded into memory: " << file << "\n";
                                       return false;
                                   }
                                   SILICIUM_UNREACHABLE();
                               });
    }

    inline int run_code_generator_command_line_tool(Si::iterator_range<char **> command_line_arguments,
                                                    std::ostream &log, Si::memory_range code)
    {
        if (command_line_arguments.size() < 2)
        {
            log << "requires output file name as the command line argument\n";
            return 1;
        }
        return update_generated_file(command_line_arguments[1], code, log) ? 0 : 1;
    }
}
