#ifndef CRUSTMODEL_IO_HPP
#define CRUSTMODEL_IO_HPP

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "surfer.hpp"
#include "tesseroid.hpp"


/**
 * Save tesseroids as text file.
 * After a comment line starting with '#' follows one line per tesseroid:
 * west east south north top bottom density vp vs
 * Throws runtime_error if the file can't be opened.
 * @param model
 * @param path
 */
void save_tesseroids(const std::vector<Tesseroid>& model, const std::filesystem::path& path);

/**
 * Save grid as text file with one line "x y value" per grid point.
 * Rows of the grid are written one after another. Missing values are written as nan.
 * Throws runtime_error if the file can't be opened.
 */
void save_xyz(const SurferGrid& grid, const std::filesystem::path& path);


/**
 * Parse options of a command line program.
 * The first positional argument may give a config file in the ini-like Boost.program_options
 * format. Options given on the command line override the values in the config file.
 * Throws boost::program_options::error for unknown or missing options or if the config file
 * can't be opened.
 * @param general Options which can be given on the command line and in the config file.
 * @param description One line description of the program, shown in the usage.
 * @return Parsed options, empty if help was requested and the usage was printed.
 */
std::optional<boost::program_options::variables_map>
parse_options(int argc, char* argv[], const boost::program_options::options_description& general,
              std::string_view description);


struct Crust2TessOptions {
    std::filesystem::path archive_path;
    std::filesystem::path output_path;

    friend std::ostream& operator<<(std::ostream& os, const Crust2TessOptions& options) {
        fmt::print(os, "[crust2]\n");
        fmt::print(os, "archive = {}\n", options.archive_path.string());
        fmt::print(os, "output = {}\n\n", options.output_path.string());
        return os;
    }
};

struct ConvertGridOptions {
    std::filesystem::path input_path;
    std::string format;
    std::filesystem::path output_path;

    friend std::ostream& operator<<(std::ostream& os, const ConvertGridOptions& options) {
        fmt::print(os, "[grid]\n");
        fmt::print(os, "input = {}\nformat = {}\n", options.input_path.string(), options.format);
        fmt::print(os, "output = {}\n\n", options.output_path.string());
        return os;
    }
};

#endif // CRUSTMODEL_IO_HPP
