#include <chrono>
#include <iostream>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "io.hpp"
#include "surfer.hpp"


int main(int argc, char* argv[]) {
    namespace po = boost::program_options;
    try {
        ConvertGridOptions opts;
        po::options_description general("Config/keyword arguments");
        // clang-format off
        general.add_options()
            ("grid.input,i", po::value(&opts.input_path)->value_name("PATH")->required(),
                "Path to the Surfer grid file.")
            ("grid.format,f", po::value(&opts.format)->value_name("FORMAT")->default_value("ascii"),
                "Format of the Surfer grid file, ascii or binary.")
            ("grid.output,o", po::value(&opts.output_path)->value_name("PATH")->required(),
                "Path of the text file the x y value columns are saved in.")
            ;
        // clang-format on
        if (not parse_options(argc, argv, general,
                              "Convert a Surfer grid file to x y value columns.")) {
            return 0;
        }

        auto format = surfer_format_from_string(opts.format);
        fmt::print("{}", fmt::streamed(opts));
        auto a = std::chrono::high_resolution_clock::now();
        auto grid = read_surfer(opts.input_path, format);
        save_xyz(grid, opts.output_path);
        auto b = std::chrono::high_resolution_clock::now();
        fmt::print("Converted {}x{} grid in {} ms\n", grid.x.size(), grid.y.size(),
                   std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count());
        return 0;
    } catch (const po::unknown_option& er) {
        fmt::print(std::cerr, "{}\nMaybe a typo?\n", er.what());
    } catch (const po::error& er) {
        fmt::print(std::cerr, "{}\n", er.what());
    } catch (const std::invalid_argument& er) {
        fmt::print(std::cerr, "{}\n", er.what());
    } catch (const std::runtime_error& er) {
        fmt::print(std::cerr, "Conversion failed: {}\n", er.what());
    }
    return -1;
}
