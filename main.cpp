#include <chrono>
#include <iostream>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "crust2.hpp"
#include "io.hpp"


int main(int argc, char* argv[]) {
    namespace po = boost::program_options;
    namespace fs = std::filesystem;
    try {
        Crust2TessOptions opts;
        // add general options, can be specified on command line and/or in config file
        po::options_description general("Config/keyword arguments");
        // clang-format off
        general.add_options()
            ("crust2.archive,a", po::value(&opts.archive_path)->value_name("PATH")
                ->default_value(fs::path(config::get_default_archive_filename()),
                               std::string(config::get_default_archive_filename())),
                "Path to the CRUST2.0 .tar.gz archive.")
            ("crust2.output,o", po::value(&opts.output_path)->value_name("PATH")->required(),
                "Path of the text file the tesseroids are saved in.")
            ;
        // clang-format on
        if (not parse_options(argc, argv, general,
                              "Convert the CRUST2.0 global crustal model to tesseroids.")) {
            return 0;
        }

        fmt::print("{}", fmt::streamed(opts));
        auto a = std::chrono::high_resolution_clock::now();
        auto model = crust2_to_tesseroids(opts.archive_path);
        auto b = std::chrono::high_resolution_clock::now();
        fmt::print("Converted model to {} tesseroids in {} ms\n", model.size(),
                   std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count());
        save_tesseroids(model, opts.output_path);
        fmt::print("Saved tesseroids in {}\n", opts.output_path.string());
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
