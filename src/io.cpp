#include <fstream>
#include <stdexcept>

#include "io.hpp"
#include "utils.hpp"

namespace po = boost::program_options;


void save_tesseroids(const std::vector<Tesseroid>& model, const std::filesystem::path& path) {
    std::ofstream file{path};
    if (not file.is_open()) {
        throw std::runtime_error(impl::Formatter()
                                 << "Couldn't open file " << path << " for saving tesseroids.");
    }
    fmt::print(file, "# west east south north top bottom density vp vs\n");
    for (const auto& t : model) {
        fmt::print(file, "{} {} {} {} {} {} {} {} {}\n", t.west, t.east, t.south, t.north, t.top,
                   t.bottom, t.props.at("density"), t.props.at("vp"), t.props.at("vs"));
    }
}

void save_xyz(const SurferGrid& grid, const std::filesystem::path& path) {
    std::ofstream file{path};
    if (not file.is_open()) {
        throw std::runtime_error(impl::Formatter()
                                 << "Couldn't open file " << path << " for saving grid.");
    }
    for (size_t i = 0; i < grid.y.size(); ++i) {
        for (size_t j = 0; j < grid.x.size(); ++j) {
            fmt::print(file, "{} {} {}\n", grid.x[j], grid.y[i], grid.values(i, j));
        }
    }
}

std::optional<po::variables_map> parse_options(int argc, char* argv[],
                                               const po::options_description& general,
                                               std::string_view description) {
    namespace fs = std::filesystem;
    // positional options for config file
    po::positional_options_description positional;
    positional.add("config_file", 1);

    // store config file on own description so the keyword argument is not shown in usage
    po::options_description hidden("Hidden options");
    // clang-format off
    hidden.add_options()
        ("config_file,c", po::value<fs::path>()->value_name("PATH"), "Path to config file.");
    // clang-format on

    // options only allowed on command line
    po::options_description cmd("Commandline options");
    // clang-format off
    cmd.add_options()
        ("help,h", "Produce help message.");
    // clang-format on

    po::options_description all_options, options_shown_in_usage;
    all_options.add(cmd).add(general).add(hidden);
    options_shown_in_usage.add(cmd).add(general);
    po::variables_map options;
    po::store(po::command_line_parser(argc, argv).options(all_options).positional(positional).run(),
              options);
    // if help is given, ignore other options, print help and exit
    if (options.count("help")) {
        fmt::print("{}\n\n", description);
        fmt::print("Usage:\n{} [config_file_path] [keyword_arguments]\n\n",
                   fs::path(argv[0]).filename().string());
        fmt::print("config_file_path can give a text file in the ini-like Boost.program_options"
                   " format. In this file options for the program can be specified. Command "
                   "line options override the values in the config file.\n\n");
        fmt::print("{}\n", fmt::streamed(options_shown_in_usage));
        return std::nullopt;
    }
    // if path to config file is given, read options from it. Since options given first are
    // preferred, this means cmd options override the config file parameters.
    if (options.count("config_file")) {
        auto config_path = options["config_file"].as<fs::path>();
        std::ifstream config_file{config_path};
        if (config_file) {
            po::store(po::parse_config_file(config_file, all_options), options);
        } else {
            throw po::error(fmt::format("Failed to open config file {}", config_path.string()));
        }
    }
    po::notify(options);
    return options;
}
