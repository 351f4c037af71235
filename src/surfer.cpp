#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "surfer.hpp"
#include "utils.hpp"


std::ostream& operator<<(std::ostream& os, SurferFormat format) {
    switch (format) {
    case SurferFormat::Ascii:
        return os << "ascii";
    case SurferFormat::Binary:
        return os << "binary";
    }
    return os;
}

SurferFormat surfer_format_from_string(std::string_view name) {
    if (name == "ascii") {
        return SurferFormat::Ascii;
    }
    if (name == "binary") {
        return SurferFormat::Binary;
    }
    throw std::invalid_argument(impl::Formatter() << "Invalid Surfer grid format " << name
                                                  << ", allowed values are ascii, binary.");
}


namespace {

    /**
     * Split header line into its two values.
     */
    std::vector<std::string> read_header_line(std::istream& is, size_t line_number,
                                              const std::filesystem::path& path) {
        std::string line;
        if (not std::getline(is, line)) {
            throw ParseError(impl::Formatter()
                             << "Surfer grid " << path << " ends in header line " << line_number);
        }
        auto tokens = text::split(line);
        if (tokens.size() != 2) {
            throw ParseError(impl::Formatter() << "Expected two values in header line "
                                               << line_number << " of Surfer grid " << path
                                               << ", got " << tokens.size() << ".");
        }
        return tokens;
    }

    int to_grid_size(const std::string& token, std::string_view context) {
        auto n = text::to_int(token, context);
        if (n <= 0) {
            throw ParseError(impl::Formatter()
                             << "Grid size has to be positive, got " << n << " " << context);
        }
        return n;
    }

    double replace_nodata(double value) {
        return value >= config::surfer_nodata_threshold ? std::numeric_limits<double>::quiet_NaN()
                                                        : value;
    }

    template <typename T>
    void read_binary_value(std::istream& is, T& value, const std::filesystem::path& path) {
        if (not is.read(reinterpret_cast<char*>(&value), sizeof(T))) {
            throw ParseError(impl::Formatter() << "Surfer grid " << path << " is truncated.");
        }
    }

} // namespace


SurferGrid read_surfer_ascii(const std::filesystem::path& path) {
    std::ifstream file{path};
    if (not file) {
        throw std::runtime_error(impl::Formatter() << "Couldn't open Surfer grid " << path);
    }
    std::string line;
    // identifier (DSAA) is not checked
    if (not std::getline(file, line)) {
        throw ParseError(impl::Formatter() << "Surfer grid " << path << " is empty.");
    }
    auto size = read_header_line(file, 2, path);
    std::string context = impl::Formatter() << "in line 2 of Surfer grid " << path;
    auto nx = to_grid_size(size[0], context);
    auto ny = to_grid_size(size[1], context);
    std::array<double, 6> limits{};
    for (size_t i = 0; i < 3; ++i) {
        auto line_number = i + 3;
        auto tokens = read_header_line(file, line_number, path);
        context = impl::Formatter() << "in line " << line_number << " of Surfer grid " << path;
        limits[2 * i] = text::to_double(tokens[0], context);
        limits[2 * i + 1] = text::to_double(tokens[1], context);
    }
    // read the body before allocating the grid, so a header with a wrong size can't request
    // more memory than the file provides
    std::vector<std::vector<double>> rows;
    size_t line_number = 5;
    while (std::getline(file, line)) {
        ++line_number;
        if (text::is_blank(line)) {
            continue;
        }
        if (rows.size() == static_cast<size_t>(ny)) {
            throw ParseError(impl::Formatter() << "Surfer grid " << path << " has more than "
                                               << ny << " rows (line " << line_number << ").");
        }
        auto tokens = text::split(line);
        if (tokens.size() != static_cast<size_t>(nx)) {
            throw ParseError(impl::Formatter() << "Expected " << nx << " values in line "
                                               << line_number << " of Surfer grid " << path
                                               << ", got " << tokens.size() << ".");
        }
        context = impl::Formatter() << "in line " << line_number << " of Surfer grid " << path;
        std::vector<double> values;
        values.reserve(tokens.size());
        for (const auto& token : tokens) {
            values.push_back(replace_nodata(text::to_double(token, context)));
        }
        rows.push_back(std::move(values));
    }
    if (rows.size() != static_cast<size_t>(ny)) {
        throw ParseError(impl::Formatter() << "Expected " << ny << " rows in Surfer grid " << path
                                           << ", got " << rows.size() << ".");
    }
    auto [xmin, xmax, ymin, ymax, zmin, zmax] = limits;
    SurferGrid grid{math::linspace(xmin, xmax, nx), math::linspace(ymin, ymax, ny),
                    Eigen::MatrixXd(ny, nx), zmin, zmax};
    for (int row = 0; row < ny; ++row) {
        for (int col = 0; col < nx; ++col) {
            grid.values(row, col) = rows[row][col];
        }
    }
    return grid;
}

SurferGrid read_surfer_binary(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::in | std::ios::binary};
    if (not file) {
        throw std::runtime_error(impl::Formatter() << "Couldn't open Surfer grid " << path);
    }
    std::array<char, 4> tag{};
    read_binary_value(file, tag, path);
    if (std::memcmp(tag.data(), "DSBB", tag.size()) != 0) {
        throw ParseError(impl::Formatter() << "File " << path << " is not a Surfer 6 binary grid.");
    }
    std::int16_t nx, ny;
    read_binary_value(file, nx, path);
    read_binary_value(file, ny, path);
    if (nx <= 0 or ny <= 0) {
        throw ParseError(impl::Formatter() << "Invalid grid size " << nx << "x" << ny
                                           << " in Surfer grid " << path);
    }
    std::array<double, 6> limits{};
    read_binary_value(file, limits, path);
    // check the file holds all values before allocating the grid
    const auto header_size = static_cast<std::uintmax_t>(file.tellg());
    const auto body_size = static_cast<std::uintmax_t>(nx) * static_cast<std::uintmax_t>(ny) *
                           sizeof(float);
    const auto file_size = std::filesystem::file_size(path);
    if (file_size < header_size + body_size) {
        throw ParseError(impl::Formatter()
                         << "Surfer grid " << path << " is truncated, " << nx << "x" << ny
                         << " values need " << body_size << " bytes, file has "
                         << file_size - header_size << " bytes after the header.");
    }
    auto [xmin, xmax, ymin, ymax, zmin, zmax] = limits;
    SurferGrid grid{math::linspace(xmin, xmax, nx), math::linspace(ymin, ymax, ny),
                    Eigen::MatrixXd(ny, nx), zmin, zmax};
    std::vector<float> row_values(nx);
    const auto nodata = static_cast<float>(config::surfer_nodata_threshold);
    for (int row = 0; row < ny; ++row) {
        if (not file.read(reinterpret_cast<char*>(row_values.data()),
                          row_values.size() * sizeof(float))) {
            throw ParseError(impl::Formatter() << "Surfer grid " << path << " is truncated in row "
                                               << row << ".");
        }
        for (int col = 0; col < nx; ++col) {
            grid.values(row, col) = row_values[col] >= nodata
                                        ? std::numeric_limits<double>::quiet_NaN()
                                        : static_cast<double>(row_values[col]);
        }
    }
    return grid;
}

SurferGrid read_surfer(const std::filesystem::path& path, SurferFormat format) {
    switch (format) {
    case SurferFormat::Ascii:
        return read_surfer_ascii(path);
    case SurferFormat::Binary:
        return read_surfer_binary(path);
    }
    throw std::invalid_argument(impl::Formatter() << "Invalid Surfer grid format "
                                                  << static_cast<int>(format));
}
