#include <iterator>
#include <stdexcept>
#include <string_view>

#include "archive.hpp"
#include "crust2.hpp"
#include "errors.hpp"
#include "utils.hpp"


bool operator==(const LayerStack& s1, const LayerStack& s2) {
    return s1.vp == s2.vp and s1.vs == s2.vs and s1.density == s2.density and
           s1.thickness == s2.thickness and s1.mantle.vp == s2.mantle.vp and
           s1.mantle.vs == s2.mantle.vs and s1.mantle.density == s2.mantle.density;
}


namespace {

    /**
     * Read a table with a header line and a label in the first column of every row.
     * store(row, column, token, context) is called for every value except the labels.
     */
    template <typename Store>
    void read_labelled_table(std::istream& is, size_t rows, size_t columns,
                             std::string_view table_name, Store store) {
        std::string line;
        if (not std::getline(is, line)) {
            throw ParseError(impl::Formatter() << "Table of " << table_name << " is empty.");
        }
        size_t line_number = 1;
        size_t row = 0;
        while (std::getline(is, line)) {
            ++line_number;
            if (text::is_blank(line)) {
                continue;
            }
            if (row == rows) {
                throw ParseError(impl::Formatter() << "Table of " << table_name << " has more than "
                                                   << rows << " rows (line " << line_number
                                                   << ").");
            }
            auto tokens = text::split(line);
            if (tokens.size() != columns + 1) {
                throw ParseError(impl::Formatter()
                                 << "Expected label and " << columns << " values in line "
                                 << line_number << " of " << table_name << ", got "
                                 << tokens.size() << " tokens.");
            }
            std::string context = impl::Formatter() << "in line " << line_number << " of "
                                                    << table_name;
            for (size_t column = 0; column < columns; ++column) {
                store(row, column, tokens[column + 1], context);
            }
            ++row;
        }
        if (row != rows) {
            throw ParseError(impl::Formatter() << "Expected " << rows << " rows in table of "
                                               << table_name << ", got " << row << ".");
        }
    }

    enum class LegendState { Code, Vp, Vs, Density, Thickness };

    /**
     * Parse a line of the legend with one value per layer and one for the mantle.
     */
    void read_property_line(std::string_view line, size_t line_number, std::string_view name,
                            std::array<double, config::num_layers>& layers, double& mantle) {
        auto tokens = text::split(line);
        if (tokens.size() != config::num_legend_values) {
            throw ParseError(impl::Formatter()
                             << "Expected " << config::num_legend_values << " values of " << name
                             << " in line " << line_number << " of legend, got " << tokens.size()
                             << ".");
        }
        std::string context = impl::Formatter() << "in line " << line_number << " of legend";
        for (size_t i = 0; i < config::num_layers; ++i) {
            layers[i] = text::to_double(tokens[i], context) * config::legend_to_si;
        }
        mantle = text::to_double(tokens.back(), context) * config::legend_to_si;
    }

    /**
     * Parse the thickness line of the legend. The mantle thickness is infinite and not parsed.
     */
    void read_thickness_line(std::string_view line, size_t line_number,
                             std::array<double, config::num_layers>& thickness) {
        auto tokens = text::split(line);
        if (tokens.size() < config::num_layers or tokens.size() > config::num_legend_values) {
            throw ParseError(impl::Formatter()
                             << "Expected " << config::num_layers << " or "
                             << config::num_legend_values << " thickness values in line "
                             << line_number << " of legend, got " << tokens.size() << ".");
        }
        std::string context = impl::Formatter() << "in line " << line_number << " of legend";
        for (size_t i = 0; i < config::num_layers; ++i) {
            thickness[i] = text::to_double(tokens[i], context) * config::legend_to_si;
            if (not(thickness[i] >= 0)) {
                throw ParseError(impl::Formatter() << "Invalid thickness " << tokens[i] << " "
                                                   << context << ".");
            }
        }
    }

} // namespace


Eigen::MatrixXd read_topography(std::istream& is, size_t rows, size_t columns) {
    Eigen::MatrixXd topography(rows, columns);
    read_labelled_table(is, rows, columns, "topography",
                        [&](size_t row, size_t column, const std::string& token,
                            const std::string& context) {
                            topography(row, column) = text::to_double(token, context);
                        });
    return topography;
}

TypeCodeGrid read_type_codes(std::istream& is, size_t rows, size_t columns) {
    TypeCodeGrid types(rows, std::vector<std::string>(columns));
    read_labelled_table(
        is, rows, columns, "type codes",
        [&](size_t row, size_t column, const std::string& token, const std::string&) {
            types[row][column] = token;
        });
    return types;
}

Codec read_codec(std::istream& is) {
    Codec codec;
    std::string line;
    size_t line_number = 0;
    while (line_number < config::legend_header_lines and std::getline(is, line)) {
        ++line_number;
    }
    auto state = LegendState::Code;
    std::string code;
    LayerStack stack{};
    while (std::getline(is, line)) {
        ++line_number;
        auto trimmed = text::trim(line);
        if (trimmed.empty()) {
            continue;
        }
        switch (state) {
        case LegendState::Code:
            if (trimmed.size() < 2) {
                throw ParseError(impl::Formatter() << "Type code '" << trimmed << "' in line "
                                                   << line_number
                                                   << " of legend is shorter than two characters.");
            }
            code = std::string(trimmed.substr(0, 2));
            stack = LayerStack{};
            state = LegendState::Vp;
            break;
        case LegendState::Vp:
            read_property_line(trimmed, line_number, "Vp", stack.vp, stack.mantle.vp);
            state = LegendState::Vs;
            break;
        case LegendState::Vs:
            read_property_line(trimmed, line_number, "Vs", stack.vs, stack.mantle.vs);
            state = LegendState::Density;
            break;
        case LegendState::Density:
            read_property_line(trimmed, line_number, "density", stack.density,
                               stack.mantle.density);
            state = LegendState::Thickness;
            break;
        case LegendState::Thickness:
            read_thickness_line(trimmed, line_number, stack.thickness);
            codec.insert_or_assign(code, stack);
            state = LegendState::Code;
            break;
        }
    }
    if (state != LegendState::Code) {
        throw ParseError(impl::Formatter()
                         << "Legend ends with incomplete definition of type code " << code << ".");
    }
    return codec;
}

std::vector<Tesseroid> cell_to_tesseroids(double west, double north, double top,
                                          const LayerStack& stack, double cell_size) {
    std::vector<Tesseroid> tesseroids;
    const double east = west + cell_size;
    const double south = north - cell_size;
    for (size_t layer = 0; layer < config::num_layers; ++layer) {
        if (stack.thickness[layer] == 0) {
            continue;
        }
        double bottom = top - stack.thickness[layer];
        tesseroids.push_back({west,
                              east,
                              south,
                              north,
                              top,
                              bottom,
                              {{"density", stack.density[layer]},
                               {"vp", stack.vp[layer]},
                               {"vs", stack.vs[layer]}}});
        top = bottom;
    }
    return tesseroids;
}

std::vector<Tesseroid> assemble_model(const Eigen::MatrixXd& topography, const TypeCodeGrid& types,
                                      const Codec& codec) {
    const auto lons = math::arange(-180., 180., config::cell_size_degrees);
    const auto lats = math::arange(90., -90., -config::cell_size_degrees);
    const auto rows = static_cast<size_t>(topography.rows());
    const auto columns = static_cast<size_t>(topography.cols());
    if (types.size() != rows) {
        throw std::invalid_argument(impl::Formatter()
                                    << "Topography has " << rows << " rows, type codes have "
                                    << types.size() << " rows.");
    }
    for (const auto& row : types) {
        if (row.size() != columns) {
            throw std::invalid_argument(impl::Formatter()
                                        << "Topography has " << columns << " columns, type codes "
                                        << "have a row with " << row.size() << " columns.");
        }
    }
    if (rows > lats.size() or columns > lons.size()) {
        throw std::invalid_argument(impl::Formatter()
                                    << "Grid of " << rows << "x" << columns
                                    << " cells exceeds the globe of " << lats.size() << "x"
                                    << lons.size() << " cells.");
    }
    std::vector<Tesseroid> model;
    model.reserve(rows * columns);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < columns; ++j) {
            auto stack = codec.find(types[i][j]);
            if (stack == codec.end()) {
                throw LookupError(impl::Formatter() << "Type code " << types[i][j] << " of cell ("
                                                    << i << ", " << j << ") is not in codec.");
            }
            auto cell = cell_to_tesseroids(lons[j], lats[i], topography(i, j), stack->second);
            model.insert(model.end(), std::make_move_iterator(cell.begin()),
                         std::make_move_iterator(cell.end()));
        }
    }
    return model;
}

std::vector<Tesseroid> crust2_to_tesseroids(const std::filesystem::path& archive_path) {
    TarGzArchive archive(archive_path);
    auto topography_file = archive.extract(config::get_topography_member());
    auto topography = read_topography(topography_file);
    auto legend_file = archive.extract(config::get_legend_member());
    auto codec = read_codec(legend_file);
    auto types_file = archive.extract(config::get_type_code_member());
    auto types = read_type_codes(types_file);
    return assemble_model(topography, types, codec);
}
