#ifndef CRUSTMODEL_CRUST2_HPP
#define CRUSTMODEL_CRUST2_HPP

#include <array>
#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "config.hpp"
#include "tesseroid.hpp"


/**
 * Properties of the mantle below the Moho as given in the legend.
 * The mantle has no lower boundary, so it never becomes part of the model geometry.
 */
struct MantleProperties {
    double vp;
    double vs;
    double density;
};

/**
 * Layered crustal profile of one type code.
 * Layers are ordered from the surface downwards: ice, water, soft sediments, hard sediments,
 * upper, middle and lower crust. Layers with zero thickness are not present in the cell.
 * All values are in SI units (m/s, kg/m^3, m).
 */
struct LayerStack {
    std::array<double, config::num_layers> vp;
    std::array<double, config::num_layers> vs;
    std::array<double, config::num_layers> density;
    std::array<double, config::num_layers> thickness;
    MantleProperties mantle;
};

bool operator==(const LayerStack& s1, const LayerStack& s2);

/**
 * Map two character type code to its layered profile.
 */
using Codec = std::map<std::string, LayerStack>;

/**
 * Type code for every cell of the grid, indexed [row][column].
 */
using TypeCodeGrid = std::vector<std::vector<std::string>>;


/**
 * Read topography/bathymetry table.
 * The first line is a header, every following line starts with a row label followed by one
 * elevation per column. Blank lines are ignored.
 * Throws ParseError if the table doesn't have the expected shape or contains a non-numeric value.
 * @param is Stream positioned at the start of the table.
 * @param rows Expected number of rows, excluding the header.
 * @param columns Expected number of values per row, excluding the label.
 * @return Matrix of elevation in m, positive up. Row index goes from north to south,
 * column index from west to east.
 */
Eigen::MatrixXd read_topography(std::istream& is, size_t rows = config::grid_rows,
                                size_t columns = config::grid_columns);

/**
 * Read table of type codes. Same layout as read_topography, values are kept as strings.
 */
TypeCodeGrid read_type_codes(std::istream& is, size_t rows = config::grid_rows,
                             size_t columns = config::grid_columns);

/**
 * Read the legend which defines the layer properties for every type code.
 * After a header of fixed length the legend consists of groups of five lines:
 * code, Vp (km/s), Vs (km/s), density (g/cm^3) and thickness (km). Every line holds one value
 * per layer and an additional value for the mantle. The mantle value of the thickness line may
 * be absent and is never parsed.
 * Blank lines are ignored. If a code is given multiple times, the last group is used.
 * Throws ParseError if the legend is malformed.
 * @param is Stream positioned at the start of the legend.
 * @return Codec with values converted to SI units.
 */
Codec read_codec(std::istream& is);

/**
 * Convert one cell of the model to tesseroids.
 * Layers are stacked from the surface downwards, starting at top. Every layer with a non zero
 * thickness creates one tesseroid, layers with zero thickness are skipped.
 * @param west Western boundary of the cell in degrees.
 * @param north Northern boundary of the cell in degrees.
 * @param top Surface elevation of the cell in m.
 * @param stack Layered profile of the cell.
 * @param cell_size Width and height of the cell in degrees.
 * @return Tesseroids from top to bottom.
 */
std::vector<Tesseroid> cell_to_tesseroids(double west, double north, double top,
                                          const LayerStack& stack,
                                          double cell_size = config::cell_size_degrees);

/**
 * Convert the complete grid to tesseroids.
 * Row i of the grids is the latitude band with northern boundary 90 - 2i degrees, column j the
 * longitude band with western boundary -180 + 2j degrees.
 * Throws LookupError if a type code is not part of the codec and invalid_argument if topography
 * and type codes have different shapes or the grid is larger than the globe.
 * @return Tesseroids in row major cell order, from top to bottom for every cell.
 */
std::vector<Tesseroid> assemble_model(const Eigen::MatrixXd& topography, const TypeCodeGrid& types,
                                      const Codec& codec);

/**
 * Convert the CRUST2.0 model to tesseroids.
 * The mantle below the Moho is not included since it has no lower boundary.
 * @param archive_path Path to the .tar.gz archive of the model.
 * @return Tesseroids with density, vp and vs set as properties.
 */
std::vector<Tesseroid> crust2_to_tesseroids(const std::filesystem::path& archive_path);

#endif // CRUSTMODEL_CRUST2_HPP
