#ifndef CRUSTMODEL_SURFER_HPP
#define CRUSTMODEL_SURFER_HPP

#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

#include <Eigen/Dense>


/**
 * Regular grid read from a Surfer grid file.
 * Surfer is a contouring, gridding and surface mapping software by Golden Software.
 */
struct SurferGrid {
    /**
     * Coordinates of the grid columns, geographically the longitude.
     */
    std::vector<double> x;
    /**
     * Coordinates of the grid rows, geographically the latitude.
     */
    std::vector<double> y;
    /**
     * Grid values, eg. topography or gravity anomaly. Shape is (y.size(), x.size()), value at
     * (i, j) belongs to point (x[j], y[i]). Missing values are NaN.
     */
    Eigen::MatrixXd values;
    // range of values as given in the file header
    double zmin;
    double zmax;
};

enum class SurferFormat { Ascii, Binary };

std::ostream& operator<<(std::ostream& os, SurferFormat format);

/**
 * Convert format name "ascii" or "binary" to the format.
 * Throws invalid_argument for other names.
 */
SurferFormat surfer_format_from_string(std::string_view name);

/**
 * Read Surfer ASCII grid file (DSAA).
 * Layout:
 * DSAA             identifier, not checked
 * nx ny            number of columns and rows
 * xmin xmax        range of x coordinates
 * ymin ymax        range of y coordinates
 * zmin zmax        range of values
 * z11 z12 ... z1nx one line of nx values per row, ny rows
 * Throws runtime_error if the file can't be opened and ParseError if the content doesn't match
 * the layout.
 * @param path
 * @return Grid with values greater or equal than the no data value set to NaN.
 */
SurferGrid read_surfer_ascii(const std::filesystem::path& path);

/**
 * Read Surfer 6 binary grid file (DSBB).
 * After the four byte identifier follow nx and ny as 16 bit integers, xmin, xmax, ymin, ymax,
 * zmin, zmax as 64 bit doubles and ny rows of nx 32 bit floats. Byte order is little endian.
 * Throws runtime_error if the file can't be opened and ParseError if the file is not a Surfer 6
 * binary grid or is truncated.
 */
SurferGrid read_surfer_binary(const std::filesystem::path& path);

/**
 * Read Surfer grid file in the given format.
 */
SurferGrid read_surfer(const std::filesystem::path& path, SurferFormat format = SurferFormat::Ascii);

#endif // CRUSTMODEL_SURFER_HPP
