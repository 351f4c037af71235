#ifndef CRUSTMODEL_CONFIG_HPP
#define CRUSTMODEL_CONFIG_HPP

#include <cstddef>
#include <string_view>

/**
 * This file contains constants, filenames and paths which describe the fixed layout of the
 * CRUST2.0 model and the Surfer grid format. Changing the values requires recompiling the library
 * and relinking with the main programs.
 */


namespace config {

    /**
     * Name of the archive members in the CRUST2.0 tar.gz archive.
     * These have to match the member names exactly, including the leading "./".
     */
    std::string_view get_topography_member();
    std::string_view get_type_code_member();
    std::string_view get_legend_member();

    /**
     * Address from which the CRUST2.0 archive can be downloaded.
     */
    std::string_view get_crust2_url();

    /**
     * File name the downloaded archive is saved under when no name is given.
     */
    std::string_view get_default_archive_filename();

    /**
     * Size of one model cell in degrees (both latitude and longitude).
     */
    constexpr double cell_size_degrees = 2.;

    /**
     * Number of latitude rows and longitude columns of the global model grid.
     */
    constexpr std::size_t grid_rows = 90;
    constexpr std::size_t grid_columns = 180;

    /**
     * Number of crustal layers per type code: ice, water, soft sediments, hard sediments,
     * upper, middle and lower crust.
     */
    constexpr std::size_t num_layers = 7;

    /**
     * Number of values in a line of the legend, the crustal layers plus the mantle.
     */
    constexpr std::size_t num_legend_values = num_layers + 1;

    /**
     * Number of header lines at the start of the legend which are skipped.
     */
    constexpr std::size_t legend_header_lines = 5;

    /**
     * Legend values are given in km, km/s and g/cm^3. Multiply by this factor to convert to SI
     * units.
     */
    constexpr double legend_to_si = 1000.;

    /**
     * Values greater or equal than this mark missing data in Surfer grids.
     */
    constexpr double surfer_nodata_threshold = 1.70141e+38;

} // namespace config

#endif // CRUSTMODEL_CONFIG_HPP
