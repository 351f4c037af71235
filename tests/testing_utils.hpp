#ifndef CRUSTMODEL_TESTING_UTILS_HPP
#define CRUSTMODEL_TESTING_UTILS_HPP

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

/**
 * EXPECT that actual and desired differ by a maximum of atol + rtol * desired.
 * @param actual Actual value
 * @param desired Desired value
 * @param rtol relative tolerance
 * @param atol absolute tolerance
 */
template <typename T>
::testing::AssertionResult Close(T actual, T desired, T rtol = 1E-7, T atol = 0) {
    T max_allowed_difference = atol + rtol * std::abs(desired);
    if (std::abs(actual - desired) <= max_allowed_difference) {
        return ::testing::AssertionSuccess();
    } else {
        return ::testing::AssertionFailure()
               << "Actual value " << actual << " different from desired value " << desired
               << " by " << std::abs(actual - desired) << ". Max. allowed difference "
               << max_allowed_difference;
    }
}

/**
 * Return directory of source file. Use with __FILE__ to locate test data.
 */
std::filesystem::path current_source_path(std::string file);

/**
 * Return path to a file in the temporary directory. An existing file is removed.
 */
std::filesystem::path temporary_file(const std::string& name);

/**
 * Create table in the layout of the CRUST2.0 grids: a header line and one labelled line per row.
 */
std::string make_labelled_table(const std::vector<std::vector<std::string>>& rows);

/**
 * Create labelled table of shape rows x columns where every value is the same.
 */
std::string make_constant_table(size_t rows, size_t columns, const std::string& value);

/**
 * Create ustar header block with valid checksum for a member of given size and type.
 */
std::string make_tar_header(const std::string& name, std::uintmax_t size, char type = '0');

using ArchiveMember = std::pair<std::string, std::string>;

/**
 * Create uncompressed tar archive in ustar format.
 * Names longer than 100 characters are stored as GNU long name entries.
 * @param members Pairs of member name and content.
 * @param type Type flag used for all members.
 */
std::string make_tar(const std::vector<ArchiveMember>& members, char type = '0');

/**
 * Compress data with gzip and save it.
 */
void write_gzip_file(const std::filesystem::path& path, const std::string& data);

#endif // CRUSTMODEL_TESTING_UTILS_HPP
