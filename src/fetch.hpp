#ifndef CRUSTMODEL_FETCH_HPP
#define CRUSTMODEL_FETCH_HPP

#include <filesystem>
#include <string_view>

#include "config.hpp"


/**
 * Interface for retrieving a remote file and storing it locally.
 * The library contains no network client, users provide their own implementation.
 */
class Downloader {
public:
    virtual ~Downloader() = default;

    /**
     * Download the file at url and save it under destination.
     * Errors are reported by throwing an exception.
     * @return Path the file was saved under.
     */
    virtual std::filesystem::path fetch(std::string_view url,
                                        const std::filesystem::path& destination) = 0;
};

/**
 * Download the CRUST2.0 model archive.
 * Exceptions thrown by the downloader are propagated.
 * @param downloader Used to retrieve the archive.
 * @param destination File name the archive is saved under.
 * @return The file name of the downloaded archive.
 */
std::filesystem::path
fetch_crust2(Downloader& downloader,
             const std::filesystem::path& destination = config::get_default_archive_filename());

#endif // CRUSTMODEL_FETCH_HPP
