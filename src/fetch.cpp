#include "fetch.hpp"


std::filesystem::path fetch_crust2(Downloader& downloader,
                                   const std::filesystem::path& destination) {
    return downloader.fetch(config::get_crust2_url(), destination);
}
