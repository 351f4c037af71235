#include "config.hpp"

namespace config {

    std::string_view get_topography_member() {
        return "./CNelevatio2.txt";
    }

    std::string_view get_type_code_member() {
        return "./CNtype2.txt";
    }

    std::string_view get_legend_member() {
        return "./CNtype2_key.txt";
    }

    std::string_view get_crust2_url() {
        return "http://igpppublic.ucsd.edu/~gabi/ftp/crust2.tar.gz";
    }

    std::string_view get_default_archive_filename() {
        return "crust2.tar.gz";
    }
} // namespace config
