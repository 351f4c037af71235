#ifndef CRUSTMODEL_ARCHIVE_HPP
#define CRUSTMODEL_ARCHIVE_HPP

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>


/**
 * Read only access to the members of a gzip compressed tar archive (.tar.gz).
 * The archive is indexed once on construction. Every extraction decompresses the archive up to the
 * requested member again, so only the requested member is held in memory.
 * Supports POSIX ustar, old V7 and GNU tar archives. Long names are taken from GNU long name
 * entries and from the path record of pax extended headers, other pax records are ignored.
 * Extended header entries are not listed as members.
 */
class TarGzArchive {
public:
    /**
     * Open and index the archive.
     * Throws ArchiveError if the file does not exist, is not gzip compressed or not a tar
     * archive, or if an extended header is larger than 1 MiB.
     * @param path Path to .tar.gz file.
     */
    explicit TarGzArchive(std::filesystem::path path);

    /**
     * Extract a member of the archive.
     * Throws ArchiveError if the member does not exist or is not a regular file.
     * @param member_name Name of the member as stored in the archive, eg. "./CNtype2.txt".
     * @return Stream positioned at the start of the member content.
     */
    std::istringstream extract(std::string_view member_name) const;

    /**
     * Return true if the archive contains a member with the given name.
     */
    bool contains(std::string_view member_name) const;

    /**
     * Names of all members in the order they are stored in the archive.
     */
    std::vector<std::string> members() const;

    const std::filesystem::path& path() const;

private:
    struct Entry {
        std::string name;
        // position of the first content byte in the uncompressed tar stream
        std::uintmax_t offset;
        std::uintmax_t size;
        char type;
    };

    const Entry* find(std::string_view member_name) const;

    std::filesystem::path path_;
    std::vector<Entry> entries;
};

#endif // CRUSTMODEL_ARCHIVE_HPP
