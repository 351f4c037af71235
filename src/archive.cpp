#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string_view>

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include "archive.hpp"
#include "errors.hpp"
#include "utils.hpp"


namespace fs = std::filesystem;
namespace io = boost::iostreams;


namespace {

    constexpr std::size_t block_size = 512;
    using Block = std::array<char, block_size>;

    // Byte offsets of header fields, see POSIX ustar specification.
    constexpr std::size_t name_offset = 0, name_length = 100;
    constexpr std::size_t size_offset = 124, size_length = 12;
    constexpr std::size_t checksum_offset = 148, checksum_length = 8;
    constexpr std::size_t typeflag_offset = 156;
    constexpr std::size_t magic_offset = 257;
    constexpr std::size_t prefix_offset = 345, prefix_length = 155;

    constexpr char gnu_longname_type = 'L';
    constexpr char pax_header_type = 'x';
    constexpr char pax_global_header_type = 'g';

    // Upper bound for the content of long name and pax header entries.
    constexpr std::uintmax_t max_extension_size = 1 << 20;

    /**
     * Decompressing input stream over a gzip file.
     * The file is closed when the reader goes out of scope.
     */
    class GzipReader {
    public:
        explicit GzipReader(const fs::path& path) : file(path, std::ios::in | std::ios::binary) {
            if (not file) {
                throw ArchiveError(impl::Formatter() << "Couldn't open archive " << path);
            }
            stream.push(io::gzip_decompressor());
            stream.push(file);
            // let decompression errors propagate instead of only setting the badbit
            stream.exceptions(std::ios::badbit);
        }

        /**
         * Read up to n bytes. Returns number of bytes read, less than n only at end of stream.
         */
        std::streamsize read(char* buffer, std::streamsize n) {
            stream.read(buffer, n);
            return stream.gcount();
        }

        /**
         * Skip n bytes. Returns false if the stream ended before.
         */
        bool skip(std::uintmax_t n) {
            constexpr auto max_chunk = static_cast<std::uintmax_t>(1) << 30;
            while (n > 0) {
                auto chunk = static_cast<std::streamsize>(std::min(n, max_chunk));
                stream.ignore(chunk);
                if (stream.gcount() != chunk) {
                    return false;
                }
                n -= chunk;
            }
            return true;
        }

    private:
        std::ifstream file;
        io::filtering_istream stream;
    };

    std::uintmax_t round_up_to_block(std::uintmax_t n) {
        return (n + block_size - 1) / block_size * block_size;
    }

    bool is_zero_block(const Block& block) {
        return std::all_of(block.begin(), block.end(), [](char c) { return c == '\0'; });
    }

    std::string read_string_field(const char* field, std::size_t length) {
        return std::string(field, strnlen(field, length));
    }

    std::uintmax_t read_octal_field(const char* field, std::size_t length) {
        std::size_t i = 0;
        while (i < length and field[i] == ' ') {
            ++i;
        }
        std::uintmax_t value = 0;
        for (; i < length and field[i] >= '0' and field[i] <= '7'; ++i) {
            value = value * 8 + static_cast<std::uintmax_t>(field[i] - '0');
        }
        // numbers are terminated by space or null
        for (; i < length; ++i) {
            if (field[i] != ' ' and field[i] != '\0') {
                throw ArchiveError(impl::Formatter()
                                   << "Invalid numeric field '" << std::string(field, length)
                                   << "' in tar header.");
            }
        }
        return value;
    }

    /**
     * Checksum is the sum of all header bytes with the checksum field itself taken as spaces.
     * Some old implementations summed signed chars, so accept both.
     */
    bool checksum_valid(const Block& header) {
        long unsigned_sum = 0, signed_sum = 0;
        for (std::size_t i = 0; i < block_size; ++i) {
            bool in_checksum = i >= checksum_offset and i < checksum_offset + checksum_length;
            char c = in_checksum ? ' ' : header[i];
            unsigned_sum += static_cast<unsigned char>(c);
            signed_sum += static_cast<signed char>(c);
        }
        auto expected =
            static_cast<long>(read_octal_field(header.data() + checksum_offset, checksum_length));
        return expected == unsigned_sum or expected == signed_sum;
    }

    /**
     * Return value of the "path" record of a pax extended header, empty if there is none.
     * Records have the form "<length> <key>=<value>\n", where length counts the whole record.
     */
    std::string read_pax_path(const std::string& content, const fs::path& archive_path) {
        std::string path;
        std::size_t position = 0;
        while (position < content.size() and content[position] != '\0') {
            auto space = content.find(' ', position);
            if (space == std::string::npos) {
                throw ArchiveError(impl::Formatter()
                                   << "Malformed pax header in archive " << archive_path);
            }
            std::size_t length = 0;
            for (auto i = position; i < space; ++i) {
                if (content[i] < '0' or content[i] > '9') {
                    throw ArchiveError(impl::Formatter() << "Malformed pax record length in archive "
                                                         << archive_path);
                }
                length = length * 10 + static_cast<std::size_t>(content[i] - '0');
            }
            auto end = position + length;
            if (end <= space + 1 or end > content.size() or content[end - 1] != '\n') {
                throw ArchiveError(impl::Formatter()
                                   << "Malformed pax record in archive " << archive_path);
            }
            auto record = std::string_view(content).substr(space + 1, end - space - 2);
            auto equals = record.find('=');
            if (equals != std::string_view::npos and record.substr(0, equals) == "path") {
                path = std::string(record.substr(equals + 1));
            }
            position = end;
        }
        return path;
    }

    bool is_regular_file_type(char type) {
        // '\0' is used by old V7 archives, '7' is a contiguous file
        return type == '0' or type == '\0' or type == '7';
    }

} // namespace


TarGzArchive::TarGzArchive(fs::path path) : path_(std::move(path)) {
    if (not fs::is_regular_file(path_)) {
        throw ArchiveError(impl::Formatter() << "Can't find archive " << path_);
    }
    try {
        GzipReader reader(path_);
        Block header;
        std::uintmax_t position = 0;
        std::string long_name;
        while (true) {
            auto n = reader.read(header.data(), block_size);
            if (n == 0) {
                // archive without end of archive marker
                break;
            }
            if (n != static_cast<std::streamsize>(block_size)) {
                throw ArchiveError(impl::Formatter() << "Archive " << path_ << " is truncated.");
            }
            position += block_size;
            if (is_zero_block(header)) {
                break;
            }
            if (not checksum_valid(header)) {
                throw ArchiveError(impl::Formatter()
                                   << "Archive " << path_ << " is not a tar archive (bad header "
                                   << "checksum at byte " << position - block_size << ").");
            }
            auto size = read_octal_field(header.data() + size_offset, size_length);
            char type = header[typeflag_offset];
            if (type == gnu_longname_type or type == pax_header_type or
                type == pax_global_header_type) {
                // content of this entry describes the following entry
                if (size > max_extension_size) {
                    throw ArchiveError(impl::Formatter()
                                       << "Extended header of " << size << " bytes at byte "
                                       << position - block_size << " of archive " << path_
                                       << " exceeds the limit of " << max_extension_size
                                       << " bytes.");
                }
                std::string content(size, '\0');
                if (reader.read(content.data(), static_cast<std::streamsize>(size)) !=
                        static_cast<std::streamsize>(size) or
                    not reader.skip(round_up_to_block(size) - size)) {
                    throw ArchiveError(impl::Formatter() << "Archive " << path_
                                                         << " is truncated.");
                }
                position += round_up_to_block(size);
                if (type == gnu_longname_type) {
                    long_name = read_string_field(content.data(), content.size());
                } else if (type == pax_header_type) {
                    auto pax_path = read_pax_path(content, path_);
                    if (not pax_path.empty()) {
                        long_name = std::move(pax_path);
                    }
                }
                // global pax headers only carry defaults like mtime or uname
                continue;
            }
            std::string name;
            if (not long_name.empty()) {
                name = std::move(long_name);
                long_name.clear();
            } else {
                name = read_string_field(header.data() + name_offset, name_length);
                bool is_ustar = std::memcmp(header.data() + magic_offset, "ustar", 5) == 0;
                auto prefix = is_ustar
                                  ? read_string_field(header.data() + prefix_offset, prefix_length)
                                  : std::string{};
                if (not prefix.empty()) {
                    name = prefix + "/" + name;
                }
            }
            entries.push_back({name, position, size, type});
            if (not reader.skip(round_up_to_block(size))) {
                throw ArchiveError(impl::Formatter() << "Archive " << path_ << " is truncated.");
            }
            position += round_up_to_block(size);
        }
    } catch (const std::ios_base::failure& e) {
        // also covers boost::iostreams::gzip_error
        throw ArchiveError(impl::Formatter()
                           << "Failed to decompress archive " << path_ << ": " << e.what());
    }
}

const TarGzArchive::Entry* TarGzArchive::find(std::string_view member_name) const {
    // if a member was appended multiple times, the last one is valid
    auto it = std::find_if(entries.rbegin(), entries.rend(),
                           [&](const Entry& entry) { return entry.name == member_name; });
    if (it == entries.rend()) {
        return nullptr;
    }
    return &*it;
}

std::istringstream TarGzArchive::extract(std::string_view member_name) const {
    const Entry* entry = find(member_name);
    if (entry == nullptr) {
        throw ArchiveError(impl::Formatter()
                           << "Archive " << path_ << " has no member " << member_name << ".");
    }
    if (not is_regular_file_type(entry->type)) {
        throw ArchiveError(impl::Formatter() << "Member " << member_name << " of archive "
                                             << path_ << " is not a regular file.");
    }
    std::string content(entry->size, '\0');
    try {
        GzipReader reader(path_);
        if (not reader.skip(entry->offset) or
            reader.read(content.data(), static_cast<std::streamsize>(entry->size)) !=
                static_cast<std::streamsize>(entry->size)) {
            throw ArchiveError(impl::Formatter() << "Archive " << path_
                                                 << " is truncated in member " << member_name);
        }
    } catch (const std::ios_base::failure& e) {
        throw ArchiveError(impl::Formatter() << "Failed to decompress member " << member_name
                                             << " of archive " << path_ << ": " << e.what());
    }
    return std::istringstream(std::move(content));
}

bool TarGzArchive::contains(std::string_view member_name) const {
    return find(member_name) != nullptr;
}

std::vector<std::string> TarGzArchive::members() const {
    std::vector<std::string> names;
    names.reserve(entries.size());
    std::transform(entries.begin(), entries.end(), std::back_inserter(names),
                   [](const Entry& entry) { return entry.name; });
    return names;
}

const fs::path& TarGzArchive::path() const {
    return path_;
}
