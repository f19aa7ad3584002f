#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace deltastore {

// A parsed table location: scheme://[authority]/path[?query][#fragment]
struct Url {
    std::string scheme;     // lowercased
    std::string authority;  // host[:port], may be empty
    std::string path;       // always starts with '/' (or is empty)
    std::string query;      // without '?'
    std::string fragment;   // without '#'

    // Throws StorageError(InvalidLocation) on a malformed URL
    static Url parse(std::string_view text);

    // "<scheme>://", the FactoryRegistry key for this URL
    std::string scheme_key() const { return scheme + "://"; }

    // Normalized full form, the ObjectStoreRegistry key
    std::string to_string() const;

    // Filesystem path for a file:// URL. Throws StorageError(InvalidLocation)
    // for other schemes, remote hosts, or relative paths.
    std::filesystem::path to_file_path() const;

    bool operator==(const Url& other) const { return to_string() == other.to_string(); }
};

inline std::ostream& operator<<(std::ostream& os, const Url& url) {
    return os << url.to_string();
}

// Normalize a scheme given as "s3", "S3" or "s3://" to the "s3://" registry key
std::string scheme_key(std::string_view scheme);

} // namespace deltastore
