#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace deltastore {

constexpr char DELIMITER = '/';

// A normalized, delimiter-separated key into an object store's namespace.
// Never has a leading or trailing delimiter and never contains empty segments;
// the empty path is the root.
class Path {
public:
    Path() = default;

    // Lenient conversion: splits on '/' and drops empty segments
    Path(std::string_view text);
    Path(const char* text) : Path(std::string_view(text)) {}
    Path(const std::string& text) : Path(std::string_view(text)) {}

    // Strict parse: rejects empty segments, "." / "..", backslashes and control chars.
    // Throws StorageError(InvalidPath).
    static Path parse(std::string_view text);

    // Percent-decode a URL path component, then parse strictly
    static Path from_url_path(std::string_view url_path);

    bool is_root() const { return raw_.empty(); }
    const std::string& as_string() const { return raw_; }
    std::vector<std::string> parts() const;

    // Last segment, empty for the root
    std::string filename() const;

    // Extension of the last segment (text after its last '.'), if any
    std::optional<std::string> extension() const;

    Path child(std::string_view segment) const;
    Path join(const Path& other) const;

    // True when every segment of prefix matches the leading segments of this path
    bool prefix_matches(const Path& prefix) const;

    // The remainder after prefix, or nullopt when prefix does not match
    std::optional<Path> strip_prefix(const Path& prefix) const;

    bool operator==(const Path& other) const { return raw_ == other.raw_; }
    bool operator!=(const Path& other) const { return raw_ != other.raw_; }
    bool operator<(const Path& other) const { return raw_ < other.raw_; }

private:
    std::string raw_;
};

inline std::ostream& operator<<(std::ostream& os, const Path& path) {
    return os << path.as_string();
}

// Location of the commit file for a table version:
// _delta_log/<version zero-padded to 20 digits>.json
Path commit_uri_from_version(int64_t version);

} // namespace deltastore
