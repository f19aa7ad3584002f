#include "deltastore/storage/path.hpp"
#include "deltastore/core/constants.hpp"
#include "deltastore/core/errors.hpp"

#include <cstdio>

namespace deltastore {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void validate_segment(std::string_view segment, std::string_view full) {
    if (segment.empty()) {
        throw StorageError(ErrorKind::InvalidPath,
            "Path \"" + std::string(full) + "\" contains an empty path segment");
    }
    if (segment == "." || segment == "..") {
        throw StorageError(ErrorKind::InvalidPath,
            "Path \"" + std::string(full) + "\" contains illegal segment \"" +
            std::string(segment) + "\"");
    }
    for (char c : segment) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || c == '\\') {
            throw StorageError(ErrorKind::InvalidPath,
                "Path \"" + std::string(full) + "\" contains illegal character in segment \"" +
                std::string(segment) + "\"");
        }
    }
}

}  // namespace

Path::Path(std::string_view text) {
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t next = text.find(DELIMITER, pos);
        if (next == std::string_view::npos) next = text.size();
        if (next > pos) {
            if (!raw_.empty()) raw_ += DELIMITER;
            raw_.append(text.substr(pos, next - pos));
        }
        pos = next + 1;
    }
}

Path Path::parse(std::string_view text) {
    std::string_view stripped = text;
    if (!stripped.empty() && stripped.front() == DELIMITER) stripped.remove_prefix(1);
    if (!stripped.empty() && stripped.back() == DELIMITER) stripped.remove_suffix(1);

    Path path;
    if (stripped.empty()) return path;

    size_t pos = 0;
    while (pos <= stripped.size()) {
        size_t next = stripped.find(DELIMITER, pos);
        if (next == std::string_view::npos) next = stripped.size();
        validate_segment(stripped.substr(pos, next - pos), text);
        pos = next + 1;
    }
    path.raw_ = std::string(stripped);
    return path;
}

Path Path::from_url_path(std::string_view url_path) {
    std::string decoded;
    decoded.reserve(url_path.size());
    for (size_t i = 0; i < url_path.size(); ++i) {
        char c = url_path[i];
        if (c != '%') {
            decoded += c;
            continue;
        }
        if (i + 2 >= url_path.size()) {
            throw StorageError(ErrorKind::InvalidPath,
                "Invalid percent-encoding in URL path \"" + std::string(url_path) + "\"");
        }
        int hi = hex_value(url_path[i + 1]);
        int lo = hex_value(url_path[i + 2]);
        if (hi < 0 || lo < 0) {
            throw StorageError(ErrorKind::InvalidPath,
                "Invalid percent-encoding in URL path \"" + std::string(url_path) + "\"");
        }
        decoded += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return parse(decoded);
}

std::vector<std::string> Path::parts() const {
    std::vector<std::string> result;
    if (raw_.empty()) return result;
    size_t pos = 0;
    while (pos <= raw_.size()) {
        size_t next = raw_.find(DELIMITER, pos);
        if (next == std::string::npos) next = raw_.size();
        result.emplace_back(raw_.substr(pos, next - pos));
        pos = next + 1;
    }
    return result;
}

std::string Path::filename() const {
    auto pos = raw_.rfind(DELIMITER);
    if (pos == std::string::npos) return raw_;
    return raw_.substr(pos + 1);
}

std::optional<std::string> Path::extension() const {
    auto name = filename();
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return std::nullopt;
    }
    return name.substr(dot + 1);
}

Path Path::child(std::string_view segment) const {
    Path result = *this;
    Path tail(segment);
    if (tail.is_root()) return result;
    if (!result.raw_.empty()) result.raw_ += DELIMITER;
    result.raw_ += tail.raw_;
    return result;
}

Path Path::join(const Path& other) const {
    return child(other.raw_);
}

bool Path::prefix_matches(const Path& prefix) const {
    if (prefix.is_root()) return true;
    if (raw_.size() < prefix.raw_.size()) return false;
    if (raw_.compare(0, prefix.raw_.size(), prefix.raw_) != 0) return false;
    return raw_.size() == prefix.raw_.size() || raw_[prefix.raw_.size()] == DELIMITER;
}

std::optional<Path> Path::strip_prefix(const Path& prefix) const {
    if (!prefix_matches(prefix)) return std::nullopt;
    if (prefix.is_root()) return *this;
    Path rest;
    if (raw_.size() > prefix.raw_.size()) {
        rest.raw_ = raw_.substr(prefix.raw_.size() + 1);
    }
    return rest;
}

Path commit_uri_from_version(int64_t version) {
    char name[64];
    std::snprintf(name, sizeof(name), "%0*lld.json",
                  constants::COMMIT_VERSION_DIGITS, static_cast<long long>(version));
    return Path(constants::DELTA_LOG_DIR).child(name);
}

} // namespace deltastore
