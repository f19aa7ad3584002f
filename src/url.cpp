#include "deltastore/storage/url.hpp"
#include "deltastore/core/errors.hpp"
#include "deltastore/storage/path.hpp"

#include <algorithm>
#include <cctype>

namespace deltastore {

namespace {

bool valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

Url Url::parse(std::string_view text) {
    auto sep = text.find("://");
    if (sep == std::string_view::npos) {
        throw StorageError(ErrorKind::InvalidLocation,
            "Invalid table location: \"" + std::string(text) + "\" is not a URL");
    }

    Url url;
    url.scheme = lowercase(text.substr(0, sep));
    if (!valid_scheme(url.scheme)) {
        throw StorageError(ErrorKind::InvalidLocation,
            "Invalid table location: bad scheme in \"" + std::string(text) + "\"");
    }

    std::string_view rest = text.substr(sep + 3);

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        url.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        url.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        url.authority = std::string(rest);
    } else {
        url.authority = std::string(rest.substr(0, slash));
        url.path = std::string(rest.substr(slash));
    }

    if (url.authority.find_first_of(" \t\r\n") != std::string::npos) {
        throw StorageError(ErrorKind::InvalidLocation,
            "Invalid table location: bad authority in \"" + std::string(text) + "\"");
    }
    return url;
}

std::string Url::to_string() const {
    std::string out = scheme + "://" + authority + path;
    if (!query.empty()) out += "?" + query;
    if (!fragment.empty()) out += "#" + fragment;
    return out;
}

std::filesystem::path Url::to_file_path() const {
    if (scheme != "file") {
        throw StorageError(ErrorKind::InvalidLocation,
            "Invalid table location: " + to_string() + " is not a file:// URL");
    }
    if (!authority.empty() && authority != "localhost") {
        throw StorageError(ErrorKind::InvalidLocation,
            "Invalid table location: " + to_string() + " names a remote host");
    }
    if (path.empty() || path[0] != '/') {
        throw StorageError(ErrorKind::InvalidLocation,
            "Invalid table location: " + to_string() + " has no absolute path");
    }

    Path decoded;
    try {
        decoded = Path::from_url_path(path);
    } catch (const StorageError& e) {
        throw StorageError(ErrorKind::InvalidLocation,
            "Invalid table location: " + to_string() + ": " + e.what());
    }
    return std::filesystem::path("/") / decoded.as_string();
}

std::string scheme_key(std::string_view scheme) {
    auto sep = scheme.find("://");
    if (sep != std::string_view::npos) {
        scheme = scheme.substr(0, sep);
    }
    return lowercase(scheme) + "://";
}

} // namespace deltastore
