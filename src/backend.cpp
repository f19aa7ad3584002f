#include "deltastore/storage/backend.hpp"

#include <algorithm>
#include <iterator>

namespace deltastore {

size_t list_page_size(const ListOptions& options) {
    return options.max_keys == 0 ? constants::DEFAULT_LIST_PAGE_SIZE : options.max_keys;
}

ListResult list_all(ObjectStore& store,
                    const std::optional<Path>& prefix,
                    const std::optional<Path>& offset) {
    ListResult all;
    ListOptions options;
    options.prefix = prefix;
    options.offset = offset;

    while (true) {
        auto page = store.list(options);
        if (!page.success) return page;
        all.objects.insert(all.objects.end(),
                           std::make_move_iterator(page.objects.begin()),
                           std::make_move_iterator(page.objects.end()));
        if (!page.truncated || page.continuation_token.empty()) break;
        options.continuation_token = page.continuation_token;
    }

    all.success = true;
    return all;
}

Status check_preconditions(const ObjectMeta& meta, const GetOptions& options) {
    const auto& location = meta.location.as_string();
    const std::string etag = meta.e_tag.value_or("");

    if (options.if_match && *options.if_match != "*" && *options.if_match != etag) {
        return failure(ErrorKind::Precondition,
            "Precondition failed for " + location + ": e_tag \"" + etag +
            "\" does not match \"" + *options.if_match + "\"");
    }
    if (options.if_none_match &&
        (*options.if_none_match == "*" || *options.if_none_match == etag)) {
        return failure(ErrorKind::NotModified,
            "Object " + location + " not modified: e_tag \"" + etag + "\" matches");
    }
    if (options.if_unmodified_since && meta.last_modified > *options.if_unmodified_since) {
        return failure(ErrorKind::Precondition,
            "Precondition failed for " + location + ": modified after the given time");
    }
    if (options.if_modified_since && meta.last_modified <= *options.if_modified_since) {
        return failure(ErrorKind::NotModified,
            "Object " + location + " not modified since the given time");
    }
    return succeeded();
}

std::optional<ByteRange> resolve_range(const std::optional<ByteRange>& requested,
                                       uint64_t size,
                                       std::string& error_message) {
    if (!requested) return ByteRange{0, size};

    if (requested->end < requested->start) {
        error_message = "Range end " + std::to_string(requested->end) +
                        " is before start " + std::to_string(requested->start);
        return std::nullopt;
    }
    if (requested->start >= size && !(size == 0 && requested->start == 0)) {
        error_message = "Range start " + std::to_string(requested->start) +
                        " beyond object size " + std::to_string(size);
        return std::nullopt;
    }
    return ByteRange{requested->start, std::min(requested->end, size)};
}

} // namespace deltastore
