#include "storage/path_normalizer.hpp"

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace OmniStore::Storage
{

StorageResult<ObjectId> PathNormalizer::Normalize(std::string_view raw, Operation op)
{
    if (raw.find('\0') != std::string_view::npos) {
        return MakeError(StorageErrc::InvalidPath, op, std::string(raw), "path contains NUL byte");
    }

    std::vector<std::string_view> segments;
    bool is_dir = false;

    size_t pos = 0;
    while (pos <= raw.size()) {
        size_t end = raw.find_first_of("/\\", pos);
        if (end == std::string_view::npos) {
            end = raw.size();
        }
        std::string_view segment = raw.substr(pos, end - pos);
        bool last                = end == raw.size();

        if (segment.empty()) {
            // Repeated or trailing separator
            if (last) {
                is_dir = true;
            }
        } else if (segment == ".") {
            is_dir = last ? true : is_dir;
        } else if (segment == "..") {
            if (segments.empty()) {
                spdlog::debug("PathNormalizer: '{}' escapes the backend root", raw);
                return MakeError(
                    StorageErrc::InvalidPath, op, std::string(raw), "path escapes backend root"
                );
            }
            segments.pop_back();
            is_dir = last ? true : is_dir;
        } else {
            segments.push_back(segment);
            is_dir = false;
        }
        pos = end + 1;
    }

    if (segments.empty()) {
        return ObjectId::Root();
    }

    std::string canonical;
    canonical.reserve(raw.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            canonical += '/';
        }
        canonical += segments[i];
    }
    if (is_dir) {
        canonical += '/';
    }
    return FromCanonical(std::move(canonical));
}

//------------------------------------------------------------------------------//
// ObjectId helpers
//------------------------------------------------------------------------------//

std::string_view ObjectId::Name() const noexcept
{
    if (IsRoot()) {
        return path_;
    }
    std::string_view view = path_;
    size_t search_end     = IsDir() ? view.size() - 1 : view.size();
    size_t slash          = view.rfind('/', search_end == 0 ? 0 : search_end - 1);
    if (slash == std::string_view::npos) {
        return view;
    }
    return view.substr(slash + 1);
}

ObjectId ObjectId::Parent() const
{
    if (IsRoot()) {
        return Root();
    }
    std::string_view view = path_;
    if (IsDir()) {
        view.remove_suffix(1);
    }
    size_t slash = view.rfind('/');
    if (slash == std::string_view::npos) {
        return Root();
    }
    return ObjectId(std::string(view.substr(0, slash + 1)));
}

ObjectId ObjectId::Join(std::string_view segment) const
{
    if (IsRoot()) {
        return ObjectId(std::string(segment));
    }
    std::string joined = path_;
    if (!IsDir()) {
        joined += '/';
    }
    joined += segment;
    return ObjectId(std::move(joined));
}

}  // namespace OmniStore::Storage
