/// @file path_guard.cpp
/// @brief PathGuard implementation.

#include "bkg/security/path_guard.hpp"

#include <cctype>
#include <new>

namespace bkg::security {

namespace {

bool isSeparator(char c) noexcept {
    return c == '/' || c == '\\';
}

bool isDriveLetter(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

char lower(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::string NormalizedPath::str() const {
    std::string out = root;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            out += '/';
        }
        out += segments[i];
    }
    return out;
}

bool PathGuard::validate(std::string_view baseDir,
                         std::string_view candidatePath) noexcept {
    return validate(baseDir, candidatePath, kBackupExtension);
}

bool PathGuard::validate(std::string_view baseDir,
                         std::string_view candidatePath,
                         std::string_view extension) noexcept {
    if (baseDir.empty() || candidatePath.empty() || extension.empty()) {
        return false;
    }
    if (baseDir.find('\0') != std::string_view::npos ||
        candidatePath.find('\0') != std::string_view::npos) {
        return false;
    }

    try {
        auto base = normalize(baseDir);
        auto candidate = normalize(candidatePath);
        if (!base || !candidate) {
            return false;
        }
        if (!isWithin(*base, *candidate)) {
            return false;
        }
        return extensionOf(candidate->segments.back()) == extension;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::optional<NormalizedPath> PathGuard::normalize(std::string_view path) {
    NormalizedPath result;
    std::size_t pos = 0;

    if (path.size() >= 2 && isSeparator(path[0]) && isSeparator(path[1])) {
        result.root = "//";
        pos = 2;
    } else if (!path.empty() && isSeparator(path[0])) {
        result.root = "/";
        pos = 1;
    } else if (path.size() >= 2 && isDriveLetter(path[0]) && path[1] == ':') {
        result.root = {lower(path[0]), ':'};
        pos = 2;
        if (path.size() > 2 && isSeparator(path[2])) {
            result.root += '/';
            pos = 3;
        }
    }

    while (pos <= path.size()) {
        auto end = pos;
        while (end < path.size() && !isSeparator(path[end])) {
            ++end;
        }
        auto segment = path.substr(pos, end - pos);
        pos = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (result.segments.empty()) {
                return std::nullopt;
            }
            result.segments.pop_back();
            continue;
        }
        result.segments.emplace_back(segment);
    }

    return result;
}

bool PathGuard::isWithin(const NormalizedPath& base,
                         const NormalizedPath& candidate) noexcept {
    if (!equalsIgnoreCase(base.root, candidate.root)) {
        return false;
    }
    if (candidate.segments.size() <= base.segments.size()) {
        return false;
    }
    for (std::size_t i = 0; i < base.segments.size(); ++i) {
        if (!equalsIgnoreCase(base.segments[i], candidate.segments[i])) {
            return false;
        }
    }
    return true;
}

std::string_view PathGuard::extensionOf(std::string_view fileName) noexcept {
    auto dot = fileName.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return {};
    }
    return fileName.substr(dot);
}

bool PathGuard::equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i])) {
            return false;
        }
    }
    return true;
}

} // namespace bkg::security
