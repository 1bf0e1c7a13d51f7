#pragma once

/// @file path_guard.hpp
/// @brief Lexical containment check for backup file paths.
///
/// Confirms that a path influenced by external input resolves to a file
/// inside the backup directory and carries the backup extension. Resolution
/// is purely lexical: the filesystem is never touched, so non-existent
/// targets validate the same way and symlinks are not followed.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bkg::security {

/// A path reduced to its root and its `.`/`..`-free segments.
///
/// Separators are normalized (`\` and `/` are equivalent). The root is
/// lowercased so drive letters compare case-insensitively:
/// | Input          | root   | segments      |
/// |----------------|--------|---------------|
/// | `/a/./b`       | `/`    | `a`, `b`      |
/// | `\\srv\share`  | `//`   | `srv`, `share`|
/// | `C:\Data\x`    | `c:/`  | `Data`, `x`   |
/// | `C:rel`        | `c:`   | `rel`         |
/// | `a/../b`       | (none) | `b`           |
struct NormalizedPath {
    std::string root;
    std::vector<std::string> segments;

    [[nodiscard]] bool isAbsolute() const noexcept {
        return !root.empty() && root.back() == '/';
    }

    /// Rejoin with '/' separators.
    [[nodiscard]] std::string str() const;
};

/// Stateless backup path validation. Thread-safe; never throws.
///
/// Example:
/// @code
///   if (!PathGuard::validate(config.backupDirectory, requestedPath)) {
///       return invalidPath();
///   }
/// @endcode
class PathGuard {
public:
    static constexpr std::string_view kBackupExtension = ".db";

    /// Validate against the default backup extension.
    [[nodiscard]] static bool validate(std::string_view baseDir,
                                       std::string_view candidatePath) noexcept;

    /// Validate with an explicit required extension (compared case-sensitively).
    ///
    /// Fails when either path is empty or contains NUL, when either cannot be
    /// resolved without climbing above its root, when the resolved candidate
    /// is not strictly below the resolved base (segment-wise, ignoring ASCII
    /// case), or when the candidate's file name does not end in @p extension.
    [[nodiscard]] static bool validate(std::string_view baseDir,
                                       std::string_view candidatePath,
                                       std::string_view extension) noexcept;

    /// Resolve `.` and `..` lexically.
    /// @return std::nullopt if a `..` would climb above the root.
    [[nodiscard]] static std::optional<NormalizedPath> normalize(std::string_view path);

    /// True if @p candidate names an entry strictly below @p base.
    [[nodiscard]] static bool isWithin(const NormalizedPath& base,
                                       const NormalizedPath& candidate) noexcept;

    /// Extension of a file name including the dot, or empty.
    /// A leading dot alone (".db", ".profile") is not an extension.
    [[nodiscard]] static std::string_view extensionOf(std::string_view fileName) noexcept;

private:
    [[nodiscard]] static bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;
};

} // namespace bkg::security
