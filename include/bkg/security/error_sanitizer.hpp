#pragma once

/// @file error_sanitizer.hpp
/// @brief Maps caught errors to safe, translatable message keys.
///
/// Low-level database errors carry schema names, SQL fragments and engine
/// state. Anything that reaches an end user passes through ErrorSanitizer
/// first: known leak signatures become stable codes from message_codes.hpp,
/// anything else that looks structured becomes "error.unexpected", and only
/// short plain text is returned verbatim.

#include <cstddef>
#include <cstdint>
#include <exception>
#include <new>
#include <optional>
#include <sstream>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "bkg/foundation/guard_error.hpp"

namespace bkg::security {

/// How a rule inspects a message.
enum class MatchKind : uint8_t {
    Phrase,     ///< Case-insensitive substring.
    SqlKeyword  ///< Any SQL statement keyword as a whole word.
};

/// One entry of the ordered classification table.
struct SanitizeRule {
    MatchKind kind;
    std::string_view pattern;
    std::string_view code;
};

/// An error's own text next to the text that is safe to show for it.
/// The original is for the log only.
struct SanitizedError {
    std::string original;
    std::string sanitized;
};

/// Stateless error-to-code translation. Thread-safe; never throws.
/// If memory runs out the result is an empty string.
///
/// Structured errors (std::exception, GuardError) are classified by message.
/// Values that are not errors are returned as their plain text.
///
/// Example:
/// @code
///   try {
///       repo.insert(company);
///   } catch (const std::exception& e) {
///       reply.error = ErrorSanitizer::sanitize(e);  // "error.db.uniqueConstraint"
///   }
/// @endcode
class ErrorSanitizer {
public:
    /// Messages of this many code points or more are never passed through.
    static constexpr std::size_t kMaxSafeMessageLength = 200;

    [[nodiscard]] static std::string sanitize(const std::exception& error) noexcept;

    [[nodiscard]] static std::string sanitize(const foundation::GuardError& error) noexcept;

    /// Rethrow and classify. Thrown strings and arithmetic values are treated
    /// as plain values; other non-std types and a null pointer map to
    /// "error.unexpected".
    [[nodiscard]] static std::string sanitize(std::exception_ptr error) noexcept;

    /// Same classification as sanitize(std::exception_ptr), keeping the
    /// original text alongside. Unknown payload types are described as
    /// "unrecognized exception type", a null pointer as "null exception".
    [[nodiscard]] static SanitizedError inspect(std::exception_ptr error) noexcept;

    /// A bare string is not an error and passes through unchanged.
    [[nodiscard]] static std::string sanitize(std::string_view value) noexcept;

    [[nodiscard]] static std::string sanitize(const char* value) noexcept;

    /// Arithmetic values render as decimal text; bool as "true"/"false".
    template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
    [[nodiscard]] static std::string sanitize(T value) noexcept {
        try {
            if constexpr (std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr (std::is_integral_v<T>) {
                return std::to_string(value);
            } else {
                std::ostringstream oss;
                oss << value;
                return oss.str();
            }
        } catch (const std::bad_alloc&) {
            return {};
        }
    }

    /// Apply the rule table and the fallback policy to a message.
    [[nodiscard]] static std::string classifyMessage(std::string_view message) noexcept;

    /// Code of the first rule matching @p message, if any.
    [[nodiscard]] static std::optional<std::string_view> matchRule(std::string_view message) noexcept;

    /// The ordered rule table. First match wins.
    [[nodiscard]] static std::span<const SanitizeRule> rules() noexcept;

    /// True if the message is too long or carries bracket punctuation.
    [[nodiscard]] static bool looksStructured(std::string_view message) noexcept;

    /// Length in UTF-8 code points.
    [[nodiscard]] static std::size_t codePointLength(std::string_view text) noexcept;

private:
    [[nodiscard]] static SanitizedError classified(std::string original);
    [[nodiscard]] static SanitizedError plain(std::string text);
    [[nodiscard]] static bool containsIgnoreCase(std::string_view haystack,
                                                 std::string_view needle) noexcept;
    [[nodiscard]] static bool containsSqlKeyword(std::string_view message) noexcept;
};

} // namespace bkg::security
