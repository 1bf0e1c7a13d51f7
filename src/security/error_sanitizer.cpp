/// @file error_sanitizer.cpp
/// @brief ErrorSanitizer rule table and classification.

#include "bkg/security/error_sanitizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <new>
#include <utility>

#include "bkg/security/message_codes.hpp"

namespace bkg::security {

namespace {

// Specific leak signatures come before the keyword sweep, which comes before
// the lock and I/O phrases. Reordering changes results.
constexpr std::array<SanitizeRule, 11> kRules = {{
    {MatchKind::Phrase, "UNIQUE constraint", codes::kUniqueConstraint},
    {MatchKind::Phrase, "FOREIGN KEY constraint", codes::kForeignKeyConstraint},
    {MatchKind::Phrase, "NOT NULL constraint", codes::kNotNullConstraint},
    {MatchKind::Phrase, "CHECK constraint", codes::kCheckConstraint},
    {MatchKind::Phrase, "no such table", codes::kSchemaError},
    {MatchKind::Phrase, "no such column", codes::kSchemaError},
    {MatchKind::Phrase, "syntax error", codes::kSystemError},
    {MatchKind::SqlKeyword, {}, codes::kGenericDbError},
    {MatchKind::Phrase, "database is locked", codes::kDatabaseLocked},
    {MatchKind::Phrase, "disk I/O error", codes::kDiskIOError},
    {MatchKind::Phrase, "database disk image is malformed", codes::kDatabaseCorrupted},
}};

constexpr std::array<std::string_view, 10> kSqlKeywords = {
    "SELECT", "INSERT", "UPDATE", "DELETE", "CREATE",
    "ALTER", "DROP", "TABLE", "COLUMN", "INDEX"
};

bool isWordChar(char c) noexcept {
    auto uc = static_cast<unsigned char>(c);
    return uc < 0x80 && (std::isalnum(uc) || c == '_');
}

char upper(char c) noexcept {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

} // namespace

std::string ErrorSanitizer::sanitize(const std::exception& error) noexcept {
    return classifyMessage(error.what());
}

std::string ErrorSanitizer::sanitize(const foundation::GuardError& error) noexcept {
    return classifyMessage(error.message());
}

std::string ErrorSanitizer::sanitize(std::exception_ptr error) noexcept {
    return inspect(std::move(error)).sanitized;
}

SanitizedError ErrorSanitizer::inspect(std::exception_ptr error) noexcept {
    try {
        if (!error) {
            return {"null exception", std::string(codes::kUnexpected)};
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return classified(e.what());
        } catch (const foundation::GuardError& e) {
            return classified(std::string(e.message()));
        } catch (const std::string& s) {
            return plain(s);
        } catch (const char* s) {
            return plain(sanitize(s));
        } catch (bool v) {
            return plain(sanitize(v));
        } catch (int v) {
            return plain(sanitize(v));
        } catch (long v) {
            return plain(sanitize(v));
        } catch (long long v) {
            return plain(sanitize(v));
        } catch (unsigned v) {
            return plain(sanitize(v));
        } catch (unsigned long v) {
            return plain(sanitize(v));
        } catch (unsigned long long v) {
            return plain(sanitize(v));
        } catch (double v) {
            return plain(sanitize(v));
        } catch (...) {
            // Unknown payload type: nothing about it is safe to show.
            return {"unrecognized exception type", std::string(codes::kUnexpected)};
        }
    } catch (const std::bad_alloc&) {
        return {};
    }
}

std::string ErrorSanitizer::sanitize(std::string_view value) noexcept {
    try {
        return std::string(value);
    } catch (const std::bad_alloc&) {
        return {};
    }
}

std::string ErrorSanitizer::sanitize(const char* value) noexcept {
    return value != nullptr ? sanitize(std::string_view(value)) : sanitize(std::string_view("null"));
}

std::string ErrorSanitizer::classifyMessage(std::string_view message) noexcept {
    try {
        if (auto code = matchRule(message)) {
            return std::string(*code);
        }
        if (looksStructured(message)) {
            return std::string(codes::kUnexpected);
        }
        return std::string(message);
    } catch (const std::bad_alloc&) {
        return {};
    }
}

SanitizedError ErrorSanitizer::classified(std::string original) {
    auto sanitized = classifyMessage(original);
    return {std::move(original), std::move(sanitized)};
}

SanitizedError ErrorSanitizer::plain(std::string text) {
    auto copy = text;
    return {std::move(copy), std::move(text)};
}

std::optional<std::string_view> ErrorSanitizer::matchRule(std::string_view message) noexcept {
    for (const auto& rule : kRules) {
        bool hit = rule.kind == MatchKind::SqlKeyword
                       ? containsSqlKeyword(message)
                       : containsIgnoreCase(message, rule.pattern);
        if (hit) {
            return rule.code;
        }
    }
    return std::nullopt;
}

std::span<const SanitizeRule> ErrorSanitizer::rules() noexcept {
    return kRules;
}

bool ErrorSanitizer::looksStructured(std::string_view message) noexcept {
    if (codePointLength(message) >= kMaxSafeMessageLength) {
        return true;
    }
    return message.find_first_of("{}[]()") != std::string_view::npos;
}

std::size_t ErrorSanitizer::codePointLength(std::string_view text) noexcept {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

bool ErrorSanitizer::containsIgnoreCase(std::string_view haystack,
                                        std::string_view needle) noexcept {
    if (needle.empty()) {
        return false;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return upper(a) == upper(b); });
    return it != haystack.end();
}

bool ErrorSanitizer::containsSqlKeyword(std::string_view message) noexcept {
    std::size_t pos = 0;
    while (pos < message.size()) {
        if (!isWordChar(message[pos])) {
            ++pos;
            continue;
        }
        auto end = pos;
        while (end < message.size() && isWordChar(message[end])) {
            ++end;
        }
        auto word = message.substr(pos, end - pos);
        pos = end;

        for (auto keyword : kSqlKeywords) {
            if (word.size() == keyword.size() &&
                std::equal(word.begin(), word.end(), keyword.begin(),
                           [](char a, char b) { return upper(a) == b; })) {
                return true;
            }
        }
    }
    return false;
}

} // namespace bkg::security
