#pragma once

#include <verspec/result.hpp>
#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Some C libraries define these as function-like macros.
#ifdef major
#undef major
#endif
#ifdef minor
#undef minor
#endif

namespace verspec {

// Strict: exactly major.minor.patch[-label], no interior whitespace.
// Loose:  major.minor[.build[.revision]][-label], whitespace allowed around dots.
enum class ParseMode { Strict, Loose };

// Four-part version (major.minor.patch.revision) with an optional
// pre-release label. Missing components are normalized to 0; the label
// keeps its case but compares case-insensitively.
class Version {
public:
    Version();
    Version(std::uint32_t major, std::uint32_t minor, std::uint32_t patch,
            std::string label = "");
    Version(std::uint32_t major, std::uint32_t minor, std::uint32_t build,
            std::uint32_t revision, std::string label = "");

    // Never fails loudly: malformed, empty or null text gives nullopt.
    static std::optional<Version> try_parse(const std::string& s,
                                            ParseMode mode = ParseMode::Loose);
    static std::optional<Version> try_parse(const char* s,
                                            ParseMode mode = ParseMode::Loose);

    // NullInput for null/empty text, Format for anything the grammar rejects.
    static Result<Version> parse(const std::string& s,
                                 ParseMode mode = ParseMode::Loose);
    static Result<Version> parse(const char* s,
                                 ParseMode mode = ParseMode::Loose);

    std::uint32_t major() const { return major_; }
    std::uint32_t minor() const { return minor_; }
    std::uint32_t patch() const { return patch_; }
    std::uint32_t build() const { return patch_; }
    std::uint32_t revision() const { return revision_; }
    const std::string& pre_release() const { return label_; }
    bool is_prerelease() const { return !label_.empty(); }

    // Text the version was parsed from, trimmed and without whitespace.
    const std::string& to_string() const { return text_; }

    // -1, 0 or 1. Numbers first; then release > pre-release; then labels
    // ordinal and case-insensitive.
    int compare(const Version& o) const;

    // Comparison against an arbitrary value: an empty any (or an empty
    // optional<Version>) orders below this version, anything that is not a
    // Version is a TypeMismatch.
    Result<int> compare_to(const std::any& other) const;

    std::size_t hash() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;

private:
    // Matches trimmed, non-empty text against the grammar for `mode`.
    static Result<Version> scan(const std::string& text, ParseMode mode);

    std::uint32_t major_ = 0;
    std::uint32_t minor_ = 0;
    std::uint32_t patch_ = 0;
    std::uint32_t revision_ = 0;
    std::string label_;
    std::string text_;
};

// Null-aware ordering over optional versions: an empty optional is less
// than any version and equal to another empty optional.
int compare(const std::optional<Version>& a, const std::optional<Version>& b);
bool equals(const std::optional<Version>& a, const std::optional<Version>& b);

// Relational checks that reject an empty left operand with InvalidArg.
// The *_equal forms answer true for two empty operands before checking.
Result<bool> checked_less(const std::optional<Version>& lhs,
                          const std::optional<Version>& rhs);
Result<bool> checked_less_equal(const std::optional<Version>& lhs,
                                const std::optional<Version>& rhs);
Result<bool> checked_greater(const std::optional<Version>& lhs,
                             const std::optional<Version>& rhs);
Result<bool> checked_greater_equal(const std::optional<Version>& lhs,
                                   const std::optional<Version>& rhs);

} // namespace verspec

namespace std {
template<>
struct hash<verspec::Version> {
    size_t operator()(const verspec::Version& v) const { return v.hash(); }
};
} // namespace std
