#include <verspec/version.hpp>
#include <verspec/log.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <initializer_list>
#include <vector>

namespace verspec {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

char fold(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && is_space(in[start])) ++start;
    size_t end = in.size();
    while (end > start && is_space(in[end - 1])) --end;
    return in.substr(start, end - start);
}

std::string strip_whitespace(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        if (!is_space(c)) out += c;
    }
    return out;
}

// Ordinal comparison of upper-cased characters.
int compare_labels(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        auto ca = static_cast<unsigned char>(fold(a[i]));
        auto cb = static_cast<unsigned char>(fold(b[i]));
        if (ca != cb) return ca < cb ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

std::string dotted(std::initializer_list<std::uint32_t> parts, const std::string& label) {
    std::string s;
    for (std::uint32_t p : parts) {
        if (!s.empty()) s += '.';
        s += std::to_string(p);
    }
    if (!label.empty()) {
        s += "-" + label;
    }
    return s;
}

VerspecError reject(const std::string& text, const std::string& reason) {
    log::debug("rejected version '%s': %s", text.c_str(), reason.c_str());
    return VerspecError::bad_format(text, "version string", reason);
}

// Numeric components of a four-part version: each must fit in a
// non-negative 32-bit signed integer. Leading zeros are accepted.
bool to_component(const std::string& digits, std::uint32_t& out) {
    size_t i = 0;
    while (i + 1 < digits.size() && digits[i] == '0') ++i;
    if (digits.size() - i > 10) return false;
    unsigned long long v = 0;
    for (; i < digits.size(); ++i) {
        v = v * 10 + static_cast<unsigned>(digits[i] - '0');
    }
    if (v > static_cast<unsigned long long>(INT_MAX)) return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Version::Version() : text_("0.0.0") {}

Version::Version(std::uint32_t major, std::uint32_t minor, std::uint32_t patch,
                 std::string label)
    : major_(major), minor_(minor), patch_(patch), label_(std::move(label)) {
    text_ = dotted({major_, minor_, patch_}, label_);
}

Version::Version(std::uint32_t major, std::uint32_t minor, std::uint32_t build,
                 std::uint32_t revision, std::string label)
    : major_(major), minor_(minor), patch_(build), revision_(revision),
      label_(std::move(label)) {
    text_ = dotted({major_, minor_, patch_, revision_}, label_);
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

Result<Version> Version::scan(const std::string& text, ParseMode mode) {
    const bool strict = mode == ParseMode::Strict;
    const size_t max_parts = strict ? 3 : 4;
    const size_t n = text.size();
    size_t pos = 0;

    auto skip_space = [&]() {
        if (strict) return;
        while (pos < n && is_space(text[pos])) ++pos;
    };
    auto read_digits = [&]() {
        size_t start = pos;
        while (pos < n && is_digit(text[pos])) ++pos;
        return text.substr(start, pos - start);
    };

    std::vector<std::string> parts;
    std::string digits = read_digits();
    if (digits.empty()) {
        return reject(text, "a version must start with a number");
    }
    parts.push_back(digits);

    while (parts.size() < max_parts) {
        size_t save = pos;
        skip_space();
        if (pos >= n || text[pos] != '.') {
            pos = save;
            break;
        }
        ++pos;
        skip_space();
        digits = read_digits();
        if (digits.empty()) {
            return reject(text, "expected a number after '.'");
        }
        parts.push_back(digits);
    }

    if (strict && parts.size() != 3) {
        return reject(text, "expected format: major.minor.patch[-label]");
    }

    std::string label;
    if (pos < n) {
        if (text[pos] != '-') {
            return reject(text, strict
                ? "expected format: major.minor.patch[-label]"
                : "expected format: major.minor[.build[.revision]][-label]");
        }
        ++pos;
        if (pos >= n || !is_alpha(text[pos])) {
            return reject(text, "pre-release label must start with a letter");
        }
        size_t start = pos;
        while (pos < n && (is_alpha(text[pos]) || is_digit(text[pos]) ||
                           text[pos] == '-')) {
            ++pos;
        }
        if (pos != n) {
            return reject(text, "pre-release label may only contain letters, digits and '-'");
        }
        label = text.substr(start);
    }

    if (parts.size() < 2) {
        return reject(text, "at least major.minor is required");
    }

    std::uint32_t nums[4] = {0, 0, 0, 0};
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!to_component(parts[i], nums[i])) {
            return reject(text, "version component '" + parts[i] + "' is out of range");
        }
    }

    Version v(nums[0], nums[1], nums[2], nums[3], std::move(label));
    v.text_ = strip_whitespace(text);
    return Result<Version>::ok(std::move(v));
}

std::optional<Version> Version::try_parse(const std::string& s, ParseMode mode) {
    std::string text = trim(s);
    if (text.empty()) return std::nullopt;
    return scan(text, mode).to_optional();
}

std::optional<Version> Version::try_parse(const char* s, ParseMode mode) {
    if (s == nullptr) return std::nullopt;
    return try_parse(std::string(s), mode);
}

Result<Version> Version::parse(const std::string& s, ParseMode mode) {
    if (s.empty()) {
        return VerspecError{VerspecError::NullInput, "empty version string"};
    }
    std::string text = trim(s);
    if (text.empty()) {
        return VerspecError::bad_format(s, "version string", "the version string is blank");
    }
    return scan(text, mode);
}

Result<Version> Version::parse(const char* s, ParseMode mode) {
    if (s == nullptr) {
        return VerspecError{VerspecError::NullInput, "null version string"};
    }
    return parse(std::string(s), mode);
}

// ---------------------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------------------

int Version::compare(const Version& o) const {
    const std::uint32_t lhs[] = {major_, minor_, patch_, revision_};
    const std::uint32_t rhs[] = {o.major_, o.minor_, o.patch_, o.revision_};
    for (int i = 0; i < 4; ++i) {
        if (lhs[i] != rhs[i]) return lhs[i] < rhs[i] ? -1 : 1;
    }

    // A release sorts after any pre-release of the same numbers
    bool release = label_.empty();
    bool other_release = o.label_.empty();
    if (release && other_release) return 0;
    if (release) return 1;
    if (other_release) return -1;
    return compare_labels(label_, o.label_);
}

Result<int> Version::compare_to(const std::any& other) const {
    if (!other.has_value()) {
        return Result<int>::ok(1);
    }
    if (const auto* v = std::any_cast<Version>(&other)) {
        return Result<int>::ok(compare(*v));
    }
    if (const auto* opt = std::any_cast<std::optional<Version>>(&other)) {
        return Result<int>::ok(opt->has_value() ? compare(**opt) : 1);
    }
    return VerspecError{VerspecError::TypeMismatch,
        "cannot compare version '" + text_ + "' with a value of type " +
        other.type().name(),
        "only verspec::Version values are comparable"};
}

std::size_t Version::hash() const {
    std::hash<std::uint32_t> hn;
    std::size_t h = hn(major_);
    h = h * 31 + hn(minor_);
    h = h * 31 + hn(patch_);
    h = h * 31 + hn(revision_);

    // Fold case so equal versions hash identically
    std::string folded;
    folded.reserve(label_.size());
    for (char c : label_) folded += fold(c);
    return h * 4567 + std::hash<std::string>{}(folded);
}

bool Version::operator==(const Version& o) const { return compare(o) == 0; }
bool Version::operator!=(const Version& o) const { return !(*this == o); }
bool Version::operator<(const Version& o) const { return compare(o) < 0; }
bool Version::operator<=(const Version& o) const { return compare(o) <= 0; }
bool Version::operator>(const Version& o) const { return compare(o) > 0; }
bool Version::operator>=(const Version& o) const { return compare(o) >= 0; }

// ---------------------------------------------------------------------------
// Optional versions
// ---------------------------------------------------------------------------

int compare(const std::optional<Version>& a, const std::optional<Version>& b) {
    if (!a.has_value()) return b.has_value() ? -1 : 0;
    if (!b.has_value()) return 1;
    return a->compare(*b);
}

bool equals(const std::optional<Version>& a, const std::optional<Version>& b) {
    return compare(a, b) == 0;
}

namespace {

VerspecError null_left_operand(const char* op) {
    return VerspecError{VerspecError::InvalidArg,
        std::string("left operand of '") + op + "' is null"};
}

} // namespace

Result<bool> checked_less(const std::optional<Version>& lhs,
                          const std::optional<Version>& rhs) {
    if (!lhs.has_value()) return null_left_operand("<");
    return Result<bool>::ok(compare(lhs, rhs) < 0);
}

Result<bool> checked_less_equal(const std::optional<Version>& lhs,
                                const std::optional<Version>& rhs) {
    if (equals(lhs, rhs)) return Result<bool>::ok(true);
    if (!lhs.has_value()) return null_left_operand("<=");
    return checked_less(lhs, rhs);
}

Result<bool> checked_greater(const std::optional<Version>& lhs,
                             const std::optional<Version>& rhs) {
    if (!lhs.has_value()) return null_left_operand(">");
    return Result<bool>::ok(compare(lhs, rhs) > 0);
}

Result<bool> checked_greater_equal(const std::optional<Version>& lhs,
                                   const std::optional<Version>& rhs) {
    if (equals(lhs, rhs)) return Result<bool>::ok(true);
    if (!lhs.has_value()) return null_left_operand(">=");
    return checked_greater(lhs, rhs);
}

} // namespace verspec
