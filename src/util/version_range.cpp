#include <verspec/version_range.hpp>
#include <verspec/log.hpp>
#include <algorithm>
#include <cctype>

namespace verspec {

// UTF-8 encodings of U+2265 and U+2264
static const char* const GREATER_OR_EQUAL = "\xE2\x89\xA5";
static const char* const LESS_OR_EQUAL = "\xE2\x89\xA4";

static std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Split on every occurrence of `delim`, keeping empty pieces
static std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

static VerspecError reject(const std::string& text, const std::string& reason) {
    log::debug("rejected version range '%s': %s", text.c_str(), reason.c_str());
    return VerspecError::bad_format(text, "version range", reason);
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

VersionRange::VersionRange(std::optional<Version> min, bool min_inclusive,
                           std::optional<Version> max, bool max_inclusive)
    : min_(std::move(min)), min_inclusive_(min_inclusive),
      max_(std::move(max)), max_inclusive_(max_inclusive) {}

VersionRange VersionRange::exact(const Version& v) {
    return VersionRange(v, true, v, true);
}

VersionRange VersionRange::at_least(const Version& v) {
    return VersionRange(v, true, std::nullopt, false);
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

Result<VersionRange> VersionRange::parse_interval(const std::string& text) {
    // A bare version means "this version or newer"
    if (auto v = Version::try_parse(text)) {
        return Result<VersionRange>::ok(at_least(*v));
    }

    if (text.size() < 3) {
        return reject(text, "expected a version or an interval such as [1.0, 2.0)");
    }

    VersionRange range;
    char open = text.front();
    char close = text.back();
    if (open == '[') {
        range.min_inclusive_ = true;
    } else if (open != '(') {
        return reject(text, "an interval must start with '[' or '('");
    }
    if (close == ']') {
        range.max_inclusive_ = true;
    } else if (close != ')') {
        return reject(text, "an interval must end with ']' or ')'");
    }

    auto parts = split(text.substr(1, text.size() - 2), ',');
    if (parts.size() > 2) {
        return reject(text, "an interval has at most two bounds");
    }
    bool all_blank = std::all_of(parts.begin(), parts.end(),
        [](const std::string& p) { return trim(p).empty(); });
    if (all_blank) {
        return reject(text, "an interval must specify at least one bound");
    }

    // "[1.0]" and "(1.0)" use the single version for both bounds
    const std::string& min_str = parts[0];
    const std::string& max_str = parts.size() == 2 ? parts[1] : parts[0];

    if (!trim(min_str).empty()) {
        auto v = Version::try_parse(min_str);
        if (!v) {
            return reject(text, "invalid lower bound '" + trim(min_str) + "'");
        }
        range.min_ = std::move(*v);
    }
    if (!trim(max_str).empty()) {
        auto v = Version::try_parse(max_str);
        if (!v) {
            return reject(text, "invalid upper bound '" + trim(max_str) + "'");
        }
        range.max_ = std::move(*v);
    }

    return Result<VersionRange>::ok(std::move(range));
}

std::optional<VersionRange> VersionRange::try_parse(const std::string& s) {
    return parse_interval(trim(s)).to_optional();
}

std::optional<VersionRange> VersionRange::try_parse(const char* s) {
    if (s == nullptr) return std::nullopt;
    return try_parse(std::string(s));
}

Result<VersionRange> VersionRange::parse(const std::string& s) {
    if (s.empty()) {
        return VerspecError{VerspecError::NullInput, "empty version range"};
    }
    std::string text = trim(s);
    if (text.empty()) {
        return reject(s, "the version range is blank");
    }
    return parse_interval(text);
}

Result<VersionRange> VersionRange::parse(const char* s) {
    if (s == nullptr) {
        return VerspecError{VerspecError::NullInput, "null version range"};
    }
    return parse(std::string(s));
}

// ---------------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------------

bool VersionRange::satisfies(const Version& v) const {
    bool ok = true;
    if (min_) {
        ok = ok && (min_inclusive_ ? v >= *min_ : v > *min_);
    }
    if (max_) {
        ok = ok && (max_inclusive_ ? v <= *max_ : v < *max_);
    }
    return ok;
}

bool VersionRange::is_exact() const {
    return min_ && max_ && *min_ == *max_ && min_inclusive_ && max_inclusive_;
}

bool VersionRange::is_at_least() const {
    return min_ && min_inclusive_ && !max_ && !max_inclusive_;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string VersionRange::to_bracket_string() const {
    if (is_at_least()) {
        return min_->to_string();
    }
    if (is_exact()) {
        return "[" + min_->to_string() + "]";
    }

    std::string s(1, min_inclusive_ ? '[' : '(');
    if (min_) s += min_->to_string();
    s += ", ";
    if (max_) s += max_->to_string();
    s += max_inclusive_ ? ']' : ')';
    return s;
}

std::string VersionRange::to_math_string() const {
    if (is_at_least()) {
        return std::string("(") + GREATER_OR_EQUAL + " " + min_->to_string() + ")";
    }
    if (is_exact()) {
        return "(= " + min_->to_string() + ")";
    }

    std::string s;
    if (min_) {
        s += min_inclusive_ ? std::string("(") + GREATER_OR_EQUAL + " " : "(> ";
        s += min_->to_string();
    }
    if (max_) {
        s += s.empty() ? "(" : " && ";
        s += max_inclusive_ ? std::string(LESS_OR_EQUAL) + " " : "< ";
        s += max_->to_string();
    }
    if (!s.empty()) {
        s += ")";
    }
    return s;
}

bool VersionRange::operator==(const VersionRange& o) const {
    return equals(min_, o.min_) && min_inclusive_ == o.min_inclusive_ &&
           equals(max_, o.max_) && max_inclusive_ == o.max_inclusive_;
}

bool VersionRange::operator!=(const VersionRange& o) const {
    return !(*this == o);
}

} // namespace verspec
