#pragma once

#include <verspec/result.hpp>
#include <verspec/version.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace verspec {

// Interval of versions with independently inclusive/exclusive bounds.
// An absent bound leaves that side unconstrained; its inclusive flag is
// kept but has no effect.
//
// Bracket notation, used for parsing and to_bracket_string():
//   1.0          at least 1.0
//   [1.0]        exactly 1.0
//   (1.0, 2.0]   1.0 < v <= 2.0
//   [1.0, )      1.0 <= v
//   (, 2.0)      v < 2.0
class VersionRange {
public:
    // No bounds: every version satisfies it.
    VersionRange() = default;
    VersionRange(std::optional<Version> min, bool min_inclusive,
                 std::optional<Version> max, bool max_inclusive);

    // [v]
    static VersionRange exact(const Version& v);
    // v <= x, no upper bound (what a bare version string means)
    static VersionRange at_least(const Version& v);

    static std::optional<VersionRange> try_parse(const std::string& s);
    static std::optional<VersionRange> try_parse(const char* s);
    static Result<VersionRange> parse(const std::string& s);
    static Result<VersionRange> parse(const char* s);

    const std::optional<Version>& min() const { return min_; }
    bool is_min_inclusive() const { return min_inclusive_; }
    const std::optional<Version>& max() const { return max_; }
    bool is_max_inclusive() const { return max_inclusive_; }

    bool satisfies(const Version& v) const;

    // Membership test over any type a version can be pulled out of.
    template<typename T, typename F>
    std::function<bool(const T&)> to_predicate(F extractor) const {
        VersionRange range = *this;
        return [range, extractor](const T& item) {
            return range.satisfies(extractor(item));
        };
    }

    template<typename T, typename F>
    std::vector<T> filter(const std::vector<T>& items, F extractor) const {
        auto pred = to_predicate<T>(extractor);
        std::vector<T> out;
        for (const auto& item : items) {
            if (pred(item)) out.push_back(item);
        }
        return out;
    }

    std::string to_bracket_string() const;

    // Human-readable form: "(≥ 1.0)", "(= 1.0)", "(> 1.0 && ≤ 2.0)".
    std::string to_math_string() const;

    bool operator==(const VersionRange& o) const;
    bool operator!=(const VersionRange& o) const;

private:
    static Result<VersionRange> parse_interval(const std::string& text);

    bool is_exact() const;
    bool is_at_least() const;

    std::optional<Version> min_;
    bool min_inclusive_ = false;
    std::optional<Version> max_;
    bool max_inclusive_ = false;
};

} // namespace verspec
