/**
 * @file topic.hpp
 * @brief MQTT topics, topic filters and the wildcard matcher.
 *
 *   * **TopicType**   – a concrete topic split into its `/` levels.
 *   * **TopicFilter** – a validated subscription pattern whose segments
 *     are literals, `+` (exactly one level) or a trailing `#` (all
 *     remaining levels, including none).  A `{name}` level is a named
 *     `+` whose value is captured into PathParameters.
 *   * **matches**     – the pure segment‑by‑segment matcher.
 *
 * Topics whose first level starts with `$` are reserved for broker
 * internals and are only matched by filters that spell out that first
 * level literally.
 */

#pragma once

#include "errors.hpp"

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mqroute {

inline constexpr char topic_separator = '/';
inline constexpr char single_level_wildcard = '+';
inline constexpr char multi_level_wildcard = '#';
inline constexpr char system_topic_prefix = '$';
inline constexpr std::string_view wildcard_parameter_name = "wildcard";

namespace detail {
inline std::vector<std::string> split_levels(std::string_view text) {
    std::vector<std::string> levels;
    std::size_t begin = 0;
    while (true) {
        auto end = text.find(topic_separator, begin);
        if (end == std::string_view::npos) {
            levels.emplace_back(text.substr(begin));
            break;
        }
        levels.emplace_back(text.substr(begin, end - begin));
        begin = end + 1;
    }
    return levels;
}

inline bool is_parameter_name(std::string_view name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}
} // namespace detail

// ==========================================================================
// TopicType – concrete topic
// ==========================================================================

/**
 * @brief A concrete (wildcard‑free) topic such as {"sensors", "7", "temp"}.
 *
 * Inherits from `std::vector<std::string>` so the usual container
 * operations work as expected; @ref to_string rebuilds the canonical
 * `/`‑joined form.
 */
class TopicType : public std::vector<std::string> {
  public:
    using std::vector<std::string>::vector; ///< Inherit all base ctors.

    /**
     * @brief Split and validate a topic string.
     * @throws InvalidTopicError on an empty string, a wildcard character
     *         or an embedded NUL.
     */
    static TopicType parse(std::string_view topic) {
        if (topic.empty()) {
            throw InvalidTopicError("topic must not be empty");
        }
        if (topic.find_first_of(std::string_view("+#\0", 3)) !=
            std::string_view::npos) {
            throw InvalidTopicError("topic \"" + std::string(topic) +
                                    "\" must not contain wildcards or NUL");
        }
        auto levels = detail::split_levels(topic);
        return TopicType(levels.begin(), levels.end());
    }

    /// @return `true` for `$SYS/...`‑style broker topics.
    bool is_system() const {
        return !empty() && !front().empty() &&
               front().front() == system_topic_prefix;
    }

    /// @return Topic as `/`‑separated string.
    std::string to_string() const {
        std::string result;
        for (const auto& str : *this) {
            result += str;
            result += topic_separator;
        }
        if (!result.empty()) {
            result.pop_back(); // Remove the trailing separator
        }
        return result;
    }
};

// ==========================================================================
// PathParameters – named captures of one delivery
// ==========================================================================

/**
 * @brief Values captured from a concrete topic by a filter's `{name}`
 *        levels, plus the levels matched by a trailing `#`.
 */
class PathParameters {
  private:
    std::vector<std::pair<std::string, std::string>> m_values;
    std::string m_wildcard;
    bool m_has_wildcard = false;

  public:
    void add(std::string name, std::string value) {
        m_values.emplace_back(std::move(name), std::move(value));
    }

    void set_wildcard(std::string remainder) {
        m_wildcard = std::move(remainder);
        m_has_wildcard = true;
    }

    /// @return The captured value, or `nullptr` for an unknown name.
    const std::string* find(std::string_view name) const {
        for (const auto& [key, value] : m_values) {
            if (key == name) {
                return &value;
            }
        }
        return nullptr;
    }

    /// @throws Error if the filter declared no parameter @p name.
    const std::string& at(std::string_view name) const {
        if (const auto* value = find(name)) {
            return *value;
        }
        throw Error("no path parameter named \"" + std::string(name) + "\"");
    }

    /// Levels matched by `#`, `/`‑joined; empty when it matched none.
    const std::string& wildcard() const { return m_wildcard; }
    bool has_wildcard() const { return m_has_wildcard; }

    std::size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty() && !m_has_wildcard; }

    auto begin() const { return m_values.begin(); }
    auto end() const { return m_values.end(); }
};

// ==========================================================================
// TopicFilter – subscription pattern
// ==========================================================================

struct SingleLevelWildcard {
    bool operator==(const SingleLevelWildcard&) const = default;
};
struct MultiLevelWildcard {
    bool operator==(const MultiLevelWildcard&) const = default;
};

/// One filter level: a literal, `+` or `#`.
using FilterSegment =
    std::variant<std::string, SingleLevelWildcard, MultiLevelWildcard>;

/**
 * @brief Immutable, validated topic filter.
 *
 * Invariant: a multi‑level wildcard, if present, is the last segment.
 *
 * A level written as `{name}` is subscribed and matched as `+`; the
 * level it matches is captured under `name`.  Two filters differing
 * only in parameter names are equal.
 */
class TopicFilter {
  private:
    std::string m_text;    ///< As subscribed, `{name}` replaced by `+`.
    std::string m_pattern; ///< As written.
    std::vector<FilterSegment> m_segments;
    std::vector<std::pair<std::size_t, std::string>> m_parameters;

    void add_parameter(std::size_t level, std::string name) {
        if (!detail::is_parameter_name(name)) {
            throw InvalidTopicError("malformed path parameter \"{" + name +
                                    "}\" in filter \"" + m_pattern + "\"");
        }
        if (name == wildcard_parameter_name) {
            throw InvalidTopicError("path parameter name \"" + name +
                                    "\" is reserved in filter \"" +
                                    m_pattern + "\"");
        }
        for (const auto& parameter : m_parameters) {
            if (parameter.second == name) {
                throw InvalidTopicError("duplicate path parameter \"" +
                                        name + "\" in filter \"" +
                                        m_pattern + "\"");
            }
        }
        m_parameters.emplace_back(level, std::move(name));
    }

  public:
    /**
     * @throws InvalidTopicError when @p filter is empty, contains NUL,
     *         places a wildcard anywhere but a whole level (`#` only
     *         as the final level), or has a malformed, duplicate or
     *         reserved `{name}` level.
     */
    explicit TopicFilter(std::string_view filter) : m_pattern(filter) {
        if (filter.empty()) {
            throw InvalidTopicError("topic filter must not be empty");
        }
        if (filter.find('\0') != std::string_view::npos) {
            throw InvalidTopicError("topic filter must not contain NUL");
        }

        auto levels = detail::split_levels(filter);
        m_segments.reserve(levels.size());
        for (std::size_t i = 0; i < levels.size(); ++i) {
            auto& level = levels[i];
            if (level.find(multi_level_wildcard) != std::string::npos) {
                if (level.size() != 1 || i + 1 != levels.size()) {
                    throw InvalidTopicError(
                        "multi-level wildcard must be the entire last "
                        "level in filter \"" +
                        m_pattern + "\"");
                }
                m_segments.emplace_back(MultiLevelWildcard{});
            } else if (level.find(single_level_wildcard) !=
                       std::string::npos) {
                if (level.size() != 1) {
                    throw InvalidTopicError(
                        "single-level wildcard must occupy an entire "
                        "level in filter \"" +
                        m_pattern + "\"");
                }
                m_segments.emplace_back(SingleLevelWildcard{});
            } else if (level.find_first_of("{}") != std::string::npos) {
                if (level.size() < 2 || level.front() != '{' ||
                    level.back() != '}') {
                    throw InvalidTopicError(
                        "path parameter must occupy an entire level in "
                        "filter \"" +
                        m_pattern + "\"");
                }
                add_parameter(i, level.substr(1, level.size() - 2));
                level = std::string(1, single_level_wildcard);
                m_segments.emplace_back(SingleLevelWildcard{});
            } else {
                m_segments.emplace_back(level);
            }
            if (i > 0) {
                m_text += topic_separator;
            }
            m_text += level;
        }
    }

    const std::string& to_string() const { return m_text; }
    const std::string& pattern() const { return m_pattern; }
    const std::vector<FilterSegment>& segments() const { return m_segments; }

    /// @return `true` if the filter contains `+` or `#`.
    bool has_wildcards() const {
        for (const auto& segment : m_segments) {
            if (!std::holds_alternative<std::string>(segment)) {
                return true;
            }
        }
        return false;
    }

    /// (level index, name) of every `{name}` level.
    const std::vector<std::pair<std::size_t, std::string>>&
    parameters() const {
        return m_parameters;
    }

    /**
     * @brief Collect the `{name}` levels and the `#` remainder of @p topic.
     * @pre `matches(*this, topic)`.
     */
    PathParameters capture(const TopicType& topic) const {
        PathParameters captured;
        for (const auto& [level, name] : m_parameters) {
            captured.add(name, topic.at(level));
        }
        if (!m_segments.empty() &&
            std::holds_alternative<MultiLevelWildcard>(m_segments.back())) {
            const auto first = m_segments.size() - 1;
            std::string remainder;
            for (auto i = first; i < topic.size(); ++i) {
                if (i > first) {
                    remainder += topic_separator;
                }
                remainder += topic[i];
            }
            captured.set_wildcard(std::move(remainder));
        }
        return captured;
    }

    bool operator==(const TopicFilter& other) const {
        return m_text == other.m_text;
    }
};

// ==========================================================================
// Matcher
// ==========================================================================

/**
 * @brief Decide whether @p topic is selected by @p filter.
 *
 * Pure function; case‑sensitive, no normalisation of levels.
 */
inline bool matches(const TopicFilter& filter, const TopicType& topic) {
    const auto& segments = filter.segments();

    if (topic.is_system() && !segments.empty() &&
        !std::holds_alternative<std::string>(segments.front())) {
        return false;
    }

    std::size_t index = 0;
    for (; index < segments.size(); ++index) {
        const auto& segment = segments[index];
        if (std::holds_alternative<MultiLevelWildcard>(segment)) {
            return true; // Matches the rest, including nothing.
        }
        if (index >= topic.size()) {
            return false;
        }
        if (const auto* literal = std::get_if<std::string>(&segment)) {
            if (*literal != topic[index]) {
                return false;
            }
        }
    }
    return index == topic.size();
}

/// Convenience overload parsing both strings.
inline bool matches(std::string_view filter, std::string_view topic) {
    return matches(TopicFilter(filter), TopicType::parse(topic));
}

} // namespace mqroute
