#pragma once

#include "error.h"

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace route {
    namespace component_type {
        struct literal {
            std::string text;

            auto operator==(const literal&) const -> bool = default;
        };

        struct parameter {
            std::string name;

            auto operator==(const parameter&) const -> bool = default;
        };

        struct wildcard {
            auto operator==(const wildcard&) const -> bool = default;
        };

        /// Matches a segment that starts with 'prefix' and ends with
        /// 'suffix' with at least one character in between.
        struct partial_capture {
            std::string prefix;
            std::string name;
            std::string suffix;

            auto operator==(const partial_capture&) const -> bool = default;
        };

        struct partial_wildcard {
            std::string prefix;
            std::string suffix;

            auto operator==(const partial_wildcard&) const -> bool = default;
        };

        struct catch_all {
            auto operator==(const catch_all&) const -> bool = default;
        };
    }

    using component = std::variant<
        component_type::literal,
        component_type::parameter,
        component_type::wildcard,
        component_type::partial_capture,
        component_type::partial_wildcard,
        component_type::catch_all
    >;

    /// Returns true if 'segment' begins with 'prefix', ends with 'suffix'
    /// and has a non-empty remainder between them.
    auto partial_match(
        std::string_view segment,
        std::string_view prefix,
        std::string_view suffix,
        bool case_insensitive = false
    ) noexcept -> bool;

    /// Classifies a single pattern segment.
    ///
    /// Throws 'build_error' for segments that can never be matched
    /// unambiguously, such as two capture groups in one segment.
    auto parse_component(
        std::string_view pattern,
        std::string_view segment
    ) -> component;

    class pattern {
        std::string text;
        std::vector<component> parts;
    public:
        using const_iterator = std::vector<component>::const_iterator;

        pattern() = default;

        pattern(std::string_view text, char separator = '/');

        auto begin() const noexcept -> const_iterator;

        auto end() const noexcept -> const_iterator;

        auto components() const noexcept -> const std::vector<component>&;

        auto empty() const noexcept -> bool;

        /// True if every component is a literal.
        auto is_literal() const noexcept -> bool;

        auto size() const noexcept -> std::size_t;

        /// The pattern as registered.
        auto str() const noexcept -> std::string_view;
    };

    auto to_string(const component& component) -> std::string;
}

template <>
struct fmt::formatter<route::component> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const route::component& component, FormatContext& ctx) const {
        return formatter<std::string_view>::format(
            route::to_string(component),
            ctx
        );
    }
};

template <>
struct fmt::formatter<route::pattern> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const route::pattern& pattern, FormatContext& ctx) const {
        return formatter<std::string_view>::format(pattern.str(), ctx);
    }
};
