#pragma once

#include "parser.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace route {
    /// Values captured while resolving a path.
    ///
    /// Names refer to strings owned by the trie; values refer to the
    /// resolved path. Neither is copied, so a 'parameters' instance must
    /// not outlive the trie or the path it was produced from.
    class parameters {
        std::unordered_map<std::string_view, std::string_view> values;
        std::vector<std::string_view> tail;
        std::string_view tail_path;
        bool catch_all_matched = false;
    public:
        using const_iterator = std::unordered_map<
            std::string_view,
            std::string_view
        >::const_iterator;

        auto begin() const noexcept -> const_iterator;

        auto end() const noexcept -> const_iterator;

        auto contains(std::string_view name) const -> bool;

        auto empty() const noexcept -> bool;

        auto size() const noexcept -> std::size_t;

        auto get(std::string_view name) const -> std::optional<std::string_view>;

        template <typename T>
        auto get(std::string_view name) const -> std::optional<T> {
            const auto value = get(name);
            if (!value) return std::nullopt;

            try {
                return parser<T>::parse(*value);
            }
            catch (const std::exception&) {
                return std::nullopt;
            }
        }

        template <typename T>
        auto require(std::string_view name) const -> T {
            const auto value = get(name);

            if (!value) {
                throw parameter_error("Missing required path parameter '{}'", name);
            }

            try {
                return parser<T>::parse(*value);
            }
            catch (const std::exception& ex) {
                throw parameter_error(
                    "Failed to parse path parameter '{}': {}",
                    name,
                    ex.what()
                );
            }
        }

        /// Segments consumed by a catch-all; empty if none matched.
        auto catch_all() const noexcept -> std::span<const std::string_view>;

        /// The part of the path consumed by a catch-all, separators intact.
        auto catch_all_path() const noexcept -> std::string_view;

        auto has_catch_all() const noexcept -> bool;

        /// Binds 'name' to 'value', replacing any earlier binding.
        auto set(std::string_view name, std::string_view value) -> void;

        auto set_catch_all(
            std::span<const std::string_view> segments,
            std::string_view path
        ) -> void;
    };
}
