#pragma once

#include "component.hpp"
#include "options.hpp"
#include "parameters.hpp"

#include <fmt/format.h>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace route {
    struct node_match {
        std::size_t entry;
        parameters params;
    };

    /// One level of the path trie.
    ///
    /// Children are tried in a fixed order: literal text, partial
    /// captures in registration order, parameters in registration order,
    /// the wildcard, and finally the catch-all. Nodes store the index of
    /// the entry a route terminates at; the values themselves live in the
    /// trie that owns the root.
    class node {
        struct partial {
            std::string prefix;
            std::string name;
            std::string suffix;
            std::unique_ptr<node> child;
        };

        struct param {
            std::string name;
            std::unique_ptr<node> child;
        };

        std::map<std::string, std::unique_ptr<node>, std::less<>> literals;
        std::vector<partial> partials;
        std::vector<param> params;
        std::unique_ptr<node> wildcard;
        std::optional<std::size_t> catch_all;
        std::optional<std::size_t> value;

        auto child(const component& component, bool case_insensitive) -> node&;

        auto find_literal(
            std::string_view segment,
            bool case_insensitive,
            std::string& buffer
        ) const -> const node*;

        auto format_to(
            std::back_insert_iterator<fmt::memory_buffer>& out,
            std::string_view label,
            int level,
            std::span<const pattern> routes
        ) const -> void;
    public:
        node() = default;

        node(const node&) = delete;

        node(node&&) = default;

        auto operator=(const node&) -> node& = delete;

        auto operator=(node&&) -> node& = default;

        /// Finds the entry that best matches 'path'.
        auto find(
            std::string_view path,
            const options& opts
        ) const -> std::optional<node_match>;

        /// Creates the nodes along 'pattern' and returns the slot holding
        /// the index of the entry the pattern terminates at.
        auto insert(
            const pattern& pattern,
            bool case_insensitive
        ) -> std::optional<std::size_t>&;

        auto to_string(std::span<const pattern> routes) const -> std::string;
    };

    /// Builds a path that 'pattern' matches, using a distinct placeholder
    /// for every segment a capture or wildcard consumes.
    auto sample_path(const pattern& pattern, char separator) -> std::string;
}
