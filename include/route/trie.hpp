#pragma once

#include "node.hpp"

#include <concepts>
#include <deque>
#include <iterator>
#include <timber/timber>

namespace route {
    template <typename T>
    struct match {
        const T* value;
        std::string_view route;
        parameters params;
    };

    template <typename T>
    class trie_builder;

    /// An immutable set of routes.
    ///
    /// Resolving only reads the trie, so a single instance may be shared
    /// between threads without synchronization.
    template <typename T>
    class trie {
        friend class trie_builder<T>;

        route::options opts;
        std::unique_ptr<node> root;
        std::vector<pattern> patterns;
        std::vector<T> values;

        trie(
            const route::options& opts,
            std::unique_ptr<node>&& root,
            std::vector<pattern>&& patterns,
            std::vector<T>&& values
        ) :
            opts(opts),
            root(std::forward<std::unique_ptr<node>>(root)),
            patterns(std::forward<std::vector<pattern>>(patterns)),
            values(std::forward<std::vector<T>>(values))
        {}
    public:
        auto options() const noexcept -> const route::options& {
            return opts;
        }

        /// Returns the value of the route that best matches 'path', or
        /// std::nullopt if no route matches.
        auto resolve(std::string_view path) const -> std::optional<match<T>> {
            auto result = root->find(path, opts);

            if (!result) {
                TIMBER_TRACE("No route matches '{}'", path);
                return std::nullopt;
            }

            const auto& route = patterns[result->entry];
            TIMBER_TRACE("Path '{}' matches route {}", path, route);

            return match<T> {
                .value = &values[result->entry],
                .route = route.str(),
                .params = std::move(result->params)
            };
        }

        auto routes() const -> std::vector<std::string_view> {
            auto result = std::vector<std::string_view>();
            result.reserve(patterns.size());

            for (const auto& pattern : patterns) {
                result.push_back(pattern.str());
            }

            return result;
        }

        auto size() const noexcept -> std::size_t {
            return patterns.size();
        }

        auto to_string() const -> std::string {
            return root->to_string(patterns);
        }

        /// Throws 'conflict_error' if any route can never be resolved
        /// because another route always takes precedence.
        auto validate() const -> void {
            for (std::size_t i = 0; i < patterns.size(); ++i) {
                const auto path = sample_path(patterns[i], opts.separator);
                const auto result = root->find(path, opts);

                if (!result) {
                    throw build_error(
                        patterns[i].str(),
                        "Route '{}' cannot be resolved",
                        patterns[i].str()
                    );
                }

                if (result->entry != i) {
                    throw conflict_error(
                        patterns[i].str(),
                        patterns[result->entry].str()
                    );
                }
            }
        }
    };

    template <typename T>
    class trie_builder {
        route::options opts;
        std::unique_ptr<node> root = std::make_unique<node>();
        std::vector<pattern> patterns;
        std::deque<T> values;

        auto check_sealed(std::string_view route) const -> void {
            if (!root) {
                throw build_error(
                    route,
                    "Cannot add route '{}': trie has already been built",
                    route
                );
            }
        }

        auto append(
            std::optional<std::size_t>& slot,
            pattern&& route,
            T&& value
        ) -> T& {
            values.push_back(std::forward<T>(value));
            patterns.push_back(std::forward<pattern>(route));
            slot = values.size() - 1;

            TIMBER_DEBUG("Route added: {}", patterns.back());
            return values.back();
        }
    public:
        trie_builder() = default;

        explicit trie_builder(const route::options& opts) : opts(opts) {}

        /// Registers 'value' under 'route'.
        ///
        /// Registering a literal route twice replaces its value. Routes
        /// containing captures or wildcards may only be registered once.
        auto add(std::string_view route, T value) -> trie_builder& {
            check_sealed(route);

            auto parsed = pattern(route, opts.separator);
            auto& slot = root->insert(parsed, opts.case_insensitive);

            if (!slot) {
                append(slot, std::move(parsed), std::move(value));
                return *this;
            }

            if (!parsed.is_literal()) {
                throw build_error(
                    parsed.str(),
                    "Route '{}' is already registered",
                    parsed.str()
                );
            }

            TIMBER_DEBUG("Route replaced: {}", parsed);
            values[*slot] = std::move(value);

            return *this;
        }

        /// Returns the value registered under 'route', adding a default
        /// constructed value if there is none. The reference remains valid
        /// until the builder is built.
        auto entry(std::string_view route) -> T&
        requires std::default_initializable<T>
        {
            check_sealed(route);

            auto parsed = pattern(route, opts.separator);
            auto& slot = root->insert(parsed, opts.case_insensitive);

            if (slot) return values[*slot];
            return append(slot, std::move(parsed), T());
        }

        auto build() && -> trie<T> {
            if (!root) throw error("Trie has already been built");

            TIMBER_DEBUG("Building trie with {} routes", patterns.size());

            return trie<T>(
                opts,
                std::move(root),
                std::move(patterns),
                std::vector<T>(
                    std::make_move_iterator(values.begin()),
                    std::make_move_iterator(values.end())
                )
            );
        }

        auto routes() const -> std::vector<std::string_view> {
            auto result = std::vector<std::string_view>();
            result.reserve(patterns.size());

            for (const auto& pattern : patterns) {
                result.push_back(pattern.str());
            }

            return result;
        }

        auto size() const noexcept -> std::size_t {
            return patterns.size();
        }

        auto to_string() const -> std::string {
            if (!root) return {};
            return root->to_string(patterns);
        }
    };
}
