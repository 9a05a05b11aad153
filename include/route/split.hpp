#pragma once

#include <cstddef>
#include <iterator>
#include <limits>
#include <string_view>

namespace route {
    /// A lazy sequence of the non-empty segments of a string.
    ///
    /// Leading, trailing and repeated separators produce no segments:
    /// "/a//b/" and "a/b" both yield "a", "b". Segments are views into the
    /// original string, which must outlive the view and its iterators.
    ///
    /// A bounded view stops splitting after 'max_splits' segments and
    /// yields the rest of the string, separators included, as its last
    /// segment.
    class split_view {
        std::string_view string;
        std::size_t max_splits;
        char separator;
    public:
        static constexpr auto unbounded =
            std::numeric_limits<std::size_t>::max();

        class iterator {
            std::string_view string;
            std::size_t first = 0;
            std::size_t last = 0;
            std::size_t next = 0;
            std::size_t splits = 0;
            char separator = '/';

            auto skip_separators(std::size_t pos) const noexcept -> std::size_t;

            auto load() noexcept -> void;

            iterator(std::string_view string, char separator) noexcept;

            friend class split_view;
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = std::string_view;
            using difference_type = std::ptrdiff_t;
            using pointer = const std::string_view*;
            using reference = std::string_view;

            iterator() = default;

            iterator(
                std::string_view string,
                char separator,
                std::size_t max_splits
            ) noexcept;

            auto operator*() const noexcept -> std::string_view;

            auto operator++() noexcept -> iterator&;

            auto operator++(int) noexcept -> iterator;

            auto operator==(const iterator& other) const noexcept -> bool;

            /// Offset of the current segment within the original string.
            auto offset() const noexcept -> std::size_t;
        };

        split_view(
            std::string_view string,
            char separator = '/',
            std::size_t max_splits = unbounded
        ) noexcept;

        auto begin() const noexcept -> iterator;

        auto end() const noexcept -> iterator;

        auto empty() const noexcept -> bool;
    };

    auto split(std::string_view string, char separator = '/') -> split_view;

    auto split_n(
        std::string_view string,
        std::size_t max_splits,
        char separator = '/'
    ) -> split_view;
}
