#include <route/split.hpp>

namespace route {
    split_view::iterator::iterator(
        std::string_view string,
        char separator,
        std::size_t max_splits
    ) noexcept :
        string(string),
        splits(max_splits),
        separator(separator)
    {
        next = skip_separators(0);
        load();
    }

    split_view::iterator::iterator(
        std::string_view string,
        char separator
    ) noexcept :
        string(string),
        first(string.size()),
        last(string.size()),
        next(string.size()),
        separator(separator)
    {}

    auto split_view::iterator::skip_separators(
        std::size_t pos
    ) const noexcept -> std::size_t {
        while (pos < string.size() && string[pos] == separator) ++pos;
        return pos;
    }

    auto split_view::iterator::load() noexcept -> void {
        first = next;

        if (first >= string.size()) {
            first = last = next = string.size();
            return;
        }

        if (splits == 0) {
            last = next = string.size();
            return;
        }

        if (splits != unbounded) --splits;

        last = string.find(separator, first);
        if (last == std::string_view::npos) last = string.size();

        next = skip_separators(last);
    }

    auto split_view::iterator::operator*() const noexcept -> std::string_view {
        return string.substr(first, last - first);
    }

    auto split_view::iterator::operator++() noexcept -> iterator& {
        load();
        return *this;
    }

    auto split_view::iterator::operator++(int) noexcept -> iterator {
        auto previous = *this;
        load();
        return previous;
    }

    auto split_view::iterator::operator==(
        const iterator& other
    ) const noexcept -> bool {
        return first == other.first;
    }

    auto split_view::iterator::offset() const noexcept -> std::size_t {
        return first;
    }

    split_view::split_view(
        std::string_view string,
        char separator,
        std::size_t max_splits
    ) noexcept :
        string(string),
        max_splits(max_splits),
        separator(separator)
    {}

    auto split_view::begin() const noexcept -> iterator {
        return iterator(string, separator, max_splits);
    }

    auto split_view::end() const noexcept -> iterator {
        return iterator(string, separator);
    }

    auto split_view::empty() const noexcept -> bool {
        return begin() == end();
    }

    auto split(std::string_view string, char separator) -> split_view {
        return split_view(string, separator);
    }

    auto split_n(
        std::string_view string,
        std::size_t max_splits,
        char separator
    ) -> split_view {
        return split_view(string, separator, max_splits);
    }
}
