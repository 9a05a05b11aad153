#include <route/parameters.hpp>

namespace route {
    auto parameters::begin() const noexcept -> const_iterator {
        return values.begin();
    }

    auto parameters::end() const noexcept -> const_iterator {
        return values.end();
    }

    auto parameters::contains(std::string_view name) const -> bool {
        return values.contains(name);
    }

    auto parameters::empty() const noexcept -> bool {
        return values.empty();
    }

    auto parameters::size() const noexcept -> std::size_t {
        return values.size();
    }

    auto parameters::get(
        std::string_view name
    ) const -> std::optional<std::string_view> {
        const auto result = values.find(name);

        if (result == values.end()) return std::nullopt;
        return result->second;
    }

    auto parameters::catch_all() const noexcept ->
        std::span<const std::string_view>
    {
        return tail;
    }

    auto parameters::catch_all_path() const noexcept -> std::string_view {
        return tail_path;
    }

    auto parameters::has_catch_all() const noexcept -> bool {
        return catch_all_matched;
    }

    auto parameters::set(std::string_view name, std::string_view value) -> void {
        values.insert_or_assign(name, value);
    }

    auto parameters::set_catch_all(
        std::span<const std::string_view> segments,
        std::string_view path
    ) -> void {
        tail.assign(segments.begin(), segments.end());
        tail_path = path;
        catch_all_matched = true;
    }
}
