#include <route/component.hpp>
#include <route/split.hpp>

#include <algorithm>

namespace route {
    namespace {
        auto lower(char c) noexcept -> char {
            if (c >= 'A' && c <= 'Z') return c - 'A' + 'a';
            return c;
        }

        auto equal(
            std::string_view a,
            std::string_view b,
            bool case_insensitive
        ) noexcept -> bool {
            if (!case_insensitive) return a == b;

            return std::equal(
                a.begin(), a.end(),
                b.begin(), b.end(),
                [](char x, char y) { return lower(x) == lower(y); }
            );
        }

        auto has_group(std::string_view text) noexcept -> bool {
            const auto open = text.find('{');
            return
                open != std::string_view::npos &&
                text.find('}', open + 1) != std::string_view::npos;
        }

        auto canonical(std::string_view text, char separator) -> std::string {
            auto result = std::string();

            for (const auto segment : split(text, separator)) {
                result.push_back(separator);
                result.append(segment);
            }

            if (result.empty()) result.push_back(separator);
            return result;
        }
    }

    auto partial_match(
        std::string_view segment,
        std::string_view prefix,
        std::string_view suffix,
        bool case_insensitive
    ) noexcept -> bool {
        if (segment.size() <= prefix.size() + suffix.size()) return false;

        return
            equal(segment.substr(0, prefix.size()), prefix, case_insensitive) &&
            equal(
                segment.substr(segment.size() - suffix.size()),
                suffix,
                case_insensitive
            );
    }

    auto parse_component(
        std::string_view pattern,
        std::string_view segment
    ) -> component {
        using namespace component_type;

        if (segment == "**") return catch_all();
        if (segment == "*") return wildcard();

        if (segment.starts_with(':')) {
            const auto name = segment.substr(1);

            if (name.empty()) {
                throw build_error(
                    pattern,
                    "Empty parameter name in route '{}'",
                    pattern
                );
            }

            return parameter { .name = std::string(name) };
        }

        const auto open = segment.find('{');
        const auto close = open == std::string_view::npos ?
            std::string_view::npos : segment.find('}', open + 1);

        if (close != std::string_view::npos) {
            const auto prefix = segment.substr(0, open);
            const auto name = segment.substr(open + 1, close - open - 1);
            const auto suffix = segment.substr(close + 1);

            if (name.find('{') != std::string_view::npos) {
                throw build_error(
                    pattern,
                    "Invalid capture name '{}' in route '{}'",
                    name,
                    pattern
                );
            }

            if (has_group(suffix)) {
                throw build_error(
                    pattern,
                    "Segment '{}' of route '{}' contains more than one capture",
                    segment,
                    pattern
                );
            }

            if (prefix.empty() && suffix.empty()) {
                if (name.empty()) return wildcard();
                return parameter { .name = std::string(name) };
            }

            if (name.empty()) {
                return partial_wildcard {
                    .prefix = std::string(prefix),
                    .suffix = std::string(suffix)
                };
            }

            return partial_capture {
                .prefix = std::string(prefix),
                .name = std::string(name),
                .suffix = std::string(suffix)
            };
        }

        const auto leading = segment.starts_with('*');
        const auto trailing = segment.ends_with('*');

        if (leading && trailing) {
            throw build_error(
                pattern,
                "Segment '{}' of route '{}' contains more than one wildcard",
                segment,
                pattern
            );
        }

        if (leading) {
            return partial_wildcard {
                .prefix = {},
                .suffix = std::string(segment.substr(1))
            };
        }

        if (trailing) {
            return partial_wildcard {
                .prefix = std::string(segment.substr(0, segment.size() - 1)),
                .suffix = {}
            };
        }

        return literal { .text = std::string(segment) };
    }

    pattern::pattern(std::string_view text, char separator) :
        text(canonical(text, separator))
    {
        for (const auto segment : split(text, separator)) {
            if (
                !parts.empty() &&
                std::holds_alternative<component_type::catch_all>(parts.back())
            ) {
                throw build_error(
                    this->text,
                    "Route '{}' continues past a catch-all",
                    this->text
                );
            }

            parts.push_back(parse_component(this->text, segment));
        }
    }

    auto pattern::begin() const noexcept -> const_iterator {
        return parts.begin();
    }

    auto pattern::end() const noexcept -> const_iterator {
        return parts.end();
    }

    auto pattern::components() const noexcept -> const std::vector<component>& {
        return parts;
    }

    auto pattern::empty() const noexcept -> bool {
        return parts.empty();
    }

    auto pattern::is_literal() const noexcept -> bool {
        return std::all_of(parts.begin(), parts.end(), [](const auto& part) {
            return std::holds_alternative<component_type::literal>(part);
        });
    }

    auto pattern::size() const noexcept -> std::size_t {
        return parts.size();
    }

    auto pattern::str() const noexcept -> std::string_view {
        return text;
    }

    auto to_string(const component& component) -> std::string {
        using namespace component_type;

        struct visitor {
            auto operator()(const literal& c) const -> std::string {
                return c.text;
            }

            auto operator()(const parameter& c) const -> std::string {
                return fmt::format(":{}", c.name);
            }

            auto operator()(const wildcard&) const -> std::string {
                return "*";
            }

            auto operator()(const partial_capture& c) const -> std::string {
                return fmt::format("{}{{{}}}{}", c.prefix, c.name, c.suffix);
            }

            auto operator()(const partial_wildcard& c) const -> std::string {
                if (c.prefix.empty() || c.suffix.empty()) {
                    return fmt::format("{}*{}", c.prefix, c.suffix);
                }

                return fmt::format("{}{{}}{}", c.prefix, c.suffix);
            }

            auto operator()(const catch_all&) const -> std::string {
                return "**";
            }
        };

        return std::visit(visitor(), component);
    }
}
