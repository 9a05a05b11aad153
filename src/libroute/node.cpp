#include <route/node.hpp>
#include <route/split.hpp>

#include <algorithm>

namespace route {
    namespace {
        enum class stage {
            literal,
            partial,
            parameter,
            wildcard,
            catch_all,
            done
        };

        struct frame {
            const node* current;
            std::size_t depth;
            std::size_t bound;
            stage next = stage::literal;
            std::size_t index = 0;
        };

        using binding = std::pair<std::string_view, std::string_view>;

        auto lowercase(std::string_view text, std::string& buffer) -> void {
            buffer.assign(text);
            std::transform(
                buffer.begin(),
                buffer.end(),
                buffer.begin(),
                [](char c) -> char {
                    if (c >= 'A' && c <= 'Z') return c - 'A' + 'a';
                    return c;
                }
            );
        }

        auto lowercase(std::string_view text, bool enabled) -> std::string {
            auto result = std::string();

            if (enabled) lowercase(text, result);
            else result = text;

            return result;
        }

        /// Returns the untouched part of 'path' that follows its first
        /// 'depth' segments.
        auto unsplit_tail(
            std::string_view path,
            std::size_t depth,
            char separator
        ) -> std::string_view {
            const auto segments = split_n(path, depth, separator);
            auto it = segments.begin();

            for (std::size_t i = 0; i < depth && it != segments.end(); ++i) {
                ++it;
            }

            if (it == segments.end()) return {};
            return *it;
        }

        auto make_match(
            std::size_t entry,
            std::span<const binding> bindings
        ) -> node_match {
            auto result = node_match { .entry = entry, .params = {} };

            for (const auto& [name, value] : bindings) {
                result.params.set(name, value);
            }

            return result;
        }
    }

    auto node::child(const component& component, bool case_insensitive) -> node& {
        using namespace component_type;

        if (const auto* literal = std::get_if<component_type::literal>(&component)) {
            auto& child = literals[lowercase(literal->text, case_insensitive)];
            if (!child) child = std::make_unique<node>();
            return *child;
        }

        if (const auto* parameter = std::get_if<component_type::parameter>(&component)) {
            auto it = std::find_if(
                params.begin(),
                params.end(),
                [parameter](const auto& p) { return p.name == parameter->name; }
            );

            if (it == params.end()) {
                return *params.emplace_back(
                    parameter->name,
                    std::make_unique<node>()
                ).child;
            }

            return *it->child;
        }

        if (std::holds_alternative<component_type::wildcard>(component)) {
            if (!wildcard) wildcard = std::make_unique<node>();
            return *wildcard;
        }

        auto key = partial();

        if (const auto* capture = std::get_if<partial_capture>(&component)) {
            key.prefix = lowercase(capture->prefix, case_insensitive);
            key.name = capture->name;
            key.suffix = lowercase(capture->suffix, case_insensitive);
        }
        else if (const auto* wild = std::get_if<partial_wildcard>(&component)) {
            key.prefix = lowercase(wild->prefix, case_insensitive);
            key.suffix = lowercase(wild->suffix, case_insensitive);
        }
        else {
            throw error("Catch-all component cannot have children");
        }

        auto it = std::find_if(
            partials.begin(),
            partials.end(),
            [&key](const auto& p) {
                return
                    p.prefix == key.prefix &&
                    p.name == key.name &&
                    p.suffix == key.suffix;
            }
        );

        if (it != partials.end()) return *it->child;

        key.child = std::make_unique<node>();
        return *partials.emplace_back(std::move(key)).child;
    }

    auto node::find_literal(
        std::string_view segment,
        bool case_insensitive,
        std::string& buffer
    ) const -> const node* {
        if (literals.empty()) return nullptr;

        if (case_insensitive) {
            lowercase(segment, buffer);
            segment = buffer;
        }

        const auto result = literals.find(segment);

        if (result == literals.end()) return nullptr;
        return result->second.get();
    }

    auto node::find(
        std::string_view path,
        const options& opts
    ) const -> std::optional<node_match> {
        const auto view = split(path, opts.separator);
        const auto segments = std::vector<std::string_view>(
            view.begin(),
            view.end()
        );

        auto bindings = std::vector<binding>();
        auto stack = std::vector<frame> {
            frame { .current = this, .depth = 0, .bound = 0 }
        };
        auto buffer = std::string();

        const auto catch_all_match = [&](
            std::size_t entry,
            std::size_t depth
        ) -> node_match {
            auto result = make_match(entry, bindings);
            result.params.set_catch_all(
                std::span(segments).subspan(depth),
                unsplit_tail(path, depth, opts.separator)
            );
            return result;
        };

        while (!stack.empty()) {
            auto& top = stack.back();
            bindings.resize(top.bound);

            const auto& current = *top.current;
            const auto depth = top.depth;

            if (depth == segments.size()) {
                stack.pop_back();

                if (current.value) return make_match(*current.value, bindings);
                if (current.catch_all) {
                    return catch_all_match(*current.catch_all, depth);
                }

                continue;
            }

            const auto segment = segments[depth];
            const node* next = nullptr;

            switch (top.next) {
                case stage::literal:
                    top.next = stage::partial;
                    next = current.find_literal(
                        segment,
                        opts.case_insensitive,
                        buffer
                    );
                    break;
                case stage::partial:
                    while (!next && top.index < current.partials.size()) {
                        const auto& partial = current.partials[top.index++];

                        if (!partial_match(
                            segment,
                            partial.prefix,
                            partial.suffix,
                            opts.case_insensitive
                        )) continue;

                        if (!partial.name.empty()) {
                            bindings.emplace_back(
                                partial.name,
                                segment.substr(
                                    partial.prefix.size(),
                                    segment.size() -
                                        partial.prefix.size() -
                                        partial.suffix.size()
                                )
                            );
                        }

                        next = partial.child.get();
                    }

                    if (!next) {
                        top.next = stage::parameter;
                        top.index = 0;
                    }
                    break;
                case stage::parameter:
                    if (top.index < current.params.size()) {
                        const auto& param = current.params[top.index++];
                        bindings.emplace_back(param.name, segment);
                        next = param.child.get();
                    }
                    else top.next = stage::wildcard;
                    break;
                case stage::wildcard:
                    top.next = stage::catch_all;
                    next = current.wildcard.get();
                    break;
                case stage::catch_all:
                    top.next = stage::done;
                    if (current.catch_all) {
                        return catch_all_match(*current.catch_all, depth);
                    }
                    break;
                case stage::done:
                    stack.pop_back();
                    break;
            }

            if (next) {
                stack.push_back(frame {
                    .current = next,
                    .depth = depth + 1,
                    .bound = bindings.size()
                });
            }
        }

        return std::nullopt;
    }

    auto node::insert(
        const pattern& pattern,
        bool case_insensitive
    ) -> std::optional<std::size_t>& {
        auto* current = this;

        for (const auto& component : pattern) {
            if (std::holds_alternative<component_type::catch_all>(component)) {
                return current->catch_all;
            }

            current = &current->child(component, case_insensitive);
        }

        return current->value;
    }

    auto node::format_to(
        std::back_insert_iterator<fmt::memory_buffer>& out,
        std::string_view label,
        int level,
        std::span<const pattern> routes
    ) const -> void {
        const auto indent = level * 2;
        for (auto i = 0; i < indent; ++i) fmt::format_to(out, " ");

        if (value) fmt::format_to(out, "{} {}\n", label, routes[*value]);
        else fmt::format_to(out, "{}\n", label);

        for (const auto& [text, child] : literals) {
            child->format_to(out, text, level + 1, routes);
        }

        for (const auto& partial : partials) {
            const auto text = partial.name.empty() ?
                fmt::format("{}{{}}{}", partial.prefix, partial.suffix) :
                fmt::format(
                    "{}{{{}}}{}",
                    partial.prefix,
                    partial.name,
                    partial.suffix
                );

            partial.child->format_to(out, text, level + 1, routes);
        }

        for (const auto& param : params) {
            param.child->format_to(
                out,
                fmt::format(":{}", param.name),
                level + 1,
                routes
            );
        }

        if (wildcard) wildcard->format_to(out, "*", level + 1, routes);

        if (catch_all) {
            for (auto i = 0; i < indent + 2; ++i) fmt::format_to(out, " ");
            fmt::format_to(out, "** {}\n", routes[*catch_all]);
        }
    }

    auto node::to_string(std::span<const pattern> routes) const -> std::string {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        format_to(out, "/", 0, routes);

        return fmt::to_string(buffer);
    }

    auto sample_path(const pattern& pattern, char separator) -> std::string {
        using namespace component_type;

        auto result = std::string();
        auto placeholders = std::size_t();

        // Placeholders must never contain the separator.
        const auto mark = separator == '~' ? '^' : '~';

        const auto placeholder = [&placeholders, mark]() -> std::string {
            return std::string(2 + placeholders++, mark);
        };

        for (const auto& component : pattern) {
            if (const auto* literal = std::get_if<component_type::literal>(&component)) {
                result.push_back(separator);
                result.append(literal->text);
            }
            else if (const auto* capture = std::get_if<partial_capture>(&component)) {
                result.push_back(separator);
                result.append(capture->prefix);
                result.append(placeholder());
                result.append(capture->suffix);
            }
            else if (const auto* wild = std::get_if<partial_wildcard>(&component)) {
                result.push_back(separator);
                result.append(wild->prefix);
                result.append(placeholder());
                result.append(wild->suffix);
            }
            else if (std::holds_alternative<catch_all>(component)) {
                for (auto i = 0; i < 3; ++i) {
                    result.push_back(separator);
                    result.append(placeholder());
                }
            }
            else {
                result.push_back(separator);
                result.append(placeholder());
            }
        }

        if (result.empty()) result.push_back(separator);
        return result;
    }
}
