#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace route {
    class error : public std::runtime_error {
        static auto format_message(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(format_message(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };

    class build_error : public error {
        std::string pattern_text;
    public:
        template <typename... T>
        build_error(
            std::string_view pattern,
            fmt::format_string<T...> format,
            T&&... args
        ) :
            error(format, std::forward<T>(args)...),
            pattern_text(pattern)
        {}

        auto pattern() const noexcept -> std::string_view {
            return pattern_text;
        }
    };

    class conflict_error : public build_error {
        std::string winner_text;
    public:
        conflict_error(std::string_view pattern, std::string_view winner) :
            build_error(
                pattern,
                "Route '{}' overrides '{}'",
                winner,
                pattern
            ),
            winner_text(winner)
        {}

        auto winner() const noexcept -> std::string_view {
            return winner_text;
        }
    };

    class parameter_error : public error {
    public:
        using error::error;
    };

    struct parser_error : std::runtime_error {
        parser_error(const std::string& what) : runtime_error(what) {}
    };
}
