#pragma once

#include "error.h"

#include <charconv>
#include <chrono>
#include <concepts>
#include <filesystem>
#include <fmt/format.h>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <uuid++/uuid++>

namespace route {
    /// Converts a captured path segment to a value of type 'T'.
    ///
    /// Each specialization provides a static 'parse' that takes the segment
    /// text and either returns the converted value or throws 'parser_error'.
    /// Conversions are strict: the whole segment must be consumed, and no
    /// surrounding whitespace or sign the type cannot represent is accepted.
    template <typename T>
    struct parser;

    template <typename T>
    concept parsable = requires(std::string_view segment) {
        { parser<T>::parse(segment) } -> std::convertible_to<T>;
    };

    template <>
    struct parser<std::string_view> {
        static auto parse(std::string_view segment) -> std::string_view {
            return segment;
        }
    };

    template <>
    struct parser<std::string> {
        static auto parse(std::string_view segment) -> std::string {
            return std::string(segment);
        }
    };

    /// Yields an empty optional instead of throwing when the segment
    /// cannot be converted.
    template <parsable T>
    struct parser<std::optional<T>> {
        static auto parse(std::string_view segment) -> std::optional<T> {
            try {
                return parser<T>::parse(segment);
            }
            catch (const parser_error&) {
                return std::nullopt;
            }
        }
    };

    template <>
    struct parser<bool> {
        static auto parse(std::string_view segment) -> bool {
            if (segment == "true" || segment == "yes" || segment == "1") {
                return true;
            }

            if (segment == "false" || segment == "no" || segment == "0") {
                return false;
            }

            throw parser_error(fmt::format(
                "'{}' is not a boolean: expect true/false, yes/no or 1/0",
                segment
            ));
        }
    };

    template <typename T>
    requires std::integral<T> || std::floating_point<T>
    struct parser<T> {
    private:
        static constexpr auto min = std::numeric_limits<T>::lowest();
        static constexpr auto max = std::numeric_limits<T>::max();

        static constexpr auto kind() noexcept -> std::string_view {
            if constexpr (std::floating_point<T>) return "a number";
            else if constexpr (std::is_unsigned_v<T>) {
                return "an unsigned integer";
            }
            else return "an integer";
        }
    public:
        static auto parse(std::string_view segment) -> T {
            const auto* const first = segment.data();
            const auto* const last = first + segment.size();

            auto value = T();
            const auto [ptr, ec] = std::from_chars(first, last, value);

            if (ec == std::errc::result_out_of_range) {
                throw parser_error(fmt::format(
                    "'{}' is outside the range of {} and {}",
                    segment,
                    +min,
                    +max
                ));
            }

            if (ec != std::errc() || ptr != last) {
                throw parser_error(fmt::format(
                    "'{}' is not {}",
                    segment,
                    kind()
                ));
            }

            return value;
        }
    };

    template <typename Rep, typename Period>
    struct parser<std::chrono::duration<Rep, Period>> {
        static auto parse(
            std::string_view segment
        ) -> std::chrono::duration<Rep, Period> {
            return std::chrono::duration<Rep, Period>(
                parser<Rep>::parse(segment)
            );
        }
    };

    template <>
    struct parser<std::filesystem::path> {
        static auto parse(std::string_view segment) -> std::filesystem::path {
            return std::filesystem::path(segment).lexically_normal();
        }
    };

    template <>
    struct parser<UUID::uuid> {
        static auto parse(std::string_view segment) -> UUID::uuid {
            try {
                return UUID::uuid(segment);
            }
            catch (const std::exception& ex) {
                throw parser_error(fmt::format(
                    "'{}' is not a UUID: {}",
                    segment,
                    ex.what()
                ));
            }
        }
    };
}
