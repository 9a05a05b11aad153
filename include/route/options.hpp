#pragma once

namespace route {
    struct options {
        /// Separates path segments in both patterns and request paths.
        char separator = '/';

        /// Compare literal text ASCII case-insensitively. Captured values
        /// keep the case of the request path.
        bool case_insensitive = false;
    };
}
