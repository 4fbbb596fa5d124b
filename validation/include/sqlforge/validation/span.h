#pragma once

#include <cstddef>
#include <utility>

namespace sqlforge::validation {

// Value tagged with the byte range [start, end) it was parsed from.
template <typename T>
struct SourceSpan {
    std::size_t start = 0;
    std::size_t end = 0;
    T value{};

    template <typename Fn>
    [[nodiscard]] auto map(Fn&& fn) const -> SourceSpan<decltype(fn(std::declval<const T&>()))> {
        return {start, end, fn(value)};
    }
};

template <typename T>
[[nodiscard]] auto makeSpan(std::size_t start, std::size_t end, T value) -> SourceSpan<T> {
    return SourceSpan<T>{start, end, std::move(value)};
}

}  // namespace sqlforge::validation
