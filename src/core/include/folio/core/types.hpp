#pragma once

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <variant>
#include <type_traits>
#include <utility>

namespace folio {

// ============================================================================
// Basic type aliases
// ============================================================================

using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Result: a value or an error, no exceptions
// ============================================================================

template<typename E>
struct Error {
    E value;

    explicit Error(E e) : value(std::move(e)) {}
};

template<typename E>
Error<std::decay_t<E>> make_error(E&& e) {
    return Error<std::decay_t<E>>(std::forward<E>(e));
}

template<typename T, typename E>
class Result {
public:
    template<typename U = T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                         std::is_constructible_v<T, U&&>>>
    Result(U&& value) : m_data(std::in_place_index<0>, std::forward<U>(value)) {}
    Result(Error<E> error) : m_data(std::in_place_index<1>, std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return m_data.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return m_data.index() == 1;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] T& value() & {
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T& value() const& {
        return std::get<0>(m_data);
    }

    [[nodiscard]] T&& value() && {
        return std::get<0>(std::move(m_data));
    }

    [[nodiscard]] E& error() & {
        return std::get<1>(m_data);
    }

    [[nodiscard]] const E& error() const& {
        return std::get<1>(m_data);
    }

    [[nodiscard]] E&& error() && {
        return std::get<1>(std::move(m_data));
    }

private:
    std::variant<T, E> m_data;
};

// Success carries nothing; default-constructed means ok
template<typename E>
class Result<void, E> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error<E> error) : m_error(std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return !m_error.has_value();
    }

    [[nodiscard]] bool is_err() const noexcept {
        return m_error.has_value();
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] const E& error() const& {
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Geometry types
// ============================================================================

template<typename T>
struct Point {
    T x{};
    T y{};

    constexpr Point() = default;
    constexpr Point(T x_, T y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Point& other) const {
        return !(*this == other);
    }
};

template<typename T>
struct Size {
    T width{};
    T height{};

    constexpr Size() = default;
    constexpr Size(T w, T h) : width(w), height(h) {}

    constexpr bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }

    constexpr bool operator!=(const Size& other) const {
        return !(*this == other);
    }

    [[nodiscard]] constexpr bool is_empty() const {
        return width <= T{} || height <= T{};
    }
};

template<typename T>
struct Rect {
    T x{};
    T y{};
    T width{};
    T height{};

    constexpr Rect() = default;
    constexpr Rect(T x_, T y_, T w, T h) : x(x_), y(y_), width(w), height(h) {}

    [[nodiscard]] constexpr T left() const { return x; }
    [[nodiscard]] constexpr T top() const { return y; }
    [[nodiscard]] constexpr T right() const { return x + width; }
    [[nodiscard]] constexpr T bottom() const { return y + height; }

    [[nodiscard]] constexpr bool is_empty() const {
        return width <= T{} || height <= T{};
    }

    // True when `other` lies entirely inside this rect (empty rects always do)
    [[nodiscard]] constexpr bool contains(const Rect& other) const {
        if (other.is_empty()) return true;
        return other.x >= x && other.y >= y &&
               other.right() <= right() && other.bottom() <= bottom();
    }

    [[nodiscard]] constexpr Rect intersection(const Rect& other) const {
        T new_x = std::max(x, other.x);
        T new_y = std::max(y, other.y);
        T new_right = std::min(right(), other.right());
        T new_bottom = std::min(bottom(), other.bottom());

        if (new_right <= new_x || new_bottom <= new_y) {
            return {};
        }

        return {new_x, new_y, new_right - new_x, new_bottom - new_y};
    }

    constexpr bool operator==(const Rect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }

    constexpr bool operator!=(const Rect& other) const {
        return !(*this == other);
    }
};

using PointI = Point<i32>;
using SizeI = Size<i32>;
using RectI = Rect<i32>;

// ============================================================================
// Color
// ============================================================================

// Opaque 8-bit RGB; covers carry no alpha channel
struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};

    constexpr Color() = default;
    constexpr Color(u8 r_, u8 g_, u8 b_) : r(r_), g(g_), b(b_) {}

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }

    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    static constexpr Color black() { return {0, 0, 0}; }
    static constexpr Color white() { return {255, 255, 255}; }
};

} // namespace folio
