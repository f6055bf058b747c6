#pragma once

// std::expected when the standard library ships it (C++23), a small
// variant-backed replacement otherwise.

#include <version>

#if defined(REROUTE_HAS_STD_EXPECTED) || __cpp_lib_expected >= 202202L

#include <expected>

namespace reroute {
    using std::expected;
    using std::unexpected;
    using std::unexpect;
    using std::unexpect_t;
    using std::bad_expected_access;
}

#else

#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace reroute {

struct unexpect_t {
    explicit unexpect_t() = default;
};
inline constexpr unexpect_t unexpect{};

template<typename E>
class unexpected {
    E error_;

public:
    template<typename Err = E>
        requires std::is_constructible_v<E, Err>
    constexpr explicit unexpected(Err&& e) : error_(std::forward<Err>(e)) {}

    constexpr const E& error() const& noexcept { return error_; }
    constexpr E& error() & noexcept { return error_; }
    constexpr E&& error() && noexcept { return std::move(error_); }
};

template<typename E>
unexpected(E) -> unexpected<E>;

template<typename E>
class bad_expected_access : public std::exception {
    E error_;

public:
    explicit bad_expected_access(E e) : error_(std::move(e)) {}
    const char* what() const noexcept override { return "bad expected access"; }
    const E& error() const& noexcept { return error_; }
};

template<typename T, typename E>
class expected {
    std::variant<T, unexpected<E>> data_;

public:
    using value_type = T;
    using error_type = E;

    constexpr expected()
        requires std::is_default_constructible_v<T>
        : data_(std::in_place_index<0>) {}

    template<typename U = T>
        requires std::is_constructible_v<T, U> &&
                 (!std::is_same_v<std::remove_cvref_t<U>, expected>) &&
                 (!std::is_same_v<std::remove_cvref_t<U>, unexpected<E>>)
    constexpr expected(U&& v) : data_(std::in_place_index<0>, std::forward<U>(v)) {}

    template<typename G>
        requires std::is_constructible_v<E, const G&>
    constexpr expected(const unexpected<G>& e)
        : data_(std::in_place_index<1>, unexpected<E>(e.error())) {}

    template<typename G>
        requires std::is_constructible_v<E, G>
    constexpr expected(unexpected<G>&& e)
        : data_(std::in_place_index<1>, unexpected<E>(std::move(e).error())) {}

    template<typename... Args>
    constexpr explicit expected(unexpect_t, Args&&... args)
        : data_(std::in_place_index<1>, unexpected<E>(E(std::forward<Args>(args)...))) {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }
    constexpr explicit operator bool() const noexcept { return has_value(); }

    constexpr const T* operator->() const noexcept { return std::addressof(std::get<0>(data_)); }
    constexpr T* operator->() noexcept { return std::addressof(std::get<0>(data_)); }
    constexpr const T& operator*() const& noexcept { return std::get<0>(data_); }
    constexpr T& operator*() & noexcept { return std::get<0>(data_); }
    constexpr T&& operator*() && noexcept { return std::move(std::get<0>(data_)); }

    constexpr const T& value() const& {
        if (!has_value()) throw bad_expected_access<E>(error());
        return std::get<0>(data_);
    }
    constexpr T& value() & {
        if (!has_value()) throw bad_expected_access<E>(error());
        return std::get<0>(data_);
    }
    constexpr T&& value() && {
        if (!has_value()) throw bad_expected_access<E>(error());
        return std::move(std::get<0>(data_));
    }

    constexpr const E& error() const& noexcept { return std::get<1>(data_).error(); }
    constexpr E& error() & noexcept { return std::get<1>(data_).error(); }
    constexpr E&& error() && noexcept { return std::move(std::get<1>(data_)).error(); }

    template<typename U>
    constexpr T value_or(U&& fallback) const& {
        return has_value() ? std::get<0>(data_) : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename F>
    constexpr auto and_then(F&& f) const& {
        using U = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
        if (has_value()) return std::invoke(std::forward<F>(f), **this);
        return U(unexpect, error());
    }

    template<typename F>
    constexpr auto transform(F&& f) const& {
        using U = std::remove_cv_t<std::invoke_result_t<F, const T&>>;
        if (has_value()) return expected<U, E>(std::invoke(std::forward<F>(f), **this));
        return expected<U, E>(unexpect, error());
    }

    template<typename U>
        requires (!std::is_same_v<std::remove_cvref_t<U>, expected>)
    friend constexpr bool operator==(const expected& lhs, const U& value) {
        return lhs.has_value() && *lhs == value;
    }
};

template<typename E>
class expected<void, E> {
    std::variant<std::monostate, unexpected<E>> data_;

public:
    using value_type = void;
    using error_type = E;

    constexpr expected() noexcept : data_(std::monostate{}) {}

    template<typename G>
        requires std::is_constructible_v<E, const G&>
    constexpr expected(const unexpected<G>& e)
        : data_(std::in_place_index<1>, unexpected<E>(e.error())) {}

    template<typename G>
        requires std::is_constructible_v<E, G>
    constexpr expected(unexpected<G>&& e)
        : data_(std::in_place_index<1>, unexpected<E>(std::move(e).error())) {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }
    constexpr explicit operator bool() const noexcept { return has_value(); }

    constexpr void value() const {
        if (!has_value()) throw bad_expected_access<E>(error());
    }

    constexpr const E& error() const& noexcept { return std::get<1>(data_).error(); }
    constexpr E& error() & noexcept { return std::get<1>(data_).error(); }
};

} // namespace reroute

#endif // REROUTE_HAS_STD_EXPECTED
