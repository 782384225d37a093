#ifndef checked_hpp
#define checked_hpp

#include <concepts> // for std::regular
#include <ostream>
#include <type_traits>
#include <utility> // for std::forward

namespace compo::detail {

template <class T, class R, class ...Args>
concept functor_returns = std::is_invocable_r_v<R, T, Args...>;

/// @brief Value of type <code>T</code> that's only ever constructed from
///   values that <code>Checker</code> accepts.
/// @note <code>Tag</code> distinguishes otherwise identical instantiations
///   so that, for example, an endpoint name can't be passed where a
///   component name is expected.
template <class T, functor_returns<T> Checker, class Tag = void>
struct checked
{
    using value_type = T;
    using checker_type = Checker;
    using tag_type = Tag;

    constexpr checked() // NOLINT(bugprone-exception-escape)
    noexcept(noexcept(Checker{}()) && std::is_nothrow_move_constructible_v<T>):
        data{Checker{}()}
    {
        // Intentionally empty.
    }

    template <class U, class V = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, checked> &&
        functor_returns<Checker, T, U>
    >>
    checked(U&& u): data{
        checker_type{}(std::forward<U>(u)) // NOLINT(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
    }
    {
        // Intentionally empty.
    }

    constexpr explicit operator value_type() const
    {
        return data;
    }

    [[nodiscard]] auto get() const & noexcept -> const value_type&
    {
        return data;
    }

private:
    value_type data;
};

template <class V, class C, class X>
inline auto operator==(const checked<V, C, X>& lhs,
                       const checked<V, C, X>& rhs)
    -> decltype(lhs.get() == rhs.get())
{
    return lhs.get() == rhs.get();
}

template <class V, class C, class X>
inline auto operator<(const checked<V, C, X>& lhs,
                      const checked<V, C, X>& rhs)
    -> decltype(lhs.get() < rhs.get())
{
    return lhs.get() < rhs.get();
}

template <class V, class C, class X>
inline auto operator==(const checked<V, C, X>& lhs, const V& rhs)
    -> decltype(lhs.get() == rhs)
{
    return lhs.get() == rhs;
}

template <class V, class C, class X>
inline auto operator==(const V& lhs, const checked<V, C, X>& rhs)
    -> decltype(lhs == rhs.get())
{
    return lhs == rhs.get();
}

template <class T>
concept ostreamable = requires{
    std::declval<std::ostream&>() << std::declval<T>();
};

template <ostreamable T, class U, class X>
auto operator<<(std::ostream& os, const checked<T, U, X>& value)
    -> std::ostream&
{
    os << value.get();
    return os;
}

}

#endif /* checked_hpp */
