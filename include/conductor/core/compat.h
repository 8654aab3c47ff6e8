#ifndef CONDUCTOR_CORE_COMPAT_H
#define CONDUCTOR_CORE_COMPAT_H

// Aliases the C++17 vocabulary types into the conductor namespace so the
// public headers read the same regardless of where they come from.

#include <optional>
#include <utility>
#include <variant>

namespace conductor {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

template <typename T>
constexpr optional<typename std::decay<T>::type> make_optional(T&& value) {
  return std::make_optional(std::forward<T>(value));
}

template <typename... Types>
using variant = std::variant<Types...>;

using bad_variant_access = std::bad_variant_access;

// Must stay using-declarations: a conductor:: overload set would compete
// with the std:: one found by argument-dependent lookup.
using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace conductor

#endif  // CONDUCTOR_CORE_COMPAT_H
