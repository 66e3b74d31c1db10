#ifndef LANLINK_CORE_COMPAT_H
#define LANLINK_CORE_COMPAT_H

// optional and variant spellings shared by the public headers. lanlink
// requires C++17, so both map straight onto the standard library.

#include <optional>
#include <variant>

namespace lanlink {

template <typename T>
using optional = std::optional<T>;
inline constexpr std::nullopt_t nullopt = std::nullopt;

template <typename... Alternatives>
using variant = std::variant<Alternatives...>;
using std::get;
using std::get_if;
using std::holds_alternative;

}  // namespace lanlink

#endif  // LANLINK_CORE_COMPAT_H
