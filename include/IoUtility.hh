/** \file
 *
 * \brief Definition of input and output stream related utilities
 *
 * Although the utilities in this do not depend on any other classes or
 * functions inside the Landlord namespace, the functions are still inside the
 * namespace to avoid name conflicts.
 */

#ifndef LANDLORD_IOUTILITY_HH_
#define LANDLORD_IOUTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace Landlord {

/** \brief Output optional value
 *
 * If \p t is not empty, outputs the wrapped value using \c operator<< for \c
 * T. Otherwise outputs the placeholder value “(none)”.
 *
 * \param os the output stream
 * \param t the value to be written to \p os
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    if (t) {
        return os << *t;
    }
    return os << "(none)";
}

/** \brief Output variant
 *
 * This function simply applies visitor which uses \c operator<< for the
 * underlying type.
 *
 * \param os the output stream
 * \param t the value to be written to \p os
 */
template<typename T, typename... Ts>
std::ostream& operator<<(std::ostream& os, const std::variant<T, Ts...>& t)
{
    std::visit([&os](const auto& v) { os << v; }, t);
    return os;
}

/** \brief Process input file stream or stdin based on \p path
 *
 * If \p path is a hyphen (“-”), calls \p callback with \c std::cin as
 * argument. Otherwise opens the file at \p path and passes reference to the
 * corresponding \c std::ifstream to the callback.
 *
 * \param path a filesystem path or hyphen
 * \param callback a callable that accepts reference to \c std::istream as
 * argument
 *
 * \return the result of invoking \p callback with the reference to the stream
 *
 * \throw std::runtime_error if the file cannot be opened
 */
template<typename Callable>
decltype(auto) processStreamFromPath(std::string_view path, Callable&& callback)
{
    auto helper = [&callback](auto& in) -> decltype(auto) {
        return std::invoke(std::forward<Callable>(callback), in);
    };
    if (path == "-") {
        return helper(std::cin);
    }
    auto in = std::ifstream {std::string {path}};
    if (!in) {
        throw std::runtime_error {"Could not open " + std::string {path}};
    }
    return helper(in);
}

/** \brief Process output file stream or stdout based on \p path
 *
 * The output counterpart of processStreamFromPath(). If \p path is a hyphen,
 * \p callback is invoked with \c std::cout. Otherwise the file at \p path is
 * truncated and opened for writing.
 *
 * \param path a filesystem path or hyphen
 * \param callback a callable that accepts reference to \c std::ostream as
 * argument
 *
 * \return the result of invoking \p callback with the reference to the stream
 *
 * \throw std::runtime_error if the file cannot be opened
 */
template<typename Callable>
decltype(auto) processStreamToPath(std::string_view path, Callable&& callback)
{
    auto helper = [&callback](auto& out) -> decltype(auto) {
        return std::invoke(std::forward<Callable>(callback), out);
    };
    if (path == "-") {
        return helper(std::cout);
    }
    auto out = std::ofstream {std::string {path}, std::ios::trunc};
    if (!out) {
        throw std::runtime_error {"Could not write " + std::string {path}};
    }
    return helper(out);
}

}

#endif // LANDLORD_IOUTILITY_HH_
