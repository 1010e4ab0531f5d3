////////////////////////////////////////////////////////////////////////////////
/// Argument passing helpers and out-of-line error reporting hooks shared by
/// the okc containers.
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <boost/config.hpp>

#include <string_view>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// Keys are looked up far more often than they are stored: small trivial keys
// (the std::int64_t of auto_key_map, enums, pointers) travel by value, the
// rest by const reference.
////////////////////////////////////////////////////////////////////////////////

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivially_copyable_v<T> &&
    std::is_trivially_default_constructible_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
}; // can_be_passed_in_reg

template <typename Key>
using key_const_arg = std::conditional_t<can_be_passed_in_reg<Key>, Key const, Key const &>;


// utility for passing non trivial predicates to algorithms which pass them around by-val
template <typename Pred>
constexpr decltype( auto ) make_trivially_copyable_predicate( Pred && __restrict pred ) noexcept {
    if constexpr ( can_be_passed_in_reg<std::remove_cvref_t<Pred>> ) {
        return std::forward<Pred>( pred );
    } else {
        return [&pred]( auto const & ... args ) noexcept( noexcept( pred( args... ) ) ) {
            return pred( args... );
        };
    }
} // make_trivially_copyable_predicate


namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_decode_error( std::string_view input, char const * reason );
    [[ noreturn, gnu::cold ]] void throw_key_space_exhausted();
} // namespace detail

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
