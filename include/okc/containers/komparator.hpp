////////////////////////////////////////////////////////////////////////////////
/// Comparator traits, utilities and the Komparator wrapper for the okc
/// containers.
///
/// Contents:
///   - is_simple_comparator<T>     — trait: can == replace double-negation test?
///   - comp_eq(comp, a, b)         — optimised equality from strict-weak comparator
///   - Komparator<Comparator>      — EBO wrapper with le/eq
///   - stable_sort_by(first, last, comp, proj) — projected stable sort
///
/// key_index inherits from Komparator to get zero-overhead comparator storage
/// + derived comparison helpers; ordered_keyed_map uses the stable sort for
/// sort_by().
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

#include "abi.hpp"

#include <boost/sort/spinsort/spinsort.hpp>

#include <functional>
#include <iterator>
#include <ranges>
#include <type_traits>
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

//==============================================================================
// Comparator traits
//==============================================================================

/// Is this a "simple" comparator where operator== can be used instead of
/// the two-comparison equivalence test?  User specializations are intended.
template <typename T> constexpr bool is_simple_comparator{ false };
template <typename T> constexpr bool is_simple_comparator<std::less   <T>>{ std::is_fundamental_v<T> };
template <typename T> constexpr bool is_simple_comparator<std::greater<T>>{ std::is_fundamental_v<T> };
template <> inline constexpr bool is_simple_comparator<std::less   <void>>{ true };
template <> inline constexpr bool is_simple_comparator<std::greater<void>>{ true };
template <> inline constexpr bool is_simple_comparator<std::ranges::less   >{ true };
template <> inline constexpr bool is_simple_comparator<std::ranges::greater>{ true };


//==============================================================================
// comp_eq — optimised equality from a strict-weak comparator (free function)
//==============================================================================

/// Three-tier dispatch:
///   1. Custom comp.eq() if available
///   2. Direct == for simple comparators (std::less/greater on fundamentals, transparent comparators)
///   3. Standard two-comparison equivalence (!comp(a,b) && !comp(b,a))
template <typename Comp>
[[ gnu::pure ]] constexpr bool comp_eq( Comp const & comp, auto const & left, auto const & right ) noexcept
{
    if constexpr ( requires{ comp.eq( left, right ); } )
        return comp.eq( left, right );
    else if constexpr ( is_simple_comparator<Comp> && requires{ left == right; } )
        return left == right;
    else
        return !comp( left, right ) && !comp( right, left );
}


//==============================================================================
// Komparator — comparator wrapper (EBO via public inheritance)
//==============================================================================

/// Publicly inherits from Comparator for empty-base optimisation. Being an
/// aggregate (no user-declared constructors, public base, no data members)
/// means no forwarding constructors are needed — aggregate initialization
/// handles all cases: Komparator<C>{ c } or Komparator<C>{}.
template <typename Comparator>
struct Komparator : Comparator
{
    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Comparator       & comp()       noexcept { return *this; }

    [[ gnu::pure ]] constexpr bool le ( auto const & left, auto const & right ) const noexcept { return comp()( left, right ); }
    [[ gnu::pure ]] constexpr bool eq ( auto const & left, auto const & right ) const noexcept { return comp_eq( comp(), left, right ); }
}; // struct Komparator


/// Stable sort of [first, last) ordering elements by proj( element ) under
/// comp. Elements comparing equal keep their relative order.
template <std::random_access_iterator It, typename Comp, typename Proj>
void stable_sort_by( It const first, It const last, Comp const & comp, Proj const & proj )
{
    boost::sort::spinsort
    (
        first, last,
        [&]( auto const & left, auto const & right ) { return comp( proj( left ), proj( right ) ); }
    );
}

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
