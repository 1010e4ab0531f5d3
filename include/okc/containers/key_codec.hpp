////////////////////////////////////////////////////////////////////////////////
/// Key serialization and rendering boundary for integer keyed maps.
///
/// Contents:
///   - encode_key( key )          — canonical decimal string form of a key
///   - key_repr                   — a key as it arrives from a transport: the
///                                  native integer or its string form
///   - decode_key( text | repr )  — parse back, throwing key_decode_error
///   - render_keyed( map, f )     — order respecting traversal handing each
///                                  entry to f together with its string id
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

#include "auto_key_map.hpp"
#include "ordered_keyed_map.hpp"

#include <charconv>
#include <concepts>
#include <cstdint>
#include <functional>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

using encoded_key = std::int64_t;

class key_decode_error : public std::invalid_argument
{
public:
    key_decode_error( std::string_view input, char const * reason );

    // the offending input, verbatim
    [[nodiscard]] std::string const & input() const noexcept { return input_; }

private:
    std::string input_;
}; // class key_decode_error


template <std::integral Key>
[[nodiscard]] std::string encode_key( Key const key )
{
    char buffer[ std::numeric_limits<Key>::digits10 + 3 ];
    auto const result{ std::to_chars( std::begin( buffer ), std::end( buffer ), key ) };
    return { buffer, result.ptr };
}

using key_repr = std::variant<encoded_key, std::string>;

// Accepts an optional leading '-' followed by decimal digits only.
[[nodiscard]] encoded_key decode_key( std::string_view text );

// Constrained so that character strings never convert to key_repr.
template <std::same_as<key_repr> Repr>
[[nodiscard]] encoded_key decode_key( Repr const & repr )
{
    if ( auto const p_native{ std::get_if<encoded_key>( &repr ) } )
        return *p_native;
    return decode_key( std::string_view{ std::get<std::string>( repr ) } );
}


/// Calls f( id, key, value ) for every entry in the iteration order, where
/// id == encode_key( key ), and collects the results.
template <std::integral Key, typename T, typename Compare, typename F>
[[nodiscard]] auto render_keyed( ordered_keyed_map<Key, T, Compare> const & map, F && f )
{
    using rendered = std::remove_cvref_t<std::invoke_result_t<F &, std::string const &, Key const &, T const &>>;
    std::vector<rendered> nodes;
    nodes.reserve( map.size() );
    for ( auto const & [key, value] : map )
        nodes.emplace_back( std::invoke( f, encode_key( key ), key, value ) );
    return nodes;
}

template <typename T, typename F>
[[nodiscard]] auto render_keyed( auto_key_map<T> const & map, F && f )
{
    return render_keyed( map.entries(), std::forward<F>( f ) );
}

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
