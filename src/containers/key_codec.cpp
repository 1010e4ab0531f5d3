////////////////////////////////////////////////////////////////////////////////
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
#include <okc/containers/key_codec.hpp>

#include <charconv>
#include <string>
#include <system_error>
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_decode_error( std::string_view const input, char const * const reason ) { throw key_decode_error( input, reason ); }
} // namespace detail

namespace
{
    std::string decode_error_message( std::string_view const input, char const * const reason )
    {
        std::string message{ "okc: cannot decode key \"" };
        message.append( input );
        message.append( "\": " );
        message.append( reason );
        return message;
    }
} // anonymous namespace

key_decode_error::key_decode_error( std::string_view const input, char const * const reason )
    : std::invalid_argument( decode_error_message( input, reason ) ), input_( input ) {}


encoded_key decode_key( std::string_view const text )
{
    if ( text.empty() )
        detail::throw_key_decode_error( text, "empty input" );

    // from_chars already rejects leading whitespace and '+'; a lone '-' or
    // any trailing character is caught below.
    auto const first{ text.data() };
    auto const last { text.data() + text.size() };
    encoded_key key{};
    auto const [ptr, ec]{ std::from_chars( first, last, key ) };
    if ( ec == std::errc::result_out_of_range )
        detail::throw_key_decode_error( text, "out of range" );
    if ( ec != std::errc{} )
        detail::throw_key_decode_error( text, "not an integer" );
    if ( ptr != last )
        detail::throw_key_decode_error( text, "trailing characters" );
    return key;
}

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
