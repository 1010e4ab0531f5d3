////////////////////////////////////////////////////////////////////////////////
/// okc key codec and rendering boundary unit tests
////////////////////////////////////////////////////////////////////////////////

#include <okc/containers/key_codec.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>
//------------------------------------------------------------------------------
namespace okc {
//------------------------------------------------------------------------------

TEST( key_codec, encode )
{
    EXPECT_EQ( encode_key( 0 ), "0" );
    EXPECT_EQ( encode_key( 42 ), "42" );
    EXPECT_EQ( encode_key( -7 ), "-7" );
    EXPECT_EQ( encode_key( std::numeric_limits<std::int64_t>::min() ), "-9223372036854775808" );
    EXPECT_EQ( encode_key( std::numeric_limits<std::uint64_t>::max() ), "18446744073709551615" );
}

TEST( key_codec, decode_text )
{
    EXPECT_EQ( decode_key( "0" ), 0 );
    EXPECT_EQ( decode_key( "123" ), 123 );
    EXPECT_EQ( decode_key( "-5" ), -5 );
    EXPECT_EQ( decode_key( "007" ), 7 );
    EXPECT_EQ( decode_key( "9223372036854775807" ), std::numeric_limits<std::int64_t>::max() );
}

TEST( key_codec, decode_either_representation )
{
    EXPECT_EQ( decode_key( key_repr{ std::int64_t{ 17 } } ), 17 );
    EXPECT_EQ( decode_key( key_repr{ std::string{ "17" } } ), 17 );
}

TEST( key_codec, encode_decode_agree )
{
    for ( std::int64_t const key : { std::int64_t{ 1 }, std::int64_t{ -1 }, std::numeric_limits<std::int64_t>::max(), std::numeric_limits<std::int64_t>::min() } )
        EXPECT_EQ( decode_key( encode_key( key ) ), key );
}

TEST( key_codec, decode_rejects_malformed_input )
{
    for ( std::string_view const bad : { "", "abc", "12a", "1.5", " 1", "1 ", "+1", "-", "--1", "0x10", "9223372036854775808" } )
    {
        SCOPED_TRACE( std::string{ bad } );
        EXPECT_THROW( std::ignore = decode_key( bad ), key_decode_error );
    }
}

TEST( key_codec, decode_error_carries_the_input )
{
    try
    {
        std::ignore = decode_key( key_repr{ std::string{ "twelve" } } );
        FAIL() << "expected key_decode_error";
    }
    catch ( key_decode_error const & e )
    {
        EXPECT_EQ( e.input(), "twelve" );
        EXPECT_NE( std::string_view{ e.what() }.find( "\"twelve\"" ), std::string_view::npos );
    }
}

TEST( key_codec, decode_error_is_invalid_argument )
{
    EXPECT_THROW( std::ignore = decode_key( "x" ), std::invalid_argument );
}

TEST( key_codec, render_keyed_follows_iteration_order )
{
    ordered_keyed_map<int, std::string> m{ { 3, "c" }, { 1, "a" }, { 2, "b" } };
    m.reverse();
    auto const nodes{ render_keyed( m, []( std::string const & id, int const key, std::string const & value ) {
        EXPECT_EQ( id, encode_key( key ) );
        return id + "=" + value;
    } ) };
    EXPECT_EQ( nodes, ( std::vector<std::string>{ "2=b", "1=a", "3=c" } ) );
}

TEST( key_codec, render_keyed_auto_keys )
{
    auto_key_map<std::string> m{ "first", "second" };
    m.prepend( "zeroth" );
    auto const ids{ render_keyed( m, []( std::string const & id, std::int64_t, std::string const & ) { return id; } ) };
    EXPECT_EQ( ids, ( std::vector<std::string>{ "3", "1", "2" } ) );

    // identities decode back to the keys they were rendered from
    for ( auto const & id : ids )
        EXPECT_TRUE( m.contains( decode_key( id ) ) );
}

TEST( key_codec, render_keyed_empty )
{
    EXPECT_TRUE( render_keyed( auto_key_map<int>{}, []( std::string const &, std::int64_t, int ) { return 0; } ).empty() );
}

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
