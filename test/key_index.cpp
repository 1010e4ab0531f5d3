////////////////////////////////////////////////////////////////////////////////
/// okc::key_index unit tests
////////////////////////////////////////////////////////////////////////////////

#include <okc/containers/key_index.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace okc {
//------------------------------------------------------------------------------

TEST( key_index, default_construction )
{
    key_index<int, std::string> idx;
    EXPECT_TRUE( idx.empty() );
    EXPECT_EQ  ( idx.size(), 0 );
    EXPECT_EQ  ( idx.find( 1 ), nullptr );
    EXPECT_FALSE( idx.contains( 1 ) );
}

TEST( key_index, sorted_unique_construction )
{
    key_index<int, std::string> idx( sorted_unique, { 1, 3, 5 }, { "a", "b", "c" } );
    EXPECT_EQ( idx.size(), 3 );
    ASSERT_NE( idx.find( 3 ), nullptr );
    EXPECT_EQ( *idx.find( 3 ), "b" );
    EXPECT_EQ( idx.find( 4 ), nullptr );
}

TEST( key_index, insert_keeps_keys_sorted )
{
    key_index<int, int> idx;
    for ( int const k : { 5, 1, 4, 2, 3 } )
        EXPECT_TRUE( idx.insert_or_assign( k, k * 10 ) );

    EXPECT_EQ( idx.keys  (), ( std::vector<int>{  1,  2,  3,  4,  5 } ) );
    EXPECT_EQ( idx.values(), ( std::vector<int>{ 10, 20, 30, 40, 50 } ) );
}

TEST( key_index, insert_or_assign_overwrites )
{
    key_index<int, std::string> idx;
    EXPECT_TRUE ( idx.insert_or_assign( 7, "first"  ) );
    EXPECT_FALSE( idx.insert_or_assign( 7, "second" ) );
    EXPECT_EQ   ( idx.size(), 1 );
    EXPECT_EQ   ( *idx.find( 7 ), "second" );
}

TEST( key_index, try_emplace_does_not_overwrite )
{
    key_index<int, std::string> idx;
    auto const [p_first, inserted_first]{ idx.try_emplace( 7, "first" ) };
    EXPECT_TRUE( inserted_first );
    EXPECT_EQ  ( *p_first, "first" );

    auto const [p_second, inserted_second]{ idx.try_emplace( 7, "second" ) };
    EXPECT_FALSE( inserted_second );
    EXPECT_EQ   ( *p_second, "first" );
}

TEST( key_index, erase )
{
    key_index<int, int> idx( sorted_unique, { 1, 2, 3 }, { 10, 20, 30 } );
    EXPECT_EQ( idx.erase( 2 ), 1 );
    EXPECT_EQ( idx.erase( 2 ), 0 );
    EXPECT_EQ( idx.keys  (), ( std::vector<int>{  1,  3 } ) );
    EXPECT_EQ( idx.values(), ( std::vector<int>{ 10, 30 } ) );
}

TEST( key_index, erase_if )
{
    key_index<int, int> idx( sorted_unique, { 1, 2, 3, 4, 5, 6 }, { 1, 0, 1, 0, 1, 0 } );
    auto const erased{ idx.erase_if( []( int const key, int const value ) { return value == 0 || key == 5; } ) };
    EXPECT_EQ( erased, 4 );
    EXPECT_EQ( idx.keys(), ( std::vector<int>{ 1, 3 } ) );
    EXPECT_EQ( idx.values(), ( std::vector<int>{ 1, 1 } ) );
}

TEST( key_index, transform_keeps_keys )
{
    key_index<int, int> idx( sorted_unique, { 2, 4 }, { 20, 40 } );
    auto const strings{ idx.transform( []( int const key, int const value ) { return std::to_string( key + value ); } ) };
    EXPECT_EQ( strings.keys  (), idx.keys() );
    EXPECT_EQ( strings.values(), ( std::vector<std::string>{ "22", "44" } ) );
}

namespace
{
    struct threshold
    {
        int limit;

        bool exceeded_by( int const value ) const noexcept { return value > limit; }
        int  headroom   ( int const value ) const noexcept { return limit - value; }

        friend bool operator<( threshold const & a, threshold const & b ) noexcept { return a.limit < b.limit; }
    };
} // anonymous namespace

TEST( key_index, member_pointer_callables )
{
    key_index<threshold, int> idx( sorted_unique, { { 10 }, { 20 }, { 30 } }, { 5, 25, 28 } );
    EXPECT_EQ( idx.erase_if( &threshold::exceeded_by ), 1 );
    EXPECT_EQ( idx.size(), 2 );
    EXPECT_FALSE( idx.contains( threshold{ 20 } ) );

    auto const headroom{ idx.transform( &threshold::headroom ) };
    EXPECT_EQ( headroom.values(), ( std::vector<int>{ 5, 2 } ) );
}

TEST( key_index, custom_comparator )
{
    key_index<int, char, std::greater<int>> idx;
    idx.insert_or_assign( 1, 'a' );
    idx.insert_or_assign( 3, 'c' );
    idx.insert_or_assign( 2, 'b' );
    EXPECT_EQ( idx.keys(), ( std::vector<int>{ 3, 2, 1 } ) );
    EXPECT_EQ( *idx.find( 2 ), 'b' );
}

TEST( key_index, string_keys )
{
    key_index<std::string, int> idx;
    idx.insert_or_assign( std::string{ "pear" }, 3 );
    idx.insert_or_assign( std::string{ "apple" }, 1 );
    EXPECT_EQ( idx.keys().front(), "apple" );
    EXPECT_TRUE( idx.contains( "pear" ) );
}

TEST( key_index, swap_and_equality )
{
    key_index<int, int> a( sorted_unique, { 1 }, { 10 } );
    key_index<int, int> b( sorted_unique, { 2, 3 }, { 20, 30 } );
    auto const a_copy{ a };
    swap( a, b );
    EXPECT_EQ( b, a_copy );
    EXPECT_EQ( a.size(), 2 );
    EXPECT_NE( a, b );
}

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
