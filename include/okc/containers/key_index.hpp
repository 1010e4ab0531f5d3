////////////////////////////////////////////////////////////////////////////////
/// key_index — the key → value lookup table behind ordered_keyed_map
///
/// Unique keys are kept sorted (by Compare) in one contiguous container and
/// the mapped values in a second, synchronised container, so that lookup is a
/// binary search over a cache friendly key array and key-only enumeration
/// never touches the values. Enumerating either container yields the
/// "natural key order".
///
/// Architecture:
///   key_index privately inherits detail::paired_storage<K, T>, which owns
///   both vectors and synchronises the dual-container operations (insert,
///   erase, compaction), and Komparator<Compare> for zero-overhead comparator
///   storage.
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
#include "komparator.hpp"

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

struct sorted_unique_t { explicit sorted_unique_t() = default; };
inline constexpr sorted_unique_t sorted_unique{};

//==============================================================================
// detail::paired_storage — comparator-agnostic synchronized dual-container ops
//==============================================================================
namespace detail {

template <typename Key, typename T>
struct paired_storage
{
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    std::vector<Key> keys;
    std::vector<T>   values;

    //--------------------------------------------------------------------------
    // Synchronized single-element insert at position (exception-safe)
    //--------------------------------------------------------------------------
    template <typename K, typename V>
    void insert_element_at( size_type const pos, K && key, V && val ) {
        auto const p{ static_cast<difference_type>( pos ) };
        keys.insert( keys.begin() + p, std::forward<K>( key ) );
        try {
            values.insert( values.begin() + p, std::forward<V>( val ) );
        } catch ( ... ) {
            keys.erase( keys.begin() + p );
            throw;
        }
    }

    //--------------------------------------------------------------------------
    // Synchronized erase
    //--------------------------------------------------------------------------
    void erase_element_at( size_type const pos ) noexcept {
        auto const p{ static_cast<difference_type>( pos ) };
        keys  .erase( keys  .begin() + p );
        values.erase( values.begin() + p );
    }

    //--------------------------------------------------------------------------
    // Single pass compaction: keep the elements for which keep( i ) holds
    //--------------------------------------------------------------------------
    template <typename Keep>
    size_type compact( Keep && keep ) {
        size_type dst{ 0 };
        for ( size_type src{ 0 }, n{ keys.size() }; src < n; ++src ) {
            if ( !keep( src ) )
                continue;
            if ( dst != src ) {
                keys  [ dst ] = std::move( keys  [ src ] );
                values[ dst ] = std::move( values[ src ] );
            }
            ++dst;
        }
        auto const erased{ keys.size() - dst };
        keys  .erase( keys  .begin() + static_cast<difference_type>( dst ), keys  .end() );
        values.erase( values.begin() + static_cast<difference_type>( dst ), values.end() );
        return erased;
    }

    void reserve( size_type const n ) {
        keys  .reserve( n );
        values.reserve( n );
    }

    void clear() noexcept {
        keys  .clear();
        values.clear();
    }

    void swap_storage( paired_storage & other ) noexcept {
        using std::swap;
        swap( keys,   other.keys   );
        swap( values, other.values );
    }
}; // struct paired_storage

} // namespace detail


//==============================================================================
// key_index — sorted unique key → value table with separate key/value storage
//==============================================================================

template
<
    typename Key,
    typename T,
    typename Compare = std::less<Key>
>
class key_index
    :
    private detail::paired_storage<Key, T>,
    private Komparator<Compare>
{
    using base = detail::paired_storage<Key, T>;
    using komp = Komparator<Compare>;

public:
    using key_type        = Key;
    using mapped_type     = T;
    using key_compare     = Compare;
    using size_type       = typename base::size_type;
    using difference_type = typename base::difference_type;
    using key_arg         = key_const_arg<Key>;

    key_index() = default;

    explicit key_index( Compare const & comp ) noexcept( std::is_nothrow_copy_constructible_v<Compare> )
        : komp{ comp } {}

    key_index( sorted_unique_t, std::vector<Key> keys, std::vector<T> values, Compare const & comp = Compare{} ) noexcept( std::is_nothrow_copy_constructible_v<Compare> )
        : base{ std::move( keys ), std::move( values ) }, komp{ comp }
    {
        BOOST_ASSERT( base::keys.size() == base::values.size() );
        BOOST_ASSERT_MSG
        (
            std::ranges::adjacent_find( base::keys, [this]( auto const & a, auto const & b ) { return !komp::le( a, b ); } ) == base::keys.end(),
            "Keys not sorted and unique"
        );
    }

    key_index( key_index const & ) = default;
    key_index( key_index && )      = default;

    key_index & operator=( key_index const & ) = default;
    key_index & operator=( key_index && )      = default;

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[nodiscard]] bool      empty() const noexcept { return base::keys.empty(); }
    [[nodiscard]] size_type size () const noexcept { return base::keys.size (); }

    using base::reserve;
    using base::clear;

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[nodiscard]] T       * find( key_arg key )       noexcept { auto const pos{ lower_bound_index( key ) }; return key_eq_at( pos, key ) ? &base::values[ pos ] : nullptr; }
    [[nodiscard]] T const * find( key_arg key ) const noexcept { auto const pos{ lower_bound_index( key ) }; return key_eq_at( pos, key ) ? &base::values[ pos ] : nullptr; }

    [[nodiscard]] bool contains( key_arg key ) const noexcept { return key_eq_at( lower_bound_index( key ), key ); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // Inserts if absent; returns the stored value and whether it was inserted.
    template <typename K, typename V>
    std::pair<T *, bool> try_emplace( K && key, V && value ) {
        auto const pos{ lower_bound_index( key ) };
        if ( key_eq_at( pos, key ) )
            return { &base::values[ pos ], false };
        base::insert_element_at( pos, key_type( std::forward<K>( key ) ), mapped_type( std::forward<V>( value ) ) );
        return { &base::values[ pos ], true };
    }

    // Returns true if the key was newly inserted.
    template <typename K, typename M>
    bool insert_or_assign( K && key, M && value ) {
        auto const pos{ lower_bound_index( key ) };
        if ( key_eq_at( pos, key ) ) {
            base::values[ pos ] = std::forward<M>( value );
            return false;
        }
        base::insert_element_at( pos, key_type( std::forward<K>( key ) ), mapped_type( std::forward<M>( value ) ) );
        return true;
    }

    size_type erase( key_arg key ) noexcept {
        auto const pos{ lower_bound_index( key ) };
        if ( !key_eq_at( pos, key ) )
            return 0;
        base::erase_element_at( pos );
        return 1;
    }

    template <typename Pred>
    size_type erase_if( Pred && pred ) {
        return base::compact( [&]( size_type const i ) { return !std::invoke( pred, std::as_const( base::keys[ i ] ), std::as_const( base::values[ i ] ) ); } );
    }

    void swap( key_index & other ) noexcept {
        base::swap_storage( other );
        using std::swap;
        swap( static_cast<komp &>( *this ), static_cast<komp &>( other ) );
    }

    friend void swap( key_index & a, key_index & b ) noexcept { a.swap( b ); }

    //--------------------------------------------------------------------------
    // Derived tables
    //--------------------------------------------------------------------------

    // Same keys, values mapped through f( key, value ); no re-sorting needed.
    template <typename F>
    auto transform( F && f ) const {
        using result_type = std::remove_cvref_t<std::invoke_result_t<F &, Key const &, T const &>>;
        std::vector<result_type> mapped;
        mapped.reserve( size() );
        for ( size_type i{ 0 }; i < size(); ++i )
            mapped.emplace_back( std::invoke( f, base::keys[ i ], base::values[ i ] ) );
        return key_index<Key, result_type, Compare>{ sorted_unique, base::keys, std::move( mapped ), key_comp() };
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[nodiscard]] key_compare key_comp() const noexcept { return komp::comp(); }

    [[nodiscard]] std::vector<Key> const & keys  () const noexcept { return base::keys;   }
    [[nodiscard]] std::vector<T>   const & values() const noexcept { return base::values; }

    friend bool operator==( key_index const & a, key_index const & b ) {
        return a.keys() == b.keys() && a.values() == b.values();
    }

private:
    template <typename K>
    [[nodiscard]] BOOST_FORCEINLINE size_type lower_bound_index( K const & key ) const noexcept {
        auto const comp{ make_trivially_copyable_predicate( komp::comp() ) };
        return static_cast<size_type>( std::lower_bound( base::keys.begin(), base::keys.end(), key, comp ) - base::keys.begin() );
    }
    template <typename K>
    [[nodiscard]] BOOST_FORCEINLINE bool key_eq_at( size_type const pos, K const & key ) const noexcept {
        return pos < base::keys.size() && komp::eq( base::keys[ pos ], key );
    }
}; // class key_index

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
