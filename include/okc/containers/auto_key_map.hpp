////////////////////////////////////////////////////////////////////////////////
/// auto_key_map — ordered_keyed_map whose keys are issued by the container
///
/// A thin policy layer over ordered_keyed_map<std::int64_t, T>: append() and
/// prepend() take only a value and return the freshly issued key. Keys come
/// from a monotonic counter which is strictly greater than every key this
/// instance (or the instance it was copied from) ever issued, so removing an
/// element never allows its key to be reused.
///
/// Everything that does not create keys is forwarded verbatim to the inner
/// map. The inner map is never exposed mutably.
///
/// The largest key that can be issued is max() - 1: the counter never steps
/// past std::numeric_limits<key_type>::max(). Any operation that would make
/// it do so throws std::overflow_error and leaves the map unchanged.
///
/// Value semantics: copies are independent and so are their counters, i.e.
/// appending through two copies of the same map issues the same key twice.
/// Always continue with the map you appended to.
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
#include "ordered_keyed_map.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

template <typename T>
class auto_key_map
{
public:
    using key_type        = std::int64_t;
    using mapped_type     = T;
    using map_type        = ordered_keyed_map<key_type, T>;
    using value_type      = typename map_type::value_type;
    using size_type       = typename map_type::size_type;
    using const_reference = typename map_type::const_reference;
    using const_iterator  = typename map_type::const_iterator;
    using iterator        = const_iterator;

    static constexpr key_type first_key{ 1 };

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    auto_key_map() = default;

    // Keys first_key, first_key + 1, ... in input order.
    template <std::input_iterator InputIt>
    auto_key_map( InputIt first, InputIt const last )
    {
        for ( ; first != last; ++first )
            append( *first );
    }

    auto_key_map( std::initializer_list<T> const il ) : auto_key_map( il.begin(), il.end() ) {}

    // Adopts entries along with their original counter. The counter is raised
    // to recalculate_next_key() should it not cover the present keys.
    // Throws std::overflow_error if entries hold the key max().
    auto_key_map( map_type entries, key_type const next_key )
        : entries_{ std::move( entries ) }, next_key_{ next_key }
    {
        next_key_ = std::max( next_key_, recalculate_next_key() );
    }

    template <std::ranges::input_range R>
    [[nodiscard]] static auto_key_map from_list( R && values )
    {
        auto_key_map result;
        if constexpr ( std::ranges::sized_range<R> )
            result.entries_.reserve( static_cast<size_type>( std::ranges::size( values ) ) );
        for ( auto && value : values )
            result.append( std::forward<decltype( value )>( value ) );
        return result;
    }

    // Rebuilds a map whose counter was lost (e.g. after crossing a
    // serialization boundary) from the keys still present.
    // Note: the counter is only as good as recalculate_next_key() (which
    // also determines the overflow behaviour).
    [[nodiscard]] static auto_key_map recover( map_type entries )
    {
        auto_key_map result;
        result.entries_  = std::move( entries );
        result.next_key_ = result.recalculate_next_key();
        return result;
    }

    //--------------------------------------------------------------------------
    // Key issuing operations
    //--------------------------------------------------------------------------

    template <typename V>
    key_type append( V && value ) { return add( false, std::forward<V>( value ) ); }

    template <typename V>
    key_type prepend( V && value ) { return add( true, std::forward<V>( value ) ); }

    [[nodiscard]] key_type next_key() const noexcept { return next_key_; }

    /// max( present keys ) + 1, or first_key when empty. Throws
    /// std::overflow_error if the key max() is present.
    ///
    /// Recovery only: unlike next_key() this forgets the keys of removed
    /// entries, so after the highest key was erased it returns a key that was
    /// already issued once.
    [[nodiscard]] key_type recalculate_next_key() const
    {
        auto const & keys{ entries_.keys_by_key() };
        return keys.empty() ? first_key : key_after( keys.back() );
    }

    //--------------------------------------------------------------------------
    // Forwarded operations
    //--------------------------------------------------------------------------
    [[nodiscard]] bool      empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_type size () const noexcept { return entries_.size (); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end  () const noexcept { return entries_.end  (); }

    [[nodiscard]] T const *                find       ( key_type const key ) const noexcept { return entries_.find       ( key ); }
    [[nodiscard]] bool                     contains   ( key_type const key ) const noexcept { return entries_.contains   ( key ); }
    [[nodiscard]] std::optional<T>         get        ( key_type const key ) const          { return entries_.get        ( key ); }
    [[nodiscard]] std::optional<size_type> position_of( key_type const key ) const noexcept { return entries_.position_of( key ); }

    template <typename M>
    bool set( key_type const key, M && value ) { return entries_.set( key, std::forward<M>( value ) ); }

    template <typename F>
    bool update( key_type const key, F && f ) { return entries_.update( key, std::forward<F>( f ) ); }

    // May create an entry under an explicitly given key: the counter then
    // moves past it. Creating the key max() is refused with
    // std::overflow_error (the entry is not kept).
    template <typename F>
    void update_optional( key_type const key, F && f )
    {
        entries_.update_optional( key, std::forward<F>( f ) );
        if ( key >= next_key_ && entries_.contains( key ) ) {
            if ( key == std::numeric_limits<key_type>::max() ) [[ unlikely ]] {
                entries_.erase( key );
                detail::throw_key_space_exhausted();
            }
            next_key_ = key + 1;
        }
    }

    template <typename F>
    auto update_with_effect( key_type const key, F && f ) { return entries_.update_with_effect( key, std::forward<F>( f ) ); }

    size_type erase( key_type const key ) { return entries_.erase( key ); }

    template <typename Pred>
    size_type filter( Pred && pred ) { return entries_.filter( std::forward<Pred>( pred ) ); }

    void clear() noexcept { entries_.clear(); }

    template <typename Proj, typename Comp = std::less<>>
    void sort_by( Proj && proj, Comp const & comp = Comp{} ) { entries_.sort_by( std::forward<Proj>( proj ), comp ); }
    void sort_by_key() { entries_.sort_by_key(); }
    void reverse    () { entries_.reverse    (); }

    [[nodiscard]] std::vector<value_type>      to_list       () const          { return entries_.to_list       (); }
    [[nodiscard]] std::vector<value_type>      to_list_by_key() const          { return entries_.to_list_by_key(); }
    [[nodiscard]] std::vector<key_type> const & keys          () const noexcept { return entries_.keys          (); }
    [[nodiscard]] std::vector<key_type> const & keys_by_key   () const noexcept { return entries_.keys_by_key   (); }
    [[nodiscard]] std::vector<T>               values        () const          { return entries_.values        (); }
    [[nodiscard]] std::vector<T>        const & values_by_key () const noexcept { return entries_.values_by_key (); }

    template <typename Acc, typename F>
    [[nodiscard]] Acc fold       ( Acc init, F && f ) const { return entries_.fold       ( std::move( init ), std::forward<F>( f ) ); }
    template <typename Acc, typename F>
    [[nodiscard]] Acc fold_by_key( Acc init, F && f ) const { return entries_.fold_by_key( std::move( init ), std::forward<F>( f ) ); }

    template <typename F>
    void for_each( F && f ) const { entries_.for_each( std::forward<F>( f ) ); }

    // The mapped map continues the counter of this one.
    template <typename F>
    [[nodiscard]] auto transform( F && f ) const
    {
        auto mapped{ entries_.transform( std::forward<F>( f ) ) };
        using result_type = typename decltype( mapped )::mapped_type;
        return auto_key_map<result_type>( std::move( mapped ), next_key_ );
    }

    // See ordered_keyed_map::map_and_unzip() for the order of the second
    // member.
    template <typename F>
    [[nodiscard]] auto map_and_unzip( F && f ) const
    {
        auto [mapped, side] = entries_.map_and_unzip( std::forward<F>( f ) );
        using result_type = typename decltype( mapped )::mapped_type;
        return std::pair{ auto_key_map<result_type>( std::move( mapped ), next_key_ ), std::move( side ) };
    }

    [[nodiscard]] map_type const & entries() const noexcept { return entries_; }

    void print( std::ostream & os ) const { entries_.print( os ); }

    friend bool operator==( auto_key_map const & a, auto_key_map const & b ) {
        return a.next_key_ == b.next_key_ && a.entries_ == b.entries_;
    }

private:
    template <typename> friend class auto_key_map;

    [[nodiscard]] static key_type key_after( key_type const key )
    {
        if ( key == std::numeric_limits<key_type>::max() ) [[ unlikely ]]
            detail::throw_key_space_exhausted();
        return key + 1;
    }

    template <typename V>
    key_type add( bool const at_front, V && value )
    {
        auto const key      { next_key_ };
        auto const following{ key_after( key ) };
        [[ maybe_unused ]] auto const added
        {
            at_front
                ? entries_.prepend( key, std::forward<V>( value ) )
                : entries_.append ( key, std::forward<V>( value ) )
        };
        BOOST_ASSERT_MSG( added, "Issued key already present" );
        next_key_ = following;
        return key;
    }

    map_type entries_;
    key_type next_key_{ first_key };
}; // class auto_key_map

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
