////////////////////////////////////////////////////////////////////////////////
/// ordered_keyed_map — keyed associative container with an explicit,
/// caller controlled iteration order
///
/// Every element is identified by a stable unique key. Insertion, removal and
/// lookup are by key (independent of position) while iteration walks an
/// explicit order sequence that the caller controls (append/prepend,
/// sort_by, sort_by_key, reverse).
///
/// Architecture:
///   items_ — key_index<Key, T, Compare>: the sorted key → value lookup table
///   order_ — std::vector<Key>: the iteration order
///   After every public operation set( order_ ) == set( items_.keys() ) and
///   order_ holds no duplicates (checked in debug builds, see
///   OKC_CHECK_INVARIANTS).
///
/// Absent keys are never an error: set/update/erase on a missing key are
/// no-ops and get() returns an empty optional.
///
/// Many operations come in two flavours, "custom order" (walks order_) and
/// "_by_key" (walks items_ in natural key order — cheaper, and for the value
/// projections copy-free).
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

#include "key_index.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#ifndef OKC_CHECK_INVARIANTS
#   ifdef NDEBUG
#       define OKC_CHECK_INVARIANTS 0
#   else
#       define OKC_CHECK_INVARIANTS 1
#   endif
#endif // OKC_CHECK_INVARIANTS
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

template
<
    typename Key,
    typename T,
    typename Compare = std::less<Key>
>
class ordered_keyed_map
{
public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type             = Key;
    using mapped_type          = T;
    using value_type           = std::pair<key_type, mapped_type>;
    using key_compare          = Compare;
    using reference            = std::pair<key_type const &, mapped_type       &>;
    using const_reference      = std::pair<key_type const &, mapped_type const &>;
    using size_type            = std::size_t;
    using difference_type      = std::ptrdiff_t;
    using index_type           = key_index<Key, T, Compare>;
    using order_container_type = std::vector<Key>;
    using key_arg              = typename index_type::key_arg;

    //--------------------------------------------------------------------------
    // Iterator (walks the custom order)
    //--------------------------------------------------------------------------
private:
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = ordered_keyed_map::value_type;
        using difference_type   = ordered_keyed_map::difference_type;
        using reference         = std::conditional_t<IsConst, ordered_keyed_map::const_reference, ordered_keyed_map::reference>;

        struct arrow_proxy {
            reference ref;
            constexpr reference       * operator->()       noexcept { return &ref; }
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = arrow_proxy;

    private:
        friend ordered_keyed_map;
        friend iterator_impl<!IsConst>;

        using map_ptr = std::conditional_t<IsConst, ordered_keyed_map const *, ordered_keyed_map *>;

        map_ptr         map_{ nullptr };
        difference_type idx_{ 0 };

        constexpr iterator_impl( map_ptr const m, difference_type const i ) noexcept : map_{ m }, idx_{ i } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : map_{ other.map_ }, idx_{ other.idx_ } {}

        reference operator*() const noexcept {
            auto const & key{ map_->order_[ static_cast<size_type>( idx_ ) ] };
            auto * const value{ map_->items_.find( key ) };
            BOOST_ASSERT_MSG( value, "Key in order missing from items" );
            return { key, *value };
        }

        arrow_proxy operator->() const noexcept { return { **this }; }

        reference operator[]( difference_type const n ) const noexcept { return *( *this + n ); }

        constexpr iterator_impl & operator++(     )    noexcept { ++idx_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++idx_; return tmp; }
        constexpr iterator_impl & operator--(     )    noexcept { --idx_; return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --idx_; return tmp; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { idx_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { idx_ -= n; return *this; }

        friend constexpr iterator_impl operator+( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl it ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator-( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ - n }; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ - b.idx_; }

        friend constexpr bool operator==( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ == b.idx_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ <=> b.idx_; }
    }; // iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------

    ordered_keyed_map() = default;

    explicit ordered_keyed_map( Compare const & comp ) noexcept( std::is_nothrow_copy_constructible_v<Compare> )
        : items_{ comp } {}

    // On duplicate keys the last value wins while the key keeps the position
    // of its first occurrence.
    template <std::input_iterator InputIt>
    ordered_keyed_map( InputIt first, InputIt const last, Compare const & comp = Compare{} )
        : items_{ comp }
    {
        for ( ; first != last; ++first ) {
            auto const & [key, value] = *first;
            insert( key, value );
        }
    }

    ordered_keyed_map( std::initializer_list<value_type> const il, Compare const & comp = Compare{} )
        : ordered_keyed_map( il.begin(), il.end(), comp ) {}

    ordered_keyed_map( ordered_keyed_map const & ) = default;
    ordered_keyed_map( ordered_keyed_map && )      = default;

    ordered_keyed_map & operator=( ordered_keyed_map const & ) = default;
    ordered_keyed_map & operator=( ordered_keyed_map && )      = default;

    // Same tie-break as the iterator range constructor.
    template <std::ranges::input_range R>
    [[nodiscard]] static ordered_keyed_map from_list( R && pairs, Compare const & comp = Compare{} )
    {
        ordered_keyed_map result( comp );
        if constexpr ( std::ranges::sized_range<R> )
            result.reserve( static_cast<size_type>( std::ranges::size( pairs ) ) );
        for ( auto && [key, value] : pairs )
            result.insert( key, value );
        return result;
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return { this, 0 }; }
    const_iterator begin() const noexcept { return { this, 0 }; }
    iterator       end  ()       noexcept { return { this, static_cast<difference_type>( order_.size() ) }; }
    const_iterator end  () const noexcept { return { this, static_cast<difference_type>( order_.size() ) }; }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end  () }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[nodiscard]] bool      empty() const noexcept { return order_.empty(); }
    [[nodiscard]] size_type size () const noexcept { BOOST_ASSERT( order_.size() == items_.size() ); return order_.size(); }

    void reserve( size_type const n ) {
        items_.reserve( n );
        order_.reserve( n );
    }

    //--------------------------------------------------------------------------
    // Lookup (never consults the order)
    //--------------------------------------------------------------------------
    [[nodiscard]] T       * find( key_arg key )       noexcept { return items_.find( key ); }
    [[nodiscard]] T const * find( key_arg key ) const noexcept { return items_.find( key ); }

    [[nodiscard]] bool contains( key_arg key ) const noexcept { return items_.contains( key ); }

    [[nodiscard]] std::optional<T> get( key_arg key ) const {
        if ( auto const p_value{ items_.find( key ) } )
            return *p_value;
        return std::nullopt;
    }

    // O(n): the current index of key in the iteration order.
    [[nodiscard]] std::optional<size_type> position_of( key_arg key ) const noexcept {
        auto const it{ find_in_order( key ) };
        if ( it == order_.end() )
            return std::nullopt;
        return static_cast<size_type>( it - order_.begin() );
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // Replaces the value of an existing key. Never inserts: returns false (and
    // leaves the map untouched) if the key is absent.
    template <typename M>
    bool set( key_arg key, M && value ) {
        auto const p_value{ items_.find( key ) };
        if ( !p_value )
            return false;
        *p_value = std::forward<M>( value );
        return true;
    }

    // New keys go to the end of the order, existing keys have their value
    // replaced in place (position unchanged). Returns true for a new key.
    template <typename K, typename M>
    bool insert( K && key, M && value ) { return add( false, std::forward<K>( key ), std::forward<M>( value ) ); }

    template <typename K, typename M>
    bool append ( K && key, M && value ) { return add( false, std::forward<K>( key ), std::forward<M>( value ) ); }
    template <typename K, typename M>
    bool prepend( K && key, M && value ) { return add( true , std::forward<K>( key ), std::forward<M>( value ) ); }

    // value = f( value ) for an existing key; false (and f not called) if
    // the key is absent.
    template <typename F>
    bool update( key_arg key, F && f ) {
        auto const p_value{ items_.find( key ) };
        if ( !p_value )
            return false;
        *p_value = std::invoke( f, std::as_const( *p_value ) );
        return true;
    }

    // General form of update: f receives the current value (or nullopt) and
    // returns the new one (or nullopt to remove the key). A key created this
    // way is appended to the order.
    template <typename F>
    void update_optional( key_arg key, F && f )
    {
        auto const p_value{ items_.find( key ) };
        std::optional<T> result
        {
            p_value
                ? std::invoke( f, std::optional<T>{ *p_value } )
                : std::invoke( f, std::optional<T>{}           )
        };
        if ( result ) {
            if ( p_value ) *p_value = *std::move( result );
            else           add( false, key_type( key ), *std::move( result ) );
        } else if ( p_value ) {
            erase( key );
        }
    }

    // f( value ) returns std::pair<T, Effect>: the value is stored and the
    // effect returned. Absent key: no call, no effect.
    template <typename F>
    auto update_with_effect( key_arg key, F && f )
        -> std::optional<typename std::remove_cvref_t<std::invoke_result_t<F &, T const &>>::second_type>
    {
        auto const p_value{ items_.find( key ) };
        if ( !p_value )
            return std::nullopt;
        auto [value, effect] = std::invoke( f, std::as_const( *p_value ) );
        *p_value = std::move( value );
        return std::move( effect );
    }

    // key may refer to an element of keys() or keys_by_key()
    size_type erase( key_arg key ) {
        auto const pos{ find_in_order( key ) };
        if ( pos == order_.end() )
            return 0;
        [[ maybe_unused ]] auto const erased{ items_.erase( key ) };
        BOOST_ASSERT_MSG( erased == 1, "Key in order missing from items" );
        order_.erase( pos );
        check_invariants();
        return 1;
    }

    // Keeps the entries for which pred( key, value ) holds (pred is called
    // once per entry, in natural key order); survivors keep their relative
    // order. Returns the number of removed entries.
    template <typename Pred>
    size_type filter( Pred && pred )
    {
        auto const removed{ items_.erase_if( [&]( Key const & key, T const & value ) { return !std::invoke( pred, key, value ); } ) };
        if ( removed ) {
            std::erase_if( order_, [this]( Key const & key ) { return !items_.contains( key ); } );
            check_invariants();
        }
        return removed;
    }

    void clear() noexcept {
        items_.clear();
        order_.clear();
    }

    void swap( ordered_keyed_map & other ) noexcept {
        items_.swap( other.items_ );
        order_.swap( other.order_ );
    }

    friend void swap( ordered_keyed_map & a, ordered_keyed_map & b ) noexcept { a.swap( b ); }

    //--------------------------------------------------------------------------
    // Ordering
    //--------------------------------------------------------------------------

    // Stable sort of the order by proj( key, value ): entries with equal
    // projections keep their previous relative order.
    template <typename Proj, typename Comp = std::less<>>
    void sort_by( Proj && proj, Comp const & comp = Comp{} )
    {
        using sort_key = std::remove_cvref_t<std::invoke_result_t<Proj &, Key const &, T const &>>;
        std::vector<std::pair<sort_key, Key>> decorated;
        decorated.reserve( order_.size() );
        for ( auto const & key : order_ )
            decorated.emplace_back( std::invoke( proj, key, *items_.find( key ) ), key );
        stable_sort_by( decorated.begin(), decorated.end(), comp, []( auto const & entry ) -> sort_key const & { return entry.first; } );
        for ( size_type i{ 0 }; i < decorated.size(); ++i )
            order_[ i ] = std::move( decorated[ i ].second );
    }

    // Resets the order to the natural key order.
    void sort_by_key() { order_ = items_.keys(); }

    void reverse() { std::ranges::reverse( order_ ); }

    //--------------------------------------------------------------------------
    // Derived maps
    //--------------------------------------------------------------------------

    // Maps every value through f( key, value ); keys and order unchanged.
    template <typename F>
    [[nodiscard]] auto transform( F && f ) const
    {
        auto mapped_items{ items_.transform( std::forward<F>( f ) ) };
        using result_type = typename decltype( mapped_items )::mapped_type;
        return ordered_keyed_map<Key, result_type, Compare>( std::move( mapped_items ), order_ );
    }

    /// Applies f( key, value ) -> std::pair<V2, W> to every entry.
    ///
    /// The resulting map keeps the current order but the W sequence follows
    /// the NATURAL KEY order, not the custom one: after reverse(), sort_by()
    /// or prepend() the two do not line up. Kept that way for compatibility
    /// with existing callers.
    template <typename F>
    [[nodiscard]] auto map_and_unzip( F && f ) const
    {
        using result_pair = std::remove_cvref_t<std::invoke_result_t<F &, Key const &, T const &>>;
        using mapped_type2 = typename result_pair::first_type;
        using side_type    = typename result_pair::second_type;

        auto const & keys  { items_.keys  () };
        auto const & values{ items_.values() };
        std::vector<mapped_type2> mapped;
        std::vector<side_type   > side;
        mapped.reserve( keys.size() );
        side  .reserve( keys.size() );
        for ( size_type i{ 0 }; i < keys.size(); ++i ) {
            auto [m, s] = std::invoke( f, keys[ i ], values[ i ] );
            mapped.emplace_back( std::move( m ) );
            side  .emplace_back( std::move( s ) );
        }
        using result_map = ordered_keyed_map<Key, mapped_type2, Compare>;
        return std::pair<result_map, std::vector<side_type>>
        {
            result_map( key_index<Key, mapped_type2, Compare>{ sorted_unique, keys, std::move( mapped ), items_.key_comp() }, order_ ),
            std::move( side )
        };
    }

    //--------------------------------------------------------------------------
    // Projections
    //--------------------------------------------------------------------------

    // Entries in the custom order.
    [[nodiscard]] std::vector<value_type> to_list() const
    {
        std::vector<value_type> list;
        list.reserve( order_.size() );
        for ( auto const & key : order_ ) {
            if ( auto const p_value{ items_.find( key ) } )
                list.emplace_back( key, *p_value );
        }
        return list;
    }

    // Entries in the natural key order.
    [[nodiscard]] std::vector<value_type> to_list_by_key() const
    {
        auto const & keys  { items_.keys  () };
        auto const & values{ items_.values() };
        std::vector<value_type> list;
        list.reserve( keys.size() );
        for ( size_type i{ 0 }; i < keys.size(); ++i )
            list.emplace_back( keys[ i ], values[ i ] );
        return list;
    }

    [[nodiscard]] order_container_type const & keys       () const noexcept { return order_;        }
    [[nodiscard]] std::vector<Key>     const & keys_by_key() const noexcept { return items_.keys(); }

    [[nodiscard]] std::vector<T> values() const
    {
        std::vector<T> result;
        result.reserve( order_.size() );
        for ( auto const & key : order_ )
            result.emplace_back( *items_.find( key ) );
        return result;
    }
    [[nodiscard]] std::vector<T> const & values_by_key() const noexcept { return items_.values(); }

    // acc = f( acc, key, value ) over the custom order
    template <typename Acc, typename F>
    [[nodiscard]] Acc fold( Acc init, F && f ) const
    {
        for ( auto const & [key, value] : *this )
            init = std::invoke( f, std::move( init ), key, value );
        return init;
    }

    // acc = f( acc, key, value ) over the natural key order
    template <typename Acc, typename F>
    [[nodiscard]] Acc fold_by_key( Acc init, F && f ) const
    {
        auto const & keys  { items_.keys  () };
        auto const & values{ items_.values() };
        for ( size_type i{ 0 }; i < keys.size(); ++i )
            init = std::invoke( f, std::move( init ), keys[ i ], values[ i ] );
        return init;
    }

    template <typename F>
    void for_each( F && f ) const
    {
        for ( auto const & [key, value] : *this )
            std::invoke( f, key, value );
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[nodiscard]] key_compare        key_comp() const noexcept { return items_.key_comp(); }
    [[nodiscard]] index_type const & items   () const noexcept { return items_; }

    // solely a debugging helper (include ordered_keyed_map_print.hpp)
    void print( std::ostream & ) const;

    //--------------------------------------------------------------------------
    // Comparison: same order and same key → value mapping
    //--------------------------------------------------------------------------
    friend bool operator==( ordered_keyed_map const & a, ordered_keyed_map const & b ) {
        return a.order_ == b.order_ && a.items_ == b.items_;
    }

private:
    template <typename, typename, typename> friend class ordered_keyed_map;

    ordered_keyed_map( index_type items, order_container_type order ) noexcept
        : items_{ std::move( items ) }, order_{ std::move( order ) }
    {
        BOOST_ASSERT( items_.size() == order_.size() );
    }

    template <typename K, typename M>
    bool add( bool const at_front, K && key, M && value )
    {
        key_type k( std::forward<K>( key ) );
        if ( !items_.insert_or_assign( k, std::forward<M>( value ) ) )
            return false;
        try {
            if ( at_front ) order_.insert( order_.begin(), k );
            else            order_.push_back( k );
        } catch ( ... ) {
            items_.erase( k );
            throw;
        }
        check_invariants();
        return true;
    }

    [[nodiscard]] typename order_container_type::const_iterator find_in_order( key_arg key ) const noexcept
    {
        auto const comp{ items_.key_comp() };
        return std::ranges::find_if( order_, [&]( Key const & k ) { return comp_eq( comp, k, key ); } );
    }

    void check_invariants() const
    {
        BOOST_ASSERT_MSG( order_.size() == items_.size(), "order/items size mismatch" );
#   if OKC_CHECK_INVARIANTS
        // Every order entry maps to a distinct items slot: together with the
        // size check this gives set( order ) == set( items ) and no duplicates.
        auto const & keys{ items_.keys() };
        auto const   comp{ items_.key_comp() };
        std::vector<bool> seen( keys.size(), false );
        [[ maybe_unused ]] bool consistent{ true };
        for ( auto const & key : order_ ) {
            auto const pos{ static_cast<size_type>( std::lower_bound( keys.begin(), keys.end(), key, comp ) - keys.begin() ) };
            if ( pos == keys.size() || !comp_eq( comp, keys[ pos ], key ) || seen[ pos ] ) {
                consistent = false;
                break;
            }
            seen[ pos ] = true;
        }
        BOOST_ASSERT_MSG( consistent, "order and items out of sync" );
#   endif
    }

    index_type           items_;
    order_container_type order_;
}; // class ordered_keyed_map

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
