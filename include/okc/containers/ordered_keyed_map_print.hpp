#pragma once

#include "ordered_keyed_map.hpp"

#include <ostream>
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

// Order: [k0, k1, ...] (n entries)
// Items: <k: v, ...> (n entries)
template <typename Key, typename T, typename Compare>
void ordered_keyed_map<Key, T, Compare>::print( std::ostream & os ) const
{
    if ( empty() )
    {
        os << "The map is empty.\n";
        return;
    }

    os << "Order:\t[";
    for ( size_type i{ 0 }; i < order_.size(); ++i )
    {
        os << order_[ i ];
        if ( i < order_.size() - 1U )
            os << ", ";
    }
    os << "] (" << order_.size() << " entries)\n";

    auto const & keys  { items_.keys  () };
    auto const & values{ items_.values() };
    os << "Items:\t<";
    for ( size_type i{ 0 }; i < keys.size(); ++i )
    {
        os << keys[ i ] << ": " << values[ i ];
        if ( i < keys.size() - 1U )
            os << ", ";
    }
    os << "> (" << keys.size() << " entries)\n";
}

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
