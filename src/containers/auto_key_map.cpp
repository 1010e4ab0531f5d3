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
#include <okc/containers/auto_key_map.hpp>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace okc
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_space_exhausted() { throw std::overflow_error( "okc::auto_key_map key space exhausted" ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace okc
//------------------------------------------------------------------------------
