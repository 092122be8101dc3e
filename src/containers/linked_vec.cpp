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
#include <lvec/containers/linked_vec.hpp>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range      (                    ) { throw std::out_of_range( "linked_vec access out of bounds" ); }
    [[ noreturn, gnu::cold ]] void throw_out_of_range      ( char const * const msg ) { throw std::out_of_range( msg ); }
    [[ noreturn, gnu::cold ]] void throw_capacity_overflow (                    ) { throw std::length_error( "capacity overflow" ); }
    [[ noreturn, gnu::cold ]] void throw_conversion_failure(                    ) { throw std::out_of_range( "position not representable by the index type" ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
