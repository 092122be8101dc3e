////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
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

#include <psi/err/fallible_result.hpp>

#include <cstdint>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

namespace err = psi::err;

// Growth failures: the index type cannot address the requested number of
// slots (a structural limit, independent of available memory) vs. the
// allocator giving up.
enum class reserve_error : std::uint8_t
{
    capacity_overflow,
    allocation_failure
}; // reserve_error

// A position that the target index type cannot represent.
enum class conversion_error : std::uint8_t
{
    out_of_range
}; // conversion_error

template <typename Result, typename Error>
using result_or_error = err::result_or_error<Result, Error>;

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range      ();
    [[ noreturn, gnu::cold ]] void throw_out_of_range      ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_capacity_overflow ();
    [[ noreturn, gnu::cold ]] void throw_conversion_failure();
} // namespace detail

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
