////////////////////////////////////////////////////////////////////////////////
/// Debug representation of linked_vec: the elements in logical order, each
/// keyed by its physical position, e.g. {9: 0, 1: 1, 7: 2}. String payloads
/// are quoted.
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
#pragma once

#include <lvec/containers/linked_vec.hpp>

#include <fmt/format.h>

#include <ostream>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

/// Detects types that behave as strings (basic_string, basic_string_view and
/// their derived types). Requires traits_type to distinguish from generic char
/// containers (e.g. vector<char>).
template <typename T>
concept string_viewable = requires {
    typename T::value_type;
    typename T::traits_type;
} && requires( T const & t ) {
    std::basic_string_view<typename T::value_type, typename T::traits_type>{ t };
};

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------

template <typename T, lvec::store_index I, auto overflow_handler>
struct fmt::formatter<lvec::linked_vec<T, I, overflow_handler>>
{
    constexpr auto parse( format_parse_context & ctx ) { return ctx.begin(); }

    template <typename FormatContext>
    auto format( lvec::linked_vec<T, I, overflow_handler> const & list, FormatContext & ctx ) const
    {
        auto out{ ctx.out() };
        *out++ = '{';
        bool first{ true };
        for ( auto const position : list.physical_indices() )
        {
            if ( !first )
                out = fmt::format_to( out, ", " );
            first = false;
            if constexpr ( lvec::string_viewable<T> ) // quoted and escaped
                out = fmt::format_to( out, "{}: {:?}", position, std::basic_string_view<typename T::value_type, typename T::traits_type>{ list[ position ] } );
            else
                out = fmt::format_to( out, "{}: {}", position, list[ position ] );
        }
        *out++ = '}';
        return out;
    }
}; // fmt::formatter<linked_vec>

//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

template <typename T, store_index I, auto overflow_handler>
std::string to_debug_string( linked_vec<T, I, overflow_handler> const & list ) { return fmt::format( "{}", list ); }

template <typename T, store_index I, auto overflow_handler>
std::ostream & operator<<( std::ostream & os, linked_vec<T, I, overflow_handler> const & list ) { return os << to_debug_string( list ); }

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
