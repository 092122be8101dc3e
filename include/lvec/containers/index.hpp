////////////////////////////////////////////////////////////////////////////////
/// Bounded index types for linked_vec links.
///
/// A store index is a (narrow) native integer, or a nonmax<> wrapper around
/// one, that the container uses instead of a full std::size_t to record the
/// physical slot of a node's neighbours. index_codec<> maps such an index to
/// and from an unbounded position (std::size_t) and publishes the largest
/// position the index can represent (max_position).
/// nonmax<Int> gives up its maximum bit pattern so that link<nonmax<Int>> (an
/// optional index) can use that pattern to encode 'no link' and remain exactly
/// sizeof( Int ) large - the plain integer flavour instead pays for a separate
/// presence flag.
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

#include <lvec/error/error.hpp>

#include <psi/build/disable_warnings.hpp>

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>

#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_GCC_OR_CLANG_DISABLE( -Wtype-limits ) // max_position == SIZE_MAX comparisons

// unbounded position count (physical or logical)
using position_t = std::size_t;

namespace detail
{
#ifdef __SIZEOF_INT128__
    using widest_unsigned = unsigned __int128;
#else
    using widest_unsigned = std::uintmax_t;
#endif

    template <typename T> bool constexpr is_int128{ false };
#ifdef __SIZEOF_INT128__
    template <> inline bool constexpr is_int128<         __int128>{ true };
    template <> inline bool constexpr is_int128<unsigned __int128>{ true };
#endif
} // namespace detail

// std::integral does not cover the 128 bit extensions in strict ISO mode
template <typename T>
concept index_integer =
    std::is_same_v<T, std::remove_cv_t<T>> &&
    !std::is_same_v<T, bool> &&
    ( std::integral<T> || detail::is_int128<T> );

namespace detail
{
    template <index_integer Int>
    bool constexpr is_signed_index{ static_cast<Int>( -1 ) < static_cast<Int>( 0 ) };

    template <index_integer Int>
    [[ gnu::const ]] constexpr Int integer_max() noexcept
    {
        auto constexpr bits      { sizeof( Int             ) * CHAR_BIT };
        auto constexpr wide_bits { sizeof( widest_unsigned ) * CHAR_BIT };
        auto constexpr all_ones  { static_cast<widest_unsigned>( -1 ) >> ( wide_bits - bits ) };
        if constexpr ( is_signed_index<Int> )
            return static_cast<Int>( all_ones >> 1 );
        else
            return static_cast<Int>( all_ones );
    }

    template <index_integer Int>
    [[ gnu::const ]] constexpr bool is_negative( Int const value ) noexcept
    {
        if constexpr ( is_signed_index<Int> ) return value < 0;
        else                                  return false;
    }

    // requires !is_negative( value )
    template <index_integer Int>
    [[ gnu::const ]] constexpr widest_unsigned widen( Int const value ) noexcept { return static_cast<widest_unsigned>( value ); }

    // min( integer maximum, position_t maximum )
    template <index_integer Int>
    [[ gnu::const ]] consteval position_t position_limit( Int const integer_maximum ) noexcept
    {
        auto constexpr position_max{ static_cast<widest_unsigned>( static_cast<position_t>( -1 ) ) };
        auto const     maximum     { widen( integer_maximum ) };
        return static_cast<position_t>( maximum < position_max ? maximum : position_max );
    }
} // namespace detail


////////////////////////////////////////////////////////////////////////////////
// \class nonmax
////////////////////////////////////////////////////////////////////////////////

template <index_integer Int>
class [[ clang::trivial_abi ]] nonmax
{
public:
    using value_type = Int;

    // reserved bit pattern (never a valid value - used by link<nonmax> as 'absent')
    static Int constexpr niche{ detail::integer_max<Int>() };
    static Int constexpr max  { static_cast<Int>( niche - 1 ) };

    constexpr nonmax() noexcept = default;

    static result_or_error<nonmax, conversion_error> try_new( Int const value ) noexcept
    {
        if ( value == niche ) [[ unlikely ]]
            return conversion_error::out_of_range;
        return nonmax{ value };
    }

    [[ gnu::const ]] static constexpr nonmax new_unchecked( Int const value ) noexcept
    {
        BOOST_ASSUME( value != niche );
        return nonmax{ value };
    }

    [[ gnu::pure ]] constexpr Int get() const noexcept { return value_; }

    friend constexpr bool operator== ( nonmax const &, nonmax const & ) noexcept = default;
    friend constexpr auto operator<=>( nonmax const &, nonmax const & ) noexcept = default;

private:
    constexpr explicit nonmax( Int const value ) noexcept : value_{ value } {}

    Int value_{};
}; // class nonmax


////////////////////////////////////////////////////////////////////////////////
// \struct index_codec
//
// to_position and from_position come in two flavours:
//  * checked - to_position, try_from_position and from_position (the latter
//    throws std::out_of_range exactly when try_from_position would fail)
//  * unchecked - the trusted fast path: the caller guarantees that the value
//    originates from a checked conversion (or, for positions, that it does not
//    exceed max_position). The precondition is verified (only) in debug builds.
////////////////////////////////////////////////////////////////////////////////

template <typename I>
struct index_codec;

template <index_integer Int>
struct index_codec<Int>
{
    using index_type = Int;

    static position_t constexpr max_position{ detail::position_limit( detail::integer_max<Int>() ) };

    [[ gnu::const ]] static constexpr position_t get_max() noexcept { return max_position; }

    static constexpr position_t to_position( Int const value )
    {
        if ( detail::is_negative( value ) || ( detail::widen( value ) > max_position ) ) [[ unlikely ]]
            detail::throw_conversion_failure();
        return static_cast<position_t>( value );
    }

    [[ gnu::const ]] static constexpr position_t to_position_unchecked( Int const value ) noexcept
    {
        BOOST_ASSUME( !detail::is_negative( value ) );
        BOOST_ASSUME( detail::widen( value ) <= max_position );
        return static_cast<position_t>( value );
    }

    static result_or_error<Int, conversion_error> try_from_position( position_t const position ) noexcept
    {
        if ( position > max_position ) [[ unlikely ]]
            return conversion_error::out_of_range;
        return static_cast<Int>( position );
    }

    static Int from_position( position_t const position )
    {
        auto const index{ try_from_position( position ) };
        if ( !index ) [[ unlikely ]]
            detail::throw_conversion_failure();
        return *index;
    }

    [[ gnu::const ]] static constexpr Int from_position_unchecked( position_t const position ) noexcept
    {
        BOOST_ASSUME( position <= max_position );
        return static_cast<Int>( position );
    }
}; // index_codec<Int>

template <index_integer Int>
struct index_codec<nonmax<Int>>
{
    using index_type = nonmax<Int>;

    static position_t constexpr max_position{ detail::position_limit( nonmax<Int>::max ) };

    [[ gnu::const ]] static constexpr position_t get_max() noexcept { return max_position; }

    static constexpr position_t to_position( index_type const value )
    {
        auto const raw{ value.get() };
        if ( detail::is_negative( raw ) || ( detail::widen( raw ) > max_position ) ) [[ unlikely ]]
            detail::throw_conversion_failure();
        return static_cast<position_t>( raw );
    }

    [[ gnu::const ]] static constexpr position_t to_position_unchecked( index_type const value ) noexcept
    {
        auto const raw{ value.get() };
        BOOST_ASSUME( !detail::is_negative( raw ) );
        BOOST_ASSUME( detail::widen( raw ) <= max_position );
        return static_cast<position_t>( raw );
    }

    static result_or_error<index_type, conversion_error> try_from_position( position_t const position ) noexcept
    {
        if ( position > max_position ) [[ unlikely ]]
            return conversion_error::out_of_range;
        return index_type::new_unchecked( static_cast<Int>( position ) );
    }

    static index_type from_position( position_t const position )
    {
        auto const index{ try_from_position( position ) };
        if ( !index ) [[ unlikely ]]
            detail::throw_conversion_failure();
        return *index;
    }

    [[ gnu::const ]] static constexpr index_type from_position_unchecked( position_t const position ) noexcept
    {
        BOOST_ASSUME( position <= max_position );
        return index_type::new_unchecked( static_cast<Int>( position ) );
    }
}; // index_codec<nonmax<Int>>

template <typename I>
concept store_index =
    std::is_trivially_copyable_v<I> &&
    requires( I const index, position_t const position )
    {
        { index_codec<I>::max_position                        } -> std::convertible_to<position_t>;
        { index_codec<I>::to_position_unchecked  ( index    ) } -> std::same_as<position_t>;
        { index_codec<I>::from_position_unchecked( position ) } -> std::same_as<I>;
    };


////////////////////////////////////////////////////////////////////////////////
// \class link
//
// An optional store index ('next'/'prev' of a node, list head and tail).
////////////////////////////////////////////////////////////////////////////////

template <store_index I>
class link
{
public:
    using index_type = I;

    constexpr link(                    ) noexcept = default;
    constexpr link( std::nullopt_t     ) noexcept {}
    constexpr link( index_type const i ) noexcept : index_{ i } {}

    [[ gnu::pure ]] constexpr explicit operator bool() const noexcept { return index_.has_value(); }

    [[ gnu::pure ]] constexpr index_type operator*() const noexcept { BOOST_ASSUME( index_.has_value() ); return *index_; }

    friend constexpr bool operator==( link const &, link const & ) noexcept = default;

private:
    std::optional<index_type> index_;
}; // class link

// niche-packed specialization: 'absent' is stored as nonmax<Int>::niche
template <index_integer Int>
class [[ clang::trivial_abi ]] link<nonmax<Int>>
{
public:
    using index_type = nonmax<Int>;

    constexpr link(                    ) noexcept = default;
    constexpr link( std::nullopt_t     ) noexcept {}
    constexpr link( index_type const i ) noexcept : bits_{ i.get() } {}

    [[ gnu::pure ]] constexpr explicit operator bool() const noexcept { return bits_ != index_type::niche; }

    [[ gnu::pure ]] constexpr index_type operator*() const noexcept { return index_type::new_unchecked( bits_ ); }

    friend constexpr bool operator==( link const &, link const & ) noexcept = default;

private:
    Int bits_{ index_type::niche };
}; // class link<nonmax>

static_assert( sizeof( link<nonmax<std::uint8_t >> ) == sizeof( std::uint8_t  ) );
static_assert( sizeof( link<nonmax<std::uint32_t>> ) == sizeof( std::uint32_t ) );
static_assert( sizeof( link<nonmax<std::size_t  >> ) == sizeof( std::size_t   ) );

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
