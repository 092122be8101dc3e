////////////////////////////////////////////////////////////////////////////////
/// Dense node pool for linked_vec: nodes live in one contiguous array and are
/// addressed by their physical position - there are no per-node allocations
/// and no holes (removal relocates the last node, see swap_remove()).
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

#include <lvec/containers/index.hpp>
#include <lvec/error/error.hpp>

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>

#include <algorithm>
#include <cstdint>
#include <new>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// \struct node
////////////////////////////////////////////////////////////////////////////////

template <typename T, store_index I>
struct node
{
    using value_type = T;
    using index_type = I;

    template <typename ... Args>
    constexpr explicit node( std::in_place_t, Args && ... args ) noexcept( std::is_nothrow_constructible_v<T, Args...> )
        : payload( std::forward<Args>( args )... ) {}

    T       payload;
    link<I> next{};
    link<I> prev{};
}; // struct node

static_assert( sizeof( node<std::int64_t, nonmax<std::uint32_t>> ) == 16 );


////////////////////////////////////////////////////////////////////////////////
// \class node_store
////////////////////////////////////////////////////////////////////////////////

template <typename T, store_index I>
class node_store
{
public:
    using node_type  = node<T, I>;
    using value_type = T;
    using index_type = I;
    using size_type  = position_t;

    [[ nodiscard, gnu::pure ]] size_type size    () const noexcept { return nodes_.size    (); }
    [[ nodiscard, gnu::pure ]] size_type capacity() const noexcept { return nodes_.capacity(); }
    [[ nodiscard, gnu::pure ]] bool      empty   () const noexcept { return nodes_.empty   (); }

    [[ nodiscard, gnu::pure ]] node_type       & operator[]( size_type const position )       noexcept { BOOST_ASSERT( position < size() ); return nodes_[ position ]; }
    [[ nodiscard, gnu::pure ]] node_type const & operator[]( size_type const position ) const noexcept { BOOST_ASSERT( position < size() ); return nodes_[ position ]; }

    [[ nodiscard, gnu::pure ]] std::span<node_type      > span()       noexcept { return nodes_; }
    [[ nodiscard, gnu::pure ]] std::span<node_type const> span() const noexcept { return nodes_; }

    // Appends an unlinked node at the physical end. The caller is responsible
    // for the index space check (size() <= index_codec<I>::max_position).
    template <typename ... Args>
    index_type emplace_back( Args && ... args )
    {
        auto const position{ size() };
        BOOST_ASSUME( position <= index_codec<I>::max_position );
        nodes_.emplace_back( std::in_place, std::forward<Args>( args )... );
        return index_codec<I>::from_position_unchecked( position );
    }

    value_type pop_back() noexcept( std::is_nothrow_move_constructible_v<T> )
    {
        BOOST_ASSUME( !empty() );
        value_type payload( std::move( nodes_.back().payload ) );
        nodes_.pop_back();
        return payload;
    }

    // Moves the last node into the given (non-last) slot and shrinks by one.
    // The relocated node keeps its links - repairing its neighbours is up to
    // the caller.
    value_type swap_remove( size_type const position ) noexcept( std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_assignable_v<T> )
    {
        BOOST_ASSUME( position + 1 < size() );
        auto & target{ nodes_[ position ] };
        value_type payload( std::move( target.payload ) );
        target = std::move( nodes_.back() );
        nodes_.pop_back();
        return payload;
    }

    void swap_payloads( size_type const a, size_type const b ) noexcept( std::is_nothrow_swappable_v<T> )
    {
        BOOST_ASSERT( a < size() && b < size() );
        if ( a == b )
            return;
        using std::swap;
        swap( nodes_[ a ].payload, nodes_[ b ].payload );
    }

    // Geometric growth (1.5x, capped at max_capacity); never shrinks.
    result_or_error<void, reserve_error> try_reserve_total( size_type const target_capacity, size_type const max_capacity ) noexcept
    {
        try
        {
            reserve_total( target_capacity, max_capacity );
        }
        catch ( std::length_error const & ) { return reserve_error::capacity_overflow;  }
        catch ( std::bad_alloc    const & ) { return reserve_error::allocation_failure; }
        return err::success;
    }

    void reserve_total( size_type const target_capacity, size_type const max_capacity )
    {
        BOOST_ASSERT( target_capacity <= max_capacity );
        auto const current_capacity{ capacity() };
        if ( target_capacity <= current_capacity )
            return;
        auto const geometric{ std::min( { current_capacity + current_capacity / 2, max_capacity, nodes_.max_size() } ) };
        nodes_.reserve( std::max( target_capacity, geometric ) );
    }

    void clear() noexcept { nodes_.clear(); }

    void swap( node_store & other ) noexcept { nodes_.swap( other.nodes_ ); }

private:
    std::vector<node_type> nodes_;
}; // class node_store

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
