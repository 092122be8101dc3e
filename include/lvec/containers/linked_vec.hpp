////////////////////////////////////////////////////////////////////////////////
/// Doubly linked list with densely packed, array backed nodes
///
/// All nodes live in one contiguous node_store and link to each other through
/// (configurably narrow) store indices instead of pointers. Removal keeps the
/// store dense by relocating the physically last node into the vacated slot
/// and patching its neighbours' links (swap-relink), so every operation other
/// than growth is O(1) and allocation free.
/// Elements are addressed two ways:
///  * logically - by list order (iteration, cursors' index_l)
///  * physically - by slot (get_p, swap_p, swap_remove, cursors' index_p).
/// Physical positions are stable across insertions but any removal may move
/// the last node (a stale physical position then names a different element).
/// An exception escaping a modifier after unlinking has begun (a throwing move
/// of T) leaves the links unspecified: the container may then only be cleared
/// or destroyed.
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

#include <lvec/containers/cursor.hpp>
#include <lvec/containers/index.hpp>
#include <lvec/containers/iterators.hpp>
#include <lvec/containers/node_store.hpp>
#include <lvec/error/error.hpp>

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

struct assert_on_overflow {
    [[ noreturn ]] void operator()() const noexcept {
        BOOST_ASSERT_MSG( false, "linked_vec index space overflow!" );
        std::unreachable();
    }
}; // assert_on_overflow
struct throw_on_overflow {
    [[ noreturn ]] void operator()() const { detail::throw_capacity_overflow(); }
}; // throw_on_overflow

////////////////////////////////////////////////////////////////////////////////
// \class linked_vec
//
// I - the store index type: a native integer or nonmax<> (see index.hpp). It
//     bounds the number of elements to index_codec<I>::max_position + 1.
// overflow_handler - invoked when an insertion would exceed that bound.
////////////////////////////////////////////////////////////////////////////////

template <typename T, store_index I = std::size_t, auto overflow_handler = throw_on_overflow{}>
class linked_vec
{
public:
    using value_type      = T;
    using reference       = T       &;
    using const_reference = T const &;
    using pointer         = T       *;
    using const_pointer   = T const *;
    using size_type       = position_t;
    using difference_type = std::ptrdiff_t;
    using index_type      = I;
    using codec           = index_codec<I>;
    using node_type       = node<T, I>;

    using       iterator         = linked_vec_iterator<linked_vec      >;
    using const_iterator         = linked_vec_iterator<linked_vec const>;
    using       reverse_iterator = std::reverse_iterator<      iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    using cursor     = basic_cursor<linked_vec const>;
    using cursor_mut = basic_cursor<linked_vec      >;

    static size_type constexpr max_position{ codec::max_position };

    constexpr linked_vec() noexcept = default;

    template <std::input_iterator It, std::sentinel_for<It> S>
    linked_vec( It const first, S const last ) { extend( std::ranges::subrange( first, last ) ); }

    linked_vec( std::initializer_list<T> const values ) : linked_vec( values.begin(), values.end() ) {}

    linked_vec( linked_vec const & ) = default;
    linked_vec( linked_vec && other ) noexcept
        :
        nodes_{ std::move( other.nodes_ ) },
        head_ { std::exchange( other.head_, {} ) },
        tail_ { std::exchange( other.tail_, {} ) }
    {
        other.nodes_.clear();
    }

    linked_vec & operator=( linked_vec const & ) = default;
    linked_vec & operator=( linked_vec && other ) noexcept
    {
        linked_vec{ std::move( other ) }.swap( *this );
        return *this;
    }

    ~linked_vec() noexcept = default;

    //--------------------------------------------------------------------------
    // capacity
    //--------------------------------------------------------------------------

    [[ nodiscard, gnu::pure ]] size_type size    () const noexcept { return nodes_.size    (); }
    [[ nodiscard, gnu::pure ]] size_type capacity() const noexcept { return nodes_.capacity(); }
    [[ nodiscard, gnu::pure ]] bool      empty   () const noexcept { return nodes_.empty   (); }

    // max_position + 1, saturated
    [[ nodiscard, gnu::const ]] static constexpr size_type max_size() noexcept
    {
        return ( max_position == static_cast<size_type>( -1 ) ) ? max_position : max_position + 1;
    }

    // Ensures room for additional more elements. Fails with capacity_overflow
    // if the index type (or the allocator) cannot address that many elements
    // and with allocation_failure if the allocation itself fails.
    [[ nodiscard ]] result_or_error<void, reserve_error> try_reserve( size_type const additional ) noexcept
    {
        if ( additional > max_size() - size() )
            return reserve_error::capacity_overflow;
        return nodes_.try_reserve_total( size() + additional, max_size() );
    }

    void reserve( size_type const additional )
    {
        if ( additional > max_size() - size() ) [[ unlikely ]]
            overflow_handler();
        nodes_.reserve_total( size() + additional, max_size() );
    }

    //--------------------------------------------------------------------------
    // element access
    //--------------------------------------------------------------------------

    // nullptr if empty
    [[ nodiscard, gnu::pure ]] pointer       front()       noexcept { return head_ ? &node_at( head_ ).payload : nullptr; }
    [[ nodiscard, gnu::pure ]] const_pointer front() const noexcept { return head_ ? &node_at( head_ ).payload : nullptr; }
    [[ nodiscard, gnu::pure ]] pointer       back ()       noexcept { return tail_ ? &node_at( tail_ ).payload : nullptr; }
    [[ nodiscard, gnu::pure ]] const_pointer back () const noexcept { return tail_ ? &node_at( tail_ ).payload : nullptr; }

    // by physical position
    [[ nodiscard ]] reference       get_p( size_type const position )       { check_position( position ); return nodes_[ position ].payload; }
    [[ nodiscard ]] const_reference get_p( size_type const position ) const { check_position( position ); return nodes_[ position ].payload; }

    [[ nodiscard, gnu::pure ]] reference       operator[]( size_type const position )       noexcept { return nodes_[ position ].payload; }
    [[ nodiscard, gnu::pure ]] const_reference operator[]( size_type const position ) const noexcept { return nodes_[ position ].payload; }

    //--------------------------------------------------------------------------
    // link introspection (physical positions, none at the ends)
    //--------------------------------------------------------------------------

    [[ nodiscard, gnu::pure ]] std::optional<size_type> head_p() const noexcept { return to_position( head_ ); }
    [[ nodiscard, gnu::pure ]] std::optional<size_type> tail_p() const noexcept { return to_position( tail_ ); }
    [[ nodiscard, gnu::pure ]] std::optional<size_type> next_p( size_type const position ) const noexcept { return to_position( nodes_[ position ].next ); }
    [[ nodiscard, gnu::pure ]] std::optional<size_type> prev_p( size_type const position ) const noexcept { return to_position( nodes_[ position ].prev ); }

    //--------------------------------------------------------------------------
    // modifiers
    //--------------------------------------------------------------------------

    template <typename ... Args>
    reference emplace_front( Args && ... args )
    {
        auto const inserted{ push_p( std::forward<Args>( args )... ) };
        insert_node_before( inserted, head_ );
        return node_at( inserted ).payload;
    }

    template <typename ... Args>
    reference emplace_back( Args && ... args )
    {
        auto const inserted{ push_p( std::forward<Args>( args )... ) };
        insert_node_after( inserted, tail_ );
        return node_at( inserted ).payload;
    }

    void push_front( T const &  value ) { emplace_front(            value   ); }
    void push_front( T       && value ) { emplace_front( std::move( value ) ); }
    void push_back ( T const &  value ) { emplace_back (            value   ); }
    void push_back ( T       && value ) { emplace_back ( std::move( value ) ); }

    std::optional<T> pop_front()
    {
        if ( !head_ )
            return std::nullopt;
        return swap_remove_unchecked( to_position( *head_ ) );
    }

    std::optional<T> pop_back()
    {
        if ( !tail_ )
            return std::nullopt;
        return swap_remove_unchecked( to_position( *tail_ ) );
    }

    // removes the physically last node (not necessarily the logical back)
    std::optional<T> pop()
    {
        if ( empty() )
            return std::nullopt;
        unlink( size() - 1 );
        return nodes_.pop_back();
    }

    // Removes the node at the given physical position, moving the physically
    // last node into its slot. Throws std::out_of_range.
    T swap_remove( size_type const position )
    {
        check_position( position );
        return swap_remove_unchecked( position );
    }

    // exchanges payloads only, list order is untouched
    void swap_p( size_type const a, size_type const b )
    {
        check_position( a );
        check_position( b );
        nodes_.swap_payloads( a, b );
    }

    void clear() noexcept
    {
        nodes_.clear();
        head_ = tail_ = {};
    }

    // Moves all elements of other to the back of this list (in their logical
    // order) leaving other empty but usable.
    void append( linked_vec & other )
    {
        BOOST_ASSERT_MSG( &other != this, "Appending a list to itself" );
        if ( empty() )
        {
            swap( other );
            return;
        }
        reserve( other.size() );
        for ( auto & value : other )
            emplace_back( std::move( value ) );
        other.clear();
    }
    void append( linked_vec && other ) { append( other ); }

    template <std::ranges::input_range Rng>
    void extend( Rng && values )
    {
        if constexpr ( std::is_same_v<std::remove_cvref_t<Rng>, linked_vec> )
            BOOST_ASSERT_MSG( &values != this, "Extending a list with itself" );
        if constexpr ( std::ranges::sized_range<Rng> )
        {
            // best effort: an unsatisfiable reservation surfaces as an
            // overflow at the exact push that exceeds the index space
            std::ignore = try_reserve( static_cast<size_type>( std::ranges::size( values ) ) );
        }
        for ( auto && value : values )
            emplace_back( std::forward<decltype( value )>( value ) );
    }
    void extend( linked_vec && other ) { append( other ); }

    void swap( linked_vec & other ) noexcept
    {
        nodes_.swap( other.nodes_ );
        std::swap( head_, other.head_ );
        std::swap( tail_, other.tail_ );
    }
    friend void swap( linked_vec & left, linked_vec & right ) noexcept { left.swap( right ); }

    //--------------------------------------------------------------------------
    // lookup
    //--------------------------------------------------------------------------

    [[ nodiscard ]] bool contains( T const & value ) const
    {
        return std::ranges::any_of( nodes_.span(), [ & ]( node_type const & candidate ) { return candidate.payload == value; } );
    }

    //--------------------------------------------------------------------------
    // iteration (logical order)
    //--------------------------------------------------------------------------

    [[ nodiscard ]]       iterator  begin()       noexcept { return {  *this, head_p() }; }
    [[ nodiscard ]] const_iterator  begin() const noexcept { return {  *this, head_p() }; }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]]       iterator  end  ()       noexcept { return {  *this, std::nullopt }; }
    [[ nodiscard ]] const_iterator  end  () const noexcept { return {  *this, std::nullopt }; }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end(); }

    [[ nodiscard ]]       reverse_iterator rbegin()       noexcept { return       reverse_iterator{ end() }; }
    [[ nodiscard ]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    [[ nodiscard ]]       reverse_iterator rend  ()       noexcept { return       reverse_iterator{ begin() }; }
    [[ nodiscard ]] const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    // physical positions of the elements, in logical order
    [[ nodiscard ]] auto physical_indices() const noexcept
    {
        using iter = physical_index_iterator<linked_vec>;
        return std::ranges::subrange<iter>{ iter{ *this, head_p() }, iter{ *this, std::nullopt } };
    }

    [[ nodiscard ]] exclusive_range<linked_vec> iter_mut() { return exclusive_range<linked_vec>{ *this }; }

    [[ nodiscard ]] consuming_range<linked_vec> consume() && noexcept { return consuming_range<linked_vec>{ std::move( *this ) }; }

    //--------------------------------------------------------------------------
    // cursors
    //--------------------------------------------------------------------------

    [[ nodiscard ]] cursor cursor_front() const noexcept { return { *this, front_position() }; }
    [[ nodiscard ]] cursor cursor_back () const noexcept { return { *this, back_position () }; }

    [[ nodiscard ]] cursor_mut cursor_front_mut() noexcept { return { *this, front_position() }; }
    [[ nodiscard ]] cursor_mut cursor_back_mut () noexcept { return { *this, back_position () }; }

    //--------------------------------------------------------------------------
    // diagnostics
    //--------------------------------------------------------------------------

    // Walks the list from the head and checks link symmetry, the head/tail
    // markers, index bounds and that every node is visited exactly once.
    [[ nodiscard ]] bool verify_links() const noexcept
    {
        if ( !head_ || !tail_ )
            return !head_ && !tail_ && empty();

        size_type   visited{ 0 };
        link<I>     previous{};
        for ( auto current{ head_ }; current; )
        {
            auto const position{ to_position( *current ) };
            if ( ( position >= size() ) || ( visited == size() ) )
                return false;
            auto const & entry{ nodes_[ position ] };
            if ( entry.prev != previous )
                return false;
            previous = current;
            current  = entry.next;
            ++visited;
        }
        return ( visited == size() ) && ( previous == tail_ );
    }

    //--------------------------------------------------------------------------
    // comparison (logical order)
    //--------------------------------------------------------------------------

    [[ nodiscard ]] friend bool operator==( linked_vec const & left, linked_vec const & right )
    {
        return ( left.size() == right.size() ) && std::equal( left.begin(), left.end(), right.begin(), right.end() );
    }

    // unordered (for partially ordered T) iff the first non-equivalent pair is
    [[ nodiscard ]] friend auto operator<=>( linked_vec const & left, linked_vec const & right ) requires std::three_way_comparable<T, std::partial_ordering>
    {
        return std::lexicographical_compare_three_way( left.begin(), left.end(), right.begin(), right.end() );
    }

private:
    [[ gnu::const ]] static size_type to_position( I const index ) noexcept { return codec::to_position_unchecked( index ); }
    [[ gnu::const ]] static std::optional<size_type> to_position( link<I> const target ) noexcept
    {
        if ( target )
            return to_position( *target );
        return std::nullopt;
    }

    void check_position( size_type const position ) const
    {
        if ( position >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "linked_vec physical position out of bounds" );
    }

    std::optional<cursor_position> front_position() const noexcept { return head_ ? std::optional<cursor_position>{ cursor_position{ 0         , to_position( *head_ ) } } : std::nullopt; }
    std::optional<cursor_position> back_position () const noexcept { return tail_ ? std::optional<cursor_position>{ cursor_position{ size() - 1, to_position( *tail_ ) } } : std::nullopt; }

    node_type       & node_at( I       const index )       noexcept { return nodes_[ to_position( index ) ]; }
    node_type const & node_at( I       const index ) const noexcept { return nodes_[ to_position( index ) ]; }
    node_type       & node_at( link<I> const index )       noexcept { return node_at( *index ); }
    node_type const & node_at( link<I> const index ) const noexcept { return node_at( *index ); }

    // appends an unlinked node
    template <typename ... Args>
    I push_p( Args && ... args )
    {
        if ( size() > max_position ) [[ unlikely ]]
            overflow_handler();
        return nodes_.emplace_back( std::forward<Args>( args )... );
    }

    // the absent link stands for the head/tail marker
    link<I> get_next( link<I> const target ) const noexcept { return target ? node_at( target ).next : head_; }
    link<I> get_prev( link<I> const target ) const noexcept { return target ? node_at( target ).prev : tail_; }

    void set_next( link<I> const target, link<I> const value ) noexcept { ( target ? node_at( target ).next : head_ ) = value; }
    void set_prev( link<I> const target, link<I> const value ) noexcept { ( target ? node_at( target ).prev : tail_ ) = value; }

    void pair( link<I> const first, link<I> const second ) noexcept
    {
        set_next( first , second );
        set_prev( second, first  );
    }

    void insert_node_before( I const inserted, link<I> const target ) noexcept
    {
        auto const other{ get_prev( target ) };
        pair( other   , inserted );
        pair( inserted, target   );
    }

    void insert_node_after( I const inserted, link<I> const target ) noexcept
    {
        auto const other{ get_next( target ) };
        pair( target  , inserted );
        pair( inserted, other    );
    }

    // detaches the node from its neighbours (it stays in the store)
    void unlink( size_type const position ) noexcept
    {
        auto const & entry{ nodes_[ position ] };
        pair( entry.prev, entry.next );
    }

    // points the neighbours of a node that was just relocated to position
    // back at it
    void relink_moved( size_type const position ) noexcept
    {
        auto const   stored{ codec::from_position_unchecked( position ) };
        auto const & entry { nodes_[ position ] };
        set_next( entry.prev, stored );
        set_prev( entry.next, stored );
    }

    T swap_remove_unchecked( size_type const position )
    {
        BOOST_ASSUME( position < size() );
        unlink( position );
        if ( position == size() - 1 )
            return nodes_.pop_back();
        auto payload{ nodes_.swap_remove( position ) };
        relink_moved( position );
        return payload;
    }

    node_store<T, I> nodes_;
    link<I>          head_;
    link<I>          tail_;
}; // class linked_vec

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
