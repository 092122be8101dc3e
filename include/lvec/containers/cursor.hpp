////////////////////////////////////////////////////////////////////////////////
/// linked_vec cursors
///
/// A cursor points either at a node, remembering both its logical (list order)
/// and physical (slot) position, or at the 'ghost' position that sits between
/// the tail and the head. Moving past either end lands on the ghost and moving
/// from the ghost lands on the head (forward) or the tail (backward).
/// basic_cursor<List const> is the shared (read-only) cursor, basic_cursor<List>
/// the exclusive (mutable, move-only) one. A nonempty_cursor can only exist
/// over a non-empty list, never sits on the ghost and wraps around instead.
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

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>

#include <optional>
#include <type_traits>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

struct cursor_position
{
    position_t logical;
    position_t physical;

    friend constexpr bool operator==( cursor_position const &, cursor_position const & ) noexcept = default;
};

template <typename List> class nonempty_cursor;

////////////////////////////////////////////////////////////////////////////////
// \class basic_cursor
////////////////////////////////////////////////////////////////////////////////

template <typename List>
class basic_cursor
{
public:
    using list_type  = List;
    using value_type = typename std::remove_const_t<List>::value_type;
    using pointer    = std::conditional_t<std::is_const_v<List>, value_type const *, value_type *>;

    static bool constexpr is_exclusive{ !std::is_const_v<List> };

    constexpr basic_cursor( List & list, std::optional<cursor_position> const position ) noexcept
        : list_{ &list }, position_{ position }
    {
        BOOST_ASSERT( !position_ || ( ( position_->logical < list.size() ) && ( position_->physical < list.size() ) ) );
    }

    constexpr basic_cursor( basic_cursor const &  ) noexcept requires( !is_exclusive ) = default;
    constexpr basic_cursor( basic_cursor       && ) noexcept = default;
    constexpr basic_cursor & operator=( basic_cursor const &  ) noexcept requires( !is_exclusive ) = default;
    constexpr basic_cursor & operator=( basic_cursor       && ) noexcept = default;

    // Trusted construction from a previously observed position pair: both
    // present (and matching) or both absent (ghost).
    static constexpr basic_cursor new_with_index_unchecked( List & list, std::optional<position_t> const logical, std::optional<position_t> const physical ) noexcept
    {
        BOOST_ASSERT_MSG( logical.has_value() == physical.has_value(), "Logical and physical positions must be both present or both absent" );
        if ( !physical )
            return { list, std::nullopt };
        return { list, cursor_position{ *logical, *physical } };
    }

    [[ gnu::pure ]] constexpr std::optional<position_t> index_l() const noexcept { return position_ ? std::optional<position_t>{ position_->logical  } : std::nullopt; }
    [[ gnu::pure ]] constexpr std::optional<position_t> index_p() const noexcept { return position_ ? std::optional<position_t>{ position_->physical } : std::nullopt; }

    [[ gnu::pure ]] constexpr bool is_ghost() const noexcept { return !position_; }

    // nullptr at the ghost position
    [[ gnu::pure ]] constexpr pointer current() const noexcept { return at( position_ ); }

    constexpr void move_next() noexcept { position_ = next_of( *list_, position_ ); }
    constexpr void move_prev() noexcept { position_ = prev_of( *list_, position_ ); }

    [[ gnu::pure ]] constexpr pointer peek_next() const noexcept { return at( next_of( *list_, position_ ) ); }
    [[ gnu::pure ]] constexpr pointer peek_prev() const noexcept { return at( prev_of( *list_, position_ ) ); }

    [[ gnu::pure ]] constexpr pointer front() const noexcept { return list_->front(); }
    [[ gnu::pure ]] constexpr pointer back () const noexcept { return list_->back (); }

    [[ gnu::pure ]] constexpr List & get_list() const noexcept { return *list_; }

    // read-only view sharing this position
    constexpr basic_cursor<List const> as_cursor() const noexcept { return { *list_, position_ }; }

    // none at the ghost position (which includes every cursor over an empty list)
    constexpr std::optional<nonempty_cursor<List const>> as_nonempty_cursor() const noexcept
    {
        if ( !position_ )
            return std::nullopt;
        return nonempty_cursor<List const>{ *list_, *position_ };
    }

private:
    constexpr pointer at( std::optional<cursor_position> const position ) const noexcept
    {
        if ( !position )
            return nullptr;
        return &( *list_ )[ position->physical ];
    }

    static constexpr std::optional<cursor_position> next_of( List & list, std::optional<cursor_position> const position ) noexcept
    {
        if ( !position )
        {
            if ( auto const head{ list.head_p() } )
                return cursor_position{ 0, *head };
            return std::nullopt;
        }
        if ( auto const next{ list.next_p( position->physical ) } )
            return cursor_position{ position->logical + 1, *next };
        return std::nullopt;
    }

    static constexpr std::optional<cursor_position> prev_of( List & list, std::optional<cursor_position> const position ) noexcept
    {
        if ( !position )
        {
            if ( auto const tail{ list.tail_p() } )
                return cursor_position{ list.size() - 1, *tail };
            return std::nullopt;
        }
        if ( auto const prev{ list.prev_p( position->physical ) } )
            return cursor_position{ position->logical - 1, *prev };
        return std::nullopt;
    }

    List *                         list_;
    std::optional<cursor_position> position_;
}; // class basic_cursor


////////////////////////////////////////////////////////////////////////////////
// \class nonempty_cursor
////////////////////////////////////////////////////////////////////////////////

template <typename List>
class nonempty_cursor
{
public:
    using list_type  = List;
    using value_type = typename std::remove_const_t<List>::value_type;
    using reference  = std::conditional_t<std::is_const_v<List>, value_type const &, value_type &>;

    constexpr nonempty_cursor( List & list, cursor_position const position ) noexcept
        : list_{ &list }, position_{ position }
    {
        BOOST_ASSERT( ( position.logical < list.size() ) && ( position.physical < list.size() ) );
    }

    [[ gnu::pure ]] constexpr position_t index_l() const noexcept { return position_.logical ; }
    [[ gnu::pure ]] constexpr position_t index_p() const noexcept { return position_.physical; }

    [[ gnu::pure ]] constexpr reference current() const noexcept { return ( *list_ )[ position_.physical ]; }

    // Returns false if the move wrapped around (from the tail to the head).
    constexpr bool move_next() noexcept
    {
        if ( auto const next{ list_->next_p( position_.physical ) } )
        {
            position_ = { position_.logical + 1, *next };
            return true;
        }
        position_ = { 0, *list_->head_p() };
        return false;
    }

    // Returns false if the move wrapped around (from the head to the tail).
    constexpr bool move_prev() noexcept
    {
        if ( auto const prev{ list_->prev_p( position_.physical ) } )
        {
            position_ = { position_.logical - 1, *prev };
            return true;
        }
        position_ = { list_->size() - 1, *list_->tail_p() };
        return false;
    }

    [[ gnu::pure ]] constexpr List & get_list() const noexcept { return *list_; }

    constexpr basic_cursor<List> as_cursor() const noexcept { return { *list_, position_ }; }

private:
    List *          list_;
    cursor_position position_;
}; // class nonempty_cursor

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
