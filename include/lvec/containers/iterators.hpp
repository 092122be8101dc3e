////////////////////////////////////////////////////////////////////////////////
/// linked_vec traversal
///
/// * iterator/const_iterator: bidirectional, logical order, the ghost (end)
///   position sits between tail and head
/// * physical_index_iterator: yields physical positions in logical order
/// * exclusive_range: mutable traversal that hands out every payload at most
///   once, from either end
/// * consuming_range: owns the list and pops from either end
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
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// \class logical_walk
//
// Position state shared by the bidirectional iterators: a list and the
// physical position of the current node (none at the ghost/end position).
////////////////////////////////////////////////////////////////////////////////

template <typename List>
class logical_walk
{
public:
    constexpr logical_walk() noexcept = default;
    constexpr logical_walk( List & list, std::optional<position_t> const position ) noexcept : list_{ &list }, position_{ position } {}

    // mutable -> const
    template <typename MutableList>
    requires std::is_same_v<List, MutableList const>
    constexpr logical_walk( logical_walk<MutableList> const & other ) noexcept : list_{ other.list_ }, position_{ other.position_ } {}

    [[ gnu::pure ]] constexpr std::optional<position_t> index_p() const noexcept { return position_; }

    constexpr logical_walk & operator++() noexcept
    {
        BOOST_ASSERT_MSG( position_, "Incrementing the end iterator" );
        position_ = list_->next_p( *position_ );
        return *this;
    }

    // decrementing end() lands on the tail
    constexpr logical_walk & operator--() noexcept
    {
        position_ = position_ ? list_->prev_p( *position_ ) : list_->tail_p();
        BOOST_ASSERT_MSG( position_, "Decrementing the begin iterator" );
        return *this;
    }

    constexpr bool operator==( logical_walk const & other ) const noexcept
    {
        BOOST_ASSERT_MSG( !list_ || !other.list_ || ( list_ == other.list_ ), "Comparing iterators of different lists" );
        return position_ == other.position_;
    }

protected:
    [[ gnu::pure ]] constexpr List     & list    () const noexcept { BOOST_ASSUME( list_ ); return *list_; }
    [[ gnu::pure ]] constexpr position_t position() const noexcept { BOOST_ASSERT_MSG( position_, "Dereferencing the end iterator" ); return *position_; }

private: template <typename> friend class logical_walk;
    List *                    list_{};
    std::optional<position_t> position_;
}; // class logical_walk


////////////////////////////////////////////////////////////////////////////////
// \class linked_vec_iterator
////////////////////////////////////////////////////////////////////////////////

template <typename List>
class linked_vec_iterator
    :
    public logical_walk<List>,
    public boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        linked_vec_iterator<List>,
#   endif
        std::bidirectional_iterator_tag,
        typename std::remove_const_t<List>::value_type,
        std::conditional_t<std::is_const_v<List>, typename List::value_type const &, typename List::value_type &>,
        std::conditional_t<std::is_const_v<List>, typename List::value_type const *, typename List::value_type *>
    >
{
private:
    using walk = logical_walk<List>;
    using impl = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        linked_vec_iterator<List>,
#   endif
        std::bidirectional_iterator_tag,
        typename std::remove_const_t<List>::value_type,
        std::conditional_t<std::is_const_v<List>, typename List::value_type const &, typename List::value_type &>,
        std::conditional_t<std::is_const_v<List>, typename List::value_type const *, typename List::value_type *>
    >;

public:
    using walk::walk;

    constexpr linked_vec_iterator() noexcept = default;

    // iterator -> const_iterator
    template <typename MutableList>
    requires std::is_same_v<List, MutableList const>
    constexpr linked_vec_iterator( linked_vec_iterator<MutableList> const & other ) noexcept
        : walk{ static_cast<logical_walk<MutableList> const &>( other ) } {}

    typename impl::reference operator*() const noexcept { return this->list()[ this->position() ]; }

    constexpr linked_vec_iterator & operator++() noexcept { return static_cast<linked_vec_iterator &>( walk::operator++() ); }
    constexpr linked_vec_iterator & operator--() noexcept { return static_cast<linked_vec_iterator &>( walk::operator--() ); }
    using impl::operator++;
    using impl::operator--;

    friend constexpr bool operator==( linked_vec_iterator const & left, linked_vec_iterator const & right ) noexcept
    {
        return static_cast<walk const &>( left ) == static_cast<walk const &>( right );
    }
}; // class linked_vec_iterator


////////////////////////////////////////////////////////////////////////////////
// \class physical_index_iterator
//
// Yields, in logical order, the physical position of each node. Positions are
// only meaningful until the next removal.
////////////////////////////////////////////////////////////////////////////////

template <typename List>
class physical_index_iterator
    :
    public logical_walk<List const>,
    public boost::stl_interfaces::proxy_iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        physical_index_iterator<List>,
#   endif
        std::bidirectional_iterator_tag,
        position_t
    >
{
private:
    using walk = logical_walk<List const>;
    using impl = boost::stl_interfaces::proxy_iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        physical_index_iterator<List>,
#   endif
        std::bidirectional_iterator_tag,
        position_t
    >;

public:
    using walk::walk;

    constexpr physical_index_iterator() noexcept = default;

    constexpr position_t operator*() const noexcept { return this->position(); }

    constexpr physical_index_iterator & operator++() noexcept { return static_cast<physical_index_iterator &>( walk::operator++() ); }
    constexpr physical_index_iterator & operator--() noexcept { return static_cast<physical_index_iterator &>( walk::operator--() ); }
    using impl::operator++;
    using impl::operator--;

    friend constexpr bool operator==( physical_index_iterator const & left, physical_index_iterator const & right ) noexcept
    {
        return static_cast<walk const &>( left ) == static_cast<walk const &>( right );
    }
}; // class physical_index_iterator


////////////////////////////////////////////////////////////////////////////////
// \class exclusive_range
//
// Mutable double ended traversal. Every payload is reachable through exactly
// one handle in a per-slot scratch table and a handle is cleared as it is
// handed out so no element can be yielded twice (which would alias a mutable
// reference). The list must not be structurally modified while the range is
// alive.
////////////////////////////////////////////////////////////////////////////////

template <typename List>
class exclusive_range
{
public:
    using value_type = typename List::value_type;

    explicit exclusive_range( List & list )
        :
        list_     { &list },
        remaining_{ list.size() },
        front_    { list.head_p().value_or( 0 ) },
        back_     { list.tail_p().value_or( 0 ) }
    {
        handles_.reserve( list.size() );
        for ( position_t position{ 0 }; position < list.size(); ++position )
            handles_.push_back( &list[ position ] );
    }

    // returns nullptr when exhausted
    value_type * next() noexcept
    {
        if ( !remaining_ )
            return nullptr;
        --remaining_;
        auto const handle{ take( front_ ) };
        if ( remaining_ )
            front_ = *list_->next_p( front_ );
        return handle;
    }

    value_type * next_back() noexcept
    {
        if ( !remaining_ )
            return nullptr;
        --remaining_;
        auto const handle{ take( back_ ) };
        if ( remaining_ )
            back_ = *list_->prev_p( back_ );
        return handle;
    }

    [[ gnu::pure ]] position_t size () const noexcept { return remaining_; }
    [[ gnu::pure ]] bool       empty() const noexcept { return !remaining_; }

    class iterator
    {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type       = typename List::value_type;
        using difference_type  = std::ptrdiff_t;

        iterator() noexcept = default;
        iterator( exclusive_range & range ) noexcept : range_{ &range }, current_{ range.next() } {}

        value_type & operator*() const noexcept { BOOST_ASSUME( current_ ); return *current_; }

        iterator & operator++(   ) noexcept { current_ = range_->next(); return *this; }
        void       operator++(int) noexcept { ++*this; }

        friend bool operator==( iterator const & it, std::default_sentinel_t ) noexcept { return !it.current_; }

    private:
        exclusive_range * range_  {};
        value_type      * current_{};
    }; // class iterator

    iterator                begin()       noexcept { return { *this }; }
    std::default_sentinel_t end  () const noexcept { return {}; }

private:
    value_type * take( position_t const position ) noexcept
    {
        auto const handle{ std::exchange( handles_[ position ], nullptr ) };
        BOOST_ASSERT_MSG( handle, "Element already handed out" );
        return handle;
    }

    List *                    list_;
    std::vector<value_type *> handles_;
    position_t                remaining_;
    position_t                front_;
    position_t                back_;
}; // class exclusive_range


////////////////////////////////////////////////////////////////////////////////
// \class consuming_range
////////////////////////////////////////////////////////////////////////////////

template <typename List>
class consuming_range
{
public:
    using value_type = typename List::value_type;

    explicit consuming_range( List && list ) noexcept : list_{ std::move( list ) } {}

    std::optional<value_type> next     () { return list_.pop_front(); }
    std::optional<value_type> next_back() { return list_.pop_back (); }

    [[ gnu::pure ]] position_t size () const noexcept { return list_.size (); }
    [[ gnu::pure ]] bool       empty() const noexcept { return list_.empty(); }

    class iterator
    {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type       = typename List::value_type;
        using difference_type  = std::ptrdiff_t;

        iterator() noexcept = default;
        iterator( consuming_range & range ) : range_{ &range }, current_{ range.next() } {}

        value_type & operator*() const noexcept { BOOST_ASSUME( current_.has_value() ); return *current_; }

        iterator & operator++(   ) { current_ = range_->next(); return *this; }
        void       operator++(int) { ++*this; }

        friend bool operator==( iterator const & it, std::default_sentinel_t ) noexcept { return !it.current_.has_value(); }

    private:
        consuming_range *                 range_{};
        mutable std::optional<value_type> current_;
    }; // class iterator

    iterator                begin()                { return { *this }; }
    std::default_sentinel_t end  () const noexcept { return {}; }

private:
    List list_;
}; // class consuming_range

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
