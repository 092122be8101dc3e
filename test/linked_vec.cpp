#include <lvec/containers/linked_vec.hpp>
#include <lvec/containers/linked_vec_print.hpp>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>
//------------------------------------------------------------------------------
namespace lvec
{
//------------------------------------------------------------------------------

namespace
{
    template <typename List>
    std::vector<typename List::value_type> to_vector( List const & list ) { return { list.begin(), list.end() }; }
} // anonymous namespace

TEST( linked_vec, push_pop )
{
    linked_vec<std::intptr_t> list;
    EXPECT_TRUE( list.empty() );
    list.push_back( 3 );
    list.push_back( 4 );
    list.push_back( 5 );
    EXPECT_EQ( list.size(), 3 );

    EXPECT_EQ( list.pop(), 5 );
    EXPECT_EQ( list.size(), 2 );
    EXPECT_EQ( list.pop_back(), 4 );
    EXPECT_EQ( list.size(), 1 );
    EXPECT_EQ( list.pop(), 3 );
    EXPECT_EQ( list.size(), 0 );
    EXPECT_EQ( list.pop(), std::nullopt );
    EXPECT_EQ( list.size(), 0 );
    EXPECT_TRUE( list.verify_links() );
}

TEST( linked_vec, move_only_payload )
{
    linked_vec<std::unique_ptr<int>> m;
    EXPECT_FALSE( m.pop_front() );
    EXPECT_FALSE( m.pop_back () );
    m.push_front( std::make_unique<int>( 1 ) );
    EXPECT_EQ( **m.pop_front(), 1 );
    m.push_back( std::make_unique<int>( 2 ) );
    m.push_back( std::make_unique<int>( 3 ) );
    EXPECT_EQ( m.size(), 2 );
    EXPECT_EQ( **m.pop_front(), 2 );
    EXPECT_EQ( **m.pop_front(), 3 );
    EXPECT_EQ( m.size(), 0 );
    EXPECT_FALSE( m.pop_front() );
    for ( auto const value : { 1, 3, 5, 7 } )
        m.push_back( std::make_unique<int>( value ) );
    EXPECT_EQ( **m.pop_front(), 1 );
    EXPECT_TRUE( m.verify_links() );

    linked_vec<int> n;
    EXPECT_EQ( n.front(), nullptr );
    EXPECT_EQ( n.back (), nullptr );
    n.push_front( 2 );
    n.push_front( 3 );
    ASSERT_NE( n.front(), nullptr );
    EXPECT_EQ( *n.front(), 3 );
    *n.front() = 0;
    EXPECT_EQ( *n.back(), 2 );
    *n.back() = 1;
    EXPECT_EQ( n.pop_front(), 0 );
    EXPECT_EQ( n.pop_front(), 1 );
}

TEST( linked_vec, element_lifetimes )
{
    static int alive;
    struct element
    {
        element(                 ) noexcept { ++alive; }
        element( element const & ) noexcept { ++alive; }
        element & operator=( element const & ) noexcept = default;
        ~element() noexcept { --alive; }
    };

    alive = 0;
    {
        linked_vec<element> ring;
        ring.emplace_back ();
        ring.emplace_front();
        ring.emplace_back ();
        ring.emplace_front();
        EXPECT_EQ( alive, 4 );

        std::ignore = ring.pop_back ();
        std::ignore = ring.pop_front();
        EXPECT_EQ( alive, 2 );
        EXPECT_TRUE( ring.verify_links() );
    }
    EXPECT_EQ( alive, 0 );

    linked_vec<element> ring;
    ring.emplace_back ();
    ring.emplace_front();
    ring.emplace_back ();
    EXPECT_EQ( alive, 3 );
    ring.clear();
    EXPECT_EQ( alive, 0 );
    EXPECT_TRUE( ring.verify_links() );
}

TEST( linked_vec, debug_representation )
{
    linked_vec<int> list;
    list.extend( std::views::iota( 0, 10 ) );
    std::ignore = list.pop_front();
    list.push_front( 0 );
    EXPECT_EQ( to_debug_string( list ), "{9: 0, 1: 1, 2: 2, 3: 3, 4: 4, 5: 5, 6: 6, 7: 7, 8: 8, 0: 9}" );

    linked_vec<std::string_view> const words{ "just", "one", "test", "more" };
    EXPECT_EQ( to_debug_string( words ), R"({0: "just", 1: "one", 2: "test", 3: "more"})" );

    EXPECT_EQ( to_debug_string( linked_vec<std::string>{} ), "{}" );

    linked_vec<std::string> const escaped{ "a\"b", "c" };
    EXPECT_EQ( fmt::format( "{}", escaped ), R"({0: "a\"b", 1: "c"})" );
    EXPECT_EQ( fmt::format( "[{}]", linked_vec<double>{ 0.5 } ), "[{0: 0.5}]" );
}

TEST( linked_vec, stale_physical_position )
{
    linked_vec<std::string> list{ "a", "b", "c", "d" };
    auto const captured{ *list.head_p() }; // "a" lives in slot 0
    EXPECT_EQ( list[ captured ], "a" );

    std::ignore = list.pop_front();
    // the physically last node ("d") now occupies the captured slot
    EXPECT_EQ( list[ captured ], "d" );
    EXPECT_EQ( to_vector( list ), ( std::vector<std::string>{ "b", "c", "d" } ) );
    EXPECT_EQ( *list.tail_p(), captured );
    EXPECT_TRUE( list.verify_links() );
}

TEST( linked_vec, swap_remove )
{
    linked_vec<int> list{ 10, 11, 12, 13, 14 };
    list.push_front( 9 ); // slot 5, logical head

    EXPECT_EQ( list.swap_remove( 1 ), 11 );
    // slot 1 now holds the former slot 5 (9), still the logical head
    EXPECT_EQ( list.get_p( 1 ), 9 );
    EXPECT_EQ( *list.head_p(), 1U );
    EXPECT_EQ( to_vector( list ), ( std::vector<int>{ 9, 10, 12, 13, 14 } ) );
    EXPECT_TRUE( list.verify_links() );

    EXPECT_EQ( list.swap_remove( list.size() - 1 ), 14 );
    EXPECT_EQ( to_vector( list ), ( std::vector<int>{ 9, 10, 12, 13 } ) );
    EXPECT_TRUE( list.verify_links() );

    EXPECT_THROW( std::ignore = list.swap_remove( list.size() ), std::out_of_range );
    EXPECT_THROW( std::ignore = list.get_p      ( 4           ), std::out_of_range );
}

TEST( linked_vec, swap_p )
{
    linked_vec<int> list{ 1, 2, 3 };
    list.swap_p( 0, 2 );
    EXPECT_EQ( to_vector( list ), ( std::vector<int>{ 3, 2, 1 } ) );
    list.swap_p( 1, 1 );
    EXPECT_EQ( to_vector( list ), ( std::vector<int>{ 3, 2, 1 } ) );
    EXPECT_EQ( *list.head_p(), 0U );
    EXPECT_THROW( list.swap_p( 0, 3 ), std::out_of_range );
    EXPECT_TRUE( list.verify_links() );
}

TEST( linked_vec, append )
{
    // empty to empty
    {
        linked_vec<int> m;
        linked_vec<int> n;
        m.append( n );
        EXPECT_TRUE( m.verify_links() );
        EXPECT_EQ( m.size(), 0 );
        EXPECT_EQ( n.size(), 0 );
    }
    // non-empty to empty
    {
        linked_vec<int> m;
        linked_vec<int> n;
        n.push_back( 2 );
        m.append( n );
        EXPECT_TRUE( m.verify_links() );
        EXPECT_EQ( m.size(), 1 );
        EXPECT_EQ( m.pop_back(), 2 );
        EXPECT_EQ( n.size(), 0 );
        EXPECT_TRUE( m.verify_links() );
    }
    // empty to non-empty
    {
        linked_vec<int> m;
        linked_vec<int> n;
        m.push_back( 2 );
        m.append( n );
        EXPECT_TRUE( m.verify_links() );
        EXPECT_EQ( m.size(), 1 );
        EXPECT_EQ( m.pop_back(), 2 );
    }

    std::vector<int> const v{ 1, 2, 3, 4, 5 };
    std::vector<int> const u{ 9, 8, 1, 2, 3, 4, 5 };
    linked_vec<int> m( v.begin(), v.end() );
    linked_vec<int> n( u.begin(), u.end() );
    m.append( n );
    EXPECT_TRUE( m.verify_links() );
    auto sum{ v };
    sum.insert( sum.end(), u.begin(), u.end() );
    EXPECT_EQ( to_vector( m ), sum );
    for ( auto const element : sum )
        EXPECT_EQ( m.pop_front(), element );

    EXPECT_EQ( n.size(), 0 );
    n.push_back( 3 );
    EXPECT_EQ( n.size(), 1 );
    EXPECT_EQ( n.pop_front(), 3 );
    EXPECT_TRUE( n.verify_links() );
}

TEST( linked_vec, extend )
{
    linked_vec<int> a;
    a.push_back( 1 );
    a.extend( std::array{ 2, 3, 4 } );
    EXPECT_EQ( a.size(), 4 );
    EXPECT_EQ( a, ( linked_vec<int>{ 1, 2, 3, 4 } ) );

    linked_vec<int> b;
    b.push_back( 5 );
    b.push_back( 6 );
    a.extend( b ); // copies
    EXPECT_EQ( a, ( linked_vec<int>{ 1, 2, 3, 4, 5, 6 } ) );
    EXPECT_EQ( b.size(), 2 );

    a.extend( linked_vec<int>{ 7, 8 } ); // moves
    EXPECT_EQ( a, ( linked_vec<int>{ 1, 2, 3, 4, 5, 6, 7, 8 } ) );

    // unsized input
    a.extend( std::views::iota( 9 ) | std::views::take_while( []( int const x ) { return x < 11; } ) );
    EXPECT_EQ( a.size(), 10 );
    EXPECT_EQ( *a.back(), 10 );
    EXPECT_TRUE( a.verify_links() );
}

TEST( linked_vec, extend_with_own_elements )
{
    linked_vec<int> list{ 1, 2, 3 };
    list.extend( linked_vec<int>{ list } );
    EXPECT_EQ( list, ( linked_vec<int>{ 1, 2, 3, 1, 2, 3 } ) );
    list.extend( std::vector<int>{ list.begin(), list.end() } );
    EXPECT_EQ( list.size(), 12 );
    EXPECT_TRUE( list.verify_links() );
#if !defined( NDEBUG ) && !defined( BOOST_DISABLE_ASSERTS )
    EXPECT_DEATH( list.extend( list ), "itself" );
#endif
}

TEST( linked_vec, contains )
{
    linked_vec<int> l;
    l.extend( std::array{ 2, 3, 4 } );
    EXPECT_TRUE ( l.contains( 3 ) );
    EXPECT_FALSE( l.contains( 1 ) );
    l.clear();
    EXPECT_FALSE( l.contains( 3 ) );
}

TEST( linked_vec, copy_and_move )
{
    // short assigned from long, long from short, equal lengths
    std::array<std::pair<std::vector<int>, std::vector<int>>, 3> const cases{{
        { { 1, 2, 3, 4, 5 }, { 8, 7, 6, 2, 3, 4, 5 } },
        { { 1, 2, 3, 4, 5 }, { 6, 7, 8 } },
        { { 1, 2, 3, 4, 5 }, { 9, 8, 1, 2, 3 } }
    }};
    for ( auto const & [ v, u ] : cases )
    {
        linked_vec<int> m( v.begin(), v.end() );
        linked_vec<int> const n( u.begin(), u.end() );
        m = n;
        EXPECT_TRUE( m.verify_links() );
        EXPECT_EQ( m, n );
        for ( auto const element : u )
            EXPECT_EQ( m.pop_front(), element );
    }

    linked_vec<int> source{ 1, 2, 3 };
    linked_vec<int> target{ std::move( source ) };
    EXPECT_EQ( to_vector( target ), ( std::vector<int>{ 1, 2, 3 } ) );
    EXPECT_TRUE( source.empty() );
    EXPECT_TRUE( source.verify_links() );
    source.push_back( 4 );
    EXPECT_EQ( to_vector( source ), std::vector<int>{ 4 } );

    source = std::move( target );
    EXPECT_EQ( to_vector( source ), ( std::vector<int>{ 1, 2, 3 } ) );
    EXPECT_TRUE( target.verify_links() );

    swap( source, target );
    EXPECT_TRUE( source.empty() );
    EXPECT_EQ( to_vector( target ), ( std::vector<int>{ 1, 2, 3 } ) );
}

TEST( linked_vec, equality )
{
    linked_vec<int> n;
    linked_vec<int> m;
    EXPECT_TRUE( n == m );
    n.push_front( 1 );
    EXPECT_TRUE( n != m );
    m.push_back( 1 );
    EXPECT_TRUE( n == m );

    EXPECT_NE( ( linked_vec<int>{ 2, 3, 4 } ), ( linked_vec<int>{ 1, 2, 3 } ) );

    // same logical sequence, different physical layout
    linked_vec<int> a{ 2, 3 };
    a.push_front( 1 );
    EXPECT_EQ( a, ( linked_vec<int>{ 1, 2, 3 } ) );
}

TEST( linked_vec, ordering )
{
    linked_vec<int> const n;
    linked_vec<int> const m{ 1, 2, 3 };
    EXPECT_TRUE( n <  m );
    EXPECT_TRUE( m >  n );
    EXPECT_TRUE( n <= n );
    EXPECT_TRUE( n >= n );
}

TEST( linked_vec, ordering_nan )
{
    auto const nan{ std::nan( "" ) };

    linked_vec<double> const n{ nan };
    linked_vec<double> const m{ nan };
    EXPECT_FALSE( n <  m );
    EXPECT_FALSE( n >  m );
    EXPECT_FALSE( n <= m );
    EXPECT_FALSE( n >= m );
    EXPECT_EQ( n <=> m, std::partial_ordering::unordered );

    linked_vec<double> const one{ 1.0 };
    EXPECT_FALSE( n <  one );
    EXPECT_FALSE( n >  one );
    EXPECT_FALSE( n <= one );
    EXPECT_FALSE( n >= one );

    linked_vec<double> const u{ 1.0, 2.0, nan };
    linked_vec<double> const v{ 1.0, 2.0, 3.0 };
    EXPECT_FALSE( u <  v );
    EXPECT_FALSE( u >  v );
    EXPECT_FALSE( u <= v );
    EXPECT_FALSE( u >= v );

    linked_vec<double> const s{ 1.0, 2.0, 4.0, 2.0 };
    linked_vec<double> const t{ 1.0, 2.0, 3.0, 2.0 };
    EXPECT_FALSE( s <  t );
    EXPECT_TRUE ( s >  one );
    EXPECT_FALSE( s <= one );
    EXPECT_TRUE ( s >= one );
}

//------------------------------------------------------------------------------
} // namespace lvec
//------------------------------------------------------------------------------
