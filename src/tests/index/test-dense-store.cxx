# include "../../../api/dense-store.hxx"
# include <mtc/test-it-easy.hpp>
# include <mtc/arena.hpp>
# include <string>
# include <vector>

namespace {

  struct Car
  {
    uint32_t    id;
    std::string name;
  };

  auto  Collect( ffindex::Positions positions ) -> std::vector<ffindex::Position>
  {
    return std::vector<ffindex::Position>( positions.begin(), positions.end() );
  }

}

TestItEasy::RegisterFunc  dense_store( []()
  {
    TEST_CASE( "index/dense-store" )
    {
      auto  cars = std::vector<Car>{
        { 2, "BMW" },
        { 5, "Audi" },
        { 2, "VW" },
        { 99, "Porsche" } };

      SECTION( "dense store may be built over records with key extractor" )
      {
        auto  store = mtc::api<const ffindex::IStore<uint32_t>>();

        if ( REQUIRE_NOTHROW( store = ffindex::dense::Index().Create( cars, &Car::id ) ) )
        {
          SECTION( "positions are listed in collection order" )
          {
            REQUIRE( Collect( store->GetPositions( 2 ) ) == std::vector<ffindex::Position>( { 0, 2 } ) );
            REQUIRE( Collect( store->GetPositions( 5 ) ) == std::vector<ffindex::Position>( { 1 } ) );
            REQUIRE( Collect( store->GetPositions( 99 ) ) == std::vector<ffindex::Position>( { 3 } ) );
          }
          SECTION( "unknown keys have no positions" )
          {
            REQUIRE( store->GetPositions( 3 ).empty() );
            REQUIRE( store->GetPositions( 100000 ).empty() );
            REQUIRE( !store->Contains( 3 ) );
            REQUIRE( !store->Contains( 100000 ) );
          }
          SECTION( "contains() matches non-empty positions" )
          {
            for ( uint32_t key = 0; key != 120; ++key )
              REQUIRE( store->Contains( key ) == !store->GetPositions( key ).empty() );
          }
          SECTION( "statistics reflect the build" )
          {
            REQUIRE( store->GetKeyCount() == 3 );
            REQUIRE( store->GetMaxIndex() == 4 );

            if ( REQUIRE( store->GetMetadata().GetMin().has_value() ) )
              REQUIRE( *store->GetMetadata().GetMin() == 2 );
            if ( REQUIRE( store->GetMetadata().GetMax().has_value() ) )
              REQUIRE( *store->GetMetadata().GetMax() == 99 );
          }
          SECTION( "keys are enumerated in ascending order" )
          {
            auto  keys = std::vector<uint32_t>();

            store->EnumKeys( [&]( uint32_t key, ffindex::Positions ){  keys.push_back( key );  } );

            REQUIRE( keys == std::vector<uint32_t>( { 2, 5, 99 } ) );
          }
          SECTION( "positions of all keys are a partition of the collection" )
          {
            auto  marks = std::vector<int>( cars.size(), 0 );

            store->EnumKeys( [&]( uint32_t, ffindex::Positions positions )
              {
                for ( auto pos: positions )
                  ++marks.at( pos );
              } );

            REQUIRE( marks == std::vector<int>( cars.size(), 1 ) );
          }
        }
      }
      SECTION( "dense store may be built over extracted keys" )
      {
        auto  keys = std::vector<uint16_t>{ 3, 1, 3, 0 };
        auto  store = ffindex::dense::Index().Create( keys );

        REQUIRE( Collect( store->GetPositions( 3 ) ) == std::vector<ffindex::Position>( { 0, 2 } ) );
        REQUIRE( Collect( store->GetPositions( 0 ) ) == std::vector<ffindex::Position>( { 3 } ) );
        REQUIRE( *store->GetMetadata().GetMin() == 0 );
        REQUIRE( *store->GetMetadata().GetMax() == 3 );
      }
      SECTION( "signed keys are stored in two halves" )
      {
        auto  keys = std::vector<int32_t>{ -3, 4, 0, -1, 4, -3 };
        auto  store = ffindex::dense::Index().Create( keys );

        REQUIRE( Collect( store->GetPositions( -3 ) ) == std::vector<ffindex::Position>( { 0, 5 } ) );
        REQUIRE( Collect( store->GetPositions( -1 ) ) == std::vector<ffindex::Position>( { 3 } ) );
        REQUIRE( Collect( store->GetPositions( 0 ) ) == std::vector<ffindex::Position>( { 2 } ) );
        REQUIRE( Collect( store->GetPositions( 4 ) ) == std::vector<ffindex::Position>( { 1, 4 } ) );
        REQUIRE( !store->Contains( -2 ) );
        REQUIRE( !store->Contains( -100 ) );

        REQUIRE( *store->GetMetadata().GetMin() == -3 );
        REQUIRE( *store->GetMetadata().GetMax() == 4 );

        SECTION( "* and enumerated from the lowest key" )
        {
          auto  found = std::vector<int32_t>();

          store->EnumKeys( [&]( int32_t key, ffindex::Positions ){  found.push_back( key );  } );

          REQUIRE( found == std::vector<int32_t>( { -3, -1, 0, 4 } ) );
        }
      }
      SECTION( "boolean keys are supported" )
      {
        auto  flags = std::vector<char>{ 1, 0, 1 };
        auto  store = ffindex::dense::Index().Create( flags, []( char c ){  return c != 0;  } );

        REQUIRE( Collect( store->GetPositions( true ) ) == std::vector<ffindex::Position>( { 0, 2 } ) );
        REQUIRE( Collect( store->GetPositions( false ) ) == std::vector<ffindex::Position>( { 1 } ) );
      }
      SECTION( "empty build has no keys and no metadata" )
      {
        auto  store = ffindex::dense::Index().Create( std::vector<uint32_t>() );

        REQUIRE( store->GetKeyCount() == 0 );
        REQUIRE( store->GetMaxIndex() == 0 );
        REQUIRE( !store->GetMetadata().GetMin().has_value() );
        REQUIRE( !store->GetMetadata().GetMax().has_value() );
        REQUIRE( !store->Contains( 0 ) );
      }
      SECTION( "keys out of the allotted range fail the build" )
      {
        auto  index = ffindex::dense::Index();

        index.Set( ffindex::dense::Settings()
          .SetMaxRange( 100 )
          .SetMinRange( 10 )
          .SetMaxSparse( 2.0 ) );

        SECTION( "* range limit follows the collection size" )
        {
          REQUIRE( ffindex::dense::Settings().SetMaxRange( 100 ).SetMinRange( 10 ).SetMaxSparse( 2.0 ).GetRangeLimit( 3 ) == 10 );
          REQUIRE( ffindex::dense::Settings().SetMaxRange( 100 ).SetMinRange( 10 ).SetMaxSparse( 2.0 ).GetRangeLimit( 20 ) == 40 );
          REQUIRE( ffindex::dense::Settings().SetMaxRange( 100 ).SetMinRange( 10 ).SetMaxSparse( 2.0 ).GetRangeLimit( 1000 ) == 100 );
        }
        SECTION( "* keys inside the range are accepted" )
        {
          REQUIRE_NOTHROW( index.Create( std::vector<uint32_t>( { 9, 0, 5 } ) ) );
        }
        SECTION( "* key exceeding the range is not truncated" )
        {
          REQUIRE_EXCEPTION( index.Create( std::vector<uint32_t>( { 1, 10, 2 } ) ), ffindex::range_overflow );
        }
        SECTION( "* sparse keys over few records are rejected" )
        {
          REQUIRE_EXCEPTION( index.Create( std::vector<uint32_t>( { 1, 50 } ) ), ffindex::range_overflow );
          REQUIRE_NOTHROW( index.Create( std::vector<uint32_t>( 30, 50 ) ) );
        }
        SECTION( "* negative and non-negative slots share the range" )
        {
          REQUIRE_NOTHROW( index.Create( std::vector<int>( { -5, 4 } ) ) );
          REQUIRE_EXCEPTION( index.Create( std::vector<int>( { -5, 5 } ) ), ffindex::range_overflow );
        }
        SECTION( "* range_overflow is a std::range_error" )
        {
          REQUIRE_EXCEPTION( index.Create( std::vector<uint64_t>( { uint64_t(-1) } ) ), std::range_error );
        }
      }
      SECTION( "dense store may be allocated with custom allocator" )
      {
        mtc::Arena  memArena;
        auto        store = memArena.Create<ffindex::index::dense::Store<uint32_t, mtc::Arena::allocator<char>>>(
          ffindex::dense::Settings().GetRangeLimit( cars.size() ) );

        if ( REQUIRE_NOTHROW( ffindex::index::BuildStore( *store, cars, &Car::id ) ) )
        {
          REQUIRE( Collect( store->GetPositions( 2 ) ) == std::vector<ffindex::Position>( { 0, 2 } ) );
          REQUIRE( store->GetKeyCount() == 3 );
          REQUIRE( store->GetRangeSize() == 100 );
        }
      }
    }
  } );
