# include "../../../api/dense-store.hxx"
# include "../../../api/hash-store.hxx"
# include "../../../api/retriever.hxx"
# include <mtc/test-it-easy.hpp>
# include <string>
# include <vector>

using namespace ffindex;

namespace {

  struct Car
  {
    uint32_t    id;
    std::string name;

    bool  operator == ( const Car& car ) const {  return id == car.id && name == car.name;  }
  };

  auto  Ids( const std::vector<Car>& cars ) -> std::vector<uint32_t>
  {
    auto  ids = std::vector<uint32_t>();

    for ( auto& car: cars )
      ids.push_back( car.id );

    return ids;
  }

}

TestItEasy::RegisterFunc  retriever( []()
  {
    TEST_CASE( "index/retriever" )
    {
      auto  cars = std::vector<Car>{ { 1, "BMW" }, { 2, "VW" }, { 3, "Audi" } };
      auto  byId = Retrieve( dense::Index().Create( cars, &Car::id ), cars );

      SECTION( "Get() returns the records of the key" )
      {
        auto  found = byId.Get( 2 ).ToVector();

        if ( REQUIRE( found.size() == 1 ) )
          REQUIRE( found.front() == Car( { 2, "VW" } ) );

        REQUIRE( byId.Get( 99 ).empty() );

        SECTION( "* and the sequence borrows the store bucket" )
        {
          auto  records = byId.Get( 1 );

          REQUIRE( !records.GetPositions().IsOwner() );
          REQUIRE( records.size() == 1 );
          REQUIRE( records.begin()->name == "BMW" );
        }
      }
      SECTION( "Contains() agrees with Get()" )
      {
        for ( uint32_t key = 0; key != 10; ++key )
          REQUIRE( byId.Contains( key ) == !byId.Get( key ).empty() );
      }
      SECTION( "GetMany() concatenates the records in order of keys" )
      {
        REQUIRE( Ids( byId.GetMany( { 2, 1 } ).ToVector() ) == std::vector<uint32_t>( { 2, 1 } ) );
        REQUIRE( Ids( byId.GetMany( { 3, 99, 1 } ).ToVector() ) == std::vector<uint32_t>( { 3, 1 } ) );
        REQUIRE( Ids( byId.GetMany( { 2, 2 } ).ToVector() ) == std::vector<uint32_t>( { 2, 2 } ) );
        REQUIRE( byId.GetMany( {} ).begin() == byId.GetMany( {} ).end() );
        REQUIRE( byId.GetMany( { 7, 8 } ).ToVector().empty() );

        SECTION( "* dereferencing the end of sequence throws" )
        {
          auto  many = byId.GetMany( { 1 } );
          auto  it = many.begin();

          REQUIRE( it->name == "BMW" );
          REQUIRE( ++it == many.end() );
          REQUIRE_EXCEPTION( *it, std::out_of_range );
        }
      }
      SECTION( "Filter() returns each matching record once in collection order" )
      {
        REQUIRE( Ids( byId.Filter( Or( Eq<uint32_t>( 1 ), Eq<uint32_t>( 2 ) ) ).ToVector() ) == std::vector<uint32_t>( { 1, 2 } ) );
        REQUIRE( Ids( byId.Filter( Or( Eq<uint32_t>( 3 ), Eq<uint32_t>( 1 ) ) ).ToVector() ) == std::vector<uint32_t>( { 1, 3 } ) );
        REQUIRE( Ids( byId.Filter( AnyOf<uint32_t>( { 3, 1, 3, 2 } ) ).ToVector() ) == std::vector<uint32_t>( { 1, 2, 3 } ) );
        REQUIRE( byId.Filter( And( Eq<uint32_t>( 1 ), Eq<uint32_t>( 2 ) ) ).empty() );
        REQUIRE( byId.Filter( Eq<uint32_t>( 5 ) ).empty() );

        SECTION( "* expressions nested to any depth are accepted" )
        {
          auto  expr = Eq<uint32_t>( 3 );

          for ( uint32_t i = 0; i != 100000; ++i )
            expr = Or( expr, Eq<uint32_t>( i % 3 ) );

          REQUIRE( Ids( byId.Filter( expr ).ToVector() ) == std::vector<uint32_t>( { 1, 2, 3 } ) );
        }
      }
      SECTION( "records with repeated keys are listed by position" )
      {
        auto  fleet = std::vector<Car>{ { 1, "VW" }, { 2, "Audi" }, { 3, "VW" }, { 4, "BMW" }, { 5, "Audi" } };
        auto  byName = Retrieve( hashed::Index().Create( fleet, &Car::name ), fleet );
        auto  byKey = Retrieve( dense::Index().Create( fleet, &Car::id ), fleet );

        REQUIRE( Ids( byName.Get( "VW" ).ToVector() ) == std::vector<uint32_t>( { 1, 3 } ) );
        REQUIRE( Ids( byName.GetMany( { "Audi", "BMW" } ).ToVector() ) == std::vector<uint32_t>( { 2, 5, 4 } ) );
        REQUIRE( Ids( byName.Filter( Or( Eq<std::string>( "BMW" ), Eq<std::string>( "VW" ) ) ).ToVector() )
          == std::vector<uint32_t>( { 1, 3, 4 } ) );

        SECTION( "* and position sets of different stores may be combined" )
        {
          auto  selected = Intersect( byName.Select( AnyOf<std::string>( { "VW", "Audi" } ) ),
            byKey.Select( AnyOf<uint32_t>( { 2, 3, 4 } ) ) );

          REQUIRE( Ids( byName.Resolve( selected ).ToVector() ) == std::vector<uint32_t>( { 2, 3 } ) );
          REQUIRE( Ids( byKey.Resolve( selected ).ToVector() ) == std::vector<uint32_t>( { 2, 3 } ) );
        }
        SECTION( "* minimal and maximal keys are available" )
        {
          REQUIRE( byName.GetMinKey() == std::string( "Audi" ) );
          REQUIRE( byName.GetMaxKey() == std::string( "VW" ) );
          REQUIRE( byKey.GetMinKey() == 1U );
          REQUIRE( byKey.GetMaxKey() == 5U );
        }
      }
      SECTION( "GetRecord() checks the position" )
      {
        REQUIRE( byId.GetRecord( 2 ).name == "Audi" );
        REQUIRE_EXCEPTION( byId.GetRecord( 3 ), invariant_violation );
      }
      SECTION( "retriever over a collection shorter than the store fails" )
      {
        auto  store = dense::Index().Create( cars, &Car::id );
        auto  fewer = std::vector<Car>( cars.begin(), cars.begin() + 2 );

        REQUIRE_EXCEPTION( Retrieve( store, fewer ), invariant_violation );
        REQUIRE_NOTHROW( Retrieve( store, cars ) );
      }
      SECTION( "retriever requires the store" )
      {
        REQUIRE_EXCEPTION( Retrieve( mtc::api<const IStore<uint32_t>>(), cars ), std::invalid_argument );
      }
      SECTION( "empty collection gives empty results" )
      {
        auto  none = std::vector<Car>();
        auto  empty = Retrieve( dense::Index().Create( none, &Car::id ), none );

        REQUIRE( empty.Get( 1 ).empty() );
        REQUIRE( empty.GetMany( { 1, 2 } ).ToVector().empty() );
        REQUIRE( empty.Filter( AnyOf<uint32_t>( { 1, 2 } ) ).empty() );
        REQUIRE( !empty.GetMinKey().has_value() );
      }
    }
  } );
