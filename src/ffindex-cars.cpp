# include "../api/dense-store.hxx"
# include "../api/hash-store.hxx"
# include "../api/retriever.hxx"
# include <mtc/config.h>
# include <cstdio>
# include <cerrno>
# include <string>
# include <vector>

struct Car
{
  uint32_t    id;
  std::string brand;
  std::string model;
  uint32_t    year;
};

const std::vector<Car> showroom =
{
  { 1, "BMW",   "M3",      2021 },
  { 2, "VW",    "Golf",    2019 },
  { 3, "Audi",  "A4",      2020 },
  { 4, "VW",    "Passat",  2021 },
  { 5, "BMW",   "X5",      2018 },
  { 6, "Skoda", "Octavia", 2021 },
  { 7, "Audi",  "Q7",      2022 }
};

template <class Sequence>
void  Print( const char* title, const Sequence& cars )
{
  fprintf( stdout, "%s:\n", title );

  for ( auto& car: cars )
    fprintf( stdout, "  #%u %s %s (%u)\n", car.id, car.brand.c_str(), car.model.c_str(), car.year );
}

auto  LoadSettings( const char* path ) -> ffindex::dense::Settings
{
  auto  config = mtc::config().Open( path );
  auto  getcfg = config.get_section( "dense" );

  if ( getcfg.empty() )
    throw std::invalid_argument( "section 'dense' not found in configuration file" );

  return ffindex::dense::Settings::Load( getcfg );
}

int   main( int argc, char* argv[] )
{
  auto  settings = ffindex::dense::Settings();

  if ( argc > 2 )
    return fprintf( stdout, "Usage: %s [config.name]\n", argv[0] ), EINVAL;

// open the configuration
  if ( argc == 2 )
  {
    try
      {  settings = LoadSettings( argv[1] );  }
    catch ( const mtc::config::error& xp )
      {  return fprintf( stderr, "Config error: %s\n", xp.what() ), EINVAL;  }
    catch ( const mtc::json::parse::error& xp )
      {  return fprintf( stderr, "Error parsing config '%s', line %d: %s\n", argv[1], xp.get_json_lineid(), xp.what() ), EINVAL;  }
    catch ( const std::invalid_argument& xp )
      {  return fprintf( stderr, "Invalid argument: %s\n", xp.what() ), EINVAL;  }
  }

// build the indices
  try
  {
    auto  byId = ffindex::Retrieve( ffindex::dense::Index().Set( settings ).Create( showroom, &Car::id ), showroom );
    auto  byYear = ffindex::Retrieve( ffindex::dense::Index().Set( settings ).Create( showroom, &Car::year ), showroom );
    auto  byBrand = ffindex::Retrieve( ffindex::hashed::Index().Create( showroom, &Car::brand ), showroom );

    fprintf( stderr, "indexed %zu cars: %zu ids, %zu years, %zu brands\n", showroom.size(),
      byId.GetStore()->GetKeyCount(),
      byYear.GetStore()->GetKeyCount(),
      byBrand.GetStore()->GetKeyCount() );

    Print( "id 3", byId.Get( 3 ) );
    Print( "ids 6, 2, 42", byId.GetMany( { 6, 2, 42 } ) );
    Print( "BMW or Skoda", byBrand.Filter( Or( ffindex::Eq<std::string>( "BMW" ), ffindex::Eq<std::string>( "Skoda" ) ) ) );

  // cross-index selection: VW or Audi made in 2021 or later
    auto  brands = byBrand.Select( ffindex::AnyOf<std::string>( { "VW", "Audi" } ) );
    auto  years = ffindex::PositionSet();

    for ( auto year = *byYear.GetMinKey(); year <= *byYear.GetMaxKey(); ++year )
      if ( year >= 2021 )
        years = ffindex::Union( years, byYear.Select( ffindex::Eq( year ) ) );

    Print( "VW or Audi since 2021", byBrand.Resolve( ffindex::Intersect( brands, years ) ) );

  // access restricted view
    auto  dealer = byBrand.CreateView( { "VW", "Skoda" } );

    fprintf( stdout, "dealer sees BMW: %s, VW: %s\n",
      dealer.Contains( "BMW" ) ? "yes" : "no",
      dealer.Contains( "VW" ) ? "yes" : "no" );

    Print( "dealer stock of BMW, VW and Skoda", dealer.GetMany( { "BMW", "VW", "Skoda" } ) );
  }
  catch ( const ffindex::range_overflow& xp )
    {  return fprintf( stderr, "Dense index does not fit: %s\n", xp.what() ), ERANGE;  }
  catch ( const ffindex::invariant_violation& xp )
    {  return fprintf( stderr, "Index does not match the records: %s\n", xp.what() ), EFAULT;  }

  return 0;
}
