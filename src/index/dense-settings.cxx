# include "../../api/dense-store.hxx"
# include <mtc/wcsstr.h>
# include <stdexcept>
# include <algorithm>
# include <optional>
# include <cstdint>
# include <cmath>

namespace ffindex {
namespace dense {

  // configured values are told from absent ones by two different defaults

  static  auto  GetInteger( const mtc::config& config, const char* key ) -> std::optional<int32_t>
  {
    auto  value = config.get_int32( key, 0 );

    if ( value != config.get_int32( key, 1 ) )
      return std::nullopt;
    return value;
  }

  static  auto  GetDouble( const mtc::config& config, const char* key ) -> std::optional<double>
  {
    auto  value = config.get_double( key, 0.0 );

    if ( value != config.get_double( key, 1.0 ) )
      return std::nullopt;
    return value;
  }

  // Settings implementation

  auto  Settings::SetMaxSparse( double value ) -> Settings&
  {
    if ( !std::isfinite( value ) || value <= 0.0 )
      throw std::invalid_argument( "slots per record ratio has to be a finite positive value" );
    return maxSparse = value, *this;
  }

  auto  Settings::GetRangeLimit( size_t count ) const -> size_t
  {
    auto  sparse = maxSparse * double(count);
    auto  slots = size_t(0);

  // clamp in the floating point domain before the conversion
    if ( sparse >= double(maxRange) )
      slots = maxRange;
    else if ( sparse > 0.0 )
      slots = size_t(sparse);

    return std::min( size_t(maxRange), std::max( size_t(minRange), slots ) );
  }

  auto  Settings::Load( const mtc::config& config ) -> Settings
  {
    auto  settings = Settings();
    auto  maxRange = GetInteger( config, "max_range" );
    auto  minRange = GetInteger( config, "min_range" );
    auto  maxSparse = GetDouble( config, "max_sparse" );

    if ( maxRange.has_value() )
    {
      if ( *maxRange <= 0 )
      {
        throw std::invalid_argument( mtc::strprintf( "'max_range' (%d) has to be a positive slots count",
          int(*maxRange) ) );
      }
      settings.SetMaxRange( uint32_t(*maxRange) );
    }

    if ( maxSparse.has_value() )
    {
      if ( !std::isfinite( *maxSparse ) || *maxSparse <= 0.0 )
      {
        throw std::invalid_argument( mtc::strprintf( "'max_sparse' (%g) has to be a positive slots per record ratio",
          *maxSparse ) );
      }
      settings.SetMaxSparse( *maxSparse );
    }

    if ( minRange.has_value() )
    {
      if ( *minRange < 0 )
      {
        throw std::invalid_argument( mtc::strprintf( "'min_range' (%d) may not be negative",
          int(*minRange) ) );
      }
      if ( uint32_t(*minRange) > settings.maxRange )
      {
        throw std::invalid_argument( mtc::strprintf( "'min_range' (%d) exceeds 'max_range' (%u)",
          int(*minRange), settings.maxRange ) );
      }
      settings.SetMinRange( uint32_t(*minRange) );
    }

    return settings;
  }

}}
