# include "../../api/position-set.hxx"
# include <algorithm>
# include <iterator>

namespace ffindex {

  // PositionSet implementation

  PositionSet::PositionSet( std::vector<Position>&& vec ):
    owned( std::move( vec ) ),
    items( owned ),
    isOwner( true )
  {
  }

  PositionSet::PositionSet( const PositionSet& set ):
    owned( set.owned ),
    items( set.isOwner ? Positions( owned ) : set.items ),
    isOwner( set.isOwner )
  {
  }

  PositionSet::PositionSet( PositionSet&& set ):
    owned( std::move( set.owned ) ),
    items( set.isOwner ? Positions( owned ) : set.items ),
    isOwner( set.isOwner )
  {
    set.items = {};
    set.isOwner = false;
  }

  PositionSet& PositionSet::operator=( const PositionSet& set )
  {
    if ( this != &set )
    {
      owned = set.owned;
      items = set.isOwner ? Positions( owned ) : set.items;
      isOwner = set.isOwner;
    }
    return *this;
  }

  PositionSet& PositionSet::operator=( PositionSet&& set )
  {
    if ( this != &set )
    {
      owned = std::move( set.owned );
      items = set.isOwner ? Positions( owned ) : set.items;
      isOwner = set.isOwner;
      set.items = {};
      set.isOwner = false;
    }
    return *this;
  }

  bool  PositionSet::operator == ( const PositionSet& to ) const
  {
    return size() == to.size() && std::equal( begin(), end(), to.begin() );
  }

  // set operations

  auto  Union( const PositionSet& lhs, const PositionSet& rhs ) -> PositionSet
  {
    auto  output = std::vector<Position>();

    if ( lhs.empty() )
      return rhs;
    if ( rhs.empty() )
      return lhs;

    output.reserve( lhs.size() + rhs.size() );

    std::set_union( lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
      std::back_inserter( output ) );

    return PositionSet( std::move( output ) );
  }

  auto  Intersect( const PositionSet& lhs, const PositionSet& rhs ) -> PositionSet
  {
    auto  output = std::vector<Position>();

    if ( lhs.empty() || rhs.empty() )
      return {};

    auto& shorter = lhs.size() <= rhs.size() ? lhs : rhs;
    auto& longer = lhs.size() <= rhs.size() ? rhs : lhs;

    output.reserve( shorter.size() );

  // much shorter set is looked up in the longer one instead of merging
    if ( shorter.size() * 16 < longer.size() )
    {
      auto  ptrtop = longer.begin();

      for ( auto pos: shorter )
      {
        if ( (ptrtop = std::lower_bound( ptrtop, longer.end(), pos )) == longer.end() )
          break;
        if ( *ptrtop == pos )
          output.push_back( pos );
      }
    }
      else
    {
      std::set_intersection( lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        std::back_inserter( output ) );
    }

    return PositionSet( std::move( output ) );
  }

  auto  Union( std::vector<PositionSet>&& sets ) -> PositionSet
  {
    auto  output = std::vector<Position>();

    sets.erase( std::remove_if( sets.begin(), sets.end(), []( const PositionSet& set ){  return set.empty();  } ),
      sets.end() );

    switch ( sets.size() )
    {
      case 0:   return {};
      case 1:   return std::move( sets.front() );
      case 2:   return Union( sets.front(), sets.back() );
      default:  break;
    }

  // merge all the sets at once
    for ( auto& next: sets )
      output.insert( output.end(), next.begin(), next.end() );

    std::sort( output.begin(), output.end() );
    output.erase( std::unique( output.begin(), output.end() ), output.end() );

    return PositionSet( std::move( output ) );
  }

  auto  Intersect( std::vector<PositionSet>&& sets ) -> PositionSet
  {
    if ( sets.empty() )
      return {};

  // start from the shortest set
    std::sort( sets.begin(), sets.end(), []( const PositionSet& a, const PositionSet& b )
      {  return a.size() < b.size();  } );

    auto  output = std::move( sets.front() );

    for ( auto next = sets.begin() + 1; next != sets.end() && !output.empty(); ++next )
      output = Intersect( output, *next );

    return output;
  }

}
