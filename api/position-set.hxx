# if !defined( __ffindex_api_position_set_hxx__ )
# define __ffindex_api_position_set_hxx__
# include "index-store.hxx"
# include <vector>

namespace ffindex
{

 /*
  * PositionSet
  *
  * Ascending, duplicate-free set of record positions. Borrows the bucket of
  * a store when taken from a single key, owns a vector when produced by
  * Union() or Intersect().
  */
  class PositionSet
  {
  public:
    PositionSet() = default;
    PositionSet( const Positions& borrowed ):
      items( borrowed ) {}
    PositionSet( std::vector<Position>&& );
    PositionSet( const PositionSet& );
    PositionSet( PositionSet&& );
    PositionSet& operator=( const PositionSet& );
    PositionSet& operator=( PositionSet&& );

  public:
    auto  begin() const -> const Position* {  return items.begin();  }
    auto  end() const -> const Position*   {  return items.end();  }
    auto  data() const -> const Position*  {  return items.data();  }
    auto  size() const -> size_t  {  return items.size();  }
    bool  empty() const {  return items.empty();  }

    auto  operator[]( size_t pos ) const -> Position {  return items[pos];  }

    bool  IsOwner() const {  return isOwner;  }
    auto  ToVector() const -> std::vector<Position> {  return std::vector<Position>( items.begin(), items.end() );  }

    bool  operator == ( const PositionSet& ) const;
    bool  operator != ( const PositionSet& to ) const {  return !(*this == to);  }

  protected:
    std::vector<Position> owned;
    Positions             items;
    bool                  isOwner = false;

  };

 /*
  * Union(), Intersect()
  *
  * Set operations over ascending position sets; the result is ascending and
  * free of duplicates for any order of arguments.
  */
  auto  Union( const PositionSet&, const PositionSet& ) -> PositionSet;
  auto  Intersect( const PositionSet&, const PositionSet& ) -> PositionSet;

 /*
  * Union( sets ), Intersect( sets )
  *
  * Same operations over any number of sets at once. A single non-empty set
  * is returned as is; no sets give an empty result.
  */
  auto  Union( std::vector<PositionSet>&& ) -> PositionSet;
  auto  Intersect( std::vector<PositionSet>&& ) -> PositionSet;

}

# endif   // !__ffindex_api_position_set_hxx__
