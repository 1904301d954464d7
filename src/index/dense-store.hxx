# if !defined( __ffindex_src_index_dense_store_hxx__ )
# define __ffindex_src_index_dense_store_hxx__
# include "../../api/index-store.hxx"
# include <mtc/wcsstr.h>
# include <type_traits>
# include <algorithm>
# include <vector>
# include <string>

namespace ffindex {
namespace index   {
namespace dense   {

 /*
  * Store
  *
  * Key -> positions table addressed directly by the integral key value.
  * Non-negative keys live in upperSlots, negative keys in lowerSlots at
  * -(key + 1). Both arrays grow lazily but never beyond rangeLimit slots in
  * total; a key that does not fit throws range_overflow.
  */
  template <class Key, class Allocator = std::allocator<char>>
  class Store final: public IStore<Key>
  {
    static_assert( std::is_integral<Key>::value, "dense store keys have to be integral" );

    template <class Target>
    using MakeAllocator = typename std::allocator_traits<Allocator>::template rebind_alloc<Target>;

    using EnumFn = typename IStore<Key>::EnumFn;
    using Bucket = std::vector<Position, MakeAllocator<Position>>;
    using Slots = std::vector<Bucket, MakeAllocator<Bucket>>;

    implement_lifetime_control

  public:
    Store( size_t rangeLimit, Allocator alloc = Allocator() );

  public:
    void  Insert( Key, Position );

  public:     // overridables from IStore
    auto  GetPositions( const Key& ) const -> Positions override;
    bool  Contains( const Key& key ) const override {  return !GetPositions( key ).empty();  }
    auto  GetMetadata() const -> const Metadata<Key>& override  {  return metadata;  }
    auto  GetKeyCount() const -> size_t override    {  return keyCount;  }
    auto  GetMaxIndex() const -> uint32_t override  {  return maxIndex;  }
    void  EnumKeys( const EnumFn& ) const override;

  public:
    auto  GetRangeLimit() const -> size_t {  return rangeLimit;  }
    auto  GetRangeSize() const -> size_t  {  return upperSlots.size() + lowerSlots.size();  }

  protected:
    static  bool  IsLower( Key key );
    static  auto  GetSlot( Key key ) -> size_t;

  protected:
    const size_t              rangeLimit;
    MakeAllocator<Position>   allocator;
    Slots                     upperSlots;
    Slots                     lowerSlots;
    Metadata<Key>             metadata;
    size_t                    keyCount = 0;
    uint32_t                  maxIndex = 0;

  };

  // Store implementation

  template <class Key, class Allocator>
  Store<Key, Allocator>::Store( size_t limit, Allocator alloc ):
    rangeLimit( limit ),
    allocator( alloc ),
    upperSlots( alloc ),
    lowerSlots( alloc )
  {
  }

  template <class Key, class Allocator>
  void  Store<Key, Allocator>::Insert( Key key, Position pos )
  {
    auto& slots = IsLower( key ) ? lowerSlots : upperSlots;
    auto  uslot = GetSlot( key );

  // check if the table has to grow and may grow
    if ( uslot >= slots.size() )
    {
      auto  others = &slots == &upperSlots ? lowerSlots.size() : upperSlots.size();

      if ( uslot >= rangeLimit || uslot + 1 + others > rangeLimit )
      {
        throw range_overflow( mtc::strprintf( "key %s does not fit dense store range limit of %zu slots",
          std::to_string( key ).c_str(), rangeLimit ) );
      }
      slots.resize( uslot + 1, Bucket( allocator ) );
    }

  // register the key
    auto& bucket = slots[uslot];

    if ( bucket.empty() )
    {
      metadata.Update( key );
      ++keyCount;
    }

    bucket.push_back( pos );
    maxIndex = std::max( maxIndex, pos + 1 );
  }

  template <class Key, class Allocator>
  auto  Store<Key, Allocator>::GetPositions( const Key& key ) const -> Positions
  {
    auto& slots = IsLower( key ) ? lowerSlots : upperSlots;
    auto  uslot = GetSlot( key );

    return uslot < slots.size() ? Positions( slots[uslot] ) : Positions();
  }

  template <class Key, class Allocator>
  void  Store<Key, Allocator>::EnumKeys( const EnumFn& fnEnum ) const
  {
    if constexpr ( std::is_signed<Key>::value )
    {
      for ( auto uslot = lowerSlots.size(); uslot-- > 0; )
        if ( !lowerSlots[uslot].empty() )
          fnEnum( Key( -Key( uslot ) - 1 ), lowerSlots[uslot] );
    }
    for ( size_t uslot = 0; uslot != upperSlots.size(); ++uslot )
      if ( !upperSlots[uslot].empty() )
        fnEnum( Key( uslot ), upperSlots[uslot] );
  }

  template <class Key, class Allocator>
  bool  Store<Key, Allocator>::IsLower( Key key )
  {
    if constexpr ( std::is_signed<Key>::value )
      return key < 0;
    else
      return false;
  }

  template <class Key, class Allocator>
  auto  Store<Key, Allocator>::GetSlot( Key key ) -> size_t
  {
    if constexpr ( std::is_signed<Key>::value )
      return key < 0 ? size_t( -(key + 1) ) : size_t( key );
    else
      return size_t( key );
  }

}}}

# endif   // !__ffindex_src_index_dense_store_hxx__
