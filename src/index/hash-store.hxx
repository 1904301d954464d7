# if !defined( __ffindex_src_index_hash_store_hxx__ )
# define __ffindex_src_index_hash_store_hxx__
# include "../../api/index-store.hxx"
# include "../tools/primes.hxx"
# include <functional>
# include <algorithm>
# include <vector>

namespace ffindex {
namespace index   {
namespace hashed  {

 /*
  * Store
  *
  * Key -> positions table for any hashable key. Entries are kept in the
  * order their keys were first seen; the hash table holds entry indices
  * chained through Entry::collision and is rebuilt with the next prime size
  * when the entries outnumber the table.
  */
  template <class Key,
    class Hash = std::hash<Key>,
    class Equal = std::equal_to<Key>,
    class Allocator = std::allocator<char>>
  class Store final: public IStore<Key>
  {
    template <class Target>
    using MakeAllocator = typename std::allocator_traits<Allocator>::template rebind_alloc<Target>;

    using EnumFn = typename IStore<Key>::EnumFn;
    using Bucket = std::vector<Position, MakeAllocator<Position>>;

    implement_lifetime_control

    struct Entry
    {
      Key       key;
      size_t    hash;
      uint32_t  collision;
      Bucket    positions;
    };

    using EntryTable = std::vector<Entry, MakeAllocator<Entry>>;
    using HashTable = std::vector<uint32_t, MakeAllocator<uint32_t>>;

    enum: uint32_t {  no_entry = uint32_t(-1)  };

  public:
    Store( size_t tableSize, Allocator alloc = Allocator(), Hash hash = Hash(), Equal equal = Equal() );

  public:
    void  Insert( const Key&, Position );

  public:     // overridables from IStore
    auto  GetPositions( const Key& ) const -> Positions override;
    bool  Contains( const Key& key ) const override {  return Lookup( key, hasher( key ) ) != no_entry;  }
    auto  GetMetadata() const -> const Metadata<Key>& override  {  return metadata;  }
    auto  GetKeyCount() const -> size_t override    {  return entries.size();  }
    auto  GetMaxIndex() const -> uint32_t override  {  return maxIndex;  }
    void  EnumKeys( const EnumFn& ) const override;

  public:
    auto  GetHashTableSize() const -> size_t  {  return hashTable.size();  }

  protected:
    auto  Lookup( const Key&, size_t ) const -> uint32_t;
    void  Rehash( size_t );

  protected:
    Hash                      hasher;
    Equal                     equals;
    MakeAllocator<Position>   allocator;
    EntryTable                entries;
    HashTable                 hashTable;
    Metadata<Key>             metadata;
    uint32_t                  maxIndex = 0;

  };

  // Store implementation

  template <class Key, class Hash, class Equal, class Allocator>
  Store<Key, Hash, Equal, Allocator>::Store( size_t tableSize, Allocator alloc, Hash hash, Equal equal ):
    hasher( hash ),
    equals( equal ),
    allocator( alloc ),
    entries( alloc ),
    hashTable( UpperPrime( tableSize ), no_entry, alloc )
  {
  }

  template <class Key, class Hash, class Equal, class Allocator>
  void  Store<Key, Hash, Equal, Allocator>::Insert( const Key& key, Position pos )
  {
    auto  hvalue = hasher( key );
    auto  nfound = Lookup( key, hvalue );

  // register new key
    if ( nfound == no_entry )
    {
      if ( entries.size() >= hashTable.size() )
        Rehash( hashTable.size() * 2 + 1 );

      auto& bucket = hashTable[hvalue % hashTable.size()];

      entries.push_back( { key, hvalue, bucket, Bucket( allocator ) } );
      metadata.Update( key );

      bucket = nfound = uint32_t(entries.size() - 1);
    }

    entries[nfound].positions.push_back( pos );
    maxIndex = std::max( maxIndex, pos + 1 );
  }

  template <class Key, class Hash, class Equal, class Allocator>
  auto  Store<Key, Hash, Equal, Allocator>::GetPositions( const Key& key ) const -> Positions
  {
    auto  nfound = Lookup( key, hasher( key ) );

    return nfound != no_entry ? Positions( entries[nfound].positions ) : Positions();
  }

  template <class Key, class Hash, class Equal, class Allocator>
  void  Store<Key, Hash, Equal, Allocator>::EnumKeys( const EnumFn& fnEnum ) const
  {
    for ( auto& next: entries )
      fnEnum( next.key, next.positions );
  }

  template <class Key, class Hash, class Equal, class Allocator>
  auto  Store<Key, Hash, Equal, Allocator>::Lookup( const Key& key, size_t hvalue ) const -> uint32_t
  {
    for ( auto index = hashTable[hvalue % hashTable.size()]; index != no_entry; index = entries[index].collision )
      if ( entries[index].hash == hvalue && equals( entries[index].key, key ) )
        return index;

    return no_entry;
  }

  template <class Key, class Hash, class Equal, class Allocator>
  void  Store<Key, Hash, Equal, Allocator>::Rehash( size_t newSize )
  {
    hashTable.assign( UpperPrime( newSize ), no_entry );

    for ( uint32_t index = 0; index != entries.size(); ++index )
    {
      auto& bucket = hashTable[entries[index].hash % hashTable.size()];

      entries[index].collision = bucket;
      bucket = index;
    }
  }

}}}

# endif   // !__ffindex_src_index_hash_store_hxx__
