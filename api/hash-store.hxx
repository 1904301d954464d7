# if !defined( __ffindex_api_hash_store_hxx__ )
# define __ffindex_api_hash_store_hxx__
# include "index-store.hxx"
# include "../src/index/hash-store.hxx"
# include "../src/index/build-store.hxx"

namespace ffindex {
namespace hashed {

  struct Settings
  {
    uint32_t  initialSize = 0x400;    /* hash table size before the first rehash */

  public:
    auto  SetInitialSize( uint32_t value ) -> Settings& {  initialSize = value; return *this;  }
  };

  template <class Allocator = std::allocator<char>>
  class Index
  {
    Settings  settings;
    Allocator allocator;

  public:
    Index( Allocator alloc = Allocator() ):
      allocator( alloc ) {}

  public:
    auto  Set( const Settings& options ) -> Index& {  return settings = options, *this;  }

  public:
    template <class Collection, class KeyOf,
      class Key = index::key_of_t<index::record_of_t<Collection>, KeyOf>,
      class Hash = std::hash<Key>,
      class Equal = std::equal_to<Key>>
    auto  Create( const Collection& records, KeyOf keyOf, Hash hash = Hash(), Equal equal = Equal() ) const
      -> mtc::api<const IStore<Key>>;

    template <class Collection>
    auto  Create( const Collection& keys ) const -> mtc::api<const IStore<index::record_of_t<Collection>>>
      {  return Create( keys, index::KeyItself() );  }

  };

  // Index implementation

  template <class Allocator>
  template <class Collection, class KeyOf, class Key, class Hash, class Equal>
  auto  Index<Allocator>::Create( const Collection& records, KeyOf keyOf, Hash hash, Equal equal ) const
    -> mtc::api<const IStore<Key>>
  {
    using Store = index::hashed::Store<Key, Hash, Equal, Allocator>;

  // the table never needs more buckets than records
    auto  length = std::min( size_t(settings.initialSize), std::size( records ) );
    auto  pstore = mtc::api<Store>( new Store( length, allocator, hash, equal ) );

    index::BuildStore( *pstore.ptr(), records, keyOf );

    return pstore.ptr();
  }

}}

# endif   // !__ffindex_api_hash_store_hxx__
