# if !defined( __ffindex_api_dense_store_hxx__ )
# define __ffindex_api_dense_store_hxx__
# include "index-store.hxx"
# include "../src/index/dense-store.hxx"
# include "../src/index/build-store.hxx"
# include <mtc/config.h>

namespace ffindex {
namespace dense {

 /*
  * Settings
  *
  * The dense store may use up to min( maxRange, max( minRange, maxSparse * N ) )
  * slots for a collection of N records. Keys outside this range fail the
  * build with range_overflow.
  */
  struct Settings
  {
    uint32_t  maxRange = 0x1000000;   /* 16M slots */
    uint32_t  minRange = 0x10000;     /* 64K slots for any collection */
    double    maxSparse = 16.0;       /* slots per record */

  public:
    auto  SetMaxRange( uint32_t value ) -> Settings& {  maxRange = value; return *this;  }
    auto  SetMinRange( uint32_t value ) -> Settings& {  minRange = value; return *this;  }
    auto  SetMaxSparse( double value ) -> Settings&;

  public:
    auto  GetRangeLimit( size_t count ) const -> size_t;

   /*
    * Load( config )
    *
    * Read "max_range", "min_range" and "max_sparse" from the configuration
    * section, keeping defaults for the absent ones. "min_range" may be 0,
    * the other values have to be positive.
    *
    * Throws std::invalid_argument on invalid values.
    */
    static  auto  Load( const mtc::config& ) -> Settings;
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
   /*
    * Create( records, keyOf )
    *
    * Build the store over the collection in one pass, keyOf being called for
    * each record in collection order.
    */
    template <class Collection, class KeyOf>
    auto  Create( const Collection& records, KeyOf keyOf ) const
      -> mtc::api<const IStore<index::key_of_t<index::record_of_t<Collection>, KeyOf>>>;

   /*
    * Create( keys )
    *
    * Build the store over already extracted keys, the position being the
    * index of the key in the collection.
    */
    template <class Collection>
    auto  Create( const Collection& keys ) const -> mtc::api<const IStore<index::record_of_t<Collection>>>
      {  return Create( keys, index::KeyItself() );  }

  };

  // Index implementation

  template <class Allocator>
  template <class Collection, class KeyOf>
  auto  Index<Allocator>::Create( const Collection& records, KeyOf keyOf ) const
    -> mtc::api<const IStore<index::key_of_t<index::record_of_t<Collection>, KeyOf>>>
  {
    using Key = index::key_of_t<index::record_of_t<Collection>, KeyOf>;
    using Store = index::dense::Store<Key, Allocator>;

    auto  pstore = mtc::api<Store>( new Store( settings.GetRangeLimit( std::size( records ) ), allocator ) );

    index::BuildStore( *pstore.ptr(), records, keyOf );

    return pstore.ptr();
  }

}}

# endif   // !__ffindex_api_dense_store_hxx__
