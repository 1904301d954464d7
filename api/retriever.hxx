# if !defined( __ffindex_api_retriever_hxx__ )
# define __ffindex_api_retriever_hxx__
# include "index-store.hxx"
# include "position-set.hxx"
# include "filter.hxx"
# include "../src/index/view-store.hxx"
# include <mtc/wcsstr.h>
# include <iterator>
# include <optional>
# include <vector>

namespace ffindex
{

 /*
  * Retriever
  *
  * Query handle over one index store and the records collection the store
  * was built from. The store is referenced, the records are borrowed: the
  * collection has to stay unchanged while the retriever, its views and the
  * sequences it returned are alive.
  *
  * A view is a retriever over a key-restricted store, so every query below
  * works the same way for views.
  */
  template <class Record, class Key>
  class Retriever
  {
  public:
    class Records;
    class ManyRecords;

    using StoreAPI = mtc::api<const IStore<Key>>;

  public:
    Retriever( StoreAPI, const Slice<Record>& );
    Retriever( const Retriever& ) = default;
    Retriever& operator=( const Retriever& ) = default;

  public:
    bool  Contains( const Key& key ) const {  return store->Contains( key );  }

   /*
    * Get( key )
    *
    * Records holding the key in collection order; empty for unknown keys.
    * Borrows the store bucket, allocates nothing.
    */
    auto  Get( const Key& key ) const -> Records
      {  return Records( store, records, PositionSet( store->GetPositions( key ) ) );  }

   /*
    * GetMany( keys )
    *
    * Get() for each of the keys in the order of keys, concatenated. Records
    * found by several keys are returned several times.
    */
    auto  GetMany( std::vector<Key> keys ) const -> ManyRecords
      {  return ManyRecords( store, records, std::move( keys ) );  }

   /*
    * Filter( expression )
    *
    * Records matching the expression in ascending position order, each
    * record once, whatever the nesting of the expression is.
    */
    auto  Filter( const Expression<Key>& expr ) const -> Records
      {  return Resolve( Select( expr ) );  }

   /*
    * Select( expression ), Resolve( positions )
    *
    * Evaluation and dereference parts of Filter(). Position sets selected by
    * retrievers over different stores of the same records may be combined
    * with Union() and Intersect() before Resolve().
    */
    auto  Select( const Expression<Key>& ) const -> PositionSet;
    auto  Resolve( PositionSet positions ) const -> Records
      {  return Records( store, records, std::move( positions ) );  }

    auto  GetRecord( Position ) const -> const Record&;

  // keys summary
    auto  GetMinKey() const -> std::optional<Key> {  return store->GetMetadata().GetMin();  }
    auto  GetMaxKey() const -> std::optional<Key> {  return store->GetMetadata().GetMax();  }

   /*
    * CreateView( keys )
    *
    * Retriever which sees only the listed keys of this one.
    */
    template <class Hash = std::hash<Key>, class Equal = std::equal_to<Key>>
    auto  CreateView( const std::vector<Key>& ) const -> Retriever;

    auto  GetStore() const -> const StoreAPI& {  return store;  }

  protected:
    StoreAPI      store;
    Slice<Record> records;

  };

  template <class Record, class Key>
  using View = Retriever<Record, Key>;

  template <class Record, class Key>
  class Retriever<Record, Key>::Records
  {
    friend class Retriever;

  public:
    class Iterator;

  protected:
    Records( const StoreAPI& st, const Slice<Record>& rs, PositionSet&& ps ):
      store( st ),
      records( rs ),
      positions( std::move( ps ) ) {}

  public:
    auto  begin() const -> Iterator {  return Iterator( records, positions.begin() );  }
    auto  end() const -> Iterator   {  return Iterator( records, positions.end() );  }
    auto  size() const -> size_t    {  return positions.size();  }
    bool  empty() const {  return positions.empty();  }

    auto  GetPositions() const -> const PositionSet& {  return positions;  }
    auto  ToVector() const -> std::vector<Record> {  return std::vector<Record>( begin(), end() );  }

  protected:
    StoreAPI      store;
    Slice<Record> records;
    PositionSet   positions;

  };

  template <class Record, class Key>
  class Retriever<Record, Key>::Records::Iterator
  {
    friend class Records;

    Iterator( const Slice<Record>& rs, const Position* pp ):
      records( rs ),
      ptrpos( pp ) {}

  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Record;
    using difference_type = std::ptrdiff_t;
    using pointer = const Record*;
    using reference = const Record&;

  public:
    Iterator() = default;

    auto  operator*() const -> const Record&;
    auto  operator->() const -> const Record* {  return &**this;  }
    auto  operator++() -> Iterator& {  return ++ptrpos, *this;  }
    auto  operator++( int ) -> Iterator {  auto it = *this;  return ++ptrpos, it;  }

    bool  operator == ( const Iterator& it ) const {  return ptrpos == it.ptrpos;  }
    bool  operator != ( const Iterator& it ) const {  return !(*this == it);  }

  protected:
    Slice<Record>   records;
    const Position* ptrpos = nullptr;

  };

  template <class Record, class Key>
  class Retriever<Record, Key>::ManyRecords
  {
    friend class Retriever;

  public:
    class Iterator;

  protected:
    ManyRecords( const StoreAPI& st, const Slice<Record>& rs, std::vector<Key>&& ks ):
      store( st ),
      records( rs ),
      keys( std::move( ks ) ) {}

  public:
    auto  begin() const -> Iterator;
    auto  end() const -> Iterator {  return Iterator( this, keys.size() );  }

    auto  ToVector() const -> std::vector<Record> {  return std::vector<Record>( begin(), end() );  }

  protected:
    StoreAPI          store;
    Slice<Record>     records;
    std::vector<Key>  keys;

  };

  template <class Record, class Key>
  class Retriever<Record, Key>::ManyRecords::Iterator
  {
    friend class ManyRecords;

    Iterator( const ManyRecords* pm, size_t ik ):
      owner( pm ),
      keyIndex( ik ) {}

  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Record;
    using difference_type = std::ptrdiff_t;
    using pointer = const Record*;
    using reference = const Record&;

  public:
    Iterator() = default;

    auto  operator*() const -> const Record&;
    auto  operator->() const -> const Record* {  return &**this;  }
    auto  operator++() -> Iterator&;
    auto  operator++( int ) -> Iterator {  auto it = *this;  return ++*this, it;  }

    bool  operator == ( const Iterator& it ) const
      {  return keyIndex == it.keyIndex && posIndex == it.posIndex;  }
    bool  operator != ( const Iterator& it ) const
      {  return !(*this == it);  }

  protected:
    auto  SkipEmpty() -> Iterator&;

  protected:
    const ManyRecords*  owner = nullptr;
    size_t              keyIndex = 0;
    size_t              posIndex = 0;
    Positions           keyBlock;

  };

  template <class Key, class Collection>
  auto  Retrieve( const mtc::api<const IStore<Key>>& store, const Collection& records )
    -> Retriever<typename Collection::value_type, Key>
  {
    return Retriever<typename Collection::value_type, Key>( store, records );
  }

  // resolve the record with bounds check

  template <class Record>
  auto  Dereference( const Slice<Record>& records, Position pos ) -> const Record&
  {
    if ( pos >= records.size() )
    {
      throw invariant_violation( mtc::strprintf( "position %u is out of the records collection of %zu",
        unsigned(pos), records.size() ) );
    }
    return records[pos];
  }

  // Retriever implementation

  template <class Record, class Key>
  Retriever<Record, Key>::Retriever( StoreAPI st, const Slice<Record>& rs ):
    store( st ),
    records( rs )
  {
    if ( store == nullptr )
      throw std::invalid_argument( "retriever requires the index store" );

    if ( store->GetMaxIndex() > records.size() )
    {
      throw invariant_violation( mtc::strprintf( "index store built over %u records does not match the collection of %zu",
        unsigned(store->GetMaxIndex()), records.size() ) );
    }
  }

  template <class Record, class Key>
  auto  Retriever<Record, Key>::Select( const Expression<Key>& expr ) const -> PositionSet
  {
    return Evaluate( expr, [this]( const Key& key ){  return store->GetPositions( key );  } );
  }

  template <class Record, class Key>
  auto  Retriever<Record, Key>::GetRecord( Position pos ) const -> const Record&
  {
    return Dereference( records, pos );
  }

  template <class Record, class Key>
  template <class Hash, class Equal>
  auto  Retriever<Record, Key>::CreateView( const std::vector<Key>& keys ) const -> Retriever
  {
    return Retriever( new index::view::Store<Key, Hash, Equal>( store, keys ), records );
  }

  // Retriever::Records::Iterator implementation

  template <class Record, class Key>
  auto  Retriever<Record, Key>::Records::Iterator::operator*() const -> const Record&
  {
    return Dereference( records, *ptrpos );
  }

  // Retriever::ManyRecords implementation

  template <class Record, class Key>
  auto  Retriever<Record, Key>::ManyRecords::begin() const -> Iterator
  {
    auto  it = Iterator( this, 0 );

    if ( !keys.empty() )
      it.keyBlock = store->GetPositions( keys.front() );

    return it.SkipEmpty();
  }

  // Retriever::ManyRecords::Iterator implementation

  template <class Record, class Key>
  auto  Retriever<Record, Key>::ManyRecords::Iterator::operator*() const -> const Record&
  {
    if ( posIndex >= keyBlock.size() )
      throw std::out_of_range( "dereferencing the end of records sequence" );

    return Dereference( owner->records, keyBlock[posIndex] );
  }

  template <class Record, class Key>
  auto  Retriever<Record, Key>::ManyRecords::Iterator::operator++() -> Iterator&
  {
    if ( posIndex < keyBlock.size() )
      ++posIndex;
    return SkipEmpty();
  }

  template <class Record, class Key>
  auto  Retriever<Record, Key>::ManyRecords::Iterator::SkipEmpty() -> Iterator&
  {
    while ( keyIndex < owner->keys.size() && posIndex == keyBlock.size() )
    {
      posIndex = 0;

      if ( ++keyIndex < owner->keys.size() )
        keyBlock = owner->store->GetPositions( owner->keys[keyIndex] );
      else
        keyBlock = {};
    }
    return *this;
  }

}

# endif   // !__ffindex_api_retriever_hxx__
