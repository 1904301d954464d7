# if !defined( __ffindex_src_index_build_store_hxx__ )
# define __ffindex_src_index_build_store_hxx__
# include "../../api/index-store.hxx"
# include <type_traits>
# include <functional>
# include <iterator>

namespace ffindex {
namespace index   {

  template <class Record, class KeyOf>
  using key_of_t = std::decay_t<std::invoke_result_t<KeyOf, const Record&>>;

  template <class Collection>
  using record_of_t = std::decay_t<decltype( *std::begin( std::declval<const Collection&>() ) )>;

  struct KeyItself
  {
    template <class Key>
    auto  operator()( const Key& key ) const -> const Key& {  return key;  }
  };

 /*
  * BuildStore( store, records, keyOf )
  *
  * The only build pass: records are visited once in collection order, the
  * position of each record is appended to the bucket of its key.
  */
  template <class Store, class Collection, class KeyOf>
  void  BuildStore( Store& store, const Collection& records, KeyOf&& keyOf )
  {
    auto  position = Position( 0 );

    if ( std::size( records ) >= size_t(Position(-1)) )
      throw range_overflow( "collection size exceeds the position range" );

    for ( auto& record: records )
      store.Insert( std::invoke( keyOf, record ), position++ );
  }

}}

# endif   // !__ffindex_src_index_build_store_hxx__
