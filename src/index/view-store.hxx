# if !defined( __ffindex_src_index_view_store_hxx__ )
# define __ffindex_src_index_view_store_hxx__
# include "../../api/index-store.hxx"
# include <unordered_set>
# include <functional>
# include <stdexcept>

namespace ffindex {
namespace index   {
namespace view    {

 /*
  * Store
  *
  * Parent store seen through a set of visible keys. Buckets are taken from
  * the parent as is; only the visible keys set belongs to the view.
  */
  template <class Key, class Hash = std::hash<Key>, class Equal = std::equal_to<Key>>
  class Store final: public IStore<Key>
  {
    using EnumFn = typename IStore<Key>::EnumFn;

    implement_lifetime_control

  public:
    template <class Keys>
    Store( mtc::api<const IStore<Key>>, const Keys& );

  public:     // overridables from IStore
    auto  GetPositions( const Key& ) const -> Positions override;
    bool  Contains( const Key& key ) const override {  return IsVisible( key ) && parent->Contains( key );  }
    auto  GetMetadata() const -> const Metadata<Key>& override  {  return metadata;  }
    auto  GetKeyCount() const -> size_t override    {  return keyCount;  }
    auto  GetMaxIndex() const -> uint32_t override  {  return parent->GetMaxIndex();  }
    void  EnumKeys( const EnumFn& ) const override;

  public:
    bool  IsVisible( const Key& key ) const {  return visible.find( key ) != visible.end();  }

  protected:
    mtc::api<const IStore<Key>>           parent;
    std::unordered_set<Key, Hash, Equal>  visible;
    Metadata<Key>                         metadata;
    size_t                                keyCount = 0;

  };

  // Store implementation

  template <class Key, class Hash, class Equal>
  template <class Keys>
  Store<Key, Hash, Equal>::Store( mtc::api<const IStore<Key>> store, const Keys& keys ):
    parent( store )
  {
    if ( parent == nullptr )
      throw std::invalid_argument( "view requires the parent store" );

    for ( auto& key: keys )
      if ( visible.insert( key ).second && parent->Contains( key ) )
      {
        metadata.Update( key );
        ++keyCount;
      }
  }

  template <class Key, class Hash, class Equal>
  auto  Store<Key, Hash, Equal>::GetPositions( const Key& key ) const -> Positions
  {
    return IsVisible( key ) ? parent->GetPositions( key ) : Positions();
  }

  template <class Key, class Hash, class Equal>
  void  Store<Key, Hash, Equal>::EnumKeys( const EnumFn& fnEnum ) const
  {
    parent->EnumKeys( [&]( const Key& key, Positions positions )
      {
        if ( IsVisible( key ) )
          fnEnum( key, positions );
      } );
  }

}}}

# endif   // !__ffindex_src_index_view_store_hxx__
