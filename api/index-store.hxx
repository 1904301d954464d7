# if !defined( __ffindex_api_index_store_hxx__ )
# define __ffindex_api_index_store_hxx__
# include "metadata.hxx"
# include "slice.hxx"
# include <mtc/interfaces.h>
# include <functional>
# include <stdexcept>
# include <cstdint>

namespace ffindex
{
  using Position = uint32_t;
  using Positions = Slice<Position>;

 /*
  * range_overflow
  *
  * A dense store was asked to hold a key outside the range it may allocate.
  * Thrown by the build so the caller may choose another store kind.
  */
  class range_overflow: public std::range_error {  using range_error::range_error;  };

 /*
  * invariant_violation
  *
  * A position points outside the backing collection. Means the store and the
  * collection do not match; never returned as a partial result.
  */
  class invariant_violation: public std::logic_error {  using logic_error::logic_error;  };

 /*
  * IStore
  *
  * Complete key -> positions mapping for one key dimension. Built once over
  * the whole collection, immutable afterwards, so any number of readers may
  * share it without locking.
  */
  template <class Key>
  struct IStore: public mtc::Iface
  {
    using EnumFn = std::function<void( const Key&, Positions )>;

   /*
    * GetPositions()
    *
    * Return ascending positions of the records holding the key, or an empty
    * slice if the key is unknown. The slice is owned by the store.
    */
    virtual auto  GetPositions( const Key& ) const -> Positions = 0;
    virtual bool  Contains( const Key& ) const = 0;

   /*
    * Store statistics: keys summary, count of distinct keys and the size of
    * the collection the store was built over.
    */
    virtual auto  GetMetadata() const -> const Metadata<Key>& = 0;
    virtual auto  GetKeyCount() const -> size_t = 0;
    virtual auto  GetMaxIndex() const -> uint32_t = 0;

   /*
    * EnumKeys()
    *
    * Call the function for every key with its positions.
    */
    virtual void  EnumKeys( const EnumFn& ) const = 0;
  };

}

# endif   // __ffindex_api_index_store_hxx__
