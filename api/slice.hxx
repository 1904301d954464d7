# if !defined( __ffindex_api_slice_hxx__ )
# define __ffindex_api_slice_hxx__
# include <cstddef>

namespace ffindex
{

 /*
  * Slice
  *
  * Borrowed view of contiguous elements owned by somebody else: the backing
  * records collection or the position bucket of an index store.
  */
  template <class T>
  class Slice
  {
  public:
    Slice():
      items( nullptr ),
      count( 0 )  {}
    Slice( const T* data, size_t size ):
      items( data ),
      count( size ) {}
    Slice( const Slice& ) = default;
    Slice& operator=( const Slice& ) = default;
  template <class Iterable>
    Slice( const Iterable& coll ):
      items( coll.data() ),
      count( coll.size() )  {}

  public:
    auto  begin() const -> const T* {  return items;  }
    auto  end() const -> const T*   {  return items + count;  }
    auto  data() const -> const T*  {  return items;  }
    auto  size() const -> size_t    {  return count;  }
    bool  empty() const {  return count == 0;  }

    auto  operator[]( size_t pos ) const -> const T& {  return items[pos];  }

  protected:
    const T*  items;
    size_t    count;

  };

}

# endif   // __ffindex_api_slice_hxx__
