# if !defined( __ffindex_api_metadata_hxx__ )
# define __ffindex_api_metadata_hxx__
# include <type_traits>
# include <optional>
# include <utility>

namespace ffindex
{

  template <class Key, class = void>
  struct is_ordered: std::false_type {};

  template <class Key>
  struct is_ordered<Key, std::void_t<decltype( std::declval<const Key&>() < std::declval<const Key&>() )>>:
    std::true_type {};

 /*
  * Metadata
  *
  * Running min/max of the keys seen by the index build. Filled once in the
  * same pass that fills the store, read-only afterwards.
  *
  * Keys without operator < are accepted and leave the metadata empty.
  */
  template <class Key>
  class Metadata
  {
  public:
    void  Update( const Key& );

    auto  GetMin() const -> const std::optional<Key>& {  return lower;  }
    auto  GetMax() const -> const std::optional<Key>& {  return upper;  }
    bool  empty() const {  return !lower.has_value();  }

  protected:
    std::optional<Key>  lower;
    std::optional<Key>  upper;

  };

  // Metadata implementation

  template <class Key>
  void  Metadata<Key>::Update( const Key& key )
  {
    if constexpr ( is_ordered<Key>::value )
    {
      if ( !lower.has_value() || key < *lower )
        lower = key;
      if ( !upper.has_value() || *upper < key )
        upper = key;
    }
  }

}

# endif   // __ffindex_api_metadata_hxx__
