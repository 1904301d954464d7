# if !defined( __ffindex_src_tools_primes_hxx__ )
# define __ffindex_src_tools_primes_hxx__
# include <cstddef>

namespace ffindex {

  // smallest prime not less than n, 2 for n < 2
  auto  UpperPrime( size_t n ) -> size_t;

}

# endif   // !__ffindex_src_tools_primes_hxx__
