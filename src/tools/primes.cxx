# include "primes.hxx"

namespace ffindex {

  static  bool  IsPrime( size_t n )
  {
    if ( n < 4 )
      return n > 1;
    if ( n % 2 == 0 || n % 3 == 0 )
      return false;

    for ( size_t d = 5; d * d <= n; d += 6 )
      if ( n % d == 0 || n % (d + 2) == 0 )
        return false;

    return true;
  }

  auto  UpperPrime( size_t n ) -> size_t
  {
    if ( n <= 2 )
      return 2;

    for ( n |= 1; !IsPrime( n ); )
      n += 2;

    return n;
  }

}
