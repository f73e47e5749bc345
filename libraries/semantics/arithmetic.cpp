#include <marlowe/semantics/arithmetic.hpp>
#include <marlowe/semantics/exceptions.hpp>

#include <limits>
#include <stdexcept>

namespace marlowe { namespace semantics {

   integer_type divide_round_half_away( const integer_type& n, const integer_type& d )
   {
      if( d == 0 )
         return integer_type( 0 );

      // cpp_int division truncates toward zero, the remainder takes the sign of n
      integer_type quotient  = n / d;
      integer_type remainder = n % d;

      if( 2 * abs( remainder ) >= abs( d ) )
      {
         if( (n < 0) == (d < 0) )
            ++quotient;
         else
            --quotient;
      }
      return quotient;
   }

   bool fits_int64( const integer_type& n )
   {
      return n >= std::numeric_limits<int64_t>::min() && n <= std::numeric_limits<int64_t>::max();
   }

   integer_type parse_integer( const string& decimal )
   {
      if( decimal.empty() )
         FC_THROW_EXCEPTION( invalid_contract_encoding, "empty integer literal" );

      size_t pos = (decimal[0] == '-' || decimal[0] == '+') ? 1 : 0;
      if( pos == decimal.size() )
         FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid integer literal ${s}", ("s",decimal) );
      for( ; pos < decimal.size(); ++pos )
      {
         if( decimal[pos] < '0' || decimal[pos] > '9' )
            FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid integer literal ${s}", ("s",decimal) );
      }

      if( decimal[0] == '+' )
         return integer_type( decimal.substr( 1 ).c_str() );
      return integer_type( decimal.c_str() );
   }

} } // marlowe::semantics
