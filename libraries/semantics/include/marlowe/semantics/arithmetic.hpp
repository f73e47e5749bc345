#pragma once

#include <marlowe/semantics/types.hpp>

namespace marlowe { namespace semantics {

   /**
    *  Divides n by d rounding to the nearest integer, halves are
    *  rounded away from zero.  Division by zero yields zero so that
    *  value evaluation stays total.
    */
   integer_type divide_round_half_away( const integer_type& n, const integer_type& d );

   inline integer_type min_integer( const integer_type& a, const integer_type& b ) { return a < b ? a : b; }
   inline timeout_type max_timeout( timeout_type a, timeout_type b ) { return a < b ? b : a; }

   bool         fits_int64( const integer_type& n );
   integer_type parse_integer( const string& decimal );

} } // marlowe::semantics
