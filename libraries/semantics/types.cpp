#include <marlowe/semantics/arithmetic.hpp>
#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/types.hpp>

namespace fc
{
   void to_variant( const marlowe::semantics::integer_type& var, variant& vo )
   {
      if( marlowe::semantics::fits_int64( var ) )
         vo = variant( var.convert_to<int64_t>() );
      else
         vo = variant( var.str() );
   }

   void from_variant( const variant& var, marlowe::semantics::integer_type& vo )
   { try {
      if( var.is_string() )
         vo = marlowe::semantics::parse_integer( var.as_string() );
      else if( var.is_uint64() )
         vo = marlowe::semantics::integer_type( var.as_uint64() );
      else if( var.is_int64() )
         vo = marlowe::semantics::integer_type( var.as_int64() );
      else
         FC_THROW_EXCEPTION( marlowe::semantics::invalid_contract_encoding, "expected an integer, got ${v}", ("v",var) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
