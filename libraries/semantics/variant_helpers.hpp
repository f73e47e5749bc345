#pragma once

#include <marlowe/semantics/config.hpp>
#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/types.hpp>

namespace marlowe { namespace semantics { namespace detail {

   inline const variant_object& expect_object( const variant& var, const char* what )
   {
      if( !var.is_object() )
         FC_THROW_EXCEPTION( invalid_contract_encoding, "expected ${what} object, got ${v}", ("what",what)("v",var) );
      return var.get_object();
   }

   inline const fc::variants& expect_array( const variant& var, const char* what )
   {
      if( !var.is_array() )
         FC_THROW_EXCEPTION( invalid_contract_encoding, "expected ${what} array, got ${v}", ("what",what)("v",var) );
      return var.get_array();
   }

   inline const variant& expect_field( const variant_object& obj, const char* key )
   {
      if( !obj.contains( key ) )
         FC_THROW_EXCEPTION( invalid_contract_encoding, "missing field ${key}", ("key",key)("obj",obj) );
      return obj[key];
   }

   inline string expect_string( const variant& var, const char* what )
   {
      if( !var.is_string() )
         FC_THROW_EXCEPTION( invalid_contract_encoding, "expected ${what} string, got ${v}", ("what",what)("v",var) );
      return var.as_string();
   }

   /** [[key, value], ...] pairs as written for maps with structured keys */
   inline const fc::variants& expect_pair( const variant& var, const char* what )
   {
      const fc::variants& entry = expect_array( var, what );
      if( entry.size() != 2 )
         FC_THROW_EXCEPTION( invalid_contract_encoding, "expected ${what} pair, got ${v}", ("what",what)("v",var) );
      return entry;
   }

   inline uint32_t& decode_nesting_depth()
   {
      static thread_local uint32_t depth = 0;
      return depth;
   }

   /** counts one level of value, observation or contract nesting while decoding */
   class nesting_guard
   {
      public:
         nesting_guard()
         {
            if( decode_nesting_depth() >= MARLOWE_MAX_DECODE_NESTING_DEPTH )
               FC_THROW_EXCEPTION( invalid_contract_encoding, "nesting deeper than ${max}",
                                   ("max",MARLOWE_MAX_DECODE_NESTING_DEPTH) );
            ++decode_nesting_depth();
         }
         ~nesting_guard() { --decode_nesting_depth(); }

      private:
         nesting_guard( const nesting_guard& );
         nesting_guard& operator = ( const nesting_guard& );
   };

} } } // marlowe::semantics::detail
