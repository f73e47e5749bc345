#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/party.hpp>

#include "variant_helpers.hpp"

namespace marlowe { namespace semantics {

   bool in_bounds( const integer_type& n, const vector<bound>& bounds )
   {
      for( const auto& b : bounds )
      {
         if( b.contains( n ) )
            return true;
      }
      return false;
   }

} } // marlowe::semantics

namespace fc
{
   using namespace marlowe::semantics::detail;

   void to_variant( const marlowe::semantics::party& var, variant& vo )
   {
      using namespace marlowe::semantics;
      switch( var.type )
      {
         case address_party_type:
            vo = mutable_variant_object( "address", var.name );
            return;
         case role_party_type:
            vo = mutable_variant_object( "role_token", var.name );
            return;
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid party type ${t}", ("t",int(var.type)) );
   }

   void from_variant( const variant& var, marlowe::semantics::party& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "party" );
      if( obj.contains( "address" ) )
         vo = party::address( expect_string( obj["address"], "address" ) );
      else if( obj.contains( "role_token" ) )
         vo = party::role( expect_string( obj["role_token"], "role_token" ) );
      else
         FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown party ${v}", ("v",var) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::payee& var, variant& vo )
   {
      using namespace marlowe::semantics;
      switch( var.type )
      {
         case account_payee_type:
            vo = mutable_variant_object( "account", var.owner );
            return;
         case party_payee_type:
            vo = mutable_variant_object( "party", var.owner );
            return;
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid payee type ${t}", ("t",int(var.type)) );
   }

   void from_variant( const variant& var, marlowe::semantics::payee& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "payee" );
      if( obj.contains( "account" ) )
         vo = payee::account( obj["account"].as<party>() );
      else if( obj.contains( "party" ) )
         vo = payee::to_party( obj["party"].as<party>() );
      else
         FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown payee ${v}", ("v",var) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::token& var, variant& vo )
   {
      mutable_variant_object obj( "currency_symbol", var.currency_symbol );
      obj( "token_name", var.token_name );
      vo = std::move( obj );
   }

   void from_variant( const variant& var, marlowe::semantics::token& vo )
   { try {
      const variant_object& obj = expect_object( var, "token" );
      vo.currency_symbol = expect_string( expect_field( obj, "currency_symbol" ), "currency_symbol" );
      vo.token_name      = expect_string( expect_field( obj, "token_name" ), "token_name" );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::choice_id& var, variant& vo )
   {
      mutable_variant_object obj( "choice_name", var.choice_name );
      obj( "choice_owner", var.choice_owner );
      vo = std::move( obj );
   }

   void from_variant( const variant& var, marlowe::semantics::choice_id& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "choice id" );
      vo.choice_name  = expect_string( expect_field( obj, "choice_name" ), "choice_name" );
      vo.choice_owner = expect_field( obj, "choice_owner" ).as<party>();
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::bound& var, variant& vo )
   {
      mutable_variant_object obj( "from", var.from );
      obj( "to", var.to );
      vo = std::move( obj );
   }

   void from_variant( const variant& var, marlowe::semantics::bound& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "bound" );
      vo.from = expect_field( obj, "from" ).as<integer_type>();
      vo.to   = expect_field( obj, "to" ).as<integer_type>();
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
