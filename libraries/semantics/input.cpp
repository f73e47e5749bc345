#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/input.hpp>

#include "variant_helpers.hpp"

namespace marlowe { namespace semantics {

   input make_deposit_input( const account_id_type& into_account, const party& from_party,
                             const token& currency, const integer_type& quantity )
   {
      input i( deposit_input_type );
      i.into_account = into_account;
      i.from_party   = from_party;
      i.currency     = currency;
      i.quantity     = quantity;
      return i;
   }

   input make_choice_input( const choice_id& choice, const integer_type& chosen_num )
   {
      input i( choice_input_type );
      i.choice     = choice;
      i.chosen_num = chosen_num;
      return i;
   }

   input make_notify_input()
   {
      return input( notify_input_type );
   }

   input disclose( const input& i, const contract_hash_type& hash, const contract_ptr& continuation )
   {
      FC_ASSERT( continuation );
      input result( i );
      result.merkleized = merkleized_continuation( hash, continuation );
      return result;
   }

   bool operator == ( const input& l, const input& r )
   {
      if( l.type != r.type || l.is_merkleized() != r.is_merkleized() )
         return false;

      if( l.is_merkleized() )
      {
         if( l.merkleized->continuation_hash != r.merkleized->continuation_hash
             || !same_contract( l.merkleized->continuation, r.merkleized->continuation ) )
            return false;
      }

      switch( l.type )
      {
         case deposit_input_type:
            return l.into_account == r.into_account && l.from_party == r.from_party
                && l.currency == r.currency && l.quantity == r.quantity;
         case choice_input_type:
            return l.choice == r.choice && l.chosen_num == r.chosen_num;
         case notify_input_type:
            return true;
         // No default to force compiler warning
      }
      return false;
   }

} } // marlowe::semantics

namespace fc
{
   using namespace marlowe::semantics::detail;

   void to_variant( const marlowe::semantics::input& var, variant& vo )
   {
      using namespace marlowe::semantics;
      mutable_variant_object obj;
      switch( var.type )
      {
         case deposit_input_type:
            obj( "input_from_party", var.from_party )
               ( "that_deposits", var.quantity )
               ( "of_token", var.currency )
               ( "into_account", var.into_account );
            break;
         case choice_input_type:
            obj( "for_choice_id", var.choice )
               ( "input_that_chooses_num", var.chosen_num );
            break;
         case notify_input_type:
            if( !var.is_merkleized() )
            {
               vo = variant( "input_notify" );
               return;
            }
            break;
         // No default to force compiler warning
      }

      if( var.is_merkleized() )
      {
         obj( "continuation_hash", var.merkleized->continuation_hash )
            ( "merkleized_continuation", var.merkleized->continuation );
      }
      vo = std::move( obj );
   }

   void from_variant( const variant& var, marlowe::semantics::input& vo )
   { try {
      using namespace marlowe::semantics;
      if( var.is_string() )
      {
         if( var.as_string() != "input_notify" )
            FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown input ${v}", ("v",var) );
         vo = make_notify_input();
         return;
      }

      const variant_object& obj = expect_object( var, "input" );
      input result;
      if( obj.contains( "input_from_party" ) )
      {
         result = make_deposit_input( expect_field( obj, "into_account" ).as<party>(),
                                      obj["input_from_party"].as<party>(),
                                      expect_field( obj, "of_token" ).as<token>(),
                                      expect_field( obj, "that_deposits" ).as<integer_type>() );
      }
      else if( obj.contains( "for_choice_id" ) )
      {
         result = make_choice_input( obj["for_choice_id"].as<choice_id>(),
                                     expect_field( obj, "input_that_chooses_num" ).as<integer_type>() );
      }
      else if( obj.contains( "continuation_hash" ) )
      {
         result = make_notify_input();
      }
      else
         FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown input ${v}", ("v",var) );

      if( obj.contains( "continuation_hash" ) )
      {
         result = disclose( result,
                            expect_string( obj["continuation_hash"], "continuation_hash" ),
                            expect_field( obj, "merkleized_continuation" ).as<contract_ptr>() );
      }
      vo = std::move( result );
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
