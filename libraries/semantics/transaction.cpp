#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/transaction.hpp>

#include "variant_helpers.hpp"

namespace marlowe { namespace semantics {

   transaction_warning make_non_positive_deposit_warning( const party& by, const account_id_type& account,
                                                          const token& currency, const integer_type& asked )
   {
      transaction_warning w( non_positive_deposit_warning );
      w.by       = by;
      w.account  = account;
      w.currency = currency;
      w.asked    = asked;
      return w;
   }

   transaction_warning make_non_positive_pay_warning( const account_id_type& account, const payee& to,
                                                      const token& currency, const integer_type& asked )
   {
      transaction_warning w( non_positive_pay_warning );
      w.account  = account;
      w.to       = to;
      w.currency = currency;
      w.asked    = asked;
      return w;
   }

   transaction_warning make_partial_pay_warning( const account_id_type& account, const payee& to, const token& currency,
                                                 const integer_type& paid, const integer_type& asked )
   {
      transaction_warning w( partial_pay_warning );
      w.account  = account;
      w.to       = to;
      w.currency = currency;
      w.paid     = paid;
      w.asked    = asked;
      return w;
   }

   transaction_warning make_shadowing_warning( const value_id_type& id, const integer_type& had_value, const integer_type& is_now )
   {
      transaction_warning w( shadowing_warning );
      w.value_id  = id;
      w.had_value = had_value;
      w.is_now    = is_now;
      return w;
   }

   transaction_warning make_assertion_failed_warning()
   {
      return transaction_warning( assertion_failed_warning );
   }

   bool operator == ( const transaction_warning& l, const transaction_warning& r )
   {
      if( l.type != r.type )
         return false;

      switch( l.type )
      {
         case non_positive_deposit_warning:
            return l.by == r.by && l.account == r.account && l.currency == r.currency && l.asked == r.asked;
         case non_positive_pay_warning:
            return l.account == r.account && l.to == r.to && l.currency == r.currency && l.asked == r.asked;
         case partial_pay_warning:
            return l.account == r.account && l.to == r.to && l.currency == r.currency
                && l.asked == r.asked && l.paid == r.paid;
         case shadowing_warning:
            return l.value_id == r.value_id && l.had_value == r.had_value && l.is_now == r.is_now;
         case assertion_failed_warning:
            return true;
         // No default to force compiler warning
      }
      return false;
   }

} } // marlowe::semantics

namespace fc
{
   using namespace marlowe::semantics::detail;

   namespace
   {
      template<typename T>
      fc::variants to_variants( const std::vector<T>& items )
      {
         fc::variants result;
         result.reserve( items.size() );
         for( const auto& item : items )
            result.push_back( variant( item ) );
         return result;
      }
   }

   void to_variant( const marlowe::semantics::payment& var, variant& vo )
   {
      mutable_variant_object obj( "payment_from", var.from_account );
      obj( "to", var.to )
         ( "token", var.currency )
         ( "amount", var.amount );
      vo = std::move( obj );
   }

   void from_variant( const variant& var, marlowe::semantics::payment& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "payment" );
      vo = payment( expect_field( obj, "payment_from" ).as<party>(),
                    expect_field( obj, "to" ).as<payee>(),
                    expect_field( obj, "token" ).as<token>(),
                    expect_field( obj, "amount" ).as<integer_type>() );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::transaction_warning& var, variant& vo )
   {
      using namespace marlowe::semantics;
      switch( var.type )
      {
         case non_positive_deposit_warning:
         {
            mutable_variant_object obj( "party", var.by );
            obj( "asked_to_deposit", var.asked )
               ( "of_token", var.currency )
               ( "in_account", var.account );
            vo = std::move( obj );
            return;
         }
         case non_positive_pay_warning:
         {
            mutable_variant_object obj( "account", var.account );
            obj( "asked_to_pay", var.asked )
               ( "of_token", var.currency )
               ( "to", var.to );
            vo = std::move( obj );
            return;
         }
         case partial_pay_warning:
         {
            mutable_variant_object obj( "account", var.account );
            obj( "asked_to_pay", var.asked )
               ( "of_token", var.currency )
               ( "to", var.to )
               ( "but_only_paid", var.paid );
            vo = std::move( obj );
            return;
         }
         case shadowing_warning:
         {
            mutable_variant_object obj( "value_id", var.value_id );
            obj( "had_value", var.had_value )
               ( "is_now", var.is_now );
            vo = std::move( obj );
            return;
         }
         case assertion_failed_warning:
            vo = variant( "assertion_failed" );
            return;
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid warning type ${t}", ("t",int(var.type)) );
   }

   void from_variant( const variant& var, marlowe::semantics::transaction_warning& vo )
   { try {
      using namespace marlowe::semantics;
      if( var.is_string() )
      {
         if( var.as_string() != "assertion_failed" )
            FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown warning ${v}", ("v",var) );
         vo = make_assertion_failed_warning();
         return;
      }

      const variant_object& obj = expect_object( var, "warning" );
      if( obj.contains( "asked_to_deposit" ) )
      {
         vo = make_non_positive_deposit_warning( expect_field( obj, "party" ).as<party>(),
                                                 expect_field( obj, "in_account" ).as<party>(),
                                                 expect_field( obj, "of_token" ).as<token>(),
                                                 obj["asked_to_deposit"].as<integer_type>() );
      }
      else if( obj.contains( "but_only_paid" ) )
      {
         vo = make_partial_pay_warning( expect_field( obj, "account" ).as<party>(),
                                        expect_field( obj, "to" ).as<payee>(),
                                        expect_field( obj, "of_token" ).as<token>(),
                                        obj["but_only_paid"].as<integer_type>(),
                                        expect_field( obj, "asked_to_pay" ).as<integer_type>() );
      }
      else if( obj.contains( "asked_to_pay" ) )
      {
         vo = make_non_positive_pay_warning( expect_field( obj, "account" ).as<party>(),
                                             expect_field( obj, "to" ).as<payee>(),
                                             expect_field( obj, "of_token" ).as<token>(),
                                             obj["asked_to_pay"].as<integer_type>() );
      }
      else if( obj.contains( "value_id" ) )
      {
         vo = make_shadowing_warning( expect_string( obj["value_id"], "value_id" ),
                                      expect_field( obj, "had_value" ).as<integer_type>(),
                                      expect_field( obj, "is_now" ).as<integer_type>() );
      }
      else
         FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown warning ${v}", ("v",var) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::transaction_input& var, variant& vo )
   {
      mutable_variant_object interval( "from", var.interval.from );
      interval( "to", var.interval.to );

      mutable_variant_object obj( "tx_interval", interval );
      obj( "tx_inputs", to_variants( var.inputs ) );
      vo = std::move( obj );
   }

   void from_variant( const variant& var, marlowe::semantics::transaction_input& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "transaction" );
      const variant_object& interval = expect_object( expect_field( obj, "tx_interval" ), "tx_interval" );

      transaction_input result;
      result.interval = time_interval( expect_field( interval, "from" ).as_int64(),
                                       expect_field( interval, "to" ).as_int64() );
      if( obj.contains( "tx_inputs" ) )
      {
         for( const auto& i : expect_array( obj["tx_inputs"], "tx_inputs" ) )
            result.inputs.push_back( i.as<input>() );
      }
      vo = std::move( result );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::transaction_output& var, variant& vo )
   {
      mutable_variant_object obj( "warnings", to_variants( var.warnings ) );
      obj( "payments", to_variants( var.payments ) )
         ( "state", var.new_state )
         ( "contract", var.continuation );
      vo = std::move( obj );
   }

   void to_variant( const marlowe::semantics::reduction_output& var, variant& vo )
   {
      mutable_variant_object obj( "reduced", var.reduced );
      obj( "warnings", to_variants( var.warnings ) )
         ( "payments", to_variants( var.payments ) )
         ( "state", var.new_state )
         ( "continuation", var.continuation );
      vo = std::move( obj );
   }
}
