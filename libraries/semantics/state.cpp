#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/state.hpp>

#include "variant_helpers.hpp"

namespace marlowe { namespace semantics {

   integer_type state::money_in_account( const account_id_type& account, const token& currency )const
   {
      auto itr = accounts.find( account_key( account, currency ) );
      if( itr == accounts.end() )
         return integer_type( 0 );
      return itr->second;
   }

   void state::set_money_in_account( const account_id_type& account, const token& currency, const integer_type& balance )
   {
      const account_key key( account, currency );
      if( balance <= 0 )
         accounts.erase( key );
      else
         accounts[key] = balance;
   }

   void state::add_money_to_account( const account_id_type& account, const token& currency, const integer_type& amount )
   {
      if( amount <= 0 )
         return;
      set_money_in_account( account, currency, money_in_account( account, currency ) + amount );
   }

   integer_type state::total_balance( const token& currency )const
   {
      integer_type total = 0;
      for( const auto& item : accounts )
      {
         if( item.first.currency == currency )
            total += item.second;
      }
      return total;
   }

   bool operator == ( const state& l, const state& r )
   {
      return l.min_time == r.min_time
          && l.accounts == r.accounts
          && l.choices == r.choices
          && l.bound_values == r.bound_values;
   }

} } // marlowe::semantics

namespace fc
{
   using namespace marlowe::semantics::detail;

   void to_variant( const marlowe::semantics::state& var, variant& vo )
   {
      fc::variants accounts;
      for( const auto& item : var.accounts )
      {
         fc::variants key{ variant( item.first.account ), variant( item.first.currency ) };
         fc::variants entry{ variant( key ), variant( item.second ) };
         accounts.push_back( variant( entry ) );
      }

      fc::variants choices;
      for( const auto& item : var.choices )
      {
         fc::variants entry{ variant( item.first ), variant( item.second ) };
         choices.push_back( variant( entry ) );
      }

      fc::variants bound_values;
      for( const auto& item : var.bound_values )
      {
         fc::variants entry{ variant( item.first ), variant( item.second ) };
         bound_values.push_back( variant( entry ) );
      }

      mutable_variant_object obj( "accounts", accounts );
      obj( "choices", choices )
         ( "boundValues", bound_values )
         ( "minTime", var.min_time );
      vo = std::move( obj );
   }

   void from_variant( const variant& var, marlowe::semantics::state& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "state" );

      state result( expect_field( obj, "minTime" ).as_int64() );

      for( const auto& item : expect_array( expect_field( obj, "accounts" ), "accounts" ) )
      {
         const fc::variants& entry = expect_pair( item, "account" );
         const fc::variants& key   = expect_pair( entry[0], "account key" );
         const integer_type balance = entry[1].as<integer_type>();
         if( balance <= 0 )
            FC_THROW_EXCEPTION( invalid_contract_encoding, "account balance must be positive", ("entry",item) );
         result.accounts[ account_key( key[0].as<party>(), key[1].as<token>() ) ] = balance;
      }

      for( const auto& item : expect_array( expect_field( obj, "choices" ), "choices" ) )
      {
         const fc::variants& entry = expect_pair( item, "choice" );
         result.choices[ entry[0].as<choice_id>() ] = entry[1].as<integer_type>();
      }

      for( const auto& item : expect_array( expect_field( obj, "boundValues" ), "boundValues" ) )
      {
         const fc::variants& entry = expect_pair( item, "bound value" );
         result.bound_values[ expect_string( entry[0], "value id" ) ] = entry[1].as<integer_type>();
      }

      vo = std::move( result );
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
