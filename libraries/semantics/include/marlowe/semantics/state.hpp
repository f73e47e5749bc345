#pragma once

#include <marlowe/semantics/party.hpp>
#include <marlowe/semantics/types.hpp>

#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

namespace marlowe { namespace semantics {

   /** accounts are keyed by owner first, then by token */
   struct account_key
   {
      account_key(){}
      account_key( const account_id_type& a, const token& t ):account(a),currency(t){}

      account_id_type  account;
      token            currency;
   };

   inline bool operator == ( const account_key& l, const account_key& r )
   {
      return l.account == r.account && l.currency == r.currency;
   }
   inline bool operator <  ( const account_key& l, const account_key& r )
   {
      if( l.account != r.account ) return l.account < r.account;
      return l.currency < r.currency;
   }

   typedef map<account_key, integer_type>    accounts_type;
   typedef map<choice_id, integer_type>      choices_type;
   typedef map<value_id_type, integer_type>  bound_values_type;

   /**
    *  Everything a contract remembers between steps.  Only positive
    *  balances are ever stored in accounts.  min_time never decreases
    *  over the life of a contract.
    */
   struct state
   {
      state():min_time(0){}
      explicit state( timeout_type t ):min_time(t){}

      integer_type  money_in_account( const account_id_type& account, const token& currency )const;
      /** stores balance, erasing the entry when it is not positive */
      void          set_money_in_account( const account_id_type& account, const token& currency, const integer_type& balance );
      void          add_money_to_account( const account_id_type& account, const token& currency, const integer_type& amount );

      bool          has_funds()const { return !accounts.empty(); }
      integer_type  total_balance( const token& currency )const;

      accounts_type      accounts;
      choices_type       choices;
      bound_values_type  bound_values;
      timeout_type       min_time;
   };

   inline state empty_state( timeout_type min_time ) { return state( min_time ); }

   bool operator == ( const state& l, const state& r );
   inline bool operator != ( const state& l, const state& r ) { return !( l == r ); }

   /** both ends inclusive, milliseconds since the POSIX epoch */
   struct time_interval
   {
      time_interval():from(0),to(0){}
      time_interval( timeout_type f, timeout_type t ):from(f),to(t){}

      timeout_type from;
      timeout_type to;
   };

   inline bool operator == ( const time_interval& l, const time_interval& r ) { return l.from == r.from && l.to == r.to; }

   struct environment
   {
      environment(){}
      explicit environment( const time_interval& i ):interval(i){}
      environment( timeout_type from, timeout_type to ):interval(from,to){}

      time_interval interval;
   };

} } // marlowe::semantics

namespace fc
{
   void to_variant( const marlowe::semantics::state& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::state& vo );
}

FC_REFLECT( marlowe::semantics::time_interval, (from)(to) )
FC_REFLECT( marlowe::semantics::environment, (interval) )
