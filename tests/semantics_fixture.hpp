#pragma once

#include <marlowe/semantics/applicable_actions.hpp>
#include <marlowe/semantics/apply_input.hpp>
#include <marlowe/semantics/compute_transaction.hpp>
#include <marlowe/semantics/evaluation.hpp>
#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/reduction.hpp>

#include <fc/io/json.hpp>

using namespace marlowe::semantics;

struct semantics_fixture
{
   semantics_fixture()
   :alice( party::address( "addr_test1qalice" ) ),
    bob( party::role( "bob" ) ),
    carol( party::role( "carol" ) ),
    ada( ada_token() ),
    dollar( "85bb65", "dollar" )
   {}

   /** When [ Deposit(alice -> alice, amount ada) then Close ] timeout -> Close */
   contract_ptr deposit_then_close( const integer_type& amount, timeout_type timeout )const
   {
      return make_when( { make_case( make_deposit( alice, alice, ada, make_constant( amount ) ), make_close() ) },
                        timeout, make_close() );
   }

   state funded( const party& owner, const token& currency, const integer_type& amount, timeout_type min_time = 0 )const
   {
      state s( min_time );
      s.set_money_in_account( owner, currency, amount );
      return s;
   }

   /** sum of every balance plus every payment that left the contract, per token */
   integer_type custody( const state& s, const vector<payment>& payments, const token& currency )const
   {
      integer_type total = s.total_balance( currency );
      for( const auto& p : payments )
      {
         if( p.currency == currency && p.to.type == party_payee_type )
            total += p.amount;
      }
      return total;
   }

   party  alice;
   party  bob;
   party  carol;
   token  ada;
   token  dollar;
};
