#include <marlowe/semantics/arithmetic.hpp>
#include <marlowe/semantics/evaluation.hpp>
#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/reduction.hpp>

#include <fc/log/logger.hpp>

namespace marlowe { namespace semantics {

   namespace
   {
      reduce_step_result reduced( const state& s, const contract_ptr& continuation )
      {
         reduce_step_result result;
         result.status       = reduced_step;
         result.new_state    = s;
         result.continuation = continuation;
         return result;
      }

      reduce_step_result not_reduced( const state& s, const contract_ptr& c, reduce_step_status status = not_reduced_step )
      {
         reduce_step_result result;
         result.status       = status;
         result.new_state    = s;
         result.continuation = c;
         return result;
      }

      /** refunds the first account in key order to its owner */
      reduce_step_result reduce_close( const state& s, const contract_ptr& c )
      {
         if( s.accounts.empty() )
            return not_reduced( s, c );

         auto first = s.accounts.begin();
         reduce_step_result result = reduced( s, c );
         result.paid = payment( first->first.account, payee::to_party( first->first.account ),
                                first->first.currency, first->second );
         result.new_state.accounts.erase( first->first );
         return result;
      }

      reduce_step_result reduce_pay( const environment& env, const state& s, const contract& c )
      {
         const integer_type to_pay = eval_value( env, s, c.amount );
         if( to_pay <= 0 )
         {
            reduce_step_result result = reduced( s, c.then );
            result.warning = make_non_positive_pay_warning( c.from_account, c.to, c.currency, to_pay );
            return result;
         }

         const integer_type balance = s.money_in_account( c.from_account, c.currency );
         const integer_type paid    = min_integer( to_pay, balance );

         reduce_step_result result = reduced( s, c.then );
         if( paid < to_pay )
            result.warning = make_partial_pay_warning( c.from_account, c.to, c.currency, paid, to_pay );

         result.new_state.set_money_in_account( c.from_account, c.currency, balance - paid );
         switch( c.to.type )
         {
            case account_payee_type:
               result.new_state.add_money_to_account( c.to.owner, c.currency, paid );
               break;
            case party_payee_type:
               result.paid = payment( c.from_account, c.to, c.currency, paid );
               break;
            // No default to force compiler warning
         }
         return result;
      }

      reduce_step_result reduce_let( const environment& env, const state& s, const contract& c )
      {
         const integer_type evaluated = eval_value( env, s, c.amount );
         reduce_step_result result = reduced( s, c.then );

         auto itr = s.bound_values.find( c.name );
         if( itr != s.bound_values.end() && itr->second != evaluated )
            result.warning = make_shadowing_warning( c.name, itr->second, evaluated );

         result.new_state.bound_values[c.name] = evaluated;
         return result;
      }
   }

   reduce_step_result reduce_contract_step( const environment& env, const state& s, const contract_ptr& c )
   { try {
      FC_ASSERT( c, "null contract" );
      switch( c->type )
      {
         case close_contract_type:
            return reduce_close( s, c );
         case pay_contract_type:
            return reduce_pay( env, s, *c );
         case if_contract_type:
            return reduced( s, eval_observation( env, s, c->condition ) ? c->then : c->otherwise );
         case when_contract_type:
            if( env.interval.to < c->timeout )
               return not_reduced( s, c );
            if( c->timeout <= env.interval.from )
               return reduced( s, c->otherwise );
            return not_reduced( s, c, ambiguous_time_interval_step );
         case let_contract_type:
            return reduce_let( env, s, *c );
         case assert_contract_type:
         {
            reduce_step_result result = reduced( s, c->then );
            if( !eval_observation( env, s, c->condition ) )
               result.warning = make_assertion_failed_warning();
            return result;
         }
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( fc::invalid_arg_exception, "invalid contract type ${t}", ("t",int(c->type)) );
   } FC_CAPTURE_AND_RETHROW( (env) ) }

   quiescent_result reduce_contract_until_quiescent( const environment& env, const state& s, const contract_ptr& c,
                                                     uint64_t max_steps )
   { try {
      quiescent_result result;
      result.new_state    = s;
      result.continuation = c;

      while( true )
      {
         reduce_step_result step = reduce_contract_step( env, result.new_state, result.continuation );
         switch( step.status )
         {
            case reduced_step:
               break;
            case not_reduced_step:
               return result;
            case ambiguous_time_interval_step:
               FC_CAPTURE_AND_THROW( ambiguous_time_interval, (env.interval.from)(env.interval.to)(result.continuation->timeout) );
            // No default to force compiler warning
         }

         if( max_steps != 0 && result.steps >= max_steps )
            FC_CAPTURE_AND_THROW( reduction_step_limit_exceeded, (max_steps) );

         ++result.steps;
         result.reduced = true;
         if( step.warning.valid() )
            result.warnings.push_back( *step.warning );
         if( step.paid.valid() )
            result.payments.push_back( *step.paid );
         result.new_state    = std::move( step.new_state );
         result.continuation = step.continuation;
      }
   } FC_CAPTURE_AND_RETHROW( (env) ) }

   bool is_waiting_for_input( const environment& env, const contract_ptr& c )
   {
      return c && c->is_when() && env.interval.to < c->timeout;
   }

} } // marlowe::semantics
