#include <marlowe/semantics/apply_input.hpp>
#include <marlowe/semantics/evaluation.hpp>
#include <marlowe/semantics/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace marlowe { namespace semantics {

   namespace
   {
      bool action_matches( const environment& env, const state& s, const action& a, const input& in )
      {
         switch( a.type )
         {
            case deposit_action_type:
               return in.type == deposit_input_type
                   && in.into_account == a.into_account
                   && in.from_party == a.by
                   && in.currency == a.currency
                   && in.quantity == eval_value( env, s, a.amount );
            case choice_action_type:
               return in.type == choice_input_type
                   && in.choice == a.choice
                   && in_bounds( in.chosen_num, a.bounds );
            case notify_action_type:
               return in.type == notify_input_type
                   && eval_observation( env, s, a.condition );
            // No default to force compiler warning
         }
         return false;
      }

      contract_ptr matched_continuation( const contract_case& matched, const input& in )
      {
         if( matched.is_merkleized() != in.is_merkleized() )
            FC_CAPTURE_AND_THROW( hash_mismatch, (matched.is_merkleized())(in.is_merkleized()) );

         if( !matched.is_merkleized() )
            return matched.then;

         const contract_hash_type& expected = *matched.merkleized_then;
         const contract_hash_type& disclosed = in.merkleized->continuation_hash;
         if( expected != disclosed )
            FC_CAPTURE_AND_THROW( hash_mismatch, (expected)(disclosed) );
         return in.merkleized->continuation;
      }
   }

   apply_result apply_input( const environment& env, const state& s, const contract_ptr& c, const input& in,
                             uint64_t max_steps )
   { try {
      if( !is_waiting_for_input( env, c ) )
         FC_CAPTURE_AND_THROW( malformed_call, (env) );

      for( const auto& cs : c->cases )
      {
         if( !action_matches( env, s, cs.case_action, in ) )
            continue;

         const contract_ptr continuation = matched_continuation( cs, in );

         state next( s );
         optional<transaction_warning> warning;
         switch( in.type )
         {
            case deposit_input_type:
               if( in.quantity <= 0 )
                  warning = make_non_positive_deposit_warning( in.from_party, in.into_account, in.currency, in.quantity );
               else
                  next.add_money_to_account( in.into_account, in.currency, in.quantity );
               break;
            case choice_input_type:
               next.choices[in.choice] = in.chosen_num;
               break;
            case notify_input_type:
               break;
            // No default to force compiler warning
         }

         apply_result result = reduce_contract_until_quiescent( env, next, continuation, max_steps );
         result.reduced = true;
         if( warning.valid() )
            result.warnings.insert( result.warnings.begin(), *warning );
         return result;
      }

      FC_CAPTURE_AND_THROW( apply_no_match, (in) );
   } FC_CAPTURE_AND_RETHROW( (in) ) }

   apply_result apply_all_inputs( const environment& env, const state& s, const contract_ptr& c, const vector<input>& inputs,
                                  uint64_t max_steps )
   { try {
      apply_result result = reduce_contract_until_quiescent( env, s, c, max_steps );

      for( const auto& in : inputs )
      {
         if( !result.continuation->is_when() )
            FC_CAPTURE_AND_THROW( apply_no_match, (in) );

         apply_result applied = apply_input( env, result.new_state, result.continuation, in, max_steps );
         result.reduced = true;
         result.steps  += applied.steps;
         result.warnings.insert( result.warnings.end(), applied.warnings.begin(), applied.warnings.end() );
         result.payments.insert( result.payments.end(), applied.payments.begin(), applied.payments.end() );
         result.new_state    = std::move( applied.new_state );
         result.continuation = applied.continuation;
      }
      return result;
   } FC_CAPTURE_AND_RETHROW( (inputs) ) }

} } // marlowe::semantics
