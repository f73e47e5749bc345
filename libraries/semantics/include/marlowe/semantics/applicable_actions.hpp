#pragma once

#include <marlowe/semantics/continuation_resolver.hpp>
#include <marlowe/semantics/transaction.hpp>

namespace marlowe { namespace semantics {

   enum applicable_action_type_enum
   {
      advance_timeout_applicable_action  = 0,
      deposit_applicable_action          = 1,
      choice_applicable_action           = 2,
      notify_applicable_action           = 3
   };

   /** what a participant ends up with after taking an applicable action */
   struct applied_action_result
   {
      vector<input>                inputs;
      environment                  env;
      state                        reduced_state;
      contract_ptr                 reduced_contract;
      vector<transaction_warning>  warnings;
      vector<payment>              payments;
   };

   /**
    *  One thing that can be done to the contract right now.  Deposit,
    *  choice and notify actions carry the case action they would match,
    *  advance_timeout only performs the pending internal steps.
    */
   struct applicable_action
   {
      applicable_action():type(advance_timeout_applicable_action),max_steps(MARLOWE_DEFAULT_MAX_REDUCTION_STEPS){}

      /**
       *  @param chosen  the number to choose, required for a choice action
       *                 and ignored otherwise
       */
      applied_action_result apply( const optional<integer_type>& chosen = optional<integer_type>() )const;

      applicable_action_type_enum        type;
      action                             case_action;
      optional<merkleized_continuation>  disclosure;

      environment                        env;
      quiescent_result                   initial_reduction;
      uint64_t                           max_steps;
   };

   /** the party that must act, none means anybody may */
   optional<party> get_applicant( const applicable_action& a );

   /** the earliest When timeout strictly after `after` on any timeout path of c */
   optional<timeout_type> get_next_timeout( const contract_ptr& c, timeout_type after );

   /**
    *  The interval a client would offer at now: up to one millisecond
    *  before the next timeout, or a day when there is none.
    */
   time_interval default_interval( const contract_ptr& c, timeout_type now );

   /**
    *  Lists the actions that apply to c in env.  Merkleized cases are
    *  resolved through resolver.  max_steps bounds the initial reduction
    *  and is kept on each action for apply().
    *
    *  @throws ambiguous_time_interval
    *  @throws unresolved_continuation
    */
   vector<applicable_action> get_applicable_actions( const environment& env, const state& s, const contract_ptr& c,
                                                     const continuation_resolver_ptr& resolver = continuation_resolver_ptr(),
                                                     uint64_t max_steps = MARLOWE_DEFAULT_MAX_REDUCTION_STEPS );

} } // marlowe::semantics

namespace fc
{
   void to_variant( const marlowe::semantics::applicable_action& var, variant& vo );
   void to_variant( const marlowe::semantics::applied_action_result& var, variant& vo );
}

FC_REFLECT_ENUM( marlowe::semantics::applicable_action_type_enum,
        (advance_timeout_applicable_action)
        (deposit_applicable_action)
        (choice_applicable_action)
        (notify_applicable_action)
        )
