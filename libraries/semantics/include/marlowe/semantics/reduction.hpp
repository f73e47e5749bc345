#pragma once

#include <marlowe/semantics/transaction.hpp>

namespace marlowe { namespace semantics {

   /**
    *  Takes one internal step (one that needs no external input).
    *  Never throws for a well formed contract, an interval that
    *  straddles a When timeout is reported as ambiguous_time_interval_step.
    */
   reduce_step_result reduce_contract_step( const environment& env, const state& s, const contract_ptr& c );

   /**
    *  Repeats reduce_contract_step until the contract is a Close with
    *  empty accounts or a When waiting for input.  Warnings and payments
    *  are returned in the order they were produced.
    *
    *  @param max_steps  throws reduction_step_limit_exceeded after this many steps, 0 disables the limit
    *  @throws ambiguous_time_interval
    */
   quiescent_result reduce_contract_until_quiescent( const environment& env, const state& s, const contract_ptr& c,
                                                     uint64_t max_steps = MARLOWE_DEFAULT_MAX_REDUCTION_STEPS );

   /** true when c is a When that cannot time out anywhere in env */
   bool is_waiting_for_input( const environment& env, const contract_ptr& c );

} } // marlowe::semantics
