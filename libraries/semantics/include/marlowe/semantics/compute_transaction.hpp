#pragma once

#include <marlowe/semantics/apply_input.hpp>

namespace marlowe { namespace semantics {

   /**
    *  Checks a declared transaction interval against the contract state
    *  and trims its start up to min_time.
    *
    *  @return the environment to evaluate with and the state with min_time advanced
    *  @throws invalid_interval   to < from
    *  @throws interval_in_past   to < s.min_time
    */
   pair<environment, state> fix_interval( const time_interval& interval, const state& s );

   /**
    *  Runs a whole transaction: fixes the interval, applies every input
    *  and reduces to quiescence.
    *
    *  @throws useless_transaction when neither an input nor an internal step applied
    */
   transaction_output compute_transaction( const transaction_input& tx, const state& s, const contract_ptr& c,
                                           uint64_t max_steps = MARLOWE_DEFAULT_MAX_REDUCTION_STEPS );

   /** runs transactions in order from an empty state created at min_time */
   transaction_output play_trace( timeout_type min_time, const contract_ptr& c, const vector<transaction_input>& transactions,
                                  uint64_t max_steps = MARLOWE_DEFAULT_MAX_REDUCTION_STEPS );

} } // marlowe::semantics
