#pragma once

#include <marlowe/semantics/reduction.hpp>

namespace marlowe { namespace semantics {

   /**
    *  Applies one input to a When that is waiting for it and reduces the
    *  matched continuation to quiescence.  Cases are tried in declared
    *  order and the first whose action matches the input is taken.
    *
    *  @throws malformed_call   c is not a When waiting within env
    *  @throws apply_no_match   no case accepts the input
    *  @throws hash_mismatch    the matched case and the input disagree on the merkleized continuation
    */
   apply_result apply_input( const environment& env, const state& s, const contract_ptr& c, const input& in,
                             uint64_t max_steps = MARLOWE_DEFAULT_MAX_REDUCTION_STEPS );

   /**
    *  Reduces c to quiescence and then applies each input in turn.  Any
    *  failure rejects the whole batch.  An empty batch is just the
    *  quiescent reduction of c.  max_steps bounds each reduction to
    *  quiescence separately.
    */
   apply_result apply_all_inputs( const environment& env, const state& s, const contract_ptr& c, const vector<input>& inputs,
                                  uint64_t max_steps = MARLOWE_DEFAULT_MAX_REDUCTION_STEPS );

} } // marlowe::semantics
