#pragma once

#include <marlowe/semantics/state.hpp>
#include <marlowe/semantics/value.hpp>

namespace marlowe { namespace semantics {

   /**
    *  Evaluates v against the current state and time interval.
    *  Evaluation is total: missing accounts, choices and bound values
    *  read as zero and division by zero yields zero.
    *
    *  Recurses on nesting depth; decoded trees are bounded by
    *  MARLOWE_MAX_DECODE_NESTING_DEPTH.
    */
   integer_type eval_value( const environment& env, const state& s, const value& v );
   integer_type eval_value( const environment& env, const state& s, const value_ptr& v );

   bool eval_observation( const environment& env, const state& s, const observation& o );
   bool eval_observation( const environment& env, const state& s, const observation_ptr& o );

} } // marlowe::semantics
