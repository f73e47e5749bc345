#include <marlowe/semantics/compute_transaction.hpp>
#include <marlowe/semantics/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace marlowe { namespace semantics {

   pair<environment, state> fix_interval( const time_interval& interval, const state& s )
   { try {
      if( interval.to < interval.from )
         FC_CAPTURE_AND_THROW( invalid_interval, (interval) );
      if( interval.to < s.min_time )
         FC_CAPTURE_AND_THROW( interval_in_past, (interval)(s.min_time) );

      state fixed( s );
      fixed.min_time = max_timeout( interval.from, s.min_time );
      return std::make_pair( environment( fixed.min_time, interval.to ), fixed );
   } FC_CAPTURE_AND_RETHROW( (interval) ) }

   transaction_output compute_transaction( const transaction_input& tx, const state& s, const contract_ptr& c,
                                           uint64_t max_steps )
   { try {
      FC_ASSERT( c, "null contract" );
      dlog( "computing transaction over [${from}, ${to}] with ${n} inputs",
            ("from",tx.interval.from)("to",tx.interval.to)("n",tx.inputs.size()) );

      apply_result applied;
      try
      {
         const auto fixed = fix_interval( tx.interval, s );
         applied = apply_all_inputs( fixed.first, fixed.second, c, tx.inputs, max_steps );

         if( !applied.reduced && !( c->is_close() && s.has_funds() ) )
            FC_CAPTURE_AND_THROW( useless_transaction, (tx.interval) );
      }
      catch( const transaction_error& e )
      {
         wlog( "transaction rejected: ${e}", ("e",e.to_detail_string()) );
         throw;
      }

      transaction_output output;
      output.warnings     = applied.warnings;
      output.payments     = applied.payments;
      output.new_state    = applied.new_state;
      output.continuation = applied.continuation;

      dlog( "transaction produced ${p} payments and ${w} warnings",
            ("p",output.payments.size())("w",output.warnings.size()) );
      return output;
   } FC_CAPTURE_AND_RETHROW( (tx) ) }

   transaction_output play_trace( timeout_type min_time, const contract_ptr& c, const vector<transaction_input>& transactions,
                                  uint64_t max_steps )
   { try {
      transaction_output result;
      result.new_state    = empty_state( min_time );
      result.continuation = c;

      for( const auto& tx : transactions )
      {
         transaction_output output = compute_transaction( tx, result.new_state, result.continuation, max_steps );
         result.warnings.insert( result.warnings.end(), output.warnings.begin(), output.warnings.end() );
         result.payments.insert( result.payments.end(), output.payments.begin(), output.payments.end() );
         result.new_state    = std::move( output.new_state );
         result.continuation = output.continuation;
      }
      return result;
   } FC_CAPTURE_AND_RETHROW( (min_time)(transactions) ) }

} } // marlowe::semantics
