#include <marlowe/semantics/applicable_actions.hpp>
#include <marlowe/semantics/apply_input.hpp>
#include <marlowe/semantics/evaluation.hpp>
#include <marlowe/semantics/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace marlowe { namespace semantics {

   applied_action_result applicable_action::apply( const optional<integer_type>& chosen )const
   { try {
      applied_action_result result;
      result.env = env;

      const state& s = initial_reduction.new_state;
      input in;
      switch( type )
      {
         case advance_timeout_applicable_action:
            result.reduced_state    = s;
            result.reduced_contract = initial_reduction.continuation;
            result.warnings         = initial_reduction.warnings;
            result.payments         = initial_reduction.payments;
            return result;
         case deposit_applicable_action:
            in = make_deposit_input( case_action.into_account, case_action.by, case_action.currency,
                                     eval_value( env, s, case_action.amount ) );
            break;
         case choice_applicable_action:
            FC_ASSERT( chosen.valid(), "a choice action needs a chosen number" );
            if( !in_bounds( *chosen, case_action.bounds ) )
               FC_THROW_EXCEPTION( fc::invalid_arg_exception, "chosen number ${n} is not in bounds", ("n",*chosen)("bounds",case_action.bounds) );
            in = make_choice_input( case_action.choice, *chosen );
            break;
         case notify_applicable_action:
            in = make_notify_input();
            break;
         // No default to force compiler warning
      }

      if( disclosure.valid() )
         in = disclose( in, disclosure->continuation_hash, disclosure->continuation );

      const apply_result applied = apply_all_inputs( env, s, initial_reduction.continuation, vector<input>{ in }, max_steps );

      result.inputs.push_back( in );
      result.reduced_state    = applied.new_state;
      result.reduced_contract = applied.continuation;
      result.warnings         = initial_reduction.warnings;
      result.warnings.insert( result.warnings.end(), applied.warnings.begin(), applied.warnings.end() );
      result.payments         = initial_reduction.payments;
      result.payments.insert( result.payments.end(), applied.payments.begin(), applied.payments.end() );
      return result;
   } FC_CAPTURE_AND_RETHROW( (type)(chosen) ) }

   optional<party> get_applicant( const applicable_action& a )
   {
      switch( a.type )
      {
         case deposit_applicable_action:
            return a.case_action.by;
         case choice_applicable_action:
            return a.case_action.choice.choice_owner;
         case advance_timeout_applicable_action:
         case notify_applicable_action:
            return optional<party>();
         // No default to force compiler warning
      }
      return optional<party>();
   }

   optional<timeout_type> get_next_timeout( const contract_ptr& root, timeout_type after )
   {
      optional<timeout_type> next;
      vector<const contract*> pending;
      if( root )
         pending.push_back( root.get() );

      while( !pending.empty() )
      {
         const contract* c = pending.back();
         pending.pop_back();

         switch( c->type )
         {
            case close_contract_type:
               break;
            case pay_contract_type:
            case let_contract_type:
            case assert_contract_type:
               pending.push_back( c->then.get() );
               break;
            case if_contract_type:
               pending.push_back( c->then.get() );
               pending.push_back( c->otherwise.get() );
               break;
            case when_contract_type:
               if( c->timeout > after )
               {
                  if( !next.valid() || c->timeout < *next )
                     next = c->timeout;
               }
               else
                  pending.push_back( c->otherwise.get() );
               break;
            // No default to force compiler warning
         }
      }
      return next;
   }

   time_interval default_interval( const contract_ptr& c, timeout_type now )
   {
      const optional<timeout_type> next = get_next_timeout( c, now );
      const timeout_type until = next.valid() ? *next : now + MARLOWE_DEFAULT_INTERVAL_LENGTH_MS;
      return time_interval( now, until - 1 );
   }

   vector<applicable_action> get_applicable_actions( const environment& env, const state& s, const contract_ptr& c,
                                                     const continuation_resolver_ptr& resolver, uint64_t max_steps )
   { try {
      vector<applicable_action> actions;

      applicable_action base;
      base.env               = env;
      base.max_steps         = max_steps;
      base.initial_reduction = reduce_contract_until_quiescent( env, s, c, max_steps );

      if( base.initial_reduction.reduced )
         actions.push_back( base );

      const contract_ptr& waiting = base.initial_reduction.continuation;
      if( !is_waiting_for_input( env, waiting ) )
         return actions;

      for( const auto& cs : waiting->cases )
      {
         applicable_action a( base );
         a.case_action = cs.case_action;
         if( cs.is_merkleized() )
         {
            if( !resolver )
               FC_CAPTURE_AND_THROW( unresolved_continuation, (*cs.merkleized_then) );
            a.disclosure = merkleized_continuation( *cs.merkleized_then, resolver->resolve( *cs.merkleized_then ) );
         }

         switch( cs.case_action.type )
         {
            case deposit_action_type:
               a.type = deposit_applicable_action;
               break;
            case choice_action_type:
               a.type = choice_applicable_action;
               break;
            case notify_action_type:
               if( !eval_observation( env, base.initial_reduction.new_state, cs.case_action.condition ) )
                  continue;
               a.type = notify_applicable_action;
               break;
            // No default to force compiler warning
         }
         actions.push_back( a );
      }

      dlog( "${n} applicable actions", ("n",actions.size()) );
      return actions;
   } FC_CAPTURE_AND_RETHROW( (env) ) }

} } // marlowe::semantics

namespace fc
{
   void to_variant( const marlowe::semantics::applicable_action& var, variant& vo )
   {
      using namespace marlowe::semantics;
      const optional<party> applicant = get_applicant( var );

      mutable_variant_object obj( "type", var.type );
      if( applicant.valid() )
         obj( "applicant", *applicant );
      else
         obj( "applicant", variant( "anybody" ) );

      if( var.type != advance_timeout_applicable_action )
         obj( "action", var.case_action );
      if( var.disclosure.valid() )
         obj( "continuation_hash", var.disclosure->continuation_hash );
      vo = std::move( obj );
   }

   void to_variant( const marlowe::semantics::applied_action_result& var, variant& vo )
   {
      fc::variants inputs;
      for( const auto& i : var.inputs )
         inputs.push_back( variant( i ) );
      fc::variants warnings;
      for( const auto& w : var.warnings )
         warnings.push_back( variant( w ) );
      fc::variants payments;
      for( const auto& p : var.payments )
         payments.push_back( variant( p ) );

      mutable_variant_object obj( "inputs", inputs );
      obj( "environment", var.env )
         ( "warnings", warnings )
         ( "payments", payments )
         ( "state", var.reduced_state )
         ( "contract", var.reduced_contract );
      vo = std::move( obj );
   }
}
