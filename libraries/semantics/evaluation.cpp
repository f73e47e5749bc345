#include <marlowe/semantics/arithmetic.hpp>
#include <marlowe/semantics/evaluation.hpp>

namespace marlowe { namespace semantics {

   namespace
   {
      integer_type lookup( const map<choice_id, integer_type>& choices, const choice_id& id )
      {
         auto itr = choices.find( id );
         return itr == choices.end() ? integer_type( 0 ) : itr->second;
      }

      integer_type lookup( const map<value_id_type, integer_type>& bound_values, const value_id_type& id )
      {
         auto itr = bound_values.find( id );
         return itr == bound_values.end() ? integer_type( 0 ) : itr->second;
      }
   }

   integer_type eval_value( const environment& env, const state& s, const value& v )
   {
      switch( v.type )
      {
         case available_money_value_type:
            return s.money_in_account( v.account, v.currency );
         case constant_value_type:
            return v.number;
         case negate_value_type:
            return -eval_value( env, s, v.lhs );
         case add_value_type:
            return eval_value( env, s, v.lhs ) + eval_value( env, s, v.rhs );
         case sub_value_type:
            return eval_value( env, s, v.lhs ) - eval_value( env, s, v.rhs );
         case mul_value_type:
            return eval_value( env, s, v.lhs ) * eval_value( env, s, v.rhs );
         case div_value_type:
            return divide_round_half_away( eval_value( env, s, v.lhs ), eval_value( env, s, v.rhs ) );
         case choice_value_type:
            return lookup( s.choices, v.choice );
         case time_interval_start_value_type:
            return integer_type( env.interval.from );
         case time_interval_end_value_type:
            return integer_type( env.interval.to );
         case use_value_type:
            return lookup( s.bound_values, v.name );
         case cond_value_type:
            return eval_observation( env, s, v.condition ) ? eval_value( env, s, v.lhs )
                                                           : eval_value( env, s, v.rhs );
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( fc::invalid_arg_exception, "invalid value type ${t}", ("t",int(v.type)) );
   }

   integer_type eval_value( const environment& env, const state& s, const value_ptr& v )
   {
      FC_ASSERT( v, "null value" );
      return eval_value( env, s, *v );
   }

   bool eval_observation( const environment& env, const state& s, const observation& o )
   {
      switch( o.type )
      {
         case and_observation_type:
            return eval_observation( env, s, o.lhs ) && eval_observation( env, s, o.rhs );
         case or_observation_type:
            return eval_observation( env, s, o.lhs ) || eval_observation( env, s, o.rhs );
         case not_observation_type:
            return !eval_observation( env, s, o.lhs );
         case chose_something_observation_type:
            return s.choices.find( o.choice ) != s.choices.end();
         case value_ge_observation_type:
            return eval_value( env, s, o.left ) >= eval_value( env, s, o.right );
         case value_gt_observation_type:
            return eval_value( env, s, o.left ) >  eval_value( env, s, o.right );
         case value_lt_observation_type:
            return eval_value( env, s, o.left ) <  eval_value( env, s, o.right );
         case value_le_observation_type:
            return eval_value( env, s, o.left ) <= eval_value( env, s, o.right );
         case value_eq_observation_type:
            return eval_value( env, s, o.left ) == eval_value( env, s, o.right );
         case true_observation_type:
            return true;
         case false_observation_type:
            return false;
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( fc::invalid_arg_exception, "invalid observation type ${t}", ("t",int(o.type)) );
   }

   bool eval_observation( const environment& env, const state& s, const observation_ptr& o )
   {
      FC_ASSERT( o, "null observation" );
      return eval_observation( env, s, *o );
   }

} } // marlowe::semantics
