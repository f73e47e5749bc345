#include <marlowe/semantics/arithmetic.hpp>
#include <marlowe/semantics/exceptions.hpp>
#include <marlowe/semantics/value.hpp>

#include "variant_helpers.hpp"

namespace marlowe { namespace semantics {

   namespace
   {
      value_ptr make_binary( value_type_enum type, const value_ptr& lhs, const value_ptr& rhs )
      {
         FC_ASSERT( lhs && rhs );
         auto v = std::make_shared<value>( type );
         v->lhs = lhs;
         v->rhs = rhs;
         return v;
      }

      observation_ptr make_comparison( observation_type_enum type, const value_ptr& left, const value_ptr& right )
      {
         FC_ASSERT( left && right );
         auto o = std::make_shared<observation>( type );
         o->left  = left;
         o->right = right;
         return o;
      }
   }

   value_ptr make_available_money( const account_id_type& account, const token& currency )
   {
      auto v = std::make_shared<value>( available_money_value_type );
      v->account  = account;
      v->currency = currency;
      return v;
   }

   value_ptr make_constant( const integer_type& number )
   {
      auto v = std::make_shared<value>( constant_value_type );
      v->number = number;
      return v;
   }

   value_ptr make_negate( const value_ptr& operand )
   {
      FC_ASSERT( operand );
      auto v = std::make_shared<value>( negate_value_type );
      v->lhs = operand;
      return v;
   }

   value_ptr make_add( const value_ptr& lhs, const value_ptr& rhs ) { return make_binary( add_value_type, lhs, rhs ); }
   value_ptr make_sub( const value_ptr& lhs, const value_ptr& rhs ) { return make_binary( sub_value_type, lhs, rhs ); }
   value_ptr make_mul( const value_ptr& lhs, const value_ptr& rhs ) { return make_binary( mul_value_type, lhs, rhs ); }
   value_ptr make_div( const value_ptr& lhs, const value_ptr& rhs ) { return make_binary( div_value_type, lhs, rhs ); }

   value_ptr make_choice_value( const choice_id& choice )
   {
      auto v = std::make_shared<value>( choice_value_type );
      v->choice = choice;
      return v;
   }

   value_ptr make_time_interval_start() { return std::make_shared<value>( time_interval_start_value_type ); }
   value_ptr make_time_interval_end()   { return std::make_shared<value>( time_interval_end_value_type ); }

   value_ptr make_use_value( const value_id_type& name )
   {
      auto v = std::make_shared<value>( use_value_type );
      v->name = name;
      return v;
   }

   value_ptr make_cond( const observation_ptr& condition, const value_ptr& then_value, const value_ptr& else_value )
   {
      FC_ASSERT( condition && then_value && else_value );
      auto v = std::make_shared<value>( cond_value_type );
      v->condition = condition;
      v->lhs       = then_value;
      v->rhs       = else_value;
      return v;
   }

   observation_ptr make_and( const observation_ptr& lhs, const observation_ptr& rhs )
   {
      FC_ASSERT( lhs && rhs );
      auto o = std::make_shared<observation>( and_observation_type );
      o->lhs = lhs;
      o->rhs = rhs;
      return o;
   }

   observation_ptr make_or( const observation_ptr& lhs, const observation_ptr& rhs )
   {
      FC_ASSERT( lhs && rhs );
      auto o = std::make_shared<observation>( or_observation_type );
      o->lhs = lhs;
      o->rhs = rhs;
      return o;
   }

   observation_ptr make_not( const observation_ptr& operand )
   {
      FC_ASSERT( operand );
      auto o = std::make_shared<observation>( not_observation_type );
      o->lhs = operand;
      return o;
   }

   observation_ptr make_chose_something( const choice_id& choice )
   {
      auto o = std::make_shared<observation>( chose_something_observation_type );
      o->choice = choice;
      return o;
   }

   observation_ptr make_value_ge( const value_ptr& l, const value_ptr& r ) { return make_comparison( value_ge_observation_type, l, r ); }
   observation_ptr make_value_gt( const value_ptr& l, const value_ptr& r ) { return make_comparison( value_gt_observation_type, l, r ); }
   observation_ptr make_value_lt( const value_ptr& l, const value_ptr& r ) { return make_comparison( value_lt_observation_type, l, r ); }
   observation_ptr make_value_le( const value_ptr& l, const value_ptr& r ) { return make_comparison( value_le_observation_type, l, r ); }
   observation_ptr make_value_eq( const value_ptr& l, const value_ptr& r ) { return make_comparison( value_eq_observation_type, l, r ); }

   observation_ptr make_true()  { return std::make_shared<observation>( true_observation_type ); }
   observation_ptr make_false() { return std::make_shared<observation>( false_observation_type ); }

   bool same_value( const value_ptr& l, const value_ptr& r )
   {
      if( l == r ) return true;
      if( !l || !r ) return false;
      return *l == *r;
   }

   bool same_observation( const observation_ptr& l, const observation_ptr& r )
   {
      if( l == r ) return true;
      if( !l || !r ) return false;
      return *l == *r;
   }

   bool operator == ( const value& l, const value& r )
   {
      if( l.type != r.type )
         return false;

      switch( l.type )
      {
         case available_money_value_type:
            return l.account == r.account && l.currency == r.currency;
         case constant_value_type:
            return l.number == r.number;
         case negate_value_type:
            return same_value( l.lhs, r.lhs );
         case add_value_type:
         case sub_value_type:
         case mul_value_type:
         case div_value_type:
            return same_value( l.lhs, r.lhs ) && same_value( l.rhs, r.rhs );
         case choice_value_type:
            return l.choice == r.choice;
         case time_interval_start_value_type:
         case time_interval_end_value_type:
            return true;
         case use_value_type:
            return l.name == r.name;
         case cond_value_type:
            return same_observation( l.condition, r.condition ) && same_value( l.lhs, r.lhs ) && same_value( l.rhs, r.rhs );
         // No default to force compiler warning
      }
      return false;
   }

   bool operator == ( const observation& l, const observation& r )
   {
      if( l.type != r.type )
         return false;

      switch( l.type )
      {
         case and_observation_type:
         case or_observation_type:
            return same_observation( l.lhs, r.lhs ) && same_observation( l.rhs, r.rhs );
         case not_observation_type:
            return same_observation( l.lhs, r.lhs );
         case chose_something_observation_type:
            return l.choice == r.choice;
         case value_ge_observation_type:
         case value_gt_observation_type:
         case value_lt_observation_type:
         case value_le_observation_type:
         case value_eq_observation_type:
            return same_value( l.left, r.left ) && same_value( l.right, r.right );
         case true_observation_type:
         case false_observation_type:
            return true;
         // No default to force compiler warning
      }
      return false;
   }

} } // marlowe::semantics

namespace fc
{
   using namespace marlowe::semantics::detail;

   void to_variant( const marlowe::semantics::value& var, variant& vo )
   {
      using namespace marlowe::semantics;
      switch( var.type )
      {
         case available_money_value_type:
         {
            mutable_variant_object obj( "amount_of_token", var.currency );
            obj( "in_account", var.account );
            vo = std::move( obj );
            return;
         }
         case constant_value_type:
            to_variant( var.number, vo );
            return;
         case negate_value_type:
            vo = mutable_variant_object( "negate", var.lhs );
            return;
         case add_value_type:
            vo = mutable_variant_object( "add", var.lhs )( "and", var.rhs );
            return;
         case sub_value_type:
            vo = mutable_variant_object( "value", var.lhs )( "minus", var.rhs );
            return;
         case mul_value_type:
            vo = mutable_variant_object( "multiply", var.lhs )( "times", var.rhs );
            return;
         case div_value_type:
            vo = mutable_variant_object( "divide", var.lhs )( "by", var.rhs );
            return;
         case choice_value_type:
            vo = mutable_variant_object( "value_of_choice", var.choice );
            return;
         case time_interval_start_value_type:
            vo = variant( "time_interval_start" );
            return;
         case time_interval_end_value_type:
            vo = variant( "time_interval_end" );
            return;
         case use_value_type:
            vo = mutable_variant_object( "use_value", var.name );
            return;
         case cond_value_type:
            vo = mutable_variant_object( "if", var.condition )( "then", var.lhs )( "else", var.rhs );
            return;
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid value type ${t}", ("t",int(var.type)) );
   }

   void to_variant( const marlowe::semantics::value_ptr& var, variant& vo )
   {
      FC_ASSERT( var, "null value" );
      to_variant( *var, vo );
   }

   void from_variant( const variant& var, marlowe::semantics::value_ptr& vo )
   { try {
      using namespace marlowe::semantics;
      nesting_guard guard;
      if( var.is_string() )
      {
         const string keyword = var.as_string();
         if( keyword == "time_interval_start" )
            vo = make_time_interval_start();
         else if( keyword == "time_interval_end" )
            vo = make_time_interval_end();
         else
            vo = make_constant( parse_integer( keyword ) );
         return;
      }
      if( !var.is_object() )
      {
         vo = make_constant( var.as<integer_type>() );
         return;
      }

      const variant_object& obj = var.get_object();
      if( obj.contains( "amount_of_token" ) )
         vo = make_available_money( expect_field( obj, "in_account" ).as<party>(), obj["amount_of_token"].as<token>() );
      else if( obj.contains( "negate" ) )
         vo = make_negate( obj["negate"].as<value_ptr>() );
      else if( obj.contains( "add" ) )
         vo = make_add( obj["add"].as<value_ptr>(), expect_field( obj, "and" ).as<value_ptr>() );
      else if( obj.contains( "minus" ) )
         vo = make_sub( expect_field( obj, "value" ).as<value_ptr>(), obj["minus"].as<value_ptr>() );
      else if( obj.contains( "multiply" ) )
         vo = make_mul( obj["multiply"].as<value_ptr>(), expect_field( obj, "times" ).as<value_ptr>() );
      else if( obj.contains( "divide" ) )
         vo = make_div( obj["divide"].as<value_ptr>(), expect_field( obj, "by" ).as<value_ptr>() );
      else if( obj.contains( "value_of_choice" ) )
         vo = make_choice_value( obj["value_of_choice"].as<choice_id>() );
      else if( obj.contains( "use_value" ) )
         vo = make_use_value( expect_string( obj["use_value"], "use_value" ) );
      else if( obj.contains( "if" ) )
         vo = make_cond( obj["if"].as<observation_ptr>(),
                         expect_field( obj, "then" ).as<value_ptr>(),
                         expect_field( obj, "else" ).as<value_ptr>() );
      else
         FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown value ${v}", ("v",var) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::observation& var, variant& vo )
   {
      using namespace marlowe::semantics;
      switch( var.type )
      {
         case and_observation_type:
            vo = mutable_variant_object( "both", var.lhs )( "and", var.rhs );
            return;
         case or_observation_type:
            vo = mutable_variant_object( "either", var.lhs )( "or", var.rhs );
            return;
         case not_observation_type:
            vo = mutable_variant_object( "not", var.lhs );
            return;
         case chose_something_observation_type:
            vo = mutable_variant_object( "chose_something_for", var.choice );
            return;
         case value_ge_observation_type:
            vo = mutable_variant_object( "value", var.left )( "ge_than", var.right );
            return;
         case value_gt_observation_type:
            vo = mutable_variant_object( "value", var.left )( "gt", var.right );
            return;
         case value_lt_observation_type:
            vo = mutable_variant_object( "value", var.left )( "lt", var.right );
            return;
         case value_le_observation_type:
            vo = mutable_variant_object( "value", var.left )( "le_than", var.right );
            return;
         case value_eq_observation_type:
            vo = mutable_variant_object( "value", var.left )( "equal_to", var.right );
            return;
         case true_observation_type:
            vo = variant( true );
            return;
         case false_observation_type:
            vo = variant( false );
            return;
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid observation type ${t}", ("t",int(var.type)) );
   }

   void to_variant( const marlowe::semantics::observation_ptr& var, variant& vo )
   {
      FC_ASSERT( var, "null observation" );
      to_variant( *var, vo );
   }

   void from_variant( const variant& var, marlowe::semantics::observation_ptr& vo )
   { try {
      using namespace marlowe::semantics;
      nesting_guard guard;
      if( var.is_bool() )
      {
         vo = var.as_bool() ? make_true() : make_false();
         return;
      }

      const variant_object& obj = expect_object( var, "observation" );
      if( obj.contains( "both" ) )
         vo = make_and( obj["both"].as<observation_ptr>(), expect_field( obj, "and" ).as<observation_ptr>() );
      else if( obj.contains( "either" ) )
         vo = make_or( obj["either"].as<observation_ptr>(), expect_field( obj, "or" ).as<observation_ptr>() );
      else if( obj.contains( "not" ) )
         vo = make_not( obj["not"].as<observation_ptr>() );
      else if( obj.contains( "chose_something_for" ) )
         vo = make_chose_something( obj["chose_something_for"].as<choice_id>() );
      else if( obj.contains( "ge_than" ) )
         vo = make_value_ge( expect_field( obj, "value" ).as<value_ptr>(), obj["ge_than"].as<value_ptr>() );
      else if( obj.contains( "gt" ) )
         vo = make_value_gt( expect_field( obj, "value" ).as<value_ptr>(), obj["gt"].as<value_ptr>() );
      else if( obj.contains( "lt" ) )
         vo = make_value_lt( expect_field( obj, "value" ).as<value_ptr>(), obj["lt"].as<value_ptr>() );
      else if( obj.contains( "le_than" ) )
         vo = make_value_le( expect_field( obj, "value" ).as<value_ptr>(), obj["le_than"].as<value_ptr>() );
      else if( obj.contains( "equal_to" ) )
         vo = make_value_eq( expect_field( obj, "value" ).as<value_ptr>(), obj["equal_to"].as<value_ptr>() );
      else
         FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown observation ${v}", ("v",var) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
