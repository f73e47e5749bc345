#pragma once

#include <marlowe/semantics/party.hpp>
#include <marlowe/semantics/types.hpp>

#include <fc/reflect/reflect.hpp>

namespace marlowe { namespace semantics {

   struct value;
   struct observation;
   typedef shared_ptr<const value>        value_ptr;
   typedef shared_ptr<const observation>  observation_ptr;

   // NOTE: the set of variants is closed, every switch over these must stay exhaustive
   enum value_type_enum
   {
      available_money_value_type      = 0,
      constant_value_type             = 1,
      negate_value_type               = 2,
      add_value_type                  = 3,
      sub_value_type                  = 4,
      mul_value_type                  = 5,
      div_value_type                  = 6,
      choice_value_type               = 7,
      time_interval_start_value_type  = 8,
      time_interval_end_value_type    = 9,
      use_value_type                  = 10,
      cond_value_type                 = 11
   };

   /**
    *  An integer expression.  Nodes are immutable and shared, the
    *  members used by each variant are:
    *
    *   available_money      account, currency
    *   constant             number
    *   negate               lhs
    *   add/sub/mul/div      lhs, rhs
    *   choice               choice
    *   use_value            name
    *   cond                 condition, lhs (then), rhs (else)
    */
   struct value
   {
      value():type(constant_value_type){}
      explicit value( value_type_enum t ):type(t){}

      value_type_enum    type;
      integer_type       number;
      account_id_type    account;
      token              currency;
      choice_id          choice;
      value_id_type      name;
      observation_ptr    condition;
      value_ptr          lhs;
      value_ptr          rhs;
   };

   enum observation_type_enum
   {
      and_observation_type            = 0,
      or_observation_type             = 1,
      not_observation_type            = 2,
      chose_something_observation_type = 3,
      value_ge_observation_type       = 4,
      value_gt_observation_type       = 5,
      value_lt_observation_type       = 6,
      value_le_observation_type       = 7,
      value_eq_observation_type       = 8,
      true_observation_type           = 9,
      false_observation_type          = 10
   };

   /**
    *  A boolean expression.  and/or use lhs and rhs, not uses lhs,
    *  the comparisons use left and right, chose_something uses choice.
    */
   struct observation
   {
      observation():type(true_observation_type){}
      explicit observation( observation_type_enum t ):type(t){}

      observation_type_enum  type;
      observation_ptr        lhs;
      observation_ptr        rhs;
      value_ptr              left;
      value_ptr              right;
      choice_id              choice;
   };

   value_ptr make_available_money( const account_id_type& account, const token& currency );
   value_ptr make_constant( const integer_type& number );
   value_ptr make_negate( const value_ptr& v );
   value_ptr make_add( const value_ptr& lhs, const value_ptr& rhs );
   value_ptr make_sub( const value_ptr& lhs, const value_ptr& rhs );
   value_ptr make_mul( const value_ptr& lhs, const value_ptr& rhs );
   value_ptr make_div( const value_ptr& lhs, const value_ptr& rhs );
   value_ptr make_choice_value( const choice_id& choice );
   value_ptr make_time_interval_start();
   value_ptr make_time_interval_end();
   value_ptr make_use_value( const value_id_type& name );
   value_ptr make_cond( const observation_ptr& condition, const value_ptr& then_value, const value_ptr& else_value );

   observation_ptr make_and( const observation_ptr& lhs, const observation_ptr& rhs );
   observation_ptr make_or( const observation_ptr& lhs, const observation_ptr& rhs );
   observation_ptr make_not( const observation_ptr& o );
   observation_ptr make_chose_something( const choice_id& choice );
   observation_ptr make_value_ge( const value_ptr& left, const value_ptr& right );
   observation_ptr make_value_gt( const value_ptr& left, const value_ptr& right );
   observation_ptr make_value_lt( const value_ptr& left, const value_ptr& right );
   observation_ptr make_value_le( const value_ptr& left, const value_ptr& right );
   observation_ptr make_value_eq( const value_ptr& left, const value_ptr& right );
   observation_ptr make_true();
   observation_ptr make_false();

   bool operator == ( const value& l, const value& r );
   bool operator == ( const observation& l, const observation& r );
   inline bool operator != ( const value& l, const value& r ) { return !( l == r ); }
   inline bool operator != ( const observation& l, const observation& r ) { return !( l == r ); }

   /** compares the pointed-to expressions, two null pointers are equal */
   bool same_value( const value_ptr& l, const value_ptr& r );
   bool same_observation( const observation_ptr& l, const observation_ptr& r );

} } // marlowe::semantics

namespace fc
{
   void to_variant( const marlowe::semantics::value& var, variant& vo );
   void to_variant( const marlowe::semantics::value_ptr& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::value_ptr& vo );
   void to_variant( const marlowe::semantics::observation& var, variant& vo );
   void to_variant( const marlowe::semantics::observation_ptr& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::observation_ptr& vo );
}

FC_REFLECT_ENUM( marlowe::semantics::value_type_enum,
        (available_money_value_type)
        (constant_value_type)
        (negate_value_type)
        (add_value_type)
        (sub_value_type)
        (mul_value_type)
        (div_value_type)
        (choice_value_type)
        (time_interval_start_value_type)
        (time_interval_end_value_type)
        (use_value_type)
        (cond_value_type)
        )
FC_REFLECT_ENUM( marlowe::semantics::observation_type_enum,
        (and_observation_type)
        (or_observation_type)
        (not_observation_type)
        (chose_something_observation_type)
        (value_ge_observation_type)
        (value_gt_observation_type)
        (value_lt_observation_type)
        (value_le_observation_type)
        (value_eq_observation_type)
        (true_observation_type)
        (false_observation_type)
        )
