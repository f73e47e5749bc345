#pragma once

#include <marlowe/semantics/contract.hpp>
#include <marlowe/semantics/input.hpp>
#include <marlowe/semantics/state.hpp>

#include <fc/reflect/reflect.hpp>

namespace marlowe { namespace semantics {

   /** money leaving an account, in the order it is settled */
   struct payment
   {
      payment(){}
      payment( const account_id_type& f, const payee& t, const token& c, const integer_type& a )
      :from_account(f),to(t),currency(c),amount(a){}

      account_id_type  from_account;
      payee            to;
      token            currency;
      integer_type     amount;
   };

   inline bool operator == ( const payment& l, const payment& r )
   {
      return l.from_account == r.from_account && l.to == r.to && l.currency == r.currency && l.amount == r.amount;
   }
   inline bool operator != ( const payment& l, const payment& r ) { return !( l == r ); }

   enum transaction_warning_type_enum
   {
      non_positive_deposit_warning  = 0,
      non_positive_pay_warning      = 1,
      partial_pay_warning           = 2,
      shadowing_warning             = 3,
      assertion_failed_warning      = 4
   };

   /**
    *  A transaction went through, but not exactly as written.
    *
    *   non_positive_deposit   by, account, currency, asked
    *   non_positive_pay       account, to, currency, asked
    *   partial_pay            account, to, currency, asked, paid
    *   shadowing              value_id, had_value, is_now
    *   assertion_failed       nothing
    */
   struct transaction_warning
   {
      transaction_warning():type(assertion_failed_warning){}
      explicit transaction_warning( transaction_warning_type_enum t ):type(t){}

      transaction_warning_type_enum  type;
      account_id_type                account;
      party                          by;
      payee                          to;
      token                          currency;
      integer_type                   asked;
      integer_type                   paid;
      value_id_type                  value_id;
      integer_type                   had_value;
      integer_type                   is_now;
   };

   transaction_warning make_non_positive_deposit_warning( const party& by, const account_id_type& account,
                                                          const token& currency, const integer_type& asked );
   transaction_warning make_non_positive_pay_warning( const account_id_type& account, const payee& to,
                                                      const token& currency, const integer_type& asked );
   transaction_warning make_partial_pay_warning( const account_id_type& account, const payee& to, const token& currency,
                                                 const integer_type& paid, const integer_type& asked );
   transaction_warning make_shadowing_warning( const value_id_type& id, const integer_type& had_value, const integer_type& is_now );
   transaction_warning make_assertion_failed_warning();

   bool operator == ( const transaction_warning& l, const transaction_warning& r );
   inline bool operator != ( const transaction_warning& l, const transaction_warning& r ) { return !( l == r ); }

   enum reduce_step_status
   {
      reduced_step                   = 0,
      not_reduced_step               = 1,
      ambiguous_time_interval_step   = 2
   };

   /** the outcome of one internal step, warning and payment are optional side effects */
   struct reduce_step_result
   {
      reduce_step_result():status(not_reduced_step){}

      reduce_step_status             status;
      optional<transaction_warning>  warning;
      optional<payment>              paid;
      state                          new_state;
      contract_ptr                   continuation;
   };

   /**
    *  A contract driven to quiescence, possibly after applying inputs.
    *  reduced is set when any internal step was taken or input applied,
    *  steps counts internal steps only.
    */
   struct reduction_output
   {
      reduction_output():reduced(false),steps(0){}

      bool                         reduced;
      uint64_t                     steps;
      vector<transaction_warning>  warnings;
      vector<payment>              payments;
      state                        new_state;
      contract_ptr                 continuation;
   };

   typedef reduction_output quiescent_result;
   typedef reduction_output apply_result;

   struct transaction_input
   {
      transaction_input(){}
      transaction_input( const time_interval& i, const vector<input>& in ):interval(i),inputs(in){}

      time_interval  interval;
      vector<input>  inputs;
   };

   struct transaction_output
   {
      vector<transaction_warning>  warnings;
      vector<payment>              payments;
      state                        new_state;
      contract_ptr                 continuation;
   };

} } // marlowe::semantics

namespace fc
{
   void to_variant( const marlowe::semantics::payment& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::payment& vo );
   void to_variant( const marlowe::semantics::transaction_warning& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::transaction_warning& vo );
   void to_variant( const marlowe::semantics::transaction_input& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::transaction_input& vo );
   void to_variant( const marlowe::semantics::transaction_output& var, variant& vo );
   void to_variant( const marlowe::semantics::reduction_output& var, variant& vo );
}

FC_REFLECT_ENUM( marlowe::semantics::transaction_warning_type_enum,
        (non_positive_deposit_warning)
        (non_positive_pay_warning)
        (partial_pay_warning)
        (shadowing_warning)
        (assertion_failed_warning)
        )
FC_REFLECT_ENUM( marlowe::semantics::reduce_step_status,
        (reduced_step)
        (not_reduced_step)
        (ambiguous_time_interval_step)
        )
