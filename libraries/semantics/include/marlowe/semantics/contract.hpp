#pragma once

#include <marlowe/semantics/party.hpp>
#include <marlowe/semantics/value.hpp>

namespace marlowe { namespace semantics {

   enum action_type_enum
   {
      deposit_action_type  = 0,
      choice_action_type   = 1,
      notify_action_type   = 2
   };

   /**
    *  What a When is waiting for.
    *
    *   deposit   party deposits amount of currency into into_account
    *   choice    choice is made with a number inside one of bounds
    *   notify    anybody notifies while condition holds
    */
   struct action
   {
      action():type(notify_action_type){}
      explicit action( action_type_enum t ):type(t){}

      action_type_enum   type;
      account_id_type    into_account;
      party              by;
      token              currency;
      value_ptr          amount;
      choice_id          choice;
      vector<bound>      bounds;
      observation_ptr    condition;
   };

   action make_deposit( const account_id_type& into_account, const party& by, const token& currency, const value_ptr& amount );
   action make_choice( const choice_id& choice, const vector<bound>& bounds );
   action make_notify( const observation_ptr& condition );

   bool operator == ( const action& l, const action& r );
   inline bool operator != ( const action& l, const action& r ) { return !( l == r ); }

   struct contract;
   typedef shared_ptr<const contract> contract_ptr;

   /**
    *  An action and the contract that follows it.  The continuation is
    *  either inline or, for a merkleized case, only known by the hash
    *  of its content; the input that matches such a case must disclose
    *  the contract.
    */
   struct contract_case
   {
      contract_case(){}
      contract_case( const action& a, const contract_ptr& c ):case_action(a),then(c){}

      bool is_merkleized()const { return merkleized_then.valid(); }

      action                        case_action;
      contract_ptr                  then;
      optional<contract_hash_type>  merkleized_then;
   };

   contract_case make_case( const action& a, const contract_ptr& then );
   contract_case make_merkleized_case( const action& a, const contract_hash_type& hash );

   bool operator == ( const contract_case& l, const contract_case& r );

   enum contract_type_enum
   {
      close_contract_type   = 0,
      pay_contract_type     = 1,
      if_contract_type      = 2,
      when_contract_type    = 3,
      let_contract_type     = 4,
      assert_contract_type  = 5
   };

   /**
    *  A contract node.  Members used by each variant:
    *
    *   close     nothing
    *   pay       from_account, to, currency, amount, then
    *   if        condition, then, otherwise
    *   when      cases, timeout, otherwise (the timeout continuation)
    *   let       name, amount, then
    *   assert    condition, then
    */
   struct contract
   {
      contract():type(close_contract_type),timeout(0){}
      explicit contract( contract_type_enum t ):type(t),timeout(0){}

      bool is_close()const { return type == close_contract_type; }
      bool is_when()const  { return type == when_contract_type; }

      contract_type_enum     type;
      account_id_type        from_account;
      payee                  to;
      token                  currency;
      value_ptr              amount;
      observation_ptr        condition;
      value_id_type          name;
      vector<contract_case>  cases;
      timeout_type           timeout;
      contract_ptr           then;
      contract_ptr           otherwise;
   };

   contract_ptr make_close();
   contract_ptr make_pay( const account_id_type& from_account, const payee& to, const token& currency,
                          const value_ptr& amount, const contract_ptr& then );
   contract_ptr make_if( const observation_ptr& condition, const contract_ptr& then, const contract_ptr& otherwise );
   contract_ptr make_when( const vector<contract_case>& cases, timeout_type timeout, const contract_ptr& timeout_continuation );
   contract_ptr make_let( const value_id_type& name, const value_ptr& v, const contract_ptr& then );
   contract_ptr make_assert( const observation_ptr& condition, const contract_ptr& then );

   bool operator == ( const contract& l, const contract& r );
   inline bool operator != ( const contract& l, const contract& r ) { return !( l == r ); }
   bool same_contract( const contract_ptr& l, const contract_ptr& r );

   /**
    *  Number of nodes in the inline contract tree, merkleized
    *  continuations are not followed.  Reduction of a contract takes at
    *  most this many non-refund steps.
    */
   uint64_t contract_size( const contract_ptr& c );

} } // marlowe::semantics

namespace fc
{
   void to_variant( const marlowe::semantics::action& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::action& vo );
   void to_variant( const marlowe::semantics::contract_case& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::contract_case& vo );
   void to_variant( const marlowe::semantics::contract& var, variant& vo );
   void to_variant( const marlowe::semantics::contract_ptr& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::contract_ptr& vo );
}

FC_REFLECT_ENUM( marlowe::semantics::action_type_enum,
        (deposit_action_type)
        (choice_action_type)
        (notify_action_type)
        )
FC_REFLECT_ENUM( marlowe::semantics::contract_type_enum,
        (close_contract_type)
        (pay_contract_type)
        (if_contract_type)
        (when_contract_type)
        (let_contract_type)
        (assert_contract_type)
        )
