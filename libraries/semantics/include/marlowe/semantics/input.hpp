#pragma once

#include <marlowe/semantics/contract.hpp>
#include <marlowe/semantics/party.hpp>

#include <fc/reflect/reflect.hpp>

namespace marlowe { namespace semantics {

   enum input_type_enum
   {
      deposit_input_type  = 0,
      choice_input_type   = 1,
      notify_input_type   = 2
   };

   /** the disclosed contract behind a merkleized case */
   struct merkleized_continuation
   {
      merkleized_continuation(){}
      merkleized_continuation( const contract_hash_type& h, const contract_ptr& c )
      :continuation_hash(h),continuation(c){}

      contract_hash_type  continuation_hash;
      contract_ptr        continuation;
   };

   /**
    *  An external input offered to a waiting When.
    *
    *   deposit   from_party deposits quantity of currency into into_account
    *   choice    choice is made with chosen_num
    *   notify    no payload
    */
   struct input
   {
      input():type(notify_input_type){}
      explicit input( input_type_enum t ):type(t){}

      bool is_merkleized()const { return merkleized.valid(); }

      input_type_enum                    type;
      account_id_type                    into_account;
      party                              from_party;
      token                              currency;
      integer_type                       quantity;
      choice_id                          choice;
      integer_type                       chosen_num;
      optional<merkleized_continuation>  merkleized;
   };

   input make_deposit_input( const account_id_type& into_account, const party& from_party,
                             const token& currency, const integer_type& quantity );
   input make_choice_input( const choice_id& choice, const integer_type& chosen_num );
   input make_notify_input();

   /** returns i with a disclosure of the continuation stored under hash */
   input disclose( const input& i, const contract_hash_type& hash, const contract_ptr& continuation );

   bool operator == ( const input& l, const input& r );
   inline bool operator != ( const input& l, const input& r ) { return !( l == r ); }

} } // marlowe::semantics

namespace fc
{
   void to_variant( const marlowe::semantics::input& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::input& vo );
}

FC_REFLECT_ENUM( marlowe::semantics::input_type_enum,
        (deposit_input_type)
        (choice_input_type)
        (notify_input_type)
        )
