#pragma once

#include <marlowe/semantics/config.hpp>
#include <marlowe/semantics/types.hpp>

#include <fc/reflect/reflect.hpp>

#include <tuple>

namespace marlowe { namespace semantics {

   /**
    *  An asset identifier, the native currency has an empty currency
    *  symbol and an empty token name.
    */
   struct token
   {
      token(){}
      token( const string& symbol, const string& name )
      :currency_symbol(symbol),token_name(name){}

      bool is_ada()const { return currency_symbol.empty() && token_name.empty(); }

      string currency_symbol;
      string token_name;
   };

   inline token ada_token() { return token( MARLOWE_ADA_CURRENCY_SYMBOL, MARLOWE_ADA_TOKEN_NAME ); }

   inline bool operator == ( const token& l, const token& r )
   {
      return std::tie( l.currency_symbol, l.token_name ) == std::tie( r.currency_symbol, r.token_name );
   }
   inline bool operator != ( const token& l, const token& r ) { return !( l == r ); }
   inline bool operator <  ( const token& l, const token& r )
   {
      return std::tie( l.currency_symbol, l.token_name ) < std::tie( r.currency_symbol, r.token_name );
   }

   enum party_type_enum
   {
      address_party_type  = 0,
      role_party_type     = 1
   };

   /**
    *  A participant is either identified by a ledger address or by the
    *  name of a role token.  Role ownership is checked at the ledger
    *  boundary, never here.
    */
   struct party
   {
      party():type(address_party_type){}
      party( party_type_enum t, const string& n ):type(t),name(n){}

      static party address( const string& addr ) { return party( address_party_type, addr ); }
      static party role( const string& role_token ) { return party( role_party_type, role_token ); }

      party_type_enum  type;
      string           name;   ///< bech32 address or role token name
   };

   inline bool operator == ( const party& l, const party& r )
   {
      return l.type == r.type && l.name == r.name;
   }
   inline bool operator != ( const party& l, const party& r ) { return !( l == r ); }
   /** every address sorts before every role */
   inline bool operator <  ( const party& l, const party& r )
   {
      if( l.type != r.type ) return l.type < r.type;
      return l.name < r.name;
   }

   /** accounts are owned by parties */
   typedef party account_id_type;

   struct choice_id
   {
      choice_id(){}
      choice_id( const string& name, const party& owner ):choice_name(name),choice_owner(owner){}

      string   choice_name;
      party    choice_owner;
   };

   inline bool operator == ( const choice_id& l, const choice_id& r )
   {
      return l.choice_name == r.choice_name && l.choice_owner == r.choice_owner;
   }
   inline bool operator != ( const choice_id& l, const choice_id& r ) { return !( l == r ); }
   inline bool operator <  ( const choice_id& l, const choice_id& r )
   {
      if( l.choice_name != r.choice_name ) return l.choice_name < r.choice_name;
      return l.choice_owner < r.choice_owner;
   }

   enum payee_type_enum
   {
      account_payee_type  = 0,
      party_payee_type    = 1
   };

   /** the destination of a Pay, either an internal account or a party outside the contract */
   struct payee
   {
      payee():type(party_payee_type){}
      payee( payee_type_enum t, const party& p ):type(t),owner(p){}

      static payee account( const account_id_type& id ) { return payee( account_payee_type, id ); }
      static payee to_party( const party& p ) { return payee( party_payee_type, p ); }

      payee_type_enum  type;
      party            owner;
   };

   inline bool operator == ( const payee& l, const payee& r )
   {
      return l.type == r.type && l.owner == r.owner;
   }
   inline bool operator != ( const payee& l, const payee& r ) { return !( l == r ); }

   /** closed interval [from, to] */
   struct bound
   {
      bound(){}
      bound( const integer_type& f, const integer_type& t ):from(f),to(t){}

      bool contains( const integer_type& n )const { return from <= n && n <= to; }

      integer_type from;
      integer_type to;
   };

   inline bool operator == ( const bound& l, const bound& r ) { return l.from == r.from && l.to == r.to; }

   bool in_bounds( const integer_type& n, const vector<bound>& bounds );

} } // marlowe::semantics

namespace fc
{
   void to_variant( const marlowe::semantics::party& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::party& vo );
   void to_variant( const marlowe::semantics::payee& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::payee& vo );
   void to_variant( const marlowe::semantics::token& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::token& vo );
   void to_variant( const marlowe::semantics::choice_id& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::choice_id& vo );
   void to_variant( const marlowe::semantics::bound& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::bound& vo );
}

FC_REFLECT_ENUM( marlowe::semantics::party_type_enum,
        (address_party_type)
        (role_party_type)
        )
FC_REFLECT_ENUM( marlowe::semantics::payee_type_enum,
        (account_payee_type)
        (party_payee_type)
        )
