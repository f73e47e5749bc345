#include <marlowe/semantics/contract.hpp>
#include <marlowe/semantics/exceptions.hpp>

#include "variant_helpers.hpp"

namespace marlowe { namespace semantics {

   action make_deposit( const account_id_type& into_account, const party& by, const token& currency, const value_ptr& amount )
   {
      FC_ASSERT( amount );
      action a( deposit_action_type );
      a.into_account = into_account;
      a.by           = by;
      a.currency     = currency;
      a.amount       = amount;
      return a;
   }

   action make_choice( const choice_id& choice, const vector<bound>& bounds )
   {
      action a( choice_action_type );
      a.choice = choice;
      a.bounds = bounds;
      return a;
   }

   action make_notify( const observation_ptr& condition )
   {
      FC_ASSERT( condition );
      action a( notify_action_type );
      a.condition = condition;
      return a;
   }

   bool operator == ( const action& l, const action& r )
   {
      if( l.type != r.type )
         return false;

      switch( l.type )
      {
         case deposit_action_type:
            return l.into_account == r.into_account && l.by == r.by && l.currency == r.currency
                && same_value( l.amount, r.amount );
         case choice_action_type:
            return l.choice == r.choice && l.bounds == r.bounds;
         case notify_action_type:
            return same_observation( l.condition, r.condition );
         // No default to force compiler warning
      }
      return false;
   }

   contract_case make_case( const action& a, const contract_ptr& then )
   {
      FC_ASSERT( then );
      return contract_case( a, then );
   }

   contract_case make_merkleized_case( const action& a, const contract_hash_type& hash )
   {
      contract_case c;
      c.case_action     = a;
      c.merkleized_then = hash;
      return c;
   }

   bool operator == ( const contract_case& l, const contract_case& r )
   {
      if( l.case_action != r.case_action || l.is_merkleized() != r.is_merkleized() )
         return false;
      if( l.is_merkleized() )
         return *l.merkleized_then == *r.merkleized_then;
      return same_contract( l.then, r.then );
   }

   contract_ptr make_close()
   {
      static const contract_ptr close = std::make_shared<contract>( close_contract_type );
      return close;
   }

   contract_ptr make_pay( const account_id_type& from_account, const payee& to, const token& currency,
                          const value_ptr& amount, const contract_ptr& then )
   {
      FC_ASSERT( amount && then );
      auto c = std::make_shared<contract>( pay_contract_type );
      c->from_account = from_account;
      c->to           = to;
      c->currency     = currency;
      c->amount       = amount;
      c->then         = then;
      return c;
   }

   contract_ptr make_if( const observation_ptr& condition, const contract_ptr& then, const contract_ptr& otherwise )
   {
      FC_ASSERT( condition && then && otherwise );
      auto c = std::make_shared<contract>( if_contract_type );
      c->condition = condition;
      c->then      = then;
      c->otherwise = otherwise;
      return c;
   }

   contract_ptr make_when( const vector<contract_case>& cases, timeout_type timeout, const contract_ptr& timeout_continuation )
   {
      FC_ASSERT( timeout_continuation );
      auto c = std::make_shared<contract>( when_contract_type );
      c->cases     = cases;
      c->timeout   = timeout;
      c->otherwise = timeout_continuation;
      return c;
   }

   contract_ptr make_let( const value_id_type& name, const value_ptr& v, const contract_ptr& then )
   {
      FC_ASSERT( v && then );
      auto c = std::make_shared<contract>( let_contract_type );
      c->name   = name;
      c->amount = v;
      c->then   = then;
      return c;
   }

   contract_ptr make_assert( const observation_ptr& condition, const contract_ptr& then )
   {
      FC_ASSERT( condition && then );
      auto c = std::make_shared<contract>( assert_contract_type );
      c->condition = condition;
      c->then      = then;
      return c;
   }

   bool same_contract( const contract_ptr& l, const contract_ptr& r )
   {
      if( l == r ) return true;
      if( !l || !r ) return false;
      return *l == *r;
   }

   bool operator == ( const contract& l, const contract& r )
   {
      if( l.type != r.type )
         return false;

      switch( l.type )
      {
         case close_contract_type:
            return true;
         case pay_contract_type:
            return l.from_account == r.from_account && l.to == r.to && l.currency == r.currency
                && same_value( l.amount, r.amount ) && same_contract( l.then, r.then );
         case if_contract_type:
            return same_observation( l.condition, r.condition )
                && same_contract( l.then, r.then ) && same_contract( l.otherwise, r.otherwise );
         case when_contract_type:
            return l.timeout == r.timeout && l.cases == r.cases && same_contract( l.otherwise, r.otherwise );
         case let_contract_type:
            return l.name == r.name && same_value( l.amount, r.amount ) && same_contract( l.then, r.then );
         case assert_contract_type:
            return same_observation( l.condition, r.condition ) && same_contract( l.then, r.then );
         // No default to force compiler warning
      }
      return false;
   }

   uint64_t contract_size( const contract_ptr& root )
   {
      uint64_t size = 0;
      vector<const contract*> pending;
      if( root )
         pending.push_back( root.get() );

      while( !pending.empty() )
      {
         const contract* c = pending.back();
         pending.pop_back();
         ++size;

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
               for( const auto& cs : c->cases )
               {
                  if( !cs.is_merkleized() )
                     pending.push_back( cs.then.get() );
               }
               pending.push_back( c->otherwise.get() );
               break;
            // No default to force compiler warning
         }
      }
      return size;
   }

} } // marlowe::semantics

namespace fc
{
   using namespace marlowe::semantics::detail;

   void to_variant( const marlowe::semantics::action& var, variant& vo )
   {
      using namespace marlowe::semantics;
      switch( var.type )
      {
         case deposit_action_type:
         {
            mutable_variant_object obj( "party", var.by );
            obj( "deposits", var.amount )
               ( "of_token", var.currency )
               ( "into_account", var.into_account );
            vo = std::move( obj );
            return;
         }
         case choice_action_type:
         {
            fc::variants bounds;
            for( const auto& b : var.bounds )
               bounds.push_back( variant( b ) );
            mutable_variant_object obj( "for_choice", var.choice );
            obj( "choose_between", bounds );
            vo = std::move( obj );
            return;
         }
         case notify_action_type:
            vo = mutable_variant_object( "notify_if", var.condition );
            return;
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid action type ${t}", ("t",int(var.type)) );
   }

   void from_variant( const variant& var, marlowe::semantics::action& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "action" );
      if( obj.contains( "deposits" ) )
      {
         vo = make_deposit( expect_field( obj, "into_account" ).as<party>(),
                            expect_field( obj, "party" ).as<party>(),
                            expect_field( obj, "of_token" ).as<token>(),
                            obj["deposits"].as<value_ptr>() );
      }
      else if( obj.contains( "for_choice" ) )
      {
         vector<bound> bounds;
         for( const auto& b : expect_array( expect_field( obj, "choose_between" ), "bounds" ) )
            bounds.push_back( b.as<bound>() );
         vo = make_choice( obj["for_choice"].as<choice_id>(), bounds );
      }
      else if( obj.contains( "notify_if" ) )
      {
         vo = make_notify( obj["notify_if"].as<observation_ptr>() );
      }
      else
         FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown action ${v}", ("v",var) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::contract_case& var, variant& vo )
   {
      mutable_variant_object obj( "case", var.case_action );
      if( var.is_merkleized() )
         obj( "merkleized_then", *var.merkleized_then );
      else
         obj( "then", var.then );
      vo = std::move( obj );
   }

   void from_variant( const variant& var, marlowe::semantics::contract_case& vo )
   { try {
      using namespace marlowe::semantics;
      const variant_object& obj = expect_object( var, "case" );
      const action a = expect_field( obj, "case" ).as<action>();
      if( obj.contains( "merkleized_then" ) )
         vo = make_merkleized_case( a, expect_string( obj["merkleized_then"], "merkleized_then" ) );
      else
         vo = make_case( a, expect_field( obj, "then" ).as<contract_ptr>() );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

   void to_variant( const marlowe::semantics::contract& var, variant& vo )
   {
      using namespace marlowe::semantics;
      switch( var.type )
      {
         case close_contract_type:
            vo = variant( "close" );
            return;
         case pay_contract_type:
         {
            mutable_variant_object obj( "from_account", var.from_account );
            obj( "to", var.to )
               ( "token", var.currency )
               ( "pay", var.amount )
               ( "then", var.then );
            vo = std::move( obj );
            return;
         }
         case if_contract_type:
            vo = mutable_variant_object( "if", var.condition )( "then", var.then )( "else", var.otherwise );
            return;
         case when_contract_type:
         {
            fc::variants cases;
            for( const auto& c : var.cases )
               cases.push_back( variant( c ) );
            mutable_variant_object obj( "when", cases );
            obj( "timeout", var.timeout )
               ( "timeout_continuation", var.otherwise );
            vo = std::move( obj );
            return;
         }
         case let_contract_type:
            vo = mutable_variant_object( "let", var.name )( "be", var.amount )( "then", var.then );
            return;
         case assert_contract_type:
            vo = mutable_variant_object( "assert", var.condition )( "then", var.then );
            return;
         // No default to force compiler warning
      }
      FC_THROW_EXCEPTION( invalid_contract_encoding, "invalid contract type ${t}", ("t",int(var.type)) );
   }

   void to_variant( const marlowe::semantics::contract_ptr& var, variant& vo )
   {
      FC_ASSERT( var, "null contract" );
      to_variant( *var, vo );
   }

   void from_variant( const variant& var, marlowe::semantics::contract_ptr& vo )
   { try {
      using namespace marlowe::semantics;
      nesting_guard guard;
      if( var.is_string() )
      {
         if( var.as_string() != "close" )
            FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown contract ${v}", ("v",var) );
         vo = make_close();
         return;
      }

      const variant_object& obj = expect_object( var, "contract" );
      if( obj.contains( "pay" ) )
      {
         vo = make_pay( expect_field( obj, "from_account" ).as<party>(),
                        expect_field( obj, "to" ).as<payee>(),
                        expect_field( obj, "token" ).as<token>(),
                        obj["pay"].as<value_ptr>(),
                        expect_field( obj, "then" ).as<contract_ptr>() );
      }
      else if( obj.contains( "if" ) )
      {
         vo = make_if( obj["if"].as<observation_ptr>(),
                       expect_field( obj, "then" ).as<contract_ptr>(),
                       expect_field( obj, "else" ).as<contract_ptr>() );
      }
      else if( obj.contains( "when" ) )
      {
         vector<contract_case> cases;
         for( const auto& c : expect_array( obj["when"], "cases" ) )
            cases.push_back( c.as<contract_case>() );
         vo = make_when( cases,
                         expect_field( obj, "timeout" ).as_int64(),
                         expect_field( obj, "timeout_continuation" ).as<contract_ptr>() );
      }
      else if( obj.contains( "let" ) )
      {
         vo = make_let( expect_string( obj["let"], "let" ),
                        expect_field( obj, "be" ).as<value_ptr>(),
                        expect_field( obj, "then" ).as<contract_ptr>() );
      }
      else if( obj.contains( "assert" ) )
      {
         vo = make_assert( obj["assert"].as<observation_ptr>(),
                           expect_field( obj, "then" ).as<contract_ptr>() );
      }
      else
         FC_THROW_EXCEPTION( invalid_contract_encoding, "unknown contract ${v}", ("v",var) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
