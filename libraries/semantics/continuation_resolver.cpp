#include <marlowe/semantics/continuation_resolver.hpp>
#include <marlowe/semantics/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include "variant_helpers.hpp"

namespace marlowe { namespace semantics {

   contract_ptr contract_source_store::resolve( const contract_hash_type& hash )const
   {
      auto itr = _sources.find( hash );
      if( itr == _sources.end() )
         FC_CAPTURE_AND_THROW( unresolved_continuation, (hash) );
      return itr->second;
   }

   void contract_source_store::store( const contract_hash_type& hash, const contract_ptr& c )
   {
      FC_ASSERT( c, "null contract" );
      FC_ASSERT( !hash.empty(), "empty continuation hash" );
      _sources[hash] = c;
   }

   bool contract_source_store::contains( const contract_hash_type& hash )const
   {
      return _sources.find( hash ) != _sources.end();
   }

   void contract_source_store::load( const variant& bundle )
   { try {
      for( const auto& entry : detail::expect_object( bundle, "continuation bundle" ) )
         store( entry.key(), entry.value().as<contract_ptr>() );
   } FC_CAPTURE_AND_RETHROW() }

   void contract_source_store::load_from_file( const fc::path& bundle_file )
   { try {
      FC_ASSERT( fc::exists( bundle_file ), "continuation bundle ${f} does not exist", ("f",bundle_file) );
      load( fc::json::from_file( bundle_file ) );
      ilog( "loaded ${n} continuations from ${f}", ("n",_sources.size())("f",bundle_file) );
   } FC_CAPTURE_AND_RETHROW( (bundle_file) ) }

   variant contract_source_store::to_variant()const
   {
      mutable_variant_object bundle;
      for( const auto& item : _sources )
         bundle( item.first, variant( item.second ) );
      return variant( bundle );
   }

} } // marlowe::semantics
