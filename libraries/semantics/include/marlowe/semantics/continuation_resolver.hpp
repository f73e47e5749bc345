#pragma once

#include <marlowe/semantics/contract.hpp>

#include <fc/filesystem.hpp>

namespace marlowe { namespace semantics {

   /**
    *  Looks up the contract stored under the hash of a merkleized case.
    *  The semantics never call this themselves, it is used to build the
    *  disclosure an input must carry.
    */
   class continuation_resolver
   {
      public:
         virtual ~continuation_resolver(){};

         /** @throws unresolved_continuation if hash is unknown */
         virtual contract_ptr resolve( const contract_hash_type& hash )const = 0;
   };
   typedef std::shared_ptr<continuation_resolver> continuation_resolver_ptr;

   /**
    *  In memory bundle of merkleized continuations.  Hashes are taken
    *  as given, whoever builds the bundle is responsible for them.
    */
   class contract_source_store : public continuation_resolver
   {
      public:
         contract_source_store(){}

         virtual contract_ptr  resolve( const contract_hash_type& hash )const override;

         void                  store( const contract_hash_type& hash, const contract_ptr& c );
         bool                  contains( const contract_hash_type& hash )const;
         size_t                size()const { return _sources.size(); }

         /** loads a JSON object mapping each hash to its contract */
         void                  load( const variant& bundle );
         void                  load_from_file( const fc::path& bundle_file );
         variant               to_variant()const;

      private:
         map<contract_hash_type, contract_ptr> _sources;
   };

} } // marlowe::semantics
