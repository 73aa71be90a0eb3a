/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once
#include <infusion/chain/types.hpp>
#include <infusion/db/generic_index.hpp>
#include <infusion/protocol/infusable.hpp>

#include <boost/multi_index/composite_key.hpp>

/**
 * @defgroup infusable Infusable token objects
 */

namespace infusion {
   namespace chain {
      class database;

      using namespace infusion::db;

      /**
       *  @brief Tracks a collection into which tokens are minted
       *  @ingroup object
       *  @ingroup implementation
       *
       *  There is one collection per token_kind.  Both are created by the
       *  creator at genesis.
       */
      class collection_object : public abstract_object<collection_object> {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id = impl_collection_object_type;

         /// Kind of token minted into the collection
         token_kind kind = token_kind::fuse_block;

         /// Name of the collection
         string name;

         /// Description shared by every token of the collection
         string description;

         /// Base of every token uri
         string uri;

         /// Tokens are named "<token_name_prefix> #<sequence>"
         string token_name_prefix;

         /// Derived from the creator and the collection name
         address collection_address;

         /// Creator that owns the collection
         address creator;

         /// Number of tokens ever minted into the collection
         /// The counter only grows.  Burned tokens keep their sequence.
         uint64_t counter = 0;

         string token_name(uint64_t sequence) const;
         string token_uri(uint64_t sequence) const;
      };

      struct by_collection_kind;
      struct by_collection_name;
      typedef multi_index_container<
         collection_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_collection_kind>, member<collection_object, token_kind, &collection_object::kind> >,
            ordered_unique< tag<by_collection_name>, member<collection_object, string, &collection_object::name> >
         >
      > collection_multi_index_type;
      typedef generic_index<collection_object, collection_multi_index_type> collection_index;


      /**
       *  @brief Handles that allow a token to be extended, transferred and burned
       *
       *  Every handle records the token it is bound to.  The handles live only
       *  inside the token's own object, so they cannot outlive the token and
       *  are released when the token is burned.
       */
      struct token_capabilities {
         token_capabilities() {}
         explicit token_capabilities(const address& token)
            : extend_ref(token), transfer_ref(token), burn_ref(token) {}

         /// Permits the token to act on its own balance store
         address extend_ref;

         /// Permits ownership changes without the owner's consent
         address transfer_ref;

         /// Permits deleting the token
         address burn_ref;

         bool is_bound_to(const address& token) const {
            return extend_ref == token && transfer_ref == token && burn_ref == token;
         }
      };

      /**
       *  @brief Tracks an infusable token (a FuseBlock or an Item)
       *  @ingroup object
       *  @ingroup implementation
       *
       *  The Aura infused into the token is held by the balance entry owned
       *  by balance_store.  It is returned to the owner when the token is burned.
       */
      class infusable_token_object : public abstract_object<infusable_token_object> {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id = impl_infusable_token_object_type;

         /// Kind of the token, selects its collection
         token_kind kind = token_kind::fuse_block;

         /// Derived from the creator, the collection name and the token name
         address token_address;

         /// Address of the collection the token belongs to
         address collection;

         /// Creator that minted the token
         address creator;

         /// Current owner
         address owner;

         /// Position of the token in its collection, starting at 1
         uint64_t sequence = 0;

         /// Name of the token, i.e. "FuseBlock #1"
         string name;

         string uri;

         string description;

         /// Address of the balance entry holding the infused Aura
         address balance_store;

         /// Set by the admin.  Permits admin transfers.  Never cleared.
         bool qualifies = false;

         /// For Items minted from a FuseBlock, that FuseBlock
         optional<address> origin;

         token_capabilities capabilities;
      };

      struct by_token_address;
      struct by_token_owner;
      typedef multi_index_container<
         infusable_token_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_token_address>, member<infusable_token_object, address, &infusable_token_object::token_address> >,
            ordered_unique< tag<by_token_owner>,
               composite_key<infusable_token_object,
                  member<infusable_token_object, address, &infusable_token_object::owner>,
                  member<object, object_id_type, &object::id>
               >
            >
         >
      > infusable_token_multi_index_type;
      typedef generic_index<infusable_token_object, infusable_token_multi_index_type> infusable_token_index;
   }
} // infusion::chain

FC_REFLECT( infusion::chain::token_capabilities, (extend_ref)(transfer_ref)(burn_ref) )

FC_REFLECT_DERIVED( infusion::chain::collection_object, (infusion::db::object),
                    (kind)
                    (name)
                    (description)
                    (uri)
                    (token_name_prefix)
                    (collection_address)
                    (creator)
                    (counter)
                  )

FC_REFLECT_DERIVED( infusion::chain::infusable_token_object, (infusion::db::object),
                    (kind)
                    (token_address)
                    (collection)
                    (creator)
                    (owner)
                    (sequence)
                    (name)
                    (uri)
                    (description)
                    (balance_store)
                    (qualifies)
                    (origin)
                    (capabilities)
)
