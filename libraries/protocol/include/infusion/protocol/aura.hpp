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
#include <infusion/protocol/base.hpp>

namespace infusion { namespace protocol {

   /**
    * @ingroup operations
    * @brief Issue new Aura into an account
    *
    * Only the admin may mint.  The supply is issued by the creator, which
    * holds the asset's mint capability.
    */
   struct aura_mint_operation : public base_operation
   {
      /// Must be the admin
      address    admin;

      /// Receives the new supply
      address    to;

      share_type amount;

      void validate()const;
      void get_required_authorities( flat_set<address>& a )const { a.insert( admin ); }
   };

   /**
    * @ingroup operations
    * @brief Destroy Aura held by an account
    */
   struct aura_burn_operation : public base_operation
   {
      /// Must be the admin
      address    admin;

      /// Account whose balance is reduced
      address    from;

      share_type amount;

      void validate()const;
      void get_required_authorities( flat_set<address>& a )const { a.insert( admin ); }
   };

   /**
    * @ingroup operations
    * @brief Move Aura between two accounts on the admin's authority
    *
    * The owner of the source balance does not take part.  Frozen accounts do
    * not stop this transfer while the asset allows transfers that ignore the
    * frozen flag.
    */
   struct aura_override_transfer_operation : public base_operation
   {
      /// Must be the admin
      address    admin;

      address    from;
      address    to;
      share_type amount;

      void validate()const;
      void get_required_authorities( flat_set<address>& a )const { a.insert( admin ); }
   };

   /**
    * @ingroup operations
    * @brief Move Aura from the owner's balance to another account
    *
    * Fails if either account is frozen.
    */
   struct aura_transfer_operation : public base_operation
   {
      /// Owner of the balance being debited
      address    from;

      address    to;
      share_type amount;

      void validate()const;
      void get_required_authorities( flat_set<address>& a )const { a.insert( from ); }
   };

   /**
    * @ingroup operations
    * @brief Stop an account from sending or receiving Aura on the ordinary path
    */
   struct aura_freeze_operation : public base_operation
   {
      /// Must be the admin
      address admin;

      address account;

      void validate()const;
      void get_required_authorities( flat_set<address>& a )const { a.insert( admin ); }
   };

   /**
    * @ingroup operations
    * @brief Clear the frozen flag of an account
    */
   struct aura_unfreeze_operation : public base_operation
   {
      /// Must be the admin
      address admin;

      address account;

      void validate()const;
      void get_required_authorities( flat_set<address>& a )const { a.insert( admin ); }
   };

   /**
    * @ingroup operations
    * @brief Move the sender's own Aura into a target's balance
    *
    * When the target is an infusable token the Aura lands in the token's
    * balance store.  Any other target is credited directly.
    */
   struct aura_infuse_operation : public base_operation
   {
      /// Owner of the balance being debited
      address    from;

      /// Account or token receiving the Aura
      address    target;

      share_type amount;

      void validate()const;
      void get_required_authorities( flat_set<address>& a )const { a.insert( from ); }
   };

} } // infusion::protocol

FC_REFLECT( infusion::protocol::aura_mint_operation, (admin)(to)(amount) )
FC_REFLECT( infusion::protocol::aura_burn_operation, (admin)(from)(amount) )
FC_REFLECT( infusion::protocol::aura_override_transfer_operation, (admin)(from)(to)(amount) )
FC_REFLECT( infusion::protocol::aura_transfer_operation, (from)(to)(amount) )
FC_REFLECT( infusion::protocol::aura_freeze_operation, (admin)(account) )
FC_REFLECT( infusion::protocol::aura_unfreeze_operation, (admin)(account) )
FC_REFLECT( infusion::protocol::aura_infuse_operation, (from)(target)(amount) )
