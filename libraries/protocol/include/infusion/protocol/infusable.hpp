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

namespace infusion {
   namespace protocol {
      /// The two collections of infusable tokens
      enum class token_kind : uint8_t {
         fuse_block = 0,
         item = 1
      };

      struct fuse_block_mint_operation : public base_operation {
         /// This account must sign.  It pays the infusion and owns the new FuseBlock.
         address caller;

         /// Aura moved from the caller's balance into the new token.
         /// Must be at least the configured minimum infusion.
         share_type amount;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         void get_required_authorities( flat_set<address>& a ) const { a.insert( caller ); }
      };

      struct item_mint_operation : public base_operation {
         /// This account must sign.  It pays the infusion and owns the new Item.
         address caller;

         /// Aura moved from the caller's balance into the new token.
         /// Must be at least the configured minimum infusion.
         share_type amount;

         /// FuseBlock the Item is minted from.  Unset for a direct mint.
         optional<address> origin;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         void get_required_authorities( flat_set<address>& a ) const { a.insert( caller ); }
      };

      struct token_qualify_operation : public base_operation {
         /// Must be the admin
         address admin;

         /// Token that becomes eligible for admin transfers
         address token;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         void get_required_authorities( flat_set<address>& a ) const { a.insert( admin ); }
      };

      struct token_override_transfer_operation : public base_operation {
         /// Must be the admin
         address admin;

         /// Qualified token to move
         address token;

         /// Account that becomes the owner.  The current owner does not sign.
         address new_owner;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         void get_required_authorities( flat_set<address>& a ) const { a.insert( admin ); }
      };

      struct token_burn_operation : public base_operation {
         /// Current owner of the token.  Receives all Aura held by the token.
         address owner;

         address token;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         void get_required_authorities( flat_set<address>& a ) const { a.insert( owner ); }
      };

      struct token_infuse_operation : public base_operation {
         /// This account must sign.  Need not own the token.
         address caller;

         address token;

         /// Aura moved from the caller's balance into the token's balance store
         share_type amount;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         void get_required_authorities( flat_set<address>& a ) const { a.insert( caller ); }
      };
   }
}

FC_REFLECT_ENUM( infusion::protocol::token_kind, (fuse_block)(item) )

FC_REFLECT( infusion::protocol::fuse_block_mint_operation, (caller)(amount) )
FC_REFLECT( infusion::protocol::item_mint_operation, (caller)(amount)(origin) )
FC_REFLECT( infusion::protocol::token_qualify_operation, (admin)(token) )
FC_REFLECT( infusion::protocol::token_override_transfer_operation, (admin)(token)(new_owner) )
FC_REFLECT( infusion::protocol::token_burn_operation, (owner)(token) )
FC_REFLECT( infusion::protocol::token_infuse_operation, (caller)(token)(amount) )
