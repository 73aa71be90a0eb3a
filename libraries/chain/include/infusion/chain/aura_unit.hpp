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

namespace infusion { namespace chain {

   class database;

   /**
    *  @brief Aura that has left one balance and not yet reached another
    *
    *  Only the database creates units, by withdrawing from a balance.  A unit
    *  cannot be copied.  It ends either deposited into a balance or, once
    *  empty, destroyed with database::destroy_zero().
    */
   class aura_unit
   {
      public:
         aura_unit( aura_unit&& other )
            : _asset_type( other._asset_type ), _amount( other._amount )
         {
            other._amount = 0;
         }

         aura_unit( const aura_unit& ) = delete;
         aura_unit& operator = ( const aura_unit& ) = delete;
         aura_unit& operator = ( aura_unit&& ) = delete;

         const address&    asset_type()const { return _asset_type; }
         const share_type& amount()const     { return _amount; }

      private:
         friend class database;

         aura_unit( const address& asset_type, share_type amount )
            : _asset_type( asset_type ), _amount( amount ) {}

         share_type extract()
         {
            share_type result = _amount;
            _amount = 0;
            return result;
         }

         address    _asset_type;
         share_type _amount;
   };

} } // infusion::chain
