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
#include <infusion/protocol/address.hpp>

#include <fc/exception/exception.hpp>

#include <cctype>

namespace infusion { namespace protocol {

   address::address( const std::string& hex )
   {
      std::string digits = hex;
      if( digits.size() >= 2 && digits[0] == '0' && ( digits[1] == 'x' || digits[1] == 'X' ) )
         digits = digits.substr( 2 );

      FC_ASSERT( !digits.empty(), "Address ${a} has no hex digits", ("a",hex) );
      FC_ASSERT( digits.size() <= 64, "Address ${a} is longer than 32 bytes", ("a",hex) );
      for( char c : digits )
         FC_ASSERT( isxdigit( static_cast<unsigned char>(c) ), "Address ${a} is not hexadecimal", ("a",hex) );

      addr = fc::sha256( std::string( 64 - digits.size(), '0' ) + digits );
   }

   address address::derive( const address& parent, const std::string& seed )
   {
      const char scheme = char( INFUSION_OBJECT_FROM_SEED_SCHEME );

      fc::sha256::encoder enc;
      enc.write( parent.addr.data(), parent.addr.data_size() );
      enc.write( seed.data(), seed.size() );
      enc.write( &scheme, 1 );
      return address( enc.result() );
   }

   address::operator std::string()const
   {
      return "0x" + addr.str();
   }

} } // infusion::protocol

namespace fc
{
   void to_variant( const infusion::protocol::address& var, variant& vo, uint32_t max_depth )
   {
      vo = std::string( var );
   }

   void from_variant( const variant& var, infusion::protocol::address& vo, uint32_t max_depth )
   {
      vo = infusion::protocol::address( var.as_string() );
   }
}
