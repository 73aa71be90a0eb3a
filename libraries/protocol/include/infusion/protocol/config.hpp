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

#define INFUSION_MAX_NESTED_OBJECTS (200)

/// Smallest Aura amount a FuseBlock or Item can be minted with
#define INFUSION_MIN_INFUSION_AMOUNT (100)
#define INFUSION_MAX_SHARE_SUPPLY int64_t(1000000000000000ll)

/// Domain separator appended when deriving an object address from a seed
#define INFUSION_OBJECT_FROM_SEED_SCHEME (0xFE)

#define INFUSION_CREATOR_SEED        "infusion::creator"
#define INFUSION_TOKEN_STORE_SEED    "infusion::aura_store"

#define INFUSION_DEFAULT_AURA_NAME          "Aura"
#define INFUSION_DEFAULT_AURA_SYMBOL        "AURA"
#define INFUSION_DEFAULT_AURA_DECIMALS      (8)
#define INFUSION_MAX_ASSET_DECIMALS         (32)
#define INFUSION_DEFAULT_AURA_ICON_URI      "https://infusion.example/aura.png"
#define INFUSION_DEFAULT_AURA_PROJECT_URI   "https://infusion.example"

#define INFUSION_FUSE_BLOCK_COLLECTION_NAME        "FuseBlock Collection"
#define INFUSION_FUSE_BLOCK_COLLECTION_DESCRIPTION "Infusable FuseBlock tokens"
#define INFUSION_FUSE_BLOCK_COLLECTION_URI         "https://infusion.example/fuseblock"
#define INFUSION_FUSE_BLOCK_TOKEN_PREFIX           "FuseBlock"

#define INFUSION_ITEM_COLLECTION_NAME        "Item Collection"
#define INFUSION_ITEM_COLLECTION_DESCRIPTION "Infusable Item tokens"
#define INFUSION_ITEM_COLLECTION_URI         "https://infusion.example/item"
#define INFUSION_ITEM_TOKEN_PREFIX           "Item"
