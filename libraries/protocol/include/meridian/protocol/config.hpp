/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
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

#define MERIDIAN_WAD_DIGITS 18
#define MERIDIAN_WAD        uint64_t( 1000000000000000000ULL )

/** Borrow index at pool creation, 1.0 in wad */
#define MERIDIAN_INITIAL_BORROW_INDEX MERIDIAN_WAD

#define MERIDIAN_SECONDS_PER_YEAR     uint64_t( 365 * 24 * 60 * 60 )

/**
 * Range limits of the pool state fields.  Values are held in 128-bit integers but are
 * checked against these widths whenever they grow.
 */
#define MERIDIAN_TOTAL_BORROWS_BITS   96
#define MERIDIAN_BORROW_INDEX_BITS    96
#define MERIDIAN_BORROW_RATE_BITS     80

#define MERIDIAN_MAX_NESTED_OBJECTS   (200)
