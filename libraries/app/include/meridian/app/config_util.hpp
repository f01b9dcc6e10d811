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

#include <meridian/protocol/pool_parameters.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/logger_config.hpp>

namespace meridian { namespace app {

   using namespace meridian::protocol;

   /**
    *  @brief Contents of a pool configuration file
    *
    *  When @ref annual_rates is present it replaces the per-second rates of @ref parameters.
    */
   struct pool_config
   {
      pool_parameters                   parameters;
      optional<annual_interest_rates>   annual_rates;
      optional<fc::logging_config>      logging;
   };

   /// Reads and validates a JSON pool configuration
   pool_config load_pool_config( const fc::path& config_file );

   /// Writes @p config as pretty printed JSON
   void save_pool_config( const pool_config& config, const fc::path& config_file );

   /// A configuration with example identities and a 2% base / 10% slope / 80% kink curve
   pool_config create_example_pool_config();

   fc::log_level string_to_level( const string& level );

   /// Console logging at @p level, for when no logging section is configured
   fc::logging_config create_console_logging_config( const string& level );

} } // meridian::app

FC_REFLECT( meridian::app::pool_config, (parameters)(annual_rates)(logging) )
