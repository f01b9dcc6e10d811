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
#include <meridian/app/config_util.hpp>
#include <meridian/protocol/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger.hpp>

namespace meridian { namespace app {

pool_config load_pool_config( const fc::path& config_file )
{ try {
   FC_ASSERT( fc::exists( config_file ), "Pool configuration ${f} does not exist", ("f",config_file) );

   pool_config config = fc::json::from_file( config_file ).as<pool_config>( MERIDIAN_MAX_NESTED_OBJECTS );
   if( config.annual_rates.valid() )
      config.parameters.rates = interest_rate_parameters::from_annual( *config.annual_rates );
   config.parameters.validate();

   ilog( "Loaded pool configuration from ${f}", ("f",config_file.preferred_string()) );
   return config;
} FC_CAPTURE_AND_RETHROW( (config_file) ) }

void save_pool_config( const pool_config& config, const fc::path& config_file )
{ try {
   fc::json::save_to_file( config, config_file );
} FC_CAPTURE_AND_RETHROW( (config_file) ) }

pool_config create_example_pool_config()
{
   pool_config config;
   pool_parameters& p = config.parameters;
   p.pool_account      = account_id_type( 1 );
   p.reserve_receiver  = account_id_type( 2 );
   p.reserve_harvester = account_id_type( 3 );
   p.admin             = account_id_type( 4 );
   p.underlying_asset  = asset_id_type( 1 );
   p.strategy_asset    = asset_id_type( 2 );

   annual_interest_rates rates;
   rates.base_rate_per_year       = amount_type( MERIDIAN_WAD ) / 50;
   rates.multiplier_per_year      = amount_type( MERIDIAN_WAD ) / 10;
   rates.jump_multiplier_per_year = amount_type( MERIDIAN_WAD ) * 3;
   rates.kink                     = amount_type( MERIDIAN_WAD ) * 8 / 10;
   rates.reserve_factor           = amount_type( MERIDIAN_WAD ) / 10;
   config.annual_rates = rates;
   p.rates = interest_rate_parameters::from_annual( rates );

   config.logging = create_console_logging_config( "info" );
   return config;
}

fc::log_level string_to_level( const string& level )
{
   if( level == "info" )
      return fc::log_level::info;
   if( level == "debug" )
      return fc::log_level::debug;
   if( level == "warn" )
      return fc::log_level::warn;
   if( level == "error" )
      return fc::log_level::error;
   if( level == "all" )
      return fc::log_level::all;
   FC_THROW( "Log level ${l} not allowed. Allowed levels are info, debug, warn, error and all.", ("l",level) );
}

fc::logging_config create_console_logging_config( const string& level )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::debug, fc::console_appender::color::green ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::warn, fc::console_appender::color::brown ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::error, fc::console_appender::color::red ) );
   cfg.appenders.push_back( fc::appender_config( "stderr", "console",
                                                 fc::variant( console_appender_config, 20 ) ) );

   fc::logger_config default_logger( "default" );
   default_logger.level = string_to_level( level );
   default_logger.appenders = { "stderr" };
   cfg.loggers = { default_logger };
   return cfg;
}

} } // meridian::app
