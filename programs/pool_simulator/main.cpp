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
#include <meridian/app/scenario.hpp>

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace bpo = boost::program_options;

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

/// Log messages to console with default color and no format via fc::console_appender
void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

int main( int argc, char** argv )
{
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options("Meridian Pool Simulator");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("config,c", bpo::value<boost::filesystem::path>(), "JSON pool configuration file")
            ("scenario,s", bpo::value<boost::filesystem::path>(), "JSON scenario to run against the pool")
            ("start-time", bpo::value<uint32_t>()->default_value(0),
                    "Pool creation time in seconds since the epoch, 0 for now")
            ("log-level", bpo::value<std::string>()->default_value("info"),
                    "Console log level when the configuration has no logging section")
            ("write-example-config", bpo::value<boost::filesystem::path>(),
                    "Write an example pool configuration to the given file and exit");

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line(argc, argv, app_options), options );
         bpo::notify( options );
      }
      catch( const boost::program_options::error& e )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      if( options.count("write-example-config") > 0 )
      {
         const fc::path out = options.at("write-example-config").as<boost::filesystem::path>();
         meridian::app::save_pool_config( meridian::app::create_example_pool_config(), out );
         my_log( "Wrote example pool configuration to " + out.preferred_string() );
         return EXIT_SUCCESS;
      }

      if( options.count("config") == 0 || options.count("scenario") == 0 )
      {
         disable_default_logging();
         my_log( "Both --config and --scenario are required, see --help" );
         return EXIT_FAILURE;
      }

      const auto config = meridian::app::load_pool_config( options.at("config").as<boost::filesystem::path>() );
      if( config.logging.valid() )
         fc::configure_logging( *config.logging );
      else
         fc::configure_logging(
               meridian::app::create_console_logging_config( options.at("log-level").as<std::string>() ) );

      const auto scenario = meridian::app::load_scenario( options.at("scenario").as<boost::filesystem::path>() );

      const uint32_t start_seconds = options.at("start-time").as<uint32_t>();
      const fc::time_point_sec start = ( start_seconds == 0 ? fc::time_point_sec( fc::time_point::now() )
                                                            : fc::time_point_sec( start_seconds ) );

      meridian::app::pool_simulation simulation( config.parameters, start );
      simulation.pool().accrued.connect( []( const meridian::protocol::accrual_record& r ) {
         ilog( "accrual ${r}", ("r",r) );
      });
      simulation.pool().reserves_harvested.connect( []( const meridian::protocol::reserve_harvest_record& r ) {
         ilog( "harvest ${r}", ("r",r) );
      });

      ilog( "Running ${n} steps starting at ${t}", ("n",scenario.steps.size())("t",start) );
      const auto results = simulation.run( scenario );

      bool failed = false;
      for( const auto& result : results )
      {
         std::cout << fc::json::to_string( fc::variant( result, MERIDIAN_MAX_NESTED_OBJECTS ) ) << "\n";
         failed = failed || result.error.valid();
      }

      auto& pool = simulation.pool();
      ilog( "Final state: total borrows ${b}, borrow index ${i}, total assets ${a}, total shares ${s}",
            ("b",pool.get_total_borrows())("i",pool.get_borrow_index())
            ("a",pool.total_assets())("s",pool.total_shares()) );

      return failed ? EXIT_FAILURE : EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   }

   if( unhandled_exception )
   {
      elog( "Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()) );
      return EXIT_FAILURE;
   }
   return EXIT_SUCCESS;
}
