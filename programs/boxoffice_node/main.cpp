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
#include <boxoffice/chain/database.hpp>
#include <boxoffice/chain/exceptions.hpp>
#include <boxoffice/chain/replay.hpp>

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>
#include <fc/filesystem.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/program_options.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/version.hpp>

#include <iostream>
#include <map>
#include <sstream>

namespace bpo = boost::program_options;

using namespace boxoffice::chain;

namespace boxoffice { namespace node {

   /// Contents of --config-file
   struct node_config
   {
      ledger_config                           ledger;
      /// Opening balances of the in memory payment gateway
      std::map<account_name_type, share_type> balances;
   };

} }

FC_REFLECT( boxoffice::node::node_config, (ledger)(balances) )

namespace {

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

fc::log_level string_to_level( const std::string& level )
{
   fc::log_level result;
   if(level == "info")
      result = fc::log_level::info;
   else if(level == "debug")
      result = fc::log_level::debug;
   else if(level == "warn")
      result = fc::log_level::warn;
   else if(level == "error")
      result = fc::log_level::error;
   else if(level == "all")
      result = fc::log_level::all;
   else
      FC_THROW("Log level not allowed. Allowed levels are info, debug, warn, error and all.");

   return result;
}

void setup_logging( const std::string& console_level )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::debug,
         fc::console_appender::color::green));
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::warn,
         fc::console_appender::color::brown));
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::error,
         fc::console_appender::color::red));
   cfg.appenders.push_back(fc::appender_config( "default", "console", fc::variant(console_appender_config, 20)));
   cfg.loggers = { fc::logger_config("default") };
   cfg.loggers.front().level = string_to_level(console_level);
   cfg.loggers.front().appenders = {"default"};
   fc::configure_logging( cfg );
}

}

/// The main program
int main(int argc, char** argv) {
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options("Boxoffice Ledger Node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("version,v", "Display version information")
            ("config-file,c", bpo::value<std::string>(),
                    "JSON file with the ledger configuration and the opening balances")
            ("operations,o", bpo::value<std::string>(),
                    "JSON file with the operations to apply, as [ { \"height\": N, \"op\": [ name, {...} ] } ]")
            ("log-level", bpo::value<std::string>()->default_value("info"),
                    "Console log level: info, debug, warn, error or all");

      bpo::variables_map options;
      try
      {
         bpo::store(bpo::parse_command_line(argc, argv, app_options), options);
      }
      catch (const boost::program_options::error& e)
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("version") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Version: " << BOXOFFICE_LEDGER_VERSION << "\n";
         ss << "Boost: " << boost::replace_all_copy(std::string(BOOST_LIB_VERSION), "_", "."); // No end of line in the end
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }
      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      bpo::notify(options);
      setup_logging( options.at("log-level").as<std::string>() );

      boxoffice::node::node_config config;
      if( options.count("config-file") > 0 )
      {
         const fc::path config_file( options.at("config-file").as<std::string>() );
         FC_ASSERT( fc::exists( config_file ), "Config file ${f} not found", ("f",config_file) );
         config = fc::json::from_file( config_file ).as<boxoffice::node::node_config>( BOXOFFICE_MAX_NESTED_OBJECTS );
         ilog( "Loaded configuration from ${f}", ("f",config_file) );
      }

      auto gateway = std::make_shared<simple_payment_gateway>();
      for( const auto& item : config.balances )
         gateway->fund( item.first, item.second );
      auto clock = std::make_shared<manual_clock>( config.ledger.initial_height );

      database db( config.ledger, gateway, clock );

      std::vector<scheduled_operation> schedule;
      if( options.count("operations") > 0 )
      {
         const fc::path ops_file( options.at("operations").as<std::string>() );
         FC_ASSERT( fc::exists( ops_file ), "Operations file ${f} not found", ("f",ops_file) );
         schedule = fc::json::from_file( ops_file )
                       .as<std::vector<scheduled_operation>>( BOXOFFICE_MAX_NESTED_OBJECTS );
      }

      uint32_t rejected = 0;
      for( const auto& item : schedule )
      {
         const replay_entry entry = replay_operation( db, *clock, item );
         if( !entry.outcome.succeeded() )
            ++rejected;
         std::cout << fc::json::to_pretty_string( fc::variant( entry, BOXOFFICE_MAX_NESTED_OBJECTS ) ) << "\n";
      }

      fc::mutable_variant_object summary;
      summary( "ledger", fc::variant( db.get_ledger_properties(), BOXOFFICE_MAX_NESTED_OBJECTS ) )
             ( "applied", schedule.size() - rejected )
             ( "rejected", rejected )
             ( "balances", fc::variant( gateway->balances(), BOXOFFICE_MAX_NESTED_OBJECTS ) );
      std::cout << fc::json::to_pretty_string( fc::variant( summary, BOXOFFICE_MAX_NESTED_OBJECTS ) ) << "\n";

      ilog( "Applied ${a} operations, ${r} rejected", ("a",schedule.size() - rejected)("r",rejected) );
      return EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   }

   if (unhandled_exception)
   {
      elog("Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()));
      return EXIT_FAILURE;
   }
   return EXIT_SUCCESS;
}
