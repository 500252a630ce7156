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

#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>

#include <fc/io/json.hpp>
#include <fc/string.hpp>

#include <cipherbook/app/api.hpp>
#include <cipherbook/fhe/input_proof.hpp>
#include <cipherbook/fhe/paillier_engine.hpp>
#include <cipherbook/protocol/config.hpp>

#include <boost/program_options.hpp>

#include <fc/log/console_appender.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

using namespace cipherbook::app;
using namespace cipherbook::chain;
using namespace cipherbook::fhe;
using namespace std;
namespace bpo = boost::program_options;

fc::log_level string_to_level(string level)
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

void setup_logging(string console_level, bool file_logger, string file_level, string file_name)
{
   fc::logging_config cfg;

   // console logger
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

   // file logger
   if(file_logger) {
      fc::file_appender::config ac;
      ac.filename             = fc::path("cipherbook_logs") / file_name;
      ac.flush                = true;
      ac.rotate               = true;
      ac.rotation_interval    = fc::hours( 1 );
      ac.rotation_limit       = fc::days( 1 );
      cfg.appenders.push_back(fc::appender_config( "file", "file", fc::variant(ac, 5)));
      cfg.loggers.front().appenders.push_back("file");
      if( string_to_level(file_level) < cfg.loggers.front().level )
         cfg.loggers.front().level = string_to_level(file_level);
   }

   fc::configure_logging( cfg );
   if(file_logger)
      ilog( "Logging to file: ${f}", ("f", (fc::path("cipherbook_logs") / file_name).preferred_string()) );
}

/**
 * Drives one accumulator from a line oriented command script. Identities are derived from
 * names so that scripts are reproducible.
 */
class command_interpreter
{
   public:
      command_interpreter( database& db, paillier_engine& engine, const fc::ecc::private_key& verifier )
      :_db(db), _engine(engine), _verifier(verifier) {}

      fc::variant execute( const string& line );

   private:
      identity_type    identity_of( const string& name );
      accumulator_api& session_of( const string& name );

      database&                                      _db;
      paillier_engine&                               _engine;
      fc::ecc::private_key                           _verifier;
      map<string, unique_ptr<accumulator_api>>       _sessions;
};

identity_type command_interpreter::identity_of( const string& name )
{
   FC_ASSERT( !name.empty(), "Missing identity name" );
   auto key = fc::ecc::private_key::regenerate( fc::sha256::hash( name ) );
   return identity_type( key.get_public_key() );
}

accumulator_api& command_interpreter::session_of( const string& name )
{
   auto itr = _sessions.find( name );
   if( itr == _sessions.end() )
      itr = _sessions.emplace( name, unique_ptr<accumulator_api>( new accumulator_api( _db, identity_of( name ) ) ) ).first;
   return *itr->second;
}

fc::variant command_interpreter::execute( const string& line )
{
   istringstream in( line );
   string command, first, second;
   in >> command >> first >> second;

   const uint32_t depth = CIPHERBOOK_MAX_NESTED_OBJECTS;
   fc::mutable_variant_object result;
   if( command == "submit" )
   {
      const uint64_t amount = parse_amount( second );
      accumulator_api& api = session_of( first );
      external_ciphertext ct = _engine.public_key().encrypt( amount );
      input_proof proof = sign_input( _verifier, _engine.get_options().domain, api.caller(), ct );
      const ciphertext_handle total = api.submit_contribution( ct, proof );
      result( "identity", api.caller(), depth )( "total", total, depth );
   }
   else if( command == "total" )
   {
      accumulator_api& api = session_of( first );
      result( "identity", api.caller(), depth )( "total", api.get_my_total_handle(), depth );
   }
   else if( command == "share" )
   {
      accumulator_api& api = session_of( first );
      api.share_total( identity_of( second ) );
      result( "shared", api.get_my_total_handle(), depth )( "viewer", identity_of( second ), depth );
   }
   else if( command == "publish" )
   {
      accumulator_api& api = session_of( first );
      api.make_total_public();
      result( "public", api.get_my_total_handle(), depth );
   }
   else if( command == "decrypt" )
   {
      const ciphertext_handle handle = _db.get_total_handle( identity_of( second ) );
      const uint64_t value = _engine.decrypt( handle, identity_of( first ) );
      result( "handle", handle, depth )( "value", value, depth );
   }
   else if( command == "granted" )
   {
      return fc::variant( session_of( first ).get_granted_handles(), depth );
   }
   else if( command == "events" )
   {
      return fc::variant( _db.get_audit_events( identity_of( first ) ), depth );
   }
   else
      FC_THROW( "Unknown command '${c}'", ("c", command) );

   return fc::variant( result );
}

int main( int argc, char** argv )
{

   try {

      boost::program_options::options_description opts;
         opts.add_options()
         ("help,h", "Print this help message and exit.")
         ("config-file,c", bpo::value<string>(), "Read options from this ini file; command line values take precedence")
         ("script,s", bpo::value<string>(), "Read commands from this file instead of stdin")
         ("modulus-bits", bpo::value<uint32_t>()->default_value(CIPHERBOOK_DEFAULT_MODULUS_BITS), "Size of the Paillier modulus")
         ("verifier-seed", bpo::value<string>()->default_value("cipherbook-input-verifier"), "Seed of the input verifier key")
         ("system-seed", bpo::value<string>()->default_value("cipherbook-system"), "Seed of the accumulator's own identity")
         ("domain", bpo::value<string>()->default_value("cipherbook"), "Name hashed into the proof domain")
         ("max-ciphertext-size", bpo::value<uint32_t>()->default_value(CIPHERBOOK_DEFAULT_MAX_CIPHERTEXT_SIZE), "Largest accepted contribution in bytes")
         ("max-proof-size", bpo::value<uint32_t>()->default_value(CIPHERBOOK_DEFAULT_MAX_PROOF_SIZE), "Largest accepted input proof in bytes")
         ("logs-console-level", bpo::value<string>()->default_value("info"), "Level of console logging")
         ("logs-file", bpo::value<bool>()->default_value(false), "Turn on/off file logging")
         ("logs-file-level", bpo::value<string>()->default_value("debug"), "Level of file logging")
         ("logs-file-name", bpo::value<string>()->default_value("cipherbook.log"), "File name for file logs")
         ;

      bpo::variables_map options;

      bpo::store( bpo::parse_command_line(argc, argv, opts), options );

      if( options.count("help") )
      {
         std::cout << opts << "\n";
         std::cout << "Commands:\n"
                   << "  submit <name> <amount>      encrypt, prove and submit a contribution\n"
                   << "  total <name>                print the current total handle of <name>\n"
                   << "  share <owner> <viewer>      share the owner's current total\n"
                   << "  publish <name>              make the current total of <name> public\n"
                   << "  decrypt <requester> <name>  decrypt the total of <name> as <requester>\n"
                   << "  granted <name>              list the totals <name> may decrypt\n"
                   << "  events <name>               print the audit events naming <name>\n";
         return 0;
      }

      if( options.count("config-file") )
      {
         const string config_file = options.at("config-file").as<string>();
         std::ifstream config_stream( config_file );
         FC_ASSERT( config_stream, "Unable to open config file ${f}", ("f", config_file) );
         bpo::store( bpo::parse_config_file<char>( config_stream, opts, true ), options );
      }
      bpo::notify( options );

      // logging
      setup_logging(options.at("logs-console-level").as<string>(),options.at("logs-file").as<bool>(),
                    options.at("logs-file-level").as<string>(), options.at("logs-file-name").as<string>());

      fc::ecc::private_key verifier_private_key = fc::ecc::private_key::regenerate(fc::sha256::hash(options.at("verifier-seed").as<string>()));
      fc::ecc::private_key system_private_key = fc::ecc::private_key::regenerate(fc::sha256::hash(options.at("system-seed").as<string>()));

      accumulator_parameters params;
      params.system_identity     = identity_type( system_private_key.get_public_key() );
      params.domain              = fc::sha256::hash( options.at("domain").as<string>() );
      params.max_ciphertext_size = options.at("max-ciphertext-size").as<uint32_t>();
      params.max_proof_size      = options.at("max-proof-size").as<uint32_t>();

      paillier_engine::options engine_options;
      engine_options.modulus_bits = options.at("modulus-bits").as<uint32_t>();
      engine_options.verifier_key = verifier_private_key.get_public_key();
      engine_options.domain       = params.domain;

      paillier_engine engine( engine_options );
      database db( engine, params );
      command_interpreter interpreter( db, engine, verifier_private_key );

      std::ifstream script_stream;
      if( options.count("script") )
      {
         const string script_file = options.at("script").as<string>();
         script_stream.open( script_file );
         FC_ASSERT( script_stream, "Unable to open script ${f}", ("f", script_file) );
      }
      std::istream& input = options.count("script") ? static_cast<std::istream&>( script_stream ) : std::cin;

      int failures = 0;
      string line;
      while( std::getline( input, line ) )
      {
         if( line.empty() || line[0] == '#' )
            continue;
         try
         {
            std::cout << fc::json::to_string( interpreter.execute( line ) ) << "\n";
         }
         catch( const fc::exception& e )
         {
            ++failures;
            std::cout << "Error: " << e.to_string() << "\n";
         }
      }

      return failures == 0 ? 0 : 2;
   }
   catch ( const fc::exception& e )
   {
      std::cout << "Exception: " << e.to_detail_string() << "\n";
      return -1;
   }
   catch ( const bpo::error& e )
   {
      std::cout << "Exception: " << e.what() << "\n";
      return -1;
   }

   return 0;
}
