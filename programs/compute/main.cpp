#include <marlowe/semantics/applicable_actions.hpp>
#include <marlowe/semantics/arithmetic.hpp>
#include <marlowe/semantics/compute_transaction.hpp>
#include <marlowe/semantics/config.hpp>
#include <marlowe/semantics/continuation_resolver.hpp>
#include <marlowe/semantics/exceptions.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/time.hpp>

#include <boost/program_options.hpp>

#include <iostream>

using namespace marlowe::semantics;

struct compute_config
{
   compute_config()
   :max_reduction_steps(MARLOWE_DEFAULT_MAX_REDUCTION_STEPS),pretty_print(true){}

   fc::logging_config logging;
   uint64_t           max_reduction_steps;
   bool               pretty_print;
};
FC_REFLECT( compute_config, (logging)(max_reduction_steps)(pretty_print) )

boost::program_options::variables_map parse_option_variables(int argc, char** argv)
{
   boost::program_options::options_description option_config("Usage");
   option_config.add_options()
      ("help", "Display this help message and exit")
      ("version", "Print version information and exit")

      ("config", boost::program_options::value<string>(), "Load settings from this JSON file, creating it with defaults if missing")

      ("contract", boost::program_options::value<string>(), "JSON file holding the current contract")
      ("state", boost::program_options::value<string>(), "JSON file holding the current state (default: empty state)")
      ("continuations", boost::program_options::value<string>(), "JSON file mapping merkleized continuation hashes to contracts")

      ("transaction", boost::program_options::value<string>(), "Compute the JSON transaction in this file")
      ("trace", boost::program_options::value<string>(), "Play the JSON array of transactions in this file from an empty state")
      ("min-time", boost::program_options::value<int64_t>(), "Initial min time for --trace (default: start of the first transaction)")

      ("applicable", "List the actions that apply in the interval given by --from and --to")
      ("from", boost::program_options::value<int64_t>(), "Interval start in milliseconds since the epoch (default: now)")
      ("to", boost::program_options::value<int64_t>(), "Interval end in milliseconds since the epoch (default: before the next timeout)")
      ("apply-action", boost::program_options::value<uint32_t>(), "With --applicable, take the action with this index")
      ("chosen-num", boost::program_options::value<string>(), "Number to choose when the taken action is a choice")
      ;

   boost::program_options::variables_map option_variables;
   try
   {
      boost::program_options::store(boost::program_options::command_line_parser(argc, argv).
                                    options(option_config).run(), option_variables);
      boost::program_options::notify(option_variables);
   }
   catch (boost::program_options::error& cmdline_error)
   {
      std::cerr << "Error: " << cmdline_error.what() << "\n";
      std::cerr << option_config << "\n";
      exit(1);
   }

   if (option_variables.count("help"))
   {
      std::cout << option_config << "\n";
      exit(0);
   }
   else if (option_variables.count("version"))
   {
      std::cout << "marlowe_compute semantics version " << MARLOWE_SEMANTICS_VERSION << "\n";
      exit(0);
   }

   return option_variables;
}

fc::logging_config create_default_logging_config()
{
   fc::logging_config cfg;

   fc::variants  c  {
      fc::mutable_variant_object( "level","debug")("color", "green"),
            fc::mutable_variant_object( "level","warn")("color", "brown"),
            fc::mutable_variant_object( "level","error")("color", "red") };

   cfg.appenders.push_back(
            fc::appender_config( "stderr", "console",
                                 fc::mutable_variant_object()
                                 ( "stream","std_error")
                                 ( "level_colors", c )
                                 ) );

   fc::logger_config dlc;
   dlc.name = "default";
   dlc.level = fc::log_level::warn;
   dlc.appenders.push_back( "stderr" );
   cfg.loggers.push_back( dlc );

   return cfg;
}

compute_config load_config( const fc::optional<fc::path>& config_file )
{ try {
   compute_config cfg;
   cfg.logging = create_default_logging_config();
   if( !config_file.valid() )
      return cfg;

   if( fc::exists( *config_file ) )
   {
      cfg = fc::json::from_file( *config_file ).as<compute_config>();
   }
   else
   {
      std::cerr << "Creating default config file at: " << config_file->preferred_string() << "\n";
      fc::json::save_to_file( cfg, *config_file );
   }
   return cfg;
} FC_CAPTURE_AND_RETHROW( (config_file) ) }

template<typename T>
T load_json( const boost::program_options::variables_map& option_variables, const char* option )
{ try {
   const fc::path file( option_variables[option].as<string>() );
   FC_ASSERT( fc::exists( file ), "${f} does not exist", ("f",file) );
   return fc::json::from_file( file ).as<T>();
} FC_CAPTURE_AND_RETHROW( (option) ) }

void print( const fc::variant& result, const compute_config& cfg )
{
   if( cfg.pretty_print )
      std::cout << fc::json::to_pretty_string( result ) << "\n";
   else
      std::cout << fc::json::to_string( result ) << "\n";
}

timeout_type now_ms()
{
   return fc::time_point::now().time_since_epoch().count() / 1000;
}

int run( const boost::program_options::variables_map& option_variables, const compute_config& cfg )
{
   if( !option_variables.count("contract") )
   {
      std::cerr << "Error: --contract is required\n";
      return 1;
   }
   const contract_ptr current = load_json<contract_ptr>( option_variables, "contract" );

   fc::optional<state> current_state;
   if( option_variables.count("state") )
      current_state = load_json<state>( option_variables, "state" );

   if( option_variables.count("trace") )
   {
      if( current_state.valid() )
      {
         std::cerr << "Error: --trace starts from the empty state and cannot be combined with --state\n";
         return 1;
      }
      const auto transactions = load_json< vector<transaction_input> >( option_variables, "trace" );
      timeout_type min_time = 0;
      if( option_variables.count("min-time") )
         min_time = option_variables["min-time"].as<int64_t>();
      else if( !transactions.empty() )
         min_time = transactions.front().interval.from;

      print( fc::variant( play_trace( min_time, current, transactions, cfg.max_reduction_steps ) ), cfg );
      return 0;
   }

   if( option_variables.count("transaction") )
   {
      const auto tx = load_json<transaction_input>( option_variables, "transaction" );
      const state s = current_state.valid() ? *current_state : empty_state( tx.interval.from );
      print( fc::variant( compute_transaction( tx, s, current, cfg.max_reduction_steps ) ), cfg );
      return 0;
   }

   if( option_variables.count("applicable") )
   {
      const timeout_type from = option_variables.count("from") ? option_variables["from"].as<int64_t>() : now_ms();
      time_interval interval = default_interval( current, from );
      if( option_variables.count("to") )
         interval.to = option_variables["to"].as<int64_t>();

      const state s = current_state.valid() ? *current_state : empty_state( interval.from );
      const auto fixed = fix_interval( interval, s );

      auto store = std::make_shared<contract_source_store>();
      if( option_variables.count("continuations") )
         store->load_from_file( fc::path( option_variables["continuations"].as<string>() ) );

      const vector<applicable_action> actions = get_applicable_actions( fixed.first, fixed.second, current, store,
                                                                          cfg.max_reduction_steps );
      if( !option_variables.count("apply-action") )
      {
         fc::variants listed;
         for( const auto& a : actions )
            listed.push_back( fc::variant( a ) );
         print( fc::variant( listed ), cfg );
         return 0;
      }

      const uint32_t index = option_variables["apply-action"].as<uint32_t>();
      if( index >= actions.size() )
      {
         std::cerr << "Error: there are only " << actions.size() << " applicable actions\n";
         return 1;
      }

      fc::optional<integer_type> chosen;
      if( option_variables.count("chosen-num") )
         chosen = parse_integer( option_variables["chosen-num"].as<string>() );
      print( fc::variant( actions[index].apply( chosen ) ), cfg );
      return 0;
   }

   std::cerr << "Error: one of --transaction, --trace or --applicable is required\n";
   return 1;
}

int main( int argc, char** argv )
{
   try
   {
      const boost::program_options::variables_map option_variables = parse_option_variables( argc, argv );

      fc::optional<fc::path> config_file;
      if( option_variables.count("config") )
         config_file = fc::path( option_variables["config"].as<string>() );

      const compute_config cfg = load_config( config_file );
      fc::configure_logging( cfg.logging );

      return run( option_variables, cfg );
   }
   catch ( const transaction_error& e )
   {
      std::cerr << "Transaction rejected: " << e.to_detail_string() << "\n";
      return 2;
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      std::cerr << e.to_detail_string() << "\n";
      return 1;
   }
}
