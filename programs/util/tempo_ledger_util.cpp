#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/variant.hpp>

#include <tempo/protocol/operations.hpp>

#include <tempo/chain/balance_book.hpp>
#include <tempo/chain/database.hpp>
#include <tempo/chain/detail_views.hpp>

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tempo_ledger_util
{
  using namespace tempo::chain;
  namespace bpo = boost::program_options;

  /// roles given on the command line, nobody else holds any
  class role_book : public authority_interface
  {
  public:
    void add( const account_name_type& account, role_mask_type roles ) { _roles[ account ] |= roles; }

    virtual bool has_role( const account_name_type& account, role_mask_type roles )const override
    {
      auto itr = _roles.find( account );
      return itr != _roles.end() && ( itr->second & roles ) != 0;
    }

  private:
    std::map< account_name_type, role_mask_type > _roles;
  };

  template< typename T >
  void print( const T& value )
  {
    std::cout << fc::json::to_pretty_string( value ) << "\n";
  }

  std::pair< std::string, int64_t > parse_funding( const std::string& entry )
  {
    std::vector< std::string > parts;
    boost::split( parts, entry, boost::is_any_of( ":" ) );
    FC_ASSERT( parts.size() == 2 && !parts[0].empty(), "Expected account:amount, got `${e}'", ("e", entry) );
    return std::make_pair( parts[0], std::stoll( parts[1] ) );
  }

  class App
  {
  public:
    explicit App( const bpo::variables_map& options ) : options( options ) {}

    void work()
    {
      auto roles = std::make_shared< role_book >();
      if( options.count( "manager" ) )
        for( const auto& account : options[ "manager" ].as< std::vector< std::string > >() )
          roles->add( account, TEMPO_ROLE_MANAGER );
      if( options.count( "agent" ) )
        for( const auto& account : options[ "agent" ].as< std::vector< std::string > >() )
          roles->add( account, TEMPO_ROLE_AGENT );
      if( options.count( "identity" ) )
        for( const auto& account : options[ "identity" ].as< std::vector< std::string > >() )
          roles->add( account, TEMPO_ROLE_IDENTITY );

      open_args args;
      args.data_dir = fc::absolute( fc::path( options[ "data-dir" ].as< boost::filesystem::path >() ) );
      args.shared_mem_dir = args.data_dir / "shm";
      args.shared_file_size = options[ "shared-file-size" ].as< uint64_t >() * 1024 * 1024;
      args.do_validate_invariants = options.count( "validate" ) > 0;
      args.authority = roles;

      if( options.count( "genesis" ) )
      {
        const fc::path genesis_file = fc::path( options[ "genesis" ].as< boost::filesystem::path >() );
        FC_ASSERT( fc::exists( genesis_file ), "Genesis file ${f} does not exist", ("f", genesis_file) );
        args.genesis = fc::json::from_file( genesis_file ).as< tempo::protocol::genesis_state >();
      }

      database db;
      auto book = std::make_shared< balance_book >( db );
      args.asset_ledger = book;

      db.open( args );

      db.with_write_lock( [&]()
      {
        if( options.count( "fund" ) )
        {
          const auto& currency = db.get_dynamic_global_properties().currency;
          for( const auto& entry : options[ "fund" ].as< std::vector< std::string > >() )
          {
            const auto funding = parse_funding( entry );
            book->issue( currency, funding.first, funding.second );
            ilog( "Issued ${a} to ${acc}", ("a", funding.second)("acc", funding.first) );
          }
        }

        if( options.count( "set-time" ) )
          db.set_head_time( fc::time_point_sec( options[ "set-time" ].as< uint32_t >() ) );

        if( options.count( "apply" ) )
          apply_operations( db, fc::path( options[ "apply" ].as< boost::filesystem::path >() ) );
      });

      db.with_read_lock( [&]()
      {
        print_views( db );

        if( options.count( "validate" ) )
        {
          db.validate_invariants();
          std::cout << "Ledger state is consistent\n";
        }
      });

      db.close();
    }

  private:
    void apply_operations( database& db, const fc::path& file )
    {
      FC_ASSERT( fc::exists( file ), "Operations file ${f} does not exist", ("f", file) );

      auto connection = db.add_post_apply_operation_handler( [&]( const operation_notification& note )
      {
        if( note.virtual_op && options.count( "print-events" ) )
          print( note.op );
      } );

      std::vector< tempo::protocol::operation > ops;
      fc::from_variant( fc::json::from_file( file ), ops );
      for( const auto& op : ops )
      {
        db.apply_operation( op );
        ilog( "Applied ${name}", ("name", tempo::protocol::operation_name( op )) );
      }

      connection.disconnect();
    }

    void print_views( const database& db )
    {
      if( options.count( "print-ledger" ) )
        print( get_ledger_details( db ) );
      if( options.count( "print-tiers" ) )
        print( get_tiers( db ) );
      if( options.count( "print-pool" ) )
        print( get_reward_pool_details( db ) );
      if( options.count( "print-fees" ) )
        print( get_fee_details( db ) );
      if( options.count( "print-curve" ) )
        print( get_curve_details( db, options[ "print-curve" ].as< uint16_t >() ) );
      if( options.count( "print-subscription" ) )
        for( const auto& account : options[ "print-subscription" ].as< std::vector< std::string > >() )
          print( get_subscription_details( db, account ) );
      if( options.count( "print-referral-code" ) )
        print( get_referral_code_details( db, options[ "print-referral-code" ].as< uint64_t >() ) );
    }

    const bpo::variables_map& options;
  };
}

int main(int argc, char **argv)
{
  boost::program_options::options_description ledger_util_options("Tempo ledger util options");
  ledger_util_options.add_options()("data-dir,d", boost::program_options::value<boost::filesystem::path>()->value_name("directory")->required(), "Directory holding the ledger shared memory file");
  ledger_util_options.add_options()("shared-file-size", boost::program_options::value<uint64_t>()->value_name("MB")->default_value(64), "Size of the shared memory file");
  ledger_util_options.add_options()("genesis,g", boost::program_options::value<boost::filesystem::path>()->value_name("file"), "JSON genesis state, used only when the ledger does not exist yet");
  ledger_util_options.add_options()("manager", boost::program_options::value<std::vector<std::string>>()->composing(), "Account holding the manager role");
  ledger_util_options.add_options()("agent", boost::program_options::value<std::vector<std::string>>()->composing(), "Account holding the agent role");
  ledger_util_options.add_options()("identity", boost::program_options::value<std::vector<std::string>>()->composing(), "Account holding the identity layer role");
  ledger_util_options.add_options()("fund", boost::program_options::value<std::vector<std::string>>()->composing(), "Issue ledger currency, as account:amount");
  ledger_util_options.add_options()("set-time", boost::program_options::value<uint32_t>()->value_name("seconds"), "Move the ledger clock to the given unix time");
  ledger_util_options.add_options()("apply,a", boost::program_options::value<boost::filesystem::path>()->value_name("file"), "JSON array of operations to apply in order");
  ledger_util_options.add_options()("print-events", "Print virtual operations generated by applied operations");
  ledger_util_options.add_options()("print-ledger", "Print global ledger details");
  ledger_util_options.add_options()("print-tiers", "Print all tiers");
  ledger_util_options.add_options()("print-pool", "Print reward pool accounting");
  ledger_util_options.add_options()("print-fees", "Print the fee schedule");
  ledger_util_options.add_options()("print-curve", boost::program_options::value<uint16_t>()->value_name("id"), "Print a reward curve with its current multiplier");
  ledger_util_options.add_options()("print-subscription", boost::program_options::value<std::vector<std::string>>()->composing(), "Print the subscription of an account");
  ledger_util_options.add_options()("print-referral-code", boost::program_options::value<uint64_t>()->value_name("code"), "Print a referral code");
  ledger_util_options.add_options()("validate", "Check ledger invariants after every operation and at the end");
  ledger_util_options.add_options()("debug", "Show debug logs");
  ledger_util_options.add_options()("help,h", "Print usage instructions");

  try
  {
    boost::program_options::variables_map options_map;
    boost::program_options::store(boost::program_options::parse_command_line(argc, argv, ledger_util_options), options_map);

    if (options_map.count("help") || options_map.empty())
    {
      std::cout << "\n" << ledger_util_options << "\n";
      return 0;
    }

    boost::program_options::notify(options_map);

    if (!options_map.count("debug"))
    {
      fc::logging_config logging_config;
      logging_config.appenders.push_back(fc::appender_config("stderr", "console", fc::variant(fc::console_appender::config())));
      logging_config.loggers = { fc::logger_config("default") };
      logging_config.loggers.front().level = fc::log_level::warn;
      logging_config.loggers.front().appenders = {"stderr"};
      fc::configure_logging(logging_config);
    }

    tempo_ledger_util::App app(options_map);
    app.work();
  }
  catch (const fc::exception &e)
  {
    elog("FC error: ${error}", ("error", e.to_detail_string()));
    return 1;
  }
  catch (const boost::program_options::error &e)
  {
    elog("boost::program_options::error: ${error}", ("error", e.what()));
    return 1;
  }
  catch (const std::exception &e)
  {
    elog("std error: ${error}", ("error", e.what()));
    return 1;
  }

  return 0;
}
