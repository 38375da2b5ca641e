#include <rewards/rewards.hpp>

namespace rewardsystem {

   using eosio::check;
   using eosio::has_auth;
   using eosio::is_account;
   using eosio::require_auth;

   rewards::rewards( name s, name code, datastream<const char*> ds )
   :contract(s, code, ds),
    _config_singleton(get_self(), get_self().value),
    _global_states(get_self(), get_self().value),
    _registry(get_self(), get_self().value)
   {
      _config = _config_singleton.get_or_default();
   }

   rewards::~rewards() {
      if( _config.admin != name() )
         _config_singleton.set( _config, get_self() );
   }

   void rewards::init( name admin, name harvester ) {
      require_auth( get_self() );
      check( !_config_singleton.exists(), "contract already initialized" );
      check( admin != name(), "null identity: admin" );
      check( is_account( admin ), "admin account does not exist" );
      check( harvester == name() || is_account( harvester ), "harvester account does not exist" );

      _config.admin     = admin;
      _config.harvester = harvester;
   }

   void rewards::setadmin( name admin ) {
      require_admin();
      check( admin != name(), "null identity: admin" );
      check( is_account( admin ), "admin account does not exist" );
      _config.admin = admin;
   }

   void rewards::setharvester( name harvester ) {
      require_admin();
      check( harvester != name(), "null identity: harvester" );
      check( is_account( harvester ), "harvester account does not exist" );
      _config.harvester = harvester;
   }

   void rewards::require_initialized()const {
      check( _config.admin != name(), "contract not initialized" );
   }

   void rewards::require_admin()const {
      require_initialized();
      check( has_auth( _config.admin ), "unauthorized: admin authority required" );
   }

   /**
    *  State is keyed by symbol code, so a second ledger reusing the code of a known
    *  producer must not reach the rows of the first one.
    */
   void rewards::check_producer( const extended_symbol& producer ) {
      check( !is_null( producer ), "null identity: producer token" );

      const auto code = producer.get_symbol().code().raw();
      auto gitr = _global_states.find( code );
      check( gitr == _global_states.end() || gitr->producer == producer, "producer token mismatch" );
      auto ritr = _registry.find( code );
      check( ritr == _registry.end() || ritr->producer == producer, "producer token mismatch" );
   }

   int64_t rewards::ledger_supply( const extended_symbol& producer )const {
      const auto sym = producer.get_symbol();
      ledger_stats statstable( producer.get_contract(), sym.code().raw() );
      const auto& st = statstable.get( sym.code().raw(), "producer token does not exist" );
      check( st.supply.symbol == sym, "symbol precision mismatch" );
      return st.supply.amount;
   }

   bool rewards::is_contract( name account )const {
      abi_hash_table abis( system_account, system_account.value );
      return abis.find( account.value ) != abis.end();
   }

} /// namespace rewardsystem

EOSIO_DISPATCH( rewardsystem::rewards,
                // rewards.cpp
                (init)(setadmin)(setharvester)
                // accrual.cpp
                (globalaccrue)(useraccrue)
                // registry.cpp
                (addrwdtoken)(rmvrwdtoken)
                // harvest.cpp
                (rewardaccrue)(harvest)(harvestlog)
                // claim.cpp
                (claim)(claimlog)
                // recipient.cpp
                (setrcpnt)(unsetrcpnt)(setrcpntpriv)(unsetrcpntpr)
)
