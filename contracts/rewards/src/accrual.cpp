#include <rewards/rewards.hpp>

namespace rewardsystem {

   using eosio::check;
   using eosio::has_auth;
   using eosio::print;
   using eosio::same_payer;

   void rewards::globalaccrue( const extended_symbol& producer ) {
      accrue_global( producer );
   }

   void rewards::useraccrue( const extended_symbol& producer, name holder ) {
      check( !is_null( producer ), "null identity: producer token" );
      check( holder != name(), "null identity: holder" );
      accrue_user( producer, holder );
   }

   global_state rewards::accrue_global( const extended_symbol& producer ) {
      check_producer( producer );

      const int64_t supply = ledger_supply( producer );

      const time_point_sec now( eosio::current_time_point() );
      auto itr = _global_states.find( producer.get_symbol().code().raw() );
      if( itr == _global_states.end() ) {
         // the first row claims the symbol code, unless the admin already bound it in the registry
         check( has_auth( producer.get_contract() ) || _registry.find( producer.get_symbol().code().raw() ) != _registry.end(),
                "unauthorized: producer ledger authority required" );
         itr = _global_states.emplace( get_self(), [&]( auto& g ) {
            g.producer    = producer;
            g.last_update = now;
            g.last_supply = supply;
         });
      } else {
         const uint32_t elapsed = now.sec_since_epoch() - itr->last_update.sec_since_epoch();
         _global_states.modify( itr, same_payer, [&]( auto& g ) {
            g.points     += uint128_t(g.last_supply) * elapsed;
            g.last_supply = supply;
            g.last_update = now;
         });
      }

      print( " :: global points: ", itr->points, " supply: ", itr->last_supply );
      return *itr;
   }

   user_state rewards::accrue_user( const extended_symbol& producer, name holder ) {
      check_producer( producer );
      check( get_global_state( get_self(), producer ).has_value(), "producer token not initialized" );

      const auto sym = producer.get_symbol();
      int64_t balance = 0;
      ledger_accounts accountstable( producer.get_contract(), holder.value );
      auto acnt = accountstable.find( sym.code().raw() );
      if( acnt != accountstable.end() ) {
         check( acnt->balance.symbol == sym, "symbol precision mismatch" );
         balance = acnt->balance.amount;
      }

      const time_point_sec now( eosio::current_time_point() );
      user_state_table users( get_self(), sym.code().raw() );
      auto itr = users.find( holder.value );
      if( itr == users.end() ) {
         itr = users.emplace( get_self(), [&]( auto& u ) {
            u.producer     = producer;
            u.holder       = holder;
            u.last_update  = now;
            u.last_balance = balance;
         });
      } else {
         check( itr->producer == producer, "producer token mismatch" );
         const uint32_t elapsed = now.sec_since_epoch() - itr->last_update.sec_since_epoch();
         users.modify( itr, same_payer, [&]( auto& u ) {
            u.points      += uint128_t(u.last_balance) * elapsed;
            u.last_balance = balance;
            u.last_update  = now;
         });
      }

      print( " :: ", holder, " points: ", itr->points, " balance: ", itr->last_balance );
      return *itr;
   }

} /// namespace rewardsystem
