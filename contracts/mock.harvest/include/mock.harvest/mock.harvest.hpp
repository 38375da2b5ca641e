#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

namespace rewardsystem {

   using eosio::name;
   using eosio::extended_asset;
   using eosio::extended_symbol;

   /**
    *  Stand-in for the yield source feeding a rewards engine. Reward tokens are sent to this account,
    *  `accrue` records how much of them is attributable to a producer token, and the engine pulls
    *  them out with `release` during its harvest.
    */
   class [[eosio::contract("mock.harvest")]] harvester : public eosio::contract {
      public:
         using contract::contract;

         [[eosio::action]]
         void setengine( name engine );

         [[eosio::action]]
         void accrue( const extended_symbol& producer, const extended_asset& quantity );

         [[eosio::action]]
         void release( const extended_symbol& producer, const extended_asset& quantity, name to );

      private:

         struct [[eosio::table("config")]] harvest_config
         {
            name engine;
         };

         // scope is the producer symbol code, layout read by the rewards engine
         struct [[eosio::table]] claimable
         {
            extended_asset quantity;

            uint64_t primary_key() const { return quantity.quantity.symbol.code().raw(); }
         };

         typedef eosio::singleton<"config"_n, harvest_config> config_singleton;
         typedef eosio::multi_index<"claimable"_n, claimable> claimable_table;

   };

} /// namespace rewardsystem
