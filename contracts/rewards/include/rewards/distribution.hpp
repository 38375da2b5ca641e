#pragma once

#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>
#include <eosio/multi_index.hpp>
#include <eosio/singleton.hpp>

#include <vector>

namespace rewardsystem {

   using eosio::name;
   using eosio::asset;
   using eosio::extended_asset;
   using eosio::extended_symbol;

   struct [[eosio::table("config"), eosio::contract("rewards")]] rewards_config {
      name     admin;
      name     harvester;

      // explicit serialization macro is not necessary, used here only to improve compilation time
      EOSLIB_SERIALIZE( rewards_config, (admin)(harvester) )
   };

   /**
    *  Reward tokens eligible for distribution to holders of one producer token.
    *  Removal swaps the last entry into the removed slot, so indices are only
    *  valid until the next removal.
    */
   struct [[eosio::table, eosio::contract("rewards")]] reward_registry {
      extended_symbol                producer;
      std::vector<extended_symbol>   reward_tokens;

      uint64_t primary_key()const { return producer.get_symbol().code().raw(); }

      EOSLIB_SERIALIZE( reward_registry, (producer)(reward_tokens) )
   };

   /**
    *  Harvested but unclaimed rewards. Scope is the producer symbol code.
    */
   struct [[eosio::table, eosio::contract("rewards")]] reward_silo {
      extended_asset   balance;

      uint64_t primary_key()const { return balance.quantity.symbol.code().raw(); }

      EOSLIB_SERIALIZE( reward_silo, (balance) )
   };

   struct redirect {
      extended_symbol   reward;
      name              recipient;

      EOSLIB_SERIALIZE( redirect, (reward)(recipient) )
   };

   // holder chosen recipients, scope is the producer symbol code
   struct [[eosio::table("recipients"), eosio::contract("rewards")]] personal_recipient {
      name                    owner;
      std::vector<redirect>   redirects;

      uint64_t primary_key()const { return owner.value; }

      EOSLIB_SERIALIZE( personal_recipient, (owner)(redirects) )
   };

   // admin chosen recipients for wrapper contracts, scope is the producer symbol code
   struct [[eosio::table("privileged"), eosio::contract("rewards")]] privileged_recipient {
      name                    owner;
      std::vector<redirect>   redirects;

      uint64_t primary_key()const { return owner.value; }

      EOSLIB_SERIALIZE( privileged_recipient, (owner)(redirects) )
   };

   typedef eosio::singleton< "config"_n, rewards_config >                rewards_config_singleton;
   typedef eosio::multi_index< "registry"_n, reward_registry >           reward_registry_table;
   typedef eosio::multi_index< "silos"_n, reward_silo >                  reward_silo_table;
   typedef eosio::multi_index< "recipients"_n, personal_recipient >      personal_recipient_table;
   typedef eosio::multi_index< "privileged"_n, privileged_recipient >    privileged_recipient_table;

   /**
    *  Amount the harvest collaborator can release for one (producer, reward) pair.
    *  The collaborator keeps this table in its own account, scoped to the producer
    *  symbol code and keyed by the reward symbol code.
    */
   struct claimable_reward {
      extended_asset   quantity;

      uint64_t primary_key()const { return quantity.quantity.symbol.code().raw(); }

      EOSLIB_SERIALIZE( claimable_reward, (quantity) )
   };

   typedef eosio::multi_index< "claimable"_n, claimable_reward >  claimable_table;

   // system contract record of every account that has set an abi
   struct abi_hash {
      name                 owner;
      eosio::checksum256   hash;

      uint64_t primary_key()const { return owner.value; }

      EOSLIB_SERIALIZE( abi_hash, (owner)(hash) )
   };

   typedef eosio::multi_index< "abihash"_n, abi_hash >  abi_hash_table;

   template<typename Row>
   static const redirect* find_redirect( const Row& row, const extended_symbol& reward ) {
      for( const auto& r : row.redirects ) {
         if( r.reward == reward )
            return &r;
      }
      return nullptr;
   }

} /// namespace rewardsystem
