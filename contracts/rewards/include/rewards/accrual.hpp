#pragma once

#include <eosio/asset.hpp>
#include <eosio/time.hpp>
#include <eosio/multi_index.hpp>

namespace rewardsystem {

   using eosio::name;
   using eosio::asset;
   using eosio::extended_symbol;
   using eosio::time_point_sec;

   /**
    *  Supply integral of one producer token. Scoped to the rewards contract and keyed by the
    *  producer symbol code. A missing row means the producer has never been accrued.
    */
   struct [[eosio::table, eosio::contract("rewards")]] global_state {
      extended_symbol   producer;
      time_point_sec    last_update;
      int64_t           last_supply = 0;
      uint128_t         points = 0;

      uint64_t primary_key()const { return producer.get_symbol().code().raw(); }

      // explicit serialization macro is not necessary, used here only to improve compilation time
      EOSLIB_SERIALIZE( global_state, (producer)(last_update)(last_supply)(points) )
   };

   /**
    *  Balance integral of one holder. Scoped to the producer symbol code.
    */
   struct [[eosio::table, eosio::contract("rewards")]] user_state {
      extended_symbol   producer;
      name              holder;
      time_point_sec    last_update;
      int64_t           last_balance = 0;
      uint128_t         points = 0;

      uint64_t primary_key()const { return holder.value; }

      // explicit serialization macro is not necessary, used here only to improve compilation time
      EOSLIB_SERIALIZE( user_state, (producer)(holder)(last_update)(last_balance)(points) )
   };

   typedef eosio::multi_index< "globalstate"_n, global_state >  global_state_table;
   typedef eosio::multi_index< "userstate"_n, user_state >      user_state_table;

   // eosio.token compatible rows of a producer ledger, read in place
   struct currency_stats {
      asset    supply;
      asset    max_supply;
      name     issuer;

      uint64_t primary_key()const { return supply.symbol.code().raw(); }
   };

   struct account {
      asset    balance;

      uint64_t primary_key()const { return balance.symbol.code().raw(); }
   };

   typedef eosio::multi_index< "stat"_n, currency_stats >  ledger_stats;
   typedef eosio::multi_index< "accounts"_n, account >     ledger_accounts;

   inline bool is_null( const extended_symbol& token ) {
      return token.get_contract() == name() || !token.get_symbol().is_valid();
   }

   // floor( amount * part / whole ) for part <= whole, without a 256 bit intermediate
   static uint64_t muldiv( uint64_t amount, uint128_t part, uint128_t whole )
   {
      uint128_t quot = 0;
      uint128_t rem  = 0;
      for( int bit = 63; bit >= 0; --bit ) {
         quot <<= 1;
         if( rem >= whole - rem ) {
            rem -= whole - rem;
            ++quot;
         } else {
            rem += rem;
         }
         if( (amount >> bit) & 1 ) {
            if( rem >= whole - part ) {
               rem -= whole - part;
               ++quot;
            } else {
               rem += part;
            }
         }
      }
      return static_cast<uint64_t>(quot);
   }

} /// namespace rewardsystem
