/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

namespace rewardsystem {

   using std::string;
   using eosio::name;
   using eosio::asset;
   using eosio::symbol;
   using eosio::symbol_code;

   /**
    *  eosio.token compatible ledger that reports supply and balance changes to a rewards engine.
    *
    *  Once the issuer binds a symbol with `setrewards`, every `issue` and `retire` sends the engine
    *  `globalaccrue` and `useraccrue` for the issuer, and every `transfer` sends `useraccrue` for
    *  both sides. The hooks run inline after the balances are updated, within the same transaction.
    */
   class [[eosio::contract("accrual.token")]] token : public eosio::contract {
      public:

         using contract::contract;

         [[eosio::action]]
         void create( name   issuer,
                      asset  maximum_supply );

         [[eosio::action]]
         void issue( name to, asset quantity, string memo );

         [[eosio::action]]
         void retire( asset quantity, string memo );

         [[eosio::action]]
         void transfer( name    from,
                        name    to,
                        asset   quantity,
                        string  memo );

         /**
          *  Binds `sym` to `engine`. Only allowed while the supply is zero, so the engine observes
          *  every balance from the first issue on. A binding cannot be removed.
          */
         [[eosio::action]]
         void setrewards( symbol_code sym, name engine );

         static asset get_balance( name token_contract_account, name owner, symbol_code sym_code )
         {
            accounts accountstable( token_contract_account, owner.value );
            const auto& ac = accountstable.get( sym_code.raw() );
            return ac.balance;
         }

         using transfer_action = eosio::action_wrapper<"transfer"_n, &token::transfer>;

      private:
         struct [[eosio::table]] account {
            asset    balance;

            uint64_t primary_key()const { return balance.symbol.code().raw(); }
         };

         struct [[eosio::table]] currency_stats {
            asset    supply;
            asset    max_supply;
            name     issuer;

            uint64_t primary_key()const { return supply.symbol.code().raw(); }
         };

         // rewards engine notified of changes to one symbol, scope is the symbol code
         struct [[eosio::table]] engine_binding {
            name     engine;

            uint64_t primary_key()const { return engine.value; }
         };

         typedef eosio::multi_index< "accounts"_n, account > accounts;
         typedef eosio::multi_index< "stat"_n, currency_stats > stats;
         typedef eosio::multi_index< "engines"_n, engine_binding > engines;

         void sub_balance( name owner, asset value );
         void add_balance( name owner, asset value, name ram_payer );
         void notify_engine( const symbol& sym, name holder, bool supply_changed );
   };

} /// namespace rewardsystem
