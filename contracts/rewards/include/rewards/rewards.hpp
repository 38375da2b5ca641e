/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>

#include <rewards/accrual.hpp>
#include <rewards/distribution.hpp>

#include <optional>
#include <string>
#include <vector>

namespace rewardsystem {

   using eosio::name;
   using eosio::asset;
   using eosio::symbol;
   using eosio::extended_asset;
   using eosio::extended_symbol;
   using eosio::datastream;

   /**
    *  The `rewards` contract turns time weighted balances of producer tokens into proportional
    *  claims on harvested reward tokens.
    *
    *  Every producer token keeps a supply integral (`globalstate`) and every holder a balance
    *  integral (`userstate`), both advanced lazily by `globalaccrue` / `useraccrue`. The producer
    *  ledger calls those hooks inline whenever a supply or a balance changes. Harvested rewards are
    *  parked in `silos` until a holder claims, at which point the holder receives
    *  `silo * user points / global points` of every registered reward token.
    */
   class [[eosio::contract("rewards")]] rewards : public eosio::contract {
      private:
         rewards_config_singleton   _config_singleton;
         rewards_config             _config;
         global_state_table         _global_states;
         reward_registry_table      _registry;

      public:
         static constexpr eosio::name active_permission{"active"_n};
         static constexpr eosio::name system_account{"eosio"_n};

         rewards( name s, name code, datastream<const char*> ds );
         ~rewards();

         [[eosio::action]]
         void init( name admin, name harvester );

         [[eosio::action]]
         void setadmin( name admin );

         [[eosio::action]]
         void setharvester( name harvester );

         // functions defined in accrual.cpp

         /**
          *  Integrates the last known supply of `producer` up to now and refreshes the snapshot.
          */
         [[eosio::action]]
         void globalaccrue( const extended_symbol& producer );

         [[eosio::action]]
         void useraccrue( const extended_symbol& producer, name holder );

         // functions defined in registry.cpp

         [[eosio::action]]
         void addrwdtoken( const extended_symbol& producer, const extended_symbol& reward );

         /**
          *  Removes the reward token at `index` by moving the last entry into its slot.
          *  The former last entry changes index, so re-read the registry between removals.
          */
         [[eosio::action]]
         void rmvrwdtoken( const extended_symbol& producer, uint64_t index );

         // functions defined in harvest.cpp

         [[eosio::action]]
         void rewardaccrue( const extended_symbol& producer, const extended_symbol& reward, uint64_t amount );

         /**
          *  Pulls every claimable (producer, reward) amount out of the harvester into the silos.
          *  Each producer is accrued before its rewards land, so only points earned before the
          *  harvest compete for them.
          */
         [[eosio::action]]
         void harvest();

         [[eosio::action]]
         void harvestlog( const std::vector<extended_symbol>& producers,
                          const std::vector<extended_symbol>& reward_tokens,
                          const std::vector<int64_t>& amounts );

         // functions defined in claim.cpp

         [[eosio::action]]
         void claim( const extended_symbol& producer, name holder );

         [[eosio::action]]
         void claimlog( name holder, const extended_symbol& producer,
                        const std::vector<name>& recipients,
                        const std::vector<extended_asset>& payouts );

         // functions defined in recipient.cpp

         [[eosio::action]]
         void setrcpnt( name owner, const extended_symbol& producer, const extended_symbol& reward, name recipient );

         [[eosio::action]]
         void unsetrcpnt( name owner, const extended_symbol& producer, const extended_symbol& reward );

         /**
          *  Admin override of the recipient for tokens held by `wrapper`. The wrapper must have an abi
          *  recorded by the system contract; an account that only set an abi also passes.
          */
         [[eosio::action]]
         void setrcpntpriv( name wrapper, const extended_symbol& producer, const extended_symbol& reward, name recipient );

         [[eosio::action]]
         void unsetrcpntpr( name wrapper, const extended_symbol& producer, const extended_symbol& reward );

         static std::optional<global_state> get_global_state( name rewards_account, const extended_symbol& producer )
         {
            global_state_table states( rewards_account, rewards_account.value );
            auto itr = states.find( producer.get_symbol().code().raw() );
            if( itr == states.end() || itr->producer != producer )
               return {};
            return *itr;
         }

         static std::vector<extended_symbol> get_reward_tokens( name rewards_account, const extended_symbol& producer )
         {
            reward_registry_table registry( rewards_account, rewards_account.value );
            auto itr = registry.find( producer.get_symbol().code().raw() );
            if( itr == registry.end() || itr->producer != producer )
               return {};
            return itr->reward_tokens;
         }

         /**
          *  Account receiving `holder`'s share of `reward`: the privileged redirect keyed by the holder,
          *  else the holder's own redirect, else the holder.
          */
         static name get_recipient( name rewards_account, name holder, const extended_symbol& producer, const extended_symbol& reward )
         {
            const auto scope = producer.get_symbol().code().raw();

            privileged_recipient_table privileged( rewards_account, scope );
            auto pitr = privileged.find( holder.value );
            if( pitr != privileged.end() ) {
               const auto* r = find_redirect( *pitr, reward );
               if( r != nullptr )
                  return r->recipient;
            }

            personal_recipient_table personal( rewards_account, scope );
            auto itr = personal.find( holder.value );
            if( itr != personal.end() ) {
               const auto* r = find_redirect( *itr, reward );
               if( r != nullptr )
                  return r->recipient;
            }
            return holder;
         }

         using globalaccrue_action = eosio::action_wrapper<"globalaccrue"_n, &rewards::globalaccrue>;
         using useraccrue_action = eosio::action_wrapper<"useraccrue"_n, &rewards::useraccrue>;
         using harvestlog_action = eosio::action_wrapper<"harvestlog"_n, &rewards::harvestlog>;
         using claimlog_action = eosio::action_wrapper<"claimlog"_n, &rewards::claimlog>;

      private:
         void require_initialized()const;
         void require_admin()const;
         void check_producer( const extended_symbol& producer );
         int64_t ledger_supply( const extended_symbol& producer )const;
         bool is_contract( name account )const;

         //defined in accrual.cpp
         global_state accrue_global( const extended_symbol& producer );
         user_state accrue_user( const extended_symbol& producer, name holder );

         //defined in harvest.cpp
         void add_reward( const extended_symbol& producer, const extended_symbol& reward, uint64_t amount );

         //defined in recipient.cpp
         template<typename Table>
         void set_redirect( Table& table, name owner, const extended_symbol& reward, name recipient, name payer );
         template<typename Table>
         void unset_redirect( Table& table, name owner, const extended_symbol& reward );
   };

} /// namespace rewardsystem
