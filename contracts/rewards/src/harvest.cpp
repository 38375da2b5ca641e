#include <rewards/rewards.hpp>

namespace rewardsystem {

   using eosio::check;
   using eosio::has_auth;
   using eosio::permission_level;
   using eosio::require_auth;
   using eosio::same_payer;

   void rewards::rewardaccrue( const extended_symbol& producer, const extended_symbol& reward, uint64_t amount ) {
      require_initialized();
      check( _config.harvester != name() && has_auth( _config.harvester ), "unauthorized: harvester authority required" );
      add_reward( producer, reward, amount );
   }

   void rewards::harvest() {
      require_initialized();
      check( _config.harvester != name(), "harvester not configured" );

      std::vector<extended_symbol> producers;
      std::vector<extended_symbol> reward_tokens;
      std::vector<int64_t>         amounts;

      for( const auto& reg : _registry ) {
         if( reg.reward_tokens.empty() )
            continue;

         // rewards must not reach points accrued after they were harvested
         accrue_global( reg.producer );

         claimable_table claimable( _config.harvester, reg.producer.get_symbol().code().raw() );
         for( const auto& reward : reg.reward_tokens ) {
            auto itr = claimable.find( reward.get_symbol().code().raw() );
            if( itr == claimable.end() || itr->quantity.quantity.amount == 0 )
               continue;
            check( itr->quantity.get_extended_symbol() == reward, "reward token mismatch" );

            const int64_t amount = itr->quantity.quantity.amount;
            add_reward( reg.producer, reward, amount );

            producers.push_back( reg.producer );
            reward_tokens.push_back( reward );
            amounts.push_back( amount );
         }
      }

      for( size_t i = 0; i < producers.size(); ++i ) {
         eosio::action( permission_level{ get_self(), active_permission },
                        _config.harvester, "release"_n,
                        std::make_tuple( producers[i], extended_asset( amounts[i], reward_tokens[i] ), get_self() )
         ).send();
      }

      harvestlog_action harvestlog_act{ get_self(), { {get_self(), active_permission} } };
      harvestlog_act.send( producers, reward_tokens, amounts );
   }

   void rewards::harvestlog( const std::vector<extended_symbol>& producers,
                             const std::vector<extended_symbol>& reward_tokens,
                             const std::vector<int64_t>& amounts ) {
      require_auth( get_self() );
   }

   void rewards::add_reward( const extended_symbol& producer, const extended_symbol& reward, uint64_t amount ) {
      check_producer( producer );
      check( !is_null( reward ), "null identity: reward token" );
      check( amount != 0, "zero amount" );
      check( amount <= uint64_t(asset::max_amount), "amount exceeds maximum asset amount" );

      reward_silo_table silos( get_self(), producer.get_symbol().code().raw() );
      auto itr = silos.find( reward.get_symbol().code().raw() );
      if( itr == silos.end() ) {
         silos.emplace( get_self(), [&]( auto& s ) {
            s.balance = extended_asset( int64_t(amount), reward );
         });
         return;
      }

      check( itr->balance.get_extended_symbol() == reward, "reward token mismatch" );
      check( itr->balance.quantity.amount <= asset::max_amount - int64_t(amount), "amount exceeds maximum asset amount" );
      silos.modify( itr, same_payer, [&]( auto& s ) {
         s.balance.quantity.amount += int64_t(amount);
      });
   }

} /// namespace rewardsystem
