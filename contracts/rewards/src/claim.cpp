#include <rewards/rewards.hpp>

namespace rewardsystem {

   using eosio::check;
   using eosio::permission_level;
   using eosio::print;
   using eosio::require_auth;
   using eosio::same_payer;

   void rewards::claim( const extended_symbol& producer, name holder ) {
      check( !is_null( producer ), "null identity: producer token" );
      check( holder != name(), "null identity: holder" );

      const auto user   = accrue_user( producer, holder );
      const auto global = accrue_global( producer );

      const uint128_t user_points   = user.points;
      const uint128_t global_points = global.points;
      if( global_points == 0 )
         return;
      check( user_points <= global_points, "user points exceed global points" );

      const auto scope = producer.get_symbol().code().raw();
      std::vector<name>           recipients;
      std::vector<extended_asset> payouts;

      reward_silo_table silos( get_self(), scope );
      for( const auto& reward : get_reward_tokens( get_self(), producer ) ) {
         auto silo = silos.find( reward.get_symbol().code().raw() );
         if( silo == silos.end() || silo->balance.quantity.amount == 0 )
            continue;
         check( silo->balance.get_extended_symbol() == reward, "reward token mismatch" );

         const int64_t amount = muldiv( silo->balance.quantity.amount, user_points, global_points );
         if( amount == 0 )
            continue;

         silos.modify( silo, same_payer, [&]( auto& s ) {
            s.balance.quantity.amount -= amount;
         });
         recipients.push_back( get_recipient( get_self(), holder, producer, reward ) );
         payouts.emplace_back( amount, reward );
      }

      user_state_table users( get_self(), scope );
      users.modify( users.get( holder.value ), same_payer, [&]( auto& u ) {
         u.points = 0;
      });
      _global_states.modify( _global_states.get( scope ), same_payer, [&]( auto& g ) {
         g.points -= user_points;
      });

      print( " :: claimed points: ", user_points, " of ", global_points );

      // every silo debit and point reset above is final before the first transfer is queued
      for( size_t i = 0; i < payouts.size(); ++i ) {
         eosio::action( permission_level{ get_self(), active_permission },
                        payouts[i].contract, "transfer"_n,
                        std::make_tuple( get_self(), recipients[i], payouts[i].quantity, std::string("reward claim") )
         ).send();
      }

      claimlog_action claimlog_act{ get_self(), { {get_self(), active_permission} } };
      claimlog_act.send( holder, producer, recipients, payouts );
   }

   void rewards::claimlog( name holder, const extended_symbol& producer,
                           const std::vector<name>& recipients,
                           const std::vector<extended_asset>& payouts ) {
      require_auth( get_self() );
   }

} /// namespace rewardsystem
