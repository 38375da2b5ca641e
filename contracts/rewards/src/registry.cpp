#include <rewards/rewards.hpp>

namespace rewardsystem {

   using eosio::check;
   using eosio::same_payer;

   void rewards::addrwdtoken( const extended_symbol& producer, const extended_symbol& reward ) {
      require_admin();
      check_producer( producer );
      ledger_supply( producer );
      check( !is_null( reward ), "null identity: reward token" );

      const auto code = reward.get_symbol().code();
      reward_silo_table silos( get_self(), producer.get_symbol().code().raw() );
      auto silo = silos.find( code.raw() );
      check( silo == silos.end() || silo->balance.get_extended_symbol() == reward, "reward token mismatch" );

      auto itr = _registry.find( producer.get_symbol().code().raw() );
      if( itr == _registry.end() ) {
         _registry.emplace( get_self(), [&]( auto& r ) {
            r.producer = producer;
            r.reward_tokens.push_back( reward );
         });
         return;
      }

      for( const auto& t : itr->reward_tokens ) {
         check( t != reward, "reward token already registered" );
         check( t.get_symbol().code() != code, "reward token mismatch" );
      }

      _registry.modify( itr, same_payer, [&]( auto& r ) {
         r.reward_tokens.push_back( reward );
      });
   }

   void rewards::rmvrwdtoken( const extended_symbol& producer, uint64_t index ) {
      require_admin();
      check_producer( producer );

      const auto& reg = _registry.get( producer.get_symbol().code().raw(), "no reward tokens registered" );
      check( index < reg.reward_tokens.size(), "index out of range" );

      _registry.modify( reg, same_payer, [&]( auto& r ) {
         r.reward_tokens[index] = r.reward_tokens.back();
         r.reward_tokens.pop_back();
      });
   }

} /// namespace rewardsystem
