#include <rewards/rewards.hpp>

#include <algorithm>

namespace rewardsystem {

   using eosio::check;
   using eosio::is_account;
   using eosio::require_auth;
   using eosio::same_payer;

   void rewards::setrcpnt( name owner, const extended_symbol& producer, const extended_symbol& reward, name recipient ) {
      check( owner != name(), "null identity: owner" );
      require_auth( owner );
      check_producer( producer );
      check( !is_null( reward ), "null identity: reward token" );
      check( recipient != name(), "null identity: recipient" );
      check( recipient != get_self(), "recipient cannot be the rewards contract" );
      check( is_account( recipient ), "recipient account does not exist" );

      personal_recipient_table personal( get_self(), producer.get_symbol().code().raw() );
      set_redirect( personal, owner, reward, recipient, owner );
   }

   void rewards::unsetrcpnt( name owner, const extended_symbol& producer, const extended_symbol& reward ) {
      check( owner != name(), "null identity: owner" );
      require_auth( owner );
      check_producer( producer );
      check( !is_null( reward ), "null identity: reward token" );

      personal_recipient_table personal( get_self(), producer.get_symbol().code().raw() );
      unset_redirect( personal, owner, reward );
   }

   void rewards::setrcpntpriv( name wrapper, const extended_symbol& producer, const extended_symbol& reward, name recipient ) {
      require_admin();
      check( wrapper != name(), "null identity: wrapper" );
      check_producer( producer );
      check( !is_null( reward ), "null identity: reward token" );
      check( recipient != name(), "null identity: recipient" );
      check( recipient != get_self(), "recipient cannot be the rewards contract" );
      check( is_account( recipient ), "recipient account does not exist" );
      check( is_contract( wrapper ), "not a contract: wrapper has no deployed code" );

      privileged_recipient_table privileged( get_self(), producer.get_symbol().code().raw() );
      set_redirect( privileged, wrapper, reward, recipient, get_self() );
   }

   void rewards::unsetrcpntpr( name wrapper, const extended_symbol& producer, const extended_symbol& reward ) {
      require_admin();
      check( wrapper != name(), "null identity: wrapper" );
      check_producer( producer );
      check( !is_null( reward ), "null identity: reward token" );
      check( is_contract( wrapper ), "not a contract: wrapper has no deployed code" );

      privileged_recipient_table privileged( get_self(), producer.get_symbol().code().raw() );
      unset_redirect( privileged, wrapper, reward );
   }

   template<typename Table>
   void rewards::set_redirect( Table& table, name owner, const extended_symbol& reward, name recipient, name payer ) {
      auto itr = table.find( owner.value );
      if( itr == table.end() ) {
         table.emplace( payer, [&]( auto& row ) {
            row.owner = owner;
            row.redirects.push_back( redirect{ reward, recipient } );
         });
         return;
      }

      table.modify( itr, same_payer, [&]( auto& row ) {
         for( auto& r : row.redirects ) {
            if( r.reward == reward ) {
               r.recipient = recipient;
               return;
            }
         }
         row.redirects.push_back( redirect{ reward, recipient } );
      });
   }

   template<typename Table>
   void rewards::unset_redirect( Table& table, name owner, const extended_symbol& reward ) {
      auto itr = table.find( owner.value );
      check( itr != table.end() && find_redirect( *itr, reward ) != nullptr, "reward recipient not set" );

      if( itr->redirects.size() == 1 ) {
         table.erase( itr );
         return;
      }

      table.modify( itr, same_payer, [&]( auto& row ) {
         row.redirects.erase( std::remove_if( row.redirects.begin(), row.redirects.end(),
                                              [&]( const redirect& r ) { return r.reward == reward; } ),
                              row.redirects.end() );
      });
   }

} /// namespace rewardsystem
