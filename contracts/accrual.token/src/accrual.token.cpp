/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */

#include <accrual.token/accrual.token.hpp>
#include <rewards/rewards.hpp>

namespace rewardsystem {

   using eosio::check;
   using eosio::extended_symbol;
   using eosio::has_auth;
   using eosio::is_account;
   using eosio::require_auth;
   using eosio::require_recipient;
   using eosio::same_payer;

   void token::create( name   issuer,
                       asset  maximum_supply )
   {
      require_auth( get_self() );

      auto sym = maximum_supply.symbol;
      check( sym.is_valid(), "invalid symbol name" );
      check( maximum_supply.is_valid(), "invalid supply");
      check( maximum_supply.amount > 0, "max-supply must be positive");

      stats statstable( get_self(), sym.code().raw() );
      auto existing = statstable.find( sym.code().raw() );
      check( existing == statstable.end(), "token with symbol already exists" );

      statstable.emplace( get_self(), [&]( auto& s ) {
         s.supply.symbol = maximum_supply.symbol;
         s.max_supply    = maximum_supply;
         s.issuer        = issuer;
      });
   }


   void token::issue( name to, asset quantity, string memo )
   {
      auto sym = quantity.symbol;
      check( sym.is_valid(), "invalid symbol name" );
      check( memo.size() <= 256, "memo has more than 256 bytes" );

      stats statstable( get_self(), sym.code().raw() );
      auto existing = statstable.find( sym.code().raw() );
      check( existing != statstable.end(), "token with symbol does not exist, create token before issue" );
      const auto& st = *existing;

      require_auth( st.issuer );
      check( quantity.is_valid(), "invalid quantity" );
      check( quantity.amount > 0, "must issue positive quantity" );

      check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
      check( quantity.amount <= st.max_supply.amount - st.supply.amount, "quantity exceeds available supply");

      statstable.modify( st, same_payer, [&]( auto& s ) {
         s.supply += quantity;
      });

      add_balance( st.issuer, quantity, st.issuer );
      notify_engine( sym, st.issuer, true );

      if( to != st.issuer ) {
         transfer_action transfer_act{ get_self(), { {st.issuer, "active"_n} } };
         transfer_act.send( st.issuer, to, quantity, memo );
      }
   }

   void token::retire( asset quantity, string memo )
   {
      auto sym = quantity.symbol;
      check( sym.is_valid(), "invalid symbol name" );
      check( memo.size() <= 256, "memo has more than 256 bytes" );

      stats statstable( get_self(), sym.code().raw() );
      auto existing = statstable.find( sym.code().raw() );
      check( existing != statstable.end(), "token with symbol does not exist" );
      const auto& st = *existing;

      require_auth( st.issuer );
      check( quantity.is_valid(), "invalid quantity" );
      check( quantity.amount > 0, "must retire positive quantity" );

      check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );

      statstable.modify( st, same_payer, [&]( auto& s ) {
         s.supply -= quantity;
      });

      sub_balance( st.issuer, quantity );
      notify_engine( sym, st.issuer, true );
   }

   void token::transfer( name    from,
                         name    to,
                         asset   quantity,
                         string  memo )
   {
      check( from != to, "cannot transfer to self" );
      require_auth( from );
      check( is_account( to ), "to account does not exist");
      auto sym = quantity.symbol.code();
      stats statstable( get_self(), sym.raw() );
      const auto& st = statstable.get( sym.raw() );

      require_recipient( from );
      require_recipient( to );

      check( quantity.is_valid(), "invalid quantity" );
      check( quantity.amount > 0, "must transfer positive quantity" );
      check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
      check( memo.size() <= 256, "memo has more than 256 bytes" );

      auto payer = has_auth( to ) ? to : from;

      sub_balance( from, quantity );
      add_balance( to, quantity, payer );

      notify_engine( quantity.symbol, from, false );
      notify_engine( quantity.symbol, to, false );
   }

   void token::sub_balance( name owner, asset value ) {
      accounts from_acnts( get_self(), owner.value );

      const auto& from = from_acnts.get( value.symbol.code().raw(), "no balance object found" );
      check( from.balance.amount >= value.amount, "overdrawn balance" );

      from_acnts.modify( from, owner, [&]( auto& a ) {
            a.balance -= value;
         });
   }

   void token::add_balance( name owner, asset value, name ram_payer )
   {
      accounts to_acnts( get_self(), owner.value );
      auto to = to_acnts.find( value.symbol.code().raw() );
      if( to == to_acnts.end() ) {
         to_acnts.emplace( ram_payer, [&]( auto& a ){
           a.balance = value;
         });
      } else {
         to_acnts.modify( to, same_payer, [&]( auto& a ) {
           a.balance += value;
         });
      }
   }

   void token::setrewards( symbol_code sym, name engine )
   {
      stats statstable( get_self(), sym.raw() );
      auto existing = statstable.find( sym.raw() );
      check( existing != statstable.end(), "token with symbol does not exist, create token before setting rewards engine" );
      const auto& st = *existing;

      require_auth( st.issuer );
      check( st.supply.amount == 0, "supply must be zero to set rewards engine" );
      check( is_account( engine ), "rewards engine account does not exist" );

      engines enginetable( get_self(), sym.raw() );
      auto e_itr = enginetable.begin();

      if( e_itr != enginetable.end() ) {
         enginetable.erase( e_itr );
      }

      enginetable.emplace( get_self(), [&]( auto& e ) {
         e.engine = engine;
      });
   }

   void token::notify_engine( const symbol& sym, name holder, bool supply_changed )
   {
      engines enginetable( get_self(), sym.code().raw() );
      auto e_itr = enginetable.begin();
      if( e_itr == enginetable.end() )
         return;

      const extended_symbol producer( sym, get_self() );
      if( supply_changed ) {
         rewards::globalaccrue_action globalaccrue_act{ e_itr->engine, { {get_self(), "active"_n} } };
         globalaccrue_act.send( producer );
      }

      rewards::useraccrue_action useraccrue_act{ e_itr->engine, { {get_self(), "active"_n} } };
      useraccrue_act.send( producer, holder );
   }

} /// namespace rewardsystem

EOSIO_DISPATCH( rewardsystem::token, (create)(issue)(transfer)(retire)(setrewards) )
