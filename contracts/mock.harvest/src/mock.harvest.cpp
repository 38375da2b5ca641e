#include <mock.harvest/mock.harvest.hpp>
#include <accrual.token/accrual.token.hpp>

namespace rewardsystem
{

using eosio::check;
using eosio::require_auth;
using eosio::same_payer;

void harvester::setengine(name engine)
{
   require_auth(get_self());
   check(eosio::is_account(engine), "engine account does not exist");
   config_singleton config(get_self(), get_self().value);
   config.set(harvest_config{engine}, get_self());
}

void harvester::accrue(const extended_symbol& producer, const extended_asset& quantity)
{
   require_auth(get_self());
   check(quantity.quantity.is_valid(), "invalid quantity");
   check(quantity.quantity.amount > 0, "must accrue positive quantity");

   claimable_table c_t(get_self(), producer.get_symbol().code().raw());
   auto itr = c_t.find(quantity.quantity.symbol.code().raw());
   if (itr == c_t.end())
   {
      c_t.emplace(get_self(), [&](auto &item) {
         item.quantity = quantity;
      });
   }
   else
   {
      check(itr->quantity.get_extended_symbol() == quantity.get_extended_symbol(), "reward token mismatch");
      c_t.modify(itr, same_payer, [&](auto &item) {
         item.quantity += quantity;
      });
   }

   // everything accrued must be releasable
   const auto held = token::get_balance(quantity.contract, get_self(), quantity.quantity.symbol.code());
   check(held.amount >= c_t.get(quantity.quantity.symbol.code().raw()).quantity.quantity.amount,
         "claimable amount exceeds harvester balance");
}

void harvester::release(const extended_symbol& producer, const extended_asset& quantity, name to)
{
   config_singleton config(get_self(), get_self().value);
   check(config.exists(), "engine not set");
   require_auth(config.get().engine);

   claimable_table c_t(get_self(), producer.get_symbol().code().raw());
   const auto& item = c_t.get(quantity.quantity.symbol.code().raw(), "nothing to release");
   check(item.quantity == quantity, "release does not match claimable amount");

   c_t.modify(item, same_payer, [&](auto &c) {
      c.quantity.quantity.amount = 0;
   });

   token::transfer_action transfer_act{quantity.contract, {{get_self(), "active"_n}}};
   transfer_act.send(get_self(), to, quantity.quantity, std::string("harvest"));
}

} // namespace rewardsystem

EOSIO_DISPATCH( rewardsystem::harvester, (setengine)(accrue)(release) )
