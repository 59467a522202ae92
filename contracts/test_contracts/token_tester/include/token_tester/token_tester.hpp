#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>

namespace system_contracts::testing::test_contracts::token_tester {

using eosio::asset;
using eosio::check;
using eosio::name;
using eosio::symbol;
using std::string;

/**
 * Token with the `eosio.token` table layout, used to fund and pay subscriptions in tests.
 *
 * When armed with `setreenter`, every transfer sent by `target` calls back into `target` before
 * returning, the way a hostile token would. A recipient named with `setblocked` makes every transfer
 * to it fail, the way a rejecting notification handler would.
 */
class [[eosio::contract("token_tester")]] token_tester : public eosio::contract {
   public:
      using contract::contract;

      [[eosio::action]]
      void create( const name& issuer, const asset& maximum_supply );

      [[eosio::action]]
      void issue( const name& to, const asset& quantity, const string& memo );

      [[eosio::action]]
      void transfer( const name& from, const name& to, const asset& quantity, const string& memo );

      /**
       * Arm the callback into `target`, or disarm it when `action` is empty.
       *
       * @param target - account whose outgoing transfers trigger the callback,
       * @param action - `executedue`, `createsub` or `cancelsub`,
       * @param authorizer - account whose `active` permission signs the callback.
       */
      [[eosio::action]]
      void setreenter( const name& target, const name& action, const name& authorizer );

      /**
       * Reject every transfer to `account`, or none when it is empty.
       */
      [[eosio::action]]
      void setblocked( const name& account );

   private:
      struct [[eosio::table]] account {
         asset    balance;

         uint64_t primary_key() const { return balance.symbol.code().raw(); }
      };

      struct [[eosio::table]] currency_stats {
         asset    supply;
         asset    max_supply;
         name     issuer;

         uint64_t primary_key() const { return supply.symbol.code().raw(); }
      };

      struct [[eosio::table]] reentry {
         name     target;
         name     action;
         name     authorizer;
      };

      struct [[eosio::table]] blocked {
         name     account;
      };

      typedef eosio::multi_index< "accounts"_n, account > accounts;
      typedef eosio::multi_index< "stat"_n, currency_stats > stats;
      typedef eosio::singleton< "reentry"_n, reentry > reentry_singleton;
      typedef eosio::singleton< "blocked"_n, blocked > blocked_singleton;

      void sub_balance( const name& owner, const asset& value );
      void add_balance( const name& owner, const asset& value, const name& ram_payer );
      void reenter( const reentry& hook, const name& to, const asset& quantity );
};

} // namespace system_contracts::testing::test_contracts::token_tester
