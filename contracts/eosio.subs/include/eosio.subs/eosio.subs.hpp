#pragma once

#include <eosio/asset.hpp>
#include <eosio/contract.hpp>
#include <eosio/crypto.hpp>
#include <eosio/eosio.hpp>
#include <eosio/name.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace eosiosubs {
   using eosio::asset;
   using eosio::check;
   using eosio::checksum256;
   using eosio::contract;
   using eosio::datastream;
   using eosio::extended_asset;
   using eosio::extended_symbol;
   using eosio::name;
   using eosio::public_key;
   using eosio::same_payer;
   using eosio::signature;
   using eosio::symbol_code;
   using eosio::time_point_sec;

   static constexpr name     active_permission  = "active"_n;
   static constexpr uint32_t max_batch_size     = 10;
   static constexpr uint64_t validation_success = 0;

   /**
    * Operation submitted by the dispatcher for validation. Only `nonce` and `signature` are
    * consumed here; the digest over the whole record is computed by the dispatcher.
    */
   struct user_operation {
      name                sender;
      uint128_t           nonce;
      std::vector<char>   call_data;
      uint64_t            call_gas_limit;
      uint64_t            verification_gas_limit;
      uint64_t            pre_verification_gas;
      uint64_t            max_fee_per_gas;
      uint64_t            max_priority_fee_per_gas;
      std::vector<char>   paymaster_and_data;
      eosio::signature    signature;

      EOSLIB_SERIALIZE( user_operation, (sender)(nonce)(call_data)(call_gas_limit)(verification_gas_limit)
                                        (pre_verification_gas)(max_fee_per_gas)(max_priority_fee_per_gas)
                                        (paymaster_and_data)(signature) )
   };

   /**
    * ## TABLE `config`
    *
    * @param owner - account allowed to manage subscriptions directly
    * @param owner_key - key whose signature authorizes operations
    * @param dispatcher - trusted account submitting operations
    * @param fee_token - token used to settle prefunds owed to the dispatcher
    *
    * ### example
    *
    * ```json
    * {
    *   "owner": "alice",
    *   "owner_key": "PUB_K1_6MRyAjQq8ud7hVNYcfnVPJqcVpscN5So8BhtHuGYqET5BoDq63",
    *   "dispatcher": "relay",
    *   "fee_token": { "sym": "4,EOS", "contract": "eosio.token" }
    * }
    * ```
    */
   struct [[eosio::table("config"), eosio::contract("eosio.subs")]] subs_config {
      name              owner;
      public_key        owner_key;
      name              dispatcher;
      extended_symbol   fee_token;

      EOSLIB_SERIALIZE( subs_config, (owner)(owner_key)(dispatcher)(fee_token) )
   };
   using config_singleton = eosio::singleton< "config"_n, subs_config >;

   struct [[eosio::table("state"), eosio::contract("eosio.subs")]] subs_state {
      uint64_t   total_subscriptions = 0; // never decremented, also the highest assigned id
      bool       locked = false;          // set while outbound inline actions are pending

      EOSLIB_SERIALIZE( subs_state, (total_subscriptions)(locked) )
   };
   using state_singleton = eosio::singleton< "state"_n, subs_state >;

   /**
    * ## TABLE `subs`
    *
    * Rows are never erased; a cancelled subscription keeps its row with `active` false.
    *
    * @param id - sequential id starting at 1
    * @param beneficiary - account receiving each payment
    * @param token - contract of the token paid out
    * @param amount - quantity paid per execution
    * @param interval - seconds added to `next_execute_at` after each successful payment
    * @param next_execute_at - time from which the subscription is due
    * @param active - false once cancelled
    */
   struct [[eosio::table("subs"), eosio::contract("eosio.subs")]] subscription {
      uint64_t         id;
      name             beneficiary;
      name             token;
      asset            amount;
      uint32_t         interval;
      time_point_sec   next_execute_at;
      bool             active;

      uint64_t primary_key() const { return id; }
      bool is_due( const time_point_sec& now ) const { return active && now >= next_execute_at; }

      EOSLIB_SERIALIZE( subscription, (id)(beneficiary)(token)(amount)(interval)(next_execute_at)(active) )
   };
   typedef eosio::multi_index< "subs"_n, subscription > subscriptions_table;

   // tables of any token contract following the eosio.token layout
   struct token_account {
      asset    balance;

      uint64_t primary_key() const { return balance.symbol.code().raw(); }
   };
   typedef eosio::multi_index< "accounts"_n, token_account > token_accounts;

   struct token_stats {
      asset    supply;
      asset    max_supply;
      name     issuer;

      uint64_t primary_key() const { return supply.symbol.code().raw(); }
   };
   typedef eosio::multi_index< "stat"_n, token_stats > token_stats_table;

   struct due_batch {
      bool                    due_exists = false;
      std::vector<uint64_t>   ids;

      EOSLIB_SERIALIZE( due_batch, (due_exists)(ids) )
   };

   /**
    * Signature validator: true when `sig` over `digest` was produced by `key`.
    * A malformed signature aborts inside `recover_key`.
    */
   bool is_signed_by( const checksum256& digest, const signature& sig, const public_key& key );

   /**
    * The `eosio.subs` contract is an account that validates operations signed by its owner
    * and pays recurring subscriptions once they fall due.
    *
    * Anyone may poll `checkdue` and submit the returned batch to `executedue`. Each id in the
    * batch is re-checked and paid independently: a payment that cannot be covered is logged
    * with `logfailed` and the subscription stays due, so it is picked up by a later poll.
    */
   class [[eosio::contract("eosio.subs")]] subs_contract : public contract {
      public:
         subs_contract( name s, name code, datastream<const char*> ds );

         /**
          * Configure the account. Can only run once.
          *
          * @param owner - account allowed to manage subscriptions directly,
          * @param owner_key - key whose signature authorizes operations,
          * @param dispatcher - trusted account submitting operations,
          * @param fee_token - token used to settle prefunds owed to the dispatcher.
          *
          * @pre requires the contract account's authority
          * @pre `owner` and `dispatcher` are distinct existing accounts
          */
         [[eosio::action]]
         void init( const name& owner, const public_key& owner_key, const name& dispatcher, const extended_symbol& fee_token );

         /**
          * Validate an operation on behalf of the dispatcher.
          *
          * @param op - the operation,
          * @param op_digest - digest over `op` the owner signed,
          * @param missing_funds - prefund owed to the dispatcher, in base units of `fee_token`.
          *
          * @pre requires the dispatcher's authority
          * @pre `op.signature` recovers to the owner key
          * @pre `op.nonce` fits in 64 bits
          *
          * @post a coverable prefund is transferred to the dispatcher, an uncoverable one is skipped
          *
          * @return 0 on success, failures abort the action
          */
         [[eosio::action]]
         uint64_t validateop( const user_operation& op, const checksum256& op_digest, uint64_t missing_funds );

         /**
          * Send `target::method` with `payload` as this account, after transferring `value` to `target`
          * when it is non-zero.
          *
          * @pre requires the dispatcher's or the owner's authority
          */
         [[eosio::action]]
         void execute( const name& target, const extended_asset& value, const name& method, const std::vector<char>& payload );

         /**
          * Create a subscription paying `amount` of `token` to `beneficiary` every `interval` seconds,
          * first due `initial_delay` seconds from now.
          *
          * @pre requires the dispatcher's or the owner's authority
          * @pre `beneficiary` and `token` are not empty
          * @pre `amount` is positive
          * @pre `initial_delay` is positive and not greater than `interval`
          *
          * @return the new subscription id
          */
         [[eosio::action]]
         uint64_t createsub( const name& beneficiary, const name& token, const asset& amount,
                             uint32_t initial_delay, uint32_t interval );

         /**
          * Cancel an active subscription. The row is kept.
          *
          * @pre requires the dispatcher's or the owner's authority
          */
         [[eosio::action]]
         void cancelsub( uint64_t id );

         [[eosio::action, eosio::read_only]]
         subscription getsub( uint64_t id );

         /**
          * Returns up to `max_batch_size` due subscription ids, lowest ids first.
          */
         [[eosio::action, eosio::read_only]]
         due_batch checkdue();

         /**
          * Pay the subscriptions in `ids`. Ids that are unknown, cancelled or not yet due are skipped.
          *
          * @param executor - any account, pays for the transaction
          * @param ids - at most `max_batch_size` ids, usually the result of `checkdue`
          */
         [[eosio::action]]
         void executedue( const name& executor, const std::vector<uint64_t>& ids );

         /**
          * Releases the call guard once the outbound actions sent before it have completed.
          * Only sent inline by this contract.
          */
         [[eosio::action]]
         void unlock();

         [[eosio::action]]
         void logcreated( const name& token, uint64_t id, const asset& amount, uint32_t initial_delay );

         [[eosio::action]]
         void logcancelled( bool cancelled, uint64_t id );

         [[eosio::action]]
         void logexecuted( uint64_t id, bool success );

         [[eosio::action]]
         void logfailed( uint64_t id, bool success );

         using init_action = eosio::action_wrapper<"init"_n, &subs_contract::init>;
         using validateop_action = eosio::action_wrapper<"validateop"_n, &subs_contract::validateop>;
         using execute_action = eosio::action_wrapper<"execute"_n, &subs_contract::execute>;
         using createsub_action = eosio::action_wrapper<"createsub"_n, &subs_contract::createsub>;
         using cancelsub_action = eosio::action_wrapper<"cancelsub"_n, &subs_contract::cancelsub>;
         using executedue_action = eosio::action_wrapper<"executedue"_n, &subs_contract::executedue>;
         using unlock_action = eosio::action_wrapper<"unlock"_n, &subs_contract::unlock>;
         using logcreated_action = eosio::action_wrapper<"logcreated"_n, &subs_contract::logcreated>;
         using logcancelled_action = eosio::action_wrapper<"logcancelled"_n, &subs_contract::logcancelled>;
         using logexecuted_action = eosio::action_wrapper<"logexecuted"_n, &subs_contract::logexecuted>;
         using logfailed_action = eosio::action_wrapper<"logfailed"_n, &subs_contract::logfailed>;

      private:
         config_singleton      _config_singleton;
         subs_config           _config;
         state_singleton       _state_singleton;
         subs_state            _state;
         subscriptions_table   _subscriptions;

         // amounts already sent out by this action, per token contract and symbol
         std::map<std::pair<name, symbol_code>, int64_t> _committed;

         void check_initialized();
         void save_state();

         // access gate
         bool is_dispatcher() const;
         bool is_owner() const;
         void require_dispatcher() const;
         void require_dispatcher_or_owner() const;

         // call guard
         void check_unlocked() const;
         void acquire_lock();
         void release_lock( bool calls_sent );

         int64_t available_balance( const name& token, const symbol_code& sym ) const;
         std::string transfer_precheck( const name& token, const name& to, const asset& quantity ) const;
         void send_transfer( const name& token, const name& to, const asset& quantity, const std::string& memo );
         bool try_transfer( const name& token, const name& to, const asset& quantity, const std::string& memo );
   };

   std::string invalid_subscription_message( uint64_t id );

   /**
    * `due` advanced by `interval`, or `time_point_sec::maximum()` when that is not representable.
    */
   time_point_sec next_due( const time_point_sec& due, uint32_t interval );

} // namespace eosiosubs
