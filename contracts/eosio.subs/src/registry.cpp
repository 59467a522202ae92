#include <eosio.subs/eosio.subs.hpp>

#include <eosio/system.hpp>

namespace eosiosubs {

uint64_t subs_contract::createsub( const name& beneficiary, const name& token, const asset& amount,
                                   uint32_t initial_delay, uint32_t interval ) {
   check_initialized();
   require_dispatcher_or_owner();
   check_unlocked();

   check( beneficiary != name(), "beneficiary is empty" );
   check( token != name(), "token contract is empty" );
   check( amount.is_valid() && amount.amount > 0, "amount must be positive" );
   check( initial_delay > 0, "initial delay must be positive" );
   check( interval >= initial_delay, "interval is shorter than initial delay" );

   const time_point_sec now( eosio::current_time_point() );
   check( initial_delay <= time_point_sec::maximum().sec_since_epoch() - now.sec_since_epoch(),
          "initial delay out of range" );

   const uint64_t id = ++_state.total_subscriptions;
   save_state();

   _subscriptions.emplace( get_self(), [&]( auto& row ) {
      row.id              = id;
      row.beneficiary     = beneficiary;
      row.token           = token;
      row.amount          = amount;
      row.interval        = interval;
      row.next_execute_at = now + initial_delay;
      row.active          = true;
   });

   logcreated_action logcreated_act{ get_self(), { get_self(), active_permission } };
   logcreated_act.send( token, id, amount, initial_delay );

   return id;
}

void subs_contract::cancelsub( uint64_t id ) {
   check_initialized();
   require_dispatcher_or_owner();
   check_unlocked();

   auto itr = _subscriptions.find( id );
   check( id != 0 && id <= _state.total_subscriptions && itr != _subscriptions.end() && itr->active,
          invalid_subscription_message( id ) );

   _subscriptions.modify( itr, same_payer, [&]( auto& row ) {
      row.active = false;
   });

   logcancelled_action logcancelled_act{ get_self(), { get_self(), active_permission } };
   logcancelled_act.send( true, id );
}

subscription subs_contract::getsub( uint64_t id ) {
   auto itr = _subscriptions.find( id );
   check( itr != _subscriptions.end(), invalid_subscription_message( id ) );
   return *itr;
}

} // namespace eosiosubs
