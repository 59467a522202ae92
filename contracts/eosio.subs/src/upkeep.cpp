#include <eosio.subs/eosio.subs.hpp>

#include <eosio/system.hpp>

namespace eosiosubs {

time_point_sec next_due( const time_point_sec& due, uint32_t interval ) {
   // saturates at the last representable second, which is never due
   const uint64_t next = uint64_t( due.sec_since_epoch() ) + interval;
   return next >= time_point_sec::maximum().sec_since_epoch() ? time_point_sec::maximum() : time_point_sec( uint32_t( next ) );
}

due_batch subs_contract::checkdue() {
   const time_point_sec now( eosio::current_time_point() );

   // lowest ids first, no rotation between polls
   due_batch batch;
   for ( auto itr = _subscriptions.begin(); itr != _subscriptions.end() && batch.ids.size() < max_batch_size; ++itr ) {
      if ( itr->is_due( now ) ) {
         batch.ids.push_back( itr->id );
      }
   }
   batch.due_exists = !batch.ids.empty();
   return batch;
}

void subs_contract::executedue( const name& executor, const std::vector<uint64_t>& ids ) {
   require_auth( executor );
   check_initialized();
   check( ids.size() <= max_batch_size, "batch exceeds maximum size" );
   acquire_lock();

   const time_point_sec now( eosio::current_time_point() );
   bool calls_sent = false;

   for ( const uint64_t id : ids ) {
      // the batch comes from the caller, every id is checked again
      auto itr = _subscriptions.find( id );
      if ( itr == _subscriptions.end() || !itr->is_due( now ) ) {
         continue;
      }

      if ( try_transfer( itr->token, itr->beneficiary, itr->amount, "subscription " + std::to_string( id ) ) ) {
         _subscriptions.modify( itr, same_payer, [&]( auto& row ) {
            row.next_execute_at = next_due( row.next_execute_at, row.interval );
         });
         logexecuted_action logexecuted_act{ get_self(), { get_self(), active_permission } };
         logexecuted_act.send( id, true );
      } else {
         logfailed_action logfailed_act{ get_self(), { get_self(), active_permission } };
         logfailed_act.send( id, false );
      }
      calls_sent = true;
   }

   release_lock( calls_sent );
}

} // namespace eosiosubs
