#include <eosio.subs/eosio.subs.hpp>

#include <limits>

namespace eosiosubs {

bool is_signed_by( const checksum256& digest, const signature& sig, const public_key& key ) {
   return eosio::recover_key( digest, sig ) == key;
}

uint64_t subs_contract::validateop( const user_operation& op, const checksum256& op_digest, uint64_t missing_funds ) {
   check_initialized();
   require_dispatcher();

   check( is_signed_by( op_digest, op.signature, _config.owner_key ), "operation signature validation failed" );
   check( op.nonce <= std::numeric_limits<uint64_t>::max(), "nonce out of range" );

   // covering the prefund is the dispatcher's concern, a settlement that cannot be paid is skipped
   if ( missing_funds > 0 ) {
      acquire_lock();
      bool sent = false;
      if ( missing_funds <= static_cast<uint64_t>( asset::max_amount ) ) {
         const asset prefund( static_cast<int64_t>( missing_funds ), _config.fee_token.get_symbol() );
         sent = try_transfer( _config.fee_token.get_contract(), _config.dispatcher, prefund, "prefund" );
      }
      release_lock( sent );
   }

   return validation_success;
}

} // namespace eosiosubs
