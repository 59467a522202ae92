#include <eosio.subs/eosio.subs.hpp>

#include <eosio/action.hpp>

namespace eosiosubs {

subs_contract::subs_contract( name s, name code, datastream<const char*> ds )
:contract(s,code,ds),
_config_singleton(get_self(), get_self().value),
_state_singleton(get_self(), get_self().value),
_subscriptions(get_self(), get_self().value)
{
   _config = _config_singleton.exists() ? _config_singleton.get() : subs_config{};
   _state  = _state_singleton.get_or_default();
}

void subs_contract::init( const name& owner, const public_key& owner_key, const name& dispatcher, const extended_symbol& fee_token ) {
   require_auth( get_self() );
   check( !_config_singleton.exists(), "contract already initialized" );
   check( is_account( owner ), "owner account does not exist" );
   check( is_account( dispatcher ), "dispatcher account does not exist" );
   check( owner != dispatcher, "owner and dispatcher must differ" );
   check( fee_token.get_contract() != name(), "fee token contract is empty" );

   _config.owner      = owner;
   _config.owner_key  = owner_key;
   _config.dispatcher = dispatcher;
   _config.fee_token  = fee_token;
   _config_singleton.set( _config, get_self() );

   _state = subs_state{};
   save_state();
}

void subs_contract::check_initialized() {
   check( _config_singleton.exists(), "contract is not initialized" );
}

void subs_contract::save_state() {
   _state_singleton.set( _state, get_self() );
}

bool subs_contract::is_dispatcher() const {
   return has_auth( _config.dispatcher );
}

bool subs_contract::is_owner() const {
   return has_auth( _config.owner );
}

void subs_contract::require_dispatcher() const {
   check( is_dispatcher(), "caller is not the dispatcher" );
}

void subs_contract::require_dispatcher_or_owner() const {
   check( is_dispatcher() || is_owner(), "caller is neither the dispatcher nor the owner" );
}

void subs_contract::check_unlocked() const {
   check( !_state.locked, "reentrant call rejected" );
}

void subs_contract::acquire_lock() {
   check_unlocked();
   _state.locked = true;
   save_state();
}

void subs_contract::release_lock( bool calls_sent ) {
   if ( calls_sent ) {
      // inline actions run in the order sent, so this one runs after every outbound call
      unlock_action unlock_act{ get_self(), { get_self(), active_permission } };
      unlock_act.send();
   } else {
      _state.locked = false;
      save_state();
   }
}

void subs_contract::unlock() {
   require_auth( get_self() );
   _state.locked = false;
   save_state();
}

int64_t subs_contract::available_balance( const name& token, const symbol_code& sym ) const {
   token_accounts accounts( token, get_self().value );
   auto itr = accounts.find( sym.raw() );
   int64_t balance = itr == accounts.end() ? 0 : itr->balance.amount;

   auto committed = _committed.find( { token, sym } );
   if ( committed != _committed.end() ) {
      balance -= committed->second;
   }
   return balance;
}

std::string subs_contract::transfer_precheck( const name& token, const name& to, const asset& quantity ) const {
   if ( !quantity.is_valid() || quantity.amount <= 0 )
      return "invalid quantity";
   if ( to == get_self() )
      return "cannot transfer to self";
   if ( !is_account( to ) )
      return "to account does not exist";

   const auto sym = quantity.symbol.code();
   token_stats_table stats( token, sym.raw() );
   auto st = stats.find( sym.raw() );
   if ( st == stats.end() )
      return "unknown token " + sym.to_string() + "@" + token.to_string();
   if ( st->supply.symbol != quantity.symbol )
      return "symbol precision mismatch";
   if ( available_balance( token, sym ) < quantity.amount )
      return "overdrawn balance";

   return {};
}

void subs_contract::send_transfer( const name& token, const name& to, const asset& quantity, const std::string& memo ) {
   _committed[{ token, quantity.symbol.code() }] += quantity.amount;

   eosio::action( eosio::permission_level{ get_self(), active_permission }, token, "transfer"_n,
                  std::make_tuple( get_self(), to, quantity, memo ) ).send();
}

bool subs_contract::try_transfer( const name& token, const name& to, const asset& quantity, const std::string& memo ) {
   const std::string reason = transfer_precheck( token, to, quantity );
   if ( !reason.empty() ) {
      return false;
   }
   send_transfer( token, to, quantity, memo );
   return true;
}

void subs_contract::execute( const name& target, const extended_asset& value, const name& method, const std::vector<char>& payload ) {
   check_initialized();
   require_dispatcher_or_owner();
   acquire_lock();

   if ( value.quantity.amount != 0 ) {
      const std::string reason = transfer_precheck( value.contract, target, value.quantity );
      check( reason.empty(), "transfer failed: " + reason );
      send_transfer( value.contract, target, value.quantity, "execute" );
   }

   // a failure inside the target aborts the transaction with the target's own message
   eosio::action act;
   act.account       = target;
   act.name          = method;
   act.authorization = { { get_self(), active_permission } };
   act.data          = payload;
   act.send();

   release_lock( true );
}

void subs_contract::logcreated( const name& token, uint64_t id, const asset& amount, uint32_t initial_delay ) {
   require_auth( get_self() );
}

void subs_contract::logcancelled( bool cancelled, uint64_t id ) {
   require_auth( get_self() );
}

void subs_contract::logexecuted( uint64_t id, bool success ) {
   require_auth( get_self() );
}

void subs_contract::logfailed( uint64_t id, bool success ) {
   require_auth( get_self() );
}

std::string invalid_subscription_message( uint64_t id ) {
   return "invalid subscription id: " + std::to_string( id );
}

} // namespace eosiosubs
