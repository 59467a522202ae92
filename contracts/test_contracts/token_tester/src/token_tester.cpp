#include <token_tester/token_tester.hpp>

#include <eosio/action.hpp>

#include <tuple>
#include <vector>

namespace system_contracts::testing::test_contracts::token_tester {

void token_tester::create( const name& issuer, const asset& maximum_supply )
{
    require_auth( get_self() );

    auto sym = maximum_supply.symbol;
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

void token_tester::issue( const name& to, const asset& quantity, const string& memo )
{
    auto sym = quantity.symbol;
    check( sym.is_valid(), "invalid symbol name" );

    stats statstable( get_self(), sym.code().raw() );
    const auto& st = statstable.get( sym.code().raw(), "token with symbol does not exist, create token before issue" );
    check( to == st.issuer, "tokens can only be issued to issuer account" );

    require_auth( st.issuer );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must issue positive quantity" );
    check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
    check( quantity.amount <= st.max_supply.amount - st.supply.amount, "quantity exceeds available supply");

    statstable.modify( st, eosio::same_payer, [&]( auto& s ) {
       s.supply += quantity;
    });

    add_balance( st.issuer, quantity, st.issuer );
}

void token_tester::transfer( const name& from, const name& to, const asset& quantity, const string& memo )
{
    check( from != to, "cannot transfer to self" );
    require_auth( from );
    check( is_account( to ), "to account does not exist");

    blocked_singleton blocked_state( get_self(), get_self().value );
    check( to != blocked_state.get_or_default().account, "recipient rejects transfers" );

    auto sym = quantity.symbol.code();
    stats statstable( get_self(), sym.raw() );
    const auto& st = statstable.get( sym.raw() );

    require_recipient( from );
    require_recipient( to );

    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must transfer positive quantity" );
    check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );

    auto payer = has_auth( to ) ? to : from;

    sub_balance( from, quantity );
    add_balance( to, quantity, payer );

    reentry_singleton reentry_state( get_self(), get_self().value );
    const auto hook = reentry_state.get_or_default();
    if ( hook.action != name() && from == hook.target ) {
       reenter( hook, to, quantity );
    }
}

void token_tester::reenter( const reentry& hook, const name& to, const asset& quantity )
{
    const eosio::permission_level auth{ hook.authorizer, "active"_n };

    if ( hook.action == "executedue"_n ) {
       eosio::action( auth, hook.target, hook.action,
                      std::make_tuple( hook.authorizer, std::vector<uint64_t>{} ) ).send();
    } else if ( hook.action == "createsub"_n ) {
       eosio::action( auth, hook.target, hook.action,
                      std::make_tuple( to, get_self(), quantity, uint32_t(1), uint32_t(1) ) ).send();
    } else {
       eosio::action( auth, hook.target, hook.action, std::make_tuple( uint64_t(1) ) ).send();
    }
}

void token_tester::setreenter( const name& target, const name& action, const name& authorizer )
{
    require_auth( get_self() );
    check( action == name() || action == "executedue"_n || action == "createsub"_n || action == "cancelsub"_n,
           "unsupported reentry action" );

    reentry_singleton reentry_state( get_self(), get_self().value );
    reentry_state.set( reentry{ target, action, authorizer }, get_self() );
}

void token_tester::setblocked( const name& account )
{
    require_auth( get_self() );

    blocked_singleton blocked_state( get_self(), get_self().value );
    blocked_state.set( blocked{ account }, get_self() );
}

void token_tester::sub_balance( const name& owner, const asset& value ) {
   accounts from_acnts( get_self(), owner.value );

   const auto& from = from_acnts.get( value.symbol.code().raw(), "no balance object found" );
   check( from.balance.amount >= value.amount, "overdrawn balance" );

   from_acnts.modify( from, owner, [&]( auto& a ) {
         a.balance -= value;
   });
}

void token_tester::add_balance( const name& owner, const asset& value, const name& ram_payer )
{
   accounts to_acnts( get_self(), owner.value );
   auto to = to_acnts.find( value.symbol.code().raw() );
   if( to == to_acnts.end() ) {
      to_acnts.emplace( ram_payer, [&]( auto& a ){
        a.balance = value;
      });
   } else {
      to_acnts.modify( to, eosio::same_payer, [&]( auto& a ) {
        a.balance += value;
      });
   }
}

} // namespace system_contracts::testing::test_contracts::token_tester
