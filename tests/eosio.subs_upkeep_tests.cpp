#include "eosio.subs_tester.hpp"

#include <limits>

using namespace eosio_subs;

BOOST_AUTO_TEST_SUITE(eosio_subs_upkeep_tests)

BOOST_FIXTURE_TEST_CASE( checkdue_tests, eosio_subs_tester ) try {

   auto batch = checkdue();
   BOOST_REQUIRE_EQUAL( false, batch.due_exists );
   BOOST_REQUIRE( batch.ids.empty() );

   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("100.0000"), day, 30 * day ) );
   produce_block();

   batch = checkdue();
   BOOST_REQUIRE_EQUAL( false, batch.due_exists );
   BOOST_REQUIRE( batch.ids.empty() );

   produce_block( fc::days(1) );

   batch = checkdue();
   BOOST_REQUIRE_EQUAL( true, batch.due_exists );
   BOOST_REQUIRE( batch.ids == std::vector<uint64_t>{ 1 } );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( monthly_payment, eosio_subs_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("100.0000"), day, 30 * day ) );
   produce_block();
   const auto first_due = next_execute_at( 1 );
   produce_block( fc::days(2) );

   auto batch = checkdue();
   BOOST_REQUIRE( batch.ids == std::vector<uint64_t>{ 1 } );

   BOOST_REQUIRE_EQUAL( success(), executedue( bob, batch.ids ) );
   BOOST_REQUIRE_EQUAL( sub_asset("100.0000"), get_balance( alice ) );
   BOOST_REQUIRE_EQUAL( sub_asset("900.0000"), get_balance( subs_account ) );
   BOOST_REQUIRE( next_execute_at( 1 ) == first_due + 30 * day );
   BOOST_REQUIRE_EQUAL( false, get_state()["locked"].as<bool>() );

   auto events = get_events( "logexecuted"_n );
   BOOST_REQUIRE_EQUAL( 1, events.size() );
   REQUIRE_MATCHING_OBJECT( events[0], mvo()( "id", 1 )( "success", true ) );
   BOOST_REQUIRE( get_events( "logfailed"_n ).empty() );

   BOOST_REQUIRE_EQUAL( false, checkdue().due_exists );
   produce_block();

   // the next period counts from the previous due time, not from the execution
   produce_block( fc::days(29) );
   BOOST_REQUIRE_EQUAL( true, checkdue().due_exists );

   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 1 } ) );
   BOOST_REQUIRE_EQUAL( sub_asset("200.0000"), get_balance( alice ) );
   BOOST_REQUIRE( next_execute_at( 1 ) == first_due + 60 * day );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( cancelled_never_due, eosio_subs_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("100.0000"), day, 30 * day ) );
   produce_block();
   BOOST_REQUIRE_EQUAL( success(), cancelsub( owner, 1 ) );
   produce_block();

   produce_block( fc::days(90) );

   auto batch = checkdue();
   BOOST_REQUIRE_EQUAL( false, batch.due_exists );
   BOOST_REQUIRE( batch.ids.empty() );

   // a stale batch naming the cancelled id pays nothing
   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 1 } ) );
   BOOST_REQUIRE_EQUAL( sub_asset("0.0000"), get_balance( alice ) );
   BOOST_REQUIRE( get_events( "logexecuted"_n ).empty() );
   BOOST_REQUIRE( get_events( "logfailed"_n ).empty() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( insufficient_balance_stays_due, eosio_subs_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("1500.0000"), day, 30 * day ) );
   produce_block();
   const auto first_due = next_execute_at( 1 );
   produce_block( fc::days(2) );

   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 1 } ) );
   auto events = get_events( "logfailed"_n );
   BOOST_REQUIRE_EQUAL( 1, events.size() );
   REQUIRE_MATCHING_OBJECT( events[0], mvo()( "id", 1 )( "success", false ) );
   BOOST_REQUIRE( get_events( "logexecuted"_n ).empty() );

   BOOST_REQUIRE_EQUAL( sub_asset("0.0000"), get_balance( alice ) );
   BOOST_REQUIRE_EQUAL( sub_asset("1000.0000"), get_balance( subs_account ) );
   BOOST_REQUIRE( next_execute_at( 1 ) == first_due );
   BOOST_REQUIRE_EQUAL( false, get_state()["locked"].as<bool>() );

   auto batch = checkdue();
   BOOST_REQUIRE( batch.ids == std::vector<uint64_t>{ 1 } );

   BOOST_REQUIRE_EQUAL( success(), transfer( token_account, subs_account, sub_asset("500.0000") ) );
   produce_block();

   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 1 } ) );
   BOOST_REQUIRE_EQUAL( 1, get_events( "logexecuted"_n ).size() );
   BOOST_REQUIRE_EQUAL( sub_asset("1500.0000"), get_balance( alice ) );
   BOOST_REQUIRE_EQUAL( sub_asset("0.0000"), get_balance( subs_account ) );
   BOOST_REQUIRE( next_execute_at( 1 ) == first_due + 30 * day );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( batch_spends_balance_once, eosio_subs_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("600.0000"), day, 30 * day ) );
   BOOST_REQUIRE_EQUAL( success(), createsub( owner, bob, token_account, sub_asset("600.0000"), day, 30 * day ) );
   produce_block();
   produce_block( fc::days(2) );

   BOOST_REQUIRE_EQUAL( success(), executedue( mallory, { 1, 2 } ) );

   auto executed = get_events( "logexecuted"_n );
   BOOST_REQUIRE_EQUAL( 1, executed.size() );
   BOOST_REQUIRE_EQUAL( 1, executed[0]["id"].as<uint64_t>() );

   auto failed = get_events( "logfailed"_n );
   BOOST_REQUIRE_EQUAL( 1, failed.size() );
   BOOST_REQUIRE_EQUAL( 2, failed[0]["id"].as<uint64_t>() );

   BOOST_REQUIRE_EQUAL( sub_asset("600.0000"), get_balance( alice ) );
   BOOST_REQUIRE_EQUAL( sub_asset("0.0000"), get_balance( bob ) );
   BOOST_REQUIRE_EQUAL( sub_asset("400.0000"), get_balance( subs_account ) );

   auto batch = checkdue();
   BOOST_REQUIRE( batch.ids == std::vector<uint64_t>{ 2 } );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( unknown_token_fails_item_only, eosio_subs_tester ) try {

   // mallory has no token tables, alice's subscription is paid in the same batch
   BOOST_REQUIRE_EQUAL( success(), createsub( owner, bob, mallory, sub_asset("1.0000"), day, day ) );
   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("1.0000"), day, day ) );
   produce_block();
   produce_block( fc::days(2) );

   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 1, 2 } ) );
   BOOST_REQUIRE_EQUAL( 1, get_events( "logfailed"_n ).size() );
   BOOST_REQUIRE_EQUAL( 1, get_events( "logfailed"_n )[0]["id"].as<uint64_t>() );
   BOOST_REQUIRE_EQUAL( 1, get_events( "logexecuted"_n ).size() );
   BOOST_REQUIRE_EQUAL( sub_asset("1.0000"), get_balance( alice ) );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( batch_cap, eosio_subs_tester ) try {

   for ( int i = 0; i < 11; ++i ) {
      BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("1.0000"), day, 30 * day ) );
      produce_block();
   }
   BOOST_REQUIRE_EQUAL( 11, total_subscriptions() );
   produce_block( fc::days(2) );

   auto batch = checkdue();
   BOOST_REQUIRE_EQUAL( true, batch.due_exists );
   BOOST_REQUIRE( batch.ids == (std::vector<uint64_t>{ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 }) );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "batch exceeds maximum size" ),
                        executedue( bob, { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11 } ) );

   BOOST_REQUIRE_EQUAL( success(), executedue( bob, batch.ids ) );
   BOOST_REQUIRE_EQUAL( 10, get_events( "logexecuted"_n ).size() );
   BOOST_REQUIRE_EQUAL( sub_asset("10.0000"), get_balance( alice ) );

   batch = checkdue();
   BOOST_REQUIRE( batch.ids == std::vector<uint64_t>{ 11 } );

   BOOST_REQUIRE_EQUAL( success(), executedue( bob, batch.ids ) );
   BOOST_REQUIRE_EQUAL( sub_asset("11.0000"), get_balance( alice ) );
   BOOST_REQUIRE_EQUAL( false, checkdue().due_exists );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( stale_and_unknown_ids_skipped, eosio_subs_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("5.0000"), day, 30 * day ) );
   produce_block();
   produce_block( fc::days(2) );

   // unknown and repeated ids
   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 7, 1, 1, 0 } ) );
   BOOST_REQUIRE_EQUAL( 1, get_events( "logexecuted"_n ).size() );
   BOOST_REQUIRE_EQUAL( sub_asset("5.0000"), get_balance( alice ) );

   // paid already, no longer due
   produce_block();
   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 1 } ) );
   BOOST_REQUIRE( get_events( "logexecuted"_n ).empty() );
   BOOST_REQUIRE_EQUAL( sub_asset("5.0000"), get_balance( alice ) );

   // empty batch
   BOOST_REQUIRE_EQUAL( success(), executedue( bob, {} ) );
   BOOST_REQUIRE_EQUAL( false, get_state()["locked"].as<bool>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( interval_past_time_range_is_paid_once, eosio_subs_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("1.0000"), day,
                                              std::numeric_limits<uint32_t>::max() ) );
   produce_block();
   produce_block( fc::days(2) );

   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 1, 1, 1 } ) );
   BOOST_REQUIRE_EQUAL( 1, get_events( "logexecuted"_n ).size() );
   BOOST_REQUIRE_EQUAL( sub_asset("1.0000"), get_balance( alice ) );
   BOOST_REQUIRE( next_execute_at( 1 ) == fc::time_point_sec::maximum() );

   BOOST_REQUIRE_EQUAL( false, checkdue().due_exists );
   produce_block();

   produce_block( fc::days(30) );
   BOOST_REQUIRE_EQUAL( success(), executedue( bob, { 1 } ) );
   BOOST_REQUIRE( get_events( "logexecuted"_n ).empty() );
   BOOST_REQUIRE_EQUAL( sub_asset("1.0000"), get_balance( alice ) );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( rejected_transfer_blocks_batch_until_cancelled, eosio_subs_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createsub( owner, bob, token_account, sub_asset("1.0000"), day, 30 * day ) );
   BOOST_REQUIRE_EQUAL( success(), createsub( owner, alice, token_account, sub_asset("1.0000"), day, 30 * day ) );
   produce_block();
   produce_block( fc::days(2) );

   // passes every table check but the token itself refuses
   BOOST_REQUIRE_EQUAL( success(), setblocked( bob ) );

   auto batch = checkdue();
   BOOST_REQUIRE( batch.ids == (std::vector<uint64_t>{ 1, 2 }) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "recipient rejects transfers" ), executedue( mallory, batch.ids ) );

   BOOST_REQUIRE_EQUAL( sub_asset("0.0000"), get_balance( alice ) );
   BOOST_REQUIRE_EQUAL( false, get_state()["locked"].as<bool>() );
   BOOST_REQUIRE( checkdue().ids == (std::vector<uint64_t>{ 1, 2 }) );

   BOOST_REQUIRE_EQUAL( success(), cancelsub( owner, 1 ) );
   produce_block();

   batch = checkdue();
   BOOST_REQUIRE( batch.ids == std::vector<uint64_t>{ 2 } );
   BOOST_REQUIRE_EQUAL( success(), executedue( mallory, batch.ids ) );
   BOOST_REQUIRE_EQUAL( sub_asset("1.0000"), get_balance( alice ) );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( executedue_requires_executor_auth, eosio_subs_tester ) try {

   BOOST_REQUIRE_EQUAL( error( "missing authority of alice" ),
                        push_subs_action( bob, "executedue"_n, mvo()( "executor", alice )( "ids", std::vector<uint64_t>{} ) ) );

} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
