#include "rewards_tester.hpp"

BOOST_AUTO_TEST_SUITE(rewards_accrual_tests)

BOOST_FIXTURE_TEST_CASE( mint_scenario, rewards_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(alice), "100 PROD" ) );

   auto global = get_global_state();
   BOOST_REQUIRE( !global.is_null() );
   BOOST_REQUIRE_EQUAL( 100, global["last_supply"].as_int64() );
   BOOST_REQUIRE_EQUAL( 0u, global_points() );
   BOOST_REQUIRE_EQUAL( 100, get_user_state( N(alice) )["last_balance"].as_int64() );

   advance( 1000 );
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(bob), "200 PROD" ) );

   global = get_global_state();
   BOOST_REQUIRE_EQUAL( 300, global["last_supply"].as_int64() );
   BOOST_REQUIRE_EQUAL( 100000u, global_points() );

   // alice has not moved since the first mint, her integral is still pending
   BOOST_REQUIRE_EQUAL( 0u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(carol), N(alice) ) );
   BOOST_REQUIRE_EQUAL( 100000u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( 0u, user_points( N(bob) ) );
   BOOST_REQUIRE_EQUAL( 0u, user_points( N(ptoken) ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( accrual_is_idempotent_within_a_block, rewards_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(alice), "50 PROD" ) );
   advance( 10 );

   BOOST_REQUIRE_EQUAL( success(), globalaccrue( N(alice) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(alice), N(alice) ) );
   BOOST_REQUIRE_EQUAL( 500u, global_points() );
   BOOST_REQUIRE_EQUAL( 500u, user_points( N(alice) ) );

   BOOST_REQUIRE_EQUAL( success(), globalaccrue( N(bob) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(bob), N(alice) ) );
   BOOST_REQUIRE_EQUAL( 500u, global_points() );
   BOOST_REQUIRE_EQUAL( 500u, user_points( N(alice) ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( points_follow_time_weighted_balance, rewards_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(alice), "100 PROD" ) );
   advance( 100 );
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(bob), "100 PROD" ) );
   advance( 100 );

   BOOST_REQUIRE_EQUAL( success(), globalaccrue( N(carol) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(carol), N(alice) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(carol), N(bob) ) );

   BOOST_REQUIRE_EQUAL( 30000u, global_points() );
   BOOST_REQUIRE_EQUAL( 20000u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( 10000u, user_points( N(bob) ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( transfer_attributes_points_to_both_sides, rewards_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(alice), "100 PROD" ) );
   advance( 50 );
   BOOST_REQUIRE_EQUAL( success(), transfer( N(ptoken), N(alice), N(bob), "40 PROD" ) );

   BOOST_REQUIRE_EQUAL( 5000u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( 60, get_user_state( N(alice) )["last_balance"].as_int64() );
   BOOST_REQUIRE_EQUAL( 0u, user_points( N(bob) ) );
   BOOST_REQUIRE_EQUAL( 40, get_user_state( N(bob) )["last_balance"].as_int64() );

   advance( 50 );
   BOOST_REQUIRE_EQUAL( success(), globalaccrue( N(carol) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(carol), N(alice) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(carol), N(bob) ) );

   BOOST_REQUIRE_EQUAL( 8000u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( 2000u, user_points( N(bob) ) );
   BOOST_REQUIRE_EQUAL( 10000u, global_points() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( burn_slows_global_accrual, rewards_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(alice), "100 PROD" ) );
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(bob), "100 PROD" ) );
   advance( 100 );

   BOOST_REQUIRE_EQUAL( success(), transfer( N(ptoken), N(alice), N(ptoken), "100 PROD" ) );
   BOOST_REQUIRE_EQUAL( success(), retire( N(ptoken), "100 PROD" ) );
   BOOST_REQUIRE_EQUAL( 20000u, global_points() );
   BOOST_REQUIRE_EQUAL( 100, get_global_state()["last_supply"].as_int64() );

   advance( 100 );
   BOOST_REQUIRE_EQUAL( success(), globalaccrue( N(carol) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(carol), N(alice) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(carol), N(bob) ) );

   // bob held half of the supply before the burn and all of it after
   BOOST_REQUIRE_EQUAL( 30000u, global_points() );
   BOOST_REQUIRE_EQUAL( 10000u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( 20000u, user_points( N(bob) ) );
   BOOST_REQUIRE_EQUAL( 0u, user_points( N(ptoken) ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( identical_histories_earn_identical_points, rewards_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(alice), "100 PROD" ) );
   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(bob), "100 PROD" ) );
   advance( 30 );

   BOOST_REQUIRE_EQUAL( success(), transfer( N(ptoken), N(alice), N(carol), "40 PROD" ) );
   BOOST_REQUIRE_EQUAL( success(), transfer( N(ptoken), N(bob), N(carol), "40 PROD" ) );
   BOOST_REQUIRE_EQUAL( 3000u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( user_points( N(alice) ), user_points( N(bob) ) );
   advance( 20 );

   // alice is observed more often than bob
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(carol), N(alice) ) );
   BOOST_REQUIRE_EQUAL( 4200u, user_points( N(alice) ) );
   advance( 7 );

   BOOST_REQUIRE_EQUAL( success(), transfer( N(ptoken), N(carol), N(alice), "10 PROD" ) );
   BOOST_REQUIRE_EQUAL( success(), transfer( N(ptoken), N(carol), N(bob), "10 PROD" ) );
   BOOST_REQUIRE_EQUAL( 4620u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( user_points( N(alice) ), user_points( N(bob) ) );
   advance( 13 );

   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(bob), N(alice) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(bob), N(bob) ) );
   BOOST_REQUIRE_EQUAL( 5530u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( user_points( N(alice) ), user_points( N(bob) ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( ledger_binds_only_at_zero_supply, rewards_tester ) try {
   // otoken is not bound, its moves never reach the engine
   BOOST_REQUIRE_EQUAL( success(), issue( N(otoken), N(alice), "100 PROD" ) );
   BOOST_REQUIRE_EQUAL( success(), transfer( N(otoken), N(alice), N(bob), "30 PROD" ) );
   BOOST_REQUIRE( get_global_state().is_null() );
   BOOST_REQUIRE( get_user_state( N(alice) ).is_null() );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "supply must be zero to set rewards engine" ),
                        setrewards( N(otoken), "PROD", N(rewards) ) );
   BOOST_REQUIRE_EQUAL( error( "missing authority of ptoken" ),
                        push_token_action( N(ptoken), N(alice), N(setrewards), mvo()("sym", "PROD")("engine", "alice") ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "rewards engine account does not exist" ),
                        setrewards( N(ptoken), "PROD", N(nobody) ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "token with symbol does not exist, create token before setting rewards engine" ),
                        setrewards( N(ptoken), "NOPE", N(rewards) ) );
   BOOST_REQUIRE_EQUAL( success(), setrewards( N(ptoken), "PROD", N(rewards) ) );

   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(alice), "100 PROD" ) );
   advance( 10 );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "supply must be zero to set rewards engine" ),
                        setrewards( N(ptoken), "PROD", N(rewards) ) );

   // every balance change since the first issue was observed
   BOOST_REQUIRE_EQUAL( success(), transfer( N(ptoken), N(alice), N(bob), "30 PROD" ) );
   BOOST_REQUIRE_EQUAL( 70, get_user_state( N(alice) )["last_balance"].as_int64() );
   BOOST_REQUIRE_EQUAL( 30, get_user_state( N(bob) )["last_balance"].as_int64() );
   advance( 10 );

   BOOST_REQUIRE_EQUAL( success(), transfer( N(ptoken), N(alice), N(bob), "10 PROD" ) );
   BOOST_REQUIRE_EQUAL( 1700u, user_points( N(alice) ) );
   BOOST_REQUIRE_EQUAL( 300u, user_points( N(bob) ) );
   BOOST_REQUIRE_EQUAL( success(), globalaccrue( N(carol) ) );
   BOOST_REQUIRE_EQUAL( 2000u, global_points() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( foreign_ledger_cannot_open_a_producer_code, rewards_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( N(otoken), N(bob), "500 PROD" ) );

   // before ptoken opens PROD, otoken balances must not seed any PROD row
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "producer token not initialized" ),
                        useraccrue( N(bob), N(bob), xsym( "0,PROD", N(otoken) ) ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "unauthorized: producer ledger authority required" ),
                        globalaccrue( N(bob), xsym( "0,PROD", N(otoken) ) ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "producer token not initialized" ),
                        useraccrue( N(bob), N(bob) ) );
   BOOST_REQUIRE( get_global_state().is_null() );
   BOOST_REQUIRE( get_user_state( N(bob) ).is_null() );

   BOOST_REQUIRE_EQUAL( success(), issue( N(ptoken), N(alice), "100 PROD" ) );
   BOOST_REQUIRE_EQUAL( "ptoken", get_global_state()["producer"]["contract"].as_string() );
   BOOST_REQUIRE_EQUAL( "ptoken", get_user_state( N(alice) )["producer"]["contract"].as_string() );
   advance( 10 );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "producer token mismatch" ),
                        useraccrue( N(bob), N(bob), xsym( "0,PROD", N(otoken) ) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(bob), N(bob) ) );
   BOOST_REQUIRE_EQUAL( success(), useraccrue( N(bob), N(alice) ) );
   BOOST_REQUIRE_EQUAL( 0, get_user_state( N(bob) )["last_balance"].as_int64() );
   BOOST_REQUIRE_EQUAL( 0u, user_points( N(bob) ) );
   BOOST_REQUIRE_EQUAL( 1000u, user_points( N(alice) ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( accrual_checks, rewards_tester ) try {
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "null identity: producer token" ),
                        globalaccrue( N(alice), xsym( "0,PROD", account_name() ) ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "null identity: holder" ),
                        useraccrue( N(alice), account_name() ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "producer token does not exist" ),
                        globalaccrue( N(alice), xsym( "0,NOPE", N(ptoken) ) ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "symbol precision mismatch" ),
                        globalaccrue( N(alice), xsym( "2,PROD", N(ptoken) ) ) );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "unauthorized: producer ledger authority required" ),
                        globalaccrue( N(alice) ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "producer token not initialized" ),
                        useraccrue( N(alice), N(alice) ) );
   BOOST_REQUIRE_EQUAL( success(), globalaccrue( N(ptoken) ) );
   BOOST_REQUIRE_EQUAL( 0, get_global_state()["last_supply"].as_int64() );

   // another ledger reusing the PROD code never reaches ptoken's rows
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "producer token mismatch" ),
                        globalaccrue( N(bob), xsym( "0,PROD", N(otoken) ) ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "producer token mismatch" ),
                        useraccrue( N(bob), N(alice), xsym( "0,PROD", N(otoken) ) ) );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
