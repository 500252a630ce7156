// see LICENSE.txt

#include <boost/test/unit_test.hpp>
#include "../common/database_fixture.hpp"

#include <cipherbook/app/api.hpp>

#include <boost/signals2/connection.hpp>

#include <cstdint>

using namespace cipherbook::app;
using namespace cipherbook::chain::test;

BOOST_FIXTURE_TEST_SUITE( api_tests, database_fixture )

BOOST_AUTO_TEST_CASE( share_then_contribute_scenario )
{
   try {
      BOOST_TEST_MESSAGE( "=== share_then_contribute_scenario ===" );

      ACTOR(alice);
      ACTOR(bob);
      ACTOR(carol);

      accumulator_api alice_api( db, alice_id );
      accumulator_api bob_api( db, bob_id );

      BOOST_CHECK( is_null_handle( alice_api.get_my_total_handle() ) );
      BOOST_CHECK( is_null_handle( bob_api.get_total_handle_of( alice_id ) ) );

      external_ciphertext ct = encrypt( 500 );
      const ciphertext_handle h1 = alice_api.submit_contribution( ct, prove( alice_id, ct ) );
      BOOST_CHECK( alice_api.get_my_total_handle() == h1 );
      BOOST_CHECK_EQUAL( decrypt_as( alice_id, h1 ), 500u );

      ct = encrypt( 250 );
      const ciphertext_handle h2 = alice_api.submit_contribution( ct, prove( alice_id, ct ) );
      BOOST_CHECK( h2 != h1 );
      BOOST_CHECK_EQUAL( decrypt_as( alice_id, h2 ), 750u );

      alice_api.share_total( bob_id );
      BOOST_CHECK( bob_api.get_total_handle_of( alice_id ) == h2 );
      BOOST_CHECK_EQUAL( decrypt_as( bob_id, h2 ), 750u );
      BOOST_CHECK_THROW( decrypt_as( carol_id, h2 ), decryption_denied_exception );

      ct = encrypt( 100 );
      const ciphertext_handle h3 = alice_api.submit_contribution( ct, prove( alice_id, ct ) );
      BOOST_CHECK_EQUAL( decrypt_as( alice_id, h3 ), 850u );
      // bob's grant was bound to h2
      BOOST_CHECK_THROW( decrypt_as( bob_id, h3 ), decryption_denied_exception );
      BOOST_CHECK_EQUAL( decrypt_as( bob_id, h2 ), 750u );

      alice_api.make_total_public();
      BOOST_CHECK_EQUAL( decrypt_as( carol_id, h3 ), 850u );
      BOOST_CHECK_EQUAL( decrypt_as( bob_id, h3 ), 850u );

      // bob never contributed
      BOOST_CHECK_THROW( bob_api.make_total_public(), no_total_yet_exception );
      BOOST_CHECK_THROW( bob_api.share_total( alice_id ), no_total_yet_exception );
      BOOST_CHECK_THROW( alice_api.share_total( identity_type() ), invalid_viewer_exception );
      BOOST_CHECK_THROW( alice_api.submit_contribution( ct, input_proof() ), invalid_proof_exception );
      BOOST_CHECK( alice_api.get_my_total_handle() == h3 );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( audit_events_name_participants )
{
   try {
      ACTOR(alice);
      ACTOR(bob);
      ACTOR(carol);

      accumulator_api alice_api( db, alice_id );
      external_ciphertext ct = encrypt( 8 );
      const ciphertext_handle h = alice_api.submit_contribution( ct, prove( alice_id, ct ) );
      alice_api.share_total( bob_id );
      alice_api.make_total_public();

      const auto alice_events = alice_api.get_audit_events( alice_id );
      BOOST_REQUIRE_EQUAL( alice_events.size(), 3u );
      BOOST_CHECK( alice_events[0].event.which() == audit_event::tag<contribution_accepted_event>::value );
      BOOST_CHECK( alice_events[1].event.which() == audit_event::tag<total_shared_event>::value );
      BOOST_CHECK( alice_events[2].event.which() == audit_event::tag<total_made_public_event>::value );
      BOOST_CHECK( alice_events[0].id < alice_events[1].id && alice_events[1].id < alice_events[2].id );

      const auto& shared = alice_events[1].event.get<total_shared_event>();
      BOOST_CHECK( shared.owner == alice_id );
      BOOST_CHECK( shared.viewer == bob_id );
      BOOST_CHECK( shared.handle == h );

      const auto& published = alice_events[2].event.get<total_made_public_event>();
      BOOST_CHECK( published.identity == alice_id );
      BOOST_CHECK( published.handle == h );

      const auto bob_events = alice_api.get_audit_events( bob_id );
      BOOST_REQUIRE_EQUAL( bob_events.size(), 1u );
      BOOST_CHECK( bob_events[0].id == alice_events[1].id );

      BOOST_CHECK( alice_api.get_audit_events( carol_id ).empty() );

      const auto page = db.get_audit_events( alice_events[1].id, 10 );
      BOOST_CHECK_EQUAL( page.size(), 2u );
      BOOST_CHECK_EQUAL( db.get_audit_events( 0, 1 ).size(), 1u );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( subscribers_see_committed_events )
{
   try {
      ACTOR(alice);
      ACTOR(bob);

      accumulator_api alice_api( db, alice_id );
      accumulator_api bob_api( db, bob_id );

      std::vector<audit_event_object> seen_by_bob;
      bob_api.subscribe_to_events( [&]( const audit_event_object& e ) { seen_by_bob.push_back( e ); } );

      external_ciphertext ct = encrypt( 3 );
      alice_api.submit_contribution( ct, prove( alice_id, ct ) );
      BOOST_CHECK( seen_by_bob.empty() );

      alice_api.share_total( bob_id );
      BOOST_REQUIRE_EQUAL( seen_by_bob.size(), 1u );
      BOOST_CHECK( seen_by_bob[0].event.get<total_shared_event>().viewer == bob_id );

      // rejected operations are never broadcast
      BOOST_CHECK_THROW( alice_api.share_total( alice_id ), invalid_viewer_exception );
      BOOST_CHECK_EQUAL( seen_by_bob.size(), 1u );

      bob_api.unsubscribe_from_events();
      alice_api.share_total( bob_id );
      BOOST_CHECK_EQUAL( seen_by_bob.size(), 1u );

      size_t all_events = 0;
      auto counter = db.applied_event.connect( [&]( const audit_event_object& ) { ++all_events; } );
      ct = encrypt( 4 );
      bob_api.submit_contribution( ct, prove( bob_id, ct ) );
      alice_api.make_total_public();
      BOOST_CHECK_EQUAL( all_events, 2u );
      counter.disconnect();
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( failing_subscribers_do_not_fail_committed_operations )
{
   try {
      ACTOR(alice);
      ACTOR(bob);

      accumulator_api alice_api( db, alice_id );
      accumulator_api bob_api( db, bob_id );

      boost::signals2::scoped_connection failing( db.applied_event.connect( []( const audit_event_object& ) {
         FC_THROW( "handler failure" );
      }) );
      bob_api.subscribe_to_events( []( const audit_event_object& ) {
         FC_THROW( "handler failure" );
      });
      std::vector<audit_event_object> seen_by_alice;
      alice_api.subscribe_to_events( [&]( const audit_event_object& e ) { seen_by_alice.push_back( e ); } );

      external_ciphertext ct = encrypt( 21 );
      const ciphertext_handle h = alice_api.submit_contribution( ct, prove( alice_id, ct ) );
      BOOST_CHECK( alice_api.get_my_total_handle() == h );
      BOOST_REQUIRE_EQUAL( seen_by_alice.size(), 1u );

      BOOST_CHECK_NO_THROW( alice_api.share_total( bob_id ) );
      BOOST_CHECK( db.is_granted( h, bob_id ) );
      BOOST_REQUIRE_EQUAL( seen_by_alice.size(), 2u );
      BOOST_CHECK( seen_by_alice[1].event.which() == audit_event::tag<total_shared_event>::value );

      // the submitter's own failing handler does not cost it the new handle
      ct = encrypt( 9 );
      ciphertext_handle bob_total;
      BOOST_CHECK_NO_THROW( bob_total = bob_api.submit_contribution( ct, prove( bob_id, ct ) ) );
      BOOST_CHECK( bob_total == bob_api.get_my_total_handle() );
      BOOST_CHECK_EQUAL( total_of( bob_id ), 9u );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( subscribers_may_push_operations )
{
   try {
      ACTOR(alice);
      ACTOR(bob);

      accumulator_api alice_api( db, alice_id );

      std::vector<audit_event_object> seen_by_alice;
      alice_api.subscribe_to_events( [&]( const audit_event_object& e ) {
         seen_by_alice.push_back( e );
         if( e.event.which() == audit_event::tag<contribution_accepted_event>::value )
            alice_api.share_total( bob_id );
      });

      external_ciphertext ct = encrypt( 40 );
      const ciphertext_handle h = alice_api.submit_contribution( ct, prove( alice_id, ct ) );

      BOOST_CHECK( db.is_granted( h, bob_id ) );
      BOOST_CHECK_EQUAL( decrypt_as( bob_id, h ), 40u );
      BOOST_REQUIRE_EQUAL( seen_by_alice.size(), 2u );
      BOOST_CHECK( seen_by_alice[0].event.which() == audit_event::tag<contribution_accepted_event>::value );
      BOOST_CHECK( seen_by_alice[1].event.which() == audit_event::tag<total_shared_event>::value );
      BOOST_CHECK_EQUAL( db.get_audit_events( alice_id ).size(), 2u );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( amounts_must_be_plain_digits )
{
   BOOST_CHECK_EQUAL( parse_amount( "0" ), 0u );
   BOOST_CHECK_EQUAL( parse_amount( "750" ), 750u );
   BOOST_CHECK_EQUAL( parse_amount( "18446744073709551615" ), UINT64_MAX );

   BOOST_CHECK_THROW( parse_amount( "-5" ), fc::exception );
   BOOST_CHECK_THROW( parse_amount( "+5" ), fc::exception );
   BOOST_CHECK_THROW( parse_amount( "5x" ), fc::exception );
   BOOST_CHECK_THROW( parse_amount( " 5" ), fc::exception );
   BOOST_CHECK_THROW( parse_amount( "" ), fc::exception );
   BOOST_CHECK_THROW( parse_amount( "18446744073709551616" ), fc::exception );
}

BOOST_AUTO_TEST_CASE( session_needs_an_identity )
{
   BOOST_CHECK_THROW( ( accumulator_api( db, identity_type() ) ), invalid_identity_exception );
}

BOOST_AUTO_TEST_SUITE_END()
