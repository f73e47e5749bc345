#define BOOST_TEST_MODULE JsonCodecTests
#include <boost/test/unit_test.hpp>

#include <marlowe/semantics/arithmetic.hpp>

#include "semantics_fixture.hpp"

namespace
{
   template<typename T>
   T parse( const std::string& json )
   {
      return fc::json::from_string( json ).as<T>();
   }
}

BOOST_FIXTURE_TEST_SUITE( json_codec_tests, semantics_fixture )

BOOST_AUTO_TEST_CASE( parses_a_deposit_contract )
{
   const contract_ptr c = parse<contract_ptr>( R"({
      "when": [ {
         "case": { "party": { "address": "addr_test1qalice" },
                   "deposits": 100,
                   "of_token": { "currency_symbol": "", "token_name": "" },
                   "into_account": { "address": "addr_test1qalice" } },
         "then": "close" } ],
      "timeout": 1000,
      "timeout_continuation": "close" })" );

   BOOST_CHECK( same_contract( c, deposit_then_close( 100, 1000 ) ) );
}

BOOST_AUTO_TEST_CASE( contracts_survive_a_round_trip )
{
   const choice_id price( "price", bob );
   const contract_ptr c =
      make_let( "fee", make_div( make_available_money( alice, dollar ), make_constant( 10 ) ),
      make_assert( make_value_ge( make_use_value( "fee" ), make_constant( 0 ) ),
      make_if( make_or( make_chose_something( price ), make_not( make_false() ) ),
               make_pay( alice, payee::account( bob ), dollar,
                         make_cond( make_value_eq( make_time_interval_start(), make_time_interval_end() ),
                                    make_negate( make_constant( 1 ) ), make_sub( make_choice_value( price ), make_constant( 2 ) ) ),
                         make_close() ),
               make_when( { make_case( make_choice( price, { bound( 0, 10 ) } ), make_close() ),
                            make_case( make_notify( make_and( make_true(), make_value_lt( make_constant( 1 ), make_constant( 2 ) ) ) ), make_close() ),
                            make_merkleized_case( make_deposit( bob, carol, ada, make_mul( make_constant( 3 ), make_constant( 4 ) ) ), "0a1b" ) },
                          123456, make_pay( bob, payee::to_party( carol ), ada, make_add( make_constant( 1 ), make_constant( 1 ) ), make_close() ) ) ) ) );

   const std::string json = fc::json::to_string( fc::variant( c ) );
   const contract_ptr parsed = parse<contract_ptr>( json );
   BOOST_CHECK( same_contract( c, parsed ) );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( parsed ) ), json );
}

BOOST_AUTO_TEST_CASE( encodes_parties_and_payees )
{
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( alice ) ), R"({"address":"addr_test1qalice"})" );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( bob ) ), R"({"role_token":"bob"})" );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( payee::account( bob ) ) ), R"({"account":{"role_token":"bob"}})" );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( payee::to_party( bob ) ) ), R"({"party":{"role_token":"bob"}})" );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( make_close() ) ), R"("close")" );
}

BOOST_AUTO_TEST_CASE( large_integers_are_decimal_strings )
{
   const integer_type big = parse_integer( "123456789012345678901234567890" );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( make_constant( big ) ) ), R"("123456789012345678901234567890")" );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( make_constant( -7 ) ) ), "-7" );

   const value_ptr from_string = parse<value_ptr>( R"("123456789012345678901234567890")" );
   BOOST_CHECK( same_value( from_string, make_constant( big ) ) );
   BOOST_CHECK( same_value( parse<value_ptr>( "42" ), make_constant( 42 ) ) );
   BOOST_CHECK( same_value( parse<value_ptr>( "-42" ), make_constant( -42 ) ) );
}

BOOST_AUTO_TEST_CASE( parses_values_and_observations )
{
   BOOST_CHECK( same_value( parse<value_ptr>( R"("time_interval_start")" ), make_time_interval_start() ) );
   BOOST_CHECK( same_value( parse<value_ptr>( R"({"value": 5, "minus": {"use_value": "x"}})" ),
                            make_sub( make_constant( 5 ), make_use_value( "x" ) ) ) );
   BOOST_CHECK( same_observation( parse<observation_ptr>( "true" ), make_true() ) );
   BOOST_CHECK( same_observation( parse<observation_ptr>( R"({"value": 1, "gt": 0})" ),
                                  make_value_gt( make_constant( 1 ), make_constant( 0 ) ) ) );
   BOOST_CHECK( same_observation( parse<observation_ptr>( R"({"value": 1, "le_than": 0})" ),
                                  make_value_le( make_constant( 1 ), make_constant( 0 ) ) ) );
}

BOOST_AUTO_TEST_CASE( state_encoding )
{
   state s( 77 );
   s.set_money_in_account( alice, ada, 5 );
   s.choices[ choice_id( "c", bob ) ] = -1;
   s.bound_values[ "v" ] = 9;

   const fc::variant encoded( s );
   BOOST_CHECK_EQUAL( fc::json::to_string( encoded ),
      R"({"accounts":[[[{"address":"addr_test1qalice"},{"currency_symbol":"","token_name":""}],5]],)"
      R"("choices":[[{"choice_name":"c","choice_owner":{"role_token":"bob"}},-1]],)"
      R"("boundValues":[["v",9]],"minTime":77})" );

   BOOST_CHECK( encoded.as<state>() == s );
   BOOST_CHECK_THROW( parse<state>( R"({"accounts":[[[{"address":"a"},{"currency_symbol":"","token_name":""}],0]],"choices":[],"boundValues":[],"minTime":0})" ),
                      invalid_contract_encoding );
}

BOOST_AUTO_TEST_CASE( input_encoding )
{
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( make_notify_input() ) ), R"("input_notify")" );
   BOOST_CHECK( parse<input>( R"("input_notify")" ) == make_notify_input() );

   const input deposit = parse<input>( R"({"input_from_party": {"role_token": "bob"}, "that_deposits": 25,
                                           "of_token": {"currency_symbol": "", "token_name": ""},
                                           "into_account": {"address": "addr_test1qalice"}})" );
   BOOST_CHECK( deposit == make_deposit_input( alice, bob, ada, 25 ) );

   const input choice = parse<input>( R"({"for_choice_id": {"choice_name": "p", "choice_owner": {"role_token": "bob"}},
                                          "input_that_chooses_num": 3})" );
   BOOST_CHECK( choice == make_choice_input( choice_id( "p", bob ), 3 ) );

   const input merkleized_notify = parse<input>( R"({"continuation_hash": "beef", "merkleized_continuation": "close"})" );
   BOOST_CHECK( merkleized_notify == disclose( make_notify_input(), "beef", make_close() ) );

   const input merkleized_choice = disclose( make_choice_input( choice_id( "p", bob ), 3 ), "beef", make_close() );
   BOOST_CHECK( fc::variant( merkleized_choice ).as<input>() == merkleized_choice );
}

BOOST_AUTO_TEST_CASE( transaction_and_warning_encoding )
{
   const transaction_input tx = parse<transaction_input>( R"({"tx_interval": {"from": 10, "to": 20}, "tx_inputs": ["input_notify"]})" );
   BOOST_CHECK_EQUAL( tx.interval.from, 10 );
   BOOST_CHECK_EQUAL( tx.interval.to, 20 );
   BOOST_REQUIRE_EQUAL( tx.inputs.size(), 1u );
   BOOST_CHECK( tx.inputs[0] == make_notify_input() );

   const transaction_warning partial = make_partial_pay_warning( alice, payee::to_party( bob ), ada, 3, 5 );
   BOOST_CHECK( fc::variant( partial ).as<transaction_warning>() == partial );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( make_assertion_failed_warning() ) ), R"("assertion_failed")" );

   const payment p( alice, payee::to_party( bob ), dollar, 12 );
   BOOST_CHECK( fc::variant( p ).as<payment>() == p );
}

BOOST_AUTO_TEST_CASE( malformed_documents_are_rejected )
{
   BOOST_CHECK_THROW( parse<contract_ptr>( R"("open")" ), invalid_contract_encoding );
   BOOST_CHECK_THROW( parse<contract_ptr>( R"({"pay": 1})" ), invalid_contract_encoding );
   BOOST_CHECK_THROW( parse<contract_ptr>( R"({"unknown": 1})" ), invalid_contract_encoding );
   BOOST_CHECK_THROW( parse<value_ptr>( R"("twelve")" ), invalid_contract_encoding );
   BOOST_CHECK_THROW( parse<observation_ptr>( "12" ), invalid_contract_encoding );
   BOOST_CHECK_THROW( parse<input>( R"({"nothing": 1})" ), invalid_contract_encoding );
   BOOST_CHECK_THROW( parse<transaction_input>( R"({"tx_inputs": []})" ), invalid_contract_encoding );
}

BOOST_AUTO_TEST_CASE( nesting_depth_is_bounded_when_decoding )
{
   fc::variant shallow( 1 );
   for( uint32_t i = 0; i < 500; ++i )
      shallow = fc::variant( fc::mutable_variant_object( "negate", shallow ) );
   const value_ptr decoded = shallow.as<value_ptr>();
   BOOST_CHECK_EQUAL( eval_value( environment( 0, 10 ), state(), decoded ), 1 );

   fc::variant deep( 1 );
   for( uint32_t i = 0; i < MARLOWE_MAX_DECODE_NESTING_DEPTH + 10; ++i )
      deep = fc::variant( fc::mutable_variant_object( "negate", deep ) );
   BOOST_CHECK_THROW( deep.as<value_ptr>(), invalid_contract_encoding );

   fc::variant deep_contract( "close" );
   for( uint32_t i = 0; i < MARLOWE_MAX_DECODE_NESTING_DEPTH + 10; ++i )
      deep_contract = fc::variant( fc::mutable_variant_object( "assert", true )( "then", deep_contract ) );
   BOOST_CHECK_THROW( deep_contract.as<contract_ptr>(), invalid_contract_encoding );

   // the depth counter is released after a rejected document
   BOOST_CHECK( same_value( shallow.as<value_ptr>(), decoded ) );
}

BOOST_AUTO_TEST_SUITE_END()
