#define BOOST_TEST_MODULE ReductionTests
#include <boost/test/unit_test.hpp>

#include "semantics_fixture.hpp"

BOOST_FIXTURE_TEST_SUITE( reduction_tests, semantics_fixture )

BOOST_AUTO_TEST_CASE( close_with_empty_accounts_is_quiescent )
{
   const environment env( 0, 10 );
   const reduce_step_result step = reduce_contract_step( env, state(), make_close() );
   BOOST_CHECK_EQUAL( step.status, not_reduced_step );

   const quiescent_result result = reduce_contract_until_quiescent( env, state(), make_close() );
   BOOST_CHECK( !result.reduced );
   BOOST_CHECK_EQUAL( result.steps, 0u );
   BOOST_CHECK( result.payments.empty() );
   BOOST_CHECK( result.continuation->is_close() );
}

BOOST_AUTO_TEST_CASE( close_refunds_one_account_per_step_in_key_order )
{
   const environment env( 0, 10 );
   state s;
   s.set_money_in_account( bob, ada, 5 );
   s.set_money_in_account( alice, dollar, 7 );
   s.set_money_in_account( alice, ada, 3 );

   const reduce_step_result step = reduce_contract_step( env, s, make_close() );
   BOOST_REQUIRE_EQUAL( step.status, reduced_step );
   BOOST_REQUIRE( step.paid.valid() );
   BOOST_CHECK( *step.paid == payment( alice, payee::to_party( alice ), ada, 3 ) );
   BOOST_CHECK_EQUAL( step.new_state.accounts.size(), 2u );

   const quiescent_result result = reduce_contract_until_quiescent( env, s, make_close() );
   BOOST_REQUIRE_EQUAL( result.payments.size(), 3u );
   // addresses sort before roles, the native token sorts first
   BOOST_CHECK( result.payments[0] == payment( alice, payee::to_party( alice ), ada, 3 ) );
   BOOST_CHECK( result.payments[1] == payment( alice, payee::to_party( alice ), dollar, 7 ) );
   BOOST_CHECK( result.payments[2] == payment( bob, payee::to_party( bob ), ada, 5 ) );
   BOOST_CHECK( result.new_state.accounts.empty() );
   BOOST_CHECK( result.warnings.empty() );
   BOOST_CHECK_EQUAL( result.steps, 3u );
}

BOOST_AUTO_TEST_CASE( pay_to_party_makes_a_payment )
{
   const environment env( 0, 10 );
   const state s = funded( alice, ada, 100 );
   const contract_ptr c = make_pay( alice, payee::to_party( bob ), ada, make_constant( 40 ), make_close() );

   const reduce_step_result step = reduce_contract_step( env, s, c );
   BOOST_REQUIRE_EQUAL( step.status, reduced_step );
   BOOST_CHECK( !step.warning.valid() );
   BOOST_REQUIRE( step.paid.valid() );
   BOOST_CHECK( *step.paid == payment( alice, payee::to_party( bob ), ada, 40 ) );
   BOOST_CHECK_EQUAL( step.new_state.money_in_account( alice, ada ), 60 );
   BOOST_CHECK( step.continuation->is_close() );
}

BOOST_AUTO_TEST_CASE( pay_to_account_moves_money_inside_the_contract )
{
   const environment env( 0, 10 );
   const state s = funded( alice, ada, 100 );
   const contract_ptr c = make_pay( alice, payee::account( bob ), ada, make_constant( 40 ), make_close() );

   const reduce_step_result step = reduce_contract_step( env, s, c );
   BOOST_REQUIRE_EQUAL( step.status, reduced_step );
   BOOST_CHECK( !step.paid.valid() );
   BOOST_CHECK_EQUAL( step.new_state.money_in_account( alice, ada ), 60 );
   BOOST_CHECK_EQUAL( step.new_state.money_in_account( bob, ada ), 40 );
}

BOOST_AUTO_TEST_CASE( partial_pay_is_capped_at_the_balance )
{
   const environment env( 0, 10 );
   const state s = funded( alice, ada, 30 );
   const contract_ptr c = make_pay( alice, payee::to_party( bob ), ada, make_constant( 50 ), make_close() );

   const quiescent_result result = reduce_contract_until_quiescent( env, s, c );
   BOOST_REQUIRE_EQUAL( result.payments.size(), 1u );
   BOOST_CHECK( result.payments[0] == payment( alice, payee::to_party( bob ), ada, 30 ) );
   BOOST_REQUIRE_EQUAL( result.warnings.size(), 1u );
   BOOST_CHECK( result.warnings[0] == make_partial_pay_warning( alice, payee::to_party( bob ), ada, 30, 50 ) );
   BOOST_CHECK_EQUAL( result.new_state.money_in_account( alice, ada ), 0 );
   BOOST_CHECK( result.new_state.accounts.empty() );
   BOOST_CHECK( result.continuation->is_close() );
}

BOOST_AUTO_TEST_CASE( pay_from_missing_account_records_zero_payment )
{
   const environment env( 0, 10 );
   const contract_ptr c = make_pay( alice, payee::to_party( bob ), ada, make_constant( 50 ), make_close() );

   const reduce_step_result step = reduce_contract_step( env, state(), c );
   BOOST_REQUIRE_EQUAL( step.status, reduced_step );
   BOOST_REQUIRE( step.paid.valid() );
   BOOST_CHECK( *step.paid == payment( alice, payee::to_party( bob ), ada, 0 ) );

   const quiescent_result result = reduce_contract_until_quiescent( env, state(), c );
   BOOST_REQUIRE_EQUAL( result.payments.size(), 1u );
   BOOST_CHECK( result.payments[0] == payment( alice, payee::to_party( bob ), ada, 0 ) );
   BOOST_REQUIRE_EQUAL( result.warnings.size(), 1u );
   BOOST_CHECK( result.warnings[0] == make_partial_pay_warning( alice, payee::to_party( bob ), ada, 0, 50 ) );
   BOOST_CHECK( result.new_state.accounts.empty() );
   BOOST_CHECK( result.continuation->is_close() );
}

BOOST_AUTO_TEST_CASE( pay_to_account_from_missing_account_moves_nothing )
{
   const environment env( 0, 10 );
   const contract_ptr c = make_pay( alice, payee::account( bob ), ada, make_constant( 50 ), make_close() );

   const reduce_step_result step = reduce_contract_step( env, state(), c );
   BOOST_REQUIRE_EQUAL( step.status, reduced_step );
   BOOST_CHECK( !step.paid.valid() );
   BOOST_CHECK( step.new_state.accounts.empty() );
}

BOOST_AUTO_TEST_CASE( non_positive_pay_changes_nothing )
{
   const environment env( 0, 10 );
   const state s = funded( alice, ada, 30 );
   const contract_ptr c = make_pay( alice, payee::to_party( bob ), ada, make_constant( -5 ), make_close() );

   const reduce_step_result step = reduce_contract_step( env, s, c );
   BOOST_REQUIRE_EQUAL( step.status, reduced_step );
   BOOST_CHECK( !step.paid.valid() );
   BOOST_REQUIRE( step.warning.valid() );
   BOOST_CHECK( *step.warning == make_non_positive_pay_warning( alice, payee::to_party( bob ), ada, -5 ) );
   BOOST_CHECK( step.new_state == s );

   const reduce_step_result zero = reduce_contract_step( env, s,
         make_pay( alice, payee::to_party( bob ), ada, make_constant( 0 ), make_close() ) );
   BOOST_REQUIRE( zero.warning.valid() );
   BOOST_CHECK_EQUAL( zero.warning->type, non_positive_pay_warning );
}

BOOST_AUTO_TEST_CASE( if_takes_the_matching_branch )
{
   const environment env( 0, 10 );
   const contract_ptr then_branch = make_pay( alice, payee::to_party( bob ), ada, make_constant( 1 ), make_close() );
   const contract_ptr else_branch = make_pay( alice, payee::to_party( carol ), ada, make_constant( 1 ), make_close() );

   const reduce_step_result yes = reduce_contract_step( env, state(), make_if( make_true(), then_branch, else_branch ) );
   BOOST_CHECK( yes.continuation == then_branch );
   BOOST_CHECK( !yes.warning.valid() );

   const reduce_step_result no = reduce_contract_step( env, state(), make_if( make_false(), then_branch, else_branch ) );
   BOOST_CHECK( no.continuation == else_branch );
}

BOOST_AUTO_TEST_CASE( let_binds_and_warns_only_on_a_changed_value )
{
   const environment env( 0, 10 );
   state s;

   const reduce_step_result first = reduce_contract_step( env, s, make_let( "x", make_constant( 5 ), make_close() ) );
   BOOST_CHECK( !first.warning.valid() );
   BOOST_CHECK_EQUAL( first.new_state.bound_values.at( "x" ), 5 );

   const reduce_step_result same = reduce_contract_step( env, first.new_state, make_let( "x", make_constant( 5 ), make_close() ) );
   BOOST_CHECK( !same.warning.valid() );

   const reduce_step_result changed = reduce_contract_step( env, first.new_state, make_let( "x", make_constant( 8 ), make_close() ) );
   BOOST_REQUIRE( changed.warning.valid() );
   BOOST_CHECK( *changed.warning == make_shadowing_warning( "x", 5, 8 ) );
   BOOST_CHECK_EQUAL( changed.new_state.bound_values.at( "x" ), 8 );
}

BOOST_AUTO_TEST_CASE( failed_assert_warns_and_continues )
{
   const environment env( 0, 10 );
   const contract_ptr next = make_pay( alice, payee::to_party( bob ), ada, make_constant( 1 ), make_close() );

   const reduce_step_result failed = reduce_contract_step( env, state(), make_assert( make_false(), next ) );
   BOOST_REQUIRE_EQUAL( failed.status, reduced_step );
   BOOST_REQUIRE( failed.warning.valid() );
   BOOST_CHECK_EQUAL( failed.warning->type, assertion_failed_warning );
   BOOST_CHECK( failed.continuation == next );

   const reduce_step_result passed = reduce_contract_step( env, state(), make_assert( make_true(), next ) );
   BOOST_CHECK( !passed.warning.valid() );
}

BOOST_AUTO_TEST_CASE( when_timeout_boundary_is_inclusive )
{
   const contract_ptr c = deposit_then_close( 100, 1000 );

   const reduce_step_result at_timeout = reduce_contract_step( environment( 1000, 1000 ), state(), c );
   BOOST_CHECK_EQUAL( at_timeout.status, reduced_step );
   BOOST_CHECK( at_timeout.continuation->is_close() );

   const reduce_step_result before = reduce_contract_step( environment( 999, 999 ), state(), c );
   BOOST_CHECK_EQUAL( before.status, not_reduced_step );
   BOOST_CHECK( before.continuation == c );
}

BOOST_AUTO_TEST_CASE( straddling_interval_is_ambiguous )
{
   const contract_ptr c = deposit_then_close( 100, 1000 );
   const environment env( 500, 1500 );

   BOOST_CHECK_EQUAL( reduce_contract_step( env, state(), c ).status, ambiguous_time_interval_step );
   BOOST_CHECK_THROW( reduce_contract_until_quiescent( env, state(), c ), ambiguous_time_interval );

   // reductions before the When are discarded along with it
   const contract_ptr paying = make_pay( alice, payee::to_party( bob ), ada, make_constant( 10 ), c );
   BOOST_CHECK_THROW( reduce_contract_until_quiescent( env, funded( alice, ada, 10 ), paying ), transaction_error );
}

BOOST_AUTO_TEST_CASE( quiescence_is_idempotent )
{
   const environment env( 0, 10 );
   state s = funded( alice, ada, 100 );
   const contract_ptr c = make_let( "x", make_constant( 1 ),
                          make_pay( alice, payee::to_party( bob ), ada, make_constant( 20 ),
                          make_assert( make_false(), deposit_then_close( 5, 1000 ) ) ) );

   const quiescent_result first = reduce_contract_until_quiescent( env, s, c );
   BOOST_CHECK( first.reduced );
   BOOST_CHECK_EQUAL( first.warnings.size(), 1u );
   BOOST_CHECK_EQUAL( first.payments.size(), 1u );
   BOOST_CHECK( first.continuation->is_when() );

   const quiescent_result second = reduce_contract_until_quiescent( env, first.new_state, first.continuation );
   BOOST_CHECK( !second.reduced );
   BOOST_CHECK( second.warnings.empty() );
   BOOST_CHECK( second.payments.empty() );
   BOOST_CHECK( second.new_state == first.new_state );
   BOOST_CHECK( second.continuation == first.continuation );
}

BOOST_AUTO_TEST_CASE( reduction_is_deterministic )
{
   const environment env( 0, 10 );
   state s = funded( alice, ada, 50 );
   s.set_money_in_account( bob, dollar, 9 );
   const contract_ptr c = make_pay( alice, payee::account( bob ), ada, make_constant( 25 ),
                          make_if( make_value_gt( make_available_money( bob, ada ), make_constant( 20 ) ),
                                   make_pay( bob, payee::to_party( carol ), ada, make_constant( 30 ), make_close() ),
                                   make_close() ) );

   const quiescent_result a = reduce_contract_until_quiescent( env, s, c );
   const quiescent_result b = reduce_contract_until_quiescent( env, s, c );
   BOOST_CHECK( a.new_state == b.new_state );
   BOOST_CHECK( a.payments == b.payments );
   BOOST_CHECK( a.warnings == b.warnings );
   BOOST_CHECK( same_contract( a.continuation, b.continuation ) );
}

BOOST_AUTO_TEST_CASE( payments_conserve_value )
{
   const environment env( 0, 10 );
   state s = funded( alice, ada, 50 );
   s.set_money_in_account( bob, ada, 8 );
   const integer_type before = s.total_balance( ada );

   const contract_ptr c = make_pay( alice, payee::account( bob ), ada, make_constant( 25 ),
                          make_pay( bob, payee::to_party( carol ), ada, make_constant( 30 ),
                          make_pay( alice, payee::to_party( alice ), ada, make_constant( 100 ),
                          deposit_then_close( 1, 1000 ) ) ) );

   const quiescent_result result = reduce_contract_until_quiescent( env, s, c );
   BOOST_CHECK( result.continuation->is_when() );
   BOOST_CHECK_EQUAL( custody( result.new_state, result.payments, ada ), before );
   BOOST_CHECK_EQUAL( result.new_state.money_in_account( bob, ada ), 3 );
   BOOST_CHECK_EQUAL( result.warnings.size(), 1u );
}

BOOST_AUTO_TEST_CASE( steps_are_bounded_by_contract_size )
{
   const environment env( 2000, 3000 );
   state s = funded( alice, ada, 10 );
   s.set_money_in_account( bob, ada, 4 );
   const contract_ptr c = make_let( "a", make_constant( 1 ),
                          make_if( make_true(),
                                   make_assert( make_true(), deposit_then_close( 1, 1000 ) ),
                                   make_close() ) );

   const quiescent_result result = reduce_contract_until_quiescent( env, s, c );
   BOOST_CHECK( result.continuation->is_close() );
   BOOST_CHECK_LE( result.steps, contract_size( c ) + s.accounts.size() );
   BOOST_CHECK_EQUAL( result.steps, 4u + 2u );
}

BOOST_AUTO_TEST_CASE( step_limit_stops_reduction )
{
   const environment env( 0, 10 );
   const contract_ptr c = make_let( "a", make_constant( 1 ), make_let( "b", make_constant( 2 ), make_close() ) );

   BOOST_CHECK_NO_THROW( reduce_contract_until_quiescent( env, state(), c, 2 ) );
   BOOST_CHECK_THROW( reduce_contract_until_quiescent( env, state(), c, 1 ), reduction_step_limit_exceeded );
}

BOOST_AUTO_TEST_CASE( input_state_is_not_modified )
{
   const environment env( 0, 10 );
   const state s = funded( alice, ada, 30 );
   const state copy = s;
   reduce_contract_until_quiescent( env, s, make_pay( alice, payee::to_party( bob ), ada, make_constant( 10 ), make_close() ) );
   BOOST_CHECK( s == copy );
}

BOOST_AUTO_TEST_SUITE_END()
