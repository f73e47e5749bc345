#pragma once

#include <fc/exception/exception.hpp>

namespace marlowe { namespace semantics {

FC_DECLARE_EXCEPTION(         semantics_exception,                                                       40000, "Semantics Exception" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_contract_encoding,        marlowe::semantics::semantics_exception, 40001, "invalid contract encoding" );
FC_DECLARE_DERIVED_EXCEPTION( unresolved_continuation,          marlowe::semantics::semantics_exception, 40002, "unresolved merkleized continuation" );
FC_DECLARE_DERIVED_EXCEPTION( reduction_step_limit_exceeded,    marlowe::semantics::semantics_exception, 40003, "reduction step limit exceeded" );

FC_DECLARE_EXCEPTION(         transaction_error,                                                         41000, "Transaction Error" );
FC_DECLARE_DERIVED_EXCEPTION( ambiguous_time_interval,          marlowe::semantics::transaction_error,   41001, "ambiguous time interval" );
FC_DECLARE_DERIVED_EXCEPTION( apply_no_match,                   marlowe::semantics::transaction_error,   41002, "input does not match any case" );
FC_DECLARE_DERIVED_EXCEPTION( hash_mismatch,                    marlowe::semantics::transaction_error,   41003, "merkleized continuation hash mismatch" );
FC_DECLARE_DERIVED_EXCEPTION( malformed_call,                   marlowe::semantics::transaction_error,   41004, "contract is not waiting for input" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_interval,                 marlowe::semantics::transaction_error,   41005, "invalid time interval" );
FC_DECLARE_DERIVED_EXCEPTION( interval_in_past,                 marlowe::semantics::transaction_error,   41006, "time interval is in the past" );
FC_DECLARE_DERIVED_EXCEPTION( useless_transaction,              marlowe::semantics::transaction_error,   41007, "useless transaction" );

} } // marlowe::semantics
