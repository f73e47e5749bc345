#pragma once

#include <fc/optional.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace marlowe { namespace semantics {

    typedef boost::multiprecision::cpp_int  integer_type;
    typedef int64_t                         timeout_type;   ///< milliseconds since the POSIX epoch
    typedef std::string                     value_id_type;
    typedef std::string                     contract_hash_type;

    using std::string;
    using std::map;
    using std::set;
    using std::vector;
    using std::pair;
    using std::shared_ptr;
    using fc::variant;
    using fc::variant_object;
    using fc::mutable_variant_object;
    using fc::optional;

} } // marlowe::semantics

namespace fc
{
   /** integers that fit in 64 bits are numbers, anything wider is a decimal string */
   void to_variant( const marlowe::semantics::integer_type& var, variant& vo );
   void from_variant( const variant& var, marlowe::semantics::integer_type& vo );
}
