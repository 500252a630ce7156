// see LICENSE.txt

#include <cipherbook/chain/exceptions.hpp>

namespace cipherbook { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "accumulator exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3010000,
                                   "operation evaluation exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( no_total_yet_exception, operation_evaluate_exception, 3010001,
                                   "identity has no total yet" )

} } // cipherbook::chain
