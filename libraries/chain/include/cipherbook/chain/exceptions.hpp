// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/exceptions.hpp>

namespace cipherbook { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3010000 )

   /// share or publish requested before the owner accumulated anything
   FC_DECLARE_DERIVED_EXCEPTION( no_total_yet_exception,       operation_evaluate_exception, 3010001 )

} } // cipherbook::chain
