// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/capability.hpp>
#include <cipherbook/protocol/contribution.hpp>

namespace cipherbook { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            submit_contribution_operation,  // 0
            share_total_operation,
            make_total_public_operation
         > operation;

   /// @} // operations group

   /**
    *  Performs stateless validation of the operation, throws an exception derived from
    *  operation_validate_exception if it fails.
    */
   void operation_validate( const operation& op );

   /// The identity on whose behalf the operation is submitted
   identity_type operation_submitter( const operation& op );

} } // cipherbook::protocol
