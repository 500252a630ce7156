// see LICENSE.txt

#include <cipherbook/protocol/exceptions.hpp>

namespace cipherbook { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception, protocol_exception, 4010000,
                                   "operation validation exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_proof_exception, operation_validate_exception, 4010001,
                                   "invalid contribution proof" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_viewer_exception, operation_validate_exception, 4010002,
                                   "invalid viewer" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_identity_exception, operation_validate_exception, 4010003,
                                   "invalid identity" )

} } // cipherbook::protocol
