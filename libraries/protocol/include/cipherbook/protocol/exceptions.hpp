// see LICENSE.txt

#pragma once

#include <fc/exception/exception.hpp>

#define CIPHERBOOK_ASSERT( expr, exc_type, FORMAT, ... )             \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace cipherbook { namespace protocol {

   FC_DECLARE_EXCEPTION( protocol_exception, 4000000 )

   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception, protocol_exception, 4010000 )

   FC_DECLARE_DERIVED_EXCEPTION( invalid_proof_exception,      operation_validate_exception, 4010001 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_viewer_exception,     operation_validate_exception, 4010002 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_identity_exception,   operation_validate_exception, 4010003 )

} } // cipherbook::protocol
