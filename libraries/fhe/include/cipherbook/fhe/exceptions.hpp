// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/exceptions.hpp>

namespace cipherbook { namespace fhe {

   FC_DECLARE_EXCEPTION( fhe_exception, 5000000 )

   FC_DECLARE_DERIVED_EXCEPTION( decryption_denied_exception,    fhe_exception, 5000001 )
   FC_DECLARE_DERIVED_EXCEPTION( processing_denied_exception,    fhe_exception, 5000002 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_handle_exception,       fhe_exception, 5000003 )
   FC_DECLARE_DERIVED_EXCEPTION( plaintext_overflow_exception,   fhe_exception, 5000004 )
   FC_DECLARE_DERIVED_EXCEPTION( malformed_ciphertext_exception, fhe_exception, 5000005 )

} } // cipherbook::fhe
