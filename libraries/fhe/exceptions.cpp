// see LICENSE.txt

#include <cipherbook/fhe/exceptions.hpp>

namespace cipherbook { namespace fhe {

   FC_IMPLEMENT_EXCEPTION( fhe_exception, 5000000, "encryption engine exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( decryption_denied_exception, fhe_exception, 5000001,
                                   "decryption denied" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( processing_denied_exception, fhe_exception, 5000002,
                                   "handle not authorized for processing" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_handle_exception, fhe_exception, 5000003,
                                   "unknown ciphertext handle" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( plaintext_overflow_exception, fhe_exception, 5000004,
                                   "plaintext exceeds 64 bits" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( malformed_ciphertext_exception, fhe_exception, 5000005,
                                   "malformed ciphertext" )

} } // cipherbook::fhe
