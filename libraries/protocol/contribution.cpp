// see LICENSE.txt

#include <cipherbook/protocol/contribution.hpp>
#include <cipherbook/protocol/exceptions.hpp>

namespace cipherbook { namespace protocol {

void submit_contribution_operation::validate()const
{
   CIPHERBOOK_ASSERT( !caller.is_null(), invalid_identity_exception,
                      "Contribution submitted by the null identity", ("caller", caller) );
   CIPHERBOOK_ASSERT( !proof.empty(), invalid_proof_exception,
                      "Contribution from ${c} carries an empty proof", ("c", caller) );
   CIPHERBOOK_ASSERT( !contribution.empty(), invalid_proof_exception,
                      "Contribution from ${c} carries an empty ciphertext", ("c", caller) );
}

} } // cipherbook::protocol
