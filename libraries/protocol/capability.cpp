// see LICENSE.txt

#include <cipherbook/protocol/capability.hpp>
#include <cipherbook/protocol/exceptions.hpp>

namespace cipherbook { namespace protocol {

void share_total_operation::validate()const
{
   CIPHERBOOK_ASSERT( !owner.is_null(), invalid_identity_exception,
                      "Total shared by the null identity", ("owner", owner) );
   CIPHERBOOK_ASSERT( !viewer.is_null(), invalid_viewer_exception,
                      "Cannot share a total with the null identity", ("owner", owner) );
   // the owner already holds decrypt rights on every total it owns
   CIPHERBOOK_ASSERT( viewer != owner, invalid_viewer_exception,
                      "Owner ${o} cannot share a total with itself", ("o", owner) );
}

void make_total_public_operation::validate()const
{
   CIPHERBOOK_ASSERT( !owner.is_null(), invalid_identity_exception,
                      "Total published by the null identity", ("owner", owner) );
}

} } // cipherbook::protocol
