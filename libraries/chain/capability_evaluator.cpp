// see LICENSE.txt

#include <cipherbook/chain/capability_evaluator.hpp>
#include <cipherbook/chain/account_total_object.hpp>
#include <cipherbook/chain/database.hpp>
#include <cipherbook/chain/exceptions.hpp>

namespace cipherbook { namespace chain {

void_result share_total_evaluator::do_evaluate( const share_total_operation& op )
{ try {
   account_ptr = db().find_account_total( op.owner );
   CIPHERBOOK_ASSERT( account_ptr && account_ptr->has_total, no_total_yet_exception,
                      "${o} has no total to share", ("o", op.owner) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result share_total_evaluator::do_apply( const share_total_operation& op )
{ try {
   database& d = db();
   const ciphertext_handle handle = account_ptr->total;

   d.grant_viewer_rights( handle, op.viewer );
   d.emit_event( total_shared_event{ op.owner, op.viewer, handle } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

///////////////////////////////////////////////////////////////////////////

void_result make_total_public_evaluator::do_evaluate( const make_total_public_operation& op )
{ try {
   account_ptr = db().find_account_total( op.owner );
   CIPHERBOOK_ASSERT( account_ptr && account_ptr->has_total, no_total_yet_exception,
                      "${o} has no total to publish", ("o", op.owner) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result make_total_public_evaluator::do_apply( const make_total_public_operation& op )
{ try {
   database& d = db();
   const ciphertext_handle handle = account_ptr->total;

   d.grant_public_rights( handle );
   d.emit_event( total_made_public_event{ op.owner, handle } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // cipherbook::chain
