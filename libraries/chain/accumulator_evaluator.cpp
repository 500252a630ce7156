// see LICENSE.txt

#include <cipherbook/chain/accumulator_evaluator.hpp>
#include <cipherbook/chain/account_total_object.hpp>
#include <cipherbook/chain/database.hpp>
#include <cipherbook/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace cipherbook { namespace chain {

void_result submit_contribution_evaluator::do_evaluate( const submit_contribution_operation& op )
{ try {
   database& d = db();
   const accumulator_parameters& params = d.get_parameters();

   CIPHERBOOK_ASSERT( op.contribution.size() <= params.max_ciphertext_size, invalid_proof_exception,
                      "Contribution of ${s} bytes exceeds the limit of ${m}",
                      ("s", op.contribution.size())("m", params.max_ciphertext_size) );
   CIPHERBOOK_ASSERT( op.proof.size() <= params.max_proof_size, invalid_proof_exception,
                      "Proof of ${s} bytes exceeds the limit of ${m}",
                      ("s", op.proof.size())("m", params.max_proof_size) );

   account_ptr = d.find_account_total( op.caller );
   validated = d.engine().verify_and_decode( op.contribution, op.proof, op.caller );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op.caller) ) }

ciphertext_handle submit_contribution_evaluator::do_apply( const submit_contribution_operation& op )
{ try {
   database& d = db();
   fhe::encryption_engine& engine = d.engine();

   const fhe::internal_ciphertext current = ( account_ptr && account_ptr->has_total )
                                            ? engine.from_external_handle( account_ptr->total )
                                            : engine.encrypt_zero();

   const ciphertext_handle contribution_handle = engine.to_external_handle( validated );
   const ciphertext_handle new_total = engine.to_external_handle( engine.add( current, validated ) );

   d.grant_processing_rights( new_total );
   d.grant_owner_rights( new_total, op.caller );

   const audit_event_object& event = d.emit_event( contribution_accepted_event{ op.caller, contribution_handle, new_total } );

   auto update = [&]( account_total_object& a ) {
      a.total     = new_total;
      a.has_total = true;
      ++a.contribution_count;
      a.last_update = event.id;
   };

   if( account_ptr == nullptr )
   {
      d.create<account_total_object>( [&]( account_total_object& a ) {
         a.owner = op.caller;
         update( a );
      });
   }
   else
      d.modify( *account_ptr, update );

   dlog( "Accepted contribution ${c} from ${who}, total is now ${t}",
         ("c", contribution_handle)("who", op.caller)("t", new_total) );
   return new_total;
} FC_CAPTURE_AND_RETHROW( (op.caller) ) }

} } // cipherbook::chain
