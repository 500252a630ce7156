// see LICENSE.txt

#include <cipherbook/chain/database.hpp>

#include <cipherbook/chain/accumulator_evaluator.hpp>
#include <cipherbook/chain/capability_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace cipherbook { namespace chain {

database::database( fhe::encryption_engine& engine, const accumulator_parameters& params )
   : _engine( engine ),
     _parameters( params ),
     _indexes( _undo_db, _undo_db, _undo_db )
{ try {
   _parameters.validate();
   FC_ASSERT( _engine.domain() == _parameters.domain,
              "Engine verifies proofs for domain ${e} but the accumulator expects ${d}",
              ("e", _engine.domain())("d", _parameters.domain) );
   initialize_evaluators();
   ilog( "Accumulator ${s} opened for domain ${d}",
         ("s", _parameters.system_identity)("d", _parameters.domain) );
} FC_CAPTURE_AND_RETHROW( (params) ) }

database::~database()
{
   applied_event.disconnect_all_slots();
}

void database::initialize_evaluators()
{
   _operation_evaluators.resize( operation::count() );
   register_evaluator<submit_contribution_evaluator>();
   register_evaluator<share_total_evaluator>();
   register_evaluator<make_total_public_evaluator>();
}

operation_result database::push_operation( const operation& op )
{ try {
   operation_result           result;
   vector<audit_event_object> committed;
   {
      std::lock_guard<std::recursive_mutex> lock( _mutex );
      FC_ASSERT( !_undo_db.enabled(), "Operations cannot be pushed from within another operation" );

      _pending_events.clear();
      try {
         operation_validate( op );

         auto session = _undo_db.start_undo_session();
         result = apply_operation( op );
         session.commit();
      } catch( const fc::exception& e ) {
         _pending_events.clear();
         wlog( "Rejected operation from ${who}: ${e}",
               ("who", operation_submitter( op ))("e", e.to_string()) );
         throw;
      }

      const auto& events = get_index_type<audit_event_index>();
      committed.reserve( _pending_events.size() );
      for( object_id_type id : _pending_events )
         committed.push_back( events.get( id ) );
      _pending_events.clear();
   }

   // handlers may push operations of their own
   for( const audit_event_object& e : committed )
      applied_event( e );

   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result database::apply_operation( const operation& op )
{
   int64_t i_which = op.which();
   FC_ASSERT( i_which >= 0 && uint64_t( i_which ) < _operation_evaluators.size(),
              "No registered evaluator for operation ${op}", ("op", op) );
   std::unique_ptr<op_evaluator>& eval = _operation_evaluators[ i_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op", op) );
   return eval->evaluate( *this, op, true );
}

} } // cipherbook::chain
