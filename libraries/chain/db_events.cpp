// see LICENSE.txt

#include <cipherbook/chain/database.hpp>

namespace cipherbook { namespace chain {

const audit_event_object& database::emit_event( const audit_event& e )
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   FC_ASSERT( _undo_db.enabled(), "Audit events are only emitted by operations" );

   const audit_event_object& obj = create<audit_event_object>( [&]( audit_event_object& o ) {
      o.event     = e;
      o.timestamp = fc::time_point::now();
   });
   _pending_events.push_back( obj.id );
   return obj;
}

vector<audit_event_object> database::get_audit_events( const identity_type& who )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   vector<audit_event_object> result;
   flat_set<identity_type> impacted;
   for( const audit_event_object& obj : get_index_type<audit_event_index>().indices() )
   {
      impacted.clear();
      event_get_impacted_identities( obj.event, impacted );
      if( impacted.find( who ) != impacted.end() )
         result.push_back( obj );
   }
   return result;
}

vector<audit_event_object> database::get_audit_events( object_id_type start, uint32_t limit )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   vector<audit_event_object> result;
   const auto& by_ids = get_index_type<audit_event_index>().indices().get<by_id>();
   for( auto itr = by_ids.lower_bound( start ); itr != by_ids.end() && result.size() < limit; ++itr )
      result.push_back( *itr );
   return result;
}

} } // cipherbook::chain
