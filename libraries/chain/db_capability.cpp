// see LICENSE.txt

#include <cipherbook/chain/database.hpp>

#include <cipherbook/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace cipherbook { namespace chain {

bool database::find_capability( const ciphertext_handle& handle, grantee_kind kind,
                                const identity_type& grantee )const
{
   const auto& idx = get_index_type<capability_index>().indices().get<by_handle_grantee>();
   return idx.find( boost::make_tuple( handle, kind, grantee ) ) != idx.end();
}

void database::grant_capability( const ciphertext_handle& handle, grantee_kind kind,
                                 const identity_type& grantee )
{ try {
   FC_ASSERT( !is_null_handle( handle ), "Cannot grant rights on the null handle" );

   std::lock_guard<std::recursive_mutex> lock( _mutex );
   if( find_capability( handle, kind, grantee ) )
      return;

   // the engine rejects unknown handles, so ask it first
   switch( kind )
   {
      case processing_grantee:
         _engine.grant_processing_authority( handle );
         break;
      case identity_grantee:
         _engine.grant_decrypt_rights( handle, grantee );
         break;
      case public_grantee:
         _engine.grant_public_decrypt( handle );
         break;
   }

   create<capability_object>( [&]( capability_object& c ) {
      c.handle  = handle;
      c.kind    = kind;
      c.grantee = grantee;
   });
} FC_CAPTURE_AND_RETHROW( (handle)(kind)(grantee) ) }

void database::grant_processing_rights( const ciphertext_handle& handle )
{
   grant_capability( handle, processing_grantee, _parameters.system_identity );
}

void database::grant_owner_rights( const ciphertext_handle& handle, const identity_type& owner )
{
   FC_ASSERT( !owner.is_null() );
   grant_capability( handle, identity_grantee, owner );
}

void database::grant_viewer_rights( const ciphertext_handle& handle, const identity_type& viewer )
{
   CIPHERBOOK_ASSERT( !viewer.is_null(), invalid_viewer_exception,
                      "Cannot grant ${h} to the null identity", ("h", handle) );
   grant_capability( handle, identity_grantee, viewer );
   dlog( "Granted ${v} decrypt rights on ${h}", ("v", viewer)("h", handle) );
}

void database::grant_public_rights( const ciphertext_handle& handle )
{
   grant_capability( handle, public_grantee, identity_type() );
   ilog( "Handle ${h} is now public", ("h", handle) );
}

bool database::is_granted( const ciphertext_handle& handle, const identity_type& who )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   return find_capability( handle, public_grantee, identity_type() )
       || ( !who.is_null() && find_capability( handle, identity_grantee, who ) );
}

bool database::is_public( const ciphertext_handle& handle )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   return find_capability( handle, public_grantee, identity_type() );
}

bool database::has_processing_rights( const ciphertext_handle& handle )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   return find_capability( handle, processing_grantee, _parameters.system_identity );
}

vector<capability_object> database::get_grants( const ciphertext_handle& handle )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   const auto& idx = get_index_type<capability_index>().indices().get<by_handle_grantee>();
   vector<capability_object> result;
   for( auto itr = idx.lower_bound( boost::make_tuple( handle ) );
        itr != idx.end() && itr->handle == handle; ++itr )
      result.push_back( *itr );
   return result;
}

vector<ciphertext_handle> database::get_handles_granted_to( const identity_type& who )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   vector<ciphertext_handle> result;
   if( who.is_null() )
      return result;
   const auto& idx = get_index_type<capability_index>().indices().get<by_grantee>();
   for( auto itr = idx.lower_bound( boost::make_tuple( who ) );
        itr != idx.end() && itr->grantee == who; ++itr )
      if( itr->kind == identity_grantee )
         result.push_back( itr->handle );
   return result;
}

} } // cipherbook::chain
