// see LICENSE.txt

#include <cipherbook/app/api.hpp>

#include <cipherbook/protocol/exceptions.hpp>

#include <fc/string.hpp>

#include <algorithm>

namespace cipherbook { namespace app {

    accumulator_api::accumulator_api( database& db, const identity_type& caller )
    :_db(db), _caller(caller)
    {
       CIPHERBOOK_ASSERT( !_caller.is_null(), invalid_identity_exception,
                          "An accumulator session needs an authenticated caller", ("caller", caller) );
    }

    accumulator_api::~accumulator_api() { }

    ciphertext_handle accumulator_api::submit_contribution( const external_ciphertext& contribution,
                                                            const input_proof& proof )
    {
       submit_contribution_operation op;
       op.caller       = _caller;
       op.contribution = contribution;
       op.proof        = proof;
       operation_result result = _db.push_operation( op );
       return result.get<ciphertext_handle>();
    }

    ciphertext_handle accumulator_api::get_my_total_handle()const
    {
       return _db.get_total_handle( _caller );
    }

    ciphertext_handle accumulator_api::get_total_handle_of( const identity_type& target )const
    {
       return _db.get_total_handle( target );
    }

    void accumulator_api::make_total_public()
    {
       make_total_public_operation op;
       op.owner = _caller;
       _db.push_operation( op );
    }

    void accumulator_api::share_total( const identity_type& viewer )
    {
       share_total_operation op;
       op.owner  = _caller;
       op.viewer = viewer;
       _db.push_operation( op );
    }

    vector<audit_event_object> accumulator_api::get_audit_events( const identity_type& who )const
    {
       return _db.get_audit_events( who );
    }

    vector<ciphertext_handle> accumulator_api::get_granted_handles()const
    {
       return _db.get_handles_granted_to( _caller );
    }

    void accumulator_api::subscribe_to_events( event_callback cb )
    {
       {
          std::lock_guard<std::mutex> lock( _callback_mutex );
          _event_callback = cb;
       }
       _applied_event_connection = _db.applied_event.connect( [this]( const audit_event_object& e ) {
          on_applied_event( e );
       });
    }

    void accumulator_api::unsubscribe_from_events()
    {
       _applied_event_connection.disconnect();
       std::lock_guard<std::mutex> lock( _callback_mutex );
       _event_callback = event_callback();
    }

    void accumulator_api::on_applied_event( const audit_event_object& e )
    {
       event_callback callback;
       {
          std::lock_guard<std::mutex> lock( _callback_mutex );
          callback = _event_callback;
       }
       if( !callback )
          return;
       flat_set<identity_type> impacted;
       event_get_impacted_identities( e.event, impacted );
       if( impacted.find( _caller ) != impacted.end() )
          callback( e );
    }

    uint64_t parse_amount( const std::string& text )
    {
       FC_ASSERT( !text.empty() && std::all_of( text.begin(), text.end(), []( char c ) { return c >= '0' && c <= '9'; } ),
                  "Amount must be a non-negative decimal integer, got '${a}'", ("a", text) );
       return fc::to_uint64( text );
    }

} } // cipherbook::app
