// see LICENSE.txt

#pragma once

#include <cipherbook/chain/accumulator_parameters.hpp>
#include <cipherbook/chain/account_total_object.hpp>
#include <cipherbook/chain/audit_event_object.hpp>
#include <cipherbook/chain/capability_object.hpp>
#include <cipherbook/chain/evaluator.hpp>

#include <cipherbook/fhe/encryption_engine.hpp>

#include <cipherbook/protocol/operations.hpp>

#include <fc/log/logger.hpp>

#include <boost/signals2/signal.hpp>

#include <memory>
#include <mutex>
#include <tuple>

namespace cipherbook { namespace chain {

   class share_total_evaluator;
   class make_total_public_evaluator;

   /**
    * Invokes every connected handler even when an earlier one throws. A failing handler is logged;
    * it cannot turn a committed operation into a failure.
    */
   struct applied_event_combiner
   {
      typedef void result_type;

      template<typename InputIterator>
      void operator()( InputIterator first, InputIterator last )const
      {
         for( ; first != last; ++first )
         {
            try {
               *first;
            } catch( const fc::exception& e ) {
               elog( "Audit event handler failed: ${e}", ("e", e.to_detail_string()) );
            } catch( const std::exception& e ) {
               elog( "Audit event handler failed: ${e}", ("e", e.what()) );
            }
         }
      }
   };

   /**
    *   @class database
    *   @brief tracks the encrypted totals and the decrypt rights on them
    *
    *   All state changes go through push_operation, which serializes them behind one lock and
    *   runs each inside an undo session: an operation either applies completely or leaves no
    *   trace. The encryption engine is owned by the caller and must outlive the database.
    */
   class database
   {
      public:
         database( fhe::encryption_engine& engine, const accumulator_parameters& params );
         ~database();

         database( const database& ) = delete;
         database& operator=( const database& ) = delete;

         /**
          * Validates, evaluates and applies @p op atomically. Events it produced are broadcast
          * through applied_event after the changes are committed.
          *
          * @return the new total handle for submit_contribution_operation, void_result otherwise
          */
         operation_result push_operation( const operation& op );

         /**
          *  This signal is emitted for every audit event once the operation that produced it has
          *  been committed and the database lock released. Handlers may push further operations.
          *  Exceptions thrown by handlers are logged and do not reach the pusher.
          */
         boost::signals2::signal<void(const audit_event_object&), applied_event_combiner> applied_event;

         /// @{ @group Accumulator Store
         /** the current total of @p who, or the null handle if it never contributed */
         ciphertext_handle           get_total_handle( const identity_type& who )const;
         bool                        has_total( const identity_type& who )const;
         const account_total_object* find_account_total( const identity_type& who )const;
         size_t                      account_count()const;
         /// @}

         /// @{ @group Capability Controller, every grant is idempotent
         /** processing authority is recorded against the system identity of the parameters */
         void grant_processing_rights( const ciphertext_handle& handle );
         void grant_owner_rights( const ciphertext_handle& handle, const identity_type& owner );

         bool is_granted( const ciphertext_handle& handle, const identity_type& who )const;
         bool is_public( const ciphertext_handle& handle )const;
         bool has_processing_rights( const ciphertext_handle& handle )const;
         vector<capability_object> get_grants( const ciphertext_handle& handle )const;
         /** handles @p who was personally granted, oldest grant first; public handles are not listed */
         vector<ciphertext_handle> get_handles_granted_to( const identity_type& who )const;
         /// @}

         /// @{ @group Audit log
         const audit_event_object&  emit_event( const audit_event& e );
         /** every event naming @p who, oldest first */
         vector<audit_event_object> get_audit_events( const identity_type& who )const;
         vector<audit_event_object> get_audit_events( object_id_type start, uint32_t limit )const;
         /// @}

         fhe::encryption_engine&       engine()const { return _engine; }
         const accumulator_parameters& get_parameters()const { return _parameters; }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            return std::get<IndexType>( _indexes );
         }

         template<typename ObjectType, typename Constructor>
         const ObjectType& create( Constructor&& con )
         {
            return std::get< typename db::object_index<ObjectType>::type >( _indexes )
                      .create( std::forward<Constructor>( con ) );
         }

         template<typename ObjectType, typename Modifier>
         void modify( const ObjectType& obj, Modifier&& m )
         {
            std::get< typename db::object_index<ObjectType>::type >( _indexes )
               .modify( obj, std::forward<Modifier>( m ) );
         }

      private:
         friend class share_total_evaluator;
         friend class make_total_public_evaluator;

         /// only reachable through the share and publish operations, which check ownership
         void grant_viewer_rights( const ciphertext_handle& handle, const identity_type& viewer );
         void grant_public_rights( const ciphertext_handle& handle );

         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[ operation::tag<typename EvaluatorType::operation_type>::value ]
               .reset( new op_evaluator_impl<EvaluatorType>() );
         }

         operation_result apply_operation( const operation& op );
         void             grant_capability( const ciphertext_handle& handle, grantee_kind kind,
                                            const identity_type& grantee );
         bool             find_capability( const ciphertext_handle& handle, grantee_kind kind,
                                           const identity_type& grantee )const;

         fhe::encryption_engine&                     _engine;
         const accumulator_parameters                _parameters;

         mutable std::recursive_mutex                _mutex;
         db::undo_database                           _undo_db;
         std::tuple< account_total_index,
                     capability_index,
                     audit_event_index >             _indexes;

         vector< std::unique_ptr<op_evaluator> >     _operation_evaluators;

         /// events of the operation being applied, broadcast once it commits
         vector<object_id_type>                      _pending_events;
   };

} } // cipherbook::chain
