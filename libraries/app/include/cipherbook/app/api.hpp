// see LICENSE.txt

#pragma once

#include <cipherbook/chain/database.hpp>

#include <boost/signals2/connection.hpp>

#include <functional>
#include <mutex>
#include <string>

namespace cipherbook { namespace app {

   using namespace cipherbook::chain;

   /**
    * @brief The accumulator_api class exposes the accumulator to one authenticated caller
    *
    * The caller identity is bound at construction by whatever authenticated the session; every
    * mutating call acts on behalf of that identity only.
    */
   class accumulator_api
   {
      public:
         typedef std::function<void(const audit_event_object&)> event_callback;

         accumulator_api( database& db, const identity_type& caller );
         ~accumulator_api();

         /**
          * @brief Folds an encrypted contribution into the caller's total
          * @param contribution ciphertext encrypted under the engine's public key
          * @param proof attests that @p contribution was produced for the caller
          * @return the caller's new total handle, decryptable by the caller only
          */
         ciphertext_handle submit_contribution( const external_ciphertext& contribution, const input_proof& proof );

         /** @return the caller's current total, or the null handle before the first contribution */
         ciphertext_handle get_my_total_handle()const;

         ciphertext_handle get_total_handle_of( const identity_type& target )const;

         /** Irrevocably lets anyone decrypt the caller's current total */
         void make_total_public();

         /** Lets @p viewer decrypt the caller's current total, but none of its later totals */
         void share_total( const identity_type& viewer );

         vector<audit_event_object> get_audit_events( const identity_type& who )const;

         /** totals of any identity the caller was allowed to decrypt, including its own */
         vector<ciphertext_handle> get_granted_handles()const;

         /**
          * @brief Register a callback handle which then can be used to observe committed events
          * naming the caller. A new subscription replaces the previous one. The callback runs on
          * the thread that pushed the operation, after the database lock is released.
          */
         void subscribe_to_events( event_callback cb );
         void unsubscribe_from_events();

         const identity_type& caller()const { return _caller; }

      private:
         void on_applied_event( const audit_event_object& e );

         database&                           _db;
         identity_type                       _caller;
         mutable std::mutex                  _callback_mutex;
         event_callback                      _event_callback;
         boost::signals2::scoped_connection  _applied_event_connection;
   };

   /**
    * Parses a plain decimal amount. Signs, blanks and anything else that is not a digit are
    * rejected so that "-5" cannot wrap to a huge contribution.
    */
   uint64_t parse_amount( const std::string& text );

} } // cipherbook::app
