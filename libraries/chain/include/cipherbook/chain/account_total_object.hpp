// see LICENSE.txt

#pragma once

#include <cipherbook/chain/types.hpp>

namespace cipherbook { namespace chain {

   /**
    * @class account_total_object
    * @ingroup object
    *
    * Encrypted running total of one identity. Created by the first accepted contribution of
    * @ref owner and never removed.
    */
   class account_total_object : public object
   {
      public:
         identity_type     owner;

         /// meaningful only when has_total is set
         ciphertext_handle total;

         /// flips to true with the first accepted contribution and stays true
         bool              has_total = false;

         uint64_t          contribution_count = 0;

         /// id of the audit event that recorded the latest contribution
         object_id_type    last_update = 0;

         /** the total if there is one, the null handle otherwise */
         ciphertext_handle current_handle()const
         {
            return has_total ? total : ciphertext_handle();
         }
   };

   struct by_owner;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_total_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< account_total_object, identity_type, &account_total_object::owner > >
      >
   > account_total_multi_index_type;

   typedef generic_index<account_total_object, account_total_multi_index_type> account_total_index;

} } // cipherbook::chain

CIPHERBOOK_MAP_OBJECT_TO_INDEX( cipherbook::chain::account_total_object, cipherbook::chain::account_total_index )

FC_REFLECT_DERIVED( cipherbook::chain::account_total_object, (cipherbook::db::object),
                    (owner)
                    (total)
                    (has_total)
                    (contribution_count)
                    (last_update) )
