// see LICENSE.txt

#pragma once

#include <cipherbook/chain/types.hpp>

namespace cipherbook { namespace chain {

   enum grantee_kind
   {
      processing_grantee, ///< the accumulator itself may use the handle as an operand
      identity_grantee,   ///< one identity may decrypt
      public_grantee      ///< anyone may decrypt
   };

   /**
    * @class capability_object
    * @ingroup object
    *
    * One decrypt or processing right on one handle. Grants are never modified or removed. For
    * processing grants @ref grantee is the accumulator's system identity, for public grants it is
    * the null identity.
    */
   class capability_object : public object
   {
      public:
         ciphertext_handle handle;
         grantee_kind      kind = identity_grantee;
         identity_type     grantee;
   };

   struct by_handle_grantee;
   struct by_grantee;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      capability_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_handle_grantee>,
            composite_key< capability_object,
               member< capability_object, ciphertext_handle, &capability_object::handle >,
               member< capability_object, grantee_kind, &capability_object::kind >,
               member< capability_object, identity_type, &capability_object::grantee >
            >
         >,
         ordered_non_unique< tag<by_grantee>,
            composite_key< capability_object,
               member< capability_object, identity_type, &capability_object::grantee >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > capability_multi_index_type;

   typedef generic_index<capability_object, capability_multi_index_type> capability_index;

} } // cipherbook::chain

CIPHERBOOK_MAP_OBJECT_TO_INDEX( cipherbook::chain::capability_object, cipherbook::chain::capability_index )

FC_REFLECT_ENUM( cipherbook::chain::grantee_kind, (processing_grantee)(identity_grantee)(public_grantee) )

FC_REFLECT_DERIVED( cipherbook::chain::capability_object, (cipherbook::db::object),
                    (handle)
                    (kind)
                    (grantee) )
