// see LICENSE.txt

#pragma once

#include <cipherbook/chain/evaluator.hpp>

namespace cipherbook { namespace chain {

   class account_total_object;

   class share_total_evaluator : public evaluator<share_total_evaluator>
   {
      public:
         typedef share_total_operation operation_type;

         void_result do_evaluate( const share_total_operation& op );
         void_result do_apply( const share_total_operation& op );

         const account_total_object* account_ptr = nullptr;
   };

   class make_total_public_evaluator : public evaluator<make_total_public_evaluator>
   {
      public:
         typedef make_total_public_operation operation_type;

         void_result do_evaluate( const make_total_public_operation& op );
         void_result do_apply( const make_total_public_operation& op );

         const account_total_object* account_ptr = nullptr;
   };

} } // cipherbook::chain
