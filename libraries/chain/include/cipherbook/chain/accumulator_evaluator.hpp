// see LICENSE.txt

#pragma once

#include <cipherbook/chain/evaluator.hpp>
#include <cipherbook/fhe/encryption_engine.hpp>

namespace cipherbook { namespace chain {

   class account_total_object;

   class submit_contribution_evaluator : public evaluator<submit_contribution_evaluator>
   {
      public:
         typedef submit_contribution_operation operation_type;

         void_result       do_evaluate( const submit_contribution_operation& op );
         ciphertext_handle do_apply( const submit_contribution_operation& op );

         const account_total_object* account_ptr = nullptr;
         fhe::internal_ciphertext    validated;
   };

} } // cipherbook::chain
