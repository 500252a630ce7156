// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/operations.hpp>

namespace cipherbook { namespace chain {

   using namespace cipherbook::protocol;

   class database;

   class generic_evaluator
   {
      public:
         virtual ~generic_evaluator(){}

         virtual int get_type()const = 0;

         /**
          * Checks the operation against the current state and, if @p apply is set, applies it.
          * Must be called while the database write lock and an undo session are held.
          */
         virtual operation_result start_evaluate( database& d, const operation& op, bool apply );

         virtual operation_result evaluate( const operation& op ) = 0;
         virtual operation_result apply( const operation& op ) = 0;

         database& db()const;

      protected:
         database* _db = nullptr;
   };

   class op_evaluator
   {
      public:
         virtual ~op_evaluator(){}
         virtual operation_result evaluate( database& d, const operation& op, bool apply ) = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
      public:
         virtual operation_result evaluate( database& d, const operation& o, bool apply = true ) override
         {
            T eval;
            return eval.start_evaluate( d, o, apply );
         }
   };

   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
      public:
         virtual int get_type()const override
         {
            return operation::tag<typename DerivedEvaluator::operation_type>::value;
         }

         virtual operation_result evaluate( const operation& o ) final override
         {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();
            return eval->do_evaluate( op );
         }

         virtual operation_result apply( const operation& o ) final override
         {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();
            return eval->do_apply( op );
         }
   };

} } // cipherbook::chain
