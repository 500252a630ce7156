// see LICENSE.txt

#include <cipherbook/chain/evaluator.hpp>
#include <cipherbook/chain/database.hpp>

namespace cipherbook { namespace chain {

   database& generic_evaluator::db()const
   {
      FC_ASSERT( _db != nullptr, "Evaluator used outside of push_operation" );
      return *_db;
   }

   operation_result generic_evaluator::start_evaluate( database& d, const operation& op, bool apply )
   { try {
      _db = &d;
      operation_result result = evaluate( op );
      if( apply )
         result = this->apply( op );
      return result;
   } FC_CAPTURE_AND_RETHROW() }

} } // cipherbook::chain
