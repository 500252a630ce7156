// see LICENSE.txt

#include <cipherbook/protocol/operations.hpp>

namespace cipherbook { namespace protocol {

/**
 * @brief Used to validate operations in a polymorphic manner
 */
struct operation_validator
{
   typedef void result_type;
   template<typename T>
   void operator()( const T& v )const { v.validate(); }
};

struct operation_get_submitter
{
   typedef identity_type result_type;
   template<typename T>
   identity_type operator()( const T& v )const { return v.submitter(); }
};

void operation_validate( const operation& op )
{
   op.visit( operation_validator() );
}

identity_type operation_submitter( const operation& op )
{
   return op.visit( operation_get_submitter() );
}

} } // namespace cipherbook::protocol
