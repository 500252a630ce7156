// see LICENSE.txt

#include <cipherbook/chain/database.hpp>

namespace cipherbook { namespace chain {

const account_total_object* database::find_account_total( const identity_type& who )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   const auto& by_owners = get_index_type<account_total_index>().indices().get<by_owner>();
   auto itr = by_owners.find( who );
   if( itr == by_owners.end() )
      return nullptr;
   return &*itr;
}

ciphertext_handle database::get_total_handle( const identity_type& who )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   const account_total_object* account = find_account_total( who );
   return account ? account->current_handle() : ciphertext_handle();
}

bool database::has_total( const identity_type& who )const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   const account_total_object* account = find_account_total( who );
   return account && account->has_total;
}

size_t database::account_count()const
{
   std::lock_guard<std::recursive_mutex> lock( _mutex );
   return get_index_type<account_total_index>().size();
}

} } // cipherbook::chain
