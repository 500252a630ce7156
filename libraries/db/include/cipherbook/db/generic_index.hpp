// see LICENSE.txt

#pragma once

#include <cipherbook/db/object.hpp>
#include <cipherbook/db/undo_database.hpp>

#include <fc/exception/exception.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace cipherbook { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   /**
    *  @class generic_index
    *  @brief stores objects of one type in a boost::multi_index_container
    *
    *  The first index of MultiIndexType must be ordered_unique<tag<by_id>, ...> on object::id.
    *  Objects are only ever created or modified through the index so that every change can be
    *  reverted by the undo_database.
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index
   {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType     object_type;

         explicit generic_index( undo_database& undo_db ):_undo_db(undo_db){}

         generic_index( const generic_index& ) = delete;
         generic_index& operator=( const generic_index& ) = delete;

         template<typename Constructor>
         const object_type& create( Constructor&& constructor )
         {
            object_type item;
            constructor( item );
            item.id = _next_id;

            auto insert_result = _indices.insert( std::move( item ) );
            FC_ASSERT( insert_result.second, "Could not create object, most likely a uniqueness constraint was violated" );
            ++_next_id;

            const object_id_type new_id = insert_result.first->id;
            _undo_db.on_undo( [this, new_id]() {
               _indices.template get<by_id>().erase( new_id );
               _next_id = new_id;
            });
            return *insert_result.first;
         }

         template<typename Modifier>
         void modify( const object_type& obj, Modifier&& m )
         {
            object_type backup = obj;
            _undo_db.on_undo( [this, backup]() {
               auto& by_ids = _indices.template get<by_id>();
               auto itr = by_ids.find( backup.id );
               if( itr != by_ids.end() )
                  by_ids.replace( itr, backup );
               else
                  by_ids.insert( backup );
            });

            auto ok = _indices.modify( _indices.iterator_to( obj ), [&m]( object_type& o ) { m( o ); } );
            FC_ASSERT( ok, "Could not modify object, most likely a uniqueness constraint was violated" );
         }

         const object_type* find( object_id_type id )const
         {
            const auto& by_ids = _indices.template get<by_id>();
            auto itr = by_ids.find( id );
            if( itr == by_ids.end() )
               return nullptr;
            return &*itr;
         }

         const object_type& get( object_id_type id )const
         {
            const object_type* result = find( id );
            FC_ASSERT( result != nullptr, "Unable to find object ${id}", ("id", id) );
            return *result;
         }

         const index_type& indices()const      { return _indices; }
         size_t            size()const         { return _indices.size(); }
         object_id_type    get_next_id()const  { return _next_id; }

      private:
         undo_database& _undo_db;
         index_type     _indices;
         object_id_type _next_id = 0;
   };

} } // cipherbook::db
