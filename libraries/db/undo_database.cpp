// see LICENSE.txt

#include <cipherbook/db/undo_database.hpp>

#include <fc/exception/exception.hpp>

namespace cipherbook { namespace db {

undo_database::session::~session()
{
   if( _apply_undo )
      _db.undo();
}

void undo_database::session::commit()
{
   if( _apply_undo )
      _db.commit();
   _apply_undo = false;
}

void undo_database::session::undo()
{
   if( _apply_undo )
      _db.undo();
   _apply_undo = false;
}

undo_database::session undo_database::start_undo_session()
{
   FC_ASSERT( !_active, "Undo sessions do not nest" );
   _active = true;
   return session( *this );
}

void undo_database::on_undo( std::function<void()> restore )
{
   if( !_active )
      return;
   _restore_actions.emplace_back( std::move( restore ) );
}

void undo_database::undo()
{
   // stop recording first, restore actions go through the indexes too
   _active = false;
   for( auto itr = _restore_actions.rbegin(); itr != _restore_actions.rend(); ++itr )
      (*itr)();
   _restore_actions.clear();
}

void undo_database::commit()
{
   _active = false;
   _restore_actions.clear();
}

} } // cipherbook::db
