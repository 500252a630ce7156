// see LICENSE.txt

#pragma once

#include <functional>
#include <cstddef>
#include <vector>

namespace cipherbook { namespace db {

   /**
    * @class undo_database
    * @brief tracks changes to the indexes so that a failed operation leaves no trace
    *
    * While a session is active every index registers a restore action for each object it creates
    * or modifies. Committing the session drops the actions; destroying it without commit runs them
    * in reverse order. Sessions do not nest.
    */
   class undo_database
   {
      public:
         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session();

               /** leaves the changes in place */
               void commit();
               void undo();

            private:
               friend class undo_database;
               explicit session( undo_database& db ): _db(db) {}

               undo_database& _db;
               bool           _apply_undo = true;
         };

         session start_undo_session();

         bool   enabled()const { return _active; }
         size_t size()const    { return _restore_actions.size(); }

         /** records how to revert one change; ignored when no session is active */
         void on_undo( std::function<void()> restore );

      private:
         void undo();
         void commit();

         bool                               _active = false;
         std::vector<std::function<void()>> _restore_actions;
   };

} } // cipherbook::db
