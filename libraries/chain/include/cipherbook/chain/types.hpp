// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/address.hpp>
#include <cipherbook/protocol/types.hpp>

#include <cipherbook/db/generic_index.hpp>

namespace cipherbook { namespace chain {

   using namespace cipherbook::protocol;
   using namespace cipherbook::db;

} } // cipherbook::chain
