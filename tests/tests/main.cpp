// see LICENSE.txt

#include <boost/test/included/unit_test.hpp>

#include <fc/log/logger.hpp>

#include <cstdlib>
#include <string>

boost::unit_test::test_suite* init_unit_test_suite(int argc, char* argv[]) {
   const char* log_level = getenv("CIPHERBOOK_TESTING_LOG_LEVEL");
   if( log_level == nullptr || std::string( log_level ) != "debug" )
      fc::logger::get( DEFAULT_LOGGER ).set_log_level( fc::log_level::warn );
   return nullptr;
}
