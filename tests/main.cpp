#define BOOST_TEST_MODULE eosio_subs_unit_tests
#include <boost/test/unit_test.hpp>
