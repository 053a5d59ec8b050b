#define BOOST_TEST_MODULE tempo unit tests
#include <boost/test/unit_test.hpp>
