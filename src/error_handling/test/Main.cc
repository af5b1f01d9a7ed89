#include <UnitTest++.h>

int
main(int argc, char* argv[])
{
  return UnitTest::RunAllTests();
}
