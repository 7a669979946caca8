// tests/main.cpp - doctest runner, the only translation unit that defines main

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
