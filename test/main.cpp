//
// Created by moinshaikh on 3/6/26.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include<doctest/doctest.h>
