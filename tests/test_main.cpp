/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
