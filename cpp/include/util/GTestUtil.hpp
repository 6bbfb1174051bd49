#pragma once

#include <gtest/gtest.h>

// gtest main(), plus the logging, random-seed and rendering options. Rendering defaults to plain
// text and the seed to 1, so test output is reproducible.
int launch_gtest(int argc, char** argv);
