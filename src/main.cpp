/*
 * TINYGUID COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 *
 * This source code is licensed under the TinyGUID Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Entry point of the `tinyguidctl` command line tool.
 */

#include "tinyguid/tool/cli.hpp"

int main(int argc, char* argv[])
{
    return tinyguid::tool::run(argc, argv);
}
