/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the University of Washington nor the names of its
 *    contributors may be used to endorse or promote products derived from this
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/******************************************************************************
 INCLUDES
 ******************************************************************************/

#include "core.h"
#include "geo.h"
#include "area.h"

#include <stdio.h>

/******************************************************************************
 DEFINES
 ******************************************************************************/

#define DEFAULT_TEST_SCRIPT "scripts/selftests/test_runner.lua"

/******************************************************************************
 MAIN
 ******************************************************************************/

/*
 * Runs the self test script, which returns its number of failures
 */
int main (int argc, char* argv[])
{
    const char* test_script = (argc > 1) ? argv[1] : DEFAULT_TEST_SCRIPT;

    /* Initialize Built-In Packages */
    initcore();
    initgeo();
    initarea();

    /* Create Lua Engine */
    LuaEngine* interpreter = new LuaEngine("regionarea-selftest");
    int failures = 0;

    try
    {
        interpreter->executeScript(test_script, argc > 2 ? argc - 2 : 0, argc > 2 ? &argv[2] : NULL);

        lua_State* L = interpreter->getState();
        if(lua_isinteger(L, -1))
        {
            failures = (int)lua_tointeger(L, -1);
        }
        else
        {
            mlog(CRITICAL, "%s did not return a failure count", test_script);
            failures = 1;
        }
        lua_pop(L, 1);
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Failed to run %s: %s", test_script, e.what());
        failures = 1;
    }

    print2term("%s: %d failure(s)\n", test_script, failures);

    /* Free Interpreter */
    delete interpreter;

    /* Clean Up Built-In Packages */
    deinitarea();
    deinitgeo();
    deinitcore();

    return (failures > 0) ? 1 : 0;
}
