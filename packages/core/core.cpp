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
 * INCLUDES
 ******************************************************************************/

#include "EventLib.h"
#include "LuaEngine.h"
#include "LuaObject.h"
#include "StringLib.h"
#include "OsApi.h"
#include "core.h"

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#define LUA_CORE_LIBNAME    "core"

/******************************************************************************
 * LOCAL DATA
 ******************************************************************************/

bool appActive  = true;
int  appErrors  = 0;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * os_print
 *
 *  Notes: OS API "dlog" print function
 *----------------------------------------------------------------------------*/
static void os_print (const char* file_name, unsigned int line_number, const char* message)
{
    EventLib::logMsg(file_name, line_number, CRITICAL, "%s", message);
}

/*----------------------------------------------------------------------------
 * core_loglvl - core.loglvl(<level>)
 *----------------------------------------------------------------------------*/
static int core_loglvl (lua_State* L)
{
    bool status = false;
    try
    {
        const long lvl = LuaObject::getLuaInteger(L, 1);
        if(lvl < DEBUG || lvl >= INVALID_EVENT_LEVEL)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "invalid log level: %ld", lvl);
        }
        EventLib::setLvl((event_level_t)lvl);
        status = true;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error setting log level: %s", e.what());
    }

    lua_pushboolean(L, status);
    return 1;
}

/*----------------------------------------------------------------------------
 * core_log - core.log(<level>, <message>)
 *----------------------------------------------------------------------------*/
static int core_log (lua_State* L)
{
    try
    {
        const long lvl = LuaObject::getLuaInteger(L, 1);
        const char* msg = LuaObject::getLuaString(L, 2);
        if(lvl >= DEBUG && lvl < INVALID_EVENT_LEVEL)
        {
            mlog((event_level_t)lvl, "%s", msg);
        }
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error logging message: %s", e.what());
    }

    return 0;
}

/*----------------------------------------------------------------------------
 * core_open
 *----------------------------------------------------------------------------*/
static int core_open (lua_State *L)
{
    static const struct luaL_Reg core_functions[] = {
        {"loglvl",          core_loglvl},
        {"log",             core_log},
        {NULL,              NULL}
    };

    /* Set Library */
    luaL_newlib(L, core_functions);

    /* Set Globals */
    LuaEngine::setAttrInt   (L, "DEBUG",                        DEBUG);
    LuaEngine::setAttrInt   (L, "INFO",                         INFO);
    LuaEngine::setAttrInt   (L, "WARNING",                      WARNING);
    LuaEngine::setAttrInt   (L, "ERROR",                        ERROR);
    LuaEngine::setAttrInt   (L, "CRITICAL",                     CRITICAL);
    LuaEngine::setAttrInt   (L, "RTE_INFO",                     RTE_INFO);
    LuaEngine::setAttrInt   (L, "RTE_ERROR",                    RTE_ERROR);
    LuaEngine::setAttrInt   (L, "RTE_RESOURCE_DOES_NOT_EXIST",  RTE_RESOURCE_DOES_NOT_EXIST);
    LuaEngine::setAttrInt   (L, "RTE_INVALID_CONFIG",           RTE_INVALID_CONFIG);
#ifdef __unittesting__
    LuaEngine::setAttrBool  (L, "UNITTEST",                     true);
#else
    LuaEngine::setAttrBool  (L, "UNITTEST",                     false);
#endif

    return 1;
}

/******************************************************************************
 * EXPORTED FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 *  initcore
 *
 *  initialize core package
 *----------------------------------------------------------------------------*/
void initcore (void)
{
    /* Initialize Platform */
    OsApi::init(os_print);

    /* Initialize Libraries */
    EventLib::init();  /* Must be called first to handle events (mlog msgs) */

    /* Add Lua Extensions */
    LuaEngine::extend(LUA_CORE_LIBNAME, core_open);

    /* Indicate Presence of Package */
    LuaEngine::indicate(LUA_CORE_LIBNAME, LIBID);

    /* Print Status */
    mlog(INFO, "%s package initialized (%s)", LUA_CORE_LIBNAME, LIBID);
}

/*----------------------------------------------------------------------------
 * deinitcore
 *
 *  uninitialize core package
 *----------------------------------------------------------------------------*/
void deinitcore (void)
{
    /* Clean up libraries initialized in initcore() */
    EventLib::deinit();
    OsApi::deinit();
}

/*----------------------------------------------------------------------------
 * checkactive
 *----------------------------------------------------------------------------*/
bool checkactive (void)
{
    return appActive;
}

/*----------------------------------------------------------------------------
 * setinactive
 *----------------------------------------------------------------------------*/
void setinactive (int errors)
{
    appErrors = errors;
    appActive = false;
}

/*----------------------------------------------------------------------------
 * geterrors
 *----------------------------------------------------------------------------*/
int geterrors (void)
{
    return appErrors;
}
